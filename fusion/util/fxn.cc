#include "fxn.h"
#include "sophus_util.h"
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <cstdint>
#include <vector>
#include "../model/view.h"

namespace scene_fusion {

namespace {

// the view image, converted to BGR and darkened so overlays stand out
cv::Mat backgroundOf(const cv::Mat& rgb, int width, int height)
{
    cv::Mat res;
    if (!rgb.empty() && rgb.type() == CV_8UC3 && rgb.cols == width && rgb.rows == height) {
        cv::cvtColor(rgb, res, cv::COLOR_RGB2BGR);
        cv::convertScaleAbs(res, res, 0.5, 0.0);
    } else {
        res = cv::Mat(height, width, CV_8UC3);
        res.setTo(cv::Vec3b(168,170,255));
    }
    return res;
}

}

SE3 SE3CV2Sophus(const cv::Mat &R, const cv::Mat &t)
{
    CV_Assert(R.rows == 3 && R.cols == 3);
    CV_Assert(t.total() == 3 && (t.cols == 1 || t.rows == 1));

    cv::Mat R64, t64;
    R.convertTo(R64, CV_64F);
    t.convertTo(t64, CV_64F);

    Eigen::Matrix3d sR;
    Eigen::Vector3d st;
    for (int c = 0; c < 3; ++c) {
        sR(0, c) = R64.at<double>(0, c);
        sR(1, c) = R64.at<double>(1, c);
        sR(2, c) = R64.at<double>(2, c);
        st[c] = t64.at<double>(c);
    }

    // re-orthonormalize, matrices typed into yaml files are rarely exact
    Eigen::Quaterniond q(sR);
    return SE3(q.normalized(), st);
}

SE3 SE3CV2Sophus(const cv::Mat& Rt)
{
    CV_Assert((Rt.rows == 3 || Rt.rows == 4) && Rt.cols == 4);
    return SE3CV2Sophus(Rt(cv::Rect(0, 0, 3, 3)), Rt(cv::Rect(3, 0, 1, 3)));
}

void printMessageOnCVImage(cv::Mat &image, std::string line1,std::string line2)
{
  if (image.empty()) return;

    // Shade a bottom band
    const int bandHeight = std::min(30, image.rows);
    cv::Rect band(0, image.rows - bandHeight, image.cols, bandHeight);
    cv::Mat roi = image(band);

    if (roi.type() == CV_8UC3 || roi.type() == CV_8UC1) cv::convertScaleAbs(roi, roi, 0.5, 0.0);
    else roi *= 0.5;

    const double fontScale = 0.4;
    const int thickness = 1;
    const int font = cv::FONT_HERSHEY_SIMPLEX;
    const cv::Scalar color(200, 200, 250);

    cv::putText(image, line1, cv::Point(5, image.rows - 17), font, fontScale, color, thickness, cv::LINE_AA);
    cv::putText(image, line2, cv::Point(5, image.rows - 4),  font, fontScale, color, thickness, cv::LINE_AA);
}


cv::Mat getDepthRainbowPlot(const View& view)
{
    return getDepthRainbowPlot(view.depth().ptr<float>(0), view.image(), view.width(), view.height());
}

cv::Mat getDepthRainbowPlot(const float* depth, const cv::Mat& rgb, int width, int height)
{
    cv::Mat res = backgroundOf(rgb, width, height);

    // inverse depth normalized by its median, so the typical pixel lands on 1
    std::vector<float> idepths;
    idepths.reserve(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
    for (int i = 0; i < width * height; ++i)
        if (depth[i] > 0.0f && std::isfinite(depth[i])) idepths.push_back(1.0f / depth[i]);
    if (idepths.empty()) return res;

    std::nth_element(idepths.begin(), idepths.begin() + idepths.size() / 2, idepths.end());
    const float norm = idepths[idepths.size() / 2];

    for (int y = 0; y < height; ++y) {
        auto* row = res.ptr<cv::Vec3b>(y);
        for (int x = 0; x < width; ++x) {
            const float d = depth[x + y * width];
            if (d > 0.0f && std::isfinite(d)) {
                const float id = (1.0f / d) / norm;
                float r = std::fabs((0.0f - id) * 255.0f);
                float g = std::fabs((1.0f - id) * 255.0f);
                float b = std::fabs((2.0f - id) * 255.0f);

                const auto rc = static_cast<std::uint8_t>(std::clamp(r, 0.0f, 255.0f));
                const auto gc = static_cast<std::uint8_t>(std::clamp(g, 0.0f, 255.0f));
                const auto bc = static_cast<std::uint8_t>(std::clamp(b, 0.0f, 255.0f));

                row[x] = cv::Vec3b(255 - bc, 255 - gc, 255 - rc);
            }
        }
    }
    return res;
}

cv::Mat getConfRedGreenPlot(const View& view)
{
    const int width = view.width();
    const int height = view.height();
    cv::Mat res = backgroundOf(view.image(), width, height);

    for (int y = 0; y < height; ++y) {
        auto* row = res.ptr<cv::Vec3b>(y);
        const float* d = view.depth().ptr<float>(y);
        for (int x = 0; x < width; ++x) {
            if (!(d[x] > 0.0f)) continue;
            const float conf = std::clamp(view.confidenceAt(x, y), 0.0f, 1.0f);
            const std::uint8_t v = static_cast<std::uint8_t>((1.0f - conf) * 255.0f);
            // BGR: (0, 255 - v, v), green for confident, red for uncertain
            row[x] = cv::Vec3b(0, static_cast<std::uint8_t>(255 - v), v);
        }
    }
    return res;
}
}

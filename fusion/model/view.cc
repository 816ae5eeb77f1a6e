#include "view.h"

#include <cstdio>

namespace scene_fusion {

View::View(int id, const cv::Mat& image, const cv::Mat& depth, const cv::Mat& confidence,
           const CameraIntrinsics& intrinsics, const SE3& worldToCam, PoseSource source)
    : pose(worldToCam, source)
{
    data.id = id;
    data.intrinsics = intrinsics;
    data.image = image.clone();
    depth.convertTo(data.depth, CV_32F);
    if (!confidence.empty())
        confidence.convertTo(data.confidence, CV_32F);
}

View::View(const View& other)
    : pose(other.pose)
{
    data.id = other.data.id;
    data.intrinsics = other.data.intrinsics;
    data.image = other.data.image.clone();
    data.depth = other.data.depth.clone();
    data.confidence = other.data.confidence.clone();
    data.sky = other.data.sky.clone();
}

View& View::operator=(const View& other)
{
    if (this == &other) return *this;
    pose = other.pose;
    data.id = other.data.id;
    data.intrinsics = other.data.intrinsics;
    data.image = other.data.image.clone();
    data.depth = other.data.depth.clone();
    data.confidence = other.data.confidence.clone();
    data.sky = other.data.sky.clone();
    return *this;
}

bool View::isConsistent(std::string* reason) const
{
    char buf[256];
    auto fail = [&](const char* msg) {
        if (reason != nullptr) *reason = msg;
        return false;
    };

    if (data.depth.empty() || data.depth.type() != CV_32FC1)
        return fail("depth map missing or not single channel");

    if (!data.intrinsics.isValid())
        return fail("malformed intrinsics");

    if (data.intrinsics.width != data.depth.cols || data.intrinsics.height != data.depth.rows) {
        std::snprintf(buf, sizeof(buf), "intrinsics resolution %dx%d does not match depth %dx%d",
                      data.intrinsics.width, data.intrinsics.height,
                      data.depth.cols, data.depth.rows);
        return fail(buf);
    }

    if (data.image.empty() || data.image.type() != CV_8UC3 || data.image.size() != data.depth.size())
        return fail("image missing, not 8-bit RGB, or sized differently from depth");

    if (!data.confidence.empty() &&
        (data.confidence.type() != CV_32FC1 || data.confidence.size() != data.depth.size()))
        return fail("confidence map sized differently from depth");

    if (!data.sky.empty() && (data.sky.type() != CV_8UC1 || data.sky.size() != data.depth.size()))
        return fail("sky mask not single channel or sized differently from depth");

    return true;
}

void View::setSky(const cv::Mat& mask)
{
    if (mask.empty()) {
        data.sky.release();
        return;
    }
    mask.convertTo(data.sky, CV_8U);
}

void View::scaleDepth(double s)
{
    data.depth *= s;
}

}

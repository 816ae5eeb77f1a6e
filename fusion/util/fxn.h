#pragma once
#include <opencv2/core/core.hpp>
#include <algorithm>
#include <string>

#include "../settings.h"
#include "sophus_util.h"


namespace scene_fusion {

class View;

/** World-to-camera pose from a 3x3 rotation and a 3-vector translation of any float type. */
SE3 SE3CV2Sophus(const cv::Mat& R, const cv::Mat& t);

/** Same, from a 3x4 or 4x4 [R|t] matrix. */
SE3 SE3CV2Sophus(const cv::Mat& Rt);

void printMessageOnCVImage(cv::Mat &image, std::string line1, std::string line2);

// 8-bit BGR plots, ready for cv::imencode. pixels without valid depth show
// the darkened view image.
cv::Mat getDepthRainbowPlot(const View& view);
cv::Mat getDepthRainbowPlot(const float* depth, const cv::Mat& bgr, int width, int height);
cv::Mat getConfRedGreenPlot(const View& view);

}

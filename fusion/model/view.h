#pragma once

#include "../util/sophus_util.h"
#include "../util/geometry.h"

#include <Eigen/Core>
#include <cstdint>
#include <opencv2/core/core.hpp>
#include <string>

#include "view_pose.h"

namespace scene_fusion {

/**
 * One observation produced by the predictor.
 *
 * Owns its buffers exclusively (copies are deep): the fuser may rescale the
 * depth map in place, so no two views may share pixel memory.
 *
 *  image       H x W, CV_8UC3, RGB 0..255
 *  depth       H x W, CV_32FC1, 0 = invalid
 *  confidence  H x W, CV_32FC1 in [0,1], or empty (every pixel fully confident)
 *  sky         H x W, CV_8UC1, nonzero = sky, or empty (no sky segmentation)
 */
class View {
public:
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW
    friend class MetricFuser;

    View(int id, const cv::Mat& image, const cv::Mat& depth, const cv::Mat& confidence,
         const CameraIntrinsics& intrinsics, const SE3& worldToCam,
         PoseSource source = PoseSource::PREDICTED);

    View(const View& other);
    View& operator=(const View& other);
    View(View&&) noexcept = default;
    View& operator=(View&&) noexcept = default;
    ~View() = default;

    // Accessors
    inline int id() const;

    inline int width() const;
    inline int height() const;

    inline const CameraIntrinsics& intrinsics() const;
    inline double fx() const;
    inline double fy() const;
    inline double cx() const;
    inline double cy() const;

    inline const cv::Mat& image() const;
    inline const cv::Mat& depth() const;
    inline const cv::Mat& confidence() const;
    inline bool hasConfidence() const;

    /** Confidence of pixel (x,y); 1 when no confidence map was supplied. */
    inline float confidenceAt(int x, int y) const;

    inline const cv::Mat& sky() const;
    inline bool hasSky() const;
    inline bool isSky(int x, int y) const;

    /** Stores a copy of the sky segmentation, converted to 8 bit. An empty mat clears it. */
    void setSky(const cv::Mat& mask);

    /**
     * Buffers agree with each other and with the intrinsics. A view failing this
     * check is dropped by the consumers instead of aborting the whole scene.
     */
    bool isConsistent(std::string* reason = nullptr) const;

    ViewPose pose;

private:
    // fuser only: depth follows the scale of the similarity applied to the pose.
    void scaleDepth(double s);

    struct Data {
        int id = -1;
        CameraIntrinsics intrinsics;

        cv::Mat image;
        cv::Mat depth;
        cv::Mat confidence;
        cv::Mat sky;
    };
    Data data;
};

/* -------------------- Inline definitions -------------------- */

inline int View::id() const { return data.id; }
inline int View::width() const { return data.depth.cols; }
inline int View::height() const { return data.depth.rows; }

inline const CameraIntrinsics& View::intrinsics() const { return data.intrinsics; }
inline double View::fx() const { return data.intrinsics.fx; }
inline double View::fy() const { return data.intrinsics.fy; }
inline double View::cx() const { return data.intrinsics.cx; }
inline double View::cy() const { return data.intrinsics.cy; }

inline const cv::Mat& View::image() const { return data.image; }
inline const cv::Mat& View::depth() const { return data.depth; }
inline const cv::Mat& View::confidence() const { return data.confidence; }
inline bool View::hasConfidence() const { return !data.confidence.empty(); }

inline float View::confidenceAt(int x, int y) const
{
    if (data.confidence.empty()) return 1.0f;
    return data.confidence.at<float>(y, x);
}

inline const cv::Mat& View::sky() const { return data.sky; }
inline bool View::hasSky() const { return !data.sky.empty(); }

inline bool View::isSky(int x, int y) const
{
    return !data.sky.empty() && data.sky.at<std::uint8_t>(y, x) != 0;
}

} // namespace scene_fusion

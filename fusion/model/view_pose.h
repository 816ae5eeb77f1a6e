#pragma once
#include <cstdint>

#include "../util/sophus_util.h"


namespace scene_fusion {

enum class PoseSource : std::uint8_t {
    PREDICTED = 0,   // from the network, arbitrary frame and scale
    KNOWN     = 1    // supplied by the caller, ground truth
};

const char* poseSourceName(PoseSource source);

class ViewPose {
public:
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    ViewPose();
    ViewPose(const SE3& worldToCam, PoseSource source);

    const SE3& worldToCam() const { return worldToCam_; }
    const SE3& camToWorld() const { return camToWorld_; }
    Eigen::Vector3d center() const { return camToWorld_.translation(); }

    PoseSource source() const { return source_; }
    bool isKnown() const { return source_ == PoseSource::KNOWN; }

    // only the fuser moves poses after the predictor created them.
    void setWorldToCam(const SE3& worldToCam, PoseSource source);

    /** Re-expresses the pose in the frame x' = S(x). Depth scaling is the caller's job. */
    void applySimilarity(const Sim3& S);

private:
    SE3 worldToCam_;

    // kept in sync with worldToCam_, read by every unprojection.
    SE3 camToWorld_;

    PoseSource source_;
};

}

#include "view_pose.h"
#include "../util/geometry.h"

/*

ViewPose is the pose container of every View.

* created by the predictor (PREDICTED) or from caller-supplied references (KNOWN)
* the fuser re-expresses it in the metric frame once alignment succeeds; known
  views get their reference pose written back verbatim afterwards
* the inverse is cached so that per-pixel unprojection never inverts

*/

namespace scene_fusion {

const char* poseSourceName(PoseSource source)
{
    switch (source) {
        case PoseSource::PREDICTED: return "predicted";
        case PoseSource::KNOWN:     return "known";
    }
    return "unknown";
}

ViewPose::ViewPose()
    : worldToCam_(SE3()),
      camToWorld_(SE3()),
      source_(PoseSource::PREDICTED)
{
}

ViewPose::ViewPose(const SE3& worldToCam, PoseSource source)
    : worldToCam_(worldToCam),
      camToWorld_(worldToCam.inverse()),
      source_(source)
{
}

void ViewPose::setWorldToCam(const SE3& worldToCam, PoseSource source)
{
    worldToCam_ = worldToCam;
    camToWorld_ = worldToCam.inverse();
    source_ = source;
}

void ViewPose::applySimilarity(const Sim3& S)
{
    setWorldToCam(applySimilarityToPose(S, worldToCam_), source_);
}

}

#pragma once

#include <string>
#include <vector>

#include "../config.h"
#include "../model/prediction.h"
#include "../util/sophus_util.h"

namespace scene_fusion {

class IndexThreadReduce;

/** Which way the fuser brought the prediction into a common frame. */
enum class FusionPath : std::uint8_t {
    NONE          = 0,   // left in the predictor's frame
    KNOWN_POSE    = 1,   // umeyama on >= 3 known camera centers
    KNOWN_ANCHOR  = 2,   // rigid anchoring on the only known pose
    PAIRED_METRIC = 3,   // umeyama onto the centers of a paired metric prediction
    DEPTH_RATIO   = 4    // median metric / relative depth ratio, scale only
};

const char* fusionPathName(FusionPath path);

/**
 * Outcome of MetricFuser::fuse. Alignment failures end up here as warnings,
 * they are never thrown to the caller.
 */
struct FusionReport {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    FusionPath path = FusionPath::NONE;
    Units units = Units::RELATIVE;
    bool aligned = false;

    // transform applied to every pose (identity when none was)
    Sim3 transform;
    int numCorrespondences = 0;

    // camera-center error |target - S(source)| of each correspondence, in the
    // target frame, ordered by view index.
    std::vector<int> residualViews;
    std::vector<double> residuals;
    double residualRms = 0.0;

    std::vector<std::string> warnings;
};

/**
 * Reconciles the relative prediction with whatever absolute information is
 * available, in this order (AlignmentMode::AUTO):
 *
 *  1. known poses for a subset of views (explicit map, plus views the predictor
 *     already tagged KNOWN)
 *  2. a paired metric prediction with the same view count and order
 *  3. nothing: the prediction stays in its own frame
 *
 * The other alignment modes restrict the fuser to exactly one of these paths.
 * Whatever transform is chosen is applied to every pose and every depth map in
 * place; this is the only place in the library that mutates a Prediction.
 */
class MetricFuser {
public:
    MetricFuser(const FusionConfig& config, IndexThreadReduce* pool = nullptr);

    MetricFuser(const MetricFuser&) = delete;
    MetricFuser& operator=(const MetricFuser&) = delete;

    /** Throws InvalidPredictionError on an empty prediction; everything else is reported. */
    FusionReport fuse(Prediction& prediction, const KnownPoses* knownPoses = nullptr,
                      const Prediction* paired = nullptr) const;

    /** Applies S to every pose and scales every depth map by S.scale(). */
    static void applyTransform(Prediction& prediction, const Sim3& S);

private:
    bool fuseKnownPoses(Prediction& prediction, const KnownPoses& reference, FusionReport& report) const;
    bool fusePaired(Prediction& prediction, const Prediction& paired, FusionReport& report) const;
    bool fuseDepthRatio(Prediction& prediction, const Prediction& paired, FusionReport& report) const;

    KnownPoses collectKnownPoses(const Prediction& prediction, const KnownPoses* explicitPoses,
                                 FusionReport& report) const;

    void computeResiduals(const Sim3& S, const std::vector<int>& viewIds, const Vector3dList& source,
                          const Vector3dList& target, FusionReport& report) const;

    FusionConfig config;
    IndexThreadReduce* pool;
};

}

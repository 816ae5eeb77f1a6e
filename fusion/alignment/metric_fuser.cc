#include "metric_fuser.h"
#include "pose_aligner.h"
#include "../settings.h"
#include "../util/errors.h"
#include "../util/geometry.h"
#include "../util/index_thread_reduce.h"

#include <algorithm>
#include <cstdarg>
#include <cstdio>

/*

fusion of a relative prediction with absolute information.

precedence (AUTO):
* known poses: a single known view anchors the whole prediction rigidly on
  it (scale is not observable from one pose). otherwise the known camera
  centers solve a similarity, which needs >= 3 of them: 2 known views are an
  AlignmentError like any other degenerate set. known views get their
  reference pose written back verbatim afterwards, so they are exact in the
  output regardless of the residual.
* paired metric prediction: similarity with free scale from the relative
  camera centers onto the metric ones. optionally falls back to a median depth
  ratio when the centers are degenerate.
* none: the prediction is left as it came in.

an AlignmentError on any path leaves the prediction untouched and is
reported as a warning. the transform is applied to poses and depth together:
depth in a camera that moved into the frame x' = s R x + t scales by s.

*/

namespace scene_fusion {

namespace {

void warn(FusionReport& report, const char* fmt, ...)
{
    char buf[512];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    report.warnings.emplace_back(buf);
    if (printWarnings)
        std::fprintf(stderr, "FUSER: %s\n", buf);
}

}

const char* fusionPathName(FusionPath path)
{
    switch (path) {
        case FusionPath::NONE:          return "none";
        case FusionPath::KNOWN_POSE:    return "known_pose";
        case FusionPath::KNOWN_ANCHOR:  return "known_anchor";
        case FusionPath::PAIRED_METRIC: return "paired_metric";
        case FusionPath::DEPTH_RATIO:   return "depth_ratio";
    }
    return "unknown";
}

MetricFuser::MetricFuser(const FusionConfig& config, IndexThreadReduce* pool)
    : config(config), pool(pool)
{
}

FusionReport MetricFuser::fuse(Prediction& prediction, const KnownPoses* knownPoses,
                               const Prediction* paired) const
{
    prediction.requireViews("fuse");

    FusionReport report;
    const AlignmentMode mode = config.alignmentMode;

    const bool allowKnown = mode == AlignmentMode::AUTO || mode == AlignmentMode::KNOWN_POSE;
    const bool allowPaired = mode == AlignmentMode::AUTO || mode == AlignmentMode::PAIRED_METRIC;

    KnownPoses reference;
    if (allowKnown)
        reference = collectKnownPoses(prediction, knownPoses, report);

    bool aligned = false;
    if (allowKnown && !reference.empty()) {
        if (paired != nullptr && printFusionInfo)
            std::printf("FUSER: known poses available, ignoring paired prediction\n");
        aligned = fuseKnownPoses(prediction, reference, report);
    } else if (allowPaired && paired != nullptr) {
        aligned = fusePaired(prediction, *paired, report);
        if (!aligned && config.depthRatioFallback)
            aligned = fuseDepthRatio(prediction, *paired, report);
    } else if (mode == AlignmentMode::KNOWN_POSE) {
        warn(report, "alignment mode known_pose but no known poses given, prediction stays %s",
             unitsName(prediction.units));
    } else if (mode == AlignmentMode::PAIRED_METRIC) {
        warn(report, "alignment mode paired_metric but no paired prediction given, prediction stays %s",
             unitsName(prediction.units));
    }

    if (!aligned) {
        prediction.aligned = false;
        report.path = FusionPath::NONE;
        report.transform = Sim3();
        if (printFusionInfo)
            std::printf("FUSER: %s: no alignment, geometry stays %s\n",
                        prediction.sceneId.c_str(), unitsName(prediction.units));
    }

    report.units = prediction.units;
    report.aligned = prediction.aligned;
    return report;
}

void MetricFuser::applyTransform(Prediction& prediction, const Sim3& S)
{
    const double s = S.scale();
    for (View& v : prediction.views) {
        v.pose.applySimilarity(S);
        if (s != 1.0)
            v.scaleDepth(s);
    }
}

KnownPoses MetricFuser::collectKnownPoses(const Prediction& prediction, const KnownPoses* explicitPoses,
                                          FusionReport& report) const
{
    KnownPoses res;

    // the predictor may already have been conditioned on some poses
    for (size_t i = 0; i < prediction.views.size(); ++i) {
        if (prediction.views[i].pose.isKnown())
            res[static_cast<int>(i)] = prediction.views[i].pose.worldToCam();
    }

    if (explicitPoses != nullptr) {
        for (const auto& kv : *explicitPoses) {
            if (kv.first < 0 || kv.first >= static_cast<int>(prediction.size())) {
                warn(report, "known pose for view %d ignored, prediction has %zu views",
                     kv.first, prediction.size());
                continue;
            }
            res[kv.first] = kv.second;
        }
    }
    return res;
}

bool MetricFuser::fuseKnownPoses(Prediction& prediction, const KnownPoses& reference,
                                 FusionReport& report) const
{
    std::vector<int> ids;
    Vector3dList source, target;
    for (const auto& kv : reference) {
        ids.push_back(kv.first);
        source.push_back(prediction.views[kv.first].pose.center());
        target.push_back(cameraCenter(kv.second));
    }

    Sim3 S;
    FusionPath path = FusionPath::NONE;
    if (ids.size() == 1) {
        S = anchorToPose(prediction.views[ids.front()].pose.worldToCam(), reference.begin()->second);
        path = FusionPath::KNOWN_ANCHOR;
    } else {
        try {
            S = alignPointSets(source, target, !config.knownPoseScale);
        } catch (const AlignmentError& e) {
            warn(report, "known-pose alignment on %zu views failed (%s), prediction stays %s",
                 ids.size(), e.what(), unitsName(prediction.units));
            return false;
        }
        path = FusionPath::KNOWN_POSE;
    }

    computeResiduals(S, ids, source, target, report);
    applyTransform(prediction, S);

    for (const auto& kv : reference)
        prediction.views[kv.first].pose.setWorldToCam(kv.second, PoseSource::KNOWN);

    prediction.units = Units::METRIC;
    prediction.aligned = true;

    report.path = path;
    report.transform = S;
    report.numCorrespondences = static_cast<int>(ids.size());

    if (printFusionInfo)
        std::printf("FUSER: %s: %s on %zu known views, scale %.6f, center rms %.6f\n",
                    prediction.sceneId.c_str(), fusionPathName(path), ids.size(), S.scale(),
                    report.residualRms);
    return true;
}

bool MetricFuser::fusePaired(Prediction& prediction, const Prediction& paired, FusionReport& report) const
{
    if (paired.size() != prediction.size()) {
        warn(report, "paired prediction has %zu views, expected %zu, prediction stays %s",
             paired.size(), prediction.size(), unitsName(prediction.units));
        return false;
    }
    if (paired.units != Units::METRIC)
        warn(report, "paired prediction is tagged %s, aligning to it anyway", unitsName(paired.units));

    const Vector3dList source = prediction.cameraCenters();
    const Vector3dList target = paired.cameraCenters();

    Sim3 S;
    try {
        S = alignPointSets(source, target, false);
    } catch (const AlignmentError& e) {
        warn(report, "paired-metric alignment on %zu views failed (%s), prediction stays %s",
             source.size(), e.what(), unitsName(prediction.units));
        return false;
    }

    std::vector<int> ids(source.size());
    for (size_t i = 0; i < ids.size(); ++i) ids[i] = static_cast<int>(i);

    computeResiduals(S, ids, source, target, report);
    applyTransform(prediction, S);

    prediction.units = Units::METRIC;
    prediction.aligned = true;

    report.path = FusionPath::PAIRED_METRIC;
    report.transform = S;
    report.numCorrespondences = static_cast<int>(ids.size());

    if (printFusionInfo)
        std::printf("FUSER: %s: paired metric alignment, scale %.6f, center rms %.6f\n",
                    prediction.sceneId.c_str(), S.scale(), report.residualRms);
    return true;
}

bool MetricFuser::fuseDepthRatio(Prediction& prediction, const Prediction& paired, FusionReport& report) const
{
    std::vector<float> ratios;
    const size_t n = std::min(prediction.size(), paired.size());
    for (size_t i = 0; i < n; ++i) {
        const View& rel = prediction.views[i];
        const View& met = paired.views[i];
        if (!rel.isConsistent() || !met.isConsistent()) {
            warn(report, "depth ratio fallback skips inconsistent view %zu", i);
            continue;
        }
        if (rel.width() != met.width() || rel.height() != met.height())
            continue;

        for (int y = 0; y < rel.height(); ++y) {
            const float* dr = rel.depth().ptr<float>(y);
            const float* dm = met.depth().ptr<float>(y);
            for (int x = 0; x < rel.width(); ++x) {
                if (dr[x] > 0.0f && dm[x] > 0.0f && rel.confidenceAt(x, y) >= config.confThreshold)
                    ratios.push_back(dm[x] / dr[x]);
            }
        }
    }

    if (ratios.empty()) {
        warn(report, "depth ratio fallback found no pixel valid in both predictions, prediction stays %s",
             unitsName(prediction.units));
        return false;
    }

    std::nth_element(ratios.begin(), ratios.begin() + ratios.size() / 2, ratios.end());
    const double s = ratios[ratios.size() / 2];
    if (!(s > 0.0)) {
        warn(report, "depth ratio fallback produced scale %f, prediction stays %s", s,
             unitsName(prediction.units));
        return false;
    }

    const Sim3 S = sim3FromParts(Eigen::Matrix3d::Identity(), s, Eigen::Vector3d::Zero());

    if (paired.size() == prediction.size()) {
        const Vector3dList source = prediction.cameraCenters();
        const Vector3dList target = paired.cameraCenters();
        std::vector<int> ids(source.size());
        for (size_t i = 0; i < ids.size(); ++i) ids[i] = static_cast<int>(i);
        computeResiduals(S, ids, source, target, report);
    }

    applyTransform(prediction, S);

    prediction.units = Units::METRIC;
    prediction.aligned = true;

    report.path = FusionPath::DEPTH_RATIO;
    report.transform = S;
    report.numCorrespondences = static_cast<int>(ratios.size());

    warn(report, "scale from median depth ratio %.6f over %zu pixels, rotation and translation left as predicted",
         s, ratios.size());
    return true;
}

void MetricFuser::computeResiduals(const Sim3& S, const std::vector<int>& viewIds, const Vector3dList& source,
                                   const Vector3dList& target, FusionReport& report) const
{
    const int n = static_cast<int>(viewIds.size());
    report.residualViews = viewIds;
    report.residuals.assign(n, 0.0);

    std::vector<double>& out = report.residuals;
    auto fn = [&](int min, int max, int) {
        for (int i = min; i < max; ++i)
            out[i] = (target[i] - applySimilarity(S, source[i])).norm();
    };

    if (pool != nullptr)
        pool->reduce(fn, 0, n, 1);
    else
        fn(0, n, 0);

    report.residualRms = residualRms(report.residuals);
}

}

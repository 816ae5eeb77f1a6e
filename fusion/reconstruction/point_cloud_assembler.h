#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "../config.h"
#include "../model/point_cloud.h"
#include "../model/prediction.h"

namespace scene_fusion {

class IndexThreadReduce;

/** Non-fatal outcome of one assembly. */
struct AssemblyReport {
    int viewsUsed = 0;
    std::vector<int> droppedViews;

    float threshold = 0.0f;             // tau actually applied
    float skyDepth = 0.0f;              // depth given to sky pixels, 0 without sky masks
    std::int64_t candidatePoints = 0;   // passing every filter, before subsampling
    std::int64_t stride = 1;            // subsampling stride, 1 when under the cap

    bool emptyResult = false;           // nothing passed, still a valid cloud
    bool cancelled = false;

    std::vector<std::string> warnings;
};

/**
 * Unprojects the fused depth of every view into one world-space point cloud.
 *
 * For each consistent view and each pixel (u = column, v = row) with
 * depth > 0 and confidence >= tau the point
 *
 *   p_world = camToWorld * (depth * ((u-cx)/fx, (v-cy)/fy, 1))
 *
 * is emitted with the pixel color. Pixels marked as sky take the sky depth
 * (FusionConfig::skyDepthPercentile of the valid non-sky depth) instead of
 * their own. Views are processed in parallel, each into
 * its own partition; partitions are concatenated in view order, then uniformly
 * subsampled with stride ceil(total / num_max_points) if the total exceeds
 * the cap. Output is identical for any thread count.
 */
class PointCloudAssembler {
public:
    /** Validates the config, throws ConfigError. */
    PointCloudAssembler(const FusionConfig& config, IndexThreadReduce* pool = nullptr);

    PointCloudAssembler(const PointCloudAssembler&) = delete;
    PointCloudAssembler& operator=(const PointCloudAssembler&) = delete;

    /**
     * Throws InvalidPredictionError for a prediction without views. Inconsistent
     * views are dropped and reported. When cancel is set between view chunks the
     * partial result is discarded and an empty cloud with report->cancelled is
     * returned.
     */
    PointCloud assemble(const Prediction& prediction, AssemblyReport* report = nullptr,
                        const std::atomic<bool>* cancel = nullptr) const;

    /** tau, or with the adaptive threshold min(max(tau, P_low), P_high) over
      * the confidences of valid-depth non-sky pixels of the given views. */
    float effectiveThreshold(const Prediction& prediction, const std::vector<char>& usable) const;

    /** Percentile of the valid non-sky depth of the given views; 0 when none of them has a sky mask. */
    float skyDepth(const Prediction& prediction, const std::vector<char>& usable) const;

    /** Appends the points of one view passing tau and the background filters.
      * Sky pixels are unprojected at skyDepth, or dropped when it is 0. */
    void makeViewPoints(const View& view, int viewIdx, float threshold, PointCloud& out,
                        float skyDepth = 0.0f) const;

private:
    FusionConfig config;
    IndexThreadReduce* pool;
};

/** p-th percentile (0..100, linear interpolation between ranks). values is reordered. */
float percentile(std::vector<float>& values, float p);

}

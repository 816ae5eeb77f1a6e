#pragma once

#include <vector>

#include <Eigen/Core>
#include <Eigen/StdVector>

#include "../config.h"
#include "../model/point_cloud.h"
#include "../model/prediction.h"

namespace scene_fusion {

class IndexThreadReduce;

/**
 * Initial gaussian primitives for an external splatting optimizer.
 *
 * scales are the linear standard deviations along the three axes of the
 * rotation (w,x,y,z); colors are linear RGB in [0,1]; opacities in (0,1).
 * The optimizer consumes these, this library never refines them.
 */
struct GaussianSet {
    std::vector<Eigen::Vector3f> means;
    std::vector<Eigen::Vector3f> scales;
    std::vector<Eigen::Vector4f, Eigen::aligned_allocator<Eigen::Vector4f>> rotations;
    std::vector<Eigen::Vector3f> colors;
    std::vector<float> opacities;

    Units units = Units::RELATIVE;

    std::size_t size() const { return means.size(); }
    bool empty() const { return means.empty(); }
};

/**
 * Seeds one isotropic gaussian per retained pixel:
 *
 *   mean     world position of the pixel
 *   sigma    gaussianScaleFactor * depth / mean focal length, i.e. the
 *            footprint of one pixel at that depth
 *   opacity  confidence clamped to [gaussianMinOpacity, gaussianMaxOpacity]
 *   color    pixel color
 */
class GaussianAdapter {
public:
    GaussianAdapter(const FusionConfig& config, IndexThreadReduce* pool = nullptr);

    /** Runs the point cloud assembler with the same config, then seeds from its points. */
    GaussianSet fromPrediction(const Prediction& prediction) const;

    /** Seeds from an assembled cloud; depth is re-measured in each point's source view. */
    GaussianSet fromPointCloud(const PointCloud& cloud, const Prediction& prediction) const;

private:
    FusionConfig config;
    IndexThreadReduce* pool;
};

}

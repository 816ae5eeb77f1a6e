#include "gaussian_adapter.h"
#include "../reconstruction/point_cloud_assembler.h"
#include "../settings.h"
#include "../util/errors.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace scene_fusion {

GaussianAdapter::GaussianAdapter(const FusionConfig& config, IndexThreadReduce* pool)
    : config(config), pool(pool)
{
    this->config.validate();
}

GaussianSet GaussianAdapter::fromPrediction(const Prediction& prediction) const
{
    PointCloudAssembler assembler(config, pool);
    const PointCloud cloud = assembler.assemble(prediction);
    return fromPointCloud(cloud, prediction);
}

GaussianSet GaussianAdapter::fromPointCloud(const PointCloud& cloud, const Prediction& prediction) const
{
    GaussianSet set;
    set.units = cloud.units;

    const size_t n = cloud.size();
    set.means.reserve(n);
    set.scales.reserve(n);
    set.rotations.reserve(n);
    set.colors.reserve(n);
    set.opacities.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        const int vi = cloud.viewIndex[i];
        if (vi < 0 || vi >= static_cast<int>(prediction.size()))
            throw InvalidPredictionError("point " + std::to_string(i) + " references view " +
                                         std::to_string(vi) + " outside the prediction");

        const View& view = prediction.views[vi];
        const Eigen::Vector3f& p = cloud.positions[i];

        // z in the source camera is the depth the point was unprojected at
        const double depth = std::abs((view.pose.worldToCam() * p.cast<double>()).z());
        const float sigma = static_cast<float>(config.gaussianScaleFactor * depth / view.intrinsics().meanFocal());

        set.means.push_back(p);
        set.scales.push_back(Eigen::Vector3f::Constant(sigma));
        set.rotations.push_back(Eigen::Vector4f(1.0f, 0.0f, 0.0f, 0.0f));
        set.colors.push_back(cloud.colors[i].cast<float>() / 255.0f);
        set.opacities.push_back(std::clamp(cloud.confidence[i], config.gaussianMinOpacity,
                                           config.gaussianMaxOpacity));
    }

    if (enablePrintDebugInfo)
        std::printf("GAUSSIANS: %s: %zu primitives\n", prediction.sceneId.c_str(), set.size());

    return set;
}

}

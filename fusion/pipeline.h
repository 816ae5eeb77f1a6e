#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "config.h"
#include "alignment/metric_fuser.h"
#include "gaussians/gaussian_adapter.h"
#include "gaussians/trajectory_generator.h"
#include "io_wrapper/exporter.h"
#include "model/point_cloud.h"
#include "model/prediction.h"
#include "reconstruction/point_cloud_assembler.h"
#include "util/index_thread_reduce.h"

namespace scene_fusion {

/** Optional inputs of one reconstruction besides the prediction itself. */
struct ReconstructionInputs {
    const KnownPoses* knownPoses = nullptr;
    const Prediction* paired = nullptr;
    const std::atomic<bool>* cancel = nullptr;
};

struct ReconstructionResult {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    FusionReport fusion;
    AssemblyReport assembly;

    PointCloud cloud;

    // only filled when gs_ply is selected
    GaussianSet gaussians;
    bool hasGaussians = false;

    // kept in memory when no export directory was given
    ExportArtifacts artifacts;
    std::vector<std::string> writtenFiles;
};

/**
 * Entry point: fuse -> assemble -> (gaussians, trajectory) -> export.
 *
 * Owns the worker pool shared by every stage. The configuration is validated
 * once in the constructor and copied; there is no global default.
 */
class ReconstructionPipeline {
public:
    /** Throws ConfigError. */
    explicit ReconstructionPipeline(const FusionConfig& config);
    ~ReconstructionPipeline();

    ReconstructionPipeline(const ReconstructionPipeline&) = delete;
    ReconstructionPipeline& operator=(const ReconstructionPipeline&) = delete;

    const FusionConfig& config() const { return config_; }

    FusionReport fuse(Prediction& prediction, const KnownPoses* knownPoses = nullptr,
                      const Prediction* paired = nullptr) const;

    PointCloud assemble(const Prediction& prediction, AssemblyReport* report = nullptr,
                        const std::atomic<bool>* cancel = nullptr) const;

    GaussianSet makeGaussians(const Prediction& prediction) const;
    GaussianSet makeGaussians(const PointCloud& cloud, const Prediction& prediction) const;

    CameraTrajectory makeTrajectory(const Prediction& prediction) const;

    /** Runs the exporters selected in the config over whatever the input provides. */
    ExportArtifacts exportAll(const ExportInput& input) const;

    /**
     * Full run on one prediction, which is fused in place. With an empty
     * exportDir the artifacts stay in the result and nothing touches the disk.
     * A cancelled assembly returns early without exporting.
     */
    ReconstructionResult run(Prediction& prediction, const ReconstructionInputs& inputs = ReconstructionInputs(),
                             const std::string& exportDir = std::string()) const;

    /** Writes every artifact below dir (created if needed); returns the written paths.
      * Throws ExportError naming the path that failed. */
    static std::vector<std::string> writeArtifacts(const ExportArtifacts& artifacts, const std::string& dir);

private:
    FusionConfig config_;
    std::unique_ptr<IndexThreadReduce> pool;

    std::unique_ptr<MetricFuser> fuser;
    std::unique_ptr<PointCloudAssembler> assembler;
    std::unique_ptr<GaussianAdapter> gaussianAdapter;
};

}

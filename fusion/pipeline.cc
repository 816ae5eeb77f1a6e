#include "pipeline.h"
#include "settings.h"
#include "util/errors.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

namespace scene_fusion {

ReconstructionPipeline::ReconstructionPipeline(const FusionConfig& config)
    : config_(config)
{
    config_.validate();

    pool = std::make_unique<IndexThreadReduce>(config_.numThreads);
    fuser = std::make_unique<MetricFuser>(config_, pool.get());
    assembler = std::make_unique<PointCloudAssembler>(config_, pool.get());
    gaussianAdapter = std::make_unique<GaussianAdapter>(config_, pool.get());

    if (enablePrintDebugInfo)
        std::printf("PIPELINE: %d threads, exports %s, alignment %s\n", pool->threadCount(),
                    exportFormatsToString(config_.exportFormats).c_str(),
                    alignmentModeName(config_.alignmentMode));
}

ReconstructionPipeline::~ReconstructionPipeline() = default;

FusionReport ReconstructionPipeline::fuse(Prediction& prediction, const KnownPoses* knownPoses,
                                          const Prediction* paired) const
{
    return fuser->fuse(prediction, knownPoses, paired);
}

PointCloud ReconstructionPipeline::assemble(const Prediction& prediction, AssemblyReport* report,
                                            const std::atomic<bool>* cancel) const
{
    return assembler->assemble(prediction, report, cancel);
}

GaussianSet ReconstructionPipeline::makeGaussians(const Prediction& prediction) const
{
    return gaussianAdapter->fromPrediction(prediction);
}

GaussianSet ReconstructionPipeline::makeGaussians(const PointCloud& cloud, const Prediction& prediction) const
{
    return gaussianAdapter->fromPointCloud(cloud, prediction);
}

CameraTrajectory ReconstructionPipeline::makeTrajectory(const Prediction& prediction) const
{
    return CameraTrajectory::fromConfig(prediction, config_);
}

ExportArtifacts ReconstructionPipeline::exportAll(const ExportInput& input) const
{
    return runExporters(config_.exportFormats, input, config_);
}

ReconstructionResult ReconstructionPipeline::run(Prediction& prediction, const ReconstructionInputs& inputs,
                                                 const std::string& exportDir) const
{
    prediction.requireViews("reconstruction");

    ReconstructionResult res;
    res.fusion = fuser->fuse(prediction, inputs.knownPoses, inputs.paired);

    res.cloud = assembler->assemble(prediction, &res.assembly, inputs.cancel);
    if (res.assembly.cancelled) {
        if (printWarnings)
            std::fprintf(stderr, "PIPELINE: assembly cancelled, nothing exported\n");
        return res;
    }

    ExportInput input;
    input.prediction = &prediction;
    input.cloud = &res.cloud;

    std::unique_ptr<CameraTrajectory> trajectory;
    if (config_.wants(EXPORT_GS_PLY)) {
        res.gaussians = gaussianAdapter->fromPointCloud(res.cloud, prediction);
        res.hasGaussians = true;
        trajectory = std::make_unique<CameraTrajectory>(CameraTrajectory::fromConfig(prediction, config_));

        input.gaussians = &res.gaussians;
        input.trajectory = trajectory.get();
    }

    res.artifacts = exportAll(input);

    if (!exportDir.empty()) {
        res.writtenFiles = writeArtifacts(res.artifacts, exportDir);
        res.artifacts.clear();
    }

    if (printFusionInfo)
        std::printf("PIPELINE: %s, %s, %zu points from %d views, %zu artifacts\n",
                    prediction.sceneId.empty() ? "<unnamed>" : prediction.sceneId.c_str(),
                    fusionPathName(res.fusion.path), res.cloud.size(), res.assembly.viewsUsed,
                    exportDir.empty() ? res.artifacts.size() : res.writtenFiles.size());
    return res;
}

std::vector<std::string> ReconstructionPipeline::writeArtifacts(const ExportArtifacts& artifacts,
                                                                const std::string& dir)
{
    std::vector<std::string> written;
    const fs::path root(dir);

    for (const ExportArtifact& a : artifacts) {
        const fs::path path = root / a.fileName;

        try {
            fs::create_directories(path.parent_path());
        } catch (const std::exception& e) {
            std::fprintf(stderr, "EXPORT: filesystem error for '%s': %s\n", path.string().c_str(), e.what());
            throw ExportError("cannot create directory for " + path.string() + ": " + e.what());
        }

        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        if (!ofs)
            throw ExportError("failed to open " + path.string());

        ofs.write(reinterpret_cast<const char*>(a.bytes.data()), static_cast<std::streamsize>(a.bytes.size()));
        ofs.close();
        if (!ofs)
            throw ExportError("failed to write " + path.string());

        if (printExportInfo)
            std::printf("EXPORT: wrote %s (%zu bytes)\n", path.string().c_str(), a.bytes.size());
        written.push_back(path.string());
    }
    return written;
}

}

#include "exporter.h"
#include "depth_vis_exporter.h"
#include "glb_exporter.h"
#include "npz_exporter.h"
#include "ply_exporter.h"
#include "../gaussians/gaussian_adapter.h"
#include "../gaussians/trajectory_generator.h"
#include "../model/point_cloud.h"
#include "../model/prediction.h"
#include "../settings.h"
#include "../util/errors.h"

#include <cstdio>

namespace scene_fusion {

namespace {

template<typename T>
const T& require(const T* p, const char* exporter, const char* what)
{
    if (p == nullptr)
        throw ExportError(std::string(exporter) + " export needs " + what);
    return *p;
}

ExportArtifacts exportPly(const ExportInput& in, const FusionConfig& config)
{
    const PointCloud& cloud = require(in.cloud, "ply", "a point cloud");
    return {{"points.ply", encodePointCloudPly(cloud, config.plyBinary)}};
}

ExportArtifacts exportGlb(const ExportInput& in, const FusionConfig&)
{
    const PointCloud& cloud = require(in.cloud, "glb", "a point cloud");
    const Prediction& prediction = require(in.prediction, "glb", "a prediction");
    return {{"scene.glb", encodeSceneGlb(cloud, prediction)}};
}

ExportArtifacts exportNpz(const ExportInput& in, const FusionConfig& config)
{
    const Prediction& prediction = require(in.prediction, "npz", "a prediction");
    return {{"predictions.npz", encodePredictionNpz(prediction, config.npzCompressed, config.npzIncludeImages)}};
}

ExportArtifacts exportGaussianPly(const ExportInput& in, const FusionConfig&)
{
    const GaussianSet& gaussians = require(in.gaussians, "gs_ply", "gaussians");

    ExportArtifacts res;
    res.push_back({"gaussians.ply", encodeGaussianPly(gaussians)});
    if (in.trajectory != nullptr) {
        const std::string text = trajectoryToText(*in.trajectory);
        res.push_back({"trajectory.txt", ByteBuffer(text.begin(), text.end())});
    }
    return res;
}

ExportArtifacts exportDepthVis(const ExportInput& in, const FusionConfig&)
{
    const Prediction& prediction = require(in.prediction, "depth_vis", "a prediction");

    ExportArtifacts res;
    for (NamedImage& img : encodeDepthVisualisation(prediction))
        res.push_back({"depth_vis/" + img.fileName, std::move(img.png)});
    return res;
}

}

const std::vector<ExporterEntry>& exporterTable()
{
    static const std::vector<ExporterEntry> table = {
        {EXPORT_PLY,       "ply",       &exportPly},
        {EXPORT_GLB,       "glb",       &exportGlb},
        {EXPORT_NPZ,       "npz",       &exportNpz},
        {EXPORT_GS_PLY,    "gs_ply",    &exportGaussianPly},
        {EXPORT_DEPTH_VIS, "depth_vis", &exportDepthVis},
    };
    return table;
}

const ExporterEntry* findExporter(ExportFormat format)
{
    for (const ExporterEntry& e : exporterTable())
        if (e.format == format) return &e;
    return nullptr;
}

ExportArtifacts runExporters(unsigned formats, const ExportInput& input, const FusionConfig& config)
{
    ExportArtifacts res;
    for (const ExporterEntry& e : exporterTable()) {
        if ((formats & e.format) == 0) continue;

        ExportArtifacts produced = e.handler(input, config);
        if (enablePrintDebugInfo)
            std::printf("EXPORT: %s produced %zu files\n", e.name, produced.size());
        for (ExportArtifact& a : produced)
            res.push_back(std::move(a));
    }
    return res;
}

}

#pragma once

#include <string>
#include <vector>

#include "byte_buffer.h"
#include "../config.h"

namespace scene_fusion {

struct Prediction;
struct PointCloud;
struct GaussianSet;
class CameraTrajectory;

/** One output file, relative to the export directory. */
struct ExportArtifact {
    std::string fileName;
    ByteBuffer bytes;
};

typedef std::vector<ExportArtifact> ExportArtifacts;

/** What the handlers read. Handlers never modify it. */
struct ExportInput {
    const Prediction* prediction = nullptr;
    const PointCloud* cloud = nullptr;
    const GaussianSet* gaussians = nullptr;
    const CameraTrajectory* trajectory = nullptr;
};

typedef ExportArtifacts (*ExportHandler)(const ExportInput& input, const FusionConfig& config);

struct ExporterEntry {
    ExportFormat format;
    const char* name;
    ExportHandler handler;
};

/** The closed set of exporters, in the order they run. */
const std::vector<ExporterEntry>& exporterTable();

/** Handler registered for one format flag; nullptr for an unknown flag. */
const ExporterEntry* findExporter(ExportFormat format);

/**
 * Runs every exporter selected in formats and concatenates their artifacts.
 * Throws ExportError when a selected exporter lacks its input.
 */
ExportArtifacts runExporters(unsigned formats, const ExportInput& input, const FusionConfig& config);

}

#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace scene_fusion {

/** Which alignment path the fuser may take. AUTO applies the precedence
  * known poses > paired metric prediction > none. */
enum class AlignmentMode : std::uint8_t {
    AUTO          = 0,
    KNOWN_POSE    = 1,
    PAIRED_METRIC = 2,
    NONE          = 3
};

enum class TrajectoryMode : std::uint8_t {
    ORBIT  = 0,
    SMOOTH = 1
};

/** Export selector, any combination. */
enum ExportFormat : unsigned {
    EXPORT_PLY       = 1<<0,
    EXPORT_GLB       = 1<<1,
    EXPORT_NPZ       = 1<<2,
    EXPORT_GS_PLY    = 1<<3,
    EXPORT_DEPTH_VIS = 1<<4,

    EXPORT_ALL = EXPORT_PLY | EXPORT_GLB | EXPORT_NPZ | EXPORT_GS_PLY | EXPORT_DEPTH_VIS
};

constexpr std::int64_t UNBOUNDED_POINTS = std::numeric_limits<std::int64_t>::max();

/**
 * Every parameter one reconstruction consumes. Passed explicitly into the
 * pipeline; there is no process-wide default instance.
 */
struct FusionConfig {
    // ---- point selection ----
    float confThreshold = 0.1f;                 // tau, pixels below are dropped
    std::int64_t numMaxPoints = 1000000;        // > 0, or UNBOUNDED_POINTS

    // tau_eff = min(max(tau, P_low(conf)), P_high(conf)) when enabled
    bool adaptiveConfThreshold = false;
    float confPercentileLow = 40.0f;
    float confPercentileHigh = 90.0f;

    bool filterBlackBackground = false;
    bool filterWhiteBackground = false;

    // sky pixels take this percentile of the valid non-sky depth
    float skyDepthPercentile = 98.0f;

    // ---- alignment ----
    AlignmentMode alignmentMode = AlignmentMode::AUTO;
    bool knownPoseScale = true;                 // false: fixed-scale variant, s = 1
    bool depthRatioFallback = false;

    // ---- gaussians / trajectory ----
    TrajectoryMode trajectoryMode = TrajectoryMode::ORBIT;
    int trajectoryFrames = 120;
    float orbitRadiusScale = 1.0f;
    float gaussianScaleFactor = 1.0f;           // sigma = factor * depth / focal
    float gaussianMinOpacity = 0.01f;
    float gaussianMaxOpacity = 0.99f;

    // ---- export ----
    unsigned exportFormats = EXPORT_PLY;
    bool plyBinary = false;
    bool npzCompressed = true;
    bool npzIncludeImages = true;

    // ---- threading ----
    int numThreads = 0;                         // 0: hardware concurrency

    /** Throws ConfigError on the first invalid parameter. */
    void validate() const;

    bool wants(ExportFormat f) const { return (exportFormats & f) != 0; }
};

/** "ply", "glb-ply", "npz-ply-gs_ply" ... Unknown names throw ConfigError. */
unsigned parseExportFormats(const std::string& selector);
std::string exportFormatsToString(unsigned formats);

AlignmentMode parseAlignmentMode(const std::string& name);
const char* alignmentModeName(AlignmentMode mode);

TrajectoryMode parseTrajectoryMode(const std::string& name);
const char* trajectoryModeName(TrajectoryMode mode);

/** Reads a YAML/XML/JSON file written by cv::FileStorage. Missing keys keep defaults.
  * The result is validated before it is returned. */
FusionConfig loadConfig(const std::string& path);
void saveConfig(const std::string& path, const FusionConfig& cfg);

}

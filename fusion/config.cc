#include "config.h"
#include "util/errors.h"

#include <opencv2/core/core.hpp>

#include <cmath>
#include <sstream>

/*

FusionConfig validation and (de)serialization.

files are read with cv::FileStorage, so YAML, XML and JSON all work. keys use
snake_case and mirror the struct members:

  conf_thresh: 0.2
  num_max_points: 100000          # or "unbounded"
  alignment_mode: "known_pose"
  export_formats: "glb-ply"

*/

namespace scene_fusion {

namespace {

struct FormatName {
    ExportFormat flag;
    const char* name;
};

constexpr FormatName kFormatNames[] = {
    {EXPORT_PLY,       "ply"},
    {EXPORT_GLB,       "glb"},
    {EXPORT_NPZ,       "npz"},
    {EXPORT_GS_PLY,    "gs_ply"},
    {EXPORT_DEPTH_VIS, "depth_vis"},
};

void readFloat(const cv::FileStorage& fs, const char* key, float& out)
{
    const cv::FileNode n = fs[key];
    if (n.empty()) return;
    if (!n.isReal() && !n.isInt())
        throw ConfigError(std::string(key) + " must be a number");
    out = static_cast<float>(static_cast<double>(n));
}

void readInt(const cv::FileStorage& fs, const char* key, int& out)
{
    const cv::FileNode n = fs[key];
    if (n.empty()) return;
    if (!n.isInt())
        throw ConfigError(std::string(key) + " must be an integer");
    out = static_cast<int>(n);
}

void readBool(const cv::FileStorage& fs, const char* key, bool& out)
{
    const cv::FileNode n = fs[key];
    if (n.empty()) return;
    if (n.isInt()) { out = static_cast<int>(n) != 0; return; }
    if (n.isString()) {
        const std::string s = static_cast<std::string>(n);
        if (s == "true" || s == "on" || s == "yes")   { out = true;  return; }
        if (s == "false" || s == "off" || s == "no")  { out = false; return; }
    }
    throw ConfigError(std::string(key) + " must be a boolean");
}

bool readString(const cv::FileStorage& fs, const char* key, std::string& out)
{
    const cv::FileNode n = fs[key];
    if (n.empty()) return false;
    if (!n.isString())
        throw ConfigError(std::string(key) + " must be a string");
    out = static_cast<std::string>(n);
    return true;
}

}


void FusionConfig::validate() const
{
    if (!std::isfinite(confThreshold) || confThreshold < 0.0f || confThreshold > 1.0f)
        throw ConfigError("conf_thresh must lie in [0,1], got " + std::to_string(confThreshold));

    if (numMaxPoints <= 0)
        throw ConfigError("num_max_points must be positive, got " + std::to_string(numMaxPoints));

    if (adaptiveConfThreshold) {
        if (!(confPercentileLow > 0.0f && confPercentileLow <= 100.0f) ||
            !(confPercentileHigh > 0.0f && confPercentileHigh <= 100.0f))
            throw ConfigError("confidence percentiles must lie in (0,100]");
        if (confPercentileLow > confPercentileHigh)
            throw ConfigError("conf_percentile_low exceeds conf_percentile_high");
    }

    if (!(skyDepthPercentile >= 0.0f && skyDepthPercentile <= 100.0f))
        throw ConfigError("sky_depth_percentile must lie in [0,100]");

    if (trajectoryFrames <= 0)
        throw ConfigError("trajectory_frames must be positive");
    if (!std::isfinite(orbitRadiusScale) || orbitRadiusScale <= 0.0f)
        throw ConfigError("orbit_radius_scale must be positive");

    if (!std::isfinite(gaussianScaleFactor) || gaussianScaleFactor <= 0.0f)
        throw ConfigError("gaussian_scale_factor must be positive");
    if (!(gaussianMinOpacity > 0.0f && gaussianMinOpacity <= gaussianMaxOpacity && gaussianMaxOpacity < 1.0f))
        throw ConfigError("gaussian opacity range must satisfy 0 < min <= max < 1");

    if (exportFormats & ~static_cast<unsigned>(EXPORT_ALL))
        throw ConfigError("unknown export format bits");

    if (numThreads < 0)
        throw ConfigError("num_threads must not be negative");
}


unsigned parseExportFormats(const std::string& selector)
{
    unsigned formats = 0;
    std::stringstream ss(selector);
    std::string token;
    while (std::getline(ss, token, '-')) {
        if (token.empty()) continue;
        bool found = false;
        for (const FormatName& f : kFormatNames) {
            if (token == f.name) {
                formats |= f.flag;
                found = true;
                break;
            }
        }
        if (!found)
            throw ConfigError("unknown export format '" + token + "'");
    }
    return formats;
}

std::string exportFormatsToString(unsigned formats)
{
    std::string res;
    for (const FormatName& f : kFormatNames) {
        if ((formats & f.flag) == 0) continue;
        if (!res.empty()) res += '-';
        res += f.name;
    }
    return res;
}

AlignmentMode parseAlignmentMode(const std::string& name)
{
    if (name == "auto")          return AlignmentMode::AUTO;
    if (name == "known_pose")    return AlignmentMode::KNOWN_POSE;
    if (name == "paired_metric") return AlignmentMode::PAIRED_METRIC;
    if (name == "none")          return AlignmentMode::NONE;
    throw ConfigError("unknown alignment mode '" + name + "'");
}

const char* alignmentModeName(AlignmentMode mode)
{
    switch (mode) {
        case AlignmentMode::AUTO:          return "auto";
        case AlignmentMode::KNOWN_POSE:    return "known_pose";
        case AlignmentMode::PAIRED_METRIC: return "paired_metric";
        case AlignmentMode::NONE:          return "none";
    }
    return "auto";
}

TrajectoryMode parseTrajectoryMode(const std::string& name)
{
    if (name == "orbit")  return TrajectoryMode::ORBIT;
    if (name == "smooth") return TrajectoryMode::SMOOTH;
    throw ConfigError("unknown trajectory mode '" + name + "'");
}

const char* trajectoryModeName(TrajectoryMode mode)
{
    switch (mode) {
        case TrajectoryMode::ORBIT:  return "orbit";
        case TrajectoryMode::SMOOTH: return "smooth";
    }
    return "orbit";
}


FusionConfig loadConfig(const std::string& path)
{
    cv::FileStorage fs;
    try {
        if (!fs.open(path, cv::FileStorage::READ))
            throw ConfigError("cannot open config file '" + path + "'");
    } catch (const cv::Exception& e) {
        throw ConfigError("cannot parse config file '" + path + "': " + e.what());
    }

    FusionConfig cfg;

    readFloat(fs, "conf_thresh", cfg.confThreshold);

    const cv::FileNode maxPoints = fs["num_max_points"];
    if (!maxPoints.empty()) {
        if (maxPoints.isString() && static_cast<std::string>(maxPoints) == "unbounded")
            cfg.numMaxPoints = UNBOUNDED_POINTS;
        else if (maxPoints.isInt() || maxPoints.isReal()) {
            const double v = static_cast<double>(maxPoints);
            // 2^63 does not fit into int64
            if (!std::isfinite(v) || std::fabs(v) >= std::ldexp(1.0, 63))
                throw ConfigError("num_max_points out of range, use \"unbounded\" for no cap");
            cfg.numMaxPoints = static_cast<std::int64_t>(v);
        } else
            throw ConfigError("num_max_points must be an integer or \"unbounded\"");
    }

    readBool(fs, "adaptive_conf_thresh", cfg.adaptiveConfThreshold);
    readFloat(fs, "conf_percentile_low", cfg.confPercentileLow);
    readFloat(fs, "conf_percentile_high", cfg.confPercentileHigh);
    readBool(fs, "filter_black_bg", cfg.filterBlackBackground);
    readBool(fs, "filter_white_bg", cfg.filterWhiteBackground);
    readFloat(fs, "sky_depth_percentile", cfg.skyDepthPercentile);

    std::string s;
    if (readString(fs, "alignment_mode", s)) cfg.alignmentMode = parseAlignmentMode(s);
    readBool(fs, "known_pose_scale", cfg.knownPoseScale);
    readBool(fs, "depth_ratio_fallback", cfg.depthRatioFallback);

    if (readString(fs, "trajectory_mode", s)) cfg.trajectoryMode = parseTrajectoryMode(s);
    readInt(fs, "trajectory_frames", cfg.trajectoryFrames);
    readFloat(fs, "orbit_radius_scale", cfg.orbitRadiusScale);
    readFloat(fs, "gaussian_scale_factor", cfg.gaussianScaleFactor);
    readFloat(fs, "gaussian_min_opacity", cfg.gaussianMinOpacity);
    readFloat(fs, "gaussian_max_opacity", cfg.gaussianMaxOpacity);

    if (readString(fs, "export_formats", s)) cfg.exportFormats = parseExportFormats(s);
    readBool(fs, "ply_binary", cfg.plyBinary);
    readBool(fs, "npz_compressed", cfg.npzCompressed);
    readBool(fs, "npz_include_images", cfg.npzIncludeImages);

    readInt(fs, "num_threads", cfg.numThreads);

    fs.release();

    cfg.validate();
    return cfg;
}

void saveConfig(const std::string& path, const FusionConfig& cfg)
{
    cv::FileStorage fs;
    try {
        if (!fs.open(path, cv::FileStorage::WRITE))
            throw ConfigError("cannot write config file '" + path + "'");
    } catch (const cv::Exception& e) {
        throw ConfigError("cannot write config file '" + path + "': " + e.what());
    }

    fs << "conf_thresh" << cfg.confThreshold;
    if (cfg.numMaxPoints == UNBOUNDED_POINTS)
        fs << "num_max_points" << "unbounded";
    else
        fs << "num_max_points" << static_cast<double>(cfg.numMaxPoints);

    fs << "adaptive_conf_thresh" << static_cast<int>(cfg.adaptiveConfThreshold);
    fs << "conf_percentile_low" << cfg.confPercentileLow;
    fs << "conf_percentile_high" << cfg.confPercentileHigh;
    fs << "filter_black_bg" << static_cast<int>(cfg.filterBlackBackground);
    fs << "filter_white_bg" << static_cast<int>(cfg.filterWhiteBackground);
    fs << "sky_depth_percentile" << cfg.skyDepthPercentile;

    fs << "alignment_mode" << alignmentModeName(cfg.alignmentMode);
    fs << "known_pose_scale" << static_cast<int>(cfg.knownPoseScale);
    fs << "depth_ratio_fallback" << static_cast<int>(cfg.depthRatioFallback);

    fs << "trajectory_mode" << trajectoryModeName(cfg.trajectoryMode);
    fs << "trajectory_frames" << cfg.trajectoryFrames;
    fs << "orbit_radius_scale" << cfg.orbitRadiusScale;
    fs << "gaussian_scale_factor" << cfg.gaussianScaleFactor;
    fs << "gaussian_min_opacity" << cfg.gaussianMinOpacity;
    fs << "gaussian_max_opacity" << cfg.gaussianMaxOpacity;

    fs << "export_formats" << exportFormatsToString(cfg.exportFormats);
    fs << "ply_binary" << static_cast<int>(cfg.plyBinary);
    fs << "npz_compressed" << static_cast<int>(cfg.npzCompressed);
    fs << "npz_include_images" << static_cast<int>(cfg.npzIncludeImages);

    fs << "num_threads" << cfg.numThreads;
    fs.release();
}

}

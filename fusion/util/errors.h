#pragma once

#include <stdexcept>
#include <string>

namespace scene_fusion {

/** Base of every error thrown by the fusion library. */
class FusionError : public std::runtime_error {
public:
    explicit FusionError(const std::string& what) : std::runtime_error(what) {}
};

/** Invalid parameter. Raised before any per-view work starts. */
class ConfigError : public FusionError {
public:
    explicit ConfigError(const std::string& what) : FusionError("config: " + what) {}
};

/** Too few or degenerate correspondences for a similarity solve.
  * Recovered by the fuser, never fatal to a reconstruction. */
class AlignmentError : public FusionError {
public:
    explicit AlignmentError(const std::string& what) : FusionError("alignment: " + what) {}
};

/** Prediction that cannot be processed at all (no views, inconsistent buffers). */
class InvalidPredictionError : public FusionError {
public:
    explicit InvalidPredictionError(const std::string& what) : FusionError("prediction: " + what) {}
};

/** Encoder or filesystem failure while producing an export. */
class ExportError : public FusionError {
public:
    explicit ExportError(const std::string& what) : FusionError("export: " + what) {}
};

}

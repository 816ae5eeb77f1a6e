#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <Eigen/StdVector>

#include "view.h"

namespace scene_fusion {

enum class Units : std::uint8_t {
    RELATIVE = 0,   // unknown global scale, arbitrary world frame
    METRIC   = 1
};

const char* unitsName(Units units);

typedef std::vector<View, Eigen::aligned_allocator<View>> ViewList;

/**
 * Ordered views of one inference call.
 *
 * Before fusion the predicted poses live in an arbitrary frame with unknown
 * scale. After fusion every view shares one world frame; `units` tells whether
 * that frame is metric and `aligned` whether a similarity was actually applied.
 */
struct Prediction {
    std::string sceneId;
    Units units = Units::RELATIVE;
    bool aligned = false;

    ViewList views;

    std::size_t size() const { return views.size(); }
    bool empty() const { return views.empty(); }

    /**
     * Indices of the views passing View::isConsistent, in view order. Every
     * other view is reported on stderr as skipped by the given stage.
     */
    std::vector<std::size_t> consistentViews(const char* stage) const;

    /** The listed views share one resolution (required for stacked raw-array export). */
    bool hasUniformResolution(const std::vector<std::size_t>& indices) const;

    /** Camera centers in view order. */
    Vector3dList cameraCenters() const;

    /** Throws InvalidPredictionError when there is no view at all. */
    void requireViews(const char* stage) const;
};

}

#pragma once

#include <cstdint>
#include <vector>

#include <Eigen/Core>

#include "prediction.h"

namespace scene_fusion {

typedef Eigen::Matrix<std::uint8_t, 3, 1> Color3b;

/**
 * World-space points with their color, source view and confidence.
 *
 * Stored as parallel arrays (one entry per point in every array), the way the
 * exporters consume them. Point order is (view index, row-major pixel index)
 * and never changes after assembly.
 */
struct PointCloud {
    std::vector<Eigen::Vector3f> positions;
    std::vector<Color3b> colors;
    std::vector<int> viewIndex;
    std::vector<float> confidence;

    // frame the positions live in
    Units units = Units::RELATIVE;

    std::size_t size() const { return positions.size(); }
    bool empty() const { return positions.empty(); }

    void reserve(std::size_t n)
    {
        positions.reserve(n);
        colors.reserve(n);
        viewIndex.reserve(n);
        confidence.reserve(n);
    }

    void clear()
    {
        positions.clear();
        colors.clear();
        viewIndex.clear();
        confidence.clear();
    }

    void push(const Eigen::Vector3f& p, const Color3b& c, int view, float conf)
    {
        positions.push_back(p);
        colors.push_back(c);
        viewIndex.push_back(view);
        confidence.push_back(conf);
    }

    /** Copies point i of other to the end. */
    void pushFrom(const PointCloud& other, std::size_t i)
    {
        push(other.positions[i], other.colors[i], other.viewIndex[i], other.confidence[i]);
    }
};

}

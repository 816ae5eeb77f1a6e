#pragma once

#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

#include "../config.h"
#include "../model/prediction.h"
#include "../util/sophus_util.h"

namespace scene_fusion {

/**
 * Novel-view camera path derived from the cameras of a fused prediction.
 *
 * Poses (world-to-camera) are computed on demand by poseAt; the sequence is
 * finite (size() poses) and can be walked any number of times.
 *
 * ORBIT   full circle around the scene centroid, in the plane orthogonal to
 *         the mean camera up direction, at the mean camera height and a radius
 *         of the largest horizontal camera distance from the centroid. every
 *         pose looks at the centroid. the scene centroid is the mean over the
 *         views of the point at median valid depth on the optical axis, or the
 *         centroid of the camera centers when no view has valid depth.
 * SMOOTH  Catmull-Rom spline through the camera centers in view order with
 *         slerped orientations. passes through every input camera.
 */
class CameraTrajectory {
public:
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    class const_iterator {
    public:
        typedef std::forward_iterator_tag iterator_category;
        typedef SE3 value_type;
        typedef std::ptrdiff_t difference_type;
        typedef const SE3* pointer;
        typedef SE3 reference;

        const_iterator(const CameraTrajectory* trajectory, int index)
            : trajectory(trajectory), index(index) {}

        SE3 operator*() const { return trajectory->poseAt(index); }
        const_iterator& operator++() { ++index; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++index; return tmp; }
        bool operator==(const const_iterator& o) const { return trajectory == o.trajectory && index == o.index; }
        bool operator!=(const const_iterator& o) const { return !(*this == o); }

    private:
        const CameraTrajectory* trajectory;
        int index;
    };

    /** Throws InvalidPredictionError without views, ConfigError for frames <= 0. */
    CameraTrajectory(const Prediction& prediction, TrajectoryMode mode, int frames,
                     float orbitRadiusScale = 1.0f);

    static CameraTrajectory fromConfig(const Prediction& prediction, const FusionConfig& config);

    TrajectoryMode mode() const { return mode_; }
    int size() const { return frames; }

    /** World-to-camera pose of frame i, 0 <= i < size(). */
    SE3 poseAt(int i) const;

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, frames); }

    // orbit geometry, exposed for the exporters and tests
    /** Scene centroid the orbit looks at. */
    const Eigen::Vector3d& centroid() const { return centroid_; }
    const Eigen::Vector3d& up() const { return up_; }
    double radius() const { return radius_; }

private:
    SE3 orbitPose(int i) const;
    SE3 smoothPose(int i) const;

    TrajectoryMode mode_;
    int frames;

    Eigen::Vector3d centroid_;
    Eigen::Vector3d up_;
    Eigen::Vector3d orbitCenter;
    Eigen::Vector3d axisA;
    Eigen::Vector3d axisB;
    double radius_;

    // smooth: control points, one per input camera
    Vector3dList centers;
    std::vector<Eigen::Quaterniond, Eigen::aligned_allocator<Eigen::Quaterniond>> orientations;
};

/** "qw qx qy qz tx ty tz\n" per pose, world-to-camera. */
std::string trajectoryToText(const CameraTrajectory& trajectory);

}

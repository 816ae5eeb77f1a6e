#include "trajectory_generator.h"
#include "../util/errors.h"
#include "../util/geometry.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <vector>

namespace scene_fusion {

namespace {

const double kTrajectoryEps = 1e-9;

Eigen::Vector3d anyPerpendicular(const Eigen::Vector3d& n)
{
    int idx = 0;
    n.cwiseAbs().minCoeff(&idx);
    Eigen::Vector3d e = Eigen::Vector3d::Zero();
    e[idx] = 1.0;
    return (e - e.dot(n) * n).normalized();
}

// point on the optical axis at the median valid depth of the view, false without valid depth
bool lookAtPoint(const View& view, Eigen::Vector3d& out)
{
    if (!view.isConsistent()) return false;

    std::vector<float> depth;
    depth.reserve(static_cast<size_t>(view.width()) * view.height());
    for (int y = 0; y < view.height(); ++y) {
        const float* d = view.depth().ptr<float>(y);
        for (int x = 0; x < view.width(); ++x) {
            if (d[x] > 0.0f && std::isfinite(d[x]) && !view.isSky(x, y))
                depth.push_back(d[x]);
        }
    }
    if (depth.empty()) return false;

    std::nth_element(depth.begin(), depth.begin() + depth.size() / 2, depth.end());
    const double median = depth[depth.size() / 2];

    const SE3& camToWorld = view.pose.camToWorld();
    out = camToWorld.translation() + median * camToWorld.rotationMatrix().col(2);
    return true;
}

}

CameraTrajectory::CameraTrajectory(const Prediction& prediction, TrajectoryMode mode, int frames,
                                   float orbitRadiusScale)
    : mode_(mode), frames(frames)
{
    prediction.requireViews("trajectory");
    if (frames <= 0)
        throw ConfigError("trajectory needs at least one frame, got " + std::to_string(frames));

    centers = prediction.cameraCenters();
    const int n = static_cast<int>(centers.size());

    orientations.reserve(n);
    up_ = Eigen::Vector3d::Zero();
    for (const View& v : prediction.views) {
        const SE3& camToWorld = v.pose.camToWorld();
        orientations.push_back(camToWorld.unit_quaternion());
        // camera y points down
        up_ += camToWorld.rotationMatrix() * Eigen::Vector3d(0.0, -1.0, 0.0);
    }
    if (up_.norm() < kTrajectoryEps)
        up_ = Eigen::Vector3d(0.0, -1.0, 0.0);
    up_.normalize();

    // scene centroid from what the cameras look at, camera centroid as fallback
    centroid_ = Eigen::Vector3d::Zero();
    int looking = 0;
    for (const View& v : prediction.views) {
        Eigen::Vector3d p;
        if (lookAtPoint(v, p)) {
            centroid_ += p;
            ++looking;
        }
    }
    if (looking > 0) {
        centroid_ /= looking;
    } else {
        for (const Eigen::Vector3d& c : centers) centroid_ += c;
        centroid_ /= n;
    }

    double meanHeight = 0.0;
    double maxDist = 0.0;
    axisA = Eigen::Vector3d::Zero();
    for (const Eigen::Vector3d& c : centers) {
        const Eigen::Vector3d o = c - centroid_;
        const double h = o.dot(up_);
        const Eigen::Vector3d horizontal = o - h * up_;
        meanHeight += h;
        maxDist = std::max(maxDist, horizontal.norm());
        if (axisA.isZero() && horizontal.norm() > kTrajectoryEps)
            axisA = horizontal.normalized();
    }
    meanHeight /= n;

    if (axisA.isZero())
        axisA = anyPerpendicular(up_);
    axisB = up_.cross(axisA);

    radius_ = (maxDist > kTrajectoryEps ? maxDist : 1.0) * orbitRadiusScale;
    orbitCenter = centroid_ + meanHeight * up_;
}

CameraTrajectory CameraTrajectory::fromConfig(const Prediction& prediction, const FusionConfig& config)
{
    return CameraTrajectory(prediction, config.trajectoryMode, config.trajectoryFrames,
                            config.orbitRadiusScale);
}

SE3 CameraTrajectory::poseAt(int i) const
{
    if (i < 0 || i >= frames)
        throw std::out_of_range("trajectory frame " + std::to_string(i) + " out of range");

    return mode_ == TrajectoryMode::ORBIT ? orbitPose(i) : smoothPose(i);
}

SE3 CameraTrajectory::orbitPose(int i) const
{
    const double theta = 2.0 * M_PI * i / frames;
    const Eigen::Vector3d p = orbitCenter + radius_ * (std::cos(theta) * axisA + std::sin(theta) * axisB);

    const Eigen::Vector3d z = (centroid_ - p).normalized();
    Eigen::Vector3d x = (-up_).cross(z);
    if (x.norm() < kTrajectoryEps)
        x = axisA;
    x.normalize();
    const Eigen::Vector3d y = z.cross(x);

    Eigen::Matrix3d R;
    R.col(0) = x;
    R.col(1) = y;
    R.col(2) = z;

    return SE3(R, p).inverse();
}

SE3 CameraTrajectory::smoothPose(int i) const
{
    const int n = static_cast<int>(centers.size());
    if (n == 1)
        return SE3(orientations[0], centers[0]).inverse();

    const double s = frames > 1 ? static_cast<double>(i) * (n - 1) / (frames - 1) : 0.0;
    const int k = std::min(static_cast<int>(std::floor(s)), n - 2);
    const double u = s - k;

    const Eigen::Vector3d& P0 = centers[std::max(k - 1, 0)];
    const Eigen::Vector3d& P1 = centers[k];
    const Eigen::Vector3d& P2 = centers[k + 1];
    const Eigen::Vector3d& P3 = centers[std::min(k + 2, n - 1)];

    // uniform Catmull-Rom, interpolates P1 at u = 0 and P2 at u = 1
    const double u2 = u * u;
    const double u3 = u2 * u;
    const Eigen::Vector3d p = 0.5 * ((2.0 * P1) +
                                     (-P0 + P2) * u +
                                     (2.0 * P0 - 5.0 * P1 + 4.0 * P2 - P3) * u2 +
                                     (-P0 + 3.0 * P1 - 3.0 * P2 + P3) * u3);

    const Eigen::Quaterniond q = orientations[k].slerp(u, orientations[k + 1]).normalized();

    return SE3(q, p).inverse();
}

std::string trajectoryToText(const CameraTrajectory& trajectory)
{
    std::string res;
    char buf[256];
    for (const SE3& pose : trajectory) {
        const Eigen::Quaterniond& q = pose.unit_quaternion();
        const Eigen::Vector3d& t = pose.translation();
        std::snprintf(buf, sizeof(buf), "%.9g %.9g %.9g %.9g %.9g %.9g %.9g\n",
                      q.w(), q.x(), q.y(), q.z(), t.x(), t.y(), t.z());
        res += buf;
    }
    return res;
}

}

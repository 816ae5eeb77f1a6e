#pragma once

#include <sophus/sim3.hpp>
#include <sophus/se3.hpp>

#include <Eigen/StdVector>
#include <map>
#include <vector>

// Typedefs for the Lie groups used throughout the fusion code.
// Everything is double precision: poses and similarity transforms are composed
// many times and are only cast to float when written out.
typedef Sophus::SE3d SE3;
typedef Sophus::Sim3d Sim3;


namespace scene_fusion {

typedef std::vector<SE3, Eigen::aligned_allocator<SE3>> SE3Vector;
typedef std::vector<Eigen::Vector3d, Eigen::aligned_allocator<Eigen::Vector3d>> Vector3dList;

// known reference poses (world-to-camera), keyed by view index.
typedef std::map<int, SE3, std::less<int>,
                 Eigen::aligned_allocator<std::pair<const int, SE3>>> KnownPoses;

inline Sim3 sim3FromSE3(const SE3& se3, double scale) {
  Sim3 result(se3.unit_quaternion(), se3.translation());
  result.setScale(scale);
  return result;
}

inline SE3 se3FromSim3(const Sim3& sim3) {
  return SE3(sim3.quaternion().normalized(), sim3.translation());
}

/** Builds x -> s * R * x + t. R must be a proper rotation, s > 0. */
inline Sim3 sim3FromParts(const Eigen::Matrix3d& R, double s, const Eigen::Vector3d& t) {
  Sim3 result(Eigen::Quaterniond(R).normalized(), t);
  result.setScale(s);
  return result;
}

}

extern template class Eigen::Quaternion<float>;
extern template class Eigen::Quaternion<double>;

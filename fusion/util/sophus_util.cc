#include <sophus/se3.hpp>
#include <sophus/sim3.hpp>

// Compile the quaternion templates here once so they don't need to be compiled
// in every translation unit that composes poses.
//
// Other files include sophus_util.h which carries the matching extern template
// declarations. For that reason, this file must not include sophus_util.h:
// a declaration may not follow the definition in the same translation unit.
//
// Eigen::Matrix cannot be instantiated this way, as it tries to compile a
// constructor variant for 4-component vectors, resulting in a static assertion
// failure.

template class Eigen::Quaternion<float>;
template class Eigen::Quaternion<double>;

#include "geometry.h"

#include <algorithm>
#include <cmath>

namespace scene_fusion {

bool CameraIntrinsics::isValid() const noexcept
{
    return std::isfinite(fx) && std::isfinite(fy) && fx > 0.0 && fy > 0.0 &&
           std::isfinite(cx) && std::isfinite(cy) && width > 0 && height > 0;
}

Eigen::Matrix3d CameraIntrinsics::K() const
{
    Eigen::Matrix3d K;
    K << fx, 0.0, cx,
         0.0, fy, cy,
         0.0, 0.0, 1.0;
    return K;
}

CameraIntrinsics CameraIntrinsics::fromFov(double fovH, double fovW, int width, int height)
{
    CameraIntrinsics K;
    K.width = width;
    K.height = height;
    K.fx = 0.5 * width / std::tan(0.5 * fovW);
    K.fy = 0.5 * height / std::tan(0.5 * fovH);
    K.cx = 0.5 * width;
    K.cy = 0.5 * height;
    return K;
}

CameraIntrinsics CameraIntrinsics::fromK(const Eigen::Matrix3d& K, int width, int height)
{
    CameraIntrinsics res;
    res.fx = K(0,0);
    res.fy = K(1,1);
    res.cx = K(0,2);
    res.cy = K(1,2);
    res.width = width;
    res.height = height;
    return res;
}


Eigen::Matrix3d quaternionToRotation(const Eigen::Vector4d& wxyz)
{
    Eigen::Quaterniond q(wxyz[0], wxyz[1], wxyz[2], wxyz[3]);
    q.normalize();
    return q.toRotationMatrix();
}

Eigen::Vector4d rotationToQuaternion(const Eigen::Matrix3d& R)
{
    Eigen::Quaterniond q(R);
    q.normalize();
    // q and -q are the same rotation; keep the w >= 0 hemisphere
    if (q.w() < 0.0) q.coeffs() *= -1.0;
    return Eigen::Vector4d(q.w(), q.x(), q.y(), q.z());
}

double rotationDistance(const Eigen::Matrix3d& R_a, const Eigen::Matrix3d& R_b)
{
    const Eigen::Matrix3d delta = R_a.transpose() * R_b;
    // trace can leave [-1,3] by rounding for nearly identical rotations
    const double c = std::clamp((delta.trace() - 1.0) * 0.5, -1.0, 1.0);
    return std::acos(c);
}

SE3 poseFromQuaternion(const Eigen::Vector4d& wxyz, const Eigen::Vector3d& t)
{
    return SE3(quaternionToRotation(wxyz), t);
}

SE3 applySimilarityToPose(const Sim3& S, const SE3& worldToCam)
{
    // camToWorld' = [R_S * R_c2w | S(c)]
    const SE3 camToWorld = worldToCam.inverse();
    const Eigen::Matrix3d R = S.rotationMatrix() * camToWorld.rotationMatrix();
    const Eigen::Vector3d c = S * camToWorld.translation();
    return SE3(R, c).inverse();
}

}

#pragma once

#include <Eigen/Core>
#include <Eigen/Geometry>

#include "sophus_util.h"

/*

geometry primitives shared by every stage.

conventions:
* camera frame is x right, y down, z forward (pinhole, OpenCV style)
* poses are world-to-camera: p_cam = R * p_world + t
* quaternions are (w, x, y, z) on the wire and converted to rotation
  matrices as soon as they enter; composition and inversion then stay exact
  matrix operations.

all functions are pure. unprojection at depth <= 0 is never computed:
callers skip such pixels.

*/

namespace scene_fusion {

struct CameraIntrinsics {
    double fx = 0.0;
    double fy = 0.0;
    double cx = 0.0;
    double cy = 0.0;

    int width = 0;
    int height = 0;

    /** Focal lengths finite and positive, principal point finite, resolution non-empty. */
    [[nodiscard]] bool isValid() const noexcept;

    [[nodiscard]] Eigen::Matrix3d K() const;
    [[nodiscard]] double meanFocal() const noexcept { return 0.5 * (fx + fy); }

    /** Pinhole intrinsics with the principal point at the image center. */
    static CameraIntrinsics fromFov(double fovH, double fovW, int width, int height);
    static CameraIntrinsics fromK(const Eigen::Matrix3d& K, int width, int height);
};

// ---------------- rotations ----------------

/** (w,x,y,z) -> rotation matrix. The quaternion does not need to be normalized. */
Eigen::Matrix3d quaternionToRotation(const Eigen::Vector4d& wxyz);

/** rotation matrix -> (w,x,y,z), normalized, w >= 0. */
Eigen::Vector4d rotationToQuaternion(const Eigen::Matrix3d& R);

inline Eigen::Matrix3d composeRotations(const Eigen::Matrix3d& R_ab, const Eigen::Matrix3d& R_bc) {
    return R_ab * R_bc;
}

inline Eigen::Matrix3d invertRotation(const Eigen::Matrix3d& R) {
    return R.transpose();
}

/** Rotation angle (radians) of R_a^T * R_b. */
double rotationDistance(const Eigen::Matrix3d& R_a, const Eigen::Matrix3d& R_b);

// ---------------- poses ----------------

/** World-to-camera pose from the predictor's wire format. */
SE3 poseFromQuaternion(const Eigen::Vector4d& wxyz, const Eigen::Vector3d& t);

/** Camera center in world coordinates: -R^T t. */
inline Eigen::Vector3d cameraCenter(const SE3& worldToCam) {
    return worldToCam.inverse().translation();
}

inline Eigen::Vector3d applyRigid(const SE3& T, const Eigen::Vector3d& p) {
    return T * p;
}

inline Eigen::Vector3d applySimilarity(const Sim3& S, const Eigen::Vector3d& p) {
    return S * p;
}

/** T2 o T1: applying the result equals applying T1 first, then T2. */
inline Sim3 composeSimilarity(const Sim3& T2, const Sim3& T1) {
    return T2 * T1;
}

/**
 * Moves a world-to-camera pose into the frame x' = s * R * x + t.
 *
 * The camera keeps its orientation relative to the scene, its center moves to
 * S(center), and the resulting pose stays rigid: depth measured in that camera
 * scales by s, which callers have to apply to the depth map themselves.
 */
SE3 applySimilarityToPose(const Sim3& S, const SE3& worldToCam);

// ---------------- pinhole ----------------

/** ((u-cx)/fx, (v-cy)/fy, 1) */
inline Eigen::Vector3d pixelToRay(const CameraIntrinsics& K, double u, double v) {
    return Eigen::Vector3d((u - K.cx) / K.fx, (v - K.cy) / K.fy, 1.0);
}

/** Camera-space point of pixel (u,v) at the given depth (z). depth must be > 0. */
inline Eigen::Vector3d unproject(const CameraIntrinsics& K, double u, double v, double depth) {
    return depth * pixelToRay(K, u, v);
}

/** Pixel coordinates of a camera-space point. Non-finite for z == 0. */
inline Eigen::Vector2d project(const CameraIntrinsics& K, const Eigen::Vector3d& pCam) {
    return Eigen::Vector2d(K.fx * pCam.x() / pCam.z() + K.cx,
                           K.fy * pCam.y() / pCam.z() + K.cy);
}

}

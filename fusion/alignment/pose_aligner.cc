#include "pose_aligner.h"
#include "../settings.h"
#include "../util/errors.h"
#include "../util/geometry.h"

#include <Eigen/SVD>
#include <algorithm>
#include <cmath>
#include <cstdio>

/*

umeyama similarity solve:

  mu_x, mu_y                     centroids of source / target
  C = 1/N sum (y_i - mu_y)(x_i - mu_x)^T
  C = U S V^T
  D = diag(1, 1, det(U)det(V) < 0 ? -1 : 1)    reflection correction
  R = U D V^T
  s = tr(D S) / var_x                          var_x = 1/N sum |x_i - mu_x|^2
  t = mu_y - s R mu_x

degenerate sets are rejected before the svd result is used: a similarity
from them would be arbitrary in at least one degree of freedom.

*/

namespace scene_fusion {

Sim3 alignPointSets(const Vector3dList& source, const Vector3dList& target, bool fixScale)
{
    if (source.size() != target.size())
        throw AlignmentError("correspondence sets differ in size (" + std::to_string(source.size()) +
                             " vs " + std::to_string(target.size()) + ")");

    const int N = static_cast<int>(source.size());
    if (N < 3)
        throw AlignmentError("need at least 3 correspondences, got " + std::to_string(N));

    Eigen::Vector3d muSrc = Eigen::Vector3d::Zero();
    Eigen::Vector3d muDst = Eigen::Vector3d::Zero();
    for (int i = 0; i < N; ++i) {
        muSrc += source[i];
        muDst += target[i];
    }
    muSrc /= N;
    muDst /= N;

    Eigen::Matrix3d cov = Eigen::Matrix3d::Zero();
    double varSrc = 0.0;
    double varDst = 0.0;
    for (int i = 0; i < N; ++i) {
        const Eigen::Vector3d x = source[i] - muSrc;
        const Eigen::Vector3d y = target[i] - muDst;
        cov += y * x.transpose();
        varSrc += x.squaredNorm();
        varDst += y.squaredNorm();
    }
    cov /= N;
    varSrc /= N;
    varDst /= N;

    if (!std::isfinite(varSrc) || !std::isfinite(varDst))
        throw AlignmentError("non-finite camera centers");

    if (varSrc < MIN_ALIGNMENT_SPREAD || varDst < MIN_ALIGNMENT_SPREAD)
        throw AlignmentError("camera centers coincide");

    Eigen::JacobiSVD<Eigen::Matrix3d> svd(cov, Eigen::ComputeFullU | Eigen::ComputeFullV);
    const Eigen::Vector3d sigma = svd.singularValues();

    // rank 1: all points on a line, the rotation about it is free.
    if (sigma(1) < MIN_ALIGNMENT_RANK_RATIO * sigma(0))
        throw AlignmentError("camera centers are collinear");

    const Eigen::Matrix3d U = svd.matrixU();
    const Eigen::Matrix3d V = svd.matrixV();

    Eigen::Matrix3d D = Eigen::Matrix3d::Identity();
    if (U.determinant() * V.determinant() < 0.0)
        D(2, 2) = -1.0;

    const Eigen::Matrix3d R = U * D * V.transpose();

    double s = 1.0;
    if (!fixScale) {
        s = (D.diagonal().cwiseProduct(sigma)).sum() / varSrc;
        if (!(s > 0.0) || !std::isfinite(s))
            throw AlignmentError("non-positive scale " + std::to_string(s));
    }

    const Eigen::Vector3d t = muDst - s * R * muSrc;

    if (enablePrintDebugInfo)
        std::printf("ALIGN: %d correspondences, scale %.6f, |t| %.6f\n", N, s, t.norm());

    return sim3FromParts(R, s, t);
}

Sim3 alignPoses(const SE3Vector& sourceWorldToCam, const SE3Vector& targetWorldToCam, bool fixScale)
{
    Vector3dList src, dst;
    src.reserve(sourceWorldToCam.size());
    dst.reserve(targetWorldToCam.size());
    for (const SE3& p : sourceWorldToCam) src.push_back(cameraCenter(p));
    for (const SE3& p : targetWorldToCam) dst.push_back(cameraCenter(p));
    return alignPointSets(src, dst, fixScale);
}

Sim3 anchorToPose(const SE3& predictedWorldToCam, const SE3& referenceWorldToCam)
{
    const SE3 predCamToWorld = predictedWorldToCam.inverse();
    const SE3 refCamToWorld = referenceWorldToCam.inverse();

    // R maps the predicted camera axes onto the reference ones, then the
    // predicted center is moved onto the reference center.
    const Eigen::Matrix3d R = refCamToWorld.rotationMatrix() * predCamToWorld.rotationMatrix().transpose();
    const Eigen::Vector3d t = refCamToWorld.translation() - R * predCamToWorld.translation();

    return sim3FromParts(R, 1.0, t);
}

std::vector<double> alignmentResiduals(const Sim3& S, const Vector3dList& source,
                                       const Vector3dList& target)
{
    std::vector<double> res;
    const size_t n = std::min(source.size(), target.size());
    res.reserve(n);
    for (size_t i = 0; i < n; ++i)
        res.push_back((target[i] - applySimilarity(S, source[i])).norm());
    return res;
}

double residualRms(const std::vector<double>& residuals)
{
    if (residuals.empty()) return 0.0;
    double sum = 0.0;
    for (double r : residuals) sum += r * r;
    return std::sqrt(sum / residuals.size());
}

}

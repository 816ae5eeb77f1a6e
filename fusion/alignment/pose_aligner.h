#pragma once

#include <vector>

#include "../util/sophus_util.h"

namespace scene_fusion {

/**
 * Closed-form similarity between two sets of corresponding camera centers.
 *
 * Finds S = (s, R, t) minimizing sum_i |target_i - (s R source_i + t)|^2
 * (Umeyama, 1991). With fixScale the scale is held at 1 and only the rigid
 * part is solved.
 *
 * Throws AlignmentError on fewer than 3 correspondences, differently sized
 * sets, coincident points, or collinear points (rotation about the line is
 * unobservable).
 */
Sim3 alignPointSets(const Vector3dList& source, const Vector3dList& target, bool fixScale = false);

/** Same as alignPointSets, on the centers of world-to-camera poses. */
Sim3 alignPoses(const SE3Vector& sourceWorldToCam, const SE3Vector& targetWorldToCam,
                bool fixScale = false);

/**
 * Rigid transform that moves one predicted camera exactly onto one reference
 * camera (orientation and center). Scale stays 1: a single pose carries no
 * information about it.
 */
Sim3 anchorToPose(const SE3& predictedWorldToCam, const SE3& referenceWorldToCam);

/** |target_i - S(source_i)| per correspondence. */
std::vector<double> alignmentResiduals(const Sim3& S, const Vector3dList& source,
                                       const Vector3dList& target);

/** Root mean square of the residuals, 0 for an empty list. */
double residualRms(const std::vector<double>& residuals);

}

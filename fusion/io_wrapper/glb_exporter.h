#pragma once

#include "byte_buffer.h"
#include "../model/point_cloud.h"
#include "../model/prediction.h"

namespace scene_fusion {

/**
 * Binary glTF (GLB 2.0) scene, built as an aiScene and written by assimp.
 *
 *  root "scene"        flips OpenCV axes (y down, z forward) to glTF (y up, z back)
 *    "points"          point primitive mesh with per-vertex colors (absent for an empty cloud)
 *    "camera_000" ...  one node per view, transform = camera-to-world in glTF
 *                      camera convention, carrying a line mesh of the view
 *                      frustum, and metadata with fx fy cx cy width height,
 *                      pose source and units. Inconsistent views get no
 *                      node; names keep the view's position in the prediction.
 *
 * Throws ExportError if assimp fails.
 */
ByteBuffer encodeSceneGlb(const PointCloud& cloud, const Prediction& prediction);

}

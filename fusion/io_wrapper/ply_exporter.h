#pragma once

#include <string>

#include "byte_buffer.h"
#include "../model/point_cloud.h"

namespace scene_fusion {

struct GaussianSet;

/**
 * Header of a colored point cloud: float x,y,z and uchar red,green,blue per vertex.
 * A "comment units relative|metric" line says whether the coordinates are scaled.
 */
std::string plyHeader(std::size_t numVertices, bool binary, Units units);

/**
 * Point cloud as PLY. ASCII writes one "x y z r g b" line per point with
 * enough digits that every float32 coordinate reads back exactly; binary is
 * little endian with the same vertex layout. An empty cloud is a header
 * with zero vertices.
 */
ByteBuffer encodePointCloudPly(const PointCloud& cloud, bool binary);

/** Reads back positions, colors and units of a PLY written by encodePointCloudPly. Throws ExportError. */
PointCloud decodePointCloudPly(const ByteBuffer& bytes);

/**
 * Gaussians in the layout of the 3D gaussian splatting reference code:
 * x y z nx ny nz f_dc_0..2 opacity scale_0..2 rot_0..3, binary little endian,
 * with f_dc the band-0 SH coefficient, opacity as logit and scales as log.
 * Carries the same units comment as the point cloud header.
 */
ByteBuffer encodeGaussianPly(const GaussianSet& gaussians);

}

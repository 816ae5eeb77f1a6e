#pragma once

#include <string>
#include <vector>

#include "byte_buffer.h"
#include "../model/prediction.h"

namespace scene_fusion {

/**
 * Minimal writer for numpy .npz archives: a zip container (no zip64) holding
 * one .npy (format 1.0) file per array, stored or raw-deflated with zlib.
 */
class NpzWriter {
public:
    explicit NpzWriter(bool compressed);

    NpzWriter(const NpzWriter&) = delete;
    NpzWriter& operator=(const NpzWriter&) = delete;

    /**
     * Adds name.npy. descr is the numpy type string ("<f4", "<i4", "|u1"), shape the
     * C-order dimensions (empty for a 0-d array); data must hold exactly
     * prod(shape) elements of that type in little endian.
     */
    void addArray(const std::string& name, const std::string& descr,
                  const std::vector<std::size_t>& shape, const ByteBuffer& data);

    /** Appends the central directory and returns the archive. The writer is empty afterwards. */
    ByteBuffer finish();

    std::size_t numEntries() const { return entries.size(); }

private:
    struct Entry {
        std::string fileName;
        std::uint16_t method;
        std::uint32_t crc;
        std::uint32_t compressedSize;
        std::uint32_t size;
        std::uint32_t offset;
    };

    bool compressed;
    ByteBuffer archive;
    std::vector<Entry> entries;
};

/** "\x93NUMPY" v1.0 header, padded so the array data starts on a 64 byte boundary. */
ByteBuffer npyHeader(const std::string& descr, const std::vector<std::size_t>& shape);

/**
 * Raw arrays of a fused prediction:
 *
 *   depth        (N,H,W)   <f4   0 = invalid
 *   conf         (N,H,W)   <f4   1 where no confidence map was given
 *   image        (N,H,W,3) |u1   RGB, only with includeImages
 *   extrinsics   (N,3,4)   <f4   world-to-camera [R|t]
 *   intrinsics   (N,3,3)   <f4
 *   pose_source  (N,)      |u1   0 predicted, 1 known
 *   view_index   (N,)      <i4   position of each row in the prediction
 *   metric       ()        |u1   1 when the frame is metric
 *
 * Inconsistent views are left out with a warning, so N counts the exported
 * views only. With differing view resolutions depth, conf and image are
 * stored per view as depth_000, conf_000, image_000, ... named by the
 * view's position in the prediction.
 */
ByteBuffer encodePredictionNpz(const Prediction& prediction, bool compressed, bool includeImages);

}

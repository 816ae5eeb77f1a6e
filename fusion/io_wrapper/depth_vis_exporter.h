#pragma once

#include <string>
#include <vector>

#include "byte_buffer.h"
#include "../model/prediction.h"

namespace scene_fusion {

struct NamedImage {
    std::string fileName;
    ByteBuffer png;
};

/**
 * Per view a PNG pair: depth_%03d.png (inverse depth rainbow over the
 * darkened image) and conf_%03d.png (green confident, red uncertain), each
 * captioned with the view index and the units of the prediction.
 * Inconsistent views are skipped. Throws ExportError if encoding fails.
 */
std::vector<NamedImage> encodeDepthVisualisation(const Prediction& prediction);

}

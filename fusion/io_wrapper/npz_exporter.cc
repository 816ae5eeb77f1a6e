#include "npz_exporter.h"
#include "../settings.h"
#include "../util/errors.h"

#include <zlib.h>

#include <algorithm>
#include <cstdio>
#include <limits>
#include <utility>

/*

zip layout written here (all little endian, no data descriptors, no zip64):

  [local file header][file data]     per entry
  [central directory header]         per entry
  [end of central directory record]

entries larger than 4 GiB are rejected.

*/

namespace scene_fusion {

namespace {

const std::uint32_t kLocalHeaderSig = 0x04034b50;
const std::uint32_t kCentralHeaderSig = 0x02014b50;
const std::uint32_t kEndOfCentralDirSig = 0x06054b50;
const std::uint16_t kZipVersion = 20;
const std::uint16_t kMethodStored = 0;
const std::uint16_t kMethodDeflate = 8;
const std::uint16_t kDosDate = (0 << 9) | (1 << 5) | 1;   // 1980-01-01

std::uint32_t crcOf(const ByteBuffer& data)
{
    uLong crc = crc32(0L, Z_NULL, 0);
    const Bytef* p = data.data();
    std::size_t left = data.size();
    while (left > 0) {
        const uInt chunk = static_cast<uInt>(std::min<std::size_t>(left, std::numeric_limits<uInt>::max()));
        crc = crc32(crc, p, chunk);
        p += chunk;
        left -= chunk;
    }
    return static_cast<std::uint32_t>(crc);
}

ByteBuffer rawDeflate(const ByteBuffer& data)
{
    z_stream zs{};
    // negative window bits: raw deflate stream without zlib header, as zip expects
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw ExportError("deflateInit2 failed");

    ByteBuffer out(deflateBound(&zs, static_cast<uLong>(data.size())));
    zs.next_in = const_cast<Bytef*>(data.data());
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    const int ret = deflate(&zs, Z_FINISH);
    const uLong produced = zs.total_out;
    deflateEnd(&zs);

    if (ret != Z_STREAM_END)
        throw ExportError("deflate failed with code " + std::to_string(ret));

    out.resize(produced);
    return out;
}

std::string shapeString(const std::vector<std::size_t>& shape)
{
    std::string s = "(";
    for (std::size_t i = 0; i < shape.size(); ++i) {
        s += std::to_string(shape[i]);
        if (shape.size() == 1 || i + 1 < shape.size()) s += ",";
        if (i + 1 < shape.size()) s += " ";
    }
    s += ")";
    return s;
}

std::size_t descrSize(const std::string& descr)
{
    if (descr == "<f4") return 4;
    if (descr == "|u1") return 1;
    if (descr == "<i4") return 4;
    throw ExportError("unsupported npy type " + descr);
}

}

ByteBuffer npyHeader(const std::string& descr, const std::vector<std::size_t>& shape)
{
    std::string dict = "{'descr': '" + descr + "', 'fortran_order': False, 'shape': " +
                       shapeString(shape) + ", }";

    // magic(6) + version(2) + length(2) + dict + padding + '\n' == k * 64
    const std::size_t unpadded = 10 + dict.size() + 1;
    const std::size_t padded = (unpadded + 63) / 64 * 64;
    dict.append(padded - unpadded, ' ');
    dict += '\n';

    ByteBuffer buf;
    appendU8(buf, 0x93);
    appendString(buf, "NUMPY");
    appendU8(buf, 1);
    appendU8(buf, 0);
    appendU16(buf, static_cast<std::uint16_t>(dict.size()));
    appendString(buf, dict);
    return buf;
}

NpzWriter::NpzWriter(bool compressed)
    : compressed(compressed)
{
}

void NpzWriter::addArray(const std::string& name, const std::string& descr,
                         const std::vector<std::size_t>& shape, const ByteBuffer& data)
{
    std::size_t numElements = 1;
    for (std::size_t d : shape) numElements *= d;
    if (numElements * descrSize(descr) != data.size())
        throw ExportError("array " + name + ": " + std::to_string(data.size()) + " bytes do not match shape " +
                          shapeString(shape));

    ByteBuffer file = npyHeader(descr, shape);
    appendBytes(file, data.data(), data.size());

    const std::uint32_t maxSize = std::numeric_limits<std::uint32_t>::max();
    if (file.size() >= maxSize || archive.size() >= maxSize)
        throw ExportError("array " + name + " too large for a zip archive without zip64");

    Entry e;
    e.fileName = name + ".npy";
    e.crc = crcOf(file);
    e.size = static_cast<std::uint32_t>(file.size());
    e.offset = static_cast<std::uint32_t>(archive.size());

    ByteBuffer payload;
    if (compressed) {
        payload = rawDeflate(file);
        e.method = kMethodDeflate;
    } else {
        payload = std::move(file);
        e.method = kMethodStored;
    }
    e.compressedSize = static_cast<std::uint32_t>(payload.size());

    appendU32(archive, kLocalHeaderSig);
    appendU16(archive, kZipVersion);
    appendU16(archive, 0);                 // flags
    appendU16(archive, e.method);
    appendU16(archive, 0);                 // time
    appendU16(archive, kDosDate);
    appendU32(archive, e.crc);
    appendU32(archive, e.compressedSize);
    appendU32(archive, e.size);
    appendU16(archive, static_cast<std::uint16_t>(e.fileName.size()));
    appendU16(archive, 0);                 // extra length
    appendString(archive, e.fileName);
    appendBytes(archive, payload.data(), payload.size());

    entries.push_back(e);
}

ByteBuffer NpzWriter::finish()
{
    const std::uint32_t cdOffset = static_cast<std::uint32_t>(archive.size());

    for (const Entry& e : entries) {
        appendU32(archive, kCentralHeaderSig);
        appendU16(archive, kZipVersion);   // made by
        appendU16(archive, kZipVersion);   // needed
        appendU16(archive, 0);
        appendU16(archive, e.method);
        appendU16(archive, 0);
        appendU16(archive, kDosDate);
        appendU32(archive, e.crc);
        appendU32(archive, e.compressedSize);
        appendU32(archive, e.size);
        appendU16(archive, static_cast<std::uint16_t>(e.fileName.size()));
        appendU16(archive, 0);             // extra
        appendU16(archive, 0);             // comment
        appendU16(archive, 0);             // disk
        appendU16(archive, 0);             // internal attributes
        appendU32(archive, 0);             // external attributes
        appendU32(archive, e.offset);
        appendString(archive, e.fileName);
    }

    const std::uint32_t cdSize = static_cast<std::uint32_t>(archive.size()) - cdOffset;

    appendU32(archive, kEndOfCentralDirSig);
    appendU16(archive, 0);
    appendU16(archive, 0);
    appendU16(archive, static_cast<std::uint16_t>(entries.size()));
    appendU16(archive, static_cast<std::uint16_t>(entries.size()));
    appendU32(archive, cdSize);
    appendU32(archive, cdOffset);
    appendU16(archive, 0);

    ByteBuffer res;
    res.swap(archive);
    entries.clear();
    return res;
}


namespace {

void appendFloatMat(ByteBuffer& buf, const cv::Mat& m)
{
    for (int y = 0; y < m.rows; ++y) {
        const float* row = m.ptr<float>(y);
        for (int x = 0; x < m.cols; ++x)
            appendF32(buf, row[x]);
    }
}

void appendConfidence(ByteBuffer& buf, const View& v)
{
    for (int y = 0; y < v.height(); ++y)
        for (int x = 0; x < v.width(); ++x)
            appendF32(buf, v.confidenceAt(x, y));
}

void appendImage(ByteBuffer& buf, const View& v)
{
    const cv::Mat& img = v.image();
    for (int y = 0; y < img.rows; ++y)
        appendBytes(buf, img.ptr<std::uint8_t>(y), static_cast<std::size_t>(img.cols) * 3);
}

}

ByteBuffer encodePredictionNpz(const Prediction& prediction, bool compressed, bool includeImages)
{
    prediction.requireViews("npz export");

    const std::vector<std::size_t> kept = prediction.consistentViews("npz");
    const std::size_t N = kept.size();
    NpzWriter writer(compressed);

    if (N > 0 && prediction.hasUniformResolution(kept)) {
        const std::size_t H = prediction.views[kept.front()].height();
        const std::size_t W = prediction.views[kept.front()].width();

        ByteBuffer depth, conf, image;
        for (std::size_t i : kept) {
            const View& v = prediction.views[i];
            appendFloatMat(depth, v.depth());
            appendConfidence(conf, v);
            if (includeImages) appendImage(image, v);
        }
        writer.addArray("depth", "<f4", {N, H, W}, depth);
        writer.addArray("conf", "<f4", {N, H, W}, conf);
        if (includeImages)
            writer.addArray("image", "|u1", {N, H, W, 3}, image);
    } else {
        char name[32];
        for (std::size_t i : kept) {
            const View& v = prediction.views[i];
            const std::size_t H = v.height();
            const std::size_t W = v.width();

            ByteBuffer depth, conf, image;
            appendFloatMat(depth, v.depth());
            appendConfidence(conf, v);

            std::snprintf(name, sizeof(name), "depth_%03zu", i);
            writer.addArray(name, "<f4", {H, W}, depth);
            std::snprintf(name, sizeof(name), "conf_%03zu", i);
            writer.addArray(name, "<f4", {H, W}, conf);
            if (includeImages) {
                appendImage(image, v);
                std::snprintf(name, sizeof(name), "image_%03zu", i);
                writer.addArray(name, "|u1", {H, W, 3}, image);
            }
        }
    }

    ByteBuffer extrinsics, intrinsics, source, index;
    for (std::size_t i : kept) {
        const View& v = prediction.views[i];
        const Eigen::Matrix<double, 3, 4> Rt = v.pose.worldToCam().matrix3x4();
        for (int r = 0; r < 3; ++r)
            for (int c = 0; c < 4; ++c)
                appendF32(extrinsics, static_cast<float>(Rt(r, c)));

        const Eigen::Matrix3d K = v.intrinsics().K();
        for (int r = 0; r < 3; ++r)
            for (int c = 0; c < 3; ++c)
                appendF32(intrinsics, static_cast<float>(K(r, c)));

        appendU8(source, static_cast<std::uint8_t>(v.pose.source()));
        appendU32(index, static_cast<std::uint32_t>(i));
    }
    writer.addArray("extrinsics", "<f4", {N, 3, 4}, extrinsics);
    writer.addArray("intrinsics", "<f4", {N, 3, 3}, intrinsics);
    writer.addArray("pose_source", "|u1", {N}, source);
    writer.addArray("view_index", "<i4", {N}, index);

    ByteBuffer metric;
    appendU8(metric, prediction.units == Units::METRIC ? 1 : 0);
    writer.addArray("metric", "|u1", {}, metric);

    const std::size_t numEntries = writer.numEntries();
    ByteBuffer res = writer.finish();

    if (printExportInfo)
        std::printf("EXPORT: npz (%s), %zu views, %zu arrays, %zu bytes\n",
                    compressed ? "deflate" : "stored", N, numEntries, res.size());
    return res;
}

}

#include "ply_exporter.h"
#include "../gaussians/gaussian_adapter.h"
#include "../settings.h"
#include "../util/errors.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace scene_fusion {

namespace {

const float kMinGaussianScale = 1e-12f;
const float kOpacityEps = 1e-6f;

const std::size_t kPlyVertexBytes = 3 * sizeof(float) + 3;

}

std::string plyHeader(std::size_t numVertices, bool binary, Units units)
{
    std::string h;
    h += "ply\n";
    h += binary ? "format binary_little_endian 1.0\n" : "format ascii 1.0\n";
    h += std::string("comment units ") + unitsName(units) + "\n";
    h += "element vertex " + std::to_string(numVertices) + "\n";
    h += "property float x\n";
    h += "property float y\n";
    h += "property float z\n";
    h += "property uchar red\n";
    h += "property uchar green\n";
    h += "property uchar blue\n";
    h += "end_header\n";
    return h;
}

ByteBuffer encodePointCloudPly(const PointCloud& cloud, bool binary)
{
    ByteBuffer buf;
    const std::string header = plyHeader(cloud.size(), binary, cloud.units);

    if (binary) {
        buf.reserve(header.size() + cloud.size() * kPlyVertexBytes);
        appendString(buf, header);
        for (std::size_t i = 0; i < cloud.size(); ++i) {
            const Eigen::Vector3f& p = cloud.positions[i];
            const Color3b& c = cloud.colors[i];
            appendF32(buf, p.x());
            appendF32(buf, p.y());
            appendF32(buf, p.z());
            appendU8(buf, c[0]);
            appendU8(buf, c[1]);
            appendU8(buf, c[2]);
        }
    } else {
        buf.reserve(header.size() + cloud.size() * 48);
        appendString(buf, header);
        char line[160];
        for (std::size_t i = 0; i < cloud.size(); ++i) {
            const Eigen::Vector3f& p = cloud.positions[i];
            const Color3b& c = cloud.colors[i];
            // 9 significant digits round-trip any float32
            const int len = std::snprintf(line, sizeof(line), "%.9g %.9g %.9g %u %u %u\n",
                                          p.x(), p.y(), p.z(),
                                          static_cast<unsigned>(c[0]), static_cast<unsigned>(c[1]),
                                          static_cast<unsigned>(c[2]));
            appendBytes(buf, line, static_cast<std::size_t>(len));
        }
    }

    if (printExportInfo)
        std::printf("EXPORT: ply (%s), %zu vertices, %zu bytes\n", binary ? "binary" : "ascii",
                    cloud.size(), buf.size());
    return buf;
}

PointCloud decodePointCloudPly(const ByteBuffer& bytes)
{
    static const std::string kEnd = "end_header\n";
    const auto endIt = std::search(bytes.begin(), bytes.end(), kEnd.begin(), kEnd.end());
    if (endIt == bytes.end())
        throw ExportError("malformed ply: no end_header");

    const std::size_t dataStart = static_cast<std::size_t>(endIt - bytes.begin()) + kEnd.size();
    std::istringstream header(std::string(bytes.begin(), endIt));

    std::string line;
    std::getline(header, line);
    if (line != "ply")
        throw ExportError("malformed ply: missing magic");

    bool binary = false;
    Units units = Units::RELATIVE;
    long long numVertices = -1;
    std::vector<std::string> properties;
    while (std::getline(header, line)) {
        std::istringstream ls(line);
        std::string key;
        ls >> key;
        if (key == "format") {
            std::string fmt;
            ls >> fmt;
            if (fmt == "binary_little_endian") binary = true;
            else if (fmt != "ascii") throw ExportError("unsupported ply format " + fmt);
        } else if (key == "element") {
            std::string name;
            ls >> name >> numVertices;
            if (name != "vertex") throw ExportError("unsupported ply element " + name);
        } else if (key == "property") {
            std::string type, name;
            ls >> type >> name;
            properties.push_back(type + " " + name);
        } else if (key == "comment") {
            std::string what, value;
            ls >> what >> value;
            if (what == "units" && value == unitsName(Units::METRIC)) units = Units::METRIC;
        }
    }

    const std::vector<std::string> expected = {"float x", "float y", "float z",
                                               "uchar red", "uchar green", "uchar blue"};
    if (numVertices < 0 || properties != expected)
        throw ExportError("malformed ply: unexpected vertex layout");

    PointCloud cloud;
    cloud.units = units;
    cloud.reserve(static_cast<std::size_t>(numVertices));

    if (binary) {
        if (bytes.size() - dataStart < static_cast<std::size_t>(numVertices) * kPlyVertexBytes)
            throw ExportError("malformed ply: truncated vertex data");
        const std::uint8_t* p = bytes.data() + dataStart;
        for (long long i = 0; i < numVertices; ++i, p += kPlyVertexBytes) {
            cloud.push(Eigen::Vector3f(readF32(p), readF32(p + 4), readF32(p + 8)),
                       Color3b(p[12], p[13], p[14]), -1, 1.0f);
        }
    } else {
        std::istringstream data(std::string(bytes.begin() + dataStart, bytes.end()));
        for (long long i = 0; i < numVertices; ++i) {
            float x, y, z;
            unsigned r, g, b;
            if (!(data >> x >> y >> z >> r >> g >> b))
                throw ExportError("malformed ply: truncated vertex data");
            cloud.push(Eigen::Vector3f(x, y, z),
                       Color3b(static_cast<std::uint8_t>(r), static_cast<std::uint8_t>(g),
                               static_cast<std::uint8_t>(b)), -1, 1.0f);
        }
    }
    return cloud;
}

ByteBuffer encodeGaussianPly(const GaussianSet& gaussians)
{
    static const char* kProperties[] = {
        "x", "y", "z", "nx", "ny", "nz",
        "f_dc_0", "f_dc_1", "f_dc_2",
        "opacity",
        "scale_0", "scale_1", "scale_2",
        "rot_0", "rot_1", "rot_2", "rot_3"
    };

    std::string header;
    header += "ply\n";
    header += "format binary_little_endian 1.0\n";
    header += std::string("comment units ") + unitsName(gaussians.units) + "\n";
    header += "element vertex " + std::to_string(gaussians.size()) + "\n";
    for (const char* p : kProperties)
        header += std::string("property float ") + p + "\n";
    header += "end_header\n";

    ByteBuffer buf;
    buf.reserve(header.size() + gaussians.size() * 17 * sizeof(float));
    appendString(buf, header);

    for (std::size_t i = 0; i < gaussians.size(); ++i) {
        const Eigen::Vector3f& m = gaussians.means[i];
        appendF32(buf, m.x());
        appendF32(buf, m.y());
        appendF32(buf, m.z());

        appendF32(buf, 0.0f);
        appendF32(buf, 0.0f);
        appendF32(buf, 0.0f);

        const Eigen::Vector3f& c = gaussians.colors[i];
        for (int k = 0; k < 3; ++k)
            appendF32(buf, (c[k] - 0.5f) / SH_C0);

        const float o = std::clamp(gaussians.opacities[i], kOpacityEps, 1.0f - kOpacityEps);
        appendF32(buf, std::log(o / (1.0f - o)));

        const Eigen::Vector3f& s = gaussians.scales[i];
        for (int k = 0; k < 3; ++k)
            appendF32(buf, std::log(std::max(s[k], kMinGaussianScale)));

        const Eigen::Vector4f& q = gaussians.rotations[i];
        for (int k = 0; k < 4; ++k)
            appendF32(buf, q[k]);
    }

    if (printExportInfo)
        std::printf("EXPORT: gaussian ply, %zu primitives, %zu bytes\n", gaussians.size(), buf.size());
    return buf;
}

}

#include <gtest/gtest.h>

#include <zlib.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <string>

#include "../fusion/gaussians/gaussian_adapter.h"
#include "../fusion/gaussians/trajectory_generator.h"
#include "../fusion/io_wrapper/depth_vis_exporter.h"
#include "../fusion/io_wrapper/exporter.h"
#include "../fusion/io_wrapper/glb_exporter.h"
#include "../fusion/io_wrapper/npz_exporter.h"
#include "../fusion/io_wrapper/ply_exporter.h"
#include "../fusion/reconstruction/point_cloud_assembler.h"
#include "../fusion/settings.h"
#include "../fusion/util/errors.h"
#include "test_scenes.h"

using namespace scene_fusion;

namespace {

PointCloud smallCloud()
{
    PointCloud cloud;
    cloud.push(Eigen::Vector3f(0.1f, -2.5f, 3.14159274f), Color3b(255, 0, 7), 0, 0.5f);
    cloud.push(Eigen::Vector3f(1e-7f, 123456.789f, -0.0f), Color3b(1, 2, 3), 0, 0.9f);
    cloud.push(Eigen::Vector3f(-1.0f / 3.0f, 2.0f / 7.0f, 1e20f), Color3b(128, 64, 32), 1, 1.0f);
    return cloud;
}

std::string headerOf(const ByteBuffer& bytes)
{
    const std::string s(bytes.begin(), bytes.end());
    const size_t end = s.find("end_header\n");
    return end == std::string::npos ? std::string() : s.substr(0, end + 11);
}

// reads every entry of a zip written by NpzWriter: name -> uncompressed bytes
std::map<std::string, ByteBuffer> readZip(const ByteBuffer& zip)
{
    std::map<std::string, ByteBuffer> files;
    size_t pos = 0;
    while (pos + 30 <= zip.size() && readU32(&zip[pos]) == 0x04034b50) {
        const std::uint16_t method = readU16(&zip[pos + 8]);
        const std::uint32_t crc = readU32(&zip[pos + 14]);
        const std::uint32_t csize = readU32(&zip[pos + 18]);
        const std::uint32_t usize = readU32(&zip[pos + 22]);
        const std::uint16_t nameLen = readU16(&zip[pos + 26]);
        const std::uint16_t extraLen = readU16(&zip[pos + 28]);
        const std::string name(zip.begin() + pos + 30, zip.begin() + pos + 30 + nameLen);
        const std::uint8_t* data = &zip[pos + 30 + nameLen + extraLen];

        ByteBuffer out(usize);
        if (method == 0) {
            std::copy(data, data + csize, out.begin());
        } else {
            z_stream zs{};
            EXPECT_EQ(inflateInit2(&zs, -MAX_WBITS), Z_OK);
            zs.next_in = const_cast<Bytef*>(data);
            zs.avail_in = csize;
            zs.next_out = out.data();
            zs.avail_out = usize;
            EXPECT_EQ(inflate(&zs, Z_FINISH), Z_STREAM_END);
            inflateEnd(&zs);
        }
        EXPECT_EQ(crc32(crc32(0L, Z_NULL, 0), out.data(), static_cast<uInt>(out.size())), crc) << name;

        files[name] = out;
        pos += 30 + nameLen + extraLen + csize;
    }
    // end of central directory record closes the archive
    EXPECT_GE(zip.size(), 22u);
    EXPECT_EQ(readU32(&zip[zip.size() - 22]), 0x06054b50u);
    EXPECT_EQ(readU16(&zip[zip.size() - 12]), files.size());
    return files;
}

std::string npyDict(const ByteBuffer& npy)
{
    const std::uint16_t len = readU16(&npy[8]);
    return std::string(npy.begin() + 10, npy.begin() + 10 + len);
}

}

class ExportTest : public ::testing::Test {
protected:
    void SetUp() override { printExportInfo = false; }
};

TEST_F(ExportTest, PlyHeaderLayout)
{
    EXPECT_EQ(plyHeader(3, false, Units::RELATIVE),
              "ply\n"
              "format ascii 1.0\n"
              "comment units relative\n"
              "element vertex 3\n"
              "property float x\n"
              "property float y\n"
              "property float z\n"
              "property uchar red\n"
              "property uchar green\n"
              "property uchar blue\n"
              "end_header\n");
    EXPECT_NE(plyHeader(0, true, Units::METRIC).find("format binary_little_endian 1.0\n"), std::string::npos);
}

TEST_F(ExportTest, PlyHeadersSayWhetherGeometryIsScaled)
{
    PointCloud cloud = smallCloud();
    EXPECT_NE(headerOf(encodePointCloudPly(cloud, false)).find("comment units relative\n"), std::string::npos);
    EXPECT_EQ(decodePointCloudPly(encodePointCloudPly(cloud, true)).units, Units::RELATIVE);

    cloud.units = Units::METRIC;
    const ByteBuffer bytes = encodePointCloudPly(cloud, false);
    EXPECT_NE(headerOf(bytes).find("comment units metric\n"), std::string::npos);
    const PointCloud back = decodePointCloudPly(bytes);
    EXPECT_EQ(back.units, Units::METRIC);
    EXPECT_EQ(back.size(), cloud.size());

    GaussianSet set;
    set.units = Units::RELATIVE;
    EXPECT_NE(headerOf(encodeGaussianPly(set)).find("comment units relative\n"), std::string::npos);
}

TEST_F(ExportTest, AsciiPlyReadsBackExactly)
{
    const PointCloud cloud = smallCloud();
    const PointCloud back = decodePointCloudPly(encodePointCloudPly(cloud, false));

    ASSERT_EQ(back.size(), cloud.size());
    for (size_t i = 0; i < cloud.size(); ++i) {
        EXPECT_EQ(back.positions[i], cloud.positions[i]) << i;
        EXPECT_EQ(back.colors[i], cloud.colors[i]) << i;
    }
}

TEST_F(ExportTest, BinaryPlyReadsBackExactly)
{
    const PointCloud cloud = smallCloud();
    const ByteBuffer bytes = encodePointCloudPly(cloud, true);
    EXPECT_EQ(bytes.size(), plyHeader(3, true, cloud.units).size() + 3 * 15);

    const PointCloud back = decodePointCloudPly(bytes);
    ASSERT_EQ(back.size(), cloud.size());
    for (size_t i = 0; i < cloud.size(); ++i) {
        EXPECT_EQ(back.positions[i], cloud.positions[i]) << i;
        EXPECT_EQ(back.colors[i], cloud.colors[i]) << i;
    }
}

TEST_F(ExportTest, EmptyCloudIsAValidZeroVertexPly)
{
    for (bool binary : {false, true}) {
        const ByteBuffer bytes = encodePointCloudPly(PointCloud(), binary);
        EXPECT_EQ(std::string(bytes.begin(), bytes.end()), plyHeader(0, binary, Units::RELATIVE));
        EXPECT_TRUE(decodePointCloudPly(bytes).empty());
    }
}

TEST_F(ExportTest, MalformedPlyIsRejected)
{
    const std::string junk = "ply\nformat ascii 1.0\nelement vertex 2\nproperty float x\nend_header\n1\n2\n";
    EXPECT_THROW(decodePointCloudPly(ByteBuffer(junk.begin(), junk.end())), ExportError);
    EXPECT_THROW(decodePointCloudPly(ByteBuffer()), ExportError);
}

TEST_F(ExportTest, GaussianPlyLayout)
{
    GaussianSet set;
    set.means.push_back(Eigen::Vector3f(1, 2, 3));
    set.scales.push_back(Eigen::Vector3f::Constant(0.5f));
    set.rotations.push_back(Eigen::Vector4f(1, 0, 0, 0));
    set.colors.push_back(Eigen::Vector3f(0.5f, 1.0f, 0.0f));
    set.opacities.push_back(0.75f);

    const ByteBuffer bytes = encodeGaussianPly(set);
    const std::string header = headerOf(bytes);
    ASSERT_FALSE(header.empty());
    EXPECT_NE(header.find("format binary_little_endian 1.0\n"), std::string::npos);
    EXPECT_NE(header.find("element vertex 1\n"), std::string::npos);
    for (const char* p : {"f_dc_0", "opacity", "scale_2", "rot_3", "nx"})
        EXPECT_NE(header.find(std::string("property float ") + p + "\n"), std::string::npos) << p;

    ASSERT_EQ(bytes.size(), header.size() + 17 * 4);
    const std::uint8_t* v = bytes.data() + header.size();
    EXPECT_FLOAT_EQ(readF32(v + 0), 1.0f);
    EXPECT_FLOAT_EQ(readF32(v + 6 * 4), 0.0f);                       // f_dc_0 of 0.5
    EXPECT_FLOAT_EQ(readF32(v + 7 * 4), 0.5f / SH_C0);               // f_dc_1 of 1.0
    EXPECT_NEAR(readF32(v + 9 * 4), std::log(3.0f), 1e-6);           // logit(0.75)
    EXPECT_NEAR(readF32(v + 10 * 4), std::log(0.5f), 1e-6);
    EXPECT_FLOAT_EQ(readF32(v + 13 * 4), 1.0f);                      // rot w
}

TEST_F(ExportTest, NpyHeaderIsPaddedTo64Bytes)
{
    const std::vector<std::vector<std::size_t>> shapes = {{}, {7}, {2, 3, 4}, {100000, 480, 640, 3}};
    for (const std::vector<std::size_t>& shape : shapes) {
        const ByteBuffer h = npyHeader("<f4", shape);
        EXPECT_EQ(h.size() % 64, 0u);
        EXPECT_EQ(h[0], 0x93);
        EXPECT_EQ(std::string(h.begin() + 1, h.begin() + 6), "NUMPY");
        EXPECT_EQ(h.back(), '\n');
    }
    EXPECT_NE(npyDict(npyHeader("|u1", {})).find("'shape': ()"), std::string::npos);
    EXPECT_NE(npyDict(npyHeader("|u1", {5})).find("'shape': (5,)"), std::string::npos);
    EXPECT_NE(npyDict(npyHeader("<f4", {2, 3})).find("'shape': (2, 3)"), std::string::npos);
}

TEST_F(ExportTest, NpzHoldsStackedArrays)
{
    Prediction pred = test::makeScene(3, 8, 6, Units::METRIC);
    pred.views[2].pose.setWorldToCam(pred.views[2].pose.worldToCam(), PoseSource::KNOWN);

    for (bool compressed : {true, false}) {
        const std::map<std::string, ByteBuffer> files = readZip(encodePredictionNpz(pred, compressed, true));

        for (const char* name : {"depth.npy", "conf.npy", "image.npy", "extrinsics.npy", "intrinsics.npy",
                                 "pose_source.npy", "metric.npy"})
            ASSERT_EQ(files.count(name), 1u) << name;

        EXPECT_NE(npyDict(files.at("depth.npy")).find("'shape': (3, 6, 8)"), std::string::npos);
        EXPECT_NE(npyDict(files.at("image.npy")).find("'shape': (3, 6, 8, 3)"), std::string::npos);
        EXPECT_NE(npyDict(files.at("extrinsics.npy")).find("'shape': (3, 3, 4)"), std::string::npos);

        // data follows the padded header
        const ByteBuffer& depth = files.at("depth.npy");
        const size_t off = 10 + readU16(&depth[8]);
        EXPECT_EQ(off % 64, 0u);
        EXPECT_EQ(depth.size() - off, 3u * 6u * 8u * 4u);
        EXPECT_FLOAT_EQ(readF32(&depth[off + 4 * 1]), pred.views[0].depth().at<float>(0, 1));

        const ByteBuffer& src = files.at("pose_source.npy");
        EXPECT_EQ(src.back(), 1);
        EXPECT_EQ(src[src.size() - 3], 0);
        EXPECT_EQ(files.at("metric.npy").back(), 1);
    }
}

TEST_F(ExportTest, NpzStoresMixedResolutionsPerView)
{
    Prediction pred = test::makeScene(2, 8, 6);
    pred.views.push_back(test::makeView(2, SE3(), 10, 4));

    const std::map<std::string, ByteBuffer> files = readZip(encodePredictionNpz(pred, true, false));
    EXPECT_EQ(files.count("depth.npy"), 0u);
    EXPECT_EQ(files.count("image_000.npy"), 0u);
    EXPECT_EQ(files.count("depth_002.npy"), 1u);
    EXPECT_EQ(files.count("conf_001.npy"), 1u);
    EXPECT_NE(npyDict(files.at("depth_002.npy")).find("'shape': (4, 10)"), std::string::npos);
    EXPECT_EQ(files.count("extrinsics.npy"), 1u);
}

TEST_F(ExportTest, NpzLeavesOutInconsistentViews)
{
    Prediction pred = test::makeScene(3, 8, 6);
    pred.views[1] = test::withBrokenIntrinsics(pred.views[1]);

    const std::map<std::string, ByteBuffer> files = readZip(encodePredictionNpz(pred, false, true));
    EXPECT_NE(npyDict(files.at("depth.npy")).find("'shape': (2, 6, 8)"), std::string::npos);
    EXPECT_NE(npyDict(files.at("extrinsics.npy")).find("'shape': (2, 3, 4)"), std::string::npos);
    EXPECT_NE(npyDict(files.at("pose_source.npy")).find("'shape': (2,)"), std::string::npos);

    const ByteBuffer& index = files.at("view_index.npy");
    EXPECT_NE(npyDict(index).find("'descr': '<i4'"), std::string::npos);
    const size_t off = 10 + readU16(&index[8]);
    ASSERT_EQ(index.size() - off, 8u);
    EXPECT_EQ(readU32(&index[off]), 0u);
    EXPECT_EQ(readU32(&index[off + 4]), 2u);

    // second stacked depth map belongs to view 2
    const ByteBuffer& depth = files.at("depth.npy");
    const size_t depthOff = 10 + readU16(&depth[8]);
    EXPECT_FLOAT_EQ(readF32(&depth[depthOff + 4 * 6 * 8 + 4]), pred.views[2].depth().at<float>(0, 1));
}

TEST_F(ExportTest, NpzPerViewArraysKeepViewPositions)
{
    Prediction pred = test::makeScene(2, 8, 6);
    pred.views.push_back(test::makeView(2, SE3(), 10, 4));
    pred.views[0] = test::withBrokenIntrinsics(pred.views[0]);

    const std::map<std::string, ByteBuffer> files = readZip(encodePredictionNpz(pred, true, false));
    EXPECT_EQ(files.count("depth_000.npy"), 0u);
    EXPECT_EQ(files.count("depth_001.npy"), 1u);
    EXPECT_EQ(files.count("depth_002.npy"), 1u);
    EXPECT_NE(npyDict(files.at("intrinsics.npy")).find("'shape': (2, 3, 3)"), std::string::npos);
}

TEST_F(ExportTest, NpzWriterRejectsSizeMismatch)
{
    NpzWriter writer(false);
    EXPECT_THROW(writer.addArray("x", "<f4", {3}, ByteBuffer(8)), ExportError);
    EXPECT_THROW(writer.addArray("x", "<f8", {1}, ByteBuffer(8)), ExportError);
    EXPECT_EQ(writer.numEntries(), 0u);
}

TEST_F(ExportTest, GlbIsBinaryGltf)
{
    const Prediction pred = test::makeScene(3);
    FusionConfig cfg;
    cfg.numThreads = 1;
    const PointCloud cloud = PointCloudAssembler(cfg).assemble(pred);

    const ByteBuffer glb = encodeSceneGlb(cloud, pred);
    ASSERT_GE(glb.size(), 20u);
    EXPECT_EQ(std::string(glb.begin(), glb.begin() + 4), "glTF");
    EXPECT_EQ(readU32(&glb[4]), 2u);
    EXPECT_EQ(readU32(&glb[8]), glb.size());

    // cameras only
    const ByteBuffer empty = encodeSceneGlb(PointCloud(), pred);
    EXPECT_EQ(std::string(empty.begin(), empty.begin() + 4), "glTF");
}

TEST_F(ExportTest, GlbDrawsOnlyConsistentCameras)
{
    Prediction pred = test::makeScene(3);
    FusionConfig cfg;
    cfg.numThreads = 1;
    const PointCloud cloud = PointCloudAssembler(cfg).assemble(pred);
    pred.views[2] = test::withBrokenIntrinsics(pred.views[2]);

    const ByteBuffer glb = encodeSceneGlb(cloud, pred);
    ASSERT_GE(glb.size(), 20u);
    EXPECT_EQ(std::string(glb.begin(), glb.begin() + 4), "glTF");
    EXPECT_EQ(readU32(&glb[8]), glb.size());

    // the JSON chunk follows the 12 byte header and the 8 byte chunk header
    const std::string json(glb.begin() + 20, glb.begin() + 20 + readU32(&glb[12]));
    EXPECT_NE(json.find("camera_000"), std::string::npos);
    EXPECT_NE(json.find("camera_001"), std::string::npos);
    EXPECT_EQ(json.find("camera_002"), std::string::npos);
}

TEST_F(ExportTest, DepthVisualisationIsOnePngPairPerView)
{
    const Prediction pred = test::makeScene(2, 16, 12);
    const std::vector<NamedImage> images = encodeDepthVisualisation(pred);

    ASSERT_EQ(images.size(), 4u);
    EXPECT_EQ(images[0].fileName, "depth_000.png");
    EXPECT_EQ(images[1].fileName, "conf_000.png");
    EXPECT_EQ(images[3].fileName, "conf_001.png");
    for (const NamedImage& img : images) {
        ASSERT_GE(img.png.size(), 8u);
        EXPECT_EQ(img.png[0], 0x89);
        EXPECT_EQ(std::string(img.png.begin() + 1, img.png.begin() + 4), "PNG");
    }
}

TEST_F(ExportTest, FormatSelectorParsing)
{
    EXPECT_EQ(parseExportFormats("ply"), static_cast<unsigned>(EXPORT_PLY));
    EXPECT_EQ(parseExportFormats("glb-ply"), static_cast<unsigned>(EXPORT_GLB | EXPORT_PLY));
    EXPECT_EQ(parseExportFormats("npz-ply-gs_ply"), static_cast<unsigned>(EXPORT_NPZ | EXPORT_PLY | EXPORT_GS_PLY));
    EXPECT_EQ(parseExportFormats(""), 0u);
    EXPECT_THROW(parseExportFormats("ply-obj"), ConfigError);
    EXPECT_EQ(exportFormatsToString(EXPORT_ALL), "ply-glb-npz-gs_ply-depth_vis");
}

TEST_F(ExportTest, DispatchTableCoversEveryFormat)
{
    for (ExportFormat f : {EXPORT_PLY, EXPORT_GLB, EXPORT_NPZ, EXPORT_GS_PLY, EXPORT_DEPTH_VIS}) {
        const ExporterEntry* e = findExporter(f);
        ASSERT_NE(e, nullptr);
        EXPECT_EQ(e->format, f);
        EXPECT_EQ(parseExportFormats(e->name), static_cast<unsigned>(f));
    }
    EXPECT_EQ(exporterTable().size(), 5u);
}

TEST_F(ExportTest, RunExportersProducesSelectedFilesOnly)
{
    const Prediction pred = test::makeScene(2, 8, 6);
    FusionConfig cfg;
    cfg.numThreads = 1;
    const PointCloud cloud = PointCloudAssembler(cfg).assemble(pred);

    ExportInput input;
    input.prediction = &pred;
    input.cloud = &cloud;

    const ExportArtifacts artifacts = runExporters(EXPORT_PLY | EXPORT_NPZ | EXPORT_DEPTH_VIS, input, cfg);
    std::vector<std::string> names;
    for (const ExportArtifact& a : artifacts) names.push_back(a.fileName);
    EXPECT_EQ(names, std::vector<std::string>({"points.ply", "predictions.npz", "depth_vis/depth_000.png",
                                               "depth_vis/conf_000.png", "depth_vis/depth_001.png",
                                               "depth_vis/conf_001.png"}));

    // gaussians were never made
    EXPECT_THROW(runExporters(EXPORT_GS_PLY, input, cfg), ExportError);
}

TEST_F(ExportTest, GaussianExportCarriesTrajectory)
{
    const Prediction pred = test::makeScene(3, 8, 6);
    FusionConfig cfg;
    cfg.numThreads = 1;
    cfg.trajectoryFrames = 6;
    const GaussianSet set = GaussianAdapter(cfg).fromPrediction(pred);
    const CameraTrajectory traj = CameraTrajectory::fromConfig(pred, cfg);

    ExportInput input;
    input.gaussians = &set;
    input.trajectory = &traj;

    const ExportArtifacts artifacts = runExporters(EXPORT_GS_PLY, input, cfg);
    ASSERT_EQ(artifacts.size(), 2u);
    EXPECT_EQ(artifacts[0].fileName, "gaussians.ply");
    EXPECT_EQ(artifacts[1].fileName, "trajectory.txt");
    EXPECT_EQ(std::count(artifacts[1].bytes.begin(), artifacts[1].bytes.end(), '\n'), 6);
}

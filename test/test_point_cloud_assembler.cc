#include <gtest/gtest.h>

#include <atomic>

#include "../fusion/reconstruction/point_cloud_assembler.h"
#include "../fusion/util/errors.h"
#include "../fusion/util/index_thread_reduce.h"
#include "test_scenes.h"

using namespace scene_fusion;

namespace {

FusionConfig unboundedConfig(float tau)
{
    FusionConfig cfg;
    cfg.confThreshold = tau;
    cfg.numMaxPoints = UNBOUNDED_POINTS;
    cfg.numThreads = 1;
    return cfg;
}

bool sameCloud(const PointCloud& a, const PointCloud& b)
{
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a.positions[i] != b.positions[i] || a.colors[i] != b.colors[i] ||
            a.viewIndex[i] != b.viewIndex[i] || a.confidence[i] != b.confidence[i])
            return false;
    }
    return true;
}

}

TEST(PointCloudAssembler, ZeroThresholdKeepsEveryValidDepthPixel)
{
    const Prediction pred = test::makeScene(3);
    PointCloudAssembler assembler(unboundedConfig(0.0f));

    AssemblyReport report;
    const PointCloud cloud = assembler.assemble(pred, &report);

    EXPECT_EQ(static_cast<int>(cloud.size()), test::countValidDepth(pred));
    EXPECT_EQ(report.candidatePoints, static_cast<std::int64_t>(cloud.size()));
    EXPECT_EQ(report.stride, 1);
    EXPECT_EQ(report.viewsUsed, 3);
    EXPECT_FALSE(report.emptyResult);
    EXPECT_EQ(cloud.units, Units::RELATIVE);
}

TEST(PointCloudAssembler, PointsLieOnTheirPixelRays)
{
    const Prediction pred = test::makeScene(2);
    PointCloudAssembler assembler(unboundedConfig(0.0f));
    const PointCloud cloud = assembler.assemble(pred);

    // first point comes from view 0, first valid pixel in row-major order
    ASSERT_FALSE(cloud.empty());
    EXPECT_EQ(cloud.viewIndex[0], 0);

    int x0 = 0;
    while (test::isHole(x0, 0)) ++x0;
    const View& v = pred.views[0];
    const Eigen::Vector3d expected = v.pose.camToWorld() * unproject(v.intrinsics(), x0, 0, test::planeDepth(x0, 0));
    EXPECT_LT((cloud.positions[0].cast<double>() - expected).norm(), 1e-5);

    const cv::Vec3b c = v.image().at<cv::Vec3b>(0, x0);
    EXPECT_EQ(cloud.colors[0], Color3b(c[0], c[1], c[2]));
}

TEST(PointCloudAssembler, PointCountIsMonotoneInThreshold)
{
    const Prediction pred = test::makeScene(3);
    size_t previous = std::numeric_limits<size_t>::max();
    for (float tau : {0.0f, 0.1f, 0.25f, 0.5f, 0.75f, 0.9f, 1.0f}) {
        PointCloudAssembler assembler(unboundedConfig(tau));
        const size_t n = assembler.assemble(pred).size();
        EXPECT_LE(n, previous) << "tau " << tau;
        previous = n;
    }
}

TEST(PointCloudAssembler, EveryEmittedPointPassesThreshold)
{
    const Prediction pred = test::makeScene(2);
    PointCloudAssembler assembler(unboundedConfig(0.6f));
    const PointCloud cloud = assembler.assemble(pred);
    ASSERT_FALSE(cloud.empty());
    for (float c : cloud.confidence)
        EXPECT_GE(c, 0.6f);
}

TEST(PointCloudAssembler, AssemblyIsDeterministic)
{
    const Prediction pred = test::makeScene(4);
    FusionConfig cfg = unboundedConfig(0.2f);
    cfg.numMaxPoints = 100;
    PointCloudAssembler assembler(cfg);

    EXPECT_TRUE(sameCloud(assembler.assemble(pred), assembler.assemble(pred)));
}

TEST(PointCloudAssembler, OutputDoesNotDependOnThreadCount)
{
    const Prediction pred = test::makeScene(7);
    FusionConfig cfg = unboundedConfig(0.3f);
    cfg.numMaxPoints = 250;

    PointCloudAssembler serial(cfg);
    const PointCloud reference = serial.assemble(pred);

    for (int threads : {2, 3, 8}) {
        IndexThreadReduce pool(threads);
        PointCloudAssembler parallel(cfg, &pool);
        EXPECT_TRUE(sameCloud(parallel.assemble(pred), reference)) << threads << " threads";
    }
}

TEST(PointCloudAssembler, SubsamplesWithUniformStride)
{
    const Prediction pred = test::makeScene(3);
    PointCloudAssembler full(unboundedConfig(0.0f));
    const PointCloud all = full.assemble(pred);

    FusionConfig cfg = unboundedConfig(0.0f);
    cfg.numMaxPoints = 100;
    PointCloudAssembler capped(cfg);

    AssemblyReport report;
    const PointCloud cloud = capped.assemble(pred, &report);

    const std::int64_t total = static_cast<std::int64_t>(all.size());
    const std::int64_t stride = (total + 99) / 100;
    EXPECT_EQ(report.stride, stride);
    EXPECT_LE(cloud.size(), 100u);
    ASSERT_EQ(static_cast<std::int64_t>(cloud.size()), (total + stride - 1) / stride);

    for (size_t i = 0; i < cloud.size(); ++i)
        EXPECT_EQ(cloud.positions[i], all.positions[i * stride]);
}

TEST(PointCloudAssembler, InvalidConfigIsRejectedUpFront)
{
    FusionConfig cfg;
    cfg.numMaxPoints = 0;
    EXPECT_THROW(PointCloudAssembler{cfg}, ConfigError);

    cfg = FusionConfig();
    cfg.confThreshold = 1.5f;
    EXPECT_THROW(PointCloudAssembler{cfg}, ConfigError);

    cfg.confThreshold = -0.1f;
    EXPECT_THROW(PointCloudAssembler{cfg}, ConfigError);
}

TEST(PointCloudAssembler, EmptyPredictionIsRejected)
{
    PointCloudAssembler assembler(unboundedConfig(0.0f));
    EXPECT_THROW(assembler.assemble(Prediction()), InvalidPredictionError);
}

TEST(PointCloudAssembler, NothingPassingIsAnEmptyCloudNotAnError)
{
    Prediction pred = test::makeScene(1);
    // confidence everywhere below 1 except the very last pixel of the ramp
    PointCloudAssembler assembler(unboundedConfig(1.0f));

    AssemblyReport report;
    PointCloud cloud = assembler.assemble(pred, &report);
    EXPECT_LE(cloud.size(), 1u);

    cv::Mat zeros = cv::Mat::zeros(12, 16, CV_32FC1);
    pred.views[0] = View(0, pred.views[0].image(), zeros, cv::Mat(), test::makeIntrinsics(16, 12), SE3());

    cloud = assembler.assemble(pred, &report);
    EXPECT_TRUE(cloud.empty());
    EXPECT_TRUE(report.emptyResult);
    EXPECT_FALSE(report.warnings.empty());
}

TEST(PointCloudAssembler, InconsistentViewIsDroppedNotFatal)
{
    Prediction pred = test::makeScene(3);
    const View& v1 = pred.views[1];
    pred.views[1] = View(1, v1.image(), v1.depth(), v1.confidence(), test::makeIntrinsics(20, 12),
                         v1.pose.worldToCam());

    PointCloudAssembler assembler(unboundedConfig(0.0f));
    AssemblyReport report;
    const PointCloud cloud = assembler.assemble(pred, &report);

    EXPECT_EQ(report.viewsUsed, 2);
    EXPECT_EQ(report.droppedViews, std::vector<int>({1}));
    EXPECT_EQ(report.warnings.size(), 1u);
    for (int vi : cloud.viewIndex)
        EXPECT_NE(vi, 1);
    EXPECT_FALSE(cloud.empty());
}

TEST(PointCloudAssembler, CancelledAssemblyReturnsEmptyCloud)
{
    const Prediction pred = test::makeScene(4);
    std::atomic<bool> cancel(true);

    {
        PointCloudAssembler assembler(unboundedConfig(0.0f));
        AssemblyReport report;
        const PointCloud cloud = assembler.assemble(pred, &report, &cancel);
        EXPECT_TRUE(report.cancelled);
        EXPECT_TRUE(cloud.empty());
    }
    {
        IndexThreadReduce pool(2);
        PointCloudAssembler assembler(unboundedConfig(0.0f), &pool);
        AssemblyReport report;
        const PointCloud cloud = assembler.assemble(pred, &report, &cancel);
        EXPECT_TRUE(report.cancelled);
        EXPECT_TRUE(cloud.empty());
    }
}

TEST(PointCloudAssembler, BackgroundFiltersDropDarkAndBrightPixels)
{
    Prediction pred = test::makeScene(1, 8, 6);
    View& v = pred.views[0];
    cv::Mat image = v.image().clone();
    image.at<cv::Vec3b>(1, 1) = cv::Vec3b(0, 5, 15);
    image.at<cv::Vec3b>(1, 2) = cv::Vec3b(250, 240, 255);
    image.at<cv::Vec3b>(1, 3) = cv::Vec3b(0, 200, 0);   // dark only in two channels
    pred.views[0] = View(0, image, v.depth(), v.confidence(), v.intrinsics(), v.pose.worldToCam());

    const size_t base = PointCloudAssembler(unboundedConfig(0.0f)).assemble(pred).size();

    FusionConfig black = unboundedConfig(0.0f);
    black.filterBlackBackground = true;
    EXPECT_EQ(PointCloudAssembler(black).assemble(pred).size(), base - 1);

    FusionConfig white = unboundedConfig(0.0f);
    white.filterWhiteBackground = true;
    EXPECT_EQ(PointCloudAssembler(white).assemble(pred).size(), base - 1);

    FusionConfig both = black;
    both.filterWhiteBackground = true;
    EXPECT_EQ(PointCloudAssembler(both).assemble(pred).size(), base - 2);
}

TEST(PointCloudAssembler, AdaptiveThresholdClampsToPercentiles)
{
    const Prediction pred = test::makeScene(2);

    FusionConfig cfg = unboundedConfig(0.0f);
    cfg.adaptiveConfThreshold = true;
    cfg.confPercentileLow = 50.0f;
    cfg.confPercentileHigh = 90.0f;

    // tau below P_low is raised to P_low
    AssemblyReport report;
    const size_t raised = PointCloudAssembler(cfg).assemble(pred, &report).size();
    EXPECT_GT(report.threshold, 0.0f);
    EXPECT_LT(raised, static_cast<size_t>(test::countValidDepth(pred)));

    // tau above P_high is lowered to P_high
    cfg.confThreshold = 1.0f;
    AssemblyReport high;
    const size_t lowered = PointCloudAssembler(cfg).assemble(pred, &high).size();
    EXPECT_LT(high.threshold, 1.0f);
    EXPECT_GT(lowered, 0u);
    EXPECT_LE(lowered, raised);
}

TEST(PointCloudAssembler, PercentileInterpolatesBetweenRanks)
{
    std::vector<float> v = {4.0f, 1.0f, 3.0f, 2.0f};
    EXPECT_FLOAT_EQ(percentile(v, 0.0f), 1.0f);
    EXPECT_FLOAT_EQ(percentile(v, 100.0f), 4.0f);
    EXPECT_FLOAT_EQ(percentile(v, 50.0f), 2.5f);

    std::vector<float> empty;
    EXPECT_FLOAT_EQ(percentile(empty, 50.0f), 0.0f);
}

TEST(PointCloudAssembler, SkyPixelsArePlacedAtTheSkyDepth)
{
    const int w = 16, h = 12;
    Prediction pred;
    pred.views.push_back(test::makeView(0, SE3(), w, h, false));

    cv::Mat sky = cv::Mat::zeros(h, w, CV_8UC1);
    sky.rowRange(0, 3).setTo(255);
    pred.views[0].setSky(sky);
    ASSERT_TRUE(pred.views[0].isConsistent());

    std::vector<float> ground;
    int validGround = 0;
    for (int y = 3; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            if (test::isHole(x, y)) continue;
            ground.push_back(test::planeDepth(x, y));
            ++validGround;
        }
    }
    FusionConfig cfg = unboundedConfig(0.0f);
    cfg.skyDepthPercentile = 90.0f;
    const float expected = percentile(ground, 90.0f);

    AssemblyReport report;
    const PointCloud cloud = PointCloudAssembler(cfg).assemble(pred, &report);

    EXPECT_FLOAT_EQ(report.skyDepth, expected);
    // holes inside the sky rows are filled too
    ASSERT_EQ(static_cast<int>(cloud.size()), validGround + 3 * w);

    // identity pose: z is the depth; sky rows come first in row-major order
    for (int i = 0; i < 3 * w; ++i)
        EXPECT_NEAR(cloud.positions[i].z(), expected, 1e-5f) << i;
    EXPECT_NEAR(cloud.positions[3 * w].z(), test::planeDepth(0, 3), 1e-5f);
}

TEST(PointCloudAssembler, ViewsWithoutSkyMaskKeepTheirDepth)
{
    const Prediction pred = test::makeScene(2);
    AssemblyReport report;
    const PointCloud cloud = PointCloudAssembler(unboundedConfig(0.0f)).assemble(pred, &report);

    EXPECT_FLOAT_EQ(report.skyDepth, 0.0f);
    EXPECT_EQ(static_cast<int>(cloud.size()), test::countValidDepth(pred));
}

TEST(PointCloudAssembler, MisSizedSkyMaskDropsTheView)
{
    Prediction pred = test::makeScene(2);
    pred.views[1].setSky(cv::Mat::ones(4, 4, CV_8UC1));

    std::string reason;
    EXPECT_FALSE(pred.views[1].isConsistent(&reason));
    EXPECT_NE(reason.find("sky"), std::string::npos);

    AssemblyReport report;
    PointCloudAssembler(unboundedConfig(0.0f)).assemble(pred, &report);
    EXPECT_EQ(report.droppedViews, std::vector<int>({1}));
}

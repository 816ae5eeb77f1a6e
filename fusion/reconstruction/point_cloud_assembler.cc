#include "point_cloud_assembler.h"
#include "../settings.h"
#include "../util/errors.h"
#include "../util/geometry.h"
#include "../util/index_thread_reduce.h"

#include <algorithm>
#include <cmath>
#include <cstdarg>
#include <cstdio>

/*

builds the world-space point cloud from a fused prediction.

* one partition per view, filled by makeViewPoints on the worker pool
* confidence threshold tau (optionally clamped to confidence percentiles)
* optional black / white background rejection on the pixel color
* sky pixels (views with a sky mask) are placed at the sky depth, a percentile
  of the valid non-sky depth of all used views; they are left out of the
  confidence percentiles
* uniform subsampling over the concatenated partitions:
  stride = ceil(total / cap), keep every stride-th point in emission order

views whose buffers disagree with their intrinsics are dropped, the rest of
the scene is still assembled.

*/

namespace scene_fusion {

namespace {

void warn(AssemblyReport& report, const char* fmt, ...)
{
    char buf[512];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    report.warnings.emplace_back(buf);
    if (printWarnings)
        std::fprintf(stderr, "ASSEMBLER: %s\n", buf);
}

}

float percentile(std::vector<float>& values, float p)
{
    if (values.empty()) return 0.0f;
    std::sort(values.begin(), values.end());

    const double rank = std::clamp(static_cast<double>(p), 0.0, 100.0) / 100.0 * (values.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(rank));
    const size_t hi = std::min(lo + 1, values.size() - 1);
    const double frac = rank - lo;
    return static_cast<float>(values[lo] + frac * (values[hi] - values[lo]));
}


PointCloudAssembler::PointCloudAssembler(const FusionConfig& config, IndexThreadReduce* pool)
    : config(config), pool(pool)
{
    this->config.validate();
}

float PointCloudAssembler::effectiveThreshold(const Prediction& prediction, const std::vector<char>& usable) const
{
    const float tau = config.confThreshold;
    if (!config.adaptiveConfThreshold)
        return tau;

    std::vector<float> conf;
    for (size_t i = 0; i < prediction.views.size(); ++i) {
        if (!usable[i]) continue;
        const View& v = prediction.views[i];
        for (int y = 0; y < v.height(); ++y) {
            const float* d = v.depth().ptr<float>(y);
            for (int x = 0; x < v.width(); ++x) {
                if (d[x] > 0.0f && std::isfinite(d[x]) && !v.isSky(x, y))
                    conf.push_back(v.confidenceAt(x, y));
            }
        }
    }
    if (conf.empty())
        return tau;

    const float low = percentile(conf, config.confPercentileLow);
    const float high = percentile(conf, config.confPercentileHigh);
    return std::min(std::max(tau, low), high);
}

float PointCloudAssembler::skyDepth(const Prediction& prediction, const std::vector<char>& usable) const
{
    bool anySky = false;
    for (size_t i = 0; i < prediction.views.size(); ++i)
        anySky = anySky || (usable[i] && prediction.views[i].hasSky());
    if (!anySky)
        return 0.0f;

    std::vector<float> depth;
    for (size_t i = 0; i < prediction.views.size(); ++i) {
        if (!usable[i]) continue;
        const View& v = prediction.views[i];
        for (int y = 0; y < v.height(); ++y) {
            const float* d = v.depth().ptr<float>(y);
            for (int x = 0; x < v.width(); ++x) {
                if (d[x] > 0.0f && std::isfinite(d[x]) && !v.isSky(x, y))
                    depth.push_back(d[x]);
            }
        }
    }
    return percentile(depth, config.skyDepthPercentile);
}

void PointCloudAssembler::makeViewPoints(const View& view, int viewIdx, float threshold, PointCloud& out,
                                         float skyDepth) const
{
    const int w = view.width();
    const int h = view.height();
    const CameraIntrinsics& K = view.intrinsics();

    const SE3& camToWorld = view.pose.camToWorld();
    const Eigen::Matrix3d R = camToWorld.rotationMatrix();
    const Eigen::Vector3d t = camToWorld.translation();

    const bool filterBlack = config.filterBlackBackground;
    const bool filterWhite = config.filterWhiteBackground;

    for (int y = 0; y < h; ++y) {
        const float* depthRow = view.depth().ptr<float>(y);
        const cv::Vec3b* colorRow = view.image().ptr<cv::Vec3b>(y);

        for (int x = 0; x < w; ++x) {
            const float d = view.isSky(x, y) ? skyDepth : depthRow[x];
            if (!(d > 0.0f) || !std::isfinite(d))
                continue;

            const float c = view.confidenceAt(x, y);
            if (!(c >= threshold))
                continue;

            const cv::Vec3b& rgb = colorRow[x];
            if (filterBlack && rgb[0] < BLACK_BG_MAX_CHANNEL && rgb[1] < BLACK_BG_MAX_CHANNEL &&
                rgb[2] < BLACK_BG_MAX_CHANNEL)
                continue;
            if (filterWhite && rgb[0] >= WHITE_BG_MIN_CHANNEL && rgb[1] >= WHITE_BG_MIN_CHANNEL &&
                rgb[2] >= WHITE_BG_MIN_CHANNEL)
                continue;

            const Eigen::Vector3d pCam = unproject(K, x, y, d);
            const Eigen::Vector3d pWorld = R * pCam + t;

            out.push(pWorld.cast<float>(), Color3b(rgb[0], rgb[1], rgb[2]), viewIdx, c);
        }
    }
}

PointCloud PointCloudAssembler::assemble(const Prediction& prediction, AssemblyReport* reportOut,
                                         const std::atomic<bool>* cancel) const
{
    prediction.requireViews("assemble");

    AssemblyReport localReport;
    AssemblyReport& report = reportOut != nullptr ? *reportOut : localReport;
    report = AssemblyReport();

    const int n = static_cast<int>(prediction.size());

    std::vector<char> usable(n, 0);
    for (int i = 0; i < n; ++i) {
        std::string reason;
        if (prediction.views[i].isConsistent(&reason)) {
            usable[i] = 1;
            report.viewsUsed++;
        } else {
            report.droppedViews.push_back(i);
            warn(report, "dropping view %d (id %d): %s", i, prediction.views[i].id(), reason.c_str());
        }
    }

    const float threshold = effectiveThreshold(prediction, usable);
    report.threshold = threshold;

    const float sky = skyDepth(prediction, usable);
    report.skyDepth = sky;

    std::vector<PointCloud> partitions(n);
    auto fn = [&](int min, int max, int) {
        for (int i = min; i < max; ++i) {
            if (usable[i])
                makeViewPoints(prediction.views[i], i, threshold, partitions[i], sky);
        }
    };

    bool complete = true;
    if (pool != nullptr) {
        complete = pool->reduce(fn, 0, n, ASSEMBLER_VIEWS_PER_CHUNK, cancel);
    } else {
        for (int i = 0; i < n && complete; i += ASSEMBLER_VIEWS_PER_CHUNK) {
            if (cancel != nullptr && cancel->load())
                complete = false;
            else
                fn(i, std::min(i + ASSEMBLER_VIEWS_PER_CHUNK, n), 0);
        }
    }

    PointCloud cloud;
    cloud.units = prediction.units;

    if (!complete) {
        report.cancelled = true;
        warn(report, "%s: assembly cancelled, partial result discarded", prediction.sceneId.c_str());
        return cloud;
    }

    std::int64_t total = 0;
    for (const PointCloud& p : partitions)
        total += static_cast<std::int64_t>(p.size());
    report.candidatePoints = total;

    const std::int64_t cap = config.numMaxPoints;
    const std::int64_t stride = total > cap ? (total + cap - 1) / cap : 1;
    report.stride = stride;

    cloud.reserve(static_cast<size_t>((total + stride - 1) / stride));

    std::int64_t k = 0;
    for (const PointCloud& p : partitions) {
        for (size_t i = 0; i < p.size(); ++i, ++k) {
            if (k % stride == 0)
                cloud.pushFrom(p, i);
        }
    }

    if (cloud.empty()) {
        report.emptyResult = true;
        warn(report, "%s: no pixel passed the filters (tau %.4f), point cloud is empty",
             prediction.sceneId.c_str(), threshold);
    }

    if (printAssemblerInfo)
        std::printf("ASSEMBLER: %s: %d/%d views, tau %.4f, %lld candidates, stride %lld, %zu points (%s)\n",
                    prediction.sceneId.c_str(), report.viewsUsed, n, threshold,
                    static_cast<long long>(total), static_cast<long long>(stride), cloud.size(),
                    unitsName(cloud.units));

    return cloud;
}

}

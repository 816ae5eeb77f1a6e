#include "depth_vis_exporter.h"
#include "../settings.h"
#include "../util/errors.h"
#include "../util/fxn.h"

#include <opencv2/imgcodecs.hpp>

#include <cstdio>

namespace scene_fusion {

namespace {

ByteBuffer toPng(const cv::Mat& bgr, const std::string& fileName)
{
    std::vector<uchar> buf;
    bool ok = false;
    try {
        ok = cv::imencode(".png", bgr, buf);
    } catch (const cv::Exception& e) {
        throw ExportError("depth_vis: encoding " + fileName + " failed: " + e.what());
    }
    if (!ok)
        throw ExportError("depth_vis: encoding " + fileName + " failed");
    return ByteBuffer(buf.begin(), buf.end());
}

}

std::vector<NamedImage> encodeDepthVisualisation(const Prediction& prediction)
{
    prediction.requireViews("depth_vis export");

    std::vector<NamedImage> res;
    char name[64];
    char caption[128];

    for (std::size_t i : prediction.consistentViews("depth_vis")) {
        const View& v = prediction.views[i];

        std::snprintf(caption, sizeof(caption), "view %zu (%s pose)", i, poseSourceName(v.pose.source()));

        cv::Mat depthPlot = getDepthRainbowPlot(v);
        printMessageOnCVImage(depthPlot, caption, std::string("depth, ") + unitsName(prediction.units) + " units");
        std::snprintf(name, sizeof(name), "depth_%03zu.png", i);
        res.push_back({name, toPng(depthPlot, name)});

        cv::Mat confPlot = getConfRedGreenPlot(v);
        printMessageOnCVImage(confPlot, caption, v.hasConfidence() ? "confidence" : "confidence (none given)");
        std::snprintf(name, sizeof(name), "conf_%03zu.png", i);
        res.push_back({name, toPng(confPlot, name)});
    }

    if (printExportInfo)
        std::printf("EXPORT: depth_vis, %zu images\n", res.size());
    return res;
}

}

#include "prediction.h"
#include "../settings.h"
#include "../util/errors.h"

#include <cstdio>

namespace scene_fusion {

const char* unitsName(Units units)
{
    switch (units) {
        case Units::RELATIVE: return "relative";
        case Units::METRIC:   return "metric";
    }
    return "unknown";
}

std::vector<std::size_t> Prediction::consistentViews(const char* stage) const
{
    std::vector<std::size_t> res;
    res.reserve(views.size());
    for (std::size_t i = 0; i < views.size(); ++i) {
        std::string reason;
        if (views[i].isConsistent(&reason)) {
            res.push_back(i);
        } else if (printWarnings) {
            std::fprintf(stderr, "EXPORT: %s skips inconsistent view %zu: %s\n", stage, i, reason.c_str());
        }
    }
    return res;
}

bool Prediction::hasUniformResolution(const std::vector<std::size_t>& indices) const
{
    for (std::size_t i : indices) {
        const View& v = views[i];
        if (v.width() != views[indices.front()].width() || v.height() != views[indices.front()].height())
            return false;
    }
    return true;
}

Vector3dList Prediction::cameraCenters() const
{
    Vector3dList centers;
    centers.reserve(views.size());
    for (const View& v : views)
        centers.push_back(v.pose.center());
    return centers;
}

void Prediction::requireViews(const char* stage) const
{
    if (views.empty())
        throw InvalidPredictionError(std::string(stage) + ": prediction '" + sceneId + "' has no views");
}

}

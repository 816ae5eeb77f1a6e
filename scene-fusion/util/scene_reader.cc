#include "scene_reader.h"
#include "../../fusion/util/errors.h"
#include "../../fusion/util/fxn.h"
#include "../../fusion/util/geometry.h"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace scene_fusion;

namespace {

std::string resolve(const fs::path& dir, const std::string& fn) {
  fs::path p(fn);
  if (p.is_relative()) p = dir / p;
  return p.string();
}

cv::Mat readImageRGB(const std::string& fn) {
  cv::Mat bgr = cv::imread(fn, cv::IMREAD_COLOR);
  if (bgr.empty()) throw InvalidPredictionError("cannot read image " + fn);
  cv::Mat rgb;
  cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
  return rgb;
}

// float metres as-is, 16-bit png in millimetres
cv::Mat readDepth(const std::string& fn) {
  cv::Mat raw = cv::imread(fn, cv::IMREAD_UNCHANGED);
  if (raw.empty()) throw InvalidPredictionError("cannot read depth " + fn);
  if (raw.channels() > 1) cv::extractChannel(raw, raw, 0);

  cv::Mat depth;
  if (raw.depth() == CV_16U) raw.convertTo(depth, CV_32F, 1.0 / 1000.0);
  else raw.convertTo(depth, CV_32F);
  return depth;
}

cv::Mat readConfidence(const std::string& fn) {
  cv::Mat raw = cv::imread(fn, cv::IMREAD_UNCHANGED);
  if (raw.empty()) throw InvalidPredictionError("cannot read confidence " + fn);
  if (raw.channels() > 1) cv::extractChannel(raw, raw, 0);

  cv::Mat conf;
  switch (raw.depth()) {
    case CV_8U:  raw.convertTo(conf, CV_32F, 1.0 / 255.0); break;
    case CV_16U: raw.convertTo(conf, CV_32F, 1.0 / 65535.0); break;
    default:     raw.convertTo(conf, CV_32F); break;
  }
  return conf;
}

cv::Mat readSky(const std::string& fn) {
  cv::Mat mask = cv::imread(fn, cv::IMREAD_GRAYSCALE);
  if (mask.empty()) throw InvalidPredictionError("cannot read sky mask " + fn);
  return mask;
}

// [qw qx qy qz tx ty tz], or a 3x4 / 4x4 !!opencv-matrix [R|t]
SE3 readPose(const cv::FileNode& node, const std::string& what) {
  if (node.isMap()) {
    cv::Mat Rt;
    node >> Rt;
    try {
      return SE3CV2Sophus(Rt);
    } catch (const cv::Exception& e) {
      throw InvalidPredictionError(what + ": pose matrix must be 3x4 or 4x4 (" + e.what() + ")");
    }
  }

  std::vector<double> v;
  node >> v;
  if (v.size() != 7) throw InvalidPredictionError(what + ": pose needs 7 values (qw qx qy qz tx ty tz)");
  return poseFromQuaternion(Eigen::Vector4d(v[0], v[1], v[2], v[3]), Eigen::Vector3d(v[4], v[5], v[6]));
}

Prediction readViews(const std::string& scene_fn, std::string* paired_fn) {
  cv::FileStorage store;
  try {
    if (!store.open(scene_fn, cv::FileStorage::READ))
      throw InvalidPredictionError("cannot open scene " + scene_fn);
  } catch (const cv::Exception& e) {
    throw InvalidPredictionError("cannot parse scene " + scene_fn + ": " + e.what());
  }
  const fs::path dir = fs::path(scene_fn).parent_path();

  Prediction pred;
  if (!store["scene_id"].empty()) pred.sceneId = static_cast<std::string>(store["scene_id"]);
  if (!store["units"].empty()) {
    const std::string units = static_cast<std::string>(store["units"]);
    if (units == "metric") pred.units = Units::METRIC;
    else if (units == "relative") pred.units = Units::RELATIVE;
    else throw InvalidPredictionError(scene_fn + ": unknown units '" + units + "'");
  }

  if (paired_fn != nullptr && !store["paired"].empty())
    *paired_fn = resolve(dir, static_cast<std::string>(store["paired"]));

  const cv::FileNode views = store["views"];
  if (views.type() != cv::FileNode::SEQ)
    throw InvalidPredictionError(scene_fn + ": 'views' is not a list");

  int idx = 0;
  for (cv::FileNodeIterator it = views.begin(); it != views.end(); ++it, ++idx) {
    const cv::FileNode v = *it;
    char what[64];
    std::snprintf(what, sizeof(what), "view %d", idx);

    if (v["image"].empty() || v["depth"].empty())
      throw InvalidPredictionError(std::string(what) + ": needs image and depth");

    cv::Mat image = readImageRGB(resolve(dir, static_cast<std::string>(v["image"])));
    cv::Mat depth = readDepth(resolve(dir, static_cast<std::string>(v["depth"])));
    cv::Mat conf;
    if (!v["confidence"].empty())
      conf = readConfidence(resolve(dir, static_cast<std::string>(v["confidence"])));

    CameraIntrinsics K;
    if (!v["intrinsics"].empty()) {
      std::vector<double> k;
      v["intrinsics"] >> k;
      if (k.size() != 4) throw InvalidPredictionError(std::string(what) + ": intrinsics needs [fx, fy, cx, cy]");
      K.fx = k[0]; K.fy = k[1]; K.cx = k[2]; K.cy = k[3];
      K.width = depth.cols;
      K.height = depth.rows;
    } else if (!v["fov"].empty()) {
      std::vector<double> f;
      v["fov"] >> f;
      if (f.size() != 2) throw InvalidPredictionError(std::string(what) + ": fov needs [fov_h, fov_w] in radians");
      K = CameraIntrinsics::fromFov(f[0], f[1], depth.cols, depth.rows);
    } else {
      throw InvalidPredictionError(std::string(what) + ": needs intrinsics or fov");
    }

    SE3 worldToCam;
    PoseSource source = PoseSource::PREDICTED;
    if (!v["pose"].empty()) worldToCam = readPose(v["pose"], what);
    if (!v["pose_source"].empty()) {
      const std::string s = static_cast<std::string>(v["pose_source"]);
      if (s == "known") source = PoseSource::KNOWN;
      else if (s != "predicted") throw InvalidPredictionError(std::string(what) + ": unknown pose_source '" + s + "'");
    }

    pred.views.emplace_back(idx, image, depth, conf, K, worldToCam, source);
    if (!v["sky"].empty())
      pred.views.back().setSky(readSky(resolve(dir, static_cast<std::string>(v["sky"]))));
  }
  return pred;
}

}

SceneReaderOpenCV::SceneReaderOpenCV(const std::string& scene_fn) {
  std::string paired_fn;
  m_prediction = readViews(scene_fn, &paired_fn);

  cv::FileStorage store(scene_fn, cv::FileStorage::READ);
  const cv::FileNode known = store["known_poses"];
  if (!known.empty()) {
    for (cv::FileNodeIterator it = known.begin(); it != known.end(); ++it) {
      const cv::FileNode k = *it;
      const int view = static_cast<int>(k["view"]);
      m_known_poses[view] = readPose(k["pose"], "known pose");
    }
  }
  store.release();

  if (!paired_fn.empty())
    m_paired = std::make_unique<Prediction>(readViews(paired_fn, nullptr));

  m_valid = !m_prediction.empty();
  std::printf("SCENE: %zu views, %zu known poses%s\n", m_prediction.size(), m_known_poses.size(),
              m_paired ? ", paired metric prediction" : "");
}

Prediction SceneReaderOpenCV::takePrediction() {
  m_valid = false;
  return std::move(m_prediction);
}

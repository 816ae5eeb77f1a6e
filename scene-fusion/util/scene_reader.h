#pragma once
#ifndef SCENE_READER_H
#define SCENE_READER_H

#include <opencv2/core/core.hpp>
#include <memory>
#include <string>

#include "../../fusion/model/prediction.h"
#include "../../fusion/util/sophus_util.h"

/*

scene description, written with cv::FileStorage (yaml, xml or json):

  scene_id: "kitchen"
  units: "relative"               # or "metric"
  paired: "kitchen_metric.yml"    # optional, a second scene with the same views
  views:
    - image: "rgb/000.png"
      depth: "depth/000.exr"      # float metres, or 16-bit png in millimetres
      confidence: "conf/000.exr"  # optional
      sky: "sky/000.png"          # optional, nonzero = sky
      intrinsics: [ fx, fy, cx, cy ]
      fov: [ fov_h, fov_w ]       # radians, used when intrinsics are absent;
                                  # principal point at the image center
      pose: [ qw, qx, qy, qz, tx, ty, tz ]   # optional, world-to-camera;
                                             # a 3x4 or 4x4 !!opencv-matrix works too
      pose_source: "predicted"    # or "known"
  known_poses:                    # optional
    - view: 0
      pose: [ qw, qx, qy, qz, tx, ty, tz ]

relative paths are resolved against the directory of the scene file.

*/

class SceneReader {
public:
  virtual ~SceneReader() = default;
  [[nodiscard]] virtual const scene_fusion::Prediction& getPrediction() const noexcept = 0;
  [[nodiscard]] virtual const scene_fusion::KnownPoses& getKnownPoses() const noexcept = 0;
  [[nodiscard]] virtual const scene_fusion::Prediction* getPaired() const noexcept = 0;
  [[nodiscard]] virtual bool is_valid() const noexcept = 0;
};

class SceneReaderOpenCV final : public SceneReader {
public:
  /** Throws InvalidPredictionError when the file or one of its images cannot be read. */
  explicit SceneReaderOpenCV(const std::string& scene_fn);
  ~SceneReaderOpenCV() override = default;

  SceneReaderOpenCV(const SceneReaderOpenCV&) = delete;
  SceneReaderOpenCV& operator=(const SceneReaderOpenCV&) = delete;

  [[nodiscard]] const scene_fusion::Prediction& getPrediction() const noexcept override { return m_prediction; }
  [[nodiscard]] const scene_fusion::KnownPoses& getKnownPoses() const noexcept override { return m_known_poses; }
  [[nodiscard]] const scene_fusion::Prediction* getPaired() const noexcept override { return m_paired.get(); }
  [[nodiscard]] bool is_valid() const noexcept override { return m_valid; }

  // moves the prediction out, the reader keeps an empty one
  scene_fusion::Prediction takePrediction();

private:
  scene_fusion::Prediction m_prediction;
  scene_fusion::KnownPoses m_known_poses;
  std::unique_ptr<scene_fusion::Prediction> m_paired;
  bool m_valid = false;
};

#endif

#include <cstdio>
#include <exception>
#include <iostream>
#include <string>

#include "../fusion/config.h"
#include "../fusion/pipeline.h"
#include "../fusion/settings.h"
#include "../fusion/util/errors.h"
#include "util/scene_reader.h"

/*

scene_fusion_app <scene.yml> <config.yml> <out_dir>

reads one prediction (plus optional known poses and a paired metric
prediction) from a scene file, fuses it, assembles the point cloud and writes
every export the config selects into out_dir.

pass "-" as config to run with the defaults.

*/

int main(int argc, char** argv) {
  if (argc != 4) {
    std::cerr << "usage: " << argv[0] << " <scene.yml> <config.yml|-> <out_dir>" << std::endl;
    return 1;
  }

  const std::string scene_fn = argv[1];
  const std::string config_fn = argv[2];
  const std::string out_dir = argv[3];

  scene_fusion::printFusionInfo = true;
  scene_fusion::printExportInfo = true;

  try {
    scene_fusion::FusionConfig config;
    if (config_fn != "-") config = scene_fusion::loadConfig(config_fn);

    SceneReaderOpenCV reader(scene_fn);
    if (!reader.is_valid()) {
      std::cerr << "ERROR: scene " << scene_fn << " has no views" << std::endl;
      return 1;
    }

    scene_fusion::ReconstructionPipeline pipeline(config);

    scene_fusion::ReconstructionInputs inputs;
    if (!reader.getKnownPoses().empty()) inputs.knownPoses = &reader.getKnownPoses();
    inputs.paired = reader.getPaired();

    scene_fusion::Prediction prediction = reader.takePrediction();
    scene_fusion::ReconstructionResult res = pipeline.run(prediction, inputs, out_dir);

    std::printf("alignment: %s (%s), rms residual %.6g over %d cameras\n",
                scene_fusion::fusionPathName(res.fusion.path), scene_fusion::unitsName(res.fusion.units),
                res.fusion.residualRms, res.fusion.numCorrespondences);
    std::printf("points: %zu of %lld candidates, tau %.4f, %d views used\n", res.cloud.size(),
                static_cast<long long>(res.assembly.candidatePoints), res.assembly.threshold,
                res.assembly.viewsUsed);
    for (const std::string& fn : res.writtenFiles) std::printf("  %s\n", fn.c_str());

    const std::size_t numWarnings = res.fusion.warnings.size() + res.assembly.warnings.size();
    if (numWarnings > 0) std::printf("%zu warnings\n", numWarnings);
  } catch (const scene_fusion::FusionError& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: unexpected failure: " << e.what() << std::endl;
    return 2;
  }
  return 0;
}

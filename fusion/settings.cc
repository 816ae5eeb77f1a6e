#include "settings.h"

namespace scene_fusion {

bool enablePrintDebugInfo = false;
bool printFusionInfo = true;
bool printAssemblerInfo = false;
bool printExportInfo = true;
bool printThreadingInfo = false;

bool printWarnings = true;

}

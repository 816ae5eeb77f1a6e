#pragma once

/*

process-wide switches for console output and a few numeric constants shared
between the fusion stages.

none of these change results: they only decide what gets printed.
per-request parameters live in FusionConfig (config.h), never here.

*/

namespace scene_fusion {

// ============== constants ==============

// minimal camera-center spread (in the source frame) below which a
// similarity solve is treated as degenerate.
constexpr double MIN_ALIGNMENT_SPREAD = 1e-9;

// ratio between smallest and largest singular value of the centered
// correspondence set below which the points are considered collinear.
constexpr double MIN_ALIGNMENT_RANK_RATIO = 1e-6;

// background filtering thresholds on 0..255 channels.
constexpr int BLACK_BG_MAX_CHANNEL = 16;
constexpr int WHITE_BG_MIN_CHANNEL = 240;

// spherical harmonics band 0 constant, used for gaussian colors.
constexpr float SH_C0 = 0.28209479177387814f;

// views processed per worker chunk in the assembler.
constexpr int ASSEMBLER_VIEWS_PER_CHUNK = 1;


// ============== console output ==============

extern bool enablePrintDebugInfo;
extern bool printFusionInfo;
extern bool printAssemblerInfo;
extern bool printExportInfo;
extern bool printThreadingInfo;

// warnings go to stderr regardless of the switches above unless this is false.
extern bool printWarnings;

}

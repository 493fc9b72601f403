#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "apps/guide/AnalysisTask.hpp"
#include "apps/guide/CalibrationGuidanceTracker.hpp"
#include "apps/guide/CaptureGuidanceTracker.hpp"
#include "apps/guide/MarkerDetector.hpp"
#include "apps/guide/QualityAnalyzer.hpp"

namespace guide {

// All tunables of one guidance pipeline.
struct GuideConfig {
    QualityAnalyzerConfig     quality{};
    MarkerDetectorConfig      markers{};
    std::vector<int64_t>      required_ids;
    CaptureGuidanceConfig     capture{};
    CalibrationGuidanceConfig calibration{};
    AnalysisTaskConfig        task{};
};

// Overlay the values present in a JSON file onto cfg.
//   { "quality": {...}, "markers": {...}, "capture": {...},
//     "calibration": {...}, "task": {...} }
// Keys are the lower-case member names (e.g. "blur_threshold").
// Missing file: warning, defaults kept, returns true.
// Malformed file or wrongly typed value: error, returns false.
bool loadGuideConfig(const std::string& path, GuideConfig& cfg);

// Same, from an in-memory document.
bool parseGuideConfig(const std::string& text, GuideConfig& cfg);

// "OFF" / "WARN" / "BLOCK" (case-sensitive). False if unrecognised.
bool parseMarkerMode(const std::string& s, msg::MarkerMode& out);

} // namespace guide

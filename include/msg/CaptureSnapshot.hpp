#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "msg/MarkerStatus.hpp"
#include "msg/QualityResult.hpp"

namespace msg {

// Fully-owned copies of the live analyzer outputs, taken at the instant the
// operator commits a capture. The guidance trackers only ever see these, so
// the next frame's publication cannot race with a counter update.

struct FrozenMarkerSnapshot {
    uint64_t   t_ns = 0;
    MarkerMode mode = MarkerMode::OFF;

    uint32_t frame_width  = 0;
    uint32_t frame_height = 0;

    std::vector<int64_t> required_ids;
    std::vector<int64_t> detected_ids;          // distinct, ascending
    std::vector<int64_t> missing_required_ids;
    bool all_required_visible = false;
    bool framing_ok = true;

    std::vector<TagDetection> detections;
};

struct FrozenQualitySnapshot {
    QualityStatus status = QualityStatus::UNKNOWN;
    double blur_score = 0.0;
    double over_frac  = 0.0;
    double under_frac = 0.0;
    int specular_clusters        = 0;
    int specular_largest_cluster = 0;

    // "OVER" / "UNDER" / "SPECULAR" as applicable
    std::vector<std::string> exposure_flags;

    std::optional<double> distance_cm;
};

} // namespace msg

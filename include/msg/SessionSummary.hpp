#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "msg/MarkerStatus.hpp"

namespace msg {

// Typed records handed to the persistence collaborator. Field names follow
// the manifest / sidecar JSON keys (see apps/guide/SummaryJson.hpp).
// Grid indexing: row-major, row = cell / 3, col = cell % 3.

static constexpr int GRID_CELLS = 9;
static constexpr int SUMMARY_VERSION = 1;

using GridCounts = std::array<int, GRID_CELLS>;

struct PhaseAnchorProgress {
    int center_mid = 0;
    int left_mid   = 0;
    int right_mid  = 0;
    int high_any   = 0;
    int low_any    = 0;
};

struct PhaseSweepProgress {
    int mid  = 0;
    int high = 0;
    int low  = 0;
};

struct PhaseCrossArchProgress {
    int total = 0;
    int high  = 0;
    int low   = 0;
};

struct CaptureTargets {
    int  good_captures = 0;
    int  per_tag = 0;
    int  grid_filled = 0;
    bool cross_arch_required = true;
};

struct CaptureManifestSummary {
    int version = SUMMARY_VERSION;
    int stable_ids_n = 0;
    std::vector<int64_t> tracked_ids;
    double distance_min_cm = 0.0;
    double distance_max_cm = 0.0;
    double edge_margin_frac = 0.0;
    int good_captures = 0;
    CaptureTargets targets;

    GridCounts grid_counts{};
    int grid_filled = 0;

    std::map<int64_t, int> per_tag_capture_count;   // ascending identity

    PhaseAnchorProgress    phase_a;
    PhaseSweepProgress     phase_b_left;
    PhaseSweepProgress     phase_c_right;
    PhaseCrossArchProgress phase_d_cross_arch;

    bool enough = false;
    std::vector<std::string> reasons_if_not_enough;
};

struct CalibrationTargets {
    int good_captures = 0;
    int grid_filled = 0;
};

struct CalibrationManifestSummary {
    int version = SUMMARY_VERSION;
    double distance_target_cm = 0.0;
    double distance_min_cm = 0.0;
    double distance_max_cm = 0.0;
    double edge_margin_frac = 0.0;
    int good_captures = 0;
    CalibrationTargets targets;

    GridCounts grid_counts{};
    int grid_filled = 0;

    bool enough = false;
    std::vector<std::string> reasons_if_not_enough;
};

struct SidecarDetection {
    int64_t id = 0;
    Point2d center_px;
    std::optional<Point2d> center_norm;   // absent when frame size unknown
    std::vector<Point2d> corners_px;
    std::optional<double> quality;
};

// Capture-session context added to a sidecar (absent for calibration).
struct SidecarCaptureContext {
    std::vector<int64_t> required_ids;
    std::vector<int64_t> tracked_ids;
    std::vector<int64_t> missing_required_ids;
    std::vector<int64_t> detected_ids;      // ascending
    bool all_required_visible = false;

    std::string phase;

    // Absent when there were no detections or the frame size is unknown.
    std::optional<int>         grid_cell;
    std::optional<std::string> lateral_bin;
    std::optional<std::string> height_bin;
    bool cross_arch = false;
};

// Per-capture marker context written next to each image.
struct SidecarMarkerSummary {
    std::string mode;
    std::string dictionary;
    uint32_t frame_width  = 0;
    uint32_t frame_height = 0;

    bool framing_ok = true;
    std::optional<double> distance_cm;
    bool distance_ok = true;

    std::optional<SidecarCaptureContext> capture;

    // sorted by (id, x, y)
    std::vector<SidecarDetection> detections;
};

} // namespace msg

#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "msg/CaptureSnapshot.hpp"
#include "msg/MarkerStatus.hpp"
#include "msg/QualityResult.hpp"
#include "msg/SessionSummary.hpp"

namespace guide {

// ---------------------------------------------------------------------------
// Shared geometry / binning helpers for the guidance trackers.
// Pure functions, no state. O(#tags) per call.
// ---------------------------------------------------------------------------

static constexpr int STABLE_IDS_N_DEFAULT = 8;
static constexpr const char* MARKER_DICTIONARY = "APRILTAG_36h11";

enum class LateralBin : uint8_t { LEFT = 0, CENTER = 1, RIGHT = 2 };
enum class HeightBin  : uint8_t { LOW = 0, MID = 1, HIGH = 2 };

const char* LateralBinStr(LateralBin b);
const char* HeightBinStr(HeightBin b);

// Thirds at 0.33 / 0.66; both outer bins are open intervals.
LateralBin lateralBin(double x_norm);
HeightBin  heightBin(double y_norm);

// Half-open thirds [0, 0.333333) [0.333333, 0.666666) [0.666666, 1].
// Returns row * 3 + col in 0..8.
int gridIndex3x3(double x_norm, double y_norm);

int filledGridCells(const msg::GridCounts& counts);

// First cell with a zero count, -1 if every cell is filled.
int firstEmptyGridCell(const msg::GridCounts& counts);

// "top-left" .. "bottom-right"
std::string cellName(int index);

double clamp01(double v);

// Horizontal extent of detection centers as a fraction of frame width.
double spreadXNorm(const std::vector<msg::TagDetection>& detections, uint32_t width);

// True when detections sit in both the left (< 0.33) and right (> 0.66) thirds.
bool hasBothSides(const std::vector<msg::TagDetection>& detections, uint32_t width);

// Mean detection center normalised to [0,1]^2. False when there is nothing to average.
bool meanCenterNorm(const std::vector<msg::TagDetection>& detections,
                    uint32_t width, uint32_t height,
                    double& x_norm, double& y_norm);

// Every corner (or the center when no corners) lies at least margin_frac * size
// away from each frame edge.
bool framingWithinMargin(const std::vector<msg::TagDetection>& detections,
                         uint32_t width, uint32_t height, double margin_frac);

// Unknown distance passes: the focus-distance signal is best-effort.
bool distanceInRange(const std::optional<double>& distance_cm, double min_cm, double max_cm);

// Top-N identities by descending frequency, ties by ascending identity.
std::vector<int64_t> chooseStableIds(const std::map<int64_t, uint64_t>& tally, int n);

std::string joinIds(const std::vector<int64_t>& ids, const char* sep = ",");

// Deep copies taken at capture time.
msg::FrozenMarkerSnapshot  freezeMarkerStatus(const msg::MarkerStatus& status);
msg::FrozenQualitySnapshot freezeQualityResult(const msg::QualityResult& result);

// Detection list for sidecars, ordered by (id, x, y).
std::vector<msg::SidecarDetection> sidecarDetections(const std::vector<msg::TagDetection>& detections,
                                                     uint32_t width, uint32_t height);

} // namespace guide

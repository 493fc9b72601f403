#pragma once
#include <optional>
#include <string>
#include <vector>

#include "os/rtos.hpp"
#include "apps/guide/GuidanceCommon.hpp"

#include "msg/CaptureSnapshot.hpp"
#include "msg/MarkerStatus.hpp"
#include "msg/QualityResult.hpp"
#include "msg/SessionSummary.hpp"

namespace guide {

struct CalibrationGuidanceConfig {
    double DISTANCE_TARGET_CM   = 25.0;
    double DISTANCE_MIN_CM      = 20.0;
    double DISTANCE_MAX_CM      = 30.0;
    double EDGE_MARGIN_FRAC     = 0.10;
    int    GOOD_CAPTURES_TARGET = 25;
    int    GRID_TARGET_FILLED   = 8;     // of 9 cells
};

struct CalibrationLiveGuidance {
    std::string message;
    std::string progress;
    std::string coverage_text;
    bool        enough = false;
};

// ---------------------------------------------------------------------------
// CalibrationGuidanceTracker: single-phase variant. Grid coverage plus a
// good-capture count, no identity tracking. Same locking rules as the
// capture tracker.
// ---------------------------------------------------------------------------
class CalibrationGuidanceTracker {
public:
    explicit CalibrationGuidanceTracker(const CalibrationGuidanceConfig& cfg = {});

    void resetForNewSession();

    bool onCaptureSaved(const msg::FrozenMarkerSnapshot& marker,
                        const msg::FrozenQualitySnapshot& quality);

    CalibrationLiveGuidance buildLiveGuidance(const msg::MarkerStatus& status,
                                              const msg::QualityResult* quality) const;

    msg::CalibrationManifestSummary buildManifestSummary() const;

    msg::SidecarMarkerSummary buildSidecarMarkerSummary(const msg::FrozenMarkerSnapshot& marker,
                                                        const msg::FrozenQualitySnapshot& quality) const;

    bool enough(std::vector<std::string>* reasons = nullptr) const;

    int goodCaptures() const;
    msg::GridCounts gridCounts() const;

    const CalibrationGuidanceConfig& config() const { return m_cfg; }

private:
    CalibrationGuidanceConfig m_cfg{};

    mutable Rtos::Mutex m_lock;
    msg::GridCounts m_grid{};
    int m_good_captures = 0;

    bool framingOk(const msg::FrozenMarkerSnapshot& snap) const;
    bool distanceOk(const std::optional<double>& d) const;
    bool enoughLocked(std::vector<std::string>& reasons) const;
};

} // namespace guide

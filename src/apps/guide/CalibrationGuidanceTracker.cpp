#include "apps/guide/CalibrationGuidanceTracker.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace guide {

static inline CalibrationGuidanceConfig sanitise(const CalibrationGuidanceConfig& in) {
    CalibrationGuidanceConfig cfg = in;

    if (cfg.DISTANCE_MIN_CM < 0.0) cfg.DISTANCE_MIN_CM = 0.0;
    if (cfg.DISTANCE_MAX_CM < cfg.DISTANCE_MIN_CM) cfg.DISTANCE_MAX_CM = cfg.DISTANCE_MIN_CM;
    cfg.DISTANCE_TARGET_CM = std::max(cfg.DISTANCE_MIN_CM, std::min(cfg.DISTANCE_MAX_CM, cfg.DISTANCE_TARGET_CM));

    if (cfg.EDGE_MARGIN_FRAC < 0.0)  cfg.EDGE_MARGIN_FRAC = 0.0;
    if (cfg.EDGE_MARGIN_FRAC > 0.45) cfg.EDGE_MARGIN_FRAC = 0.45;

    if (cfg.GOOD_CAPTURES_TARGET < 0) cfg.GOOD_CAPTURES_TARGET = 0;
    cfg.GRID_TARGET_FILLED = std::max(0, std::min(msg::GRID_CELLS, cfg.GRID_TARGET_FILLED));

    return cfg;
}

CalibrationGuidanceTracker::CalibrationGuidanceTracker(const CalibrationGuidanceConfig& cfg)
: m_cfg(sanitise(cfg)) {
}

void CalibrationGuidanceTracker::resetForNewSession() {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    m_grid.fill(0);
    m_good_captures = 0;
    std::cout << "[CAL] Session reset\n";
}

bool CalibrationGuidanceTracker::onCaptureSaved(const msg::FrozenMarkerSnapshot& marker,
                                                const msg::FrozenQualitySnapshot& quality) {
    std::lock_guard<Rtos::Mutex> lk(m_lock);

    const bool q_ok = quality.status == msg::QualityStatus::OK;
    const bool has_markers = !marker.detections.empty();
    const bool d_ok = distanceOk(quality.distance_cm);
    const bool f_ok = framingOk(marker);

    if (!(q_ok && has_markers && d_ok && f_ok)) return false;

    m_good_captures += 1;

    double x = 0.0, y = 0.0;
    if (meanCenterNorm(marker.detections, marker.frame_width, marker.frame_height, x, y)) {
        m_grid[gridIndex3x3(x, y)] += 1;
    }
    return true;
}

CalibrationLiveGuidance CalibrationGuidanceTracker::buildLiveGuidance(const msg::MarkerStatus& status,
                                                                      const msg::QualityResult* quality) const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);

    const msg::FrozenMarkerSnapshot frozen = freezeMarkerStatus(status);
    const std::optional<double> dist = quality ? quality->distance_cm : std::nullopt;
    const bool dist_ok = distanceOk(dist);
    const bool frm_ok  = framingOk(frozen);

    const int filled = filledGridCells(m_grid);

    CalibrationLiveGuidance g;
    g.coverage_text = "Coverage: " + std::to_string(filled) + "/9";
    g.progress = "Calib shots: " + std::to_string(m_good_captures) + "/" +
                 std::to_string(m_cfg.GOOD_CAPTURES_TARGET);

    std::vector<std::string> reasons;
    g.enough = enoughLocked(reasons);

    std::ostringstream target;
    target << "(target ~" << m_cfg.DISTANCE_TARGET_CM << " cm)";

    if (status.detectedCount() == 0) {
        g.message = "No markers: bring board/flags into view";
    } else if (!frm_ok) {
        g.message = "Reframe: keep board away from edges";
    } else if (!dist_ok) {
        const bool too_close = dist && *dist < m_cfg.DISTANCE_MIN_CM;
        g.message = std::string(too_close ? "Move farther " : "Move closer ") + target.str();
    } else if (filled < m_cfg.GRID_TARGET_FILLED) {
        const int empty = firstEmptyGridCell(m_grid);
        g.message = (empty >= 0) ? "Move board to " + cellName(empty)
                                 : std::string("Move board around the frame");
    } else {
        g.message = g.enough ? "Calibration enough" : "Keep going";
    }
    return g;
}

msg::CalibrationManifestSummary CalibrationGuidanceTracker::buildManifestSummary() const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);

    msg::CalibrationManifestSummary m;
    m.distance_target_cm = m_cfg.DISTANCE_TARGET_CM;
    m.distance_min_cm    = m_cfg.DISTANCE_MIN_CM;
    m.distance_max_cm    = m_cfg.DISTANCE_MAX_CM;
    m.edge_margin_frac   = m_cfg.EDGE_MARGIN_FRAC;
    m.good_captures      = m_good_captures;

    m.targets.good_captures = m_cfg.GOOD_CAPTURES_TARGET;
    m.targets.grid_filled   = m_cfg.GRID_TARGET_FILLED;

    m.grid_counts = m_grid;
    m.grid_filled = filledGridCells(m_grid);

    m.enough = enoughLocked(m.reasons_if_not_enough);
    return m;
}

msg::SidecarMarkerSummary CalibrationGuidanceTracker::buildSidecarMarkerSummary(const msg::FrozenMarkerSnapshot& marker,
                                                                               const msg::FrozenQualitySnapshot& quality) const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);

    msg::SidecarMarkerSummary s;
    s.mode         = msg::MarkerModeStr(marker.mode);
    s.dictionary   = MARKER_DICTIONARY;
    s.frame_width  = marker.frame_width;
    s.frame_height = marker.frame_height;
    s.framing_ok   = framingOk(marker);
    s.distance_cm  = quality.distance_cm;
    s.distance_ok  = distanceOk(quality.distance_cm);
    s.detections   = sidecarDetections(marker.detections, marker.frame_width, marker.frame_height);
    return s;
}

bool CalibrationGuidanceTracker::enough(std::vector<std::string>* reasons) const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    std::vector<std::string> r;
    const bool ok = enoughLocked(r);
    if (reasons) *reasons = std::move(r);
    return ok;
}

int CalibrationGuidanceTracker::goodCaptures() const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    return m_good_captures;
}

msg::GridCounts CalibrationGuidanceTracker::gridCounts() const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    return m_grid;
}

// -------------------- private helpers --------------------

bool CalibrationGuidanceTracker::framingOk(const msg::FrozenMarkerSnapshot& snap) const {
    if (snap.frame_width == 0 || snap.frame_height == 0) return snap.framing_ok;
    return framingWithinMargin(snap.detections, snap.frame_width, snap.frame_height,
                               m_cfg.EDGE_MARGIN_FRAC);
}

bool CalibrationGuidanceTracker::distanceOk(const std::optional<double>& d) const {
    return distanceInRange(d, m_cfg.DISTANCE_MIN_CM, m_cfg.DISTANCE_MAX_CM);
}

bool CalibrationGuidanceTracker::enoughLocked(std::vector<std::string>& reasons) const {
    reasons.clear();

    if (m_good_captures < m_cfg.GOOD_CAPTURES_TARGET) {
        reasons.push_back("Need more good shots: " + std::to_string(m_good_captures) + "/" +
                          std::to_string(m_cfg.GOOD_CAPTURES_TARGET));
    }

    const int filled = filledGridCells(m_grid);
    if (filled < m_cfg.GRID_TARGET_FILLED) {
        reasons.push_back("Coverage: " + std::to_string(filled) + "/" +
                          std::to_string(m_cfg.GRID_TARGET_FILLED));
    }
    return reasons.empty();
}

} // namespace guide

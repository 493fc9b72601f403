#include "apps/guide/CaptureGuidanceTracker.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace guide {

static inline CaptureGuidanceConfig sanitise(const CaptureGuidanceConfig& in) {
    CaptureGuidanceConfig cfg = in;

    if (cfg.STABLE_IDS_N < 0) cfg.STABLE_IDS_N = 0;

    if (cfg.DISTANCE_MIN_CM < 0.0) cfg.DISTANCE_MIN_CM = 0.0;
    if (cfg.DISTANCE_MAX_CM < cfg.DISTANCE_MIN_CM) cfg.DISTANCE_MAX_CM = cfg.DISTANCE_MIN_CM;

    if (cfg.EDGE_MARGIN_FRAC < 0.0)  cfg.EDGE_MARGIN_FRAC = 0.0;
    if (cfg.EDGE_MARGIN_FRAC > 0.45) cfg.EDGE_MARGIN_FRAC = 0.45;

    if (cfg.GOOD_CAPTURES_TARGET < 0) cfg.GOOD_CAPTURES_TARGET = 0;
    if (cfg.PER_TAG_TARGET < 0)       cfg.PER_TAG_TARGET = 0;
    cfg.GRID_TARGET_FILLED = std::max(0, std::min(msg::GRID_CELLS, cfg.GRID_TARGET_FILLED));

    cfg.CROSS_ARCH_SPREAD = clamp01(cfg.CROSS_ARCH_SPREAD);

    if (cfg.ANCHOR_PER_BIN < 0)      cfg.ANCHOR_PER_BIN = 0;
    if (cfg.SWEEP_MID < 0)           cfg.SWEEP_MID = 0;
    if (cfg.SWEEP_HIGH_LOW < 0)      cfg.SWEEP_HIGH_LOW = 0;
    if (cfg.CROSS_ARCH_TOTAL < 0)    cfg.CROSS_ARCH_TOTAL = 0;
    if (cfg.CROSS_ARCH_HIGH_LOW < 0) cfg.CROSS_ARCH_HIGH_LOW = 0;

    return cfg;
}

const char* CapturePhaseStr(CapturePhase p) {
    switch (p) {
        case CapturePhase::ANCHOR:      return "ANCHOR";
        case CapturePhase::LEFT_SWEEP:  return "LEFT_SWEEP";
        case CapturePhase::RIGHT_SWEEP: return "RIGHT_SWEEP";
        case CapturePhase::CROSS_ARCH:  return "CROSS_ARCH";
        case CapturePhase::CLEANUP:     return "CLEANUP";
        default:                        return "UNKNOWN";
    }
}

CaptureGuidanceTracker::CaptureGuidanceTracker(const CaptureGuidanceConfig& cfg)
: m_cfg(sanitise(cfg)) {
}

void CaptureGuidanceTracker::resetForNewSession() {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    clearCounters();
    m_stable = StableIdLock{};
    m_required_active.clear();
    std::cout << "[CG] Session reset\n";
}

void CaptureGuidanceTracker::onRequiredIdsChanged(const std::vector<int64_t>& required_ids) {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    m_required_active = required_ids;
    m_stable = StableIdLock{};
    clearCounters();
    std::cout << "[CG] Required ids changed ("
              << (required_ids.empty() ? std::string("none") : joinIds(required_ids))
              << "), statistics reset\n";
}

bool CaptureGuidanceTracker::onCaptureSaved(const msg::FrozenMarkerSnapshot& marker,
                                            const msg::FrozenQualitySnapshot& quality,
                                            const msg::MarkerSessionSummary& summary) {
    std::lock_guard<Rtos::Mutex> lk(m_lock);

    // Good capture: quality OK + distance ok + framing ok + at least one marker
    const bool q_ok = quality.status == msg::QualityStatus::OK;
    const bool d_ok = distanceOk(quality.distance_cm);
    const bool f_ok = framingOk(marker);
    const bool has_markers = !marker.detections.empty();

    if (!(q_ok && d_ok && f_ok && has_markers)) return false;

    m_counters.good_captures += 1;

    const std::vector<int64_t> tracked = trackedIdsLocked(marker.required_ids, summary);

    Placement pl;
    if (place(marker, pl)) {
        m_counters.grid[pl.cell] += 1;

        const bool mid  = pl.ht == HeightBin::MID;
        const bool high = pl.ht == HeightBin::HIGH;
        const bool low  = pl.ht == HeightBin::LOW;

        auto& a = m_counters.anchor;
        if (mid && pl.lat == LateralBin::CENTER) a.center_mid += 1;
        if (mid && pl.lat == LateralBin::LEFT)   a.left_mid += 1;
        if (mid && pl.lat == LateralBin::RIGHT)  a.right_mid += 1;
        if (high) a.high_any += 1;
        if (low)  a.low_any += 1;

        if (pl.lat == LateralBin::LEFT) {
            auto& b = m_counters.left;
            if (mid)  b.mid += 1;
            if (high) b.high += 1;
            if (low)  b.low += 1;
        } else if (pl.lat == LateralBin::RIGHT) {
            auto& c = m_counters.right;
            if (mid)  c.mid += 1;
            if (high) c.high += 1;
            if (low)  c.low += 1;
        }

        if (pl.cross_arch) {
            auto& d = m_counters.cross;
            d.total += 1;
            if (high) d.high += 1;
            if (low)  d.low += 1;
        }
    }

    // Per-tag counts, tracked ids only. Absent ids still get an entry.
    const auto& present = marker.detected_ids;
    for (int64_t id : tracked) {
        const bool seen = std::find(present.begin(), present.end(), id) != present.end();
        bumpPerTag(id, seen ? 1 : 0);
    }
    return true;
}

CaptureLiveGuidance CaptureGuidanceTracker::buildLiveGuidance(const msg::MarkerStatus& status,
                                                              const msg::QualityResult* quality,
                                                              const msg::MarkerSessionSummary& summary) {
    std::lock_guard<Rtos::Mutex> lk(m_lock);

    const msg::FrozenMarkerSnapshot frozen = freezeMarkerStatus(status);
    const std::optional<double> distance = quality ? quality->distance_cm : std::nullopt;
    const bool dist_ok = distanceOk(distance);
    const bool frm_ok  = framingOk(frozen);

    const auto& required = status.required_ids;
    const std::vector<int64_t> tracked = trackedIdsLocked(required, summary);

    CaptureLiveGuidance g;
    g.phase = phaseLocked();
    g.phase_progress = phaseProgressText(g.phase);
    g.coverage_text = "Coverage: " + std::to_string(filledGridCells(m_counters.grid)) + "/9";

    std::vector<std::string> reasons;
    g.enough = enoughLocked(tracked, reasons);

    const bool missing = !required.empty() && !status.missing_required_ids.empty();

    std::ostringstream range;
    range << "(target " << static_cast<int>(m_cfg.DISTANCE_MIN_CM) << "–"
          << static_cast<int>(m_cfg.DISTANCE_MAX_CM) << " cm)";

    if (status.detectedCount() == 0) {
        g.message = "No markers: move closer / improve lighting";
    } else if (missing) {
        g.message = "Missing: " + joinIds(status.missing_required_ids);
    } else if (!frm_ok) {
        g.message = "Reframe: keep tags away from edges";
    } else if (!dist_ok) {
        const bool too_close = distance && *distance < m_cfg.DISTANCE_MIN_CM;
        g.message = std::string(too_close ? "Move farther " : "Move closer ") + range.str();
    } else {
        switch (g.phase) {
            case CapturePhase::ANCHOR:
                g.message = "Next: anchor ring (front/left/right + high/low)";
                break;
            case CapturePhase::LEFT_SWEEP:
                g.message = "Next: sweep LEFT posterior (upper+lower rail)";
                break;
            case CapturePhase::RIGHT_SWEEP:
                g.message = "Next: sweep RIGHT posterior (upper+lower rail)";
                break;
            case CapturePhase::CROSS_ARCH:
                g.message = "Next: cross-arch obliques (high+low)";
                break;
            case CapturePhase::CLEANUP: {
                std::vector<int64_t> weak;
                for (int64_t id : tracked) {
                    if (perTagCount(id) < m_cfg.PER_TAG_TARGET) weak.push_back(id);
                }
                if (!weak.empty()) {
                    g.message = "Cleanup: weak tags " + joinIds(weak) + " (need " +
                                std::to_string(m_cfg.PER_TAG_TARGET) + " each)";
                } else if (!g.enough) {
                    g.message = reasons.empty() ? std::string("Keep going") : reasons.front();
                } else {
                    g.message = "Enough";
                }
                break;
            }
        }
    }

    if (status.mode == msg::MarkerMode::BLOCK) {
        if (missing)       g.block_reason = std::string("Missing required");
        else if (!frm_ok)  g.block_reason = std::string("Framing");
        else if (!dist_ok) g.block_reason = std::string("Distance");
    }

    return g;
}

msg::CaptureManifestSummary CaptureGuidanceTracker::buildManifestSummary(const msg::MarkerSessionSummary& summary) {
    std::lock_guard<Rtos::Mutex> lk(m_lock);

    const std::vector<int64_t> tracked = trackedIdsLocked(m_required_active, summary);

    msg::CaptureManifestSummary m;
    m.stable_ids_n     = m_cfg.STABLE_IDS_N;
    m.tracked_ids      = tracked;
    m.distance_min_cm  = m_cfg.DISTANCE_MIN_CM;
    m.distance_max_cm  = m_cfg.DISTANCE_MAX_CM;
    m.edge_margin_frac = m_cfg.EDGE_MARGIN_FRAC;
    m.good_captures    = m_counters.good_captures;

    m.targets.good_captures       = m_cfg.GOOD_CAPTURES_TARGET;
    m.targets.per_tag             = m_cfg.PER_TAG_TARGET;
    m.targets.grid_filled         = m_cfg.GRID_TARGET_FILLED;
    m.targets.cross_arch_required = m_cfg.CROSS_ARCH_REQUIRED;

    m.grid_counts = m_counters.grid;
    m.grid_filled = filledGridCells(m_counters.grid);

    for (int64_t id : tracked) m.per_tag_capture_count[id] = perTagCount(id);

    m.phase_a            = m_counters.anchor;
    m.phase_b_left       = m_counters.left;
    m.phase_c_right      = m_counters.right;
    m.phase_d_cross_arch = m_counters.cross;

    m.enough = enoughLocked(tracked, m.reasons_if_not_enough);
    return m;
}

msg::SidecarMarkerSummary CaptureGuidanceTracker::buildSidecarMarkerSummary(const msg::FrozenMarkerSnapshot& marker,
                                                                           const msg::FrozenQualitySnapshot& quality,
                                                                           const msg::MarkerSessionSummary& summary) {
    std::lock_guard<Rtos::Mutex> lk(m_lock);

    msg::SidecarMarkerSummary s;
    s.mode         = msg::MarkerModeStr(marker.mode);
    s.dictionary   = MARKER_DICTIONARY;
    s.frame_width  = marker.frame_width;
    s.frame_height = marker.frame_height;
    s.framing_ok   = framingOk(marker);
    s.distance_cm  = quality.distance_cm;
    s.distance_ok  = distanceOk(quality.distance_cm);

    msg::SidecarCaptureContext ctx;
    ctx.required_ids         = marker.required_ids;
    ctx.tracked_ids          = trackedIdsLocked(marker.required_ids, summary);
    ctx.missing_required_ids = marker.missing_required_ids;
    ctx.detected_ids         = marker.detected_ids;
    std::sort(ctx.detected_ids.begin(), ctx.detected_ids.end());
    ctx.all_required_visible = marker.all_required_visible;
    ctx.phase                = CapturePhaseStr(phaseLocked());

    Placement pl;
    if (place(marker, pl)) {
        ctx.grid_cell   = pl.cell;
        ctx.lateral_bin = std::string(LateralBinStr(pl.lat));
        ctx.height_bin  = std::string(HeightBinStr(pl.ht));
        ctx.cross_arch  = pl.cross_arch;
    }
    s.capture = std::move(ctx);

    s.detections = sidecarDetections(marker.detections, marker.frame_width, marker.frame_height);
    return s;
}

bool CaptureGuidanceTracker::enough(const msg::MarkerSessionSummary& summary, std::vector<std::string>* reasons) {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    const std::vector<int64_t> tracked = trackedIdsLocked(m_required_active, summary);
    std::vector<std::string> r;
    const bool ok = enoughLocked(tracked, r);
    if (reasons) *reasons = std::move(r);
    return ok;
}

CapturePhase CaptureGuidanceTracker::phase() const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    return phaseLocked();
}

int CaptureGuidanceTracker::goodCaptures() const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    return m_counters.good_captures;
}

msg::GridCounts CaptureGuidanceTracker::gridCounts() const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    return m_counters.grid;
}

std::vector<std::pair<int64_t, int>> CaptureGuidanceTracker::perTagCaptureCounts() const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    return m_counters.per_tag;
}

std::vector<int64_t> CaptureGuidanceTracker::lockedStableIds() const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    return m_stable.locked ? m_stable.ids : std::vector<int64_t>{};
}

// -------------------- private helpers --------------------

void CaptureGuidanceTracker::clearCounters() {
    m_counters = SessionCounters{};
}

std::vector<int64_t> CaptureGuidanceTracker::trackedIdsLocked(const std::vector<int64_t>& required,
                                                              const msg::MarkerSessionSummary& summary) {
    if (!required.empty()) {
        if (!m_stable.locked || m_stable.ids != required) {
            m_stable.locked = true;
            m_stable.ids = required;
        }
        return required;
    }
    if (m_stable.locked) return m_stable.ids;

    std::vector<int64_t> candidates = chooseStableIds(summary.per_tag_count, m_cfg.STABLE_IDS_N);
    if (m_cfg.STABLE_IDS_N > 0 && static_cast<int>(candidates.size()) >= m_cfg.STABLE_IDS_N) {
        m_stable.locked = true;
        m_stable.ids = candidates;
        std::cout << "[CG] Stable ids locked: " << joinIds(candidates) << "\n";
    }
    // Until locked, the current top candidates stand in.
    return candidates;
}

int CaptureGuidanceTracker::perTagCount(int64_t id) const {
    for (const auto& kv : m_counters.per_tag) {
        if (kv.first == id) return kv.second;
    }
    return 0;
}

void CaptureGuidanceTracker::bumpPerTag(int64_t id, int delta) {
    for (auto& kv : m_counters.per_tag) {
        if (kv.first == id) {
            kv.second += delta;
            return;
        }
    }
    m_counters.per_tag.emplace_back(id, delta);
}

bool CaptureGuidanceTracker::framingOk(const msg::FrozenMarkerSnapshot& snap) const {
    if (snap.frame_width == 0 || snap.frame_height == 0) return snap.framing_ok;
    return framingWithinMargin(snap.detections, snap.frame_width, snap.frame_height,
                               m_cfg.EDGE_MARGIN_FRAC);
}

bool CaptureGuidanceTracker::distanceOk(const std::optional<double>& d) const {
    return distanceInRange(d, m_cfg.DISTANCE_MIN_CM, m_cfg.DISTANCE_MAX_CM);
}

bool CaptureGuidanceTracker::place(const msg::FrozenMarkerSnapshot& snap, Placement& out) const {
    double x = 0.0, y = 0.0;
    if (!meanCenterNorm(snap.detections, snap.frame_width, snap.frame_height, x, y)) return false;

    out.cell = gridIndex3x3(x, y);
    out.lat  = lateralBin(x);
    out.ht   = heightBin(y);
    out.cross_arch = spreadXNorm(snap.detections, snap.frame_width) >= m_cfg.CROSS_ARCH_SPREAD &&
                     hasBothSides(snap.detections, snap.frame_width);
    return true;
}

bool CaptureGuidanceTracker::anchorComplete() const {
    const auto& a = m_counters.anchor;
    const int n = m_cfg.ANCHOR_PER_BIN;
    return a.center_mid >= n && a.left_mid >= n && a.right_mid >= n &&
           a.high_any >= n && a.low_any >= n;
}

bool CaptureGuidanceTracker::leftComplete() const {
    const auto& b = m_counters.left;
    return b.mid >= m_cfg.SWEEP_MID && b.high >= m_cfg.SWEEP_HIGH_LOW && b.low >= m_cfg.SWEEP_HIGH_LOW;
}

bool CaptureGuidanceTracker::rightComplete() const {
    const auto& c = m_counters.right;
    return c.mid >= m_cfg.SWEEP_MID && c.high >= m_cfg.SWEEP_HIGH_LOW && c.low >= m_cfg.SWEEP_HIGH_LOW;
}

bool CaptureGuidanceTracker::crossArchComplete() const {
    const auto& d = m_counters.cross;
    return d.total >= m_cfg.CROSS_ARCH_TOTAL &&
           d.high >= m_cfg.CROSS_ARCH_HIGH_LOW && d.low >= m_cfg.CROSS_ARCH_HIGH_LOW;
}

CapturePhase CaptureGuidanceTracker::phaseLocked() const {
    if (!anchorComplete())    return CapturePhase::ANCHOR;
    if (!leftComplete())      return CapturePhase::LEFT_SWEEP;
    if (!rightComplete())     return CapturePhase::RIGHT_SWEEP;
    if (!crossArchComplete()) return CapturePhase::CROSS_ARCH;
    return CapturePhase::CLEANUP;
}

std::string CaptureGuidanceTracker::phaseProgressText(CapturePhase p) const {
    std::ostringstream os;
    switch (p) {
        case CapturePhase::ANCHOR: {
            const auto& a = m_counters.anchor;
            const int n = m_cfg.ANCHOR_PER_BIN;
            const int done = std::min(a.center_mid, n) + std::min(a.left_mid, n) +
                             std::min(a.right_mid, n) + std::min(a.high_any, n) + std::min(a.low_any, n);
            os << "Phase A (Anchor): " << done << "/" << 5 * n;
            break;
        }
        case CapturePhase::LEFT_SWEEP:
        case CapturePhase::RIGHT_SWEEP: {
            const auto& s = (p == CapturePhase::LEFT_SWEEP) ? m_counters.left : m_counters.right;
            const int done = std::min(s.mid, m_cfg.SWEEP_MID) + std::min(s.high, m_cfg.SWEEP_HIGH_LOW) +
                             std::min(s.low, m_cfg.SWEEP_HIGH_LOW);
            os << ((p == CapturePhase::LEFT_SWEEP) ? "Phase B (Left sweep): " : "Phase C (Right sweep): ")
               << done << "/" << (m_cfg.SWEEP_MID + 2 * m_cfg.SWEEP_HIGH_LOW);
            break;
        }
        case CapturePhase::CROSS_ARCH: {
            const auto& d = m_counters.cross;
            os << "Phase D (Cross-arch): " << d.total << "/" << m_cfg.CROSS_ARCH_TOTAL
               << " (H:" << d.high << " L:" << d.low << ")";
            break;
        }
        case CapturePhase::CLEANUP:
            os << "Phase E (Cleanup)";
            break;
    }
    return os.str();
}

bool CaptureGuidanceTracker::enoughLocked(const std::vector<int64_t>& tracked,
                                          std::vector<std::string>& reasons) const {
    reasons.clear();

    if (m_counters.good_captures < m_cfg.GOOD_CAPTURES_TARGET) {
        reasons.push_back("Need more good shots: " + std::to_string(m_counters.good_captures) + "/" +
                          std::to_string(m_cfg.GOOD_CAPTURES_TARGET));
    }

    const int filled = filledGridCells(m_counters.grid);
    if (filled < m_cfg.GRID_TARGET_FILLED) {
        reasons.push_back("Coverage: " + std::to_string(filled) + "/" +
                          std::to_string(m_cfg.GRID_TARGET_FILLED));
    }

    if (m_cfg.CROSS_ARCH_REQUIRED && !crossArchComplete()) {
        reasons.emplace_back("Cross-arch obliques missing");
    }

    for (int64_t id : tracked) {
        const int c = perTagCount(id);
        if (c < m_cfg.PER_TAG_TARGET) {
            reasons.push_back("Tag " + std::to_string(id) + ": " + std::to_string(c) + "/" +
                              std::to_string(m_cfg.PER_TAG_TARGET));
        }
    }
    return reasons.empty();
}

} // namespace guide

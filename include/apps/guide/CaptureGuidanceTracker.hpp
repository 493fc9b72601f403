#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "os/rtos.hpp"
#include "apps/guide/GuidanceCommon.hpp"

#include "msg/CaptureSnapshot.hpp"
#include "msg/MarkerStatus.hpp"
#include "msg/QualityResult.hpp"
#include "msg/SessionSummary.hpp"

namespace guide {

// ---------------------------------------------------------------------------
// Configuration for the CaptureGuidanceTracker (tunable parameters, no state).
// ---------------------------------------------------------------------------
struct CaptureGuidanceConfig {
    int    STABLE_IDS_N         = STABLE_IDS_N_DEFAULT;  // tracked ids when none are required
    double DISTANCE_MIN_CM      = 20.0;
    double DISTANCE_MAX_CM      = 30.0;
    double EDGE_MARGIN_FRAC     = 0.10;

    int    GOOD_CAPTURES_TARGET = 60;
    int    PER_TAG_TARGET       = 10;
    int    GRID_TARGET_FILLED   = 7;     // of 9 cells
    bool   CROSS_ARCH_REQUIRED  = true;

    // Cross-arch capture: center spread >= this fraction of width, tags on both sides.
    double CROSS_ARCH_SPREAD    = 0.65;

    // Phase completion thresholds
    int ANCHOR_PER_BIN      = 2;   // center/left/right mid, any high, any low
    int SWEEP_MID           = 5;
    int SWEEP_HIGH_LOW      = 3;
    int CROSS_ARCH_TOTAL    = 6;
    int CROSS_ARCH_HIGH_LOW = 2;
};

// Strictly ordered; derived from the counters, never stored.
enum class CapturePhase : uint8_t {
    ANCHOR = 0,
    LEFT_SWEEP,
    RIGHT_SWEEP,
    CROSS_ARCH,
    CLEANUP,
};

const char* CapturePhaseStr(CapturePhase p);

struct CaptureLiveGuidance {
    std::string  message;
    CapturePhase phase = CapturePhase::ANCHOR;
    std::string  phase_progress;
    std::string  coverage_text;
    bool         enough = false;
    std::optional<std::string> block_reason;   // BLOCK mode only
};

// ---------------------------------------------------------------------------
// CaptureGuidanceTracker: multi-phase coverage / sufficiency for capture
// sessions. Counters change only in onCaptureSaved(), and only for captures
// passing the good-capture gate. Every public method runs under one mutex.
// ---------------------------------------------------------------------------
class CaptureGuidanceTracker {
public:
    explicit CaptureGuidanceTracker(const CaptureGuidanceConfig& cfg = {});

    void resetForNewSession();

    // Resets all statistics: counts from before the change are not comparable.
    void onRequiredIdsChanged(const std::vector<int64_t>& required_ids);

    // Sole mutator. Returns true when the capture passed the gate and was counted.
    bool onCaptureSaved(const msg::FrozenMarkerSnapshot& marker,
                        const msg::FrozenQualitySnapshot& quality,
                        const msg::MarkerSessionSummary& summary);

    // Read-only with respect to counters (may lock in stable ids).
    CaptureLiveGuidance buildLiveGuidance(const msg::MarkerStatus& status,
                                          const msg::QualityResult* quality,
                                          const msg::MarkerSessionSummary& summary);

    msg::CaptureManifestSummary buildManifestSummary(const msg::MarkerSessionSummary& summary);

    msg::SidecarMarkerSummary buildSidecarMarkerSummary(const msg::FrozenMarkerSnapshot& marker,
                                                        const msg::FrozenQualitySnapshot& quality,
                                                        const msg::MarkerSessionSummary& summary);

    // Sufficiency verdict; reasons in fixed order (shots, coverage, cross-arch, per tag).
    bool enough(const msg::MarkerSessionSummary& summary, std::vector<std::string>* reasons = nullptr);

    CapturePhase phase() const;
    int goodCaptures() const;
    msg::GridCounts gridCounts() const;
    std::vector<std::pair<int64_t, int>> perTagCaptureCounts() const;
    std::vector<int64_t> lockedStableIds() const;

    const CaptureGuidanceConfig& config() const { return m_cfg; }

private:
    struct SessionCounters {
        msg::GridCounts grid{};
        std::vector<std::pair<int64_t, int>> per_tag;   // insertion order
        int good_captures = 0;

        msg::PhaseAnchorProgress    anchor;
        msg::PhaseSweepProgress     left;
        msg::PhaseSweepProgress     right;
        msg::PhaseCrossArchProgress cross;
    };

    // Unlocked -> Locked(ids). Left only through a reset.
    struct StableIdLock {
        bool locked = false;
        std::vector<int64_t> ids;
    };

    struct Placement {
        int cell = 0;
        LateralBin lat = LateralBin::CENTER;
        HeightBin  ht  = HeightBin::MID;
        bool cross_arch = false;
    };

    CaptureGuidanceConfig m_cfg{};

    mutable Rtos::Mutex m_lock;
    SessionCounters m_counters{};
    StableIdLock    m_stable{};
    std::vector<int64_t> m_required_active;

    // --- helpers, called with m_lock held ---
    void clearCounters();
    std::vector<int64_t> trackedIdsLocked(const std::vector<int64_t>& required,
                                          const msg::MarkerSessionSummary& summary);
    int perTagCount(int64_t id) const;
    void bumpPerTag(int64_t id, int delta);

    bool framingOk(const msg::FrozenMarkerSnapshot& snap) const;
    bool distanceOk(const std::optional<double>& d) const;
    bool place(const msg::FrozenMarkerSnapshot& snap, Placement& out) const;

    bool anchorComplete() const;
    bool leftComplete() const;
    bool rightComplete() const;
    bool crossArchComplete() const;
    CapturePhase phaseLocked() const;
    std::string phaseProgressText(CapturePhase p) const;

    bool enoughLocked(const std::vector<int64_t>& tracked, std::vector<std::string>& reasons) const;
};

} // namespace guide

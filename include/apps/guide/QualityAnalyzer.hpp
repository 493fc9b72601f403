#pragma once
#include <cstdint>
#include <vector>

#include "msg/ImageFrame.hpp"
#include "msg/QualityResult.hpp"

namespace guide {

class CaptureResultStore;

// ---------------------------------------------------------------------------
// Configuration for the QualityAnalyzer (tunable parameters, no state).
// ---------------------------------------------------------------------------
struct QualityAnalyzerConfig {
    int    TARGET_FPS      = 12;      // analysis rate; faster frames are dropped
    double ROI_FRAC        = 0.40;    // centered ROI side as fraction of frame side
    int    ROI_MIN_PX      = 64;      // ROI side lower bound [pixels]

    int    BLUR_STEP       = 2;       // Laplacian sampling stride [pixels]
    double BLUR_THRESHOLD  = 150.0;   // Laplacian variance below this => BLUR

    int     EXPOSURE_STEP  = 2;       // exposure sampling stride [pixels]
    uint8_t CLIP_HIGH      = 245;     // >= counts as clipped highlight
    uint8_t CLIP_LOW       = 10;      // <= counts as clipped shadow
    double  OVER_THRESH    = 0.02;    // clipped-high fraction above this => OVER/SPECULAR
    double  UNDER_THRESH   = 0.02;    // clipped-low fraction above this => UNDER

    // Clipping confined to fewer than SPECULAR_MAX_CLUSTERS clusters, each
    // smaller than SPECULAR_MAX_CLUSTER_PX samples, is SPECULAR instead of OVER.
    int SPECULAR_MAX_CLUSTERS   = 5;
    int SPECULAR_MAX_CLUSTER_PX = 100;
};

// ---------------------------------------------------------------------------
// QualityAnalyzer: blur / exposure / specular scoring on the raw luma plane.
// Single-threaded: call analyze() from one task only.
// ---------------------------------------------------------------------------
class QualityAnalyzer {
public:
    // store may be null (no distance estimate).
    explicit QualityAnalyzer(const QualityAnalyzerConfig& cfg = {},
                             const CaptureResultStore* store = nullptr);

    void setConfig(const QualityAnalyzerConfig& cfg);

    // Forget the throttle timestamp.
    void reset();

    // Core API: consume one ImageFrame, produce one QualityResult.
    // Returns false when the frame was dropped (throttled, unsupported, bad);
    // lastStatus() says why and 'out' is left untouched.
    bool analyze(const msg::ImageFrame& img, msg::QualityResult& out);

    enum class Status : uint8_t {
        OK = 0,
        THROTTLED,
        UNSUPPORTED_FORMAT,
        BAD_FRAME,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }

private:
    QualityAnalyzerConfig m_cfg{};
    const CaptureResultStore* m_store = nullptr;

    uint64_t m_interval_ns = 0;
    uint64_t m_last_analyze_ns = 0;

    Status m_status = Status::OK;
    bool   m_warned_format = false;

    int m_roi_x = 0;
    int m_roi_y = 0;
    int m_roi_w = 0;
    int m_roi_h = 0;

    // Clipped-high mask on the exposure sample grid, plus flood-fill stack.
    // Kept as members so steady-state frames do not allocate.
    std::vector<uint8_t> m_clip_mask;
    std::vector<int>     m_stack;

    void defineROI(const msg::ImageFrame& img);
    double laplacianVariance(const msg::ImageFrame& img) const;
    void measureExposure(const msg::ImageFrame& img, int& grid_w, int& grid_h,
                         int& high_cnt, int& low_cnt, int& total);
    void clusterHighlights(int grid_w, int grid_h, int& clusters, int& largest);

    msg::QualityStatus classify(const msg::QualityResult& r) const;
};

} // namespace guide

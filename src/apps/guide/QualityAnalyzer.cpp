#include "apps/guide/QualityAnalyzer.hpp"
#include "apps/guide/CaptureResultStore.hpp"

#include <algorithm>
#include <iostream>

namespace guide {

static inline QualityAnalyzerConfig sanitise(const QualityAnalyzerConfig& in) {
    QualityAnalyzerConfig cfg = in;

    if (cfg.TARGET_FPS < 1) cfg.TARGET_FPS = 1;

    if (cfg.ROI_FRAC <= 0.0) cfg.ROI_FRAC = 0.40;
    if (cfg.ROI_FRAC > 1.0)  cfg.ROI_FRAC = 1.0;
    if (cfg.ROI_MIN_PX < 3)  cfg.ROI_MIN_PX = 3;   // Laplacian needs a 3x3 neighbourhood

    if (cfg.BLUR_STEP < 1)     cfg.BLUR_STEP = 1;
    if (cfg.EXPOSURE_STEP < 1) cfg.EXPOSURE_STEP = 1;
    if (cfg.BLUR_THRESHOLD < 0.0) cfg.BLUR_THRESHOLD = 0.0;

    if (cfg.CLIP_LOW >= cfg.CLIP_HIGH) {
        cfg.CLIP_LOW  = 10;
        cfg.CLIP_HIGH = 245;
    }

    cfg.OVER_THRESH  = std::max(0.0, std::min(1.0, cfg.OVER_THRESH));
    cfg.UNDER_THRESH = std::max(0.0, std::min(1.0, cfg.UNDER_THRESH));

    if (cfg.SPECULAR_MAX_CLUSTERS < 0)   cfg.SPECULAR_MAX_CLUSTERS = 0;
    if (cfg.SPECULAR_MAX_CLUSTER_PX < 0) cfg.SPECULAR_MAX_CLUSTER_PX = 0;

    return cfg;
}

QualityAnalyzer::QualityAnalyzer(const QualityAnalyzerConfig& cfg,
                                 const CaptureResultStore* store)
: m_cfg(sanitise(cfg))
, m_store(store) {
    m_interval_ns = 1000000000ULL / static_cast<uint64_t>(m_cfg.TARGET_FPS);
    reset();
}

void QualityAnalyzer::setConfig(const QualityAnalyzerConfig& cfg) {
    m_cfg = sanitise(cfg);
    m_interval_ns = 1000000000ULL / static_cast<uint64_t>(m_cfg.TARGET_FPS);
}

void QualityAnalyzer::reset() {
    m_last_analyze_ns = 0;
    m_status = Status::OK;
}

bool QualityAnalyzer::analyze(const msg::ImageFrame& img, msg::QualityResult& out) {
    // ---- Throttle: drop, never queue. Older timestamps drop too; reset()
    // restarts the clock. ----
    if (m_last_analyze_ns != 0 &&
        (img.t_ns < m_last_analyze_ns || (img.t_ns - m_last_analyze_ns) < m_interval_ns)) {
        m_status = Status::THROTTLED;
        return false;
    }
    m_last_analyze_ns = img.t_ns;

    if (img.bytes_per_px != 1) {
        if (!m_warned_format) {
            std::cerr << "[QA] Unsupported pixel stride " << static_cast<int>(img.bytes_per_px)
                      << " (need planar luma), frames skipped\n";
            m_warned_format = true;
        }
        m_status = Status::UNSUPPORTED_FORMAT;
        return false;
    }

    if (!img.data || img.width < 3 || img.height < 3 || img.stride < img.width) {
        m_status = Status::BAD_FRAME;
        return false;
    }

    defineROI(img);

    msg::QualityResult r{};
    r.t_ns     = img.t_ns;
    r.frame_id = img.frame_id;

    // ---- Blur ----
    r.blur_score = laplacianVariance(img);

    // ---- Exposure ----
    int grid_w = 0, grid_h = 0;
    int high_cnt = 0, low_cnt = 0, total = 0;
    measureExposure(img, grid_w, grid_h, high_cnt, low_cnt, total);

    r.over_frac  = (total > 0) ? static_cast<double>(high_cnt) / total : 0.0;
    r.under_frac = (total > 0) ? static_cast<double>(low_cnt) / total : 0.0;

    // ---- Specular clusters ----
    if (high_cnt > 0) {
        clusterHighlights(grid_w, grid_h, r.specular_clusters, r.specular_largest_cluster);
    }

    // ---- Distance (best effort) ----
    // Focus distance is in diopters (1/m): d[cm] = 100 / diopters.
    if (m_store) {
        const auto diopters = m_store->latestFocusDistance();
        if (diopters && *diopters > 0.0f) {
            r.distance_cm = 100.0 / static_cast<double>(*diopters);
        }
    }

    r.status = classify(r);
    out = r;

    m_status = Status::OK;
    return true;
}

// -------------------- private helpers --------------------

void QualityAnalyzer::defineROI(const msg::ImageFrame& img) {
    const int w = static_cast<int>(img.width);
    const int h = static_cast<int>(img.height);

    m_roi_w = std::min(std::max(static_cast<int>(w * m_cfg.ROI_FRAC), m_cfg.ROI_MIN_PX), w);
    m_roi_h = std::min(std::max(static_cast<int>(h * m_cfg.ROI_FRAC), m_cfg.ROI_MIN_PX), h);
    m_roi_x = std::max(0, (w - m_roi_w) / 2);
    m_roi_y = std::max(0, (h - m_roi_h) / 2);
}

double QualityAnalyzer::laplacianVariance(const msg::ImageFrame& img) const {
    const uint8_t* data = img.data;
    const int stride = static_cast<int>(img.stride);
    const int step = m_cfg.BLUR_STEP;

    double sum = 0.0;
    double sum_sq = 0.0;
    int count = 0;

    // Interior only: every sample has all four neighbours inside the ROI.
    for (int y = m_roi_y + 1; y < m_roi_y + m_roi_h - 1; y += step) {
        const uint8_t* row = data + y * stride;
        const uint8_t* up  = row - stride;
        const uint8_t* dn  = row + stride;
        for (int x = m_roi_x + 1; x < m_roi_x + m_roi_w - 1; x += step) {
            const int lap = up[x] + dn[x] + row[x - 1] + row[x + 1] - 4 * row[x];
            sum    += lap;
            sum_sq += static_cast<double>(lap) * lap;
            ++count;
        }
    }

    if (count == 0) return 0.0;

    const double mean = sum / count;
    return (sum_sq / count) - mean * mean;   // population variance
}

void QualityAnalyzer::measureExposure(const msg::ImageFrame& img, int& grid_w, int& grid_h,
                                      int& high_cnt, int& low_cnt, int& total) {
    const uint8_t* data = img.data;
    const int stride = static_cast<int>(img.stride);
    const int step = m_cfg.EXPOSURE_STEP;

    grid_w = (m_roi_w + step - 1) / step;
    grid_h = (m_roi_h + step - 1) / step;

    m_clip_mask.assign(static_cast<std::size_t>(grid_w) * grid_h, 0);

    high_cnt = 0;
    low_cnt  = 0;
    total    = 0;

    int gy = 0;
    for (int y = m_roi_y; y < m_roi_y + m_roi_h; y += step, ++gy) {
        const uint8_t* row = data + y * stride;
        int gx = 0;
        for (int x = m_roi_x; x < m_roi_x + m_roi_w; x += step, ++gx) {
            const uint8_t v = row[x];
            if (v >= m_cfg.CLIP_HIGH) {
                ++high_cnt;
                m_clip_mask[gy * grid_w + gx] = 1;
            }
            if (v <= m_cfg.CLIP_LOW) ++low_cnt;
            ++total;
        }
    }
}

void QualityAnalyzer::clusterHighlights(int grid_w, int grid_h, int& clusters, int& largest) {
    // 8-connected neighbour offsets
    static const int du[8] = {-1, 0, 1, -1, 1, -1, 0, 1};
    static const int dv[8] = {-1, -1, -1, 0, 0, 1, 1, 1};

    clusters = 0;
    largest  = 0;

    for (int v = 0; v < grid_h; ++v) {
        for (int u = 0; u < grid_w; ++u) {
            const int seed = v * grid_w + u;
            if (!m_clip_mask[seed]) continue;

            // Seed a new cluster and clear it from the mask as we go
            int area = 0;
            m_stack.clear();
            m_stack.push_back(seed);
            m_clip_mask[seed] = 0;

            while (!m_stack.empty()) {
                const int p = m_stack.back();
                m_stack.pop_back();
                ++area;

                const int pu = p % grid_w;
                const int pv = p / grid_w;
                for (int n = 0; n < 8; ++n) {
                    const int nu = pu + du[n];
                    const int nv = pv + dv[n];
                    if (nu < 0 || nu >= grid_w || nv < 0 || nv >= grid_h) continue;

                    const int q = nv * grid_w + nu;
                    if (!m_clip_mask[q]) continue;
                    m_clip_mask[q] = 0;
                    m_stack.push_back(q);
                }
            }

            ++clusters;
            largest = std::max(largest, area);
        }
    }
}

msg::QualityStatus QualityAnalyzer::classify(const msg::QualityResult& r) const {
    if (r.blur_score < m_cfg.BLUR_THRESHOLD) return msg::QualityStatus::BLUR;

    if (r.over_frac > m_cfg.OVER_THRESH) {
        const bool small_highlights =
            r.specular_clusters < m_cfg.SPECULAR_MAX_CLUSTERS &&
            r.specular_largest_cluster < m_cfg.SPECULAR_MAX_CLUSTER_PX;
        return small_highlights ? msg::QualityStatus::SPECULAR : msg::QualityStatus::OVER;
    }

    if (r.under_frac > m_cfg.UNDER_THRESH) return msg::QualityStatus::UNDER;

    return msg::QualityStatus::OK;
}

const char* QualityAnalyzer::StatusStr(QualityAnalyzer::Status s) {
    switch (s) {
        case QualityAnalyzer::Status::OK:                 return "OK";
        case QualityAnalyzer::Status::THROTTLED:          return "THROTTLED";
        case QualityAnalyzer::Status::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
        case QualityAnalyzer::Status::BAD_FRAME:          return "BAD_FRAME";
        default:                                          return "UNKNOWN";
    }
}

} // namespace guide

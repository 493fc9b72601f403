#pragma once
#include <cstdint>
#include <optional>

namespace msg {

// Verdict of the frame quality analyzer, in classification priority order.
enum class QualityStatus : uint8_t {
    OK = 0,
    BLUR,
    OVER,       // broad highlight clipping
    UNDER,      // broad shadow clipping
    SPECULAR,   // clipping confined to a few small highlight clusters
    UNKNOWN     // nothing analyzed yet
};

inline const char* QualityStatusStr(QualityStatus s) {
    switch (s) {
        case QualityStatus::OK:       return "OK";
        case QualityStatus::BLUR:     return "BLUR";
        case QualityStatus::OVER:     return "OVER";
        case QualityStatus::UNDER:    return "UNDER";
        case QualityStatus::SPECULAR: return "SPECULAR";
        default:                      return "UNKNOWN";
    }
}

struct QualityResult {
    QualityStatus status = QualityStatus::UNKNOWN;

    double blur_score = 0.0;        // Laplacian variance over the ROI
    double over_frac  = 0.0;        // fraction of ROI samples >= clip-high
    double under_frac = 0.0;        // fraction of ROI samples <= clip-low

    // 8-connected clusters of clipped-high samples (sample-grid units)
    int specular_clusters        = 0;
    int specular_largest_cluster = 0;

    // Best-effort subject distance from the lens focus distance.
    std::optional<double> distance_cm;

    // --- Measurement identity ---
    uint64_t t_ns     = 0;          // copy-through from ImageFrame
    uint32_t frame_id = 0;          // copy-through from ImageFrame
};

} // namespace msg

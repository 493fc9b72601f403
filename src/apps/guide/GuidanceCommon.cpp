#include "apps/guide/GuidanceCommon.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <tuple>
#include <utility>

namespace guide {

const char* LateralBinStr(LateralBin b) {
    switch (b) {
        case LateralBin::LEFT:   return "LEFT";
        case LateralBin::CENTER: return "CENTER";
        case LateralBin::RIGHT:  return "RIGHT";
        default:                 return "UNKNOWN";
    }
}

const char* HeightBinStr(HeightBin b) {
    switch (b) {
        case HeightBin::LOW:  return "LOW";
        case HeightBin::MID:  return "MID";
        case HeightBin::HIGH: return "HIGH";
        default:              return "UNKNOWN";
    }
}

LateralBin lateralBin(double x_norm) {
    if (x_norm < 0.33) return LateralBin::LEFT;
    if (x_norm > 0.66) return LateralBin::RIGHT;
    return LateralBin::CENTER;
}

HeightBin heightBin(double y_norm) {
    if (y_norm < 0.33) return HeightBin::LOW;
    if (y_norm > 0.66) return HeightBin::HIGH;
    return HeightBin::MID;
}

int gridIndex3x3(double x_norm, double y_norm) {
    int col = 2;
    if (x_norm < 0.333333)      col = 0;
    else if (x_norm < 0.666666) col = 1;

    int row = 2;
    if (y_norm < 0.333333)      row = 0;
    else if (y_norm < 0.666666) row = 1;

    return row * 3 + col;
}

int filledGridCells(const msg::GridCounts& counts) {
    int k = 0;
    for (int c : counts) {
        if (c > 0) ++k;
    }
    return k;
}

int firstEmptyGridCell(const msg::GridCounts& counts) {
    for (int i = 0; i < msg::GRID_CELLS; ++i) {
        if (counts[i] <= 0) return i;
    }
    return -1;
}

std::string cellName(int index) {
    const int row = index / 3;
    const int col = index % 3;

    const char* row_name = (row == 0) ? "top" : (row == 1) ? "mid" : "bottom";
    const char* col_name = (col == 0) ? "left" : (col == 1) ? "center" : "right";

    return std::string(row_name) + "-" + col_name;
}

double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

double spreadXNorm(const std::vector<msg::TagDetection>& detections, uint32_t width) {
    if (detections.empty() || width == 0) return 0.0;

    double min_x = std::numeric_limits<double>::infinity();
    double max_x = -std::numeric_limits<double>::infinity();
    for (const auto& d : detections) {
        min_x = std::min(min_x, d.center_x);
        max_x = std::max(max_x, d.center_x);
    }
    return clamp01((max_x - min_x) / static_cast<double>(width));
}

bool hasBothSides(const std::vector<msg::TagDetection>& detections, uint32_t width) {
    if (detections.empty() || width == 0) return false;

    bool left = false;
    bool right = false;
    for (const auto& d : detections) {
        const double x = clamp01(d.center_x / static_cast<double>(width));
        if (x < 0.33) left = true;
        if (x > 0.66) right = true;
    }
    return left && right;
}

bool meanCenterNorm(const std::vector<msg::TagDetection>& detections,
                    uint32_t width, uint32_t height,
                    double& x_norm, double& y_norm) {
    if (detections.empty() || width == 0 || height == 0) return false;

    double sx = 0.0;
    double sy = 0.0;
    for (const auto& d : detections) {
        sx += d.center_x;
        sy += d.center_y;
    }
    const double n = static_cast<double>(detections.size());
    x_norm = clamp01(sx / n / static_cast<double>(width));
    y_norm = clamp01(sy / n / static_cast<double>(height));
    return true;
}

bool framingWithinMargin(const std::vector<msg::TagDetection>& detections,
                         uint32_t width, uint32_t height, double margin_frac) {
    const double w  = static_cast<double>(width);
    const double h  = static_cast<double>(height);
    const double mx = w * margin_frac;
    const double my = h * margin_frac;

    auto inside = [&](double x, double y) {
        return !(x < mx || x > (w - mx) || y < my || y > (h - my));
    };

    for (const auto& d : detections) {
        if (!d.corners.empty()) {
            for (const auto& c : d.corners) {
                if (!inside(c.x, c.y)) return false;
            }
        } else if (!inside(d.center_x, d.center_y)) {
            return false;
        }
    }
    return true;
}

bool distanceInRange(const std::optional<double>& distance_cm, double min_cm, double max_cm) {
    if (!distance_cm) return true;
    return *distance_cm >= min_cm && *distance_cm <= max_cm;
}

std::vector<int64_t> chooseStableIds(const std::map<int64_t, uint64_t>& tally, int n) {
    std::vector<std::pair<int64_t, uint64_t>> list(tally.begin(), tally.end());

    // count desc, then id asc
    std::sort(list.begin(), list.end(),
              [](const std::pair<int64_t, uint64_t>& a, const std::pair<int64_t, uint64_t>& b) {
                  if (a.second != b.second) return a.second > b.second;
                  return a.first < b.first;
              });

    const std::size_t take = std::min(list.size(), static_cast<std::size_t>(std::max(0, n)));

    std::vector<int64_t> ids;
    ids.reserve(take);
    for (std::size_t i = 0; i < take; ++i) ids.push_back(list[i].first);
    return ids;
}

std::string joinIds(const std::vector<int64_t>& ids, const char* sep) {
    std::ostringstream os;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) os << sep;
        os << ids[i];
    }
    return os.str();
}

msg::FrozenMarkerSnapshot freezeMarkerStatus(const msg::MarkerStatus& status) {
    msg::FrozenMarkerSnapshot snap;
    snap.t_ns                 = status.t_ns;
    snap.mode                 = status.mode;
    snap.frame_width          = status.frame_width;
    snap.frame_height         = status.frame_height;
    snap.required_ids         = status.required_ids;
    snap.detected_ids         = status.detectedIds();
    snap.missing_required_ids = status.missing_required_ids;
    snap.all_required_visible = status.all_required_visible;
    snap.framing_ok           = status.framing_ok;
    snap.detections           = status.detections;
    return snap;
}

msg::FrozenQualitySnapshot freezeQualityResult(const msg::QualityResult& result) {
    msg::FrozenQualitySnapshot snap;
    snap.status                   = result.status;
    snap.blur_score               = result.blur_score;
    snap.over_frac                = result.over_frac;
    snap.under_frac               = result.under_frac;
    snap.specular_clusters        = result.specular_clusters;
    snap.specular_largest_cluster = result.specular_largest_cluster;
    snap.distance_cm              = result.distance_cm;

    if (result.status == msg::QualityStatus::OVER)     snap.exposure_flags.emplace_back("OVER");
    if (result.status == msg::QualityStatus::UNDER)    snap.exposure_flags.emplace_back("UNDER");
    if (result.status == msg::QualityStatus::SPECULAR) snap.exposure_flags.emplace_back("SPECULAR");
    return snap;
}

std::vector<msg::SidecarDetection> sidecarDetections(const std::vector<msg::TagDetection>& detections,
                                                     uint32_t width, uint32_t height) {
    std::vector<const msg::TagDetection*> sorted;
    sorted.reserve(detections.size());
    for (const auto& d : detections) sorted.push_back(&d);

    std::sort(sorted.begin(), sorted.end(),
              [](const msg::TagDetection* a, const msg::TagDetection* b) {
                  return std::tie(a->id, a->center_x, a->center_y) <
                         std::tie(b->id, b->center_x, b->center_y);
              });

    std::vector<msg::SidecarDetection> out;
    out.reserve(sorted.size());
    for (const auto* d : sorted) {
        msg::SidecarDetection s;
        s.id = d->id;
        s.center_px = {d->center_x, d->center_y};
        if (width > 0 && height > 0) {
            s.center_norm = msg::Point2d{d->center_x / static_cast<double>(width),
                                         d->center_y / static_cast<double>(height)};
        }
        s.corners_px = d->corners;
        s.quality = d->quality;
        out.push_back(std::move(s));
    }
    return out;
}

} // namespace guide

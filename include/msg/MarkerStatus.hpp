#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace msg {

// Pixel coords: origin = top-left; x → right, y → down (in full-frame pixels).

// How marker findings affect capture: ignored, advisory, or capture-blocking.
enum class MarkerMode : uint8_t { OFF = 0, WARN = 1, BLOCK = 2 };

inline const char* MarkerModeStr(MarkerMode m) {
    switch (m) {
        case MarkerMode::OFF:   return "OFF";
        case MarkerMode::WARN:  return "WARN";
        case MarkerMode::BLOCK: return "BLOCK";
        default:                return "UNKNOWN";
    }
}

struct Point2d {
    double x = 0.0;
    double y = 0.0;
};

// One decoded fiducial in THIS frame.
struct TagDetection {
    int64_t id = 0;
    double  center_x = 0.0;
    double  center_y = 0.0;
    std::vector<Point2d>  corners;  // empty, or >= 4 points in detector order
    std::optional<double> quality;  // 0..1 polygon area / ROI area
};

// Latest detector output. Published as a whole (immutable once published).
struct MarkerStatus {
    uint64_t   t_ns = 0;
    MarkerMode mode = MarkerMode::OFF;

    uint32_t frame_width  = 0;
    uint32_t frame_height = 0;

    std::vector<TagDetection> detections;

    std::vector<int64_t> required_ids;          // sorted, de-duplicated
    std::vector<int64_t> missing_required_ids;  // required order
    bool all_required_visible = false;
    bool framing_ok = true;

    std::string guidance_text;
    std::string display_text;

    std::size_t detectedCount() const { return detections.size(); }

    // Distinct identities present in this frame, ascending.
    std::vector<int64_t> detectedIds() const {
        std::vector<int64_t> ids;
        ids.reserve(detections.size());
        for (const auto& d : detections) ids.push_back(d.id);
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
        return ids;
    }
};

// Session-wide detector tallies (since the last reset()).
struct MarkerSessionSummary {
    uint64_t frames_processed = 0;
    uint64_t frames_all_required_visible = 0;

    // identity -> number of processed frames it was seen in
    std::map<int64_t, uint64_t> per_tag_count;
};

} // namespace msg

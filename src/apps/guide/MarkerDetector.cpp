#include "apps/guide/MarkerDetector.hpp"
#include "apps/guide/GuidanceCommon.hpp"

#include <opencv2/core.hpp>
#include <opencv2/objdetect/aruco_detector.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace guide {

static inline MarkerDetectorConfig sanitise(const MarkerDetectorConfig& in) {
    MarkerDetectorConfig cfg = in;

    if (cfg.ROI_FRAC <= 0.0) cfg.ROI_FRAC = 0.60;
    if (cfg.ROI_FRAC > 1.0)  cfg.ROI_FRAC = 1.0;
    if (cfg.ROI_MIN_PX < 1)  cfg.ROI_MIN_PX = 1;

    if (cfg.DOWNSAMPLE_STEP < 1) cfg.DOWNSAMPLE_STEP = 1;
    if (cfg.DOWNSAMPLE_STEP > 8) cfg.DOWNSAMPLE_STEP = 8;   // tags vanish past this

    if (cfg.EDGE_MARGIN_FRAC < 0.0)  cfg.EDGE_MARGIN_FRAC = 0.0;
    if (cfg.EDGE_MARGIN_FRAC > 0.45) cfg.EDGE_MARGIN_FRAC = 0.45;

    return cfg;
}

// Shoelace polygon area in pixels^2.
static double polygonArea(const std::vector<msg::Point2d>& pts) {
    if (pts.size() < 3) return 0.0;
    double acc = 0.0;
    for (std::size_t i = 0; i < pts.size(); ++i) {
        const auto& a = pts[i];
        const auto& b = pts[(i + 1) % pts.size()];
        acc += a.x * b.y - b.x * a.y;
    }
    return std::abs(acc) * 0.5;
}

static std::vector<int64_t> normaliseIds(const std::vector<int64_t>& ids) {
    std::vector<int64_t> out = ids;
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

DetectFn makeAprilTagDetectFn() {
    // The detector object is shared by copies of the returned function but
    // only ever used from the single processing thread.
    auto detector = std::make_shared<cv::aruco::ArucoDetector>(
        cv::aruco::getPredefinedDictionary(cv::aruco::DICT_APRILTAG_36h11),
        cv::aruco::DetectorParameters());

    return [detector](const uint8_t* data, int width, int height, int stride,
                      std::vector<RawMarker>& out) {
        out.clear();

        // Wraps the working buffer, no copy.
        const cv::Mat gray(height, width, CV_8UC1, const_cast<uint8_t*>(data),
                           static_cast<std::size_t>(stride));

        std::vector<std::vector<cv::Point2f>> corners;
        std::vector<int> ids;
        detector->detectMarkers(gray, corners, ids);

        out.reserve(ids.size());
        for (std::size_t i = 0; i < ids.size() && i < corners.size(); ++i) {
            RawMarker m;
            m.id = ids[i];
            m.corners.reserve(corners[i].size());
            for (const auto& c : corners[i]) {
                m.corners.push_back({static_cast<double>(c.x), static_cast<double>(c.y)});
            }
            out.push_back(std::move(m));
        }
    };
}

MarkerTexts buildMarkerTexts(std::size_t total_detections,
                             const std::vector<int64_t>& required_ids,
                             const std::vector<int64_t>& missing_ids,
                             bool framing_ok) {
    MarkerTexts t;

    std::ostringstream disp;
    disp << "Markers detected: " << total_detections;
    if (!required_ids.empty()) {
        disp << " | required " << (required_ids.size() - missing_ids.size())
             << "/" << required_ids.size();
    }
    t.display = disp.str();

    if (total_detections == 0) {
        t.guidance = "No markers detected";
    } else if (!missing_ids.empty()) {
        t.guidance = "Missing required: " + joinIds(missing_ids);
    } else if (!framing_ok) {
        t.guidance = "Keep markers away from frame edges";
    } else {
        t.guidance = "Markers OK";
    }
    return t;
}

// ============================================================================
// NullMarkerDetector
// ============================================================================

NullMarkerDetector::NullMarkerDetector() {
    auto st = std::make_shared<msg::MarkerStatus>();
    st->mode = msg::MarkerMode::OFF;
    st->display_text = "Markers detected: N/A";
    m_status = std::move(st);
}

// ============================================================================
// FiducialMarkerDetector
// ============================================================================

FiducialMarkerDetector::FiducialMarkerDetector(const MarkerDetectorConfig& cfg, DetectFn detect_fn)
: m_cfg(sanitise(cfg))
, m_detect(std::move(detect_fn)) {
    if (!m_detect) m_detect = makeAprilTagDetectFn();
    m_mode.store(m_cfg.MODE);
    reset();
}

void FiducialMarkerDetector::setMode(msg::MarkerMode mode) {
    const msg::MarkerMode prev = m_mode.exchange(mode);
    if (prev != mode) {
        std::cout << "[MD] Mode " << msg::MarkerModeStr(prev) << " -> "
                  << msg::MarkerModeStr(mode) << "\n";
    }
}

void FiducialMarkerDetector::setRequiredIds(const std::vector<int64_t>& ids) {
    std::vector<int64_t> norm = normaliseIds(ids);

    std::lock_guard<Rtos::Mutex> lk(m_lock);
    if (norm == m_required) return;
    m_required = std::move(norm);
    std::cout << "[MD] Required ids: "
              << (m_required.empty() ? std::string("(none)") : joinIds(m_required)) << "\n";
}

void FiducialMarkerDetector::reset() {
    {
        std::lock_guard<Rtos::Mutex> lk(m_lock);
        m_session = msg::MarkerSessionSummary{};
    }

    auto st = std::make_shared<msg::MarkerStatus>();
    st->mode = m_mode.load();
    st->display_text = "Markers detected: 0";
    publish(st);
}

std::shared_ptr<const msg::MarkerStatus> FiducialMarkerDetector::latest() const {
    return std::atomic_load(&m_latest);
}

msg::MarkerSessionSummary FiducialMarkerDetector::sessionSummary() const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    return m_session;
}

void FiducialMarkerDetector::publish(const std::shared_ptr<const msg::MarkerStatus>& st) {
    std::atomic_store(&m_latest, st);
}

// Zero detections for this frame.
void FiducialMarkerDetector::detectorFailed(const char* what) {
    if (!m_warned_detector) {
        std::cerr << "[MD] Detector error, frame treated as empty: " << what << "\n";
        m_warned_detector = true;
    }
    m_raw.clear();
    m_status = Status::DETECTOR_ERROR;
}

std::shared_ptr<msg::MarkerStatus>
FiducialMarkerDetector::baseStatus(const msg::ImageFrame& img, msg::MarkerMode mode) const {
    auto st = std::make_shared<msg::MarkerStatus>();
    st->t_ns = img.t_ns;
    st->mode = mode;
    st->frame_width  = img.width;
    st->frame_height = img.height;
    return st;
}

bool FiducialMarkerDetector::process(const msg::ImageFrame& img) {
    const msg::MarkerMode mode = m_mode.load();

    // ---- OFF: stay observable, do no work ----
    if (mode == msg::MarkerMode::OFF) {
        auto st = baseStatus(img, mode);
        st->display_text = "Markers: OFF";
        publish(st);
        m_status = Status::DISABLED;
        return false;
    }

    if (img.bytes_per_px != 1) {
        if (!m_warned_format) {
            std::cerr << "[MD] Unsupported image format (pixel stride "
                      << static_cast<int>(img.bytes_per_px) << ")\n";
            m_warned_format = true;
        }
        auto st = baseStatus(img, mode);
        st->guidance_text = "Unsupported image format";
        st->display_text  = "Unsupported image format";
        publish(st);
        m_status = Status::UNSUPPORTED_FORMAT;
        return false;
    }

    if (!img.data || img.width == 0 || img.height == 0 || img.stride < img.width) {
        m_status = Status::BAD_FRAME;
        return false;
    }

    // ---- ROI -> working buffer -> backend ----
    defineROI(img);
    copyDownsampled(img);

    m_status = Status::OK;
    m_raw.clear();
    try {
        m_detect(m_work.data(), m_work_w, m_work_h, m_work_w, m_raw);
    } catch (const std::exception& e) {
        // cv::Exception lands here too.
        detectorFailed(e.what());
    } catch (...) {
        detectorFailed("unknown exception");
    }

    auto st = baseStatus(img, mode);
    remap(m_raw, st->detections);

    st->framing_ok = framingWithinMargin(st->detections, img.width, img.height,
                                         m_cfg.EDGE_MARGIN_FRAC);

    const std::vector<int64_t> present = st->detectedIds();

    {
        std::lock_guard<Rtos::Mutex> lk(m_lock);
        st->required_ids = m_required;

        for (int64_t id : m_required) {
            if (!std::binary_search(present.begin(), present.end(), id)) {
                st->missing_required_ids.push_back(id);
            }
        }
        st->all_required_visible = st->missing_required_ids.empty();

        // Session tallies: one hit per identity per frame
        m_session.frames_processed += 1;
        if (!m_required.empty() && st->all_required_visible) {
            m_session.frames_all_required_visible += 1;
        }
        for (int64_t id : present) m_session.per_tag_count[id] += 1;
    }

    const MarkerTexts texts = buildMarkerTexts(st->detectedCount(), st->required_ids,
                                               st->missing_required_ids, st->framing_ok);
    st->guidance_text = texts.guidance;
    st->display_text  = texts.display;

    publish(st);
    return true;
}

// -------------------- private helpers --------------------

void FiducialMarkerDetector::defineROI(const msg::ImageFrame& img) {
    const int w = static_cast<int>(img.width);
    const int h = static_cast<int>(img.height);

    m_roi_w = std::min(std::max(static_cast<int>(w * m_cfg.ROI_FRAC), m_cfg.ROI_MIN_PX), w);
    m_roi_h = std::min(std::max(static_cast<int>(h * m_cfg.ROI_FRAC), m_cfg.ROI_MIN_PX), h);
    m_roi_x = std::max(0, (w - m_roi_w) / 2);
    m_roi_y = std::max(0, (h - m_roi_h) / 2);
}

void FiducialMarkerDetector::copyDownsampled(const msg::ImageFrame& img) {
    const int step = m_cfg.DOWNSAMPLE_STEP;
    m_work_w = (m_roi_w + step - 1) / step;
    m_work_h = (m_roi_h + step - 1) / step;

    m_work.resize(static_cast<std::size_t>(m_work_w) * m_work_h);

    uint8_t* dst = m_work.data();
    for (int r = 0; r < m_work_h; ++r) {
        const uint8_t* src = img.data + static_cast<std::size_t>(m_roi_y + r * step) * img.stride + m_roi_x;
        for (int c = 0; c < m_work_w; ++c) {
            *dst++ = src[c * step];
        }
    }
}

void FiducialMarkerDetector::remap(const std::vector<RawMarker>& raw,
                                   std::vector<msg::TagDetection>& out) const {
    const double step = static_cast<double>(m_cfg.DOWNSAMPLE_STEP);
    const double roi_area = static_cast<double>(m_roi_w) * m_roi_h;

    out.clear();
    out.reserve(raw.size());
    for (const auto& m : raw) {
        msg::TagDetection d;
        d.id = m.id;

        // original = roi_origin + reduced * step
        double sx = 0.0, sy = 0.0;
        d.corners.reserve(m.corners.size());
        for (const auto& c : m.corners) {
            const msg::Point2d p{m_roi_x + c.x * step, m_roi_y + c.y * step};
            sx += p.x;
            sy += p.y;
            d.corners.push_back(p);
        }
        if (d.corners.empty()) continue;   // nothing to place

        d.center_x = sx / d.corners.size();
        d.center_y = sy / d.corners.size();

        if (d.corners.size() >= 3 && roi_area > 0.0) {
            d.quality = clamp01(polygonArea(d.corners) / roi_area);
        }
        out.push_back(std::move(d));
    }
}

const char* FiducialMarkerDetector::StatusStr(FiducialMarkerDetector::Status s) {
    switch (s) {
        case FiducialMarkerDetector::Status::OK:                 return "OK";
        case FiducialMarkerDetector::Status::DISABLED:           return "DISABLED";
        case FiducialMarkerDetector::Status::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
        case FiducialMarkerDetector::Status::BAD_FRAME:          return "BAD_FRAME";
        case FiducialMarkerDetector::Status::DETECTOR_ERROR:     return "DETECTOR_ERROR";
        default:                                                 return "UNKNOWN";
    }
}

std::unique_ptr<IMarkerDetector> makeMarkerDetector(const MarkerDetectorConfig& cfg,
                                                    DetectFn detect_fn) {
    if (!cfg.ENABLED) return std::make_unique<NullMarkerDetector>();
    return std::make_unique<FiducialMarkerDetector>(cfg, std::move(detect_fn));
}

} // namespace guide

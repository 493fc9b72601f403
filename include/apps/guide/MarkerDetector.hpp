#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "os/rtos.hpp"
#include "apps/guide/IMarkerDetector.hpp"

namespace guide {

// ---------------------------------------------------------------------------
// Configuration for the FiducialMarkerDetector (tunable parameters, no state).
// ---------------------------------------------------------------------------
struct MarkerDetectorConfig {
    bool   ENABLED          = true;     // false selects the no-op detector
    msg::MarkerMode MODE    = msg::MarkerMode::WARN;

    double ROI_FRAC         = 0.60;     // centered ROI side as fraction of frame side
    int    ROI_MIN_PX       = 160;      // ROI side lower bound [pixels]
    int    DOWNSAMPLE_STEP  = 2;        // keep every Nth row/column of the ROI

    double EDGE_MARGIN_FRAC = 0.10;     // framing margin as fraction of frame size
};

// One marker as reported by the detection backend, in working-buffer pixels.
struct RawMarker {
    int64_t id = 0;
    std::vector<msg::Point2d> corners;  // detector order, normally 4
};

// Detection backend: runs on the downsampled GRAY8 working buffer.
// May throw; the detector treats a throw as zero detections.
using DetectFn = std::function<void(const uint8_t* data, int width, int height, int stride,
                                    std::vector<RawMarker>& out)>;

// Default backend: OpenCV ArucoDetector with the AprilTag 36h11 dictionary.
DetectFn makeAprilTagDetectFn();

// Operator-facing texts. Pure function of its four inputs.
struct MarkerTexts {
    std::string guidance;
    std::string display;
};

MarkerTexts buildMarkerTexts(std::size_t total_detections,
                             const std::vector<int64_t>& required_ids,
                             const std::vector<int64_t>& missing_ids,
                             bool framing_ok);

// ---------------------------------------------------------------------------
// NullMarkerDetector: detection disabled. Keeps the pipeline shape intact.
// ---------------------------------------------------------------------------
class NullMarkerDetector final : public IMarkerDetector {
public:
    NullMarkerDetector();

    void setMode(msg::MarkerMode) override {}
    msg::MarkerMode mode() const override { return msg::MarkerMode::OFF; }
    void setRequiredIds(const std::vector<int64_t>&) override {}
    void reset() override {}
    bool process(const msg::ImageFrame&) override { return false; }

    std::shared_ptr<const msg::MarkerStatus> latest() const override { return m_status; }
    msg::MarkerSessionSummary sessionSummary() const override { return {}; }

private:
    std::shared_ptr<const msg::MarkerStatus> m_status;
};

// ---------------------------------------------------------------------------
// FiducialMarkerDetector: center ROI -> downsample -> detect -> remap.
// process() is single-producer (analysis task). latest() is an atomic
// pointer swap, so readers never observe a partially built status.
// ---------------------------------------------------------------------------
class FiducialMarkerDetector final : public IMarkerDetector {
public:
    // detect_fn empty => OpenCV AprilTag backend.
    explicit FiducialMarkerDetector(const MarkerDetectorConfig& cfg = {}, DetectFn detect_fn = {});

    void setMode(msg::MarkerMode mode) override;
    msg::MarkerMode mode() const override { return m_mode.load(); }
    void setRequiredIds(const std::vector<int64_t>& ids) override;
    void reset() override;
    bool process(const msg::ImageFrame& img) override;

    std::shared_ptr<const msg::MarkerStatus> latest() const override;
    msg::MarkerSessionSummary sessionSummary() const override;

    enum class Status : uint8_t {
        OK = 0,
        DISABLED,           // mode OFF
        UNSUPPORTED_FORMAT,
        BAD_FRAME,
        DETECTOR_ERROR,     // backend threw; frame counted with zero detections
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status.load(); }

private:
    MarkerDetectorConfig m_cfg{};
    DetectFn m_detect;

    std::atomic<msg::MarkerMode> m_mode{msg::MarkerMode::WARN};

    // Guards the required list and the session tallies.
    mutable Rtos::Mutex m_lock;
    std::vector<int64_t> m_required;
    msg::MarkerSessionSummary m_session{};

    std::shared_ptr<const msg::MarkerStatus> m_latest;

    std::atomic<Status> m_status{Status::OK};

    // Processing-thread only
    bool   m_warned_format = false;
    bool   m_warned_detector = false;

    int m_roi_x = 0;
    int m_roi_y = 0;
    int m_roi_w = 0;
    int m_roi_h = 0;

    std::vector<uint8_t>   m_work;      // downsampled ROI, tightly packed
    int m_work_w = 0;
    int m_work_h = 0;
    std::vector<RawMarker> m_raw;

    void publish(const std::shared_ptr<const msg::MarkerStatus>& st);
    void detectorFailed(const char* what);
    std::shared_ptr<msg::MarkerStatus> baseStatus(const msg::ImageFrame& img, msg::MarkerMode mode) const;

    void defineROI(const msg::ImageFrame& img);
    void copyDownsampled(const msg::ImageFrame& img);
    void remap(const std::vector<RawMarker>& raw, std::vector<msg::TagDetection>& out) const;
};

std::unique_ptr<IMarkerDetector> makeMarkerDetector(const MarkerDetectorConfig& cfg,
                                                    DetectFn detect_fn = {});

} // namespace guide

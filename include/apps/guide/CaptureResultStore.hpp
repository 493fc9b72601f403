#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "os/rtos.hpp"

namespace guide {

// Per-frame camera metadata, as last reported by the camera collaborator.
struct CameraMetadata {
    std::optional<int32_t> iso;
    std::optional<int64_t> shutter_ns;
    std::optional<float>   focus_distance_diopters;   // 0 = infinity focus
};

// ---------------------------------------------------------------------------
// CaptureResultStore: latest-value store written by the camera callback
// thread and read by the analysis task / capture path.
// ---------------------------------------------------------------------------
class CaptureResultStore {
public:
    void publish(const CameraMetadata& md);

    void setIso(std::optional<int32_t> iso);
    void setShutterNs(std::optional<int64_t> shutter_ns);
    void setFocusDistance(std::optional<float> diopters);

    std::optional<float> latestFocusDistance() const;

    // Copy of all fields taken under one lock (never re-queries the camera).
    CameraMetadata snapshot() const;

private:
    mutable Rtos::Mutex m_lock;
    CameraMetadata m_latest{};
};

// "fd=—" when unknown, "fd=inf" at infinity focus, else "fd~25cm (4.00D)".
std::string formatFocusDistance(std::optional<float> diopters);

} // namespace guide

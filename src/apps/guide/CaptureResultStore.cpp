#include "apps/guide/CaptureResultStore.hpp"

#include <cmath>
#include <cstdio>

namespace guide {

void CaptureResultStore::publish(const CameraMetadata& md) {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    m_latest = md;
}

void CaptureResultStore::setIso(std::optional<int32_t> iso) {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    m_latest.iso = iso;
}

void CaptureResultStore::setShutterNs(std::optional<int64_t> shutter_ns) {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    m_latest.shutter_ns = shutter_ns;
}

void CaptureResultStore::setFocusDistance(std::optional<float> diopters) {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    m_latest.focus_distance_diopters = diopters;
}

std::optional<float> CaptureResultStore::latestFocusDistance() const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    return m_latest.focus_distance_diopters;
}

CameraMetadata CaptureResultStore::snapshot() const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    return m_latest;
}

std::string formatFocusDistance(std::optional<float> diopters) {
    if (!diopters) return "fd=—";
    if (*diopters <= 0.0f) return "fd=inf";

    const long cm = std::lround(100.0 / static_cast<double>(*diopters));
    char buf[64];
    std::snprintf(buf, sizeof(buf), "fd~%ldcm (%.2fD)", cm, static_cast<double>(*diopters));
    return std::string(buf);
}

} // namespace guide

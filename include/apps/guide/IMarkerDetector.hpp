#pragma once
#include <memory>
#include <vector>

#include "msg/ImageFrame.hpp"
#include "msg/MarkerStatus.hpp"

namespace guide {

// Capability surface shared by the disabled and the fiducial-backed detector.
// process() runs on the analysis task; everything else may be called from
// any thread.
class IMarkerDetector {
public:
    virtual ~IMarkerDetector() = default;

    virtual void setMode(msg::MarkerMode mode) = 0;
    virtual msg::MarkerMode mode() const = 0;

    // Order and duplicates are irrelevant; stored sorted and de-duplicated.
    virtual void setRequiredIds(const std::vector<int64_t>& ids) = 0;

    // Clear session tallies and the published status.
    virtual void reset() = 0;

    // Returns false when the frame produced no detection pass
    // (OFF mode, unsupported layout, invalid frame).
    virtual bool process(const msg::ImageFrame& img) = 0;

    // Never null. Immutable once returned.
    virtual std::shared_ptr<const msg::MarkerStatus> latest() const = 0;

    virtual msg::MarkerSessionSummary sessionSummary() const = 0;
};

} // namespace guide

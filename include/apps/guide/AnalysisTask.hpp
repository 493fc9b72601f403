#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "os/rtos.hpp"

#include "apps/guide/IMarkerDetector.hpp"
#include "apps/guide/MarkerDetector.hpp"
#include "apps/guide/QualityAnalyzer.hpp"

#include "msg/CaptureSnapshot.hpp"
#include "msg/ImageFrame.hpp"
#include "msg/MarkerStatus.hpp"
#include "msg/QualityResult.hpp"

namespace guide {

class CaptureResultStore;

struct AnalysisTaskConfig {
    uint32_t RECEIVE_TIMEOUT_MS = 50;                  // stop-flag poll period
    uint32_t MAX_FRAME_BYTES    = 4096u * 4096u;       // larger frames are refused
};

// A frame copied into task-owned storage. frame.data points into *pixels.
struct PendingFrame {
    std::shared_ptr<const std::vector<uint8_t>> pixels;
    msg::ImageFrame frame{};
};

// ------------------------------
// Queue types (keep them explicit and boring)
// ------------------------------
using LiveFrameQueue = Rtos::Queue<PendingFrame, 1>;   // freshest-wins

// Everything a capture event needs, copied at the instant of capture.
struct CaptureSnapshot {
    msg::FrozenMarkerSnapshot  markers;
    msg::FrozenQualitySnapshot quality;     // status UNKNOWN if nothing analyzed yet
    msg::MarkerSessionSummary  session;
};

// ---------------------------------------------------------------------------
//  AnalysisTask: runs QualityAnalyzer + marker detector on one worker thread.
//  Producers call Submit() (never blocks); the UI thread reads the latest
//  published results and calls freezeForCapture() on a capture event.
// ---------------------------------------------------------------------------
class AnalysisTask {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        AnalysisTask*   self    = nullptr;
        LiveFrameQueue* live_in = nullptr;
    };

public:
    AnalysisTask(const AnalysisTaskConfig& cfg,
                 const QualityAnalyzerConfig& qa_cfg,
                 const MarkerDetectorConfig& md_cfg,
                 const CaptureResultStore* store = nullptr,
                 DetectFn detect_fn = {});
    ~AnalysisTask();

    AnalysisTask(const AnalysisTask&) = delete;
    AnalysisTask& operator=(const AnalysisTask&) = delete;

    // OSAL-compatible entry point
    static void TaskEntry(void* arg);

    // Spawn the worker thread on the internal queue.
    bool Start();

    // Request graceful stop (thread-safe).
    void RequestStop() { m_stop_requested.store(true); }
    bool StopRequested() const { return m_stop_requested.load(); }
    void Join();

    // Copy the frame and offer it to the worker. Never blocks; an unprocessed
    // older frame is dropped. False if the frame was refused.
    bool Submit(const msg::ImageFrame& frame);

    // Run both analyzers on the calling thread. Only for use when the worker
    // is not running (tests, offline tools).
    bool ProcessFrame(const msg::ImageFrame& frame);

    std::shared_ptr<const msg::QualityResult> latestQuality() const;
    std::shared_ptr<const msg::MarkerStatus>  latestMarkers() const;

    CaptureSnapshot freezeForCapture() const;

    IMarkerDetector& markerDetector() { return *m_md; }
    const IMarkerDetector& markerDetector() const { return *m_md; }

    uint64_t framesAnalyzed() const { return m_frames_analyzed.load(); }
    uint64_t framesSubmitted() const { return m_frames_submitted.load(); }

    enum class Status : uint8_t {
        OK = 0,
        START_FAIL,
        FRAME_REFUSED,
        QUEUE_FULL,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status.load(); }

private:
    // Main run loop. Intended to be called only by the analysis thread.
    void Run(LiveFrameQueue& live_in);

private:
    AnalysisTaskConfig m_cfg{};

    QualityAnalyzer                  m_qa;
    std::unique_ptr<IMarkerDetector> m_md;

    std::shared_ptr<const msg::QualityResult> m_latest_quality;

    LiveFrameQueue m_live_q{/*overwrite=*/true};
    TaskCtx        m_ctx{};
    Rtos::Task     m_task;

    std::atomic<bool>     m_stop_requested{false};
    std::atomic<uint64_t> m_frames_analyzed{0};
    std::atomic<uint64_t> m_frames_submitted{0};
    std::atomic<Status>   m_status{Status::OK};
};

} // namespace guide

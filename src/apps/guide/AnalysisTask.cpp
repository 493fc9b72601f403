#include "apps/guide/AnalysisTask.hpp"
#include "apps/guide/GuidanceCommon.hpp"

#include <cstring> // memcpy
#include <iostream>
#include <utility>

namespace guide {

static inline AnalysisTaskConfig sanitise(const AnalysisTaskConfig& in) {
    AnalysisTaskConfig cfg = in;
    if (cfg.RECEIVE_TIMEOUT_MS == 0) cfg.RECEIVE_TIMEOUT_MS = 50;
    if (cfg.RECEIVE_TIMEOUT_MS == Rtos::MAX_TIMEOUT) cfg.RECEIVE_TIMEOUT_MS = 1000; // must wake to see stop
    if (cfg.MAX_FRAME_BYTES == 0) cfg.MAX_FRAME_BYTES = 4096u * 4096u;
    return cfg;
}

AnalysisTask::AnalysisTask(const AnalysisTaskConfig& cfg,
                           const QualityAnalyzerConfig& qa_cfg,
                           const MarkerDetectorConfig& md_cfg,
                           const CaptureResultStore* store,
                           DetectFn detect_fn)
: m_cfg(sanitise(cfg))
, m_qa(qa_cfg, store)
, m_md(makeMarkerDetector(md_cfg, std::move(detect_fn))) {
    m_ctx.self    = this;
    m_ctx.live_in = &m_live_q;
}

AnalysisTask::~AnalysisTask() {
    RequestStop();
    m_task.Join();
}

void AnalysisTask::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);

    if (!ctx || !ctx->self || !ctx->live_in) {
        return; // invalid context
    }

    ctx->self->Run(*ctx->live_in);
}

bool AnalysisTask::Start() {
    m_stop_requested.store(false);
    if (!m_task.Create("Analysis", &AnalysisTask::TaskEntry, &m_ctx)) {
        m_status.store(Status::START_FAIL);
        std::cerr << "[AT] Failed to start analysis task\n";
        return false;
    }
    std::cout << "[AT] Analysis task started\n";
    return true;
}

void AnalysisTask::Join() {
    m_task.Join();
}

void AnalysisTask::Run(LiveFrameQueue& live_in) {
    // Block (bounded) for the newest frame; the timeout only exists so a
    // stop request is noticed on an idle queue.
    while (!StopRequested()) {
        PendingFrame pf{};
        if (!live_in.receive(pf, m_cfg.RECEIVE_TIMEOUT_MS)) {
            continue;
        }
        (void)ProcessFrame(pf.frame);
    }
    std::cout << "[AT] Analysis task stopped after " << m_frames_analyzed.load() << " frames\n";
}

bool AnalysisTask::Submit(const msg::ImageFrame& frame) {
    const uint64_t bytes = static_cast<uint64_t>(frame.stride) * frame.height;
    if (!frame.data || bytes == 0 || bytes > m_cfg.MAX_FRAME_BYTES) {
        m_status.store(Status::FRAME_REFUSED);
        return false;
    }

    auto pixels = std::make_shared<std::vector<uint8_t>>(static_cast<std::size_t>(bytes));
    std::memcpy(pixels->data(), frame.data, static_cast<std::size_t>(bytes));

    PendingFrame pf;
    pf.frame = frame;
    pf.frame.data = pixels->data();
    pf.pixels = std::move(pixels);

    if (!m_live_q.try_send(pf)) {
        m_status.store(Status::QUEUE_FULL);
        return false;
    }
    m_frames_submitted.fetch_add(1);
    return true;
}

bool AnalysisTask::ProcessFrame(const msg::ImageFrame& frame) {
    // ---- Quality (self-throttled) ----
    msg::QualityResult q{};
    const bool ok_q = m_qa.analyze(frame, q);
    if (ok_q) {
        std::atomic_store(&m_latest_quality, std::shared_ptr<const msg::QualityResult>(
                                                  std::make_shared<msg::QualityResult>(q)));
    }

    // ---- Markers (publishes on its own) ----
    const bool ok_md = m_md->process(frame);

    m_frames_analyzed.fetch_add(1);
    return ok_q || ok_md;
}

std::shared_ptr<const msg::QualityResult> AnalysisTask::latestQuality() const {
    return std::atomic_load(&m_latest_quality);
}

std::shared_ptr<const msg::MarkerStatus> AnalysisTask::latestMarkers() const {
    return m_md->latest();
}

CaptureSnapshot AnalysisTask::freezeForCapture() const {
    CaptureSnapshot snap;

    const auto markers = m_md->latest();
    if (markers) snap.markers = freezeMarkerStatus(*markers);

    const auto quality = latestQuality();
    if (quality) snap.quality = freezeQualityResult(*quality);

    snap.session = m_md->sessionSummary();
    return snap;
}

const char* AnalysisTask::StatusStr(AnalysisTask::Status s) {
    switch (s) {
        case AnalysisTask::Status::OK:            return "OK";
        case AnalysisTask::Status::START_FAIL:    return "START_FAIL";
        case AnalysisTask::Status::FRAME_REFUSED: return "FRAME_REFUSED";
        case AnalysisTask::Status::QUEUE_FULL:    return "QUEUE_FULL";
        default:                                  return "UNKNOWN";
    }
}

} // namespace guide

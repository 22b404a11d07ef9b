// ScanTask.cpp
#include "apps/scan/ScanTask.hpp"

#include <exception>
#include <iostream>
#include <string>

namespace scan {

static inline ScanTaskConfig sanitise(const ScanTaskConfig& in) {
    ScanTaskConfig cfg = in;
    if (cfg.receive_timeout_ms == 0) cfg.receive_timeout_ms = 1;
    return cfg;
}

ScanTask::ScanTask(const ScanTaskConfig& cfg)
: m_cfg(sanitise(cfg))
, m_pipeline(m_cfg.pipeline) {
}

void ScanTask::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);

    if (!ctx || !ctx->self || !ctx->live_in || !ctx->release_out) {
        return;
    }

    ctx->self->Run(*ctx->live_in, *ctx->release_out,
                   ctx->overlay_out, ctx->det_out, ctx->detector);
}

void ScanTask::Pause() {
    m_paused.store(true);
    m_reset_pending.store(true);
}

void ScanTask::Resume() {
    m_paused.store(false);
    m_reset_pending.store(true);
}

void ScanTask::Run(platform::LiveFrameQueue& live_in, platform::ReleaseFrameQueue& release_out,
                   OverlayQueue* overlay_out, DetectionQueue* det_out,
                   platform::IDetector* detector) {

    //  - wait (bounded) for the newest frame from the source
    //  - prepare -> overlay -> detect
    //  - always hand the frame back to the source (blocking send)
    while (!StopRequested()) {

        msg::RawFrame frame{};
        const bool got = live_in.receive(frame, m_cfg.receive_timeout_ms);

        // Pause/Resume issued before this frame arrived apply to it.
        applyLifecycle(overlay_out);

        if (!got) continue;
        m_received.fetch_add(1);

        if (m_paused.load()) {
            m_dropped_paused.fetch_add(1);
        } else {
            handleFrame(frame, overlay_out, det_out, detector);
        }

        // Critical: do this on every path, the source owns the buffer.
        if (!release_out.send(frame, Rtos::MAX_TIMEOUT)) {
            m_status.store(Status::RELEASE_FAILED);
            std::cerr << "[SCAN] release failed id=" << frame.frame_id << "\n";
        }
    }

    // Every frame taken from live_in was released in its own iteration.
    applyLifecycle(overlay_out);
}

// -------------------- private helpers --------------------

void ScanTask::applyLifecycle(OverlayQueue* overlay_out) {
    if (!m_reset_pending.exchange(false)) return;

    m_pipeline.reset();

    // A shown rect is hidden on Pause and on Resume alike; a Pause/Resume
    // pair merged into one reset must still clear it.
    publishOverlay(overlay_out, m_mapper.reset());
}

void ScanTask::handleFrame(const msg::RawFrame& frame, OverlayQueue* overlay_out,
                           DetectionQueue* det_out, platform::IDetector* detector) {
    msg::PreparedFrame prepared{};
    if (!m_pipeline.process(frame, prepared)) {
        const FramePipeline::Status s = m_pipeline.lastStatus();
        if (s != FramePipeline::Status::BUSY && s != FramePipeline::Status::THROTTLED) {
            std::cerr << "[SCAN] frame " << frame.frame_id << " dropped: "
                      << FramePipeline::StatusStr(s) << "\n";
        }
        return;
    }
    m_prepared.fetch_add(1);

    const int32_t rotation = m_cfg.rotation_deg ? *m_cfg.rotation_deg : frame.rotation_deg;

    // ---- Overlay ----
    const msg::OverlayUpdate u = m_mapper.update(prepared, rotation);
    publishOverlay(overlay_out, u);

    // ---- Detection ----
    if (detector) {
        runDetector(*detector, prepared, rotation, det_out);
    }
}

void ScanTask::runDetector(platform::IDetector& detector, const msg::PreparedFrame& prepared,
                           int32_t rotation_deg, DetectionQueue* det_out) {
    msg::DetectionBatch batch{};
    batch.frame_id      = prepared.frame_id;
    batch.t_capture_us  = prepared.t_capture_us;
    batch.crop_rect     = prepared.crop_rect;
    batch.original_size = prepared.original_size;

    bool ok = false;
    try {
        ok = detector.detect(prepared, rotation_deg, batch.results);
    } catch (const std::exception& e) {
        std::cerr << "[SCAN] detector threw on frame " << prepared.frame_id
                  << ": " << e.what() << "\n";
        ok = false;
    }

    if (!ok) {
        m_detector_failures.fetch_add(1);
        m_status.store(Status::DETECT_FAILED);
        return;
    }
    m_status.store(Status::OK);
    m_detections.fetch_add(static_cast<uint32_t>(batch.results.size()));

    std::string joined;
    for (const msg::DetectionResult& r : batch.results) {
        if (r.raw_value.empty()) continue;
        if (!joined.empty()) joined += ", ";
        joined += r.raw_value;
    }
    if (!joined.empty()) {
        std::cout << "[SCAN] frame " << prepared.frame_id << " decoded: " << joined << "\n";
    }

    if (det_out) (void)det_out->try_send(batch);
}

void ScanTask::publishOverlay(OverlayQueue* overlay_out, const msg::OverlayUpdate& u) {
    if (u.action == msg::OverlayAction::UNCHANGED) return;
    m_overlay_updates.fetch_add(1);
    if (overlay_out) (void)overlay_out->try_send(u);
}

ScanTask::Counters ScanTask::counters() const {
    Counters c{};
    c.received          = m_received.load();
    c.prepared          = m_prepared.load();
    c.dropped_paused    = m_dropped_paused.load();
    c.overlay_updates   = m_overlay_updates.load();
    c.detections        = m_detections.load();
    c.detector_failures = m_detector_failures.load();
    return c;
}

// FDIR

const char* ScanTask::StatusStr(ScanTask::Status s) {
    switch (s) {
        case ScanTask::Status::OK:             return "OK";
        case ScanTask::Status::DETECT_FAILED:  return "DETECT_FAILED";
        case ScanTask::Status::RELEASE_FAILED: return "RELEASE_FAILED";
        default:                               return "UNKNOWN";
    }
}

} // namespace scan

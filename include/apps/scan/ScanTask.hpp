#pragma once
#include <atomic>
#include <cstdint>
#include <optional>

#include "os/rtos.hpp"

#include "platform/IFrameSource.hpp"   // LiveFrameQueue / ReleaseFrameQueue
#include "platform/IDetector.hpp"

#include "apps/scan/FramePipeline.hpp"
#include "apps/scan/RotationMapper.hpp"

#include "msg/OverlayUpdate.hpp"
#include "msg/Detection.hpp"

namespace scan {

// ------------------------------
// Queue types (keep them explicit and boring)
// ------------------------------
using OverlayQueue   = Rtos::Queue<msg::OverlayUpdate, 1>;   // freshest-wins
using DetectionQueue = Rtos::Queue<msg::DetectionBatch, 1>;  // freshest-wins

// ------------------------------
// Config
// ------------------------------
struct ScanTaskConfig {
    FramePipelineConfig pipeline{};

    // Fixed rotation for detector and overlay [deg]. When unset, each
    // frame's own rotation_deg (stamped by the source) is used.
    std::optional<int32_t> rotation_deg{};

    // Upper bound on how long the loop waits for a frame before
    // re-checking stop/pause requests [ms].
    uint32_t receive_timeout_ms = 100;
};

// ---------------------------------------------------------------------------
//  ScanTask
// ---------------------------------------------------------------------------
class ScanTask {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        ScanTask* self = nullptr;

        platform::LiveFrameQueue*    live_in     = nullptr;   // source -> scan (freshest-wins)
        platform::ReleaseFrameQueue* release_out = nullptr;   // scan -> source (must not drop)

        // Optional taps / collaborators
        OverlayQueue*        overlay_out = nullptr;
        DetectionQueue*      det_out     = nullptr;
        platform::IDetector* detector    = nullptr;
    };

    enum class Status : uint8_t {
        OK = 0,
        DETECT_FAILED,     // detector returned false or threw
        RELEASE_FAILED,    // release queue refused a frame (should not happen)
    };

    struct Counters {
        uint32_t received          = 0;
        uint32_t prepared          = 0;
        uint32_t dropped_paused    = 0;
        uint32_t overlay_updates   = 0;
        uint32_t detections        = 0;
        uint32_t detector_failures = 0;
    };

public:
    explicit ScanTask(const ScanTaskConfig& cfg = {});

    // OSAL-compatible entry point
    static void TaskEntry(void* arg);

    // Request graceful stop (thread-safe).
    void RequestStop() { m_stop_requested.store(true); }
    bool StopRequested() const { return m_stop_requested.load(); }

    // Lifecycle (thread-safe, applied at the next frame boundary).
    // Both restart the frame sequence and hide a shown overlay;
    // Pause() additionally hands frames straight back.
    void Pause();
    void Resume();
    bool Paused() const { return m_paused.load(); }

    const ScanTaskConfig& getConfig() const { return m_cfg; }
    const FramePipeline& pipeline() const { return m_pipeline; }

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status.load(); }

    Counters counters() const;

private:
    // Main run loop. Intended to be called only by the scan thread.
    void Run(platform::LiveFrameQueue& live_in, platform::ReleaseFrameQueue& release_out,
             OverlayQueue* overlay_out, DetectionQueue* det_out,
             platform::IDetector* detector);

    void applyLifecycle(OverlayQueue* overlay_out);

    void handleFrame(const msg::RawFrame& frame, OverlayQueue* overlay_out,
                     DetectionQueue* det_out, platform::IDetector* detector);

    void runDetector(platform::IDetector& detector, const msg::PreparedFrame& prepared,
                     int32_t rotation_deg, DetectionQueue* det_out);

    void publishOverlay(OverlayQueue* overlay_out, const msg::OverlayUpdate& u);

private:
    ScanTaskConfig m_cfg{};

    FramePipeline  m_pipeline;
    RotationMapper m_mapper;     // scan thread only

    std::atomic<bool> m_stop_requested{false};
    std::atomic<bool> m_paused{false};
    std::atomic<bool> m_reset_pending{false};

    // FDIR
    std::atomic<Status> m_status{Status::OK};

    std::atomic<uint32_t> m_received{0};
    std::atomic<uint32_t> m_prepared{0};
    std::atomic<uint32_t> m_dropped_paused{0};
    std::atomic<uint32_t> m_overlay_updates{0};
    std::atomic<uint32_t> m_detections{0};
    std::atomic<uint32_t> m_detector_failures{0};
};

} // namespace scan

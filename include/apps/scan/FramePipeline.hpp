#pragma once
#include <atomic>
#include <cstdint>
#include <optional>

#include "msg/RawFrame.hpp"
#include "msg/PreparedFrame.hpp"

#include "apps/scan/FrameGate.hpp"
#include "apps/scan/ConversionWorker.hpp"
#include "apps/scan/RoiCropper.hpp"

namespace scan {

// ------------------------------
// Config
// ------------------------------
struct FramePipelineConfig {
    // Run preparation on frames 0, N, 2N, ... of the non-busy stream.
    uint32_t process_every_nth_frame = 3;

    // Side of the centered square ROI handed to the detector [pixels].
    // nullopt (or 0) hands over the full frame.
    std::optional<uint32_t> roi_side_px = 600;
};

// ---------------------------------------------------------------------------
// FramePipeline: RawFrame -> PreparedFrame.
//
//   FrameGate -> (YUV420 planar) ConversionWorker -> RoiCropper
//             -> (packed BGRA)   copy            -> RoiCropper
//
// process() may be called from any thread; concurrent calls while a frame
// is in flight are refused by the gate (Status::BUSY), never queued.
//
// NV21 output always has even sides: a planar frame with an odd width or
// height loses its last column or row before conversion.
// ---------------------------------------------------------------------------
class FramePipeline {
public:
    enum class Status : uint8_t {
        OK = 0,

        // SKIPS (normal operation)
        BUSY,
        THROTTLED,

        // FRAME FAULTS (frame dropped, stream continues)
        MALFORMED_PLANES,
        UNSUPPORTED_LAYOUT,
        CONVERT_FAIL,
        PREPARE_FAIL,

        // SETUP FAULTS
        WORKER_UNAVAILABLE,
    };

    struct Counters {
        uint32_t accepted  = 0;
        uint32_t busy      = 0;
        uint32_t throttled = 0;
        uint32_t faulted   = 0;
        uint32_t truncated = 0;   // conversions that stopped early on short planes
    };

public:
    explicit FramePipeline(const FramePipelineConfig& cfg = {});
    ~FramePipeline();

    FramePipeline(const FramePipeline&) = delete;
    FramePipeline& operator=(const FramePipeline&) = delete;

    // Core API: true and 'out' filled if the frame was accepted and
    // prepared; false means "skip this frame" (see lastStatus()).
    // 'frame' is only read during the call.
    bool process(const msg::RawFrame& frame, msg::PreparedFrame& out);

    // Stream restart: next frame is treated as frame 0. Does not abort a
    // frame currently in flight.
    void reset();

    const FramePipelineConfig& getConfig() const { return m_cfg; }

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status.load(); }

    Counters counters() const;

private:
    bool preparePlanar(const msg::RawFrame& frame, msg::PreparedFrame& out);
    bool preparePacked(const msg::RawFrame& frame, msg::PreparedFrame& out);

    static void fillFullFrameGeometry(const msg::RawFrame& frame, msg::PreparedFrame& out);

    bool fail(Status s);

    FramePipelineConfig m_cfg{};

    FrameGate        m_gate;
    ConversionWorker m_worker;
    RoiCropper       m_cropper;

    // FDIR
    std::atomic<Status> m_status{Status::OK};

    std::atomic<uint32_t> m_accepted{0};
    std::atomic<uint32_t> m_busy{0};
    std::atomic<uint32_t> m_throttled{0};
    std::atomic<uint32_t> m_faulted{0};
    std::atomic<uint32_t> m_truncated{0};
};

} // namespace scan

#pragma once
#include <cstdint>
#include <cstddef>

#include "platform/IFrameSource.hpp"

namespace platform {

static constexpr uint32_t V4L2SRC_MAX_BUFS = 16;

struct V4l2SourceConfig {
    const char* dev = "/dev/video0";

    // Requested size; the driver may round it.
    uint32_t width  = 1280;
    uint32_t height = 720;

    // fourcc, kept as uint32_t so callers need no linux headers.
    // V4L2_PIX_FMT_YUV420 (YU12, the default when 0) or
    // V4L2_PIX_FMT_ABGR32 / V4L2_PIX_FMT_XBGR32 (B,G,R,A byte order).
    uint32_t v4l2_pixfmt = 0;

    // MMAP buffers requested with VIDIOC_REQBUFS, clamped to [2, V4L2SRC_MAX_BUFS].
    uint32_t buffer_count = 4;

    int32_t sensor_orientation_deg = 90;
};

// ------------------------------
// V4l2FrameSource: single-planar V4L2 capture with mmapped buffers.
// Dequeued frames view the driver's buffer directly; the buffer goes back
// to the driver on Release(). Format negotiation and streaming only, no
// sensor controls. All ioctls come from the source task.
// ------------------------------
class V4l2FrameSource : public IFrameSource {
public:
    explicit V4l2FrameSource(const V4l2SourceConfig& cfg);
    ~V4l2FrameSource() override;

    // Open, negotiate, map, queue, stream on. Anything partially set up is
    // torn down again on failure.
    bool Start() override;

    // Safe after a failed or partial Start().
    void Stop() override;

    bool IsRunning() const override { return m_running; }

    bool Dequeue(msg::RawFrame& out) override;
    bool Release(const msg::RawFrame& frame) override;

    int32_t SensorOrientation() const override { return m_cfg.sensor_orientation_deg; }

    uint32_t negotiatedWidth()  const { return m_width; }
    uint32_t negotiatedHeight() const { return m_height; }
    uint32_t negotiatedStride() const { return m_stride; }

    enum class Status : uint8_t {
        OK = 0,

        // errno is recorded for these
        OPEN_FAIL,
        QUERYCAP_FAIL,
        SETFMT_FAIL,
        REQBUFS_FAIL,
        QUERYBUF_FAIL,
        MMAP_FAIL,
        QBUF_FAIL,
        STREAMON_FAIL,
        DQBUF_FAIL,

        NOT_RUNNING,
        BAD_BUFF_INDEX,
        UNSUPPORTED_CAPS,
        UNSUPPORTED_FORMAT,
        SHORT_BUFFER,       // bytesused too small for the negotiated layout
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }
    int    lastErrno()  const { return m_errno; }

private:
    struct MappedBuffer {
        uint8_t* ptr = nullptr;
        uint32_t len = 0;
    };

    bool openDevice();
    bool queryCaps();
    bool setAndVerifyFormat();
    bool requestAndMapBuffers();
    bool queueAllBuffers();
    bool streamOn();
    void streamOff();
    void unmapBuffers();
    void closeDevice();

    bool queueBuffer(uint32_t index);

    // Point out's planes into one mapped buffer holding 'used' valid bytes.
    bool describePlanes(const MappedBuffer& buf, uint32_t used, msg::RawFrame& out) const;

    bool fail(Status s);

    V4l2SourceConfig m_cfg{};
    int m_fd = -1;

    // Read back from VIDIOC_G_FMT
    uint32_t m_width  = 0;
    uint32_t m_height = 0;
    uint32_t m_stride = 0;        // bytesperline of the luma / packed plane
    msg::PixelLayout m_layout = msg::PixelLayout::UNKNOWN;

    MappedBuffer m_bufs[V4L2SRC_MAX_BUFS]{};
    uint32_t m_buf_count = 0;

    uint32_t m_frame_id = 0;
    bool m_running = false;

    // FDIR
    Status m_status = Status::OK;
    int    m_errno  = 0;
};

} // namespace platform

// V4l2FrameSource.cpp
#include "platform/linux/V4l2FrameSource.hpp"

#include <linux/videodev2.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <errno.h>

#include <chrono>

namespace {

// ioctl() restarted on EINTR.
static int ioctl_retry(int fd, unsigned long req, void* arg) {
    for (;;) {
        const int r = ::ioctl(fd, req, arg);
        if (r != -1 || errno != EINTR) return r;
    }
}

static uint64_t now_us() {
    using clock = std::chrono::steady_clock;
    return (uint64_t)std::chrono::duration_cast<std::chrono::microseconds>(
        clock::now().time_since_epoch()).count();
}

static v4l2_buffer mmapBuffer(uint32_t index) {
    v4l2_buffer b{};
    b.type   = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    b.memory = V4L2_MEMORY_MMAP;
    b.index  = index;
    return b;
}

static msg::PixelLayout layoutOf(uint32_t fourcc) {
    switch (fourcc) {
        case V4L2_PIX_FMT_YUV420: return msg::PixelLayout::YUV420_PLANAR;
        case V4L2_PIX_FMT_ABGR32:
        case V4L2_PIX_FMT_XBGR32: return msg::PixelLayout::PACKED_BGRA;
        default:                  return msg::PixelLayout::UNKNOWN;
    }
}

} // anonymous namespace

namespace platform {

static inline V4l2SourceConfig sanitise(const V4l2SourceConfig& in) {
    V4l2SourceConfig cfg = in;
    if (!cfg.dev) cfg.dev = "/dev/video0";
    if (cfg.width == 0 || cfg.height == 0) {
        cfg.width  = 1280;
        cfg.height = 720;
    }
    if (cfg.v4l2_pixfmt == 0) cfg.v4l2_pixfmt = V4L2_PIX_FMT_YUV420;
    if (cfg.buffer_count < 2) cfg.buffer_count = 2;
    if (cfg.buffer_count > V4L2SRC_MAX_BUFS) cfg.buffer_count = V4L2SRC_MAX_BUFS;
    return cfg;
}

V4l2FrameSource::V4l2FrameSource(const V4l2SourceConfig& cfg)
: m_cfg(sanitise(cfg)) {
}

V4l2FrameSource::~V4l2FrameSource() {
    Stop();
}

bool V4l2FrameSource::Start() {
    if (m_running) return true;

    m_status = Status::OK;
    m_errno  = 0;

    if (layoutOf(m_cfg.v4l2_pixfmt) == msg::PixelLayout::UNKNOWN) {
        return fail(Status::UNSUPPORTED_FORMAT);
    }
    if (!openDevice()) return false;

    // Each step records its own status; undo everything on the first failure.
    const bool up = queryCaps() &&
                    setAndVerifyFormat() &&
                    requestAndMapBuffers() &&
                    queueAllBuffers() &&
                    streamOn();
    if (!up) {
        Stop();
        return false;
    }

    m_frame_id = 0;
    return true;
}

void V4l2FrameSource::Stop() {
    if (m_running) {
        streamOff();
        m_running = false;
    }
    unmapBuffers();
    closeDevice();
}

bool V4l2FrameSource::Dequeue(msg::RawFrame& out) {
    if (!m_running) return fail(Status::NOT_RUNNING);

    v4l2_buffer buf = mmapBuffer(0);
    if (ioctl_retry(m_fd, VIDIOC_DQBUF, &buf) == -1) return fail(Status::DQBUF_FAIL);
    if (buf.index >= m_buf_count) return fail(Status::BAD_BUFF_INDEX);

    out = msg::RawFrame{};
    out.buffer_index = static_cast<uint16_t>(buf.index);

    const MappedBuffer& mb = m_bufs[buf.index];
    if (!describePlanes(mb, buf.bytesused ? buf.bytesused : mb.len, out)) {
        // Unusable frame: give the buffer straight back to the driver.
        (void)queueBuffer(buf.index);
        return fail(Status::SHORT_BUFFER);
    }

    out.width        = m_width;
    out.height       = m_height;
    out.layout       = m_layout;
    out.rotation_deg = m_cfg.sensor_orientation_deg;
    out.t_capture_us = now_us();       // at DQBUF, not the driver timestamp
    out.frame_id     = m_frame_id++;
    return true;
}

bool V4l2FrameSource::Release(const msg::RawFrame& frame) {
    if (!m_running) return fail(Status::NOT_RUNNING);
    return queueBuffer(frame.buffer_index);
}

// -------------------- private helpers --------------------

bool V4l2FrameSource::queueBuffer(uint32_t index) {
    if (index >= m_buf_count) return fail(Status::BAD_BUFF_INDEX);
    v4l2_buffer buf = mmapBuffer(index);
    if (ioctl_retry(m_fd, VIDIOC_QBUF, &buf) == -1) return fail(Status::QBUF_FAIL);
    return true;
}

bool V4l2FrameSource::describePlanes(const MappedBuffer& buf, uint32_t used, msg::RawFrame& out) const {
    const std::size_t avail = used < buf.len ? used : buf.len;

    if (m_layout == msg::PixelLayout::PACKED_BGRA) {
        if (avail < std::size_t(m_stride) * m_height) return false;
        msg::Plane& p = out.planes[0];
        p.data         = buf.ptr;
        p.size_bytes   = avail;
        p.row_stride   = m_stride;
        p.pixel_stride = 4;
        out.plane_count = 1;
        return true;
    }

    // YU12: full Y plane, then U, then V, back to back. Chroma rows use
    // half the luma stride.
    const uint32_t c_stride = m_stride / 2;
    const uint32_t c_width  = (m_width + 1) / 2;
    const uint32_t c_height = (m_height + 1) / 2;
    const std::size_t y_bytes = std::size_t(m_stride) * m_height;
    const std::size_t c_bytes = std::size_t(c_stride) * c_height;
    if (avail < y_bytes + 2 * c_bytes) return false;

    out.planes[msg::PLANE_Y].data       = buf.ptr;
    out.planes[msg::PLANE_Y].size_bytes = y_bytes;
    out.planes[msg::PLANE_Y].row_stride = m_stride;

    const uint8_t* chroma = buf.ptr + y_bytes;
    for (uint8_t i : {msg::PLANE_U, msg::PLANE_V}) {
        msg::Plane& c = out.planes[i];
        c.data       = chroma;
        c.size_bytes = c_bytes;
        c.row_stride = c_stride;
        c.width      = c_width;
        c.height     = c_height;
        chroma += c_bytes;
    }

    out.plane_count = 3;
    return true;
}

bool V4l2FrameSource::openDevice() {
    m_fd = ::open(m_cfg.dev, O_RDWR | O_CLOEXEC);
    return m_fd >= 0 ? true : fail(Status::OPEN_FAIL);
}

bool V4l2FrameSource::queryCaps() {
    v4l2_capability cap{};
    if (ioctl_retry(m_fd, VIDIOC_QUERYCAP, &cap) == -1) return fail(Status::QUERYCAP_FAIL);

    const uint32_t need = V4L2_CAP_VIDEO_CAPTURE | V4L2_CAP_STREAMING;
    if ((cap.capabilities & need) != need) return fail(Status::UNSUPPORTED_CAPS);
    return true;
}

bool V4l2FrameSource::setAndVerifyFormat() {
    v4l2_format fmt{};
    fmt.type                = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    fmt.fmt.pix.width       = m_cfg.width;
    fmt.fmt.pix.height      = m_cfg.height;
    fmt.fmt.pix.pixelformat = m_cfg.v4l2_pixfmt;
    fmt.fmt.pix.field       = V4L2_FIELD_NONE;

    if (ioctl_retry(m_fd, VIDIOC_S_FMT, &fmt) == -1 ||
        ioctl_retry(m_fd, VIDIOC_G_FMT, &fmt) == -1) {
        return fail(Status::SETFMT_FAIL);
    }

    // Size may be rounded, the fourcc may not change.
    if (fmt.fmt.pix.pixelformat != m_cfg.v4l2_pixfmt) return fail(Status::UNSUPPORTED_FORMAT);

    m_width  = fmt.fmt.pix.width;
    m_height = fmt.fmt.pix.height;
    m_stride = fmt.fmt.pix.bytesperline;
    m_layout = layoutOf(fmt.fmt.pix.pixelformat);

    const uint32_t row_bytes = (m_layout == msg::PixelLayout::PACKED_BGRA) ? m_width * 4 : m_width;
    if (m_width == 0 || m_height == 0 || m_stride < row_bytes) {
        // Not an ioctl error, so no errno worth keeping.
        errno = 0;
        return fail(Status::SETFMT_FAIL);
    }
    return true;
}

bool V4l2FrameSource::requestAndMapBuffers() {
    v4l2_requestbuffers req{};
    req.count  = m_cfg.buffer_count;
    req.type   = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    req.memory = V4L2_MEMORY_MMAP;

    if (ioctl_retry(m_fd, VIDIOC_REQBUFS, &req) == -1 || req.count < 2) {
        return fail(Status::REQBUFS_FAIL);
    }
    m_buf_count = req.count < V4L2SRC_MAX_BUFS ? req.count : V4L2SRC_MAX_BUFS;

    for (uint32_t i = 0; i < m_buf_count; ++i) {
        v4l2_buffer buf = mmapBuffer(i);
        if (ioctl_retry(m_fd, VIDIOC_QUERYBUF, &buf) == -1) return fail(Status::QUERYBUF_FAIL);

        void* p = ::mmap(nullptr, buf.length, PROT_READ | PROT_WRITE, MAP_SHARED, m_fd, buf.m.offset);
        if (p == MAP_FAILED) return fail(Status::MMAP_FAIL);

        m_bufs[i] = MappedBuffer{static_cast<uint8_t*>(p), buf.length};
    }
    return true;
}

bool V4l2FrameSource::queueAllBuffers() {
    for (uint32_t i = 0; i < m_buf_count; ++i) {
        if (!queueBuffer(i)) return false;
    }
    return true;
}

bool V4l2FrameSource::streamOn() {
    int type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    if (ioctl_retry(m_fd, VIDIOC_STREAMON, &type) == -1) return fail(Status::STREAMON_FAIL);
    m_running = true;
    return true;
}

void V4l2FrameSource::streamOff() {
    int type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    (void)ioctl_retry(m_fd, VIDIOC_STREAMOFF, &type);
}

void V4l2FrameSource::unmapBuffers() {
    for (uint32_t i = 0; i < m_buf_count; ++i) {
        if (m_bufs[i].ptr) ::munmap(m_bufs[i].ptr, m_bufs[i].len);
        m_bufs[i] = MappedBuffer{};
    }
    m_buf_count = 0;
}

void V4l2FrameSource::closeDevice() {
    if (m_fd < 0) return;
    ::close(m_fd);
    m_fd = -1;
}

// FDIR

bool V4l2FrameSource::fail(Status s) {
    m_status = s;
    // Syscall statuses sit between OPEN_FAIL and DQBUF_FAIL.
    const bool syscall = s >= Status::OPEN_FAIL && s <= Status::DQBUF_FAIL;
    m_errno = syscall ? errno : 0;
    return false;
}

const char* V4l2FrameSource::StatusStr(Status s) {
    switch (s) {
        case Status::OK:                 return "OK";
        case Status::OPEN_FAIL:          return "OPEN_FAIL";
        case Status::QUERYCAP_FAIL:      return "QUERYCAP_FAIL";
        case Status::SETFMT_FAIL:        return "SETFMT_FAIL";
        case Status::REQBUFS_FAIL:       return "REQBUFS_FAIL";
        case Status::QUERYBUF_FAIL:      return "QUERYBUF_FAIL";
        case Status::MMAP_FAIL:          return "MMAP_FAIL";
        case Status::QBUF_FAIL:          return "QBUF_FAIL";
        case Status::STREAMON_FAIL:      return "STREAMON_FAIL";
        case Status::DQBUF_FAIL:         return "DQBUF_FAIL";
        case Status::NOT_RUNNING:        return "NOT_RUNNING";
        case Status::BAD_BUFF_INDEX:     return "BAD_BUFF_INDEX";
        case Status::UNSUPPORTED_CAPS:   return "UNSUPPORTED_CAPS";
        case Status::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
        case Status::SHORT_BUFFER:       return "SHORT_BUFFER";
    }
    return "UNKNOWN";
}

} // namespace platform

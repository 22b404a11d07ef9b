// FramePipeline.cpp
#include "apps/scan/FramePipeline.hpp"

#include <algorithm>
#include <cstring> // memcpy
#include <exception>
#include <iostream>

namespace {

constexpr uint32_t BGRA_BYTES_PER_PX = 4;

// Same plane views, frame size rounded down to even. A declared chroma
// geometry is capped to match so each chroma row is exactly width bytes.
msg::RawFrame trimToEven(const msg::RawFrame& in) {
    msg::RawFrame f = in;
    f.width  &= ~1u;
    f.height &= ~1u;

    for (uint8_t i : {msg::PLANE_U, msg::PLANE_V}) {
        msg::Plane& p = f.planes[i];
        if (p.width)  p.width  = std::min(*p.width,  f.width / 2);
        if (p.height) p.height = std::min(*p.height, f.height / 2);
    }
    return f;
}

} // anonymous namespace

namespace scan {

static inline FramePipelineConfig sanitise(const FramePipelineConfig& in) {
    FramePipelineConfig cfg = in;

    if (cfg.process_every_nth_frame < 1) cfg.process_every_nth_frame = 1;

    // 0 is the same as "no ROI"
    if (cfg.roi_side_px && *cfg.roi_side_px == 0) cfg.roi_side_px.reset();

    return cfg;
}

FramePipeline::FramePipeline(const FramePipelineConfig& cfg)
: m_cfg(sanitise(cfg))
, m_gate(m_cfg.process_every_nth_frame)
, m_cropper(m_cfg.roi_side_px) {
    if (!m_worker.Start()) {
        // Planar frames will report WORKER_UNAVAILABLE; packed frames still work.
        std::cerr << "[SCAN] conversion worker failed to start\n";
    }
}

FramePipeline::~FramePipeline() {
    m_worker.Stop();
}

bool FramePipeline::process(const msg::RawFrame& frame, msg::PreparedFrame& out) {
    FrameGate::Pass pass = m_gate.tryAcquire();
    if (!pass) {
        if (pass.decision() == FrameGate::Decision::BUSY) {
            m_busy.fetch_add(1);
            m_status.store(Status::BUSY);
        } else {
            m_throttled.fetch_add(1);
            m_status.store(Status::THROTTLED);
        }
        return false;
    }

    // From here on 'pass' keeps the gate busy; it is released on every
    // return path, including exceptions.
    try {
        msg::PreparedFrame prepared{};

        switch (frame.layout) {
            case msg::PixelLayout::YUV420_PLANAR:
                if (!preparePlanar(frame, prepared)) return false;
                break;
            case msg::PixelLayout::PACKED_BGRA:
                if (!preparePacked(frame, prepared)) return false;
                break;
            default:
                return fail(Status::UNSUPPORTED_LAYOUT);
        }

        out = m_cropper.crop(std::move(prepared));
    } catch (const std::exception& e) {
        std::cerr << "[SCAN] prepare failed id=" << frame.frame_id << ": " << e.what() << "\n";
        return fail(Status::PREPARE_FAIL);
    }

    m_accepted.fetch_add(1);
    m_status.store(Status::OK);
    return true;
}

void FramePipeline::reset() {
    m_gate.reset();
    m_status.store(Status::OK);
}

FramePipeline::Counters FramePipeline::counters() const {
    Counters c{};
    c.accepted  = m_accepted.load();
    c.busy      = m_busy.load();
    c.throttled = m_throttled.load();
    c.faulted   = m_faulted.load();
    c.truncated = m_truncated.load();
    return c;
}

// -------------------- private helpers --------------------

void FramePipeline::fillFullFrameGeometry(const msg::RawFrame& frame, msg::PreparedFrame& out) {
    out.size          = {frame.width, frame.height};
    out.crop_rect     = {0, 0, frame.width, frame.height};
    out.original_size = {frame.width, frame.height};

    out.rotation_deg = frame.rotation_deg;
    out.t_capture_us = frame.t_capture_us;
    out.frame_id     = frame.frame_id;
}

bool FramePipeline::preparePlanar(const msg::RawFrame& frame, msg::PreparedFrame& out) {
    if (!PixelFormatConverter::hasPlanarYuv(frame)) return fail(Status::MALFORMED_PLANES);
    if (!m_worker.running()) return fail(Status::WORKER_UNAVAILABLE);

    // A 1-pixel wide or high frame has no chroma pair to keep.
    const msg::RawFrame even = trimToEven(frame);
    if (even.width == 0 || even.height == 0) return fail(Status::MALFORMED_PLANES);

    ConvertReport report{};
    if (!m_worker.Convert(even, out.bytes, report)) return fail(Status::CONVERT_FAIL);

    if (report.truncated) m_truncated.fetch_add(1);

    out.format     = msg::PixelFormat::NV21;
    out.row_stride = even.width;
    fillFullFrameGeometry(even, out);
    return true;
}

bool FramePipeline::preparePacked(const msg::RawFrame& frame, msg::PreparedFrame& out) {
    if (frame.plane_count < 1) return fail(Status::MALFORMED_PLANES);

    const msg::Plane& p = frame.planes[0];
    const uint32_t w = frame.width;
    const uint32_t h = frame.height;
    const std::size_t row_bytes = std::size_t(w) * BGRA_BYTES_PER_PX;

    if (!p.data || w == 0 || h == 0) return fail(Status::MALFORMED_PLANES);
    if (p.row_stride < row_bytes) return fail(Status::MALFORMED_PLANES);
    if (p.size_bytes < std::size_t(p.row_stride) * (h - 1) + row_bytes) {
        return fail(Status::MALFORMED_PLANES);
    }

    // The camera buffer goes back to the source after this call, so copy
    // it out, dropping row padding.
    out.bytes.resize(msg::bgraByteSize(w, h));
    for (uint32_t row = 0; row < h; ++row) {
        std::memcpy(out.bytes.data() + std::size_t(row) * row_bytes,
                    p.data + std::size_t(row) * p.row_stride,
                    row_bytes);
    }

    out.format     = msg::PixelFormat::BGRA8888;
    out.row_stride = static_cast<uint32_t>(row_bytes);
    fillFullFrameGeometry(frame, out);
    return true;
}

// FDIR

bool FramePipeline::fail(Status s) {
    m_status.store(s);
    m_faulted.fetch_add(1);
    return false;
}

const char* FramePipeline::StatusStr(FramePipeline::Status s) {
    switch (s) {
        case FramePipeline::Status::OK:                 return "OK";
        case FramePipeline::Status::BUSY:               return "BUSY";
        case FramePipeline::Status::THROTTLED:          return "THROTTLED";
        case FramePipeline::Status::MALFORMED_PLANES:   return "MALFORMED_PLANES";
        case FramePipeline::Status::UNSUPPORTED_LAYOUT: return "UNSUPPORTED_LAYOUT";
        case FramePipeline::Status::CONVERT_FAIL:       return "CONVERT_FAIL";
        case FramePipeline::Status::PREPARE_FAIL:       return "PREPARE_FAIL";
        case FramePipeline::Status::WORKER_UNAVAILABLE: return "WORKER_UNAVAILABLE";
        default:                                        return "UNKNOWN";
    }
}

} // namespace scan

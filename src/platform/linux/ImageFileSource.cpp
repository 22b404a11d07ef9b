// ImageFileSource.cpp
#include "platform/linux/ImageFileSource.hpp"

#include <opencv2/opencv.hpp>

#include <chrono>
#include <cstring> // memcpy
#include <iostream>

namespace {

static uint64_t now_us() {
    using clock = std::chrono::steady_clock;
    return (uint64_t)std::chrono::duration_cast<std::chrono::microseconds>(
        clock::now().time_since_epoch()).count();
}

} // anonymous namespace

namespace platform {

ImageFileSource::ImageFileSource(const ImageFileSourceConfig& cfg)
: m_cfg(cfg) {
}

ImageFileSource::~ImageFileSource() {
    Stop();
}

bool ImageFileSource::Start() {
    if (m_running.load()) return true;
    m_status = Status::OK;

    if (m_cfg.layout != msg::PixelLayout::YUV420_PLANAR &&
        m_cfg.layout != msg::PixelLayout::PACKED_BGRA) {
        return fail(Status::UNSUPPORTED_LAYOUT);
    }

    cv::Mat img = cv::imread(m_cfg.path, cv::IMREAD_COLOR);
    if (img.empty()) {
        std::cerr << "[SOURCE] could not load " << m_cfg.path << "\n";
        return fail(Status::LOAD_FAIL);
    }

    // I420 needs even dimensions; drop a trailing row/column if necessary.
    const int w = img.cols & ~1;
    const int h = img.rows & ~1;
    if (w < 2 || h < 2) return fail(Status::BAD_GEOMETRY);
    img = img(cv::Rect(0, 0, w, h)).clone();

    m_width  = static_cast<uint32_t>(w);
    m_height = static_cast<uint32_t>(h);

    try {
        cv::Mat converted;
        if (m_cfg.layout == msg::PixelLayout::YUV420_PLANAR) {
            cv::cvtColor(img, converted, cv::COLOR_BGR2YUV_I420);
        } else {
            cv::cvtColor(img, converted, cv::COLOR_BGR2BGRA);
        }
        if (!converted.isContinuous()) converted = converted.clone();

        const std::vector<uint8_t> bytes(converted.data,
                                         converted.data + converted.total() * converted.elemSize());
        const bool ok = (m_cfg.layout == msg::PixelLayout::YUV420_PLANAR)
                      ? layoutPlanar(bytes) : layoutPacked(bytes);
        if (!ok) return false;
    } catch (const cv::Exception& e) {
        std::cerr << "[SOURCE] colour conversion failed: " << e.what() << "\n";
        return fail(Status::CONVERT_FAIL);
    }

    m_frame_id = 0;
    m_running.store(true);
    return true;
}

void ImageFileSource::Stop() {
    m_running.store(false);
}

bool ImageFileSource::Dequeue(msg::RawFrame& out) {
    if (!m_running.load()) return fail(Status::NOT_RUNNING);

    if (m_cfg.frame_period_ms > 0) {
        Rtos::SleepMs(static_cast<int>(m_cfg.frame_period_ms));
    }

    out = m_template;
    out.t_capture_us = now_us();
    out.frame_id     = m_frame_id++;
    return true;
}

bool ImageFileSource::Release(const msg::RawFrame& /*frame*/) {
    // Buffers are shared and never written after Start().
    return true;
}

// -------------------- private helpers --------------------

bool ImageFileSource::layoutPlanar(const std::vector<uint8_t>& i420) {
    const uint32_t w  = m_width;
    const uint32_t h  = m_height;
    const uint32_t cw = w / 2;
    const uint32_t ch = h / 2;

    const uint8_t* src_y = i420.data();
    const uint8_t* src_u = src_y + std::size_t(w) * h;
    const uint8_t* src_v = src_u + std::size_t(cw) * ch;

    msg::RawFrame& f = m_template;
    f = msg::RawFrame{};
    f.width  = w;
    f.height = h;
    f.layout = msg::PixelLayout::YUV420_PLANAR;
    f.rotation_deg = m_cfg.sensor_orientation_deg;
    f.plane_count  = 3;

    // ---- Y ----
    const uint32_t y_stride = w + m_cfg.row_padding;
    m_y.assign(std::size_t(y_stride) * h, 0);
    for (uint32_t row = 0; row < h; ++row) {
        std::memcpy(m_y.data() + std::size_t(row) * y_stride, src_y + std::size_t(row) * w, w);
    }

    msg::Plane& y = f.planes[msg::PLANE_Y];
    y.data         = m_y.data();
    y.size_bytes   = m_y.size();
    y.row_stride   = y_stride;
    y.pixel_stride = 1;
    y.width        = w;
    y.height       = h;

    msg::Plane& u = f.planes[msg::PLANE_U];
    msg::Plane& v = f.planes[msg::PLANE_V];

    if (m_cfg.semi_planar_chroma) {
        // One V,U interleaved buffer; U and V are views offset by one byte,
        // each one byte shorter than the buffer.
        const uint32_t c_stride = w + m_cfg.row_padding;
        m_vu.assign(std::size_t(c_stride) * ch, 0);
        for (uint32_t row = 0; row < ch; ++row) {
            uint8_t* dst = m_vu.data() + std::size_t(row) * c_stride;
            for (uint32_t col = 0; col < cw; ++col) {
                dst[2 * col]     = src_v[std::size_t(row) * cw + col];
                dst[2 * col + 1] = src_u[std::size_t(row) * cw + col];
            }
        }

        v.data         = m_vu.data();
        v.size_bytes   = m_vu.size() - 1;
        v.row_stride   = c_stride;
        v.pixel_stride = 2;

        u.data         = m_vu.data() + 1;
        u.size_bytes   = m_vu.size() - 1;
        u.row_stride   = c_stride;
        u.pixel_stride = 2;
    } else {
        const uint32_t c_stride = cw + m_cfg.row_padding / 2;
        m_u.assign(std::size_t(c_stride) * ch, 0);
        m_v.assign(std::size_t(c_stride) * ch, 0);
        for (uint32_t row = 0; row < ch; ++row) {
            std::memcpy(m_u.data() + std::size_t(row) * c_stride, src_u + std::size_t(row) * cw, cw);
            std::memcpy(m_v.data() + std::size_t(row) * c_stride, src_v + std::size_t(row) * cw, cw);
        }

        u.data         = m_u.data();
        u.size_bytes   = m_u.size();
        u.row_stride   = c_stride;
        u.pixel_stride = 1;

        v.data         = m_v.data();
        v.size_bytes   = m_v.size();
        v.row_stride   = c_stride;
        v.pixel_stride = 1;
    }

    u.width  = cw;
    u.height = ch;
    v.width  = cw;
    v.height = ch;
    return true;
}

bool ImageFileSource::layoutPacked(const std::vector<uint8_t>& bgra) {
    const uint32_t w = m_width;
    const uint32_t h = m_height;
    const uint32_t row_bytes = w * 4;
    const uint32_t stride    = row_bytes + m_cfg.row_padding;

    m_bgra.assign(std::size_t(stride) * h, 0);
    for (uint32_t row = 0; row < h; ++row) {
        std::memcpy(m_bgra.data() + std::size_t(row) * stride,
                    bgra.data() + std::size_t(row) * row_bytes, row_bytes);
    }

    msg::RawFrame& f = m_template;
    f = msg::RawFrame{};
    f.width  = w;
    f.height = h;
    f.layout = msg::PixelLayout::PACKED_BGRA;
    f.rotation_deg = m_cfg.sensor_orientation_deg;
    f.plane_count  = 1;

    msg::Plane& p = f.planes[0];
    p.data         = m_bgra.data();
    p.size_bytes   = m_bgra.size();
    p.row_stride   = stride;
    p.pixel_stride = 4;
    return true;
}

// FDIR

bool ImageFileSource::fail(Status s) {
    m_status = s;
    return false;
}

const char* ImageFileSource::StatusStr(ImageFileSource::Status s) {
    switch (s) {
        case ImageFileSource::Status::OK:                 return "OK";
        case ImageFileSource::Status::LOAD_FAIL:          return "LOAD_FAIL";
        case ImageFileSource::Status::BAD_GEOMETRY:       return "BAD_GEOMETRY";
        case ImageFileSource::Status::CONVERT_FAIL:       return "CONVERT_FAIL";
        case ImageFileSource::Status::UNSUPPORTED_LAYOUT: return "UNSUPPORTED_LAYOUT";
        case ImageFileSource::Status::NOT_RUNNING:        return "NOT_RUNNING";
        default:                                          return "UNKNOWN";
    }
}

} // namespace platform

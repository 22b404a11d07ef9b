// PixelFormatConverter.cpp
#include "apps/scan/PixelFormatConverter.hpp"
#include "msg/PreparedFrame.hpp"

#include <algorithm>
#include <cstring> // memcpy

namespace scan {

bool PixelFormatConverter::hasPlanarYuv(const msg::RawFrame& frame) {
    if (frame.layout != msg::PixelLayout::YUV420_PLANAR) return false;
    if (frame.plane_count < 3) return false;
    if (frame.width == 0 || frame.height == 0) return false;

    for (uint8_t i = 0; i < 3; ++i) {
        const msg::Plane& p = frame.planes[i];
        if (!p.data || p.size_bytes == 0 || p.row_stride == 0) return false;
    }
    return true;
}

bool PixelFormatConverter::toNv21(const msg::RawFrame& frame,
                                  std::vector<uint8_t>& out,
                                  ConvertReport& report) {
    report = ConvertReport{};
    if (!hasPlanarYuv(frame)) return false;

    const uint32_t width  = frame.width;
    const uint32_t height = frame.height;

    out.assign(msg::nv21ByteSize(width, height), 0);

    const msg::Plane& y = frame.planes[msg::PLANE_Y];
    const msg::Plane& u = frame.planes[msg::PLANE_U];
    const msg::Plane& v = frame.planes[msg::PLANE_V];

    // Chroma always starts right after a full luma plane, even if the
    // luma copy stopped early.
    const std::size_t luma_len = std::size_t(width) * height;

    bool truncated = false;
    std::size_t written = copyLuma(y, width, height, out.data(), luma_len, truncated);

    // Chroma geometry comes from the U plane, falling back to half size.
    const uint32_t uv_width  = u.chromaWidth(width);
    const uint32_t uv_height = u.chromaHeight(height);

    written += interleaveChroma(u, v, uv_width, uv_height,
                                out.data() + luma_len, out.size() - luma_len, truncated);

    report.bytes_written = written;
    report.truncated     = truncated || written < out.size();
    return true;
}

// -------------------- private helpers --------------------

std::size_t PixelFormatConverter::copyLuma(const msg::Plane& y, uint32_t width, uint32_t height,
                                           uint8_t* dst, std::size_t dst_len, bool& truncated) {
    const std::size_t px_stride = y.pixelStrideOr1();
    std::size_t out = 0;

    for (uint32_t row = 0; row < height; ++row) {
        const std::size_t row_start = std::size_t(row) * y.row_stride;
        if (row_start >= y.size_bytes || out >= dst_len) {
            truncated = true;
            break;
        }

        // Samples actually present in this row of the source
        const std::size_t avail = (y.size_bytes - row_start + px_stride - 1) / px_stride;
        const std::size_t n = std::min<std::size_t>({width, avail, dst_len - out});

        if (px_stride == 1) {
            std::memcpy(dst + out, y.data + row_start, n);
        } else {
            const uint8_t* src = y.data + row_start;
            for (std::size_t col = 0; col < n; ++col) {
                dst[out + col] = src[col * px_stride];
            }
        }
        out += n;

        if (n < width) {
            truncated = true;
            break;
        }
    }
    return out;
}

std::size_t PixelFormatConverter::interleaveChroma(const msg::Plane& u, const msg::Plane& v,
                                                   uint32_t uv_width, uint32_t uv_height,
                                                   uint8_t* dst, std::size_t dst_len, bool& truncated) {
    const std::size_t u_px = u.pixelStrideOr1();
    const std::size_t v_px = v.pixelStrideOr1();
    std::size_t out = 0;

    for (uint32_t row = 0; row < uv_height; ++row) {
        const std::size_t u_row_start = std::size_t(row) * u.row_stride;
        const std::size_t v_row_start = std::size_t(row) * v.row_stride;
        if (u_row_start >= u.size_bytes || v_row_start >= v.size_bytes) {
            truncated = true;
            break;
        }

        // Clamp the row to what both planes can actually supply. Interleaved
        // camera chroma is commonly one byte short on the last row.
        const std::size_t max_u_cols = (u.size_bytes - u_row_start) / u_px;
        const std::size_t max_v_cols = (v.size_bytes - v_row_start) / v_px;
        const std::size_t row_width  = std::min<std::size_t>({uv_width, max_u_cols, max_v_cols});
        if (row_width == 0) {
            truncated = true;
            break;
        }

        const uint8_t* u_row = u.data + u_row_start;
        const uint8_t* v_row = v.data + v_row_start;

        for (std::size_t col = 0; col < row_width; ++col) {
            if (out >= dst_len) return out;
            dst[out++] = v_row[col * v_px];
            if (out >= dst_len) return out;
            dst[out++] = u_row[col * u_px];
        }
        if (row_width < uv_width) truncated = true;
    }
    return out;
}

} // namespace scan

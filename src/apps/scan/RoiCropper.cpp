// RoiCropper.cpp
#include "apps/scan/RoiCropper.hpp"

#include <algorithm>
#include <cstring> // memcpy

namespace {

constexpr uint32_t BGRA_BYTES_PER_PX = 4;

} // anonymous namespace

namespace scan {

RoiCropper::RoiCropper(std::optional<uint32_t> side_px) {
    if (side_px && *side_px > 0) m_side = side_px;
}

msg::PreparedFrame RoiCropper::crop(msg::PreparedFrame frame) const {
    if (!m_side) return frame;

    const uint32_t desired = *m_side;
    const uint32_t w = frame.size.width;
    const uint32_t h = frame.size.height;

    // Larger than the frame on both axes: nothing to gain.
    if (desired >= w && desired >= h) return frame;

    switch (frame.format) {
        case msg::PixelFormat::NV21:     return cropNv21(std::move(frame), desired);
        case msg::PixelFormat::BGRA8888: return cropBgra(std::move(frame), desired);
    }

    // Any other tag: no cropping rule, pass through.
    return frame;
}

uint32_t RoiCropper::evenStartWithinBounds(int64_t proposed, uint32_t side, uint32_t dim) {
    int64_t value = proposed;
    const int64_t s = side;
    const int64_t d = dim;

    if (value < 0) value = 0;
    if (value + s > d) value = d - s;
    if (value < 0) value = 0;
    if (value % 2 != 0) value = value > 0 ? value - 1 : 0;
    while (value + s > d && value >= 2) {
        value -= 2;
    }
    if (value < 0) value = 0;
    return static_cast<uint32_t>(value);
}

// -------------------- private helpers --------------------

msg::PreparedFrame RoiCropper::cropNv21(msg::PreparedFrame frame, uint32_t desired) const {
    const uint32_t w = frame.size.width;
    const uint32_t h = frame.size.height;

    uint32_t side = std::min(desired, std::min(w, h));
    if (side % 2 != 0) side -= 1;
    if (side < 2) return frame;                 // degenerate ROI: refuse
    if (side == w && side == h) return frame;   // square frame, already the ROI

    // Reads below assume a well-formed NV21 buffer of w x h.
    if (frame.bytes.size() < msg::nv21ByteSize(w, h)) return frame;

    const uint32_t start_x = evenStartWithinBounds((int64_t(w) - side) / 2, side, w);
    const uint32_t start_y = evenStartWithinBounds((int64_t(h) - side) / 2, side, h);

    std::vector<uint8_t> out(msg::nv21ByteSize(side, side));
    const uint8_t* src = frame.bytes.data();
    uint8_t* dst = out.data();

    // Luma: 'side' rows of 'side' bytes
    for (uint32_t row = 0; row < side; ++row) {
        const std::size_t src_off = std::size_t(start_y + row) * w + start_x;
        std::memcpy(dst, src + src_off, side);
        dst += side;
    }

    // Chroma: each subsampled row holds w bytes of V,U pairs, so a chroma
    // row is addressed exactly like a luma row, offset by the luma plane.
    const std::size_t y_plane_len = std::size_t(w) * h;
    const uint32_t uv_start_row = start_y / 2;
    const uint32_t uv_rows      = side / 2;

    for (uint32_t row = 0; row < uv_rows; ++row) {
        const std::size_t src_off = y_plane_len + std::size_t(uv_start_row + row) * w + start_x;
        std::memcpy(dst, src + src_off, side);
        dst += side;
    }

    return makeCropped(frame, std::move(out), side, side, start_x, start_y);
}

msg::PreparedFrame RoiCropper::cropBgra(msg::PreparedFrame frame, uint32_t desired) const {
    const uint32_t w = frame.size.width;
    const uint32_t h = frame.size.height;

    const uint32_t side = std::min(desired, std::min(w, h));
    if (side < 1) return frame;
    if (side == w && side == h) return frame;

    const uint32_t stride = frame.row_stride;
    if (stride < w * BGRA_BYTES_PER_PX) return frame;
    if (frame.bytes.size() < std::size_t(stride) * (h - 1) + std::size_t(w) * BGRA_BYTES_PER_PX) {
        return frame;
    }

    const uint32_t start_x = (w - side) / 2;
    const uint32_t start_y = (h - side) / 2;

    const std::size_t row_bytes = std::size_t(side) * BGRA_BYTES_PER_PX;
    std::vector<uint8_t> out(msg::bgraByteSize(side, side));
    uint8_t* dst = out.data();

    for (uint32_t row = 0; row < side; ++row) {
        const std::size_t src_off = std::size_t(start_y + row) * stride
                                  + std::size_t(start_x) * BGRA_BYTES_PER_PX;
        std::memcpy(dst, frame.bytes.data() + src_off, row_bytes);
        dst += row_bytes;
    }

    return makeCropped(frame, std::move(out), side * BGRA_BYTES_PER_PX, side, start_x, start_y);
}

msg::PreparedFrame RoiCropper::makeCropped(const msg::PreparedFrame& src,
                                           std::vector<uint8_t>&& bytes,
                                           uint32_t row_stride,
                                           uint32_t side,
                                           uint32_t start_x, uint32_t start_y) {
    msg::PreparedFrame out{};
    out.bytes      = std::move(bytes);
    out.format     = src.format;
    out.row_stride = row_stride;
    out.size       = {side, side};

    // crop_rect stays in original-frame coordinates even if 'src' was
    // itself a crop.
    out.crop_rect = {src.crop_rect.x + start_x, src.crop_rect.y + start_y, side, side};
    out.original_size = src.original_size;

    out.rotation_deg = src.rotation_deg;
    out.t_capture_us = src.t_capture_us;
    out.frame_id     = src.frame_id;
    return out;
}

} // namespace scan

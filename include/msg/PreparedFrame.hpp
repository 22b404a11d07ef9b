#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

namespace msg {

// Byte layouts the detector accepts.
enum class PixelFormat : uint8_t {
    // Full-res luma plane, then half-res interleaved V,U pairs.
    NV21     = 0,
    // 4 bytes per pixel, B,G,R,A.
    BGRA8888 = 1,
};

const char* PixelFormatStr(PixelFormat f);

struct FrameSize {
    uint32_t width  = 0;
    uint32_t height = 0;
};

// Pixel rectangle, origin top-left.
struct PixelRect {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t width  = 0;
    uint32_t height = 0;
};

inline bool operator==(const PixelRect& a, const PixelRect& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

// Exact buffer size required by a format for a given logical size.
constexpr std::size_t nv21ByteSize(uint32_t w, uint32_t h) {
    return std::size_t(w) * h + (std::size_t(w) * h) / 2;
}

constexpr std::size_t bgraByteSize(uint32_t w, uint32_t h) {
    return std::size_t(w) * h * 4;
}

std::size_t expectedByteSize(PixelFormat f, uint32_t w, uint32_t h);

// Detector-ready frame. Owns its bytes; created once per accepted camera
// frame and discarded after the detector and overlay have seen it.
struct PreparedFrame {
    std::vector<uint8_t> bytes;

    PixelFormat format = PixelFormat::NV21;

    // Bytes per row in 'bytes' (luma row stride for NV21).
    uint32_t row_stride = 0;

    // Logical size of 'bytes' in pixels.
    FrameSize size{};

    // Region of the original camera frame this buffer covers.
    PixelRect crop_rect{};

    // Camera frame size before any cropping.
    FrameSize original_size{};

    // Copy-through from RawFrame
    int32_t  rotation_deg = 0;
    uint64_t t_capture_us = 0;
    uint32_t frame_id     = 0;
};

// Buffer length matches the format formula, NV21 sides are even and
// crop_rect lies inside original_size.
bool isConsistent(const PreparedFrame& f);

} // namespace msg

#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>

namespace msg {

// One channel of pixel data as delivered by the camera.
// Non-owning: the bytes belong to the capture source.
struct Plane {
    // Non-owning pointer to the first byte of the plane, const to prevent modification
    const uint8_t* data = nullptr;

    // Number of readable bytes behind data. Camera stacks may hand out
    // planes shorter than rows * row_stride (last row unpadded, or one
    // byte short for interleaved chroma), so always bound reads by this.
    std::size_t size_bytes = 0;

    // Stride = number of BYTES between the start of row v and the start of row v+1.
    uint32_t row_stride = 0;

    // Bytes between consecutive samples within a row.
    // Absent => 1 (tightly packed samples).
    std::optional<uint32_t> pixel_stride;

    // Declared plane geometry in samples. Absent => derived from the
    // frame size (full size for luma, rounded-up half size for chroma).
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;

    uint32_t pixelStrideOr1() const {
        return (pixel_stride && *pixel_stride > 0) ? *pixel_stride : 1u;
    }

    // 4:2:0 chroma geometry fallbacks
    uint32_t chromaWidth(uint32_t frame_width) const {
        return width ? *width : (frame_width + 1u) >> 1;
    }
    uint32_t chromaHeight(uint32_t frame_height) const {
        return height ? *height : (frame_height + 1u) >> 1;
    }
};

} // namespace msg

#pragma once
#include <array>
#include <cstdint>
#include <cstddef>

#include "msg/Plane.hpp"

namespace msg {

// Native memory layout of a captured frame.
enum class PixelLayout : uint8_t {
    UNKNOWN       = 0,
    YUV420_PLANAR = 1,   // 3 planes: Y full res, U and V subsampled 2x2
    PACKED_BGRA   = 2,   // 1 plane: B,G,R,A bytes per pixel
};

constexpr std::size_t MAX_PLANES = 3;

// Plane order for YUV420_PLANAR
enum : uint8_t { PLANE_Y = 0, PLANE_U = 1, PLANE_V = 2 };

// A camera frame as delivered by the capture source.
// Borrowed: plane data stays valid only until the frame is released back
// to the source, so consumers must copy what they keep.
struct RawFrame {
    std::array<Plane, MAX_PLANES> planes{};
    uint8_t  plane_count = 0;

    // Image dimensions in pixels
    uint32_t width  = 0;
    uint32_t height = 0;

    PixelLayout layout = PixelLayout::UNKNOWN;

    // Sensor rotation relative to the display, in degrees (out of band).
    // Usually one of 0/90/180/270 but any value is accepted downstream.
    int32_t rotation_deg = 0;

    uint64_t t_capture_us = 0;  // capture timestamp (monotonic, us)
    uint32_t frame_id     = 0;  // increasing counter from the source

    // Source-specific handle used to give the buffer back (e.g. V4L2 index).
    uint16_t buffer_index = 0;
};

} // namespace msg

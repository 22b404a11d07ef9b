#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "msg/PreparedFrame.hpp"

namespace msg {

// Corner in prepared-frame pixel coordinates (before the crop offset).
struct Point2f {
    float u_px = 0.0f;
    float v_px = 0.0f;
};

// One decoded pattern as reported by the detection engine.
struct DetectionResult {
    std::string raw_value;              // may be empty if the engine could not decode
    std::array<Point2f, 4> corners{};
    uint8_t corner_count = 0;           // 0 if the engine gives no geometry
};

struct DetectionBatch {
    std::vector<DetectionResult> results;

    // Region of the camera frame the corners are relative to.
    PixelRect crop_rect{};
    FrameSize original_size{};

    // --- Measurement identity ---
    uint32_t frame_id     = 0;
    uint64_t t_capture_us = 0;
};

} // namespace msg

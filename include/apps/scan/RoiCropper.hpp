#pragma once
#include <cstdint>
#include <optional>

#include "msg/PreparedFrame.hpp"

namespace scan {

// ---------------------------------------------------------------------------
// RoiCropper: cuts a centered square out of a PreparedFrame to shrink the
// detector's workload.
//
// NV21 crops keep an even side and even origin so the 2x2 chroma blocks stay
// aligned with luma. BGRA crops have no alignment constraint.
//
// Whenever a crop is not possible or not useful the input is returned as is
// (moved through, no copy).
// ---------------------------------------------------------------------------
class RoiCropper {
public:
    // side_px: desired square side in pixels; nullopt or 0 disables cropping.
    explicit RoiCropper(std::optional<uint32_t> side_px = std::nullopt);

    std::optional<uint32_t> side() const { return m_side; }

    msg::PreparedFrame crop(msg::PreparedFrame frame) const;

    // Exposed for tests: even start inside [0, dim - side].
    static uint32_t evenStartWithinBounds(int64_t proposed, uint32_t side, uint32_t dim);

private:
    std::optional<uint32_t> m_side;

    msg::PreparedFrame cropNv21(msg::PreparedFrame frame, uint32_t desired) const;
    msg::PreparedFrame cropBgra(msg::PreparedFrame frame, uint32_t desired) const;

    static msg::PreparedFrame makeCropped(const msg::PreparedFrame& src,
                                          std::vector<uint8_t>&& bytes,
                                          uint32_t row_stride,
                                          uint32_t side,
                                          uint32_t start_x, uint32_t start_y);
};

} // namespace scan

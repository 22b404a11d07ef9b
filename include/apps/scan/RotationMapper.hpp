#pragma once
#include <cstdint>

#include "msg/PreparedFrame.hpp"
#include "msg/OverlayUpdate.hpp"

namespace scan {

// ---------------------------------------------------------------------------
// RotationMapper: crop rectangle (camera pixels) -> overlay rectangle in
// normalized preview coordinates, accounting for sensor rotation.
//
// Stateful only for debouncing: it remembers the last rectangle it asked the
// overlay to show and reports UNCHANGED for sub-epsilon moves.
// ---------------------------------------------------------------------------
class RotationMapper {
public:
    static constexpr double EPSILON = 1e-3;

    RotationMapper() = default;

    // Maps the frame's crop rect under 'rotation_deg' and decides what the
    // overlay should do. Frames with an empty original size yield UNCHANGED.
    msg::OverlayUpdate update(const msg::PreparedFrame& frame, int32_t rotation_deg);

    // Forget the shown rectangle (stream restart). Returns HIDE if a
    // rectangle was on screen, else UNCHANGED.
    msg::OverlayUpdate reset();

    bool hasShown() const { return m_has_shown; }
    const msg::NormRect& shown() const { return m_shown; }

    // ---- stateless building blocks ----

    // crop_rect / original_size, each coordinate clamped to [0,1]
    static msg::NormRect normalize(const msg::PreparedFrame& frame);

    // [0,360)
    static int32_t normalizeDegrees(int32_t deg);

    // Exact axis swap/mirror for 0/90/180/270, bounding box of the rotated
    // corners about (0.5,0.5) for anything else.
    static msg::NormRect rotate(const msg::NormRect& r, int32_t rotation_deg);

    // Edges clamped to [0,1], inverted edges swapped back.
    static msg::NormRect clamp(const msg::NormRect& r);

    static bool coversFullFrame(const msg::NormRect& r);
    static bool closeTo(const msg::NormRect& a, const msg::NormRect& b);

private:
    bool m_has_shown = false;
    msg::NormRect m_shown{};
};

} // namespace scan

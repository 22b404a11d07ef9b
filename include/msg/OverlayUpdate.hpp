#pragma once
#include <cstdint>

namespace msg {

// Rectangle in normalized preview coordinates, [0,1] on both axes.
// Origin top-left; x -> right, y -> down.
struct NormRect {
    double left   = 0.0;
    double top    = 0.0;
    double right  = 0.0;
    double bottom = 0.0;

    double width()  const { return right - left; }
    double height() const { return bottom - top; }

    static NormRect fromLTWH(double l, double t, double w, double h) {
        return NormRect{l, t, l + w, t + h};
    }
};

enum class OverlayAction : uint8_t {
    UNCHANGED = 0,  // keep whatever is on screen
    SHOW      = 1,  // draw 'rect'
    HIDE      = 2,  // remove the overlay (full frame / no visible ROI)
};

struct OverlayUpdate {
    OverlayAction action = OverlayAction::UNCHANGED;
    NormRect rect{};
    uint32_t frame_id = 0;
};

} // namespace msg

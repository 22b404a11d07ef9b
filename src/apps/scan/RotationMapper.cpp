// RotationMapper.cpp
#include "apps/scan/RotationMapper.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

#include <Eigen/Core>
#include <Eigen/Geometry>

namespace {

using EVec2 = Eigen::Vector2d;

static inline double clamp01(double x) {
    return (x < 0.0) ? 0.0 : (x > 1.0) ? 1.0 : x;
}

// Point rotation in normalized coordinates (y down).
static EVec2 rotatePoint(const EVec2& p, int32_t deg) {
    switch (deg) {
        case 0:   return p;
        case 90:  return EVec2(p.y(), 1.0 - p.x());
        case 180: return EVec2(1.0 - p.x(), 1.0 - p.y());
        case 270: return EVec2(1.0 - p.y(), p.x());
        default:  break;
    }

    const EVec2 centre(0.5, 0.5);
    const Eigen::Rotation2Dd rot(static_cast<double>(deg) * EIGEN_PI / 180.0);
    return rot * (p - centre) + centre;
}

} // anonymous namespace

namespace scan {

msg::NormRect RotationMapper::normalize(const msg::PreparedFrame& frame) {
    const double w = frame.original_size.width;
    const double h = frame.original_size.height;
    if (w <= 0.0 || h <= 0.0) return msg::NormRect{};

    const msg::PixelRect& c = frame.crop_rect;
    return msg::NormRect::fromLTWH(clamp01(c.x / w),
                                   clamp01(c.y / h),
                                   clamp01(c.width / w),
                                   clamp01(c.height / h));
}

int32_t RotationMapper::normalizeDegrees(int32_t deg) {
    return ((deg % 360) + 360) % 360;
}

msg::NormRect RotationMapper::rotate(const msg::NormRect& r, int32_t rotation_deg) {
    const int32_t deg = normalizeDegrees(rotation_deg);
    if (deg == 0) return r;

    const std::array<EVec2, 4> corners = {
        EVec2(r.left,  r.top),
        EVec2(r.right, r.top),
        EVec2(r.left,  r.bottom),
        EVec2(r.right, r.bottom),
    };

    EVec2 lo(std::numeric_limits<double>::max(), std::numeric_limits<double>::max());
    EVec2 hi(std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest());
    for (const EVec2& c : corners) {
        const EVec2 p = rotatePoint(c, deg);
        lo = lo.cwiseMin(p);
        hi = hi.cwiseMax(p);
    }
    return msg::NormRect{lo.x(), lo.y(), hi.x(), hi.y()};
}

msg::NormRect RotationMapper::clamp(const msg::NormRect& r) {
    double left   = clamp01(r.left);
    double right  = clamp01(r.right);
    if (right < left) std::swap(left, right);

    double top    = clamp01(r.top);
    double bottom = clamp01(r.bottom);
    if (bottom < top) std::swap(top, bottom);

    return msg::NormRect{left, top, right, bottom};
}

bool RotationMapper::coversFullFrame(const msg::NormRect& r) {
    return r.width() >= 1.0 - EPSILON && r.height() >= 1.0 - EPSILON;
}

bool RotationMapper::closeTo(const msg::NormRect& a, const msg::NormRect& b) {
    return std::fabs(a.left   - b.left)   < EPSILON &&
           std::fabs(a.top    - b.top)    < EPSILON &&
           std::fabs(a.right  - b.right)  < EPSILON &&
           std::fabs(a.bottom - b.bottom) < EPSILON;
}

msg::OverlayUpdate RotationMapper::update(const msg::PreparedFrame& frame, int32_t rotation_deg) {
    msg::OverlayUpdate upd{};
    upd.frame_id = frame.frame_id;

    if (frame.original_size.width == 0 || frame.original_size.height == 0) {
        return upd;
    }

    const msg::NormRect mapped = clamp(rotate(normalize(frame), rotation_deg));

    // Full frame: nothing worth outlining.
    if (coversFullFrame(mapped)) {
        if (m_has_shown) {
            m_has_shown = false;
            upd.action = msg::OverlayAction::HIDE;
        }
        return upd;
    }

    // Debounce sub-pixel jitter.
    if (m_has_shown && closeTo(m_shown, mapped)) {
        return upd;
    }

    m_shown     = mapped;
    m_has_shown = true;
    upd.action  = msg::OverlayAction::SHOW;
    upd.rect    = mapped;
    return upd;
}

msg::OverlayUpdate RotationMapper::reset() {
    msg::OverlayUpdate upd{};
    if (m_has_shown) upd.action = msg::OverlayAction::HIDE;
    m_has_shown = false;
    m_shown = msg::NormRect{};
    return upd;
}

} // namespace scan

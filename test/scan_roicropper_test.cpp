// test/scan_roicropper_test.cpp
//
// RoiCropper: centered square crops for NV21 and BGRA, alignment, identity
// cases and crop-rect bookkeeping.

#include <iostream>
#include <utility>
#include <vector>

#include "apps/scan/RoiCropper.hpp"
#include "msg/PreparedFrame.hpp"

#include "scan_test_frames.hpp"

using scan::RoiCropper;
using scantest::check;

// Every byte of an NV21 crop equals the pattern at crop_rect offset.
static bool nv21MatchesPattern(const msg::PreparedFrame& f) {
    const uint32_t w = f.size.width;
    const uint32_t h = f.size.height;
    const uint32_t x0 = f.crop_rect.x;
    const uint32_t y0 = f.crop_rect.y;
    if (f.bytes.size() < msg::nv21ByteSize(w, h)) return false;

    for (uint32_t r = 0; r < h; ++r)
        for (uint32_t c = 0; c < w; ++c)
            if (f.bytes[std::size_t(r) * w + c] != scantest::lumaAt(x0 + c, y0 + r)) return false;

    const std::size_t base = std::size_t(w) * h;
    for (uint32_t r = 0; r < h / 2; ++r) {
        for (uint32_t k = 0; k < w / 2; ++k) {
            const std::size_t off = base + std::size_t(r) * w + 2 * k;
            if (f.bytes[off]     != scantest::vAt(x0 / 2 + k, y0 / 2 + r)) return false;
            if (f.bytes[off + 1] != scantest::uAt(x0 / 2 + k, y0 / 2 + r)) return false;
        }
    }
    return true;
}

static bool bgraMatchesPattern(const msg::PreparedFrame& f) {
    for (uint32_t r = 0; r < f.size.height; ++r)
        for (uint32_t c = 0; c < f.size.width; ++c)
            for (uint32_t k = 0; k < 4; ++k)
                if (f.bytes[std::size_t(r) * f.row_stride + std::size_t(c) * 4 + k] !=
                    scantest::bgraAt(f.crop_rect.x + c, f.crop_rect.y + r, k)) return false;
    return true;
}

int main() {
    std::cout << "=== scan_roicropper_test ===\n";

    {
        std::cout << "\n[Test 1] 1280x720 NV21, side 600\n";
        msg::PreparedFrame in = scantest::preparedNv21(1280, 720);
        in.frame_id = 42;
        in.t_capture_us = 123456;
        in.rotation_deg = 90;

        const msg::PreparedFrame out = RoiCropper(600u).crop(std::move(in));
        check("size 600x600", out.size.width == 600 && out.size.height == 600);
        check("540000 bytes", out.bytes.size() == 540000);
        check("crop rect (340,60,600,600)", out.crop_rect == msg::PixelRect{340, 60, 600, 600});
        check("original size kept", out.original_size.width == 1280 && out.original_size.height == 720);
        check("row stride == side", out.row_stride == 600);
        check("format stays NV21", out.format == msg::PixelFormat::NV21);
        check("metadata copied", out.frame_id == 42 && out.t_capture_us == 123456 && out.rotation_deg == 90);
        check("bytes are the source sub-rectangle", nv21MatchesPattern(out));
        check("isConsistent()", msg::isConsistent(out));
    }

    {
        std::cout << "\n[Test 2] Side larger than the frame: identity\n";
        msg::PreparedFrame in = scantest::preparedNv21(1280, 720);
        const std::vector<uint8_t> before = in.bytes;
        const msg::PreparedFrame out = RoiCropper(2000u).crop(std::move(in));
        check("size unchanged", out.size.width == 1280 && out.size.height == 720);
        check("crop rect = full frame", out.crop_rect == msg::PixelRect{0, 0, 1280, 720});
        check("bytes untouched", out.bytes == before);
    }

    {
        std::cout << "\n[Test 3] No side configured: identity\n";
        msg::PreparedFrame in = scantest::preparedBgra(64, 32);
        const msg::PreparedFrame a = RoiCropper().crop(in);
        const msg::PreparedFrame b = RoiCropper(0u).crop(in);
        check("nullopt -> identity", a.bytes == in.bytes && a.crop_rect == in.crop_rect);
        check("0 -> identity", b.bytes == in.bytes && b.crop_rect == in.crop_rect);
        check("0 reported as no side", !RoiCropper(0u).side());
    }

    {
        std::cout << "\n[Test 4] Square frame equal to the side: identity\n";
        msg::PreparedFrame in = scantest::preparedNv21(600, 600);
        const msg::PreparedFrame out = RoiCropper(600u).crop(in);
        check("size unchanged", out.size.width == 600 && out.size.height == 600);
        check("bytes untouched", out.bytes == in.bytes);
    }

    {
        std::cout << "\n[Test 5] Side between the two dimensions clamps to the short one\n";
        const msg::PreparedFrame out = RoiCropper(1000u).crop(scantest::preparedNv21(1280, 720));
        check("720x720", out.size.width == 720 && out.size.height == 720);
        check("crop rect (280,0,720,720)", out.crop_rect == msg::PixelRect{280, 0, 720, 720});
        check("bytes are the source sub-rectangle", nv21MatchesPattern(out));
    }

    {
        std::cout << "\n[Test 6] NV21 starts are even and in bounds across geometries\n";
        bool all_ok = true;
        for (uint32_t w = 4; w <= 40; w += 2) {
            for (uint32_t h = 4; h <= 30; h += 2) {
                for (uint32_t side = 2; side <= 44; ++side) {
                    const msg::PreparedFrame out = RoiCropper(side).crop(scantest::preparedNv21(w, h));
                    const msg::PixelRect& r = out.crop_rect;
                    const bool ok = (r.x % 2 == 0) && (r.y % 2 == 0) &&
                                    (r.x + r.width <= w) && (r.y + r.height <= h) &&
                                    (r.width % 2 == 0) &&
                                    msg::isConsistent(out) && nv21MatchesPattern(out);
                    if (!ok) {
                        std::cout << "  bad crop w=" << w << " h=" << h << " side=" << side << "\n";
                        all_ok = false;
                    }
                }
            }
        }
        check("all crops aligned, in bounds and byte exact", all_ok);

        const msg::PreparedFrame odd = RoiCropper(7u).crop(scantest::preparedNv21(20, 20));
        check("odd side 7 rounds down to 6", odd.size.width == 6);
    }

    {
        std::cout << "\n[Test 7] Degenerate NV21 side is refused\n";
        msg::PreparedFrame in = scantest::preparedNv21(16, 8);
        const msg::PreparedFrame out = RoiCropper(1u).crop(in);
        check("side 1 -> identity", out.size.width == 16 && out.bytes == in.bytes);
    }

    {
        std::cout << "\n[Test 8] evenStartWithinBounds\n";
        check("negative -> 0", RoiCropper::evenStartWithinBounds(-5, 10, 100) == 0);
        check("over the end -> dim-side", RoiCropper::evenStartWithinBounds(95, 10, 100) == 90);
        check("odd -> previous even", RoiCropper::evenStartWithinBounds(51, 10, 100) == 50);
        check("odd dim-side -> even below", RoiCropper::evenStartWithinBounds(95, 10, 101) == 90);
        check("side == dim -> 0", RoiCropper::evenStartWithinBounds(7, 10, 10) == 0);
    }

    {
        std::cout << "\n[Test 9] BGRA with padded rows, odd start allowed\n";
        msg::PreparedFrame in = scantest::preparedBgra(101, 51, /*row_padding=*/12);
        const msg::PreparedFrame out = RoiCropper(20u).crop(std::move(in));
        check("20x20", out.size.width == 20 && out.size.height == 20);
        check("crop rect (40,15,20,20)", out.crop_rect == msg::PixelRect{40, 15, 20, 20});
        check("tight row stride", out.row_stride == 80);
        check("1600 bytes", out.bytes.size() == 1600);
        check("bytes are the source sub-rectangle", bgraMatchesPattern(out));
        check("isConsistent()", msg::isConsistent(out));
    }

    {
        std::cout << "\n[Test 10] BGRA side 1 still crops\n";
        const msg::PreparedFrame out = RoiCropper(1u).crop(scantest::preparedBgra(9, 5));
        check("1x1 at the center", out.size.width == 1 && out.crop_rect == msg::PixelRect{4, 2, 1, 1});
        check("4 bytes", out.bytes.size() == 4 && bgraMatchesPattern(out));
    }

    {
        std::cout << "\n[Test 11] Cropping a crop keeps original-frame coordinates\n";
        const RoiCropper big(600u);
        const RoiCropper small(300u);
        const msg::PreparedFrame once  = big.crop(scantest::preparedNv21(1280, 720));
        const msg::PreparedFrame twice = small.crop(once);
        check("crop rect (490,210,300,300)", twice.crop_rect == msg::PixelRect{490, 210, 300, 300});
        check("original size still 1280x720",
              twice.original_size.width == 1280 && twice.original_size.height == 720);
        check("bytes are the original sub-rectangle", nv21MatchesPattern(twice));
    }

    {
        std::cout << "\n[Test 12] Short NV21 buffer: identity, no read past the end\n";
        msg::PreparedFrame in = scantest::preparedNv21(64, 32);
        in.bytes.resize(64 * 32);   // luma only
        const msg::PreparedFrame out = RoiCropper(16u).crop(in);
        check("unchanged", out.size.width == 64 && out.bytes.size() == 64 * 32);
    }

    return scantest::finish("scan_roicropper_test");
}

#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

#include "msg/RawFrame.hpp"

namespace scan {

// What a conversion actually managed to write.
struct ConvertReport {
    std::size_t bytes_written = 0;   // <= out.size()
    bool truncated = false;          // stopped early on a short plane or full output
};

// ---------------------------------------------------------------------------
// PixelFormatConverter: 3-plane YUV 4:2:0 -> NV21.
//
// Output layout: width*height luma bytes (row-major, no padding), then
// (width*height)/2 bytes of interleaved V,U pairs, one pair per 2x2 block.
//
// Pure and stateless; safe to call from any thread.
// ---------------------------------------------------------------------------
class PixelFormatConverter {
public:
    // Resizes 'out' to exactly nv21ByteSize(width, height) and fills it.
    // Returns false only if the frame does not carry 3 usable planes;
    // short or truncated planes are clamped and reported, never fatal.
    // Bytes the planes could not supply are left zero and carry no meaning.
    static bool toNv21(const msg::RawFrame& frame,
                       std::vector<uint8_t>& out,
                       ConvertReport& report);

    // true if 'frame' has the planes toNv21() needs
    static bool hasPlanarYuv(const msg::RawFrame& frame);

private:
    static std::size_t copyLuma(const msg::Plane& y, uint32_t width, uint32_t height,
                                uint8_t* dst, std::size_t dst_len, bool& truncated);

    static std::size_t interleaveChroma(const msg::Plane& u, const msg::Plane& v,
                                        uint32_t uv_width, uint32_t uv_height,
                                        uint8_t* dst, std::size_t dst_len, bool& truncated);
};

} // namespace scan

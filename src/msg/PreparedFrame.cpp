#include "msg/PreparedFrame.hpp"

namespace msg {

const char* PixelFormatStr(PixelFormat f) {
    switch (f) {
        case PixelFormat::NV21:     return "NV21";
        case PixelFormat::BGRA8888: return "BGRA8888";
        default:                    return "UNKNOWN";
    }
}

std::size_t expectedByteSize(PixelFormat f, uint32_t w, uint32_t h) {
    switch (f) {
        case PixelFormat::NV21:     return nv21ByteSize(w, h);
        case PixelFormat::BGRA8888: return bgraByteSize(w, h);
        default:                    return 0;
    }
}

bool isConsistent(const PreparedFrame& f) {
    if (f.bytes.size() != expectedByteSize(f.format, f.size.width, f.size.height)) return false;

    // Chroma pairs cover 2x2 luma blocks; odd sides misalign every chroma row.
    if (f.format == PixelFormat::NV21 && ((f.size.width | f.size.height) & 1u)) return false;

    const PixelRect& r = f.crop_rect;
    if (r.width == 0 || r.height == 0) return false;
    if (uint64_t(r.x) + r.width  > f.original_size.width)  return false;
    if (uint64_t(r.y) + r.height > f.original_size.height) return false;

    return true;
}

} // namespace msg

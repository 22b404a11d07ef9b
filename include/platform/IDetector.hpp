#pragma once
#include <cstdint>
#include <vector>

#include "msg/PreparedFrame.hpp"
#include "msg/Detection.hpp"

namespace platform {

// Pattern-detection engine. Consumes a prepared buffer (format, row stride
// and size travel with it) and the rotation needed to make it upright.
// Implementations may return false or throw std::exception on failure;
// callers treat both as "no detection this frame".
class IDetector {
public:
    virtual bool detect(const msg::PreparedFrame& frame,
                        int32_t rotation_deg,
                        std::vector<msg::DetectionResult>& out) = 0;
    virtual ~IDetector() = default;
};

} // namespace platform

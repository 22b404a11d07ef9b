#pragma once
#include <cstdint>
#include <vector>

#include "platform/IDetector.hpp"

namespace platform {

// ------------------------------
// OpenCvQrDetector: IDetector backed by cv::QRCodeDetector (multi-decode).
// Works on luma only: the NV21 Y plane is wrapped without a copy, BGRA is
// converted to grayscale. The image is turned upright by 'rotation_deg'
// (multiples of 90) before decoding; corners are reported back in
// prepared-frame pixels.
// ------------------------------
class OpenCvQrDetector : public IDetector {
public:
    OpenCvQrDetector() = default;

    bool detect(const msg::PreparedFrame& frame,
                int32_t rotation_deg,
                std::vector<msg::DetectionResult>& out) override;

    enum class Status : uint8_t {
        OK = 0,
        BAD_FRAME,       // buffer inconsistent with its geometry
        CV_EXCEPTION,    // OpenCV threw
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    bool fail(Status s);

    Status m_status = Status::OK;
};

} // namespace platform

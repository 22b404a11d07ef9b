// OpenCvQrDetector.cpp
#include "platform/linux/OpenCvQrDetector.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>

#include <iostream>
#include <string>

namespace {

// Quarter turns clockwise needed to make the image upright, in [0,3].
static int quarterTurns(int32_t rotation_deg) {
    int32_t d = rotation_deg % 360;
    if (d < 0) d += 360;
    return static_cast<int>(((d + 45) / 90) % 4);
}

// Point in the upright image -> point in the unrotated (prepared) image of
// size w x h.
static cv::Point2f unrotate(const cv::Point2f& p, int turns, int w, int h) {
    switch (turns) {
        case 1:  return cv::Point2f(p.y, float(h - 1) - p.x);
        case 2:  return cv::Point2f(float(w - 1) - p.x, float(h - 1) - p.y);
        case 3:  return cv::Point2f(float(w - 1) - p.y, p.x);
        default: return p;
    }
}

} // anonymous namespace

namespace platform {

bool OpenCvQrDetector::detect(const msg::PreparedFrame& frame,
                              int32_t rotation_deg,
                              std::vector<msg::DetectionResult>& out) {
    out.clear();
    m_status = Status::OK;

    const int w = static_cast<int>(frame.size.width);
    const int h = static_cast<int>(frame.size.height);
    if (w <= 0 || h <= 0 || frame.bytes.empty()) return fail(Status::BAD_FRAME);

    try {
        cv::Mat gray;
        if (frame.format == msg::PixelFormat::NV21) {
            if (frame.bytes.size() < std::size_t(frame.row_stride) * h ||
                frame.row_stride < static_cast<uint32_t>(w)) {
                return fail(Status::BAD_FRAME);
            }
            // Y plane view; OpenCV never writes through it.
            gray = cv::Mat(h, w, CV_8UC1,
                           const_cast<uint8_t*>(frame.bytes.data()),
                           frame.row_stride);
        } else if (frame.format == msg::PixelFormat::BGRA8888) {
            if (frame.bytes.size() < std::size_t(frame.row_stride) * h ||
                frame.row_stride < static_cast<uint32_t>(w) * 4) {
                return fail(Status::BAD_FRAME);
            }
            const cv::Mat bgra(h, w, CV_8UC4,
                               const_cast<uint8_t*>(frame.bytes.data()),
                               frame.row_stride);
            cv::cvtColor(bgra, gray, cv::COLOR_BGRA2GRAY);
        } else {
            return fail(Status::BAD_FRAME);
        }

        const int turns = quarterTurns(rotation_deg);
        cv::Mat upright;
        switch (turns) {
            case 1:  cv::rotate(gray, upright, cv::ROTATE_90_CLOCKWISE);        break;
            case 2:  cv::rotate(gray, upright, cv::ROTATE_180);                 break;
            case 3:  cv::rotate(gray, upright, cv::ROTATE_90_COUNTERCLOCKWISE); break;
            default: upright = gray;                                            break;
        }

        cv::QRCodeDetector qr;
        std::vector<std::string> decoded;
        std::vector<cv::Point2f> corners;   // 4 per code
        if (!qr.detectAndDecodeMulti(upright, decoded, corners)) {
            return true;   // nothing in view is not a failure
        }

        out.reserve(decoded.size());
        for (std::size_t i = 0; i < decoded.size(); ++i) {
            msg::DetectionResult r{};
            r.raw_value = decoded[i];

            if (corners.size() >= (i + 1) * 4) {
                for (std::size_t k = 0; k < 4; ++k) {
                    const cv::Point2f p = unrotate(corners[i * 4 + k], turns, w, h);
                    r.corners[k].u_px = p.x;
                    r.corners[k].v_px = p.y;
                }
                r.corner_count = 4;
            }
            out.push_back(r);
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[QR] OpenCV error on frame " << frame.frame_id << ": " << e.what() << "\n";
        out.clear();
        return fail(Status::CV_EXCEPTION);
    }

    return true;
}

// FDIR

bool OpenCvQrDetector::fail(Status s) {
    m_status = s;
    return false;
}

const char* OpenCvQrDetector::StatusStr(OpenCvQrDetector::Status s) {
    switch (s) {
        case OpenCvQrDetector::Status::OK:           return "OK";
        case OpenCvQrDetector::Status::BAD_FRAME:    return "BAD_FRAME";
        case OpenCvQrDetector::Status::CV_EXCEPTION: return "CV_EXCEPTION";
        default:                                     return "UNKNOWN";
    }
}

} // namespace platform

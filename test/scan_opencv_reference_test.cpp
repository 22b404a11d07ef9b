// test/scan_opencv_reference_test.cpp
//
// Cross-checks against OpenCV: NV21 output vs cv::cvtColor I420/NV21,
// ImageFileSource layouts through FramePipeline, OpenCvQrDetector on real
// and degenerate frames, V4L2 open failure.

#include <algorithm>
#include <array>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <opencv2/opencv.hpp>

#include "apps/scan/FramePipeline.hpp"
#include "apps/scan/PixelFormatConverter.hpp"
#include "platform/linux/ImageFileSource.hpp"
#include "platform/linux/OpenCvQrDetector.hpp"
#include "platform/linux/V4l2FrameSource.hpp"

#include "scan_test_frames.hpp"

using scantest::check;

static const char* kImagePath = "/tmp/scan_opencv_reference_test.png";

// Smooth colour gradient with some texture, even size.
static cv::Mat makeImage(int w, int h) {
    cv::Mat img(h, w, CV_8UC3);
    for (int r = 0; r < h; ++r) {
        for (int c = 0; c < w; ++c) {
            img.at<cv::Vec3b>(r, c) = cv::Vec3b(
                static_cast<uint8_t>((c * 255) / w),
                static_cast<uint8_t>((r * 255) / h),
                static_cast<uint8_t>(((r + c) * 7) & 0xFF));
        }
    }
    return img;
}

// I420 (Y, U, V planes) -> NV21 (Y, then V,U pairs) by hand.
static std::vector<uint8_t> i420ToNv21(const cv::Mat& i420, int w, int h) {
    const uint8_t* y = i420.ptr<uint8_t>();
    const std::size_t luma = std::size_t(w) * h;
    const std::size_t quarter = luma / 4;
    const uint8_t* u = y + luma;
    const uint8_t* v = u + quarter;

    std::vector<uint8_t> out(y, y + luma);
    for (std::size_t i = 0; i < quarter; ++i) {
        out.push_back(v[i]);
        out.push_back(u[i]);
    }
    return out;
}

static bool startAndGrab(platform::ImageFileSource& src, msg::RawFrame& f) {
    if (!src.Start()) {
        std::cout << "  start failed: " << platform::ImageFileSource::StatusStr(src.lastStatus()) << "\n";
        return false;
    }
    return src.Dequeue(f);
}

int main() {
    std::cout << "=== scan_opencv_reference_test ===\n";

    const int W = 320;
    const int H = 240;
    const cv::Mat bgr = makeImage(W, H);
    check("reference image written", cv::imwrite(kImagePath, bgr));

    cv::Mat i420;
    cv::cvtColor(bgr, i420, cv::COLOR_BGR2YUV_I420);
    const std::vector<uint8_t> ref_nv21 = i420ToNv21(i420, W, H);

    {
        std::cout << "\n[Test 1] Planar source: NV21 equals the OpenCV I420 repacked\n";
        platform::ImageFileSourceConfig cfg{};
        cfg.path = kImagePath;
        cfg.frame_period_ms = 0;
        cfg.row_padding = 24;
        platform::ImageFileSource src(cfg);

        msg::RawFrame f{};
        check("source started and frame dequeued", startAndGrab(src, f));
        check("geometry", f.width == uint32_t(W) && f.height == uint32_t(H) && f.plane_count == 3);

        std::vector<uint8_t> out;
        scan::ConvertReport rep{};
        check("toNv21() ok", scan::PixelFormatConverter::toNv21(f, out, rep));
        check("bytes equal the I420 repack", out == ref_nv21);
        check("not truncated", !rep.truncated);

        // OpenCV decodes both buffers to the same picture
        cv::Mat nv21(H * 3 / 2, W, CV_8UC1, out.data());
        cv::Mat from_nv21;
        cv::Mat from_i420;
        cv::cvtColor(nv21, from_nv21, cv::COLOR_YUV2BGR_NV21);
        cv::cvtColor(i420, from_i420, cv::COLOR_YUV2BGR_I420);
        check("COLOR_YUV2BGR_NV21 == COLOR_YUV2BGR_I420",
              cv::norm(from_nv21, from_i420, cv::NORM_INF) == 0.0);

        src.Stop();
        check("stopped", !src.IsRunning());
    }

    {
        std::cout << "\n[Test 2] Semi-planar chroma views\n";
        platform::ImageFileSourceConfig cfg{};
        cfg.path = kImagePath;
        cfg.frame_period_ms = 0;
        cfg.semi_planar_chroma = true;

        cfg.row_padding = 16;
        platform::ImageFileSource padded(cfg);
        msg::RawFrame f{};
        std::vector<uint8_t> out;
        scan::ConvertReport rep{};
        check("padded: dequeued", startAndGrab(padded, f));
        check("padded: exact", scan::PixelFormatConverter::toNv21(f, out, rep) && out == ref_nv21);

        cfg.row_padding = 0;
        platform::ImageFileSource tight(cfg);
        check("tight: dequeued", startAndGrab(tight, f));
        check("tight: toNv21() ok", scan::PixelFormatConverter::toNv21(f, out, rep));
        check("tight: all but the last V,U pair exact",
              out.size() == ref_nv21.size() &&
              std::equal(out.begin(), out.end() - 2, ref_nv21.begin()));
        check("tight: reported truncated", rep.truncated);
    }

    {
        std::cout << "\n[Test 3] BGRA source through FramePipeline, ROI 100\n";
        platform::ImageFileSourceConfig cfg{};
        cfg.path = kImagePath;
        cfg.frame_period_ms = 0;
        cfg.layout = msg::PixelLayout::PACKED_BGRA;
        cfg.row_padding = 32;
        platform::ImageFileSource src(cfg);

        msg::RawFrame f{};
        check("dequeued", startAndGrab(src, f));

        scan::FramePipelineConfig pcfg{};
        pcfg.process_every_nth_frame = 1;
        pcfg.roi_side_px = 100;
        scan::FramePipeline pipe(pcfg);

        msg::PreparedFrame out{};
        check("process() ok", pipe.process(f, out));
        check("crop (110,70,100,100)", out.crop_rect == msg::PixelRect{110, 70, 100, 100});

        cv::Mat bgra;
        cv::cvtColor(bgr, bgra, cv::COLOR_BGR2BGRA);
        const cv::Mat want = bgra(cv::Rect(110, 70, 100, 100)).clone();
        const cv::Mat got(100, 100, CV_8UC4, out.bytes.data(), out.row_stride);
        check("crop equals the OpenCV sub-image", cv::norm(got, want, cv::NORM_INF) == 0.0);
    }

    {
        std::cout << "\n[Test 4] ImageFileSource failures\n";
        platform::ImageFileSourceConfig cfg{};
        cfg.path = "/tmp/does_not_exist_scanprep.png";
        platform::ImageFileSource src(cfg);
        msg::RawFrame f{};
        check("Dequeue() before Start() -> false", !src.Dequeue(f));
        check("NOT_RUNNING", src.lastStatus() == platform::ImageFileSource::Status::NOT_RUNNING);
        check("missing file -> Start() false", !src.Start());
        check("LOAD_FAIL", src.lastStatus() == platform::ImageFileSource::Status::LOAD_FAIL);

        cfg.path = kImagePath;
        cfg.layout = msg::PixelLayout::UNKNOWN;
        platform::ImageFileSource unknown(cfg);
        check("unknown layout -> Start() false", !unknown.Start());
        check("UNSUPPORTED_LAYOUT",
              unknown.lastStatus() == platform::ImageFileSource::Status::UNSUPPORTED_LAYOUT);
    }

    {
        std::cout << "\n[Test 5] OpenCvQrDetector on degenerate frames\n";
        platform::OpenCvQrDetector det;
        std::vector<msg::DetectionResult> results;

        msg::PreparedFrame empty{};
        check("empty frame -> false", !det.detect(empty, 0, results));
        check("BAD_FRAME", det.lastStatus() == platform::OpenCvQrDetector::Status::BAD_FRAME);

        msg::PreparedFrame short_nv21{};
        short_nv21.size = {64, 64};
        short_nv21.row_stride = 64;
        short_nv21.bytes.assign(64 * 10, 0);
        check("short buffer -> false", !det.detect(short_nv21, 0, results));

        msg::PreparedFrame blank{};
        blank.size = {200, 200};
        blank.row_stride = 200;
        blank.bytes.assign(msg::nv21ByteSize(200, 200), 128);
        check("blank frame -> true", det.detect(blank, 90, results));
        check("no results", results.empty());
        check("status OK", det.lastStatus() == platform::OpenCvQrDetector::Status::OK);
    }

#if CV_VERSION_MAJOR > 4 || (CV_VERSION_MAJOR == 4 && CV_VERSION_MINOR >= 5)
    {
        std::cout << "\n[Test 6] OpenCvQrDetector decodes an encoded code, upright and turned\n";
        cv::Mat code;
        cv::QRCodeEncoder::create()->encode("scanprep", code);
        cv::Mat big;
        cv::resize(code, big, cv::Size(), 8.0, 8.0, cv::INTER_NEAREST);

        cv::Mat canvas(320, 320, CV_8UC1, cv::Scalar(255));
        const int off_x = (canvas.cols - big.cols) / 2;
        const int off_y = (canvas.rows - big.rows) / 2;
        big.copyTo(canvas(cv::Rect(off_x, off_y, big.cols, big.rows)));

        auto asNv21 = [](const cv::Mat& gray) {
            msg::PreparedFrame f{};
            f.size = {uint32_t(gray.cols), uint32_t(gray.rows)};
            f.row_stride = uint32_t(gray.cols);
            f.bytes.assign(msg::nv21ByteSize(f.size.width, f.size.height), 128);
            for (int r = 0; r < gray.rows; ++r) {
                std::memcpy(f.bytes.data() + std::size_t(r) * gray.cols, gray.ptr<uint8_t>(r), gray.cols);
            }
            return f;
        };

        platform::OpenCvQrDetector det;
        std::vector<msg::DetectionResult> results;

        check("upright: detect() ok", det.detect(asNv21(canvas), 0, results));
        check("upright: decoded", results.size() == 1 && results[0].raw_value == "scanprep");

        // Stored turned a quarter counter-clockwise; 90 makes it upright again.
        cv::Mat turned;
        cv::rotate(canvas, turned, cv::ROTATE_90_COUNTERCLOCKWISE);
        check("turned: detect() ok", det.detect(asNv21(turned), 90, results));
        check("turned: decoded", results.size() == 1 && results[0].raw_value == "scanprep");

        bool corners_inside = !results.empty() && results[0].corner_count == 4;
        for (const msg::Point2f& p : results.empty() ? std::array<msg::Point2f, 4>{} : results[0].corners) {
            corners_inside = corners_inside &&
                p.u_px >= off_x - 4 && p.u_px <= off_x + big.cols + 4 &&
                p.v_px >= off_y - 4 && p.v_px <= off_y + big.rows + 4;
        }
        check("turned: corners on the code in stored coordinates", corners_inside);
    }
#endif

    {
        std::cout << "\n[Test 7] V4L2 source on a missing device\n";
        platform::V4l2SourceConfig cfg{};
        cfg.dev = "/dev/does_not_exist_scanprep";
        platform::V4l2FrameSource src(cfg);
        check("Start() -> false", !src.Start());
        check("OPEN_FAIL", src.lastStatus() == platform::V4l2FrameSource::Status::OPEN_FAIL);
        check("not running", !src.IsRunning());
        msg::RawFrame f{};
        check("Dequeue() -> false", !src.Dequeue(f));
        src.Stop();
    }

    return scantest::finish("scan_opencv_reference_test");
}

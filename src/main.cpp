// scanprep: runs a capture source through the scan pipeline and renders
// the last overlay rectangle and detections onto a preview image.
#include <opencv2/opencv.hpp>

#include <linux/videodev2.h>

#include <iostream>
#include <memory>
#include <string>

#include "os/rtos.hpp"

#include "platform/IFrameSource.hpp"
#include "platform/linux/ImageFileSource.hpp"
#include "platform/linux/V4l2FrameSource.hpp"
#include "platform/linux/OpenCvQrDetector.hpp"

#include "apps/scan/ScanTask.hpp"

struct Args {
    std::string image;                 // still image source
    std::string dev;                   // V4L2 source (takes precedence)
    std::string layout = "yuv";        // yuv | bgra
    uint32_t every = 3;
    uint32_t roi = 600;                // 0 = full frame
    int32_t rotation = 90;
    uint32_t frames = 30;              // stop after this many prepared frames
    uint32_t padding = 0;
    bool semi_planar = false;
    std::string out = "scanprep_preview.png";
};

static void print_usage(const char* exe) {
    std::cerr
        << "Usage:\n"
        << "  " << exe << " (--image <FILE> | --dev <NODE>) [--layout yuv|bgra] [--every N] [--roi PX]\n"
        << "         [--rotation DEG] [--frames N] [--padding BYTES] [--semi_planar 0|1] [--out FILE]\n"
        << "\nExample:\n"
        << "  " << exe << " --image qr.png --layout yuv --every 3 --roi 600 --rotation 90\n";
}

static bool parse_args(int argc, char** argv, Args& out) {
    if (argc < 3) return false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        auto need_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        const char* v = nullptr;
        if (a == "--image") {
            if (!(v = need_value("--image"))) return false;
            out.image = v;
        } else if (a == "--dev") {
            if (!(v = need_value("--dev"))) return false;
            out.dev = v;
        } else if (a == "--layout") {
            if (!(v = need_value("--layout"))) return false;
            out.layout = v;
        } else if (a == "--every") {
            if (!(v = need_value("--every"))) return false;
            out.every = static_cast<uint32_t>(std::stoul(v));
        } else if (a == "--roi") {
            if (!(v = need_value("--roi"))) return false;
            out.roi = static_cast<uint32_t>(std::stoul(v));
        } else if (a == "--rotation") {
            if (!(v = need_value("--rotation"))) return false;
            out.rotation = static_cast<int32_t>(std::stoi(v));
        } else if (a == "--frames") {
            if (!(v = need_value("--frames"))) return false;
            out.frames = static_cast<uint32_t>(std::stoul(v));
        } else if (a == "--padding") {
            if (!(v = need_value("--padding"))) return false;
            out.padding = static_cast<uint32_t>(std::stoul(v));
        } else if (a == "--semi_planar") {
            if (!(v = need_value("--semi_planar"))) return false;
            out.semi_planar = (std::stoi(v) != 0);
        } else if (a == "--out") {
            if (!(v = need_value("--out"))) return false;
            out.out = v;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            return false;
        }
    }

    if (out.image.empty() && out.dev.empty()) return false;
    if (out.layout != "yuv" && out.layout != "bgra") return false;
    return true;
}

// Camera pixel -> upright preview pixel, for a sensor rotated by 'turns'
// quarter turns clockwise. w,h: camera frame size.
static cv::Point2f toPreview(cv::Point2f p, int turns, int w, int h) {
    switch (turns) {
        case 1:  return cv::Point2f(float(h - 1) - p.y, p.x);
        case 2:  return cv::Point2f(float(w - 1) - p.x, float(h - 1) - p.y);
        case 3:  return cv::Point2f(p.y, float(w - 1) - p.x);
        default: return p;
    }
}

static int quarterTurns(int32_t deg) {
    int32_t d = deg % 360;
    if (d < 0) d += 360;
    return static_cast<int>(((d + 45) / 90) % 4);
}

static void render(const Args& args, const cv::Mat& camera_bgr,
                   bool have_overlay, const msg::NormRect& overlay,
                   bool have_batch, const msg::DetectionBatch& batch) {
    const int turns = quarterTurns(args.rotation);

    cv::Mat preview;
    switch (turns) {
        case 1:  cv::rotate(camera_bgr, preview, cv::ROTATE_90_CLOCKWISE);        break;
        case 2:  cv::rotate(camera_bgr, preview, cv::ROTATE_180);                 break;
        case 3:  cv::rotate(camera_bgr, preview, cv::ROTATE_90_COUNTERCLOCKWISE); break;
        default: preview = camera_bgr.clone();                                    break;
    }

    // Overlay rect is normalized: scale to whatever the preview is.
    if (have_overlay) {
        const cv::Point tl(int(overlay.left * preview.cols), int(overlay.top * preview.rows));
        const cv::Point br(int(overlay.right * preview.cols), int(overlay.bottom * preview.rows));
        cv::rectangle(preview, tl, br, cv::Scalar(0, 255, 0), 3);
    }

    if (have_batch) {
        for (const msg::DetectionResult& r : batch.results) {
            if (r.corner_count < 4) continue;
            std::vector<cv::Point> poly;
            for (uint8_t k = 0; k < r.corner_count; ++k) {
                const cv::Point2f cam(r.corners[k].u_px + float(batch.crop_rect.x),
                                      r.corners[k].v_px + float(batch.crop_rect.y));
                poly.push_back(toPreview(cam, turns, camera_bgr.cols, camera_bgr.rows));
            }
            cv::polylines(preview, poly, true, cv::Scalar(0, 0, 255), 2);
            if (!r.raw_value.empty()) {
                cv::putText(preview, r.raw_value, poly[0], cv::FONT_HERSHEY_SIMPLEX,
                            0.7, cv::Scalar(0, 0, 255), 2);
            }
        }
    }

    if (!cv::imwrite(args.out, preview)) {
        std::cerr << "[MAIN] could not write " << args.out << "\n";
        return;
    }
    std::cout << "[MAIN] preview written to " << args.out << "\n";
}

int main(int argc, char** argv) {
    Args args;
    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad argument value: " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    const msg::PixelLayout layout = (args.layout == "bgra")
                                  ? msg::PixelLayout::PACKED_BGRA
                                  : msg::PixelLayout::YUV420_PLANAR;

    // ---- Source ----
    std::unique_ptr<platform::IFrameSource> source;
    cv::Mat camera_bgr;

    if (!args.dev.empty()) {
        platform::V4l2SourceConfig cfg{};
        cfg.dev = args.dev.c_str();
        cfg.v4l2_pixfmt = (layout == msg::PixelLayout::PACKED_BGRA) ? V4L2_PIX_FMT_XBGR32
                                                                    : V4L2_PIX_FMT_YUV420;
        cfg.sensor_orientation_deg = args.rotation;
        source = std::make_unique<platform::V4l2FrameSource>(cfg);
    } else {
        platform::ImageFileSourceConfig cfg{};
        cfg.path = args.image;
        cfg.layout = layout;
        cfg.row_padding = args.padding;
        cfg.semi_planar_chroma = args.semi_planar;
        cfg.sensor_orientation_deg = args.rotation;
        source = std::make_unique<platform::ImageFileSource>(cfg);

        camera_bgr = cv::imread(args.image, cv::IMREAD_COLOR);
        if (camera_bgr.empty()) {
            std::cerr << "[MAIN] could not load " << args.image << "\n";
            return 1;
        }
        // Same even crop the source applies
        camera_bgr = camera_bgr(cv::Rect(0, 0, camera_bgr.cols & ~1, camera_bgr.rows & ~1)).clone();
    }

    // ---- Scan ----
    scan::ScanTaskConfig scan_cfg{};
    scan_cfg.pipeline.process_every_nth_frame = args.every;
    scan_cfg.pipeline.roi_side_px = args.roi;

    scan::ScanTask scan_task(scan_cfg);
    platform::OpenCvQrDetector detector;

    // ---- Queues ----
    platform::LiveFrameQueue    live_q{/*overwrite=*/true};
    platform::ReleaseFrameQueue release_q{/*overwrite=*/false};
    scan::OverlayQueue          overlay_q{/*overwrite=*/true};
    scan::DetectionQueue        det_q{/*overwrite=*/true};

    platform::IFrameSource::TaskCtx source_ctx{};
    source_ctx.self       = source.get();
    source_ctx.live_out   = &live_q;
    source_ctx.release_in = &release_q;

    scan::ScanTask::TaskCtx scan_ctx{};
    scan_ctx.self        = &scan_task;
    scan_ctx.live_in     = &live_q;
    scan_ctx.release_out = &release_q;
    scan_ctx.overlay_out = &overlay_q;
    scan_ctx.det_out     = &det_q;
    scan_ctx.detector    = &detector;

    Rtos::Task source_task;
    Rtos::Task scanner_task;

    if (!source_task.Create("FrameSource", platform::IFrameSource::TaskEntry, &source_ctx)) {
        return 1;
    }
    if (!scanner_task.Create("Scan", scan::ScanTask::TaskEntry, &scan_ctx)) {
        source->RequestStop();
        source_task.Join();
        return 1;
    }

    // ---- Monitor ----
    bool have_overlay = false;
    msg::NormRect overlay{};
    bool have_batch = false;
    msg::DetectionBatch batch{};

    uint32_t idle_ticks = 0;
    uint32_t last_prepared = 0;
    while (scan_task.counters().prepared < args.frames) {
        msg::OverlayUpdate u{};
        if (overlay_q.receive(u, 100)) {
            if (u.action == msg::OverlayAction::SHOW) {
                have_overlay = true;
                overlay = u.rect;
                std::cout << "[MAIN] overlay SHOW id=" << u.frame_id
                          << " ltrb=(" << u.rect.left << ", " << u.rect.top << ", "
                          << u.rect.right << ", " << u.rect.bottom << ")\n";
            } else if (u.action == msg::OverlayAction::HIDE) {
                have_overlay = false;
                std::cout << "[MAIN] overlay HIDE id=" << u.frame_id << "\n";
            }
        }

        msg::DetectionBatch b{};
        if (det_q.try_receive(b) && !b.results.empty()) {
            batch = b;
            have_batch = true;
        }

        // Give up if nothing gets prepared for ~5 s (dead source, bad frames).
        const uint32_t prepared = scan_task.counters().prepared;
        if (prepared != last_prepared) {
            last_prepared = prepared;
            idle_ticks = 0;
        } else if (++idle_ticks > 50) {
            std::cerr << "[MAIN] no frames prepared, giving up\n";
            break;
        }
    }

    scan_task.RequestStop();
    scanner_task.Join();
    source->RequestStop();
    source_task.Join();

    const scan::ScanTask::Counters sc = scan_task.counters();
    const scan::FramePipeline::Counters pc = scan_task.pipeline().counters();
    std::cout << "[MAIN] received=" << sc.received
              << " prepared=" << sc.prepared
              << " busy=" << pc.busy
              << " throttled=" << pc.throttled
              << " faulted=" << pc.faulted
              << " detections=" << sc.detections
              << " detector_failures=" << sc.detector_failures << "\n";

    if (camera_bgr.empty()) {
        // Device source: no still to draw on, use a blank canvas of the
        // camera's size.
        auto* v4l2 = static_cast<platform::V4l2FrameSource*>(source.get());
        const int w = static_cast<int>(v4l2->negotiatedWidth());
        const int h = static_cast<int>(v4l2->negotiatedHeight());
        if (w <= 0 || h <= 0) return 1;
        camera_bgr = cv::Mat::zeros(h, w, CV_8UC3);
    }

    try {
        render(args, camera_bgr, have_overlay, overlay, have_batch, batch);
    } catch (const cv::Exception& e) {
        std::cerr << "[MAIN] render failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "platform/IFrameSource.hpp"

namespace platform {

struct ImageFileSourceConfig {
    std::string path;

    // YUV420_PLANAR (Android-style 3 planes) or PACKED_BGRA (iOS-style)
    msg::PixelLayout layout = msg::PixelLayout::YUV420_PLANAR;

    // Extra bytes at the end of every row, as camera HALs add for alignment.
    uint32_t row_padding = 0;

    // YUV420 only: deliver chroma as two overlapping views into one
    // interleaved V,U buffer with pixel stride 2 (each view one byte short),
    // the layout most Android devices report.
    bool semi_planar_chroma = false;

    // Pace Dequeue() like a camera [ms]. 0 = as fast as possible.
    uint32_t frame_period_ms = 33;

    int32_t sensor_orientation_deg = 90;
};

// ------------------------------
// ImageFileSource: replays one still image as an endless camera stream.
// The image is loaded and laid out once in Start(); every Dequeue() lends
// out views of the same immutable buffers, so Release() has nothing to do.
// ------------------------------
class ImageFileSource : public IFrameSource {
public:
    explicit ImageFileSource(const ImageFileSourceConfig& cfg);
    ~ImageFileSource() override;

    bool Start() override;
    void Stop() override;
    bool IsRunning() const override { return m_running.load(); }

    bool Dequeue(msg::RawFrame& out) override;
    bool Release(const msg::RawFrame& frame) override;

    int32_t SensorOrientation() const override { return m_cfg.sensor_orientation_deg; }

    uint32_t width()  const { return m_width; }
    uint32_t height() const { return m_height; }

    enum class Status : uint8_t {
        OK = 0,
        LOAD_FAIL,          // file missing or not an image
        BAD_GEOMETRY,       // smaller than 2x2
        CONVERT_FAIL,       // OpenCV colour conversion threw
        UNSUPPORTED_LAYOUT,
        NOT_RUNNING,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    bool layoutPlanar(const std::vector<uint8_t>& i420);
    bool layoutPacked(const std::vector<uint8_t>& bgra);

    bool fail(Status s);

    ImageFileSourceConfig m_cfg{};

    uint32_t m_width  = 0;
    uint32_t m_height = 0;

    // Backing storage for the plane views
    std::vector<uint8_t> m_y;
    std::vector<uint8_t> m_u;
    std::vector<uint8_t> m_v;
    std::vector<uint8_t> m_vu;      // semi-planar chroma
    std::vector<uint8_t> m_bgra;

    msg::RawFrame m_template{};     // planes + geometry, copied per Dequeue()

    uint32_t m_frame_id = 0;
    std::atomic<bool> m_running{false};

    // FDIR
    Status m_status = Status::OK;
};

} // namespace platform

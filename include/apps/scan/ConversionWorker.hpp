#pragma once
#include <atomic>
#include <cstdint>
#include <vector>

#include "os/rtos.hpp"
#include "msg/RawFrame.hpp"
#include "apps/scan/PixelFormatConverter.hpp"

namespace scan {

// ---------------------------------------------------------------------------
// ConversionWorker: runs YUV->NV21 conversions on a dedicated task so the
// caller's thread only waits instead of doing the pixel work.
//
// Fire-and-await, one job in flight: Convert() hands a job to the worker
// and blocks on a completion semaphore. Concurrent Convert() calls queue
// up on m_submit: FramePipeline's gate is normally the only caller, but a
// gate reset() can let a second frame in while one is still converting.
//
// Buffers are passed by pointer, no copy: the RawFrame stays borrowed for
// the whole call because the caller is blocked until the worker is done.
// ---------------------------------------------------------------------------
class ConversionWorker {
public:
    ConversionWorker() = default;
    ~ConversionWorker();

    ConversionWorker(const ConversionWorker&) = delete;
    ConversionWorker& operator=(const ConversionWorker&) = delete;

    // Spawns the worker task. Returns false if the task could not be created.
    bool Start();

    // Asks the worker to exit and joins it. Safe to call repeatedly, but
    // not concurrently with Convert().
    void Stop();

    bool running() const { return m_running.load(); }

    // Blocks until the worker has converted 'frame' into 'out'.
    // false if the worker is not running, the frame lacks YUV planes, or
    // the conversion threw (e.g. allocation failure).
    bool Convert(const msg::RawFrame& frame, std::vector<uint8_t>& out, ConvertReport& report);

    uint32_t jobsDone() const { return m_jobs_done.load(); }

    // OSAL-compatible entry point
    static void TaskEntry(void* arg);

private:
    struct Job {
        const msg::RawFrame*  frame  = nullptr;
        std::vector<uint8_t>* out    = nullptr;
        ConvertReport*        report = nullptr;
        bool ok   = false;
        bool stop = false;   // sentinel: leave the run loop
    };

    using JobQueue = Rtos::Queue<Job*, 1>;

    void Run();

    Rtos::Mutex           m_submit;   // one job in flight, held until m_done
    JobQueue              m_jobs{/*overwrite=*/false};
    Rtos::BinarySemaphore m_done;
    Rtos::Task            m_task;

    std::atomic<bool>     m_running{false};
    std::atomic<uint32_t> m_jobs_done{0};
};

} // namespace scan

#pragma once
#include <atomic>
#include <cstdint>
#include <cstddef>

#include "os/rtos.hpp"
#include "msg/RawFrame.hpp"

namespace platform {

// ------------------------------
// Queue types (keep them explicit and boring)
// ------------------------------
using LiveFrameQueue = Rtos::Queue<msg::RawFrame, 1>;          // freshest-wins
static constexpr std::size_t RELEASE_Q_CAP = 16;               // >= source buffer count (+ margin)
using ReleaseFrameQueue = Rtos::Queue<msg::RawFrame, RELEASE_Q_CAP>; // Never drop

// ------------------------------
// IFrameSource: camera capture API as seen by the scanner.
// Frames are lent out by Dequeue() and must come back through Release().
// Only the source's own task may call Dequeue()/Release().
// ------------------------------
class IFrameSource {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        IFrameSource*      self       = nullptr;
        LiveFrameQueue*    live_out   = nullptr;
        ReleaseFrameQueue* release_in = nullptr;
    };

public:
    virtual ~IFrameSource() = default;

    virtual bool Start() = 0;
    virtual void Stop()  = 0;
    virtual bool IsRunning() const = 0;

    // One blocking dequeue: fills 'out' as a non-owning view.
    virtual bool Dequeue(msg::RawFrame& out) = 0;

    // Give a dequeued frame's buffer back to the source.
    virtual bool Release(const msg::RawFrame& frame) = 0;

    // Mounting angle of the sensor relative to the display [deg].
    virtual int32_t SensorOrientation() const = 0;

    // Thread loop helper:
    // - drains release_in (buffers the consumer is done with)
    // - dequeues one frame
    // - publishes newest to live_out (overwrite=true); a frame displaced
    //   before anyone consumed it is released straight away
    void Run(LiveFrameQueue& live_out, ReleaseFrameQueue& release_in);

    // Request graceful stop of Run() (thread-safe).
    void RequestStop() { m_stop_requested.store(true); }
    bool StopRequested() const { return m_stop_requested.load(); }

    // OSAL-compatible entry point: Start() + Run() + Stop()
    static void TaskEntry(void* arg);

private:
    void drainReleases(ReleaseFrameQueue& release_in);

    std::atomic<bool> m_stop_requested{false};

    msg::RawFrame m_live{};
    bool m_live_valid = false;
};

} // namespace platform

// IFrameSource.cpp
#include "platform/IFrameSource.hpp"

#include <iostream>

namespace {

// Back-off after a failed dequeue so a dead device does not spin the CPU.
constexpr int DEQUEUE_RETRY_MS = 10;

} // anonymous namespace

namespace platform {

void IFrameSource::Run(LiveFrameQueue& live_out, ReleaseFrameQueue& release_in) {
    m_live_valid = false;

    while (!StopRequested()) {

        // 1) Drain releases (buffers the scanner finished with)
        drainReleases(release_in);

        // 2) Dequeue one fresh frame (blocking)
        msg::RawFrame f{};
        if (!Dequeue(f)) {
            Rtos::SleepMs(DEQUEUE_RETRY_MS);
            continue;
        }

        // 3) Publish newest frame (freshest-wins queue of depth 1).
        // The queue does not hand back what it overwrote, so remember the
        // last published frame and release it ourselves on overwrite.
        (void)live_out.send(f, Rtos::MAX_TIMEOUT);

        if (live_out.wasLastSendOverwritten() && m_live_valid) {
            (void)Release(m_live);
        }

        m_live       = f;
        m_live_valid = true;
    }

    drainReleases(release_in);
}

void IFrameSource::drainReleases(ReleaseFrameQueue& release_in) {
    msg::RawFrame rel{};
    while (release_in.try_receive(rel)) {
        (void)Release(rel);
    }
}

// Static task entry function compatible with OSAL:
//
// OSAL wants:   void (*fn)(void*)
// C++ methods:  need an object (this) to run on
//
// So we pass a small context struct (TaskCtx) through the void*.

void IFrameSource::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);

    // Incomplete wiring or a torn-down source: nothing to do.
    if (!ctx || !ctx->self || !ctx->live_out || !ctx->release_in) {
        return;
    }

    if (!ctx->self->Start()) {
        std::cerr << "[SOURCE] start failed\n";
        return;
    }

    ctx->self->Run(*ctx->live_out, *ctx->release_in);
    ctx->self->Stop();
}

} // namespace platform

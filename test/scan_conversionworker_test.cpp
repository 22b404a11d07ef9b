// test/scan_conversionworker_test.cpp
//
// ConversionWorker: start/stop lifecycle and fire-and-await conversions.

#include <atomic>
#include <iostream>
#include <vector>

#include "os/rtos.hpp"
#include "apps/scan/ConversionWorker.hpp"

#include "scan_test_frames.hpp"

using scan::ConversionWorker;
using scan::ConvertReport;
using scantest::SyntheticYuv;
using scantest::check;

// Several tasks converting their own frame through one worker
struct SubmitterCtx {
    ConversionWorker* worker = nullptr;
    uint32_t width  = 0;
    uint32_t height = 0;
    int calls = 0;
    std::atomic<int>* wrong = nullptr;
};

static void Submitter(void* arg) {
    auto* ctx = static_cast<SubmitterCtx*>(arg);
    SyntheticYuv yuv(ctx->width, ctx->height);
    const std::vector<uint8_t> expected = scantest::expectedNv21(ctx->width, ctx->height);
    for (int i = 0; i < ctx->calls; ++i) {
        std::vector<uint8_t> out;
        ConvertReport rep{};
        if (!ctx->worker->Convert(yuv.raw, out, rep) || out != expected) ctx->wrong->fetch_add(1);
    }
}

int main() {
    std::cout << "=== scan_conversionworker_test ===\n";

    {
        std::cout << "\n[Test 1] Convert() before Start() is refused\n";
        ConversionWorker w;
        SyntheticYuv yuv(16, 8);
        std::vector<uint8_t> out;
        ConvertReport rep{};
        check("not running", !w.running());
        check("Convert() -> false", !w.Convert(yuv.raw, out, rep));
        check("no job ran", w.jobsDone() == 0);
    }

    {
        std::cout << "\n[Test 2] Sequential conversions on the worker task\n";
        ConversionWorker w;
        check("Start()", w.Start());
        check("Start() again is a no-op", w.Start() && w.running());

        bool all_ok = true;
        for (uint32_t i = 0; i < 20; ++i) {
            const uint32_t width  = 16 + 2 * i;
            const uint32_t height = 8 + 2 * i;
            SyntheticYuv yuv(width, height, /*row_padding=*/i % 3, /*semi=*/(i % 2) == 1);
            std::vector<uint8_t> out;
            ConvertReport rep{};
            const bool ok = w.Convert(yuv.raw, out, rep);
            if (!ok || out.size() != msg::nv21ByteSize(width, height)) all_ok = false;
            // Planar and padded semi-planar layouts convert exactly
            if ((i % 2 == 0 || i % 3 != 0) && out != scantest::expectedNv21(width, height)) {
                std::cout << "  mismatch at i=" << i << "\n";
                all_ok = false;
            }
        }
        check("20 conversions with exact output", all_ok);
        check("jobsDone() == 20", w.jobsDone() == 20);

        w.Stop();
        check("stopped", !w.running());
    }

    {
        std::cout << "\n[Test 3] Malformed frame: false, worker keeps serving\n";
        ConversionWorker w;
        check("Start()", w.Start());

        SyntheticYuv bad(16, 8);
        bad.raw.plane_count = 1;
        std::vector<uint8_t> out;
        ConvertReport rep{};
        check("malformed -> false", !w.Convert(bad.raw, out, rep));

        SyntheticYuv good(16, 8);
        check("next frame converts", w.Convert(good.raw, out, rep) && out == scantest::expectedNv21(16, 8));
    }   // destructor stops the worker

    {
        std::cout << "\n[Test 4] Stop() is idempotent and the worker restarts\n";
        ConversionWorker w;
        check("Start()", w.Start());
        w.Stop();
        w.Stop();
        SyntheticYuv yuv(16, 8);
        std::vector<uint8_t> out;
        ConvertReport rep{};
        check("Convert() after Stop() -> false", !w.Convert(yuv.raw, out, rep));
        check("restart", w.Start());
        check("Convert() after restart", w.Convert(yuv.raw, out, rep));
        w.Stop();
    }

    {
        std::cout << "\n[Test 5] Concurrent Convert() calls each get their own result\n";
        ConversionWorker w;
        check("Start()", w.Start());

        std::atomic<int> wrong{0};
        SubmitterCtx ctx[3] = {
            {&w, 64, 48, 40, &wrong},
            {&w, 160, 120, 40, &wrong},
            {&w, 32, 16, 40, &wrong},
        };
        Rtos::Task tasks[3];
        bool created = true;
        for (int i = 0; i < 3; ++i) {
            created = tasks[i].Create("Submitter", Submitter, &ctx[i]) && created;
        }
        check("tasks created", created);
        for (Rtos::Task& t : tasks) t.Join();

        check("120 conversions, all exact", wrong.load() == 0);
        check("jobsDone() == 120", w.jobsDone() == 120);
        w.Stop();
    }

    return scantest::finish("scan_conversionworker_test");
}

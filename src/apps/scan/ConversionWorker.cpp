// ConversionWorker.cpp
#include "apps/scan/ConversionWorker.hpp"

#include <exception>
#include <iostream>

namespace scan {

ConversionWorker::~ConversionWorker() {
    Stop();
}

bool ConversionWorker::Start() {
    if (m_running.load()) return true;

    m_running.store(true);
    if (!m_task.Create("ConversionWorker", &ConversionWorker::TaskEntry, this)) {
        m_running.store(false);
        return false;
    }
    return true;
}

void ConversionWorker::Stop() {
    if (!m_running.exchange(false)) return;

    Job stop{};
    stop.stop = true;
    (void)m_jobs.send(&stop, Rtos::MAX_TIMEOUT);
    m_task.Join();
}

bool ConversionWorker::Convert(const msg::RawFrame& frame,
                               std::vector<uint8_t>& out,
                               ConvertReport& report) {
    if (!m_running.load()) return false;

    // m_done is not tied to a job: the token must be taken by the caller
    // that submitted it.
    Rtos::LockGuard lock(m_submit);

    Job job{};
    job.frame  = &frame;
    job.out    = &out;
    job.report = &report;

    (void)m_jobs.send(&job, Rtos::MAX_TIMEOUT);

    // No cancellation: once submitted the job always completes.
    m_done.take();
    return job.ok;
}

void ConversionWorker::TaskEntry(void* arg) {
    auto* self = static_cast<ConversionWorker*>(arg);
    if (!self) return;
    self->Run();
}

void ConversionWorker::Run() {
    while (true) {
        Job* job = nullptr;
        if (!m_jobs.receive(job, Rtos::MAX_TIMEOUT) || !job) continue;

        if (job->stop) return;

        try {
            job->ok = PixelFormatConverter::toNv21(*job->frame, *job->out, *job->report);
        } catch (const std::exception& e) {
            std::cerr << "[WORKER] conversion failed id=" << job->frame->frame_id
                      << ": " << e.what() << "\n";
            job->ok = false;
        }

        m_jobs_done.fetch_add(1);
        m_done.give();
    }
}

} // namespace scan

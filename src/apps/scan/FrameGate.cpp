// FrameGate.cpp
#include "apps/scan/FrameGate.hpp"

namespace scan {

// -------------------- Pass --------------------

FrameGate::Pass::Pass(Pass&& other) noexcept
: m_gate(other.m_gate)
, m_generation(other.m_generation)
, m_decision(other.m_decision) {
    other.m_gate = nullptr;
}

FrameGate::Pass& FrameGate::Pass::operator=(Pass&& other) noexcept {
    if (this != &other) {
        release();
        m_gate       = other.m_gate;
        m_generation = other.m_generation;
        m_decision   = other.m_decision;
        other.m_gate = nullptr;
    }
    return *this;
}

void FrameGate::Pass::release() {
    if (m_gate) {
        m_gate->releaseGeneration(m_generation);
        m_gate = nullptr;
    }
}

// -------------------- FrameGate --------------------

FrameGate::FrameGate(uint32_t every_nth)
: m_every_nth(every_nth < 1 ? 1 : every_nth) {
}

FrameGate::Decision FrameGate::admit(uint32_t& generation) {
    bool expected = false;
    if (!m_busy.compare_exchange_strong(expected, true,
                                        std::memory_order_acq_rel,
                                        std::memory_order_acquire)) {
        // Busy skips do not advance the counter.
        return Decision::BUSY;
    }

    generation = m_generation.load(std::memory_order_acquire);

    // Only the busy holder touches the counter, so fetch_add is just for
    // visibility against reset().
    const uint32_t position = m_counter.fetch_add(1, std::memory_order_relaxed);
    if ((position % m_every_nth) != 0) {
        m_busy.store(false, std::memory_order_release);
        return Decision::THROTTLED;
    }
    return Decision::ACCEPT;
}

FrameGate::Pass FrameGate::tryAcquire() {
    uint32_t generation = 0;
    const Decision d = admit(generation);
    if (d != Decision::ACCEPT) {
        return Pass(nullptr, 0, d);
    }
    return Pass(this, generation, d);
}

bool FrameGate::shouldProcess() {
    uint32_t generation = 0;
    return admit(generation) == Decision::ACCEPT;
}

void FrameGate::release() {
    m_busy.store(false, std::memory_order_release);
}

void FrameGate::releaseGeneration(uint32_t generation) {
    if (m_generation.load(std::memory_order_acquire) != generation) {
        return; // reset() already cleared our flag; someone else may own it now
    }
    m_busy.store(false, std::memory_order_release);
}

void FrameGate::reset() {
    m_generation.fetch_add(1, std::memory_order_acq_rel);
    m_counter.store(0, std::memory_order_relaxed);
    m_busy.store(false, std::memory_order_release);
}

} // namespace scan

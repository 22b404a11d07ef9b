#pragma once
#include <atomic>
#include <cstdint>

namespace scan {

// ---------------------------------------------------------------------------
// FrameGate: "process every Nth frame" throttle + single busy flag.
//
// A frame is accepted only if no earlier frame is still being prepared and
// its position in the non-busy stream is a multiple of N. Refused frames
// are dropped, never queued. The counter is a plain uint32_t that wraps.
//
// Preferred use is the scoped form:
//
//     FrameGate::Pass pass = gate.tryAcquire();
//     if (!pass) return;      // skipped
//     ...                     // busy until 'pass' goes out of scope
// ---------------------------------------------------------------------------
class FrameGate {
public:
    enum class Decision : uint8_t {
        ACCEPT = 0,
        BUSY,        // previous frame still in flight
        THROTTLED,   // not an Nth frame
    };

    // Move-only token holding the busy flag. Releases on destruction,
    // including during stack unwinding.
    class Pass {
    public:
        Pass() = default;
        ~Pass() { release(); }

        Pass(Pass&& other) noexcept;
        Pass& operator=(Pass&& other) noexcept;

        Pass(const Pass&) = delete;
        Pass& operator=(const Pass&) = delete;

        explicit operator bool() const { return m_gate != nullptr; }
        Decision decision() const { return m_decision; }

        void release();

    private:
        friend class FrameGate;
        Pass(FrameGate* gate, uint32_t generation, Decision d)
        : m_gate(gate), m_generation(generation), m_decision(d) {}

        FrameGate* m_gate       = nullptr;
        uint32_t   m_generation = 0;
        Decision   m_decision   = Decision::BUSY;
    };

public:
    explicit FrameGate(uint32_t every_nth = 1);

    // Scoped acquisition. An empty Pass means "skip this frame".
    Pass tryAcquire();

    // Unscoped form: on true the caller owns the busy flag and must call
    // release(). Prefer tryAcquire().
    bool shouldProcess();
    void release();

    // Forget the frame sequence: the next frame is frame 0 again.
    // Does not wait for an in-flight frame.
    void reset();

    uint32_t interval() const { return m_every_nth; }
    uint32_t counter()  const { return m_counter.load(std::memory_order_relaxed); }
    bool     busy()     const { return m_busy.load(std::memory_order_acquire); }

private:
    Decision admit(uint32_t& generation);
    void releaseGeneration(uint32_t generation);

    uint32_t m_every_nth = 1;

    std::atomic<bool>     m_busy{false};
    std::atomic<uint32_t> m_counter{0};

    // Bumped by reset() so a pass taken before the reset cannot clear the
    // busy flag of a pass taken after it.
    std::atomic<uint32_t> m_generation{0};
};

} // namespace scan

#pragma once
#include <cstddef>
#include <cstdint>

namespace Rtos {

// Pass as timeout_ms to wait without limit.
static constexpr uint32_t MAX_TIMEOUT = 0xFFFFFFFFu;

void SleepMs(int ms);

//== Task ==//
// One thread running fn(arg). A task can be created again once joined.
class Task {
public:
    Task();
    ~Task();   // detaches a task that was never joined

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // false if the thread could not be started or is still running
    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();   // no-op unless a thread is running

    bool Created() const;

private:
    struct TaskHandle;
    TaskHandle* handle_;
};

//== Mutex ==//
class Mutex {
public:
    Mutex();
    ~Mutex();

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock();
    void unlock();

private:
    struct MutexHandle;
    MutexHandle* handle_;
};

// Scoped lock for Rtos::Mutex.
class LockGuard {
public:
    explicit LockGuard(Mutex& m) : m_(m) { m_.lock(); }
    ~LockGuard() { m_.unlock(); }

    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;

private:
    Mutex& m_;
};

//== Binary semaphore ==//
// Starts empty; give() saturates at one.
class BinarySemaphore {
public:
    BinarySemaphore();
    ~BinarySemaphore();

    BinarySemaphore(const BinarySemaphore&) = delete;
    BinarySemaphore& operator=(const BinarySemaphore&) = delete;

    void take();
    bool take(uint32_t timeout_ms);   // false on timeout
    bool try_take();
    void give();

private:
    struct SemaphoreHandle;
    SemaphoreHandle* handle_;
};

//== Counting semaphore ==//
// give() beyond maxCount is refused (and logged).
class CountingSemaphore {
public:
    CountingSemaphore(size_t maxCount, size_t initialCount);
    ~CountingSemaphore();

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    void take();
    bool take(uint32_t timeout_ms);   // false on timeout
    bool try_take();
    void give();

private:
    struct CountingSemHandle;
    CountingSemHandle* handle_;
};

//== Queue ==//
// Fixed capacity ring buffer of T, header-only, built from the OSAL
// Mutex and two counting semaphores (free slots / filled slots) so the same
// code runs over any port of those primitives.
//
// Blocking mode (default): send() waits for a free slot, try_send() fails
// when full.
// Overwrite mode: a send on a full queue evicts the oldest item and never
// blocks. wasLastSendOverwritten() reports an eviction on the last send;
// only meaningful with a single producer.
template <typename T, size_t Capacity>
class Queue {
    static_assert(Capacity > 0, "Queue needs at least one slot");

public:
    explicit Queue(bool overwrite = false) : m_overwrite(overwrite) {}

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    bool send(const T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        m_last_overwritten = false;
        if (!acquireSlot(timeout_ms)) return false;
        push(item);
        return true;
    }

    bool try_send(const T& item) { return send(item, 0); }

    bool receive(T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        const bool got = (timeout_ms == MAX_TIMEOUT) ? (m_filled.take(), true)
                                                     : m_filled.take(timeout_ms);
        if (!got) return false;
        pop(item);
        return true;
    }

    bool try_receive(T& item) {
        if (!m_filled.try_take()) return false;
        pop(item);
        return true;
    }

    bool wasLastSendOverwritten() const { return m_last_overwritten; }

private:
    // On success the caller owns one free slot.
    bool acquireSlot(uint32_t timeout_ms) {
        if (m_free.try_take()) return true;

        if (m_overwrite) {
            // Full: evict the oldest filled slot and reuse it.
            if (m_filled.try_take()) {
                LockGuard g(m_lock);
                m_tail = (m_tail + 1) % Capacity;
                m_last_overwritten = true;
                return true;
            }
            // A consumer is mid-pop; its slot is about to be freed.
            m_free.take();
            return true;
        }

        if (timeout_ms == 0) return false;
        if (timeout_ms == MAX_TIMEOUT) {
            m_free.take();
            return true;
        }
        return m_free.take(timeout_ms);
    }

    void push(const T& item) {
        {
            LockGuard g(m_lock);
            m_buffer[m_head] = item;
            m_head = (m_head + 1) % Capacity;
        }
        m_filled.give();
    }

    void pop(T& item) {
        {
            LockGuard g(m_lock);
            item = m_buffer[m_tail];
            m_tail = (m_tail + 1) % Capacity;
        }
        m_free.give();
    }

    T m_buffer[Capacity];
    size_t m_head = 0;
    size_t m_tail = 0;

    bool m_overwrite = false;
    bool m_last_overwritten = false;

    Mutex m_lock;
    CountingSemaphore m_free{Capacity, Capacity};
    CountingSemaphore m_filled{Capacity, 0};
};

} // namespace Rtos

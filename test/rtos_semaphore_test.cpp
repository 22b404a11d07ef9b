// test/rtos_semaphore_test.cpp
//
// Rtos binary and counting semaphores: non-blocking, timed and cross-task
// take/give.

#include "os/rtos.hpp"
#include <atomic>
#include <iostream>

#include "scan_test_frames.hpp"

using scantest::check;

static Rtos::BinarySemaphore g_sem;
static std::atomic<bool> g_acquired{false};

static void Consumer(void*) {
    // Nothing given yet: must wait for the producer
    if (g_sem.try_take()) return;
    g_acquired.store(g_sem.take(2000));
}

static void Producer(void*) {
    Rtos::SleepMs(50);
    g_sem.give();
}

int main() {
    std::cout << "=== rtos_semaphore_test ===\n";

    {
        std::cout << "\n[Test 1] Binary semaphore, single thread\n";
        Rtos::BinarySemaphore s;
        check("starts empty", !s.try_take());
        check("timed take times out", !s.take(20));
        s.give();
        s.give();   // saturates at 1
        check("take after give", s.try_take());
        check("second take fails", !s.try_take());
    }

    {
        std::cout << "\n[Test 2] Binary semaphore across tasks\n";
        Rtos::Task consumerTask;
        Rtos::Task producerTask;

        const bool created = consumerTask.Create("Consumer", Consumer, nullptr) &&
                             producerTask.Create("Producer", Producer, nullptr);
        check("tasks created", created);
        consumerTask.Join();
        producerTask.Join();
        check("consumer acquired after waiting", g_acquired.load());
    }

    {
        std::cout << "\n[Test 3] Counting semaphore\n";
        Rtos::CountingSemaphore s(/*maxCount=*/3, /*initialCount=*/2);
        check("take 1", s.try_take());
        check("take 2", s.take(0));
        check("empty", !s.try_take() && !s.take(20));
        s.give();
        s.give();
        s.give();
        s.give();   // beyond max is ignored
        check("three available", s.try_take() && s.try_take() && s.try_take());
        check("capped at max", !s.try_take());
    }

    return scantest::finish("rtos_semaphore_test");
}

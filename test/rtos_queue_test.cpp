// test/rtos_queue_test.cpp
//
// Rtos::Queue: FIFO order, blocking hand-off between tasks, and the
// freshest-wins (overwrite) mode used for live frames and overlays.

#include "os/rtos.hpp"
#include <iostream>
#include <vector>

#include "scan_test_frames.hpp"

using scantest::check;

// Define the queue type with int messages and size 5
static Rtos::Queue<int, 5> g_queue;
static std::vector<int> g_received;

static void Producer(void*) {
    for (int i = 1; i <= 20; ++i) {
        g_queue.send(i);  // blocks while the queue is full
    }
}

static void Consumer(void*) {
    Rtos::SleepMs(50);  // let the producer fill the queue first
    for (int i = 1; i <= 20; ++i) {
        int value = 0;
        if (!g_queue.receive(value, 2000)) return;
        g_received.push_back(value);
    }
}

int main() {
    std::cout << "=== rtos_queue_test ===\n";

    {
        std::cout << "\n[Test 1] FIFO order, full and empty edges\n";
        Rtos::Queue<int, 3> q;
        check("send 1", q.send(1, 0));
        check("send 2", q.send(2, 0));
        check("send 3", q.send(3, 0));
        check("try_send on full -> false", !q.try_send(4));
        check("timed send on full -> false", !q.send(4, 20));

        int v = 0;
        check("receive 1", q.receive(v, 0) && v == 1);
        check("receive 2", q.try_receive(v) && v == 2);
        check("receive 3", q.receive(v) && v == 3);
        check("try_receive on empty -> false", !q.try_receive(v));
        check("timed receive on empty -> false", !q.receive(v, 20));
    }

    {
        std::cout << "\n[Test 2] Overwrite mode keeps the newest items\n";
        Rtos::Queue<int, 2> q(/*overwrite=*/true);
        check("send 1", q.send(1) && !q.wasLastSendOverwritten());
        check("send 2", q.send(2) && !q.wasLastSendOverwritten());
        check("send 3 overwrites", q.send(3) && q.wasLastSendOverwritten());
        check("try_send 4 overwrites", q.try_send(4) && q.wasLastSendOverwritten());

        int v = 0;
        check("oldest left is 3", q.try_receive(v) && v == 3);
        check("then 4", q.try_receive(v) && v == 4);
        check("empty", !q.try_receive(v));
        check("send after drain does not overwrite", q.send(5) && !q.wasLastSendOverwritten());
    }

    {
        std::cout << "\n[Test 3] Depth-1 freshest-wins channel\n";
        Rtos::Queue<int, 1> q(/*overwrite=*/true);
        for (int i = 0; i < 10; ++i) (void)q.send(i);
        int v = -1;
        check("only the last value survives", q.try_receive(v) && v == 9 && !q.try_receive(v));
    }

    {
        std::cout << "\n[Test 4] Producer/consumer tasks through a blocking queue\n";
        Rtos::Task producerTask;
        Rtos::Task consumerTask;

        const bool created = producerTask.Create("Producer", Producer, nullptr) &&
                             consumerTask.Create("Consumer", Consumer, nullptr);
        check("tasks created", created);
        producerTask.Join();
        consumerTask.Join();

        bool in_order = g_received.size() == 20;
        for (std::size_t i = 0; in_order && i < g_received.size(); ++i) {
            in_order = g_received[i] == static_cast<int>(i) + 1;
        }
        check("all 20 items received in order", in_order);
    }

    return scantest::finish("rtos_queue_test");
}

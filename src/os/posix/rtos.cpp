// rtos.cpp: POSIX port of the OSAL (pthreads + POSIX semaphores)
#include "os/rtos.hpp"

#include <pthread.h>
#include <semaphore.h>
#include <time.h>
#include <cerrno>
#include <iostream>

namespace Rtos {

namespace {

// CLOCK_REALTIME deadline 'ms' from now, as pthread/sem timed waits expect.
timespec deadlineIn(uint32_t ms) {
    timespec ts{};
    ::clock_gettime(CLOCK_REALTIME, &ts);
    const long long nsec = static_cast<long long>(ts.tv_nsec) +
                           static_cast<long long>(ms % 1000u) * 1000000LL;
    ts.tv_sec  += static_cast<time_t>(ms / 1000u + nsec / 1000000000LL);
    ts.tv_nsec  = static_cast<long>(nsec % 1000000000LL);
    return ts;
}

struct TaskStart {
    void (*fn)(void*);
    void* arg;
};

void* taskTrampoline(void* p) {
    TaskStart start = *static_cast<TaskStart*>(p);
    delete static_cast<TaskStart*>(p);
    start.fn(start.arg);
    return nullptr;
}

} // anonymous namespace

void SleepMs(int ms) {
    if (ms <= 0) return;
    timespec req{};
    req.tv_sec  = ms / 1000;
    req.tv_nsec = static_cast<long>(ms % 1000) * 1000000L;
    while (::nanosleep(&req, &req) != 0 && errno == EINTR) {
    }
}

// =======================
// Task
// =======================

struct Task::TaskHandle {
    pthread_t thread{};
    bool running = false;   // created and not yet joined
};

Task::Task() : handle_(new TaskHandle{}) {}

Task::~Task() {
    if (handle_->running) pthread_detach(handle_->thread);
    delete handle_;
}

bool Task::Create(const char* name, void (*fn)(void*), void* arg) {
    const char* label = name ? name : "?";
    if (handle_->running) {
        std::cerr << "[Task] " << label << " already running\n";
        return false;
    }

    auto* start = new TaskStart{fn, arg};
    const int rc = pthread_create(&handle_->thread, nullptr, taskTrampoline, start);
    if (rc != 0) {
        delete start;
        std::cerr << "[Task] cannot start " << label << " (rc=" << rc << ")\n";
        return false;
    }
    handle_->running = true;
    return true;
}

void Task::Join() {
    if (!handle_->running) return;
    pthread_join(handle_->thread, nullptr);
    handle_->running = false;
}

bool Task::Created() const {
    return handle_->running;
}

// =======================
// Mutex
// =======================

struct Mutex::MutexHandle {
    pthread_mutex_t m;
};

Mutex::Mutex() : handle_(new MutexHandle) {
    if (pthread_mutex_init(&handle_->m, nullptr) != 0) {
        std::cerr << "[Mutex] init failed\n";
    }
}

Mutex::~Mutex() {
    pthread_mutex_destroy(&handle_->m);
    delete handle_;
}

void Mutex::lock()   { pthread_mutex_lock(&handle_->m); }
void Mutex::unlock() { pthread_mutex_unlock(&handle_->m); }

// =======================
// BinarySemaphore: flag + condition variable
// =======================

struct BinarySemaphore::SemaphoreHandle {
    pthread_mutex_t m;
    pthread_cond_t  cv;
    bool given = false;
};

BinarySemaphore::BinarySemaphore() : handle_(new SemaphoreHandle) {
    pthread_mutex_init(&handle_->m, nullptr);
    pthread_cond_init(&handle_->cv, nullptr);
}

BinarySemaphore::~BinarySemaphore() {
    pthread_cond_destroy(&handle_->cv);
    pthread_mutex_destroy(&handle_->m);
    delete handle_;
}

void BinarySemaphore::take() {
    (void)take(MAX_TIMEOUT);
}

bool BinarySemaphore::take(uint32_t timeout_ms) {
    const bool forever = (timeout_ms == MAX_TIMEOUT);
    const timespec deadline = forever ? timespec{} : deadlineIn(timeout_ms);

    pthread_mutex_lock(&handle_->m);
    while (!handle_->given) {
        if (forever) {
            pthread_cond_wait(&handle_->cv, &handle_->m);
        } else if (pthread_cond_timedwait(&handle_->cv, &handle_->m, &deadline) == ETIMEDOUT) {
            break;
        }
    }
    const bool got = handle_->given;
    handle_->given = false;
    pthread_mutex_unlock(&handle_->m);
    return got;
}

bool BinarySemaphore::try_take() {
    pthread_mutex_lock(&handle_->m);
    const bool got = handle_->given;
    handle_->given = false;
    pthread_mutex_unlock(&handle_->m);
    return got;
}

void BinarySemaphore::give() {
    pthread_mutex_lock(&handle_->m);
    handle_->given = true;
    pthread_cond_signal(&handle_->cv);
    pthread_mutex_unlock(&handle_->m);
}

// =======================
// CountingSemaphore: sem_t with a ceiling
// =======================

struct CountingSemaphore::CountingSemHandle {
    sem_t sem;
    unsigned ceiling = 0;
};

CountingSemaphore::CountingSemaphore(size_t maxCount, size_t initialCount)
: handle_(new CountingSemHandle) {
    if (initialCount > maxCount) {
        std::cerr << "[CountingSemaphore] initial " << initialCount
                  << " > max " << maxCount << ", clamped\n";
        initialCount = maxCount;
    }
    handle_->ceiling = static_cast<unsigned>(maxCount);
    if (sem_init(&handle_->sem, 0, static_cast<unsigned>(initialCount)) != 0) {
        std::cerr << "[CountingSemaphore] sem_init failed, errno=" << errno << "\n";
    }
}

CountingSemaphore::~CountingSemaphore() {
    sem_destroy(&handle_->sem);
    delete handle_;
}

void CountingSemaphore::take() {
    (void)take(MAX_TIMEOUT);
}

bool CountingSemaphore::take(uint32_t timeout_ms) {
    const bool forever = (timeout_ms == MAX_TIMEOUT);
    const timespec deadline = forever ? timespec{} : deadlineIn(timeout_ms);

    for (;;) {
        const int rc = forever ? sem_wait(&handle_->sem)
                               : sem_timedwait(&handle_->sem, &deadline);
        if (rc == 0) return true;
        if (errno == EINTR) continue;
        if (errno != ETIMEDOUT) {
            std::cerr << "[CountingSemaphore] wait failed, errno=" << errno << "\n";
        }
        return false;
    }
}

bool CountingSemaphore::try_take() {
    return sem_trywait(&handle_->sem) == 0;
}

void CountingSemaphore::give() {
    int value = 0;
    sem_getvalue(&handle_->sem, &value);
    if (value >= 0 && static_cast<unsigned>(value) >= handle_->ceiling) {
        std::cerr << "[CountingSemaphore] give() at max count ignored\n";
        return;
    }
    sem_post(&handle_->sem);
}

} // namespace Rtos

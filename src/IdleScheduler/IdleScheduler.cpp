#include "IdleScheduler.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <utility>
#include <sched.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>


#ifndef IOPRIO_CLASS_SHIFT
#define IOPRIO_CLASS_SHIFT 13
#define IOPRIO_CLASS_IDLE  3
#define IOPRIO_PRIO_VALUE(class_, data_) (((class_) << IOPRIO_CLASS_SHIFT) | (data_))
#define IOPRIO_WHO_PROCESS 1
#endif


// Desc: get current thread id (TID)
// In: (none)
// Out: pid_t
static inline pid_t gettid_wrap() {
    return static_cast<pid_t>(syscall(SYS_gettid));
}

// Desc: set I/O priority for a process/thread
// In: int which, int who, int ioprio
// Out: int (syscall result)
static inline int ioprio_set_wrap(int which, int who, int ioprio) {
    return static_cast<int>(syscall(SYS_ioprio_set, which, who, ioprio));
}

// Desc: lower calling thread CPU/I/O priority to background
// In: (none)
// Out: void
static void set_thread_background_mode() {
    pid_t tid = gettid_wrap();
    const int io_idle = IOPRIO_PRIO_VALUE(IOPRIO_CLASS_IDLE, 0);
    if (ioprio_set_wrap(IOPRIO_WHO_PROCESS, tid, io_idle) != 0) {
        Logger::warn("IdleScheduler", std::string("ioprio_set(IDLE) failed: ") + std::strerror(errno));
    }

    // sched_setscheduler(0, ...) applies to the calling thread on Linux
    struct sched_param sp; std::memset(&sp, 0, sizeof(sp));
    if (sched_setscheduler(0, SCHED_IDLE, &sp) != 0) {
        if (setpriority(PRIO_PROCESS, static_cast<id_t>(tid), 19) != 0) {
            Logger::warn("IdleScheduler", std::string("setpriority(+19) failed: ") + std::strerror(errno));
        }
    }
}


BackgroundIdleScheduler::~BackgroundIdleScheduler() {
    stop();
}


// Desc: start N background workers (idempotent)
// In: size_t num_workers
// Out: void
void BackgroundIdleScheduler::start(std::size_t num_workers) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (started_) return;
    if (num_workers == 0) num_workers = 1;
    shutdown_ = false;
    started_ = true;
    workers_.reserve(num_workers);
    for (std::size_t i = 0; i < num_workers; ++i) {
        workers_.emplace_back(&BackgroundIdleScheduler::worker_loop, this);
    }
}


// Desc: signal shutdown, let workers drain the queue, join them
// In: (none)
// Out: void
void BackgroundIdleScheduler::stop() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!started_) return;
        shutdown_ = true;
        workers.swap(workers_);
    }
    cv_.notify_all();
    for (auto& th : workers) {
        if (th.joinable()) th.join();
    }
    std::lock_guard<std::mutex> lk(mtx_);
    started_ = false;
}


bool BackgroundIdleScheduler::running() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return started_ && !shutdown_;
}


// Desc: enqueue a task for the next free background worker
// In: Task task
// Out: bool (false if not started or shutting down)
bool BackgroundIdleScheduler::schedule(Task task) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!started_ || shutdown_) return false;
        q_.emplace_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}


// Desc: wait for and pop one task from queue
// In: Task& out
// Out: bool (false if shutdown and empty)
bool BackgroundIdleScheduler::wait_dequeue(Task& out) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this]{ return shutdown_ || !q_.empty(); });
    if (shutdown_ && q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    return true;
}


void BackgroundIdleScheduler::worker_loop() {
    set_thread_background_mode();
    for (;;) {
        Task t;
        if (!wait_dequeue(t)) break;
        try {
            t();
        } catch (const std::exception& e) {
            Logger::error("IdleScheduler", std::string("task threw: ") + e.what());
        }
    }
}

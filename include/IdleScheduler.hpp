#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Hook for running deferrable work when the host has spare capacity.
class IdleScheduler {
public:
    using Task = std::function<void()>;
    virtual ~IdleScheduler() = default;

    // Returns false if the task was not accepted (scheduler stopped).
    virtual bool schedule(Task task) = 0;
};

// Worker pool whose threads drop to SCHED_IDLE and the idle I/O class,
// so queued work only runs on otherwise unused CPU and disk time.
class BackgroundIdleScheduler : public IdleScheduler {
public:
    BackgroundIdleScheduler() = default;
    ~BackgroundIdleScheduler() override;

    BackgroundIdleScheduler(const BackgroundIdleScheduler&) = delete;
    BackgroundIdleScheduler& operator=(const BackgroundIdleScheduler&) = delete;

    void start(std::size_t num_workers);  // idempotent
    void stop();                          // drains the queue, joins workers

    bool schedule(Task task) override;
    bool running() const;

private:
    void worker_loop();
    bool wait_dequeue(Task& out);

    mutable std::mutex       mtx_;
    std::condition_variable  cv_;
    std::deque<Task>         q_;
    bool                     shutdown_ = false;
    bool                     started_ = false;
    std::vector<std::thread> workers_;
};

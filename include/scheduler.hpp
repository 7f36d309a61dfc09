#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Handle to a deferred task, disarmed once it runs or is cancelled.
// Cancelling a task that is already running has no effect.
class TimerHandle {
public:
    TimerHandle() = default;
    explicit TimerHandle(std::shared_ptr<std::atomic<bool>> cancelled) : flag(std::move(cancelled)) {}

    void cancel();
    bool armed() const;

private:
    std::shared_ptr<std::atomic<bool>> flag;
};

class Scheduler {
public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;
    virtual TimerHandle after(std::chrono::milliseconds delay, Task task) = 0;
};

// Runs tasks on one background thread.
class ThreadScheduler : public Scheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    TimerHandle after(std::chrono::milliseconds delay, Task task) override;
    void stop();

private:
    struct Entry {
        std::chrono::steady_clock::time_point when;
        std::uint64_t seq;
        Task task;
        std::shared_ptr<std::atomic<bool>> cancelled;
    };
    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            return a.when != b.when ? a.when > b.when : a.seq > b.seq;
        }
    };

    void worker_loop();

    std::priority_queue<Entry, std::vector<Entry>, Later> queue;
    std::mutex mutex;
    std::condition_variable cv;
    std::uint64_t next_seq = 0;
    bool running = true;
    std::thread worker;
};

// Virtual clock for tests: nothing runs until advance() is called.
class ManualScheduler : public Scheduler {
public:
    TimerHandle after(std::chrono::milliseconds delay, Task task) override;

    // Moves the clock forward, running every task that falls due in order,
    // including tasks scheduled by those tasks.
    void advance(std::chrono::milliseconds delta);

    std::chrono::milliseconds now() const;
    size_t pending() const; // armed, not cancelled

private:
    struct Entry {
        std::chrono::milliseconds when;
        std::uint64_t seq;
        Task task;
        std::shared_ptr<std::atomic<bool>> cancelled;
    };

    mutable std::mutex mutex;
    std::vector<Entry> entries;
    std::chrono::milliseconds clock{0};
    std::uint64_t next_seq = 0;
};

#endif

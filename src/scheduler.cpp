#include "scheduler.hpp"
#include <algorithm>
#include <iostream>

void TimerHandle::cancel() {
    if (flag) flag->store(true);
}

bool TimerHandle::armed() const {
    return flag && !flag->load();
}

ThreadScheduler::ThreadScheduler() : worker([this] { worker_loop(); }) {}

ThreadScheduler::~ThreadScheduler() {
    stop();
}

TimerHandle ThreadScheduler::after(std::chrono::milliseconds delay, Task task) {
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lock(mutex);
        queue.push({std::chrono::steady_clock::now() + delay, next_seq++, std::move(task), cancelled});
    }
    cv.notify_one();
    return TimerHandle(cancelled);
}

void ThreadScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running) return;
        running = false;
    }
    cv.notify_all();
    if (worker.joinable()) worker.join();
}

void ThreadScheduler::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex);
    while (running) {
        if (queue.empty()) {
            cv.wait(lock, [this] { return !running || !queue.empty(); });
            continue;
        }

        auto when = queue.top().when;
        if (cv.wait_until(lock, when, [this, when] {
                return !running || queue.empty() || queue.top().when < when;
            })) {
            continue; // stopped, or an earlier task arrived
        }

        Entry entry = queue.top();
        queue.pop();
        if (entry.cancelled->exchange(true)) continue;

        lock.unlock();
        try {
            entry.task();
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Scheduled task failed: " << e.what() << std::endl;
        }
        lock.lock();
    }
}

TimerHandle ManualScheduler::after(std::chrono::milliseconds delay, Task task) {
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(mutex);
    entries.push_back({clock + delay, next_seq++, std::move(task), cancelled});
    return TimerHandle(cancelled);
}

void ManualScheduler::advance(std::chrono::milliseconds delta) {
    std::unique_lock<std::mutex> lock(mutex);
    const auto target = clock + delta;

    while (true) {
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [](const Entry& e) { return e.cancelled->load(); }),
                      entries.end());

        auto next = std::min_element(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
            return a.when != b.when ? a.when < b.when : a.seq < b.seq;
        });
        if (next == entries.end() || next->when > target) break;

        Entry entry = std::move(*next);
        entries.erase(next);
        clock = entry.when;
        entry.cancelled->store(true);

        lock.unlock();
        entry.task();
        lock.lock();
    }
    clock = target;
}

std::chrono::milliseconds ManualScheduler::now() const {
    std::lock_guard<std::mutex> lock(mutex);
    return clock;
}

size_t ManualScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex);
    return std::count_if(entries.begin(), entries.end(),
                         [](const Entry& e) { return !e.cancelled->load(); });
}

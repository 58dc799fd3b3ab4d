#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace ridematch::platform {

struct TaskPoolConfig {
    std::string name = "tasks";
    int num_workers = 4;
};

/// Statistics for monitoring
struct TaskPoolStats {
    std::atomic<uint64_t> submitted{0};
    std::atomic<uint64_t> executed{0};
    std::atomic<uint64_t> failed{0};    // task threw
    std::atomic<uint64_t> rejected{0};  // submitted after shutdown
    std::atomic<uint64_t> dropped{0};   // still queued at shutdown
};

/**
 * Fixed-size worker pool with delayed submission.
 *
 * Tasks are fire-and-forget: nothing is returned to the submitter, and a
 * task communicates results only through shared stores. A delayed task
 * cannot be revoked once submitted; it should re-check whatever state it
 * depends on when it runs.
 *
 * Tasks due at the same instant run in submission order (one worker), or
 * start in submission order (several workers).
 */
class TaskPool {
public:
    using Task = std::function<void()>;
    using Config = TaskPoolConfig;

    explicit TaskPool(Config config = {});
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    /// Run task as soon as a worker is free
    /// @return false if the pool is shut down
    bool submit(Task task);

    /// Run task no earlier than delay from now
    bool submit_after(std::chrono::milliseconds delay, Task task);

    /// Block until no task is queued or running, or timeout elapses
    /// @return true if the pool went idle
    bool wait_idle(std::chrono::milliseconds timeout);

    /// Stop workers. Tasks not yet started are dropped.
    void shutdown();

    size_t queued() const;

    const TaskPoolStats& stats() const { return stats_; }

private:
    struct ScheduledTask {
        std::chrono::steady_clock::time_point due;
        uint64_t sequence;
        Task task;
    };

    struct LaterFirst {
        bool operator()(const ScheduledTask& a, const ScheduledTask& b) const {
            if (a.due != b.due) return a.due > b.due;
            return a.sequence > b.sequence;
        }
    };

    bool enqueue(std::chrono::steady_clock::time_point due, Task task);
    void worker_loop(int worker_index);

    Config config_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::priority_queue<ScheduledTask, std::vector<ScheduledTask>, LaterFirst> queue_;
    uint64_t next_sequence_ = 0;
    int active_ = 0;
    bool running_ = true;

    TaskPoolStats stats_;
    std::vector<std::thread> workers_;
};

}  // namespace ridematch::platform

#include "task_pool.hpp"

#include <exception>

#include <glog/logging.h>

namespace ridematch::platform {

TaskPool::TaskPool(Config config) : config_(std::move(config)) {
    int workers = config_.num_workers > 0 ? config_.num_workers : 1;
    workers_.reserve(workers);
    for (int i = 0; i < workers; ++i) {
        workers_.emplace_back([this, i]() { worker_loop(i); });
    }
    LOG(INFO) << "Task pool '" << config_.name << "' started with "
              << workers << " workers";
}

TaskPool::~TaskPool() {
    shutdown();
}

bool TaskPool::submit(Task task) {
    return enqueue(std::chrono::steady_clock::now(), std::move(task));
}

bool TaskPool::submit_after(std::chrono::milliseconds delay, Task task) {
    return enqueue(std::chrono::steady_clock::now() + delay, std::move(task));
}

bool TaskPool::enqueue(std::chrono::steady_clock::time_point due, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            stats_.rejected++;
            LOG(WARNING) << "Task pool '" << config_.name
                         << "' is shut down, rejecting task";
            return false;
        }
        queue_.push(ScheduledTask{due, next_sequence_++, std::move(task)});
    }
    stats_.submitted++;
    work_cv_.notify_all();
    return true;
}

bool TaskPool::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() {
        return queue_.empty() && active_ == 0;
    });
}

void TaskPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        stats_.dropped += queue_.size();
        if (!queue_.empty()) {
            LOG(WARNING) << "Task pool '" << config_.name << "' dropping "
                         << queue_.size() << " queued tasks";
        }
        while (!queue_.empty()) {
            queue_.pop();
        }
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    LOG(INFO) << "Task pool '" << config_.name << "' stopped";
}

size_t TaskPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TaskPool::worker_loop(int worker_index) {
    VLOG(1) << "Task pool '" << config_.name << "' worker " << worker_index
            << " running";

    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (queue_.empty()) {
            work_cv_.wait(lock);
            continue;
        }

        auto due = queue_.top().due;
        if (due > std::chrono::steady_clock::now()) {
            // Woken early by a new submission or shutdown; re-evaluate the head
            work_cv_.wait_until(lock, due);
            continue;
        }

        // priority_queue::top is const; the task is moved out before pop
        Task task = std::move(const_cast<ScheduledTask&>(queue_.top()).task);
        queue_.pop();
        ++active_;
        lock.unlock();

        try {
            task();
        } catch (const std::exception& e) {
            stats_.failed++;
            LOG(ERROR) << "Task in pool '" << config_.name
                       << "' threw: " << e.what();
        } catch (...) {
            stats_.failed++;
            LOG(ERROR) << "Task in pool '" << config_.name
                       << "' threw a non-standard exception";
        }
        stats_.executed++;

        lock.lock();
        --active_;
        if (queue_.empty() && active_ == 0) {
            idle_cv_.notify_all();
        }
    }
}

}  // namespace ridematch::platform

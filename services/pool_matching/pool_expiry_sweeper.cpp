#include "pool_expiry_sweeper.hpp"

#include <glog/logging.h>

namespace ridematch::pool {

PoolExpirySweeper::PoolExpirySweeper(std::shared_ptr<PoolMatchingEngine> engine, Config config)
    : engine_(std::move(engine)), config_(config) {}

PoolExpirySweeper::~PoolExpirySweeper() {
    stop();
}

void PoolExpirySweeper::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread([this]() { run(); });
    LOG(INFO) << "Pool expiry sweeper started (every " << config_.interval.count() << " ms)";
}

void PoolExpirySweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG(INFO) << "Pool expiry sweeper stopped";
}

int PoolExpirySweeper::sweep_once() {
    stats_.sweeps++;

    int cancelled = 0;
    auto result = engine_->cleanup_expired_pools(&cancelled);
    if (!result.ok()) {
        LOG(ERROR) << "Expiry sweep failed: " << result.message;
        stats_.failures++;
        return -1;
    }

    stats_.pools_cancelled += static_cast<uint64_t>(cancelled);
    return cancelled;
}

void PoolExpirySweeper::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        cv_.wait_for(lock, config_.interval, [this]() { return !running_; });
        if (!running_) {
            break;
        }
        lock.unlock();
        sweep_once();
        lock.lock();
    }
}

}  // namespace ridematch::pool

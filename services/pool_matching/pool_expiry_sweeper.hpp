#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "pool_matching_engine.hpp"

namespace ridematch::pool {

struct PoolExpirySweeperConfig {
    std::chrono::milliseconds interval{30000};
};

struct PoolExpirySweeperStats {
    std::atomic<uint64_t> sweeps{0};
    std::atomic<uint64_t> failures{0};
    std::atomic<uint64_t> pools_cancelled{0};
};

/// Periodically cancels matching pools whose deadline has passed
class PoolExpirySweeper {
public:
    using Config = PoolExpirySweeperConfig;

    PoolExpirySweeper(std::shared_ptr<PoolMatchingEngine> engine, Config config = {});
    ~PoolExpirySweeper();

    PoolExpirySweeper(const PoolExpirySweeper&) = delete;
    PoolExpirySweeper& operator=(const PoolExpirySweeper&) = delete;

    void start();
    void stop();

    /// One sweep on the calling thread
    /// @return pools cancelled, or -1 on failure
    int sweep_once();

    const PoolExpirySweeperStats& stats() const { return stats_; }

private:
    void run();

    std::shared_ptr<PoolMatchingEngine> engine_;
    Config config_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    std::thread thread_;
    PoolExpirySweeperStats stats_;
};

}  // namespace ridematch::pool

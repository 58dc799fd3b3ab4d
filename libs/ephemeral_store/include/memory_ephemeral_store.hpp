#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "ephemeral_store.hpp"

namespace ridematch::platform {

/// Statistics for monitoring
struct EphemeralStoreStats {
    std::atomic<uint64_t> writes{0};
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> expired_evicted{0};
};

struct MemoryEphemeralStoreConfig {
    std::chrono::milliseconds cleanup_interval{5000};
};

/**
 * In-process EphemeralStore backed by a mutex-protected map.
 *
 * Reads check expiry so a stale value is never returned; a background
 * cleanup thread evicts expired entries so the map does not grow without
 * bound.
 *
 * State is visible to this process only. Offer sets and status hints are
 * therefore not shared between dispatch instances: run a single dispatch
 * instance per consumer group when using this store.
 */
class MemoryEphemeralStore : public EphemeralStore {
public:
    using Config = MemoryEphemeralStoreConfig;

    explicit MemoryEphemeralStore(Config config = {});
    ~MemoryEphemeralStore() override;

    MemoryEphemeralStore(const MemoryEphemeralStore&) = delete;
    MemoryEphemeralStore& operator=(const MemoryEphemeralStore&) = delete;

    bool set_with_expiration(const std::string& key,
                             const std::string& value,
                             std::chrono::milliseconds ttl) override;
    std::optional<std::string> get(const std::string& key) override;
    bool del(const std::string& key) override;

    /// Remaining lifetime of a live key
    std::optional<std::chrono::milliseconds> ttl(const std::string& key) const;

    /// Number of stored entries, including not-yet-evicted expired ones
    size_t size() const;

    const EphemeralStoreStats& stats() const { return stats_; }

private:
    struct Entry {
        std::string value;
        std::chrono::steady_clock::time_point expires_at;
    };

    void cleanup_thread_func();
    void cleanup_expired();

    Config config_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;

    EphemeralStoreStats stats_;

    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_cv_;
    std::atomic<bool> running_{true};
    std::thread cleanup_thread_;
};

}  // namespace ridematch::platform

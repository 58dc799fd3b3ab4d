#include "memory_ephemeral_store.hpp"

#include <glog/logging.h>

namespace ridematch::platform {

MemoryEphemeralStore::MemoryEphemeralStore(Config config)
    : config_(config) {
    cleanup_thread_ = std::thread([this]() { cleanup_thread_func(); });
}

MemoryEphemeralStore::~MemoryEphemeralStore() {
    {
        std::lock_guard<std::mutex> lock(cleanup_mutex_);
        running_ = false;
    }
    cleanup_cv_.notify_all();
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }
}

bool MemoryEphemeralStore::set_with_expiration(const std::string& key,
                                               const std::string& value,
                                               std::chrono::milliseconds ttl) {
    if (ttl.count() <= 0) {
        // Already expired: behave as a delete
        VLOG(1) << "Non-positive TTL for " << key << ", dropping";
        return del(key);
    }

    auto expires_at = std::chrono::steady_clock::now() + ttl;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = Entry{value, expires_at};
    }
    stats_.writes++;
    return true;
}

std::optional<std::string> MemoryEphemeralStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        stats_.misses++;
        return std::nullopt;
    }
    if (it->second.expires_at <= std::chrono::steady_clock::now()) {
        entries_.erase(it);
        stats_.expired_evicted++;
        stats_.misses++;
        return std::nullopt;
    }
    stats_.hits++;
    return it->second.value;
}

bool MemoryEphemeralStore::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
    return true;
}

std::optional<std::chrono::milliseconds> MemoryEphemeralStore::ttl(
    const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    auto now = std::chrono::steady_clock::now();
    if (it->second.expires_at <= now) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        it->second.expires_at - now);
}

size_t MemoryEphemeralStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void MemoryEphemeralStore::cleanup_thread_func() {
    std::unique_lock<std::mutex> lock(cleanup_mutex_);
    while (running_) {
        cleanup_cv_.wait_for(lock, config_.cleanup_interval,
                             [this]() { return !running_; });
        if (running_) {
            cleanup_expired();
        }
    }
}

void MemoryEphemeralStore::cleanup_expired() {
    auto now = std::chrono::steady_clock::now();
    size_t evicted = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end(); ) {
            if (it->second.expires_at <= now) {
                it = entries_.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
    }

    if (evicted > 0) {
        stats_.expired_evicted += evicted;
        VLOG(1) << "Evicted " << evicted << " expired keys";
    }
}

}  // namespace ridematch::platform

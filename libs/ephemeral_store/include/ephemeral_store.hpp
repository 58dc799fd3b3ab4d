#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace ridematch::platform {

/**
 * Key/value store with per-key expiration.
 *
 * Holds short-lived coordination state (offer tracking, status hints,
 * ETA registrations). Expiry is the only lifecycle: an absent key means
 * "never written or already expired" and is never an error.
 */
class EphemeralStore {
public:
    virtual ~EphemeralStore() = default;

    /// Store value under key; replaces any previous value and TTL.
    /// @return false if the write was not accepted
    virtual bool set_with_expiration(const std::string& key,
                                     const std::string& value,
                                     std::chrono::milliseconds ttl) = 0;

    /// Read a live value
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /// Remove key. Deleting an absent key succeeds.
    virtual bool del(const std::string& key) = 0;
};

}  // namespace ridematch::platform

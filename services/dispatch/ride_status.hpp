#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "ephemeral_store.hpp"
#include "postgres_client.hpp"

namespace ridematch::dispatch {

/// True while a ride may still be offered to drivers ("pending",
/// "requested" or "searching"). An unknown status is not pending.
bool is_ride_still_pending(const std::optional<std::string>& status);

/// Durable ride status lookup, consulted when no status hint is cached
class RideStatusSource {
public:
    virtual ~RideStatusSource() = default;

    /// nullopt when the ride is unknown or the lookup failed
    virtual std::optional<std::string> ride_status(const std::string& ride_id) = 0;
};

/// Reads rides.status
class PostgresRideStatusSource : public RideStatusSource {
public:
    explicit PostgresRideStatusSource(std::shared_ptr<platform::PostgresClient> db);

    std::optional<std::string> ride_status(const std::string& ride_id) override;

private:
    std::shared_ptr<platform::PostgresClient> db_;
};

/**
 * Status hint cache at ride_status:<ride_id>, falling back to a
 * RideStatusSource when the hint is absent.
 */
class RideStatusResolver {
public:
    RideStatusResolver(std::shared_ptr<platform::EphemeralStore> store,
                       std::shared_ptr<RideStatusSource> fallback,
                       std::chrono::milliseconds hint_ttl);

    bool set_hint(const std::string& ride_id, const std::string& status);

    /// Cached hint, else durable status, else nullopt
    std::optional<std::string> current_status(const std::string& ride_id);

    static std::string hint_key(const std::string& ride_id);

private:
    std::shared_ptr<platform::EphemeralStore> store_;
    std::shared_ptr<RideStatusSource> fallback_;
    std::chrono::milliseconds hint_ttl_;
};

}  // namespace ridematch::dispatch

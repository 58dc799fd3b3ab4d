#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "dispatch_types.hpp"
#include "ephemeral_store.hpp"
#include "notification_sink.hpp"

namespace ridematch::dispatch {

/// Ride leg being tracked for one driver
struct ActiveRideInfo {
    std::string ride_id;
    std::string rider_id;
    std::string driver_id;
    geo::LatLng pickup;
    std::optional<geo::LatLng> dropoff;
    /// "accepted" while heading to pickup, "started" while heading to dropoff
    std::string status = ride_status::kAccepted;
};

struct EtaTrackerConfig {
    std::chrono::milliseconds registration_ttl = std::chrono::hours(2);
    std::chrono::milliseconds min_update_interval = std::chrono::seconds(5);
};

/// Statistics for monitoring
struct EtaTrackerStats {
    std::atomic<uint64_t> locations_received{0};
    std::atomic<uint64_t> rate_limited{0};
    std::atomic<uint64_t> updates_sent{0};
};

/**
 * Recomputes the rider-facing ETA as the assigned driver moves.
 *
 * Registrations live at ride:active:<driver_id>. Location updates for a
 * driver are throttled to one ETA per min_update_interval using the
 * eta:last:<driver_id> key, so the throttle holds across service replicas.
 */
class EtaTracker {
public:
    using Config = EtaTrackerConfig;

    EtaTracker(std::shared_ptr<platform::EphemeralStore> store,
               std::shared_ptr<platform::NotificationSink> sink,
               Config config = {});

    bool register_active_ride(const ActiveRideInfo& info);

    /// Switch the destination to the dropoff. False if the driver has no
    /// registration for ride_id.
    bool mark_started(const std::string& driver_id, const std::string& ride_id);

    void unregister_active_ride(const std::string& driver_id);

    std::optional<ActiveRideInfo> active_ride(const std::string& driver_id);

    /// @return true if an ETA update was sent
    bool on_driver_location(const DriverLocation& location);

    const EtaTrackerStats& stats() const { return stats_; }

    static std::string active_ride_key(const std::string& driver_id);
    static std::string last_update_key(const std::string& driver_id);

private:
    std::shared_ptr<platform::EphemeralStore> store_;
    std::shared_ptr<platform::NotificationSink> sink_;
    Config config_;
    EtaTrackerStats stats_;
};

}  // namespace ridematch::dispatch

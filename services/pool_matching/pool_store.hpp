#pragma once

#include <optional>
#include <string>
#include <vector>

#include "pool_types.hpp"

namespace ridematch::pool {

/// Outcome of a guarded write
enum class WriteResult {
    kApplied,
    kNotApplied,  // guard (owner, prior status, capacity) did not match
    kFailed,      // storage error
};

/**
 * Persistence for pools, passengers and per-city configuration.
 *
 * Readers return false only on storage errors; "not found" is an empty
 * optional with a true return. Status and count changes are single guarded
 * writes, so two callers racing on the same row cannot both succeed.
 */
class PoolStore {
public:
    virtual ~PoolStore() = default;

    // Pools

    virtual bool create_pool_ride(const PoolRide& pool) = 0;
    virtual bool get_pool_ride(const std::string& pool_ride_id,
                               std::optional<PoolRide>& out) = 0;

    /// Matching pools in the given cells with deadline in the future and room
    /// for seats more, oldest first
    virtual bool find_nearby_pools(const std::vector<std::string>& cell_ids,
                                   int seats,
                                   int limit,
                                   std::vector<PoolRide>& out) = 0;

    /// Latest confirmed or in_progress pool driven by driver_id
    virtual bool get_driver_active_pool(const std::string& driver_id,
                                        std::optional<PoolRide>& out) = 0;

    /// current_passengers += delta, applied only while the result stays
    /// within [0, max_passengers]
    virtual WriteResult adjust_passenger_count(const std::string& pool_ride_id,
                                               int delta) = 0;

    virtual WriteResult update_pool_route(const std::string& pool_ride_id,
                                          const std::vector<RouteStop>& route,
                                          double total_distance_km,
                                          int total_duration_minutes) = 0;

    /// matching -> confirmed with the driver, only while no driver is set
    virtual WriteResult assign_driver(const std::string& pool_ride_id,
                                      const std::string& driver_id,
                                      const std::string& vehicle_id) = 0;

    /// Status change guarded by the prior status. Entering in_progress sets
    /// started_at, entering completed sets completed_at.
    virtual WriteResult transition_pool(const std::string& pool_ride_id,
                                        PoolStatus from,
                                        PoolStatus to) = 0;

    /// Cancel matching pools past their deadline together with their
    /// non-terminal passengers
    /// @param cancelled_passengers passengers moved to cancelled
    /// @return false on storage error (nothing is changed)
    virtual bool cancel_expired_pools(std::vector<std::string>& cancelled_pool_ids,
                                      std::vector<PoolPassenger>& cancelled_passengers) = 0;

    // Passengers

    virtual bool create_passenger(const PoolPassenger& passenger) = 0;
    virtual bool get_passenger(const std::string& pool_passenger_id,
                               std::optional<PoolPassenger>& out) = 0;

    /// All passengers of a pool in creation order
    virtual bool list_passengers(const std::string& pool_ride_id,
                                 std::vector<PoolPassenger>& out) = 0;

    /// Latest non-terminal passenger record of a rider
    virtual bool get_active_passenger_for_rider(const std::string& rider_id,
                                                std::optional<PoolPassenger>& out) = 0;

    /// Status change guarded by the prior status. Entering picked_up sets
    /// picked_up_at, entering dropped_off sets dropped_off_at.
    virtual WriteResult transition_passenger(const std::string& pool_passenger_id,
                                             PassengerStatus from,
                                             PassengerStatus to) = 0;

    // Configuration and reporting

    /// City row if present and active, else the global row.
    /// Empty city_id reads only the global row.
    virtual bool get_pool_config(const std::string& city_id,
                                 std::optional<PoolConfig>& out) = 0;

    virtual bool get_pool_stats(PoolStats& out) = 0;
};

}  // namespace ridematch::pool

#pragma once

#include <memory>

#include "pool_store.hpp"
#include "postgres_client.hpp"

namespace ridematch::pool {

/**
 * PoolStore over the pool_rides, pool_passengers and pool_configs tables.
 *
 * Timestamps are TIMESTAMPTZ columns exchanged as epoch milliseconds.
 * optimized_route is a JSONB array of stops.
 */
class PostgresPoolStore : public PoolStore {
public:
    explicit PostgresPoolStore(std::shared_ptr<platform::PostgresClient> db);

    bool create_pool_ride(const PoolRide& pool) override;
    bool get_pool_ride(const std::string& pool_ride_id,
                       std::optional<PoolRide>& out) override;
    bool find_nearby_pools(const std::vector<std::string>& cell_ids,
                           int seats,
                           int limit,
                           std::vector<PoolRide>& out) override;
    bool get_driver_active_pool(const std::string& driver_id,
                                std::optional<PoolRide>& out) override;
    WriteResult adjust_passenger_count(const std::string& pool_ride_id, int delta) override;
    WriteResult update_pool_route(const std::string& pool_ride_id,
                                  const std::vector<RouteStop>& route,
                                  double total_distance_km,
                                  int total_duration_minutes) override;
    WriteResult assign_driver(const std::string& pool_ride_id,
                              const std::string& driver_id,
                              const std::string& vehicle_id) override;
    WriteResult transition_pool(const std::string& pool_ride_id,
                                PoolStatus from,
                                PoolStatus to) override;
    bool cancel_expired_pools(std::vector<std::string>& cancelled_pool_ids,
                              std::vector<PoolPassenger>& cancelled_passengers) override;

    bool create_passenger(const PoolPassenger& passenger) override;
    bool get_passenger(const std::string& pool_passenger_id,
                       std::optional<PoolPassenger>& out) override;
    bool list_passengers(const std::string& pool_ride_id,
                         std::vector<PoolPassenger>& out) override;
    bool get_active_passenger_for_rider(const std::string& rider_id,
                                        std::optional<PoolPassenger>& out) override;
    WriteResult transition_passenger(const std::string& pool_passenger_id,
                                     PassengerStatus from,
                                     PassengerStatus to) override;

    bool get_pool_config(const std::string& city_id,
                         std::optional<PoolConfig>& out) override;
    bool get_pool_stats(PoolStats& out) override;

private:
    bool query_pools(const std::string& where_clause,
                     const std::vector<std::string>& params,
                     std::vector<PoolRide>& out);
    bool query_passengers(const std::string& where_clause,
                          const std::vector<std::string>& params,
                          std::vector<PoolPassenger>& out);

    std::shared_ptr<platform::PostgresClient> db_;
};

}  // namespace ridematch::pool

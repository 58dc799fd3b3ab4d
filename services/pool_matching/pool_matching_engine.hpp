#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "notification_sink.hpp"
#include "pool_store.hpp"
#include "pool_types.hpp"
#include "routing_service.hpp"
#include "spatial_cell_index.hpp"
#include "task_pool.hpp"

namespace ridematch::pool {

/// Engine settings that do not vary per city
struct PoolServiceConfig {
    /// Used when the store has neither a city nor a global config row
    PoolConfig defaults;

    /// Rings around the pickup cell searched for open pools
    int candidate_ring_size = 2;
    int max_candidates = 10;

    /// Pickup estimate for a rider joining an existing pool
    int join_pickup_minutes = 5;

    /// Driver share of the summed pool fares
    double driver_share = 0.75;
};

/// Statistics for monitoring
struct PoolEngineStats {
    std::atomic<uint64_t> requests{0};
    std::atomic<uint64_t> matches{0};
    std::atomic<uint64_t> pools_created{0};
    std::atomic<uint64_t> capacity_races{0};
    std::atomic<uint64_t> reoptimizations{0};
    std::atomic<uint64_t> reoptimization_failures{0};
    std::atomic<uint64_t> pools_expired{0};
};

/**
 * Shared-ride matching and pool lifecycle.
 *
 * A request either joins the best scoring open pool near the pickup or
 * opens a new one. Status changes are guarded writes in the store, so
 * concurrent callers racing on one pool or passenger cannot both win.
 * Route re-optimization runs on the TaskPool; callers never wait for it.
 *
 * The TaskPool must be shut down before the engine is destroyed.
 */
class PoolMatchingEngine {
public:
    PoolMatchingEngine(PoolServiceConfig config,
                       std::shared_ptr<PoolStore> store,
                       std::shared_ptr<geo::RoutingService> routing,
                       std::shared_ptr<geo::SpatialCellIndex> cells,
                       std::shared_ptr<platform::TaskPool> tasks,
                       std::shared_ptr<platform::NotificationSink> sink = nullptr);

    // Rider operations

    PoolResult request_pool_ride(const std::string& rider_id,
                                 const PoolRideRequest& request,
                                 PoolRideResult* result);

    PoolResult confirm_pool_ride(const std::string& rider_id,
                                 const std::string& pool_passenger_id,
                                 bool accept,
                                 PassengerStatus* new_status);

    PoolResult cancel_pool_ride(const std::string& rider_id,
                                const std::string& pool_passenger_id);

    PoolResult get_pool_status(const std::string& rider_id,
                               const std::string& pool_ride_id,
                               PoolStatusView* view);

    // Driver operations

    PoolResult get_driver_pool_ride(const std::string& driver_id, DriverPoolView* view);

    PoolResult assign_driver(const std::string& pool_ride_id,
                             const std::string& driver_id,
                             const std::string& vehicle_id);

    PoolResult start_pool_ride(const std::string& driver_id, const std::string& pool_ride_id);

    PoolResult pickup_passenger(const std::string& driver_id,
                                const std::string& pool_passenger_id);

    PoolResult dropoff_passenger(const std::string& driver_id,
                                 const std::string& pool_passenger_id,
                                 bool* pool_completed);

    PoolResult mark_no_show(const std::string& driver_id,
                            const std::string& pool_passenger_id);

    // Reporting and maintenance

    PoolResult get_pool_stats(PoolStats* stats);

    /// Cancel matching pools past their deadline and notify their riders
    PoolResult cleanup_expired_pools(int* cancelled_pools);

    /// Rebuild the stop list of a pool from its active passengers.
    /// Leaves the route unchanged when fewer than two stops remain or
    /// routing fails.
    void reoptimize_route(const std::string& pool_ride_id);

    /// City config, else global config, else compiled-in defaults
    PoolConfig resolve_config(const std::string& city_id);

    const PoolEngineStats& stats() const { return stats_; }

private:
    struct Candidate {
        PoolRide pool;
        RouteMatchScore score;
    };

    std::optional<Candidate> find_best_pool(const PoolRideRequest& request,
                                            int seats,
                                            const PoolConfig& config);

    /// Passenger in the driver's active pool, or why not
    PoolResult load_driver_passenger(const std::string& driver_id,
                                     const std::string& pool_passenger_id,
                                     PoolRide& pool,
                                     PoolPassenger& passenger);

    /// Guarded status change for a passenger leaving a pool early;
    /// releases the seats and schedules re-optimization
    PoolResult release_passenger(const PoolPassenger& passenger, PassengerStatus to);

    void schedule_reoptimization(const std::string& pool_ride_id);

    void notify_pool_update(const PoolPassenger& passenger,
                            PoolStatus pool_status,
                            const std::string& message);

    PoolServiceConfig config_;
    std::shared_ptr<PoolStore> store_;
    std::shared_ptr<geo::RoutingService> routing_;
    std::shared_ptr<geo::SpatialCellIndex> cells_;
    std::shared_ptr<platform::TaskPool> tasks_;
    std::shared_ptr<platform::NotificationSink> sink_;
    PoolEngineStats stats_;
};

}  // namespace ridematch::pool

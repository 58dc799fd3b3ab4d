#include "pool_matching_engine.hpp"

#include <map>

#include <glog/logging.h>

#include "pool_scoring.hpp"
#include "ride_event_codec.hpp"

namespace ridematch::pool {

namespace {

constexpr int64_t kMsPerMinute = 60 * 1000;

const char* kExpiredMessage =
    "No pool match was found before the deadline. Please request a new ride.";

/// 1-based position of a passenger's stop, 0 when absent
int stop_index(const std::vector<RouteStop>& route,
               const std::string& pool_passenger_id,
               StopType type) {
    for (size_t i = 0; i < route.size(); ++i) {
        if (route[i].pool_passenger_id == pool_passenger_id && route[i].type == type) {
            return static_cast<int>(i) + 1;
        }
    }
    return 0;
}

RouteStop make_stop(const std::string& pool_passenger_id,
                    StopType type,
                    const geo::LatLng& location,
                    const std::string& address,
                    int sequence_order,
                    int64_t estimated_arrival_ms) {
    RouteStop stop;
    stop.id = generate_id("stop-");
    stop.pool_passenger_id = pool_passenger_id;
    stop.type = type;
    stop.location = location;
    stop.address = address;
    stop.sequence_order = sequence_order;
    stop.estimated_arrival_ms = estimated_arrival_ms;
    return stop;
}

}  // namespace

PoolMatchingEngine::PoolMatchingEngine(PoolServiceConfig config,
                                       std::shared_ptr<PoolStore> store,
                                       std::shared_ptr<geo::RoutingService> routing,
                                       std::shared_ptr<geo::SpatialCellIndex> cells,
                                       std::shared_ptr<platform::TaskPool> tasks,
                                       std::shared_ptr<platform::NotificationSink> sink)
    : config_(std::move(config)),
      store_(std::move(store)),
      routing_(std::move(routing)),
      cells_(std::move(cells)),
      tasks_(std::move(tasks)),
      sink_(std::move(sink)) {}

PoolConfig PoolMatchingEngine::resolve_config(const std::string& city_id) {
    std::optional<PoolConfig> stored;
    if (!store_->get_pool_config(city_id, stored)) {
        LOG(WARNING) << "Pool config lookup failed, using defaults";
        return config_.defaults;
    }
    if (!stored) {
        return config_.defaults;
    }

    // The fare schedule is not configured per city
    stored->fare = config_.defaults.fare;
    return *stored;
}

// ============================================================================
// Rider operations
// ============================================================================

PoolResult PoolMatchingEngine::request_pool_ride(const std::string& rider_id,
                                                 const PoolRideRequest& request,
                                                 PoolRideResult* result) {
    stats_.requests++;

    if (rider_id.empty()) {
        return PoolResult::error(PoolError::kInvalidArgument, "rider id is required");
    }
    if (!geo::is_valid_coordinate(request.pickup)) {
        return PoolResult::error(PoolError::kInvalidArgument, "invalid pickup location");
    }
    if (!geo::is_valid_coordinate(request.dropoff)) {
        return PoolResult::error(PoolError::kInvalidArgument, "invalid dropoff location");
    }
    if (request.max_wait_minutes < 0) {
        return PoolResult::error(PoolError::kInvalidArgument,
                                 "max wait minutes must not be negative");
    }

    PoolConfig config = resolve_config(request.city_id);

    int seats = request.passenger_count == 0 ? 1 : request.passenger_count;
    if (seats < 1 || seats > config.max_passengers_per_ride) {
        return PoolResult::error(PoolError::kInvalidArgument,
                                 "passenger count must be between 1 and " +
                                 std::to_string(config.max_passengers_per_ride));
    }

    std::optional<PoolPassenger> existing;
    if (!store_->get_active_passenger_for_rider(rider_id, existing)) {
        return PoolResult::error(PoolError::kInternal, "failed to check active pool rides");
    }
    if (existing) {
        return PoolResult::error(PoolError::kFailedPrecondition,
                                 "you already have an active pool ride");
    }

    auto solo = routing_->get_route(request.pickup, request.dropoff);
    if (!solo) {
        return PoolResult::error(PoolError::kUnavailable, "failed to calculate route");
    }

    double original_fare = calculate_fare(solo->distance_km, solo->duration_minutes, config.fare);

    int64_t now = codec::now_ms();
    int max_wait = request.max_wait_minutes > 0 ? request.max_wait_minutes
                                                : config.max_wait_minutes;
    int64_t deadline = now + max_wait * kMsPerMinute;

    PoolPassenger passenger;
    passenger.id = generate_id("pp-");
    passenger.rider_id = rider_id;
    passenger.status = PassengerStatus::kPending;
    passenger.pickup = request.pickup;
    passenger.dropoff = request.dropoff;
    passenger.pickup_address = request.pickup_address;
    passenger.dropoff_address = request.dropoff_address;
    passenger.direct_distance_km = solo->distance_km;
    passenger.direct_duration_minutes = solo->duration_minutes;
    passenger.original_fare = original_fare;
    passenger.seat_count = seats;

    PoolRide pool;
    std::optional<RouteMatchScore> match_score;

    if (auto best = find_best_pool(request, seats, config)) {
        switch (store_->adjust_passenger_count(best->pool.id, seats)) {
            case WriteResult::kApplied:
                pool = std::move(best->pool);
                pool.current_passengers += seats;
                match_score = best->score;
                break;
            case WriteResult::kNotApplied:
                stats_.capacity_races++;
                LOG(INFO) << "Pool " << best->pool.id
                          << " filled up concurrently, opening a new pool";
                break;
            case WriteResult::kFailed:
                return PoolResult::error(PoolError::kInternal, "failed to join pool ride");
        }
    }

    bool match_found = match_score.has_value();

    if (match_found) {
        passenger.pool_fare = matched_pool_fare(original_fare, config.discount_percent,
                                                match_score->score);
        passenger.estimated_pickup_ms = now + config_.join_pickup_minutes * kMsPerMinute;
        passenger.estimated_dropoff_ms =
            passenger.estimated_pickup_ms + pool.total_duration_minutes * kMsPerMinute;
    } else {
        passenger.pool_fare = new_pool_fare(original_fare, config.discount_percent);
        passenger.estimated_pickup_ms = deadline;
        passenger.estimated_dropoff_ms =
            passenger.estimated_pickup_ms + solo->duration_minutes * kMsPerMinute;

        pool.id = generate_id("pool-");
        pool.status = PoolStatus::kMatching;
        pool.max_passengers = config.max_passengers_per_ride;
        pool.current_passengers = seats;
        pool.optimized_route = {
            make_stop(passenger.id, StopType::kPickup, request.pickup,
                      request.pickup_address, 1, passenger.estimated_pickup_ms),
            make_stop(passenger.id, StopType::kDropoff, request.dropoff,
                      request.dropoff_address, 2, passenger.estimated_dropoff_ms),
        };
        pool.total_distance_km = solo->distance_km;
        pool.total_duration_minutes = solo->duration_minutes;
        pool.center = request.pickup;
        pool.radius_km = config.match_radius_km;
        pool.cell_id = cells_->cell_for_point(request.pickup, config.cell_resolution);
        pool.base_fare = config.fare.base_fare;
        pool.per_km_rate = config.fare.per_km_rate;
        pool.per_minute_rate = config.fare.per_minute_rate;
        pool.match_deadline_ms = deadline;
        pool.created_at_ms = now;
        pool.updated_at_ms = now;

        if (!store_->create_pool_ride(pool)) {
            return PoolResult::error(PoolError::kInternal, "failed to create pool ride");
        }
        stats_.pools_created++;
    }

    passenger.pool_ride_id = pool.id;
    passenger.savings_percent = savings_percent(original_fare, passenger.pool_fare);
    passenger.created_at_ms = now;
    passenger.updated_at_ms = now;

    if (!store_->create_passenger(passenger)) {
        // Give back what was taken for this request
        if (match_found) {
            if (store_->adjust_passenger_count(pool.id, -seats) != WriteResult::kApplied) {
                LOG(ERROR) << "Could not release " << seats << " seats of pool " << pool.id;
            }
        } else if (store_->transition_pool(pool.id, PoolStatus::kMatching,
                                           PoolStatus::kCancelled) != WriteResult::kApplied) {
            LOG(ERROR) << "Could not cancel orphaned pool " << pool.id;
        }
        return PoolResult::error(PoolError::kInternal, "failed to create pool passenger");
    }

    if (match_found) {
        stats_.matches++;
        schedule_reoptimization(pool.id);
    }

    LOG(INFO) << "Pool ride requested: rider=" << rider_id << " pool=" << pool.id
              << " match_found=" << match_found
              << " savings=" << passenger.savings_percent << "%";

    if (result) {
        result->pool_passenger_id = passenger.id;
        result->pool_ride_id = pool.id;
        result->status = passenger.status;
        result->match_found = match_found;
        result->original_fare = original_fare;
        result->pool_fare = passenger.pool_fare;
        result->savings_percent = passenger.savings_percent;
        result->estimated_pickup_ms = passenger.estimated_pickup_ms;
        result->estimated_dropoff_ms = passenger.estimated_dropoff_ms;
        result->match_deadline_ms = deadline;
        result->match_score = match_score;
        result->current_passengers = pool.current_passengers;
        result->max_passengers = pool.max_passengers;
        result->message = match_message(match_found, passenger.savings_percent);
    }
    return PoolResult::success();
}

std::optional<PoolMatchingEngine::Candidate> PoolMatchingEngine::find_best_pool(
    const PoolRideRequest& request, int seats, const PoolConfig& config) {

    auto cell_ids = cells_->k_ring(request.pickup, config.cell_resolution,
                                   config_.candidate_ring_size);

    std::vector<PoolRide> pools;
    if (!store_->find_nearby_pools(cell_ids, seats, config_.max_candidates, pools)) {
        LOG(WARNING) << "Failed to find matching pools, opening a new one";
        return std::nullopt;
    }

    std::optional<Candidate> best;
    for (auto& pool : pools) {
        auto score = calculate_match_score(pool, request, config, *routing_);
        if (!score || score->score < config.min_match_score) {
            continue;
        }
        VLOG(1) << "Pool " << pool.id << " scored " << score->score;
        // Ties keep the older pool
        if (!best || score->score > best->score.score) {
            best = Candidate{std::move(pool), *score};
        }
    }
    return best;
}

PoolResult PoolMatchingEngine::confirm_pool_ride(const std::string& rider_id,
                                                 const std::string& pool_passenger_id,
                                                 bool accept,
                                                 PassengerStatus* new_status) {
    std::optional<PoolPassenger> passenger;
    if (!store_->get_passenger(pool_passenger_id, passenger)) {
        return PoolResult::error(PoolError::kInternal, "failed to load pool passenger");
    }
    if (!passenger) {
        return PoolResult::error(PoolError::kNotFound, "pool passenger not found");
    }
    if (passenger->rider_id != rider_id) {
        return PoolResult::error(PoolError::kForbidden, "not authorized to confirm this pool");
    }
    if (passenger->status != PassengerStatus::kPending) {
        return PoolResult::error(PoolError::kFailedPrecondition,
                                 "pool ride is not pending confirmation");
    }

    if (!accept) {
        auto released = release_passenger(*passenger, PassengerStatus::kCancelled);
        if (released.ok()) {
            LOG(INFO) << "Pool ride declined: passenger=" << pool_passenger_id;
            if (new_status) *new_status = PassengerStatus::kCancelled;
        }
        return released;
    }

    switch (store_->transition_passenger(pool_passenger_id, PassengerStatus::kPending,
                                         PassengerStatus::kConfirmed)) {
        case WriteResult::kApplied:
            break;
        case WriteResult::kNotApplied:
            return PoolResult::error(PoolError::kFailedPrecondition,
                                     "pool ride is not pending confirmation");
        case WriteResult::kFailed:
            return PoolResult::error(PoolError::kInternal, "failed to confirm pool");
    }

    LOG(INFO) << "Pool ride confirmed: passenger=" << pool_passenger_id;
    if (new_status) *new_status = PassengerStatus::kConfirmed;
    return PoolResult::success();
}

PoolResult PoolMatchingEngine::cancel_pool_ride(const std::string& rider_id,
                                                const std::string& pool_passenger_id) {
    std::optional<PoolPassenger> passenger;
    if (!store_->get_passenger(pool_passenger_id, passenger)) {
        return PoolResult::error(PoolError::kInternal, "failed to load pool passenger");
    }
    if (!passenger) {
        return PoolResult::error(PoolError::kNotFound, "pool passenger not found");
    }
    if (passenger->rider_id != rider_id) {
        return PoolResult::error(PoolError::kForbidden, "not authorized to cancel this pool");
    }
    if (passenger->status == PassengerStatus::kPickedUp) {
        return PoolResult::error(PoolError::kFailedPrecondition, "cannot cancel after pickup");
    }
    if (is_terminal(passenger->status)) {
        return PoolResult::error(PoolError::kFailedPrecondition,
                                 "pool ride is already completed or cancelled");
    }

    auto released = release_passenger(*passenger, PassengerStatus::kCancelled);
    if (released.ok()) {
        LOG(INFO) << "Pool ride cancelled: passenger=" << pool_passenger_id
                  << " rider=" << rider_id;
    }
    return released;
}

PoolResult PoolMatchingEngine::get_pool_status(const std::string& rider_id,
                                               const std::string& pool_ride_id,
                                               PoolStatusView* view) {
    std::optional<PoolRide> pool;
    if (!store_->get_pool_ride(pool_ride_id, pool)) {
        return PoolResult::error(PoolError::kInternal, "failed to load pool ride");
    }
    if (!pool) {
        return PoolResult::error(PoolError::kNotFound, "pool ride not found");
    }

    std::vector<PoolPassenger> passengers;
    if (!store_->list_passengers(pool_ride_id, passengers)) {
        return PoolResult::error(PoolError::kInternal, "failed to load pool passengers");
    }

    // Latest record of the caller in this pool
    const PoolPassenger* mine = nullptr;
    for (const auto& p : passengers) {
        if (p.rider_id == rider_id) {
            mine = &p;
        }
    }
    if (!mine) {
        return PoolResult::error(PoolError::kForbidden, "not authorized to view this pool");
    }

    if (view) {
        view->your_status = mine->status;
        view->estimated_arrival_ms = mine->estimated_dropoff_ms;
        view->route = pool->optimized_route;
        view->other_passengers.clear();
        for (const auto& p : passengers) {
            if (p.rider_id == rider_id) continue;
            CoPassenger other;
            other.first_name_initial = "P";
            other.pickup_stop = stop_index(pool->optimized_route, p.id, StopType::kPickup);
            other.dropoff_stop = stop_index(pool->optimized_route, p.id, StopType::kDropoff);
            view->other_passengers.push_back(std::move(other));
        }
        view->pool_ride = std::move(*pool);
    }
    return PoolResult::success();
}

// ============================================================================
// Driver operations
// ============================================================================

PoolResult PoolMatchingEngine::get_driver_pool_ride(const std::string& driver_id,
                                                    DriverPoolView* view) {
    std::optional<PoolRide> pool;
    if (!store_->get_driver_active_pool(driver_id, pool)) {
        return PoolResult::error(PoolError::kInternal, "failed to load active pool ride");
    }
    if (!pool) {
        return PoolResult::error(PoolError::kNotFound, "no active pool ride");
    }

    std::vector<PoolPassenger> passengers;
    if (!store_->list_passengers(pool->id, passengers)) {
        return PoolResult::error(PoolError::kInternal, "failed to load pool passengers");
    }

    if (view) {
        view->total_fare = 0.0;
        for (const auto& p : passengers) {
            if (p.status == PassengerStatus::kCancelled ||
                p.status == PassengerStatus::kNoShow) {
                continue;
            }
            view->total_fare += p.pool_fare;
        }
        view->total_fare = geo::round2(view->total_fare);
        view->driver_earnings = geo::round2(view->total_fare * config_.driver_share);

        view->next_stop.reset();
        for (const auto& stop : pool->optimized_route) {
            if (!stop.actual_arrival_ms) {
                view->next_stop = stop;
                break;
            }
        }

        view->route = pool->optimized_route;
        view->passengers = std::move(passengers);
        view->pool_ride = std::move(*pool);
    }
    return PoolResult::success();
}

PoolResult PoolMatchingEngine::assign_driver(const std::string& pool_ride_id,
                                             const std::string& driver_id,
                                             const std::string& vehicle_id) {
    if (driver_id.empty()) {
        return PoolResult::error(PoolError::kInvalidArgument, "driver id is required");
    }

    std::optional<PoolRide> pool;
    if (!store_->get_pool_ride(pool_ride_id, pool)) {
        return PoolResult::error(PoolError::kInternal, "failed to load pool ride");
    }
    if (!pool) {
        return PoolResult::error(PoolError::kNotFound, "pool ride not found");
    }
    if (pool->driver_id) {
        return PoolResult::error(PoolError::kFailedPrecondition,
                                 "pool ride already has a driver");
    }
    if (pool->status != PoolStatus::kMatching) {
        return PoolResult::error(PoolError::kFailedPrecondition,
                                 "pool ride is not open for assignment");
    }

    switch (store_->assign_driver(pool_ride_id, driver_id, vehicle_id)) {
        case WriteResult::kApplied:
            break;
        case WriteResult::kNotApplied:
            return PoolResult::error(PoolError::kFailedPrecondition,
                                     "pool ride is not open for assignment");
        case WriteResult::kFailed:
            return PoolResult::error(PoolError::kInternal, "failed to assign driver");
    }

    LOG(INFO) << "Driver " << driver_id << " assigned to pool " << pool_ride_id;
    return PoolResult::success();
}

PoolResult PoolMatchingEngine::start_pool_ride(const std::string& driver_id,
                                               const std::string& pool_ride_id) {
    std::optional<PoolRide> pool;
    if (!store_->get_pool_ride(pool_ride_id, pool)) {
        return PoolResult::error(PoolError::kInternal, "failed to load pool ride");
    }
    if (!pool) {
        return PoolResult::error(PoolError::kNotFound, "pool ride not found");
    }
    if (!pool->driver_id || *pool->driver_id != driver_id) {
        return PoolResult::error(PoolError::kForbidden, "not authorized to start this pool");
    }
    if (pool->status != PoolStatus::kConfirmed) {
        return PoolResult::error(PoolError::kFailedPrecondition, "pool ride is not confirmed");
    }

    switch (store_->transition_pool(pool_ride_id, PoolStatus::kConfirmed,
                                    PoolStatus::kInProgress)) {
        case WriteResult::kApplied:
            break;
        case WriteResult::kNotApplied:
            return PoolResult::error(PoolError::kFailedPrecondition,
                                     "pool ride is not confirmed");
        case WriteResult::kFailed:
            return PoolResult::error(PoolError::kInternal, "failed to start pool ride");
    }

    LOG(INFO) << "Pool ride started: pool=" << pool_ride_id << " driver=" << driver_id;
    return PoolResult::success();
}

PoolResult PoolMatchingEngine::load_driver_passenger(const std::string& driver_id,
                                                     const std::string& pool_passenger_id,
                                                     PoolRide& pool,
                                                     PoolPassenger& passenger) {
    std::optional<PoolRide> active;
    if (!store_->get_driver_active_pool(driver_id, active)) {
        return PoolResult::error(PoolError::kInternal, "failed to load active pool ride");
    }
    if (!active) {
        return PoolResult::error(PoolError::kForbidden, "no active pool ride");
    }

    std::optional<PoolPassenger> found;
    if (!store_->get_passenger(pool_passenger_id, found)) {
        return PoolResult::error(PoolError::kInternal, "failed to load pool passenger");
    }
    if (!found) {
        return PoolResult::error(PoolError::kNotFound, "passenger not found");
    }
    if (found->pool_ride_id != active->id) {
        return PoolResult::error(PoolError::kForbidden, "passenger not in your pool");
    }

    pool = std::move(*active);
    passenger = std::move(*found);
    return PoolResult::success();
}

PoolResult PoolMatchingEngine::pickup_passenger(const std::string& driver_id,
                                                const std::string& pool_passenger_id) {
    PoolRide pool;
    PoolPassenger passenger;
    auto loaded = load_driver_passenger(driver_id, pool_passenger_id, pool, passenger);
    if (!loaded.ok()) {
        return loaded;
    }
    if (passenger.status != PassengerStatus::kConfirmed) {
        return PoolResult::error(PoolError::kFailedPrecondition, "passenger is not confirmed");
    }

    switch (store_->transition_passenger(pool_passenger_id, PassengerStatus::kConfirmed,
                                         PassengerStatus::kPickedUp)) {
        case WriteResult::kApplied:
            break;
        case WriteResult::kNotApplied:
            return PoolResult::error(PoolError::kFailedPrecondition,
                                     "passenger is not confirmed");
        case WriteResult::kFailed:
            return PoolResult::error(PoolError::kInternal, "failed to update passenger");
    }

    if (pool.status == PoolStatus::kConfirmed &&
        store_->transition_pool(pool.id, PoolStatus::kConfirmed,
                                PoolStatus::kInProgress) == WriteResult::kFailed) {
        LOG(WARNING) << "Could not move pool " << pool.id << " to in_progress";
    }

    // Record arrival at the pickup stop; re-optimization keeps it
    int64_t now = codec::now_ms();
    bool marked = false;
    for (auto& stop : pool.optimized_route) {
        if (stop.pool_passenger_id == pool_passenger_id && stop.type == StopType::kPickup) {
            stop.actual_arrival_ms = now;
            marked = true;
        }
    }
    if (marked && store_->update_pool_route(pool.id, pool.optimized_route,
                                            pool.total_distance_km,
                                            pool.total_duration_minutes) !=
                      WriteResult::kApplied) {
        LOG(WARNING) << "Could not record pickup arrival in pool " << pool.id;
    }

    schedule_reoptimization(pool.id);

    LOG(INFO) << "Passenger picked up: passenger=" << pool_passenger_id
              << " driver=" << driver_id;
    return PoolResult::success();
}

PoolResult PoolMatchingEngine::dropoff_passenger(const std::string& driver_id,
                                                 const std::string& pool_passenger_id,
                                                 bool* pool_completed) {
    if (pool_completed) *pool_completed = false;

    PoolRide pool;
    PoolPassenger passenger;
    auto loaded = load_driver_passenger(driver_id, pool_passenger_id, pool, passenger);
    if (!loaded.ok()) {
        return loaded;
    }
    if (passenger.status != PassengerStatus::kPickedUp) {
        return PoolResult::error(PoolError::kFailedPrecondition, "passenger is not picked up");
    }

    switch (store_->transition_passenger(pool_passenger_id, PassengerStatus::kPickedUp,
                                         PassengerStatus::kDroppedOff)) {
        case WriteResult::kApplied:
            break;
        case WriteResult::kNotApplied:
            return PoolResult::error(PoolError::kFailedPrecondition,
                                     "passenger is not picked up");
        case WriteResult::kFailed:
            return PoolResult::error(PoolError::kInternal, "failed to update passenger");
    }

    LOG(INFO) << "Passenger dropped off: passenger=" << pool_passenger_id
              << " driver=" << driver_id;

    std::vector<PoolPassenger> passengers;
    if (!store_->list_passengers(pool.id, passengers)) {
        LOG(WARNING) << "Could not check completion of pool " << pool.id;
        return PoolResult::success();
    }

    bool all_done = true;
    for (const auto& p : passengers) {
        if (!is_terminal(p.status)) {
            all_done = false;
            break;
        }
    }

    if (!all_done) {
        schedule_reoptimization(pool.id);
        return PoolResult::success();
    }

    if (store_->transition_pool(pool.id, PoolStatus::kInProgress,
                                PoolStatus::kCompleted) == WriteResult::kApplied) {
        LOG(INFO) << "Pool ride completed: pool=" << pool.id;
        if (pool_completed) *pool_completed = true;
    } else {
        LOG(WARNING) << "Pool " << pool.id << " has no riders left but could not be completed";
    }
    return PoolResult::success();
}

PoolResult PoolMatchingEngine::mark_no_show(const std::string& driver_id,
                                            const std::string& pool_passenger_id) {
    PoolRide pool;
    PoolPassenger passenger;
    auto loaded = load_driver_passenger(driver_id, pool_passenger_id, pool, passenger);
    if (!loaded.ok()) {
        return loaded;
    }
    if (!can_transition(passenger.status, PassengerStatus::kNoShow)) {
        return PoolResult::error(PoolError::kFailedPrecondition,
                                 "passenger cannot be marked as no-show");
    }

    auto released = release_passenger(passenger, PassengerStatus::kNoShow);
    if (released.ok()) {
        LOG(INFO) << "Passenger no-show: passenger=" << pool_passenger_id
                  << " driver=" << driver_id;
    }
    return released;
}

PoolResult PoolMatchingEngine::release_passenger(const PoolPassenger& passenger,
                                                 PassengerStatus to) {
    switch (store_->transition_passenger(passenger.id, passenger.status, to)) {
        case WriteResult::kApplied:
            break;
        case WriteResult::kNotApplied:
            return PoolResult::error(PoolError::kFailedPrecondition,
                                     "passenger status changed concurrently");
        case WriteResult::kFailed:
            return PoolResult::error(PoolError::kInternal, "failed to update passenger");
    }

    if (store_->adjust_passenger_count(passenger.pool_ride_id, -passenger.seat_count) !=
        WriteResult::kApplied) {
        LOG(WARNING) << "Could not release " << passenger.seat_count << " seats of pool "
                     << passenger.pool_ride_id;
    }

    schedule_reoptimization(passenger.pool_ride_id);
    return PoolResult::success();
}

// ============================================================================
// Reporting and maintenance
// ============================================================================

PoolResult PoolMatchingEngine::get_pool_stats(PoolStats* stats) {
    PoolStats result;
    if (!store_->get_pool_stats(result)) {
        return PoolResult::error(PoolError::kInternal, "failed to get pool stats");
    }
    if (stats) *stats = result;
    return PoolResult::success();
}

PoolResult PoolMatchingEngine::cleanup_expired_pools(int* cancelled_pools) {
    std::vector<std::string> pool_ids;
    std::vector<PoolPassenger> passengers;
    if (!store_->cancel_expired_pools(pool_ids, passengers)) {
        return PoolResult::error(PoolError::kInternal, "failed to cancel expired pools");
    }

    for (const auto& passenger : passengers) {
        notify_pool_update(passenger, PoolStatus::kCancelled, kExpiredMessage);
    }

    if (!pool_ids.empty()) {
        stats_.pools_expired += pool_ids.size();
        LOG(INFO) << "Cancelled " << pool_ids.size() << " expired pools ("
                  << passengers.size() << " passengers)";
    }
    if (cancelled_pools) *cancelled_pools = static_cast<int>(pool_ids.size());
    return PoolResult::success();
}

void PoolMatchingEngine::schedule_reoptimization(const std::string& pool_ride_id) {
    if (!tasks_->submit([this, pool_ride_id]() { reoptimize_route(pool_ride_id); })) {
        LOG(WARNING) << "Task pool rejected re-optimization of pool " << pool_ride_id;
    }
}

void PoolMatchingEngine::reoptimize_route(const std::string& pool_ride_id) {
    std::optional<PoolRide> pool;
    if (!store_->get_pool_ride(pool_ride_id, pool) || !pool) {
        LOG(WARNING) << "Cannot re-optimize pool " << pool_ride_id << ": not loaded";
        stats_.reoptimization_failures++;
        return;
    }

    std::vector<PoolPassenger> passengers;
    if (!store_->list_passengers(pool_ride_id, passengers)) {
        stats_.reoptimization_failures++;
        return;
    }

    std::map<std::string, int64_t> pickup_arrivals;
    for (const auto& stop : pool->optimized_route) {
        if (stop.type == StopType::kPickup && stop.actual_arrival_ms) {
            pickup_arrivals[stop.pool_passenger_id] = *stop.actual_arrival_ms;
        }
    }

    std::vector<RouteStop> stops;
    std::vector<geo::LatLng> points;
    for (const auto& p : passengers) {
        if (is_terminal(p.status)) continue;

        RouteStop pickup = make_stop(p.id, StopType::kPickup, p.pickup, p.pickup_address, 0, 0);
        auto arrived = pickup_arrivals.find(p.id);
        if (arrived != pickup_arrivals.end()) {
            pickup.actual_arrival_ms = arrived->second;
        }
        stops.push_back(std::move(pickup));
        stops.push_back(make_stop(p.id, StopType::kDropoff, p.dropoff, p.dropoff_address, 0, 0));
        points.push_back(p.pickup);
        points.push_back(p.dropoff);
    }

    if (points.size() < 2) {
        VLOG(1) << "Pool " << pool_ride_id << " has fewer than two stops, route unchanged";
        return;
    }

    auto route = routing_->get_multi_stop_route(points);
    if (!route) {
        LOG(ERROR) << "Failed to re-optimize route of pool " << pool_ride_id;
        stats_.reoptimization_failures++;
        return;
    }

    int64_t eta = codec::now_ms();
    for (size_t i = 0; i < stops.size(); ++i) {
        if (i > 0 && i - 1 < route->legs.size()) {
            eta += route->legs[i - 1].duration_minutes * kMsPerMinute;
        }
        stops[i].sequence_order = static_cast<int>(i) + 1;
        stops[i].estimated_arrival_ms = eta;
    }

    if (store_->update_pool_route(pool_ride_id, stops, route->total_distance_km,
                                  route->total_duration_minutes) == WriteResult::kFailed) {
        stats_.reoptimization_failures++;
        return;
    }

    stats_.reoptimizations++;
    LOG(INFO) << "Pool route re-optimized: pool=" << pool_ride_id
              << " stops=" << stops.size()
              << " distance_km=" << route->total_distance_km
              << " duration_min=" << route->total_duration_minutes;
}

void PoolMatchingEngine::notify_pool_update(const PoolPassenger& passenger,
                                            PoolStatus pool_status,
                                            const std::string& message) {
    if (!sink_) {
        return;
    }

    notifications::notification_t notification;
    auto* update = notification.mutable_pool_update();
    update->set_pool_ride_id(passenger.pool_ride_id);
    update->set_pool_passenger_id(passenger.id);
    update->set_pool_status(to_string(pool_status));
    update->set_passenger_status(to_string(passenger.status));
    update->set_message(message);

    if (!sink_->send_to_user(passenger.rider_id, notification)) {
        LOG(WARNING) << "Failed to notify rider " << passenger.rider_id
                     << " about pool " << passenger.pool_ride_id;
    }
}

}  // namespace ridematch::pool

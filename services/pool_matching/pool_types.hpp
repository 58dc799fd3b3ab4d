#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "geo_math.hpp"

namespace ridematch::pool {

// ============================================================================
// Status enums
// ============================================================================

/// matching -> confirmed -> in_progress -> completed; matching -> cancelled
enum class PoolStatus {
    kMatching,
    kConfirmed,
    kInProgress,
    kCompleted,
    kCancelled,
};

/// pending -> confirmed -> picked_up -> dropped_off;
/// cancelled and no_show only from pending or confirmed
enum class PassengerStatus {
    kPending,
    kConfirmed,
    kPickedUp,
    kDroppedOff,
    kCancelled,
    kNoShow,
};

enum class StopType {
    kPickup,
    kDropoff,
};

const char* to_string(PoolStatus status);
const char* to_string(PassengerStatus status);
const char* to_string(StopType type);

std::optional<PoolStatus> pool_status_from_string(const std::string& value);
std::optional<PassengerStatus> passenger_status_from_string(const std::string& value);
std::optional<StopType> stop_type_from_string(const std::string& value);

bool is_terminal(PoolStatus status);
bool is_terminal(PassengerStatus status);

/// Whether the lifecycle allows moving directly from one status to another
bool can_transition(PoolStatus from, PoolStatus to);
bool can_transition(PassengerStatus from, PassengerStatus to);

// ============================================================================
// Records
// ============================================================================

struct RouteStop {
    std::string id;
    std::string pool_passenger_id;
    StopType type = StopType::kPickup;
    geo::LatLng location;
    std::string address;
    int sequence_order = 0;  // 1-based
    int64_t estimated_arrival_ms = 0;
    std::optional<int64_t> actual_arrival_ms;
};

struct PoolRide {
    std::string id;
    std::optional<std::string> driver_id;
    std::optional<std::string> vehicle_id;
    PoolStatus status = PoolStatus::kMatching;
    int max_passengers = 0;
    int current_passengers = 0;

    std::vector<RouteStop> optimized_route;
    double total_distance_km = 0.0;
    int total_duration_minutes = 0;

    geo::LatLng center;
    double radius_km = 0.0;
    std::string cell_id;

    double base_fare = 0.0;
    double per_km_rate = 0.0;
    double per_minute_rate = 0.0;

    int64_t match_deadline_ms = 0;
    std::optional<int64_t> started_at_ms;
    std::optional<int64_t> completed_at_ms;
    int64_t created_at_ms = 0;
    int64_t updated_at_ms = 0;
};

struct PoolPassenger {
    std::string id;
    std::string pool_ride_id;
    std::string rider_id;
    PassengerStatus status = PassengerStatus::kPending;

    geo::LatLng pickup;
    geo::LatLng dropoff;
    std::string pickup_address;
    std::string dropoff_address;

    /// Route if riding alone
    double direct_distance_km = 0.0;
    int direct_duration_minutes = 0;

    double original_fare = 0.0;
    double pool_fare = 0.0;
    double savings_percent = 0.0;
    int seat_count = 1;

    std::optional<int64_t> picked_up_at_ms;
    std::optional<int64_t> dropped_off_at_ms;
    int64_t estimated_pickup_ms = 0;
    int64_t estimated_dropoff_ms = 0;
    int64_t created_at_ms = 0;
    int64_t updated_at_ms = 0;
};

struct RouteMatchScore {
    double score = 0.0;  // [0, 1]
    double detour_minutes = 0.0;
    double detour_km = 0.0;
    double detour_percent = 0.0;
    double cost_savings_percent = 0.0;
};

struct FareSchedule {
    double base_fare = 2.0;
    double per_km_rate = 1.5;
    double per_minute_rate = 0.25;
};

/// Matching parameters, resolved per city
struct PoolConfig {
    double max_detour_percent = 25.0;
    int max_detour_minutes = 15;
    int max_wait_minutes = 5;
    int max_passengers_per_ride = 4;
    double min_match_score = 0.5;
    double match_radius_km = 3.0;
    int cell_resolution = 7;
    double discount_percent = 25.0;
    double min_savings_percent = 15.0;
    FareSchedule fare;
};

// ============================================================================
// Requests and views
// ============================================================================

struct PoolRideRequest {
    geo::LatLng pickup;
    geo::LatLng dropoff;
    std::string pickup_address;
    std::string dropoff_address;
    int passenger_count = 0;   // 0 means 1
    int max_wait_minutes = 0;  // 0 means config
    std::string city_id;       // empty means global config
};

struct PoolRideResult {
    std::string pool_passenger_id;
    std::string pool_ride_id;
    PassengerStatus status = PassengerStatus::kPending;
    bool match_found = false;
    double original_fare = 0.0;
    double pool_fare = 0.0;
    double savings_percent = 0.0;
    int64_t estimated_pickup_ms = 0;
    int64_t estimated_dropoff_ms = 0;
    int64_t match_deadline_ms = 0;
    std::optional<RouteMatchScore> match_score;
    int current_passengers = 0;
    int max_passengers = 0;
    std::string message;
};

/// Another rider in the pool, reduced to stop positions
struct CoPassenger {
    std::string first_name_initial;
    int pickup_stop = 0;   // 1-based, 0 when absent
    int dropoff_stop = 0;
};

struct PoolStatusView {
    PoolRide pool_ride;
    PassengerStatus your_status = PassengerStatus::kPending;
    std::vector<RouteStop> route;
    int64_t estimated_arrival_ms = 0;
    std::vector<CoPassenger> other_passengers;
};

struct DriverPoolView {
    PoolRide pool_ride;
    std::vector<PoolPassenger> passengers;
    std::vector<RouteStop> route;
    std::optional<RouteStop> next_stop;
    double total_fare = 0.0;
    double driver_earnings = 0.0;
};

/// CO2 emitted per car-km, used for the shared-km savings figure
constexpr double kCo2KgPerKm = 0.21;

struct PoolStats {
    int64_t total_pools = 0;
    int64_t active_pools = 0;
    double avg_passengers_per_pool = 0.0;
    double avg_savings_percent = 0.0;
    double match_success_rate = 0.0;
    double total_co2_saved_kg = 0.0;
};

// ============================================================================
// Errors
// ============================================================================

enum class PoolError {
    kOk,
    kInvalidArgument,
    kFailedPrecondition,
    kNotFound,
    kForbidden,
    kUnavailable,
    kInternal,
};

const char* to_string(PoolError code);

/// Outcome of an engine operation; readable values go to out-parameters
struct PoolResult {
    PoolError code = PoolError::kOk;
    std::string message;

    bool ok() const { return code == PoolError::kOk; }

    static PoolResult success() { return {}; }
    static PoolResult error(PoolError code, std::string message) {
        return PoolResult{code, std::move(message)};
    }
};

// ============================================================================
// Helpers
// ============================================================================

/// Random id with a readable prefix, e.g. "pool-3fa9c2..."
std::string generate_id(const char* prefix);

/// optimized_route column encoding
std::string route_to_json(const std::vector<RouteStop>& route);
std::optional<std::vector<RouteStop>> route_from_json(const std::string& data);

}  // namespace ridematch::pool

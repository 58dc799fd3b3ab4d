#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "geo_math.hpp"

namespace ridematch::dispatch {

/// Dispatch tuning. Radius fields bound the candidate locator; the rest
/// drive offer batching.
struct DispatchConfig {
    double search_radius_km = 5.0;
    double max_search_radius_km = 20.0;
    double radius_increment_km = 5.0;

    int max_drivers_to_notify = 10;
    int first_batch_size = 3;
    int offer_timeout_seconds = 30;
    int retry_delay_seconds = 10;

    /// Offer Set outlives the longest offer by this much
    int offer_set_grace_seconds = 10;

    /// Lifetime of ride_status / ride_request hints
    int status_hint_ttl_seconds = 3600;
};

struct Location {
    geo::LatLng point;
    std::string address;
};

// ============================================================================
// Inbound events
// ============================================================================

struct RideRequested {
    std::string ride_id;
    std::string rider_id;
    std::string rider_name;
    double rider_rating = 0.0;
    Location pickup;
    std::optional<Location> dropoff;
    std::string ride_type_id;
    std::string ride_type_name;
    double estimated_fare = 0.0;
    double estimated_distance_km = 0.0;
    int estimated_duration_minutes = 0;
    std::string currency;
    int64_t requested_at_ms = 0;
};

struct RideAccepted {
    std::string ride_id;
    std::string driver_id;
    std::string driver_name;
    int64_t accepted_at_ms = 0;
};

struct RideCancelled {
    std::string ride_id;
    std::string cancelled_by;
    std::string reason;
    int64_t cancelled_at_ms = 0;
};

struct RideStarted {
    std::string ride_id;
    std::string driver_id;
    int64_t started_at_ms = 0;
};

struct RideCompleted {
    std::string ride_id;
    std::string driver_id;
    int64_t completed_at_ms = 0;
};

struct DriverLocation {
    std::string driver_id;
    geo::LatLng point;
    double heading = 0.0;
    double speed_kmh = 0.0;
    int64_t timestamp_ms = 0;
};

/// Driver returned by a candidate search. Distance and ETA are filled in
/// when the offer is built.
struct Candidate {
    std::string driver_id;
    std::string user_id;
    geo::LatLng location;
    double distance_to_pickup_km = 0.0;
    int eta_minutes = 0;
};

// ============================================================================
// Ride status hints
// ============================================================================

namespace ride_status {
constexpr const char* kPending = "pending";
constexpr const char* kRequested = "requested";
constexpr const char* kSearching = "searching";
constexpr const char* kAccepted = "accepted";
constexpr const char* kStarted = "started";
constexpr const char* kCancelled = "cancelled";
constexpr const char* kNoDrivers = "no_drivers";
}  // namespace ride_status

}  // namespace ridematch::dispatch

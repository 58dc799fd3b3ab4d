#pragma once

#include <string>

#include "pool_types.hpp"
#include "routing_service.hpp"

namespace ridematch::pool {

// Score weights, summing to 1
constexpr double kRouteWeight = 0.4;
constexpr double kTimeWeight = 0.3;
constexpr double kDirectionWeight = 0.3;

/// round2(base + km * per_km + minutes * per_minute)
double calculate_fare(double distance_km, int duration_minutes, const FareSchedule& fare);

/// Fare for a rider joining a pool with the given match score
double matched_pool_fare(double original_fare, double discount_percent, double score);

/// Fare for the rider who opens a new pool (full discount)
double new_pool_fare(double original_fare, double discount_percent);

/// max(0, 1 - pool / original) * 100; 0 when original is not positive
double savings_percent(double original_fare, double pool_fare);

/// Alignment of bearing(center -> dropoff) with bearing(pickup -> dropoff), in [0, 1]
double direction_score(const geo::LatLng& pool_center,
                       const geo::LatLng& pickup,
                       const geo::LatLng& dropoff);

/**
 * Score a detour from route totals.
 *
 * Zero when the detour exceeds either limit, or when the current route is
 * empty and the detour is positive. Otherwise the weighted sum of route,
 * time and direction sub-scores, each clamped to [0, 1].
 */
RouteMatchScore score_detour(double current_km,
                             int current_minutes,
                             double new_km,
                             int new_minutes,
                             double direction,
                             const PoolConfig& config);

/// Route the pool's stops plus the new pickup and dropoff and score the detour
/// @return empty optional when routing fails
std::optional<RouteMatchScore> calculate_match_score(const PoolRide& pool,
                                                     const PoolRideRequest& request,
                                                     const PoolConfig& config,
                                                     geo::RoutingService& routing);

/// Rider-facing result message
std::string match_message(bool match_found, double savings_percent);

}  // namespace ridematch::pool

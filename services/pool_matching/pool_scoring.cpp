#include "pool_scoring.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include <glog/logging.h>

namespace ridematch::pool {

namespace {

double clamp_unit(double value) {
    return std::min(1.0, std::max(0.0, value));
}

}  // namespace

double calculate_fare(double distance_km, int duration_minutes, const FareSchedule& fare) {
    return geo::round2(fare.base_fare +
                       distance_km * fare.per_km_rate +
                       duration_minutes * fare.per_minute_rate);
}

double matched_pool_fare(double original_fare, double discount_percent, double score) {
    return geo::round2(original_fare * (1.0 - discount_percent * score / 100.0));
}

double new_pool_fare(double original_fare, double discount_percent) {
    return geo::round2(original_fare * (1.0 - discount_percent / 100.0));
}

double savings_percent(double original_fare, double pool_fare) {
    if (original_fare <= 0.0) {
        return 0.0;
    }
    return std::max(0.0, 1.0 - pool_fare / original_fare) * 100.0;
}

double direction_score(const geo::LatLng& pool_center,
                       const geo::LatLng& pickup,
                       const geo::LatLng& dropoff) {
    return clamp_unit(geo::direction_alignment(geo::bearing_degrees(pool_center, dropoff),
                                               geo::bearing_degrees(pickup, dropoff)));
}

RouteMatchScore score_detour(double current_km,
                             int current_minutes,
                             double new_km,
                             int new_minutes,
                             double direction,
                             const PoolConfig& config) {
    RouteMatchScore result;
    result.detour_km = new_km - current_km;
    result.detour_minutes = static_cast<double>(new_minutes - current_minutes);

    if (current_km <= 0.0) {
        if (result.detour_km > 0.0) {
            return result;
        }
        result.detour_percent = 0.0;
    } else {
        result.detour_percent = result.detour_km / current_km * 100.0;
    }

    if (result.detour_percent > config.max_detour_percent ||
        result.detour_minutes > config.max_detour_minutes) {
        return result;
    }

    double route = config.max_detour_percent > 0.0
        ? clamp_unit(1.0 - result.detour_percent / config.max_detour_percent)
        : 1.0;
    double time = config.max_detour_minutes > 0
        ? clamp_unit(1.0 - result.detour_minutes / config.max_detour_minutes)
        : 1.0;

    result.score = clamp_unit(route * kRouteWeight +
                              time * kTimeWeight +
                              clamp_unit(direction) * kDirectionWeight);
    result.cost_savings_percent = config.discount_percent * result.score;
    return result;
}

std::optional<RouteMatchScore> calculate_match_score(const PoolRide& pool,
                                                     const PoolRideRequest& request,
                                                     const PoolConfig& config,
                                                     geo::RoutingService& routing) {
    std::vector<geo::LatLng> stops;
    stops.reserve(pool.optimized_route.size() + 2);
    for (const auto& stop : pool.optimized_route) {
        stops.push_back(stop.location);
    }
    stops.push_back(request.pickup);
    stops.push_back(request.dropoff);

    auto route = routing.get_multi_stop_route(stops);
    if (!route) {
        LOG(WARNING) << "Could not route pool " << pool.id << " with the new stops";
        return std::nullopt;
    }

    return score_detour(pool.total_distance_km, pool.total_duration_minutes,
                        route->total_distance_km, route->total_duration_minutes,
                        direction_score(pool.center, request.pickup, request.dropoff),
                        config);
}

std::string match_message(bool match_found, double savings_percent) {
    if (match_found) {
        return "Great! We found a pool match. You'll save " +
               std::to_string(static_cast<int>(savings_percent)) + "% on this ride.";
    }
    return "We're looking for other riders heading your way. "
           "You'll be notified when we find a match.";
}

}  // namespace ridematch::pool

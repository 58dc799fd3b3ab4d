#include "routing_service.hpp"

#include <cmath>

#include <glog/logging.h>

namespace ridematch::geo {

GreatCircleRouter::GreatCircleRouter(Config config) : config_(config) {
    if (config_.average_speed_kmh <= 0.0) {
        LOG(WARNING) << "Invalid router speed " << config_.average_speed_kmh
                     << ", using " << kAverageCitySpeedKmh;
        config_.average_speed_kmh = kAverageCitySpeedKmh;
    }
}

RouteInfo GreatCircleRouter::leg(const LatLng& from, const LatLng& to) const {
    RouteInfo info;
    info.distance_km = round2(haversine_km(from, to) * config_.road_factor);
    info.duration_minutes = static_cast<int>(
        std::ceil(info.distance_km / config_.average_speed_kmh * 60.0));
    return info;
}

std::optional<RouteInfo> GreatCircleRouter::get_route(const LatLng& origin,
                                                      const LatLng& destination) {
    if (!is_valid_coordinate(origin) || !is_valid_coordinate(destination)) {
        LOG(WARNING) << "Route requested for invalid coordinates";
        return std::nullopt;
    }
    return leg(origin, destination);
}

std::optional<MultiStopRoute> GreatCircleRouter::get_multi_stop_route(
    const std::vector<LatLng>& stops) {
    if (stops.size() < 2) {
        LOG(WARNING) << "Multi-stop route needs at least 2 stops, got "
                     << stops.size();
        return std::nullopt;
    }

    MultiStopRoute route;
    route.legs.reserve(stops.size() - 1);

    for (size_t i = 1; i < stops.size(); ++i) {
        if (!is_valid_coordinate(stops[i - 1]) || !is_valid_coordinate(stops[i])) {
            LOG(WARNING) << "Multi-stop route has invalid stop near index " << i;
            return std::nullopt;
        }
        RouteInfo info = leg(stops[i - 1], stops[i]);

        RouteLeg route_leg;
        route_leg.from_index = static_cast<int>(i - 1);
        route_leg.to_index = static_cast<int>(i);
        route_leg.distance_km = info.distance_km;
        route_leg.duration_minutes = info.duration_minutes;
        route.legs.push_back(route_leg);

        route.total_distance_km += info.distance_km;
        route.total_duration_minutes += info.duration_minutes;
    }

    route.total_distance_km = round2(route.total_distance_km);
    return route;
}

}  // namespace ridematch::geo

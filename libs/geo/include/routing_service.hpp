#pragma once

#include <optional>
#include <vector>

#include "geo_math.hpp"

namespace ridematch::geo {

/// Point-to-point route summary
struct RouteInfo {
    double distance_km = 0.0;
    int duration_minutes = 0;
};

/// One leg of a multi-stop route, between consecutive stops
struct RouteLeg {
    int from_index = 0;
    int to_index = 0;
    double distance_km = 0.0;
    int duration_minutes = 0;
};

struct MultiStopRoute {
    double total_distance_km = 0.0;
    int total_duration_minutes = 0;
    std::vector<RouteLeg> legs;
};

/// Routing collaborator. Empty optional means the route could not be computed.
class RoutingService {
public:
    virtual ~RoutingService() = default;

    virtual std::optional<RouteInfo> get_route(const LatLng& origin,
                                               const LatLng& destination) = 0;

    /// Route visiting stops in the given order; needs at least two stops
    virtual std::optional<MultiStopRoute> get_multi_stop_route(
        const std::vector<LatLng>& stops) = 0;
};

struct GreatCircleRouterConfig {
    /// Road distance over straight-line distance
    double road_factor = 1.3;
    double average_speed_kmh = kAverageCitySpeedKmh;
};

/**
 * Offline router: haversine distance scaled by a road factor, driven at a
 * fixed average speed. Stop order is taken as given.
 */
class GreatCircleRouter : public RoutingService {
public:
    using Config = GreatCircleRouterConfig;

    explicit GreatCircleRouter(Config config = {});

    std::optional<RouteInfo> get_route(const LatLng& origin,
                                       const LatLng& destination) override;
    std::optional<MultiStopRoute> get_multi_stop_route(
        const std::vector<LatLng>& stops) override;

private:
    RouteInfo leg(const LatLng& from, const LatLng& to) const;

    Config config_;
};

}  // namespace ridematch::geo

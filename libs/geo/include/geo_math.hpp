#pragma once

namespace ridematch::geo {

/// WGS84 point in degrees
struct LatLng {
    double latitude = 0.0;
    double longitude = 0.0;
};

constexpr double kEarthRadiusKm = 6371.0;

/// Average urban speed used wherever no live speed is known
constexpr double kAverageCitySpeedKmh = 30.0;

/// Below this speed a driver is treated as stationary for ETA purposes
constexpr double kMovingSpeedThresholdKmh = 5.0;

/// Great-circle distance in km (unrounded)
double haversine_km(const LatLng& a, const LatLng& b);

/// Great-circle distance in km, rounded to 2 decimals.
/// Symmetric, and zero for identical points.
double calculate_distance_km(const LatLng& a, const LatLng& b);

/// Initial bearing from a to b in degrees, normalised to [0, 360)
double bearing_degrees(const LatLng& a, const LatLng& b);

/// 1 for identical bearings, 0 for opposite bearings
double direction_alignment(double bearing_a, double bearing_b);

/// ceil(distance / speed * 60); falls back to kAverageCitySpeedKmh when the
/// speed is not above kMovingSpeedThresholdKmh
int estimate_eta_minutes(double distance_km, double speed_kmh = 0.0);

/// Round half away from zero to 2 decimals
double round2(double value);

/// Latitude within [-90, 90] and longitude within [-180, 180]
bool is_valid_coordinate(const LatLng& point);

}  // namespace ridematch::geo

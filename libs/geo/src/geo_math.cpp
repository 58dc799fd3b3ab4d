#include "geo_math.hpp"

#include <cmath>

namespace ridematch::geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

double to_radians(double degrees) {
    return degrees * kPi / 180.0;
}

double to_degrees(double radians) {
    return radians * 180.0 / kPi;
}

}  // namespace

double haversine_km(const LatLng& a, const LatLng& b) {
    double d_lat = to_radians(b.latitude - a.latitude);
    double d_lng = to_radians(b.longitude - a.longitude);
    double lat1 = to_radians(a.latitude);
    double lat2 = to_radians(b.latitude);

    double h = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
               std::cos(lat1) * std::cos(lat2) *
               std::sin(d_lng / 2) * std::sin(d_lng / 2);
    double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
    return kEarthRadiusKm * c;
}

double calculate_distance_km(const LatLng& a, const LatLng& b) {
    return round2(haversine_km(a, b));
}

double bearing_degrees(const LatLng& a, const LatLng& b) {
    double lat1 = to_radians(a.latitude);
    double lat2 = to_radians(b.latitude);
    double d_lng = to_radians(b.longitude - a.longitude);

    double y = std::sin(d_lng) * std::cos(lat2);
    double x = std::cos(lat1) * std::sin(lat2) -
               std::sin(lat1) * std::cos(lat2) * std::cos(d_lng);

    double bearing = std::fmod(to_degrees(std::atan2(y, x)) + 360.0, 360.0);
    return bearing;
}

double direction_alignment(double bearing_a, double bearing_b) {
    double diff = std::fabs(bearing_a - bearing_b);
    if (diff > 180.0) {
        diff = 360.0 - diff;
    }
    return 1.0 - diff / 180.0;
}

int estimate_eta_minutes(double distance_km, double speed_kmh) {
    double speed = speed_kmh > kMovingSpeedThresholdKmh ? speed_kmh
                                                        : kAverageCitySpeedKmh;
    return static_cast<int>(std::ceil(distance_km / speed * 60.0));
}

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

bool is_valid_coordinate(const LatLng& point) {
    return point.latitude >= -90.0 && point.latitude <= 90.0 &&
           point.longitude >= -180.0 && point.longitude <= 180.0;
}

}  // namespace ridematch::geo

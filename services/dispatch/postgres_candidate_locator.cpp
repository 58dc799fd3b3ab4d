#include "postgres_candidate_locator.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>

namespace ridematch::dispatch {

namespace {

constexpr double kKmPerDegreeLatitude = 111.32;
constexpr double kRadiansPerDegree = 3.14159265358979323846 / 180.0;

std::string format_double(double value) {
    std::ostringstream ss;
    ss << std::setprecision(10) << value;
    return ss.str();
}

}  // namespace

PostgresCandidateLocator::PostgresCandidateLocator(
    std::shared_ptr<platform::PostgresClient> db, Config config)
    : db_(std::move(db)), config_(config) {
    if (config_.radius_increment_km <= 0.0) {
        LOG(WARNING) << "Non-positive radius increment, searching once at "
                     << config_.max_search_radius_km << " km";
        config_.radius_increment_km = config_.max_search_radius_km;
    }
}

std::optional<std::vector<Candidate>> PostgresCandidateLocator::find_available_drivers(
    const geo::LatLng& point, int max_count) {

    if (max_count <= 0) {
        return std::vector<Candidate>{};
    }
    if (!geo::is_valid_coordinate(point)) {
        LOG(WARNING) << "Candidate search for invalid point " << point.latitude
                     << "," << point.longitude;
        return std::nullopt;
    }

    double radius = std::min(config_.search_radius_km, config_.max_search_radius_km);
    std::vector<Candidate> found;

    while (true) {
        auto candidates = search(point, radius, max_count);
        if (!candidates) {
            return std::nullopt;
        }
        found = std::move(*candidates);

        if (static_cast<int>(found.size()) >= max_count ||
            radius >= config_.max_search_radius_km) {
            break;
        }
        radius = std::min(radius + config_.radius_increment_km,
                          config_.max_search_radius_km);
        VLOG(1) << "Only " << found.size() << " drivers nearby, widening search to "
                << radius << " km";
    }

    VLOG(1) << "Candidate search found " << found.size() << " drivers within "
            << radius << " km";
    return found;
}

std::optional<std::vector<Candidate>> PostgresCandidateLocator::search(
    const geo::LatLng& point, double radius_km, int max_count) {

    double lat_delta = radius_km / kKmPerDegreeLatitude;
    double cos_lat = std::max(std::cos(point.latitude * kRadiansPerDegree), 0.01);
    double lng_delta = radius_km / (kKmPerDegreeLatitude * cos_lat);

    std::string sql = R"(
        SELECT driver_id, COALESCE(user_id, driver_id) AS user_id,
               latitude, longitude
        FROM driver_locations
        WHERE status = 'available'
          AND updated_at > NOW() - make_interval(secs => $5::int)
          AND latitude BETWEEN $1::double precision AND $2::double precision
          AND longitude BETWEEN $3::double precision AND $4::double precision
    )";

    std::vector<std::string> params = {
        format_double(point.latitude - lat_delta),
        format_double(point.latitude + lat_delta),
        format_double(point.longitude - lng_delta),
        format_double(point.longitude + lng_delta),
        std::to_string(config_.location_max_age_seconds),
    };

    auto result = db_->execute(sql, params);
    if (!result.ok()) {
        LOG(ERROR) << "Candidate search failed: " << result.error();
        return std::nullopt;
    }

    std::vector<Candidate> candidates;
    for (const auto& row : result) {
        Candidate candidate;
        candidate.driver_id = row.get_string("driver_id");
        candidate.user_id = row.get_string("user_id");
        candidate.location.latitude = row.get_double("latitude");
        candidate.location.longitude = row.get_double("longitude");
        candidate.distance_to_pickup_km =
            geo::calculate_distance_km(candidate.location, point);

        if (candidate.distance_to_pickup_km <= radius_km) {
            candidates.push_back(std::move(candidate));
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return a.distance_to_pickup_km < b.distance_to_pickup_km;
                     });
    if (static_cast<int>(candidates.size()) > max_count) {
        candidates.resize(static_cast<size_t>(max_count));
    }
    return candidates;
}

}  // namespace ridematch::dispatch

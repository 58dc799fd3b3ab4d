#pragma once

#include <memory>

#include "candidate_locator.hpp"
#include "postgres_client.hpp"

namespace ridematch::dispatch {

struct PostgresCandidateLocatorConfig {
    double search_radius_km = 5.0;
    double max_search_radius_km = 20.0;
    double radius_increment_km = 5.0;

    /// Positions older than this are ignored
    int location_max_age_seconds = 60;
};

/**
 * Candidate search over the driver_locations table.
 *
 * Starts at search_radius_km and widens by radius_increment_km until
 * enough available drivers are found or max_search_radius_km is reached.
 * Each pass prefilters with a bounding box in SQL and applies the exact
 * haversine radius here.
 */
class PostgresCandidateLocator : public CandidateLocator {
public:
    using Config = PostgresCandidateLocatorConfig;

    PostgresCandidateLocator(std::shared_ptr<platform::PostgresClient> db, Config config = {});

    std::optional<std::vector<Candidate>> find_available_drivers(
        const geo::LatLng& point, int max_count) override;

private:
    std::optional<std::vector<Candidate>> search(const geo::LatLng& point,
                                                 double radius_km,
                                                 int max_count);

    std::shared_ptr<platform::PostgresClient> db_;
    Config config_;
};

}  // namespace ridematch::dispatch

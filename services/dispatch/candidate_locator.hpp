#pragma once

#include <optional>
#include <vector>

#include "dispatch_types.hpp"

namespace ridematch::dispatch {

/// Finds available drivers near a point
class CandidateLocator {
public:
    virtual ~CandidateLocator() = default;

    /// Up to max_count available drivers, nearest first.
    /// Empty vector means none found; nullopt means the lookup failed.
    virtual std::optional<std::vector<Candidate>> find_available_drivers(
        const geo::LatLng& point, int max_count) = 0;
};

}  // namespace ridematch::dispatch

#include "ride_status.hpp"

#include <glog/logging.h>

#include "dispatch_types.hpp"

namespace ridematch::dispatch {

bool is_ride_still_pending(const std::optional<std::string>& status) {
    if (!status) {
        return false;
    }
    return *status == ride_status::kPending ||
           *status == ride_status::kRequested ||
           *status == ride_status::kSearching;
}

PostgresRideStatusSource::PostgresRideStatusSource(
    std::shared_ptr<platform::PostgresClient> db)
    : db_(std::move(db)) {}

std::optional<std::string> PostgresRideStatusSource::ride_status(const std::string& ride_id) {
    auto result = db_->execute("SELECT status FROM rides WHERE id = $1", {ride_id});
    if (!result.ok()) {
        LOG(ERROR) << "Failed to read status of ride " << ride_id << ": " << result.error();
        return std::nullopt;
    }
    if (result.num_rows() == 0) {
        return std::nullopt;
    }
    return result.row(0).get_string("status");
}

RideStatusResolver::RideStatusResolver(std::shared_ptr<platform::EphemeralStore> store,
                                       std::shared_ptr<RideStatusSource> fallback,
                                       std::chrono::milliseconds hint_ttl)
    : store_(std::move(store)), fallback_(std::move(fallback)), hint_ttl_(hint_ttl) {}

std::string RideStatusResolver::hint_key(const std::string& ride_id) {
    return "ride_status:" + ride_id;
}

bool RideStatusResolver::set_hint(const std::string& ride_id, const std::string& status) {
    return store_->set_with_expiration(hint_key(ride_id), status, hint_ttl_);
}

std::optional<std::string> RideStatusResolver::current_status(const std::string& ride_id) {
    if (auto hint = store_->get(hint_key(ride_id))) {
        return hint;
    }
    if (!fallback_) {
        return std::nullopt;
    }
    VLOG(1) << "No status hint for ride " << ride_id << ", reading durable status";
    return fallback_->ride_status(ride_id);
}

}  // namespace ridematch::dispatch

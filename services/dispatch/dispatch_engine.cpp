#include "dispatch_engine.hpp"

#include <algorithm>
#include <chrono>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include "ride_event_codec.hpp"

using json = nlohmann::json;

namespace ridematch::dispatch {

namespace {

void set_location(notifications::location_t* out, const Location& location) {
    out->set_latitude(location.point.latitude);
    out->set_longitude(location.point.longitude);
    out->set_address(location.address);
}

}  // namespace

DispatchEngine::DispatchEngine(DispatchConfig config,
                               std::shared_ptr<CandidateLocator> locator,
                               std::shared_ptr<platform::EphemeralStore> store,
                               std::shared_ptr<platform::NotificationSink> sink,
                               std::shared_ptr<platform::TaskPool> tasks,
                               std::shared_ptr<RideStatusSource> status_source,
                               std::shared_ptr<EtaTracker> eta_tracker)
    : config_(config),
      locator_(std::move(locator)),
      store_(store),
      sink_(std::move(sink)),
      tasks_(std::move(tasks)),
      eta_tracker_(std::move(eta_tracker)),
      offers_(store),
      status_(store, std::move(status_source),
              std::chrono::seconds(config.status_hint_ttl_seconds)) {}

// ============================================================================
// Ride requested
// ============================================================================

void DispatchEngine::on_ride_requested(const RideRequested& event) {
    stats_.rides_requested++;
    LOG(INFO) << "Dispatching ride " << event.ride_id << " (pickup "
              << event.pickup.point.latitude << "," << event.pickup.point.longitude << ")";

    // A later event may have been handled first; never move a ride back to searching
    auto current = status_.current_status(event.ride_id);
    if (current && !is_ride_still_pending(current)) {
        LOG(INFO) << "Ride " << event.ride_id << " is already " << *current
                  << ", keeping its status";
    } else if (!status_.set_hint(event.ride_id, ride_status::kSearching)) {
        LOG(WARNING) << "Failed to record searching status for ride " << event.ride_id;
    }

    RideSummary summary;
    summary.ride_id = event.ride_id;
    summary.rider_id = event.rider_id;
    summary.pickup = event.pickup.point;
    if (event.dropoff) {
        summary.dropoff = event.dropoff->point;
    }
    if (!remember_ride(summary)) {
        LOG(WARNING) << "Failed to cache summary of ride " << event.ride_id;
    }

    auto candidates = locator_->find_available_drivers(event.pickup.point,
                                                       config_.max_drivers_to_notify);
    if (!candidates) {
        stats_.locator_errors++;
        LOG(ERROR) << "Candidate search failed for ride " << event.ride_id;
        return;
    }

    if (candidates->empty()) {
        stats_.rides_without_drivers++;
        LOG(WARNING) << "No drivers available for ride " << event.ride_id;

        notifications::notification_t notification;
        auto* no_drivers = notification.mutable_no_drivers_available();
        no_drivers->set_ride_id(event.ride_id);
        no_drivers->set_message("No drivers are available near your pickup right now. "
                                "Please try again in a few minutes.");
        if (!sink_->send_to_user(event.rider_id, notification)) {
            LOG(WARNING) << "Failed to notify rider " << event.rider_id
                         << " that no drivers are available";
        }
        status_.set_hint(event.ride_id, ride_status::kNoDrivers);
        return;
    }

    std::vector<Candidate> ordered = std::move(*candidates);
    for (auto& candidate : ordered) {
        candidate.distance_to_pickup_km =
            geo::calculate_distance_km(candidate.location, event.pickup.point);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return a.distance_to_pickup_km < b.distance_to_pickup_km;
                     });
    if (static_cast<int>(ordered.size()) > config_.max_drivers_to_notify) {
        ordered.resize(static_cast<size_t>(std::max(config_.max_drivers_to_notify, 0)));
    }

    LOG(INFO) << "Found " << ordered.size() << " drivers for ride " << event.ride_id;

    size_t first_batch = std::min(ordered.size(),
                                  static_cast<size_t>(std::max(config_.first_batch_size, 0)));
    for (size_t i = 0; i < first_batch; ++i) {
        send_offer(event, ordered[i]);
    }

    if (first_batch >= ordered.size()) {
        return;
    }

    std::vector<Candidate> remaining(ordered.begin() + static_cast<long>(first_batch),
                                     ordered.end());
    auto delay = std::chrono::seconds(config_.retry_delay_seconds);
    bool scheduled = tasks_->submit_after(delay, [this, event, remaining]() {
        send_delayed_batch(event, remaining);
    });
    if (!scheduled) {
        LOG(WARNING) << "Could not schedule second offer batch for ride " << event.ride_id;
    } else {
        VLOG(1) << "Scheduled " << remaining.size() << " delayed offers for ride "
                << event.ride_id << " in " << config_.retry_delay_seconds << "s";
    }
}

void DispatchEngine::send_delayed_batch(const RideRequested& event,
                                        const std::vector<Candidate>& batch) {
    auto status = status_.current_status(event.ride_id);
    if (!is_ride_still_pending(status)) {
        stats_.delayed_batches_skipped++;
        LOG(INFO) << "Ride " << event.ride_id << " no longer pending ("
                  << status.value_or("unknown") << "), skipping delayed offers";
        return;
    }

    stats_.delayed_batches_sent++;
    for (const auto& candidate : batch) {
        send_offer(event, candidate);
    }
}

bool DispatchEngine::send_offer(const RideRequested& event, Candidate candidate) {
    candidate.distance_to_pickup_km =
        geo::calculate_distance_km(candidate.location, event.pickup.point);
    candidate.eta_minutes = geo::estimate_eta_minutes(candidate.distance_to_pickup_km);

    int64_t now = codec::now_ms();
    int64_t expires_at = now + static_cast<int64_t>(config_.offer_timeout_seconds) * 1000;

    TrackedOffer tracked;
    tracked.driver_id = candidate.driver_id;
    tracked.sent_at_ms = now;
    tracked.expires_at_ms = expires_at;

    if (!offers_.track_offer(event.ride_id, tracked, now)) {
        LOG(WARNING) << "Failed to track offer for ride " << event.ride_id
                     << " to driver " << candidate.driver_id;
    }
    auto set_ttl = std::chrono::seconds(config_.offer_timeout_seconds +
                                        config_.offer_set_grace_seconds);
    const std::string& recipient =
        candidate.user_id.empty() ? candidate.driver_id : candidate.user_id;
    if (!offers_.append_to_offer_set(event.ride_id, candidate.driver_id, set_ttl, recipient)) {
        LOG(WARNING) << "Failed to add driver " << candidate.driver_id
                     << " to offer set of ride " << event.ride_id;
    }

    notifications::notification_t notification;
    auto* offer = notification.mutable_ride_offer();
    offer->set_ride_id(event.ride_id);
    offer->set_rider_name(event.rider_name);
    offer->set_rider_rating(event.rider_rating);
    set_location(offer->mutable_pickup(), event.pickup);
    if (event.dropoff) {
        set_location(offer->mutable_dropoff(), *event.dropoff);
    }
    offer->set_ride_type(event.ride_type_name);
    offer->set_estimated_fare(event.estimated_fare);
    offer->set_estimated_distance_km(event.estimated_distance_km);
    offer->set_estimated_duration_minutes(event.estimated_duration_minutes);
    offer->set_distance_to_pickup_km(candidate.distance_to_pickup_km);
    offer->set_eta_to_pickup_minutes(candidate.eta_minutes);
    offer->set_currency(event.currency);
    offer->set_expires_at_ms(expires_at);
    offer->set_timeout_seconds(config_.offer_timeout_seconds);

    if (!sink_->send_to_user(recipient, notification)) {
        stats_.offer_send_failures++;
        LOG(WARNING) << "Failed to deliver offer for ride " << event.ride_id
                     << " to driver " << candidate.driver_id;
        return false;
    }

    stats_.offers_sent++;
    LOG(INFO) << "Sent offer for ride " << event.ride_id << " to driver "
              << candidate.driver_id << " (" << candidate.distance_to_pickup_km << " km, "
              << candidate.eta_minutes << " min)";
    return true;
}

// ============================================================================
// Accepted / cancelled
// ============================================================================

void DispatchEngine::on_ride_accepted(const RideAccepted& event) {
    LOG(INFO) << "Ride " << event.ride_id << " accepted by driver " << event.driver_id;

    status_.set_hint(event.ride_id, ride_status::kAccepted);
    cancel_pending_offers(event.ride_id, event.driver_id, notifications::RIDE_TAKEN);

    auto summary = recall_ride(event.ride_id);
    if (!summary) {
        VLOG(1) << "No cached summary for ride " << event.ride_id << ", ETA not tracked";
        return;
    }
    summary->driver_id = event.driver_id;
    remember_ride(*summary);

    if (eta_tracker_) {
        ActiveRideInfo info;
        info.ride_id = summary->ride_id;
        info.rider_id = summary->rider_id;
        info.driver_id = event.driver_id;
        info.pickup = summary->pickup;
        info.dropoff = summary->dropoff;
        info.status = ride_status::kAccepted;
        if (!eta_tracker_->register_active_ride(info)) {
            LOG(WARNING) << "Failed to register ETA tracking for ride " << event.ride_id;
        }
    }
}

void DispatchEngine::on_ride_cancelled(const RideCancelled& event) {
    LOG(INFO) << "Ride " << event.ride_id << " cancelled by " << event.cancelled_by
              << (event.reason.empty() ? "" : ": " + event.reason);

    status_.set_hint(event.ride_id, ride_status::kCancelled);
    cancel_pending_offers(event.ride_id, "", notifications::RIDE_CANCELLED);

    auto summary = recall_ride(event.ride_id);
    if (summary && !summary->driver_id.empty() && eta_tracker_) {
        eta_tracker_->unregister_active_ride(summary->driver_id);
    }
    forget_ride(event.ride_id);
}

void DispatchEngine::cancel_pending_offers(const std::string& ride_id,
                                           const std::string& accepted_driver_id,
                                           notifications::offer_cancel_reason_t reason) {
    auto set = offers_.get_offer_set(ride_id);
    if (!set) {
        VLOG(1) << "No outstanding offers for ride " << ride_id;
        return;
    }

    size_t withdrawn = 0;
    for (const auto& driver_id : set->drivers) {
        if (driver_id == accepted_driver_id) {
            continue;
        }

        notifications::notification_t notification;
        auto* cancelled = notification.mutable_offer_cancelled();
        cancelled->set_ride_id(ride_id);
        cancelled->set_reason(reason);
        if (!sink_->send_to_user(set->recipient_for(driver_id), notification)) {
            LOG(WARNING) << "Failed to withdraw offer for ride " << ride_id
                         << " from driver " << driver_id;
        }
        offers_.clear_tracked_offer(ride_id, driver_id);
        stats_.offers_cancelled++;
        withdrawn++;
    }

    offers_.clear_offer_set(ride_id);
    LOG(INFO) << "Withdrew offers for ride " << ride_id << " from "
              << withdrawn << " drivers";
}

// ============================================================================
// Trip progress
// ============================================================================

void DispatchEngine::on_ride_started(const RideStarted& event) {
    if (!eta_tracker_) return;

    if (eta_tracker_->mark_started(event.driver_id, event.ride_id)) {
        VLOG(1) << "Ride " << event.ride_id << " started, ETA now to dropoff";
        return;
    }

    auto summary = recall_ride(event.ride_id);
    if (!summary) {
        VLOG(1) << "Ride " << event.ride_id << " started without tracking data";
        return;
    }

    ActiveRideInfo info;
    info.ride_id = summary->ride_id;
    info.rider_id = summary->rider_id;
    info.driver_id = event.driver_id;
    info.pickup = summary->pickup;
    info.dropoff = summary->dropoff;
    info.status = ride_status::kStarted;
    eta_tracker_->register_active_ride(info);
}

void DispatchEngine::on_ride_completed(const RideCompleted& event) {
    VLOG(1) << "Ride " << event.ride_id << " completed by driver " << event.driver_id;
    if (eta_tracker_ && !event.driver_id.empty()) {
        eta_tracker_->unregister_active_ride(event.driver_id);
    }
    forget_ride(event.ride_id);
}

void DispatchEngine::on_driver_location(const DriverLocation& event) {
    if (eta_tracker_) {
        eta_tracker_->on_driver_location(event);
    }
}

// ============================================================================
// Ride summary cache
// ============================================================================

std::string DispatchEngine::ride_request_key(const std::string& ride_id) {
    return "ride_request:" + ride_id;
}

bool DispatchEngine::remember_ride(const RideSummary& summary) {
    json j;
    j["ride_id"] = summary.ride_id;
    j["rider_id"] = summary.rider_id;
    j["pickup_lat"] = summary.pickup.latitude;
    j["pickup_lng"] = summary.pickup.longitude;
    if (summary.dropoff) {
        j["dropoff_lat"] = summary.dropoff->latitude;
        j["dropoff_lng"] = summary.dropoff->longitude;
    }
    if (!summary.driver_id.empty()) {
        j["driver_id"] = summary.driver_id;
    }
    return store_->set_with_expiration(ride_request_key(summary.ride_id), j.dump(),
                                       std::chrono::seconds(config_.status_hint_ttl_seconds));
}

std::optional<DispatchEngine::RideSummary> DispatchEngine::recall_ride(
    const std::string& ride_id) {
    auto data = store_->get(ride_request_key(ride_id));
    if (!data) {
        return std::nullopt;
    }

    try {
        json j = json::parse(*data);
        RideSummary summary;
        summary.ride_id = j.at("ride_id").get<std::string>();
        summary.rider_id = j.value("rider_id", std::string());
        summary.pickup.latitude = j.at("pickup_lat").get<double>();
        summary.pickup.longitude = j.at("pickup_lng").get<double>();
        if (j.contains("dropoff_lat") && j.contains("dropoff_lng")) {
            summary.dropoff = geo::LatLng{j["dropoff_lat"].get<double>(),
                                          j["dropoff_lng"].get<double>()};
        }
        summary.driver_id = j.value("driver_id", std::string());
        return summary;
    } catch (const json::exception& e) {
        LOG(WARNING) << "Invalid ride summary for " << ride_id << ": " << e.what();
        return std::nullopt;
    }
}

void DispatchEngine::forget_ride(const std::string& ride_id) {
    store_->del(ride_request_key(ride_id));
}

}  // namespace ridematch::dispatch

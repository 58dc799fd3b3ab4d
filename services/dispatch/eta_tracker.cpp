#include "eta_tracker.hpp"

#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include "ride_event_codec.hpp"

using json = nlohmann::json;

namespace ridematch::dispatch {

namespace {

std::string encode_active_ride(const ActiveRideInfo& info) {
    json j;
    j["ride_id"] = info.ride_id;
    j["rider_id"] = info.rider_id;
    j["driver_id"] = info.driver_id;
    j["pickup_lat"] = info.pickup.latitude;
    j["pickup_lng"] = info.pickup.longitude;
    if (info.dropoff) {
        j["dropoff_lat"] = info.dropoff->latitude;
        j["dropoff_lng"] = info.dropoff->longitude;
    }
    j["status"] = info.status;
    return j.dump();
}

std::optional<ActiveRideInfo> decode_active_ride(const std::string& data) {
    try {
        json j = json::parse(data);
        ActiveRideInfo info;
        info.ride_id = j.at("ride_id").get<std::string>();
        info.rider_id = j.value("rider_id", std::string());
        info.driver_id = j.value("driver_id", std::string());
        info.pickup.latitude = j.at("pickup_lat").get<double>();
        info.pickup.longitude = j.at("pickup_lng").get<double>();
        if (j.contains("dropoff_lat") && j.contains("dropoff_lng")) {
            info.dropoff = geo::LatLng{j["dropoff_lat"].get<double>(),
                                       j["dropoff_lng"].get<double>()};
        }
        info.status = j.value("status", std::string(ride_status::kAccepted));
        return info;
    } catch (const json::exception& e) {
        LOG(WARNING) << "Invalid active ride record: " << e.what();
        return std::nullopt;
    }
}

}  // namespace

EtaTracker::EtaTracker(std::shared_ptr<platform::EphemeralStore> store,
                       std::shared_ptr<platform::NotificationSink> sink,
                       Config config)
    : store_(std::move(store)), sink_(std::move(sink)), config_(config) {}

std::string EtaTracker::active_ride_key(const std::string& driver_id) {
    return "ride:active:" + driver_id;
}

std::string EtaTracker::last_update_key(const std::string& driver_id) {
    return "eta:last:" + driver_id;
}

bool EtaTracker::register_active_ride(const ActiveRideInfo& info) {
    if (info.driver_id.empty() || info.ride_id.empty()) {
        LOG(WARNING) << "Cannot track ride without ride and driver ids";
        return false;
    }
    bool ok = store_->set_with_expiration(active_ride_key(info.driver_id),
                                          encode_active_ride(info),
                                          config_.registration_ttl);
    if (ok) {
        VLOG(1) << "Tracking ETA for ride " << info.ride_id << " (driver "
                << info.driver_id << ", " << info.status << ")";
    }
    return ok;
}

bool EtaTracker::mark_started(const std::string& driver_id, const std::string& ride_id) {
    auto info = active_ride(driver_id);
    if (!info || info->ride_id != ride_id) {
        return false;
    }
    info->status = ride_status::kStarted;
    // Destination changes, so the next location should produce an ETA at once
    store_->del(last_update_key(driver_id));
    return register_active_ride(*info);
}

void EtaTracker::unregister_active_ride(const std::string& driver_id) {
    store_->del(active_ride_key(driver_id));
    store_->del(last_update_key(driver_id));
}

std::optional<ActiveRideInfo> EtaTracker::active_ride(const std::string& driver_id) {
    auto data = store_->get(active_ride_key(driver_id));
    if (!data) {
        return std::nullopt;
    }
    return decode_active_ride(*data);
}

bool EtaTracker::on_driver_location(const DriverLocation& location) {
    stats_.locations_received++;

    if (store_->get(last_update_key(location.driver_id))) {
        stats_.rate_limited++;
        return false;
    }

    auto info = active_ride(location.driver_id);
    if (!info) {
        return false;
    }

    geo::LatLng destination = info->pickup;
    if (info->status != ride_status::kAccepted) {
        if (!info->dropoff) {
            VLOG(1) << "Ride " << info->ride_id << " has no dropoff, skipping ETA";
            return false;
        }
        destination = *info->dropoff;
    }

    double distance = geo::haversine_km(location.point, destination);
    int eta_minutes = geo::estimate_eta_minutes(distance, location.speed_kmh);

    store_->set_with_expiration(last_update_key(location.driver_id), "1",
                                config_.min_update_interval);

    notifications::notification_t notification;
    auto* update = notification.mutable_eta_update();
    update->set_ride_id(info->ride_id);
    update->set_eta_minutes(eta_minutes);
    update->set_distance_km(geo::round2(distance));
    update->set_driver_latitude(location.point.latitude);
    update->set_driver_longitude(location.point.longitude);
    update->set_driver_heading(location.heading);
    update->set_driver_speed(location.speed_kmh);
    update->set_updated_at_ms(codec::now_ms());

    if (!sink_->send_to_user(info->rider_id, notification)) {
        VLOG(1) << "Failed to send ETA update to rider " << info->rider_id;
    }
    if (!sink_->send_to_ride(info->ride_id, notification)) {
        VLOG(1) << "Failed to send ETA update to ride " << info->ride_id;
    }

    stats_.updates_sent++;
    return true;
}

}  // namespace ridematch::dispatch

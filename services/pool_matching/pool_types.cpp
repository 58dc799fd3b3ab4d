#include "pool_types.hpp"

#include <iomanip>
#include <random>
#include <sstream>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ridematch::pool {

const char* to_string(PoolStatus status) {
    switch (status) {
        case PoolStatus::kMatching: return "matching";
        case PoolStatus::kConfirmed: return "confirmed";
        case PoolStatus::kInProgress: return "in_progress";
        case PoolStatus::kCompleted: return "completed";
        case PoolStatus::kCancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(PassengerStatus status) {
    switch (status) {
        case PassengerStatus::kPending: return "pending";
        case PassengerStatus::kConfirmed: return "confirmed";
        case PassengerStatus::kPickedUp: return "picked_up";
        case PassengerStatus::kDroppedOff: return "dropped_off";
        case PassengerStatus::kCancelled: return "cancelled";
        case PassengerStatus::kNoShow: return "no_show";
    }
    return "unknown";
}

const char* to_string(StopType type) {
    return type == StopType::kPickup ? "pickup" : "dropoff";
}

const char* to_string(PoolError code) {
    switch (code) {
        case PoolError::kOk: return "OK";
        case PoolError::kInvalidArgument: return "INVALID_ARGUMENT";
        case PoolError::kFailedPrecondition: return "FAILED_PRECONDITION";
        case PoolError::kNotFound: return "NOT_FOUND";
        case PoolError::kForbidden: return "FORBIDDEN";
        case PoolError::kUnavailable: return "UNAVAILABLE";
        case PoolError::kInternal: return "INTERNAL";
    }
    return "UNKNOWN";
}

std::optional<PoolStatus> pool_status_from_string(const std::string& value) {
    if (value == "matching") return PoolStatus::kMatching;
    if (value == "confirmed") return PoolStatus::kConfirmed;
    if (value == "in_progress") return PoolStatus::kInProgress;
    if (value == "completed") return PoolStatus::kCompleted;
    if (value == "cancelled") return PoolStatus::kCancelled;
    return std::nullopt;
}

std::optional<PassengerStatus> passenger_status_from_string(const std::string& value) {
    if (value == "pending") return PassengerStatus::kPending;
    if (value == "confirmed") return PassengerStatus::kConfirmed;
    if (value == "picked_up") return PassengerStatus::kPickedUp;
    if (value == "dropped_off") return PassengerStatus::kDroppedOff;
    if (value == "cancelled") return PassengerStatus::kCancelled;
    if (value == "no_show") return PassengerStatus::kNoShow;
    return std::nullopt;
}

std::optional<StopType> stop_type_from_string(const std::string& value) {
    if (value == "pickup") return StopType::kPickup;
    if (value == "dropoff") return StopType::kDropoff;
    return std::nullopt;
}

bool is_terminal(PoolStatus status) {
    return status == PoolStatus::kCompleted || status == PoolStatus::kCancelled;
}

bool is_terminal(PassengerStatus status) {
    return status == PassengerStatus::kDroppedOff ||
           status == PassengerStatus::kCancelled ||
           status == PassengerStatus::kNoShow;
}

bool can_transition(PoolStatus from, PoolStatus to) {
    switch (from) {
        case PoolStatus::kMatching:
            return to == PoolStatus::kConfirmed || to == PoolStatus::kCancelled;
        case PoolStatus::kConfirmed:
            return to == PoolStatus::kInProgress;
        case PoolStatus::kInProgress:
            return to == PoolStatus::kCompleted;
        case PoolStatus::kCompleted:
        case PoolStatus::kCancelled:
            return false;
    }
    return false;
}

bool can_transition(PassengerStatus from, PassengerStatus to) {
    switch (from) {
        case PassengerStatus::kPending:
            return to == PassengerStatus::kConfirmed ||
                   to == PassengerStatus::kCancelled ||
                   to == PassengerStatus::kNoShow;
        case PassengerStatus::kConfirmed:
            return to == PassengerStatus::kPickedUp ||
                   to == PassengerStatus::kCancelled ||
                   to == PassengerStatus::kNoShow;
        case PassengerStatus::kPickedUp:
            return to == PassengerStatus::kDroppedOff;
        case PassengerStatus::kDroppedOff:
        case PassengerStatus::kCancelled:
        case PassengerStatus::kNoShow:
            return false;
    }
    return false;
}

std::string generate_id(const char* prefix) {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    std::stringstream ss;
    ss << prefix << std::hex << std::setfill('0') << std::setw(16) << dist(gen);
    return ss.str();
}

std::string route_to_json(const std::vector<RouteStop>& route) {
    json stops = json::array();
    for (const auto& stop : route) {
        json j;
        j["id"] = stop.id;
        j["pool_passenger_id"] = stop.pool_passenger_id;
        j["type"] = to_string(stop.type);
        j["latitude"] = stop.location.latitude;
        j["longitude"] = stop.location.longitude;
        j["address"] = stop.address;
        j["sequence_order"] = stop.sequence_order;
        j["estimated_arrival_ms"] = stop.estimated_arrival_ms;
        if (stop.actual_arrival_ms) {
            j["actual_arrival_ms"] = *stop.actual_arrival_ms;
        }
        stops.push_back(std::move(j));
    }
    return stops.dump();
}

std::optional<std::vector<RouteStop>> route_from_json(const std::string& data) {
    if (data.empty()) {
        return std::vector<RouteStop>{};
    }

    try {
        json stops = json::parse(data);
        if (!stops.is_array()) {
            return std::nullopt;
        }

        std::vector<RouteStop> route;
        route.reserve(stops.size());
        for (const auto& j : stops) {
            RouteStop stop;
            stop.id = j.value("id", std::string());
            stop.pool_passenger_id = j.at("pool_passenger_id").get<std::string>();
            auto type = stop_type_from_string(j.at("type").get<std::string>());
            if (!type) {
                return std::nullopt;
            }
            stop.type = *type;
            stop.location.latitude = j.at("latitude").get<double>();
            stop.location.longitude = j.at("longitude").get<double>();
            stop.address = j.value("address", std::string());
            stop.sequence_order = j.value("sequence_order", 0);
            stop.estimated_arrival_ms = j.value("estimated_arrival_ms", int64_t{0});
            if (j.contains("actual_arrival_ms") && !j["actual_arrival_ms"].is_null()) {
                stop.actual_arrival_ms = j["actual_arrival_ms"].get<int64_t>();
            }
            route.push_back(std::move(stop));
        }
        return route;
    } catch (const json::exception& e) {
        LOG(WARNING) << "Invalid route JSON: " << e.what();
        return std::nullopt;
    }
}

}  // namespace ridematch::pool

#include "ride_event_codec.hpp"

#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

#include <glog/logging.h>

namespace ridematch::codec {

namespace {

std::string generate_id(const char* prefix) {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    std::stringstream ss;
    ss << prefix << std::hex << std::setfill('0') << std::setw(16) << dist(gen);
    return ss.str();
}

}  // namespace

int64_t now_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

std::string encode_ride_event(ride_events::ride_event_t event) {
    if (event.event_id().empty()) {
        event.set_event_id(generate_id("evt-"));
    }
    if (event.produced_at_ms() == 0) {
        event.set_produced_at_ms(now_ms());
    }
    return event.SerializeAsString();
}

std::optional<ride_events::ride_event_t> decode_ride_event(const std::string& data) {
    if (data.empty()) {
        return std::nullopt;
    }

    ride_events::ride_event_t event;
    if (!event.ParseFromString(data)) {
        VLOG(1) << "Failed to parse ride event (" << data.size() << " bytes)";
        return std::nullopt;
    }
    if (event.event_case() == ride_events::ride_event_t::EVENT_NOT_SET) {
        VLOG(1) << "Ride event " << event.event_id() << " carries no event";
        return std::nullopt;
    }
    return event;
}

const char* ride_event_kind(const ride_events::ride_event_t& event) {
    switch (event.event_case()) {
        case ride_events::ride_event_t::kRequested: return "requested";
        case ride_events::ride_event_t::kAccepted: return "accepted";
        case ride_events::ride_event_t::kCancelled: return "cancelled";
        case ride_events::ride_event_t::kStarted: return "started";
        case ride_events::ride_event_t::kCompleted: return "completed";
        case ride_events::ride_event_t::kDriverLocation: return "driver_location";
        default: return "unknown";
    }
}

std::string encode_notification(notifications::notification_t notification) {
    if (notification.notification_id().empty()) {
        notification.set_notification_id(generate_id("ntf-"));
    }
    if (notification.created_at_ms() == 0) {
        notification.set_created_at_ms(now_ms());
    }
    return notification.SerializeAsString();
}

std::optional<notifications::notification_t> decode_notification(const std::string& data) {
    notifications::notification_t msg;
    if (!msg.ParseFromString(data)) {
        return std::nullopt;
    }
    if (msg.payload_case() == notifications::notification_t::PAYLOAD_NOT_SET) {
        return std::nullopt;
    }
    return msg;
}

const char* notification_kind(const notifications::notification_t& notification) {
    switch (notification.payload_case()) {
        case notifications::notification_t::kRideOffer: return "ride_offer";
        case notifications::notification_t::kOfferCancelled: return "offer_cancelled";
        case notifications::notification_t::kNoDriversAvailable: return "no_drivers_available";
        case notifications::notification_t::kEtaUpdate: return "eta_update";
        case notifications::notification_t::kPoolUpdate: return "pool_update";
        default: return "unknown";
    }
}

}  // namespace ridematch::codec

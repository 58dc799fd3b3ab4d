#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "notifications.pb.h"
#include "ride-events.pb.h"

namespace ridematch::codec {

/// Current wall-clock time in epoch milliseconds
int64_t now_ms();

/// Serialize a ride event, stamping event_id and produced_at_ms when unset
std::string encode_ride_event(ride_events::ride_event_t event);

/// Decode a ride event. Empty payloads and events without a kind are rejected.
std::optional<ride_events::ride_event_t> decode_ride_event(const std::string& data);

/// Short name of the event kind ("requested", "driver_location", ...)
const char* ride_event_kind(const ride_events::ride_event_t& event);

/// Serialize a notification, stamping notification_id and created_at_ms when unset
std::string encode_notification(notifications::notification_t notification);

/// Decode a notification. Notifications without a payload are rejected.
std::optional<notifications::notification_t> decode_notification(const std::string& data);

/// Short name of the payload kind ("ride_offer", "eta_update", ...)
const char* notification_kind(const notifications::notification_t& notification);

}  // namespace ridematch::codec

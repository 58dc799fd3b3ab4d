#pragma once

#include <string>

#include "notifications.pb.h"

namespace ridematch::platform {

/**
 * Outbound push channel to connected clients.
 *
 * Delivery is best effort: a false return means the notification was not
 * accepted for delivery. Callers log and continue.
 */
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    /// Deliver to one user (rider or driver)
    virtual bool send_to_user(const std::string& user_id,
                              const notifications::notification_t& notification) = 0;

    /// Deliver to every client subscribed to a ride
    virtual bool send_to_ride(const std::string& ride_id,
                              const notifications::notification_t& notification) = 0;
};

}  // namespace ridematch::platform

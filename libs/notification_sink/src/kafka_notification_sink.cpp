#include "kafka_notification_sink.hpp"

#include <glog/logging.h>

#include "ride_event_codec.hpp"

namespace ridematch::platform {

KafkaNotificationSink::KafkaNotificationSink(std::shared_ptr<KafkaProducer> producer,
                                             Config config)
    : producer_(std::move(producer)), config_(std::move(config)) {}

bool KafkaNotificationSink::send_to_user(const std::string& user_id,
                                         const notifications::notification_t& notification) {
    if (user_id.empty()) {
        LOG(WARNING) << "Dropping " << codec::notification_kind(notification)
                     << " notification without recipient";
        stats_.notifications_failed++;
        return false;
    }

    notifications::notification_t addressed = notification;
    addressed.set_recipient_user_id(user_id);
    return publish(user_id, addressed);
}

bool KafkaNotificationSink::send_to_ride(const std::string& ride_id,
                                         const notifications::notification_t& notification) {
    if (ride_id.empty()) {
        LOG(WARNING) << "Dropping " << codec::notification_kind(notification)
                     << " notification without ride";
        stats_.notifications_failed++;
        return false;
    }

    notifications::notification_t addressed = notification;
    addressed.set_recipient_ride_id(ride_id);
    return publish("ride:" + ride_id, addressed);
}

bool KafkaNotificationSink::publish(const std::string& key,
                                    const notifications::notification_t& notification) {
    if (!producer_) {
        stats_.notifications_failed++;
        return false;
    }

    std::string payload = codec::encode_notification(notification);
    if (!producer_->produce(config_.topic, key, payload)) {
        LOG(WARNING) << "Failed to publish " << codec::notification_kind(notification)
                     << " notification for " << key;
        stats_.notifications_failed++;
        return false;
    }

    VLOG(1) << "Published " << codec::notification_kind(notification)
            << " notification for " << key;
    stats_.notifications_sent++;
    return true;
}

}  // namespace ridematch::platform

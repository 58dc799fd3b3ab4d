#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "kafka_producer.hpp"
#include "notification_sink.hpp"

namespace ridematch::platform {

struct KafkaNotificationSinkConfig {
    std::string topic = "ridematch.notifications";
};

/// Statistics for monitoring
struct KafkaNotificationSinkStats {
    std::atomic<uint64_t> notifications_sent{0};
    std::atomic<uint64_t> notifications_failed{0};
};

/**
 * NotificationSink that publishes notification_t to Kafka.
 *
 * Messages are keyed by recipient (user id, or "ride:<ride_id>") so all
 * notifications for one recipient land on one partition in order.
 */
class KafkaNotificationSink : public NotificationSink {
public:
    using Config = KafkaNotificationSinkConfig;

    KafkaNotificationSink(std::shared_ptr<KafkaProducer> producer, Config config = {});

    bool send_to_user(const std::string& user_id,
                      const notifications::notification_t& notification) override;
    bool send_to_ride(const std::string& ride_id,
                      const notifications::notification_t& notification) override;

    const KafkaNotificationSinkStats& stats() const { return stats_; }

private:
    bool publish(const std::string& key, const notifications::notification_t& notification);

    std::shared_ptr<KafkaProducer> producer_;
    Config config_;
    KafkaNotificationSinkStats stats_;
};

}  // namespace ridematch::platform

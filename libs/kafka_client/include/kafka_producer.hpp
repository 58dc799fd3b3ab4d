#pragma once

#include <atomic>
#include <memory>
#include <string>

#include <librdkafka/rdkafkacpp.h>

namespace ridematch::platform {

struct KafkaProducerConfig {
    std::string brokers = "localhost:9092";
    std::string client_id = "ridematch-producer";
    int linger_ms = 5;
    int message_timeout_ms = 30000;
    int max_retries = 5;
};

struct KafkaProducerStats {
    std::atomic<uint64_t> messages_sent{0};
    std::atomic<uint64_t> send_errors{0};
    std::atomic<uint64_t> delivery_failures{0};
};

/**
 * Thread-safe librdkafka producer.
 *
 * produce() only queues; delivery reports are served by poll(), by later
 * produce() calls and by flush(). Failed deliveries are logged and counted.
 */
class KafkaProducer {
public:
    explicit KafkaProducer(const KafkaProducerConfig& config);
    ~KafkaProducer();

    KafkaProducer(const KafkaProducer&) = delete;
    KafkaProducer& operator=(const KafkaProducer&) = delete;

    /// Queue a message; the key picks the partition
    /// @return false if the message could not be queued
    bool produce(const std::string& topic, const std::string& key, const std::string& value);

    void poll(int timeout_ms = 0);

    /// Wait for queued messages to be delivered
    /// @return messages still queued after the timeout
    int flush(int timeout_ms = 10000);

    const KafkaProducerStats& stats() const { return stats_; }

private:
    class DeliveryReporter;

    KafkaProducerStats stats_;
    std::unique_ptr<DeliveryReporter> reporter_;
    std::unique_ptr<RdKafka::Producer> producer_;
};

}  // namespace ridematch::platform

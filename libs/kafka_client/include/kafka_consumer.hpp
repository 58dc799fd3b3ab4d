#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <librdkafka/rdkafkacpp.h>

namespace ridematch::platform {

struct KafkaMessage {
    std::string topic;
    int32_t partition = 0;
    int64_t offset = 0;
    std::string key;
    std::string value;
    int64_t timestamp_ms = 0;
};

using MessageCallback = std::function<void(const KafkaMessage& message)>;

struct KafkaConsumerConfig {
    std::string brokers = "localhost:9092";
    std::string group_id = "ridematch";
    std::string client_id = "ridematch-consumer";
    std::string auto_offset_reset = "latest";
    int auto_commit_interval_ms = 5000;
    int session_timeout_ms = 30000;
};

/**
 * Consumer-group member with auto-committed offsets.
 *
 * consume_loop() runs on the caller's thread until stop() is called from
 * another one.
 */
class KafkaConsumer {
public:
    explicit KafkaConsumer(const KafkaConsumerConfig& config);
    ~KafkaConsumer();

    KafkaConsumer(const KafkaConsumer&) = delete;
    KafkaConsumer& operator=(const KafkaConsumer&) = delete;

    bool subscribe(const std::vector<std::string>& topics);

    /// Returns at once if stop() already ran
    void consume_loop(const MessageCallback& callback, int timeout_ms = 100);

    void stop();

    /// Leave the group; further calls are no-ops
    void close();

private:
    std::optional<KafkaMessage> next(int timeout_ms);

    std::unique_ptr<RdKafka::KafkaConsumer> consumer_;
    std::atomic<bool> running_{true};
    bool closed_ = false;
};

}  // namespace ridematch::platform

#include "kafka_consumer.hpp"

#include <glog/logging.h>

namespace ridematch::platform {

namespace {

void set_or_die(RdKafka::Conf* conf, const std::string& name, const std::string& value) {
    std::string errstr;
    if (conf->set(name, value, errstr) != RdKafka::Conf::CONF_OK) {
        LOG(FATAL) << "Invalid consumer setting " << name << "=" << value << ": " << errstr;
    }
}

}  // namespace

KafkaConsumer::KafkaConsumer(const KafkaConsumerConfig& config) {
    std::unique_ptr<RdKafka::Conf> conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));

    set_or_die(conf.get(), "bootstrap.servers", config.brokers);
    set_or_die(conf.get(), "group.id", config.group_id);
    set_or_die(conf.get(), "client.id", config.client_id);
    set_or_die(conf.get(), "auto.offset.reset", config.auto_offset_reset);
    set_or_die(conf.get(), "enable.auto.commit", "true");
    set_or_die(conf.get(), "auto.commit.interval.ms", std::to_string(config.auto_commit_interval_ms));
    set_or_die(conf.get(), "session.timeout.ms", std::to_string(config.session_timeout_ms));

    std::string errstr;
    consumer_.reset(RdKafka::KafkaConsumer::create(conf.get(), errstr));
    if (!consumer_) {
        LOG(FATAL) << "Could not create Kafka consumer: " << errstr;
    }
    LOG(INFO) << "Kafka consumer " << config.client_id << " joined group " << config.group_id
              << " on " << config.brokers;
}

KafkaConsumer::~KafkaConsumer() {
    stop();
    close();
}

bool KafkaConsumer::subscribe(const std::vector<std::string>& topics) {
    RdKafka::ErrorCode err = consumer_->subscribe(topics);
    if (err != RdKafka::ERR_NO_ERROR) {
        LOG(ERROR) << "Subscription failed: " << RdKafka::err2str(err);
        return false;
    }
    for (const auto& topic : topics) {
        LOG(INFO) << "Subscribed to " << topic;
    }
    return true;
}

std::optional<KafkaMessage> KafkaConsumer::next(int timeout_ms) {
    std::unique_ptr<RdKafka::Message> msg(consumer_->consume(timeout_ms));
    if (!msg) {
        return std::nullopt;
    }

    if (msg->err() == RdKafka::ERR__TIMED_OUT || msg->err() == RdKafka::ERR__PARTITION_EOF) {
        return std::nullopt;
    }
    if (msg->err() != RdKafka::ERR_NO_ERROR) {
        LOG(WARNING) << "Consume failed: " << msg->errstr();
        return std::nullopt;
    }

    KafkaMessage message;
    message.topic = msg->topic_name();
    message.partition = msg->partition();
    message.offset = msg->offset();
    message.timestamp_ms = msg->timestamp().timestamp;
    if (msg->key()) {
        message.key = *msg->key();
    }
    if (msg->payload()) {
        message.value.assign(static_cast<const char*>(msg->payload()), msg->len());
    }
    return message;
}

void KafkaConsumer::consume_loop(const MessageCallback& callback, int timeout_ms) {
    while (running_.load()) {
        if (auto message = next(timeout_ms)) {
            callback(*message);
        }
    }
}

void KafkaConsumer::stop() {
    running_.store(false);
}

void KafkaConsumer::close() {
    if (closed_ || !consumer_) {
        return;
    }
    closed_ = true;
    consumer_->close();
}

}  // namespace ridematch::platform

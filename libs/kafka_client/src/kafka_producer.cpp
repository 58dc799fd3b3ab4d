#include "kafka_producer.hpp"

#include <glog/logging.h>

namespace ridematch::platform {

namespace {

constexpr int kQueueFullRetries = 10;

void set_or_die(RdKafka::Conf* conf, const std::string& name, const std::string& value) {
    std::string errstr;
    if (conf->set(name, value, errstr) != RdKafka::Conf::CONF_OK) {
        LOG(FATAL) << "Invalid producer setting " << name << "=" << value << ": " << errstr;
    }
}

}  // namespace

class KafkaProducer::DeliveryReporter : public RdKafka::DeliveryReportCb {
public:
    explicit DeliveryReporter(KafkaProducerStats& stats) : stats_(stats) {}

    void dr_cb(RdKafka::Message& message) override {
        if (message.err() != RdKafka::ERR_NO_ERROR) {
            stats_.delivery_failures++;
            LOG(WARNING) << "Delivery to " << message.topic_name() << " failed: "
                         << message.errstr();
            return;
        }
        VLOG(2) << "Delivered to " << message.topic_name() << "[" << message.partition()
                << "]@" << message.offset();
    }

private:
    KafkaProducerStats& stats_;
};

KafkaProducer::KafkaProducer(const KafkaProducerConfig& config)
    : reporter_(std::make_unique<DeliveryReporter>(stats_)) {
    std::unique_ptr<RdKafka::Conf> conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));

    set_or_die(conf.get(), "bootstrap.servers", config.brokers);
    set_or_die(conf.get(), "client.id", config.client_id);
    set_or_die(conf.get(), "linger.ms", std::to_string(config.linger_ms));
    set_or_die(conf.get(), "message.timeout.ms", std::to_string(config.message_timeout_ms));
    set_or_die(conf.get(), "retries", std::to_string(config.max_retries));
    // Notifications are latency sensitive
    set_or_die(conf.get(), "socket.nagle.disable", "true");

    std::string errstr;
    if (conf->set("dr_cb", reporter_.get(), errstr) != RdKafka::Conf::CONF_OK) {
        LOG(FATAL) << "Could not install delivery reporter: " << errstr;
    }

    producer_.reset(RdKafka::Producer::create(conf.get(), errstr));
    if (!producer_) {
        LOG(FATAL) << "Could not create Kafka producer: " << errstr;
    }
    LOG(INFO) << "Kafka producer " << config.client_id << " connected to " << config.brokers;
}

KafkaProducer::~KafkaProducer() {
    int remaining = flush(5000);
    if (remaining > 0) {
        LOG(WARNING) << remaining << " Kafka messages dropped at shutdown";
    }
}

bool KafkaProducer::produce(const std::string& topic,
                            const std::string& key,
                            const std::string& value) {
    RdKafka::ErrorCode err = RdKafka::ERR_NO_ERROR;
    for (int attempt = 0; attempt < kQueueFullRetries; ++attempt) {
        err = producer_->produce(topic, RdKafka::Topic::PARTITION_UA,
                                 RdKafka::Producer::RK_MSG_COPY,
                                 const_cast<char*>(value.data()), value.size(),
                                 key.data(), key.size(),
                                 0, nullptr);
        if (err != RdKafka::ERR__QUEUE_FULL) {
            break;
        }
        // Make room by serving delivery reports
        producer_->poll(100);
    }

    if (err != RdKafka::ERR_NO_ERROR) {
        stats_.send_errors++;
        LOG(ERROR) << "Could not queue message for " << topic << ": " << RdKafka::err2str(err);
        return false;
    }

    stats_.messages_sent++;
    producer_->poll(0);
    return true;
}

void KafkaProducer::poll(int timeout_ms) {
    producer_->poll(timeout_ms);
}

int KafkaProducer::flush(int timeout_ms) {
    RdKafka::ErrorCode err = producer_->flush(timeout_ms);
    if (err != RdKafka::ERR_NO_ERROR && err != RdKafka::ERR__TIMED_OUT) {
        LOG(WARNING) << "Kafka flush failed: " << RdKafka::err2str(err);
    }
    return producer_->outq_len();
}

}  // namespace ridematch::platform

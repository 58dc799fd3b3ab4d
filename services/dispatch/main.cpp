#include <gflags/gflags.h>
#include <glog/logging.h>

#include <atomic>
#include <csignal>
#include <memory>

#include "dispatch_engine.hpp"
#include "eta_tracker.hpp"
#include "kafka_notification_sink.hpp"
#include "kafka_producer.hpp"
#include "memory_ephemeral_store.hpp"
#include "postgres_candidate_locator.hpp"
#include "postgres_client.hpp"
#include "ride_event_consumer.hpp"
#include "ride_status.hpp"
#include "task_pool.hpp"

// Kafka flags
DEFINE_string(kafka_broker, "localhost:9092", "Kafka broker address");
DEFINE_string(kafka_group, "ridematch-dispatch", "Kafka consumer group");
DEFINE_string(notifications_topic, "ridematch.notifications",
              "Kafka topic for outbound notifications");

// PostgreSQL flags
DEFINE_string(postgres_host, "localhost", "PostgreSQL host");
DEFINE_int32(postgres_port, 5432, "PostgreSQL port");
DEFINE_string(postgres_db, "ridematch", "PostgreSQL database");
DEFINE_string(postgres_user, "ridematch", "PostgreSQL user");
DEFINE_string(postgres_password, "ridematch_dev", "PostgreSQL password");

// Dispatch flags
DEFINE_double(search_radius_km, 5.0, "Initial driver search radius");
DEFINE_double(max_search_radius_km, 20.0, "Maximum driver search radius");
DEFINE_double(radius_increment_km, 5.0, "Search radius step");
DEFINE_int32(max_drivers_to_notify, 10, "Maximum drivers offered one ride");
DEFINE_int32(first_batch_size, 3, "Drivers offered immediately");
DEFINE_int32(offer_timeout_seconds, 30, "Offer lifetime");
DEFINE_int32(retry_delay_seconds, 10, "Delay before the second offer batch");
DEFINE_int32(offer_set_grace_seconds, 10, "Extra lifetime of the per-ride offer set");
DEFINE_int32(location_max_age_seconds, 60, "Ignore driver positions older than this");

// Runtime flags
DEFINE_int32(workers, 8, "Event handler threads");

static std::atomic<bool> g_shutdown{false};

void signal_handler(int sig) {
    LOG(INFO) << "Received signal " << sig << ", shutting down...";
    g_shutdown = true;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    google::SetStderrLogging(google::INFO);
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    namespace dispatch = ridematch::dispatch;
    namespace platform = ridematch::platform;

    LOG(INFO) << "Dispatch Service starting...";
    LOG(INFO) << "  Kafka: " << FLAGS_kafka_broker << " (group " << FLAGS_kafka_group << ")";
    LOG(INFO) << "  PostgreSQL: " << FLAGS_postgres_host << ":" << FLAGS_postgres_port
              << "/" << FLAGS_postgres_db;

    platform::PostgresConfig pg_config;
    pg_config.host = FLAGS_postgres_host;
    pg_config.port = FLAGS_postgres_port;
    pg_config.database = FLAGS_postgres_db;
    pg_config.user = FLAGS_postgres_user;
    pg_config.password = FLAGS_postgres_password;

    auto pg_client = std::make_shared<platform::PostgresClient>(pg_config);
    if (!pg_client->is_connected()) {
        LOG(ERROR) << "Failed to connect to PostgreSQL";
        return 1;
    }
    LOG(INFO) << "Connected to PostgreSQL";

    platform::KafkaProducerConfig producer_config;
    producer_config.brokers = FLAGS_kafka_broker;
    producer_config.client_id = "ridematch-dispatch-producer";
    auto producer = std::make_shared<platform::KafkaProducer>(producer_config);

    platform::KafkaNotificationSinkConfig sink_config;
    sink_config.topic = FLAGS_notifications_topic;
    auto sink = std::make_shared<platform::KafkaNotificationSink>(producer, sink_config);

    dispatch::DispatchConfig config;
    config.search_radius_km = FLAGS_search_radius_km;
    config.max_search_radius_km = FLAGS_max_search_radius_km;
    config.radius_increment_km = FLAGS_radius_increment_km;
    config.max_drivers_to_notify = FLAGS_max_drivers_to_notify;
    config.first_batch_size = FLAGS_first_batch_size;
    config.offer_timeout_seconds = FLAGS_offer_timeout_seconds;
    config.retry_delay_seconds = FLAGS_retry_delay_seconds;
    config.offer_set_grace_seconds = FLAGS_offer_set_grace_seconds;

    dispatch::PostgresCandidateLocatorConfig locator_config;
    locator_config.search_radius_km = config.search_radius_km;
    locator_config.max_search_radius_km = config.max_search_radius_km;
    locator_config.radius_increment_km = config.radius_increment_km;
    locator_config.location_max_age_seconds = FLAGS_location_max_age_seconds;
    auto locator = std::make_shared<dispatch::PostgresCandidateLocator>(pg_client, locator_config);

    // Offer and status state is process-local; one dispatch instance is assumed
    auto store = std::make_shared<platform::MemoryEphemeralStore>();

    platform::TaskPoolConfig pool_config;
    pool_config.name = "dispatch";
    pool_config.num_workers = FLAGS_workers;
    auto tasks = std::make_shared<platform::TaskPool>(pool_config);

    auto status_source = std::make_shared<dispatch::PostgresRideStatusSource>(pg_client);
    auto eta_tracker = std::make_shared<dispatch::EtaTracker>(store, sink);

    auto engine = std::make_shared<dispatch::DispatchEngine>(
        config, locator, store, sink, tasks, status_source, eta_tracker);

    dispatch::RideEventConsumerConfig consumer_config;
    consumer_config.kafka.brokers = FLAGS_kafka_broker;
    consumer_config.kafka.group_id = FLAGS_kafka_group;
    consumer_config.kafka.client_id = "ridematch-dispatch-consumer";

    dispatch::RideEventConsumer consumer(consumer_config, engine, tasks);
    if (!consumer.start()) {
        LOG(ERROR) << "Failed to start ride event consumer";
        return 1;
    }

    LOG(INFO) << "Dispatch Service running";

    // Serve delivery reports until shutdown
    while (!g_shutdown) {
        producer->poll(100);
    }

    LOG(INFO) << "Shutting down...";

    consumer.stop();
    tasks->shutdown();
    producer->flush(5000);

    const auto& stats = engine->stats();
    const auto& sink_stats = sink->stats();
    LOG(INFO) << "Final stats:";
    LOG(INFO) << "  rides_requested=" << stats.rides_requested;
    LOG(INFO) << "  offers_sent=" << stats.offers_sent;
    LOG(INFO) << "  offers_cancelled=" << stats.offers_cancelled;
    LOG(INFO) << "  rides_without_drivers=" << stats.rides_without_drivers;
    LOG(INFO) << "  delayed_batches_skipped=" << stats.delayed_batches_skipped;
    LOG(INFO) << "  eta_updates_sent=" << eta_tracker->stats().updates_sent;
    LOG(INFO) << "  notifications_failed=" << sink_stats.notifications_failed;
    LOG(INFO) << "  events_dispatched=" << consumer.stats().events_dispatched;
    LOG(INFO) << "  parse_errors=" << consumer.stats().parse_errors;

    LOG(INFO) << "Dispatch Service shutdown complete";
    return 0;
}

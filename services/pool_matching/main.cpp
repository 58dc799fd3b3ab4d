#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>
#include <memory>

#include "grpc_service_base.hpp"
#include "kafka_notification_sink.hpp"
#include "kafka_producer.hpp"
#include "pool_expiry_sweeper.hpp"
#include "pool_matching_engine.hpp"
#include "pool_matching_service_impl.hpp"
#include "postgres_client.hpp"
#include "postgres_pool_store.hpp"
#include "routing_service.hpp"
#include "spatial_cell_index.hpp"
#include "task_pool.hpp"

// gRPC flags
DEFINE_string(grpc_listen, "0.0.0.0:50071", "gRPC listen address");
DEFINE_int32(grpc_threads, 4, "Number of gRPC server threads");

// Kafka flags
DEFINE_string(kafka_broker, "localhost:9092", "Kafka broker address");
DEFINE_string(notifications_topic, "ridematch.notifications",
              "Kafka topic for outbound notifications");

// PostgreSQL flags
DEFINE_string(postgres_host, "localhost", "PostgreSQL host");
DEFINE_int32(postgres_port, 5432, "PostgreSQL port");
DEFINE_string(postgres_db, "ridematch", "PostgreSQL database");
DEFINE_string(postgres_user, "ridematch", "PostgreSQL user");
DEFINE_string(postgres_password, "ridematch_dev", "PostgreSQL password");

// Matching flags (defaults when pool_configs has no row)
DEFINE_double(max_detour_percent, 25.0, "Maximum detour as a share of the pool route");
DEFINE_int32(max_detour_minutes, 15, "Maximum added minutes for existing riders");
DEFINE_int32(max_wait_minutes, 5, "How long a new pool waits for co-riders");
DEFINE_int32(max_passengers_per_ride, 4, "Seats per pool");
DEFINE_double(min_match_score, 0.5, "Lowest score that joins an existing pool");
DEFINE_int32(cell_resolution, 7, "Spatial cell resolution for pool lookup");
DEFINE_double(discount_percent, 25.0, "Pool discount at a perfect match");
DEFINE_double(road_factor, 1.3, "Road distance over straight-line distance");

// Runtime flags
DEFINE_int32(workers, 4, "Route re-optimization threads");
DEFINE_int32(expiry_sweep_seconds, 30, "Interval of the expired pool sweep");

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    google::SetStderrLogging(google::INFO);
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    namespace pool = ridematch::pool;
    namespace platform = ridematch::platform;
    namespace geo = ridematch::geo;

    LOG(INFO) << "Pool Matching Service starting...";
    LOG(INFO) << "  gRPC listen: " << FLAGS_grpc_listen;
    LOG(INFO) << "  Kafka: " << FLAGS_kafka_broker;
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
    producer_config.client_id = "ridematch-pool-producer";
    auto producer = std::make_shared<platform::KafkaProducer>(producer_config);

    platform::KafkaNotificationSinkConfig sink_config;
    sink_config.topic = FLAGS_notifications_topic;
    auto sink = std::make_shared<platform::KafkaNotificationSink>(producer, sink_config);

    pool::PoolServiceConfig config;
    config.defaults.max_detour_percent = FLAGS_max_detour_percent;
    config.defaults.max_detour_minutes = FLAGS_max_detour_minutes;
    config.defaults.max_wait_minutes = FLAGS_max_wait_minutes;
    config.defaults.max_passengers_per_ride = FLAGS_max_passengers_per_ride;
    config.defaults.min_match_score = FLAGS_min_match_score;
    config.defaults.cell_resolution = FLAGS_cell_resolution;
    config.defaults.discount_percent = FLAGS_discount_percent;

    geo::GreatCircleRouterConfig router_config;
    router_config.road_factor = FLAGS_road_factor;

    platform::TaskPoolConfig pool_config;
    pool_config.name = "pool-routes";
    pool_config.num_workers = FLAGS_workers;
    auto tasks = std::make_shared<platform::TaskPool>(pool_config);

    auto engine = std::make_shared<pool::PoolMatchingEngine>(
        config,
        std::make_shared<pool::PostgresPoolStore>(pg_client),
        std::make_shared<geo::GreatCircleRouter>(router_config),
        std::make_shared<geo::GridCellIndex>(),
        tasks,
        sink);

    pool::PoolExpirySweeperConfig sweeper_config;
    sweeper_config.interval = std::chrono::seconds(FLAGS_expiry_sweep_seconds);
    pool::PoolExpirySweeper sweeper(engine, sweeper_config);

    // Service implementation inherits from all IFEX service classes
    auto service_impl = std::make_unique<pool::PoolMatchingServiceImpl>(
        engine, [pg_client]() { return pg_client->is_connected(); });

    platform::GrpcServiceConfig grpc_config;
    grpc_config.listen_address = FLAGS_grpc_listen;
    grpc_config.num_threads = FLAGS_grpc_threads;
    platform::GrpcServiceBase server(grpc_config);

    // Register all IFEX service interfaces (one per method)
    namespace proto = ridematch::pool_matching_service;
    server.register_service(static_cast<proto::request_pool_ride_service::Service*>(service_impl.get()));
    server.register_service(static_cast<proto::confirm_pool_ride_service::Service*>(service_impl.get()));
    server.register_service(static_cast<proto::cancel_pool_ride_service::Service*>(service_impl.get()));
    server.register_service(static_cast<proto::get_pool_status_service::Service*>(service_impl.get()));
    server.register_service(static_cast<proto::get_driver_pool_ride_service::Service*>(service_impl.get()));
    server.register_service(static_cast<proto::assign_driver_service::Service*>(service_impl.get()));
    server.register_service(static_cast<proto::start_pool_ride_service::Service*>(service_impl.get()));
    server.register_service(static_cast<proto::pickup_passenger_service::Service*>(service_impl.get()));
    server.register_service(static_cast<proto::dropoff_passenger_service::Service*>(service_impl.get()));
    server.register_service(static_cast<proto::mark_no_show_service::Service*>(service_impl.get()));
    server.register_service(static_cast<proto::get_pool_stats_service::Service*>(service_impl.get()));
    server.register_service(static_cast<proto::healthy_service::Service*>(service_impl.get()));

    // Stop background work before the server drains
    server.set_shutdown_callback([&sweeper]() { sweeper.stop(); });

    if (!server.start()) {
        LOG(ERROR) << "Failed to start gRPC server";
        return 1;
    }
    sweeper.start();

    LOG(INFO) << "Pool Matching Service listening on " << server.bound_address();

    // Returns after SIGINT/SIGTERM
    server.wait();

    LOG(INFO) << "Shutting down...";

    sweeper.stop();
    tasks->shutdown();
    producer->flush(5000);

    const auto& stats = engine->stats();
    LOG(INFO) << "Final stats:";
    LOG(INFO) << "  requests=" << stats.requests;
    LOG(INFO) << "  matches=" << stats.matches;
    LOG(INFO) << "  pools_created=" << stats.pools_created;
    LOG(INFO) << "  capacity_races=" << stats.capacity_races;
    LOG(INFO) << "  reoptimizations=" << stats.reoptimizations;
    LOG(INFO) << "  pools_expired=" << stats.pools_expired;
    LOG(INFO) << "  notifications_failed=" << sink->stats().notifications_failed;

    LOG(INFO) << "Pool Matching Service shutdown complete";
    return 0;
}

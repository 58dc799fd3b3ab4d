#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "dispatch_engine.hpp"
#include "kafka_consumer.hpp"
#include "ride-events.pb.h"
#include "task_pool.hpp"

namespace ridematch::dispatch {

/// Configuration for ride event consumer
struct RideEventConsumerConfig {
    platform::KafkaConsumerConfig kafka;
    std::vector<std::string> topics = {
        "ride.requested", "ride.accepted", "ride.cancelled",
        "ride.started", "ride.completed", "driver.location",
    };
    int poll_timeout_ms = 100;
};

/// Statistics for ride event consumer
struct RideEventConsumerStats {
    std::atomic<uint64_t> messages_received{0};
    std::atomic<uint64_t> events_dispatched{0};
    std::atomic<uint64_t> parse_errors{0};
    std::atomic<uint64_t> invalid_events{0};
    std::atomic<uint64_t> rejected{0};
};

// Wire to engine types. Dropoff is present only when the event carries one.
RideRequested from_proto(const ride_events::ride_requested_t& msg);
RideAccepted from_proto(const ride_events::ride_accepted_t& msg);
RideCancelled from_proto(const ride_events::ride_cancelled_t& msg);
RideStarted from_proto(const ride_events::ride_started_t& msg);
RideCompleted from_proto(const ride_events::ride_completed_t& msg);
DriverLocation from_proto(const ride_events::driver_location_t& msg);

/**
 * Background Kafka consumer for ride lifecycle events
 *
 * Decodes ride_event_t on the consumer thread and hands each event to the
 * DispatchEngine on the TaskPool, so slow handlers never stall polling.
 */
class RideEventConsumer {
public:
    RideEventConsumer(RideEventConsumerConfig config,
                      std::shared_ptr<DispatchEngine> engine,
                      std::shared_ptr<platform::TaskPool> tasks);
    ~RideEventConsumer();

    RideEventConsumer(const RideEventConsumer&) = delete;
    RideEventConsumer& operator=(const RideEventConsumer&) = delete;

    /// Subscribe and start consuming in a background thread
    bool start();

    /// Stop consuming and leave the consumer group
    void stop();

    bool is_running() const { return running_; }

    /// Decode one message and schedule its handler
    /// @return true if the event was handed to the engine
    bool process_message(const std::string& value);

    const RideEventConsumerStats& stats() const { return stats_; }

private:
    void run();

    RideEventConsumerConfig config_;
    std::shared_ptr<DispatchEngine> engine_;
    std::shared_ptr<platform::TaskPool> tasks_;

    std::unique_ptr<platform::KafkaConsumer> consumer_;
    std::atomic<bool> running_{false};
    std::thread consumer_thread_;
    RideEventConsumerStats stats_;
};

}  // namespace ridematch::dispatch

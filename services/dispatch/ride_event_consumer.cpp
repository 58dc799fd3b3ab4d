#include "ride_event_consumer.hpp"

#include <glog/logging.h>

#include "ride_event_codec.hpp"

namespace ridematch::dispatch {

namespace {

Location to_location(const ride_events::location_t& msg) {
    Location location;
    location.point.latitude = msg.latitude();
    location.point.longitude = msg.longitude();
    location.address = msg.address();
    return location;
}

}  // namespace

RideRequested from_proto(const ride_events::ride_requested_t& msg) {
    RideRequested event;
    event.ride_id = msg.ride_id();
    event.rider_id = msg.rider_id();
    event.rider_name = msg.rider_name();
    event.rider_rating = msg.rider_rating();
    event.pickup = to_location(msg.pickup());
    if (msg.has_dropoff()) {
        event.dropoff = to_location(msg.dropoff());
    }
    event.ride_type_id = msg.ride_type_id();
    event.ride_type_name = msg.ride_type_name();
    event.estimated_fare = msg.estimated_fare();
    event.estimated_distance_km = msg.estimated_distance_km();
    event.estimated_duration_minutes = msg.estimated_duration_minutes();
    event.currency = msg.currency();
    event.requested_at_ms = msg.requested_at_ms();
    return event;
}

RideAccepted from_proto(const ride_events::ride_accepted_t& msg) {
    RideAccepted event;
    event.ride_id = msg.ride_id();
    event.driver_id = msg.driver_id();
    event.driver_name = msg.driver_name();
    event.accepted_at_ms = msg.accepted_at_ms();
    return event;
}

RideCancelled from_proto(const ride_events::ride_cancelled_t& msg) {
    RideCancelled event;
    event.ride_id = msg.ride_id();
    event.cancelled_by = msg.cancelled_by();
    event.reason = msg.reason();
    event.cancelled_at_ms = msg.cancelled_at_ms();
    return event;
}

RideStarted from_proto(const ride_events::ride_started_t& msg) {
    RideStarted event;
    event.ride_id = msg.ride_id();
    event.driver_id = msg.driver_id();
    event.started_at_ms = msg.started_at_ms();
    return event;
}

RideCompleted from_proto(const ride_events::ride_completed_t& msg) {
    RideCompleted event;
    event.ride_id = msg.ride_id();
    event.driver_id = msg.driver_id();
    event.completed_at_ms = msg.completed_at_ms();
    return event;
}

DriverLocation from_proto(const ride_events::driver_location_t& msg) {
    DriverLocation event;
    event.driver_id = msg.driver_id();
    event.point.latitude = msg.latitude();
    event.point.longitude = msg.longitude();
    event.heading = msg.heading();
    event.speed_kmh = msg.speed_kmh();
    event.timestamp_ms = msg.timestamp_ms();
    return event;
}

RideEventConsumer::RideEventConsumer(RideEventConsumerConfig config,
                                     std::shared_ptr<DispatchEngine> engine,
                                     std::shared_ptr<platform::TaskPool> tasks)
    : config_(std::move(config)), engine_(std::move(engine)), tasks_(std::move(tasks)) {}

RideEventConsumer::~RideEventConsumer() {
    stop();
}

bool RideEventConsumer::start() {
    if (running_) {
        LOG(WARNING) << "Ride event consumer already running";
        return true;
    }

    consumer_ = std::make_unique<platform::KafkaConsumer>(config_.kafka);
    if (!consumer_->subscribe(config_.topics)) {
        LOG(ERROR) << "Failed to subscribe ride event consumer";
        consumer_.reset();
        return false;
    }

    running_ = true;
    consumer_thread_ = std::thread([this]() { run(); });

    LOG(INFO) << "Ride event consumer started on " << config_.topics.size() << " topics";
    return true;
}

void RideEventConsumer::stop() {
    if (!running_) return;

    running_ = false;
    if (consumer_) {
        consumer_->stop();
    }
    if (consumer_thread_.joinable()) {
        consumer_thread_.join();
    }
    if (consumer_) {
        consumer_->close();
    }

    LOG(INFO) << "Ride event consumer stopped";
}

void RideEventConsumer::run() {
    LOG(INFO) << "Ride event consumer thread started";

    consumer_->consume_loop([this](const platform::KafkaMessage& message) {
        stats_.messages_received++;
        VLOG(2) << "Ride event from " << message.topic << " key=" << message.key;
        process_message(message.value);
    }, config_.poll_timeout_ms);

    LOG(INFO) << "Ride event consumer thread stopped";
}

bool RideEventConsumer::process_message(const std::string& value) {
    auto event = codec::decode_ride_event(value);
    if (!event) {
        LOG(WARNING) << "Failed to decode ride event";
        stats_.parse_errors++;
        return false;
    }

    platform::TaskPool::Task task;
    std::shared_ptr<DispatchEngine> engine = engine_;

    switch (event->event_case()) {
        case ride_events::ride_event_t::kRequested: {
            auto requested = from_proto(event->requested());
            if (requested.ride_id.empty() ||
                !geo::is_valid_coordinate(requested.pickup.point)) {
                LOG(WARNING) << "Ignoring ride request with missing id or invalid pickup";
                stats_.invalid_events++;
                return false;
            }
            task = [engine, requested]() { engine->on_ride_requested(requested); };
            break;
        }
        case ride_events::ride_event_t::kAccepted: {
            auto accepted = from_proto(event->accepted());
            if (accepted.ride_id.empty() || accepted.driver_id.empty()) {
                LOG(WARNING) << "Ignoring ride acceptance without ride or driver id";
                stats_.invalid_events++;
                return false;
            }
            task = [engine, accepted]() { engine->on_ride_accepted(accepted); };
            break;
        }
        case ride_events::ride_event_t::kCancelled: {
            auto cancelled = from_proto(event->cancelled());
            if (cancelled.ride_id.empty()) {
                stats_.invalid_events++;
                return false;
            }
            task = [engine, cancelled]() { engine->on_ride_cancelled(cancelled); };
            break;
        }
        case ride_events::ride_event_t::kStarted: {
            auto started = from_proto(event->started());
            if (started.ride_id.empty() || started.driver_id.empty()) {
                stats_.invalid_events++;
                return false;
            }
            task = [engine, started]() { engine->on_ride_started(started); };
            break;
        }
        case ride_events::ride_event_t::kCompleted: {
            auto completed = from_proto(event->completed());
            if (completed.ride_id.empty()) {
                stats_.invalid_events++;
                return false;
            }
            task = [engine, completed]() { engine->on_ride_completed(completed); };
            break;
        }
        case ride_events::ride_event_t::kDriverLocation: {
            auto location = from_proto(event->driver_location());
            if (location.driver_id.empty() || !geo::is_valid_coordinate(location.point)) {
                stats_.invalid_events++;
                return false;
            }
            task = [engine, location]() { engine->on_driver_location(location); };
            break;
        }
        default:
            stats_.invalid_events++;
            return false;
    }

    if (!tasks_->submit(std::move(task))) {
        LOG(WARNING) << "Task pool rejected " << codec::ride_event_kind(*event) << " event";
        stats_.rejected++;
        return false;
    }

    VLOG(1) << "Dispatched " << codec::ride_event_kind(*event) << " event "
            << event->event_id();
    stats_.events_dispatched++;
    return true;
}

}  // namespace ridematch::dispatch

#include "pool_matching_service_impl.hpp"

#include <glog/logging.h>

namespace ridematch::pool {

namespace {

void set_location(const geo::LatLng& point, proto::location_t* out) {
    out->set_latitude(point.latitude);
    out->set_longitude(point.longitude);
}

geo::LatLng to_point(const proto::location_t& location) {
    geo::LatLng point;
    point.latitude = location.latitude();
    point.longitude = location.longitude();
    return point;
}

grpc::Status require(const std::string& value, const char* name) {
    if (value.empty()) {
        return grpc::Status(grpc::INVALID_ARGUMENT, std::string(name) + " is required");
    }
    return grpc::Status::OK;
}

}  // namespace

grpc::Status to_grpc_status(const PoolResult& result) {
    switch (result.code) {
        case PoolError::kOk:
            return grpc::Status::OK;
        case PoolError::kInvalidArgument:
            return grpc::Status(grpc::INVALID_ARGUMENT, result.message);
        case PoolError::kFailedPrecondition:
            return grpc::Status(grpc::FAILED_PRECONDITION, result.message);
        case PoolError::kNotFound:
            return grpc::Status(grpc::NOT_FOUND, result.message);
        case PoolError::kForbidden:
            return grpc::Status(grpc::PERMISSION_DENIED, result.message);
        case PoolError::kUnavailable:
            return grpc::Status(grpc::UNAVAILABLE, result.message);
        case PoolError::kInternal:
            return grpc::Status(grpc::INTERNAL, result.message);
    }
    return grpc::Status(grpc::UNKNOWN, result.message);
}

proto::pool_status_t to_proto(PoolStatus status) {
    switch (status) {
        case PoolStatus::kMatching: return proto::POOL_MATCHING;
        case PoolStatus::kConfirmed: return proto::POOL_CONFIRMED;
        case PoolStatus::kInProgress: return proto::POOL_IN_PROGRESS;
        case PoolStatus::kCompleted: return proto::POOL_COMPLETED;
        case PoolStatus::kCancelled: return proto::POOL_CANCELLED;
    }
    return proto::POOL_STATUS_UNKNOWN;
}

proto::passenger_status_t to_proto(PassengerStatus status) {
    switch (status) {
        case PassengerStatus::kPending: return proto::PASSENGER_PENDING;
        case PassengerStatus::kConfirmed: return proto::PASSENGER_CONFIRMED;
        case PassengerStatus::kPickedUp: return proto::PASSENGER_PICKED_UP;
        case PassengerStatus::kDroppedOff: return proto::PASSENGER_DROPPED_OFF;
        case PassengerStatus::kCancelled: return proto::PASSENGER_CANCELLED;
        case PassengerStatus::kNoShow: return proto::PASSENGER_NO_SHOW;
    }
    return proto::PASSENGER_STATUS_UNKNOWN;
}

void to_proto(const RouteStop& stop, proto::route_stop_t* out) {
    out->set_id(stop.id);
    out->set_pool_passenger_id(stop.pool_passenger_id);
    out->set_type(stop.type == StopType::kPickup ? proto::STOP_PICKUP : proto::STOP_DROPOFF);
    set_location(stop.location, out->mutable_location());
    out->set_address(stop.address);
    out->set_sequence_order(stop.sequence_order);
    out->set_estimated_arrival_ms(stop.estimated_arrival_ms);
    out->set_actual_arrival_ms(stop.actual_arrival_ms.value_or(0));
}

void to_proto(const PoolRide& pool, proto::pool_ride_t* out) {
    out->set_id(pool.id);
    out->set_driver_id(pool.driver_id.value_or(""));
    out->set_vehicle_id(pool.vehicle_id.value_or(""));
    out->set_status(to_proto(pool.status));
    out->set_max_passengers(pool.max_passengers);
    out->set_current_passengers(pool.current_passengers);
    for (const auto& stop : pool.optimized_route) {
        to_proto(stop, out->add_optimized_route());
    }
    out->set_total_distance_km(pool.total_distance_km);
    out->set_total_duration_minutes(pool.total_duration_minutes);
    set_location(pool.center, out->mutable_center());
    out->set_radius_km(pool.radius_km);
    out->set_cell_id(pool.cell_id);
    out->set_base_fare(pool.base_fare);
    out->set_per_km_rate(pool.per_km_rate);
    out->set_per_minute_rate(pool.per_minute_rate);
    out->set_match_deadline_ms(pool.match_deadline_ms);
    out->set_started_at_ms(pool.started_at_ms.value_or(0));
    out->set_completed_at_ms(pool.completed_at_ms.value_or(0));
    out->set_created_at_ms(pool.created_at_ms);
}

void to_proto(const PoolPassenger& passenger, proto::pool_passenger_t* out) {
    out->set_id(passenger.id);
    out->set_pool_ride_id(passenger.pool_ride_id);
    out->set_rider_id(passenger.rider_id);
    out->set_status(to_proto(passenger.status));
    set_location(passenger.pickup, out->mutable_pickup());
    set_location(passenger.dropoff, out->mutable_dropoff());
    out->set_pickup_address(passenger.pickup_address);
    out->set_dropoff_address(passenger.dropoff_address);
    out->set_direct_distance_km(passenger.direct_distance_km);
    out->set_direct_duration_minutes(passenger.direct_duration_minutes);
    out->set_original_fare(passenger.original_fare);
    out->set_pool_fare(passenger.pool_fare);
    out->set_savings_percent(passenger.savings_percent);
    out->set_seat_count(passenger.seat_count);
    out->set_picked_up_at_ms(passenger.picked_up_at_ms.value_or(0));
    out->set_dropped_off_at_ms(passenger.dropped_off_at_ms.value_or(0));
    out->set_estimated_pickup_ms(passenger.estimated_pickup_ms);
    out->set_estimated_dropoff_ms(passenger.estimated_dropoff_ms);
}

void to_proto(const PoolRideResult& result, proto::pool_ride_result_t* out) {
    out->set_pool_passenger_id(result.pool_passenger_id);
    out->set_pool_ride_id(result.pool_ride_id);
    out->set_match_found(result.match_found);
    out->set_original_fare(result.original_fare);
    out->set_pool_fare(result.pool_fare);
    out->set_savings_percent(result.savings_percent);
    out->set_estimated_pickup_ms(result.estimated_pickup_ms);
    out->set_estimated_dropoff_ms(result.estimated_dropoff_ms);
    out->set_match_deadline_ms(result.match_deadline_ms);
    out->set_match_score(result.match_score ? result.match_score->score : 0.0);
    out->set_current_passengers(result.current_passengers);
    out->set_max_passengers(result.max_passengers);
    out->set_message(result.message);
}

void to_proto(const PoolStats& stats, proto::pool_stats_t* out) {
    out->set_total_pools(stats.total_pools);
    out->set_active_pools(stats.active_pools);
    out->set_avg_passengers_per_pool(stats.avg_passengers_per_pool);
    out->set_avg_savings_percent(stats.avg_savings_percent);
    out->set_match_success_rate(stats.match_success_rate);
    out->set_total_co2_saved_kg(stats.total_co2_saved_kg);
}

PoolRideRequest from_proto(const proto::pool_ride_request_t& request) {
    PoolRideRequest out;
    out.pickup = to_point(request.pickup());
    out.dropoff = to_point(request.dropoff());
    out.pickup_address = request.pickup_address();
    out.dropoff_address = request.dropoff_address();
    out.passenger_count = request.passenger_count();
    out.max_wait_minutes = request.max_wait_minutes();
    out.city_id = request.city_id();
    return out;
}

PoolMatchingServiceImpl::PoolMatchingServiceImpl(std::shared_ptr<PoolMatchingEngine> engine,
                                                 HealthCheck health_check)
    : engine_(std::move(engine)), health_check_(std::move(health_check)) {}

grpc::Status PoolMatchingServiceImpl::request_pool_ride(
    grpc::ServerContext* context,
    const proto::request_pool_ride_request* request,
    proto::request_pool_ride_response* response) {

    auto status = require(request->rider_id(), "rider_id");
    if (!status.ok()) return status;
    if (!request->has_request() || !request->request().has_pickup() ||
        !request->request().has_dropoff()) {
        return grpc::Status(grpc::INVALID_ARGUMENT, "pickup and dropoff are required");
    }

    PoolRideResult result;
    auto outcome = engine_->request_pool_ride(request->rider_id(),
                                              from_proto(request->request()), &result);
    if (!outcome.ok()) {
        LOG(WARNING) << "request_pool_ride failed for rider " << request->rider_id()
                     << ": " << to_string(outcome.code) << " " << outcome.message;
        return to_grpc_status(outcome);
    }

    to_proto(result, response->mutable_result());
    return grpc::Status::OK;
}

grpc::Status PoolMatchingServiceImpl::confirm_pool_ride(
    grpc::ServerContext* context,
    const proto::confirm_pool_ride_request* request,
    proto::confirm_pool_ride_response* response) {

    auto status = require(request->rider_id(), "rider_id");
    if (!status.ok()) return status;
    status = require(request->pool_passenger_id(), "pool_passenger_id");
    if (!status.ok()) return status;

    PassengerStatus new_status = PassengerStatus::kPending;
    auto outcome = engine_->confirm_pool_ride(request->rider_id(), request->pool_passenger_id(),
                                              request->accept(), &new_status);
    if (!outcome.ok()) {
        return to_grpc_status(outcome);
    }

    response->set_success(true);
    response->set_status(to_proto(new_status));
    return grpc::Status::OK;
}

grpc::Status PoolMatchingServiceImpl::cancel_pool_ride(
    grpc::ServerContext* context,
    const proto::cancel_pool_ride_request* request,
    proto::cancel_pool_ride_response* response) {

    auto status = require(request->rider_id(), "rider_id");
    if (!status.ok()) return status;
    status = require(request->pool_passenger_id(), "pool_passenger_id");
    if (!status.ok()) return status;

    auto outcome = engine_->cancel_pool_ride(request->rider_id(), request->pool_passenger_id());
    if (!outcome.ok()) {
        return to_grpc_status(outcome);
    }

    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status PoolMatchingServiceImpl::get_pool_status(
    grpc::ServerContext* context,
    const proto::get_pool_status_request* request,
    proto::get_pool_status_response* response) {

    auto status = require(request->rider_id(), "rider_id");
    if (!status.ok()) return status;
    status = require(request->pool_ride_id(), "pool_ride_id");
    if (!status.ok()) return status;

    PoolStatusView view;
    auto outcome = engine_->get_pool_status(request->rider_id(), request->pool_ride_id(), &view);
    if (!outcome.ok()) {
        return to_grpc_status(outcome);
    }

    auto* out = response->mutable_status();
    to_proto(view.pool_ride, out->mutable_pool_ride());
    out->set_your_status(to_proto(view.your_status));
    for (const auto& stop : view.route) {
        to_proto(stop, out->add_route());
    }
    out->set_estimated_arrival_ms(view.estimated_arrival_ms);
    for (const auto& other : view.other_passengers) {
        auto* co = out->add_other_passengers();
        co->set_first_name_initial(other.first_name_initial);
        co->set_pickup_stop(other.pickup_stop);
        co->set_dropoff_stop(other.dropoff_stop);
    }
    return grpc::Status::OK;
}

grpc::Status PoolMatchingServiceImpl::get_driver_pool_ride(
    grpc::ServerContext* context,
    const proto::get_driver_pool_ride_request* request,
    proto::get_driver_pool_ride_response* response) {

    auto status = require(request->driver_id(), "driver_id");
    if (!status.ok()) return status;

    DriverPoolView view;
    auto outcome = engine_->get_driver_pool_ride(request->driver_id(), &view);
    if (!outcome.ok()) {
        return to_grpc_status(outcome);
    }

    auto* out = response->mutable_view();
    to_proto(view.pool_ride, out->mutable_pool_ride());
    for (const auto& passenger : view.passengers) {
        to_proto(passenger, out->add_passengers());
    }
    for (const auto& stop : view.route) {
        to_proto(stop, out->add_route());
    }
    if (view.next_stop) {
        to_proto(*view.next_stop, out->mutable_next_stop());
    }
    out->set_total_fare(view.total_fare);
    out->set_driver_earnings(view.driver_earnings);
    return grpc::Status::OK;
}

grpc::Status PoolMatchingServiceImpl::assign_driver(
    grpc::ServerContext* context,
    const proto::assign_driver_request* request,
    proto::assign_driver_response* response) {

    auto status = require(request->pool_ride_id(), "pool_ride_id");
    if (!status.ok()) return status;
    status = require(request->driver_id(), "driver_id");
    if (!status.ok()) return status;

    auto outcome = engine_->assign_driver(request->pool_ride_id(), request->driver_id(),
                                          request->vehicle_id());
    if (!outcome.ok()) {
        return to_grpc_status(outcome);
    }

    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status PoolMatchingServiceImpl::start_pool_ride(
    grpc::ServerContext* context,
    const proto::start_pool_ride_request* request,
    proto::start_pool_ride_response* response) {

    auto status = require(request->driver_id(), "driver_id");
    if (!status.ok()) return status;
    status = require(request->pool_ride_id(), "pool_ride_id");
    if (!status.ok()) return status;

    auto outcome = engine_->start_pool_ride(request->driver_id(), request->pool_ride_id());
    if (!outcome.ok()) {
        return to_grpc_status(outcome);
    }

    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status PoolMatchingServiceImpl::pickup_passenger(
    grpc::ServerContext* context,
    const proto::pickup_passenger_request* request,
    proto::pickup_passenger_response* response) {

    auto status = require(request->driver_id(), "driver_id");
    if (!status.ok()) return status;
    status = require(request->pool_passenger_id(), "pool_passenger_id");
    if (!status.ok()) return status;

    auto outcome = engine_->pickup_passenger(request->driver_id(), request->pool_passenger_id());
    if (!outcome.ok()) {
        return to_grpc_status(outcome);
    }

    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status PoolMatchingServiceImpl::dropoff_passenger(
    grpc::ServerContext* context,
    const proto::dropoff_passenger_request* request,
    proto::dropoff_passenger_response* response) {

    auto status = require(request->driver_id(), "driver_id");
    if (!status.ok()) return status;
    status = require(request->pool_passenger_id(), "pool_passenger_id");
    if (!status.ok()) return status;

    bool pool_completed = false;
    auto outcome = engine_->dropoff_passenger(request->driver_id(),
                                              request->pool_passenger_id(), &pool_completed);
    if (!outcome.ok()) {
        return to_grpc_status(outcome);
    }

    response->set_success(true);
    response->set_pool_completed(pool_completed);
    return grpc::Status::OK;
}

grpc::Status PoolMatchingServiceImpl::mark_no_show(
    grpc::ServerContext* context,
    const proto::mark_no_show_request* request,
    proto::mark_no_show_response* response) {

    auto status = require(request->driver_id(), "driver_id");
    if (!status.ok()) return status;
    status = require(request->pool_passenger_id(), "pool_passenger_id");
    if (!status.ok()) return status;

    auto outcome = engine_->mark_no_show(request->driver_id(), request->pool_passenger_id());
    if (!outcome.ok()) {
        return to_grpc_status(outcome);
    }

    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status PoolMatchingServiceImpl::get_pool_stats(
    grpc::ServerContext* context,
    const proto::get_pool_stats_request* request,
    proto::get_pool_stats_response* response) {

    PoolStats stats;
    auto outcome = engine_->get_pool_stats(&stats);
    if (!outcome.ok()) {
        return to_grpc_status(outcome);
    }

    to_proto(stats, response->mutable_stats());
    return grpc::Status::OK;
}

grpc::Status PoolMatchingServiceImpl::healthy(
    grpc::ServerContext* context,
    const proto::healthy_request* request,
    proto::healthy_response* response) {

    bool healthy = engine_ && (!health_check_ || health_check_());
    response->set_is_healthy(healthy);
    return grpc::Status::OK;
}

}  // namespace ridematch::pool

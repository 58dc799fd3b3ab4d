#pragma once

#include <functional>
#include <memory>

#include "pool-matching-service.grpc.pb.h"
#include "pool_matching_engine.hpp"

namespace ridematch::pool {

// Namespace alias for generated types
namespace proto = ridematch::pool_matching_service;

/// PoolError to gRPC status; FORBIDDEN becomes PERMISSION_DENIED
grpc::Status to_grpc_status(const PoolResult& result);

// Engine records to wire messages
void to_proto(const RouteStop& stop, proto::route_stop_t* out);
void to_proto(const PoolRide& pool, proto::pool_ride_t* out);
void to_proto(const PoolPassenger& passenger, proto::pool_passenger_t* out);
void to_proto(const PoolRideResult& result, proto::pool_ride_result_t* out);
void to_proto(const PoolStats& stats, proto::pool_stats_t* out);
proto::pool_status_t to_proto(PoolStatus status);
proto::passenger_status_t to_proto(PassengerStatus status);

/// Wire request to engine request
PoolRideRequest from_proto(const proto::pool_ride_request_t& request);

/**
 * Pool Matching Service gRPC implementation (IFEX-based)
 *
 * Inherits from one IFEX-style service class per method and forwards each
 * call to the PoolMatchingEngine. Caller identity arrives in the request.
 */
class PoolMatchingServiceImpl final
    : public proto::request_pool_ride_service::Service,
      public proto::confirm_pool_ride_service::Service,
      public proto::cancel_pool_ride_service::Service,
      public proto::get_pool_status_service::Service,
      public proto::get_driver_pool_ride_service::Service,
      public proto::assign_driver_service::Service,
      public proto::start_pool_ride_service::Service,
      public proto::pickup_passenger_service::Service,
      public proto::dropoff_passenger_service::Service,
      public proto::mark_no_show_service::Service,
      public proto::get_pool_stats_service::Service,
      public proto::healthy_service::Service {
public:
    using HealthCheck = std::function<bool()>;

    explicit PoolMatchingServiceImpl(std::shared_ptr<PoolMatchingEngine> engine,
                                     HealthCheck health_check = nullptr);

    // Join an open pool or start a new one
    grpc::Status request_pool_ride(
        grpc::ServerContext* context,
        const proto::request_pool_ride_request* request,
        proto::request_pool_ride_response* response) override;

    // Accept or decline a pending seat
    grpc::Status confirm_pool_ride(
        grpc::ServerContext* context,
        const proto::confirm_pool_ride_request* request,
        proto::confirm_pool_ride_response* response) override;

    grpc::Status cancel_pool_ride(
        grpc::ServerContext* context,
        const proto::cancel_pool_ride_request* request,
        proto::cancel_pool_ride_response* response) override;

    // Rider view of a pool
    grpc::Status get_pool_status(
        grpc::ServerContext* context,
        const proto::get_pool_status_request* request,
        proto::get_pool_status_response* response) override;

    // Driver view of the active pool
    grpc::Status get_driver_pool_ride(
        grpc::ServerContext* context,
        const proto::get_driver_pool_ride_request* request,
        proto::get_driver_pool_ride_response* response) override;

    grpc::Status assign_driver(
        grpc::ServerContext* context,
        const proto::assign_driver_request* request,
        proto::assign_driver_response* response) override;

    grpc::Status start_pool_ride(
        grpc::ServerContext* context,
        const proto::start_pool_ride_request* request,
        proto::start_pool_ride_response* response) override;

    grpc::Status pickup_passenger(
        grpc::ServerContext* context,
        const proto::pickup_passenger_request* request,
        proto::pickup_passenger_response* response) override;

    grpc::Status dropoff_passenger(
        grpc::ServerContext* context,
        const proto::dropoff_passenger_request* request,
        proto::dropoff_passenger_response* response) override;

    grpc::Status mark_no_show(
        grpc::ServerContext* context,
        const proto::mark_no_show_request* request,
        proto::mark_no_show_response* response) override;

    grpc::Status get_pool_stats(
        grpc::ServerContext* context,
        const proto::get_pool_stats_request* request,
        proto::get_pool_stats_response* response) override;

    // Health check (IFEX standard method)
    grpc::Status healthy(
        grpc::ServerContext* context,
        const proto::healthy_request* request,
        proto::healthy_response* response) override;

private:
    std::shared_ptr<PoolMatchingEngine> engine_;
    HealthCheck health_check_;
};

}  // namespace ridematch::pool

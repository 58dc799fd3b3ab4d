/**
 * @file pool_matching_service_test.cpp
 * @brief Unit tests for the pool matching gRPC surface
 *
 * Handlers are called directly without a server; none of them read the
 * ServerContext.
 */

#include <gtest/gtest.h>
#include <glog/logging.h>

#include <chrono>
#include <memory>

#include "pool_matching_service_impl.hpp"
#include "test_doubles.hpp"

using namespace ridematch::pool;
using ridematch::geo::GridCellIndex;
using ridematch::platform::TaskPool;
using ridematch::test::InMemoryPoolStore;
using ridematch::test::SwitchableRouter;
using namespace std::chrono_literals;

class PoolMatchingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        static bool glog_initialized = false;
        if (!glog_initialized) {
            google::InitGoogleLogging("pool_matching_service_test");
            FLAGS_logtostderr = true;
            glog_initialized = true;
        }

        store_ = std::make_shared<InMemoryPoolStore>();
        tasks_ = std::make_shared<TaskPool>();
        engine_ = std::make_shared<PoolMatchingEngine>(
            PoolServiceConfig{}, store_, std::make_shared<SwitchableRouter>(),
            std::make_shared<GridCellIndex>(), tasks_);
        service_ = std::make_unique<PoolMatchingServiceImpl>(engine_);
    }

    void TearDown() override {
        tasks_->shutdown();
    }

    static proto::request_pool_ride_request ride_request(const std::string& rider) {
        proto::request_pool_ride_request request;
        request.set_rider_id(rider);
        auto* trip = request.mutable_request();
        trip->mutable_pickup()->set_latitude(40.7580);
        trip->mutable_pickup()->set_longitude(-73.9855);
        trip->mutable_dropoff()->set_latitude(40.7128);
        trip->mutable_dropoff()->set_longitude(-74.0060);
        trip->set_pickup_address("Times Square");
        return request;
    }

    std::shared_ptr<InMemoryPoolStore> store_;
    std::shared_ptr<TaskPool> tasks_;
    std::shared_ptr<PoolMatchingEngine> engine_;
    std::unique_ptr<PoolMatchingServiceImpl> service_;
};

// =============================================================================
// Status mapping
// =============================================================================

TEST_F(PoolMatchingServiceTest, ErrorCodesMapToGrpc) {
    EXPECT_TRUE(to_grpc_status(PoolResult::success()).ok());
    EXPECT_EQ(to_grpc_status(PoolResult::error(PoolError::kInvalidArgument, "x")).error_code(),
              grpc::INVALID_ARGUMENT);
    EXPECT_EQ(to_grpc_status(PoolResult::error(PoolError::kFailedPrecondition, "x")).error_code(),
              grpc::FAILED_PRECONDITION);
    EXPECT_EQ(to_grpc_status(PoolResult::error(PoolError::kNotFound, "x")).error_code(),
              grpc::NOT_FOUND);
    EXPECT_EQ(to_grpc_status(PoolResult::error(PoolError::kUnavailable, "x")).error_code(),
              grpc::UNAVAILABLE);
    EXPECT_EQ(to_grpc_status(PoolResult::error(PoolError::kInternal, "x")).error_code(),
              grpc::INTERNAL);

    auto forbidden = to_grpc_status(PoolResult::error(PoolError::kForbidden, "not yours"));
    EXPECT_EQ(forbidden.error_code(), grpc::PERMISSION_DENIED);
    EXPECT_EQ(forbidden.error_message(), "not yours");
}

// =============================================================================
// Handlers
// =============================================================================

TEST_F(PoolMatchingServiceTest, RequestReturnsResult) {
    auto request = ride_request("rider-a");
    proto::request_pool_ride_response response;
    auto status = service_->request_pool_ride(nullptr, &request, &response);
    ASSERT_TRUE(status.ok()) << status.error_message();

    const auto& result = response.result();
    EXPECT_FALSE(result.pool_ride_id().empty());
    EXPECT_FALSE(result.match_found());
    EXPECT_EQ(result.current_passengers(), 1);
    EXPECT_EQ(result.max_passengers(), 4);
    EXPECT_DOUBLE_EQ(result.match_score(), 0.0);
    EXPECT_GT(result.original_fare(), result.pool_fare());
}

TEST_F(PoolMatchingServiceTest, RequiredFieldsAreChecked) {
    auto missing_rider = ride_request("");
    proto::request_pool_ride_response ride_response;
    EXPECT_EQ(service_->request_pool_ride(nullptr, &missing_rider, &ride_response).error_code(),
              grpc::INVALID_ARGUMENT);

    proto::request_pool_ride_request no_dropoff = ride_request("rider-a");
    no_dropoff.mutable_request()->clear_dropoff();
    EXPECT_EQ(service_->request_pool_ride(nullptr, &no_dropoff, &ride_response).error_code(),
              grpc::INVALID_ARGUMENT);

    proto::confirm_pool_ride_request confirm;
    confirm.set_rider_id("rider-a");
    proto::confirm_pool_ride_response confirm_response;
    EXPECT_EQ(service_->confirm_pool_ride(nullptr, &confirm, &confirm_response).error_code(),
              grpc::INVALID_ARGUMENT);

    proto::get_driver_pool_ride_request driver;
    proto::get_driver_pool_ride_response driver_response;
    EXPECT_EQ(service_->get_driver_pool_ride(nullptr, &driver, &driver_response).error_code(),
              grpc::INVALID_ARGUMENT);

    proto::assign_driver_request assign;
    assign.set_pool_ride_id("pool-1");
    proto::assign_driver_response assign_response;
    EXPECT_EQ(service_->assign_driver(nullptr, &assign, &assign_response).error_code(),
              grpc::INVALID_ARGUMENT);
}

TEST_F(PoolMatchingServiceTest, ConfirmReturnsNewStatus) {
    auto request = ride_request("rider-a");
    proto::request_pool_ride_response ride;
    ASSERT_TRUE(service_->request_pool_ride(nullptr, &request, &ride).ok());

    proto::confirm_pool_ride_request confirm;
    confirm.set_rider_id("rider-a");
    confirm.set_pool_passenger_id(ride.result().pool_passenger_id());
    confirm.set_accept(true);
    proto::confirm_pool_ride_response response;
    ASSERT_TRUE(service_->confirm_pool_ride(nullptr, &confirm, &response).ok());
    EXPECT_TRUE(response.success());
    EXPECT_EQ(response.status(), proto::PASSENGER_CONFIRMED);
}

TEST_F(PoolMatchingServiceTest, OutsiderCannotViewPool) {
    auto request = ride_request("rider-a");
    proto::request_pool_ride_response ride;
    ASSERT_TRUE(service_->request_pool_ride(nullptr, &request, &ride).ok());

    proto::get_pool_status_request status_request;
    status_request.set_rider_id("rider-x");
    status_request.set_pool_ride_id(ride.result().pool_ride_id());
    proto::get_pool_status_response response;
    EXPECT_EQ(service_->get_pool_status(nullptr, &status_request, &response).error_code(),
              grpc::PERMISSION_DENIED);

    status_request.set_rider_id("rider-a");
    ASSERT_TRUE(service_->get_pool_status(nullptr, &status_request, &response).ok());
    EXPECT_EQ(response.status().your_status(), proto::PASSENGER_PENDING);
    EXPECT_EQ(response.status().route_size(), 2);
    EXPECT_EQ(response.status().pool_ride().status(), proto::POOL_MATCHING);
}

TEST_F(PoolMatchingServiceTest, DriverViewReportsNextStop) {
    auto request = ride_request("rider-a");
    proto::request_pool_ride_response ride;
    ASSERT_TRUE(service_->request_pool_ride(nullptr, &request, &ride).ok());

    proto::assign_driver_request assign;
    assign.set_pool_ride_id(ride.result().pool_ride_id());
    assign.set_driver_id("drv-1");
    proto::assign_driver_response assigned;
    ASSERT_TRUE(service_->assign_driver(nullptr, &assign, &assigned).ok());

    proto::get_driver_pool_ride_request driver;
    driver.set_driver_id("drv-1");
    proto::get_driver_pool_ride_response response;
    ASSERT_TRUE(service_->get_driver_pool_ride(nullptr, &driver, &response).ok());

    const auto& view = response.view();
    EXPECT_TRUE(view.has_next_stop());
    EXPECT_EQ(view.next_stop().type(), proto::STOP_PICKUP);
    EXPECT_EQ(view.next_stop().address(), "Times Square");
    EXPECT_EQ(view.passengers_size(), 1);
    EXPECT_EQ(view.pool_ride().driver_id(), "drv-1");
    EXPECT_DOUBLE_EQ(view.total_fare(), ride.result().pool_fare());
}

TEST_F(PoolMatchingServiceTest, StatsFailureIsInternal) {
    proto::get_pool_stats_request request;
    proto::get_pool_stats_response response;
    ASSERT_TRUE(service_->get_pool_stats(nullptr, &request, &response).ok());
    EXPECT_EQ(response.stats().total_pools(), 0);

    store_->set_fail(true);
    EXPECT_EQ(service_->get_pool_stats(nullptr, &request, &response).error_code(),
              grpc::INTERNAL);
}

TEST_F(PoolMatchingServiceTest, HealthFollowsCheck) {
    proto::healthy_request request;
    proto::healthy_response response;
    ASSERT_TRUE(service_->healthy(nullptr, &request, &response).ok());
    EXPECT_TRUE(response.is_healthy());

    PoolMatchingServiceImpl checked(engine_, []() { return false; });
    ASSERT_TRUE(checked.healthy(nullptr, &request, &response).ok());
    EXPECT_FALSE(response.is_healthy());
}

// =============================================================================
// Conversions
// =============================================================================

TEST_F(PoolMatchingServiceTest, StopConversion) {
    RouteStop stop;
    stop.id = "stop-1";
    stop.pool_passenger_id = "pp-1";
    stop.type = StopType::kDropoff;
    stop.location = ridematch::geo::LatLng{40.7, -74.0};
    stop.sequence_order = 2;

    proto::route_stop_t out;
    to_proto(stop, &out);
    EXPECT_EQ(out.type(), proto::STOP_DROPOFF);
    EXPECT_EQ(out.actual_arrival_ms(), 0);
    EXPECT_DOUBLE_EQ(out.location().longitude(), -74.0);
    EXPECT_EQ(out.sequence_order(), 2);
}

TEST_F(PoolMatchingServiceTest, RequestConversion) {
    auto wire = ride_request("rider-a");
    wire.mutable_request()->set_passenger_count(2);
    wire.mutable_request()->set_city_id("nyc");

    auto request = from_proto(wire.request());
    EXPECT_EQ(request.passenger_count, 2);
    EXPECT_EQ(request.city_id, "nyc");
    EXPECT_DOUBLE_EQ(request.pickup.latitude, 40.7580);
    EXPECT_EQ(request.pickup_address, "Times Square");
}

TEST_F(PoolMatchingServiceTest, StatusEnums) {
    EXPECT_EQ(to_proto(PoolStatus::kInProgress), proto::POOL_IN_PROGRESS);
    EXPECT_EQ(to_proto(PassengerStatus::kNoShow), proto::PASSENGER_NO_SHOW);
}

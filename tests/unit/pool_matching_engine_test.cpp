/**
 * @file pool_matching_engine_test.cpp
 * @brief Unit tests for pool matching and the pool lifecycle
 *
 * The engine runs against the in-memory pool store, great-circle routing
 * and the grid cell index. Route re-optimization runs on a real TaskPool;
 * tests wait for it to go idle before reading routes.
 */

#include <gtest/gtest.h>
#include <glog/logging.h>

#include <chrono>
#include <memory>
#include <thread>

#include "pool_expiry_sweeper.hpp"
#include "pool_matching_engine.hpp"
#include "test_doubles.hpp"

using namespace ridematch::pool;
using ridematch::geo::GridCellIndex;
using ridematch::geo::LatLng;
using ridematch::platform::TaskPool;
using ridematch::test::InMemoryPoolStore;
using ridematch::test::RecordingNotificationSink;
using ridematch::test::SwitchableRouter;
using namespace std::chrono_literals;

namespace {

const LatLng kMidtown{40.7580, -73.9855};
const LatLng kDowntown{40.7128, -74.0060};
const LatLng kBattery{40.7056, -74.0090};

}  // namespace

class PoolMatchingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        static bool glog_initialized = false;
        if (!glog_initialized) {
            google::InitGoogleLogging("pool_matching_engine_test");
            FLAGS_logtostderr = true;
            glog_initialized = true;
        }

        store_ = std::make_shared<InMemoryPoolStore>();
        router_ = std::make_shared<SwitchableRouter>();
        cells_ = std::make_shared<GridCellIndex>();
        tasks_ = std::make_shared<TaskPool>();
        sink_ = std::make_shared<RecordingNotificationSink>();

        // Coarse cells so a pickup at the first rider's dropoff still
        // searches the pool's cell
        config_.defaults.cell_resolution = 6;
        make_engine();
    }

    void TearDown() override {
        tasks_->shutdown();
    }

    void make_engine() {
        engine_ = std::make_shared<PoolMatchingEngine>(config_, store_, router_, cells_,
                                                       tasks_, sink_);
    }

    void settle() {
        ASSERT_TRUE(tasks_->wait_idle(2s));
    }

    static PoolRideRequest trip(const LatLng& pickup, const LatLng& dropoff, int seats = 1) {
        PoolRideRequest request;
        request.pickup = pickup;
        request.dropoff = dropoff;
        request.passenger_count = seats;
        return request;
    }

    PoolRideResult request(const std::string& rider, const PoolRideRequest& req) {
        PoolRideResult result;
        auto status = engine_->request_pool_ride(rider, req, &result);
        EXPECT_TRUE(status.ok()) << status.message;
        return result;
    }

    /// Rider A alone, confirmed, with drv-1 assigned
    PoolRideResult confirmed_pool_with_driver() {
        auto a = request("rider-a", trip(kMidtown, kDowntown));
        EXPECT_TRUE(engine_->confirm_pool_ride("rider-a", a.pool_passenger_id, true, nullptr).ok());
        EXPECT_TRUE(engine_->assign_driver(a.pool_ride_id, "drv-1", "veh-1").ok());
        return a;
    }

    PoolServiceConfig config_;
    std::shared_ptr<InMemoryPoolStore> store_;
    std::shared_ptr<SwitchableRouter> router_;
    std::shared_ptr<GridCellIndex> cells_;
    std::shared_ptr<TaskPool> tasks_;
    std::shared_ptr<RecordingNotificationSink> sink_;
    std::shared_ptr<PoolMatchingEngine> engine_;
};

// =============================================================================
// Requesting
// =============================================================================

TEST_F(PoolMatchingEngineTest, FirstRiderOpensPool) {
    auto a = request("rider-a", trip(kMidtown, kDowntown, 2));

    EXPECT_FALSE(a.match_found);
    EXPECT_FALSE(a.match_score.has_value());
    EXPECT_EQ(a.status, PassengerStatus::kPending);
    EXPECT_EQ(a.current_passengers, 2);
    EXPECT_EQ(a.max_passengers, 4);
    EXPECT_NEAR(a.savings_percent, 25.0, 0.1);
    EXPECT_LT(a.pool_fare, a.original_fare);
    EXPECT_EQ(a.estimated_pickup_ms, a.match_deadline_ms);
    EXPECT_NE(a.message.find("looking for other riders"), std::string::npos);

    std::optional<PoolRide> pool;
    ASSERT_TRUE(store_->get_pool_ride(a.pool_ride_id, pool));
    ASSERT_TRUE(pool.has_value());
    EXPECT_EQ(pool->status, PoolStatus::kMatching);
    EXPECT_EQ(pool->current_passengers, 2);
    ASSERT_EQ(pool->optimized_route.size(), 2u);
    EXPECT_EQ(pool->optimized_route[0].type, StopType::kPickup);
    EXPECT_EQ(pool->optimized_route[1].sequence_order, 2);
    EXPECT_EQ(pool->cell_id, cells_->cell_for_point(kMidtown, 6));
    EXPECT_EQ(engine_->stats().pools_created.load(), 1u);
}

TEST_F(PoolMatchingEngineTest, NearbyRiderJoinsPool) {
    auto a = request("rider-a", trip(kMidtown, kDowntown));
    auto b = request("rider-b", trip(kDowntown, kBattery));

    EXPECT_TRUE(b.match_found);
    EXPECT_EQ(b.pool_ride_id, a.pool_ride_id);
    EXPECT_EQ(b.current_passengers, 2);
    ASSERT_TRUE(b.match_score.has_value());
    EXPECT_GE(b.match_score->score, 0.5);
    EXPECT_LE(b.match_score->score, 1.0);
    EXPECT_GT(b.savings_percent, 0.0);
    EXPECT_LE(b.savings_percent, 25.0);
    EXPECT_NE(b.message.find("found a pool match"), std::string::npos);
    EXPECT_EQ(engine_->stats().matches.load(), 1u);

    settle();
    std::optional<PoolRide> pool;
    ASSERT_TRUE(store_->get_pool_ride(a.pool_ride_id, pool));
    ASSERT_EQ(pool->optimized_route.size(), 4u);
    EXPECT_EQ(pool->optimized_route[2].pool_passenger_id, b.pool_passenger_id);
    EXPECT_EQ(pool->optimized_route[3].sequence_order, 4);
    EXPECT_LE(pool->optimized_route[0].estimated_arrival_ms,
              pool->optimized_route[3].estimated_arrival_ms);
    EXPECT_EQ(engine_->stats().reoptimizations.load(), 1u);
}

TEST_F(PoolMatchingEngineTest, FullPoolIsNotJoined) {
    config_.defaults.max_passengers_per_ride = 2;
    make_engine();

    auto a = request("rider-a", trip(kMidtown, kDowntown, 2));
    auto b = request("rider-b", trip(kDowntown, kBattery));

    EXPECT_FALSE(b.match_found);
    EXPECT_NE(b.pool_ride_id, a.pool_ride_id);
    for (const auto& pool : store_->pools()) {
        EXPECT_LE(pool.current_passengers, pool.max_passengers);
    }
}

TEST_F(PoolMatchingEngineTest, UnrelatedTripOpensSecondPool) {
    request("rider-a", trip(kMidtown, kDowntown));
    // Heads north, away from the first pool
    auto b = request("rider-b", trip(kDowntown, LatLng{40.8000, -73.9500}));
    EXPECT_FALSE(b.match_found);
    EXPECT_EQ(store_->pools().size(), 2u);
}

TEST_F(PoolMatchingEngineTest, OneActiveRidePerRider) {
    request("rider-a", trip(kMidtown, kDowntown));
    auto again = engine_->request_pool_ride("rider-a", trip(kMidtown, kDowntown), nullptr);
    EXPECT_EQ(again.code, PoolError::kFailedPrecondition);
}

TEST_F(PoolMatchingEngineTest, InvalidRequests) {
    EXPECT_EQ(engine_->request_pool_ride("rider-a", trip(LatLng{91.0, 0.0}, kDowntown), nullptr)
                  .code,
              PoolError::kInvalidArgument);
    EXPECT_EQ(engine_->request_pool_ride("rider-a", trip(kMidtown, LatLng{0.0, 181.0}), nullptr)
                  .code,
              PoolError::kInvalidArgument);
    EXPECT_EQ(engine_->request_pool_ride("rider-a", trip(kMidtown, kDowntown, 5), nullptr).code,
              PoolError::kInvalidArgument);
    EXPECT_EQ(engine_->request_pool_ride("rider-a", trip(kMidtown, kDowntown, -1), nullptr).code,
              PoolError::kInvalidArgument);
    EXPECT_EQ(engine_->request_pool_ride("", trip(kMidtown, kDowntown), nullptr).code,
              PoolError::kInvalidArgument);
    EXPECT_TRUE(store_->pools().empty());
}

TEST_F(PoolMatchingEngineTest, RoutingFailureIsUnavailable) {
    router_->set_fail(true);
    auto status = engine_->request_pool_ride("rider-a", trip(kMidtown, kDowntown), nullptr);
    EXPECT_EQ(status.code, PoolError::kUnavailable);
}

TEST_F(PoolMatchingEngineTest, FailedPassengerWriteCancelsNewPool) {
    store_->set_fail_passenger_create(true);
    auto status = engine_->request_pool_ride("rider-a", trip(kMidtown, kDowntown), nullptr);
    EXPECT_EQ(status.code, PoolError::kInternal);

    auto pools = store_->pools();
    ASSERT_EQ(pools.size(), 1u);
    EXPECT_EQ(pools[0].status, PoolStatus::kCancelled);
}

TEST_F(PoolMatchingEngineTest, CustomWaitSetsDeadline) {
    auto req = trip(kMidtown, kDowntown);
    req.max_wait_minutes = 10;
    int64_t before = ridematch::codec::now_ms();
    auto a = request("rider-a", req);
    EXPECT_GE(a.match_deadline_ms, before + 10 * 60 * 1000);
}

// =============================================================================
// Confirmation and cancellation
// =============================================================================

TEST_F(PoolMatchingEngineTest, ConfirmAccept) {
    auto a = request("rider-a", trip(kMidtown, kDowntown));
    PassengerStatus status = PassengerStatus::kPending;
    ASSERT_TRUE(engine_->confirm_pool_ride("rider-a", a.pool_passenger_id, true, &status).ok());
    EXPECT_EQ(status, PassengerStatus::kConfirmed);

    auto twice = engine_->confirm_pool_ride("rider-a", a.pool_passenger_id, true, nullptr);
    EXPECT_EQ(twice.code, PoolError::kFailedPrecondition);
}

TEST_F(PoolMatchingEngineTest, DeclineReleasesSeats) {
    auto a = request("rider-a", trip(kMidtown, kDowntown));
    auto b = request("rider-b", trip(kDowntown, kBattery, 2));
    ASSERT_TRUE(b.match_found);
    settle();

    PassengerStatus status = PassengerStatus::kPending;
    ASSERT_TRUE(engine_->confirm_pool_ride("rider-b", b.pool_passenger_id, false, &status).ok());
    EXPECT_EQ(status, PassengerStatus::kCancelled);
    settle();

    std::optional<PoolRide> pool;
    ASSERT_TRUE(store_->get_pool_ride(a.pool_ride_id, pool));
    EXPECT_EQ(pool->current_passengers, 1);
    EXPECT_EQ(pool->optimized_route.size(), 2u);
}

TEST_F(PoolMatchingEngineTest, OnlyOwnerMayConfirmOrCancel) {
    auto a = request("rider-a", trip(kMidtown, kDowntown));
    EXPECT_EQ(engine_->confirm_pool_ride("rider-x", a.pool_passenger_id, true, nullptr).code,
              PoolError::kForbidden);
    EXPECT_EQ(engine_->cancel_pool_ride("rider-x", a.pool_passenger_id).code,
              PoolError::kForbidden);
    EXPECT_EQ(engine_->confirm_pool_ride("rider-a", "pp-missing", true, nullptr).code,
              PoolError::kNotFound);
}

TEST_F(PoolMatchingEngineTest, CancelReleasesSeatsOnce) {
    auto a = request("rider-a", trip(kMidtown, kDowntown, 2));
    ASSERT_TRUE(engine_->cancel_pool_ride("rider-a", a.pool_passenger_id).ok());

    std::optional<PoolRide> pool;
    ASSERT_TRUE(store_->get_pool_ride(a.pool_ride_id, pool));
    EXPECT_EQ(pool->current_passengers, 0);

    auto again = engine_->cancel_pool_ride("rider-a", a.pool_passenger_id);
    EXPECT_EQ(again.code, PoolError::kFailedPrecondition);
    ASSERT_TRUE(store_->get_pool_ride(a.pool_ride_id, pool));
    EXPECT_EQ(pool->current_passengers, 0);

    // A cancelled rider may request again
    request("rider-a", trip(kMidtown, kDowntown));
}

TEST_F(PoolMatchingEngineTest, CannotCancelAfterPickup) {
    auto a = confirmed_pool_with_driver();
    ASSERT_TRUE(engine_->pickup_passenger("drv-1", a.pool_passenger_id).ok());

    auto status = engine_->cancel_pool_ride("rider-a", a.pool_passenger_id);
    EXPECT_EQ(status.code, PoolError::kFailedPrecondition);
    EXPECT_EQ(status.message, "cannot cancel after pickup");
}

// =============================================================================
// Views
// =============================================================================

TEST_F(PoolMatchingEngineTest, StatusShowsOtherPassengers) {
    auto a = request("rider-a", trip(kMidtown, kDowntown));
    auto b = request("rider-b", trip(kDowntown, kBattery));
    ASSERT_TRUE(b.match_found);
    settle();

    PoolStatusView view;
    ASSERT_TRUE(engine_->get_pool_status("rider-a", a.pool_ride_id, &view).ok());
    EXPECT_EQ(view.your_status, PassengerStatus::kPending);
    EXPECT_EQ(view.route.size(), 4u);
    ASSERT_EQ(view.other_passengers.size(), 1u);
    EXPECT_EQ(view.other_passengers[0].first_name_initial, "P");
    EXPECT_EQ(view.other_passengers[0].pickup_stop, 3);
    EXPECT_EQ(view.other_passengers[0].dropoff_stop, 4);
    EXPECT_EQ(view.estimated_arrival_ms, a.estimated_dropoff_ms);

    EXPECT_EQ(engine_->get_pool_status("rider-x", a.pool_ride_id, &view).code,
              PoolError::kForbidden);
    EXPECT_EQ(engine_->get_pool_status("rider-a", "pool-missing", &view).code,
              PoolError::kNotFound);
}

TEST_F(PoolMatchingEngineTest, DriverViewSumsFares) {
    auto a = confirmed_pool_with_driver();

    DriverPoolView view;
    ASSERT_TRUE(engine_->get_driver_pool_ride("drv-1", &view).ok());
    EXPECT_EQ(view.pool_ride.id, a.pool_ride_id);
    EXPECT_EQ(view.pool_ride.status, PoolStatus::kConfirmed);
    ASSERT_EQ(view.passengers.size(), 1u);
    EXPECT_DOUBLE_EQ(view.total_fare, a.pool_fare);
    EXPECT_NEAR(view.driver_earnings, a.pool_fare * 0.75, 0.006);
    ASSERT_TRUE(view.next_stop.has_value());
    EXPECT_EQ(view.next_stop->type, StopType::kPickup);

    ASSERT_TRUE(engine_->pickup_passenger("drv-1", a.pool_passenger_id).ok());
    settle();
    ASSERT_TRUE(engine_->get_driver_pool_ride("drv-1", &view).ok());
    ASSERT_TRUE(view.next_stop.has_value());
    EXPECT_EQ(view.next_stop->type, StopType::kDropoff);
    EXPECT_EQ(view.pool_ride.status, PoolStatus::kInProgress);
}

TEST_F(PoolMatchingEngineTest, DriverWithoutPool) {
    DriverPoolView view;
    EXPECT_EQ(engine_->get_driver_pool_ride("drv-9", &view).code, PoolError::kNotFound);
}

// =============================================================================
// Driver lifecycle
// =============================================================================

TEST_F(PoolMatchingEngineTest, AssignOnlyOnce) {
    auto a = confirmed_pool_with_driver();
    EXPECT_EQ(engine_->assign_driver(a.pool_ride_id, "drv-2", "veh-2").code,
              PoolError::kFailedPrecondition);
    EXPECT_EQ(engine_->assign_driver("pool-missing", "drv-2", "veh-2").code,
              PoolError::kNotFound);
    EXPECT_EQ(engine_->assign_driver(a.pool_ride_id, "", "veh-2").code,
              PoolError::kInvalidArgument);
}

TEST_F(PoolMatchingEngineTest, FullRideCompletesPool) {
    auto a = confirmed_pool_with_driver();

    EXPECT_EQ(engine_->start_pool_ride("drv-2", a.pool_ride_id).code, PoolError::kForbidden);
    ASSERT_TRUE(engine_->start_pool_ride("drv-1", a.pool_ride_id).ok());
    EXPECT_EQ(engine_->start_pool_ride("drv-1", a.pool_ride_id).code,
              PoolError::kFailedPrecondition);

    ASSERT_TRUE(engine_->pickup_passenger("drv-1", a.pool_passenger_id).ok());
    settle();

    bool completed = false;
    ASSERT_TRUE(engine_->dropoff_passenger("drv-1", a.pool_passenger_id, &completed).ok());
    EXPECT_TRUE(completed);

    std::optional<PoolRide> pool;
    ASSERT_TRUE(store_->get_pool_ride(a.pool_ride_id, pool));
    EXPECT_EQ(pool->status, PoolStatus::kCompleted);
    EXPECT_TRUE(pool->started_at_ms.has_value());
    EXPECT_TRUE(pool->completed_at_ms.has_value());

    std::optional<PoolPassenger> passenger;
    ASSERT_TRUE(store_->get_passenger(a.pool_passenger_id, passenger));
    EXPECT_EQ(passenger->status, PassengerStatus::kDroppedOff);
    EXPECT_TRUE(passenger->picked_up_at_ms.has_value());
    EXPECT_TRUE(passenger->dropped_off_at_ms.has_value());
}

TEST_F(PoolMatchingEngineTest, PickupKeepsArrivalThroughReoptimization) {
    auto a = confirmed_pool_with_driver();
    ASSERT_TRUE(engine_->pickup_passenger("drv-1", a.pool_passenger_id).ok());
    settle();

    std::optional<PoolRide> pool;
    ASSERT_TRUE(store_->get_pool_ride(a.pool_ride_id, pool));
    ASSERT_EQ(pool->optimized_route.size(), 2u);
    EXPECT_TRUE(pool->optimized_route[0].actual_arrival_ms.has_value());
    EXPECT_FALSE(pool->optimized_route[1].actual_arrival_ms.has_value());
}

TEST_F(PoolMatchingEngineTest, PickupNeedsConfirmedPassenger) {
    auto a = request("rider-a", trip(kMidtown, kDowntown));
    ASSERT_TRUE(engine_->assign_driver(a.pool_ride_id, "drv-1", "veh-1").ok());

    EXPECT_EQ(engine_->pickup_passenger("drv-1", a.pool_passenger_id).code,
              PoolError::kFailedPrecondition);
    EXPECT_EQ(engine_->pickup_passenger("drv-2", a.pool_passenger_id).code,
              PoolError::kForbidden);
}

TEST_F(PoolMatchingEngineTest, DropoffNeedsPickedUpPassenger) {
    auto a = confirmed_pool_with_driver();
    bool completed = true;
    auto status = engine_->dropoff_passenger("drv-1", a.pool_passenger_id, &completed);
    EXPECT_EQ(status.code, PoolError::kFailedPrecondition);
    EXPECT_FALSE(completed);
}

TEST_F(PoolMatchingEngineTest, PassengerOfOtherPoolIsForbidden) {
    confirmed_pool_with_driver();
    auto other = request("rider-b", trip(kDowntown, LatLng{40.8000, -73.9500}));
    EXPECT_EQ(engine_->mark_no_show("drv-1", other.pool_passenger_id).code,
              PoolError::kForbidden);
}

TEST_F(PoolMatchingEngineTest, NoShowReleasesSeats) {
    auto a = confirmed_pool_with_driver();
    ASSERT_TRUE(engine_->mark_no_show("drv-1", a.pool_passenger_id).ok());

    std::optional<PoolPassenger> passenger;
    ASSERT_TRUE(store_->get_passenger(a.pool_passenger_id, passenger));
    EXPECT_EQ(passenger->status, PassengerStatus::kNoShow);

    std::optional<PoolRide> pool;
    ASSERT_TRUE(store_->get_pool_ride(a.pool_ride_id, pool));
    EXPECT_EQ(pool->current_passengers, 0);

    EXPECT_EQ(engine_->mark_no_show("drv-1", a.pool_passenger_id).code,
              PoolError::kFailedPrecondition);
}

// =============================================================================
// Reporting and maintenance
// =============================================================================

TEST_F(PoolMatchingEngineTest, StatsCountMatchedAndCompleted) {
    auto a = confirmed_pool_with_driver();
    ASSERT_TRUE(engine_->start_pool_ride("drv-1", a.pool_ride_id).ok());
    ASSERT_TRUE(engine_->pickup_passenger("drv-1", a.pool_passenger_id).ok());
    settle();
    ASSERT_TRUE(engine_->dropoff_passenger("drv-1", a.pool_passenger_id, nullptr).ok());

    auto c = request("rider-c", trip(kDowntown, LatLng{40.8000, -73.9500}));
    ASSERT_TRUE(engine_->cancel_pool_ride("rider-c", c.pool_passenger_id).ok());

    PoolStats stats;
    ASSERT_TRUE(engine_->get_pool_stats(&stats).ok());
    EXPECT_EQ(stats.total_pools, 2);
    EXPECT_EQ(stats.active_pools, 1);
    EXPECT_DOUBLE_EQ(stats.match_success_rate, 50.0);
    EXPECT_NEAR(stats.avg_savings_percent, a.savings_percent, 1e-9);
    EXPECT_GT(stats.total_co2_saved_kg, 0.0);
}

TEST_F(PoolMatchingEngineTest, StatsStoreFailure) {
    store_->set_fail(true);
    PoolStats stats;
    EXPECT_EQ(engine_->get_pool_stats(&stats).code, PoolError::kInternal);
}

TEST_F(PoolMatchingEngineTest, ExpiredPoolsAreCancelledAndRidersNotified) {
    auto a = request("rider-a", trip(kMidtown, kDowntown));
    auto fresh = request("rider-b", trip(kDowntown, LatLng{40.8000, -73.9500}));
    store_->expire_pool(a.pool_ride_id);

    int cancelled = 0;
    ASSERT_TRUE(engine_->cleanup_expired_pools(&cancelled).ok());
    EXPECT_EQ(cancelled, 1);
    EXPECT_EQ(engine_->stats().pools_expired.load(), 1u);

    std::optional<PoolPassenger> passenger;
    ASSERT_TRUE(store_->get_passenger(a.pool_passenger_id, passenger));
    EXPECT_EQ(passenger->status, PassengerStatus::kCancelled);

    auto updates = sink_->sent_of_kind("pool_update");
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].recipient, "rider-a");
    EXPECT_FALSE(updates[0].to_ride);
    const auto& update = updates[0].notification.pool_update();
    EXPECT_EQ(update.pool_ride_id(), a.pool_ride_id);
    EXPECT_EQ(update.pool_status(), "cancelled");
    EXPECT_EQ(update.passenger_status(), "cancelled");

    std::optional<PoolRide> open;
    ASSERT_TRUE(store_->get_pool_ride(fresh.pool_ride_id, open));
    EXPECT_EQ(open->status, PoolStatus::kMatching);

    // Second sweep finds nothing
    ASSERT_TRUE(engine_->cleanup_expired_pools(&cancelled).ok());
    EXPECT_EQ(cancelled, 0);
}

TEST_F(PoolMatchingEngineTest, SweeperReportsStoreFailure) {
    auto a = request("rider-a", trip(kMidtown, kDowntown));
    store_->expire_pool(a.pool_ride_id);

    PoolExpirySweeper sweeper(engine_);
    EXPECT_EQ(sweeper.sweep_once(), 1);
    EXPECT_EQ(sweeper.stats().pools_cancelled.load(), 1u);

    store_->set_fail(true);
    EXPECT_EQ(sweeper.sweep_once(), -1);
    EXPECT_EQ(sweeper.stats().failures.load(), 1u);
    EXPECT_EQ(sweeper.stats().sweeps.load(), 2u);
}

TEST_F(PoolMatchingEngineTest, SweeperStartsAndStops) {
    PoolExpirySweeper::Config sweeper_config;
    sweeper_config.interval = 10ms;
    PoolExpirySweeper sweeper(engine_, sweeper_config);
    sweeper.start();
    std::this_thread::sleep_for(50ms);
    sweeper.stop();
    EXPECT_GE(sweeper.stats().sweeps.load(), 1u);
}

TEST_F(PoolMatchingEngineTest, ConfigResolution) {
    EXPECT_EQ(engine_->resolve_config("nyc").cell_resolution, 6);

    PoolConfig global;
    global.max_passengers_per_ride = 3;
    store_->set_config("", global);
    PoolConfig nyc;
    nyc.max_passengers_per_ride = 2;
    nyc.fare.base_fare = 99.0;
    store_->set_config("nyc", nyc);

    EXPECT_EQ(engine_->resolve_config("nyc").max_passengers_per_ride, 2);
    EXPECT_EQ(engine_->resolve_config("sf").max_passengers_per_ride, 3);
    EXPECT_EQ(engine_->resolve_config("").max_passengers_per_ride, 3);
    // Fares are not configured per city
    EXPECT_DOUBLE_EQ(engine_->resolve_config("nyc").fare.base_fare, 2.0);

    store_->set_fail(true);
    EXPECT_EQ(engine_->resolve_config("nyc").max_passengers_per_ride, 4);
}

TEST_F(PoolMatchingEngineTest, ReoptimizationFailureLeavesRoute) {
    auto a = request("rider-a", trip(kMidtown, kDowntown));
    std::optional<PoolRide> before;
    ASSERT_TRUE(store_->get_pool_ride(a.pool_ride_id, before));

    router_->set_fail(true);
    engine_->reoptimize_route(a.pool_ride_id);
    EXPECT_EQ(engine_->stats().reoptimization_failures.load(), 1u);

    std::optional<PoolRide> after;
    ASSERT_TRUE(store_->get_pool_ride(a.pool_ride_id, after));
    ASSERT_EQ(after->optimized_route.size(), before->optimized_route.size());
    EXPECT_EQ(after->optimized_route[0].id, before->optimized_route[0].id);
}

TEST_F(PoolMatchingEngineTest, ReoptimizationSkipsEmptyPool) {
    auto a = request("rider-a", trip(kMidtown, kDowntown));
    ASSERT_TRUE(engine_->cancel_pool_ride("rider-a", a.pool_passenger_id).ok());
    settle();

    std::optional<PoolRide> pool;
    ASSERT_TRUE(store_->get_pool_ride(a.pool_ride_id, pool));
    EXPECT_EQ(pool->optimized_route.size(), 2u);
    EXPECT_EQ(engine_->stats().reoptimization_failures.load(), 0u);
}

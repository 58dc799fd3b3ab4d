/**
 * @file dispatch_engine_test.cpp
 * @brief Unit tests for offer batching, withdrawal and ETA hand-off
 *
 * The engine runs against the in-memory ephemeral store, a fake candidate
 * locator and a recording notification sink. Delayed batches run on a
 * real TaskPool; tests wait for it to go idle.
 */

#include <gtest/gtest.h>
#include <glog/logging.h>

#include <chrono>
#include <memory>
#include <set>

#include "dispatch_engine.hpp"
#include "memory_ephemeral_store.hpp"
#include "test_doubles.hpp"

using namespace ridematch::dispatch;
using ridematch::geo::LatLng;
using ridematch::platform::MemoryEphemeralStore;
using ridematch::platform::TaskPool;
using ridematch::test::FakeCandidateLocator;
using ridematch::test::FakeRideStatusSource;
using ridematch::test::RecordingNotificationSink;
using namespace std::chrono_literals;

namespace notifications = ridematch::notifications;

class DispatchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        static bool glog_initialized = false;
        if (!glog_initialized) {
            google::InitGoogleLogging("dispatch_engine_test");
            FLAGS_logtostderr = true;
            glog_initialized = true;
        }

        store_ = std::make_shared<MemoryEphemeralStore>();
        sink_ = std::make_shared<RecordingNotificationSink>();
        locator_ = std::make_shared<FakeCandidateLocator>();
        status_source_ = std::make_shared<FakeRideStatusSource>();
        tasks_ = std::make_shared<TaskPool>();
        eta_tracker_ = std::make_shared<EtaTracker>(store_, sink_);

        config_.max_drivers_to_notify = 5;
        config_.first_batch_size = 2;
        config_.offer_timeout_seconds = 30;
        config_.retry_delay_seconds = 1;
    }

    void TearDown() override {
        tasks_->shutdown();
    }

    void make_engine() {
        engine_ = std::make_unique<DispatchEngine>(config_, locator_, store_, sink_, tasks_,
                                                   status_source_, eta_tracker_);
    }

    RideRequested request() const {
        RideRequested event;
        event.ride_id = "ride-1";
        event.rider_id = "rider-1";
        event.rider_name = "Alex";
        event.rider_rating = 4.8;
        event.pickup.point = pickup_;
        event.pickup.address = "Times Square";
        event.dropoff = Location{LatLng{40.6413, -73.7781}, "JFK"};
        event.ride_type_name = "Standard";
        event.estimated_fare = 52.5;
        event.currency = "USD";
        return event;
    }

    /// Driver north of the pickup by roughly km kilometres
    static Candidate driver(const std::string& id, double km) {
        Candidate candidate;
        candidate.driver_id = id;
        candidate.user_id = "user-" + id;
        candidate.location = LatLng{40.7580 + km / 111.19, -73.9855};
        return candidate;
    }

    std::vector<std::string> offer_recipients() const {
        std::vector<std::string> out;
        for (const auto& s : sink_->sent_of_kind("ride_offer")) {
            out.push_back(s.recipient);
        }
        return out;
    }

    const LatLng pickup_{40.7580, -73.9855};
    DispatchConfig config_;
    std::shared_ptr<MemoryEphemeralStore> store_;
    std::shared_ptr<RecordingNotificationSink> sink_;
    std::shared_ptr<FakeCandidateLocator> locator_;
    std::shared_ptr<FakeRideStatusSource> status_source_;
    std::shared_ptr<TaskPool> tasks_;
    std::shared_ptr<EtaTracker> eta_tracker_;
    std::unique_ptr<DispatchEngine> engine_;
};

// =============================================================================
// Offer batches
// =============================================================================

TEST_F(DispatchEngineTest, NearestDriversGetFirstBatch) {
    locator_->set_candidates({driver("d4", 4.0), driver("d1", 1.0), driver("d3", 3.0),
                              driver("d2", 2.0), driver("d5", 5.0)});
    make_engine();

    engine_->on_ride_requested(request());

    EXPECT_EQ(offer_recipients(), (std::vector<std::string>{"user-d1", "user-d2"}));
    EXPECT_EQ(locator_->last_max_count(), 5);
}

TEST_F(DispatchEngineTest, SecondBatchFollowsAfterDelay) {
    locator_->set_candidates({driver("d1", 1.0), driver("d2", 2.0), driver("d3", 3.0),
                              driver("d4", 4.0)});
    make_engine();

    engine_->on_ride_requested(request());
    EXPECT_EQ(offer_recipients().size(), 2u);

    ASSERT_TRUE(tasks_->wait_idle(5s));
    EXPECT_EQ(offer_recipients(),
              (std::vector<std::string>{"user-d1", "user-d2", "user-d3", "user-d4"}));
    EXPECT_EQ(engine_->stats().delayed_batches_sent.load(), 1u);

    auto set = OfferTracker(store_).get_offer_set("ride-1");
    ASSERT_TRUE(set.has_value());
    EXPECT_EQ(set->drivers.size(), 4u);
}

TEST_F(DispatchEngineTest, NoMoreThanMaxDriversAreOffered) {
    config_.first_batch_size = 10;
    config_.max_drivers_to_notify = 3;
    locator_->set_candidates({driver("d1", 1.0), driver("d2", 2.0), driver("d3", 3.0),
                              driver("d4", 4.0), driver("d5", 5.0)});
    make_engine();

    engine_->on_ride_requested(request());
    ASSERT_TRUE(tasks_->wait_idle(5s));

    EXPECT_EQ(offer_recipients().size(), 3u);
}

TEST_F(DispatchEngineTest, OfferCarriesRideAndTiming) {
    locator_->set_candidates({driver("d1", 2.4)});
    make_engine();

    int64_t before = ridematch::codec::now_ms();
    engine_->on_ride_requested(request());

    auto offers = sink_->sent_of_kind("ride_offer");
    ASSERT_EQ(offers.size(), 1u);
    const auto& offer = offers[0].notification.ride_offer();
    EXPECT_EQ(offer.ride_id(), "ride-1");
    EXPECT_EQ(offer.rider_name(), "Alex");
    EXPECT_EQ(offer.pickup().address(), "Times Square");
    EXPECT_EQ(offer.dropoff().address(), "JFK");
    EXPECT_EQ(offer.timeout_seconds(), 30);
    EXPECT_GE(offer.expires_at_ms(), before + 30000);
    EXPECT_NEAR(offer.distance_to_pickup_km(), 2.4, 0.05);
    EXPECT_EQ(offer.eta_to_pickup_minutes(), 5);

    auto tracked = OfferTracker(store_).get_tracked_offer("ride-1", "d1");
    ASSERT_TRUE(tracked.has_value());
    EXPECT_EQ(tracked->expires_at_ms, offer.expires_at_ms());
}

TEST_F(DispatchEngineTest, OfferGoesToDriverIdWithoutUserId) {
    Candidate candidate = driver("d1", 1.0);
    candidate.user_id.clear();
    locator_->set_candidates({candidate});
    make_engine();

    engine_->on_ride_requested(request());
    EXPECT_EQ(offer_recipients(), (std::vector<std::string>{"d1"}));
}

TEST_F(DispatchEngineTest, FailedDeliveryIsCounted) {
    locator_->set_candidates({driver("d1", 1.0)});
    sink_->set_fail(true);
    make_engine();

    engine_->on_ride_requested(request());
    EXPECT_EQ(engine_->stats().offer_send_failures.load(), 1u);
    EXPECT_EQ(engine_->stats().offers_sent.load(), 0u);
}

// =============================================================================
// No drivers / locator failure
// =============================================================================

TEST_F(DispatchEngineTest, NoCandidatesNotifiesRiderOnce) {
    make_engine();

    engine_->on_ride_requested(request());
    ASSERT_TRUE(tasks_->wait_idle(5s));

    auto sent = sink_->sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].recipient, "rider-1");
    EXPECT_TRUE(sent[0].notification.has_no_drivers_available());
    EXPECT_EQ(sent[0].notification.no_drivers_available().ride_id(), "ride-1");

    EXPECT_FALSE(OfferTracker(store_).get_offer_set("ride-1").has_value());
    EXPECT_EQ(store_->get(RideStatusResolver::hint_key("ride-1")).value_or(""),
              ride_status::kNoDrivers);
}

TEST_F(DispatchEngineTest, LocatorFailureSendsNothing) {
    locator_->set_fail(true);
    make_engine();

    engine_->on_ride_requested(request());
    EXPECT_TRUE(sink_->sent().empty());
    EXPECT_EQ(engine_->stats().locator_errors.load(), 1u);
}

// =============================================================================
// Accept / cancel
// =============================================================================

TEST_F(DispatchEngineTest, AcceptWithdrawsOtherOffers) {
    config_.first_batch_size = 3;
    locator_->set_candidates({driver("d1", 1.0), driver("d2", 2.0), driver("d3", 3.0)});
    make_engine();

    engine_->on_ride_requested(request());
    sink_->clear();

    RideAccepted accepted;
    accepted.ride_id = "ride-1";
    accepted.driver_id = "d2";
    engine_->on_ride_accepted(accepted);

    auto withdrawn = sink_->sent_of_kind("offer_cancelled");
    std::set<std::string> recipients;
    for (const auto& s : withdrawn) {
        recipients.insert(s.recipient);
        EXPECT_EQ(s.notification.offer_cancelled().reason(), notifications::RIDE_TAKEN);
    }
    EXPECT_EQ(recipients, (std::set<std::string>{"user-d1", "user-d3"}));

    OfferTracker offers(store_);
    EXPECT_FALSE(offers.get_offer_set("ride-1").has_value());
    EXPECT_FALSE(offers.get_tracked_offer("ride-1", "d1").has_value());
    EXPECT_FALSE(offers.get_tracked_offer("ride-1", "d3").has_value());
}

TEST_F(DispatchEngineTest, WithdrawalReachesTheInboxOfTheOffer) {
    config_.first_batch_size = 3;
    Candidate bare = driver("d3", 3.0);
    bare.user_id.clear();
    locator_->set_candidates({driver("d1", 1.0), driver("d2", 2.0), bare});
    make_engine();

    engine_->on_ride_requested(request());
    std::set<std::string> offered;
    for (const auto& recipient : offer_recipients()) {
        offered.insert(recipient);
    }
    sink_->clear();

    RideCancelled cancelled;
    cancelled.ride_id = "ride-1";
    cancelled.cancelled_by = "rider";
    engine_->on_ride_cancelled(cancelled);

    std::set<std::string> withdrawn;
    for (const auto& s : sink_->sent_of_kind("offer_cancelled")) {
        withdrawn.insert(s.recipient);
    }
    EXPECT_EQ(withdrawn, (std::set<std::string>{"user-d1", "user-d2", "d3"}));
    EXPECT_EQ(withdrawn, offered);
}

TEST_F(DispatchEngineTest, AcceptBeforeDelaySkipsSecondBatch) {
    locator_->set_candidates({driver("d1", 1.0), driver("d2", 2.0), driver("d3", 3.0)});
    make_engine();

    engine_->on_ride_requested(request());

    RideAccepted accepted;
    accepted.ride_id = "ride-1";
    accepted.driver_id = "d1";
    engine_->on_ride_accepted(accepted);

    ASSERT_TRUE(tasks_->wait_idle(5s));
    EXPECT_EQ(offer_recipients().size(), 2u);
    EXPECT_EQ(engine_->stats().delayed_batches_skipped.load(), 1u);
}

TEST_F(DispatchEngineTest, DelayedBatchFallsBackToDurableStatus) {
    locator_->set_candidates({driver("d1", 1.0), driver("d2", 2.0), driver("d3", 3.0)});
    make_engine();

    engine_->on_ride_requested(request());
    store_->del(RideStatusResolver::hint_key("ride-1"));
    status_source_->set_status("ride-1", ride_status::kAccepted);

    ASSERT_TRUE(tasks_->wait_idle(5s));
    EXPECT_EQ(offer_recipients().size(), 2u);
    EXPECT_EQ(engine_->stats().delayed_batches_skipped.load(), 1u);
}

TEST_F(DispatchEngineTest, LateRequestKeepsAcceptedStatus) {
    locator_->set_candidates({driver("d1", 1.0)});
    make_engine();

    store_->set_with_expiration(RideStatusResolver::hint_key("ride-1"),
                                ride_status::kAccepted, 60s);
    engine_->on_ride_requested(request());

    EXPECT_EQ(store_->get(RideStatusResolver::hint_key("ride-1")).value_or(""),
              ride_status::kAccepted);
}

TEST_F(DispatchEngineTest, RequestMarksNewRideSearching) {
    locator_->set_candidates({driver("d1", 1.0)});
    make_engine();

    engine_->on_ride_requested(request());

    EXPECT_EQ(store_->get(RideStatusResolver::hint_key("ride-1")).value_or(""),
              ride_status::kSearching);
}

TEST_F(DispatchEngineTest, CancelWithdrawsAllOffers) {
    locator_->set_candidates({driver("d1", 1.0), driver("d2", 2.0)});
    make_engine();

    engine_->on_ride_requested(request());
    sink_->clear();

    RideCancelled cancelled;
    cancelled.ride_id = "ride-1";
    cancelled.cancelled_by = "rider";
    engine_->on_ride_cancelled(cancelled);

    auto withdrawn = sink_->sent_of_kind("offer_cancelled");
    ASSERT_EQ(withdrawn.size(), 2u);
    for (const auto& s : withdrawn) {
        EXPECT_EQ(s.notification.offer_cancelled().reason(), notifications::RIDE_CANCELLED);
    }
    EXPECT_EQ(store_->get(RideStatusResolver::hint_key("ride-1")).value_or(""),
              ride_status::kCancelled);
}

TEST_F(DispatchEngineTest, AcceptWithoutOffersIsQuiet) {
    make_engine();
    RideAccepted accepted;
    accepted.ride_id = "ride-unknown";
    accepted.driver_id = "d1";
    engine_->on_ride_accepted(accepted);
    EXPECT_TRUE(sink_->sent().empty());
}

// =============================================================================
// ETA hand-off
// =============================================================================

TEST_F(DispatchEngineTest, AcceptRegistersEtaTracking) {
    locator_->set_candidates({driver("d1", 1.0)});
    make_engine();

    engine_->on_ride_requested(request());
    RideAccepted accepted;
    accepted.ride_id = "ride-1";
    accepted.driver_id = "d1";
    engine_->on_ride_accepted(accepted);

    auto active = eta_tracker_->active_ride("d1");
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->rider_id, "rider-1");
    EXPECT_EQ(active->status, ride_status::kAccepted);

    sink_->clear();
    DriverLocation location;
    location.driver_id = "d1";
    location.point = LatLng{40.7680, -73.9855};
    engine_->on_driver_location(location);
    EXPECT_FALSE(sink_->sent_of_kind("eta_update").empty());
}

TEST_F(DispatchEngineTest, StartAndCompleteMoveTracking) {
    locator_->set_candidates({driver("d1", 1.0)});
    make_engine();

    engine_->on_ride_requested(request());
    RideAccepted accepted;
    accepted.ride_id = "ride-1";
    accepted.driver_id = "d1";
    engine_->on_ride_accepted(accepted);

    RideStarted started;
    started.ride_id = "ride-1";
    started.driver_id = "d1";
    engine_->on_ride_started(started);
    auto active = eta_tracker_->active_ride("d1");
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->status, ride_status::kStarted);

    RideCompleted completed;
    completed.ride_id = "ride-1";
    completed.driver_id = "d1";
    engine_->on_ride_completed(completed);
    EXPECT_FALSE(eta_tracker_->active_ride("d1").has_value());
}

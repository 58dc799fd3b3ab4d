#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "candidate_locator.hpp"
#include "dispatch_types.hpp"
#include "ephemeral_store.hpp"
#include "eta_tracker.hpp"
#include "notification_sink.hpp"
#include "offer_tracker.hpp"
#include "ride_status.hpp"
#include "task_pool.hpp"

namespace ridematch::dispatch {

/// Statistics for monitoring
struct DispatchStats {
    std::atomic<uint64_t> rides_requested{0};
    std::atomic<uint64_t> offers_sent{0};
    std::atomic<uint64_t> offer_send_failures{0};
    std::atomic<uint64_t> delayed_batches_sent{0};
    std::atomic<uint64_t> delayed_batches_skipped{0};
    std::atomic<uint64_t> rides_without_drivers{0};
    std::atomic<uint64_t> locator_errors{0};
    std::atomic<uint64_t> offers_cancelled{0};
};

/**
 * Single-ride dispatch.
 *
 * Per ride: requested -> offering -> accepted | no_drivers | cancelled,
 * driven only by events. Offers go out in two batches: the nearest
 * first_batch_size candidates immediately, the rest after
 * retry_delay_seconds if the ride is still pending at that time.
 *
 * The engine keeps no per-ride state in memory. Handlers may run
 * concurrently on any thread; the TaskPool passed in must be shut down
 * before the engine is destroyed.
 */
class DispatchEngine {
public:
    DispatchEngine(DispatchConfig config,
                   std::shared_ptr<CandidateLocator> locator,
                   std::shared_ptr<platform::EphemeralStore> store,
                   std::shared_ptr<platform::NotificationSink> sink,
                   std::shared_ptr<platform::TaskPool> tasks,
                   std::shared_ptr<RideStatusSource> status_source,
                   std::shared_ptr<EtaTracker> eta_tracker = nullptr);

    void on_ride_requested(const RideRequested& event);
    void on_ride_accepted(const RideAccepted& event);
    void on_ride_cancelled(const RideCancelled& event);
    void on_ride_started(const RideStarted& event);
    void on_ride_completed(const RideCompleted& event);
    void on_driver_location(const DriverLocation& event);

    const DispatchStats& stats() const { return stats_; }
    const DispatchConfig& config() const { return config_; }

private:
    /// What accept/start need to know about a ride after the request event is gone
    struct RideSummary {
        std::string ride_id;
        std::string rider_id;
        geo::LatLng pickup;
        std::optional<geo::LatLng> dropoff;
        std::string driver_id;
    };

    bool send_offer(const RideRequested& event, Candidate candidate);
    void send_delayed_batch(const RideRequested& event, const std::vector<Candidate>& batch);
    void cancel_pending_offers(const std::string& ride_id,
                               const std::string& accepted_driver_id,
                               notifications::offer_cancel_reason_t reason);

    bool remember_ride(const RideSummary& summary);
    std::optional<RideSummary> recall_ride(const std::string& ride_id);
    void forget_ride(const std::string& ride_id);

    static std::string ride_request_key(const std::string& ride_id);

    DispatchConfig config_;
    std::shared_ptr<CandidateLocator> locator_;
    std::shared_ptr<platform::EphemeralStore> store_;
    std::shared_ptr<platform::NotificationSink> sink_;
    std::shared_ptr<platform::TaskPool> tasks_;
    std::shared_ptr<EtaTracker> eta_tracker_;

    OfferTracker offers_;
    RideStatusResolver status_;
    DispatchStats stats_;
};

}  // namespace ridematch::dispatch

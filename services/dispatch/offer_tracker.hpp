#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ephemeral_store.hpp"

namespace ridematch::dispatch {

/// Per (ride, driver) record of an outstanding offer
struct TrackedOffer {
    std::string driver_id;
    int64_t sent_at_ms = 0;
    int64_t expires_at_ms = 0;
};

/// Drivers currently holding an offer for one ride
struct OfferSet {
    std::string ride_id;
    std::vector<std::string> drivers;
    /// Inbox the offer went to, for drivers notified under another id
    std::map<std::string, std::string> recipients;

    const std::string& recipient_for(const std::string& driver_id) const {
        auto it = recipients.find(driver_id);
        return it == recipients.end() ? driver_id : it->second;
    }
};

/**
 * Offer bookkeeping in the ephemeral store.
 *
 * Keys:
 *   ride_offer:<ride_id>:<driver_id>  TrackedOffer, TTL = remaining offer lifetime
 *   ride_offers:<ride_id>             OfferSet, TTL refreshed on every append
 *
 * append_to_offer_set is a read-modify-write with no store-side atomicity.
 * Two concurrent appends for the same ride can lose a driver id; that
 * driver's offer then simply expires without a cancellation notice.
 */
class OfferTracker {
public:
    explicit OfferTracker(std::shared_ptr<platform::EphemeralStore> store);

    /// Write the TrackedOffer; TTL is expires_at_ms - now_ms
    bool track_offer(const std::string& ride_id, const TrackedOffer& offer, int64_t now_ms);

    /// Add driver_id to the ride's OfferSet (no duplicates) and reset its TTL.
    /// recipient_id is where withdrawals go; empty means driver_id.
    bool append_to_offer_set(const std::string& ride_id,
                             const std::string& driver_id,
                             std::chrono::milliseconds ttl,
                             const std::string& recipient_id = "");

    std::optional<TrackedOffer> get_tracked_offer(const std::string& ride_id,
                                                  const std::string& driver_id);
    std::optional<OfferSet> get_offer_set(const std::string& ride_id);

    bool clear_tracked_offer(const std::string& ride_id, const std::string& driver_id);
    bool clear_offer_set(const std::string& ride_id);

    static std::string offer_key(const std::string& ride_id, const std::string& driver_id);
    static std::string offer_set_key(const std::string& ride_id);

    static std::string to_json(const TrackedOffer& offer);
    static std::string to_json(const OfferSet& set);
    static std::optional<TrackedOffer> tracked_offer_from_json(const std::string& data);
    static std::optional<OfferSet> offer_set_from_json(const std::string& data);

private:
    std::shared_ptr<platform::EphemeralStore> store_;
};

}  // namespace ridematch::dispatch

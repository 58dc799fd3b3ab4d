#include "offer_tracker.hpp"

#include <algorithm>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ridematch::dispatch {

OfferTracker::OfferTracker(std::shared_ptr<platform::EphemeralStore> store)
    : store_(std::move(store)) {}

std::string OfferTracker::offer_key(const std::string& ride_id, const std::string& driver_id) {
    return "ride_offer:" + ride_id + ":" + driver_id;
}

std::string OfferTracker::offer_set_key(const std::string& ride_id) {
    return "ride_offers:" + ride_id;
}

bool OfferTracker::track_offer(const std::string& ride_id, const TrackedOffer& offer,
                               int64_t now_ms) {
    auto remaining = std::chrono::milliseconds(offer.expires_at_ms - now_ms);
    if (remaining.count() <= 0) {
        VLOG(1) << "Offer for ride " << ride_id << " to " << offer.driver_id
                << " already expired, not tracking";
        return false;
    }
    return store_->set_with_expiration(offer_key(ride_id, offer.driver_id),
                                       to_json(offer), remaining);
}

bool OfferTracker::append_to_offer_set(const std::string& ride_id,
                                       const std::string& driver_id,
                                       std::chrono::milliseconds ttl,
                                       const std::string& recipient_id) {
    OfferSet set;
    set.ride_id = ride_id;

    if (auto existing = store_->get(offer_set_key(ride_id))) {
        if (auto parsed = offer_set_from_json(*existing)) {
            set = std::move(*parsed);
        } else {
            LOG(WARNING) << "Replacing unreadable offer set for ride " << ride_id;
        }
    }

    if (std::find(set.drivers.begin(), set.drivers.end(), driver_id) == set.drivers.end()) {
        set.drivers.push_back(driver_id);
    }
    if (!recipient_id.empty() && recipient_id != driver_id) {
        set.recipients[driver_id] = recipient_id;
    }

    return store_->set_with_expiration(offer_set_key(ride_id), to_json(set), ttl);
}

std::optional<TrackedOffer> OfferTracker::get_tracked_offer(const std::string& ride_id,
                                                            const std::string& driver_id) {
    auto data = store_->get(offer_key(ride_id, driver_id));
    if (!data) {
        return std::nullopt;
    }
    return tracked_offer_from_json(*data);
}

std::optional<OfferSet> OfferTracker::get_offer_set(const std::string& ride_id) {
    auto data = store_->get(offer_set_key(ride_id));
    if (!data) {
        return std::nullopt;
    }
    return offer_set_from_json(*data);
}

bool OfferTracker::clear_tracked_offer(const std::string& ride_id,
                                       const std::string& driver_id) {
    return store_->del(offer_key(ride_id, driver_id));
}

bool OfferTracker::clear_offer_set(const std::string& ride_id) {
    return store_->del(offer_set_key(ride_id));
}

std::string OfferTracker::to_json(const TrackedOffer& offer) {
    json j;
    j["driver_id"] = offer.driver_id;
    j["sent_at_ms"] = offer.sent_at_ms;
    j["expires_at_ms"] = offer.expires_at_ms;
    return j.dump();
}

std::string OfferTracker::to_json(const OfferSet& set) {
    json j;
    j["ride_id"] = set.ride_id;
    j["drivers"] = set.drivers;
    if (!set.recipients.empty()) {
        j["recipients"] = set.recipients;
    }
    return j.dump();
}

std::optional<TrackedOffer> OfferTracker::tracked_offer_from_json(const std::string& data) {
    try {
        json j = json::parse(data);
        TrackedOffer offer;
        offer.driver_id = j.at("driver_id").get<std::string>();
        offer.sent_at_ms = j.value("sent_at_ms", int64_t{0});
        offer.expires_at_ms = j.value("expires_at_ms", int64_t{0});
        return offer;
    } catch (const json::exception& e) {
        LOG(WARNING) << "Invalid tracked offer record: " << e.what();
        return std::nullopt;
    }
}

std::optional<OfferSet> OfferTracker::offer_set_from_json(const std::string& data) {
    try {
        json j = json::parse(data);
        OfferSet set;
        set.ride_id = j.value("ride_id", std::string());
        set.drivers = j.at("drivers").get<std::vector<std::string>>();
        if (j.contains("recipients")) {
            set.recipients = j["recipients"].get<std::map<std::string, std::string>>();
        }
        return set;
    } catch (const json::exception& e) {
        LOG(WARNING) << "Invalid offer set record: " << e.what();
        return std::nullopt;
    }
}

}  // namespace ridematch::dispatch

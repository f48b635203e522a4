// =============================================================================
// oracle.cpp - Price Feeds and USD Normalization
// =============================================================================

#include "dsc/oracle.hpp"
#include "dsc/registry.hpp"

namespace dsc {

// =============================================================================
// PriceFeed
// =============================================================================

PriceFeed::PriceFeed(const Address& addr, uint8_t decimals, I128 initial_answer, Clock clock)
    : address_(addr), decimals_(decimals), clock_(std::move(clock)) {
    update_answer(initial_answer);
}

void PriceFeed::update_answer(I128 answer) {
    uint64_t now = clock_();
    latest_.round_id += 1;
    latest_.answer = answer;
    latest_.started_at = now;
    latest_.updated_at = now;
    latest_.answered_in_round = latest_.round_id;
}

void PriceFeed::update_round_data(uint64_t round_id, I128 answer,
                                  uint64_t timestamp, uint64_t started_at) {
    latest_.round_id = round_id;
    latest_.answer = answer;
    latest_.started_at = started_at;
    latest_.updated_at = timestamp;
    latest_.answered_in_round = round_id;
}

// =============================================================================
// OracleAdapter
// =============================================================================

OracleAdapter::OracleAdapter(const AssetRegistry& registry, Clock clock, uint64_t timeout)
    : registry_(registry), clock_(std::move(clock)), timeout_(timeout) {}

std::optional<I128> OracleAdapter::normalize(const RoundData& round, uint8_t decimals) const {
    if (round.answer <= 0) {
        return std::nullopt;
    }

    // Incomplete or carried-over round
    if (round.updated_at == 0 || round.answered_in_round < round.round_id) {
        return std::nullopt;
    }

    uint64_t now = clock_();
    if (now > round.updated_at && now - round.updated_at > timeout_) {
        return std::nullopt;
    }

    if (decimals <= 18) {
        return x18::mul_div(round.answer, x18::pow10(18 - decimals), 1);
    }
    return round.answer / x18::pow10(decimals - 18);
}

I128 OracleAdapter::price_of(const Address& asset) const {
    const CollateralAsset* entry = registry_.find(asset);
    if (!entry || !entry->price_feed) {
        throw DSCError(errors::ORACLE_ERROR, "no price feed for " + address::to_hex(asset));
    }

    const IPriceFeed& feed = *entry->price_feed;
    RoundData round = feed.latest_round_data();

    auto price = normalize(round, feed.decimals());
    if (!price || *price <= 0) {
        throw DSCError(errors::ORACLE_ERROR,
                       "invalid or stale reading from " + address::to_hex(feed.address()) +
                       " (answer " + x18::to_string(round.answer) +
                       ", updated_at " + std::to_string(round.updated_at) + ")");
    }
    return *price;
}

I128 OracleAdapter::usd_value(const Address& asset, I128 amount) const {
    if (amount == 0) return 0;
    return x18::mul_div(price_of(asset), amount, X18_ONE);
}

I128 OracleAdapter::token_amount_from_usd(const Address& asset, I128 usd_x18) const {
    return x18::mul_div(usd_x18, X18_ONE, price_of(asset));
}

} // namespace dsc

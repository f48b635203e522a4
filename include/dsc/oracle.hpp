#ifndef DSC_ORACLE_HPP
#define DSC_ORACLE_HPP

#include <optional>

#include "types.hpp"

namespace dsc {

class AssetRegistry;

// =============================================================================
// Oracle Reading
// =============================================================================

struct RoundData {
    uint64_t round_id;
    I128 answer;               // price in the feed's native decimals
    uint64_t started_at;
    uint64_t updated_at;
    uint64_t answered_in_round;
};

// =============================================================================
// Price Feed Interface
// =============================================================================

class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    virtual Address address() const = 0;
    virtual uint8_t decimals() const = 0;
    virtual RoundData latest_round_data() const = 0;
};

// =============================================================================
// PriceFeed - In-Memory Aggregator
// =============================================================================

class PriceFeed : public IPriceFeed {
public:
    PriceFeed(const Address& addr, uint8_t decimals, I128 initial_answer,
              Clock clock = system_clock_seconds);

    PriceFeed(const PriceFeed&) = delete;
    PriceFeed& operator=(const PriceFeed&) = delete;

    Address address() const override { return address_; }
    uint8_t decimals() const override { return decimals_; }
    RoundData latest_round_data() const override { return latest_; }

    // Publish a new answer as a fresh round stamped with the current time
    void update_answer(I128 answer);

    // Overwrite the latest round wholesale
    void update_round_data(uint64_t round_id, I128 answer,
                           uint64_t timestamp, uint64_t started_at);

private:
    Address address_;
    uint8_t decimals_;
    Clock clock_;
    RoundData latest_{};
};

// =============================================================================
// OracleAdapter - Normalized USD Prices
// =============================================================================

// Every valuation re-reads the feed. Prices are returned as USD per whole
// unit of the asset, in X18.
class OracleAdapter {
public:
    static constexpr uint64_t DEFAULT_TIMEOUT = 3 * 60 * 60;  // 3 hours

    OracleAdapter(const AssetRegistry& registry, Clock clock = system_clock_seconds,
                  uint64_t timeout = DEFAULT_TIMEOUT);

    // Throws DSCError(ORACLE_ERROR) when the asset has no feed or the reading is invalid
    I128 price_of(const Address& asset) const;

    // price_of(asset) * amount / 1e18
    I128 usd_value(const Address& asset, I128 amount) const;

    // usd * 1e18 / price_of(asset)
    I128 token_amount_from_usd(const Address& asset, I128 usd_x18) const;

    // Validate a reading and scale it to X18
    std::optional<I128> normalize(const RoundData& round, uint8_t decimals) const;

    uint64_t timeout() const { return timeout_; }
    uint64_t now() const { return clock_(); }

private:
    const AssetRegistry& registry_;
    Clock clock_;
    uint64_t timeout_;
};

} // namespace dsc

#endif // DSC_ORACLE_HPP

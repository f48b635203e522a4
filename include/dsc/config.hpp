#ifndef DSC_CONFIG_HPP
#define DSC_CONFIG_HPP

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "token.hpp"
#include "oracle.hpp"
#include "engine.hpp"

namespace dsc {

// =============================================================================
// Deployment Configuration (JSON)
// =============================================================================

struct TokenSpec {
    std::string symbol;
    Address address{};
    uint8_t decimals = 18;
};

struct FeedSpec {
    Address address{};
    uint8_t decimals = 8;
    I128 initial_price_x18 = 0;    // USD per whole unit
};

// {
//   "engine_address": "0x...",
//   "stablecoin": { "symbol": "DSC", "address": "0x..." },
//   "price_timeout_seconds": 10800,
//   "log_level": "info",
//   "collateral_tokens": [ { "symbol": "WETH", "address": "0x...", "decimals": 18 } ],
//   "price_feeds": [ { "address": "0x...", "decimals": 8, "initial_price": "2000" } ]
// }
//
// collateral_tokens[i] is priced by price_feeds[i].
struct DeploymentConfig {
    Address engine_address{};
    std::string stablecoin_symbol = "DSC";
    Address stablecoin_address{};
    uint64_t price_timeout_seconds = OracleAdapter::DEFAULT_TIMEOUT;
    std::string log_level = "warn";
    std::vector<TokenSpec> collateral_tokens;
    std::vector<FeedSpec> price_feeds;

    // Throws DSCError(CONFIG_INVALID) on unreadable files, malformed JSON,
    // missing fields or bad values. Length mismatches are left to deploy().
    static DeploymentConfig from_file(const std::string& path);
    static DeploymentConfig from_string(const std::string& content);
    static DeploymentConfig from_json(const nlohmann::json& root);
};

// Decimal amount from a JSON string ("2000.5") or number. Throws CONFIG_INVALID.
I128 decimal_from_json(const nlohmann::json& value, const std::string& field);

// Address from a JSON hex string. Throws CONFIG_INVALID.
Address address_from_json(const nlohmann::json& value, const std::string& field);

// =============================================================================
// In-Memory Deployment
// =============================================================================

struct Deployment {
    std::vector<std::shared_ptr<Erc20>> tokens;
    std::vector<std::shared_ptr<PriceFeed>> feeds;
    std::shared_ptr<StableCoin> stablecoin;
    std::unique_ptr<DSCEngine> engine;

    // nullptr when no token has this symbol
    std::shared_ptr<Erc20> token(const std::string& symbol) const;
    std::shared_ptr<PriceFeed> feed_for(const std::string& symbol) const;
};

// Builds collaborators and the engine. Throws DSCError(CONFIG_MISMATCH) when
// the token and feed lists differ in length.
Deployment deploy(const DeploymentConfig& config, Clock clock = system_clock_seconds);

} // namespace dsc

#endif // DSC_CONFIG_HPP

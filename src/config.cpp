// =============================================================================
// config.cpp - Deployment Configuration and In-Memory Deployment
// =============================================================================

#include "dsc/config.hpp"
#include "dsc/log.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace dsc {

using json = nlohmann::json;

namespace {

uint8_t decimals_from_json(const json& value, const std::string& field, int max) {
    if (!value.is_number_integer()) {
        throw DSCError(errors::CONFIG_INVALID, field + " must be an integer");
    }
    int d = value.get<int>();
    if (d < 0 || d > max) {
        throw DSCError(errors::CONFIG_INVALID,
                       field + " out of range [0, " + std::to_string(max) + "]");
    }
    return static_cast<uint8_t>(d);
}

const json& required(const json& object, const char* key, const std::string& context) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw DSCError(errors::CONFIG_INVALID, context + " missing \"" + key + "\"");
    }
    return *it;
}

} // namespace

// =============================================================================
// Field Helpers
// =============================================================================

I128 decimal_from_json(const json& value, const std::string& field) {
    if (value.is_number_integer()) {
        return x18::from_int(value.get<int64_t>());
    }
    if (value.is_number_float()) {
        return x18::from_double(value.get<double>());
    }
    if (value.is_string()) {
        I128 out = 0;
        if (x18::parse(value.get<std::string>(), out)) {
            return out;
        }
    }
    throw DSCError(errors::CONFIG_INVALID, field + " is not a decimal amount");
}

Address address_from_json(const json& value, const std::string& field) {
    Address addr{};
    if (!value.is_string() || !address::from_hex(value.get<std::string>(), addr)) {
        throw DSCError(errors::CONFIG_INVALID, field + " is not a 20-byte hex address");
    }
    return addr;
}

// =============================================================================
// DeploymentConfig
// =============================================================================

DeploymentConfig DeploymentConfig::from_file(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw DSCError(errors::CONFIG_INVALID, "cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

DeploymentConfig DeploymentConfig::from_string(const std::string& content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        throw DSCError(errors::CONFIG_INVALID, std::string("malformed JSON: ") + e.what());
    }
    return from_json(root);
}

DeploymentConfig DeploymentConfig::from_json(const json& root) {
    if (!root.is_object()) {
        throw DSCError(errors::CONFIG_INVALID, "deployment config must be a JSON object");
    }

    DeploymentConfig config;

    try {
        config.engine_address = address_from_json(required(root, "engine_address", "config"),
                                                  "engine_address");

        const json& coin = required(root, "stablecoin", "config");
        config.stablecoin_address = address_from_json(required(coin, "address", "stablecoin"),
                                                      "stablecoin.address");
        config.stablecoin_symbol = coin.value("symbol", config.stablecoin_symbol);

        config.price_timeout_seconds = root.value("price_timeout_seconds", config.price_timeout_seconds);
        config.log_level = root.value("log_level", config.log_level);

        const json& tokens = required(root, "collateral_tokens", "config");
        if (!tokens.is_array()) {
            throw DSCError(errors::CONFIG_INVALID, "collateral_tokens must be an array");
        }
        for (size_t i = 0; i < tokens.size(); ++i) {
            std::string ctx = "collateral_tokens[" + std::to_string(i) + "]";
            const json& entry = tokens[i];

            TokenSpec spec;
            spec.symbol = required(entry, "symbol", ctx).get<std::string>();
            spec.address = address_from_json(required(entry, "address", ctx), ctx + ".address");
            if (entry.contains("decimals")) {
                spec.decimals = decimals_from_json(entry["decimals"], ctx + ".decimals", 18);
            }
            if (spec.decimals != 18) {
                throw DSCError(errors::CONFIG_INVALID, ctx + " must use 18 decimals");
            }
            config.collateral_tokens.push_back(spec);
        }

        const json& feeds = required(root, "price_feeds", "config");
        if (!feeds.is_array()) {
            throw DSCError(errors::CONFIG_INVALID, "price_feeds must be an array");
        }
        for (size_t i = 0; i < feeds.size(); ++i) {
            std::string ctx = "price_feeds[" + std::to_string(i) + "]";
            const json& entry = feeds[i];

            FeedSpec spec;
            spec.address = address_from_json(required(entry, "address", ctx), ctx + ".address");
            if (entry.contains("decimals")) {
                spec.decimals = decimals_from_json(entry["decimals"], ctx + ".decimals", 36);
            }
            spec.initial_price_x18 = decimal_from_json(required(entry, "initial_price", ctx),
                                                       ctx + ".initial_price");
            config.price_feeds.push_back(spec);
        }
    } catch (const json::exception& e) {
        throw DSCError(errors::CONFIG_INVALID, e.what());
    }

    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        throw DSCError(errors::CONFIG_INVALID, "unknown log_level \"" + config.log_level + "\"");
    }

    return config;
}

// =============================================================================
// Deployment
// =============================================================================

std::shared_ptr<Erc20> Deployment::token(const std::string& symbol) const {
    for (const auto& t : tokens) {
        if (t->symbol() == symbol) return t;
    }
    return nullptr;
}

std::shared_ptr<PriceFeed> Deployment::feed_for(const std::string& symbol) const {
    for (size_t i = 0; i < tokens.size() && i < feeds.size(); ++i) {
        if (tokens[i]->symbol() == symbol) return feeds[i];
    }
    return nullptr;
}

Deployment deploy(const DeploymentConfig& config, Clock clock) {
    log::set_level(config.log_level);

    Deployment d;
    d.stablecoin = std::make_shared<StableCoin>(config.stablecoin_address, config.engine_address,
                                                config.stablecoin_symbol);

    std::vector<std::shared_ptr<ICollateralToken>> tokens;
    for (const auto& spec : config.collateral_tokens) {
        auto token = std::make_shared<Erc20>(spec.address, spec.symbol, spec.decimals);
        d.tokens.push_back(token);
        tokens.push_back(token);
    }

    std::vector<std::shared_ptr<IPriceFeed>> feeds;
    for (const auto& spec : config.price_feeds) {
        // USD X18 -> feed native decimals
        I128 answer = spec.decimals <= 18
            ? spec.initial_price_x18 / x18::pow10(18 - spec.decimals)
            : x18::mul_div(spec.initial_price_x18, x18::pow10(spec.decimals - 18), 1);
        auto feed = std::make_shared<PriceFeed>(spec.address, spec.decimals, answer, clock);
        d.feeds.push_back(feed);
        feeds.push_back(feed);
    }

    EngineConfig engine_config;
    engine_config.self = config.engine_address;
    engine_config.price_timeout = config.price_timeout_seconds;
    engine_config.clock = std::move(clock);

    d.engine = std::make_unique<DSCEngine>(tokens, feeds, d.stablecoin, std::move(engine_config));
    return d;
}

} // namespace dsc

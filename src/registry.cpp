// =============================================================================
// registry.cpp - Supported Collateral Registry
// =============================================================================

#include "dsc/registry.hpp"

namespace dsc {

AssetRegistry::AssetRegistry(const std::vector<std::shared_ptr<ICollateralToken>>& tokens,
                             const std::vector<std::shared_ptr<IPriceFeed>>& price_feeds) {
    if (tokens.size() != price_feeds.size()) {
        throw DSCError(errors::CONFIG_MISMATCH,
                       std::to_string(tokens.size()) + " collateral tokens but " +
                       std::to_string(price_feeds.size()) + " price feeds");
    }

    std::unordered_map<Address, CollateralAsset, AddressHash> assets;
    std::vector<Address> order;

    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!tokens[i] || !price_feeds[i]) {
            throw DSCError(errors::CONFIG_MISMATCH,
                           "missing token or price feed at index " + std::to_string(i));
        }

        Address id = tokens[i]->address();
        if (address::is_zero(id)) {
            throw DSCError(errors::CONFIG_MISMATCH, "zero token address at index " + std::to_string(i));
        }
        if (assets.find(id) != assets.end()) {
            throw DSCError(errors::CONFIG_MISMATCH, "duplicate token " + address::to_hex(id));
        }

        assets[id] = CollateralAsset{id, tokens[i], price_feeds[i]};
        order.push_back(id);
    }

    assets_ = std::move(assets);
    order_ = std::move(order);
}

bool AssetRegistry::is_supported(const Address& asset) const {
    return assets_.find(asset) != assets_.end();
}

const CollateralAsset& AssetRegistry::get(const Address& asset) const {
    auto it = assets_.find(asset);
    if (it == assets_.end()) {
        throw DSCError(errors::UNSUPPORTED_ASSET, address::to_hex(asset));
    }
    return it->second;
}

const CollateralAsset* AssetRegistry::find(const Address& asset) const {
    auto it = assets_.find(asset);
    return (it != assets_.end()) ? &it->second : nullptr;
}

} // namespace dsc

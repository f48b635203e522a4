#ifndef DSC_REGISTRY_HPP
#define DSC_REGISTRY_HPP

#include <memory>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "token.hpp"
#include "oracle.hpp"

namespace dsc {

// =============================================================================
// Collateral Asset Capabilities
// =============================================================================

struct CollateralAsset {
    Address id;                                   // token address
    std::shared_ptr<ICollateralToken> token;      // value transfer
    std::shared_ptr<IPriceFeed> price_feed;       // USD price
};

// =============================================================================
// AssetRegistry - Immutable Asset -> Oracle Map
// =============================================================================

class AssetRegistry {
public:
    // Throws DSCError(CONFIG_MISMATCH) when the lists differ in length,
    // contain null entries or repeat a token address.
    AssetRegistry(const std::vector<std::shared_ptr<ICollateralToken>>& tokens,
                  const std::vector<std::shared_ptr<IPriceFeed>>& price_feeds);

    AssetRegistry(const AssetRegistry&) = delete;
    AssetRegistry& operator=(const AssetRegistry&) = delete;

    bool is_supported(const Address& asset) const;

    // Throws DSCError(UNSUPPORTED_ASSET)
    const CollateralAsset& get(const Address& asset) const;

    // nullptr when unknown
    const CollateralAsset* find(const Address& asset) const;

    // Registration order
    const std::vector<Address>& assets() const { return order_; }
    size_t size() const { return order_.size(); }

private:
    std::unordered_map<Address, CollateralAsset, AddressHash> assets_;
    std::vector<Address> order_;
};

} // namespace dsc

#endif // DSC_REGISTRY_HPP

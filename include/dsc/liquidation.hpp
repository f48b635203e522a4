#ifndef DSC_LIQUIDATION_HPP
#define DSC_LIQUIDATION_HPP

#include "types.hpp"
#include "ledger.hpp"
#include "risk.hpp"

namespace dsc {

// =============================================================================
// Liquidation Quote (read-only preview)
// =============================================================================

struct LiquidationQuote {
    I128 debt_to_cover_x18;
    I128 collateral_x18;         // debt_to_cover converted at the oracle price
    I128 bonus_x18;              // LIQUIDATION_BONUS share
    I128 total_seized_x18;       // collateral + bonus
    I128 available_x18;          // target's balance of the asset
    I128 health_factor_x18;      // target's current health factor
    bool liquidatable;
};

// =============================================================================
// Liquidation Result
// =============================================================================

struct LiquidationResult {
    Address liquidator;
    Address target;
    Address asset;
    I128 debt_covered_x18;
    I128 collateral_seized_x18;  // includes bonus
    I128 bonus_x18;
    I128 starting_health_factor_x18;
    I128 ending_health_factor_x18;
};

// =============================================================================
// LiquidationEngine
// =============================================================================

// Ledger side of a liquidation. Moving the liability and the seized
// collateral is left to the custody layer.
class LiquidationEngine {
public:
    LiquidationEngine(const AssetRegistry& registry, CollateralLedger& collateral,
                      DebtLedger& debt, const RiskEngine& risk, const OracleAdapter& oracle);

    LiquidationQuote quote(const Address& target, const Address& asset, I128 debt_to_cover_x18) const;

    // Validates and applies the ledger effects, recording them in `journal`.
    // Throws ZERO_AMOUNT, UNSUPPORTED_ASSET, HEALTH_FACTOR_OK, INSUFFICIENT_DEBT,
    // INSUFFICIENT_COLLATERAL, HEALTH_FACTOR_NOT_IMPROVED, HEALTH_FACTOR_BROKEN.
    LiquidationResult execute(const Address& liquidator, const Address& target,
                              const Address& asset, I128 debt_to_cover_x18, Journal& journal);

private:
    const AssetRegistry& registry_;
    CollateralLedger& collateral_;
    DebtLedger& debt_;
    const RiskEngine& risk_;
    const OracleAdapter& oracle_;
};

} // namespace dsc

#endif // DSC_LIQUIDATION_HPP

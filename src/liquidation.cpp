// =============================================================================
// liquidation.cpp - LiquidationEngine Implementation
// =============================================================================

#include "dsc/liquidation.hpp"
#include "dsc/registry.hpp"

namespace dsc {

LiquidationEngine::LiquidationEngine(const AssetRegistry& registry, CollateralLedger& collateral,
                                     DebtLedger& debt, const RiskEngine& risk,
                                     const OracleAdapter& oracle)
    : registry_(registry), collateral_(collateral), debt_(debt), risk_(risk), oracle_(oracle) {}

LiquidationQuote LiquidationEngine::quote(const Address& target, const Address& asset,
                                          I128 debt_to_cover_x18) const {
    if (debt_to_cover_x18 <= 0) {
        throw DSCError(errors::ZERO_AMOUNT, "debt to cover");
    }
    if (!registry_.is_supported(asset)) {
        throw DSCError(errors::UNSUPPORTED_ASSET, address::to_hex(asset));
    }

    LiquidationQuote q{};
    q.debt_to_cover_x18 = debt_to_cover_x18;
    q.collateral_x18 = oracle_.token_amount_from_usd(asset, debt_to_cover_x18);
    q.total_seized_x18 = x18::mul_div(q.collateral_x18,
                                      params::LIQUIDATION_PRECISION + params::LIQUIDATION_BONUS,
                                      params::LIQUIDATION_PRECISION);
    q.bonus_x18 = q.total_seized_x18 - q.collateral_x18;
    q.available_x18 = collateral_.balance_of(target, asset);
    q.health_factor_x18 = risk_.health_factor(target);
    q.liquidatable = q.health_factor_x18 < params::MIN_HEALTH_FACTOR;
    return q;
}

LiquidationResult LiquidationEngine::execute(const Address& liquidator, const Address& target,
                                             const Address& asset, I128 debt_to_cover_x18,
                                             Journal& journal) {
    LiquidationQuote q = quote(target, asset, debt_to_cover_x18);

    if (!q.liquidatable) {
        throw DSCError(errors::HEALTH_FACTOR_OK,
                       address::to_hex(target) + " health factor " + x18::format(q.health_factor_x18));
    }

    I128 owed = debt_.debt_of(target);
    if (debt_to_cover_x18 > owed) {
        throw DSCError(errors::INSUFFICIENT_DEBT,
                       "covering " + x18::format(debt_to_cover_x18) + " of " + x18::format(owed));
    }

    // No capping: seizing more than the target holds fails the whole liquidation
    if (q.total_seized_x18 > q.available_x18) {
        throw DSCError(errors::INSUFFICIENT_COLLATERAL,
                       "seize " + x18::format(q.total_seized_x18) + " of " +
                       x18::format(q.available_x18) + " available");
    }

    collateral_.withdraw(target, asset, q.total_seized_x18, journal);
    debt_.burn(target, debt_to_cover_x18, journal);

    I128 ending = risk_.health_factor(target);
    if (ending < q.health_factor_x18) {
        throw DSCError(errors::HEALTH_FACTOR_NOT_IMPROVED,
                       address::to_hex(target) + " " + x18::format(q.health_factor_x18) +
                       " -> " + x18::format(ending));
    }

    risk_.assert_healthy(liquidator);

    LiquidationResult result{};
    result.liquidator = liquidator;
    result.target = target;
    result.asset = asset;
    result.debt_covered_x18 = debt_to_cover_x18;
    result.collateral_seized_x18 = q.total_seized_x18;
    result.bonus_x18 = q.bonus_x18;
    result.starting_health_factor_x18 = q.health_factor_x18;
    result.ending_health_factor_x18 = ending;
    return result;
}

} // namespace dsc

// =============================================================================
// risk.cpp - RiskEngine Implementation
// =============================================================================

#include "dsc/risk.hpp"

namespace dsc {

RiskEngine::RiskEngine(const CollateralLedger& collateral, const DebtLedger& debt,
                       const OracleAdapter& oracle)
    : collateral_(collateral), debt_(debt), oracle_(oracle) {}

I128 RiskEngine::calculate_health_factor(I128 debt_minted_x18, I128 collateral_value_usd_x18) {
    if (debt_minted_x18 == 0) {
        return params::MAX_HEALTH_FACTOR;
    }

    I128 adjusted = x18::mul_div(collateral_value_usd_x18, params::LIQUIDATION_THRESHOLD,
                                 params::LIQUIDATION_PRECISION);
    return x18::mul_div(adjusted, params::PRECISION, debt_minted_x18);
}

I128 RiskEngine::health_factor(const Address& account) const {
    I128 debt = debt_.debt_of(account);
    if (debt == 0) {
        return params::MAX_HEALTH_FACTOR;
    }
    return calculate_health_factor(debt, collateral_.value_usd(account, oracle_));
}

AccountInfo RiskEngine::account_information(const Address& account) const {
    AccountInfo info{};
    info.debt_minted_x18 = debt_.debt_of(account);
    info.collateral_value_usd_x18 = collateral_.value_usd(account, oracle_);
    info.health_factor_x18 = calculate_health_factor(info.debt_minted_x18,
                                                     info.collateral_value_usd_x18);
    return info;
}

bool RiskEngine::is_healthy(const Address& account) const {
    return health_factor(account) >= params::MIN_HEALTH_FACTOR;
}

void RiskEngine::assert_healthy(const Address& account) const {
    I128 hf = health_factor(account);
    if (hf < params::MIN_HEALTH_FACTOR) {
        throw DSCError(errors::HEALTH_FACTOR_BROKEN,
                       address::to_hex(account) + " health factor " + x18::format(hf));
    }
}

} // namespace dsc

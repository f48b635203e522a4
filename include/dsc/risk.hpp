#ifndef DSC_RISK_HPP
#define DSC_RISK_HPP

#include "types.hpp"
#include "ledger.hpp"
#include "oracle.hpp"

namespace dsc {

// =============================================================================
// Protocol Parameters
// =============================================================================

namespace params {
constexpr I128 PRECISION = X18_ONE;
constexpr I128 LIQUIDATION_THRESHOLD = 50;   // 50% -> 200% overcollateralized
constexpr I128 LIQUIDATION_BONUS = 10;       // 10% of seized collateral
constexpr I128 LIQUIDATION_PRECISION = 100;
constexpr I128 MIN_HEALTH_FACTOR = X18_ONE;  // 1.0
constexpr I128 MAX_HEALTH_FACTOR = I128_MAX; // no debt
}

// =============================================================================
// Account Snapshot
// =============================================================================

struct AccountInfo {
    I128 debt_minted_x18;
    I128 collateral_value_usd_x18;
    I128 health_factor_x18;
};

// =============================================================================
// RiskEngine - Health Factor and Solvency Invariant
// =============================================================================

class RiskEngine {
public:
    RiskEngine(const CollateralLedger& collateral, const DebtLedger& debt,
               const OracleAdapter& oracle);

    // (collateral_usd * THRESHOLD / 100) * 1e18 / debt, MAX_HEALTH_FACTOR when debt == 0
    static I128 calculate_health_factor(I128 debt_minted_x18, I128 collateral_value_usd_x18);

    I128 health_factor(const Address& account) const;
    AccountInfo account_information(const Address& account) const;

    bool is_healthy(const Address& account) const;
    bool is_liquidatable(const Address& account) const { return !is_healthy(account); }

    // Throws DSCError(HEALTH_FACTOR_BROKEN)
    void assert_healthy(const Address& account) const;

private:
    const CollateralLedger& collateral_;
    const DebtLedger& debt_;
    const OracleAdapter& oracle_;
};

} // namespace dsc

#endif // DSC_RISK_HPP

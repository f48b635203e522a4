#ifndef DSC_LEDGER_HPP
#define DSC_LEDGER_HPP

#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "journal.hpp"

namespace dsc {

class AssetRegistry;
class OracleAdapter;

// =============================================================================
// CollateralLedger - Per-Account, Per-Asset Deposits
// =============================================================================

// Zero balances are erased; absence means zero.
class CollateralLedger {
public:
    explicit CollateralLedger(const AssetRegistry& registry);

    CollateralLedger(const CollateralLedger&) = delete;
    CollateralLedger& operator=(const CollateralLedger&) = delete;

    // Throws ZERO_AMOUNT / UNSUPPORTED_ASSET / MATH_OVERFLOW
    void deposit(const Address& account, const Address& asset, I128 amount, Journal& journal);

    // Throws ZERO_AMOUNT / UNSUPPORTED_ASSET / INSUFFICIENT_COLLATERAL
    void withdraw(const Address& account, const Address& asset, I128 amount, Journal& journal);

    I128 balance_of(const Address& account, const Address& asset) const;

    // Sum of all accounts' deposits of `asset`
    I128 total_of(const Address& asset) const;

    // Sum over registered assets of usd_value(asset, balance), X18
    I128 value_usd(const Address& account, const OracleAdapter& oracle) const;

    size_t account_count() const { return balances_.size(); }

private:
    using AssetBalances = std::unordered_map<Address, I128, AddressHash>;

    void set(const Address& account, const Address& asset, I128 value);

    const AssetRegistry& registry_;
    std::unordered_map<Address, AssetBalances, AddressHash> balances_;
    AssetBalances totals_;
};

// =============================================================================
// DebtLedger - Per-Account Minted Liability
// =============================================================================

class DebtLedger {
public:
    DebtLedger() = default;

    DebtLedger(const DebtLedger&) = delete;
    DebtLedger& operator=(const DebtLedger&) = delete;

    // Throws ZERO_AMOUNT / MATH_OVERFLOW
    void mint(const Address& account, I128 amount, Journal& journal);

    // Throws ZERO_AMOUNT / INSUFFICIENT_DEBT
    void burn(const Address& account, I128 amount, Journal& journal);

    I128 debt_of(const Address& account) const;
    I128 total() const { return total_; }

    std::vector<Address> debtors() const;

private:
    void set(const Address& account, I128 value);

    std::unordered_map<Address, I128, AddressHash> minted_;
    I128 total_{0};
};

} // namespace dsc

#endif // DSC_LEDGER_HPP

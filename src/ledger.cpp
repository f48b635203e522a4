// =============================================================================
// ledger.cpp - Collateral and Debt Ledgers
// =============================================================================

#include "dsc/ledger.hpp"
#include "dsc/registry.hpp"
#include "dsc/oracle.hpp"

namespace dsc {

// =============================================================================
// CollateralLedger
// =============================================================================

CollateralLedger::CollateralLedger(const AssetRegistry& registry) : registry_(registry) {}

void CollateralLedger::deposit(const Address& account, const Address& asset,
                               I128 amount, Journal& journal) {
    if (amount <= 0) {
        throw DSCError(errors::ZERO_AMOUNT, "collateral deposit");
    }
    if (!registry_.is_supported(asset)) {
        throw DSCError(errors::UNSUPPORTED_ASSET, address::to_hex(asset));
    }

    I128 before = balance_of(account, asset);
    I128 after = x18::add(before, amount);
    x18::add(total_of(asset), amount);

    journal.record([this, account, asset, before] { set(account, asset, before); });
    set(account, asset, after);
}

void CollateralLedger::withdraw(const Address& account, const Address& asset,
                                I128 amount, Journal& journal) {
    if (amount <= 0) {
        throw DSCError(errors::ZERO_AMOUNT, "collateral withdrawal");
    }
    if (!registry_.is_supported(asset)) {
        throw DSCError(errors::UNSUPPORTED_ASSET, address::to_hex(asset));
    }

    I128 before = balance_of(account, asset);
    if (amount > before) {
        throw DSCError(errors::INSUFFICIENT_COLLATERAL,
                       address::to_hex(account) + " holds " + x18::format(before) +
                       ", requested " + x18::format(amount));
    }

    journal.record([this, account, asset, before] { set(account, asset, before); });
    set(account, asset, before - amount);
}

I128 CollateralLedger::balance_of(const Address& account, const Address& asset) const {
    auto it = balances_.find(account);
    if (it == balances_.end()) return 0;
    auto ait = it->second.find(asset);
    return (ait != it->second.end()) ? ait->second : 0;
}

I128 CollateralLedger::total_of(const Address& asset) const {
    auto it = totals_.find(asset);
    return (it != totals_.end()) ? it->second : 0;
}

I128 CollateralLedger::value_usd(const Address& account, const OracleAdapter& oracle) const {
    auto it = balances_.find(account);
    if (it == balances_.end()) return 0;

    I128 total = 0;
    for (const Address& asset : registry_.assets()) {
        auto ait = it->second.find(asset);
        if (ait == it->second.end()) continue;
        total = x18::add(total, oracle.usd_value(asset, ait->second));
    }
    return total;
}

void CollateralLedger::set(const Address& account, const Address& asset, I128 value) {
    I128 previous = balance_of(account, asset);
    totals_[asset] += value - previous;
    if (totals_[asset] == 0) {
        totals_.erase(asset);
    }

    if (value == 0) {
        auto it = balances_.find(account);
        if (it == balances_.end()) return;
        it->second.erase(asset);
        if (it->second.empty()) {
            balances_.erase(it);
        }
        return;
    }
    balances_[account][asset] = value;
}

// =============================================================================
// DebtLedger
// =============================================================================

void DebtLedger::mint(const Address& account, I128 amount, Journal& journal) {
    if (amount <= 0) {
        throw DSCError(errors::ZERO_AMOUNT, "debt mint");
    }

    I128 before = debt_of(account);
    I128 after = x18::add(before, amount);
    x18::add(total_, amount);

    journal.record([this, account, before] { set(account, before); });
    set(account, after);
}

void DebtLedger::burn(const Address& account, I128 amount, Journal& journal) {
    if (amount <= 0) {
        throw DSCError(errors::ZERO_AMOUNT, "debt burn");
    }

    I128 before = debt_of(account);
    if (amount > before) {
        throw DSCError(errors::INSUFFICIENT_DEBT,
                       address::to_hex(account) + " owes " + x18::format(before) +
                       ", repaying " + x18::format(amount));
    }

    journal.record([this, account, before] { set(account, before); });
    set(account, before - amount);
}

I128 DebtLedger::debt_of(const Address& account) const {
    auto it = minted_.find(account);
    return (it != minted_.end()) ? it->second : 0;
}

std::vector<Address> DebtLedger::debtors() const {
    std::vector<Address> accounts;
    accounts.reserve(minted_.size());
    for (const auto& [account, debt] : minted_) {
        accounts.push_back(account);
    }
    return accounts;
}

void DebtLedger::set(const Address& account, I128 value) {
    total_ += value - debt_of(account);
    if (value == 0) {
        minted_.erase(account);
    } else {
        minted_[account] = value;
    }
}

} // namespace dsc

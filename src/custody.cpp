// =============================================================================
// custody.cpp - Reentrancy Guard and External Value Movement
// =============================================================================

#include "dsc/custody.hpp"
#include "dsc/log.hpp"

#include <exception>

namespace dsc {

// =============================================================================
// ReentrancyGuard
// =============================================================================

ReentrancyGuard::Scope::Scope(ReentrancyGuard& guard, const char* operation) : guard_(guard) {
    if (guard_.entered_) {
        throw DSCError(errors::REENTRANCY_BLOCKED,
                       std::string(operation) + " entered during " + guard_.holder_);
    }
    guard_.entered_ = true;
    guard_.holder_ = operation;
}

ReentrancyGuard::Scope::~Scope() {
    guard_.entered_ = false;
    guard_.holder_ = "";
}

// =============================================================================
// Custody
// =============================================================================

Custody::Custody(const Address& self, const AssetRegistry& registry, ILiabilityToken& liability)
    : self_(self), registry_(registry), liability_(liability) {}

template <typename Call>
void Custody::invoke(const std::string& what, Call&& call) {
    bool ok = false;
    try {
        ok = call();
    } catch (const DSCError&) {
        throw;
    } catch (const std::exception& e) {
        throw DSCError(errors::TRANSFER_FAILED, what + " threw: " + e.what());
    }
    if (!ok) {
        throw DSCError(errors::TRANSFER_FAILED, what + " returned false");
    }
    log::logger()->trace("custody: {}", what);
}

void Custody::pull_collateral(const Address& from, const Address& asset, I128 amount,
                              Journal& journal) {
    ICollateralToken& token = *registry_.get(asset).token;
    std::string what = "transfer_from " + x18::format(amount) + " " + token.symbol() +
                       " " + address::to_hex(from) + " -> engine";

    invoke(what, [&] { return token.transfer_from(self_, from, self_, amount); });

    Address self = self_;
    journal.compensate("return " + x18::format(amount) + " " + token.symbol() + " to " +
                       address::to_hex(from),
                       [&token, self, from, amount] { return token.transfer(self, from, amount); });
}

void Custody::push_collateral(const Address& to, const Address& asset, I128 amount) {
    ICollateralToken& token = *registry_.get(asset).token;
    std::string what = "transfer " + x18::format(amount) + " " + token.symbol() +
                       " engine -> " + address::to_hex(to);

    invoke(what, [&] { return token.transfer(self_, to, amount); });
}

void Custody::burn_liability(const Address& from, I128 amount, Journal& journal) {
    std::string what = "burn " + x18::format(amount) + " from " + address::to_hex(from);

    invoke(what, [&] { return liability_.burn_from(self_, from, amount); });

    Address self = self_;
    ILiabilityToken& liability = liability_;
    journal.compensate("re-mint " + x18::format(amount) + " to " + address::to_hex(from),
                       [&liability, self, from, amount] { return liability.mint(self, from, amount); });
}

void Custody::mint_liability(const Address& to, I128 amount) {
    std::string what = "mint " + x18::format(amount) + " to " + address::to_hex(to);

    invoke(what, [&] { return liability_.mint(self_, to, amount); });
}

} // namespace dsc

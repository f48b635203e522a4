// =============================================================================
// token.cpp - In-Memory Collateral and Liability Tokens
// =============================================================================

#include "dsc/token.hpp"

namespace dsc {

// =============================================================================
// Erc20
// =============================================================================

Erc20::Erc20(const Address& addr, std::string symbol, uint8_t decimals)
    : address_(addr), symbol_(std::move(symbol)), decimals_(decimals) {}

I128 Erc20::balance_of(const Address& owner) const {
    auto it = balances_.find(owner);
    return (it != balances_.end()) ? it->second : 0;
}

I128 Erc20::allowance(const Address& owner, const Address& spender) const {
    auto it = allowances_.find(owner);
    if (it == allowances_.end()) return 0;
    auto sit = it->second.find(spender);
    return (sit != it->second.end()) ? sit->second : 0;
}

bool Erc20::approve(const Address& owner, const Address& spender, I128 amount) {
    if (amount < 0 || address::is_zero(spender)) {
        return false;
    }
    allowances_[owner][spender] = amount;
    return true;
}

bool Erc20::transfer(const Address& sender, const Address& to, I128 amount) {
    return move(sender, to, amount);
}

bool Erc20::transfer_from(const Address& spender, const Address& from,
                          const Address& to, I128 amount) {
    if (allowance(from, spender) < amount || balance_of(from) < amount) {
        return false;
    }
    if (!move(from, to, amount)) {
        return false;
    }
    return spend_allowance(from, spender, amount);
}

void Erc20::mint_to(const Address& to, I128 amount) {
    if (amount <= 0) return;
    credit(to, amount);
    total_supply_ += amount;
}

bool Erc20::move(const Address& from, const Address& to, I128 amount) {
    if (amount < 0 || address::is_zero(to)) {
        return false;
    }
    if (!debit(from, amount)) {
        return false;
    }
    credit(to, amount);
    return true;
}

bool Erc20::spend_allowance(const Address& owner, const Address& spender, I128 amount) {
    auto& current = allowances_[owner][spender];
    if (current < amount) {
        return false;
    }
    current -= amount;
    return true;
}

void Erc20::credit(const Address& to, I128 amount) {
    balances_[to] += amount;
}

bool Erc20::debit(const Address& from, I128 amount) {
    auto it = balances_.find(from);
    I128 balance = (it != balances_.end()) ? it->second : 0;
    if (balance < amount) {
        return false;
    }
    if (amount == 0) {
        return true;
    }
    it->second -= amount;
    if (it->second == 0) {
        balances_.erase(it);
    }
    return true;
}

// =============================================================================
// StableCoin
// =============================================================================

StableCoin::StableCoin(const Address& addr, const Address& owner, std::string symbol)
    : Erc20(addr, std::move(symbol), 18), owner_(owner) {}

bool StableCoin::transfer_ownership(const Address& current, const Address& next) {
    if (current != owner_ || address::is_zero(next)) {
        return false;
    }
    owner_ = next;
    return true;
}

bool StableCoin::mint(const Address& minter, const Address& to, I128 amount) {
    if (minter != owner_ || amount <= 0 || address::is_zero(to)) {
        return false;
    }
    credit(to, amount);
    total_supply_ += amount;
    return true;
}

bool StableCoin::burn_from(const Address& burner, const Address& from, I128 amount) {
    if (burner != owner_ || amount <= 0) {
        return false;
    }
    if (balance_of(from) < amount || allowance(from, burner) < amount) {
        return false;
    }
    if (!spend_allowance(from, burner, amount) || !debit(from, amount)) {
        return false;
    }
    total_supply_ -= amount;
    return true;
}

} // namespace dsc

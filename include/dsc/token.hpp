#ifndef DSC_TOKEN_HPP
#define DSC_TOKEN_HPP

#include <string>
#include <unordered_map>

#include "types.hpp"

namespace dsc {

// =============================================================================
// Collateral Value-Transfer Interface
// =============================================================================

// The operating party is passed explicitly: `sender` for transfer, `spender`
// for transfer_from. A false return means the transfer did not happen.
class ICollateralToken {
public:
    virtual ~ICollateralToken() = default;

    virtual Address address() const = 0;
    virtual std::string symbol() const = 0;

    virtual I128 balance_of(const Address& owner) const = 0;

    virtual bool transfer(const Address& sender, const Address& to, I128 amount) = 0;
    virtual bool transfer_from(const Address& spender, const Address& from,
                               const Address& to, I128 amount) = 0;
};

// =============================================================================
// Liability Token Interface
// =============================================================================

class ILiabilityToken {
public:
    virtual ~ILiabilityToken() = default;

    virtual Address address() const = 0;

    virtual I128 balance_of(const Address& owner) const = 0;
    virtual I128 total_supply() const = 0;

    // Issue new liability to `to`
    virtual bool mint(const Address& minter, const Address& to, I128 amount) = 0;

    // Destroy `amount` held by `from`; `from` must have approved `burner`
    virtual bool burn_from(const Address& burner, const Address& from, I128 amount) = 0;
};

// =============================================================================
// Erc20 - In-Memory Fungible Token
// =============================================================================

class Erc20 : public ICollateralToken {
public:
    Erc20(const Address& addr, std::string symbol, uint8_t decimals = 18);

    Erc20(const Erc20&) = delete;
    Erc20& operator=(const Erc20&) = delete;

    Address address() const override { return address_; }
    std::string symbol() const override { return symbol_; }
    uint8_t decimals() const { return decimals_; }

    I128 balance_of(const Address& owner) const override;
    I128 allowance(const Address& owner, const Address& spender) const;
    I128 supply() const { return total_supply_; }

    bool approve(const Address& owner, const Address& spender, I128 amount);
    bool transfer(const Address& sender, const Address& to, I128 amount) override;
    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, I128 amount) override;

    // Faucet: create tokens out of thin air (tests and simulation)
    void mint_to(const Address& to, I128 amount);

protected:
    bool move(const Address& from, const Address& to, I128 amount);
    bool spend_allowance(const Address& owner, const Address& spender, I128 amount);
    void credit(const Address& to, I128 amount);
    bool debit(const Address& from, I128 amount);

    Address address_;
    std::string symbol_;
    uint8_t decimals_;
    I128 total_supply_{0};

    std::unordered_map<Address, I128, AddressHash> balances_;
    std::unordered_map<Address, std::unordered_map<Address, I128, AddressHash>, AddressHash> allowances_;
};

// =============================================================================
// StableCoin - Owner-Controlled Liability Token
// =============================================================================

// Only the owner (the engine) may mint or burn.
class StableCoin : public Erc20, public ILiabilityToken {
public:
    StableCoin(const Address& addr, const Address& owner, std::string symbol = "DSC");

    Address address() const override { return address_; }
    Address owner() const { return owner_; }
    bool transfer_ownership(const Address& current, const Address& next);

    I128 balance_of(const Address& holder) const override { return Erc20::balance_of(holder); }
    I128 total_supply() const override { return total_supply_; }

    bool mint(const Address& minter, const Address& to, I128 amount) override;
    bool burn_from(const Address& burner, const Address& from, I128 amount) override;

private:
    Address owner_;
};

} // namespace dsc

#endif // DSC_TOKEN_HPP

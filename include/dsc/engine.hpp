#ifndef DSC_ENGINE_HPP
#define DSC_ENGINE_HPP

#include <functional>
#include <memory>
#include <vector>

#include "types.hpp"
#include "token.hpp"
#include "oracle.hpp"
#include "registry.hpp"
#include "ledger.hpp"
#include "risk.hpp"
#include "liquidation.hpp"
#include "custody.hpp"
#include "events.hpp"

namespace dsc {

// =============================================================================
// Engine Configuration
// =============================================================================

struct EngineConfig {
    Address self{};                                        // holds deposited collateral
    uint64_t price_timeout = OracleAdapter::DEFAULT_TIMEOUT;
    Clock clock = system_clock_seconds;
};

// =============================================================================
// DSCEngine - Over-Collateralized Debt Engine
// =============================================================================

// Every mutating call runs under the reentrancy guard and is all-or-nothing:
// ledger effects first, health check second, external transfers last. Any
// failure discards the ledger changes and rethrows the DSCError.
class DSCEngine {
public:
    // Throws DSCError(CONFIG_MISMATCH) if the lists differ in length,
    // DSCError(CONFIG_INVALID) for a null liability token or zero self address.
    DSCEngine(const std::vector<std::shared_ptr<ICollateralToken>>& collateral_tokens,
              const std::vector<std::shared_ptr<IPriceFeed>>& price_feeds,
              std::shared_ptr<ILiabilityToken> liability,
              EngineConfig config);
    ~DSCEngine() = default;

    // Non-copyable
    DSCEngine(const DSCEngine&) = delete;
    DSCEngine& operator=(const DSCEngine&) = delete;

    // =========================================================================
    // Collateral
    // =========================================================================

    void deposit_collateral(const Address& caller, const Address& asset, I128 amount_x18);

    // Only while the caller stays healthy
    void withdraw_collateral(const Address& caller, const Address& asset, I128 amount_x18);

    // =========================================================================
    // Debt
    // =========================================================================

    // Only while the caller stays healthy
    void mint_debt(const Address& caller, I128 amount_x18);

    // Caller must hold and have approved `amount_x18` of the liability token
    void burn_debt(const Address& caller, I128 amount_x18);

    // =========================================================================
    // Composed Operations
    // =========================================================================

    void deposit_collateral_and_mint_debt(const Address& caller, const Address& asset,
                                          I128 collateral_x18, I128 mint_x18);

    // Health is checked once, after both ledger changes
    void redeem_collateral_for_debt(const Address& caller, const Address& asset,
                                    I128 collateral_x18, I128 burn_x18);

    // =========================================================================
    // Liquidation
    // =========================================================================

    LiquidationResult liquidate(const Address& caller, const Address& target,
                                const Address& asset, I128 debt_to_cover_x18);

    LiquidationQuote quote_liquidation(const Address& target, const Address& asset,
                                       I128 debt_to_cover_x18) const;

    // =========================================================================
    // Queries
    // =========================================================================

    I128 get_health_factor(const Address& account) const;
    I128 get_account_collateral_value(const Address& account) const;
    AccountInfo get_account_information(const Address& account) const;

    I128 get_usd_value(const Address& asset, I128 amount_x18) const;
    I128 get_token_amount_from_usd(const Address& asset, I128 usd_x18) const;

    I128 get_collateral_balance(const Address& account, const Address& asset) const;
    I128 get_debt(const Address& account) const;

    I128 total_debt() const;
    I128 total_collateral(const Address& asset) const;

    static I128 calculate_health_factor(I128 debt_minted_x18, I128 collateral_value_usd_x18) {
        return RiskEngine::calculate_health_factor(debt_minted_x18, collateral_value_usd_x18);
    }

    const std::vector<Address>& get_collateral_tokens() const { return registry_.assets(); }
    Address get_price_feed(const Address& asset) const;
    Address get_liability_token() const { return liability_->address(); }
    const Address& self() const { return config_.self; }

    static constexpr I128 precision() { return params::PRECISION; }
    static constexpr I128 liquidation_threshold() { return params::LIQUIDATION_THRESHOLD; }
    static constexpr I128 liquidation_bonus() { return params::LIQUIDATION_BONUS; }
    static constexpr I128 min_health_factor() { return params::MIN_HEALTH_FACTOR; }

    // =========================================================================
    // Events
    // =========================================================================

    // Listeners see committed operations only, in emission order
    void subscribe(EventListener listener);

private:
    using Body = std::function<void(Journal&)>;

    static ILiabilityToken& require_liability(const std::shared_ptr<ILiabilityToken>& liability);

    void atomically(const char* operation, const Body& body);
    void emit(const Event& event);
    void publish(const std::vector<Event>& events);

    EngineConfig config_;
    std::shared_ptr<ILiabilityToken> liability_;

    // Construction order matters: the registry validates the configuration
    // before any ledger exists.
    AssetRegistry registry_;
    OracleAdapter oracle_;
    CollateralLedger collateral_;
    DebtLedger debt_;
    RiskEngine risk_;
    LiquidationEngine liquidation_;
    Custody custody_;
    ReentrancyGuard guard_;

    std::vector<Event> pending_;
    std::vector<EventListener> listeners_;
};

} // namespace dsc

#endif // DSC_ENGINE_HPP

// =============================================================================
// engine.cpp - DSCEngine Implementation
// =============================================================================

#include "dsc/engine.hpp"
#include "dsc/log.hpp"

#include <exception>

namespace dsc {

// =============================================================================
// Constructor
// =============================================================================

DSCEngine::DSCEngine(const std::vector<std::shared_ptr<ICollateralToken>>& collateral_tokens,
                     const std::vector<std::shared_ptr<IPriceFeed>>& price_feeds,
                     std::shared_ptr<ILiabilityToken> liability,
                     EngineConfig config)
    : config_(std::move(config))
    , liability_(std::move(liability))
    , registry_(collateral_tokens, price_feeds)
    , oracle_(registry_, config_.clock, config_.price_timeout)
    , collateral_(registry_)
    , debt_()
    , risk_(collateral_, debt_, oracle_)
    , liquidation_(registry_, collateral_, debt_, risk_, oracle_)
    , custody_(config_.self, registry_, require_liability(liability_))
{
    if (address::is_zero(config_.self)) {
        throw DSCError(errors::CONFIG_INVALID, "engine address is zero");
    }

    log::logger()->info("engine {} ready: {} collateral assets, liability {}, price timeout {}s",
                        address::to_hex(config_.self), registry_.size(),
                        address::to_hex(liability_->address()), config_.price_timeout);
}

ILiabilityToken& DSCEngine::require_liability(const std::shared_ptr<ILiabilityToken>& liability) {
    if (!liability) {
        throw DSCError(errors::CONFIG_INVALID, "liability token is null");
    }
    return *liability;
}

// =============================================================================
// Collateral
// =============================================================================

void DSCEngine::deposit_collateral(const Address& caller, const Address& asset, I128 amount_x18) {
    atomically("deposit_collateral", [&](Journal& journal) {
        collateral_.deposit(caller, asset, amount_x18, journal);
        emit(Event{EventKind::COLLATERAL_DEPOSITED, caller, asset, amount_x18, {}, 0});

        custody_.pull_collateral(caller, asset, amount_x18, journal);
    });
}

void DSCEngine::withdraw_collateral(const Address& caller, const Address& asset, I128 amount_x18) {
    atomically("withdraw_collateral", [&](Journal& journal) {
        collateral_.withdraw(caller, asset, amount_x18, journal);
        emit(Event{EventKind::COLLATERAL_WITHDRAWN, caller, asset, amount_x18, caller, 0});

        risk_.assert_healthy(caller);

        custody_.push_collateral(caller, asset, amount_x18);
    });
}

// =============================================================================
// Debt
// =============================================================================

void DSCEngine::mint_debt(const Address& caller, I128 amount_x18) {
    atomically("mint_debt", [&](Journal& journal) {
        debt_.mint(caller, amount_x18, journal);
        emit(Event{EventKind::DEBT_MINTED, caller, {}, amount_x18, {}, 0});

        risk_.assert_healthy(caller);

        custody_.mint_liability(caller, amount_x18);
    });
}

void DSCEngine::burn_debt(const Address& caller, I128 amount_x18) {
    atomically("burn_debt", [&](Journal& journal) {
        debt_.burn(caller, amount_x18, journal);
        emit(Event{EventKind::DEBT_BURNED, caller, {}, amount_x18, caller, 0});

        custody_.burn_liability(caller, amount_x18, journal);
    });
}

// =============================================================================
// Composed Operations
// =============================================================================

void DSCEngine::deposit_collateral_and_mint_debt(const Address& caller, const Address& asset,
                                                 I128 collateral_x18, I128 mint_x18) {
    atomically("deposit_collateral_and_mint_debt", [&](Journal& journal) {
        collateral_.deposit(caller, asset, collateral_x18, journal);
        debt_.mint(caller, mint_x18, journal);
        emit(Event{EventKind::COLLATERAL_DEPOSITED, caller, asset, collateral_x18, {}, 0});
        emit(Event{EventKind::DEBT_MINTED, caller, {}, mint_x18, {}, 0});

        risk_.assert_healthy(caller);

        custody_.pull_collateral(caller, asset, collateral_x18, journal);
        custody_.mint_liability(caller, mint_x18);
    });
}

void DSCEngine::redeem_collateral_for_debt(const Address& caller, const Address& asset,
                                           I128 collateral_x18, I128 burn_x18) {
    atomically("redeem_collateral_for_debt", [&](Journal& journal) {
        debt_.burn(caller, burn_x18, journal);
        collateral_.withdraw(caller, asset, collateral_x18, journal);
        emit(Event{EventKind::DEBT_BURNED, caller, {}, burn_x18, caller, 0});
        emit(Event{EventKind::COLLATERAL_WITHDRAWN, caller, asset, collateral_x18, caller, 0});

        risk_.assert_healthy(caller);

        custody_.burn_liability(caller, burn_x18, journal);
        custody_.push_collateral(caller, asset, collateral_x18);
    });
}

// =============================================================================
// Liquidation
// =============================================================================

LiquidationResult DSCEngine::liquidate(const Address& caller, const Address& target,
                                       const Address& asset, I128 debt_to_cover_x18) {
    LiquidationResult result{};

    atomically("liquidate", [&](Journal& journal) {
        result = liquidation_.execute(caller, target, asset, debt_to_cover_x18, journal);
        emit(Event{EventKind::COLLATERAL_WITHDRAWN, target, asset,
                   result.collateral_seized_x18, caller, 0});
        emit(Event{EventKind::DEBT_BURNED, target, {}, debt_to_cover_x18, caller, 0});
        emit(Event{EventKind::LIQUIDATION, target, asset, debt_to_cover_x18,
                   caller, result.collateral_seized_x18});

        custody_.burn_liability(caller, debt_to_cover_x18, journal);
        custody_.push_collateral(caller, asset, result.collateral_seized_x18);
    });

    log::logger()->info("liquidated {}: covered {} seized {} (bonus {}), health {} -> {}",
                        address::to_hex(target), x18::format(result.debt_covered_x18),
                        x18::format(result.collateral_seized_x18), x18::format(result.bonus_x18),
                        x18::format(result.starting_health_factor_x18),
                        x18::format(result.ending_health_factor_x18));
    return result;
}

LiquidationQuote DSCEngine::quote_liquidation(const Address& target, const Address& asset,
                                              I128 debt_to_cover_x18) const {
    return liquidation_.quote(target, asset, debt_to_cover_x18);
}

// =============================================================================
// Queries
// =============================================================================

I128 DSCEngine::get_health_factor(const Address& account) const {
    return risk_.health_factor(account);
}

I128 DSCEngine::get_account_collateral_value(const Address& account) const {
    return collateral_.value_usd(account, oracle_);
}

AccountInfo DSCEngine::get_account_information(const Address& account) const {
    return risk_.account_information(account);
}

I128 DSCEngine::get_usd_value(const Address& asset, I128 amount_x18) const {
    return oracle_.usd_value(asset, amount_x18);
}

I128 DSCEngine::get_token_amount_from_usd(const Address& asset, I128 usd_x18) const {
    return oracle_.token_amount_from_usd(asset, usd_x18);
}

I128 DSCEngine::get_collateral_balance(const Address& account, const Address& asset) const {
    return collateral_.balance_of(account, asset);
}

I128 DSCEngine::get_debt(const Address& account) const {
    return debt_.debt_of(account);
}

I128 DSCEngine::total_debt() const {
    return debt_.total();
}

I128 DSCEngine::total_collateral(const Address& asset) const {
    return collateral_.total_of(asset);
}

Address DSCEngine::get_price_feed(const Address& asset) const {
    return registry_.get(asset).price_feed->address();
}

// =============================================================================
// Events
// =============================================================================

void DSCEngine::subscribe(EventListener listener) {
    listeners_.push_back(std::move(listener));
}

void DSCEngine::emit(const Event& event) {
    pending_.push_back(event);
}

void DSCEngine::publish(const std::vector<Event>& events) {
    for (const Event& event : events) {
        log::logger()->info("{}", describe(event));
        // Listeners may subscribe from inside a callback
        const std::vector<EventListener> listeners = listeners_;
        for (const auto& listener : listeners) {
            listener(event);
        }
    }
}

// =============================================================================
// Atomic Execution
// =============================================================================

void DSCEngine::atomically(const char* operation, const Body& body) {
    std::vector<Event> committed;
    {
        ReentrancyGuard::Scope scope(guard_, operation);
        Journal journal;
        pending_.clear();

        log::logger()->debug("{} begin", operation);

        try {
            body(journal);
        } catch (const std::exception& e) {
            size_t failed = journal.revert();
            pending_.clear();
            log::logger()->warn("{} reverted: {}{}", operation, e.what(),
                                failed ? " (compensation failed)" : "");
            throw;
        } catch (...) {
            journal.revert();
            pending_.clear();
            throw;
        }

        journal.commit();
        committed.swap(pending_);
    }

    // Guard released: listeners may call back into the engine
    publish(committed);
}

} // namespace dsc

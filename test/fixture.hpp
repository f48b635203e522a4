// DSC Engine - Shared Test Fixture and Test Doubles

#ifndef DSC_TEST_FIXTURE_HPP
#define DSC_TEST_FIXTURE_HPP

#include <functional>
#include <memory>
#include <stdexcept>
#include <vector>

#include <catch2/catch.hpp>
#include <dsc/dsc.hpp>

// Print I128 values in assertion messages
namespace Catch {
template <>
struct StringMaker<__int128> {
    static std::string convert(__int128 value) { return dsc::x18::to_string(value); }
};
} // namespace Catch

namespace dsc {
namespace test {

constexpr uint64_t START_TIME = 1700000000;

inline const Address ENGINE = address::from_id(0xE0);
inline const Address DSC_TOKEN = address::from_id(0xD5);
inline const Address WETH = address::from_id(0x01);
inline const Address WBTC = address::from_id(0x02);
inline const Address ETH_FEED = address::from_id(0xF1);
inline const Address BTC_FEED = address::from_id(0xF2);

inline const Address ALICE = address::from_id(0xA11CE);
inline const Address BOB = address::from_id(0xB0B);
inline const Address CAROL = address::from_id(0xCA401);

inline I128 units(int64_t n) { return x18::from_int(n); }

// Error code raised by `call`, errors::OK if it returned normally
template <typename Call>
int32_t error_of(Call&& call) {
    try {
        call();
    } catch (const DSCError& e) {
        return e.code();
    }
    return errors::OK;
}

// 8-decimal feed answer for a whole-dollar price
inline I128 usd8(int64_t dollars) { return static_cast<I128>(dollars) * 100000000; }

// =============================================================================
// Test Doubles
// =============================================================================

// Manually advanced clock shared by feeds and the engine
class ManualClock {
public:
    ManualClock() : now_(std::make_shared<uint64_t>(START_TIME)) {}

    Clock clock() const {
        std::shared_ptr<uint64_t> now = now_;
        return [now] { return *now; };
    }

    uint64_t now() const { return *now_; }
    void advance(uint64_t seconds) { *now_ += seconds; }

private:
    std::shared_ptr<uint64_t> now_;
};

// Feed whose round data is set directly
class ScriptedFeed : public IPriceFeed {
public:
    ScriptedFeed(const Address& addr, uint8_t decimals) : address_(addr), decimals_(decimals) {}

    Address address() const override { return address_; }
    uint8_t decimals() const override { return decimals_; }
    RoundData latest_round_data() const override { return round; }

    RoundData round{};

private:
    Address address_;
    uint8_t decimals_;
};

// Collateral token with switchable failure modes
class FaultyToken : public Erc20 {
public:
    FaultyToken(const Address& addr, std::string symbol) : Erc20(addr, std::move(symbol)) {}

    bool refuse_transfer = false;
    bool refuse_transfer_from = false;
    bool throw_on_transfer = false;

    bool transfer(const Address& sender, const Address& to, I128 amount) override {
        if (throw_on_transfer) throw std::runtime_error("token paused");
        if (refuse_transfer) return false;
        return Erc20::transfer(sender, to, amount);
    }

    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, I128 amount) override {
        if (refuse_transfer_from) return false;
        return Erc20::transfer_from(spender, from, to, amount);
    }
};

// Collateral token that calls back into the engine mid-transfer
class HookedToken : public Erc20 {
public:
    HookedToken(const Address& addr, std::string symbol) : Erc20(addr, std::move(symbol)) {}

    std::function<bool()> on_transfer_from;
    std::function<bool()> on_transfer;

    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, I128 amount) override {
        if (on_transfer_from && !on_transfer_from()) return false;
        return Erc20::transfer_from(spender, from, to, amount);
    }

    bool transfer(const Address& sender, const Address& to, I128 amount) override {
        if (on_transfer && !on_transfer()) return false;
        return Erc20::transfer(sender, to, amount);
    }
};

// =============================================================================
// Harness - Engine with WETH ($2000) and WBTC ($60000) collateral
// =============================================================================

class Harness {
public:
    explicit Harness(std::shared_ptr<Erc20> weth_token = nullptr)
        : weth(weth_token ? std::move(weth_token) : std::make_shared<Erc20>(WETH, "WETH"))
        , wbtc(std::make_shared<Erc20>(WBTC, "WBTC"))
        , eth_feed(std::make_shared<PriceFeed>(ETH_FEED, 8, usd8(2000), time.clock()))
        , btc_feed(std::make_shared<PriceFeed>(BTC_FEED, 8, usd8(60000), time.clock()))
        , dsc(std::make_shared<StableCoin>(DSC_TOKEN, ENGINE))
    {
        EngineConfig config;
        config.self = ENGINE;
        config.clock = time.clock();

        engine = std::make_unique<DSCEngine>(
            std::vector<std::shared_ptr<ICollateralToken>>{weth, wbtc},
            std::vector<std::shared_ptr<IPriceFeed>>{eth_feed, btc_feed},
            dsc, config);
    }

    // Faucet `amount` of `token` to `account` and approve the engine for it
    void fund(const Address& account, Erc20& token, I128 amount) {
        token.mint_to(account, amount);
        token.approve(account, ENGINE, token.allowance(account, ENGINE) + amount);
    }

    // Collateralize `account` and mint against it in one step
    void open(const Address& account, I128 collateral, I128 debt) {
        fund(account, *weth, collateral);
        engine->deposit_collateral_and_mint_debt(account, WETH, collateral, debt);
    }

    void allow_burn(const Address& account, I128 amount) {
        dsc->approve(account, ENGINE, amount);
    }

    void set_eth_price(int64_t dollars) { eth_feed->update_answer(usd8(dollars)); }

    ManualClock time;
    std::shared_ptr<Erc20> weth;
    std::shared_ptr<Erc20> wbtc;
    std::shared_ptr<PriceFeed> eth_feed;
    std::shared_ptr<PriceFeed> btc_feed;
    std::shared_ptr<StableCoin> dsc;
    std::unique_ptr<DSCEngine> engine;
};

} // namespace test
} // namespace dsc

#endif // DSC_TEST_FIXTURE_HPP

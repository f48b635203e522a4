// DSC Scenario Simulator
//
// Deploys the engine with in-memory collaborators from a deployment file and
// replays a scenario of user, keeper and oracle steps against it.
//
//   dsc-sim [options] <deployment.json> <scenario.json>

#include "dsc/dsc.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace dsc;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Options {
    std::string deployment_path;
    std::string scenario_path;
    bool verbose = false;
    bool print_events = false;
};

//------------------------------------------------------------------------------
// Simulation State
//------------------------------------------------------------------------------

class Simulation {
public:
    Simulation(const DeploymentConfig& config, uint64_t start_time)
        : now_(std::make_shared<uint64_t>(start_time))
    {
        std::shared_ptr<uint64_t> now = now_;
        deployment_ = deploy(config, [now] { return *now; });
    }

    DSCEngine& engine() { return *deployment_.engine; }

    void on_events(bool print) {
        if (!print) return;
        engine().subscribe([](const Event& e) {
            std::cout << "    event " << describe(e) << "\n";
        });
    }

    Address account(const std::string& name) {
        auto it = accounts_.find(name);
        if (it != accounts_.end()) return it->second;
        Address addr = address::from_id(0x1000 + accounts_.size());
        accounts_[name] = addr;
        return addr;
    }

    std::shared_ptr<Erc20> token(const std::string& symbol) const {
        auto t = deployment_.token(symbol);
        if (!t) {
            throw DSCError(errors::UNSUPPORTED_ASSET, "unknown token symbol " + symbol);
        }
        return t;
    }

    void run_step(const json& step);
    void report() const;

private:
    I128 amount(const json& step, const char* field) const {
        if (!step.contains(field)) {
            throw DSCError(errors::CONFIG_INVALID, std::string("step missing \"") + field + "\"");
        }
        return decimal_from_json(step[field], field);
    }

    std::shared_ptr<uint64_t> now_;
    Deployment deployment_;
    std::map<std::string, Address> accounts_;
};

void Simulation::run_step(const json& step) {
    std::string op = step.at("op").get<std::string>();
    DSCEngine& e = engine();

    if (op == "faucet") {
        token(step.at("token").get<std::string>())->mint_to(
            account(step.at("account").get<std::string>()), amount(step, "amount"));
    } else if (op == "approve") {
        Address owner = account(step.at("account").get<std::string>());
        std::string symbol = step.at("token").get<std::string>();
        I128 value = amount(step, "amount");
        bool ok = (symbol == deployment_.stablecoin->symbol())
            ? deployment_.stablecoin->approve(owner, e.self(), value)
            : token(symbol)->approve(owner, e.self(), value);
        if (!ok) throw DSCError(errors::TRANSFER_FAILED, "approve rejected");
    } else if (op == "transfer") {
        Address from = account(step.at("from").get<std::string>());
        Address to = account(step.at("to").get<std::string>());
        std::string symbol = step.at("token").get<std::string>();
        I128 value = amount(step, "amount");
        bool ok = (symbol == deployment_.stablecoin->symbol())
            ? deployment_.stablecoin->transfer(from, to, value)
            : token(symbol)->transfer(from, to, value);
        if (!ok) throw DSCError(errors::TRANSFER_FAILED, "transfer rejected");
    } else if (op == "set_price") {
        std::string symbol = step.at("token").get<std::string>();
        auto feed = deployment_.feed_for(symbol);
        if (!feed) throw DSCError(errors::UNSUPPORTED_ASSET, "no feed for " + symbol);
        I128 price = amount(step, "price");
        uint8_t d = feed->decimals();
        feed->update_answer(d <= 18 ? price / x18::pow10(18 - d)
                                    : x18::mul_div(price, x18::pow10(d - 18), 1));
    } else if (op == "advance_time") {
        *now_ += step.at("seconds").get<uint64_t>();
    } else if (op == "deposit") {
        e.deposit_collateral(account(step.at("account").get<std::string>()),
                             token(step.at("token").get<std::string>())->address(),
                             amount(step, "amount"));
    } else if (op == "withdraw") {
        e.withdraw_collateral(account(step.at("account").get<std::string>()),
                              token(step.at("token").get<std::string>())->address(),
                              amount(step, "amount"));
    } else if (op == "mint") {
        e.mint_debt(account(step.at("account").get<std::string>()), amount(step, "amount"));
    } else if (op == "burn") {
        e.burn_debt(account(step.at("account").get<std::string>()), amount(step, "amount"));
    } else if (op == "deposit_and_mint") {
        e.deposit_collateral_and_mint_debt(account(step.at("account").get<std::string>()),
                                           token(step.at("token").get<std::string>())->address(),
                                           amount(step, "collateral"), amount(step, "mint"));
    } else if (op == "redeem_for_debt") {
        e.redeem_collateral_for_debt(account(step.at("account").get<std::string>()),
                                     token(step.at("token").get<std::string>())->address(),
                                     amount(step, "collateral"), amount(step, "burn"));
    } else if (op == "liquidate") {
        LiquidationResult r = e.liquidate(account(step.at("account").get<std::string>()),
                                          account(step.at("target").get<std::string>()),
                                          token(step.at("token").get<std::string>())->address(),
                                          amount(step, "debt"));
        std::cout << "    seized " << x18::format(r.collateral_seized_x18)
                  << " (bonus " << x18::format(r.bonus_x18) << "), health "
                  << x18::format(r.starting_health_factor_x18) << " -> "
                  << (r.ending_health_factor_x18 == params::MAX_HEALTH_FACTOR
                          ? std::string("max") : x18::format(r.ending_health_factor_x18))
                  << "\n";
    } else if (op == "quote") {
        LiquidationQuote q = e.quote_liquidation(account(step.at("target").get<std::string>()),
                                                 token(step.at("token").get<std::string>())->address(),
                                                 amount(step, "debt"));
        std::cout << "    quote: seize " << x18::format(q.total_seized_x18)
                  << " of " << x18::format(q.available_x18)
                  << (q.liquidatable ? " (liquidatable)" : " (healthy)") << "\n";
    } else if (op == "report") {
        report();
    } else {
        throw DSCError(errors::CONFIG_INVALID, "unknown op \"" + op + "\"");
    }
}

void Simulation::report() const {
    const DSCEngine& e = *deployment_.engine;

    std::cout << "    " << std::left << std::setw(10) << "account"
              << std::setw(24) << "collateral_usd"
              << std::setw(20) << "debt"
              << "health" << "\n";

    for (const auto& [name, addr] : accounts_) {
        AccountInfo info = e.get_account_information(addr);
        std::string hf = info.health_factor_x18 == params::MAX_HEALTH_FACTOR
            ? "max" : x18::format(info.health_factor_x18);
        std::cout << "    " << std::left << std::setw(10) << name
                  << std::setw(24) << x18::format(info.collateral_value_usd_x18)
                  << std::setw(20) << x18::format(info.debt_minted_x18)
                  << hf << "\n";
    }

    std::cout << "    total debt " << x18::format(e.total_debt())
              << ", liability supply " << x18::format(deployment_.stablecoin->total_supply()) << "\n";
}

//------------------------------------------------------------------------------
// Command Line
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "DSC Scenario Simulator\n\n"
              << "Usage: " << prog << " [options] <deployment.json> <scenario.json>\n\n"
              << "Options:\n"
              << "  -e, --events     Print committed engine events\n"
              << "  -v, --verbose    Debug logging\n"
              << "  -h, --help       Show this help message\n\n"
              << "Scenario steps (\"op\"):\n"
              << "  faucet, approve, transfer, set_price, advance_time,\n"
              << "  deposit, withdraw, mint, burn, deposit_and_mint, redeem_for_debt,\n"
              << "  liquidate, quote, report\n"
              << "A step may carry \"expect\": \"OK\" or an error name such as \"HealthFactorBroken\".\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-e" || arg == "--events") {
            options.print_events = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        print_usage(argv[0]);
        std::exit(1);
    }
    options.deployment_path = positional[0];
    options.scenario_path = positional[1];
    return options;
}

json load_scenario(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw DSCError(errors::CONFIG_INVALID, "cannot open scenario file: " + path);
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw DSCError(errors::CONFIG_INVALID, std::string("malformed scenario: ") + e.what());
    }
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    try {
        DeploymentConfig config = DeploymentConfig::from_file(options.deployment_path);
        if (options.verbose) {
            config.log_level = "debug";
        }
        json scenario = load_scenario(options.scenario_path);

        Simulation sim(config, scenario.value("start_time", uint64_t{1700000000}));
        sim.on_events(options.print_events);

        const json& steps = scenario.at("steps");
        int mismatches = 0;

        for (size_t i = 0; i < steps.size(); ++i) {
            const json& step = steps[i];
            std::string op = step.value("op", std::string("?"));
            std::string outcome = errors::name(errors::OK);

            try {
                sim.run_step(step);
            } catch (const DSCError& e) {
                outcome = errors::name(e.code());
                std::cout << "    " << e.what() << "\n";
            }

            std::string expected = step.value("expect", std::string());
            bool matches = expected.empty() || expected == outcome;
            if (!matches) ++mismatches;

            std::cout << "[" << std::setw(3) << std::right << i << "] " << std::left
                      << std::setw(18) << op << outcome
                      << (matches ? "" : "  (expected " + expected + ")") << "\n";
        }

        if (mismatches > 0) {
            std::cerr << mismatches << " step(s) did not match expectations\n";
            return 2;
        }
    } catch (const DSCError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const json::exception& e) {
        std::cerr << "Scenario error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

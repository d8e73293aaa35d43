#include "risk/RiskSignalEvaluator.h"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using namespace riskbook;
using namespace riskbook::risk;

namespace {
int g_failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "[TEST] FAILED: " << message << "\n";
        ++g_failures;
    }
}

bool contains(const std::vector<std::string>& signals, const std::string& text) {
    return std::find(signals.begin(), signals.end(), text) != signals.end();
}

Position makePosition(const std::string& symbol, double price, double quantity, double unrealized = 0.0) {
    Position pos;
    pos.symbol = symbol;
    pos.entry_price = price;
    pos.current_price = price;
    pos.quantity = quantity;
    pos.unrealized_pnl = Money::fromDouble(unrealized);
    return pos;
}

AccountState makeAccount(double balance, int losses) {
    AccountState account = AccountState::create(Money::fromDouble(10000.0));
    account.current_balance = Money::fromDouble(balance);
    account.consecutive_losses = losses;
    return normalize(account);
}
}

int main() {
    std::cout << "[TEST] Starting RiskSignals Test..." << std::endl;

    RiskSignalEvaluator evaluator{SignalThresholds()};

    // healthy account, small exposure
    auto signals = evaluator.signals(makeAccount(10000.0, 0), {makePosition("BTC", 100.0, 10.0)});
    expect(signals.empty(), "healthy account has no signals");

    // 25% drawdown, 3 losses -> drawdown, streak and capital loss
    signals = evaluator.signals(makeAccount(7500.0, 3), {});
    expect(signals.size() == 3, "three signals at 25% drawdown with streak");
    expect(!signals.empty() && signals[0] == "HIGH DRAWDOWN WARNING: 25.0%", "drawdown message first");
    expect(contains(signals, "CONSECUTIVE LOSSES: 3"), "loss streak message");
    expect(contains(signals, "SIGNIFICANT CAPITAL LOSS"), "capital loss message");

    // exactly 15% drawdown does not warn
    signals = evaluator.signals(makeAccount(8500.0, 0), {});
    expect(!contains(signals, "HIGH DRAWDOWN WARNING: 15.0%"), "drawdown threshold is exclusive");

    // 11 small positions -> count warning only
    std::vector<Position> many;
    for (int i = 0; i < 11; ++i) {
        many.push_back(makePosition("S" + std::to_string(i), 10.0, 1.0));
    }
    signals = evaluator.signals(makeAccount(10000.0, 0), many);
    expect(signals.size() == 1 && signals[0] == "HIGH POSITION COUNT: 11", "position count warning");

    // a freshly opened 95% position is flat and does not warn
    signals = evaluator.signals(makeAccount(10000.0, 0), {makePosition("BTC", 50000.0, 0.19)});
    expect(!contains(signals, "HIGH PORTFOLIO CONCENTRATION"), "flat full-size position is quiet");

    // open pnl swing above half the balance warns, either direction
    signals = evaluator.signals(makeAccount(10000.0, 0),
                                {makePosition("BTC", 50000.0, 0.19, 3000.0),
                                 makePosition("ETH", 3000.0, 1.0, -2500.0)});
    expect(contains(signals, "HIGH PORTFOLIO CONCENTRATION"), "concentration warning on 5500 swing");

    // exactly half does not warn
    signals = evaluator.signals(makeAccount(10000.0, 0), {makePosition("BTC", 50000.0, 0.19, -5000.0)});
    expect(!contains(signals, "HIGH PORTFOLIO CONCENTRATION"), "concentration threshold is exclusive");

    // any open pnl against a non-positive balance
    signals = evaluator.signals(makeAccount(0.0, 0), {makePosition("BTC", 1.0, 1.0, 0.01)});
    expect(contains(signals, "HIGH PORTFOLIO CONCENTRATION"), "open pnl with zero balance concentrates");

    expect(RiskSignalEvaluator::unrealizedExposure({makePosition("A", 10.0, 2.0, 4.0),
                                                    makePosition("B", 5.0, 1.0, -1.5)}) == 5.5,
           "exposure sums absolute unrealized pnl");

    if (g_failures > 0) {
        std::cerr << "[TEST] RiskSignals Test FAILED (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "[TEST] RiskSignals Test PASSED!" << std::endl;
    return 0;
}

#include "analytics/PortfolioMetrics.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace riskbook;
using analytics::PortfolioMetricsEngine;

namespace {
int g_failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "[TEST] FAILED: " << message << "\n";
        ++g_failures;
    }
}

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

// entry 100 x qty 10 -> notional 1000, so pnl_percent = pnl / 10
risk::TradeRecord makeTrade(double pnl) {
    risk::TradeRecord trade;
    trade.symbol = "BTC";
    trade.entry_price = 100.0;
    trade.quantity = 10.0;
    trade.exit_price = 100.0 + pnl / 10.0;
    trade.pnl = Money::fromDouble(pnl);
    trade.pnl_percent = pnl / 10.0;
    return trade;
}

risk::AccountState makeAccount(double balance) {
    risk::AccountState account = risk::AccountState::create(Money::fromDouble(10000.0));
    auto next = risk::applyClose(account, Money::fromDouble(balance - 10000.0));
    return next ? *next : account;
}
}

static void testInsufficientData() {
    PortfolioMetricsEngine engine{risk::RiskConfig()};
    const auto account = makeAccount(10000.0);

    expect(!engine.compute({}, account, {}).has_value(), "no trades -> no metrics");
    expect(!engine.compute({makeTrade(10.0)}, account, {}).has_value(), "one trade -> no metrics");
    expect(engine.compute({makeTrade(10.0), makeTrade(-5.0)}, account, {}).has_value(), "two trades -> metrics");
}

static void testWinLossStatistics() {
    PortfolioMetricsEngine engine{risk::RiskConfig()};
    const std::vector<risk::TradeRecord> history = {makeTrade(20.0), makeTrade(-10.0)};
    const auto m = engine.compute(history, makeAccount(10010.0), {});

    expect(m.has_value(), "metrics available");
    if (!m) {
        return;
    }
    expect(m->total_trades == 2, "two trades");
    expect(m->winning_trades == 1 && m->losing_trades == 1, "one win one loss");
    expect(near(m->win_rate_pct, 50.0), "win rate 50%");
    expect(near(m->avg_win_pct, 2.0), "avg win 2%");
    expect(near(m->avg_loss_pct, -1.0), "avg loss -1%");
    expect(near(m->profit_factor, 2.0), "profit factor 2");
    expect(near(m->total_return_pct, 0.1), "total return 0.1%");
    expect(m->total_balance == Money::fromDouble(10010.0), "balance reported");
    expect(m->small_sample, "two trades is a small sample");
}

static void testProfitFactorWithoutLosses() {
    PortfolioMetricsEngine engine{risk::RiskConfig()};
    const auto m = engine.compute({makeTrade(10.0), makeTrade(30.0)}, makeAccount(10040.0), {});

    expect(m && near(m->profit_factor, 0.0), "profit factor 0 when there are no losses");
    expect(m && near(m->win_rate_pct, 100.0), "win rate 100%");
    expect(m && near(m->max_drawdown_pct, 0.0), "no drawdown on rising curve");
}

static void testZeroVarianceSharpe() {
    PortfolioMetricsEngine engine{risk::RiskConfig()};
    const auto m = engine.compute({makeTrade(10.0), makeTrade(10.0), makeTrade(10.0)}, makeAccount(10030.0), {});

    expect(m && m->sharpe_ratio == 0.0, "zero stddev -> sharpe 0");
    expect(m && std::isfinite(m->sharpe_ratio), "sharpe finite");
}

static void testSharpeMatchesDefinition() {
    risk::RiskConfig config;
    config.risk_free_rate_per_period = 0.0;
    PortfolioMetricsEngine engine{config};

    // returns 0.02, -0.01 -> mean 0.005, population stddev 0.015
    const auto m = engine.compute({makeTrade(20.0), makeTrade(-10.0)}, makeAccount(10010.0), {});
    expect(m && near(m->sharpe_ratio, 0.005 / 0.015, 1e-9), "sharpe = mean / stddev");
}

static void testIdempotent() {
    PortfolioMetricsEngine engine{risk::RiskConfig()};
    const std::vector<risk::TradeRecord> history = {
        makeTrade(20.0), makeTrade(-10.0), makeTrade(5.0), makeTrade(-30.0), makeTrade(12.0)
    };
    const auto account = makeAccount(9997.0);

    const auto a = engine.compute(history, account, {});
    const auto b = engine.compute(history, account, {});
    expect(a && b, "both computations available");
    if (a && b) {
        expect(a->sharpe_ratio == b->sharpe_ratio, "same sharpe");
        expect(a->max_drawdown_pct == b->max_drawdown_pct, "same max drawdown");
        expect(a->var_95 == b->var_95, "same VaR");
        expect(a->profit_factor == b->profit_factor, "same profit factor");
        expect(a->win_rate_pct >= 0.0 && a->win_rate_pct <= 100.0, "win rate bounded");
        expect(a->profit_factor >= 0.0, "profit factor non-negative");
    }
}

static void testStatisticHelpers() {
    expect(near(PortfolioMetricsEngine::percentile({5.0, 1.0, 3.0, 2.0, 4.0}, 5.0), 1.2), "linear percentile");
    expect(near(PortfolioMetricsEngine::percentile({7.0}, 5.0), 7.0), "single value percentile");
    expect(near(PortfolioMetricsEngine::percentile({}, 5.0), 0.0), "empty percentile");

    expect(near(PortfolioMetricsEngine::stddev({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}), 2.0), "population stddev");

    // curve 1.1, 0.55, 0.66 -> worst drop 50% from 1.1
    expect(near(PortfolioMetricsEngine::maxDrawdown({0.1, -0.5, 0.2}), 0.5), "max drawdown of curve");
    expect(near(PortfolioMetricsEngine::maxDrawdown({}), 0.0), "empty curve no drawdown");
}

static void testVarAndUnrealized() {
    PortfolioMetricsEngine engine{risk::RiskConfig()};
    const std::vector<risk::TradeRecord> history = {
        makeTrade(10.0), makeTrade(20.0), makeTrade(30.0), makeTrade(40.0), makeTrade(50.0)
    };
    const auto account = makeAccount(10150.0);

    risk::Position open;
    open.symbol = "ETH";
    open.unrealized_pnl = Money::fromDouble(-25.0);

    const auto m = engine.compute(history, account, {open});
    expect(m.has_value(), "metrics available");
    if (!m) {
        return;
    }
    // returns 0.01..0.05, 5th percentile = 0.012
    expect(near(m->var_95.toDouble(), 121.8, 1e-6), "VaR from 5th percentile");
    expect(m->unrealized_pnl == Money::fromDouble(-25.0), "unrealized summed");
    expect(m->total_value == Money::fromDouble(10125.0), "total value = balance + unrealized");
    expect(m->open_positions == 1, "open position counted");
}

static void testLargeSampleFlag() {
    PortfolioMetricsEngine engine{risk::RiskConfig()};
    std::vector<risk::TradeRecord> history;
    for (int i = 0; i < 30; ++i) {
        history.push_back(makeTrade((i % 3 == 0) ? -5.0 : 8.0));
    }
    const auto m = engine.compute(history, makeAccount(10110.0), {});
    expect(m && !m->small_sample, "30 trades is a stable sample");
}

int main() {
    std::cout << "[TEST] Starting PortfolioMetrics Test..." << std::endl;

    testInsufficientData();
    testWinLossStatistics();
    testProfitFactorWithoutLosses();
    testZeroVarianceSharpe();
    testSharpeMatchesDefinition();
    testIdempotent();
    testStatisticHelpers();
    testVarAndUnrealized();
    testLargeSampleFlag();

    if (g_failures > 0) {
        std::cerr << "[TEST] PortfolioMetrics Test FAILED (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "[TEST] PortfolioMetrics Test PASSED!" << std::endl;
    return 0;
}

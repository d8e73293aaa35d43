#include "analytics/PortfolioMetrics.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace riskbook {
namespace analytics {

namespace {
constexpr double STDDEV_EPSILON = 1e-12;

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}
}

PortfolioMetricsEngine::PortfolioMetricsEngine(const risk::RiskConfig& config)
    : risk_free_rate_(config.risk_free_rate_per_period)
    , min_trades_(config.min_trades_for_metrics)
    , stable_sample_size_(config.stable_sample_size)
{
}

double PortfolioMetricsEngine::stddev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    const double m = mean(values);
    double variance = 0.0;
    for (double v : values) {
        variance += (v - m) * (v - m);
    }
    variance /= static_cast<double>(values.size());
    return std::sqrt(variance);
}

double PortfolioMetricsEngine::percentile(std::vector<double> values, double q) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());

    q = std::clamp(q, 0.0, 100.0);
    const double rank = q / 100.0 * static_cast<double>(values.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(rank));
    const size_t upper = static_cast<size_t>(std::ceil(rank));
    const double weight = rank - static_cast<double>(lower);
    return values[lower] + (values[upper] - values[lower]) * weight;
}

double PortfolioMetricsEngine::maxDrawdown(const std::vector<double>& returns) {
    double cumulative = 1.0;
    double peak = 0.0;
    bool has_peak = false;
    double worst = 0.0;

    for (double r : returns) {
        cumulative *= (1.0 + r);
        if (!has_peak || cumulative > peak) {
            peak = cumulative;
            has_peak = true;
        }
        if (peak <= 0.0) {
            continue;
        }
        const double dd = (peak - cumulative) / peak;
        worst = std::max(worst, dd);
    }
    return worst;
}

std::optional<PortfolioMetrics> PortfolioMetricsEngine::compute(
    const std::vector<risk::TradeRecord>& history,
    const risk::AccountState& account,
    const std::vector<risk::Position>& open_positions
) const {
    if (static_cast<int>(history.size()) < min_trades_) {
        return std::nullopt;
    }

    PortfolioMetrics m;

    // 1. balance / unrealized (display sums saturate instead of wrapping)
    m.total_balance = account.current_balance;
    for (const auto& pos : open_positions) {
        m.unrealized_pnl = m.unrealized_pnl.saturatingAdd(pos.unrealized_pnl);
    }
    m.total_value = m.total_balance.saturatingAdd(m.unrealized_pnl);

    const double initial = account.initial_balance.toDouble();
    m.total_return_pct = (initial > 0.0)
        ? (account.current_balance.toDouble() - initial) / initial * 100.0
        : 0.0;
    m.current_drawdown_pct = account.current_drawdown * 100.0;

    // 2. per-trade return series
    std::vector<double> returns;
    returns.reserve(history.size());
    for (const auto& trade : history) {
        returns.push_back(trade.pnl_percent / 100.0);
    }

    // 3. Sharpe
    const double sd = stddev(returns);
    if (sd > STDDEV_EPSILON) {
        std::vector<double> excess;
        excess.reserve(returns.size());
        for (double r : returns) {
            excess.push_back(r - risk_free_rate_);
        }
        m.sharpe_ratio = mean(excess) / sd;
    }

    // 4. drawdown of the trade curve
    m.max_drawdown_pct = maxDrawdown(returns) * 100.0;

    // 5. win / loss statistics
    double total_wins_pct = 0.0;
    double total_losses_pct = 0.0;
    int loss_count = 0;
    for (const auto& trade : history) {
        if (trade.pnl.isPositive()) {
            m.winning_trades++;
            total_wins_pct += trade.pnl_percent;
        } else if (trade.pnl.isNegative()) {
            loss_count++;
            total_losses_pct += trade.pnl_percent;
        }
    }
    m.total_trades = static_cast<int>(history.size());
    m.losing_trades = loss_count;
    m.win_rate_pct = static_cast<double>(m.winning_trades) / static_cast<double>(m.total_trades) * 100.0;
    m.avg_win_pct = (m.winning_trades > 0) ? total_wins_pct / m.winning_trades : 0.0;
    m.avg_loss_pct = (loss_count > 0) ? total_losses_pct / loss_count : 0.0;

    const double gross_loss = std::abs(total_losses_pct);
    m.profit_factor = (gross_loss > 0.0) ? total_wins_pct / gross_loss : 0.0;

    // 6. historical VaR (5th percentile of returns, scaled by balance)
    m.var_95 = Money::fromDouble(percentile(returns, 5.0) * account.current_balance.toDouble());

    m.open_positions = static_cast<int>(open_positions.size());
    m.consecutive_losses = account.consecutive_losses;
    m.small_sample = m.total_trades < stable_sample_size_;

    if (m.small_sample) {
        LOG_WARN("Portfolio metrics from {} trades (< {}): Sharpe/VaR are unstable",
                 m.total_trades, stable_sample_size_);
    }

    return m;
}

} // namespace analytics
} // namespace riskbook

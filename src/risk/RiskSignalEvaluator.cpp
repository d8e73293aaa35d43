#include "risk/RiskSignalEvaluator.h"

#include <cmath>
#include <cstdio>

namespace riskbook {
namespace risk {

RiskSignalEvaluator::RiskSignalEvaluator(const SignalThresholds& thresholds)
    : thresholds_(thresholds)
{
}

double RiskSignalEvaluator::unrealizedExposure(const std::vector<Position>& open_positions) {
    double exposure = 0.0;
    for (const auto& pos : open_positions) {
        exposure += std::abs(pos.unrealized_pnl.toDouble());
    }
    return exposure;
}

std::vector<std::string> RiskSignalEvaluator::signals(
    const AccountState& account,
    const std::vector<Position>& open_positions
) const {
    std::vector<std::string> out;
    char buffer[96];

    if (account.current_drawdown > thresholds_.high_drawdown) {
        std::snprintf(buffer, sizeof(buffer), "HIGH DRAWDOWN WARNING: %.1f%%",
                      account.current_drawdown * 100.0);
        out.emplace_back(buffer);
    }

    if (account.consecutive_losses >= thresholds_.consecutive_losses) {
        out.emplace_back("CONSECUTIVE LOSSES: " + std::to_string(account.consecutive_losses));
    }

    if (static_cast<int>(open_positions.size()) > thresholds_.max_open_positions) {
        out.emplace_back("HIGH POSITION COUNT: " + std::to_string(open_positions.size()));
    }

    // Open pnl swing vs balance. A flat book never warns.
    const double exposure = unrealizedExposure(open_positions);
    if (exposure > 0.0 &&
        exposure > account.current_balance.toDouble() * thresholds_.concentration) {
        out.emplace_back("HIGH PORTFOLIO CONCENTRATION");
    }

    if (account.current_balance.toDouble() <
        account.initial_balance.toDouble() * thresholds_.capital_loss_floor) {
        out.emplace_back("SIGNIFICANT CAPITAL LOSS");
    }

    return out;
}

} // namespace risk
} // namespace riskbook

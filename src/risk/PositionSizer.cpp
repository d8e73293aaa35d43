#include "risk/PositionSizer.h"

#include <algorithm>
#include <cmath>

namespace riskbook {
namespace risk {

PositionSizer::PositionSizer(double max_position_size_pct)
    : max_position_size_pct_(max_position_size_pct)
{
}

Money PositionSizer::cap(const AccountState& account) const {
    if (!account.current_balance.isPositive()) {
        return Money();
    }
    return Money::fromDouble(account.current_balance.toDouble() * max_position_size_pct_);
}

double PositionSizer::volatilityAdjustment(double volatility) {
    if (!std::isfinite(volatility)) {
        return MIN_ADJUSTMENT;
    }
    return std::max(MIN_ADJUSTMENT, 1.0 - volatility * 2.0);
}

double PositionSizer::drawdownAdjustment(double current_drawdown) {
    if (!(current_drawdown > 0.0)) {
        return 1.0;
    }
    return std::max(MIN_ADJUSTMENT, 1.0 - current_drawdown);
}

double PositionSizer::lossStreakAdjustment(int consecutive_losses) {
    if (consecutive_losses <= 0) {
        return 1.0;
    }
    return std::max(MIN_ADJUSTMENT, 1.0 - consecutive_losses * 0.1);
}

Money PositionSizer::size(
    const AccountState& account,
    std::optional<double> volatility
) const {
    const Money hard_cap = cap(account);
    if (hard_cap.isZero()) {
        return Money();
    }

    double sized = hard_cap.toDouble();

    if (volatility.has_value()) {
        sized *= volatilityAdjustment(*volatility);
    }

    sized *= drawdownAdjustment(account.current_drawdown);
    sized *= lossStreakAdjustment(account.consecutive_losses);

    // Adjustments are multiplicative; re-clamp so rounding or a negative
    // volatility input can never push the size above the hard cap.
    Money result = Money::fromDouble(sized);
    if (result > hard_cap) {
        result = hard_cap;
    }
    if (result.isNegative()) {
        result = Money();
    }
    return result;
}

} // namespace risk
} // namespace riskbook

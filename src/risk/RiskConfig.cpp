#include "risk/RiskConfig.h"
#include "common/Money.h"

#include <cmath>

namespace riskbook {
namespace risk {

namespace {
bool fail(std::string* reason, const char* message) {
    if (reason != nullptr) {
        *reason = message;
    }
    return false;
}

bool finitePositive(double v) {
    return std::isfinite(v) && v > 0.0;
}
}

bool RiskConfig::isValid(std::string* reason) const {
    if (!finitePositive(initial_balance)) {
        return fail(reason, "initial_balance must be > 0");
    }
    if (!Money::fits(initial_balance)) {
        return fail(reason, "initial_balance is outside the representable money range");
    }
    if (!finitePositive(max_position_size_pct) || max_position_size_pct > 1.0) {
        return fail(reason, "max_position_size_pct must be in (0, 1]");
    }
    if (!finitePositive(stop_loss_pct) || stop_loss_pct >= 1.0) {
        return fail(reason, "stop_loss_pct must be in (0, 1)");
    }
    if (!finitePositive(take_profit_pct) || take_profit_pct >= 1.0) {
        return fail(reason, "take_profit_pct must be in (0, 1)");
    }
    if (!finitePositive(max_drawdown_limit)) {
        return fail(reason, "max_drawdown_limit must be > 0");
    }
    if (max_consecutive_losses <= 0) {
        return fail(reason, "max_consecutive_losses must be > 0");
    }
    if (!std::isfinite(risk_free_rate_per_period)) {
        return fail(reason, "risk_free_rate_per_period must be finite");
    }
    if (min_trades_for_metrics < 2) {
        return fail(reason, "min_trades_for_metrics must be >= 2");
    }
    if (stable_sample_size < min_trades_for_metrics) {
        return fail(reason, "stable_sample_size must be >= min_trades_for_metrics");
    }
    if (!std::isfinite(signals.high_drawdown) ||
        !std::isfinite(signals.concentration) ||
        !std::isfinite(signals.capital_loss_floor)) {
        return fail(reason, "signal thresholds must be finite");
    }
    return true;
}

} // namespace risk
} // namespace riskbook

#include "risk/ExitCalculator.h"

namespace riskbook {
namespace risk {

ExitCalculator::ExitCalculator(double stop_loss_pct, double take_profit_pct)
    : stop_loss_pct_(stop_loss_pct)
    , take_profit_pct_(take_profit_pct)
{
}

Price ExitCalculator::stopLoss(Price entry_price, Side side) const {
    if (side == Side::LONG) {
        return entry_price * (1.0 - stop_loss_pct_);
    }
    return entry_price * (1.0 + stop_loss_pct_);
}

Price ExitCalculator::takeProfit(Price entry_price, Side side) const {
    if (side == Side::LONG) {
        return entry_price * (1.0 + take_profit_pct_);
    }
    return entry_price * (1.0 - take_profit_pct_);
}

} // namespace risk
} // namespace riskbook

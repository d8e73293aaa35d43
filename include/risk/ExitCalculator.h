#pragma once

#include "common/Types.h"

namespace riskbook {
namespace risk {

// 손절/익절가 계산
//   Long : SL = entry * (1 - sl),  TP = entry * (1 + tp)
//   Short: SL = entry * (1 + sl),  TP = entry * (1 - tp)
class ExitCalculator {
public:
    ExitCalculator(double stop_loss_pct, double take_profit_pct);

    Price stopLoss(Price entry_price, Side side) const;
    Price takeProfit(Price entry_price, Side side) const;

private:
    double stop_loss_pct_;
    double take_profit_pct_;
};

} // namespace risk
} // namespace riskbook

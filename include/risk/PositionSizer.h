#pragma once

#include "common/Money.h"
#include "risk/AccountState.h"
#include "risk/RiskConfig.h"
#include <optional>

namespace riskbook {
namespace risk {

// 포지션 사이징 (계좌 통화 기준 금액)
//
// base = balance * max_position_size_pct
//   * max(0.5, 1 - volatility * 2)          변동성 입력 시
//   * max(0.5, 1 - current_drawdown)        드로다운 중
//   * max(0.5, 1 - consecutive_losses * 0.1) 연속 손실 중
// 결과는 다시 base 상한으로 clamp. 진입가와 무관하고 부작용 없음.
class PositionSizer {
public:
    static constexpr double MIN_ADJUSTMENT = 0.5;

    explicit PositionSizer(double max_position_size_pct);

    Money size(const AccountState& account,
               std::optional<double> volatility = std::nullopt) const;

    // balance * max_position_size_pct (음수 잔고면 0)
    Money cap(const AccountState& account) const;

    static double volatilityAdjustment(double volatility);
    static double drawdownAdjustment(double current_drawdown);
    static double lossStreakAdjustment(int consecutive_losses);

private:
    double max_position_size_pct_;
};

} // namespace risk
} // namespace riskbook

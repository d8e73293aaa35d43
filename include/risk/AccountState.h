#pragma once

#include "common/Money.h"
#include <optional>

namespace riskbook {
namespace risk {

// 계좌 상태. 엔진 생성 시 1회 만들어지고 청산(applyClose)으로만 바뀐다.
struct AccountState {
    Money initial_balance;
    Money current_balance;
    Money peak_balance;          // High Water Mark
    double current_drawdown = 0.0;   // (peak - current) / peak, 항상 >= 0
    int consecutive_losses = 0;

    static AccountState create(Money initial_balance);
};

// (peak - current) / peak. peak <= 0 이거나 current >= peak 이면 0
double computeDrawdown(Money peak_balance, Money current_balance);

// 청산 1건의 계좌 전이. 잔고 += pnl, 연속 손실 갱신, HWM 갱신, 드로다운 재계산
// 잔고가 Money 범위를 넘으면 nullopt (상태 변경 없음)
std::optional<AccountState> applyClose(const AccountState& state, Money pnl);

// 외부 스냅샷 복원용: peak 를 current 이상으로 맞추고 드로다운 재계산
AccountState normalize(const AccountState& state);

} // namespace risk
} // namespace riskbook

#pragma once

#include <string>

namespace riskbook {
namespace risk {

// 경고 신호 임계값
struct SignalThresholds {
    double high_drawdown = 0.15;            // 드로다운 경고 (초과)
    int consecutive_losses = 3;             // 연속 손실 경고 (이상)
    int max_open_positions = 10;            // 포지션 개수 경고 (초과)
    double concentration = 0.5;             // 노출/잔고 비율 경고 (초과)
    double capital_loss_floor = 0.8;        // 원금 대비 잔고 하한 (미만)
};

// 리스크 설정
struct RiskConfig {
    double initial_balance = 10000.0;

    // 사이징 / 청산가
    double max_position_size_pct = 0.95;    // 잔고 대비 포지션 상한 (hard cap)
    double stop_loss_pct = 0.05;            // 5% 손절
    double take_profit_pct = 0.10;          // 10% 익절

    // 진입 차단
    double max_drawdown_limit = 0.20;       // 20% 이상이면 신규 진입 거부
    int max_consecutive_losses = 5;

    // 성과 지표
    double risk_free_rate_per_period = 0.02 / 252.0;  // 연 2% 를 거래 1건 기간으로 환산
    int min_trades_for_metrics = 2;
    int stable_sample_size = 30;            // 이보다 적으면 Sharpe/VaR 불안정

    SignalThresholds signals;

    // 문제 없으면 true. 아니면 reason 에 첫 번째 오류를 기록
    bool isValid(std::string* reason = nullptr) const;
};

} // namespace risk
} // namespace riskbook

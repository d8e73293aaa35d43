#pragma once

#include "common/Money.h"
#include "risk/AccountState.h"
#include "risk/RiskConfig.h"
#include "risk/RiskTypes.h"
#include <optional>
#include <vector>

namespace riskbook {
namespace analytics {

struct PortfolioMetrics {
    Money total_balance;
    Money unrealized_pnl;       // 오픈 포지션 미실현 손익 합
    Money total_value;          // balance + unrealized
    double total_return_pct;

    double sharpe_ratio;
    double max_drawdown_pct;    // 거래 누적 수익 곡선 기준, 양수
    double current_drawdown_pct;

    double win_rate_pct;        // [0, 100]
    double avg_win_pct;
    double avg_loss_pct;
    double profit_factor;       // >= 0, 손실 합 0 이면 0

    Money var_95;               // 1-period historical VaR (보통 음수)

    int total_trades;
    int winning_trades;
    int losing_trades;
    int open_positions;
    int consecutive_losses;

    // 표본이 stable_sample_size 미만이면 Sharpe/VaR 신뢰도 낮음
    bool small_sample;

    PortfolioMetrics()
        : total_return_pct(0)
        , sharpe_ratio(0), max_drawdown_pct(0), current_drawdown_pct(0)
        , win_rate_pct(0), avg_win_pct(0), avg_loss_pct(0), profit_factor(0)
        , total_trades(0), winning_trades(0), losing_trades(0)
        , open_positions(0), consecutive_losses(0)
        , small_sample(true)
    {}
};

// Portfolio Metrics Engine
// 거래 이력 + 계좌 상태 + 오픈 포지션의 순수 함수. 같은 입력이면 같은 결과.
class PortfolioMetricsEngine {
public:
    explicit PortfolioMetricsEngine(const risk::RiskConfig& config);

    // 거래가 min_trades_for_metrics 미만이면 nullopt (InsufficientData)
    std::optional<PortfolioMetrics> compute(
        const std::vector<risk::TradeRecord>& history,
        const risk::AccountState& account,
        const std::vector<risk::Position>& open_positions
    ) const;

    // ===== 통계 헬퍼 =====

    // 모집단 표준편차
    static double stddev(const std::vector<double>& values);
    // 선형 보간 백분위 (q: 0~100). 빈 벡터면 0
    static double percentile(std::vector<double> values, double q);
    // 누적곱 (1 + r) 곡선의 최대 낙폭 (0~1 이상)
    static double maxDrawdown(const std::vector<double>& returns);

private:
    double risk_free_rate_;
    int min_trades_;
    int stable_sample_size_;
};

} // namespace analytics
} // namespace riskbook

#pragma once

#include "analytics/PortfolioMetrics.h"
#include "core/contracts/IEventJournal.h"
#include "core/model/StateTypes.h"
#include "engine/PerformanceStore.h"
#include "risk/AccountState.h"
#include "risk/MarkToMarketMonitor.h"
#include "risk/PositionLedger.h"
#include "risk/RiskConfig.h"
#include "risk/RiskSignalEvaluator.h"
#include "risk/SettlementEngine.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace riskbook {
namespace engine {

// Risk Engine - 외부 진입점
//
// 계좌 상태 / 원장 / 거래 이력을 소유하고 모든 변경을 하나의 mutex 로 직렬화한다.
// metrics / riskSignals 는 락 안에서 복사만 하고 계산은 락 밖에서 한다.
// 저널 기록은 락을 놓은 뒤에 한다.
class RiskEngine {
public:
    // 잘못된 설정이면 std::invalid_argument
    explicit RiskEngine(const risk::RiskConfig& config);

    RiskEngine(const RiskEngine&) = delete;
    RiskEngine& operator=(const RiskEngine&) = delete;

    // ===== 포지션 =====

    risk::OpenPositionResult openPosition(
        const std::string& strategy_name,
        const std::string& symbol,
        Side side,
        Price entry_price,
        std::optional<double> volatility = std::nullopt
    );

    // 발동된 손절/익절은 같은 호출 안에서 청산
    std::vector<risk::TradeRecord> markToMarket(const std::map<std::string, Price>& price_by_symbol);

    // 마지막으로 반영된 현재가로 MANUAL 청산
    std::optional<risk::TradeRecord> closeManually(PositionId position_id);

    std::optional<risk::TradeRecord> closePosition(
        PositionId position_id,
        Price exit_price,
        ExitReason reason
    );

    // ===== 조회 =====

    std::optional<analytics::PortfolioMetrics> metrics() const;
    std::vector<std::string> riskSignals() const;

    std::optional<risk::Position> getPosition(PositionId position_id) const;
    std::vector<risk::Position> getOpenPositions() const;
    std::vector<risk::TradeRecord> getTradeHistory() const;
    risk::AccountState getAccountState() const;
    std::unordered_map<std::string, StrategyPerformanceStats> strategyPerformance() const;
    // (전략, 심볼, 방향)별 집계
    PerformanceBucketMap bucketPerformance() const;

    const risk::RiskConfig& config() const { return config_; }

    // ===== 영속화 =====

    core::RiskStateSnapshot snapshot() const;
    void restore(const core::RiskStateSnapshot& snapshot);

    void setEventJournal(std::shared_ptr<core::IEventJournal> journal);

private:
    static const risk::RiskConfig& validated(const risk::RiskConfig& config);

    core::JournalEvent makeOpenedEvent(const risk::Position& pos) const;
    core::JournalEvent makeClosedEvent(const risk::TradeRecord& trade) const;
    core::JournalEvent makeRejectedEvent(
        const std::string& strategy_name,
        const std::string& symbol,
        Side side,
        Price entry_price,
        const risk::OpenPositionResult& result
    ) const;
    void appendJournal(const std::shared_ptr<core::IEventJournal>& journal,
                       const std::vector<core::JournalEvent>& events) const;

    mutable std::mutex mutex_;

    risk::RiskConfig config_;
    risk::AccountState account_;
    risk::PositionLedger ledger_;
    std::vector<risk::TradeRecord> history_;

    risk::SettlementEngine settlement_;
    risk::MarkToMarketMonitor monitor_;
    risk::RiskSignalEvaluator signal_evaluator_;
    analytics::PortfolioMetricsEngine metrics_engine_;

    std::shared_ptr<core::IEventJournal> journal_;
};

} // namespace engine
} // namespace riskbook

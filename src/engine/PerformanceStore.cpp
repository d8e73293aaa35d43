#include "engine/PerformanceStore.h"

namespace riskbook {
namespace engine {
namespace {
void accumulateStats(StrategyPerformanceStats& s, const risk::TradeRecord& trade) {
    s.trades++;
    s.net_profit = s.net_profit.saturatingAdd(trade.pnl);
    if (trade.pnl.isPositive()) {
        s.wins++;
        s.gross_profit = s.gross_profit.saturatingAdd(trade.pnl);
    } else if (trade.pnl.isNegative()) {
        s.gross_loss_abs = s.gross_loss_abs.saturatingAdd(trade.pnl.abs());
    }
}
}

void PerformanceStore::rebuild(const std::vector<risk::TradeRecord>& history) {
    by_strategy_.clear();
    by_bucket_.clear();

    for (const auto& trade : history) {
        const std::string strategy_name = trade.strategy_name.empty() ? "unknown" : trade.strategy_name;
        accumulateStats(by_strategy_[strategy_name], trade);

        PerformanceBucketKey key;
        key.strategy_name = strategy_name;
        key.symbol = trade.symbol;
        key.side = trade.side;
        accumulateStats(by_bucket_[key], trade);
    }
}

} // namespace engine
} // namespace riskbook

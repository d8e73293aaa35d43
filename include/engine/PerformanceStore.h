#pragma once

#include "risk/RiskTypes.h"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace riskbook {
namespace engine {

struct StrategyPerformanceStats {
    int trades = 0;
    int wins = 0;
    Money gross_profit;
    Money gross_loss_abs;
    Money net_profit;

    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
    // 거래당 평균 손익
    double expectancy() const {
        return (trades > 0) ? (net_profit.toDouble() / static_cast<double>(trades)) : 0.0;
    }
    double profitFactor() const {
        return gross_loss_abs.isPositive() ? (gross_profit.toDouble() / gross_loss_abs.toDouble()) : 0.0;
    }
};

struct PerformanceBucketKey {
    std::string strategy_name;
    std::string symbol;
    Side side = Side::LONG;

    bool operator==(const PerformanceBucketKey& other) const {
        return strategy_name == other.strategy_name &&
               symbol == other.symbol &&
               side == other.side;
    }
};

struct PerformanceBucketKeyHash {
    std::size_t operator()(const PerformanceBucketKey& key) const {
        std::size_t h1 = std::hash<std::string>{}(key.strategy_name);
        std::size_t h2 = std::hash<std::string>{}(key.symbol);
        std::size_t h3 = std::hash<int>{}(static_cast<int>(key.side));
        return h1 ^ (h2 << 1) ^ (h3 << 2);
    }
};

using PerformanceBucketMap =
    std::unordered_map<PerformanceBucketKey, StrategyPerformanceStats, PerformanceBucketKeyHash>;

// 청산된 거래를 전략별 / (전략, 심볼, 방향)별로 집계. 전략명이 비어 있으면 "unknown"
class PerformanceStore {
public:
    void rebuild(const std::vector<risk::TradeRecord>& history);
    const std::unordered_map<std::string, StrategyPerformanceStats>& byStrategy() const {
        return by_strategy_;
    }
    const PerformanceBucketMap& byBucket() const {
        return by_bucket_;
    }

private:
    std::unordered_map<std::string, StrategyPerformanceStats> by_strategy_;
    PerformanceBucketMap by_bucket_;
};

} // namespace engine
} // namespace riskbook

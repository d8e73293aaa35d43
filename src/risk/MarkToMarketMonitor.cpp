#include "risk/MarkToMarketMonitor.h"
#include "common/Logger.h"
#include <cmath>
#include <utility>

namespace riskbook {
namespace risk {

MarkToMarketMonitor::MarkToMarketMonitor(PositionLedger& ledger, SettlementEngine& settlement)
    : ledger_(ledger)
    , settlement_(settlement)
{
}

std::optional<ExitReason> MarkToMarketMonitor::evaluateTrigger(const Position& pos, Price current_price) {
    if (pos.side == Side::LONG) {
        // 1. stop first
        if (current_price <= pos.stop_loss) {
            return ExitReason::STOP_LOSS;
        }
        // 2. then target
        if (current_price >= pos.take_profit) {
            return ExitReason::TAKE_PROFIT;
        }
        return std::nullopt;
    }

    if (current_price >= pos.stop_loss) {
        return ExitReason::STOP_LOSS;
    }
    if (current_price <= pos.take_profit) {
        return ExitReason::TAKE_PROFIT;
    }
    return std::nullopt;
}

std::vector<TradeRecord> MarkToMarketMonitor::update(const std::map<std::string, Price>& price_by_symbol) {
    std::vector<TradeRecord> closed;

    // Collect triggers first so settlement never mutates the map being walked.
    std::vector<std::pair<PositionId, ExitReason>> triggered;

    for (const auto& pos : ledger_.listOpen()) {
        auto price_it = price_by_symbol.find(pos.symbol);
        if (price_it == price_by_symbol.end()) {
            continue;
        }

        const Price price = price_it->second;
        if (!std::isfinite(price) || price <= 0.0) {
            LOG_WARN("{} tick ignored: invalid price {}", pos.symbol, price);
            continue;
        }

        Position* marked = ledger_.markPrice(pos.id, price);
        if (marked == nullptr) {
            continue;
        }

        auto reason = evaluateTrigger(*marked, price);
        if (!reason) {
            continue;
        }

        if (*reason == ExitReason::STOP_LOSS) {
            LOG_WARN("#{} {} stop-loss hit: {:.2f} vs {:.2f}", marked->id, marked->symbol, price, marked->stop_loss);
        } else {
            LOG_INFO("#{} {} take-profit hit: {:.2f} vs {:.2f}", marked->id, marked->symbol, price, marked->take_profit);
        }
        triggered.emplace_back(marked->id, *reason);
    }

    for (const auto& [id, reason] : triggered) {
        auto pos = ledger_.get(id);
        if (!pos) {
            continue;
        }
        auto trade = settlement_.close(id, pos->current_price, reason);
        if (trade) {
            closed.push_back(std::move(*trade));
        }
    }

    return closed;
}

} // namespace risk
} // namespace riskbook

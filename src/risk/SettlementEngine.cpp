#include "risk/SettlementEngine.h"
#include "common/Logger.h"
#include <cmath>

namespace riskbook {
namespace risk {

SettlementEngine::SettlementEngine(
    PositionLedger& ledger,
    AccountState& account,
    std::vector<TradeRecord>& history
)
    : ledger_(ledger)
    , account_(account)
    , history_(history)
{
}

std::optional<Money> SettlementEngine::computePnl(const Position& pos, Price exit_price) {
    const double diff = (pos.side == Side::LONG)
        ? (exit_price - pos.entry_price)
        : (pos.entry_price - exit_price);
    const double pnl = diff * pos.quantity;
    if (!Money::fits(pnl)) {
        return std::nullopt;
    }
    return Money::fromDouble(pnl);
}

double SettlementEngine::computePnlPercent(const Position& pos, Money pnl) {
    const double notional = pos.entry_price * pos.quantity;
    if (!(notional > 0.0)) {
        return 0.0;
    }
    return pnl.toDouble() / notional * 100.0;
}

std::optional<TradeRecord> SettlementEngine::close(
    PositionId id,
    Price exit_price,
    ExitReason reason
) {
    if (!std::isfinite(exit_price) || exit_price <= 0.0) {
        LOG_ERROR("Close refused for #{}: invalid exit price {}", id, exit_price);
        return std::nullopt;
    }

    auto current = ledger_.get(id);
    if (!current) {
        LOG_WARN("Close failed: position #{} not found or already closed", id);
        return std::nullopt;
    }

    // Validate everything before the position leaves the ledger.
    auto pnl = computePnl(*current, exit_price);
    if (!pnl) {
        LOG_ERROR("Close refused for #{}: pnl at exit price {} is outside the money range", id, exit_price);
        return std::nullopt;
    }
    auto next_account = applyClose(account_, *pnl);
    if (!next_account) {
        LOG_ERROR("Close refused for #{}: balance {} + pnl {} overflows",
                  id, account_.current_balance.toString(), pnl->toString());
        return std::nullopt;
    }

    auto closed = ledger_.take(id);
    if (!closed) {
        LOG_WARN("Close failed: position #{} not found or already closed", id);
        return std::nullopt;
    }

    const Position& pos = *closed;

    TradeRecord trade;
    trade.position_id = pos.id;
    trade.strategy_name = pos.strategy_name;
    trade.symbol = pos.symbol;
    trade.side = pos.side;
    trade.entry_price = pos.entry_price;
    trade.exit_price = exit_price;
    trade.quantity = pos.quantity;
    trade.position_value = pos.position_value;
    trade.stop_loss = pos.stop_loss;
    trade.take_profit = pos.take_profit;
    trade.entry_time = pos.entry_time;
    trade.exit_time = currentTimeMs();
    trade.pnl = *pnl;
    trade.pnl_percent = computePnlPercent(pos, trade.pnl);
    trade.exit_reason = reason;

    // Exactly one account transition per close.
    account_ = *next_account;
    history_.push_back(trade);

    LOG_INFO("Position closed: #{} {} {} | pnl {} ({:+.2f}%) | reason={} | balance {}",
             trade.position_id, trade.symbol, toString(trade.side),
             trade.pnl.toString(), trade.pnl_percent, toString(reason),
             account_.current_balance.toString());
    Logger::getInstance().logTrade(trade.symbol, toString(trade.side),
                                   trade.entry_price, trade.exit_price, trade.quantity,
                                   trade.pnl.toString(), toString(reason));

    return trade;
}

} // namespace risk
} // namespace riskbook

#include "risk/PositionLedger.h"
#include "common/Logger.h"
#include <cmath>

namespace riskbook {
namespace risk {

PositionLedger::PositionLedger(const RiskConfig& config)
    : max_drawdown_limit_(config.max_drawdown_limit)
    , max_consecutive_losses_(config.max_consecutive_losses)
    , sizer_(config.max_position_size_pct)
    , exits_(config.stop_loss_pct, config.take_profit_pct)
{
}

// ===== Position Entry =====

RejectReason PositionLedger::checkEntryLimits(const AccountState& account) const {
    if (account.current_drawdown >= max_drawdown_limit_) {
        return RejectReason::DRAWDOWN_LIMIT;
    }
    if (account.consecutive_losses >= max_consecutive_losses_) {
        return RejectReason::CONSECUTIVE_LOSSES;
    }
    return RejectReason::NONE;
}

OpenPositionResult PositionLedger::open(
    const AccountState& account,
    const std::string& strategy_name,
    const std::string& symbol,
    Side side,
    Price entry_price,
    std::optional<double> volatility
) {
    // 1) request sanity
    if (symbol.empty()) {
        return OpenPositionResult::rejected(RejectReason::INVALID_REQUEST, "symbol is empty");
    }
    if (!std::isfinite(entry_price) || entry_price <= 0.0) {
        return OpenPositionResult::rejected(RejectReason::INVALID_REQUEST, "entry price must be a positive number");
    }
    if (volatility.has_value() && !std::isfinite(*volatility)) {
        return OpenPositionResult::rejected(RejectReason::INVALID_REQUEST, "volatility must be finite");
    }

    // 2) drawdown / loss streak guard
    const RejectReason limit = checkEntryLimits(account);
    if (limit == RejectReason::DRAWDOWN_LIMIT) {
        LOG_ERROR("Drawdown limit exceeded, entry blocked: {} {} (dd {:.2f}% >= {:.2f}%)",
                  symbol, toString(side), account.current_drawdown * 100.0, max_drawdown_limit_ * 100.0);
        return OpenPositionResult::rejected(limit, "Maximum drawdown limit exceeded");
    }
    if (limit == RejectReason::CONSECUTIVE_LOSSES) {
        LOG_ERROR("Consecutive loss limit reached, entry blocked: {} {} ({} >= {})",
                  symbol, toString(side), account.consecutive_losses, max_consecutive_losses_);
        return OpenPositionResult::rejected(limit, "Too many consecutive losses");
    }

    // 3) sizing
    const Money value = sizer_.size(account, volatility);
    const Quantity quantity = value.toDouble() / entry_price;
    if (!value.isPositive() || !(quantity > 0.0)) {
        LOG_WARN("{} entry blocked: sized value {} leaves no quantity (balance {})",
                 symbol, value.toString(), account.current_balance.toString());
        return OpenPositionResult::rejected(RejectReason::INSUFFICIENT_BALANCE, "No balance available for sizing");
    }

    Position pos;
    pos.id = next_id_++;
    pos.strategy_name = strategy_name;
    pos.symbol = symbol;
    pos.side = side;
    pos.entry_price = entry_price;
    pos.current_price = entry_price;
    pos.quantity = quantity;
    pos.position_value = value;
    pos.stop_loss = exits_.stopLoss(entry_price, side);
    pos.take_profit = exits_.takeProfit(entry_price, side);
    pos.entry_time = currentTimeMs();
    pos.status = PositionStatus::OPEN;
    pos.unrealized_pnl = Money();
    pos.has_volatility = volatility.has_value();
    pos.volatility = volatility.value_or(0.0);

    positions_[pos.id] = pos;

    LOG_INFO("Position opened: #{} {} {} | strategy={} | qty={:.8f} | notional={}",
             pos.id, pos.symbol, toString(side), strategy_name, quantity, value.toString());
    LOG_INFO("   risk plan: SL={:.2f}, TP={:.2f}", pos.stop_loss, pos.take_profit);

    return OpenPositionResult::ok(pos);
}

// ===== Lookup =====

std::optional<Position> PositionLedger::get(PositionId id) const {
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Position> PositionLedger::listOpen() const {
    std::vector<Position> result;
    result.reserve(positions_.size());
    for (const auto& [id, pos] : positions_) {
        result.push_back(pos);
    }
    return result;
}

// ===== Mutation =====

Money PositionLedger::unrealizedPnl(const Position& pos, Price current_price) {
    const double diff = (pos.side == Side::LONG)
        ? (current_price - pos.entry_price)
        : (pos.entry_price - current_price);
    return Money::fromDouble(diff * pos.quantity);
}

Position* PositionLedger::markPrice(PositionId id, Price current_price) {
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return nullptr;
    }

    auto& pos = it->second;
    pos.current_price = current_price;
    pos.unrealized_pnl = unrealizedPnl(pos, current_price);
    return &pos;
}

std::optional<Position> PositionLedger::take(PositionId id) {
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return std::nullopt;
    }

    Position pos = it->second;
    pos.status = PositionStatus::CLOSED;
    positions_.erase(it);
    return pos;
}

void PositionLedger::restore(const std::vector<Position>& positions, PositionId next_id) {
    positions_.clear();
    PositionId max_id = 0;
    for (const auto& pos : positions) {
        if (pos.status != PositionStatus::OPEN) {
            continue;
        }
        positions_[pos.id] = pos;
        if (pos.id > max_id) {
            max_id = pos.id;
        }
    }
    next_id_ = (next_id > max_id) ? next_id : max_id + 1;
}

} // namespace risk
} // namespace riskbook

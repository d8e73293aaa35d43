#include "core/state/RiskStateJson.h"

#include <string>

namespace riskbook {
namespace core {

nlohmann::json moneyToJson(Money value) {
    return value.toString();
}

Money moneyFromJson(const nlohmann::json& parent, const char* key) {
    if (!parent.contains(key)) {
        return Money();
    }
    const auto& v = parent.at(key);
    if (v.is_string()) {
        auto parsed = Money::parse(v.get<std::string>());
        return parsed.value_or(Money());
    }
    if (v.is_number()) {
        return Money::fromDouble(v.get<double>());
    }
    return Money();
}

nlohmann::json toJson(const risk::AccountState& account) {
    nlohmann::json raw;
    raw["initial_balance"] = moneyToJson(account.initial_balance);
    raw["current_balance"] = moneyToJson(account.current_balance);
    raw["peak_balance"] = moneyToJson(account.peak_balance);
    raw["current_drawdown"] = account.current_drawdown;
    raw["consecutive_losses"] = account.consecutive_losses;
    return raw;
}

nlohmann::json toJson(const risk::Position& pos) {
    nlohmann::json raw;
    raw["id"] = pos.id;
    raw["strategy_name"] = pos.strategy_name;
    raw["symbol"] = pos.symbol;
    raw["side"] = toString(pos.side);
    raw["entry_price"] = pos.entry_price;
    raw["current_price"] = pos.current_price;
    raw["quantity"] = pos.quantity;
    raw["position_value"] = moneyToJson(pos.position_value);
    raw["stop_loss"] = pos.stop_loss;
    raw["take_profit"] = pos.take_profit;
    raw["entry_time"] = pos.entry_time;
    raw["status"] = toString(pos.status);
    raw["unrealized_pnl"] = moneyToJson(pos.unrealized_pnl);
    if (pos.has_volatility) {
        raw["volatility"] = pos.volatility;
    }
    return raw;
}

nlohmann::json toJson(const risk::TradeRecord& trade) {
    nlohmann::json raw;
    raw["position_id"] = trade.position_id;
    raw["strategy_name"] = trade.strategy_name;
    raw["symbol"] = trade.symbol;
    raw["side"] = toString(trade.side);
    raw["entry_price"] = trade.entry_price;
    raw["exit_price"] = trade.exit_price;
    raw["quantity"] = trade.quantity;
    raw["position_value"] = moneyToJson(trade.position_value);
    raw["stop_loss"] = trade.stop_loss;
    raw["take_profit"] = trade.take_profit;
    raw["entry_time"] = trade.entry_time;
    raw["exit_time"] = trade.exit_time;
    raw["pnl"] = moneyToJson(trade.pnl);
    raw["pnl_percent"] = trade.pnl_percent;
    raw["exit_reason"] = toString(trade.exit_reason);
    return raw;
}

nlohmann::json toJson(const analytics::PortfolioMetrics& m) {
    nlohmann::json raw;
    raw["total_balance"] = moneyToJson(m.total_balance);
    raw["unrealized_pnl"] = moneyToJson(m.unrealized_pnl);
    raw["total_value"] = moneyToJson(m.total_value);
    raw["total_return_pct"] = m.total_return_pct;
    raw["sharpe_ratio"] = m.sharpe_ratio;
    raw["max_drawdown_pct"] = m.max_drawdown_pct;
    raw["current_drawdown_pct"] = m.current_drawdown_pct;
    raw["win_rate_pct"] = m.win_rate_pct;
    raw["avg_win_pct"] = m.avg_win_pct;
    raw["avg_loss_pct"] = m.avg_loss_pct;
    raw["profit_factor"] = m.profit_factor;
    raw["var_95"] = moneyToJson(m.var_95);
    raw["total_trades"] = m.total_trades;
    raw["winning_trades"] = m.winning_trades;
    raw["losing_trades"] = m.losing_trades;
    raw["open_positions"] = m.open_positions;
    raw["consecutive_losses"] = m.consecutive_losses;
    raw["small_sample"] = m.small_sample;
    return raw;
}

risk::AccountState accountFromJson(const nlohmann::json& raw) {
    risk::AccountState account;
    account.initial_balance = moneyFromJson(raw, "initial_balance");
    account.current_balance = moneyFromJson(raw, "current_balance");
    account.peak_balance = moneyFromJson(raw, "peak_balance");
    account.consecutive_losses = raw.value("consecutive_losses", 0);
    // drawdown is derived, never trusted from disk
    return risk::normalize(account);
}

risk::Position positionFromJson(const nlohmann::json& raw) {
    risk::Position pos;
    pos.id = raw.value("id", static_cast<PositionId>(0));
    pos.strategy_name = raw.value("strategy_name", std::string());
    pos.symbol = raw.value("symbol", std::string());
    parseSide(raw.value("side", std::string("long")), pos.side);
    pos.entry_price = raw.value("entry_price", 0.0);
    pos.current_price = raw.value("current_price", pos.entry_price);
    pos.quantity = raw.value("quantity", 0.0);
    pos.position_value = moneyFromJson(raw, "position_value");
    pos.stop_loss = raw.value("stop_loss", 0.0);
    pos.take_profit = raw.value("take_profit", 0.0);
    pos.entry_time = raw.value("entry_time", 0LL);
    pos.status = (raw.value("status", std::string("open")) == "closed")
        ? PositionStatus::CLOSED
        : PositionStatus::OPEN;
    pos.unrealized_pnl = moneyFromJson(raw, "unrealized_pnl");
    pos.has_volatility = raw.contains("volatility");
    pos.volatility = raw.value("volatility", 0.0);
    return pos;
}

risk::TradeRecord tradeFromJson(const nlohmann::json& raw) {
    risk::TradeRecord trade;
    trade.position_id = raw.value("position_id", static_cast<PositionId>(0));
    trade.strategy_name = raw.value("strategy_name", std::string());
    trade.symbol = raw.value("symbol", std::string());
    parseSide(raw.value("side", std::string("long")), trade.side);
    trade.entry_price = raw.value("entry_price", 0.0);
    trade.exit_price = raw.value("exit_price", 0.0);
    trade.quantity = raw.value("quantity", 0.0);
    trade.position_value = moneyFromJson(raw, "position_value");
    trade.stop_loss = raw.value("stop_loss", 0.0);
    trade.take_profit = raw.value("take_profit", 0.0);
    trade.entry_time = raw.value("entry_time", 0LL);
    trade.exit_time = raw.value("exit_time", 0LL);
    trade.pnl = moneyFromJson(raw, "pnl");
    trade.pnl_percent = raw.value("pnl_percent", 0.0);
    trade.exit_reason = parseExitReason(raw.value("exit_reason", std::string("manual")));
    return trade;
}

} // namespace core
} // namespace riskbook

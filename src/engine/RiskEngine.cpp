#include "engine/RiskEngine.h"
#include "common/Logger.h"
#include "core/state/RiskStateJson.h"
#include <cmath>
#include <stdexcept>

namespace riskbook {
namespace engine {

const risk::RiskConfig& RiskEngine::validated(const risk::RiskConfig& config) {
    std::string reason;
    if (!config.isValid(&reason)) {
        throw std::invalid_argument("Invalid risk config: " + reason);
    }
    return config;
}

RiskEngine::RiskEngine(const risk::RiskConfig& config)
    : config_(validated(config))
    , account_(risk::AccountState::create(Money::fromDouble(config_.initial_balance)))
    , ledger_(config_)
    , settlement_(ledger_, account_, history_)
    , monitor_(ledger_, settlement_)
    , signal_evaluator_(config_.signals)
    , metrics_engine_(config_)
{
    LOG_INFO("RiskEngine initialized: balance {}, max position {:.0f}%, SL {:.1f}%, TP {:.1f}%",
             account_.current_balance.toString(),
             config_.max_position_size_pct * 100.0,
             config_.stop_loss_pct * 100.0,
             config_.take_profit_pct * 100.0);
}

// ===== Positions =====

risk::OpenPositionResult RiskEngine::openPosition(
    const std::string& strategy_name,
    const std::string& symbol,
    Side side,
    Price entry_price,
    std::optional<double> volatility
) {
    risk::OpenPositionResult result;
    std::vector<core::JournalEvent> events;
    std::shared_ptr<core::IEventJournal> journal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = ledger_.open(account_, strategy_name, symbol, side, entry_price, volatility);
        journal = journal_;
        if (journal) {
            events.push_back(result.accepted
                ? makeOpenedEvent(result.position)
                : makeRejectedEvent(strategy_name, symbol, side, entry_price, result));
        }
    }
    appendJournal(journal, events);
    return result;
}

std::vector<risk::TradeRecord> RiskEngine::markToMarket(const std::map<std::string, Price>& price_by_symbol) {
    std::vector<risk::TradeRecord> closed;
    std::vector<core::JournalEvent> events;
    std::shared_ptr<core::IEventJournal> journal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed = monitor_.update(price_by_symbol);
        journal = journal_;
        if (journal) {
            for (const auto& trade : closed) {
                events.push_back(makeClosedEvent(trade));
            }
        }
    }
    appendJournal(journal, events);
    return closed;
}

std::optional<risk::TradeRecord> RiskEngine::closeManually(PositionId position_id) {
    std::optional<risk::TradeRecord> trade;
    std::vector<core::JournalEvent> events;
    std::shared_ptr<core::IEventJournal> journal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto pos = ledger_.get(position_id);
        if (!pos) {
            LOG_WARN("Manual close ignored: position #{} not found", position_id);
            return std::nullopt;
        }
        trade = settlement_.close(position_id, pos->current_price, ExitReason::MANUAL);
        journal = journal_;
        if (journal && trade) {
            events.push_back(makeClosedEvent(*trade));
        }
    }
    appendJournal(journal, events);
    return trade;
}

std::optional<risk::TradeRecord> RiskEngine::closePosition(
    PositionId position_id,
    Price exit_price,
    ExitReason reason
) {
    std::optional<risk::TradeRecord> trade;
    std::vector<core::JournalEvent> events;
    std::shared_ptr<core::IEventJournal> journal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        trade = settlement_.close(position_id, exit_price, reason);
        journal = journal_;
        if (journal && trade) {
            events.push_back(makeClosedEvent(*trade));
        }
    }
    appendJournal(journal, events);
    return trade;
}

// ===== Queries =====

std::optional<analytics::PortfolioMetrics> RiskEngine::metrics() const {
    std::vector<risk::TradeRecord> history;
    risk::AccountState account;
    std::vector<risk::Position> open_positions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history = history_;
        account = account_;
        open_positions = ledger_.listOpen();
    }
    return metrics_engine_.compute(history, account, open_positions);
}

std::vector<std::string> RiskEngine::riskSignals() const {
    risk::AccountState account;
    std::vector<risk::Position> open_positions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        account = account_;
        open_positions = ledger_.listOpen();
    }
    return signal_evaluator_.signals(account, open_positions);
}

std::optional<risk::Position> RiskEngine::getPosition(PositionId position_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.get(position_id);
}

std::vector<risk::Position> RiskEngine::getOpenPositions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.listOpen();
}

std::vector<risk::TradeRecord> RiskEngine::getTradeHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

risk::AccountState RiskEngine::getAccountState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return account_;
}

std::unordered_map<std::string, StrategyPerformanceStats> RiskEngine::strategyPerformance() const {
    std::vector<risk::TradeRecord> history;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history = history_;
    }
    PerformanceStore store;
    store.rebuild(history);
    return store.byStrategy();
}

PerformanceBucketMap RiskEngine::bucketPerformance() const {
    std::vector<risk::TradeRecord> history;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history = history_;
    }
    PerformanceStore store;
    store.rebuild(history);
    return store.byBucket();
}

// ===== Persistence =====

core::RiskStateSnapshot RiskEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    core::RiskStateSnapshot snap;
    snap.saved_at_ms = currentTimeMs();
    snap.account = account_;
    snap.positions = ledger_.listOpen();
    snap.trade_history = history_;
    snap.next_position_id = ledger_.nextId();
    return snap;
}

void RiskEngine::restore(const core::RiskStateSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    // ids stay unique across closed trades too
    PositionId next_id = snapshot.next_position_id;
    for (const auto& trade : snapshot.trade_history) {
        if (trade.position_id >= next_id) {
            next_id = trade.position_id + 1;
        }
    }

    account_ = risk::normalize(snapshot.account);
    history_ = snapshot.trade_history;
    ledger_.restore(snapshot.positions, next_id);

    LOG_INFO("Risk state restored: balance {}, peak {}, dd {:.2f}%, open {}, trades {}",
             account_.current_balance.toString(),
             account_.peak_balance.toString(),
             account_.current_drawdown * 100.0,
             ledger_.openCount(),
             history_.size());
}

void RiskEngine::setEventJournal(std::shared_ptr<core::IEventJournal> journal) {
    std::lock_guard<std::mutex> lock(mutex_);
    journal_ = std::move(journal);
}

// ===== Journal =====

core::JournalEvent RiskEngine::makeOpenedEvent(const risk::Position& pos) const {
    core::JournalEvent event;
    event.ts_ms = currentTimeMs();
    event.type = core::JournalEventType::POSITION_OPENED;
    event.symbol = pos.symbol;
    event.position_id = pos.id;
    event.payload = core::toJson(pos);
    return event;
}

core::JournalEvent RiskEngine::makeClosedEvent(const risk::TradeRecord& trade) const {
    core::JournalEvent event;
    event.ts_ms = currentTimeMs();
    event.type = core::JournalEventType::POSITION_CLOSED;
    event.symbol = trade.symbol;
    event.position_id = trade.position_id;
    event.payload = core::toJson(trade);
    return event;
}

core::JournalEvent RiskEngine::makeRejectedEvent(
    const std::string& strategy_name,
    const std::string& symbol,
    Side side,
    Price entry_price,
    const risk::OpenPositionResult& result
) const {
    core::JournalEvent event;
    event.ts_ms = currentTimeMs();
    event.type = core::JournalEventType::ENTRY_REJECTED;
    event.symbol = symbol;
    event.payload["strategy_name"] = strategy_name;
    event.payload["side"] = toString(side);
    event.payload["reason"] = risk::toString(result.reason);
    event.payload["message"] = result.message;
    event.payload["drawdown"] = account_.current_drawdown;
    event.payload["consecutive_losses"] = account_.consecutive_losses;
    if (std::isfinite(entry_price)) {
        event.payload["entry_price"] = entry_price;
    }
    return event;
}

void RiskEngine::appendJournal(const std::shared_ptr<core::IEventJournal>& journal,
                               const std::vector<core::JournalEvent>& events) const {
    if (!journal) {
        return;
    }
    for (const auto& event : events) {
        if (!journal->append(event)) {
            LOG_ERROR("Event journal append failed: {} {} #{}",
                      core::toString(event.type), event.symbol, event.position_id);
        }
    }
}

} // namespace engine
} // namespace riskbook

#include "engine/ReplayRunner.h"
#include "common/Logger.h"
#include "core/state/RiskStateJson.h"

#include <algorithm>
#include <map>
#include <optional>
#include <tuple>
#include <vector>

namespace riskbook {
namespace engine {

namespace {
ReplayLineResult applyOpenLine(RiskEngine& risk_engine, const nlohmann::json& line) {
    Side side = Side::LONG;
    if (!parseSide(line.value("side", std::string("long")), side)) {
        return ReplayLineResult::MALFORMED;
    }
    std::optional<double> volatility;
    if (line.contains("volatility") && !line["volatility"].is_null()) {
        volatility = line["volatility"].get<double>();
    }
    auto result = risk_engine.openPosition(
        line.value("strategy", std::string("replay")),
        line.value("symbol", std::string()),
        side,
        line.value("price", 0.0),
        volatility
    );
    if (!result.accepted) {
        LOG_WARN("Replay entry rejected: {} ({})", risk::toString(result.reason), result.message);
    }
    return ReplayLineResult::APPLIED;
}

ReplayLineResult applyTickLine(RiskEngine& risk_engine, const nlohmann::json& line) {
    if (!line.contains("prices") || !line["prices"].is_object()) {
        return ReplayLineResult::MALFORMED;
    }
    std::map<std::string, Price> prices;
    for (auto it = line["prices"].begin(); it != line["prices"].end(); ++it) {
        prices[it.key()] = it.value().get<double>();
    }
    risk_engine.markToMarket(prices);
    return ReplayLineResult::APPLIED;
}

ReplayLineResult applyCloseLine(RiskEngine& risk_engine, const nlohmann::json& line) {
    const auto id = line.at("id").get<PositionId>();
    std::optional<risk::TradeRecord> trade;
    if (line.contains("price") && !line["price"].is_null()) {
        trade = risk_engine.closePosition(
            id,
            line["price"].get<double>(),
            parseExitReason(line.value("reason", std::string("manual")))
        );
    } else {
        trade = risk_engine.closeManually(id);
    }
    if (!trade) {
        LOG_WARN("Replay close skipped: position #{} not closed", id);
    }
    return ReplayLineResult::APPLIED;
}

nlohmann::json statsToJson(const StrategyPerformanceStats& stats) {
    return {
        {"trades", stats.trades},
        {"wins", stats.wins},
        {"net_profit", core::moneyToJson(stats.net_profit)},
        {"win_rate", stats.winRate()},
        {"expectancy", stats.expectancy()},
        {"profit_factor", stats.profitFactor()}
    };
}
}

const char* toString(ReplayLineResult result) {
    switch (result) {
        case ReplayLineResult::APPLIED: return "applied";
        case ReplayLineResult::IGNORED: return "ignored";
        case ReplayLineResult::UNKNOWN: return "unknown";
        case ReplayLineResult::MALFORMED: return "malformed";
    }
    return "unknown";
}

ReplayLineResult applyReplayLine(RiskEngine& risk_engine, const std::string& row) {
    if (row.empty() || row[0] == '#') {
        return ReplayLineResult::IGNORED;
    }

    try {
        const auto line = nlohmann::json::parse(row);
        if (!line.is_object()) {
            LOG_WARN("Replay line is not an object: {}", row);
            return ReplayLineResult::MALFORMED;
        }

        const std::string type = line.value("type", std::string());
        if (type == "open") {
            return applyOpenLine(risk_engine, line);
        }
        if (type == "tick") {
            return applyTickLine(risk_engine, line);
        }
        if (type == "close") {
            return applyCloseLine(risk_engine, line);
        }
        LOG_WARN("Unknown replay command skipped: {}", row);
        return ReplayLineResult::UNKNOWN;
    } catch (const nlohmann::json::exception& e) {
        // parse_error, type_error (e.g. "price":"abc"), out_of_range (missing "id")
        LOG_WARN("Malformed replay line skipped: {} ({})", row, e.what());
        return ReplayLineResult::MALFORMED;
    }
}

nlohmann::json buildReplayReport(const RiskEngine& risk_engine,
                                 core::IEventJournal* journal,
                                 std::uint64_t from_seq) {
    nlohmann::json report;
    report["account"] = core::toJson(risk_engine.getAccountState());
    if (auto m = risk_engine.metrics()) {
        report["metrics"] = core::toJson(*m);
    } else {
        report["metrics"] = nullptr;
    }
    report["risk_signals"] = risk_engine.riskSignals();

    nlohmann::json by_strategy = nlohmann::json::object();
    for (const auto& [name, stats] : risk_engine.strategyPerformance()) {
        by_strategy[name] = statsToJson(stats);
    }
    report["strategies"] = by_strategy;

    const auto buckets = risk_engine.bucketPerformance();
    std::vector<const PerformanceBucketMap::value_type*> ordered;
    ordered.reserve(buckets.size());
    for (const auto& entry : buckets) {
        ordered.push_back(&entry);
    }
    std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
        return std::make_tuple(a->first.strategy_name, a->first.symbol, static_cast<int>(a->first.side)) <
               std::make_tuple(b->first.strategy_name, b->first.symbol, static_cast<int>(b->first.side));
    });

    nlohmann::json bucket_rows = nlohmann::json::array();
    for (const auto* entry : ordered) {
        nlohmann::json row = statsToJson(entry->second);
        row["strategy"] = entry->first.strategy_name;
        row["symbol"] = entry->first.symbol;
        row["side"] = toString(entry->first.side);
        bucket_rows.push_back(std::move(row));
    }
    report["buckets"] = bucket_rows;

    if (journal != nullptr) {
        core::JournalQuery query;
        query.from_seq = from_seq;
        query.type = core::JournalEventType::ENTRY_REJECTED;

        std::map<std::string, int> by_reason;
        const auto rejected = journal->read(query);
        for (const auto& event : rejected) {
            by_reason[event.payload.value("reason", std::string("unknown"))]++;
        }
        report["rejections"] = {
            {"total", rejected.size()},
            {"by_reason", by_reason}
        };
    }
    return report;
}

} // namespace engine
} // namespace riskbook

#include "core/state/EventJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using riskbook::core::EventJournalJsonl;
using riskbook::core::JournalEvent;
using riskbook::core::JournalEventType;
using riskbook::core::JournalQuery;

namespace {
JournalEvent makeEvent(JournalEventType type, const std::string& symbol, riskbook::PositionId id) {
    JournalEvent event;
    event.ts_ms = 1000;
    event.type = type;
    event.symbol = symbol;
    event.position_id = id;
    return event;
}
}

int main() {
    const auto path = std::filesystem::temp_directory_path() / "riskbook_test_event_journal.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    {
        EventJournalJsonl journal(path);

        auto first = makeEvent(JournalEventType::POSITION_OPENED, "BTC", 1);
        first.payload["entry_price"] = 50000.0;

        auto second = makeEvent(JournalEventType::POSITION_CLOSED, "BTC", 1);
        second.ts_ms = 2000;
        second.payload["pnl"] = "-494.00000000";

        if (!journal.append(first)) {
            std::cerr << "[TEST] append(first) failed\n";
            return 1;
        }
        if (!journal.append(second)) {
            std::cerr << "[TEST] append(second) failed\n";
            return 1;
        }

        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }

        JournalQuery from_two;
        from_two.from_seq = 2;
        const auto rows = journal.read(from_two);
        if (rows.size() != 1) {
            std::cerr << "[TEST] read(from_seq=2) should return one row, got " << rows.size() << "\n";
            return 1;
        }
        if (rows.front().symbol != "BTC" || rows.front().position_id != 1 ||
            rows.front().type != JournalEventType::POSITION_CLOSED) {
            std::cerr << "[TEST] unexpected row: " << rows.front().symbol << "\n";
            return 1;
        }
        if (rows.front().payload.value("pnl", std::string()) != "-494.00000000") {
            std::cerr << "[TEST] payload not preserved\n";
            return 1;
        }
    }

    // events missing the fields their type requires are refused without consuming a seq
    {
        EventJournalJsonl journal(path);

        auto no_symbol = makeEvent(JournalEventType::POSITION_OPENED, "", 2);
        auto no_id = makeEvent(JournalEventType::POSITION_CLOSED, "ETH", 0);
        auto no_reason = makeEvent(JournalEventType::ENTRY_REJECTED, "ETH", 0);
        auto rejected_with_id = makeEvent(JournalEventType::ENTRY_REJECTED, "ETH", 7);
        rejected_with_id.payload["reason"] = "drawdown_limit";
        auto array_payload = makeEvent(JournalEventType::POSITION_OPENED, "ETH", 2);
        array_payload.payload = nlohmann::json::array();

        std::string reason;
        if (EventJournalJsonl::validate(no_symbol, &reason) || reason.empty()) {
            std::cerr << "[TEST] position event without symbol must be invalid\n";
            return 1;
        }
        if (journal.append(no_symbol) || journal.append(no_id) || journal.append(no_reason) ||
            journal.append(rejected_with_id) || journal.append(array_payload)) {
            std::cerr << "[TEST] malformed events must be refused\n";
            return 1;
        }
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] refused events must not advance seq, got " << journal.lastSeq() << "\n";
            return 1;
        }

        // an invalid-request rejection may have an empty symbol
        auto empty_symbol_rejection = makeEvent(JournalEventType::ENTRY_REJECTED, "", 0);
        empty_symbol_rejection.payload["reason"] = "invalid_request";
        if (!EventJournalJsonl::validate(empty_symbol_rejection)) {
            std::cerr << "[TEST] rejection without symbol should be valid\n";
            return 1;
        }
    }

    // corrupt lines must not break reading or seq recovery
    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << "{not json\n";
        // parseable but wrongly typed; its seq still counts so numbering never repeats
        out << R"({"seq":3,"ts_ms":"late","type":"POSITION_OPENED","symbol":"BTC","position_id":9,"payload":{}})" << "\n";
        out << R"({"seq":4,"type":"POSITION_MOVED","symbol":"BTC","position_id":9,"payload":{}})" << "\n";
    }

    EventJournalJsonl reopened(path);
    if (reopened.lastSeq() != 4) {
        std::cerr << "[TEST] reopened lastSeq should be 4, got " << reopened.lastSeq() << "\n";
        return 1;
    }

    auto third = makeEvent(JournalEventType::ENTRY_REJECTED, "ETH", 0);
    third.ts_ms = 3000;
    third.payload["reason"] = "drawdown_limit";
    auto fourth = makeEvent(JournalEventType::POSITION_OPENED, "ETH", 2);
    fourth.ts_ms = 4000;
    if (!reopened.append(third) || !reopened.append(fourth) || reopened.lastSeq() != 6) {
        std::cerr << "[TEST] append after reopen should continue at seq 5\n";
        return 1;
    }

    const auto all = reopened.read(JournalQuery());
    if (all.size() != 4 || all.back().seq != 6) {
        std::cerr << "[TEST] expected 4 valid rows, got " << all.size() << "\n";
        return 1;
    }

    // filters combine
    JournalQuery rejections;
    rejections.type = JournalEventType::ENTRY_REJECTED;
    const auto rejected = reopened.read(rejections);
    if (rejected.size() != 1 || rejected.front().payload.value("reason", std::string()) != "drawdown_limit") {
        std::cerr << "[TEST] type filter should return the single rejection\n";
        return 1;
    }

    JournalQuery eth;
    eth.symbol = "ETH";
    eth.type = JournalEventType::POSITION_OPENED;
    const auto eth_opened = reopened.read(eth);
    if (eth_opened.size() != 1 || eth_opened.front().position_id != 2) {
        std::cerr << "[TEST] symbol + type filter should return ETH #2 only\n";
        return 1;
    }

    JournalQuery first_position;
    first_position.position_id = 1;
    first_position.from_seq = 2;
    const auto tail = reopened.read(first_position);
    if (tail.size() != 1 || tail.front().type != JournalEventType::POSITION_CLOSED) {
        std::cerr << "[TEST] position + seq filter should return the close of #1\n";
        return 1;
    }

    std::filesystem::remove(path, ec);
    std::cout << "[TEST] EventJournal PASSED\n";
    return 0;
}

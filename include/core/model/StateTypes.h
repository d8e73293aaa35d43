#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "risk/AccountState.h"
#include "risk/RiskTypes.h"

namespace riskbook {
namespace core {

enum class JournalEventType {
    POSITION_OPENED,
    POSITION_CLOSED,
    ENTRY_REJECTED
};

inline const char* toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::POSITION_OPENED: return "POSITION_OPENED";
        case JournalEventType::POSITION_CLOSED: return "POSITION_CLOSED";
        case JournalEventType::ENTRY_REJECTED: return "ENTRY_REJECTED";
    }
    return "UNKNOWN";
}

inline bool parseJournalEventType(const std::string& value, JournalEventType& out) {
    if (value == "POSITION_OPENED") { out = JournalEventType::POSITION_OPENED; return true; }
    if (value == "POSITION_CLOSED") { out = JournalEventType::POSITION_CLOSED; return true; }
    if (value == "ENTRY_REJECTED") { out = JournalEventType::ENTRY_REJECTED; return true; }
    return false;
}

// 저널 1행
//   OPENED / CLOSED : symbol 필수, position_id > 0, payload 는 포지션/거래 JSON
//   REJECTED        : position_id == 0, payload.reason 필수 (symbol 은 비어 있을 수 있음)
struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::POSITION_OPENED;
    std::string symbol;
    PositionId position_id = 0;
    nlohmann::json payload = nlohmann::json::object();
};

// 조회 조건. 비어 있는 필드는 필터하지 않음
struct JournalQuery {
    std::uint64_t from_seq = 1;
    std::optional<JournalEventType> type;
    std::optional<PositionId> position_id;
    std::optional<std::string> symbol;

    bool matches(const JournalEvent& event) const {
        if (event.seq < from_seq) return false;
        if (type && event.type != *type) return false;
        if (position_id && event.position_id != *position_id) return false;
        if (symbol && event.symbol != *symbol) return false;
        return true;
    }
};

// 호스트가 영속화할 때 쓰는 상태 전체 (계좌 1행 + 오픈 포지션 + 거래 이력)
struct RiskStateSnapshot {
    int schema_version = 1;
    long long saved_at_ms = 0;
    risk::AccountState account;
    std::vector<risk::Position> positions;
    std::vector<risk::TradeRecord> trade_history;
    PositionId next_position_id = 1;
};

} // namespace core
} // namespace riskbook

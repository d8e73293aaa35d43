#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace riskbook {

using Price = double;
using Quantity = double;
using PositionId = std::uint64_t;

enum class Side { LONG, SHORT };
enum class PositionStatus { OPEN, CLOSED };
enum class ExitReason { STOP_LOSS, TAKE_PROFIT, MANUAL };

inline const char* toString(Side side) {
    return side == Side::LONG ? "long" : "short";
}

inline const char* toString(PositionStatus status) {
    return status == PositionStatus::OPEN ? "open" : "closed";
}

inline const char* toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::STOP_LOSS: return "stop_loss";
        case ExitReason::TAKE_PROFIT: return "take_profit";
        case ExitReason::MANUAL: return "manual";
    }
    return "manual";
}

// 알 수 없는 값은 false 반환
inline bool parseSide(const std::string& value, Side& out) {
    if (value == "long" || value == "LONG" || value == "buy") {
        out = Side::LONG;
        return true;
    }
    if (value == "short" || value == "SHORT" || value == "sell") {
        out = Side::SHORT;
        return true;
    }
    return false;
}

inline ExitReason parseExitReason(const std::string& value) {
    if (value == "stop_loss") return ExitReason::STOP_LOSS;
    if (value == "take_profit") return ExitReason::TAKE_PROFIT;
    return ExitReason::MANUAL;
}

inline long long currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace riskbook

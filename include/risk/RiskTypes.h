#pragma once

#include "common/Money.h"
#include "common/Types.h"
#include <string>
#include <utility>

namespace riskbook {
namespace risk {

// 포지션 정보 (원장이 소유, 청산 시 TradeRecord 로 이전)
struct Position {
    PositionId id;
    std::string strategy_name;
    std::string symbol;
    Side side;

    Price entry_price;
    Price current_price;
    Quantity quantity;          // 생성 후 불변
    Money position_value;       // 사이징 결과 (계좌 통화)

    // 손절/익절가
    Price stop_loss;
    Price take_profit;

    long long entry_time;       // epoch ms
    PositionStatus status;

    Money unrealized_pnl;       // 미실현 손익

    double volatility;          // 진입 시 변동성 (없으면 0)
    bool has_volatility;

    Position()
        : id(0), side(Side::LONG)
        , entry_price(0), current_price(0), quantity(0)
        , stop_loss(0), take_profit(0)
        , entry_time(0), status(PositionStatus::OPEN)
        , volatility(0), has_volatility(false)
    {}
};

// 거래 이력 (append-only, 생성 후 불변)
struct TradeRecord {
    PositionId position_id;
    std::string strategy_name;
    std::string symbol;
    Side side;

    Price entry_price;
    Price exit_price;
    Quantity quantity;
    Money position_value;
    Price stop_loss;
    Price take_profit;

    long long entry_time;
    long long exit_time;

    Money pnl;
    double pnl_percent;         // pnl / (entry * qty) * 100
    ExitReason exit_reason;

    TradeRecord()
        : position_id(0), side(Side::LONG)
        , entry_price(0), exit_price(0), quantity(0)
        , stop_loss(0), take_profit(0)
        , entry_time(0), exit_time(0)
        , pnl_percent(0), exit_reason(ExitReason::MANUAL)
    {}
};

// 진입 거부 사유
enum class RejectReason {
    NONE,
    DRAWDOWN_LIMIT,         // current_drawdown >= max_drawdown_limit
    CONSECUTIVE_LOSSES,     // consecutive_losses >= max_consecutive_losses
    INVALID_REQUEST,        // 가격/심볼/변동성 입력 오류
    INSUFFICIENT_BALANCE    // 사이징 결과 수량 0
};

inline const char* toString(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "none";
        case RejectReason::DRAWDOWN_LIMIT: return "drawdown_limit";
        case RejectReason::CONSECUTIVE_LOSSES: return "consecutive_losses";
        case RejectReason::INVALID_REQUEST: return "invalid_request";
        case RejectReason::INSUFFICIENT_BALANCE: return "insufficient_balance";
    }
    return "none";
}

// openPosition 결과: accepted 이면 position 유효, 아니면 reason/message
struct OpenPositionResult {
    bool accepted = false;
    Position position;
    RejectReason reason = RejectReason::NONE;
    std::string message;

    static OpenPositionResult ok(const Position& pos) {
        OpenPositionResult r;
        r.accepted = true;
        r.position = pos;
        return r;
    }

    static OpenPositionResult rejected(RejectReason reason, std::string message) {
        OpenPositionResult r;
        r.reason = reason;
        r.message = std::move(message);
        return r;
    }
};

} // namespace risk
} // namespace riskbook

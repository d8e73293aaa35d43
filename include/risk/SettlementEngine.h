#pragma once

#include "risk/AccountState.h"
#include "risk/PositionLedger.h"
#include "risk/RiskTypes.h"
#include <optional>
#include <vector>

namespace riskbook {
namespace risk {

// Settlement Engine - 청산 처리
//
// 계좌 상태가 바뀌는 유일한 곳. 청산 1건당:
//   1. pnl 계산 (Money 로 1회 반올림) 과 applyClose() 검사
//   2. 원장에서 포지션 제거 (OPEN -> CLOSED, 되돌릴 수 없음)
//   3. 계좌 전이 1회
//   4. TradeRecord 를 이력에 append
// pnl 이나 새 잔고가 Money 범위를 넘으면 거부하고 포지션은 열린 채로 둔다.
// 스레드 안전하지 않음: RiskEngine 의 락 안에서만 호출된다.
class SettlementEngine {
public:
    SettlementEngine(PositionLedger& ledger,
                     AccountState& account,
                     std::vector<TradeRecord>& history);

    // 없는(또는 이미 청산된) ID, 비정상 청산가, 금액 오버플로우면 nullopt
    std::optional<TradeRecord> close(PositionId id, Price exit_price, ExitReason reason);

    // long (exit - entry) * qty, short (entry - exit) * qty. 범위 밖이면 nullopt
    static std::optional<Money> computePnl(const Position& pos, Price exit_price);
    static double computePnlPercent(const Position& pos, Money pnl);

private:
    PositionLedger& ledger_;
    AccountState& account_;
    std::vector<TradeRecord>& history_;
};

} // namespace risk
} // namespace riskbook

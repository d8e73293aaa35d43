#pragma once

#include "risk/AccountState.h"
#include "risk/ExitCalculator.h"
#include "risk/PositionSizer.h"
#include "risk/RiskConfig.h"
#include "risk/RiskTypes.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace riskbook {
namespace risk {

// Position Ledger - 오픈 포지션 원장
//
// Position 이 만들어지는 유일한 곳. 진입 한도(드로다운/연속 손실)를 검사한 뒤
// 사이징 -> 손절/익절가 -> ID 발급 순서로 포지션을 만든다.
// 스레드 안전하지 않음: RiskEngine 의 락 안에서만 호출된다.
class PositionLedger {
public:
    explicit PositionLedger(const RiskConfig& config);

    // ===== 포지션 생성 =====

    // 거부 시 아무것도 바뀌지 않는다
    OpenPositionResult open(
        const AccountState& account,
        const std::string& strategy_name,
        const std::string& symbol,
        Side side,
        Price entry_price,
        std::optional<double> volatility = std::nullopt
    );

    // 진입 한도 검사만 수행 (NONE 이면 진입 가능)
    RejectReason checkEntryLimits(const AccountState& account) const;

    // ===== 조회 =====

    std::optional<Position> get(PositionId id) const;
    std::vector<Position> listOpen() const;   // ID 오름차순 스냅샷
    size_t openCount() const { return positions_.size(); }
    PositionId nextId() const { return next_id_; }

    // ===== 갱신 (MarkToMarketMonitor / SettlementEngine 전용) =====

    // 현재가 갱신 + 미실현 손익 재계산. 없는 ID 면 nullptr
    Position* markPrice(PositionId id, Price current_price);

    // 원장에서 제거하고 CLOSED 상태로 반환. 이미 없으면 nullopt
    std::optional<Position> take(PositionId id);

    // 스냅샷 복원. next_id 는 복원된 최대 ID 보다 커지도록 보정
    void restore(const std::vector<Position>& positions, PositionId next_id);

    static Money unrealizedPnl(const Position& pos, Price current_price);

private:
    double max_drawdown_limit_;
    int max_consecutive_losses_;
    PositionSizer sizer_;
    ExitCalculator exits_;

    std::map<PositionId, Position> positions_;
    PositionId next_id_ = 1;
};

} // namespace risk
} // namespace riskbook

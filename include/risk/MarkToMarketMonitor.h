#pragma once

#include "risk/PositionLedger.h"
#include "risk/SettlementEngine.h"
#include "risk/RiskTypes.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace riskbook {
namespace risk {

// Mark-to-Market Monitor - 현재가 반영 + 청산 조건 감시
//
// 청산 조건 우선순위 (첫 번째로 맞는 것만 적용, 같은 패스에서 두 개가 동시에 나오지 않음):
//   1. Long  & price <= stop_loss   -> STOP_LOSS
//   2. Long  & price >= take_profit -> TAKE_PROFIT
//   3. Short & price >= stop_loss   -> STOP_LOSS
//   4. Short & price <= take_profit -> TAKE_PROFIT
//
// 가격 맵에 없는 심볼은 건드리지 않는다 (부분 시세가 다른 포지션을 막지 않도록).
class MarkToMarketMonitor {
public:
    MarkToMarketMonitor(PositionLedger& ledger, SettlementEngine& settlement);

    // 발동된 포지션은 같은 호출 안에서 청산되고 TradeRecord 로 반환 (ID 순)
    std::vector<TradeRecord> update(const std::map<std::string, Price>& price_by_symbol);

    static std::optional<ExitReason> evaluateTrigger(const Position& pos, Price current_price);

private:
    PositionLedger& ledger_;
    SettlementEngine& settlement_;
};

} // namespace risk
} // namespace riskbook

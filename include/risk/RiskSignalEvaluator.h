#pragma once

#include "risk/AccountState.h"
#include "risk/RiskConfig.h"
#include "risk/RiskTypes.h"
#include <string>
#include <vector>

namespace riskbook {
namespace risk {

// 경고 문자열 생성 (순수 함수, 참고용)
class RiskSignalEvaluator {
public:
    explicit RiskSignalEvaluator(const SignalThresholds& thresholds);

    std::vector<std::string> signals(const AccountState& account,
                                     const std::vector<Position>& open_positions) const;

    // sum(|unrealized_pnl|). concentration 경고는 이 값 > balance * concentration
    static double unrealizedExposure(const std::vector<Position>& open_positions);

private:
    SignalThresholds thresholds_;
};

} // namespace risk
} // namespace riskbook

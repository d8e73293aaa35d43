#pragma once

#include "core/contracts/IEventJournal.h"
#include "engine/RiskEngine.h"
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace riskbook {
namespace engine {

// 리플레이 파일 1행 = 명령 1개
//   {"type":"open","strategy":"breakout","symbol":"BTC","side":"long","price":50000,"volatility":0.02}
//   {"type":"tick","prices":{"BTC":47400,"ETH":3100}}
//   {"type":"close","id":1,"price":51000}      (price 생략 시 수동 청산)
// 빈 줄과 '#' 으로 시작하는 줄은 무시
enum class ReplayLineResult {
    APPLIED,
    IGNORED,
    UNKNOWN,     // 알 수 없는 type
    MALFORMED    // JSON 오류, 필드 타입 오류, 잘못된 side
};

const char* toString(ReplayLineResult result);

// 예외를 밖으로 던지지 않는다. 엔진 거부(진입 거절, 없는 ID 청산)도 APPLIED
ReplayLineResult applyReplayLine(RiskEngine& risk_engine, const std::string& row);

// 계좌, 지표, 경고, 전략/버킷별 성과. journal 이 있으면 from_seq 이후 진입 거절 사유별 건수
nlohmann::json buildReplayReport(const RiskEngine& risk_engine,
                                 core::IEventJournal* journal,
                                 std::uint64_t from_seq);

} // namespace engine
} // namespace riskbook

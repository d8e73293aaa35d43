#pragma once

#include <nlohmann/json.hpp>

#include "analytics/PortfolioMetrics.h"
#include "common/Money.h"
#include "risk/AccountState.h"
#include "risk/RiskTypes.h"

namespace riskbook {
namespace core {

// 금액은 문자열("9506.00000000")로 저장해 정밀도 손실을 막는다
nlohmann::json moneyToJson(Money value);
Money moneyFromJson(const nlohmann::json& parent, const char* key);

nlohmann::json toJson(const risk::AccountState& account);
nlohmann::json toJson(const risk::Position& pos);
nlohmann::json toJson(const risk::TradeRecord& trade);
nlohmann::json toJson(const analytics::PortfolioMetrics& metrics);

// 필드 타입이 틀리거나 raw 가 객체가 아니면 nlohmann::json::type_error
risk::AccountState accountFromJson(const nlohmann::json& raw);
risk::Position positionFromJson(const nlohmann::json& raw);
risk::TradeRecord tradeFromJson(const nlohmann::json& raw);

} // namespace core
} // namespace riskbook

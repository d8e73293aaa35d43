#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace riskbook {

// 고정소수점 금액 (소수 8자리)
// 잔고/손익은 double 누적 오차 없이 정확히 더하고 빼야 한다.
class Money {
public:
    static constexpr std::int64_t SCALE = 100000000LL;
    // 표현 가능한 최대 raw 값. 대칭 범위 [-MAX_RAW, MAX_RAW] 만 사용한다
    static constexpr std::int64_t MAX_RAW = std::numeric_limits<std::int64_t>::max();

    constexpr Money() = default;

    static constexpr Money fromRaw(std::int64_t raw) { return Money(raw); }
    // 가장 가까운 1e-8 단위로 반올림. NaN/inf 는 0, 범위 밖은 포화
    // (잔고/손익처럼 정확해야 하는 값은 fits() 로 먼저 확인)
    static Money fromDouble(double value);
    // 범위 안의 유한한 값인지 (약 +-9.2e10)
    static bool fits(double value);
    static constexpr Money highest() { return Money(MAX_RAW); }
    static constexpr Money lowest() { return Money(-MAX_RAW); }
    // "-494.5", "9506.00000000" 등. 소수 8자리 초과/형식 오류면 nullopt
    static std::optional<Money> parse(const std::string& text);

    constexpr std::int64_t raw() const { return raw_; }
    double toDouble() const { return static_cast<double>(raw_) / static_cast<double>(SCALE); }

    bool isZero() const { return raw_ == 0; }
    bool isNegative() const { return raw_ < 0; }
    bool isPositive() const { return raw_ > 0; }

    Money abs() const { return Money(raw_ < 0 ? -raw_ : raw_); }

    // "9506.00000000" 형식
    std::string toString() const;

    // 오버플로우면 nullopt
    std::optional<Money> checkedAdd(Money other) const;
    std::optional<Money> checkedSub(Money other) const;
    // 오버플로우면 highest()/lowest() 로 포화 (표시용 합계)
    Money saturatingAdd(Money other) const;

    Money operator-() const { return Money(-raw_); }
    Money operator+(Money other) const { return Money(raw_ + other.raw_); }
    Money operator-(Money other) const { return Money(raw_ - other.raw_); }
    Money& operator+=(Money other) { raw_ += other.raw_; return *this; }
    Money& operator-=(Money other) { raw_ -= other.raw_; return *this; }

    bool operator==(Money other) const { return raw_ == other.raw_; }
    bool operator!=(Money other) const { return raw_ != other.raw_; }
    bool operator<(Money other) const { return raw_ < other.raw_; }
    bool operator<=(Money other) const { return raw_ <= other.raw_; }
    bool operator>(Money other) const { return raw_ > other.raw_; }
    bool operator>=(Money other) const { return raw_ >= other.raw_; }

private:
    constexpr explicit Money(std::int64_t raw) : raw_(raw) {}

    std::int64_t raw_ = 0;
};

} // namespace riskbook

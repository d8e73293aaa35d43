#include "common/Money.h"

#include <cmath>
#include <cstdio>
#include <limits>

namespace riskbook {

namespace {
// 2^63 as double; |scaled| must stay strictly below it
constexpr double RAW_LIMIT = 9223372036854775808.0;
}

bool Money::fits(double value) {
    if (!std::isfinite(value)) {
        return false;
    }
    return std::abs(value * static_cast<double>(SCALE)) < RAW_LIMIT;
}

Money Money::fromDouble(double value) {
    if (!std::isfinite(value)) {
        return Money();
    }
    if (!fits(value)) {
        return value > 0.0 ? highest() : lowest();
    }
    const std::int64_t raw = static_cast<std::int64_t>(std::llround(value * static_cast<double>(SCALE)));
    // llround can land on INT64_MIN only at the boundary
    return Money(raw < -MAX_RAW ? -MAX_RAW : raw);
}

std::optional<Money> Money::checkedAdd(Money other) const {
    if (other.raw_ > 0 && raw_ > MAX_RAW - other.raw_) {
        return std::nullopt;
    }
    if (other.raw_ < 0 && raw_ < -MAX_RAW - other.raw_) {
        return std::nullopt;
    }
    return Money(raw_ + other.raw_);
}

std::optional<Money> Money::checkedSub(Money other) const {
    if (other.raw_ < -MAX_RAW) {
        return std::nullopt;
    }
    return checkedAdd(Money(-other.raw_));
}

Money Money::saturatingAdd(Money other) const {
    auto sum = checkedAdd(other);
    if (sum) {
        return *sum;
    }
    return other.raw_ > 0 ? highest() : lowest();
}

std::optional<Money> Money::parse(const std::string& text) {
    size_t i = 0;
    bool negative = false;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        negative = (text[i] == '-');
        ++i;
    }

    std::int64_t units = 0;
    std::int64_t frac = 0;
    int frac_digits = 0;
    bool any_digit = false;
    bool in_frac = false;
    const std::int64_t max_units = std::numeric_limits<std::int64_t>::max() / SCALE - 1;

    for (; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '.' && !in_frac) {
            in_frac = true;
            continue;
        }
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        any_digit = true;
        if (in_frac) {
            if (frac_digits == 8) {
                return std::nullopt;
            }
            frac = frac * 10 + (c - '0');
            ++frac_digits;
        } else {
            if (units > max_units / 10) {
                return std::nullopt;
            }
            units = units * 10 + (c - '0');
        }
    }

    if (!any_digit) {
        return std::nullopt;
    }
    for (; frac_digits < 8; ++frac_digits) {
        frac *= 10;
    }

    const std::int64_t raw = units * SCALE + frac;
    return Money(negative ? -raw : raw);
}

std::string Money::toString() const {
    const bool negative = raw_ < 0;
    // INT64_MIN 은 fromRaw 로만 만들 수 있으므로 unsigned 로 절대값 처리
    const std::uint64_t magnitude = negative
        ? static_cast<std::uint64_t>(-(raw_ + 1)) + 1u
        : static_cast<std::uint64_t>(raw_);

    const std::uint64_t units = magnitude / static_cast<std::uint64_t>(SCALE);
    const std::uint64_t frac = magnitude % static_cast<std::uint64_t>(SCALE);

    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%s%llu.%08llu",
                  negative ? "-" : "",
                  static_cast<unsigned long long>(units),
                  static_cast<unsigned long long>(frac));
    return std::string(buffer);
}

} // namespace riskbook

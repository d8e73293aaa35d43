#include "common/Money.h"

#include <iostream>
#include <limits>
#include <string>

using riskbook::Money;

namespace {
int g_failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "[TEST] FAILED: " << message << "\n";
        ++g_failures;
    }
}
}

int main() {
    std::cout << "[TEST] Starting Money Test..." << std::endl;

    // rounding to 1e-8
    expect(Money::fromDouble(-494.000000000001).toString() == "-494.00000000", "fromDouble rounds to 8 digits");
    expect(Money::fromDouble(std::numeric_limits<double>::quiet_NaN()).isZero(), "NaN becomes zero");

    // exact accumulation
    Money sum;
    for (int i = 0; i < 10; ++i) {
        sum += Money::fromDouble(0.1);
    }
    expect(sum == Money::fromDouble(1.0), "ten 0.1 add up to exactly 1");

    // parse
    auto parsed = Money::parse("9506.00000000");
    expect(parsed.has_value() && *parsed == Money::fromDouble(9506.0), "parse plain balance");
    auto negative = Money::parse("-0.5");
    expect(negative.has_value() && negative->raw() == -50000000, "parse negative fraction");
    expect(!Money::parse("1.123456789").has_value(), "more than 8 fraction digits rejected");
    expect(!Money::parse("abc").has_value(), "garbage rejected");
    expect(!Money::parse("").has_value(), "empty rejected");
    expect(!Money::parse("-").has_value(), "bare sign rejected");

    // formatting
    expect(Money::fromDouble(9506.0).toString() == "9506.00000000", "toString positive");
    expect(Money::fromRaw(-1).toString() == "-0.00000001", "toString smallest negative");
    expect(Money().toString() == "0.00000000", "toString zero");

    // comparisons / helpers
    expect(Money::fromDouble(-3.0).abs() == Money::fromDouble(3.0), "abs");
    expect(Money::fromDouble(1.0) > Money::fromDouble(0.99999999), "ordering at last digit");
    expect((-Money::fromDouble(2.5)).isNegative(), "unary minus");

    // range
    expect(Money::fits(9.0e10), "9e10 fits");
    expect(!Money::fits(1.0e11), "1e11 does not fit");
    expect(!Money::fits(std::numeric_limits<double>::infinity()), "inf does not fit");
    expect(Money::fromDouble(1.0e12) == Money::highest(), "fromDouble saturates high");
    expect(Money::fromDouble(-1.0e12) == Money::lowest(), "fromDouble saturates low");

    // checked arithmetic
    auto exact = Money::fromDouble(10.5).checkedAdd(Money::fromDouble(-0.5));
    expect(exact.has_value() && *exact == Money::fromDouble(10.0), "checkedAdd in range");
    expect(!Money::highest().checkedAdd(Money::fromRaw(1)).has_value(), "checkedAdd overflow");
    expect(!Money::lowest().checkedAdd(Money::fromRaw(-1)).has_value(), "checkedAdd underflow");
    expect(!Money::lowest().checkedSub(Money::fromRaw(1)).has_value(), "checkedSub underflow");
    auto diff = Money::fromDouble(5.0).checkedSub(Money::fromDouble(7.25));
    expect(diff.has_value() && *diff == Money::fromDouble(-2.25), "checkedSub in range");
    expect(Money::highest().saturatingAdd(Money::fromDouble(1.0)) == Money::highest(), "saturatingAdd clamps high");
    expect(Money::lowest().saturatingAdd(Money::fromDouble(-1.0)) == Money::lowest(), "saturatingAdd clamps low");
    expect(Money::fromDouble(1.0).saturatingAdd(Money::fromDouble(2.0)) == Money::fromDouble(3.0),
           "saturatingAdd in range");

    if (g_failures > 0) {
        std::cerr << "[TEST] Money Test FAILED (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "[TEST] Money Test PASSED!" << std::endl;
    return 0;
}

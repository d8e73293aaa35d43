#include "risk/AccountState.h"

#include <algorithm>

namespace riskbook {
namespace risk {

AccountState AccountState::create(Money initial_balance) {
    AccountState state;
    state.initial_balance = initial_balance;
    state.current_balance = initial_balance;
    state.peak_balance = initial_balance;
    state.current_drawdown = 0.0;
    state.consecutive_losses = 0;
    return state;
}

double computeDrawdown(Money peak_balance, Money current_balance) {
    if (!peak_balance.isPositive() || current_balance >= peak_balance) {
        return 0.0;
    }
    const double peak = peak_balance.toDouble();
    return (peak - current_balance.toDouble()) / peak;
}

std::optional<AccountState> applyClose(const AccountState& state, Money pnl) {
    auto balance = state.current_balance.checkedAdd(pnl);
    if (!balance) {
        return std::nullopt;
    }

    AccountState next = state;
    next.current_balance = *balance;

    if (pnl.isNegative()) {
        next.consecutive_losses = state.consecutive_losses + 1;
    } else {
        next.consecutive_losses = 0;
    }

    if (next.current_balance > next.peak_balance) {
        next.peak_balance = next.current_balance;
    }

    next.current_drawdown = computeDrawdown(next.peak_balance, next.current_balance);
    return next;
}

AccountState normalize(const AccountState& state) {
    AccountState next = state;
    next.peak_balance = std::max(next.peak_balance, next.current_balance);
    next.consecutive_losses = std::max(0, next.consecutive_losses);
    next.current_drawdown = computeDrawdown(next.peak_balance, next.current_balance);
    return next;
}

} // namespace risk
} // namespace riskbook

#include "planning.hpp"
#include <algorithm>
#include <cmath>

namespace debtfree {

double monthly_interest(const DebtRecord& debt) {
    return debt.balance * debt.monthly_rate();
}

double total_monthly_interest(const std::vector<DebtRecord>& debts) {
    double total = 0.0;
    for (const auto& d : debts) {
        total += monthly_interest(d);
    }
    return total;
}

double total_minimum_payment(const std::vector<DebtRecord>& debts) {
    double total = 0.0;
    for (const auto& d : debts) {
        total += d.minimum_payment;
    }
    return total;
}

double total_balance(const std::vector<DebtRecord>& debts) {
    double total = 0.0;
    for (const auto& d : debts) {
        total += d.balance;
    }
    return total;
}

double recommended_monthly_payment(const std::vector<DebtRecord>& debts) {
    if (debts.empty()) {
        return 0.0;
    }

    const double minimums_plus = total_minimum_payment(debts) * 1.2;

    double rate_sum = 0.0;
    for (const auto& d : debts) {
        rate_sum += d.annual_interest_rate_percent;
    }
    const double mean_monthly_rate = rate_sum / static_cast<double>(debts.size()) / 100.0 / 12.0;
    const double principal = total_balance(debts);
    const double n = static_cast<double>(RECOMMENDED_PAYOFF_MONTHS);

    double amortized;
    if (mean_monthly_rate > 0.0) {
        amortized = (mean_monthly_rate * principal) / (1.0 - std::pow(1.0 + mean_monthly_rate, -n));
    } else {
        amortized = principal / n;
    }

    return std::max(minimums_plus, amortized);
}

BudgetRange budget_range(const std::vector<DebtRecord>& debts) {
    const double minimums = total_minimum_payment(debts);

    BudgetRange range;
    range.minimum = std::max(minimums, MIN_BUDGET_FLOOR);
    range.maximum = std::max(minimums * 3.0, MAX_BUDGET_FLOOR);
    range.recommended = recommended_monthly_payment(debts);
    return range;
}

} // namespace debtfree

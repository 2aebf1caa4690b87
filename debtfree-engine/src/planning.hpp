#ifndef DEBTFREE_PLANNING_HPP
#define DEBTFREE_PLANNING_HPP

#include "debt.hpp"
#include <vector>

namespace debtfree {

// Budget bounds offered to a user choosing a monthly payment
struct BudgetRange {
    double minimum;       // max(sum of minimums, MIN_BUDGET_FLOOR)
    double recommended;   // recommended_monthly_payment()
    double maximum;       // max(3 x sum of minimums, MAX_BUDGET_FLOOR)
};

constexpr double MIN_BUDGET_FLOOR = 100.0;
constexpr double MAX_BUDGET_FLOOR = 5000.0;
constexpr int RECOMMENDED_PAYOFF_MONTHS = 36;

// Interest one month adds to the current balance
double monthly_interest(const DebtRecord& debt);
double total_monthly_interest(const std::vector<DebtRecord>& debts);

double total_minimum_payment(const std::vector<DebtRecord>& debts);
double total_balance(const std::vector<DebtRecord>& debts);

// Larger of 120% of the minimums and the level payment that amortizes the
// total balance over 36 months at the mean interest rate:
//   P = r x PV / (1 - (1 + r)^-n)
// With a zero mean rate the payment is PV / n. Empty input yields 0.
double recommended_monthly_payment(const std::vector<DebtRecord>& debts);

BudgetRange budget_range(const std::vector<DebtRecord>& debts);

} // namespace debtfree

#endif // DEBTFREE_PLANNING_HPP

#ifndef DEBTFREE_PAYOFF_HPP
#define DEBTFREE_PAYOFF_HPP

#include "debt.hpp"
#include "strategy.hpp"
#include <string>
#include <vector>

namespace debtfree {

// Aggregate state of the working portfolio after one simulated month
struct MonthlySnapshot {
    int month;                      // 1-based
    double interest_accrued;        // Interest added this month
    double minimum_paid;            // Sum of minimum payments applied
    double extra_paid;              // Extra payment applied to the first debt
    double remaining_balance;       // Total balance left after payments
    size_t debts_remaining;         // Debts still above the paid-off epsilon
};

// A debt leaving the working list
struct PayoffEvent {
    std::string debt_id;
    int month;
};

struct SimulationResult {
    int months_to_payoff;           // Month counter at termination
    double interest_saved;          // baseline_interest - total_interest_paid, may be negative
    double baseline_interest;       // Minimum-only estimate, see compute_baseline_interest
    double total_interest_paid;     // Interest accrued during the simulation
    double total_paid;              // Minimums plus extra payments applied
    bool converged;                 // False when the month cap stopped the run
    std::vector<PayoffEvent> payoff_order;
    std::vector<MonthlySnapshot> schedule;  // Only with detailed_schedule

    SimulationResult();

    // Callers showing "never" for capped runs should test this
    bool is_payable() const { return converged; }
};

struct SimulationConfig {
    double paid_off_epsilon;        // A balance at or below this counts as paid (default 0.1)
    int max_months;                 // Circuit breaker (default 600, 50 years)
    bool detailed_schedule;         // If true, populate SimulationResult::schedule

    SimulationConfig();
};

// Interest paid if every debt ran independently at its own minimum pace,
// estimated as balance x monthly rate x ceil(balance / minimum).
// Debts with a zero balance contribute nothing. Throws
// InvalidMinimumPaymentError for a live balance without a positive minimum.
double compute_baseline_interest(const std::vector<DebtRecord>& debts);

// Month-by-month simulation over debts in priority order.
//
// Each month:
//   1. Accrue interest on every remaining debt
//   2. Pay each debt's minimum, capped at its balance
//   3. Pay budget - sum(minimums of remaining debts), if positive, to the
//      first remaining debt, capped at its balance
//   4. Drop debts at or below paid_off_epsilon
// The loop ends when no debt is left or after max_months months.
//
// The input is never modified. An empty input yields zero months and zero
// savings. Invalid debts are rejected up front (see validate_debt).
//
// Events go to the shared Logger. A capped run emits one simulation_capped
// WARN, which reaches stderr under the default LoggerConfig; hosts that
// embed the engine should call Logger::configure() first (for example with
// enable_console = false or min_level = ERROR).
SimulationResult simulate_payoff(
    const std::vector<DebtRecord>& ordered_debts,
    double monthly_budget,
    const SimulationConfig& config = SimulationConfig()
);

// Result of recommending, ordering and simulating in one call
struct PayoffPlan {
    StrategyTag strategy;
    std::vector<DebtRecord> ordered_debts;
    SimulationResult result;
};

// Recommends a strategy for the portfolio, orders by it and simulates
PayoffPlan project_debt_free(
    const std::vector<DebtRecord>& debts,
    double monthly_budget,
    const SimulationConfig& config = SimulationConfig()
);

// Orders by the given strategy and simulates
PayoffPlan plan_with_strategy(
    const std::vector<DebtRecord>& debts,
    StrategyTag strategy,
    double monthly_budget,
    const SimulationConfig& config = SimulationConfig()
);

} // namespace debtfree

#endif // DEBTFREE_PAYOFF_HPP

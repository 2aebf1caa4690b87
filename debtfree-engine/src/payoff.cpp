#include "payoff.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace debtfree {

// ============================================================================
// SimulationResult / SimulationConfig
// ============================================================================

SimulationResult::SimulationResult()
    : months_to_payoff(0),
      interest_saved(0.0),
      baseline_interest(0.0),
      total_interest_paid(0.0),
      total_paid(0.0),
      converged(true) {}

SimulationConfig::SimulationConfig()
    : paid_off_epsilon(0.1),
      max_months(600),
      detailed_schedule(false) {}

// ============================================================================
// Simulation
// ============================================================================

namespace {

// Mutable copy of the fields the simulation needs
struct WorkingDebt {
    std::string id;
    double balance;
    double monthly_rate;
    double minimum_payment;
};

void validate_config(const SimulationConfig& config) {
    if (config.paid_off_epsilon < 0.0) {
        throw std::invalid_argument("paid_off_epsilon must be non-negative");
    }
    if (config.max_months < 0) {
        throw std::invalid_argument("max_months must be non-negative");
    }
}

void validate_and_log(const std::vector<DebtRecord>& debts) {
    for (const auto& debt : debts) {
        try {
            validate_debt(debt);
        } catch (const std::invalid_argument& e) {
            Logger::get_instance().log_validation_error(debt.id, e.what());
            throw;
        }
    }
}

} // anonymous namespace

double compute_baseline_interest(const std::vector<DebtRecord>& debts) {
    double baseline = 0.0;
    for (const auto& debt : debts) {
        if (debt.balance <= 0.0) {
            continue;
        }
        if (debt.minimum_payment <= 0.0) {
            throw InvalidMinimumPaymentError(debt.id);
        }
        // Kept in floating point; the ratio may exceed the int range
        const double months = std::ceil(debt.balance / debt.minimum_payment);
        baseline += debt.balance * debt.monthly_rate() * months;
    }
    return baseline;
}

SimulationResult simulate_payoff(
    const std::vector<DebtRecord>& ordered_debts,
    double monthly_budget,
    const SimulationConfig& config)
{
    auto start_time = std::chrono::steady_clock::now();

    validate_config(config);
    validate_and_log(ordered_debts);

    SimulationResult result;
    if (ordered_debts.empty()) {
        return result;
    }

    result.baseline_interest = compute_baseline_interest(ordered_debts);

    // Zero balances are already paid and take no part in the run
    std::vector<WorkingDebt> working;
    working.reserve(ordered_debts.size());
    for (const auto& debt : ordered_debts) {
        if (debt.balance > 0.0) {
            working.push_back({debt.id, debt.balance, debt.monthly_rate(), debt.minimum_payment});
        }
    }

    if (config.detailed_schedule) {
        result.schedule.reserve(static_cast<size_t>(config.max_months));
    }

    int months = 0;
    while (!working.empty() && months < config.max_months) {
        const int month = months + 1;

        // Interest
        double interest_this_month = 0.0;
        for (auto& debt : working) {
            double interest = debt.balance * debt.monthly_rate;
            debt.balance += interest;
            interest_this_month += interest;
        }
        result.total_interest_paid += interest_this_month;

        // Minimums
        double minimum_paid = 0.0;
        double minimum_total = 0.0;
        for (auto& debt : working) {
            double payment = std::min(debt.balance, debt.minimum_payment);
            debt.balance -= payment;
            minimum_paid += payment;
            minimum_total += debt.minimum_payment;
        }

        // Everything above the minimums goes to the first debt in priority order
        double extra_paid = 0.0;
        const double extra = std::max(0.0, monthly_budget - minimum_total);
        if (extra > 0.0) {
            extra_paid = std::min(working.front().balance, extra);
            working.front().balance -= extra_paid;
        }
        result.total_paid += minimum_paid + extra_paid;

        // Paid off
        auto paid_end = std::stable_partition(working.begin(), working.end(),
            [&config](const WorkingDebt& d) { return d.balance > config.paid_off_epsilon; });
        for (auto it = paid_end; it != working.end(); ++it) {
            result.payoff_order.push_back({it->id, month});
        }
        working.erase(paid_end, working.end());

        ++months;

        if (config.detailed_schedule) {
            MonthlySnapshot snapshot;
            snapshot.month = month;
            snapshot.interest_accrued = interest_this_month;
            snapshot.minimum_paid = minimum_paid;
            snapshot.extra_paid = extra_paid;
            snapshot.remaining_balance = 0.0;
            for (const auto& debt : working) {
                snapshot.remaining_balance += debt.balance;
            }
            snapshot.debts_remaining = working.size();
            result.schedule.push_back(snapshot);
        }
    }

    result.months_to_payoff = months;
    result.converged = working.empty();
    result.interest_saved = result.baseline_interest - result.total_interest_paid;

    auto end_time = std::chrono::steady_clock::now();
    double elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    Logger& logger = Logger::get_instance();
    SimulationContext ctx("simulate", ordered_debts.size(), monthly_budget);
    if (!result.converged) {
        double remaining = 0.0;
        for (const auto& debt : working) {
            remaining += debt.balance;
        }
        logger.log_simulation_capped(ctx, result, remaining);
    }
    logger.log_simulation_complete(ctx, result, elapsed_ms);

    return result;
}

PayoffPlan plan_with_strategy(
    const std::vector<DebtRecord>& debts,
    StrategyTag strategy,
    double monthly_budget,
    const SimulationConfig& config)
{
    PayoffPlan plan;
    plan.strategy = strategy;
    plan.ordered_debts = order_debts(debts, strategy);
    plan.result = simulate_payoff(plan.ordered_debts, monthly_budget, config);
    return plan;
}

PayoffPlan project_debt_free(
    const std::vector<DebtRecord>& debts,
    double monthly_budget,
    const SimulationConfig& config)
{
    return plan_with_strategy(debts, recommend_strategy(debts), monthly_budget, config);
}

} // namespace debtfree

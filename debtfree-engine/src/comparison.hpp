#ifndef DEBTFREE_COMPARISON_HPP
#define DEBTFREE_COMPARISON_HPP

#include "debt.hpp"
#include "payoff.hpp"
#include "strategy.hpp"
#include <vector>

namespace debtfree {

struct StrategyComparison {
    StrategyTag strategy;
    SimulationResult result;
};

// Orders and simulates the portfolio once per comparable strategy (Custom
// excluded) and returns the results sorted by months_to_payoff, fastest
// first. Ties keep enum order. Nothing is cached between calls.
// Each capped strategy logs its own simulation_capped WARN, so a budget
// below the interest yields five of them (see simulate_payoff).
std::vector<StrategyComparison> compare_strategies(
    const std::vector<DebtRecord>& debts,
    double monthly_budget,
    const SimulationConfig& config = SimulationConfig()
);

std::vector<StrategyComparison> compare_strategies(
    const Portfolio& portfolio,
    double monthly_budget,
    const SimulationConfig& config = SimulationConfig()
);

// Strategy of the first entry. Throws std::invalid_argument when empty.
StrategyTag best_strategy(const std::vector<StrategyComparison>& ranking);

} // namespace debtfree

#endif // DEBTFREE_COMPARISON_HPP

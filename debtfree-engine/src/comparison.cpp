#include "comparison.hpp"
#include "logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace debtfree {

std::vector<StrategyComparison> compare_strategies(
    const std::vector<DebtRecord>& debts,
    double monthly_budget,
    const SimulationConfig& config)
{
    std::vector<StrategyComparison> ranking;
    ranking.reserve(comparable_strategies().size());

    for (StrategyTag strategy : comparable_strategies()) {
        std::vector<DebtRecord> ordered = order_debts(debts, strategy);
        ranking.push_back({strategy, simulate_payoff(ordered, monthly_budget, config)});
    }

    std::stable_sort(ranking.begin(), ranking.end(),
                     [](const StrategyComparison& a, const StrategyComparison& b) {
                         return a.result.months_to_payoff < b.result.months_to_payoff;
                     });

    Logger::get_instance().log_comparison(ranking, monthly_budget);
    return ranking;
}

std::vector<StrategyComparison> compare_strategies(
    const Portfolio& portfolio,
    double monthly_budget,
    const SimulationConfig& config)
{
    return compare_strategies(portfolio.debts(), monthly_budget, config);
}

StrategyTag best_strategy(const std::vector<StrategyComparison>& ranking) {
    if (ranking.empty()) {
        throw std::invalid_argument("Cannot pick a strategy from an empty comparison");
    }
    return ranking.front().strategy;
}

} // namespace debtfree

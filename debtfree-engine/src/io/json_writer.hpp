#ifndef DEBTFREE_IO_JSON_WRITER_HPP
#define DEBTFREE_IO_JSON_WRITER_HPP

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "../comparison.hpp"
#include "../payoff.hpp"
#include "../planning.hpp"

namespace debtfree {
namespace io {

// Everything the CLI reports for one run
struct PlanReport {
    StrategyTag recommended_strategy;
    PayoffPlan plan;
    double monthly_budget;
    BudgetRange budget_range;
    double total_monthly_interest;
    std::vector<StrategyComparison> comparison;   // Empty unless requested
};

// Write a SimulationResult as a JSON object. The schedule is included when
// the result carries one.
void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  bool pretty_print = true);

// Write a comparison ranking as a JSON array
void write_comparison_json(std::ostream& os, const std::vector<StrategyComparison>& ranking,
                           bool pretty_print = true);

void write_plan_report_json(std::ostream& os, const PlanReport& report,
                            bool pretty_print = true);

void write_plan_report_json(const std::string& filepath, const PlanReport& report,
                            bool pretty_print = true);

} // namespace io
} // namespace debtfree

#endif // DEBTFREE_IO_JSON_WRITER_HPP

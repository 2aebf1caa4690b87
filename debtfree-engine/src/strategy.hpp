#ifndef DEBTFREE_STRATEGY_HPP
#define DEBTFREE_STRATEGY_HPP

#include "debt.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace debtfree {

enum class StrategyTag : uint8_t {
    Snowball = 0,
    Avalanche = 1,
    HighestBalance = 2,
    LowestBalance = 3,
    HighestInterest = 4,
    Custom = 5          // Caller-supplied order, never re-sorted
};

// Static description of a strategy. The sort key is not stored here;
// order_debts() switches on the tag.
struct StrategyInfo {
    StrategyTag tag;
    const char* key;            // CLI / config spelling, e.g. "highest-balance"
    const char* display_name;   // e.g. "Highest Balance First"
    const char* description;
};

const StrategyInfo& strategy_info(StrategyTag tag);

std::string strategy_to_string(StrategyTag tag);

// Accepts the key or the display name. Throws std::invalid_argument otherwise.
StrategyTag strategy_from_string(const std::string& text);

// The five strategies that define their own ordering, in enum order
const std::array<StrategyTag, 5>& comparable_strategies();

// Heuristic recommendation, first matching rule wins:
//   1. any rate > 15% and total balance > 10000       -> Avalanche
//   2. any balance < 1000 and at least 3 debts         -> Snowball
//   3. any balance > half of the total balance         -> HighestBalance
//   4. mean rate > 10%                                 -> HighestInterest
//   5. otherwise                                       -> Snowball
// An empty portfolio yields Snowball. The result does not depend on the
// order of the input.
StrategyTag recommend_strategy(const std::vector<DebtRecord>& debts);
StrategyTag recommend_strategy(const Portfolio& portfolio);

// Returns a reordered copy. The sort is stable so equal keys keep their
// input order; Custom returns the input order unchanged.
std::vector<DebtRecord> order_debts(const std::vector<DebtRecord>& debts, StrategyTag strategy);
std::vector<DebtRecord> order_debts(const Portfolio& portfolio, StrategyTag strategy);

} // namespace debtfree

#endif // DEBTFREE_STRATEGY_HPP

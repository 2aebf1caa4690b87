#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <string>
#include <vector>
#include "strategy.hpp"

using namespace debtfree;

namespace {

std::vector<std::string> ids_of(const std::vector<DebtRecord>& debts) {
    std::vector<std::string> ids;
    for (const auto& d : debts) {
        ids.push_back(d.id);
    }
    return ids;
}

std::vector<DebtRecord> mixed_portfolio() {
    return {
        DebtRecord("visa", 2500.0, 22.9, 75.0),
        DebtRecord("store", 800.0, 15.5, 25.0),
        DebtRecord("student", 12000.0, 6.5, 240.0),
        DebtRecord("car", 4300.0, 11.0, 110.0)
    };
}

} // anonymous namespace

TEST_CASE("Strategy metadata lookup", "[strategy]") {
    REQUIRE(strategy_to_string(StrategyTag::Snowball) == "snowball");
    REQUIRE(strategy_to_string(StrategyTag::HighestBalance) == "highest-balance");
    REQUIRE(std::string(strategy_info(StrategyTag::Avalanche).display_name) == "Avalanche Method");
    REQUIRE(std::string(strategy_info(StrategyTag::Custom).display_name) == "Custom Order");
    REQUIRE_FALSE(std::string(strategy_info(StrategyTag::LowestBalance).description).empty());

    REQUIRE(strategy_from_string("avalanche") == StrategyTag::Avalanche);
    REQUIRE(strategy_from_string("Highest Interest First") == StrategyTag::HighestInterest);
    REQUIRE(strategy_from_string("custom") == StrategyTag::Custom);
    REQUIRE_THROWS_AS(strategy_from_string("fastest"), std::invalid_argument);
}

TEST_CASE("Comparable strategies exclude Custom", "[strategy]") {
    const auto& tags = comparable_strategies();
    REQUIRE(tags.size() == 5);
    REQUIRE(std::find(tags.begin(), tags.end(), StrategyTag::Custom) == tags.end());
    REQUIRE(tags.front() == StrategyTag::Snowball);
}

TEST_CASE("Recommendation rules in priority order", "[strategy][recommend]") {
    SECTION("Empty portfolio defaults to Snowball") {
        REQUIRE(recommend_strategy(std::vector<DebtRecord>{}) == StrategyTag::Snowball);
    }

    SECTION("High rate with a large total picks Avalanche") {
        std::vector<DebtRecord> debts = {
            DebtRecord("card", 6000.0, 19.9, 180.0),
            DebtRecord("loan", 5000.0, 5.0, 100.0)
        };
        REQUIRE(recommend_strategy(debts) == StrategyTag::Avalanche);
    }

    SECTION("High rate but total at the 10000 threshold does not pick Avalanche") {
        std::vector<DebtRecord> debts = {
            DebtRecord("card", 5000.0, 19.9, 150.0),
            DebtRecord("loan", 5000.0, 5.0, 100.0)
        };
        // No small balance, nothing above half, mean rate 12.45
        REQUIRE(recommend_strategy(debts) == StrategyTag::HighestInterest);
    }

    SECTION("Small balance among three or more debts picks Snowball") {
        std::vector<DebtRecord> debts = {
            DebtRecord("a", 900.0, 8.0, 30.0),
            DebtRecord("b", 3000.0, 8.0, 90.0),
            DebtRecord("c", 4000.0, 8.0, 120.0)
        };
        REQUIRE(recommend_strategy(debts) == StrategyTag::Snowball);
    }

    SECTION("Small balance with only two debts falls through") {
        std::vector<DebtRecord> debts = {
            DebtRecord("a", 900.0, 8.0, 30.0),
            DebtRecord("b", 3000.0, 8.0, 90.0)
        };
        // 3000 is more than half of 3900
        REQUIRE(recommend_strategy(debts) == StrategyTag::HighestBalance);
    }

    SECTION("Dominant balance picks HighestBalance") {
        std::vector<DebtRecord> debts = {
            DebtRecord("mortgage", 9000.0, 4.0, 300.0),
            DebtRecord("car", 2000.0, 6.0, 80.0),
            DebtRecord("card", 1500.0, 12.0, 45.0)
        };
        REQUIRE(recommend_strategy(debts) == StrategyTag::HighestBalance);
    }

    SECTION("High mean rate picks HighestInterest") {
        std::vector<DebtRecord> debts = {
            DebtRecord("a", 2000.0, 12.0, 60.0),
            DebtRecord("b", 2500.0, 11.0, 70.0),
            DebtRecord("c", 3000.0, 14.0, 90.0)
        };
        REQUIRE(recommend_strategy(debts) == StrategyTag::HighestInterest);
    }

    SECTION("Nothing matches falls back to Snowball") {
        std::vector<DebtRecord> debts = {
            DebtRecord("a", 2000.0, 4.0, 60.0),
            DebtRecord("b", 2500.0, 5.0, 70.0),
            DebtRecord("c", 3000.0, 6.0, 90.0)
        };
        REQUIRE(recommend_strategy(debts) == StrategyTag::Snowball);
    }

    SECTION("Mixed sample portfolio") {
        // 22.9% rate and 19600 total
        REQUIRE(recommend_strategy(mixed_portfolio()) == StrategyTag::Avalanche);
    }
}

TEST_CASE("Recommendation ignores input order", "[strategy][recommend]") {
    std::vector<DebtRecord> debts = {
        DebtRecord("a", 0.1, 10.0, 1.0),
        DebtRecord("b", 3333.3, 10.000000001, 90.0),
        DebtRecord("c", 3333.3, 9.999999999, 90.0),
        DebtRecord("d", 3333.3, 10.0, 90.0)
    };

    StrategyTag expected = recommend_strategy(debts);
    std::sort(debts.begin(), debts.end(),
              [](const DebtRecord& x, const DebtRecord& y) { return x.id < y.id; });
    do {
        REQUIRE(recommend_strategy(debts) == expected);
    } while (std::next_permutation(debts.begin(), debts.end(),
                                   [](const DebtRecord& x, const DebtRecord& y) { return x.id < y.id; }));
}

TEST_CASE("Order by strategy", "[strategy][order]") {
    auto debts = mixed_portfolio();

    SECTION("Snowball sorts balances ascending") {
        auto ordered = order_debts(debts, StrategyTag::Snowball);
        REQUIRE(ids_of(ordered) == std::vector<std::string>{"store", "visa", "car", "student"});
        for (size_t i = 1; i < ordered.size(); ++i) {
            REQUIRE(ordered[i - 1].balance <= ordered[i].balance);
        }
    }

    SECTION("LowestBalance matches Snowball") {
        REQUIRE(ids_of(order_debts(debts, StrategyTag::LowestBalance)) ==
                ids_of(order_debts(debts, StrategyTag::Snowball)));
    }

    SECTION("Avalanche sorts rates descending") {
        auto ordered = order_debts(debts, StrategyTag::Avalanche);
        REQUIRE(ids_of(ordered) == std::vector<std::string>{"visa", "store", "car", "student"});
        for (size_t i = 1; i < ordered.size(); ++i) {
            REQUIRE(ordered[i - 1].annual_interest_rate_percent >=
                    ordered[i].annual_interest_rate_percent);
        }
    }

    SECTION("HighestInterest matches Avalanche") {
        REQUIRE(ids_of(order_debts(debts, StrategyTag::HighestInterest)) ==
                ids_of(order_debts(debts, StrategyTag::Avalanche)));
    }

    SECTION("HighestBalance sorts balances descending") {
        auto ordered = order_debts(debts, StrategyTag::HighestBalance);
        REQUIRE(ids_of(ordered) == std::vector<std::string>{"student", "car", "visa", "store"});
    }

    SECTION("Custom keeps the input order") {
        REQUIRE(ids_of(order_debts(debts, StrategyTag::Custom)) == ids_of(debts));
    }

    SECTION("Input is left untouched") {
        auto copy = debts;
        order_debts(debts, StrategyTag::HighestBalance);
        REQUIRE(debts == copy);
    }
}

TEST_CASE("Ordering is stable for equal keys", "[strategy][order]") {
    std::vector<DebtRecord> debts = {
        DebtRecord("first", 500.0, 10.0, 20.0),
        DebtRecord("big", 900.0, 10.0, 20.0),
        DebtRecord("second", 500.0, 10.0, 20.0),
        DebtRecord("third", 500.0, 10.0, 20.0)
    };

    REQUIRE(ids_of(order_debts(debts, StrategyTag::Snowball)) ==
            std::vector<std::string>{"first", "second", "third", "big"});
    REQUIRE(ids_of(order_debts(debts, StrategyTag::HighestBalance)) ==
            std::vector<std::string>{"big", "first", "second", "third"});
    // All rates are equal
    REQUIRE(ids_of(order_debts(debts, StrategyTag::Avalanche)) == ids_of(debts));
}

TEST_CASE("Ordering is a permutation for every strategy", "[strategy][order]") {
    auto debts = mixed_portfolio();
    auto expected = ids_of(debts);
    std::sort(expected.begin(), expected.end());

    for (StrategyTag tag : {StrategyTag::Snowball, StrategyTag::Avalanche, StrategyTag::HighestBalance,
                            StrategyTag::LowestBalance, StrategyTag::HighestInterest, StrategyTag::Custom}) {
        auto ids = ids_of(order_debts(debts, tag));
        std::sort(ids.begin(), ids.end());
        REQUIRE(ids == expected);
    }

    REQUIRE(order_debts(std::vector<DebtRecord>{}, StrategyTag::Snowball).empty());
}

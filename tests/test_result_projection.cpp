/*
===============================================================================
TEST RESULT PROJECTION — Tests for result_projection.h
===============================================================================

OVERVIEW
--------
Validates the pure projection from raw solver values to a PlanResult:
rounding of tolerance noise, zero-filling, aggregates and placeholder
reporting. No Gurobi license is needed; values are written by hand.

TEST ORGANIZATION
-----------------
• Section A: Rounding
• Section B: Completeness and aggregates
• Section C: No incumbent
• Section D: Placeholders

DEPENDENCIES
------------
• Catch2 v3 - Test framework
• result_projection.h - System under test

===============================================================================
*/

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <meal_planner/result_projection.h>

#include "test_support.h"

#include <vector>

using namespace mealplan;
using mealplan::testing::recipe;
using mealplan::testing::sku;

namespace {

    std::vector<RecipeOption> recipes() {
        return {
            recipe("r1", 4, { { "a", 1.0 } }),
            recipe("r2", 6, { { "b", 2.0 } }),
        };
    }

    std::vector<SupplyOption> supply() {
        return {
            sku("s1", "a", 2.0, 3.0),
            sku("s2", "b", 4.0, 2.0),
            sku(placeholderSkuId("c"), "c", 999999.0, 1.0),
        };
    }

    SolvedValues optimal() {
        SolvedValues v;
        v.status = PlanStatus::Optimal;
        v.has_incumbent = true;
        v.objective = 8.0002;
        v.mip_gap = 0.0;
        v.runtime_seconds = 0.25;
        v.batches = { { "r1", 1.9999999 }, { "r2", 1.0000001 } };
        v.units = { { "s1", 1.0 }, { "s2", 1.0 }, { placeholderSkuId("c"), -1e-9 } };
        return v;
    }

} // namespace

// ============================================================================
// SECTION A: ROUNDING
// ============================================================================

TEST_CASE("A1: Projection::ToCount", "[projection][rounding]")
{
    REQUIRE(toCount(1.9999999) == 2);
    REQUIRE(toCount(2.0000001) == 2);
    REQUIRE(toCount(-1e-9) == 0);
    REQUIRE(toCount(-0.7) == 0);
    REQUIRE(toCount(0.0) == 0);
}

TEST_CASE("A2: Projection::NoiseIsRemoved", "[projection][rounding]")
{
    PlanResult r = projectResult(optimal(), recipes(), supply());

    REQUIRE(r.recipe_batches.at("r1") == 2);
    REQUIRE(r.recipe_batches.at("r2") == 1);
    REQUIRE(r.sku_units.at(placeholderSkuId("c")) == 0);
}

// ============================================================================
// SECTION B: COMPLETENESS AND AGGREGATES
// ============================================================================

TEST_CASE("B1: Projection::Aggregates", "[projection][aggregates]")
{
    PlanResult r = projectResult(optimal(), recipes(), supply());

    REQUIRE(r.status == PlanStatus::Optimal);
    REQUIRE(r.has_incumbent);
    REQUIRE(r.usable());
    REQUIRE(r.total_batches == 3);
    REQUIRE(r.total_servings == 2 * 4 + 1 * 6);
    REQUIRE(r.grocery_cost == Catch::Approx(5.0));
    REQUIRE(r.objective_value.has_value());
    REQUIRE(*r.objective_value == Catch::Approx(8.0002));
    REQUIRE(r.runtime_seconds == Catch::Approx(0.25));
}

TEST_CASE("B2: Projection::EveryInputIdPresent", "[projection][aggregates]")
{
    SolvedValues v = optimal();
    v.batches.erase("r2");
    v.units.erase("s2");

    PlanResult r = projectResult(v, recipes(), supply());

    REQUIRE(r.recipe_batches.size() == 2);
    REQUIRE(r.sku_units.size() == 3);
    REQUIRE(r.recipe_batches.at("r2") == 0);
    REQUIRE(r.sku_units.at("s2") == 0);
}

// ============================================================================
// SECTION C: NO INCUMBENT
// ============================================================================

/**
 * @test Projection::NoIncumbentIsAllZero
 * @given An infeasible outcome that still carries stale values
 * @then Counts are zero and objective/gap are absent
 */
TEST_CASE("C1: Projection::NoIncumbentIsAllZero", "[projection][status]")
{
    SolvedValues v = optimal();
    v.status = PlanStatus::Infeasible;
    v.has_incumbent = false;

    PlanResult r = projectResult(v, recipes(), supply());

    REQUIRE(r.status == PlanStatus::Infeasible);
    REQUIRE_FALSE(r.usable());
    REQUIRE_FALSE(r.objective_value.has_value());
    REQUIRE_FALSE(r.mip_gap.has_value());
    REQUIRE(r.total_batches == 0);
    REQUIRE(r.total_servings == 0);
    REQUIRE(r.grocery_cost == 0.0);
    for (const auto& [id, n] : r.recipe_batches) {
        REQUIRE(n == 0);
    }
    for (const auto& [id, n] : r.sku_units) {
        REQUIRE(n == 0);
    }
}

TEST_CASE("C2: Projection::TimeLimitWithIncumbentIsUsable", "[projection][status]")
{
    SolvedValues v = optimal();
    v.status = PlanStatus::NotSolved;
    v.mip_gap = 0.12;

    PlanResult r = projectResult(v, recipes(), supply());

    REQUIRE(r.usable());
    REQUIRE(*r.mip_gap == Catch::Approx(0.12));
    REQUIRE(r.total_batches == 3);
}

// ============================================================================
// SECTION D: PLACEHOLDERS
// ============================================================================

TEST_CASE("D1: Projection::PlaceholderIngredientsReported", "[projection][placeholder]")
{
    SolvedValues v = optimal();

    SECTION("unused placeholder is not reported") {
        PlanResult r = projectResult(v, recipes(), supply());
        REQUIRE_FALSE(r.usedPlaceholders());
    }

    SECTION("purchased placeholder is reported") {
        v.units[placeholderSkuId("c")] = 1.0;
        PlanResult r = projectResult(v, recipes(), supply());

        REQUIRE(r.usedPlaceholders());
        REQUIRE(r.placeholder_ingredients == std::vector<IngredientId>{ "c" });
        REQUIRE(r.grocery_cost == Catch::Approx(6.0));
    }
}

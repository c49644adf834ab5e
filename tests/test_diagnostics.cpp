/*
===============================================================================
TEST DIAGNOSTICS — Tests for diagnostics.h
===============================================================================

OVERVIEW
--------
Validates Gurobi status strings, the Gurobi -> PlanStatus mapping table,
model statistics and summaries, and IIS extraction with readable row names.

TEST ORGANIZATION
-----------------
• Section A: Status strings
• Section B: PlanStatus mapping
• Section C: Model statistics and summary
• Section D: IIS computation

DEPENDENCIES
------------
• Catch2 v3 - Test framework
• diagnostics.h - System under test
• constraints.h, variables.h - Row and variable creation
• Gurobi - a license is required for Sections C and D

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <meal_planner/constraints.h>
#include <meal_planner/diagnostics.h>
#include <meal_planner/variables.h>

#include "test_support.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace mealplan;
using mealplan::testing::makeModel;

// ============================================================================
// SECTION A: STATUS STRINGS
// ============================================================================

TEST_CASE("A1: StatusString::KnownAndUnknown", "[diagnostics][status]")
{
    REQUIRE(statusString(GRB_OPTIMAL) == "OPTIMAL");
    REQUIRE(statusString(GRB_INFEASIBLE) == "INFEASIBLE");
    REQUIRE(statusString(GRB_TIME_LIMIT) == "TIME_LIMIT");
    REQUIRE(statusString(GRB_INF_OR_UNBD) == "INF_OR_UNBD");
    REQUIRE(statusString(9999) == "UNKNOWN(9999)");
}

// ============================================================================
// SECTION B: PLANSTATUS MAPPING
// ============================================================================

/**
 * @test PlanStatus::MappingTable
 * @brief Every Gurobi termination lands in the five-value vocabulary
 */
TEST_CASE("B1: PlanStatus::MappingTable", "[diagnostics][status][plan]")
{
    REQUIRE(toPlanStatus(GRB_OPTIMAL) == PlanStatus::Optimal);

    REQUIRE(toPlanStatus(GRB_INFEASIBLE) == PlanStatus::Infeasible);
    REQUIRE(toPlanStatus(GRB_INF_OR_UNBD) == PlanStatus::Infeasible);

    REQUIRE(toPlanStatus(GRB_UNBOUNDED) == PlanStatus::Unbounded);

    for (int s : { GRB_TIME_LIMIT, GRB_NODE_LIMIT, GRB_SOLUTION_LIMIT, GRB_INTERRUPTED,
                   GRB_SUBOPTIMAL, GRB_ITERATION_LIMIT, GRB_USER_OBJ_LIMIT }) {
        INFO("status " << statusString(s));
        REQUIRE(toPlanStatus(s) == PlanStatus::NotSolved);
    }

    for (int s : { GRB_LOADED, GRB_NUMERIC, GRB_CUTOFF, GRB_INPROGRESS, -1, 9999 }) {
        INFO("status " << statusString(s));
        REQUIRE(toPlanStatus(s) == PlanStatus::Undefined);
    }
}

TEST_CASE("B2: PlanStatus::Strings", "[diagnostics][status][plan]")
{
    REQUIRE(toString(PlanStatus::Optimal) == "Optimal");
    REQUIRE(toString(PlanStatus::NotSolved) == "Not Solved");
    REQUIRE(parsePlanStatus("Not Solved") == PlanStatus::NotSolved);
    REQUIRE(parsePlanStatus("Undefined") == PlanStatus::Undefined);
    REQUIRE_THROWS_AS(parsePlanStatus("optimal"), InvalidPlanInput);
}

// ============================================================================
// SECTION C: MODEL STATISTICS AND SUMMARY
// ============================================================================

TEST_CASE("C1: Statistics::CountsByType", "[diagnostics][statistics]")
{
    GRBModel model = makeModel();
    GRBVar b = model.addVar(0.0, 1.0, 0.0, GRB_BINARY);
    GRBVar i = model.addVar(0.0, 10.0, 0.0, GRB_INTEGER);
    GRBVar c = model.addVar(0.0, 10.0, 0.0, GRB_CONTINUOUS);
    model.addConstr(b + i + c <= 5.0);
    model.addConstr(i - c >= 0.0);
    model.update();

    auto stats = computeStatistics(model);
    REQUIRE(stats.numVars == 3);
    REQUIRE(stats.numBinary == 1);
    REQUIRE(stats.numInteger == 1);
    REQUIRE(stats.numContinuous == 1);
    REQUIRE(stats.numConstrs == 2);
    REQUIRE(stats.numNonZeros == 5);
}

TEST_CASE("C2: Summary::OneLine", "[diagnostics][summary]")
{
    GRBModel model = makeModel();
    std::vector<std::string> ids{ "soup", "stew" };
    auto B = VariableFactory::addKeyed(model, GRB_INTEGER, 0.0, GRB_INFINITY, "batches", ids);
    model.addConstr(B.at("soup") + B.at("stew") >= 1.0);
    model.update();

    REQUIRE(modelSummary(model) == "2 vars (2 int), 1 constrs, 2 nz");
}

TEST_CASE("C3: Summary::EmptyModel", "[diagnostics][summary]")
{
    GRBModel model = makeModel();
    model.update();

    REQUIRE(modelSummary(model) == "0 vars, 0 constrs, 0 nz");
}

// ============================================================================
// SECTION D: IIS COMPUTATION
// ============================================================================

/**
 * @test IIS::NamesConflictingRows
 * @given batches[soup] required >= 1 while its only ingredient is capped at 0
 * @then The IIS names both rows and not the unrelated one
 */
TEST_CASE("D1: IIS::NamesConflictingRows", "[diagnostics][iis]")
{
    GRBModel model = makeModel();
    std::vector<std::string> ids{ "soup", "salad" };
    auto B = VariableFactory::addKeyed(model, GRB_INTEGER, 0.0, GRB_INFINITY, "batches", ids);

    std::vector<std::string> soup{ "soup" };
    ConstraintFactory::addKeyed(model, "required_recipe", soup,
        [&](const std::string& r) { return GRBLinExpr(B.at(r)) >= 1.0; }, true);
    std::vector<std::string> basil{ "basil" };
    ConstraintFactory::addKeyed(model, "ingredient_balance", basil,
        [&](const std::string&) { return 2.0 * B.at("soup") <= 0.0; }, true);
    ConstraintFactory::addScalar(model, "salad_cap", GRBLinExpr(B.at("salad")) <= 3.0, true);
    model.optimize();
    REQUIRE(model.get(GRB_IntAttr_Status) != GRB_OPTIMAL);

    auto iis = computeIIS(model);
    auto names = iis.constraintNames();

    REQUIRE_FALSE(iis.empty());
    REQUIRE(std::find(names.begin(), names.end(), "required_recipe[soup]") != names.end());
    REQUIRE(std::find(names.begin(), names.end(), "ingredient_balance[basil]") != names.end());
    REQUIRE(std::find(names.begin(), names.end(), "salad_cap") == names.end());
    REQUIRE(iis.size() >= names.size());
}

TEST_CASE("D2: IIS::FeasibleModelThrows", "[diagnostics][iis][errors]")
{
    GRBModel model = makeModel();
    GRBVar x = model.addVar(0.0, 1.0, 1.0, GRB_CONTINUOUS);
    model.addConstr(x >= 0.5);
    model.optimize();

    REQUIRE_THROWS_AS(computeIIS(model), GRBException);
}

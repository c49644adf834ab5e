#pragma once
/*
===============================================================================
MEAL PLANNER — Unified Include Header
===============================================================================

WHAT'S INCLUDED
---------------
Planning
• plan_types.h         — RecipeOption, SupplyOption, PlanOptions, PlanResult
• errors.h             — InvalidPlanInput
• validation.h         — request checks, tie-breaker safety
• planner.h            — solve()
• supply_preparation.h — price-row filtering, placeholder injection
• shopping_list.h      — per-ingredient consolidation of a plan
• anomaly.h            — advisory outlier flags
• json_io.h            — request / config / result documents

Modeling kernel
• enum_utils.h, naming.h, variables.h, constraints.h, expressions.h
• model_builder.h      — template-method ModelBuilder<VarEnum, ConEnum>
• plan_builder.h       — the meal-plan MILP
• result_projection.h  — solver values into PlanResult
• callbacks.h          — MIP progress callback
• diagnostics.h        — status mapping, statistics, IIS

QUICK START
-----------
    #include <meal_planner/meal_planner.h>

    std::vector<mealplan::RecipeOption> recipes = {
        {"pancakes", 4, {{"flour", 250.0}, {"milk", 300.0}}, mealplan::MealType::Entree},
    };
    std::vector<mealplan::SupplyOption> supply = {
        {"flour-1kg", "flour", 1000.0, 2.49},
        {"milk-1l",   "milk",  1000.0, 1.19},
    };

    auto result = mealplan::solve(8, recipes, supply);
    if (result.usable()) {
        auto list = mealplan::buildShoppingList(result, recipes, supply);
    }

REQUIREMENTS
------------
• C++20 compiler (GCC 12+, Clang 15+, MSVC 19.29+)
• Gurobi Optimizer 10.0+ with C++ API
• Abseil (log, flags), nlohmann_json 3.x

CONFIGURATION
-------------
• MEALPLAN_DEBUG or _DEBUG: variables get readable names ("batches[soup]").
  Constraint rows of the plan model are always named.

===============================================================================
*/

#include "enum_utils.h"
#include "naming.h"
#include "errors.h"
#include "plan_types.h"
#include "variables.h"
#include "constraints.h"
#include "expressions.h"
#include "model_builder.h"
#include "diagnostics.h"
#include "callbacks.h"
#include "validation.h"
#include "plan_builder.h"
#include "result_projection.h"
#include "planner.h"
#include "supply_preparation.h"
#include "shopping_list.h"
#include "anomaly.h"
#include "json_io.h"

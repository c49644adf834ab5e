/*
===============================================================================
TEST JSON I/O — Tests for json_io.h
===============================================================================

OVERVIEW
--------
Validates the request, configuration and result documents: defaults and
overlays, error mapping to InvalidPlanInput, the result schema version and
the report assembled by the command-line driver.

TEST ORGANIZATION
-----------------
• Section A: Requests
• Section B: Configuration overlay
• Section C: Results and reports
• Section D: Errors

DEPENDENCIES
------------
• Catch2 v3 - Test framework
• nlohmann_json - Document model
• json_io.h - System under test

===============================================================================
*/

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <meal_planner/json_io.h>

#include "test_support.h"

#include <set>
#include <string>
#include <vector>

using namespace mealplan;
using mealplan::testing::recipe;
using mealplan::testing::sku;

namespace {

    const char* kRequest = R"({
        "target_servings": 12,
        "recipes": [
            { "recipe_id": "soup", "servings_per_batch": 4,
              "ingredient_requirements": { "tomato": 2.0, "onion": 1 },
              "meal_type": "Entree" },
            { "recipe_id": "water", "servings_per_batch": 1 }
        ],
        "supply": [
            { "sku_id": "tomato-can", "ingredient_id": "tomato",
              "quantity_per_unit": 3, "unit_cost": 2.5, "retailer": "corner" },
            { "sku_id": "onion-net", "ingredient_id": "onion", "quantity_per_unit": 6 }
        ],
        "retailers": [ "corner" ],
        "options": {
            "time_limit_seconds": 4,
            "meal_type_minimums": { "entree": 1 },
            "required_recipe_ids": [ "soup" ],
            "explain_infeasibility": true
        }
    })";

} // namespace

// ============================================================================
// SECTION A: REQUESTS
// ============================================================================

TEST_CASE("A1: Request::ParseFields", "[json][request]")
{
    PlanRequest r = parsePlanRequest(kRequest);

    REQUIRE(r.target_servings == 12);
    REQUIRE(r.recipes.size() == 2);
    REQUIRE(r.recipes[0].meal_type == MealType::Entree);
    REQUIRE(r.recipes[0].ingredient_requirements.at("onion") == Catch::Approx(1.0));
    REQUIRE(r.recipes[1].meal_type == MealType::Unknown);
    REQUIRE(r.recipes[1].ingredient_requirements.empty());

    REQUIRE(r.supply.size() == 2);
    REQUIRE(r.supply[0].retailer == "corner");
    REQUIRE(r.supply[1].unit_cost == 0.0);
    REQUIRE(r.retailers == std::set<std::string>{ "corner" });

    REQUIRE(r.options.time_limit_seconds == Catch::Approx(4.0));
    REQUIRE(r.options.batch_penalty == Catch::Approx(1e-4));
    REQUIRE(r.options.meal_type_minimums.at(MealType::Entree) == 1);
    REQUIRE(r.options.required_recipe_ids == std::set<RecipeId>{ "soup" });
    REQUIRE(r.options.explain_infeasibility);
    REQUIRE(r.placeholders.enabled);
}

/**
 * @test Request::RoundTrip
 * @then Serializing a parsed request and parsing it again keeps every field
 */
TEST_CASE("A2: Request::RoundTrip", "[json][request]")
{
    PlanRequest first = parsePlanRequest(kRequest);
    first.options.mip_gap = 0.02;
    first.placeholders.enabled = false;

    json doc = first;
    PlanRequest second = parsePlanRequest(doc.dump());

    REQUIRE(second.target_servings == first.target_servings);
    REQUIRE(second.recipes.size() == first.recipes.size());
    REQUIRE(second.recipes[0].ingredient_requirements == first.recipes[0].ingredient_requirements);
    REQUIRE(second.supply[0].sku_id == first.supply[0].sku_id);
    REQUIRE(second.retailers == first.retailers);
    REQUIRE(second.options.mip_gap.has_value());
    REQUIRE(*second.options.mip_gap == Catch::Approx(0.02));
    REQUIRE(second.options.meal_type_minimums == first.options.meal_type_minimums);
    REQUIRE_FALSE(second.placeholders.enabled);
}

TEST_CASE("A3: Request::MealTypeTags", "[json][request]")
{
    REQUIRE(parseMealType("  Dessert\t") == MealType::Dessert);
    REQUIRE(parseMealType("SIDE") == MealType::Side);
    REQUIRE(parseMealType(" ") == MealType::Unknown);
    REQUIRE_THROWS_AS(parseMealType("en tree"), InvalidPlanInput);

    PlanRequest r = parsePlanRequest(R"({ "target_servings": 2,
        "recipes": [ { "recipe_id": "pie", "servings_per_batch": 8, "meal_type": " dessert " } ] })");
    REQUIRE(r.recipes[0].meal_type == MealType::Dessert);
}

// ============================================================================
// SECTION B: CONFIGURATION OVERLAY
// ============================================================================

TEST_CASE("B1: Config::DefaultsFeedRequest", "[json][config]")
{
    PlannerConfig config = parsePlannerConfig(R"({
        "time_limit_seconds": 30,
        "batch_penalty": 0.001,
        "threads": 2,
        "mip_gap": 0.01,
        "placeholders": { "unit_cost": 5.0 }
    })");

    REQUIRE(config.time_limit_seconds == Catch::Approx(30.0));
    REQUIRE(config.placeholders.unit_cost == Catch::Approx(5.0));
    REQUIRE(config.placeholders.quantity_per_unit == Catch::Approx(999999.0));

    PlanRequest r = parsePlanRequest(kRequest, config);

    REQUIRE(r.options.time_limit_seconds == Catch::Approx(4.0));
    REQUIRE(r.options.batch_penalty == Catch::Approx(0.001));
    REQUIRE(r.options.threads == 2);
    REQUIRE(*r.options.mip_gap == Catch::Approx(0.01));
    REQUIRE(r.placeholders.unit_cost == Catch::Approx(5.0));
}

TEST_CASE("B2: Config::NullGapClearsDefault", "[json][config]")
{
    PlannerConfig config;
    config.mip_gap = 0.05;

    PlanRequest r = parsePlanRequest(
        R"({ "target_servings": 1, "recipes": [], "options": { "mip_gap": null } })", config);

    REQUIRE_FALSE(r.options.mip_gap.has_value());
}

// ============================================================================
// SECTION C: RESULTS AND REPORTS
// ============================================================================

TEST_CASE("C1: Result::VersionedDocument", "[json][result]")
{
    PlanResult r;
    r.status = PlanStatus::NotSolved;
    r.has_incumbent = true;
    r.objective_value = 12.5;
    r.recipe_batches = { { "soup", 3 } };
    r.sku_units = { { "tomato-can", 2 } };
    r.grocery_cost = 12.5;
    r.total_batches = 3;
    r.total_servings = 12;
    r.mip_gap = 0.1;

    json doc = r;
    REQUIRE(doc.at("schema_version") == 1);
    REQUIRE(doc.at("status") == "Not Solved");

    PlanResult back = parsePlanResult(doc.dump());
    REQUIRE(back.status == PlanStatus::NotSolved);
    REQUIRE(back.usable());
    REQUIRE(*back.objective_value == Catch::Approx(12.5));
    REQUIRE(back.recipe_batches.at("soup") == 3);
    REQUIRE(*back.mip_gap == Catch::Approx(0.1));
}

TEST_CASE("C2: Result::NoIncumbentIsNull", "[json][result]")
{
    PlanResult r;
    r.status = PlanStatus::Infeasible;
    r.conflicting_constraints = { "required_recipe[pesto]" };

    json doc = r;
    REQUIRE(doc.at("objective_value").is_null());
    REQUIRE(doc.at("mip_gap").is_null());

    PlanResult back = parsePlanResult(doc.dump());
    REQUIRE_FALSE(back.objective_value.has_value());
    REQUIRE_FALSE(back.has_incumbent);
    REQUIRE(back.conflicting_constraints == r.conflicting_constraints);
}

TEST_CASE("C3: Report::SectionsPresent", "[json][report]")
{
    PlanResult r;
    r.status = PlanStatus::Optimal;
    r.has_incumbent = true;
    r.objective_value = 2.0;

    ShoppingList list;
    ShoppingLine line;
    line.sku_id = "tomato-can";
    line.ingredient_id = "tomato";
    line.units = 1;
    line.unit_cost = 2.0;
    line.line_cost = 2.0;
    list.lines.push_back(line);
    list.ingredients["tomato"] = IngredientTotals{ 2.0, 3.0, 1.0 };
    list.total_cost = 2.0;

    json report = planReport(r, list, {}, { "basil" });

    REQUIRE(report.at("schema_version") == 1);
    REQUIRE(report.at("shopping_list").at("lines").size() == 1);
    REQUIRE(report.at("shopping_list").at("ingredients").at("tomato").at("leftover") == 1.0);
    REQUIRE(report.at("anomalies").empty());
    REQUIRE(report.at("missing_ingredients") == json::array({ "basil" }));
}

// ============================================================================
// SECTION D: ERRORS
// ============================================================================

TEST_CASE("D1: Errors::MalformedJsonIsInvalidInput", "[json][errors]")
{
    SECTION("syntax") {
        try {
            parsePlanRequest("{ not json");
            FAIL("expected InvalidPlanInput");
        } catch (const InvalidPlanInput& e) {
            REQUIRE(e.field() == "json");
        }
    }

    SECTION("missing key") {
        REQUIRE_THROWS_AS(parsePlanRequest(R"({ "recipes": [] })"), InvalidPlanInput);
    }

    SECTION("wrong type") {
        REQUIRE_THROWS_AS(parsePlanRequest(R"({ "target_servings": "many", "recipes": [] })"),
                          InvalidPlanInput);
    }

    SECTION("unknown meal type") {
        try {
            parsePlanRequest(R"({ "target_servings": 1,
                "recipes": [ { "recipe_id": "x", "servings_per_batch": 1, "meal_type": "brunch" } ] })");
            FAIL("expected InvalidPlanInput");
        } catch (const InvalidPlanInput& e) {
            REQUIRE(e.field() == "meal_type");
        }
    }
}

TEST_CASE("D2: Errors::UnsupportedSchemaVersion", "[json][errors]")
{
    json doc = PlanResult{};
    doc["schema_version"] = 2;

    try {
        parsePlanResult(doc.dump());
        FAIL("expected InvalidPlanInput");
    } catch (const InvalidPlanInput& e) {
        REQUIRE(e.field() == "schema_version");
    }
}

TEST_CASE("D3: Errors::MissingFileIsRuntimeError", "[json][errors]")
{
    REQUIRE_THROWS_AS(loadPlanRequest("/nonexistent/meal_planner/request.json"), std::runtime_error);
}

/**
 * @test Errors::FractionalCountIsInvalidInput
 * @then A count given as a non-integral or out-of-range number is rejected
 *       under its own field name instead of being truncated
 */
TEST_CASE("D4: Errors::FractionalCountIsInvalidInput", "[json][errors]")
{
    auto fieldOf = [](const std::string& text) -> std::string {
        try {
            parsePlanRequest(text);
        } catch (const InvalidPlanInput& e) {
            return e.field();
        }
        return "";
    };

    SECTION("target servings") {
        REQUIRE(fieldOf(R"({ "target_servings": 4.7, "recipes": [] })") == "target_servings");
        REQUIRE(fieldOf(R"({ "target_servings": 1e12, "recipes": [] })") == "target_servings");
        REQUIRE(fieldOf(R"({ "target_servings": 3000000000, "recipes": [] })") == "target_servings");
        REQUIRE(fieldOf(R"({ "target_servings": -3000000000, "recipes": [] })") == "target_servings");
    }

    SECTION("servings per batch") {
        REQUIRE(fieldOf(R"({ "target_servings": 4,
            "recipes": [ { "recipe_id": "soup", "servings_per_batch": 2.5 } ] })")
                == "recipes[soup].servings_per_batch");
    }

    SECTION("meal-type minimum") {
        REQUIRE(fieldOf(R"({ "target_servings": 4, "recipes": [],
            "options": { "meal_type_minimums": { "entree": 1.9 } } })")
                == "meal_type_minimums[entree]");
    }

    SECTION("threads and servings per person") {
        REQUIRE(fieldOf(R"({ "target_servings": 4, "recipes": [],
            "options": { "threads": 0.5 } })") == "threads");
        REQUIRE(fieldOf(R"({ "target_servings": 4, "recipes": [],
            "options": { "include_every_servings_per_person": "2" } })")
                == "include_every_servings_per_person");
    }

    SECTION("integral values are accepted") {
        REQUIRE(fieldOf(R"({ "target_servings": 4, "recipes": [],
            "options": { "threads": 2, "meal_type_minimums": { "entree": 1 } } })") == "");
    }

    SECTION("config threads") {
        REQUIRE_THROWS_AS(parsePlannerConfig(R"({ "threads": 1.5 })"), InvalidPlanInput);
    }

    SECTION("schema version") {
        json doc = PlanResult{};
        doc["schema_version"] = 1.0;
        try {
            parsePlanResult(doc.dump());
            FAIL("expected InvalidPlanInput");
        } catch (const InvalidPlanInput& e) {
            REQUIRE(e.field() == "schema_version");
        }
    }
}

/*
================================================================================
EXAMPLE 01: WEEKLY MENU - Cheapest groceries for a serving target
================================================================================

PROBLEM DESCRIPTION
-------------------
A household cooks for 12 servings this week. Five recipes are candidates,
each tagged with a meal type and broken down into per-batch ingredient
quantities in base units (grams, milliliters, count). The store lists one or
more packs per ingredient. Pick whole batches and whole packs so that:

    * at least 12 servings are produced
    * every ingredient used is covered by the packs bought
    * the menu has at least one dessert
    * the soup is on the menu no matter what

Parsley has no store listing; a placeholder pack keeps the menu solvable
and the shopping list flags it.

PLANNER FEATURES DEMONSTRATED
-----------------------------
- withPlaceholders()           escape valve for ingredients without supply
- PlanOptions                  meal-type minimums and required recipes
- solve()                      MILP build + time-limited solve
- buildShoppingList()          per-ingredient required / purchased / leftover
- detectAnomalies()            advisory outlier flags

================================================================================
*/

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "absl/log/initialize.h"
#include <meal_planner/meal_planner.h>

using mealplan::MealType;

int main() {
    absl::InitializeLog();

    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: Weekly Menu - Cheapest Groceries\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // PROBLEM DATA
        // ====================================================================
        const int target = 12;

        std::vector<mealplan::RecipeOption> recipes = {
            {"tomato-soup", 4, {{"tomato", 800.0}, {"onion", 1.0}, {"parsley", 10.0}}, MealType::Appetizer},
            {"pasta-bake",  6, {{"pasta", 500.0}, {"tomato", 400.0}, {"cheese", 200.0}}, MealType::Entree},
            {"omelette",    2, {{"egg", 4.0}, {"cheese", 50.0}, {"onion", 0.5}}, MealType::Entree},
            {"rice-bowl",   4, {{"rice", 400.0}, {"egg", 4.0}, {"onion", 1.0}}, MealType::Entree},
            {"rice-pudding", 6, {{"rice", 200.0}, {"milk", 1000.0}}, MealType::Dessert},
        };

        std::vector<mealplan::SupplyOption> supply = {
            {"tomato-can-400", "tomato", 400.0, 0.89, "corner"},
            {"tomato-1kg",     "tomato", 1000.0, 2.49, "market"},
            {"onion-each",     "onion", 1.0, 0.35, "market"},
            {"pasta-500",      "pasta", 500.0, 1.29, "corner"},
            {"cheese-200",     "cheese", 200.0, 2.99, "corner"},
            {"cheese-500",     "cheese", 500.0, 5.99, "market"},
            {"egg-6",          "egg", 6.0, 1.99, "corner"},
            {"egg-12",         "egg", 12.0, 3.49, "market"},
            {"rice-1kg",       "rice", 1000.0, 1.79, "corner"},
            {"milk-1l",        "milk", 1000.0, 1.09, "corner"},
        };

        mealplan::PlanOptions options;
        options.time_limit_seconds = 10.0;
        options.meal_type_minimums = {{MealType::Dessert, 1}};
        options.required_recipe_ids = {"tomato-soup"};

        std::cout << "PROBLEM DATA\n";
        std::cout << "------------\n";
        std::cout << "Target servings: " << target << "\n\n";
        std::cout << std::setw(14) << "Recipe" << std::setw(10) << "Serves"
                  << std::setw(12) << "Type" << "  Ingredients\n";
        std::cout << std::string(60, '-') << "\n";
        for (const auto& r : recipes) {
            std::cout << std::setw(14) << r.recipe_id << std::setw(10) << r.servings_per_batch
                      << std::setw(12) << mealplan::toString(r.meal_type) << "  ";
            for (const auto& [ingredient, qty] : r.ingredient_requirements) {
                std::cout << ingredient << "=" << qty << " ";
            }
            std::cout << "\n";
        }
        std::cout << "\n";

        // ====================================================================
        // PLACEHOLDERS
        // ====================================================================
        auto augmented = mealplan::withPlaceholders(recipes, supply);
        if (!augmented.missing.empty()) {
            std::cout << "No store listing for:";
            for (const auto& i : augmented.missing) std::cout << " " << i;
            std::cout << " (placeholder injected)\n\n";
        }

        // ====================================================================
        // SOLVE
        // ====================================================================
        std::cout << "SOLVING...\n";
        std::cout << "----------\n";

        auto result = mealplan::solve(target, recipes, augmented.options, options);
        std::cout << "Status: " << mealplan::toString(result.status) << "\n";

        if (!result.usable()) {
            std::cout << "No plan available.\n";
            return 2;
        }

        // ====================================================================
        // DISPLAY RESULTS
        // ====================================================================
        std::cout << std::fixed << std::setprecision(2);
        std::cout << "Grocery cost: $" << result.grocery_cost
                  << "  (objective " << *result.objective_value << ")\n";
        std::cout << "Servings: " << result.total_servings << " from "
                  << result.total_batches << " batches\n\n";

        std::cout << "Menu:\n";
        std::cout << std::setw(14) << "Recipe" << std::setw(10) << "Batches" << "\n";
        std::cout << std::string(24, '-') << "\n";
        for (const auto& [id, n] : result.recipe_batches) {
            if (n > 0) {
                std::cout << std::setw(14) << id << std::setw(10) << n << "\n";
            }
        }
        std::cout << "\n";

        auto list = mealplan::buildShoppingList(result, recipes, augmented.options);

        std::cout << "Shopping List:\n";
        std::cout << std::setw(18) << "SKU" << std::setw(8) << "Units"
                  << std::setw(10) << "Cost" << std::setw(10) << "Store" << "\n";
        std::cout << std::string(46, '-') << "\n";
        for (const auto& line : list.lines) {
            std::cout << std::setw(18) << line.sku_id << std::setw(8) << line.units
                      << std::setw(10) << line.line_cost << std::setw(10) << line.retailer;
            if (line.placeholder) {
                std::cout << " [NOT PURCHASABLE]";
            }
            std::cout << "\n";
        }
        std::cout << std::string(46, '-') << "\n";
        std::cout << std::setw(18) << "TOTAL" << std::setw(8) << ""
                  << std::setw(10) << list.total_cost << "\n\n";

        std::cout << "Ingredient Balance:\n";
        std::cout << std::setw(10) << "Ingredient" << std::setw(12) << "Required"
                  << std::setw(12) << "Purchased" << std::setw(12) << "Leftover" << "\n";
        std::cout << std::string(46, '-') << "\n";
        for (const auto& [ingredient, t] : list.ingredients) {
            std::cout << std::setw(10) << ingredient << std::setw(12) << t.required
                      << std::setw(12) << t.purchased << std::setw(12) << t.leftover << "\n";
        }

        for (const auto& a : mealplan::detectAnomalies(list)) {
            std::cout << "\nCheck " << a.sku_id << ":";
            for (const auto& reason : a.reasons) std::cout << " " << reason << ";";
        }
        std::cout << "\n";

    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}

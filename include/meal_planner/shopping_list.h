#pragma once
/*
===============================================================================
SHOPPING LIST — Consolidated purchases for a solved plan
===============================================================================

Expands a PlanResult with the same RecipeOption / SupplyOption objects the
solve consumed:

    required[i]  = sum_r batches[r] * req[r,i]
    purchased[i] = sum_{s in S(i)} units[s] * qty[s]
    leftover[i]  = purchased[i] - required[i]

Placeholder lines are kept but flagged, and excluded from total_cost, so a
display can suppress them without losing the fact that the plan needs them.

===============================================================================
*/

#include <algorithm>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include "plan_types.h"

namespace mealplan {

    struct ShoppingLine {
        SkuId sku_id;
        IngredientId ingredient_id;
        long long units = 0;
        double unit_cost = 0.0;
        double line_cost = 0.0;
        bool placeholder = false;
        std::string retailer;
    };

    struct IngredientTotals {
        double required = 0.0;
        double purchased = 0.0;
        double leftover = 0.0;
    };

    struct ShoppingList {
        std::vector<ShoppingLine> lines;                 ///< by ingredient, then sku
        std::map<IngredientId, IngredientTotals> ingredients;
        double total_cost = 0.0;                         ///< placeholder lines excluded
        bool has_placeholders = false;
    };

    /**
     * @brief Build the shopping list of a plan
     *
     * @details Only SKUs with units > 0 become lines. Every ingredient that a
     *          used recipe requires or a purchased SKU supplies gets a totals
     *          entry. A result without an incumbent yields an empty list.
     */
    inline ShoppingList buildShoppingList(const PlanResult& result,
                                          const std::vector<RecipeOption>& recipes,
                                          const std::vector<SupplyOption>& supply)
    {
        ShoppingList list;

        for (const auto& r : recipes) {
            auto it = result.recipe_batches.find(r.recipe_id);
            if (it == result.recipe_batches.end() || it->second <= 0) {
                continue;
            }
            for (const auto& [ingredient, qty] : r.ingredient_requirements) {
                list.ingredients[ingredient].required += static_cast<double>(it->second) * qty;
            }
        }

        for (const auto& s : supply) {
            auto it = result.sku_units.find(s.sku_id);
            if (it == result.sku_units.end() || it->second <= 0) {
                continue;
            }
            ShoppingLine line;
            line.sku_id = s.sku_id;
            line.ingredient_id = s.ingredient_id;
            line.units = it->second;
            line.unit_cost = s.unit_cost;
            line.line_cost = static_cast<double>(it->second) * s.unit_cost;
            line.placeholder = isPlaceholderSku(s.sku_id);
            line.retailer = s.retailer;

            list.ingredients[s.ingredient_id].purchased +=
                static_cast<double>(it->second) * s.quantity_per_unit;
            if (line.placeholder) {
                list.has_placeholders = true;
            } else {
                list.total_cost += line.line_cost;
            }
            list.lines.push_back(std::move(line));
        }

        for (auto& [ingredient, totals] : list.ingredients) {
            totals.leftover = totals.purchased - totals.required;
        }

        std::sort(list.lines.begin(), list.lines.end(),
            [](const ShoppingLine& a, const ShoppingLine& b) {
                return std::tie(a.ingredient_id, a.sku_id) < std::tie(b.ingredient_id, b.sku_id);
            });
        return list;
    }

} // namespace mealplan

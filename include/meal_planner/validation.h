#pragma once
/*
===============================================================================
VALIDATION — Request checks run before any solver state exists
===============================================================================

validatePlanRequest() rejects a malformed request with InvalidPlanInput
naming the first offending field. Nothing is clamped or repaired.

tieBreakIsSafe() answers whether the batch tie-breaker ε can reorder two
plans whose grocery cost differs by at least one cent: the ε term of any
reasonable plan is bounded by ε times an upper estimate of its batch count,
and that product must stay below the cent.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <format>
#include <set>
#include <string>
#include <vector>

#include "errors.h"
#include "plan_types.h"

namespace mealplan {

    namespace validation_detail {

        inline bool finiteNonNegative(double v) {
            return std::isfinite(v) && v >= 0.0;
        }

        inline bool finitePositive(double v) {
            return std::isfinite(v) && v > 0.0;
        }

        template<typename Known>
        void checkKnownIds(const std::set<RecipeId>& ids, const Known& known, const char* field) {
            for (const auto& id : ids) {
                if (!known.contains(id)) {
                    throw InvalidPlanInput(field, std::format("unknown recipe id '{}'", id));
                }
            }
        }

    } // namespace validation_detail

    inline void validateRecipes(const std::vector<RecipeOption>& recipes) {
        using namespace validation_detail;

        if (recipes.empty()) {
            throw InvalidPlanInput("recipes", "at least one recipe is required");
        }
        std::set<RecipeId> seen;
        for (const auto& r : recipes) {
            if (r.recipe_id.empty()) {
                throw InvalidPlanInput("recipes.recipe_id", "empty recipe id");
            }
            if (!seen.insert(r.recipe_id).second) {
                throw InvalidPlanInput("recipes.recipe_id",
                    std::format("duplicate recipe id '{}'", r.recipe_id));
            }
            if (r.servings_per_batch <= 0) {
                throw InvalidPlanInput(std::format("recipes[{}].servings_per_batch", r.recipe_id),
                    std::format("must be positive, got {}", r.servings_per_batch));
            }
            for (const auto& [ingredient, qty] : r.ingredient_requirements) {
                if (ingredient.empty()) {
                    throw InvalidPlanInput(std::format("recipes[{}].ingredient_requirements", r.recipe_id),
                        "empty ingredient id");
                }
                if (!finiteNonNegative(qty)) {
                    throw InvalidPlanInput(
                        std::format("recipes[{}].ingredient_requirements[{}]", r.recipe_id, ingredient),
                        std::format("must be finite and >= 0, got {}", qty));
                }
            }
        }
    }

    inline void validateSupply(const std::vector<SupplyOption>& supply) {
        using namespace validation_detail;

        std::set<SkuId> seen;
        for (const auto& s : supply) {
            if (s.sku_id.empty()) {
                throw InvalidPlanInput("supply.sku_id", "empty sku id");
            }
            if (!seen.insert(s.sku_id).second) {
                throw InvalidPlanInput("supply.sku_id", std::format("duplicate sku id '{}'", s.sku_id));
            }
            if (s.ingredient_id.empty()) {
                throw InvalidPlanInput(std::format("supply[{}].ingredient_id", s.sku_id), "empty ingredient id");
            }
            if (!finitePositive(s.quantity_per_unit)) {
                throw InvalidPlanInput(std::format("supply[{}].quantity_per_unit", s.sku_id),
                    std::format("must be finite and > 0, got {}", s.quantity_per_unit));
            }
            if (!finiteNonNegative(s.unit_cost)) {
                throw InvalidPlanInput(std::format("supply[{}].unit_cost", s.sku_id),
                    std::format("must be finite and >= 0, got {}", s.unit_cost));
            }
        }
    }

    inline void validateOptions(const PlanOptions& options, const std::vector<RecipeOption>& recipes) {
        using namespace validation_detail;

        if (!finitePositive(options.time_limit_seconds)) {
            throw InvalidPlanInput("time_limit_seconds",
                std::format("must be finite and > 0, got {}", options.time_limit_seconds));
        }
        if (!finitePositive(options.batch_penalty)) {
            throw InvalidPlanInput("batch_penalty",
                std::format("must be finite and > 0, got {}", options.batch_penalty));
        }
        if (options.threads < 0) {
            throw InvalidPlanInput("threads", std::format("must be >= 0, got {}", options.threads));
        }
        if (options.mip_gap && !(*options.mip_gap >= 0.0 && *options.mip_gap < 1.0)) {
            throw InvalidPlanInput("mip_gap", std::format("must lie in [0, 1), got {}", *options.mip_gap));
        }
        if (options.include_every_servings_per_person <= 0) {
            throw InvalidPlanInput("include_every_servings_per_person",
                std::format("must be positive, got {}", options.include_every_servings_per_person));
        }
        for (const auto& [type, minimum] : options.meal_type_minimums) {
            if (type == MealType::Unknown) {
                throw InvalidPlanInput("meal_type_minimums", "untagged recipes cannot carry a minimum");
            }
            if (minimum < 0) {
                throw InvalidPlanInput(std::format("meal_type_minimums[{}]", toString(type)),
                    std::format("must be >= 0, got {}", minimum));
            }
        }

        std::set<RecipeId> known;
        for (const auto& r : recipes) {
            known.insert(r.recipe_id);
        }
        checkKnownIds(options.required_recipe_ids, known, "required_recipe_ids");
        checkKnownIds(options.include_every_recipe_ids, known, "include_every_recipe_ids");
    }

    /**
     * @brief Reject a request that cannot be turned into a model
     * @throws InvalidPlanInput naming the first offending field
     */
    inline void validatePlanRequest(int target_servings,
                                    const std::vector<RecipeOption>& recipes,
                                    const std::vector<SupplyOption>& supply,
                                    const PlanOptions& options)
    {
        if (target_servings <= 0) {
            throw InvalidPlanInput("target_servings",
                std::format("must be positive, got {}", target_servings));
        }
        validateRecipes(recipes);
        validateSupply(supply);
        validateOptions(options, recipes);
    }

    // ============================================================================
    // TIE-BREAKER SAFETY
    // ============================================================================

    /**
     * @brief Upper estimate of the batch count of a cost-sensible plan
     *
     * @details Meeting the target with the smallest-yield recipe, plus one
     *          batch per required recipe, plus the batches each include-every
     *          recipe needs on its own, plus every meal-type minimum.
     *          Expects a validated request.
     */
    inline long long batchCountCeiling(int target_servings,
                                       const std::vector<RecipeOption>& recipes,
                                       const PlanOptions& options)
    {
        int minServings = recipes.empty() ? 1 : recipes.front().servings_per_batch;
        for (const auto& r : recipes) {
            minServings = std::min(minServings, r.servings_per_batch);
        }

        long long bound = (static_cast<long long>(target_servings) + minServings - 1) / minServings;
        bound += static_cast<long long>(options.required_recipe_ids.size());

        const long long perRecipe =
            static_cast<long long>(target_servings) * options.include_every_servings_per_person;
        for (const auto& r : recipes) {
            if (options.include_every_recipe_ids.contains(r.recipe_id)) {
                bound += std::max(1LL, (perRecipe + r.servings_per_batch - 1) / r.servings_per_batch);
            }
        }
        for (const auto& [type, minimum] : options.meal_type_minimums) {
            bound += minimum;
        }
        return bound;
    }

    /**
     * @brief True when ε x batchCountCeiling stays below the cost resolution
     * @param resolution Smallest cost difference that must never be reordered
     */
    inline bool tieBreakIsSafe(int target_servings,
                               const std::vector<RecipeOption>& recipes,
                               const PlanOptions& options,
                               double resolution = 0.01)
    {
        double worst = options.batch_penalty *
            static_cast<double>(batchCountCeiling(target_servings, recipes, options));
        return worst < resolution;
    }

} // namespace mealplan

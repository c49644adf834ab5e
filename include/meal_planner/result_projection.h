#pragma once
/*
===============================================================================
RESULT PROJECTION — Solver values back into plan terms
===============================================================================

Two steps:

    readSolvedValues(builder)   Gurobi attributes -> SolvedValues (raw doubles)
    projectResult(values, ...)  SolvedValues -> PlanResult

The second step touches no solver state, so it is exercised directly by
tests with hand-made values.

Integrality: batch and unit variables are declared integer, so the solver
has already decided their values; std::llround only removes tolerance noise
(1.9999999 -> 2). Negative noise (-1e-9) projects to 0.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "diagnostics.h"
#include "plan_builder.h"
#include "plan_types.h"
#include "variables.h"

namespace mealplan {

    /// @brief Raw outcome of a solve, before rounding and aggregation
    struct SolvedValues {
        PlanStatus status = PlanStatus::Undefined;
        bool has_incumbent = false;
        std::optional<double> objective;
        std::optional<double> mip_gap;
        double runtime_seconds = 0.0;
        std::map<RecipeId, double> batches;
        std::map<SkuId, double> units;
    };

    inline long long toCount(double v) {
        return std::max(0LL, std::llround(v));
    }

    /**
     * @brief Build a PlanResult from raw values
     *
     * @details Every recipe and SKU of the request appears in the result;
     *          missing values (no incumbent, or absent from the map) count
     *          as 0. Aggregates are computed from the rounded counts.
     */
    inline PlanResult projectResult(const SolvedValues& values,
                                    const std::vector<RecipeOption>& recipes,
                                    const std::vector<SupplyOption>& supply)
    {
        PlanResult result;
        result.status = values.status;
        result.has_incumbent = values.has_incumbent;
        result.runtime_seconds = values.runtime_seconds;

        if (values.has_incumbent) {
            result.objective_value = values.objective;
            result.mip_gap = values.mip_gap;
        }

        for (const auto& r : recipes) {
            long long n = 0;
            if (values.has_incumbent) {
                auto it = values.batches.find(r.recipe_id);
                if (it != values.batches.end()) {
                    n = toCount(it->second);
                }
            }
            result.recipe_batches[r.recipe_id] = n;
            result.total_batches += n;
            result.total_servings += n * r.servings_per_batch;
        }

        std::set<IngredientId> placeholders;
        for (const auto& s : supply) {
            long long n = 0;
            if (values.has_incumbent) {
                auto it = values.units.find(s.sku_id);
                if (it != values.units.end()) {
                    n = toCount(it->second);
                }
            }
            result.sku_units[s.sku_id] = n;
            result.grocery_cost += static_cast<double>(n) * s.unit_cost;
            if (n > 0 && isPlaceholderSku(s.sku_id)) {
                placeholders.insert(s.ingredient_id);
            }
        }
        result.placeholder_ingredients.assign(placeholders.begin(), placeholders.end());

        return result;
    }

    /// @brief Read status, objective and variable values after optimize()
    inline SolvedValues readSolvedValues(const PlanBuilder& builder) {
        SolvedValues v;
        v.status = toPlanStatus(builder.status());
        v.runtime_seconds = builder.runtime();
        v.has_incumbent = builder.hasSolution();

        if (v.has_incumbent) {
            v.objective = builder.objVal();
            v.mip_gap = builder.mipGap();
            for (const auto& [id, x] : values(builder.batches())) {
                v.batches.emplace(id, x);
            }
            for (const auto& [id, x] : values(builder.units())) {
                v.units.emplace(id, x);
            }
        }
        return v;
    }

    inline PlanResult projectResult(const PlanBuilder& builder) {
        return projectResult(readSolvedValues(builder), builder.recipes(), builder.supply());
    }

} // namespace mealplan

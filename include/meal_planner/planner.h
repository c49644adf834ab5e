#pragma once
/*
===============================================================================
PLANNER — solve(): one planning request, start to finish
===============================================================================

    validatePlanRequest()        InvalidPlanInput on malformed input
    data-quality warnings        zero-cost options, placeholders, unsafe eps
    PlanBuilder::optimize()      build + time-limited branch-and-bound
    projectResult()              PlanResult with every recipe / SKU present
    computeIIS()                 only when Infeasible and explain_infeasibility

Solver outcomes (Infeasible, Not Solved, Unbounded, Undefined) are return
values. GRBException (no license, out of memory) propagates unchanged.

Each call owns its own GRBEnv and GRBModel; concurrent calls share nothing.

===============================================================================
*/

#include <vector>

#include "absl/log/log.h"
#include "gurobi_c++.h"

#include "diagnostics.h"
#include "plan_builder.h"
#include "plan_types.h"
#include "result_projection.h"
#include "validation.h"

namespace mealplan {

    namespace planner_detail {

        inline void warnDataQuality(int target_servings,
                                    const std::vector<RecipeOption>& recipes,
                                    const std::vector<SupplyOption>& supply,
                                    const PlanOptions& options)
        {
            for (const auto& s : supply) {
                if (s.unit_cost == 0.0) {
                    LOG(WARNING) << "plan.zero_cost sku=" << s.sku_id
                                 << " ingredient=" << s.ingredient_id
                                 << " (price unknown; purchases of it are free to the optimizer)";
                }
                if (isPlaceholderSku(s.sku_id)) {
                    LOG(WARNING) << "plan.placeholder ingredient=" << s.ingredient_id
                                 << " has no real supply; plan may not be purchasable";
                }
            }
            if (!tieBreakIsSafe(target_servings, recipes, options)) {
                LOG(WARNING) << "plan.batch_penalty " << options.batch_penalty
                             << " x up to " << batchCountCeiling(target_servings, recipes, options)
                             << " batches can reach a cent; cost ranking may flip";
            }
        }

    } // namespace planner_detail

    /**
     * @brief Choose recipe batches and SKU purchases of minimum grocery cost
     *
     * @param target_servings Servings the plan must at least produce (> 0)
     * @param recipes         Candidate recipes, unique ids
     * @param supply          Purchasable options, already filtered and
     *                        placeholder-augmented by the caller
     * @param options         Time limit, tie-breaker and composition rules
     *
     * @throws InvalidPlanInput before any solver state exists
     * @throws GRBException     on solver or license failure
     */
    inline PlanResult solve(int target_servings,
                            const std::vector<RecipeOption>& recipes,
                            const std::vector<SupplyOption>& supply,
                            const PlanOptions& options = {})
    {
        validatePlanRequest(target_servings, recipes, supply, options);

        LOG(INFO) << "plan.start target=" << target_servings
                  << " recipes=" << recipes.size() << " skus=" << supply.size()
                  << " time_limit=" << options.time_limit_seconds << "s";
        planner_detail::warnDataQuality(target_servings, recipes, supply, options);

        PlanBuilder builder(target_servings, recipes, supply, options);
        builder.optimize();

        PlanResult result = projectResult(builder);

        if (result.status == PlanStatus::Infeasible && options.explain_infeasibility) {
            result.conflicting_constraints = computeIIS(builder.model()).constraintNames();
            for (const auto& name : result.conflicting_constraints) {
                LOG(INFO) << "plan.conflict " << name;
            }
        }

        if (result.usedPlaceholders()) {
            LOG(WARNING) << "plan.placeholders_used count=" << result.placeholder_ingredients.size();
        }

        LOG(INFO) << "plan.end status=" << toString(result.status)
                  << " gurobi=" << statusString(builder.status())
                  << " objective=" << (result.objective_value ? *result.objective_value : 0.0)
                  << " batches=" << result.total_batches
                  << " servings=" << result.total_servings
                  << " nodes=" << builder.nodeCount()
                  << " runtime=" << result.runtime_seconds << "s";

        return result;
    }

} // namespace mealplan

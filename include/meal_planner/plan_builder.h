#pragma once
/*
===============================================================================
PLAN BUILDER — The meal-plan MILP
===============================================================================

MATHEMATICAL MODEL
------------------
Sets:
    R               recipes
    S               supply options (SKUs)
    I               ingredients referenced by any recipe requirement
    S(i)            options supplying ingredient i
    R(t)            recipes tagged with meal type t (Unknown never included)

Parameters:
    T               target servings
    srv[r]          servings per batch of r
    req[r,i]        quantity of i per batch of r
    qty[s], cost[s] package size and unit price of s
    min[t]          meal-type minimum batches
    Req, Every      required / include-every recipe ids
    k               include-every servings per person
    eps             batch tie-breaker

Variables:
    batches[r] in Z+     units[s] in Z+

Objective:
    min  sum_s cost[s] * units[s] + eps * sum_r batches[r]

Constraints:
    serving_target:           sum_r srv[r] * batches[r] >= T
    ingredient_balance[i]:    sum_r req[r,i] * batches[r] <= sum_{s in S(i)} qty[s] * units[s]
    meal_type_min[t]:         sum_{r in R(t)} batches[r] >= min[t]        (min[t] > 0)
    required_recipe[r]:       batches[r] >= 1                             (r in Req)
    include_every[r]:         srv[r] * batches[r] >= T * k                (r in Every)

An include_every row implies batches[r] >= 1 because T * k >= 1 and
batches[r] is integral.

An ingredient with no supply option still gets a balance row whose right
side is empty, which pins every recipe using it to zero batches.

Rows are always named (serving_target, ingredient_balance[flour], ...) so
IIS reports are readable in release builds too.

===============================================================================
*/

#include <format>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "gurobi_c++.h"

#include "callbacks.h"
#include "constraints.h"
#include "diagnostics.h"
#include "enum_utils.h"
#include "expressions.h"
#include "model_builder.h"
#include "plan_types.h"
#include "variables.h"

namespace mealplan {

    MEALPLAN_DECLARE_ENUM_WITH_COUNT(PlanVars, Batches, Units);
    MEALPLAN_DECLARE_ENUM_WITH_COUNT(PlanCons, ServingTarget, IngredientBalance,
                                     MealTypeMinimum, RequiredRecipe, IncludeEvery);

    /**
     * @class PlanBuilder
     * @brief ModelBuilder that assembles and solves one planning request
     *
     * @details Holds its own copy of the request, so the builder can outlive
     *          the caller's vectors. Expects input already accepted by
     *          validatePlanRequest(); it does not re-check it.
     */
    class PlanBuilder : public ModelBuilder<PlanVars, PlanCons> {
    private:
        int target_;
        std::vector<RecipeOption> recipes_;
        std::vector<SupplyOption> supply_;
        PlanOptions options_;

        std::unique_ptr<PlanProgressCallback> callback_;

    public:
        PlanBuilder(int target_servings,
                    std::vector<RecipeOption> recipes,
                    std::vector<SupplyOption> supply,
                    PlanOptions options = {})
            : target_(target_servings),
              recipes_(std::move(recipes)),
              supply_(std::move(supply)),
              options_(std::move(options))
        {
        }

        int targetServings() const noexcept { return target_; }
        const std::vector<RecipeOption>& recipes() const noexcept { return recipes_; }
        const std::vector<SupplyOption>& supply() const noexcept { return supply_; }
        const PlanOptions& options() const noexcept { return options_; }

        const KeyedVariableSet& batches() const { return variables().get(PlanVars::Batches); }
        const KeyedVariableSet& units() const { return variables().get(PlanVars::Units); }

        /// @brief Ingredient ids that receive a balance row, sorted
        std::set<IngredientId> referencedIngredients() const {
            std::set<IngredientId> ids;
            for (const auto& r : recipes_) {
                for (const auto& [ingredient, qty] : r.ingredient_requirements) {
                    ids.insert(ingredient);
                }
            }
            return ids;
        }

        /// @brief Incumbents reported by the solve so far
        int incumbentsSeen() const noexcept {
            return callback_ ? callback_->incumbentsSeen() : 0;
        }

    protected:
        void configureEnvironment(GRBEnv& env) override {
            env.set(GRB_IntParam_OutputFlag, 0);
        }

        void addParameters() override {
            quiet();
            timeLimit(options_.time_limit_seconds);
            if (options_.threads > 0) {
                threads(options_.threads);
            }
            if (options_.mip_gap) {
                mipGapLimit(*options_.mip_gap);
            }
        }

        void addVariables() override {
            std::vector<std::string> recipeIds;
            recipeIds.reserve(recipes_.size());
            for (const auto& r : recipes_) {
                recipeIds.push_back(r.recipe_id);
            }
            std::vector<std::string> skuIds;
            skuIds.reserve(supply_.size());
            for (const auto& s : supply_) {
                skuIds.push_back(s.sku_id);
            }

            variables().set(PlanVars::Batches, VariableFactory::addKeyed(
                model(), GRB_INTEGER, 0.0, GRB_INFINITY, "batches", recipeIds));
            variables().set(PlanVars::Units, VariableFactory::addKeyed(
                model(), GRB_INTEGER, 0.0, GRB_INFINITY, "units", skuIds));
        }

        void addConstraints() override {
            const auto& B = variables().get(PlanVars::Batches);
            const auto& U = variables().get(PlanVars::Units);

            constraints().set(PlanCons::ServingTarget, ConstraintFactory::addScalar(
                model(), "serving_target",
                sum(recipes_, [&](const RecipeOption& r) {
                    return static_cast<double>(r.servings_per_batch) * B.at(r.recipe_id);
                }) >= static_cast<double>(target_),
                true));

            constraints().set(PlanCons::IngredientBalance, ConstraintFactory::addKeyed(
                model(), "ingredient_balance", referencedIngredients(),
                [&](const std::string& ingredient) {
                    GRBLinExpr demand = sumIf(recipes_,
                        [&](const RecipeOption& r) { return r.ingredient_requirements.contains(ingredient); },
                        [&](const RecipeOption& r) {
                            return r.ingredient_requirements.at(ingredient) * B.at(r.recipe_id);
                        });
                    GRBLinExpr available = sumIf(supply_,
                        [&](const SupplyOption& s) { return s.ingredient_id == ingredient; },
                        [&](const SupplyOption& s) { return s.quantity_per_unit * U.at(s.sku_id); });
                    return demand <= available;
                },
                true));

            std::vector<std::string> typedMinimums;
            for (const auto& [type, minimum] : options_.meal_type_minimums) {
                if (minimum > 0) {
                    typedMinimums.push_back(toString(type));
                }
            }
            constraints().set(PlanCons::MealTypeMinimum, ConstraintFactory::addKeyed(
                model(), "meal_type_min", typedMinimums,
                [&](const std::string& typeName) {
                    MealType type = parseMealType(typeName);
                    return sumIf(recipes_,
                        [&](const RecipeOption& r) { return r.meal_type == type; },
                        [&](const RecipeOption& r) { return B.at(r.recipe_id); })
                        >= static_cast<double>(options_.meal_type_minimums.at(type));
                },
                true));

            constraints().set(PlanCons::RequiredRecipe, ConstraintFactory::addKeyed(
                model(), "required_recipe", options_.required_recipe_ids,
                [&](const std::string& id) { return GRBLinExpr(B.at(id)) >= 1.0; },
                true));

            const double perRecipe =
                static_cast<double>(target_) * options_.include_every_servings_per_person;
            constraints().set(PlanCons::IncludeEvery, ConstraintFactory::addKeyed(
                model(), "include_every", options_.include_every_recipe_ids,
                [&](const std::string& id) {
                    return static_cast<double>(servingsOf(id)) * B.at(id) >= perRecipe;
                },
                true));
        }

        void addObjective() override {
            const auto& B = variables().get(PlanVars::Batches);
            const auto& U = variables().get(PlanVars::Units);

            GRBLinExpr cost = sum(supply_, [&](const SupplyOption& s) {
                return s.unit_cost * U.at(s.sku_id);
            });
            minimize(cost + options_.batch_penalty * sum(B));
        }

        void beforeOptimize() override {
            model().update();
            LOG(INFO) << "plan.model " << modelSummary(model())
                      << " recipes=" << recipes_.size() << " skus=" << supply_.size();

            if (!callback_) {
                callback_ = std::make_unique<PlanProgressCallback>(
                    variables().get(PlanVars::Batches), options_.progress);
                model().setCallback(callback_.get());
            }
        }

    private:
        int servingsOf(const RecipeId& id) const {
            for (const auto& r : recipes_) {
                if (r.recipe_id == id) {
                    return r.servings_per_batch;
                }
            }
            throw std::out_of_range(std::format("PlanBuilder: unknown recipe '{}'", id));
        }
    };

} // namespace mealplan

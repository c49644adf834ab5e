#pragma once
/*
===============================================================================
PLAN TYPES — Value objects exchanged with the planner
===============================================================================

OVERVIEW
--------
Everything here is constructed fresh for one planning request and owned by
it. Quantities are in the ingredient's canonical base unit (grams,
milliliters, count); recipe requirements and SKU package sizes for the same
ingredient must already agree on that unit when they arrive.

• RecipeOption  — recipe id, servings per batch, per-batch requirements
• SupplyOption  — one purchasable pack for one ingredient
• MealType      — appetizer / entree / dessert / side (Unknown = untagged)
• PlanStatus    — Optimal / Infeasible / NotSolved / Unbounded / Undefined
• PlanResult    — batches per recipe, units per SKU, objective and metadata

PLACEHOLDER SKUS
----------------
When an ingredient has no usable supply, callers may inject a synthetic
option (see supply_preparation.h). Its id is "placeholder:<ingredient>",
a prefix real catalogs never produce; isPlaceholderSku() recognizes it and
PlanResult::placeholder_ingredients lists every ingredient that was
actually bought through one.

===============================================================================
*/

#include <cctype>
#include <format>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <set>
#include <vector>

#include "errors.h"

namespace mealplan {

    using RecipeId = std::string;
    using IngredientId = std::string;
    using SkuId = std::string;

    // ============================================================================
    // MEAL TYPE
    // ============================================================================
    enum class MealType { Appetizer, Entree, Dessert, Side, Unknown };

    inline constexpr MealType kTaggedMealTypes[] = {
        MealType::Appetizer, MealType::Entree, MealType::Dessert, MealType::Side
    };

    inline std::string toString(MealType t) {
        switch (t) {
            case MealType::Appetizer: return "appetizer";
            case MealType::Entree:    return "entree";
            case MealType::Dessert:   return "dessert";
            case MealType::Side:      return "side";
            case MealType::Unknown:   return "unknown";
        }
        return "unknown";
    }

    /**
     * @brief Parse a meal-type tag, ignoring case and surrounding blanks
     * @throws InvalidPlanInput for text outside the vocabulary
     */
    inline MealType parseMealType(std::string_view text) {
        auto blank = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
        while (!text.empty() && blank(text.front())) text.remove_prefix(1);
        while (!text.empty() && blank(text.back())) text.remove_suffix(1);

        std::string s;
        for (char c : text) {
            s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        if (s == "appetizer") return MealType::Appetizer;
        if (s == "entree")    return MealType::Entree;
        if (s == "dessert")   return MealType::Dessert;
        if (s == "side")      return MealType::Side;
        if (s == "unknown" || s.empty()) return MealType::Unknown;
        throw InvalidPlanInput("meal_type", std::format("unknown meal type '{}'", text));
    }

    /// @brief Minimum total batches per meal type
    using MealTypeConstraintSpec = std::map<MealType, int>;

    // ============================================================================
    // CATALOG RECORDS
    // ============================================================================
    struct RecipeOption {
        RecipeId recipe_id;
        int servings_per_batch = 1;
        std::map<IngredientId, double> ingredient_requirements;
        MealType meal_type = MealType::Unknown;
    };

    struct SupplyOption {
        SkuId sku_id;
        IngredientId ingredient_id;
        double quantity_per_unit = 0.0;
        double unit_cost = 0.0;          ///< 0 when the price is unknown
        std::string retailer;            ///< empty when untagged
    };

    inline constexpr std::string_view kPlaceholderPrefix = "placeholder:";

    inline SkuId placeholderSkuId(const IngredientId& ingredient) {
        return std::string(kPlaceholderPrefix) + ingredient;
    }

    inline bool isPlaceholderSku(std::string_view sku) noexcept {
        return sku.starts_with(kPlaceholderPrefix);
    }

    // ============================================================================
    // RESULT
    // ============================================================================
    enum class PlanStatus { Optimal, Infeasible, NotSolved, Unbounded, Undefined };

    inline std::string toString(PlanStatus s) {
        switch (s) {
            case PlanStatus::Optimal:    return "Optimal";
            case PlanStatus::Infeasible: return "Infeasible";
            case PlanStatus::NotSolved:  return "Not Solved";
            case PlanStatus::Unbounded:  return "Unbounded";
            case PlanStatus::Undefined:  return "Undefined";
        }
        return "Undefined";
    }

    /// @throws InvalidPlanInput for an unknown status name
    inline PlanStatus parsePlanStatus(std::string_view text) {
        for (PlanStatus s : { PlanStatus::Optimal, PlanStatus::Infeasible, PlanStatus::NotSolved,
                              PlanStatus::Unbounded, PlanStatus::Undefined }) {
            if (toString(s) == text) {
                return s;
            }
        }
        throw InvalidPlanInput("status", std::format("unknown plan status '{}'", text));
    }

    struct PlanResult {
        PlanStatus status = PlanStatus::Undefined;
        std::optional<double> objective_value;

        /// Every input recipe / SKU is present; 0 when unused or unsolved.
        std::map<RecipeId, long long> recipe_batches;
        std::map<SkuId, long long> sku_units;

        bool has_incumbent = false;
        double grocery_cost = 0.0;       ///< objective without the batch tie-breaker
        long long total_servings = 0;
        long long total_batches = 0;
        std::vector<IngredientId> placeholder_ingredients;

        std::optional<double> mip_gap;
        double runtime_seconds = 0.0;

        /// Rows of an irreducible infeasible subsystem, when requested
        std::vector<std::string> conflicting_constraints;

        /// @brief Optimal, or stopped early with an incumbent
        bool usable() const noexcept {
            return has_incumbent &&
                   (status == PlanStatus::Optimal || status == PlanStatus::NotSolved);
        }

        bool usedPlaceholders() const noexcept { return !placeholder_ingredients.empty(); }
    };

    // ============================================================================
    // OPTIONS
    // ============================================================================

    /// @brief Snapshot of branch-and-bound progress handed to PlanOptions::progress
    struct SolveProgress {
        double runtime = 0.0;
        double bestObj = std::numeric_limits<double>::infinity();
        double bestBound = -std::numeric_limits<double>::infinity();
        double gap = std::numeric_limits<double>::infinity();
        long long nodeCount = 0;
        int solutionCount = 0;
        bool incumbent = false;      ///< true when reported for a new incumbent

        bool hasSolution() const noexcept { return solutionCount > 0; }
    };

    /**
     * @brief Per-request knobs for solve()
     *
     * @details Defaults reproduce a plain cost-minimizing plan: 10 s wall
     *          clock, tie-breaker 1e-4 per batch, no composition rules.
     *          Every field is validated by validatePlanRequest(); nothing is
     *          silently clamped.
     */
    struct PlanOptions {
        double time_limit_seconds = 10.0;
        double batch_penalty = 1e-4;

        MealTypeConstraintSpec meal_type_minimums;
        std::set<RecipeId> required_recipe_ids;
        std::set<RecipeId> include_every_recipe_ids;
        int include_every_servings_per_person = 1;

        int threads = 0;                    ///< 0 lets Gurobi decide
        std::optional<double> mip_gap;      ///< relative gap, Gurobi default when unset
        bool explain_infeasibility = false;

        /// Runs on Gurobi's thread during the solve
        std::function<void(const SolveProgress&)> progress;
    };

} // namespace mealplan

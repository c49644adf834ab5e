#pragma once
/*
===============================================================================
SUPPLY PREPARATION — Price-cache rows into SupplyOptions
===============================================================================

OVERVIEW
--------
Price rows arrive from the product-search collaborator with a TTL, a
retailer tag, and a package size already converted to the ingredient's base
unit (or missing when conversion failed). Before a solve they are:

    1. dropped when expired          (expires_at <= now)
    2. dropped when the request names retailers and the row's is not listed
    3. dropped when unusable         (no package size, or size <= 0 / NaN)
    4. priced at 0 when the price is missing or not finite, and reported

Every dropped or defaulted row is reported by id so the caller can surface it.

PLACEHOLDERS
------------
withPlaceholders() covers ingredients that a recipe needs but no option
supplies with a synthetic "placeholder:<ingredient>" option of very large
package size and small cost. The plan stays solvable; the result names every
placeholder actually bought (PlanResult::placeholder_ingredients). With the
policy disabled nothing is injected and recipes needing such ingredients are
held at zero batches by their balance rows.

===============================================================================
*/

#include <chrono>
#include <cmath>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "absl/log/log.h"
#include "plan_types.h"

namespace mealplan {

    struct SupplyRow {
        SkuId sku_id;
        IngredientId ingredient_id;
        std::optional<double> package_quantity;
        std::optional<double> unit_price;
        std::string retailer;
        std::chrono::system_clock::time_point expires_at;
    };

    struct SupplyPreparation {
        std::vector<SupplyOption> options;
        std::vector<SkuId> expired;
        std::vector<SkuId> filtered_by_retailer;
        std::vector<SkuId> unusable;
        std::vector<SkuId> zero_cost;
    };

    /**
     * @brief Filter cached price rows down to usable supply options
     * @param retailers Allowed retailer tags; empty allows every retailer
     */
    inline SupplyPreparation prepareSupplyOptions(const std::vector<SupplyRow>& rows,
                                                  std::chrono::system_clock::time_point now,
                                                  const std::set<std::string>& retailers = {})
    {
        SupplyPreparation prep;
        for (const auto& row : rows) {
            if (row.expires_at <= now) {
                prep.expired.push_back(row.sku_id);
                continue;
            }
            if (!retailers.empty() && !retailers.contains(row.retailer)) {
                prep.filtered_by_retailer.push_back(row.sku_id);
                continue;
            }
            if (!row.package_quantity || !std::isfinite(*row.package_quantity) ||
                *row.package_quantity <= 0.0) {
                prep.unusable.push_back(row.sku_id);
                continue;
            }

            SupplyOption opt;
            opt.sku_id = row.sku_id;
            opt.ingredient_id = row.ingredient_id;
            opt.quantity_per_unit = *row.package_quantity;
            opt.retailer = row.retailer;
            if (row.unit_price && std::isfinite(*row.unit_price) && *row.unit_price > 0.0) {
                opt.unit_cost = *row.unit_price;
            } else {
                opt.unit_cost = 0.0;
                prep.zero_cost.push_back(row.sku_id);
            }
            prep.options.push_back(std::move(opt));
        }

        VLOG(1) << "supply.prepare rows=" << rows.size() << " usable=" << prep.options.size()
                << " expired=" << prep.expired.size()
                << " retailer_filtered=" << prep.filtered_by_retailer.size()
                << " unusable=" << prep.unusable.size();
        return prep;
    }

    // ============================================================================
    // PLACEHOLDERS
    // ============================================================================

    struct PlaceholderPolicy {
        bool enabled = true;
        double quantity_per_unit = 999999.0;
        double unit_cost = 1.0;
    };

    struct PlaceholderAugmentation {
        std::vector<SupplyOption> options;
        std::vector<IngredientId> missing;      ///< sorted
    };

    /// @brief Ingredients some recipe needs (quantity > 0) that no option supplies, sorted
    inline std::vector<IngredientId> missingIngredients(const std::vector<RecipeOption>& recipes,
                                                        const std::vector<SupplyOption>& options)
    {
        std::set<IngredientId> supplied;
        for (const auto& s : options) {
            supplied.insert(s.ingredient_id);
        }
        std::set<IngredientId> missing;
        for (const auto& r : recipes) {
            for (const auto& [ingredient, qty] : r.ingredient_requirements) {
                if (qty > 0.0 && !supplied.contains(ingredient)) {
                    missing.insert(ingredient);
                }
            }
        }
        return { missing.begin(), missing.end() };
    }

    /**
     * @brief Append a placeholder option for every missing ingredient
     *
     * @details With policy.enabled == false the options are returned as
     *          given and only `missing` is filled.
     */
    inline PlaceholderAugmentation withPlaceholders(const std::vector<RecipeOption>& recipes,
                                                    std::vector<SupplyOption> options,
                                                    const PlaceholderPolicy& policy = {})
    {
        PlaceholderAugmentation out;
        out.missing = missingIngredients(recipes, options);

        if (policy.enabled && !out.missing.empty()) {
            LOG(WARNING) << "plan.missing_skus count=" << out.missing.size() << " using placeholders";
            for (const auto& ingredient : out.missing) {
                SupplyOption p;
                p.sku_id = placeholderSkuId(ingredient);
                p.ingredient_id = ingredient;
                p.quantity_per_unit = policy.quantity_per_unit;
                p.unit_cost = policy.unit_cost;
                options.push_back(std::move(p));
            }
        }
        out.options = std::move(options);
        return out;
    }

} // namespace mealplan

#pragma once
/*
===============================================================================
ANOMALY — Advisory outlier flags over a shopping list
===============================================================================

Compares each purchased line against the plan's own distribution:

    quantity threshold = max(10, mean + 2 * stdev)   with >= 2 lines
                       = 10                          otherwise
    cost threshold     = 3 * median line cost        when the median is > 0

stdev is the sample standard deviation. Placeholder lines and zero-cost
lines are left out of the cost statistics; placeholder lines are never
flagged. Flags are advice for a reviewer and never change the plan.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <format>
#include <string>
#include <vector>

#include "plan_types.h"
#include "shopping_list.h"

namespace mealplan {

    struct Anomaly {
        SkuId sku_id;
        IngredientId ingredient_id;
        long long units = 0;
        double line_cost = 0.0;
        std::vector<std::string> reasons;
    };

    struct AnomalyThresholds {
        double quantity = 10.0;
        double median_cost = 0.0;
        double cost = 0.0;              ///< 0 disables the cost check
    };

    inline AnomalyThresholds anomalyThresholds(const ShoppingList& list) {
        AnomalyThresholds t;

        std::vector<double> quantities;
        std::vector<double> costs;
        for (const auto& line : list.lines) {
            if (line.placeholder || line.units <= 0) {
                continue;
            }
            quantities.push_back(static_cast<double>(line.units));
            if (line.line_cost > 0.0) {
                costs.push_back(line.line_cost);
            }
        }

        if (quantities.size() >= 2) {
            double mean = 0.0;
            for (double q : quantities) mean += q;
            mean /= static_cast<double>(quantities.size());
            double ss = 0.0;
            for (double q : quantities) ss += (q - mean) * (q - mean);
            double stdev = std::sqrt(ss / static_cast<double>(quantities.size() - 1));
            t.quantity = std::max(10.0, mean + 2.0 * stdev);
        }

        if (!costs.empty()) {
            std::sort(costs.begin(), costs.end());
            std::size_t n = costs.size();
            t.median_cost = (n % 2 == 1) ? costs[n / 2] : 0.5 * (costs[n / 2 - 1] + costs[n / 2]);
            if (t.median_cost > 0.0) {
                t.cost = 3.0 * t.median_cost;
            }
        }
        return t;
    }

    /// @brief Lines whose units or cost stand out, in shopping-list order
    inline std::vector<Anomaly> detectAnomalies(const ShoppingList& list) {
        const AnomalyThresholds t = anomalyThresholds(list);

        std::vector<Anomaly> found;
        for (const auto& line : list.lines) {
            if (line.placeholder) {
                continue;
            }
            Anomaly a;
            if (static_cast<double>(line.units) > t.quantity) {
                a.reasons.push_back(std::format("purchase qty {} >> typical ({:.0f})", line.units, t.quantity));
            }
            if (t.cost > 0.0 && line.line_cost > t.cost) {
                a.reasons.push_back(std::format("total ${:.2f} >> median ${:.2f}", line.line_cost, t.median_cost));
            }
            if (!a.reasons.empty()) {
                a.sku_id = line.sku_id;
                a.ingredient_id = line.ingredient_id;
                a.units = line.units;
                a.line_cost = line.line_cost;
                found.push_back(std::move(a));
            }
        }
        return found;
    }

} // namespace mealplan

#pragma once
/*
===============================================================================
EXPRESSIONS — sum() helpers for building GRBLinExpr
===============================================================================

OVERVIEW
--------
Mirrors the mathematical notation of the plan model:

    sum_{r in R} servings[r] * batches[r]      -> sum(recipes, f)
    sum_{r in R | type(r) = t} batches[r]      -> sumIf(recipes, pred, f)
    sum_{s} units[s]                           -> sum(units)

The range can be any iterable (a vector of RecipeOption, a vector of ids,
a KeyedVariableSet). The lambda returns a GRBVar, GRBLinExpr, a scaled
variable or a constant; terms are accumulated with GRBLinExpr::operator+=.

An empty range yields the zero expression, so `sum(nothing) <= 0` is a
valid (trivially satisfied) row.

===============================================================================
*/

#include <utility>
#include <functional>

#include "gurobi_c++.h"
#include "variables.h"

namespace mealplan {

    namespace expr_detail {

        template<typename Term>
        void add_term(GRBLinExpr& expr, Term&& t) {
            expr += std::forward<Term>(t);
        }

    } // namespace expr_detail

    /**
     * @brief sum_{x in rng} func(x)
     * @throws Propagates exceptions from func
     */
    template<typename Range, typename Func>
    GRBLinExpr sum(const Range& rng, Func&& func) {
        GRBLinExpr expr = 0.0;
        for (const auto& item : rng) {
            expr_detail::add_term(expr, std::invoke(func, item));
        }
        return expr;
    }

    /**
     * @brief sum_{x in rng | pred(x)} func(x)
     */
    template<typename Range, typename Pred, typename Func>
    GRBLinExpr sumIf(const Range& rng, Pred&& pred, Func&& func) {
        GRBLinExpr expr = 0.0;
        for (const auto& item : rng) {
            if (std::invoke(pred, item)) {
                expr_detail::add_term(expr, std::invoke(func, item));
            }
        }
        return expr;
    }

    /// @brief Sum of every variable in the set
    inline GRBLinExpr sum(const KeyedVariableSet& vars) {
        GRBLinExpr expr = 0.0;
        for (const auto& e : vars) {
            expr += e.var;
        }
        return expr;
    }

} // namespace mealplan

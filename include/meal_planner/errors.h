#pragma once
/*
===============================================================================
ERRORS — Exceptions raised before a model is built
===============================================================================

Only malformed requests throw. Solver outcomes (infeasible, time limit,
unbounded) are reported through PlanResult::status, and GRBException from
the solver propagates unchanged.

===============================================================================
*/

#include <format>
#include <stdexcept>
#include <string>
#include <utility>

namespace mealplan {

    /**
     * @class InvalidPlanInput
     * @brief A planning request that cannot be turned into a model
     *
     * @details field() names the offending input ("target_servings",
     *          "recipes[soup].servings_per_batch", ...) so callers can map the
     *          failure back to a form field or JSON path.
     */
    class InvalidPlanInput : public std::invalid_argument {
    public:
        InvalidPlanInput(std::string field, const std::string& message)
            : std::invalid_argument(std::format("invalid plan input: {}: {}", field, message)),
              field_(std::move(field))
        {
        }

        const std::string& field() const noexcept { return field_; }

    private:
        std::string field_;
    };

} // namespace mealplan

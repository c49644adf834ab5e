#pragma once
/*
===============================================================================
DIAGNOSTICS — Status translation and model analysis
===============================================================================

Overview
--------
Free functions over a GRBModel, independent of ModelBuilder:

    * statusString / toPlanStatus   Gurobi status code -> text / PlanStatus
    * computeStatistics             variable and row counts by type
    * modelSummary                  one-line size summary for logs
    * computeIIS                    irreducible infeasible subsystem

Typical Usage
-------------
    builder.optimize();
    LOG(INFO) << "plan.model " << modelSummary(builder.model());

    if (builder.isInfeasible()) {
        for (const auto& name : computeIIS(builder.model()).constraintNames()) {
            LOG(INFO) << "conflict: " << name;
        }
    }

Row names in the IIS are only meaningful when the model was built with
names (see naming.h); PlanBuilder always names its rows.

===============================================================================
*/

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "gurobi_c++.h"
#include "plan_types.h"

namespace mealplan {

// =============================================================================
// STATUS
// =============================================================================

inline std::string statusString(int status) {
    switch (status) {
        case GRB_LOADED:          return "LOADED";
        case GRB_OPTIMAL:         return "OPTIMAL";
        case GRB_INFEASIBLE:      return "INFEASIBLE";
        case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
        case GRB_UNBOUNDED:       return "UNBOUNDED";
        case GRB_CUTOFF:          return "CUTOFF";
        case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
        case GRB_NODE_LIMIT:      return "NODE_LIMIT";
        case GRB_TIME_LIMIT:      return "TIME_LIMIT";
        case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
        case GRB_INTERRUPTED:     return "INTERRUPTED";
        case GRB_NUMERIC:         return "NUMERIC";
        case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
        case GRB_INPROGRESS:      return "INPROGRESS";
        case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
        default:                  return "UNKNOWN(" + std::to_string(status) + ")";
    }
}

/**
 * @brief Collapse a Gurobi status code into the planner's status vocabulary
 *
 * @details Every stop short of proof (time, node, solution or iteration
 *          limits, interruption, suboptimal termination, objective limit)
 *          maps to NotSolved; the caller decides from SolCount whether an
 *          incumbent exists. INF_OR_UNBD is reported as Infeasible since
 *          every variable of a plan is bounded below by zero and every
 *          objective coefficient is non-negative.
 */
inline PlanStatus toPlanStatus(int status) {
    switch (status) {
        case GRB_OPTIMAL:
            return PlanStatus::Optimal;
        case GRB_INFEASIBLE:
        case GRB_INF_OR_UNBD:
            return PlanStatus::Infeasible;
        case GRB_UNBOUNDED:
            return PlanStatus::Unbounded;
        case GRB_TIME_LIMIT:
        case GRB_NODE_LIMIT:
        case GRB_SOLUTION_LIMIT:
        case GRB_INTERRUPTED:
        case GRB_SUBOPTIMAL:
        case GRB_ITERATION_LIMIT:
        case GRB_USER_OBJ_LIMIT:
            return PlanStatus::NotSolved;
        default:
            return PlanStatus::Undefined;
    }
}

// =============================================================================
// MODEL STATISTICS
// =============================================================================

struct ModelStatistics {
    int numVars = 0;
    int numConstrs = 0;
    int numBinary = 0;
    int numInteger = 0;     ///< general integers, binaries excluded
    int numContinuous = 0;
    int numNonZeros = 0;
};

/// @note Call after model.update() or optimize(); pending additions are not counted
inline ModelStatistics computeStatistics(const GRBModel& model) {
    ModelStatistics stats;

    stats.numVars = model.get(GRB_IntAttr_NumVars);
    stats.numConstrs = model.get(GRB_IntAttr_NumConstrs);
    stats.numBinary = model.get(GRB_IntAttr_NumBinVars);
    // NumIntVars includes binaries
    stats.numInteger = model.get(GRB_IntAttr_NumIntVars) - stats.numBinary;
    stats.numNonZeros = model.get(GRB_IntAttr_NumNZs);
    stats.numContinuous = stats.numVars - stats.numBinary - stats.numInteger;

    return stats;
}

/**
 * @brief Brief size summary such as "12 vars (12 int), 9 constrs, 31 nz"
 */
inline std::string modelSummary(const GRBModel& model) {
    auto stats = computeStatistics(model);

    std::string result = std::to_string(stats.numVars) + " vars";

    if (stats.numBinary > 0 || stats.numInteger > 0) {
        result += " (";
        if (stats.numBinary > 0) {
            result += std::to_string(stats.numBinary) + " bin";
            if (stats.numInteger > 0) result += ", ";
        }
        if (stats.numInteger > 0) {
            result += std::to_string(stats.numInteger) + " int";
        }
        result += ")";
    }

    result += ", " + std::to_string(stats.numConstrs) + " constrs";
    result += ", " + std::to_string(stats.numNonZeros) + " nz";
    return result;
}

// =============================================================================
// IIS (IRREDUCIBLE INCONSISTENT SUBSYSTEM)
// =============================================================================

struct IISResult {
    std::vector<std::pair<std::string, GRBConstr>> constraints;
    std::vector<std::pair<std::string, GRBVar>> lowerBounds;
    std::vector<std::pair<std::string, GRBVar>> upperBounds;

    bool empty() const {
        return constraints.empty() && lowerBounds.empty() && upperBounds.empty();
    }

    size_t size() const {
        return constraints.size() + lowerBounds.size() + upperBounds.size();
    }

    std::vector<std::string> constraintNames() const {
        std::vector<std::string> names;
        names.reserve(constraints.size());
        for (const auto& [name, c] : constraints) {
            names.push_back(name);
        }
        return names;
    }
};

/**
 * @brief Compute an IIS for an infeasible model
 *
 * @note Only valid for INFEASIBLE / INF_OR_UNBD models; Gurobi throws
 *       GRBException otherwise. Potentially expensive on large models.
 */
inline IISResult computeIIS(GRBModel& model) {
    IISResult result;

    model.computeIIS();

    // getConstrs()/getVars() hand back new[] arrays owned by the caller
    int numConstrs = model.get(GRB_IntAttr_NumConstrs);
    std::unique_ptr<GRBConstr[]> constrs(model.getConstrs());
    for (int i = 0; i < numConstrs; ++i) {
        if (constrs[i].get(GRB_IntAttr_IISConstr) > 0) {
            result.constraints.emplace_back(constrs[i].get(GRB_StringAttr_ConstrName), constrs[i]);
        }
    }

    int numVars = model.get(GRB_IntAttr_NumVars);
    std::unique_ptr<GRBVar[]> vars(model.getVars());
    for (int i = 0; i < numVars; ++i) {
        if (vars[i].get(GRB_IntAttr_IISLB) > 0) {
            result.lowerBounds.emplace_back(vars[i].get(GRB_StringAttr_VarName), vars[i]);
        }
        if (vars[i].get(GRB_IntAttr_IISUB) > 0) {
            result.upperBounds.emplace_back(vars[i].get(GRB_StringAttr_VarName), vars[i]);
        }
    }

    return result;
}

} // namespace mealplan

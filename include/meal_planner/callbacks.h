#pragma once
/*
===============================================================================
CALLBACKS — MIP callback framework
===============================================================================

Overview
--------
Wraps Gurobi's where-based GRBCallback in named virtual methods:

| Method         | When Called               | Common Use                     |
|----------------|---------------------------|--------------------------------|
| onIncumbent()  | New incumbent found       | Logging, incumbent inspection  |
| onProgress()   | Periodically during MIP   | Monitoring, early termination  |
| onMessage()    | Gurobi log line           | Redirecting solver output      |

Key Components
--------------
• CallbackSolution      — incumbent values by GRBVar or by keyed set entry
• MIPCallback           — base class doing the dispatch
• PlanProgressCallback  — logs incumbents and forwards SolveProgress to
                          PlanOptions::progress

Thread Safety
-------------
Gurobi invokes callbacks on its own threads. The user hook must not touch
shared state without synchronization. CallbackSolution is only valid inside
the invocation that produced it.

Exception Safety
----------------
std::exception thrown from a hook is rethrown as
GRBException(GRB_ERROR_CALLBACK), which aborts the solve and propagates out
of optimize().

===============================================================================
*/

#include <cmath>
#include <functional>
#include <map>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "gurobi_c++.h"
#include "plan_types.h"
#include "variables.h"

namespace mealplan {

class MIPCallback;

// =============================================================================
// CALLBACK SOLUTION ACCESSOR
// =============================================================================

class CallbackSolution {
public:
    double operator()(const GRBVar& v) const;

    /// @throws std::out_of_range for an unknown key
    double operator()(const KeyedVariableSet& vs, const std::string& key) const;

    /// @brief Incumbent value of every entry, keyed
    std::map<std::string, double> values(const KeyedVariableSet& vs) const;

private:
    friend class MIPCallback;
    explicit CallbackSolution(MIPCallback* cb) : callback_(cb) {}

    MIPCallback* callback_;
};

// =============================================================================
// MIP CALLBACK BASE CLASS
// =============================================================================

class MIPCallback : public GRBCallback {
public:
    virtual ~MIPCallback() = default;

    /// @note Only meaningful inside onIncumbent()
    double getSolutionValue(const GRBVar& v) {
        return getSolution(v);
    }

protected:
    virtual void onIncumbent(const CallbackSolution& sol) { (void)sol; }

    /// @note Called frequently; keep it lightweight.
    virtual void onProgress(const SolveProgress& p) { (void)p; }

    virtual void onMessage(const std::string& msg) { (void)msg; }

    /**
     * @brief Progress at the current callback point
     *
     * @details MIP counters are read only where Gurobi publishes them
     *          (MIP, MIPSOL, MIPNODE); elsewhere they keep their defaults.
     */
    SolveProgress progress() {
        SolveProgress p;
        p.runtime = getDoubleInfo(GRB_CB_RUNTIME);

        if (where == GRB_CB_MIP) {
            p.bestObj = getDoubleInfo(GRB_CB_MIP_OBJBST);
            p.bestBound = getDoubleInfo(GRB_CB_MIP_OBJBND);
            p.nodeCount = static_cast<long long>(getDoubleInfo(GRB_CB_MIP_NODCNT));
            p.solutionCount = getIntInfo(GRB_CB_MIP_SOLCNT);
        } else if (where == GRB_CB_MIPSOL) {
            p.bestObj = getDoubleInfo(GRB_CB_MIPSOL_OBJBST);
            p.bestBound = getDoubleInfo(GRB_CB_MIPSOL_OBJBND);
            p.nodeCount = static_cast<long long>(getDoubleInfo(GRB_CB_MIPSOL_NODCNT));
            p.solutionCount = getIntInfo(GRB_CB_MIPSOL_SOLCNT);
        } else if (where == GRB_CB_MIPNODE) {
            p.bestObj = getDoubleInfo(GRB_CB_MIPNODE_OBJBST);
            p.bestBound = getDoubleInfo(GRB_CB_MIPNODE_OBJBND);
            p.nodeCount = static_cast<long long>(getDoubleInfo(GRB_CB_MIPNODE_NODCNT));
            p.solutionCount = getIntInfo(GRB_CB_MIPNODE_SOLCNT);
        }

        if (p.solutionCount > 0 && std::abs(p.bestObj) > 1e-10) {
            p.gap = std::abs(p.bestObj - p.bestBound) / std::abs(p.bestObj);
        }
        return p;
    }

    void abort() {
        GRBCallback::abort();
    }

private:
    void callback() override {
        try {
            switch (where) {
                case GRB_CB_MIPSOL: {
                    CallbackSolution sol(this);
                    onIncumbent(sol);
                    break;
                }
                case GRB_CB_MIP:
                    onProgress(progress());
                    break;
                case GRB_CB_MESSAGE:
                    onMessage(getStringInfo(GRB_CB_MSG_STRING));
                    break;
                default:
                    break;
            }
        } catch (GRBException&) {
            throw;
        } catch (std::exception& e) {
            throw GRBException(e.what(), GRB_ERROR_CALLBACK);
        }
    }
};

inline double CallbackSolution::operator()(const GRBVar& v) const {
    return callback_->getSolutionValue(v);
}

inline double CallbackSolution::operator()(const KeyedVariableSet& vs, const std::string& key) const {
    return callback_->getSolutionValue(vs.at(key));
}

inline std::map<std::string, double> CallbackSolution::values(const KeyedVariableSet& vs) const {
    std::map<std::string, double> result;
    for (const auto& entry : vs) {
        result.emplace(entry.key, callback_->getSolutionValue(entry.var));
    }
    return result;
}

// =============================================================================
// PLAN PROGRESS CALLBACK
// =============================================================================

/**
 * @brief Reports incumbents and periodic progress of a plan solve
 *
 * @details Each new incumbent is logged at VLOG(1) with its objective and
 *          total batch count, then handed to the user hook with
 *          SolveProgress::incumbent set. Periodic MIP progress goes to the
 *          hook only.
 */
class PlanProgressCallback : public MIPCallback {
public:
    PlanProgressCallback(const KeyedVariableSet& batches,
                         std::function<void(const SolveProgress&)> hook)
        : batches_(batches), hook_(std::move(hook))
    {
    }

    int incumbentsSeen() const noexcept { return incumbents_; }

protected:
    void onIncumbent(const CallbackSolution& sol) override {
        ++incumbents_;
        SolveProgress p = progress();
        p.incumbent = true;

        double batches = 0.0;
        for (const auto& [key, v] : sol.values(batches_)) {
            batches += v;
        }
        VLOG(1) << "plan.incumbent n=" << incumbents_ << " objective=" << p.bestObj
                << " batches=" << std::llround(batches) << " t=" << p.runtime << "s";

        if (hook_) {
            hook_(p);
        }
    }

    void onProgress(const SolveProgress& p) override {
        if (hook_) {
            hook_(p);
        }
    }

private:
    const KeyedVariableSet& batches_;
    std::function<void(const SolveProgress&)> hook_;
    int incumbents_ = 0;
};

} // namespace mealplan

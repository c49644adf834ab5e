#pragma once
/*
===============================================================================
MODEL BUILDER — Template-method orchestration of one optimization model
===============================================================================

Overview
--------
ModelBuilder owns the Gurobi environment and model for a single solve and
drives the build in a fixed order:

    optimize() {
        initialize();          // GRBEnv (deferred start) + GRBModel
        addVariables();
        addConstraints();
        addParameters();
        addObjective();
        beforeOptimize();
        model.optimize();
        afterOptimize();
    }

Derived builders override the hooks. PlanBuilder is the one production
subclass; tests use small builders to exercise the workflow.

Key Properties
--------------
1. Lazy initialization: the constructor touches no solver state, so a
   builder can be created and configured before a license is checked.
2. One environment per builder: nothing is shared between builders, which
   is what lets concurrent planning requests run without locks.
3. Build once: the model is assembled on the first optimize(); later calls
   re-run only the solve and the before/after hooks.
4. Parameter tracking: named setters (timeLimit(), threads(), quiet(),
   mipGapLimit()) record what they applied in appliedParameters(), keyed by
   Gurobi parameter name.

Typical Usage
-------------
    MEALPLAN_DECLARE_ENUM_WITH_COUNT(Vars, X);
    MEALPLAN_DECLARE_ENUM_WITH_COUNT(Cons, Cap);

    class Tiny : public mealplan::ModelBuilder<Vars, Cons> {
        void addVariables() override { ... variables().set(Vars::X, ...); }
        void addConstraints() override { ... }
        void addObjective() override { minimize(...); }
    };

    Tiny t;
    t.optimize();
    if (t.hasSolution()) { double z = t.objVal(); }

===============================================================================
*/

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include "gurobi_c++.h"

#include "variables.h"
#include "constraints.h"

namespace mealplan {

    template <typename VarEnum, typename ConEnum>
    class ModelBuilder {
    public:
        using VarTable = VariableTable<VarEnum>;
        using ConTable = ConstraintTable<ConEnum>;

    private:
        std::unique_ptr<GRBEnv>   env_;
        std::unique_ptr<GRBModel> model_;

        bool initialized_ = false;
        bool built_ = false;

        std::map<std::string, double> applied_;

    protected:
        VarTable vars_;
        ConTable cons_;

    public:
        ModelBuilder() = default;
        virtual ~ModelBuilder() = default;

        ModelBuilder(const ModelBuilder&) = delete;
        ModelBuilder& operator=(const ModelBuilder&) = delete;

        // -------------------------------------------------------------------------
        // Initialization
        // -------------------------------------------------------------------------
        /**
         * @brief Create the environment and model if not done yet
         *
         * The environment is created with deferred start so configureEnvironment()
         * can silence the license banner before start() prints anything.
         *
         * @throws GRBException if the environment cannot start (no license)
         */
        void initialize()
        {
            if (initialized_)
                return;

            env_ = std::make_unique<GRBEnv>(true);
            configureEnvironment(*env_);
            env_->start();
            model_ = std::make_unique<GRBModel>(*env_);

            initialized_ = true;
        }

        // -------------------------------------------------------------------------
        // Accessors
        // -------------------------------------------------------------------------
        GRBModel& model()
        {
            if (!initialized_)
                initialize();
            return *model_;
        }

        /// @throws std::logic_error before initialize()
        const GRBModel& model() const
        {
            if (!initialized_)
                throw std::logic_error("ModelBuilder::model: not initialized");
            return *model_;
        }

        [[nodiscard]] bool isBuilt() const noexcept { return built_; }

        VarTable& variables() noexcept { return vars_; }
        const VarTable& variables() const noexcept { return vars_; }

        ConTable& constraints() noexcept { return cons_; }
        const ConTable& constraints() const noexcept { return cons_; }

        /// @brief Parameters applied through the named setters, by Gurobi name
        const std::map<std::string, double>& appliedParameters() const noexcept {
            return applied_;
        }

        // -------------------------------------------------------------------------
        // Parameter Configuration
        // -------------------------------------------------------------------------
        template <typename Param, typename Val>
        void setParam(Param p, Val value)
        {
            model().set(p, value);
        }

        /// @brief Wall-clock limit for the solve, in seconds
        void timeLimit(double seconds) {
            setParam(GRB_DoubleParam_TimeLimit, seconds);
            applied_["TimeLimit"] = seconds;
        }

        /// @brief Relative MIP gap at which the search stops (0.0001 = 0.01%)
        void mipGapLimit(double gap) {
            setParam(GRB_DoubleParam_MIPGap, gap);
            applied_["MIPGap"] = gap;
        }

        /// @brief Solver threads (0 = automatic)
        void threads(int n) {
            setParam(GRB_IntParam_Threads, n);
            applied_["Threads"] = n;
        }

        /// @brief No solver console output
        void quiet() {
            setParam(GRB_IntParam_OutputFlag, 0);
            applied_["OutputFlag"] = 0;
        }

        // -------------------------------------------------------------------------
        // Objective Helpers
        // -------------------------------------------------------------------------
        void minimize(const GRBLinExpr& expr) {
            model().setObjective(expr, GRB_MINIMIZE);
        }

        void maximize(const GRBLinExpr& expr) {
            model().setObjective(expr, GRB_MAXIMIZE);
        }

        // -------------------------------------------------------------------------
        // Solution Diagnostics (valid after optimize())
        // -------------------------------------------------------------------------
        int status() const {
            return model().get(GRB_IntAttr_Status);
        }

        bool isOptimal() const {
            return status() == GRB_OPTIMAL;
        }

        bool isInfeasible() const {
            int s = status();
            return s == GRB_INFEASIBLE || s == GRB_INF_OR_UNBD;
        }

        bool isUnbounded() const {
            return status() == GRB_UNBOUNDED;
        }

        /// @brief True if an incumbent can be read, whatever stopped the search
        bool hasSolution() const {
            return solutionCount() > 0;
        }

        /// @throws GRBException without an incumbent
        double objVal() const {
            return model().get(GRB_DoubleAttr_ObjVal);
        }

        double objBound() const {
            return model().get(GRB_DoubleAttr_ObjBound);
        }

        /// @note Only meaningful for MIP models with an incumbent
        double mipGap() const {
            return model().get(GRB_DoubleAttr_MIPGap);
        }

        double runtime() const {
            return model().get(GRB_DoubleAttr_Runtime);
        }

        int solutionCount() const {
            return model().get(GRB_IntAttr_SolCount);
        }

        double nodeCount() const {
            return model().get(GRB_DoubleAttr_NodeCount);
        }

        // -------------------------------------------------------------------------
        // Template-method hooks
        // -------------------------------------------------------------------------
        virtual void configureEnvironment(GRBEnv& env) {}
        virtual void addParameters() {}
        virtual void addVariables() {}
        virtual void addConstraints() {}
        virtual void addObjective() {}
        virtual void beforeOptimize() {}
        virtual void afterOptimize() {}

        // -------------------------------------------------------------------------
        // Main orchestration
        // -------------------------------------------------------------------------
        GRBModel& optimize()
        {
            initialize();

            if (!built_) {
                addVariables();
                addConstraints();
                addParameters();
                addObjective();
                built_ = true;
            }

            beforeOptimize();
            model().optimize();
            afterOptimize();

            return model();
        }
    };

} // namespace mealplan

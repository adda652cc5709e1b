#pragma once
/*
===============================================================================
MODEL BUILDER — Template-method orchestration for portfolio QPs
===============================================================================

Overview
--------
ModelBuilder coordinates everything one Gurobi solve needs:

    * Environment (owned, or shared with the other samples of a sweep)
    * Model creation
    * Variables and constraints (VariableTable / ConstraintTable)
    * Parameters (tracked in store() under "param:<Name>")
    * Objective (linear or quadratic)
    * The optimize() lifecycle

The workflow is a template method:

    initialize()
    optimize() {
        addVariables();
        addConstraints();
        addParameters();
        addObjective();
        beforeOptimize();
        model.optimize();
        afterOptimize();
    }

Derived builders (PortfolioModel) override the hooks they need.

Environments
------------
Starting a GRBEnv checks the license and is far more expensive than building
a ten-variable QP. A frontier sweep therefore creates one environment and
hands it to every sample:

    GRBEnv env(true);
    env.set(GRB_IntParam_OutputFlag, 0);
    env.start();
    for (double g : grid) {
        PortfolioModel pm(env, market, g);   // model lives on the shared env
        pm.optimize();
    }

The default constructor owns its environment instead; configureEnvironment()
runs on it before start().

Parameters
----------
    * Named setters: timeLimit(), threads(), quiet(), presolve(), method(),
      barConvTol(), barIterLimit(), logFile()
    * apply(SolverSettings) maps a run configuration onto the setters
    * applyPreset(Preset::Accurate), Preset::Fast, ...
    * Every named setter records its value in store()["param:<Name>"]

Design Notes
------------
* No solver work happens in a constructor.
* initialize() runs once; optimize() calls it.
* A shared environment must outlive every builder created on it.

===============================================================================
*/

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "gurobi_c++.h"

#include "config.h"
#include "constraints.h"
#include "data_store.h"
#include "variables.h"

namespace markowitz {

    template <typename VarEnum, typename ConEnum>
    class ModelBuilder {
    public:
        using VarTable = VariableTable<VarEnum>;
        using ConTable = ConstraintTable<ConEnum>;

    private:
        std::unique_ptr<GRBEnv>   owned_env_;
        GRBEnv*                   shared_env_ = nullptr;   // not owned
        std::unique_ptr<GRBModel> model_;

        bool initialized_ = false;

    protected:
        VarTable vars_;
        ConTable cons_;
        DataStore store_;

    public:
        // -------------------------------------------------------------------------
        // Constructors
        // -------------------------------------------------------------------------

        /// @brief Owns its environment, created on initialize()
        ModelBuilder() = default;

        /**
         * @brief Build the model on an already started environment
         * @note configureEnvironment() is not called; env must outlive *this
         */
        explicit ModelBuilder(GRBEnv& env)
            : shared_env_(&env)
        {
        }

        ModelBuilder(const ModelBuilder&) = delete;
        ModelBuilder& operator=(const ModelBuilder&) = delete;

        virtual ~ModelBuilder() = default;

        // -------------------------------------------------------------------------
        // Initialization
        // -------------------------------------------------------------------------

        /**
         * @brief Create the environment (if owned) and the model
         *
         * Owned environment: GRBEnv(true) → configureEnvironment() → start().
         * Shared environment: the model is created on it directly.
         */
        void initialize()
        {
            if (initialized_)
                return;

            if (!shared_env_) {
                owned_env_ = std::make_unique<GRBEnv>(true);   // defer license check
                configureEnvironment(*owned_env_);
                owned_env_->start();
                model_ = std::make_unique<GRBModel>(*owned_env_);
            }
            else {
                model_ = std::make_unique<GRBModel>(*shared_env_);
            }

            initialized_ = true;
        }

        bool ownsEnvironment() const noexcept { return shared_env_ == nullptr; }

        // -------------------------------------------------------------------------
        // Accessors
        // -------------------------------------------------------------------------

        /// @brief Mutable model, initializing on first use
        GRBModel& model()
        {
            if (!initialized_)
                initialize();
            return *model_;
        }

        /// @throws std::logic_error before initialize()
        const GRBModel& model() const
        {
            if (!model_)
                throw std::logic_error("ModelBuilder::model: builder not initialized");
            return *model_;
        }

        VarTable& variables() noexcept { return vars_; }
        const VarTable& variables() const noexcept { return vars_; }

        ConTable& constraints() noexcept { return cons_; }
        const ConTable& constraints() const noexcept { return cons_; }

        DataStore& store() noexcept { return store_; }
        const DataStore& store() const noexcept { return store_; }

        // -------------------------------------------------------------------------
        // Parameter Configuration
        // -------------------------------------------------------------------------

        /// @brief Raw parameter, not tracked
        template <typename Param, typename Val>
        void setParam(Param p, Val&& value)
        {
            model().set(p, std::forward<Val>(value));
        }

        /**
         * @brief Parameter tracked as store()["param:" + name]
         * @example
         *     setParam(GRB_IntParam_BarHomogeneous, 1, "BarHomogeneous");
         */
        template <typename Param, typename Val>
        void setParam(Param p, const Val& value, const std::string& name)
        {
            model().set(p, value);
            store_[std::string("param:") + name] = value;
        }

        /// @param seconds Maximum runtime per solve
        void timeLimit(double seconds) {
            setParam(GRB_DoubleParam_TimeLimit, seconds, "TimeLimit");
        }

        /// @param n 0 = automatic
        void threads(int n) {
            setParam(GRB_IntParam_Threads, n, "Threads");
        }

        void quiet() {
            setParam(GRB_IntParam_OutputFlag, 0, "OutputFlag");
        }

        void verbose() {
            setParam(GRB_IntParam_OutputFlag, 1, "OutputFlag");
        }

        /// @param level -1=auto, 0=off, 1=conservative, 2=aggressive
        void presolve(int level) {
            setParam(GRB_IntParam_Presolve, level, "Presolve");
        }

        /// @param m -1=auto, 0=primal simplex, 1=dual simplex, 2=barrier
        void method(int m) {
            setParam(GRB_IntParam_Method, m, "Method");
        }

        /// @brief Relative complementarity at which barrier stops
        void barConvTol(double tol) {
            setParam(GRB_DoubleParam_BarConvTol, tol, "BarConvTol");
        }

        void barIterLimit(int n) {
            setParam(GRB_IntParam_BarIterLimit, n, "BarIterLimit");
        }

        /// @brief Append the solver log to a file ("" disables)
        void logFile(const std::string& path) {
            setParam(GRB_StringParam_LogFile, path, "LogFile");
        }

        /**
         * @brief Apply a run configuration
         * @details Time limit and iteration limit are left at Gurobi's
         *          defaults when their settings are 0 / negative.
         */
        void apply(const SolverSettings& s) {
            if (s.quiet) quiet(); else verbose();
            threads(s.threads);
            barConvTol(s.barConvTol);
            if (s.timeLimit > 0.0) timeLimit(s.timeLimit);
            if (s.barIterLimit >= 0) barIterLimit(s.barIterLimit);
            if (!s.logFile.empty()) logFile(s.logFile);
        }

        // -------------------------------------------------------------------------
        // Parameter Presets
        // -------------------------------------------------------------------------

        enum class Preset {
            Fast,       ///< 60s limit, BarConvTol 1e-6, automatic threads
            Accurate,   ///< Barrier, BarConvTol 1e-12
            Quiet,      ///< No output
            Debug       ///< Output on, presolve off
        };

        /// @note Preset name tracked in store()["param:Preset"]
        void applyPreset(Preset p) {
            switch (p) {
                case Preset::Fast:
                    timeLimit(60.0);
                    barConvTol(1e-6);
                    threads(0);
                    store_["param:Preset"] = std::string("Fast");
                    break;

                case Preset::Accurate:
                    method(GRB_METHOD_BARRIER);
                    barConvTol(1e-12);
                    store_["param:Preset"] = std::string("Accurate");
                    break;

                case Preset::Quiet:
                    quiet();
                    store_["param:Preset"] = std::string("Quiet");
                    break;

                case Preset::Debug:
                    verbose();
                    presolve(0);
                    store_["param:Preset"] = std::string("Debug");
                    break;
            }
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

        /// @example minimize(quadForm(sigma, W));
        void minimize(const GRBQuadExpr& expr) {
            model().setObjective(expr, GRB_MINIMIZE);
        }

        /// @example maximize(dot(mu, W) - gamma * quadForm(sigma, W));
        void maximize(const GRBQuadExpr& expr) {
            model().setObjective(expr, GRB_MAXIMIZE);
        }

        // -------------------------------------------------------------------------
        // Solution Diagnostics
        // -------------------------------------------------------------------------

        int status() const {
            return model().get(GRB_IntAttr_Status);
        }

        bool isOptimal() const {
            return status() == GRB_OPTIMAL;
        }

        /// @brief OPTIMAL or SUBOPTIMAL, or a limit status with a solution
        bool hasSolution() const {
            int s = status();
            return s == GRB_OPTIMAL ||
                   s == GRB_SUBOPTIMAL ||
                   ((s == GRB_TIME_LIMIT || s == GRB_ITERATION_LIMIT) && solutionCount() > 0);
        }

        bool isInfeasible() const {
            return status() == GRB_INFEASIBLE;
        }

        bool isUnbounded() const {
            return status() == GRB_UNBOUNDED;
        }

        /// @throws GRBException if no solution is available
        double objVal() const {
            return model().get(GRB_DoubleAttr_ObjVal);
        }

        /// @brief Seconds spent in the last optimize()
        double runtime() const {
            return model().get(GRB_DoubleAttr_Runtime);
        }

        int barIterCount() const {
            return model().get(GRB_IntAttr_BarIterCount);
        }

        int solutionCount() const {
            return model().get(GRB_IntAttr_SolCount);
        }

        // -------------------------------------------------------------------------
        // Template-method hooks
        // -------------------------------------------------------------------------

        /// @brief Owned environment only, before start()
        virtual void configureEnvironment(GRBEnv& env) { (void)env; }

        virtual void addParameters() {}

        virtual void addVariables() {}

        virtual void addConstraints() {}

        virtual void addObjective() {}

        /// @brief Last chance before the solve (callbacks, warm starts)
        virtual void beforeOptimize() {}

        /// @brief Solution extraction
        virtual void afterOptimize() {}

        // -------------------------------------------------------------------------
        // Main orchestration
        // -------------------------------------------------------------------------

        /**
         * @brief Build and solve
         *
         * Steps:
         *     1. initialize()
         *     2. addVariables()
         *     3. addConstraints()
         *     4. addParameters()
         *     5. addObjective()
         *     6. beforeOptimize()
         *     7. model.optimize()
         *     8. afterOptimize()
         */
        GRBModel& optimize()
        {
            initialize();

            addVariables();
            addConstraints();
            addParameters();
            addObjective();

            beforeOptimize();
            model().optimize();
            afterOptimize();

            return model();
        }
    };

} // namespace markowitz

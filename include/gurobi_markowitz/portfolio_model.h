#pragma once
/*
===============================================================================
PORTFOLIO MODEL — One long-only mean-variance QP
===============================================================================

MATHEMATICAL MODEL
------------------
Sets:
    A = {0, 1, ..., n-1}        Assets

Parameters:
    mu[a]                       Expected return of asset a
    sigma[a,b]                  Covariance of assets a and b
    gamma > 0                   Risk aversion

Variables:
    w[a] >= 0                   Fraction of budget in asset a

Objective (RiskAdjustedReturn):
    max  sum_a mu[a] w[a] - gamma * sum_{a,b} sigma[a,b] w[a] w[b]

Objective (MinimumVariance):
    min  sum_{a,b} sigma[a,b] w[a] w[b]

Constraints:
    Budget:  sum_a w[a] = 1

USAGE
-----
    auto market = markowitz::generateMarketData(1, 10);

    markowitz::PortfolioModel pm(market, 0.5);
    pm.optimize();
    markowitz::requireSolution(pm.model(), "gamma = 0.5", 0.5);

    Eigen::VectorXd w = pm.weights();
    double r = pm.expectedReturn();      // mu' w
    double s = pm.risk();                // sqrt(w' Sigma w)

After a successful solve store() holds "expected_return", "variance",
"risk", "objective", "runtime" and "bar_iter_count"; "status" is stored
after every solve.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <Eigen/Dense>

#include "gurobi_c++.h"

#include "callbacks.h"
#include "config.h"
#include "constraints.h"
#include "enum_utils.h"
#include "expressions.h"
#include "market_data.h"
#include "model_builder.h"
#include "variables.h"

namespace markowitz {

    MARKOWITZ_DECLARE_ENUM(PortfolioVars, W);
    MARKOWITZ_DECLARE_ENUM(PortfolioCons, Budget);

    // ========================================================================
    // PLAIN-VECTOR PORTFOLIO MEASURES
    // ========================================================================

    namespace portfolio_detail {
        inline void check_weights(const char* where, Eigen::Index n, Eigen::Index w) {
            if (n != w) {
                throw std::invalid_argument(
                    std::format("{}: {} assets but {} weights", where, n, w));
            }
        }
    } // namespace portfolio_detail

    /// @brief mu' w
    inline double portfolioReturn(const Eigen::VectorXd& mu, const Eigen::VectorXd& w) {
        portfolio_detail::check_weights("portfolioReturn", mu.size(), w.size());
        return mu.dot(w);
    }

    /// @brief w' Sigma w
    inline double portfolioVariance(const Eigen::MatrixXd& sigma, const Eigen::VectorXd& w) {
        portfolio_detail::check_weights("portfolioVariance", sigma.rows(), w.size());
        portfolio_detail::check_weights("portfolioVariance", sigma.cols(), w.size());
        return w.dot(sigma * w);
    }

    /// @brief sqrt(w' Sigma w); round-off below zero is clamped
    inline double portfolioRisk(const Eigen::MatrixXd& sigma, const Eigen::VectorXd& w) {
        return std::sqrt(std::max(0.0, portfolioVariance(sigma, w)));
    }

    /// @brief mu' w - gamma w' Sigma w
    inline double riskAdjustedObjective(const Eigen::VectorXd& mu, const Eigen::MatrixXd& sigma,
                                        const Eigen::VectorXd& w, double gamma) {
        return portfolioReturn(mu, w) - gamma * portfolioVariance(sigma, w);
    }

    // ========================================================================
    // PORTFOLIO MODEL
    // ========================================================================

    /**
     * @class PortfolioModel
     * @brief Builds and solves the long-only budget QP for one risk aversion
     *
     * @details The market is referenced, not copied; it must outlive the model.
     *          Construction validates the inputs but does no solver work.
     *
     * @throws std::invalid_argument from the constructors for invalid market
     *         data or, with RiskAdjustedReturn, gamma not finite and positive
     */
    class PortfolioModel : public ModelBuilder<PortfolioVars, PortfolioCons> {
    public:
        enum class Objective {
            RiskAdjustedReturn,     ///< max mu'w - gamma w'Sigma w
            MinimumVariance         ///< min w'Sigma w
        };

    private:
        const MarketData& market_;
        Objective objective_;
        double gamma_;
        SolverSettings settings_;
        BarrierCallback* callback_ = nullptr;   // not owned
        Eigen::VectorXd weights_;

    public:
        /// @brief Risk-adjusted return model on its own environment
        PortfolioModel(const MarketData& market, double gamma,
                       SolverSettings settings = {})
            : market_(market), objective_(Objective::RiskAdjustedReturn),
              gamma_(gamma), settings_(std::move(settings))
        {
            checkInputs();
        }

        /// @brief Risk-adjusted return model on a shared, started environment
        PortfolioModel(GRBEnv& env, const MarketData& market, double gamma,
                       SolverSettings settings = {})
            : ModelBuilder(env), market_(market), objective_(Objective::RiskAdjustedReturn),
              gamma_(gamma), settings_(std::move(settings))
        {
            checkInputs();
        }

        /**
         * @brief Model with an explicit objective on a shared environment
         * @param gamma Ignored for MinimumVariance
         */
        PortfolioModel(GRBEnv& env, const MarketData& market, Objective objective,
                       SolverSettings settings = {},
                       double gamma = std::numeric_limits<double>::quiet_NaN())
            : ModelBuilder(env), market_(market), objective_(objective),
              gamma_(gamma), settings_(std::move(settings))
        {
            checkInputs();
        }

        PortfolioModel(MarketData&&, double, SolverSettings = {}) = delete;
        PortfolioModel(GRBEnv&, MarketData&&, double, SolverSettings = {}) = delete;
        PortfolioModel(GRBEnv&, MarketData&&, Objective, SolverSettings = {},
                       double = std::numeric_limits<double>::quiet_NaN()) = delete;

        Objective objective() const noexcept { return objective_; }

        /// @brief Risk aversion; NaN for MinimumVariance
        double gamma() const noexcept {
            return objective_ == Objective::RiskAdjustedReturn
                ? gamma_ : std::numeric_limits<double>::quiet_NaN();
        }

        const MarketData& market() const noexcept { return market_; }

        /// @brief Observe the barrier solve; cb must outlive optimize()
        void setProgress(BarrierCallback* cb) noexcept { callback_ = cb; }

        // -------------------------------------------------------------------------
        // Solution
        // -------------------------------------------------------------------------

        bool solved() const noexcept { return weights_.size() > 0; }

        /// @throws std::logic_error without a solution
        const Eigen::VectorXd& weights() const {
            requireSolved("weights");
            return weights_;
        }

        double expectedReturn() const { return stored("expected_return"); }
        double variance() const { return stored("variance"); }
        double risk() const { return stored("risk"); }

        /// @brief Dual price of sum(w) = 1
        double budgetDual() const {
            requireSolved("budgetDual");
            return dual(cons_.get(PortfolioCons::Budget).scalar());
        }

        // -------------------------------------------------------------------------
        // Model expressions (evaluate() them after solving)
        // -------------------------------------------------------------------------

        GRBLinExpr returnExpr() const {
            return dot(market_.mu, builtWeights("returnExpr"));
        }

        GRBQuadExpr varianceExpr() const {
            return quadForm(market_.sigma, builtWeights("varianceExpr"));
        }

        /// @brief The expression handed to setObjective()
        GRBQuadExpr objectiveExpr() const {
            if (objective_ == Objective::MinimumVariance) {
                return varianceExpr();
            }
            const auto& W = builtWeights("objectiveExpr");
            GRBQuadExpr obj = dot(market_.mu, W);
            obj -= quadForm(gamma_ * market_.sigma, W);
            return obj;
        }

    protected:
        /// Owned environment only; silences the license banner of quiet runs
        void configureEnvironment(GRBEnv& env) override {
            env.set(GRB_IntParam_OutputFlag, settings_.quiet ? 0 : 1);
        }

        void addParameters() override {
            apply(settings_);
        }

        void addVariables() override {
            auto W = VariableFactory::add(
                model(), GRB_CONTINUOUS, 0.0, GRB_INFINITY, "w", market_.assetCount());
            variables().set(PortfolioVars::W, std::move(W));
        }

        void addConstraints() override {
            auto& W = variables().get(PortfolioVars::W);
            auto budget = ConstraintFactory::add(model(), "budget",
                [&]() { return sum(W) == 1.0; });
            constraints().set(PortfolioCons::Budget, std::move(budget));
        }

        void addObjective() override {
            if (objective_ == Objective::MinimumVariance) {
                minimize(objectiveExpr());
            }
            else {
                maximize(objectiveExpr());
            }
        }

        void beforeOptimize() override {
            if (callback_) {
                model().setCallback(callback_);
            }
        }

        void afterOptimize() override {
            store()["status"] = status();
            if (!hasSolution()) {
                return;
            }

            weights_ = toVector(variables().get(PortfolioVars::W));

            const double var = portfolioVariance(market_.sigma, weights_);
            store()["expected_return"] = portfolioReturn(market_.mu, weights_);
            store()["variance"] = var;
            store()["risk"] = std::sqrt(std::max(0.0, var));
            store()["objective"] = objVal();
            store()["runtime"] = runtime();
            store()["bar_iter_count"] = barIterCount();
        }

    private:
        void checkInputs() const {
            validate(market_);
            if (objective_ == Objective::RiskAdjustedReturn &&
                !(std::isfinite(gamma_) && gamma_ > 0.0)) {
                throw std::invalid_argument(
                    std::format("PortfolioModel: gamma must be finite and positive, got {}", gamma_));
            }
            settings_.validate();
        }

        void requireSolved(const char* what) const {
            if (!solved()) {
                throw std::logic_error(
                    std::format("PortfolioModel::{}: no solution available", what));
            }
        }

        double stored(const char* key) const {
            requireSolved(key);
            return store().at(key).get<double>();
        }

        const WeightVector& builtWeights(const char* what) const {
            const auto& W = vars_.get(PortfolioVars::W);
            if (W.empty()) {
                throw std::logic_error(
                    std::format("PortfolioModel::{}: model has not been built", what));
            }
            return W;
        }
    };

} // namespace markowitz

#pragma once
/*
===============================================================================
FRONTIER — Risk-aversion sweep over the portfolio QP
===============================================================================

OVERVIEW
--------
The efficient frontier is traced by solving one PortfolioModel per risk
aversion gamma on a log-spaced grid:

    gamma_k = 10^(lo + k (hi - lo) / (samples - 1)),   k = 0..samples-1

Each sample is independent. solveOne() is the per-sample unit of work: it
builds a model on a shared environment, solves it and returns a
FrontierPoint (weights, mu'w, sqrt(w'Sigma w), status, runtime). Return and
risk are computed from the returned weights by ordinary functions.

FrontierSolver owns the environment and runs the sweep in grid order,
writing sample k to position k of the resulting Frontier.

FAILURE POLICY
--------------
The sweep stops at the first sample without a usable solution and throws
SolveError naming the sample index, gamma and Gurobi status. No partial
Frontier is returned.

USAGE
-----
    auto market = markowitz::generateMarketData(1, 10);
    auto grid   = markowitz::riskAversionGrid(100, -2.0, 3.0);

    markowitz::FrontierSolver solver(market);
    solver.setLog(&std::clog);
    markowitz::Frontier frontier = solver.sweep(grid);

    for (const auto& p : frontier)
        std::cout << p.gamma << " " << p.risk << " " << p.expectedReturn << "\n";

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "gurobi_c++.h"

#include "callbacks.h"
#include "config.h"
#include "diagnostics.h"
#include "market_data.h"
#include "portfolio_model.h"

namespace markowitz {

    // ========================================================================
    // RISK-AVERSION GRID
    // ========================================================================

    /**
     * @brief samples values log-spaced from 10^lowExp to 10^highExp inclusive
     * @throws std::invalid_argument if samples <= 0 or an exponent is not finite
     */
    inline std::vector<double> riskAversionGrid(int samples, double lowExp, double highExp) {
        if (samples <= 0) {
            throw std::invalid_argument(
                std::format("riskAversionGrid: samples must be positive, got {}", samples));
        }
        if (!std::isfinite(lowExp) || !std::isfinite(highExp)) {
            throw std::invalid_argument("riskAversionGrid: exponents must be finite");
        }

        std::vector<double> grid;
        grid.reserve(static_cast<std::size_t>(samples));
        if (samples == 1) {
            grid.push_back(std::pow(10.0, lowExp));
            return grid;
        }

        const double step = (highExp - lowExp) / (samples - 1);
        for (int k = 0; k < samples; ++k) {
            const double e = (k == samples - 1) ? highExp : lowExp + k * step;
            grid.push_back(std::pow(10.0, e));
        }
        return grid;
    }

    inline std::vector<double> riskAversionGrid(const FrontierConfig& config) {
        return riskAversionGrid(config.samples, config.gammaMinExponent, config.gammaMaxExponent);
    }

    // ========================================================================
    // FRONTIER POINT / FRONTIER
    // ========================================================================

    struct FrontierPoint {
        double gamma = 0.0;             ///< NaN for the minimum-variance portfolio
        Eigen::VectorXd weights;
        double expectedReturn = 0.0;    ///< mu' w
        double risk = 0.0;              ///< sqrt(w' Sigma w)
        int status = GRB_LOADED;
        double runtime = 0.0;           ///< Seconds in optimize()
    };

    /**
     * @class Frontier
     * @brief Solved samples in grid order
     */
    class Frontier {
        std::vector<FrontierPoint> points_;

    public:
        Frontier() = default;
        explicit Frontier(std::vector<FrontierPoint> points) : points_(std::move(points)) {}

        int size() const noexcept { return static_cast<int>(points_.size()); }
        bool empty() const noexcept { return points_.empty(); }

        /// @throws std::out_of_range
        const FrontierPoint& at(int k) const {
            if (k < 0 || k >= size()) {
                throw std::out_of_range(
                    std::format("Frontier::at: sample {} out of range [0, {})", k, size()));
            }
            return points_[static_cast<std::size_t>(k)];
        }

        const FrontierPoint& operator[](int k) const { return at(k); }

        auto begin() const noexcept { return points_.begin(); }
        auto end() const noexcept { return points_.end(); }

        std::vector<double> gammas() const { return column(&FrontierPoint::gamma); }
        std::vector<double> returns() const { return column(&FrontierPoint::expectedReturn); }
        std::vector<double> risks() const { return column(&FrontierPoint::risk); }

    private:
        std::vector<double> column(double FrontierPoint::* field) const {
            std::vector<double> out;
            out.reserve(points_.size());
            for (const auto& p : points_) out.push_back(p.*field);
            return out;
        }
    };

    // ========================================================================
    // SINGLE SAMPLE
    // ========================================================================

    namespace frontier_detail {

        inline FrontierPoint extract(PortfolioModel& pm, const std::string& context) {
            pm.optimize();
            requireSolution(pm.model(), context, pm.gamma());

            FrontierPoint p;
            p.gamma = pm.gamma();
            p.weights = pm.weights();
            p.expectedReturn = portfolioReturn(pm.market().mu, p.weights);
            p.risk = portfolioRisk(pm.market().sigma, p.weights);
            p.status = pm.status();
            p.runtime = pm.runtime();
            return p;
        }

    } // namespace frontier_detail

    /**
     * @brief Solve max mu'w - gamma w'Sigma w, w >= 0, sum(w) = 1
     *
     * @param env      Started environment shared across samples
     * @param progress Optional barrier observer
     *
     * @throws std::invalid_argument if gamma is not finite and positive
     * @throws SolveError            if the solve ends without a usable solution
     */
    inline FrontierPoint solveOne(GRBEnv& env, const MarketData& market, double gamma,
                                  const SolverSettings& settings = {},
                                  BarrierCallback* progress = nullptr) {
        PortfolioModel pm(env, market, gamma, settings);
        pm.setProgress(progress);
        return frontier_detail::extract(pm, std::format("gamma = {:g}", gamma));
    }

    // ========================================================================
    // CLOSED-FORM MINIMUM VARIANCE
    // ========================================================================

    /**
     * @brief Sigma^-1 1 / (1' Sigma^-1 1)
     *
     * @details Minimizes w'Sigma w subject to sum(w) = 1 only. Equals the
     *          long-only minimum-variance portfolio whenever the result is
     *          componentwise non-negative.
     *
     * @throws std::invalid_argument if Sigma is not square or is singular
     */
    inline Eigen::VectorXd closedFormMinimumVariance(const Eigen::MatrixXd& sigma) {
        if (sigma.rows() == 0 || sigma.rows() != sigma.cols()) {
            throw std::invalid_argument(
                std::format("closedFormMinimumVariance: expected a non-empty square matrix, got {}x{}",
                            sigma.rows(), sigma.cols()));
        }

        Eigen::LDLT<Eigen::MatrixXd> ldlt(sigma);
        const Eigen::VectorXd d = ldlt.vectorD().cwiseAbs();
        if (ldlt.info() != Eigen::Success || d.minCoeff() <= 1e-12 * std::max(1.0, d.maxCoeff())) {
            throw std::invalid_argument("closedFormMinimumVariance: covariance is singular");
        }

        const Eigen::VectorXd ones = Eigen::VectorXd::Ones(sigma.rows());
        const Eigen::VectorXd x = ldlt.solve(ones);
        return x / ones.dot(x);
    }

    // ========================================================================
    // FRONTIER SOLVER
    // ========================================================================

    /**
     * @class FrontierSolver
     * @brief Runs the sweep on one Gurobi environment
     *
     * @details The environment is started on first use with OutputFlag taken
     *          from the settings, so a quiet run prints nothing, not even the
     *          license banner.
     */
    class FrontierSolver {
        const MarketData& market_;
        SolverSettings settings_;
        std::unique_ptr<GRBEnv> env_;
        std::ostream* log_ = nullptr;            // not owned
        BarrierCallback* progress_ = nullptr;    // not owned

    public:
        /// @throws std::invalid_argument for invalid market data or settings
        explicit FrontierSolver(const MarketData& market, SolverSettings settings = {})
            : market_(market), settings_(std::move(settings))
        {
            validate(market_);
            settings_.validate();
        }

        /// The market is referenced and must outlive the solver
        FrontierSolver(MarketData&&, SolverSettings = {}) = delete;

        /// @brief One line per solved sample; nullptr disables
        void setLog(std::ostream* os) noexcept { log_ = os; }

        void setProgress(BarrierCallback* cb) noexcept { progress_ = cb; }

        const SolverSettings& settings() const noexcept { return settings_; }

        GRBEnv& environment() {
            if (!env_) {
                auto env = std::make_unique<GRBEnv>(true);
                env->set(GRB_IntParam_OutputFlag, settings_.quiet ? 0 : 1);
                env->start();
                env_ = std::move(env);
            }
            return *env_;
        }

        /**
         * @brief Solve every gamma in order
         * @throws std::invalid_argument before any solve if a gamma is invalid
         * @throws SolveError at the first failing sample
         */
        Frontier sweep(const std::vector<double>& gammas) {
            for (std::size_t k = 0; k < gammas.size(); ++k) {
                if (!(std::isfinite(gammas[k]) && gammas[k] > 0.0)) {
                    throw std::invalid_argument(
                        std::format("FrontierSolver::sweep: gamma[{}] = {} is not finite and positive",
                                    k, gammas[k]));
                }
            }

            const int total = static_cast<int>(gammas.size());
            std::vector<FrontierPoint> points(gammas.size());

            for (int k = 0; k < total; ++k) {
                const double gamma = gammas[static_cast<std::size_t>(k)];

                PortfolioModel pm(environment(), market_, gamma, settings_);
                pm.setProgress(progress_);
                points[static_cast<std::size_t>(k)] = frontier_detail::extract(
                    pm, std::format("sample {} of {} (gamma = {:g})", k, total, gamma));

                logPoint(k, points[static_cast<std::size_t>(k)]);
            }

            return Frontier(std::move(points));
        }

        /// @brief Long-only minimum-variance portfolio (gamma reported as NaN)
        FrontierPoint minimumVariance() {
            PortfolioModel pm(environment(), market_,
                              PortfolioModel::Objective::MinimumVariance, settings_);
            pm.setProgress(progress_);
            return frontier_detail::extract(pm, "minimum variance");
        }

    private:
        void logPoint(int k, const FrontierPoint& p) const {
            if (!log_) return;
            *log_ << std::format("  [{:3d}] gamma {:10.4e}  return {:8.4f}  risk {:8.4f}  {:<10} {:.3f}s\n",
                                 k, p.gamma, p.expectedReturn, p.risk,
                                 statusString(p.status), p.runtime);
        }
    };

} // namespace markowitz

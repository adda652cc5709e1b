/*
================================================================================
EXAMPLE 01: EFFICIENT FRONTIER - Risk-Aversion Sweep of a Mean-Variance QP
================================================================================
PROBLEM TYPE: Convex Quadratic Programming (QP), solved once per sample

PROBLEM DESCRIPTION
-------------------
A synthetic market of n assets is generated from a seed: expected returns
mu_i = |N(0,1)| and covariance Sigma = A'A with A an n x n standard normal
matrix. For each risk aversion gamma on a log-spaced grid the long-only,
fully invested portfolio maximizing risk-adjusted return is computed. The
(risk, return) pairs trace the efficient frontier.

MATHEMATICAL MODEL
------------------
Variables:
    w[a] >= 0                   Fraction of budget in asset a

Objective:
    max  mu' w - gamma * w' Sigma w

Constraints:
    Budget:  sum_a w[a] = 1

USAGE
-----
    01_efficient_frontier [key=value ...]

    n=10 seed=1 samples=100 gamma_min=-2 gamma_max=3 markers=29,40
    quiet=1 time_limit=0 threads=0 bar_conv_tol=1e-9 bar_iter_limit=-1
    log_file= csv=frontier.csv

FEATURES DEMONSTRATED
---------------------
- parseOverrides() / FrontierConfig     Run configuration from arguments
- generateMarketData()                  Seeded data generator
- FrontierSolver::sweep()               One QP per gamma on a shared GRBEnv
- FrontierSolver::minimumVariance()     Minimum-variance reference portfolio
- ProgressLogger                        Barrier iterations (quiet=0)
- renderFrontier() / renderAllocations() / renderReturnDistributions()
- writeFrontierCsv()                    Results export
- SolveError                            Failing sample reported with its gamma

================================================================================
*/

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <gurobi_markowitz/markowitz.h>

int main(int argc, char* argv[]) {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: Efficient Frontier (Markowitz Mean-Variance)\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // CONFIGURATION
        // ====================================================================
        std::vector<std::string> args(argv + 1, argv + argc);
        auto config = markowitz::FrontierConfig::fromStore(markowitz::parseOverrides(args));
        config.validate();

        std::cout << "CONFIGURATION\n";
        std::cout << "-------------\n";
        std::cout << "Assets:  " << config.assets << "\n";
        std::cout << "Seed:    " << config.seed << "\n";
        std::cout << "Samples: " << config.samples << " (gamma from 1e"
                  << config.gammaMinExponent << " to 1e" << config.gammaMaxExponent << ")\n\n";

        // ====================================================================
        // MARKET DATA
        // ====================================================================
        auto market = markowitz::generateMarketData(config.seed, config.assets);

        std::cout << "MARKET DATA\n";
        std::cout << "-----------\n";
        markowitz::renderMarketTable(std::cout, market);
        std::cout << "\nmin eigenvalue of Sigma: " << std::scientific << std::setprecision(3)
                  << markowitz::minEigenvalue(market.sigma) << std::defaultfloat << "\n\n";

        // ====================================================================
        // FRONTIER SWEEP
        // ====================================================================
        markowitz::FrontierSolver solver(market, config.solver);
        markowitz::ProgressLogger progress(std::cout);
        if (!config.solver.quiet) {
            solver.setProgress(&progress);
        }
        solver.setLog(&std::cout);

        std::cout << "FRONTIER SWEEP\n";
        std::cout << "--------------\n";
        auto grid = markowitz::riskAversionGrid(config);
        auto frontier = solver.sweep(grid);

        double totalRuntime = 0.0;
        for (const auto& p : frontier) totalRuntime += p.runtime;
        std::cout << "\nSolved " << frontier.size() << " QPs in "
                  << std::fixed << std::setprecision(3) << totalRuntime << "s\n\n";

        // ====================================================================
        // MINIMUM VARIANCE PORTFOLIO
        // ====================================================================
        std::cout << "MINIMUM VARIANCE PORTFOLIO\n";
        std::cout << "--------------------------\n";
        auto minVar = solver.minimumVariance();
        std::cout << "Expected Return: " << std::setprecision(4) << minVar.expectedReturn << "\n";
        std::cout << "Risk:            " << minVar.risk << "\n";
        std::cout << "Allocation:\n";
        for (int a = 0; a < market.assetCount(); ++a) {
            const double pct = minVar.weights(a) * 100;
            if (pct > 0.1) {
                std::cout << "  " << std::setw(6) << market.labels[static_cast<std::size_t>(a)] << ": ";
                int barLen = static_cast<int>(pct / 2);
                std::cout << "[" << std::string(static_cast<std::size_t>(barLen), '=')
                          << std::string(static_cast<std::size_t>(std::max(0, 50 - barLen)), ' ')
                          << "] " << std::setw(6) << std::setprecision(2) << pct << "%\n";
            }
        }
        std::cout << std::defaultfloat << "\n";

        // ====================================================================
        // CHARTS
        // ====================================================================
        markowitz::RenderOptions options;
        markowitz::checkSampleIndices(frontier, config.markers);

        markowitz::renderFrontier(std::cout, frontier, market, config.markers, options);
        std::cout << "\n";
        markowitz::renderAllocations(std::cout, frontier, config.markers, market.labels, options);
        std::cout << "\n";
        markowitz::renderReturnDistributions(std::cout, frontier, config.markers, options);

        // ====================================================================
        // EXPORT
        // ====================================================================
        if (!config.csvPath.empty()) {
            std::ofstream csv(config.csvPath);
            if (!csv) {
                std::cerr << "Error: cannot open " << config.csvPath << " for writing\n";
                return 1;
            }
            markowitz::writeFrontierCsv(csv, frontier, market.labels);
            std::cout << "\nWrote " << frontier.size() << " samples to " << config.csvPath << "\n";
        }

    } catch (markowitz::SolveError& e) {
        std::cerr << "Solve failed: " << e.what() << "\n";
        return 1;
    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}

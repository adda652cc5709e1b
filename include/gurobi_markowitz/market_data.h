#pragma once
/*
===============================================================================
MARKET DATA — Synthetic expected returns and covariance
===============================================================================

OVERVIEW
--------
A MarketData instance is the fixed input of a frontier run: n assets, their
expected returns mu and covariance Sigma. generateMarketData() produces a
reproducible toy instance from a seed:

    mu_i  = |z_i|,        z_i  ~ N(0, 1)
    Sigma = A' A,         A_ij ~ N(0, 1), A is n x n

A' A is symmetric positive semidefinite by construction. The same seed
always yields the same mu and Sigma (std::mt19937_64, mu drawn first, then A
column by column).

KEY COMPONENTS
--------------
• MarketData                — mu, Sigma, asset labels
• generateMarketData()      — seeded generator
• validate()                — dimension, finiteness and symmetry checks
• minEigenvalue() / isPositiveSemidefinite()
• singleAssetRisk() / maxReturnAsset() — single-asset reference points

USAGE
-----
    auto market = markowitz::generateMarketData(1, 10);
    Eigen::VectorXd sd = markowitz::singleAssetRisk(market);   // sqrt(diag)

EXCEPTION SAFETY
----------------
• generateMarketData(): std::invalid_argument for n <= 0
• validate(): std::invalid_argument describing the first problem found

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "naming.h"

namespace markowitz {

    // ========================================================================
    // MARKET DATA
    // ========================================================================
    struct MarketData {
        Eigen::VectorXd mu;                 ///< Expected return per asset
        Eigen::MatrixXd sigma;              ///< Return covariance
        std::vector<std::string> labels;    ///< "A0", "A1", ...

        int assetCount() const noexcept { return static_cast<int>(mu.size()); }
    };

    /**
     * @brief Check that a MarketData instance describes a valid QP input
     *
     * @details n > 0, mu has n entries, Sigma is n x n, every entry is
     *          finite, and |S_ij - S_ji| <= 1e-9 * max(1, max|S|). Labels, if
     *          present, must number n.
     *
     * @throws std::invalid_argument
     */
    inline void validate(const MarketData& m) {
        const Eigen::Index n = m.mu.size();
        if (n == 0) {
            throw std::invalid_argument("MarketData: no assets");
        }
        if (m.sigma.rows() != n || m.sigma.cols() != n) {
            throw std::invalid_argument(
                std::format("MarketData: sigma is {}x{}, expected {}x{}",
                            m.sigma.rows(), m.sigma.cols(), n, n));
        }
        if (!m.labels.empty() && static_cast<Eigen::Index>(m.labels.size()) != n) {
            throw std::invalid_argument(
                std::format("MarketData: {} labels for {} assets", m.labels.size(), n));
        }
        if (!m.mu.allFinite()) {
            throw std::invalid_argument("MarketData: mu has a non-finite entry");
        }
        if (!m.sigma.allFinite()) {
            throw std::invalid_argument("MarketData: sigma has a non-finite entry");
        }

        const double scale = std::max(1.0, m.sigma.cwiseAbs().maxCoeff());
        const double asym = (m.sigma - m.sigma.transpose()).cwiseAbs().maxCoeff();
        if (asym > 1e-9 * scale) {
            throw std::invalid_argument(
                std::format("MarketData: sigma is not symmetric (max |S - S'| = {:g})", asym));
        }
    }

    /**
     * @brief Seeded synthetic market
     * @param seed Generator seed
     * @param n    Number of assets
     * @throws std::invalid_argument if n <= 0
     */
    inline MarketData generateMarketData(std::uint64_t seed, int n) {
        if (n <= 0) {
            throw std::invalid_argument(
                std::format("generateMarketData: asset count must be positive, got {}", n));
        }

        std::mt19937_64 rng(seed);
        std::normal_distribution<double> normal(0.0, 1.0);

        MarketData m;
        m.mu.resize(n);
        for (int i = 0; i < n; ++i) {
            m.mu(i) = std::abs(normal(rng));
        }

        Eigen::MatrixXd A(n, n);
        for (int j = 0; j < n; ++j) {
            for (int i = 0; i < n; ++i) {
                A(i, j) = normal(rng);
            }
        }
        m.sigma = A.transpose() * A;
        // exact symmetry
        m.sigma = 0.5 * (m.sigma + m.sigma.transpose()).eval();

        m.labels = assetLabels(n);
        return m;
    }

    // ========================================================================
    // SPECTRAL CHECKS
    // ========================================================================

    /// @brief Smallest eigenvalue of a symmetric matrix
    inline double minEigenvalue(const Eigen::MatrixXd& S) {
        if (S.rows() == 0 || S.rows() != S.cols()) {
            throw std::invalid_argument(
                std::format("minEigenvalue: expected a non-empty square matrix, got {}x{}",
                            S.rows(), S.cols()));
        }
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(S, Eigen::EigenvaluesOnly);
        if (es.info() != Eigen::Success) {
            throw std::runtime_error("minEigenvalue: eigen-decomposition did not converge");
        }
        return es.eigenvalues().minCoeff();
    }

    /**
     * @brief All eigenvalues >= -eps * max(1, largest eigenvalue magnitude)
     */
    inline bool isPositiveSemidefinite(const Eigen::MatrixXd& S, double eps = 1e-9) {
        if (S.rows() == 0 || S.rows() != S.cols()) {
            return false;
        }
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(S, Eigen::EigenvaluesOnly);
        if (es.info() != Eigen::Success) {
            return false;
        }
        const auto& ev = es.eigenvalues();
        const double scale = std::max(1.0, ev.cwiseAbs().maxCoeff());
        return ev.minCoeff() >= -eps * scale;
    }

    // ========================================================================
    // SINGLE-ASSET PORTFOLIOS
    // ========================================================================

    /// @brief sqrt(Sigma_ii), the risk of holding asset i alone
    inline Eigen::VectorXd singleAssetRisk(const MarketData& m) {
        return m.sigma.diagonal().cwiseMax(0.0).cwiseSqrt();
    }

    /// @brief Index of the asset with the largest expected return (first on ties)
    inline int maxReturnAsset(const MarketData& m) {
        if (m.mu.size() == 0) {
            throw std::invalid_argument("maxReturnAsset: no assets");
        }
        Eigen::Index k = 0;
        m.mu.maxCoeff(&k);
        return static_cast<int>(k);
    }

} // namespace markowitz

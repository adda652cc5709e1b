#pragma once
/*
===============================================================================
EXPRESSIONS — Linear and quadratic portfolio expressions
===============================================================================

OVERVIEW
--------
Builds the Gurobi expressions a mean-variance model is made of:

    expected return     mu' w          -> dot(mu, W)
    budget              sum_i w_i      -> sum(W)
    variance            w' Sigma w     -> quadForm(Sigma, W)

and evaluates any of them at the solution once the model is solved
(evaluate()). The general sum()/quadSum() helpers iterate an index domain
(see indexing.h) and accumulate whatever a lambda returns.

CONCEPTUAL MODEL
----------------
    sum_{i in I} f(i)             -> sum(I, f)
    sum_{i <= j} f(i,j)           -> quadSum(upperPairs(n), f)

quadForm() iterates upperPairs(n) and uses the symmetric part of Sigma, so a
model holds n(n+1)/2 quadratic terms instead of n^2.

EXCEPTION SAFETY
----------------
• dot()/quadForm(): std::invalid_argument on a dimension mismatch
• evaluate(): GRBException when the model has no solution
• Lambda exceptions propagate unchanged

===============================================================================
*/

#include <format>
#include <functional>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>

#include <Eigen/Dense>

#include "gurobi_c++.h"
#include "indexing.h"
#include "variables.h"

namespace markowitz {

    namespace expr_detail {

        /// f(i) for scalar indices, f(i, j, ...) for tuple indices
        template<typename Func, typename Idx>
        auto invoke_on_index(Func&& f, Idx&& idx) {
            using RawIdx = std::remove_cvref_t<Idx>;

            if constexpr (detail::is_tuple_like_v<RawIdx>) {
                return std::apply(
                    [&](auto&&... args) {
                        return std::invoke(std::forward<Func>(f),
                            std::forward<decltype(args)>(args)...);
                    },
                    std::forward<Idx>(idx));
            }
            else {
                return std::invoke(std::forward<Func>(f), std::forward<Idx>(idx));
            }
        }

        inline void check_length(const char* where, Eigen::Index expected, int actual) {
            if (expected != actual) {
                throw std::invalid_argument(
                    std::format("{}: dimension mismatch ({} coefficients, {} variables)",
                        where, expected, actual));
            }
        }

    } // namespace expr_detail

    // ========================================================================
    // LINEAR
    // ========================================================================

    /**
     * @brief sum_{idx in rng} func(idx...)
     * @example
     *     auto ret = sum(range(0, n), [&](int i) { return mu(i) * W(i); });
     */
    template<typename Range, typename Func>
    GRBLinExpr sum(const Range& rng, Func&& func) {
        GRBLinExpr expr = 0.0;
        for (const auto& idx : rng) {
            expr += expr_detail::invoke_on_index(func, idx);
        }
        return expr;
    }

    /// @brief sum_i w_i
    inline GRBLinExpr sum(const WeightVector& W) {
        GRBLinExpr expr = 0.0;
        for (const auto& v : W) expr += v;
        return expr;
    }

    /**
     * @brief Inner product c' w
     * @throws std::invalid_argument if c.size() != W.size()
     */
    inline GRBLinExpr dot(const Eigen::VectorXd& c, const WeightVector& W) {
        expr_detail::check_length("dot", c.size(), W.size());

        GRBLinExpr expr = 0.0;
        W.forEach([&](const GRBVar& v, int i) { expr += c(i) * v; });
        return expr;
    }

    // ========================================================================
    // QUADRATIC
    // ========================================================================

    /**
     * @brief sum_{idx in rng} func(idx...) as a quadratic expression
     * @example
     *     auto diag = quadSum(upperPairs(n), [&](int a, int b) {
     *         return a == b ? S(a, a) * W(a) * W(a) : GRBQuadExpr(0.0);
     *     });
     */
    template<typename Range, typename Func>
    GRBQuadExpr quadSum(const Range& rng, Func&& func) {
        GRBQuadExpr expr = 0.0;
        for (const auto& idx : rng) {
            expr += expr_detail::invoke_on_index(func, idx);
        }
        return expr;
    }

    /**
     * @brief Quadratic form w' S w over the upper triangle of S
     *
     * @details Uses (S + S')/2, so an asymmetric S contributes the same form
     *          as its symmetric part. Zero entries are skipped.
     *
     * @throws std::invalid_argument if S is not W.size() x W.size()
     */
    inline GRBQuadExpr quadForm(const Eigen::MatrixXd& S, const WeightVector& W) {
        expr_detail::check_length("quadForm(rows)", S.rows(), W.size());
        expr_detail::check_length("quadForm(cols)", S.cols(), W.size());

        return quadSum(upperPairs(W.size()), [&](int i, int j) -> GRBQuadExpr {
            const double s = (i == j) ? S(i, i) : S(i, j) + S(j, i);
            if (s == 0.0) return GRBQuadExpr(0.0);
            return s * (W(i) * W(j));
        });
    }

    // ========================================================================
    // EVALUATION
    // ========================================================================

    /// @brief Value of a linear expression at the current solution
    inline double evaluate(const GRBLinExpr& expr) {
        return expr.getValue();
    }

    /// @brief Value of a quadratic expression at the current solution
    inline double evaluate(const GRBQuadExpr& expr) {
        return expr.getValue();
    }

} // namespace markowitz

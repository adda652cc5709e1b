#pragma once
/*
===============================================================================
VARIABLES — Portfolio decision vector on top of Gurobi
===============================================================================

OVERVIEW
--------
Holds the decision variables of a portfolio model. The central type is
WeightVector, the vector w in R^n of budget fractions, one GRBVar per asset.
VariableFactory creates it on a GRBModel; the solution extraction helpers read
it back as std::vector<double> or Eigen::VectorXd once the model is solved.

KEY COMPONENTS
--------------
• WeightVector    — ordered GRBVar per asset with bounds-checked access
• VariableFactory — creates scalar variables and weight vectors
• VariableTable   — enum-keyed registry of weight vectors (see enum_utils.h)
• value()/values()/toVector() — solution extraction
• lb()/ub()/setLB()/setUB()   — bound queries and updates

USAGE EXAMPLES
--------------
    // w_i in [0, inf), i = 0..n-1
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, GRB_INFINITY, "w", n);

    model.optimize();
    Eigen::VectorXd w = markowitz::toVector(W);
    double w3 = markowitz::value(W(3));

NAMING BEHAVIOR
---------------
Variables are named "w_0", "w_1", ... when naming_enabled() (see naming.h).

EXCEPTION SAFETY
----------------
• at()/operator(): std::out_of_range on a bad index
• VariableFactory::add: std::invalid_argument on a negative size
• value()/values(): GRBException when no solution is available

===============================================================================
*/

#include <string>
#include <vector>
#include <stdexcept>
#include <type_traits>
#include <format>

#include <Eigen/Dense>

#include "gurobi_c++.h"
#include "naming.h"
#include "enum_utils.h"

namespace markowitz {

    // ============================================================================
    // WEIGHT VECTOR
    // ============================================================================
    /**
     * @class WeightVector
     * @brief One GRBVar per asset, in asset order
     *
     * @details Empty by default so it can live in an EnumTable slot before the
     *          model's addVariables() hook fills it.
     */
    class WeightVector {
        std::vector<GRBVar> vars_;

    public:
        WeightVector() = default;
        explicit WeightVector(std::vector<GRBVar> vars) : vars_(std::move(vars)) {}

        int size() const noexcept { return static_cast<int>(vars_.size()); }
        bool empty() const noexcept { return vars_.empty(); }

        GRBVar& at(int i) {
            check(i);
            return vars_[static_cast<std::size_t>(i)];
        }

        const GRBVar& at(int i) const {
            check(i);
            return vars_[static_cast<std::size_t>(i)];
        }

        GRBVar& operator()(int i) { return at(i); }
        const GRBVar& operator()(int i) const { return at(i); }

        auto begin() { return vars_.begin(); }
        auto end() { return vars_.end(); }
        auto begin() const { return vars_.begin(); }
        auto end() const { return vars_.end(); }

        /// @brief Visit every variable with its asset index
        template<typename Fn>
        void forEach(Fn&& fn) {
            for (int i = 0; i < size(); ++i) fn(vars_[static_cast<std::size_t>(i)], i);
        }

        template<typename Fn>
        void forEach(Fn&& fn) const {
            for (int i = 0; i < size(); ++i) fn(vars_[static_cast<std::size_t>(i)], i);
        }

    private:
        void check(int i) const {
            if (i < 0 || i >= size()) {
                throw std::out_of_range(
                    std::format("WeightVector::at: index {} out of range [0, {})", i, size()));
            }
        }
    };

    // ============================================================================
    // VARIABLE FACTORY
    // ============================================================================
    class VariableFactory {
    public:
        /**
         * @brief Create a single variable
         * @example
         *     GRBVar t = VariableFactory::add(model, GRB_CONTINUOUS, 0, GRB_INFINITY, "t");
         */
        static GRBVar add(GRBModel& model,
            int vtype,
            double lb,
            double ub,
            const std::string& baseName)
        {
            return addVarOpt(model, lb, ub, vtype, make_name::plain(baseName));
        }

        /**
         * @brief Create a vector of n variables named baseName_i
         * @throws std::invalid_argument if n is negative
         */
        template<typename SizeType>
            requires std::is_integral_v<SizeType>
        static WeightVector add(GRBModel& model,
            int vtype,
            double lb,
            double ub,
            const std::string& baseName,
            SizeType n)
        {
            if (n < 0) {
                throw std::invalid_argument(
                    std::format("VariableFactory::add: negative size {}", n));
            }

            std::vector<GRBVar> vars;
            vars.reserve(static_cast<std::size_t>(n));
            for (SizeType i = 0; i < n; ++i) {
                vars.push_back(addVarOpt(model, lb, ub, vtype,
                    make_name::index(baseName, static_cast<int>(i))));
            }
            return WeightVector(std::move(vars));
        }

    private:
        static GRBVar addVarOpt(GRBModel& model,
            double lb,
            double ub,
            int vtype,
            const std::string& name)
        {
            if constexpr (naming_enabled()) {
                return model.addVar(lb, ub, 0.0, static_cast<char>(vtype), name);
            }
            else {
                return model.addVar(lb, ub, 0.0, static_cast<char>(vtype));
            }
        }
    };

    template<typename EnumT>
    using VariableTable = EnumTable<EnumT, WeightVector>;

    // ============================================================================
    // SOLUTION EXTRACTION
    // ============================================================================

    /// @brief Solution value of a variable (GRB_DoubleAttr_X)
    inline double value(const GRBVar& v) {
        return v.get(GRB_DoubleAttr_X);
    }

    /// @brief Solution values in asset order
    inline std::vector<double> values(const WeightVector& W) {
        std::vector<double> out;
        out.reserve(static_cast<std::size_t>(W.size()));
        for (const auto& v : W) out.push_back(value(v));
        return out;
    }

    /// @brief Solution values as an Eigen vector
    inline Eigen::VectorXd toVector(const WeightVector& W) {
        Eigen::VectorXd out(W.size());
        W.forEach([&](const GRBVar& v, int i) { out(i) = value(v); });
        return out;
    }

    // ============================================================================
    // BOUNDS
    // ============================================================================

    inline double lb(const GRBVar& v) { return v.get(GRB_DoubleAttr_LB); }
    inline double ub(const GRBVar& v) { return v.get(GRB_DoubleAttr_UB); }

    inline void setLB(GRBVar& v, double bound) { v.set(GRB_DoubleAttr_LB, bound); }
    inline void setUB(GRBVar& v, double bound) { v.set(GRB_DoubleAttr_UB, bound); }

} // namespace markowitz

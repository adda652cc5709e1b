#pragma once
/*
===============================================================================
DIAGNOSTICS — Status reporting, model statistics and solve-failure errors
===============================================================================

Overview
--------
Free functions over a GRBModel for turning solver state into something a
caller can log or act on:

    * Human-readable status names
    * Model statistics (variables, constraints, quadratic objective terms)
    * Solution quality (constraint and bound violations)
    * SolveError, the exception raised when a portfolio QP has no usable
      solution, and requireSolution() which raises it

Typical Usage
-------------
    PortfolioModel pm(market, 1.0);
    pm.optimize();

    std::cout << markowitz::statusString(pm.status()) << "\n";
    std::cout << markowitz::modelSummary(pm.model()) << "\n";

    markowitz::requireSolution(pm.model(), "gamma = 1.0", 1.0);

    auto q = markowitz::computeSolutionQuality(pm.model());
    if (q.maxConstrViolation > 1e-6) { ... }

===============================================================================
*/

#include <cmath>
#include <format>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include "gurobi_c++.h"

namespace markowitz {

// =============================================================================
// STATUS STRING CONVERSION
// =============================================================================

/**
 * @brief Convert a Gurobi status code to its name
 * @return "OPTIMAL", "INFEASIBLE", ... or "UNKNOWN(<code>)"
 */
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

/// @brief True for statuses whose solution values are usable
inline bool isUsableStatus(int status) noexcept {
    return status == GRB_OPTIMAL || status == GRB_SUBOPTIMAL;
}

// =============================================================================
// SOLVE ERROR
// =============================================================================

/**
 * @brief Raised when a portfolio QP ends without a usable solution
 *
 * @details Carries the Gurobi status and the risk-aversion value of the
 *          failing sample (NaN when the model has no risk-aversion parameter,
 *          e.g. the minimum-variance model).
 */
class SolveError : public std::runtime_error {
public:
    SolveError(const std::string& context, int status,
               double gamma = std::numeric_limits<double>::quiet_NaN())
        : std::runtime_error(std::format("{}: solver finished with status {}",
                                         context, statusString(status)))
        , status_(status)
        , gamma_(gamma)
    {
    }

    int status() const noexcept { return status_; }
    double gamma() const noexcept { return gamma_; }
    bool hasGamma() const noexcept { return !std::isnan(gamma_); }

private:
    int status_;
    double gamma_;
};

/**
 * @brief Throw SolveError unless the model holds an OPTIMAL/SUBOPTIMAL solution
 * @param model   Solved (or attempted) model
 * @param context Prefix of the error message, e.g. "sample 29 (gamma = 0.29)"
 * @param gamma   Risk aversion recorded in the error
 */
inline void requireSolution(const GRBModel& model, const std::string& context,
                            double gamma = std::numeric_limits<double>::quiet_NaN()) {
    const int status = model.get(GRB_IntAttr_Status);
    if (!isUsableStatus(status) || model.get(GRB_IntAttr_SolCount) == 0) {
        throw SolveError(context, status, gamma);
    }
}

// =============================================================================
// MODEL STATISTICS
// =============================================================================

struct ModelStatistics {
    int numVars = 0;        ///< Total number of variables
    int numConstrs = 0;     ///< Linear constraints
    int numNonZeros = 0;    ///< Non-zeros in the linear constraint matrix
    int numQNZs = 0;        ///< Non-zeros in the quadratic objective
    int numQConstrs = 0;    ///< Quadratic constraints
    int numContinuous = 0;  ///< Continuous variables
};

inline ModelStatistics computeStatistics(const GRBModel& model) {
    ModelStatistics stats;

    stats.numVars = model.get(GRB_IntAttr_NumVars);
    stats.numConstrs = model.get(GRB_IntAttr_NumConstrs);
    stats.numNonZeros = model.get(GRB_IntAttr_NumNZs);
    stats.numQNZs = model.get(GRB_IntAttr_NumQNZs);
    stats.numQConstrs = model.get(GRB_IntAttr_NumQConstrs);
    stats.numContinuous = stats.numVars - model.get(GRB_IntAttr_NumIntVars);

    return stats;
}

/// @brief True if the model has a quadratic objective and no integer variables
inline bool isQP(const GRBModel& model) {
    return model.get(GRB_IntAttr_NumQNZs) > 0 &&
           model.get(GRB_IntAttr_NumIntVars) == 0;
}

/// @return e.g. "10 vars, 1 constrs, 55 qobj nz"
inline std::string modelSummary(const GRBModel& model) {
    auto stats = computeStatistics(model);

    std::string result = std::format("{} vars, {} constrs", stats.numVars, stats.numConstrs);
    if (stats.numQNZs > 0) {
        result += std::format(", {} qobj nz", stats.numQNZs);
    }
    if (stats.numQConstrs > 0) {
        result += std::format(", {} qconstrs", stats.numQConstrs);
    }
    return result;
}

// =============================================================================
// SOLUTION QUALITY
// =============================================================================

struct SolutionQuality {
    double maxConstrViolation = 0.0;  ///< GRB_DoubleAttr_ConstrVio
    double maxBoundViolation = 0.0;   ///< GRB_DoubleAttr_BoundVio
    double sumConstrViolation = 0.0;  ///< Sum over linear constraints
};

/// @note Only call when the model has a solution
inline SolutionQuality computeSolutionQuality(GRBModel& model) {
    SolutionQuality quality;

    quality.maxConstrViolation = model.get(GRB_DoubleAttr_ConstrVio);
    quality.maxBoundViolation = model.get(GRB_DoubleAttr_BoundVio);

    std::unique_ptr<GRBConstr[]> constrs(model.getConstrs());
    const int numConstrs = model.get(GRB_IntAttr_NumConstrs);

    for (int i = 0; i < numConstrs; ++i) {
        const double slack = constrs[i].get(GRB_DoubleAttr_Slack);
        const char sense = constrs[i].get(GRB_CharAttr_Sense);

        // Slack = rhs - lhs; negative on a <= row, positive on a >= row,
        // any sign on an = row is a violation.
        if (sense == GRB_LESS_EQUAL && slack < 0) {
            quality.sumConstrViolation += -slack;
        } else if (sense == GRB_GREATER_EQUAL && slack > 0) {
            quality.sumConstrViolation += slack;
        } else if (sense == GRB_EQUAL) {
            quality.sumConstrViolation += std::abs(slack);
        }
    }

    return quality;
}

} // namespace markowitz

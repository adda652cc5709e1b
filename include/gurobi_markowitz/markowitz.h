#pragma once
/*
===============================================================================
GUROBI MARKOWITZ — Unified Include Header
===============================================================================

OVERVIEW
--------
Single include for the mean-variance frontier library: synthetic market
data, the long-only budget QP on Gurobi, the risk-aversion sweep and the text
renderer, together with the modeling layer they are built on.

WHAT'S INCLUDED
---------------
• naming.h          — Debug/release element names, asset labels
• enum_utils.h      — MARKOWITZ_DECLARE_ENUM, EnumTable
• data_store.h      — Type-erased key-value storage
• indexing.h        — Index ranges, upper-triangle pairs
• variables.h       — WeightVector, VariableFactory, solution extraction
• constraints.h     — Constraint handles, ConstraintFactory, dual prices
• expressions.h     — sum(), dot(), quadForm(), evaluate()
• config.h          — SolverSettings, FrontierConfig, parseOverrides()
• model_builder.h   — Template-method model construction
• callbacks.h       — Barrier progress callbacks
• diagnostics.h     — Status names, statistics, SolveError
• market_data.h     — Data generator and covariance checks
• portfolio_model.h — One mean-variance QP
• frontier.h        — Risk-aversion grid and sweep
• renderer.h        — Text charts and CSV export

QUICK START
-----------
    #include <gurobi_markowitz/markowitz.h>

    int main() {
        auto market   = markowitz::generateMarketData(1, 10);
        auto grid     = markowitz::riskAversionGrid(100, -2.0, 3.0);

        markowitz::FrontierSolver solver(market);
        auto frontier = solver.sweep(grid);

        markowitz::renderFrontier(std::cout, frontier, market, {29, 40});
        markowitz::renderAllocations(std::cout, frontier, {29, 40}, market.labels);
    }

REQUIREMENTS
------------
• C++20 compiler (GCC 13+, Clang 17+, MSVC 19.29+) for <format>
• Gurobi Optimizer 10.0+ with the C++ API
• Eigen 3.3+

CONFIGURATION
-------------
• MARKOWITZ_DEBUG or _DEBUG defined: variables and constraints get readable
  names ("w_3", "budget")
• Release builds: no names

===============================================================================
*/

// ============================================================================
// MODELING LAYER (order matters for dependencies)
// ============================================================================

// No dependencies
#include "naming.h"
#include "enum_utils.h"
#include "data_store.h"
#include "indexing.h"

// Gurobi handles
#include "variables.h"
#include "constraints.h"
#include "expressions.h"

// Run configuration (depends on data_store)
#include "config.h"

// Model builder (depends on variables, constraints, data_store, config)
#include "model_builder.h"

// Standalone, operate on GRBModel
#include "callbacks.h"
#include "diagnostics.h"

// ============================================================================
// PORTFOLIO COMPONENTS
// ============================================================================

#include "market_data.h"
#include "portfolio_model.h"
#include "frontier.h"
#include "renderer.h"

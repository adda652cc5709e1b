/*
===============================================================================
TEST VARIABLES — Tests for variables.h
===============================================================================

OVERVIEW
--------
Validates WeightVector, VariableFactory and VariableTable together with the
solution extraction and bound helpers. Solution tests solve a tiny LP whose
optimum is known.

TEST ORGANIZATION
-----------------
• Section A: Scalar variables
• Section B: Weight vectors (size, naming, bounds)
• Section C: Access and iteration
• Section D: VariableTable
• Section E: Solution extraction
• Section F: Bound updates

BUILD CONFIGURATION NOTES
-------------------------
Tests adapt to debug/release mode via naming_enabled(). Name checks only run
when names are generated.

DEPENDENCIES
------------
• Catch2 v3 - Test framework
• Gurobi - GRBEnv, GRBModel, GRBVar
• variables.h, enum_utils.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <gurobi_markowitz/variables.h>
#include <gurobi_markowitz/enum_utils.h>
#include <gurobi_markowitz/naming.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace markowitz;

// ============================================================================
// UTILITY
// ============================================================================

static GRBEnv& quietEnv() {
    static std::unique_ptr<GRBEnv> env;
    if (!env) {
        env = std::make_unique<GRBEnv>(true);
        env->set(GRB_IntParam_OutputFlag, 0);
        env->start();
    }
    return *env;
}

MARKOWITZ_DECLARE_ENUM(Holdings, Long, Short);

// ============================================================================
// SECTION A: SCALAR VARIABLES
// ============================================================================

TEST_CASE("A1: VariableFactory::ScalarNameAndBounds", "[variables][scalar]")
{
    GRBModel model(quietEnv());

    auto t = VariableFactory::add(model, GRB_CONTINUOUS, -1.0, 2.5, "t");
    model.update();

    REQUIRE(lb(t) == Catch::Approx(-1.0));
    REQUIRE(ub(t) == Catch::Approx(2.5));
    REQUIRE(t.get(GRB_CharAttr_VType) == GRB_CONTINUOUS);

    if constexpr (naming_enabled()) {
        REQUIRE(t.get(GRB_StringAttr_VarName) == "t");
    }
}

// ============================================================================
// SECTION B: WEIGHT VECTORS
// ============================================================================

/**
 * @test VariableFactory::WeightVector
 * @brief n weights with the long-only bounds of a portfolio
 *
 * @given n = 5, bounds [0, inf)
 * @then  5 continuous variables named w_0..w_4 with those bounds
 */
TEST_CASE("B1: VariableFactory::WeightVector", "[variables][vector]")
{
    GRBModel model(quietEnv());

    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, GRB_INFINITY, "w", 5);
    model.update();

    REQUIRE(W.size() == 5);
    REQUIRE_FALSE(W.empty());
    REQUIRE(model.get(GRB_IntAttr_NumVars) == 5);

    for (const auto& v : W) {
        REQUIRE(lb(v) == Catch::Approx(0.0));
        REQUIRE(ub(v) >= GRB_INFINITY);
    }

    if constexpr (naming_enabled()) {
        REQUIRE(W(0).get(GRB_StringAttr_VarName) == "w_0");
        REQUIRE(W(4).get(GRB_StringAttr_VarName) == "w_4");
    }
}

TEST_CASE("B2: VariableFactory::EmptyAndNegativeSizes", "[variables][vector][edge]")
{
    GRBModel model(quietEnv());

    auto none = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "w", 0);
    REQUIRE(none.empty());
    REQUIRE(none.size() == 0);

    REQUIRE_THROWS_AS(VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "w", -1),
                      std::invalid_argument);
}

// ============================================================================
// SECTION C: ACCESS AND ITERATION
// ============================================================================

TEST_CASE("C1: WeightVector::BoundsCheckedAccess", "[variables][access][error]")
{
    GRBModel model(quietEnv());
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "w", 3);

    REQUIRE_NOTHROW(W.at(2));
    REQUIRE_THROWS_AS(W.at(3), std::out_of_range);
    REQUIRE_THROWS_AS(W(-1), std::out_of_range);

    const WeightVector& cw = W;
    REQUIRE_THROWS_AS(cw.at(7), std::out_of_range);
    REQUIRE_THROWS_AS(WeightVector{}.at(0), std::out_of_range);
}

TEST_CASE("C2: WeightVector::ForEachVisitsInOrder", "[variables][iteration]")
{
    GRBModel model(quietEnv());
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "w", 4);

    std::vector<int> seen;
    W.forEach([&](GRBVar& v, int i) {
        seen.push_back(i);
        setUB(v, 0.1 * (i + 1));
    });
    model.update();

    REQUIRE(seen == std::vector<int>{ 0, 1, 2, 3 });
    REQUIRE(ub(W(3)) == Catch::Approx(0.4));
}

// ============================================================================
// SECTION D: VARIABLE TABLE
// ============================================================================

TEST_CASE("D1: VariableTable::EnumSlots", "[variables][table]")
{
    GRBModel model(quietEnv());

    VariableTable<Holdings> vars;
    vars.set(Holdings::Long, VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "long", 3));
    vars.set(Holdings::Short, VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "short", 2));

    REQUIRE(vars.get(Holdings::Long).size() == 3);
    REQUIRE(vars(Holdings::Short).size() == 2);
    STATIC_REQUIRE(VariableTable<Holdings>::size() == 2);
}

// ============================================================================
// SECTION E: SOLUTION EXTRACTION
// ============================================================================

/**
 * @test Values::KnownLpOptimum
 * @brief values() and toVector() read the optimal weights
 *
 * @given max 1 w0 + 3 w1 + 2 w2 with sum(w) = 1, w >= 0
 * @then  w = (0, 1, 0)
 */
TEST_CASE("E1: Values::KnownLpOptimum", "[variables][solution]")
{
    GRBModel model(quietEnv());
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, GRB_INFINITY, "w", 3);

    model.addConstr(W(0) + W(1) + W(2) == 1.0);
    model.setObjective(1.0 * W(0) + 3.0 * W(1) + 2.0 * W(2), GRB_MAXIMIZE);
    model.optimize();
    REQUIRE(model.get(GRB_IntAttr_Status) == GRB_OPTIMAL);

    auto vals = values(W);
    REQUIRE(vals.size() == 3);
    REQUIRE(vals[1] == Catch::Approx(1.0));

    Eigen::VectorXd w = toVector(W);
    REQUIRE(w.size() == 3);
    REQUIRE(w.sum() == Catch::Approx(1.0));
    REQUIRE(w(0) == Catch::Approx(0.0).margin(1e-9));
    REQUIRE(value(W(2)) == Catch::Approx(0.0).margin(1e-9));
}

TEST_CASE("E2: Values::NoSolutionThrows", "[variables][solution][error]")
{
    GRBModel model(quietEnv());
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "w", 2);
    model.update();

    REQUIRE_THROWS_AS(value(W(0)), GRBException);
    REQUIRE_THROWS_AS(toVector(W), GRBException);
}

// ============================================================================
// SECTION F: BOUND UPDATES
// ============================================================================

TEST_CASE("F1: Bounds::SetAndRead", "[variables][bounds]")
{
    GRBModel model(quietEnv());
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, GRB_INFINITY, "w", 2);

    setLB(W(0), 0.1);
    setUB(W(1), 0.6);
    model.update();

    REQUIRE(lb(W(0)) == Catch::Approx(0.1));
    REQUIRE(ub(W(1)) == Catch::Approx(0.6));
}

/*
===============================================================================
TEST EXPRESSIONS — Tests for expressions.h
===============================================================================

OVERVIEW
--------
Validates the expression builders for the portfolio objective: sums, the
inner product mu'w, the quadratic form w'Sigma w, and evaluation at a
solution.

TEST ORGANIZATION
-----------------
• Section A: Linear builders (sum, dot)
• Section B: Quadratic builders (quadSum, quadForm)
• Section C: Dimension errors
• Section D: Evaluation at a solution

DEPENDENCIES
------------
• Catch2 v3 - Test framework
• Eigen 3 - Coefficient vectors and matrices
• Gurobi - GRBLinExpr, GRBQuadExpr
• expressions.h, indexing.h, variables.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <gurobi_markowitz/expressions.h>
#include <gurobi_markowitz/indexing.h>
#include <gurobi_markowitz/variables.h>

#include <memory>
#include <stdexcept>

using namespace markowitz;

// ============================================================================
// TEST UTILITIES
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

/// Fix every weight to a value so evaluation needs only a trivial solve
static void fixWeights(GRBModel& model, WeightVector& W, const Eigen::VectorXd& w) {
    W.forEach([&](GRBVar& v, int i) {
        setLB(v, w(i));
        setUB(v, w(i));
    });
    model.optimize();
    REQUIRE(model.get(GRB_IntAttr_Status) == GRB_OPTIMAL);
}

// ============================================================================
// SECTION A: LINEAR BUILDERS
// ============================================================================

TEST_CASE("A1: Sum::AllWeights", "[expressions][linear]")
{
    GRBModel model(quietEnv());
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "w", 4);

    GRBLinExpr s = sum(W);
    REQUIRE(s.size() == 4);
    REQUIRE(s.getConstant() == 0.0);
    for (unsigned int k = 0; k < s.size(); ++k) {
        REQUIRE(s.getCoeff(k) == Catch::Approx(1.0));
    }

    GRBLinExpr empty = sum(WeightVector{});
    REQUIRE(empty.size() == 0);
}

TEST_CASE("A2: Sum::OverRange", "[expressions][linear]")
{
    GRBModel model(quietEnv());
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "w", 5);

    // Even assets only
    GRBLinExpr s = sum(range(0, 5, 2), [&](int i) { return 2.0 * W(i); });
    REQUIRE(s.size() == 3);
    REQUIRE(s.getCoeff(1) == Catch::Approx(2.0));
}

/**
 * @test Dot::CoefficientsInAssetOrder
 * @brief dot(mu, W) has one term per asset with coefficient mu_i
 */
TEST_CASE("A3: Dot::CoefficientsInAssetOrder", "[expressions][linear]")
{
    GRBModel model(quietEnv());
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "w", 3);

    Eigen::VectorXd mu(3);
    mu << 0.5, 1.5, 2.5;

    GRBLinExpr r = dot(mu, W);
    REQUIRE(r.size() == 3);
    REQUIRE(r.getCoeff(0) == Catch::Approx(0.5));
    REQUIRE(r.getCoeff(2) == Catch::Approx(2.5));
    REQUIRE(r.getVar(1).sameAs(W(1)));
}

// ============================================================================
// SECTION B: QUADRATIC BUILDERS
// ============================================================================

/**
 * @test QuadForm::UpperTriangleTerms
 * @brief A dense n x n matrix yields n(n+1)/2 terms; zeros are skipped
 *
 * @given Dense 3x3 Sigma, then a diagonal one
 * @then  6 terms for the dense matrix, 3 for the diagonal
 */
TEST_CASE("B1: QuadForm::UpperTriangleTerms", "[expressions][quadratic]")
{
    GRBModel model(quietEnv());
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "w", 3);

    Eigen::MatrixXd dense(3, 3);
    dense << 4.0, 1.0, 0.5,
             1.0, 3.0, 0.2,
             0.5, 0.2, 2.0;
    REQUIRE(quadForm(dense, W).size() == 6);

    Eigen::MatrixXd diag = Eigen::Vector3d(1.0, 2.0, 3.0).asDiagonal();
    REQUIRE(quadForm(diag, W).size() == 3);

    REQUIRE(quadForm(Eigen::MatrixXd::Zero(3, 3), W).size() == 0);
}

TEST_CASE("B2: QuadForm::OffDiagonalCoefficientDoubled", "[expressions][quadratic]")
{
    GRBModel model(quietEnv());
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "w", 2);

    Eigen::MatrixXd S(2, 2);
    S << 0.0, 0.3,
         0.3, 0.0;

    GRBQuadExpr q = quadForm(S, W);
    REQUIRE(q.size() == 1);
    REQUIRE(q.getCoeff(0) == Catch::Approx(0.6));
}

TEST_CASE("B3: QuadSum::UpperTriangleDomain", "[expressions][quadratic]")
{
    GRBModel model(quietEnv());
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "w", 3);

    auto q = quadSum(upperPairs(3), [&](int i, int j) {
        return W(i) * W(j);
    });
    REQUIRE(q.size() == 6);
}

// ============================================================================
// SECTION C: DIMENSION ERRORS
// ============================================================================

TEST_CASE("C1: Expressions::DimensionMismatch", "[expressions][error]")
{
    GRBModel model(quietEnv());
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "w", 3);

    REQUIRE_THROWS_AS(dot(Eigen::VectorXd::Ones(2), W), std::invalid_argument);
    REQUIRE_THROWS_AS(quadForm(Eigen::MatrixXd::Identity(2, 2), W), std::invalid_argument);
    REQUIRE_THROWS_AS(quadForm(Eigen::MatrixXd::Ones(3, 2), W), std::invalid_argument);
}

// ============================================================================
// SECTION D: EVALUATION
// ============================================================================

/**
 * @test Evaluate::MatchesEigenArithmetic
 * @brief Evaluated expressions equal mu'w and w'Sigma w computed with Eigen
 *
 * @given Weights fixed to (0.2, 0.3, 0.5) and an asymmetric-looking Sigma
 * @then  evaluate(dot) == mu.dot(w); evaluate(quadForm) == w' Sym(Sigma) w
 */
TEST_CASE("D1: Evaluate::MatchesEigenArithmetic", "[expressions][evaluate]")
{
    GRBModel model(quietEnv());
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "w", 3);

    Eigen::VectorXd mu(3);
    mu << 0.1, 0.4, 0.25;
    Eigen::MatrixXd S(3, 3);
    S << 2.0, 0.4, 0.0,
         0.2, 1.0, 0.3,
         0.0, 0.3, 0.5;

    auto ret = dot(mu, W);
    auto var = quadForm(S, W);
    model.setObjective(ret);

    Eigen::VectorXd w(3);
    w << 0.2, 0.3, 0.5;
    fixWeights(model, W, w);

    const Eigen::MatrixXd sym = 0.5 * (S + S.transpose());
    REQUIRE(evaluate(ret) == Catch::Approx(mu.dot(w)));
    REQUIRE(evaluate(var) == Catch::Approx(w.dot(sym * w)));
}

TEST_CASE("D2: Evaluate::NoSolutionThrows", "[expressions][evaluate][error]")
{
    GRBModel model(quietEnv());
    auto W = VariableFactory::add(model, GRB_CONTINUOUS, 0.0, 1.0, "w", 2);
    model.update();

    REQUIRE_THROWS_AS(evaluate(sum(W)), GRBException);
}

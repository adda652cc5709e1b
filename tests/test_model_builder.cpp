/*
===============================================================================
TEST MODEL BUILDER — Tests for model_builder.h
===============================================================================

OVERVIEW
--------
Validates the ModelBuilder template: hook orchestration, owned vs shared
environments, lazy initialization, tracked parameters and presets, applying
SolverSettings, objective helpers and status accessors.

TEST ORGANIZATION
-----------------
• Section A: Orchestration and lifecycle
• Section B: Environments
• Section C: Tracked parameters, presets and SolverSettings
• Section D: Objective helpers on a small QP
• Section E: Status accessors

DEPENDENCIES
------------
• Catch2 v3 - Test framework
• Gurobi - GRBEnv, GRBModel
• model_builder.h and the modeling headers - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <gurobi_markowitz/model_builder.h>
#include <gurobi_markowitz/constraints.h>
#include <gurobi_markowitz/expressions.h>
#include <gurobi_markowitz/variables.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace markowitz;

// ============================================================================
// TEST UTILITIES AND FIXTURES
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

MARKOWITZ_DECLARE_ENUM(TestVars, W);
MARKOWITZ_DECLARE_ENUM(TestCons, Budget);

/**
 * @class TwoAssetBuilder
 * @brief Minimal variance of two assets with a budget; records hook order
 *
 * @details Sigma = diag(1, 4) so the optimum is w = (0.8, 0.2) with
 *          variance 0.8.
 */
class TwoAssetBuilder : public ModelBuilder<TestVars, TestCons>
{
public:
    using Base = ModelBuilder<TestVars, TestCons>;
    using Base::Base;

    std::vector<std::string> calls;
    bool maximizeReturn = false;

    void configureEnvironment(GRBEnv& env) override
    {
        calls.push_back("configureEnvironment");
        env.set(GRB_IntParam_OutputFlag, 0);
    }

    void addVariables() override
    {
        calls.push_back("addVariables");
        variables().set(TestVars::W,
            VariableFactory::add(model(), GRB_CONTINUOUS, 0.0, GRB_INFINITY, "w", 2));
    }

    void addConstraints() override
    {
        calls.push_back("addConstraints");
        auto& W = variables()(TestVars::W);
        constraints().set(TestCons::Budget,
            ConstraintFactory::add(model(), "budget", [&] { return sum(W) == 1.0; }));
    }

    void addParameters() override
    {
        calls.push_back("addParameters");
        threads(1);
    }

    void addObjective() override
    {
        calls.push_back("addObjective");
        auto& W = variables()(TestVars::W);

        Eigen::MatrixXd sigma = Eigen::Vector2d(1.0, 4.0).asDiagonal();
        if (maximizeReturn) {
            // max 4 w1 - w'Sigma w: interior optimum at w = (0.4, 0.6)
            GRBQuadExpr obj = dot(Eigen::Vector2d(0.0, 4.0), W);
            obj -= quadForm(sigma, W);
            maximize(obj);
        }
        else {
            minimize(quadForm(sigma, W));
        }
    }

    void beforeOptimize() override { calls.push_back("beforeOptimize"); }

    void afterOptimize() override { calls.push_back("afterOptimize"); }
};

// ============================================================================
// SECTION A: ORCHESTRATION AND LIFECYCLE
// ============================================================================

/**
 * @test Orchestration::HookOrder
 * @brief optimize() runs every hook once, in template-method order
 *
 * @given A TwoAssetBuilder on its own environment
 * @when  Calling optimize()
 * @then  configureEnvironment precedes the model hooks, which run as
 *        variables, constraints, parameters, objective, before, after
 */
TEST_CASE("A1: Orchestration::HookOrder", "[model_builder][orchestration]")
{
    TwoAssetBuilder b;
    b.optimize();

    REQUIRE(b.calls == std::vector<std::string>{
        "configureEnvironment", "addVariables", "addConstraints",
        "addParameters", "addObjective", "beforeOptimize", "afterOptimize" });
}

TEST_CASE("A2: Lifecycle::LazyInitialization", "[model_builder][initialization]")
{
    TwoAssetBuilder b;
    const TwoAssetBuilder& cb = b;

    REQUIRE_THROWS_AS(cb.model(), std::logic_error);

    b.model();
    REQUIRE_NOTHROW(cb.model());
    REQUIRE(b.calls == std::vector<std::string>{ "configureEnvironment" });

    b.initialize();
    REQUIRE(b.calls.size() == 1);
}

// ============================================================================
// SECTION B: ENVIRONMENTS
// ============================================================================

TEST_CASE("B1: Environment::OwnedByDefault", "[model_builder][environment]")
{
    TwoAssetBuilder b;
    REQUIRE(b.ownsEnvironment());
}

/**
 * @test Environment::SharedSkipsConfigure
 * @brief A builder on a shared environment never configures or starts one
 */
TEST_CASE("B2: Environment::SharedSkipsConfigure", "[model_builder][environment]")
{
    TwoAssetBuilder b(quietEnv());
    REQUIRE_FALSE(b.ownsEnvironment());

    b.optimize();
    REQUIRE(b.calls.front() == "addVariables");
    REQUIRE(b.isOptimal());
}

TEST_CASE("B3: Environment::ManyModelsOneEnv", "[model_builder][environment]")
{
    TwoAssetBuilder first(quietEnv());
    TwoAssetBuilder second(quietEnv());
    second.maximizeReturn = true;

    first.optimize();
    second.optimize();

    REQUIRE(first.objVal() == Catch::Approx(0.8));
    REQUIRE(second.objVal() == Catch::Approx(4.0 * 0.6 - (0.16 + 4 * 0.36)));
}

// ============================================================================
// SECTION C: PARAMETERS
// ============================================================================

TEST_CASE("C1: Parameters::TrackedInStore", "[model_builder][parameters]")
{
    TwoAssetBuilder b(quietEnv());

    b.timeLimit(5.0);
    b.presolve(0);
    b.method(GRB_METHOD_BARRIER);
    b.barConvTol(1e-10);

    REQUIRE(b.store().at("param:TimeLimit").get<double>() == Catch::Approx(5.0));
    REQUIRE(b.store().at("param:Presolve").get<int>() == 0);
    REQUIRE(b.store().at("param:Method").get<int>() == GRB_METHOD_BARRIER);
    REQUIRE(b.model().get(GRB_DoubleParam_BarConvTol) == Catch::Approx(1e-10));

    b.setParam(GRB_IntParam_BarHomogeneous, 1);
    REQUIRE(b.store().find("param:BarHomogeneous") == b.store().end());
    REQUIRE(b.model().get(GRB_IntParam_BarHomogeneous) == 1);
}

TEST_CASE("C2: Parameters::Presets", "[model_builder][parameters][presets]")
{
    TwoAssetBuilder b(quietEnv());

    SECTION("Fast") {
        b.applyPreset(TwoAssetBuilder::Preset::Fast);
        REQUIRE(b.model().get(GRB_DoubleParam_TimeLimit) == Catch::Approx(60.0));
        REQUIRE(b.model().get(GRB_DoubleParam_BarConvTol) == Catch::Approx(1e-6));
        REQUIRE(b.store().at("param:Preset").get<std::string>() == "Fast");
    }
    SECTION("Accurate") {
        b.applyPreset(TwoAssetBuilder::Preset::Accurate);
        REQUIRE(b.model().get(GRB_IntParam_Method) == GRB_METHOD_BARRIER);
        REQUIRE(b.model().get(GRB_DoubleParam_BarConvTol) == Catch::Approx(1e-12));
    }
    SECTION("Quiet") {
        b.applyPreset(TwoAssetBuilder::Preset::Quiet);
        REQUIRE(b.model().get(GRB_IntParam_OutputFlag) == 0);
    }
    SECTION("Debug") {
        b.applyPreset(TwoAssetBuilder::Preset::Debug);
        REQUIRE(b.model().get(GRB_IntParam_OutputFlag) == 1);
        REQUIRE(b.model().get(GRB_IntParam_Presolve) == 0);
        REQUIRE(b.store().at("param:Preset").get<std::string>() == "Debug");
    }
}

/**
 * @test Parameters::ApplySolverSettings
 * @brief Zero / negative limits keep Gurobi's defaults
 */
TEST_CASE("C3: Parameters::ApplySolverSettings", "[model_builder][parameters][config]")
{
    TwoAssetBuilder b(quietEnv());

    SECTION("defaults") {
        b.apply(SolverSettings{});
        REQUIRE(b.model().get(GRB_IntParam_OutputFlag) == 0);
        REQUIRE(b.store().find("param:TimeLimit") == b.store().end());
        REQUIRE(b.store().find("param:BarIterLimit") == b.store().end());
        REQUIRE(b.store().find("param:LogFile") == b.store().end());
        REQUIRE(b.store().at("param:BarConvTol").get<double>() == Catch::Approx(1e-9));
    }
    SECTION("limits") {
        SolverSettings s;
        s.quiet = false;
        s.timeLimit = 3.0;
        s.threads = 2;
        s.barIterLimit = 40;

        b.apply(s);
        REQUIRE(b.model().get(GRB_IntParam_OutputFlag) == 1);
        REQUIRE(b.model().get(GRB_DoubleParam_TimeLimit) == Catch::Approx(3.0));
        REQUIRE(b.model().get(GRB_IntParam_Threads) == 2);
        REQUIRE(b.model().get(GRB_IntParam_BarIterLimit) == 40);
    }
}

// ============================================================================
// SECTION D: OBJECTIVE HELPERS
// ============================================================================

TEST_CASE("D1: Objective::MinimizeQuadratic", "[model_builder][objective]")
{
    TwoAssetBuilder b(quietEnv());
    b.optimize();

    REQUIRE(b.isOptimal());
    REQUIRE(b.model().get(GRB_IntAttr_ModelSense) == GRB_MINIMIZE);

    Eigen::VectorXd w = toVector(b.variables()(TestVars::W));
    REQUIRE(w(0) == Catch::Approx(0.8).margin(1e-6));
    REQUIRE(w(1) == Catch::Approx(0.2).margin(1e-6));
}

TEST_CASE("D2: Objective::MaximizeQuadratic", "[model_builder][objective]")
{
    TwoAssetBuilder b(quietEnv());
    b.maximizeReturn = true;
    b.optimize();

    REQUIRE(b.isOptimal());
    REQUIRE(b.model().get(GRB_IntAttr_ModelSense) == GRB_MAXIMIZE);

    Eigen::VectorXd w = toVector(b.variables()(TestVars::W));
    REQUIRE(w(0) == Catch::Approx(0.4).margin(1e-6));
    REQUIRE(w(1) == Catch::Approx(0.6).margin(1e-6));
}

// ============================================================================
// SECTION E: STATUS ACCESSORS
// ============================================================================

TEST_CASE("E1: Status::AfterOptimalSolve", "[model_builder][diagnostics]")
{
    TwoAssetBuilder b(quietEnv());
    b.optimize();

    REQUIRE(b.status() == GRB_OPTIMAL);
    REQUIRE(b.hasSolution());
    REQUIRE_FALSE(b.isInfeasible());
    REQUIRE_FALSE(b.isUnbounded());
    REQUIRE(b.solutionCount() >= 1);
    REQUIRE(b.runtime() >= 0.0);
    REQUIRE(b.barIterCount() >= 0);
}

/**
 * @test Status::IterationLimit
 * @brief A limit status counts as a solution only with an incumbent
 */
TEST_CASE("E2: Status::IterationLimit", "[model_builder][diagnostics][edge]")
{
    TwoAssetBuilder b(quietEnv());
    b.presolve(0);
    b.method(GRB_METHOD_BARRIER);
    b.setParam(GRB_IntParam_Crossover, 0);
    b.barIterLimit(0);
    b.optimize();

    REQUIRE(b.status() == GRB_ITERATION_LIMIT);
    REQUIRE_FALSE(b.isOptimal());
    REQUIRE(b.hasSolution() == (b.solutionCount() > 0));
}

/*
===============================================================================
TEST EXPRESSIONS — Tests for expressions.h
===============================================================================

OVERVIEW
--------
Validates sum(domain, f) over the index domains used by the sizing model:
scalar ranges, Cartesian products with tuple unpacking, scalar and variable
terms, and empty domains.

TEST ORGANIZATION
-----------------
• Section A: Scalar domains
• Section B: Cartesian domains
• Section C: Edge cases

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• expressions.h - System under test
• indexing.h, scenario_table.h - Supporting components
• Gurobi C++ API - Solver backend

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <storage_sizing/expressions.h>
#include <storage_sizing/indexing.h>
#include <storage_sizing/scenario_table.h>

#include <stdexcept>
#include <vector>

using namespace sizing;
using Catch::Approx;

// ============================================================================
// TEST UTILITIES AND FIXTURES
// ============================================================================

static GRBEnv& testEnv() {
    static GRBEnv env(true);
    static const bool started = [] {
        env.set(GRB_IntParam_OutputFlag, 0);
        env.start();
        return true;
    }();
    (void)started;
    return env;
}

DECLARE_ENUM_WITH_COUNT(Flow, In, Out);

using FlowTable = ScenarioTable<GRBVar, Flow>;

/// @brief Continuous variables in [0, 10] for every (s, t, field)
static FlowTable addFlows(GRBModel& model, int S, int T) {
    FlowTable table(S, T);
    table.forEach([&](GRBVar& v, int, int, Flow) {
        v = model.addVar(0.0, 10.0, 0.0, GRB_CONTINUOUS);
    });
    model.update();
    return table;
}

// ============================================================================
// SECTION A: SCALAR DOMAINS
// ============================================================================

/**
 * @test Sum::RangeWithIndexDependentCoefficients
 * @brief sum_t p[t] * x[t] places p[t] on each variable
 *
 * @given 4 timeslots with prices {0.1, 0.2, 0.3, 0.4}
 * @when The sum is added as a constraint
 * @then Each coefficient equals its price
 *
 * @covers sizing::sum(RangeView, lambda)
 */
TEST_CASE("A1: Sum::RangeWithIndexDependentCoefficients", "[expressions][sum]")
{
    GRBModel model(testEnv());
    auto flows = addFlows(model, 1, 4);
    const std::vector<double> price{ 0.1, 0.2, 0.3, 0.4 };

    GRBLinExpr expr = sum(range_view(0, 4), [&](int t) {
        return price[static_cast<std::size_t>(t)] * flows(0, t, Flow::In);
    });
    REQUIRE(expr.size() == 4);

    GRBConstr c = model.addConstr(expr <= 1.0);
    model.update();

    for (int t = 0; t < 4; ++t) {
        REQUIRE(model.getCoeff(c, flows(0, t, Flow::In))
            == Approx(price[static_cast<std::size_t>(t)]));
        REQUIRE(model.getCoeff(c, flows(0, t, Flow::Out)) == 0.0);
    }
}

TEST_CASE("A2: Sum::DifferenceOfTerms", "[expressions][sum]")
{
    GRBModel model(testEnv());
    auto flows = addFlows(model, 1, 3);

    GRBLinExpr expr = sum(range_view(0, 3), [&](int t) {
        return flows(0, t, Flow::In) - 2.0 * flows(0, t, Flow::Out);
    });

    GRBConstr c = model.addConstr(expr == 0.0);
    model.update();

    for (int t = 0; t < 3; ++t) {
        REQUIRE(model.getCoeff(c, flows(0, t, Flow::In)) == Approx(1.0));
        REQUIRE(model.getCoeff(c, flows(0, t, Flow::Out)) == Approx(-2.0));
    }
}

TEST_CASE("A3: Sum::ConstantTermsAccumulate", "[expressions][sum]")
{
    GRBLinExpr expr = sum(range_view(1, 5), [](int t) { return static_cast<double>(t); });
    REQUIRE(expr.size() == 0);
    REQUIRE(expr.getConstant() == Approx(1.0 + 2.0 + 3.0 + 4.0));
}

TEST_CASE("A4: Sum::SteppedRange", "[expressions][sum]")
{
    GRBModel model(testEnv());
    auto flows = addFlows(model, 1, 6);

    // every other timeslot
    GRBLinExpr expr = sum(range_view(0, 6, 2), [&](int t) { return flows(0, t, Flow::In); });
    REQUIRE(expr.size() == 3);

    GRBConstr c = model.addConstr(expr <= 1.0);
    model.update();
    REQUIRE(model.getCoeff(c, flows(0, 2, Flow::In)) == Approx(1.0));
    REQUIRE(model.getCoeff(c, flows(0, 3, Flow::In)) == 0.0);
}

// ============================================================================
// SECTION B: CARTESIAN DOMAINS
// ============================================================================

/**
 * @test Sum::CartesianUnpacksTuple
 * @brief sum over S x T passes (s, t) as two arguments
 *
 * @covers sizing::sum(ProductView, lambda)
 * @covers expr_detail::invoke_on_index
 */
TEST_CASE("B1: Sum::CartesianUnpacksTuple", "[expressions][cartesian]")
{
    GRBModel model(testEnv());
    auto flows = addFlows(model, 3, 4);

    auto S = range_view(0, 3);
    auto T = range_view(0, 4);

    int calls = 0;
    GRBLinExpr expr = sum(S * T, [&](int s, int t) {
        ++calls;
        return (1.0 + s) * flows(s, t, Flow::Out);
    });
    REQUIRE(calls == 12);
    REQUIRE(expr.size() == 12);

    GRBConstr c = model.addConstr(expr <= 100.0);
    model.update();
    REQUIRE(model.getCoeff(c, flows(0, 3, Flow::Out)) == Approx(1.0));
    REQUIRE(model.getCoeff(c, flows(2, 1, Flow::Out)) == Approx(3.0));
}

TEST_CASE("B2: Sum::NestedSumsMatchCartesian", "[expressions][cartesian]")
{
    GRBModel model(testEnv());
    auto flows = addFlows(model, 2, 3);
    auto S = range_view(0, 2);
    auto T = range_view(0, 3);

    GRBLinExpr nested = sum(S, [&](int s) {
        return sum(T, [&](int t) { return flows(s, t, Flow::In); });
    });
    GRBLinExpr flat = sum(S * T, [&](int s, int t) { return flows(s, t, Flow::In); });

    // both maximise to the same bound
    model.addConstr(nested <= 7.5);
    model.setObjective(flat, GRB_MAXIMIZE);
    model.optimize();

    REQUIRE(model.get(GRB_IntAttr_Status) == GRB_OPTIMAL);
    REQUIRE(model.get(GRB_DoubleAttr_ObjVal) == Approx(7.5));
}

// ============================================================================
// SECTION C: EDGE CASES
// ============================================================================

TEST_CASE("C1: Sum::EmptyDomainIsZero", "[expressions][edge]")
{
    GRBLinExpr expr = sum(range_view(0, 0), [](int) -> GRBLinExpr {
        FAIL("callable invoked on empty domain");
        return 0.0;
    });
    REQUIRE(expr.size() == 0);
    REQUIRE(expr.getConstant() == 0.0);
}

TEST_CASE("C2: Sum::ExceptionFromCallablePropagates", "[expressions][edge]")
{
    auto thrower = [](int t) -> double {
        if (t == 2) throw std::out_of_range("t");
        return 1.0;
    };
    REQUIRE_THROWS_AS(sum(range_view(0, 4), thrower), std::out_of_range);
}

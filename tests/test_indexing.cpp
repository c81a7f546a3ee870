/*
===============================================================================
TEST INDEXING — Tests for indexing.h
===============================================================================

OVERVIEW
--------
Validates the scenario and timeslot domains: RangeView construction and
iteration, and Cartesian products of two ranges, whose scenario-major,
timeslot-increasing order the model construction relies on.

TEST ORGANIZATION
-----------------
• Section A: RangeView construction and iteration
• Section B: Cartesian product order and size
• Section C: Edge cases

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• indexing.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <storage_sizing/indexing.h>

#include <limits>
#include <tuple>
#include <vector>

using namespace sizing;

// ============================================================================
// SECTION A: RANGEVIEW
// ============================================================================

/**
 * @test RangeView::BasicProperties
 * @brief size(), empty() and operator[] of half-open ranges
 *
 * @covers RangeView::size()
 * @covers RangeView::operator[]
 */
TEST_CASE("A1: RangeView::BasicProperties", "[RangeView][construction]")
{
    RangeView r(0, 24);
    REQUIRE(r.size() == 24);
    REQUIRE_FALSE(r.empty());
    REQUIRE(r[0] == 0);
    REQUIRE(r[23] == 23);

    RangeView stepped(0, 10, 3);
    REQUIRE(stepped.size() == 4);
    REQUIRE(stepped[3] == 9);
}

TEST_CASE("A2: RangeView::ForwardIteration", "[RangeView][iteration]")
{
    std::vector<int> seen;
    for (int t : range_view(5, 9)) {
        seen.push_back(t);
    }
    REQUIRE(seen == std::vector<int>{ 5, 6, 7, 8 });
}

TEST_CASE("A3: RangeView::EmptyRanges", "[RangeView][edge]")
{
    REQUIRE(range_view(3, 3).empty());
    REQUIRE(range_view(5, 2).empty());
    REQUIRE(range_view(0, 10, 0).empty());
    REQUIRE(range_view(0, 10, -1).empty());

    int iterations = 0;
    for ([[maybe_unused]] int i : range_view(4, 1)) {
        ++iterations;
    }
    REQUIRE(iterations == 0);
}

// ============================================================================
// SECTION B: CARTESIAN PRODUCT
// ============================================================================

/**
 * @test ProductView::ScenarioMajorOrder
 * @brief S * T visits every timeslot of a scenario before the next scenario
 *
 * @given S = [0, 2), T = [0, 3)
 * @when Iterating S * T
 * @then (0,0) (0,1) (0,2) (1,0) (1,1) (1,2)
 */
TEST_CASE("B1: ProductView::ScenarioMajorOrder", "[ProductView][order]")
{
    auto S = range_view(0, 2);
    auto T = range_view(0, 3);

    std::vector<std::tuple<int, int>> seen;
    for (auto [s, t] : S * T) {
        seen.emplace_back(s, t);
    }

    const std::vector<std::tuple<int, int>> expected{
        { 0, 0 }, { 0, 1 }, { 0, 2 }, { 1, 0 }, { 1, 1 }, { 1, 2 }
    };
    REQUIRE(seen == expected);
}

TEST_CASE("B2: ProductView::SizeIsProduct", "[ProductView][size]")
{
    auto S = range_view(0, 4);
    auto T = range_view(0, 24);
    auto product = S * T;

    REQUIRE(product.size() == 96);
    REQUIRE_FALSE(product.empty());

    std::size_t count = 0;
    for ([[maybe_unused]] auto idx : product) {
        ++count;
    }
    REQUIRE(count == 96);
}

TEST_CASE("B3: ProductView::OffsetRanges", "[ProductView][order]")
{
    auto S = range_view(2, 4);
    auto T = range_view(10, 12);

    std::vector<std::tuple<int, int>> seen;
    for (auto idx : S * T) {
        seen.push_back(idx);
    }
    REQUIRE(seen.front() == std::tuple<int, int>{ 2, 10 });
    REQUIRE(seen.back() == std::tuple<int, int>{ 3, 11 });
    REQUIRE(seen.size() == 4);
}

// ============================================================================
// SECTION C: EDGE CASES
// ============================================================================

TEST_CASE("C1: ProductView::EmptyOperandYieldsNothing", "[ProductView][edge]")
{
    auto S = range_view(0, 3);
    auto none = range_view(0, 0);

    auto left = none * S;
    auto right = S * none;
    REQUIRE(left.empty());
    REQUIRE(right.empty());

    int iterations = 0;
    for ([[maybe_unused]] auto idx : right) {
        ++iterations;
    }
    for ([[maybe_unused]] auto idx : left) {
        ++iterations;
    }
    REQUIRE(iterations == 0);
}

TEST_CASE("C2: RangeView::LargeBoundsDoNotOverflow", "[RangeView][edge]")
{
    const int hi = std::numeric_limits<int>::max();
    RangeView r(hi - 2, hi);
    REQUIRE(r.size() == 2);
    REQUIRE(r[1] == hi - 1);

    RangeView wide(std::numeric_limits<int>::min(), 0, 1 << 30);
    REQUIRE(wide.size() == 2);
}

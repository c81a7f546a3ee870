/*
===============================================================================
TEST NAMING — Tests for naming.h
===============================================================================

OVERVIEW
--------
Validates build-configuration detection and the name builders used for the
model elements: make_name:: (conditional) and force_name:: (always on).

SECTIONS
--------
A  compile-time switch
B  make_name::concat / make_name::index
C  force_name::, named in every build
D  invalid input

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <storage_sizing/naming.h>

#include <stdexcept>
#include <string>
#include <string_view>

#if defined(SIZING_DEBUG) || defined(_DEBUG) || defined(SIZING_SYMBOLIC_NAMES)
inline constexpr bool namesExpected = true;
#else
inline constexpr bool namesExpected = false;
#endif

// ============================================================================
// SECTION A: COMPILE-TIME SWITCH
// ============================================================================

/**
 * @test Switch::FollowsCompileDefinitions
 * @brief naming_enabled() is true exactly when one of the three macros is set
 */
TEST_CASE("A1: Switch::FollowsCompileDefinitions", "[naming][config]")
{
    STATIC_REQUIRE(naming_enabled() == namesExpected);
    STATIC_REQUIRE(naming_disabled() != namesExpected);
}

// ============================================================================
// SECTION B: MAKE_NAME
// ============================================================================

TEST_CASE("B1: MakeName::ConcatBaseVariableNames", "[naming][concat]")
{
    if (naming_enabled()) {
        REQUIRE(make_name::concat("numberOfModules") == "numberOfModules");
        REQUIRE(make_name::concat(std::string_view("size"), "Of", "Storage") == "sizeOfStorage");
    }
    else {
        REQUIRE(make_name::concat("numberOfModules").empty());
    }
}

/**
 * @test MakeName::IndexScenarioTimeslot
 * @brief Scenario elements are named base_s_t
 *
 * @covers make_name::index()
 */
TEST_CASE("B2: MakeName::IndexScenarioTimeslot", "[naming][index]")
{
    if (naming_enabled()) {
        REQUIRE(make_name::index("storageLevel", 0, 0) == "storageLevel_0_0");
        REQUIRE(make_name::index("soldEnergy", 3, 8759) == "soldEnergy_3_8759");
        REQUIRE(make_name::index(std::string_view("balance"), 12) == "balance_12");
    }
    else {
        REQUIRE(make_name::index("storageLevel", 0, 0).empty());
    }
}

TEST_CASE("B3: MakeName::IndexWithoutIndicesIsBase", "[naming][index]")
{
    if (naming_enabled()) {
        REQUIRE(make_name::index("numberOfModules") == "numberOfModules");
    }
}

// ============================================================================
// SECTION C: FORCE_NAME
// ============================================================================

TEST_CASE("C1: ForceName::AlwaysProducesNames", "[naming][force]")
{
    REQUIRE(force_name::concat("capacity_", 1, "_", 2) == "capacity_1_2");
    REQUIRE(force_name::index("capacity", 1, 2) == "capacity_1_2");
    REQUIRE(force_name::index("x", -1) == "x_-1");
}

TEST_CASE("C2: ForceName::MixedIntegralTypes", "[naming][force]")
{
    const short s = 2;
    const long t = 40L;
    const std::size_t f = 5;
    REQUIRE(force_name::index("v", s, t, f) == "v_2_40_5");
}

// ============================================================================
// SECTION D: ERROR CONDITIONS
// ============================================================================

TEST_CASE("D1: Errors::EmptyBaseWithIndicesThrows", "[naming][errors]")
{
    REQUIRE_THROWS_AS(force_name::index("", 1, 2), std::invalid_argument);
    REQUIRE(force_name::index("").empty());
}

/*
===============================================================================
TEST CONFIG LOADER — Tests for config_loader.h
===============================================================================

OVERVIEW
--------
Validates JSON configuration loading through Boost.PropertyTree: required
keys, optional sampling and solver blocks, malformed input, and validation
after parsing.

TEST ORGANIZATION
-----------------
• Section A: Complete documents
• Section B: Optional blocks and defaults
• Section C: Missing keys and malformed input
• Section D: Files

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• config_loader.h - System under test
• Boost.PropertyTree - JSON parser

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <storage_sizing/config_loader.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace sizing;
using Catch::Matchers::ContainsSubstring;

namespace {

    const std::string REQUIRED_KEYS = R"(
        "numberOfScenarios": 5,
        "numberOfDays": 2,
        "minNumberOfModules": 0,
        "maxNumberOfModules": 200,
        "minStorageSizeKwh": 0,
        "maxStorageSizeKwh": 100,
        "storagePricePerKwhEuro": 50,
        "pricePerModuleEuro": 850,
        "maxWattsPerModule": 800,
        "areaPerModuleM2": 1.2)";

    ProblemConfiguration load(const std::string& json) {
        std::istringstream in(json);
        return loadConfiguration(in);
    }

} // namespace

// ============================================================================
// SECTION A: COMPLETE DOCUMENTS
// ============================================================================

/**
 * @test Load::RequiredKeys
 * @brief Every top-level key is read into ProblemConfiguration
 *
 * @covers loadConfiguration(std::istream&)
 */
TEST_CASE("A1: Load::RequiredKeys", "[config_loader][load]")
{
    auto c = load("{" + REQUIRED_KEYS + "}");

    REQUIRE(c.numberOfScenarios == 5);
    REQUIRE(c.numberOfDays == 2);
    REQUIRE(c.minNumberOfModules == 0);
    REQUIRE(c.maxNumberOfModules == 200);
    REQUIRE(c.minStorageSizeKwh == 0.0);
    REQUIRE(c.maxStorageSizeKwh == 100.0);
    REQUIRE(c.storagePricePerKwhEuro == 50.0);
    REQUIRE(c.pricePerModuleEuro == 850.0);
    REQUIRE(c.maxWattsPerModule == 800.0);
    REQUIRE(c.areaPerModuleM2 == 1.2);
}

TEST_CASE("A2: Load::SamplingAndSolverBlocks", "[config_loader][load]")
{
    auto c = load("{" + REQUIRED_KEYS + R"(,
        "sampling": {
            "seed": 7,
            "solarIrradiance": { "mean": 450, "stddev": 150 },
            "purchasePrice": { "mean": 0.4, "stddev": 0.05 }
        },
        "solver": { "timeLimitSeconds": 30, "mipGap": 0.01, "threads": 2, "output": true }
    })");

    REQUIRE(c.sampling.seed == 7);
    REQUIRE(c.sampling.solarIrradiance.mean == 450.0);
    REQUIRE(c.sampling.solarIrradiance.stddev == 150.0);
    REQUIRE(c.sampling.purchasePrice.mean == 0.4);
    REQUIRE(c.sampling.purchasePrice.stddev == 0.05);

    REQUIRE(c.solver.timeLimitSeconds == 30.0);
    REQUIRE(c.solver.mipGap == 0.01);
    REQUIRE(c.solver.threads == 2);
    REQUIRE(c.solver.output);
}

// ============================================================================
// SECTION B: OPTIONAL BLOCKS
// ============================================================================

TEST_CASE("B1: Defaults::AbsentBlocksKeepDefaults", "[config_loader][defaults]")
{
    const ProblemConfiguration defaults;
    auto c = load("{" + REQUIRED_KEYS + "}");

    REQUIRE(c.sampling.seed == defaults.sampling.seed);
    REQUIRE(c.sampling.consumption.mean == defaults.sampling.consumption.mean);
    REQUIRE(c.sampling.sellPrice.mean == defaults.sampling.sellPrice.mean);
    REQUIRE(c.solver.timeLimitSeconds == 0.0);
    REQUIRE_FALSE(c.solver.output);
}

TEST_CASE("B2: Defaults::PartialDistributionKeepsOtherField", "[config_loader][defaults]")
{
    auto c = load("{" + REQUIRED_KEYS + R"(,
        "sampling": { "consumption": { "stddev": 0 } }
    })");

    REQUIRE(c.sampling.consumption.mean == 10000.0);
    REQUIRE(c.sampling.consumption.stddev == 0.0);
}

// ============================================================================
// SECTION C: ERRORS
// ============================================================================

/**
 * @test Errors::MissingRequiredKey
 * @brief A missing top-level key is a ConfigurationError naming the key
 */
TEST_CASE("C1: Errors::MissingRequiredKey", "[config_loader][errors]")
{
    const std::string json = R"({
        "numberOfScenarios": 5,
        "numberOfDays": 2,
        "minNumberOfModules": 0,
        "maxNumberOfModules": 200,
        "minStorageSizeKwh": 0,
        "maxStorageSizeKwh": 100,
        "storagePricePerKwhEuro": 50,
        "maxWattsPerModule": 800,
        "areaPerModuleM2": 1.2
    })";

    REQUIRE_THROWS_AS(load(json), ConfigurationError);
    REQUIRE_THROWS_WITH(load(json), ContainsSubstring("pricePerModuleEuro"));
}

TEST_CASE("C2: Errors::WrongValueType", "[config_loader][errors]")
{
    auto json = "{" + REQUIRED_KEYS + R"(, "solver": { "threads": "many" } })";
    REQUIRE_THROWS_AS(load(json), ConfigurationError);
}

TEST_CASE("C3: Errors::InvalidJson", "[config_loader][errors]")
{
    REQUIRE_THROWS_WITH(load("{ \"numberOfScenarios\": "), ContainsSubstring("invalid JSON"));
}

TEST_CASE("C4: Errors::ParsedValuesAreValidated", "[config_loader][errors]")
{
    std::string json = "{" + REQUIRED_KEYS + "}";
    const auto pos = json.find("\"maxNumberOfModules\": 200");
    REQUIRE(pos != std::string::npos);
    json.replace(pos, std::string("\"maxNumberOfModules\": 200").size(), "\"maxNumberOfModules\": -1");

    REQUIRE_THROWS_WITH(load(json), ContainsSubstring("maxNumberOfModules"));
}

/**
 * @test Errors::NegativeSeedRejected
 * @brief "seed": -1 is a ConfigurationError instead of wrapping to 2^64 - 1
 */
TEST_CASE("C5: Errors::NegativeSeedRejected", "[config_loader][errors]")
{
    const auto json = "{" + REQUIRED_KEYS + R"(, "sampling": { "seed": -1 } })";
    REQUIRE_THROWS_AS(load(json), ConfigurationError);
    REQUIRE_THROWS_WITH(load(json), ContainsSubstring("sampling.seed"));

    const auto largest = "{" + REQUIRED_KEYS + R"(, "sampling": { "seed": 9223372036854775807 } })";
    REQUIRE(load(largest).sampling.seed == 9223372036854775807ULL);
}

TEST_CASE("C6: Errors::MalformedOptionalValue", "[config_loader][errors]")
{
    const auto json = "{" + REQUIRED_KEYS
        + R"(, "sampling": { "consumption": { "stddev": "wide" } } })";
    REQUIRE_THROWS_WITH(load(json), ContainsSubstring("malformed value"));
}

// ============================================================================
// SECTION D: FILES
// ============================================================================

TEST_CASE("D1: Files::ReadFromDisk", "[config_loader][file]")
{
    const auto path = std::filesystem::temp_directory_path() / "storage_sizing_config_test.json";
    {
        std::ofstream out(path);
        out << "{" << REQUIRED_KEYS << "}";
    }

    auto c = loadConfiguration(path);
    REQUIRE(c.numberOfScenarios == 5);

    std::filesystem::remove(path);
}

TEST_CASE("D2: Files::MissingFileIsConfigurationError", "[config_loader][file]")
{
    const auto path = std::filesystem::temp_directory_path() / "storage_sizing_does_not_exist.json";
    std::filesystem::remove(path);
    REQUIRE_THROWS_AS(loadConfiguration(path), ConfigurationError);
}

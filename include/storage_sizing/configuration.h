#pragma once
/*
===============================================================================
CONFIGURATION — Parameters of the storage selection problem
===============================================================================

OVERVIEW
--------
Plain parameter records. ProblemConfiguration carries the investment bounds
and prices, the planning horizon and the scenario count; SamplingSettings
carries the seed and the four normal distributions used to generate scenario
profiles; SolverSettings carries the engine limits.

Units
-----
    maxWattsPerModule        W (per module, per hour)
    areaPerModuleM2          m²
    pricePerModuleEuro       € per module
    storagePricePerKwhEuro   € per kWh of capacity
    min/maxStorageSizeKwh    kWh
    solar mean / stddev      W/m²
    consumption mean/stddev  W
    price mean / stddev      € per kWh

Operational model variables are in Wh; WATT_HOURS_PER_KWH is the single
conversion factor between the two.

Defaults reproduce the reference planning case; validate() must pass before
any model element is created.

===============================================================================
*/

#include <cmath>
#include <cstdint>
#include <format>
#include <limits>

#include "errors.h"

namespace sizing {

    /// @brief kWh (configuration, prices) -> Wh (operational variables)
    inline constexpr double WATT_HOURS_PER_KWH = 1000.0;

    /// @brief One timeslot per hour
    inline constexpr int TIMESLOTS_PER_DAY = 24;

    /// @brief Parameters of a normal distribution
    struct NormalParameters {
        double mean = 0.0;
        double stddev = 0.0;
    };

    /**
     * @brief Seed and distributions for scenario sampling
     *
     * @details Prices default to zero variance, i.e. constant over the
     *          horizon; any stddev >= 0 is accepted.
     */
    struct SamplingSettings {
        std::uint64_t seed = 42;
        NormalParameters solarIrradiance{ 500.0, 200.0 };
        NormalParameters consumption{ 10000.0, 2000.0 };
        NormalParameters purchasePrice{ 0.5, 0.0 };
        NormalParameters sellPrice{ 0.12, 0.0 };
    };

    /// @brief Engine limits; zero means "no limit" / "engine default"
    struct SolverSettings {
        double timeLimitSeconds = 0.0;
        double mipGap = 0.0;
        int threads = 0;
        bool output = false;
    };

    /**
     * @struct ProblemConfiguration
     * @brief Investment bounds, prices, horizon and scenario count
     */
    struct ProblemConfiguration {
        double maxWattsPerModule = 800.0;
        double areaPerModuleM2 = 1.2;
        double pricePerModuleEuro = 670.0;
        int minNumberOfModules = 0;
        int maxNumberOfModules = 100;

        double storagePricePerKwhEuro = 1400.0;
        double minStorageSizeKwh = 0.0;
        double maxStorageSizeKwh = 1000.0;

        int numberOfScenarios = 10;
        int numberOfDays = 365;

        SamplingSettings sampling;
        SolverSettings solver;

        /// @brief numberOfDays * 24
        [[nodiscard]] int timeslotCount() const noexcept {
            return numberOfDays * TIMESLOTS_PER_DAY;
        }

        /// @brief Upper bound of every storage-level variable, in Wh
        [[nodiscard]] double storageCapacityUpperBoundWh() const noexcept {
            return maxStorageSizeKwh * WATT_HOURS_PER_KWH;
        }

        /**
         * @brief Check every parameter; throws on the first violation
         * @throws ConfigurationError
         */
        void validate() const;
    };

    namespace config_detail {

        inline void requireFinite(double value, const char* name) {
            if (!std::isfinite(value)) {
                throw ConfigurationError(
                    std::format("configuration: {} must be finite, got {}", name, value));
            }
        }

        inline void requireNonNegative(double value, const char* name) {
            requireFinite(value, name);
            if (value < 0.0) {
                throw ConfigurationError(
                    std::format("configuration: {} must be >= 0, got {}", name, value));
            }
        }

        template<typename T>
        void requireOrdered(T lower, T upper, const char* lowerName, const char* upperName) {
            if (lower > upper) {
                throw ConfigurationError(
                    std::format("configuration: {} ({}) exceeds {} ({})",
                        lowerName, lower, upperName, upper));
            }
        }

        inline void requireDistribution(const NormalParameters& p, const char* name) {
            requireFinite(p.mean, name);
            if (!std::isfinite(p.stddev) || p.stddev < 0.0) {
                throw ConfigurationError(
                    std::format("configuration: {} stddev must be finite and >= 0, got {}",
                        name, p.stddev));
            }
        }

    } // namespace config_detail

    inline void ProblemConfiguration::validate() const {
        using namespace config_detail;

        if (numberOfScenarios < 1) {
            throw ConfigurationError(std::format(
                "configuration: numberOfScenarios must be >= 1, got {}", numberOfScenarios));
        }
        if (numberOfDays < 1) {
            throw ConfigurationError(std::format(
                "configuration: numberOfDays must be >= 1, got {}", numberOfDays));
        }
        if (numberOfDays > std::numeric_limits<int>::max() / TIMESLOTS_PER_DAY) {
            throw ConfigurationError(std::format(
                "configuration: numberOfDays {} overflows the timeslot index", numberOfDays));
        }

        if (minNumberOfModules < 0) {
            throw ConfigurationError(std::format(
                "configuration: minNumberOfModules must be >= 0, got {}", minNumberOfModules));
        }
        requireOrdered(minNumberOfModules, maxNumberOfModules,
            "minNumberOfModules", "maxNumberOfModules");

        requireNonNegative(minStorageSizeKwh, "minStorageSizeKwh");
        requireNonNegative(maxStorageSizeKwh, "maxStorageSizeKwh");
        requireOrdered(minStorageSizeKwh, maxStorageSizeKwh,
            "minStorageSizeKwh", "maxStorageSizeKwh");

        requireNonNegative(maxWattsPerModule, "maxWattsPerModule");
        requireNonNegative(areaPerModuleM2, "areaPerModuleM2");
        requireNonNegative(pricePerModuleEuro, "pricePerModuleEuro");
        requireNonNegative(storagePricePerKwhEuro, "storagePricePerKwhEuro");

        requireDistribution(sampling.solarIrradiance, "solarIrradiance");
        requireDistribution(sampling.consumption, "consumption");
        requireDistribution(sampling.purchasePrice, "purchasePrice");
        requireDistribution(sampling.sellPrice, "sellPrice");

        requireNonNegative(solver.timeLimitSeconds, "timeLimitSeconds");
        requireNonNegative(solver.mipGap, "mipGap");
        if (solver.threads < 0) {
            throw ConfigurationError(std::format(
                "configuration: threads must be >= 0, got {}", solver.threads));
        }
    }

} // namespace sizing

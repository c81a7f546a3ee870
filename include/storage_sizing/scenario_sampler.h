#pragma once
/*
===============================================================================
SCENARIO SAMPLER — Exogenous hourly profiles for one scenario
===============================================================================

OVERVIEW
--------
Produces the four inputs a scenario needs over the full horizon:

    solarPerModuleW[t]   N(mean, sd) W/m², clamped at 0, times module area,
                         capped at maxWattsPerModule
    consumptionW[t]      N(mean, sd) W, clamped at 0
    purchasePrice[t]     N(mean, sd) €/kWh
    sellPrice[t]         N(mean, sd) €/kWh

The solar value is per module; the constraint builder multiplies it by the
module count.

DETERMINISM
-----------
Every scenario draws from its own std::mt19937_64, seeded from
(seed, scenario index) through std::seed_seq. Consequences:

• identical configuration + seed -> identical profiles, bit for bit
• scenario s has the same profile whatever numberOfScenarios is
• no process-wide random state is touched

A distribution with stddev == 0 yields its mean and consumes no randomness.

===============================================================================
*/

#include <algorithm>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <format>
#include <vector>

#include "configuration.h"
#include "errors.h"

namespace sizing {

    /**
     * @struct ScenarioProfile
     * @brief Sampled inputs of one scenario, one entry per timeslot
     */
    struct ScenarioProfile {
        std::vector<double> solarPerModuleW;
        std::vector<double> consumptionW;
        std::vector<double> purchasePriceEuroPerKwh;
        std::vector<double> sellPriceEuroPerKwh;

        [[nodiscard]] std::size_t timeslotCount() const noexcept {
            return solarPerModuleW.size();
        }

        bool operator==(const ScenarioProfile&) const = default;
    };

    /**
     * @class ScenarioSampler
     * @brief Seeded generator of ScenarioProfile objects
     *
     * @example
     *     ScenarioSampler sampler(config);
     *     ScenarioProfile p0 = sampler.sample(0);
     */
    class ScenarioSampler {
    public:
        /**
         * @brief Capture the sampling parameters of a configuration
         * @throws ConfigurationError if the configuration is invalid
         */
        explicit ScenarioSampler(const ProblemConfiguration& config)
            : settings_(config.sampling),
              areaPerModuleM2_(config.areaPerModuleM2),
              maxWattsPerModule_(config.maxWattsPerModule),
              timeslots_(config.timeslotCount())
        {
            config.validate();
        }

        [[nodiscard]] int timeslotCount() const noexcept { return timeslots_; }
        [[nodiscard]] std::uint64_t seed() const noexcept { return settings_.seed; }

        /**
         * @brief Sample the profile of one scenario
         * @param scenario Scenario index (>= 0)
         * @throws std::out_of_range if scenario < 0
         */
        [[nodiscard]] ScenarioProfile sample(int scenario) const {
            if (scenario < 0) {
                throw std::out_of_range(
                    std::format("ScenarioSampler::sample: negative scenario {}", scenario));
            }

            std::mt19937_64 engine = makeEngine(scenario);
            ScenarioProfile profile;

            profile.solarPerModuleW = draw(engine, settings_.solarIrradiance);
            for (double& w : profile.solarPerModuleW) {
                w = std::min(std::max(w, 0.0) * areaPerModuleM2_, maxWattsPerModule_);
            }

            profile.consumptionW = draw(engine, settings_.consumption);
            for (double& w : profile.consumptionW) {
                w = std::max(w, 0.0);
            }

            profile.purchasePriceEuroPerKwh = draw(engine, settings_.purchasePrice);
            profile.sellPriceEuroPerKwh = draw(engine, settings_.sellPrice);

            return profile;
        }

    private:
        SamplingSettings settings_;
        double areaPerModuleM2_;
        double maxWattsPerModule_;
        int timeslots_;

        std::mt19937_64 makeEngine(int scenario) const {
            std::seed_seq seq{
                static_cast<std::uint32_t>(settings_.seed & 0xffffffffu),
                static_cast<std::uint32_t>(settings_.seed >> 32),
                static_cast<std::uint32_t>(scenario)
            };
            return std::mt19937_64(seq);
        }

        std::vector<double> draw(std::mt19937_64& engine, const NormalParameters& p) const {
            const auto n = static_cast<std::size_t>(timeslots_);
            if (p.stddev == 0.0) {
                return std::vector<double>(n, p.mean);
            }

            std::normal_distribution<double> dist(p.mean, p.stddev);
            std::vector<double> values(n);
            for (double& v : values) {
                v = dist(engine);
            }
            return values;
        }
    };

} // namespace sizing

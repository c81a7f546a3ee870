#pragma once
/*
===============================================================================
OBJECTIVE — Investment cost plus expected recourse cost
===============================================================================

OVERVIEW
--------
    investment  = pricePerModule * numberOfModules
                + storagePricePerKwh * sizeOfStorageKwh

    recourse(s) = sum_t purchase[s,t] * bought[s,t] / 1000
                      - sell[s,t]     * sold[s,t]   / 1000

    expected    = (1 / S) * sum_s recourse(s)

    minimize investment + expected

Operational variables are in Wh and prices in €/kWh; every price is divided
by WATT_HOURS_PER_KWH before it multiplies a Wh variable. Scenarios are
weighted equally.

===============================================================================
*/

#include <format>
#include <stdexcept>
#include <vector>

#include "gurobi_c++.h"
#include "configuration.h"
#include "expressions.h"
#include "indexing.h"
#include "scenario_sampler.h"
#include "variables.h"

namespace sizing {

    class ObjectiveBuilder {
    public:
        [[nodiscard]] static GRBLinExpr investmentCost(
            const ProblemConfiguration& config,
            const BaseVariableSet& base)
        {
            return config.pricePerModuleEuro * base.numberOfModules
                + config.storagePricePerKwhEuro * base.sizeOfStorageKwh;
        }

        /// @brief Energy cost of one scenario in €, from its Wh variables
        [[nodiscard]] static GRBLinExpr scenarioRecourseCost(
            const ScenarioProfile& profile,
            const ScenarioVariables& vars,
            int s)
        {
            auto T = range_view(0, vars.timeslotCount());
            if (profile.purchasePriceEuroPerKwh.size() != T.size()
                || profile.sellPriceEuroPerKwh.size() != T.size()) {
                throw std::invalid_argument(std::format(
                    "ObjectiveBuilder: price profile of scenario {} does not cover {} timeslots",
                    s, T.size()));
            }

            return sum(T, [&](int t) {
                const auto k = static_cast<std::size_t>(t);
                return profile.purchasePriceEuroPerKwh[k] / WATT_HOURS_PER_KWH
                        * vars(s, t, ScenarioField::BoughtEnergy)
                    - profile.sellPriceEuroPerKwh[k] / WATT_HOURS_PER_KWH
                        * vars(s, t, ScenarioField::SoldEnergy);
            });
        }

        /**
         * @brief Mean of the per-scenario recourse costs
         * @param profiles One profile per scenario row of @p vars
         * @throws std::invalid_argument if the profile count differs from S
         */
        [[nodiscard]] static GRBLinExpr expectedRecourseCost(
            const std::vector<ScenarioProfile>& profiles,
            const ScenarioVariables& vars)
        {
            const int S = vars.scenarioCount();
            if (profiles.size() != static_cast<std::size_t>(S) || S == 0) {
                throw std::invalid_argument(std::format(
                    "ObjectiveBuilder: {} profiles for {} scenarios", profiles.size(), S));
            }

            auto scenarios = range_view(0, S);
            GRBLinExpr total = sum(scenarios, [&](int s) {
                return scenarioRecourseCost(profiles[static_cast<std::size_t>(s)], vars, s);
            });
            return (1.0 / static_cast<double>(S)) * total;
        }

        /// @brief Set "minimize investment + expected recourse" on the model
        static void build(GRBModel& model,
            const ProblemConfiguration& config,
            const BaseVariableSet& base,
            const std::vector<ScenarioProfile>& profiles,
            const ScenarioVariables& vars)
        {
            model.setObjective(
                investmentCost(config, base) + expectedRecourseCost(profiles, vars),
                GRB_MINIMIZE);
        }
    };

} // namespace sizing

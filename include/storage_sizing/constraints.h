#pragma once
/*
===============================================================================
CONSTRAINT SYSTEM — Per-scenario, per-timeslot operational constraints
===============================================================================

OVERVIEW
--------
For each scenario s and timeslot t (increasing t) five constraints are
emitted, one per ScenarioConstraint family:

    ProductionLink    producedEnergy - solar[t] * numberOfModules   == 0
    ConsumptionLink   consumedEnergy                                 == load[t]
    EnergyBalance     produced - consumed - sold - delta + bought    == 0
    StorageRecursion  t == 0: storageLevel                           == 0
                      t >  0: level[t] - level[t-1] - delta[t-1]     == 0
    StorageCapacity   storageLevel - 1000 * sizeOfStorageKwh         <= 0

ProductionLink is the only family whose coefficients depend on the sampled
scenario. StorageCapacity converts the kWh investment to Wh. Constraint
count is 5 * S * T; base variables are bounded, never constrained.

Buying and selling in the same timeslot is not excluded. With a purchase
price above the sell price such a solution is never optimal.

storageEnergyDelta of the last timeslot T-1 appears in no recursion row. It
is limited only by its bounds [-1000 * maxStorageSizeKwh, +1000 *
maxStorageSizeKwh], not by the purchased sizeOfStorageKwh, so the final
hour can draw up to that amount of energy at no cost.

NAMING BEHAVIOR
---------------
    production_<s>_<t>, consumption_<s>_<t>, balance_<s>_<t>,
    initialStorage_<s>_0 / storageRecursion_<s>_<t>, capacity_<s>_<t>

EXCEPTION SAFETY
----------------
• std::invalid_argument if the profile length differs from the horizon
• GRBException from the engine propagates unchanged

===============================================================================
*/

#include <format>
#include <stdexcept>
#include <string>

#include "gurobi_c++.h"
#include "configuration.h"
#include "enum_utils.h"
#include "naming.h"
#include "scenario_sampler.h"
#include "scenario_table.h"
#include "variables.h"

namespace sizing {

    /// @brief The five constraint families of one (scenario, timeslot)
    DECLARE_ENUM_WITH_COUNT(ScenarioConstraint,
        ProductionLink,
        ConsumptionLink,
        EnergyBalance,
        StorageRecursion,
        StorageCapacity);

    using ScenarioConstraints = ScenarioTable<GRBConstr, ScenarioConstraint>;

    /**
     * @class ConstraintBuilder
     * @brief Emits the operational constraints of one scenario
     *
     * @example
     *     ScenarioConstraints cons(S, T);
     *     for (int s = 0; s < S; ++s)
     *         ConstraintBuilder::addScenario(model, sampler.sample(s), base, vars, s, cons);
     */
    class ConstraintBuilder {
    public:
        /**
         * @brief Add all constraints of scenario @p s, timeslot by timeslot
         *
         * @param profile Sampled inputs of scenario @p s
         * @param base Investment variables
         * @param vars Operational variables (scenario @p s already declared)
         * @param cons Destination table, same shape as @p vars
         * @throws std::invalid_argument if profile or table shapes disagree
         */
        static void addScenario(GRBModel& model,
            const ScenarioProfile& profile,
            const BaseVariableSet& base,
            const ScenarioVariables& vars,
            int s,
            ScenarioConstraints& cons)
        {
            const int T = vars.timeslotCount();
            if (cons.timeslotCount() != T || cons.scenarioCount() != vars.scenarioCount()) {
                throw std::invalid_argument(std::format(
                    "ConstraintBuilder::addScenario: constraint table {}x{} does not match variables {}x{}",
                    cons.scenarioCount(), cons.timeslotCount(), vars.scenarioCount(), T));
            }
            if (profile.timeslotCount() != static_cast<std::size_t>(T)
                || profile.consumptionW.size() != static_cast<std::size_t>(T)) {
                throw std::invalid_argument(std::format(
                    "ConstraintBuilder::addScenario: profile of scenario {} has {} timeslots, expected {}",
                    s, profile.timeslotCount(), T));
            }

            for (int t = 0; t < T; ++t) {
                const auto k = static_cast<std::size_t>(t);
                const GRBVar level    = vars(s, t, ScenarioField::StorageLevel);
                const GRBVar delta    = vars(s, t, ScenarioField::StorageEnergyDelta);
                const GRBVar produced = vars(s, t, ScenarioField::ProducedEnergy);
                const GRBVar consumed = vars(s, t, ScenarioField::ConsumedEnergy);
                const GRBVar bought   = vars(s, t, ScenarioField::BoughtEnergy);
                const GRBVar sold     = vars(s, t, ScenarioField::SoldEnergy);

                cons(s, t, ScenarioConstraint::ProductionLink) = addConstrOpt(model,
                    produced - profile.solarPerModuleW[k] * base.numberOfModules == 0.0,
                    ::make_name::index("production", s, t));

                cons(s, t, ScenarioConstraint::ConsumptionLink) = addConstrOpt(model,
                    GRBLinExpr(consumed) == profile.consumptionW[k],
                    ::make_name::index("consumption", s, t));

                cons(s, t, ScenarioConstraint::EnergyBalance) = addConstrOpt(model,
                    produced - consumed - sold - delta + bought == 0.0,
                    ::make_name::index("balance", s, t));

                if (t == 0) {
                    cons(s, t, ScenarioConstraint::StorageRecursion) = addConstrOpt(model,
                        GRBLinExpr(level) == 0.0,
                        ::make_name::index("initialStorage", s, t));
                }
                else {
                    const GRBVar previousLevel = vars(s, t - 1, ScenarioField::StorageLevel);
                    const GRBVar previousDelta = vars(s, t - 1, ScenarioField::StorageEnergyDelta);
                    cons(s, t, ScenarioConstraint::StorageRecursion) = addConstrOpt(model,
                        level - previousLevel - previousDelta == 0.0,
                        ::make_name::index("storageRecursion", s, t));
                }

                cons(s, t, ScenarioConstraint::StorageCapacity) = addConstrOpt(model,
                    level - WATT_HOURS_PER_KWH * base.sizeOfStorageKwh <= 0.0,
                    ::make_name::index("capacity", s, t));
            }
        }

    private:
        static GRBConstr addConstrOpt(GRBModel& model,
            const GRBTempConstr& tmp,
            const std::string& name)
        {
            if constexpr (naming_enabled()) {
                return model.addConstr(tmp, name);
            }
            else {
                return model.addConstr(tmp);
            }
        }
    };

} // namespace sizing

#pragma once
/*
===============================================================================
VARIABLE MANAGEMENT — Investment and operational decision variables
===============================================================================

OVERVIEW
--------
Declares the two variable stages of the sizing program against a GRBModel:

    stage one   numberOfModules     integer     [minModules, maxModules]
                sizeOfStorageKwh    continuous  [minStorage, maxStorage] kWh

    stage two   per scenario s and timeslot t, six continuous Wh variables
                storageLevel        [0, Cmax]
                storageEnergyDelta  [-Cmax, +Cmax]
                producedEnergy      [0, +inf)
                consumedEnergy      [0, +inf)
                boughtEnergy        [0, +inf)
                soldEnergy          [0, +inf)

    with Cmax = maxStorageSizeKwh * WATT_HOURS_PER_KWH.

Unbounded uppers use GRB_INFINITY. Stage-two variables live in a dense
ScenarioTable<GRBVar, ScenarioField>; total count is 2 + 6 * S * T.

NAMING BEHAVIOR
---------------
    numberOfModules, sizeOfStorageKwh
    storageLevel_<s>_<t>, storageEnergyDelta_<s>_<t>, ...

Names are only attached when naming_enabled().

EXCEPTION SAFETY
----------------
• ConfigurationError if any declared lower bound exceeds its upper bound
• GRBException from the engine propagates unchanged
• value() / values(): GRBException if no solution is available

===============================================================================
*/

#include <array>
#include <format>
#include <string>
#include <string_view>
#include <vector>

#include "gurobi_c++.h"
#include "configuration.h"
#include "enum_utils.h"
#include "errors.h"
#include "naming.h"
#include "scenario_table.h"

namespace sizing {

    /// @brief The six operational variables of one (scenario, timeslot)
    DECLARE_ENUM_WITH_COUNT(ScenarioField,
        StorageLevel,
        StorageEnergyDelta,
        ProducedEnergy,
        ConsumedEnergy,
        BoughtEnergy,
        SoldEnergy);

    inline constexpr std::array<std::string_view, ScenarioField_COUNT> SCENARIO_FIELD_NAMES{
        "storageLevel",
        "storageEnergyDelta",
        "producedEnergy",
        "consumedEnergy",
        "boughtEnergy",
        "soldEnergy"
    };

    /// @brief Base name of a field ("storageLevel", ...)
    [[nodiscard]] constexpr std::string_view fieldName(ScenarioField field) noexcept {
        return SCENARIO_FIELD_NAMES[enum_index(field)];
    }

    using ScenarioVariables = ScenarioTable<GRBVar, ScenarioField>;

    /**
     * @struct BaseVariableSet
     * @brief Stage-one decisions, shared by every scenario
     */
    struct BaseVariableSet {
        GRBVar numberOfModules;
        GRBVar sizeOfStorageKwh;
    };

    /// @brief Declared bounds of one operational field
    struct VariableBounds {
        double lower;
        double upper;
    };

    /// @brief Bounds of a field for the given configuration
    [[nodiscard]] inline VariableBounds fieldBounds(
        const ProblemConfiguration& config, ScenarioField field)
    {
        const double capacity = config.storageCapacityUpperBoundWh();
        switch (field) {
            case ScenarioField::StorageLevel:       return { 0.0, capacity };
            case ScenarioField::StorageEnergyDelta: return { -capacity, capacity };
            case ScenarioField::ProducedEnergy:
            case ScenarioField::ConsumedEnergy:
            case ScenarioField::BoughtEnergy:
            case ScenarioField::SoldEnergy:
            case ScenarioField::COUNT:              break;
        }
        return { 0.0, GRB_INFINITY };
    }

    /**
     * @class VariableFactory
     * @brief Creates the base and per-scenario variables of the sizing model
     *
     * @example
     *     BaseVariableSet base = VariableFactory::addBase(model, config);
     *     ScenarioVariables vars(S, T);
     *     for (int s = 0; s < S; ++s)
     *         VariableFactory::addScenario(model, config, s, vars);
     */
    class VariableFactory {
    public:
        /**
         * @brief Declare numberOfModules and sizeOfStorageKwh
         * @throws ConfigurationError if a bound pair is reversed
         */
        static BaseVariableSet addBase(GRBModel& model, const ProblemConfiguration& config) {
            BaseVariableSet base;
            base.numberOfModules = addVarChecked(model,
                static_cast<double>(config.minNumberOfModules),
                static_cast<double>(config.maxNumberOfModules),
                GRB_INTEGER, "numberOfModules");
            base.sizeOfStorageKwh = addVarChecked(model,
                config.minStorageSizeKwh,
                config.maxStorageSizeKwh,
                GRB_CONTINUOUS, "sizeOfStorageKwh");
            return base;
        }

        /**
         * @brief Declare the six fields for every timeslot of one scenario
         *
         * @param scenario Scenario index, must be a valid row of @p table
         * @param table Destination; its timeslot count defines the horizon
         *
         * @details Timeslots are declared in increasing order so that the
         *          recursion constraint of t can reference t - 1.
         */
        static void addScenario(GRBModel& model,
            const ProblemConfiguration& config,
            int scenario,
            ScenarioVariables& table)
        {
            std::array<VariableBounds, ScenarioField_COUNT> bounds{};
            for (ScenarioField f : enum_values<ScenarioField>()) {
                bounds[enum_index(f)] = fieldBounds(config, f);
                checkBounds(bounds[enum_index(f)].lower, bounds[enum_index(f)].upper,
                    ::force_name::index(fieldName(f), scenario));
            }

            for (int t = 0; t < table.timeslotCount(); ++t) {
                for (ScenarioField f : enum_values<ScenarioField>()) {
                    const VariableBounds& b = bounds[enum_index(f)];
                    table(scenario, t, f) = addVarOpt(model, b.lower, b.upper, GRB_CONTINUOUS,
                        ::make_name::index(fieldName(f), scenario, t));
                }
            }
        }

    private:
        static GRBVar addVarChecked(GRBModel& model,
            double lb,
            double ub,
            char vtype,
            std::string_view name)
        {
            checkBounds(lb, ub, name);
            return addVarOpt(model, lb, ub, vtype, ::make_name::concat(name));
        }

        static void checkBounds(double lb, double ub, std::string_view name) {
            if (lb > ub) {
                throw ConfigurationError(
                    std::format("VariableFactory: {} lower bound {} exceeds upper bound {}",
                        name, lb, ub));
            }
        }

        /// @brief Create GRBVar with optional naming
        static GRBVar addVarOpt(GRBModel& model,
            double lb,
            double ub,
            char vtype,
            const std::string& name)
        {
            if constexpr (naming_enabled()) {
                return model.addVar(lb, ub, 0.0, vtype, name);
            }
            else {
                return model.addVar(lb, ub, 0.0, vtype);
            }
        }
    };

    // ============================================================================
    // SOLUTION EXTRACTION
    // ============================================================================

    /**
     * @brief Solution value of a single variable
     * @throws GRBException if model not optimized or no solution available
     */
    inline double value(const GRBVar& v) {
        return v.get(GRB_DoubleAttr_X);
    }

    /**
     * @brief Solution values of one field of one scenario, in timeslot order
     * @throws GRBException if model not optimized or no solution available
     */
    inline std::vector<double> values(const ScenarioVariables& table,
        int scenario,
        ScenarioField field)
    {
        std::vector<double> result;
        result.reserve(static_cast<std::size_t>(table.timeslotCount()));
        for (int t = 0; t < table.timeslotCount(); ++t) {
            result.push_back(table(scenario, t, field).get(GRB_DoubleAttr_X));
        }
        return result;
    }

} // namespace sizing

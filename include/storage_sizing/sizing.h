#pragma once
/*
===============================================================================
STORAGE SIZING — Unified Include Header
===============================================================================

OVERVIEW
--------
Single include for the stochastic PV module and battery sizing model.

WHAT'S INCLUDED
---------------
• enum_utils.h        - DECLARE_ENUM_WITH_COUNT and enum helpers
• naming.h            - symbolic model-element names
• indexing.h          - range_view, S * T products
• errors.h            - ConfigurationError, SolverUnavailableError, SolveError
• log.h               - level-filtered diagnostic messages
• configuration.h     - ProblemConfiguration, SamplingSettings, SolverSettings
• config_loader.h     - JSON configuration files
• scenario_sampler.h  - seeded ScenarioProfile generation
• scenario_table.h    - dense (scenario, timeslot, field) storage
• variables.h         - VariableFactory, BaseVariableSet, ScenarioField
• constraints.h       - ConstraintBuilder, ScenarioConstraint
• expressions.h       - sum(domain, f)
• objective.h         - ObjectiveBuilder
• diagnostics.h       - status strings, statistics, LP export, IIS
• model_builder.h     - ModelBuilder template
• storage_selection.h - StorageSelectionProblem, SizingSolution

QUICK START
-----------
    #include <storage_sizing/sizing.h>

    int main() {
        sizing::ProblemConfiguration config;
        config.numberOfScenarios = 5;
        config.maxStorageSizeKwh = 100;

        sizing::StorageSelectionProblem problem(config);
        const auto& sol = problem.solve();
        std::cout << sol.numberOfModules << " modules, "
                  << sol.sizeOfStorageKwh << " kWh\n";
    }

REQUIREMENTS
------------
• C++20 compiler (GCC 13+, Clang 17+, MSVC 19.29+) for <format>
• Gurobi Optimizer 10.0+ with C++ API
• Boost.PropertyTree for config_loader.h

===============================================================================
*/

#include "enum_utils.h"
#include "naming.h"
#include "indexing.h"
#include "errors.h"
#include "log.h"

#include "configuration.h"
#include "config_loader.h"
#include "scenario_sampler.h"
#include "scenario_table.h"

#include "variables.h"
#include "constraints.h"
#include "expressions.h"
#include "objective.h"

#include "diagnostics.h"
#include "model_builder.h"
#include "storage_selection.h"

#pragma once
/*
===============================================================================
DIAGNOSTICS — Status reporting, model statistics, LP export and IIS
===============================================================================

OVERVIEW
--------
Utility functions around an assembled or solved GRBModel:

• statusString(status)     "OPTIMAL", "INFEASIBLE", ...
• classifyStatus(status)   nullopt for GRB_OPTIMAL, otherwise a SolveFailure
• computeStatistics(model) variable / constraint / non-zero counts
• modelSummary(model)      "146 vars (1 int), 120 constrs, 313 nzs"
• exportModel(model, path) LP-format text file, overwritten on every call
• computeIIS(model)        conflicting constraints and bounds of an
                           infeasible model
• computeSolutionQuality   violation metrics of the incumbent

USAGE
-----
    log::info("model: {}", modelSummary(model));
    exportModel(model, "storage_selection.lp");

    if (auto failure = classifyStatus(model.get(GRB_IntAttr_Status))) { ... }

===============================================================================
*/

#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gurobi_c++.h"
#include "errors.h"

namespace sizing {

// =============================================================================
// STATUS
// =============================================================================

namespace diag_detail {

    struct StatusName {
        int code;
        const char* name;
    };

    inline constexpr StatusName statusNames[] = {
        { GRB_LOADED, "LOADED" },
        { GRB_OPTIMAL, "OPTIMAL" },
        { GRB_INFEASIBLE, "INFEASIBLE" },
        { GRB_INF_OR_UNBD, "INF_OR_UNBD" },
        { GRB_UNBOUNDED, "UNBOUNDED" },
        { GRB_CUTOFF, "CUTOFF" },
        { GRB_ITERATION_LIMIT, "ITERATION_LIMIT" },
        { GRB_NODE_LIMIT, "NODE_LIMIT" },
        { GRB_TIME_LIMIT, "TIME_LIMIT" },
        { GRB_SOLUTION_LIMIT, "SOLUTION_LIMIT" },
        { GRB_INTERRUPTED, "INTERRUPTED" },
        { GRB_NUMERIC, "NUMERIC" },
        { GRB_SUBOPTIMAL, "SUBOPTIMAL" },
        { GRB_INPROGRESS, "INPROGRESS" },
        { GRB_USER_OBJ_LIMIT, "USER_OBJ_LIMIT" },
        { GRB_WORK_LIMIT, "WORK_LIMIT" },
        { GRB_MEM_LIMIT, "MEM_LIMIT" },
    };

} // namespace diag_detail

/// @brief Engine status name, e.g. "TIME_LIMIT"; "UNKNOWN(<code>)" otherwise
inline std::string statusString(int status) {
    for (const auto& entry : diag_detail::statusNames) {
        if (entry.code == status) {
            return entry.name;
        }
    }
    return std::format("UNKNOWN({})", status);
}

/**
 * @brief Map an engine status to the failure it represents
 * @return std::nullopt for GRB_OPTIMAL, the failure class otherwise
 *
 * @details Limit-type stops are NotSolved even when an incumbent exists;
 *          only a proven optimum is accepted.
 */
inline std::optional<SolveFailure> classifyStatus(int status) {
    switch (status) {
        case GRB_OPTIMAL:
            return std::nullopt;
        case GRB_INFEASIBLE:
            return SolveFailure::Infeasible;
        case GRB_UNBOUNDED:
            return SolveFailure::Unbounded;
        case GRB_INF_OR_UNBD:
            return SolveFailure::InfeasibleOrUnbounded;
        case GRB_LOADED:
        case GRB_CUTOFF:
        case GRB_ITERATION_LIMIT:
        case GRB_NODE_LIMIT:
        case GRB_TIME_LIMIT:
        case GRB_SOLUTION_LIMIT:
        case GRB_INTERRUPTED:
        case GRB_SUBOPTIMAL:
        case GRB_INPROGRESS:
        case GRB_USER_OBJ_LIMIT:
        case GRB_WORK_LIMIT:
        case GRB_MEM_LIMIT:
            return SolveFailure::NotSolved;
        default:
            return SolveFailure::SolverError;
    }
}

// =============================================================================
// MODEL STATISTICS
// =============================================================================

/// @brief Snapshot of model size and composition
struct ModelStatistics {
    int numVars = 0;
    int numConstrs = 0;
    int numInteger = 0;     ///< General integer (binary excluded)
    int numBinary = 0;
    int numContinuous = 0;
    int numNonZeros = 0;
};

/**
 * @brief Compute statistics for a Gurobi model
 * @note Call after GRBModel::update(); pending elements are not counted
 */
inline ModelStatistics computeStatistics(const GRBModel& model) {
    const int vars = model.get(GRB_IntAttr_NumVars);
    const int binaries = model.get(GRB_IntAttr_NumBinVars);
    const int integers = model.get(GRB_IntAttr_NumIntVars) - binaries;  // NumIntVars counts binaries too

    return ModelStatistics{
        vars,
        model.get(GRB_IntAttr_NumConstrs),
        integers,
        binaries,
        vars - binaries - integers,
        model.get(GRB_IntAttr_NumNZs),
    };
}

/// @brief Summary like "146 vars (1 int), 120 constrs, 313 nzs"
inline std::string modelSummary(const GRBModel& model) {
    const auto stats = computeStatistics(model);

    std::string result = std::format("{} vars", stats.numVars);
    if (stats.numBinary > 0 && stats.numInteger > 0) {
        result += std::format(" ({} bin, {} int)", stats.numBinary, stats.numInteger);
    }
    else if (stats.numBinary > 0) {
        result += std::format(" ({} bin)", stats.numBinary);
    }
    else if (stats.numInteger > 0) {
        result += std::format(" ({} int)", stats.numInteger);
    }
    result += std::format(", {} constrs, {} nzs", stats.numConstrs, stats.numNonZeros);

    return result;
}

// =============================================================================
// LP EXPORT
// =============================================================================

/**
 * @brief Write the model in LP format, replacing any existing file
 *
 * @param path Target file; ".lp" is appended when the extension is missing,
 *             since Gurobi selects the format from the extension
 * @return The path actually written
 * @throws GRBException if the file cannot be written
 */
inline std::filesystem::path exportModel(GRBModel& model, std::filesystem::path path) {
    if (path.extension() != ".lp") {
        path += ".lp";
    }
    model.update();
    model.write(path.string());
    return path;
}

// =============================================================================
// IIS
// =============================================================================

/// @brief Names of the rows and bounds in an irreducible infeasible subsystem
struct InfeasibleSubsystem {
    std::vector<std::string> constraints;
    std::vector<std::string> lowerBounds;
    std::vector<std::string> upperBounds;

    [[nodiscard]] std::size_t size() const noexcept {
        return constraints.size() + lowerBounds.size() + upperBounds.size();
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
};

/**
 * @brief Run GRBModel::computeIIS() and collect the members by name
 *
 * @note Only meaningful when the status is INFEASIBLE or INF_OR_UNBD
 * @throws GRBException if the model is feasible or the computation fails
 */
inline InfeasibleSubsystem computeIIS(GRBModel& model) {
    model.computeIIS();

    InfeasibleSubsystem iis;

    std::unique_ptr<GRBConstr[]> rows(model.getConstrs());
    const int rowCount = model.get(GRB_IntAttr_NumConstrs);
    for (int r = 0; r < rowCount; ++r) {
        if (rows[r].get(GRB_IntAttr_IISConstr) != 0) {
            iis.constraints.push_back(rows[r].get(GRB_StringAttr_ConstrName));
        }
    }

    std::unique_ptr<GRBVar[]> columns(model.getVars());
    const int columnCount = model.get(GRB_IntAttr_NumVars);
    for (int c = 0; c < columnCount; ++c) {
        GRBVar column = columns[c];
        if (column.get(GRB_IntAttr_IISLB) != 0) {
            iis.lowerBounds.push_back(column.get(GRB_StringAttr_VarName));
        }
        if (column.get(GRB_IntAttr_IISUB) != 0) {
            iis.upperBounds.push_back(column.get(GRB_StringAttr_VarName));
        }
    }

    return iis;
}

// =============================================================================
// SOLUTION QUALITY
// =============================================================================

/// @brief Violation metrics of the current solution
struct SolutionQuality {
    double maxConstrViolation = 0.0;
    double maxBoundViolation = 0.0;
    double maxIntViolation = 0.0;
};

/// @note Only call when the model has a solution
inline SolutionQuality computeSolutionQuality(const GRBModel& model) {
    return SolutionQuality{
        model.get(GRB_DoubleAttr_ConstrVio),
        model.get(GRB_DoubleAttr_BoundVio),
        model.get(GRB_DoubleAttr_IntVio),
    };
}

} // namespace sizing

#pragma once
/*
===============================================================================
ERRORS — Exception types raised while building and solving the sizing model
===============================================================================

Three failure families, each distinguishable by type:

    ConfigurationError     invalid bounds, horizon, scenario count or
                           distribution parameters; raised before any
                           variable is declared
    SolverUnavailableError the engine environment could not be created;
                           raised before any model construction
    SolveError             the engine returned something other than an
                           optimal solution; carries the failure class and
                           the raw engine status

===============================================================================
*/

#include <stdexcept>
#include <string>

#include "enum_utils.h"

namespace sizing {

    /// @brief Invalid problem or sampling configuration
    class ConfigurationError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /// @brief The solver backend could not be created (licence, missing library, ...)
    class SolverUnavailableError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Classification of a non-optimal solve
     *
     * NotSolved covers every limit-type stop (time, node, iteration, work,
     * memory, user interrupt); SolverError covers numerical trouble and unknown codes.
     */
    DECLARE_ENUM_WITH_COUNT(SolveFailure,
        Infeasible,
        Unbounded,
        InfeasibleOrUnbounded,
        NotSolved,
        SolverError);

    /// @brief Human-readable name of a SolveFailure
    inline const char* toString(SolveFailure failure) noexcept {
        switch (failure) {
            case SolveFailure::Infeasible:            return "infeasible";
            case SolveFailure::Unbounded:             return "unbounded";
            case SolveFailure::InfeasibleOrUnbounded: return "infeasible or unbounded";
            case SolveFailure::NotSolved:             return "not solved";
            case SolveFailure::SolverError:           return "solver error";
            case SolveFailure::COUNT:                 break;
        }
        return "unknown";
    }

    /**
     * @brief The engine did not report an optimal solution
     *
     * @details Solution values must not be read after this is thrown; the
     *          engine's state may be stale or undefined.
     */
    class SolveError : public std::runtime_error {
    public:
        SolveError(SolveFailure failure, int status, const std::string& what)
            : std::runtime_error(what), failure_(failure), status_(status) {
        }

        [[nodiscard]] SolveFailure failure() const noexcept { return failure_; }

        /// @brief Raw engine status code (GRB_INFEASIBLE, GRB_TIME_LIMIT, ...)
        [[nodiscard]] int status() const noexcept { return status_; }

    private:
        SolveFailure failure_;
        int status_;
    };

} // namespace sizing

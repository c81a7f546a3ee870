/*
================================================================================
STORAGE SELECTION - Stochastic sizing of PV modules and battery storage
================================================================================
PROBLEM TYPE: Two-stage stochastic Mixed-Integer Programming (MIP)

PROBLEM DESCRIPTION
-------------------
A site owner decides how many PV modules to install and how large a battery
to buy. Solar production and consumption are uncertain and represented by
sampled hourly scenarios. For every scenario and hour the grid covers what
production and storage cannot, and surplus can be sold. The goal is to
minimize investment plus the expected cost of energy.

MATHEMATICAL MODEL
------------------
Sets:
    S = {0, ..., numberOfScenarios-1}
    T = {0, ..., 24*numberOfDays-1}

Variables:
    m in Z, [mMin, mMax]           number of modules
    C >= 0, [CMin, CMax] kWh       storage capacity
    L, D, P, U, B, V [s,t]         level, delta, produced, consumed,
                                   bought, sold energy (Wh)

Objective:
    min  pm*m + pc*C + (1/|S|) sum_{s,t} (buy[s,t]*B[s,t] - sell[s,t]*V[s,t]) / 1000

Constraints (for all s, t):
    P[s,t] = solar[s,t] * m
    U[s,t] = load[s,t]
    P - U  = V + D - B
    L[s,0] = 0,  L[s,t] = L[s,t-1] + D[s,t-1]
    L[s,t] <= 1000 * C

USAGE
-----
    storage_selection [--config FILE] [--scenarios N] [--days N] [--seed N]
                      [--lp-file PATH] [--time-limit SEC] [--mip-gap GAP]
                      [--threads N] [--solver-output] [--log-level LEVEL]

EXIT CODES
----------
    0 optimal solution found    3 solve did not end optimal
    1 bad arguments or config   5 help shown
    2 solver unavailable

================================================================================
*/

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include <storage_sizing/sizing.h>

namespace bpopts = boost::program_options;

namespace {

    void printSolution(const sizing::StorageSelectionProblem& problem) {
        const auto& sol = problem.solution();
        const auto& cfg = problem.configuration();

        std::cout << "\nSOLUTION\n";
        std::cout << "--------\n";
        std::cout << std::fixed << std::setprecision(3);
        std::cout << "Modules:                " << sol.numberOfModules << "\n";
        std::cout << "Storage:                " << sol.sizeOfStorageKwh << " kWh\n";
        std::cout << std::setprecision(2);
        std::cout << "Objective:              " << sol.objective << " EUR\n";
        std::cout << "  investment:           " << sol.investmentCost << " EUR\n";
        std::cout << "  expected recourse:    " << sol.expectedRecourseCost << " EUR\n";
        std::cout << "Runtime:                " << sol.runtimeSeconds << " s\n";
        std::cout << std::setprecision(6);
        std::cout << "MIP gap:                " << sol.mipGap << "\n";

        std::cout << "\nRecourse cost per scenario:\n";
        std::cout << std::setprecision(2);
        for (int s = 0; s < cfg.numberOfScenarios; ++s) {
            std::cout << "  scenario " << std::setw(4) << s << ": "
                      << std::setw(14) << sol.scenarioRecourseCosts[static_cast<std::size_t>(s)]
                      << " EUR\n";
        }
    }

    void reportInfeasibility(sizing::StorageSelectionProblem& problem) {
        try {
            auto iis = sizing::computeIIS(problem.model());
            sizing::log::warning("IIS: {} constraints, {} lower bounds, {} upper bounds",
                iis.constraints.size(), iis.lowerBounds.size(), iis.upperBounds.size());
            for (const auto& name : iis.constraints) {
                sizing::log::warning("  IIS constraint {}", name);
            }
            for (const auto& name : iis.lowerBounds) {
                sizing::log::warning("  IIS lower bound {}", name);
            }
            for (const auto& name : iis.upperBounds) {
                sizing::log::warning("  IIS upper bound {}", name);
            }
        }
        catch (const GRBException& e) {
            sizing::log::warning("IIS computation failed: {} (code {})",
                e.getMessage(), e.getErrorCode());
        }
    }

} // namespace

int main(int argc, char* argv[]) {
    bpopts::options_description opts_desc("Options");
    opts_desc.add_options()
        ("help,h",                                  "Show help")
        ("config,c",      bpopts::value<std::string>(), "Path to a JSON configuration file; built-in defaults otherwise")
        ("scenarios",     bpopts::value<int>(),     "Override numberOfScenarios")
        ("days",          bpopts::value<int>(),     "Override numberOfDays")
        ("seed,s",        bpopts::value<std::uint64_t>(), "Override the sampling seed")
        ("lp-file",       bpopts::value<std::string>()->default_value("storage_selection.lp"),
                                                    "LP export of the assembled model, overwritten on every run; empty disables the export")
        ("time-limit",    bpopts::value<double>(),  "Solver time limit in seconds")
        ("mip-gap",       bpopts::value<double>(),  "Relative MIP gap at which the solve stops")
        ("threads,n",     bpopts::value<int>(),     "Solver threads, 0 lets the engine choose")
        ("solver-output",                           "Show the solver's own console log")
        ("log-level,l",   bpopts::value<std::string>()->default_value("info"),
                                                    "debug, info, warning, error or off");
    bpopts::variables_map opts_vals;
    try {
        bpopts::store(bpopts::parse_command_line(argc, argv, opts_desc), opts_vals);
        bpopts::notify(opts_vals);
    }
    catch (const bpopts::error& err) {
        std::cerr << "Error when parsing command line arguments:\n" << err.what() << "\n";
        return 1;
    }

    if (opts_vals.count("help") > 0) {
        std::cerr << opts_desc << "\n";
        return 5;
    }

    const std::string levelName = opts_vals["log-level"].as<std::string>();
    if (auto level = sizing::parseLogLevel(levelName)) {
        sizing::setLogLevel(*level);
    }
    else {
        std::cerr << "Unknown log level '" << levelName << "'\n";
        return 1;
    }

    sizing::ProblemConfiguration config;
    try {
        if (opts_vals.count("config") > 0) {
            config = sizing::loadConfiguration(
                std::filesystem::path(opts_vals["config"].as<std::string>()));
        }
        if (opts_vals.count("scenarios") > 0) config.numberOfScenarios = opts_vals["scenarios"].as<int>();
        if (opts_vals.count("days") > 0)      config.numberOfDays = opts_vals["days"].as<int>();
        if (opts_vals.count("seed") > 0)      config.sampling.seed = opts_vals["seed"].as<std::uint64_t>();
        if (opts_vals.count("time-limit") > 0) config.solver.timeLimitSeconds = opts_vals["time-limit"].as<double>();
        if (opts_vals.count("mip-gap") > 0)   config.solver.mipGap = opts_vals["mip-gap"].as<double>();
        if (opts_vals.count("threads") > 0)   config.solver.threads = opts_vals["threads"].as<int>();
        config.validate();
    }
    catch (const sizing::ConfigurationError& e) {
        sizing::log::error("{}", e.what());
        return 1;
    }

    try {
        sizing::StorageSelectionProblem problem(config);
        problem.build();
        if (opts_vals.count("solver-output") > 0) {
            problem.enableOutput();
        }

        std::cout << "Starting to solve problem. Problem characteristics:\n";
        std::cout << "variables:   " << problem.variableCount() << "\n";
        std::cout << "constraints: " << problem.constraintCount() << "\n";
        sizing::log::info("model: {}", sizing::modelSummary(problem.model()));

        const std::string lpFile = opts_vals["lp-file"].as<std::string>();
        if (!lpFile.empty()) {
            problem.exportLp(lpFile);
        }

        try {
            problem.solve();
        }
        catch (const sizing::SolveError& e) {
            sizing::log::error("{} (Gurobi status {})", e.what(), e.status());
            if (e.failure() == sizing::SolveFailure::Infeasible
                || e.failure() == sizing::SolveFailure::InfeasibleOrUnbounded) {
                reportInfeasibility(problem);
            }
            return 3;
        }

        printSolution(problem);
    }
    catch (const sizing::SolverUnavailableError& e) {
        sizing::log::error("{}", e.what());
        return 2;
    }
    catch (const sizing::ConfigurationError& e) {
        sizing::log::error("{}", e.what());
        return 1;
    }
    catch (const GRBException& e) {
        sizing::log::error("Gurobi error {}: {}", e.getErrorCode(), e.getMessage());
        return 3;
    }

    return 0;
}

#pragma once
/*
===============================================================================
STORAGE SELECTION PROBLEM — Two-stage stochastic PV and battery sizing
===============================================================================

OVERVIEW
--------
Stage one chooses the number of PV modules and the battery capacity. Stage
two, for every sampled scenario and every hour of the horizon, decides how
much energy to buy, sell and move into or out of storage so that the
hourly balance holds. The objective is investment cost plus the average
recourse cost over the scenarios.

Build order (ModelBuilder hooks):

    addVariables     2 base variables, then 6 * T per scenario
    addConstraints   per scenario: sample the profile, then 5 * T constraints
                     in increasing timeslot order
    addParameters    TimeLimit / MIPGap / Threads / OutputFlag
    addObjective     investment + expected recourse, minimized
    afterOptimize    status check, then SizingSolution extraction

Any status other than GRB_OPTIMAL raises SolveError and no value is read.

USAGE
-----
    StorageSelectionProblem problem(config);
    problem.build();
    log::info("variables: {}", problem.variableCount());
    problem.exportLp("storage_selection.lp");
    const SizingSolution& sol = problem.solve();

===============================================================================
*/

#include <cmath>
#include <filesystem>
#include <format>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "gurobi_c++.h"
#include "configuration.h"
#include "constraints.h"
#include "diagnostics.h"
#include "errors.h"
#include "log.h"
#include "model_builder.h"
#include "objective.h"
#include "scenario_sampler.h"
#include "variables.h"

namespace sizing {

    /**
     * @struct SizingSolution
     * @brief Values read back after an optimal solve
     */
    struct SizingSolution {
        int numberOfModules = 0;
        double sizeOfStorageKwh = 0.0;

        double objective = 0.0;             ///< €
        double investmentCost = 0.0;        ///< €
        double expectedRecourseCost = 0.0;  ///< €
        std::vector<double> scenarioRecourseCosts;

        double runtimeSeconds = 0.0;
        double mipGap = 0.0;
    };

    class StorageSelectionProblem
        : public ModelBuilder<ScenarioField, ScenarioConstraint> {
    public:
        /**
         * @brief Problem with its own Gurobi environment
         * @throws ConfigurationError before any engine object is created
         */
        explicit StorageSelectionProblem(ProblemConfiguration config)
            : config_(validated(std::move(config))),
              sampler_(config_)
        {
        }

        /**
         * @brief Problem built into a caller-owned model
         * @throws ConfigurationError before any variable is declared
         */
        StorageSelectionProblem(GRBModel& model, ProblemConfiguration config)
            : ModelBuilder(model),
              config_(validated(std::move(config))),
              sampler_(config_)
        {
        }

        [[nodiscard]] const ProblemConfiguration& configuration() const noexcept { return config_; }

        /// @brief Sampled profiles, one per scenario; empty before build()
        [[nodiscard]] const std::vector<ScenarioProfile>& profiles() const noexcept { return profiles_; }

        [[nodiscard]] const BaseVariableSet& base() const noexcept { return base_; }

        /// @brief Number of variables of the assembled model (builds it if needed)
        int variableCount() {
            return build().get(GRB_IntAttr_NumVars);
        }

        /// @brief Number of linear constraints of the assembled model (builds it if needed)
        int constraintCount() {
            return build().get(GRB_IntAttr_NumConstrs);
        }

        /**
         * @brief Write the assembled model in LP format, overwriting @p path
         * @return The file actually written
         */
        std::filesystem::path exportLp(const std::filesystem::path& path) {
            build();
            auto written = exportModel(model(), path);
            log::info("model exported to {}", written.string());
            return written;
        }

        /// @brief Turn on the engine's console log for the next solve
        void enableOutput() {
            config_.solver.output = true;
            verbose();
        }

        /**
         * @brief Build if needed, solve, and return the extracted solution
         * @throws SolveError if the solve does not end optimal
         */
        const SizingSolution& solve() {
            optimize();
            return solution();
        }

        [[nodiscard]] bool hasSolution() const noexcept { return solution_.has_value(); }

        /// @throws std::logic_error if no optimal solve has completed
        [[nodiscard]] const SizingSolution& solution() const {
            if (!solution_) {
                throw std::logic_error("StorageSelectionProblem: no optimal solution available");
            }
            return *solution_;
        }

        /**
         * @brief Solved values of one field of one scenario, timeslot order
         * @throws std::logic_error if no optimal solve has completed
         */
        [[nodiscard]] std::vector<double> scenarioValues(int s, ScenarioField field) const {
            solution();
            return values(vars_, s, field);
        }

    protected:
        // -------------------------------------------------------------------------
        // ModelBuilder hooks
        // -------------------------------------------------------------------------

        void configureEnvironment(GRBEnv& env) override {
            env.set(GRB_IntParam_OutputFlag, config_.solver.output ? 1 : 0);
        }

        void addVariables() override {
            const int S = config_.numberOfScenarios;
            const int T = config_.timeslotCount();
            auto& m = model();

            log::debug("building base variables");
            base_ = VariableFactory::addBase(m, config_);

            log::debug("building scenario variables ({} scenarios x {} timeslots)", S, T);
            vars_ = VarTable(S, T);
            for (int s = 0; s < S; ++s) {
                VariableFactory::addScenario(m, config_, s, vars_);
            }
            log::debug("finished setting up decision variables");
        }

        void addConstraints() override {
            const int S = config_.numberOfScenarios;
            auto& m = model();

            log::debug("start setting up constraints");
            cons_ = ConTable(S, config_.timeslotCount());
            profiles_.clear();
            profiles_.reserve(static_cast<std::size_t>(S));

            for (int s = 0; s < S; ++s) {
                log::debug("processing scenario {}/{}", s + 1, S);
                profiles_.push_back(sampler_.sample(s));
                ConstraintBuilder::addScenario(m, profiles_.back(), base_, vars_, s, cons_);
            }
            log::debug("finished setting up constraints");
        }

        void addParameters() override {
            const SolverSettings& solver = config_.solver;
            if (solver.output) {
                verbose();
            }
            else {
                quiet();
            }
            if (solver.timeLimitSeconds > 0.0) {
                timeLimit(solver.timeLimitSeconds);
            }
            if (solver.mipGap > 0.0) {
                mipGapLimit(solver.mipGap);
            }
            if (solver.threads > 0) {
                threads(solver.threads);
            }
        }

        void addObjective() override {
            log::debug("start setting up objective");
            ObjectiveBuilder::build(model(), config_, base_, profiles_, vars_);
            log::debug("finished setting up objective");
        }

        void afterOptimize() override {
            solution_.reset();

            const int code = status();
            if (auto failure = classifyStatus(code)) {
                log::error("solve ended with status {}", statusString(code));
                throw SolveError(*failure, code, std::format(
                    "storage selection: solve ended with status {} ({})",
                    statusString(code), toString(*failure)));
            }

            solution_ = extractSolution();
            log::info("optimal: {} modules, {:.3f} kWh storage, objective {:.2f} EUR",
                solution_->numberOfModules, solution_->sizeOfStorageKwh, solution_->objective);
        }

    private:
        ProblemConfiguration config_;
        ScenarioSampler sampler_;

        BaseVariableSet base_;
        std::vector<ScenarioProfile> profiles_;
        std::optional<SizingSolution> solution_;

        static ProblemConfiguration validated(ProblemConfiguration config) {
            config.validate();
            return config;
        }

        SizingSolution extractSolution() const {
            SizingSolution sol;
            const double modules = value(base_.numberOfModules);
            sol.numberOfModules = static_cast<int>(std::lround(modules));
            sol.sizeOfStorageKwh = value(base_.sizeOfStorageKwh);
            sol.objective = objVal();
            sol.investmentCost = config_.pricePerModuleEuro * modules
                + config_.storagePricePerKwhEuro * sol.sizeOfStorageKwh;

            const int S = vars_.scenarioCount();
            sol.scenarioRecourseCosts.reserve(static_cast<std::size_t>(S));
            double total = 0.0;
            for (int s = 0; s < S; ++s) {
                const ScenarioProfile& p = profiles_[static_cast<std::size_t>(s)];
                const auto bought = values(vars_, s, ScenarioField::BoughtEnergy);
                const auto sold = values(vars_, s, ScenarioField::SoldEnergy);
                double cost = 0.0;
                for (std::size_t t = 0; t < bought.size(); ++t) {
                    cost += p.purchasePriceEuroPerKwh[t] * bought[t] / WATT_HOURS_PER_KWH
                        - p.sellPriceEuroPerKwh[t] * sold[t] / WATT_HOURS_PER_KWH;
                }
                sol.scenarioRecourseCosts.push_back(cost);
                total += cost;
            }
            sol.expectedRecourseCost = S > 0 ? total / static_cast<double>(S) : 0.0;

            sol.runtimeSeconds = runtime();
            // MIPGap is only defined for models with integer variables
            sol.mipGap = model().get(GRB_IntAttr_IsMIP) ? mipGap() : 0.0;
            return sol;
        }
    };

} // namespace sizing

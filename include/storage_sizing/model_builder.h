#pragma once
/*
===============================================================================
MODEL BUILDER — Template-method orchestration of a scenario model
===============================================================================

OVERVIEW
--------
ModelBuilder owns the engine objects of one model and fixes the order in
which a derived problem fills it:

    build()                         optimize()
      initialize()   (once)           build()
      addVariables()                  beforeOptimize()
      addConstraints()                GRBModel::optimize()
      addParameters()                 afterOptimize()
      addObjective()
      GRBModel::update()

The assembly hooks run exactly once, however often build() or optimize() is
called. A hook that throws leaves a partly filled model behind; the builder
cannot be rebuilt after that and later build() calls throw std::logic_error.
A failed initialize() leaves no model and may be retried. Keeping build() apart from optimize() lets a driver report counts and
export the LP file before the solve.

ENVIRONMENT
-----------
Nothing is created by the constructor. initialize() creates GRBEnv(true),
hands it to configureEnvironment() and starts it; a GRBException raised
there (missing licence, missing library) becomes SolverUnavailableError.

A builder constructed on a caller-owned GRBModel never creates an
environment and never calls configureEnvironment().

TABLES
------
VarField and ConKind are the field enums of the operational variable table
and of the constraint table. Both tables are ScenarioTable instances that the
derived addVariables() / addConstraints() size and fill.

    class MyProblem : public ModelBuilder<ScenarioField, ScenarioConstraint> {
    protected:
        void addVariables() override   { vars_ = VarTable(S, T); ... }
        void addConstraints() override { cons_ = ConTable(S, T); ... }
        void addObjective() override   { minimize(...); }
    };

===============================================================================
*/

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "gurobi_c++.h"
#include "errors.h"
#include "scenario_table.h"

namespace sizing {

    template <typename VarField, typename ConKind>
    class ModelBuilder {
    public:
        using VarTable = ScenarioTable<GRBVar, VarField>;
        using ConTable = ScenarioTable<GRBConstr, ConKind>;

        ModelBuilder() = default;

        /// @brief Build into @p external; the caller keeps ownership
        explicit ModelBuilder(GRBModel& external) : model_(&external) {}

        virtual ~ModelBuilder() = default;

        ModelBuilder(const ModelBuilder&) = delete;
        ModelBuilder& operator=(const ModelBuilder&) = delete;

        /**
         * @brief Create and start the environment and the model (first call only)
         * @throws SolverUnavailableError if the engine cannot be started
         */
        void initialize()
        {
            if (model_ != nullptr)
                return;

            try {
                auto env = std::make_unique<GRBEnv>(true);
                configureEnvironment(*env);
                env->start();
                auto model = std::make_unique<GRBModel>(*env);

                env_ = std::move(env);
                ownedModel_ = std::move(model);
                model_ = ownedModel_.get();
            }
            catch (const GRBException& e) {
                throw SolverUnavailableError(
                    "Gurobi environment unavailable: " + e.getMessage()
                    + " (code " + std::to_string(e.getErrorCode()) + ")");
            }
        }

        /// @brief The model being built; initializes on first use
        GRBModel& model()
        {
            initialize();
            return *model_;
        }

        /// @throws std::logic_error before initialize()
        const GRBModel& model() const
        {
            if (model_ == nullptr) {
                throw std::logic_error("ModelBuilder::model: builder not initialized");
            }
            return *model_;
        }

        VarTable& variables() noexcept { return vars_; }
        const VarTable& variables() const noexcept { return vars_; }

        ConTable& constraints() noexcept { return cons_; }
        const ConTable& constraints() const noexcept { return cons_; }

        [[nodiscard]] bool isBuilt() const noexcept { return built_; }

        // -------------------------------------------------------------------------
        // Parameters
        // -------------------------------------------------------------------------

        template <typename Param, typename Val>
        void setParam(Param param, Val&& value)
        {
            model().set(param, std::forward<Val>(value));
        }

        void timeLimit(double seconds) { setParam(GRB_DoubleParam_TimeLimit, seconds); }
        void mipGapLimit(double gap) { setParam(GRB_DoubleParam_MIPGap, gap); }

        /// @brief 0 lets the engine choose
        void threads(int count) { setParam(GRB_IntParam_Threads, count); }

        void quiet() { setParam(GRB_IntParam_OutputFlag, 0); }
        void verbose() { setParam(GRB_IntParam_OutputFlag, 1); }

        // -------------------------------------------------------------------------
        // Results of the last solve
        // -------------------------------------------------------------------------

        int status() const { return model().get(GRB_IntAttr_Status); }
        bool isOptimal() const { return status() == GRB_OPTIMAL; }
        double objVal() const { return model().get(GRB_DoubleAttr_ObjVal); }
        double mipGap() const { return model().get(GRB_DoubleAttr_MIPGap); }

        /// @brief Wall-clock seconds
        double runtime() const { return model().get(GRB_DoubleAttr_Runtime); }

        int solutionCount() const { return model().get(GRB_IntAttr_SolCount); }

        // -------------------------------------------------------------------------
        // Orchestration
        // -------------------------------------------------------------------------

        /**
         * @brief Assemble the model without solving it; later calls return at once
         * @throws std::logic_error if an assembly hook threw in an earlier build()
         */
        GRBModel& build()
        {
            if (built_) {
                return *model_;
            }
            if (buildFailed_) {
                throw std::logic_error("ModelBuilder::build: an earlier build failed");
            }

            initialize();
            buildFailed_ = true;
            addVariables();
            addConstraints();
            addParameters();
            addObjective();
            model_->update();
            buildFailed_ = false;
            built_ = true;
            return *model_;
        }

        /// @brief build(), then solve between the two optimize hooks
        GRBModel& optimize()
        {
            build();
            beforeOptimize();
            model_->optimize();
            afterOptimize();
            return *model_;
        }

    protected:
        VarTable vars_;
        ConTable cons_;

        void minimize(const GRBLinExpr& expr) { model().setObjective(expr, GRB_MINIMIZE); }

        // -------------------------------------------------------------------------
        // Hooks
        // -------------------------------------------------------------------------

        /// @brief Environment parameters set before the environment starts
        virtual void configureEnvironment(GRBEnv&) {}

        /// @brief Model parameters: TimeLimit, MIPGap, Threads, OutputFlag
        virtual void addParameters() {}

        virtual void addVariables() {}
        virtual void addConstraints() {}
        virtual void addObjective() {}

        virtual void beforeOptimize() {}

        /// @brief Status check and solution read-back
        virtual void afterOptimize() {}

    private:
        std::unique_ptr<GRBEnv> env_;
        std::unique_ptr<GRBModel> ownedModel_;
        GRBModel* model_ = nullptr;   // ownedModel_ or the caller's model

        bool built_ = false;
        bool buildFailed_ = false;  // set while assembling, cleared on success
    };

} // namespace sizing

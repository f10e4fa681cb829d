/*
 * optimization_model.h
 *
 * This file contains the decision model of one optimization window
 * and the accumulator of the shared net demand and exports expressions.
 * The decision model wraps an OR-Tools MPSolver and keeps a registry
 * of all variables, so that the values can be extracted after the solve.
 *
 */

#ifndef OPTIMIZATION_MODEL_H
#define OPTIMIZATION_MODEL_H

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ortools/linear_solver/linear_solver.h"

#include "horizon_sets.h"


namespace model {

    using operations_research::LinearExpr;
    using operations_research::MPConstraint;
    using operations_research::MPSolver;
    using operations_research::MPVariable;

    /*!
     * The decision model of one window.
     * It is created fresh per window and discarded after the values have been extracted.
     */
    class DecisionModel {
        public:
            explicit DecisionModel(std::unique_ptr<MPSolver> solver);

            MPSolver* solver() { return mp_solver.get(); }
            double infinity() const { return mp_solver->infinity(); }

            /**
             * Creates one continuous variable per time step with constant bounds and registers them under the given name
             */
            const std::vector<MPVariable*>& make_series(const std::string& name, size_t T, double lb, double ub);
            /**
             * Creates one continuous variable per time step with time dependent bounds
             */
            const std::vector<MPVariable*>& make_series(const std::string& name, const std::vector<double>& lb, const std::vector<double>& ub);
            /**
             * Creates one indicator variable per time step. It is binary if binary is set, otherwise it is relaxed to [0,1].
             */
            const std::vector<MPVariable*>& make_indicator_series(const std::string& name, size_t T, bool binary);
            MPVariable* make_scalar(const std::string& name, double lb, double ub);
            MPVariable* make_indicator(const std::string& name, bool binary);

            bool has_series(const std::string& name) const { return series_variables.contains(name); }
            bool has_scalar(const std::string& name) const { return scalar_variables.contains(name); }
            const std::vector<MPVariable*>& series(const std::string& name) const; ///< throws std::out_of_range if the name is unknown
            MPVariable* scalar(const std::string& name) const;                    ///< throws std::out_of_range if the name is unknown

            /// Adds a linear row constraint; lb and ub can be +/- infinity()
            MPConstraint* add_constraint(const operations_research::LinearRange& range, const std::string& name);

            void add_objective_term(const LinearExpr& term) { objective_expr += term; }
            const LinearExpr& objective() const { return objective_expr; }

            /**
             * Sets the accumulated objective (minimization) and runs the solver.
             */
            MPSolver::ResultStatus solve();

            double objective_value() const { return mp_solver->Objective().Value(); }
            std::vector<double> series_values(const std::string& name) const;
            double scalar_value(const std::string& name) const { return scalar(name)->solution_value(); }
            int n_variables() const   { return mp_solver->NumVariables(); }
            int n_constraints() const { return mp_solver->NumConstraints(); }

        private:
            std::unique_ptr<MPSolver> mp_solver;
            std::map<std::string, std::vector<MPVariable*>> series_variables;
            std::map<std::string, MPVariable*> scalar_variables;
            LinearExpr objective_expr;
    };


    /*!
     * Shared expressions, that are updated additively by all asset builders.
     * The mechanism builders only read the expressions and append objective terms or linkage constraints.
     */
    struct ExpressionAccumulator {
        std::vector<LinearExpr> net_demand;          ///< Initialized with the base demand
        std::vector<double> net_demand_upper_bound;  ///< Upper bound of every net demand expression (big-M of the linkage)
        bool exports_enabled = false;
        std::vector<LinearExpr> exports;             ///< Only used if exports_enabled is set
        double exports_upper_bound = 0.0;            ///< Sum of all export capable capacities

        ExpressionAccumulator() = default;
        ExpressionAccumulator(const horizon::Sets& sets, bool exports_enabled_);
    };

}

#endif

/**
 * solver_backend.hpp
 *
 * This file contains the functions required to select and configure
 * the solver backend, that is called by OR-Tools.
 */

#ifndef SOLVER_BACKEND_HPP
#define SOLVER_BACKEND_HPP

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "absl/time/time.h"
#include "ortools/linear_solver/linear_solver.h"

#include "components.h"
#include "errors.h"
#include "global.h"

namespace model {

    /**
     * Returns the OR-Tools solver id of a solver choice
     */
    inline std::string solver_id(global::SolverChoice choice) {
        switch (choice) {
            case global::SolverChoice::SCIP:   return "SCIP";
            case global::SolverChoice::CBC:    return "CBC";
            case global::SolverChoice::GLPK:   return "GLPK";
            case global::SolverChoice::Gurobi: return "GUROBI";
            case global::SolverChoice::HiGHS:  return "HIGHS";
        }
        return "SCIP";
    }

    /**
     * Creates a new solver instance for the scenario and passes the time limit and
     * the backend specific parameters.
     * @throws ConfigurationError if the selected backend is not available in the linked OR-Tools version
     */
    inline std::unique_ptr<operations_research::MPSolver> create_solver(const ScenarioSpec& scenario) {
        using operations_research::MPSolver;
        const std::string id = solver_id(scenario.solver);
        std::unique_ptr<MPSolver> solver( MPSolver::CreateSolver(id) );
        if (!solver) {
            throw ConfigurationError(id + " solver unavailable.");
        }
        if (scenario.solver_time_limit > 0.0) {
            solver->SetTimeLimit( absl::Milliseconds( static_cast<std::int64_t>(scenario.solver_time_limit * 1000.0) ) );
        }
        if (!scenario.solver_parameters.empty()) {
            if (!solver->SetSolverSpecificParametersAsString(scenario.solver_parameters)) {
                std::cerr << "Warning: The solver parameters '" << scenario.solver_parameters << "' are not accepted by the " << id << " solver." << std::endl;
            }
        }
        return solver;
    }

    inline std::string status_to_string(operations_research::MPSolver::ResultStatus status) {
        using operations_research::MPSolver;
        switch (status) {
            case MPSolver::OPTIMAL:         return "OPTIMAL";
            case MPSolver::FEASIBLE:        return "FEASIBLE";
            case MPSolver::INFEASIBLE:      return "INFEASIBLE";
            case MPSolver::UNBOUNDED:       return "UNBOUNDED";
            case MPSolver::ABNORMAL:        return "ABNORMAL";
            case MPSolver::MODEL_INVALID:   return "MODEL_INVALID";
            case MPSolver::NOT_SOLVED:      return "NOT_SOLVED";
        }
        return "UNKNOWN";
    }

}

#endif

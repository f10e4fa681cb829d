/*
 * errors.h
 *
 * Exception classes thrown by the tariff compiler,
 * the input validation and the horizon orchestrator.
 */

#ifndef ERRORS_H
#define ERRORS_H

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace results {
    struct SimulationResults;
}

/**
 * Raised if a required input is missing, a value is out of its valid range
 * or an asset is enabled with a contradictory combination of settings.
 * It is always raised before any optimization model is built.
 */
class ConfigurationError : public std::runtime_error {
    public:
        explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Raised by the rate profile compiler if a rate table does not cover
 * all required hours or a season cross-reference is inconsistent.
 */
class CompilationError : public std::runtime_error {
    public:
        explicit CompilationError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Raised if the solver does not report an optimal solution for one window.
 * It carries the results of all windows that have been solved before.
 */
class SolveError : public std::runtime_error {
    public:
        SolveError(const std::string& msg,
                   const std::string& window_,
                   const std::string& solver_status_,
                   std::shared_ptr<const results::SimulationResults> partial_results_)
            : std::runtime_error(msg),
              window(window_),
              solver_status(solver_status_),
              partial_results(std::move(partial_results_))
        {}

        const std::string& get_window() const { return window; } ///< Description of the failing window, e.g. "2023-03-05"
        const std::string& get_solver_status() const { return solver_status; }
        /**
         * Returns the results of the windows solved before the failing one.
         * Can be NULL if the first window already failed.
         */
        std::shared_ptr<const results::SimulationResults> get_partial_results() const { return partial_results; }

    private:
        std::string window;
        std::string solver_status;
        std::shared_ptr<const results::SimulationResults> partial_results;
};

#endif

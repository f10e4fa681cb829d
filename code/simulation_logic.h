/*
 * simulation_logic.h
 *
 * This contains all functions required for running the
 * optimization of one scenario (or one sensitivity case),
 * i.e., the loop over all optimization windows of the scenario year.
 *
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

#include "postprocessing.h"
#include "rate_profiles.h"
#include "results.h"
#include "run_specification.h"

namespace sensitivity {
    struct SensitivityDefinition;
}

namespace simulation {

    /*!
     * Everything that is known after one run has finished
     */
    struct CaseResults {
        RunSpecs specs;
        tariffs::CompiledTariff compiled;
        std::shared_ptr<results::SimulationResults> results;
        postprocessing::ElectricityBill bill;
        std::vector<postprocessing::InvestmentCost> investment;
    };

    /**
     * Runs the optimization for all windows of the scenario year in chronological order.
     * The battery state of charge is carried from one window to the next one, and for the
     * DAY horizon also the peak demand per monthly demand charge period (reset at a new month).
     *
     * @param output_prefix The prefix for stdout information. If not empty, the progress is not written to stdout.
     *
     * @throws SolveError if a window is not solved to optimality. It carries the results of all windows before.
     */
    std::shared_ptr<results::SimulationResults> run_windows(const RunSpecs& specs,
                                                            const tariffs::CompiledTariff& compiled,
                                                            const char* output_prefix = "");

    /**
     * Runs the complete pipeline for one set of inputs:
     * validation, tariff compilation, the loop over all windows and the post-processing.
     *
     * @throws ConfigurationError, CompilationError or SolveError
     */
    CaseResults run_case(const RunInputs& inputs, const char* output_prefix = "");

    /**
     * Runs the complete optimization for a given scenario.
     * If a sensitivity analysis is given, all cases of the sweep are run instead.
     * It also initializes the output directory of the scenario and writes all results.
     *
     * @param inputs The raw inputs of the scenario
     * @param scenario_id scenario id to use
     * @param sweep (optional, default NULL) The sensitivity analysis to run
     *
     * @return false, if writing the output fails or a case of the sensitivity analysis failed, otherwise true
     * @throws ConfigurationError, CompilationError or SolveError if the (single) run fails
     */
    bool runCompleteSimulation(const RunInputs& inputs, unsigned long scenario_id, const sensitivity::SensitivityDefinition* sweep = NULL);


    /**
     * Runs a complete optimization while the status output is active and maps all errors to return codes.
     * The status updater thread is stopped and ncurses is shut down in every case.
     *
     * @param run The optimization, returns false if it was not successful
     *
     * @return 0 on success, 3 if the run failed or a solve error or any other exception occured,
     *         4 for errors in the configuration or the tariff
     */
    int run_with_status_output(const std::function<bool()>& run);

}

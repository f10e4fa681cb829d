/*
 * sensitivity_analysis.h
 *
 * This file contains the definition of a sensitivity analysis,
 * i.e., a sweep over a list of values of one numeric parameter,
 * and the functions to run all cases of it.
 *
 */

#ifndef SENSITIVITY_ANALYSIS_H
#define SENSITIVITY_ANALYSIS_H

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "run_specification.h"
#include "simulation_logic.h"


namespace sensitivity {

    /*!
     * One sensitivity analysis as given in the section "Sensitivity Analysis" of the configuration
     */
    struct SensitivityDefinition {
        int id = 0;
        std::string variable;  ///< "tariff", "demand", "solar" or "storage"
        std::string parameter; ///< The snake_case name of a numeric parameter, e.g. "power_capacity"
        std::vector<double> values;
    };

    /*!
     * One case of a sensitivity analysis. A case is owned by exactly one worker.
     */
    struct SweepCase {
        std::string key;  ///< "{variable}_{parameter}_{value}"
        double value = 0.0;
        RunInputs inputs; ///< Copy of the base inputs with the value applied
        std::optional<simulation::CaseResults> result;
        std::string error_message; ///< Only set if the case failed
    };

    /*!
     * The merged results of all cases
     */
    struct SensitivityResults {
        std::map<std::string, simulation::CaseResults> cases;
        std::vector<std::pair<std::string, std::string>> failed; ///< Case key and error message
        std::map<std::string, double> values; ///< Value per case key (including the failed cases)
    };

    /**
     * Returns true, if the parameter is known for the variable
     */
    bool is_known_parameter(const std::string& variable, const std::string& parameter);

    /**
     * Sets one parameter of the raw inputs.
     * @throws ConfigurationError if the variable or the parameter is unknown, or the value cannot be assigned (e.g. a negative lifespan)
     */
    void apply_value(RunInputs& inputs, const std::string& variable, const std::string& parameter, double value);

    /**
     * Returns the key of a case, e.g. "storage_power_capacity_5"
     */
    std::string case_key(const SensitivityDefinition& def, double value);

    /**
     * Creates all cases of the sensitivity analysis out of the base inputs.
     * @throws ConfigurationError if the definition is invalid
     */
    std::vector<SweepCase> make_cases(const RunInputs& base, const SensitivityDefinition& def);

    /**
     * Runs one case and stores the results or the error message in the case.
     * Errors of the case are not propagated.
     */
    void run_case(SweepCase& sc);

    /**
     * Runs all cases of the sensitivity analysis. If Global::get_n_threads() is larger than 0,
     * the cases are distributed to the worker threads, otherwise they are run in the calling thread.
     * A failed case is reported and does not stop the other cases.
     *
     * @throws ConfigurationError if the definition is invalid
     */
    SensitivityResults run_sensitivity_analysis(const RunInputs& base, const SensitivityDefinition& def);

}

#endif

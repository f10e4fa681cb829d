/*
 * results.h
 *
 * Contains the results of one run, i.e. the time series results
 * of all solved windows, the tiered energy results and the asset
 * capacities, and the extraction of the values from a solved model.
 *
 */

#ifndef RESULTS_H
#define RESULTS_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "horizon_sets.h"
#include "model_builder.h"
#include "run_specification.h"


namespace results {

    struct TieredResult {
        std::string window;
        unsigned int month = 1;
        unsigned int tier  = 1;
        double energy = 0.0; ///< Energy in this band in kWh
        double price  = 0.0;
    };

    struct WindowSummary {
        std::string window;
        std::string solver_status;
        double objective_value = 0.0;
        int n_variables   = 0;
        int n_constraints = 0;
    };

    /*!
     * Results of all windows solved so far. The time series are appended window by window,
     * thus all columns have the same length (n_timesteps).
     */
    struct SimulationResults {
        int year = 0;
        unsigned int interval_length = 60;
        std::vector<std::string> columns; ///< Column names in output order
        std::map<std::string, std::vector<double>> time_series;
        size_t n_timesteps = 0;
        std::vector<TieredResult> tiered;
        std::vector<WindowSummary> windows;
        double pv_capacity          = 0.0; ///< Fixed capacity in PCM, maximum over all windows in CEM
        double bes_power_capacity   = 0.0;
        double bes_energy_capacity  = 0.0;

        bool has_column(const std::string& name) const { return time_series.contains(name); }
        const std::vector<double>& column(const std::string& name) const { return time_series.at(name); }
        double total_objective_value() const;
    };

    /**
     * Returns the time series columns that exist for the given settings
     */
    std::vector<std::string> time_series_columns(const RunSpecs& specs);

    /**
     * Creates an empty result object with the columns of the given settings
     */
    SimulationResults initialize_results(const RunSpecs& specs);

    /**
     * Appends the values of a solved window to the results.
     */
    void extract_window(SimulationResults& res, const RunSpecs& specs, const horizon::Sets& sets,
                        const model::BuiltModel& built, const std::string& solver_status);

}

#endif

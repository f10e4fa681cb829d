/*
 * output.h
 *
 * This contains all functions for writing the results
 * of a scenario (or of all cases of a sensitivity analysis)
 * to the disk.
 *
 */

#ifndef __OUTPUT_H
#define __OUTPUT_H

#include <filesystem>
#include <string>
#include <vector>

#include "postprocessing.h"
#include "results.h"
#include "run_specification.h"
#include "sensitivity_analysis.h"
#include "simulation_logic.h"


namespace output {

    /**
     * Removes a directory if this already exists and creates a new, empty directory.
     * Missing parent directories are created as well.
     *
     * @return false, if the directory cannot be created
     */
    bool create_dir_del_if_exists(const std::filesystem::path& dirpath);

    /**
     * Returns the output directory of a scenario, i.e., "{output path}/S0001" for scenario 1
     */
    std::filesystem::path scenario_output_dir(unsigned long scenario_id);

    /**
     * Writes all result files of one run into the given directory:
     * time_series_results.csv (if Global::get_ts_output() is set), electricity_bill_results.csv,
     * investment_cost_results.csv (CEM only), tiered_energy_results.csv (only with tiered rates)
     * and parameter-settings.txt.
     *
     * @return false, if one of the files cannot be written
     */
    bool write_case_results(const std::filesystem::path& dirpath, const simulation::CaseResults& cr);

    bool write_time_series(const std::filesystem::path& dirpath, const results::SimulationResults& res);
    bool write_electricity_bill(const std::filesystem::path& dirpath, const postprocessing::ElectricityBill& bill);
    bool write_investment_costs(const std::filesystem::path& dirpath, const std::vector<postprocessing::InvestmentCost>& costs);
    bool write_tiered_energy(const std::filesystem::path& dirpath, const results::SimulationResults& res);
    bool write_parameter_settings(const std::filesystem::path& dirpath, const RunSpecs& specs, const results::SimulationResults& res);

    /**
     * Writes one line per case of the sensitivity analysis with the
     * annual bill and the asset capacities into sensitivity_summary.csv.
     */
    bool write_sensitivity_summary(const std::filesystem::path& dirpath, const sensitivity::SensitivityResults& sr);

    /**
     * Writes the run times (in seconds) of the setup and the main run into runtime-information.txt
     */
    bool write_runtime_information(const std::filesystem::path& dirpath, long seconds_setup, long seconds_main_run);

}

#endif

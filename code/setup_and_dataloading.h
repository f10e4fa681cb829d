/*
 *
 * setup_and_dataloading.h
 *
 * Contains all code required for reading the configuration
 * file and loading the profiles from the profile database
 *
 * */

#ifndef SETUP_AND_DATALOADING_H
#define SETUP_AND_DATALOADING_H

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "run_specification.h"
#include "sensitivity_analysis.h"
#include "tariff.h"


/**
 * This namespace contains all functions required for loading
 * the configuration file and the profile database
 **/
namespace configld {

    /**
     * Loads the config file, that is passed as command line argument.
     * The settings of "Default Scenario Values" are read first, then the settings
     * of all scenarios the selected one inherits from (root first) and finally
     * the settings of the selected scenario. Profiles, that are given as table names,
     * are loaded from the profile database afterwards.
     *
     * @param scenario_id The ID of the scenario to load
     * @param filepath Path to the JSON configuration file
     * @param inputs The raw inputs of the scenario are written to this struct
     * @param sensitivity_analyses All definitions of the section "Sensitivity Analysis" are written to this vector
     *
     * @return false, if the file cannot be read or parsed, the scenario is not found or a profile cannot be loaded
     */
    bool load_config_file(unsigned long scenario_id, const std::string& filepath,
                          RunInputs& inputs, std::vector<sensitivity::SensitivityDefinition>& sensitivity_analyses);

    /**
     * Same as load_config_file(), but reads the JSON from a stream.
     * The working directory is not changed.
     */
    bool load_config_from_stream(unsigned long scenario_id, std::istream& json_stream,
                                 RunInputs& inputs, std::vector<sensitivity::SensitivityDefinition>& sensitivity_analyses);

    /**
     * Loads one profile out of a table of the profile database.
     * The table must have the columns (TimestepID, value), the time step IDs must start at 1 without gaps.
     */
    bool load_profile_table(const std::string& db_filepath, const std::string& table, std::vector<double>& values);

    /**
     * Loads a time-stamped profile out of a table with the columns (TimestepID, timestamp, value).
     */
    bool load_timestamped_table(const std::string& db_filepath, const std::string& table, std::vector<TimestampedValue>& values);

    /**
     * @brief Outputs the build information and the run-wide settings to the specified output stream.
     *
     * The output can be redirected to any valid std::ostream, such as:
     * - std::cout (to print to console),
     * - std::ofstream (to write to a file),
     * - std::ostringstream (to capture as a string).
     *
     * @param current_outstream Reference to an output stream where the configuration should be written.
     */
    void output_variable_values(std::ostream& current_outstream);

}




#endif

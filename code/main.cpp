#include <iostream>
#include <fstream>
#include <string>
#include <chrono>
#include <vector>

#define BOOST_BIND_GLOBAL_PLACEHOLDERS
#include <boost/program_options.hpp>

#include "global.h"

#include "output.h"
#include "run_specification.h"
#include "sensitivity_analysis.h"
#include "setup_and_dataloading.h"
#include "simulation_logic.h"

using namespace std;
namespace bpopts = boost::program_options;



namespace {

    /*
     * Parses an on/off command line value, returns false if the value is invalid
     */
    bool parse_on_off(const string& value, bool& result) {
        if (value == "on" || value == "yes") {
            result = true;
            return true;
        } else if (value == "off" || value == "no") {
            result = false;
            return true;
        }
        return false;
    }

}



/**
 * @brief Entry point of the optimization.
 *
 * This function loads the selected scenario and runs the optimization
 * (or the selected sensitivity analysis) based on the provided command line parameters.
 *
 * @param argc Number of command line arguments.
 * @param argv Array of command line argument strings.
 *
 * @return Return code indicating the execution result of the program:
 *   - **0**  Normal execution, no errors occurred
 *   - **1**  Wrong parameters
 *   - **2**  Required file not found / error during database connections
 *   - **3**  Errors during the optimization
 *   - **4**  Erroneous input files
 *   - **5**  No optimization executed (e.g., help displayed)
 */
int main(int argc, char* argv[]) {

	//
	// parsing command line arguments
	//
	unsigned long scenario_id;
    string config_filepath;
    //
    bpopts::options_description opts_desc("Options");
    opts_desc.add_options()
        ("help,h",                            "Show help")
        ("config",   bpopts::value<string>(), "Path to the JSON configuration file")
        ("sensitivity", bpopts::value<int>(), "ID of the sensitivity analysis, that should be run for the selected scenario")
        ("scenario", bpopts::value<unsigned long>(),"ID of the scenario that should be used")
        ("n_threads,n",   bpopts::value<uint>()->default_value(3),    "Number of working threads for the cases of a sensitivity analysis. Defaults to 3. If all cases should be run by the main thread, set this value to 0.")
        ("status-output", bpopts::value<string>()->default_value("off"), "'on' shows the progress and the errors of the sensitivity cases on an ncurses screen, 'off' writes a status line to stdout (default)")
        ("ts-output,t",   bpopts::value<string>()->default_value("on"),  "'off' or 'no' switches off the output of the time series results, 'on' writes them (default)");
    bpopts::positional_options_description opts_desc_pos;
    opts_desc_pos.add("scenario", -1);
    bpopts::variables_map opts_vals;
    try {
        bpopts::command_line_parser parser{argc, argv};
        parser.options(opts_desc).positional(opts_desc_pos);
        bpopts::parsed_options parsed_options = parser.run();
        bpopts::store( parsed_options, opts_vals );
        bpopts::notify(opts_vals);
    } catch (const bpopts::error &err) {
        cerr << "Error when parsing command line arguments:" << "\n";
        cerr << err.what() << endl;
        return 1;
    }
    // now, command line arguments are parsed
    // we now set the internal variables accordingly
    if (opts_vals.count("help") > 0) {
        cerr << opts_desc << endl;
        cerr << "Usage: dercost [-h] [--config PATH] [--sensitivity IDsa] [[--scenario] IDscenario]" << endl;
        return 5;
    }
    if (opts_vals.count("config") > 0) {
        config_filepath = opts_vals["config"].as<string>();
    } else {
        config_filepath = "../config/dercost_config.json";
    }
    if (opts_vals.count("sensitivity") > 0) {
        Global::set_sensitivity_vals(true, opts_vals["sensitivity"].as<int>() );
    } else {
        Global::set_sensitivity_vals(false, 0);
    }
    if (opts_vals.count("scenario") > 0) {
		scenario_id = opts_vals["scenario"].as<unsigned long>();
    } else {
		scenario_id = 1;
    }
    if (opts_vals.count("n_threads") > 0) {
        unsigned int n_threads = opts_vals["n_threads"].as<uint>();
        Global::set_n_threads( n_threads );
        if (n_threads == 1) {
            cerr << "Warning: Defining only 1 working thread is useless, as the main thread will wait until all workers are finished.\nPlease increase the number of working threads or disable multi-threading by setting n_threads to 0." << std::endl;
        }
    }
    bool status_output = false;
    if (!parse_on_off(opts_vals["status-output"].as<string>(), status_output)) {
        cerr << "Error when parsing command line arguments: invalid option for --status-output given!" << endl;
        return 1;
    }
    Global::set_status_output(status_output);
    bool ts_output = true;
    if (!parse_on_off(opts_vals["ts-output"].as<string>(), ts_output)) {
        cerr << "Error when parsing command line arguments: invalid option for --ts-output / -t given!" << endl;
        return 1;
    }
    Global::set_ts_output(ts_output);

    // get time for time measurement
    auto t1 = std::chrono::system_clock::now();
    global::time_of_run_start = t1;

	cout << "Initializing the optimization for scenario ID " << scenario_id << endl;

	//
	// open and parse the config file
	//
    RunInputs inputs;
    vector<sensitivity::SensitivityDefinition> sensitivity_analyses;
	if (!configld::load_config_file(scenario_id, config_filepath, inputs, sensitivity_analyses)) {
		return 2;
	}

    //
    // select the sensitivity analysis
    //
    const sensitivity::SensitivityDefinition* selected_sweep = NULL;
    if (Global::is_sensitivity_analysis()) {
        for (const sensitivity::SensitivityDefinition& def : sensitivity_analyses) {
            if (def.id == Global::get_sensitivity_id()) {
                selected_sweep = &def;
                break;
            }
        }
        if (selected_sweep == NULL) {
            cerr << "Error: Sensitivity analysis with ID " << Global::get_sensitivity_id() << " is not defined in the config file!" << endl;
            return 4;
        }
    }

    //
    // Output all variable values
    //
    configld::output_variable_values(std::cout);

    // get time for time measurement
    auto t2 = std::chrono::system_clock::now();

    //
    // Run the optimization
    // - once (if no sensitivity analysis is selected) or
    // - once per case of the sensitivity analysis
    //
    int return_code = simulation::run_with_status_output([&]() {
        return simulation::runCompleteSimulation(inputs, scenario_id, selected_sweep);
    });
    cout << "\n";
    if (return_code != 0)
        return return_code;

    // get time for time measurement and send the values to the file
    auto t3 = std::chrono::system_clock::now();
    long s_setup = std::chrono::duration_cast<std::chrono::seconds>(t2-t1).count();
    long s_main  = std::chrono::duration_cast<std::chrono::seconds>(t3-t2).count();
    const auto scenario_dir = output::scenario_output_dir(scenario_id);
    if (!output::write_runtime_information(scenario_dir, s_setup, s_main)) {
        return 3;
    }

    //
    // Output all variable values (second time to a file)
    //
    std::ofstream log_file(scenario_dir / "parameter-settings-general.txt");
    configld::output_variable_values(log_file);
    log_file.close();

    cout << "Run-time information:\n";
    cout << "  Setup and data loading: " << s_setup << "s\n";
    cout << "  Main run:               " << s_main  << "s\n";
    cout << "  Complete run time:      " << std::chrono::duration_cast<std::chrono::seconds>(t3-t1).count() << "s" << std::endl;

	return 0;
}

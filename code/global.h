/*
 *
 * global.h
 *
 * Contains the enums shared by all modules and the class Global,
 * where all run-wide settings are stored
 *
 * */

#ifndef GLOBAL_H
#define GLOBAL_H

#include <atomic>
#include <chrono>
#include <string>


/*!
 * Namespace global
 *
 * It contains enums and run-wide counters that might change during
 * the execution (i.e., the counters are used by the status output).
 *
 * Attention: Do not confuse with class Global (mind the capital "G")!
 */
namespace global {

    inline std::chrono::time_point<std::chrono::system_clock> time_of_run_start; ///< The time the main run was started
    inline std::atomic<unsigned long> n_windows_solved{0}; ///< Number of solved optimization windows (over all cases)
    inline std::atomic<unsigned long> n_cases_finished{0}; ///< Number of finished sensitivity cases
    inline std::atomic<unsigned long> n_cases_total{0};    ///< Number of sensitivity cases to run

    /*!
     * This enum defines the problem type.
     * It corresponds to the config variable 'problem type'.
     */
    enum struct ProblemType : short {
        ProductionCost,    ///< PCM: asset sizes are fixed, only the dispatch is optimized
        CapacityExpansion  ///< CEM: asset sizes are decision variables
    };

    /*!
     * This enum defines the length of one optimization window.
     */
    enum struct OptimizationHorizon : short {
        Day,
        Month,
        Year
    };

    /*!
     * The solver backend, that is used by OR-Tools.
     */
    enum struct SolverChoice : short {
        SCIP,
        CBC,
        GLPK,
        Gurobi,
        HiGHS
    };

    /*!
     * Defines, to which time span the bounds of a tiered energy rate refer.
     */
    enum struct TieredBaselineType : short {
        Daily,
        Monthly
    };

    std::string to_string(ProblemType pt);
    std::string to_string(OptimizationHorizon oh);
    std::string to_string(SolverChoice sc);
    std::string to_string(TieredBaselineType tb);

    /*!
     * The string to delimit output sections
     */
    const char* const output_section_delimiter = "*********************************************************************************";

}


/*
 * class Global
 *
 * This class contains all run-wide settings that cannot change
 * after they have been set once (i.e., after LockAllVariables() has been called).
 *
 * Attention: Not to be confused with namespace global (mind the lower case "g").
 */
class Global {
    public:
        static void LockAllVariables();   ///< No (set) variable can be overwritten after this call, unset variables can still be set once
        static void UnlockAllVariables(); ///< All variables can now be overwritten
        //
        // getter methods
        static const std::string& get_input_path()            { return input_path;  }
        static const std::string& get_output_path()           { return output_path; }
        static const std::string& get_profile_database_name() { return profile_database_name; }
        static bool is_profile_database_set()                 { return profile_database_set; }
        static unsigned int get_n_threads()                   { return n_threads; }
        static bool get_status_output()                       { return status_output; } ///< True, if the ncurses status output is selected
        static bool get_ts_output()                           { return ts_output; }     ///< True, if the time series results should be written
        static bool is_sensitivity_analysis()                 { return sensitivity_selected; }
        static int  get_sensitivity_id()                      { return sensitivity_id; }
        //
        // setter methods
        static void set_input_path(const std::string& path);
        static void set_output_path(const std::string& path);
        static void set_profile_database_name(const std::string& fname);
        static void set_n_threads(unsigned int n);
        static void set_status_output(bool value);
        static void set_ts_output(bool value);
        static void set_sensitivity_vals(bool selected, int id);

    private:
        static bool is_locked;
        //
        static std::string input_path;            static bool input_path_set;
        static std::string output_path;           static bool output_path_set;
        static std::string profile_database_name; static bool profile_database_set;
        static unsigned int n_threads;            static bool n_threads_set;
        static bool status_output;                static bool status_output_set;
        static bool ts_output;                    static bool ts_output_set;
        static bool sensitivity_selected;
        static int  sensitivity_id;               static bool sensitivity_vals_set;
};

#endif

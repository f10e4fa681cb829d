#include "global.h"

#include <iostream>
#include <string>

using namespace std;



string global::to_string(ProblemType pt) {
    switch (pt) {
        case ProblemType::ProductionCost:    return "PCM";
        case ProblemType::CapacityExpansion: return "CEM";
    }
    return "unknown";
}

string global::to_string(OptimizationHorizon oh) {
    switch (oh) {
        case OptimizationHorizon::Day:   return "DAY";
        case OptimizationHorizon::Month: return "MONTH";
        case OptimizationHorizon::Year:  return "YEAR";
    }
    return "unknown";
}

string global::to_string(SolverChoice sc) {
    switch (sc) {
        case SolverChoice::SCIP:   return "SCIP";
        case SolverChoice::CBC:    return "CBC";
        case SolverChoice::GLPK:   return "GLPK";
        case SolverChoice::Gurobi: return "GUROBI";
        case SolverChoice::HiGHS:  return "HIGHS";
    }
    return "unknown";
}

string global::to_string(TieredBaselineType tb) {
    switch (tb) {
        case TieredBaselineType::Daily:   return "daily";
        case TieredBaselineType::Monthly: return "monthly";
    }
    return "unknown";
}



// ----------------------------- //
//  Implementation of Global     //
// ----------------------------- //

bool Global::is_locked = false;

string Global::input_path  = "";           bool Global::input_path_set  = false;
string Global::output_path = "";           bool Global::output_path_set = false;
string Global::profile_database_name = ""; bool Global::profile_database_set = false;
unsigned int Global::n_threads = 0;        bool Global::n_threads_set  = false;
bool Global::status_output = false;        bool Global::status_output_set = false;
bool Global::ts_output     = true;         bool Global::ts_output_set  = false;
bool Global::sensitivity_selected = false;
int  Global::sensitivity_id = 0;           bool Global::sensitivity_vals_set = false;

void Global::LockAllVariables() {
    is_locked = true;
}

void Global::UnlockAllVariables() {
    is_locked = false;
}

void Global::set_input_path(const string& path) {
    if (is_locked && input_path_set) {
        cerr << "Input path already set!" << endl;
    } else {
        input_path = path;
        // add a trailing slash, as file names are appended directly
        if (!input_path.empty() && input_path.back() != '/')
            input_path += "/";
        input_path_set = true;
    }
}

void Global::set_output_path(const string& path) {
    if (is_locked && output_path_set) {
        cerr << "Output path already set!" << endl;
    } else {
        output_path = path;
        output_path_set = true;
    }
}

void Global::set_profile_database_name(const string& fname) {
    if (is_locked && profile_database_set) {
        cerr << "Profile database name already set!" << endl;
    } else {
        profile_database_name = fname;
        profile_database_set  = true;
    }
}

void Global::set_n_threads(unsigned int n) {
    if (is_locked && n_threads_set) {
        cerr << "Number of threads already set!" << endl;
    } else {
        n_threads = n;
        n_threads_set = true;
    }
}

void Global::set_status_output(bool value) {
    if (is_locked && status_output_set) {
        cerr << "Status output mode already set!" << endl;
    } else {
        status_output = value;
        status_output_set = true;
    }
}

void Global::set_ts_output(bool value) {
    if (is_locked && ts_output_set) {
        cerr << "Time series output mode already set!" << endl;
    } else {
        ts_output = value;
        ts_output_set = true;
    }
}

void Global::set_sensitivity_vals(bool selected, int id) {
    if (is_locked && sensitivity_vals_set) {
        cerr << "Values for the sensitivity analysis are already set!" << endl;
    } else {
        sensitivity_selected = selected;
        sensitivity_id       = id;
        sensitivity_vals_set = true;
    }
}

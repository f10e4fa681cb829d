#include "sensitivity_analysis.h"

#include <cmath>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "errors.h"
#include "global.h"
#include "helper.h"
#include "status_output.hpp"
#include "worker_threads.hpp"

using namespace std;
using namespace sensitivity;



namespace {

    //
    // The numeric parameters that can be varied, per variable
    const map<string, optional<double> TariffInput::*> tariff_parameters = {
        {"nem_non_bypassable_charge", &TariffInput::nem_non_bypassable_charge},
        {"customer_charge_daily",     &TariffInput::customer_charge_daily},
        {"customer_charge_monthly",   &TariffInput::customer_charge_monthly},
        {"all_charge_scaling",        &TariffInput::all_charge_scaling},
        {"energy_charge_scaling",     &TariffInput::energy_charge_scaling},
        {"demand_charge_scaling",     &TariffInput::demand_charge_scaling},
        {"tou_energy_charge_scaling", &TariffInput::tou_energy_charge_scaling}
    };
    const map<string, optional<double> DemandInput::*> demand_parameters = {
        {"shift_percent",      &DemandInput::shift_percent},
        {"shift_duration",     &DemandInput::shift_duration},
        {"shift_up_cost",      &DemandInput::shift_up_cost},
        {"shift_down_cost",    &DemandInput::shift_down_cost},
        {"value_of_lost_load", &DemandInput::value_of_lost_load}
    };
    const map<string, optional<double> SolarInput::*> solar_parameters = {
        {"power_capacity",         &SolarInput::power_capacity},
        {"maximum_power_capacity", &SolarInput::maximum_power_capacity},
        {"capital_cost",           &SolarInput::capital_cost},
        {"fixed_om_cost",          &SolarInput::fixed_om_cost},
        {"inverter_eff",           &SolarInput::inverter_eff},
        {"investment_tax_credit",  &SolarInput::investment_tax_credit},
        {"linked_cost_scaling",    &SolarInput::linked_cost_scaling}
    };
    const map<string, optional<double> StorageInput::*> storage_parameters = {
        {"power_capacity",          &StorageInput::power_capacity},
        {"energy_capacity",         &StorageInput::energy_capacity},
        {"duration",                &StorageInput::duration},
        {"maximum_power_capacity",  &StorageInput::maximum_power_capacity},
        {"maximum_energy_capacity", &StorageInput::maximum_energy_capacity},
        {"soc_min",                 &StorageInput::soc_min},
        {"soc_max",                 &StorageInput::soc_max},
        {"soc_initial",             &StorageInput::soc_initial},
        {"charge_eff",              &StorageInput::charge_eff},
        {"discharge_eff",           &StorageInput::discharge_eff},
        {"loss_rate",               &StorageInput::loss_rate},
        {"power_capital_cost",      &StorageInput::power_capital_cost},
        {"fixed_om_cost",           &StorageInput::fixed_om_cost},
        {"investment_tax_credit",   &StorageInput::investment_tax_credit},
        {"linked_cost_scaling",     &StorageInput::linked_cost_scaling}
    };

    unsigned int to_unsigned(const string& parameter, double value) {
        if (value < 0.0 || value != std::floor(value))
            throw ConfigurationError("The value " + format_number(value) + " of the parameter '" + parameter + "' is not a non-negative integer.");
        return static_cast<unsigned int>(value);
    }

    template <typename InputT>
    bool set_member(const map<string, optional<double> InputT::*>& members, InputT& input, const string& parameter, double value) {
        auto it = members.find(parameter);
        if (it == members.end())
            return false;
        input.*(it->second) = value;
        return true;
    }

}


bool sensitivity::is_known_parameter(const string& variable, const string& parameter) {
    if (variable == "tariff")
        return tariff_parameters.contains(parameter) || parameter == "nem_version";
    if (variable == "demand")
        return demand_parameters.contains(parameter);
    if (variable == "solar")
        return solar_parameters.contains(parameter) || parameter == "lifespan";
    if (variable == "storage")
        return storage_parameters.contains(parameter) || parameter == "lifespan";
    return false;
}


void sensitivity::apply_value(RunInputs& inputs, const string& variable, const string& parameter, double value) {
    if (variable == "tariff") {
        if (parameter == "nem_version") {
            inputs.tariff.nem_version = static_cast<int>(to_unsigned(parameter, value));
            return;
        }
        if (set_member(tariff_parameters, inputs.tariff, parameter, value))
            return;
    } else if (variable == "demand") {
        if (set_member(demand_parameters, inputs.demand, parameter, value))
            return;
    } else if (variable == "solar") {
        if (parameter == "lifespan") {
            inputs.solar.lifespan = to_unsigned(parameter, value);
            return;
        }
        if (set_member(solar_parameters, inputs.solar, parameter, value))
            return;
    } else if (variable == "storage") {
        if (parameter == "lifespan") {
            inputs.storage.lifespan = to_unsigned(parameter, value);
            return;
        }
        if (set_member(storage_parameters, inputs.storage, parameter, value))
            return;
    } else {
        throw ConfigurationError("Unknown sensitivity variable '" + variable + "'. Allowed are tariff, demand, solar and storage.");
    }
    throw ConfigurationError("Unknown sensitivity parameter '" + parameter + "' for the variable '" + variable + "'.");
}


string sensitivity::case_key(const SensitivityDefinition& def, double value) {
    return def.variable + "_" + def.parameter + "_" + format_number(value);
}


vector<SweepCase> sensitivity::make_cases(const RunInputs& base, const SensitivityDefinition& def) {
    if (def.values.empty())
        throw ConfigurationError("The sensitivity analysis with ID " + to_string(def.id) + " has no values.");
    vector<SweepCase> cases;
    cases.reserve(def.values.size());
    map<string, bool> known_keys;
    for (double v : def.values) {
        SweepCase sc;
        sc.key    = case_key(def, v);
        sc.value  = v;
        sc.inputs = base;
        apply_value(sc.inputs, def.variable, def.parameter, v);
        if (known_keys.contains(sc.key)) {
            cerr << "Warning: The value " << format_number(v) << " is given more than once in the sensitivity analysis with ID " << def.id << ". It is only run once." << endl;
            continue;
        }
        known_keys[sc.key] = true;
        cases.push_back(std::move(sc));
    }
    return cases;
}


void sensitivity::run_case(SweepCase& sc) {
    const string prefix = "[" + sc.key + "] ";
    try {
        sc.result = simulation::run_case(sc.inputs, prefix.c_str());
    } catch (const ConfigurationError& e) {
        sc.error_message = string("Configuration error: ") + e.what();
    } catch (const CompilationError& e) {
        sc.error_message = string("Tariff compilation error: ") + e.what();
    } catch (const SolveError& e) {
        sc.error_message = string("Solve error in window ") + e.get_window() + " (" + e.get_solver_status() + "): " + e.what();
    } catch (const std::exception& e) {
        sc.error_message = string("Unexpected error: ") + e.what();
    }
    if (!sc.error_message.empty())
        StatusOutput::report_error("Error " + prefix + sc.error_message);
    global::n_cases_finished++;
}


SensitivityResults sensitivity::run_sensitivity_analysis(const RunInputs& base, const SensitivityDefinition& def) {
    vector<SweepCase> cases = make_cases(base, def);
    global::n_cases_total    = cases.size();
    global::n_cases_finished = 0;

    cout << "Run sensitivity analysis " << def.id << " (" << def.variable << " " << def.parameter << ") with " << cases.size() << " case(s) ..." << endl;

    if (Global::get_n_threads() == 0) {
        for (SweepCase& sc : cases)
            run_case(sc);
    } else {
        SweepThreadGroupManager thread_manager(cases);
        thread_manager.startAllWorkerThreads();
        thread_manager.executeAllCases();
        if (!thread_manager.waitForWorkersToFinish())
            cerr << "Warning: At least one case of the sensitivity analysis " << def.id << " failed." << endl;
        thread_manager.stopAllWorkerThreads();
    }

    //
    // merge the results by key
    SensitivityResults sr;
    for (SweepCase& sc : cases) {
        sr.values[sc.key] = sc.value;
        if (sc.result.has_value()) {
            sr.cases.emplace(sc.key, std::move(sc.result.value()));
        } else {
            sr.failed.emplace_back(sc.key, sc.error_message);
        }
    }
    cout << "... sensitivity analysis finished (" << sr.cases.size() << " succeeded, " << sr.failed.size() << " failed)." << "\n";
    cout << global::output_section_delimiter << endl;
    return sr;
}

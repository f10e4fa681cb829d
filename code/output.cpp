
#include "output.h"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>

#include "global.h"
#include "helper.h"

using namespace std;
using namespace output;


namespace {

    /*
     * Opens an output file and reports an error if this is not possible
     */
    bool open_output(ofstream& ofs, const filesystem::path& fpath) {
        ofs.open(fpath, std::ofstream::out);
        if (!ofs.is_open()) {
            cerr << "Error when opening output file " << fpath << endl;
            return false;
        }
        ofs << setprecision(10);
        return true;
    }

    const char* const bill_header = "period,energy_charge,tiered_charge,demand_charge,customer_charge,nem_revenue,non_bypassable_charge,total";

    void write_bill_line(ofstream& ofs, const string& period, const postprocessing::BillComponents& bc) {
        ofs << period << "," << bc.energy_charge << "," << bc.tiered_charge << "," << bc.demand_charge << ","
            << bc.customer_charge << "," << bc.nem_revenue << "," << bc.non_bypassable_charge << "," << bc.total() << "\n";
    }

}


bool output::create_dir_del_if_exists(const filesystem::path& dirpath) {
    error_code ec;
    // check if dir exists
    if (filesystem::is_directory(dirpath, ec)) {
        // if yes, delete it
        filesystem::remove_all(dirpath, ec);
        if (ec) {
            cerr << "Error when deleting the old output directory " << dirpath << ": " << ec.message() << endl;
            return false;
        }
    }
    // now, actually create output dir (maybe again)
    filesystem::create_directories(dirpath, ec);
    if (ec) {
        cerr << "Error when creating the output directory " << dirpath << ": " << ec.message() << endl;
        return false;
    }
    return true;
}


filesystem::path output::scenario_output_dir(unsigned long scenario_id) {
    filesystem::path dirpath = Global::get_output_path();
    stringstream current_scenario_str;
    current_scenario_str << "S";
    current_scenario_str << setw(4) << setfill('0') << scenario_id;
    dirpath /= current_scenario_str.str();
    return dirpath;
}


bool output::write_case_results(const filesystem::path& dirpath, const simulation::CaseResults& cr) {
    bool ok = true;
    if (Global::get_ts_output())
        ok = write_time_series(dirpath, *cr.results) && ok;
    ok = write_electricity_bill(dirpath, cr.bill) && ok;
    if (cr.specs.scenario.is_capacity_expansion())
        ok = write_investment_costs(dirpath, cr.investment) && ok;
    if (cr.specs.tariff.has_tiered_rates())
        ok = write_tiered_energy(dirpath, *cr.results) && ok;
    ok = write_parameter_settings(dirpath, cr.specs, *cr.results) && ok;
    return ok;
}


bool output::write_time_series(const filesystem::path& dirpath, const results::SimulationResults& res) {
    ofstream ofs;
    if (!open_output(ofs, dirpath / "time_series_results.csv"))
        return false;
    //
    // header
    ofs << "timestamp";
    for (const string& c : res.columns)
        ofs << "," << c;
    ofs << "\n";
    //
    // one line per time step
    vector<const vector<double>*> cols;
    cols.reserve(res.columns.size());
    for (const string& c : res.columns)
        cols.push_back(&res.column(c));
    for (size_t t = 0; t < res.n_timesteps; t++) {
        ofs << format_datetime( timestep_to_datetime(res.year, res.interval_length, t) );
        for (const vector<double>* col : cols)
            ofs << "," << (*col)[t];
        ofs << "\n";
    }
    ofs.close();
    return true;
}


bool output::write_electricity_bill(const filesystem::path& dirpath, const postprocessing::ElectricityBill& bill) {
    ofstream ofs;
    if (!open_output(ofs, dirpath / "electricity_bill_results.csv"))
        return false;
    ofs << bill_header << "\n";
    for (unsigned int m = 1; m <= 12; m++)
        write_bill_line(ofs, to_string(m), bill.monthly[m - 1]);
    write_bill_line(ofs, "annual", bill.annual);
    ofs.close();
    return true;
}


bool output::write_investment_costs(const filesystem::path& dirpath, const vector<postprocessing::InvestmentCost>& costs) {
    ofstream ofs;
    if (!open_output(ofs, dirpath / "investment_cost_results.csv"))
        return false;
    ofs << "asset,capacity,capital_cost_per_kw,total_capital_cost,amortized_capital_cost,"
           "om_cost_per_kw_year,total_om_cost,itc_rate,total_itc,amortized_itc\n";
    for (const postprocessing::InvestmentCost& ic : costs) {
        ofs << ic.asset << "," << ic.capacity << "," << ic.capital_cost_per_kw << "," << ic.total_capital_cost << ","
            << ic.amortized_capital_cost << "," << ic.om_cost_per_kw_year << "," << ic.total_om_cost << ","
            << ic.itc_rate << "," << ic.total_itc << "," << ic.amortized_itc << "\n";
    }
    ofs.close();
    return true;
}


bool output::write_tiered_energy(const filesystem::path& dirpath, const results::SimulationResults& res) {
    ofstream ofs;
    if (!open_output(ofs, dirpath / "tiered_energy_results.csv"))
        return false;
    ofs << "window,month,tier,energy,price\n";
    for (const results::TieredResult& tr : res.tiered)
        ofs << tr.window << "," << tr.month << "," << tr.tier << "," << tr.energy << "," << tr.price << "\n";
    ofs.close();
    return true;
}


bool output::write_parameter_settings(const filesystem::path& dirpath, const RunSpecs& specs, const results::SimulationResults& res) {
    ofstream ofs;
    if (!open_output(ofs, dirpath / "parameter-settings.txt"))
        return false;
    time_t current_time = time(nullptr);
    ofs << "Results written at " << put_time(localtime(&current_time), "%F %T") << "\n";
    ofs << "Build at " << __DATE__ << " " << __TIME__ << ", C++ standard = " << __cplusplus << "\n\n";
    output_run_specs(specs, ofs);
    ofs << "\n";
    ofs << "Solved windows: " << res.windows.size() << "\n";
    ofs << "Sum of the objective values: " << res.total_objective_value() << "\n";
    ofs.close();
    return true;
}


bool output::write_sensitivity_summary(const filesystem::path& dirpath, const sensitivity::SensitivityResults& sr) {
    ofstream ofs;
    if (!open_output(ofs, dirpath / "sensitivity_summary.csv"))
        return false;
    ofs << "case,value,annual_bill,pv_capacity,bes_power_capacity,bes_energy_capacity\n";
    for (const auto& [key, cr] : sr.cases) {
        ofs << key << "," << sr.values.at(key) << "," << cr.bill.total() << "," << cr.results->pv_capacity << ","
            << cr.results->bes_power_capacity << "," << cr.results->bes_energy_capacity << "\n";
    }
    for (const auto& [key, msg] : sr.failed)
        ofs << key << "," << sr.values.at(key) << ",failed,,,\n";
    ofs.close();
    return true;
}


bool output::write_runtime_information(const filesystem::path& dirpath, long seconds_setup, long seconds_main_run) {
    ofstream ofs;
    if (!open_output(ofs, dirpath / "runtime-information.txt"))
        return false;
    ofs << "Setup and data loading: " << seconds_setup << "s\n";
    ofs << "Main run:               " << seconds_main_run << "s\n";
    ofs << "Solved windows:         " << global::n_windows_solved.load() << "\n";
    ofs.close();
    return true;
}

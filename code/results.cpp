#include "results.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace std;
using namespace results;



double SimulationResults::total_objective_value() const {
    double sum = 0.0;
    for (const WindowSummary& w : windows)
        sum += w.objective_value;
    return sum;
}


vector<string> results::time_series_columns(const RunSpecs& specs) {
    vector<string> cols = {"demand", "net_demand", "energy_prices"};
    if (specs.exports_enabled()) {
        cols.push_back("net_exports");
        cols.push_back("export_prices");
    }
    if (specs.solar.enabled) {
        cols.push_back("pv_generation_btm");
        if (specs.solar_exports())
            cols.push_back("pv_generation_export");
    }
    if (specs.storage.enabled) {
        cols.push_back("bes_state_of_charge");
        cols.push_back("bes_charging");
        cols.push_back("bes_discharging_btm");
        if (specs.storage_exports())
            cols.push_back("bes_discharging_export");
    }
    if (specs.demand.simple_shift_enabled) {
        cols.push_back("ssd_up_deviations");
        cols.push_back("ssd_down_deviations");
    }
    if (specs.demand.shed_enabled)
        cols.push_back("shed_demand");
    return cols;
}


SimulationResults results::initialize_results(const RunSpecs& specs) {
    SimulationResults res;
    res.year            = specs.scenario.year;
    res.interval_length = specs.scenario.interval_length;
    res.columns         = time_series_columns(specs);
    for (const string& c : res.columns)
        res.time_series[c] = vector<double>();
    if (!specs.scenario.is_capacity_expansion()) {
        if (specs.solar.enabled)
            res.pv_capacity = specs.solar.power_capacity.value_or(0.0);
        if (specs.storage.enabled) {
            res.bes_power_capacity  = specs.storage.power_capacity.value_or(0.0);
            res.bes_energy_capacity = specs.storage.energy_capacity.value_or(0.0);
        }
    }
    return res;
}


void results::extract_window(SimulationResults& res, const RunSpecs& specs, const horizon::Sets& sets,
                             const model::BuiltModel& built, const string& solver_status)
{
    const model::DecisionModel& dm          = *built.model;
    const model::ExpressionAccumulator& acc = built.expressions;
    const size_t T = sets.T;

    auto append = [&](const string& name, const vector<double>& values) -> void {
        vector<double>& col = res.time_series[name];
        col.insert(col.end(), values.begin(), values.end());
    };

    append("demand", sets.demand);
    vector<double> net_demand(T);
    for (size_t t = 0; t < T; t++)
        net_demand[t] = acc.net_demand[t].SolutionValue();
    append("net_demand", net_demand);
    append("energy_prices", sets.energy_prices);
    if (acc.exports_enabled) {
        vector<double> exports(T);
        for (size_t t = 0; t < T; t++)
            exports[t] = acc.exports[t].SolutionValue();
        append("net_exports", exports);
        append("export_prices", sets.nem_prices);
    }
    if (specs.solar.enabled) {
        append("pv_generation_btm", dm.series_values("p_pv_btm"));
        if (specs.solar_exports())
            append("pv_generation_export", dm.series_values("p_pv_exp"));
        if (dm.has_scalar("pv_capacity"))
            res.pv_capacity = std::max(res.pv_capacity, dm.scalar_value("pv_capacity"));
    }
    if (specs.storage.enabled) {
        append("bes_state_of_charge", dm.series_values("e_bes_soc"));
        append("bes_charging",        dm.series_values("p_bes_ch"));
        append("bes_discharging_btm", dm.series_values("p_bes_dis_btm"));
        if (specs.storage_exports())
            append("bes_discharging_export", dm.series_values("p_bes_dis_exp"));
        if (dm.has_scalar("bes_power_capacity")) {
            res.bes_power_capacity  = std::max(res.bes_power_capacity,  dm.scalar_value("bes_power_capacity"));
            res.bes_energy_capacity = std::max(res.bes_energy_capacity, dm.scalar_value("bes_energy_capacity"));
        }
    }
    if (specs.demand.simple_shift_enabled) {
        append("ssd_up_deviations",   dm.series_values("d_dev_up"));
        append("ssd_down_deviations", dm.series_values("d_dev_down"));
    }
    if (specs.demand.shed_enabled)
        append("shed_demand", dm.series_values("d_shed"));
    res.n_timesteps += T;

    //
    // tiered energy
    for (const horizon::WindowTierBand& band : sets.tier_bands) {
        const string name = "e_tier_" + to_string(band.month) + "_" + to_string(band.tier);
        if (!dm.has_scalar(name))
            continue;
        TieredResult tr;
        tr.window = sets.window.description;
        tr.month  = band.month;
        tr.tier   = band.tier;
        tr.energy = dm.scalar_value(name);
        tr.price  = band.price;
        res.tiered.push_back(tr);
    }

    WindowSummary ws;
    ws.window          = sets.window.description;
    ws.solver_status   = solver_status;
    ws.objective_value = dm.objective_value();
    ws.n_variables     = dm.n_variables();
    ws.n_constraints   = dm.n_constraints();
    res.windows.push_back(ws);
}

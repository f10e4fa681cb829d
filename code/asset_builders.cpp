#include "asset_builders.h"

#include <string>
#include <vector>

using namespace std;
using namespace model;
using operations_research::LinearExpr;



void model::build_solar(DecisionModel& dm, const RunSpecs& specs, const horizon::Sets& sets, ExpressionAccumulator& acc) {
    const SolarSpec& solar = specs.solar;
    const size_t T         = sets.T;
    const double infinity  = dm.infinity();
    const bool cem         = specs.scenario.is_capacity_expansion();
    const bool exports     = specs.solar_exports();

    MPVariable* capacity_var = NULL;
    double capacity_bound    = 0.0; // upper bound of the capacity (for the exports linkage)
    if (cem) {
        capacity_bound = solar.maximum_power_capacity.value_or(infinity);
        capacity_var   = dm.make_scalar("pv_capacity", 0.0, capacity_bound);
    } else {
        capacity_bound = solar.power_capacity.value();
    }

    const vector<MPVariable*>& p_btm = dm.make_series("p_pv_btm", T, 0.0, infinity);
    const vector<MPVariable*>* p_exp = NULL;
    if (exports)
        p_exp = &dm.make_series("p_pv_exp", T, 0.0, infinity);

    for (size_t t = 0; t < T; t++) {
        const string tstr = to_string(t);
        LinearExpr generation(p_btm[t]);
        if (p_exp != NULL)
            generation += LinearExpr((*p_exp)[t]);
        const double available = sets.capacity_factor[t] * solar.inverter_eff;
        if (cem) {
            dm.add_constraint(generation - available * LinearExpr(capacity_var) <= 0.0, "pv_generation_limit_" + tstr);
        } else {
            dm.add_constraint(generation <= available * capacity_bound, "pv_generation_limit_" + tstr);
        }
        acc.net_demand[t] -= LinearExpr(p_btm[t]);
        if (p_exp != NULL)
            acc.exports[t] += LinearExpr((*p_exp)[t]);
    }
    if (p_exp != NULL)
        acc.exports_upper_bound += capacity_bound * solar.inverter_eff;
}


void model::build_storage(DecisionModel& dm, const RunSpecs& specs, const horizon::Sets& sets, ExpressionAccumulator& acc) {
    const StorageSpec& bes = specs.storage;
    const size_t T         = sets.T;
    const double infinity  = dm.infinity();
    const double dt        = sets.dt;
    const bool cem         = specs.scenario.is_capacity_expansion();
    const bool exports     = specs.storage_exports();

    //
    // power and energy capacity: constants in PCM, variables in CEM
    LinearExpr power;
    LinearExpr energy;
    double power_bound = 0.0; // upper bound of the power capacity
    if (cem) {
        power_bound = bes.maximum_power_capacity.value_or(infinity);
        MPVariable* p_cap = dm.make_scalar("bes_power_capacity",  0.0, power_bound);
        MPVariable* e_cap = dm.make_scalar("bes_energy_capacity", 0.0, bes.maximum_energy_capacity.value_or(infinity));
        power  = LinearExpr(p_cap);
        energy = LinearExpr(e_cap);
        if (bes.duration.has_value()) {
            dm.add_constraint(energy == bes.duration.value() * power, "bes_duration");
        }
    } else {
        power_bound = bes.power_capacity.value();
        power  = LinearExpr(power_bound);
        energy = LinearExpr(bes.energy_capacity.value());
    }
    // in CEM, the power variables are bound by constraints
    const double var_bound = cem ? infinity : power_bound;

    const vector<MPVariable*>& p_ch      = dm.make_series("p_bes_ch",      T, 0.0, var_bound);
    const vector<MPVariable*>& p_dis_btm = dm.make_series("p_bes_dis_btm", T, 0.0, var_bound);
    const vector<MPVariable*>* p_dis_exp = NULL;
    if (exports)
        p_dis_exp = &dm.make_series("p_bes_dis_exp", T, 0.0, var_bound);
    const vector<MPVariable*>& e_soc     = dm.make_series("e_bes_soc", T, -infinity, infinity);
    const vector<MPVariable*>* p_pv_btm  = NULL;
    if (bes.nonimport)
        p_pv_btm = &dm.series("p_pv_btm");

    const double retention = 1.0 - bes.loss_rate;
    for (size_t t = 0; t < T; t++) {
        const string tstr = to_string(t);
        LinearExpr discharge(p_dis_btm[t]);
        if (p_dis_exp != NULL)
            discharge += LinearExpr((*p_dis_exp)[t]);
        //
        // power limits
        if (cem)
            dm.add_constraint(LinearExpr(p_ch[t]) - power <= 0.0, "bes_charge_limit_" + tstr);
        if (cem || p_dis_exp != NULL)
            dm.add_constraint(discharge - power <= 0.0, "bes_discharge_limit_" + tstr);
        if (p_pv_btm != NULL)
            dm.add_constraint(LinearExpr(p_ch[t]) - LinearExpr((*p_pv_btm)[t]) <= 0.0, "bes_nonimport_" + tstr);
        //
        // state of charge bounds
        dm.add_constraint(LinearExpr(e_soc[t]) - bes.soc_min * energy >= 0.0, "bes_soc_min_" + tstr);
        dm.add_constraint(LinearExpr(e_soc[t]) - bes.soc_max * energy <= 0.0, "bes_soc_max_" + tstr);
        //
        // state of charge dynamics
        LinearExpr previous = (t == 0) ? (retention * sets.bes_initial_soc) * energy
                                       : retention * LinearExpr(e_soc[t - 1]);
        dm.add_constraint(
            LinearExpr(e_soc[t]) == previous + (dt * bes.charge_eff) * LinearExpr(p_ch[t]) - (dt / bes.discharge_eff) * discharge,
            "bes_soc_balance_" + tstr
        );
        //
        // shared expressions
        acc.net_demand[t] += LinearExpr(p_ch[t]);
        acc.net_demand[t] -= LinearExpr(p_dis_btm[t]);
        acc.net_demand_upper_bound[t] += power_bound;
        if (p_dis_exp != NULL)
            acc.exports[t] += LinearExpr((*p_dis_exp)[t]);
    }
    // terminal guard: do not drain the energy that belongs to the next window
    if (T > 0)
        dm.add_constraint(LinearExpr(e_soc[T - 1]) - sets.bes_initial_soc * energy >= 0.0, "bes_terminal_soc");
    if (p_dis_exp != NULL)
        acc.exports_upper_bound += power_bound;
}


void model::build_shiftable_demand(DecisionModel& dm, const RunSpecs& specs, const horizon::Sets& sets, ExpressionAccumulator& acc) {
    const DemandSpec& demand = specs.demand;
    const size_t T = sets.T;
    const double dt = sets.dt;

    vector<double> zeros(T, 0.0);
    vector<double> down_bound(T, 0.0);
    for (size_t t = 0; t < T; t++)
        down_bound[t] = -sets.shift_down_capacity[t];
    const vector<MPVariable*>& d_up   = dm.make_series("d_dev_up",   zeros, sets.shift_up_capacity);
    const vector<MPVariable*>& d_down = dm.make_series("d_dev_down", zeros, down_bound);

    vector<LinearExpr> deviation(T);
    LinearExpr total;
    LinearExpr up_energy;
    LinearExpr down_energy;
    for (size_t t = 0; t < T; t++) {
        deviation[t] = LinearExpr(d_up[t]) - LinearExpr(d_down[t]);
        total       += deviation[t];
        up_energy   += LinearExpr(d_up[t]);
        down_energy += LinearExpr(d_down[t]);
        acc.net_demand[t] += deviation[t];
        acc.net_demand_upper_bound[t] += sets.shift_up_capacity[t];
    }
    dm.add_constraint(total == 0.0, "ssd_energy_neutral");
    //
    // no sliding window of the shift duration may end with a net curtailment
    const size_t D = demand.shift_duration;
    if (D > 0 && D < T) {
        for (size_t s = 0; s + D <= T; s++) {
            LinearExpr window_sum;
            for (size_t t = s; t < s + D; t++)
                window_sum += deviation[t];
            dm.add_constraint(window_sum >= 0.0, "ssd_rolling_window_" + to_string(s));
        }
    }
    dm.add_objective_term( (dt * demand.shift_up_cost) * up_energy + (dt * demand.shift_down_cost) * down_energy );
}


void model::build_sheddable_demand(DecisionModel& dm, const RunSpecs& specs, const horizon::Sets& sets, ExpressionAccumulator& acc) {
    const size_t T = sets.T;
    vector<double> zeros(T, 0.0);
    const vector<MPVariable*>& d_shed = dm.make_series("d_shed", zeros, sets.demand);
    LinearExpr shed_energy;
    for (size_t t = 0; t < T; t++) {
        acc.net_demand[t] -= LinearExpr(d_shed[t]);
        shed_energy += LinearExpr(d_shed[t]);
    }
    dm.add_objective_term( (sets.dt * specs.demand.value_of_lost_load) * shed_energy );
}

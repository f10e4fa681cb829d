#include "run_specification.h"

#include <iostream>
#include <ostream>
#include <string>

#include "errors.h"
#include "global.h"

using namespace std;



RunSpecs make_run_specs(const RunInputs& inputs) {
    RunSpecs specs;
    specs.scenario = make_scenario_spec(inputs.scenario);
    specs.tariff   = make_tariff_spec(inputs.tariff, specs.scenario);
    specs.demand   = make_demand_spec(inputs.demand, specs.scenario);
    specs.solar    = make_solar_spec(inputs.solar, specs.scenario);
    specs.storage  = make_storage_spec(inputs.storage, specs.scenario);

    //
    // combinations of settings
    if (specs.storage.enabled && specs.storage.nonimport && !specs.solar.enabled) {
        throw ConfigurationError("The storage is defined as non-import, but solar PV is not enabled. A non-import storage can only be charged by solar PV.");
    }
    if (specs.tariff.nem_enabled && !specs.solar.enabled) {
        cout << "Notice: Net metering is enabled, but solar PV is not enabled. No exports are modeled." << endl;
    }
    if (specs.scenario.is_capacity_expansion() && specs.exports_enabled()) {
        // the big-M constants of the exports linkage are derived from the capacity bounds
        if (!specs.solar.maximum_power_capacity.has_value()) {
            throw ConfigurationError("The problem type is CEM and net metering is enabled, thus the solar parameter 'maximum power capacity' is required.");
        }
        if (specs.storage.enabled && !specs.storage.maximum_power_capacity.has_value()) {
            throw ConfigurationError("The problem type is CEM and net metering is enabled, thus the storage parameter 'maximum power capacity' is required.");
        }
    }
    if (specs.scenario.binary_pv_capacity_and_exports_linkage && !specs.scenario.is_capacity_expansion()) {
        cerr << "Warning: The binary PV capacity and exports linkage is only used in CEM. The setting is ignored." << endl;
    }
    return specs;
}


void output_run_specs(const RunSpecs& specs, ostream& out) {
    const ScenarioSpec& sc = specs.scenario;
    const TariffSpec& ta   = specs.tariff;
    out << "Scenario settings:\n";
    out << "  problem type                 = " << global::to_string(sc.problem_type) << "\n";
    out << "  year                         = " << sc.year << "\n";
    out << "  interval length              = " << sc.interval_length << " min\n";
    out << "  optimization horizon         = " << global::to_string(sc.optimization_horizon) << "\n";
    out << "  optimization solver          = " << global::to_string(sc.solver) << "\n";
    out << "  solver time limit            = " << sc.solver_time_limit << " s\n";
    out << "  solver parameters            = " << sc.solver_parameters << "\n";
    if (sc.real_discount_rate.has_value())
        out << "  real discount rate           = " << sc.real_discount_rate.value() << "\n";
    if (sc.amortization_period.has_value())
        out << "  amortization period          = " << sc.amortization_period.value() << "\n";
    out << "  binary net demand linkage    = " << (sc.binary_net_demand_and_exports_linkage  ? "true" : "false") << "\n";
    out << "  binary pv capacity linkage   = " << (sc.binary_pv_capacity_and_exports_linkage ? "true" : "false") << "\n";
    out << "\nTariff:\n";
    out << "  utility name                 = " << ta.utility_name << "\n";
    out << "  tariff name                  = " << ta.tariff_name << "\n";
    out << "  weekday weekend split        = " << (ta.weekday_weekend_split ? "true" : "false") << "\n";
    out << "  holiday split                = " << (ta.holiday_split ? "true" : "false") << "\n";
    out << "  seasonal month split         = " << (ta.seasonal_month_split ? "true" : "false") << "\n";
    for (const auto& [season, months] : ta.months_by_season) {
        out << "  season " << season << " months = ";
        for (unsigned int m : months)
            out << m << " ";
        out << "\n";
    }
    out << "  number of energy TOU rows    = " << ta.energy_tou_rates.size() << "\n";
    out << "  weekend TOU table given      = " << (ta.weekend_energy_tou_rates.empty() ? "false" : "true") << "\n";
    out << "  number of tiers              = " << ta.energy_tiered_rates.size() << "\n";
    out << "  tiered baseline type         = " << global::to_string(ta.tiered_baseline_type) << "\n";
    out << "  demand charges               = " << (ta.has_demand_charges() ? "true" : "false") << "\n";
    out << "  nem enabled                  = " << (ta.nem_enabled ? "true" : "false") << "\n";
    if (ta.nem_enabled) {
        out << "  nem version                  = " << ta.nem_version << "\n";
        out << "  nem non-bypassable charge    = " << ta.nem_non_bypassable_charge << "\n";
    }
    out << "  customer charge (daily)      = " << ta.customer_charge_daily << "\n";
    out << "  customer charge (monthly)    = " << ta.customer_charge_monthly << "\n";
    out << "  all charge scaling           = " << ta.all_charge_scaling << "\n";
    out << "  energy charge scaling        = " << ta.energy_charge_scaling << "\n";
    out << "  demand charge scaling        = " << ta.demand_charge_scaling << "\n";
    out << "  tou energy charge scaling    = " << ta.tou_energy_charge_scaling << "\n";
    out << "\nDemand:\n";
    out << "  simple shift enabled         = " << (specs.demand.simple_shift_enabled ? "true" : "false") << "\n";
    if (specs.demand.simple_shift_enabled) {
        out << "  shift duration               = " << specs.demand.shift_duration << " time steps\n";
        out << "  shift up cost                = " << specs.demand.shift_up_cost << "\n";
        out << "  shift down cost              = " << specs.demand.shift_down_cost << "\n";
    }
    out << "  shed enabled                 = " << (specs.demand.shed_enabled ? "true" : "false") << "\n";
    if (specs.demand.shed_enabled)
        out << "  value of lost load           = " << specs.demand.value_of_lost_load << "\n";
    out << "\nSolar PV:\n";
    out << "  enabled                      = " << (specs.solar.enabled ? "true" : "false") << "\n";
    if (specs.solar.enabled) {
        if (specs.solar.power_capacity.has_value())
            out << "  power capacity               = " << specs.solar.power_capacity.value() << " kW\n";
        if (specs.solar.maximum_power_capacity.has_value())
            out << "  maximum power capacity       = " << specs.solar.maximum_power_capacity.value() << " kW\n";
        out << "  nonexport                    = " << (specs.solar.nonexport ? "true" : "false") << "\n";
        out << "  inverter efficiency          = " << specs.solar.inverter_eff << "\n";
        out << "  capital cost                 = " << specs.solar.capital_cost << "\n";
        out << "  fixed om cost                = " << specs.solar.fixed_om_cost << "\n";
        out << "  lifespan                     = " << specs.solar.lifespan << "\n";
        out << "  investment tax credit        = " << specs.solar.investment_tax_credit << "\n";
        out << "  linked cost scaling          = " << specs.solar.linked_cost_scaling << "\n";
    }
    out << "\nStorage:\n";
    out << "  enabled                      = " << (specs.storage.enabled ? "true" : "false") << "\n";
    if (specs.storage.enabled) {
        if (specs.storage.power_capacity.has_value())
            out << "  power capacity               = " << specs.storage.power_capacity.value() << " kW\n";
        if (specs.storage.energy_capacity.has_value())
            out << "  energy capacity              = " << specs.storage.energy_capacity.value() << " kWh\n";
        if (specs.storage.duration.has_value())
            out << "  duration                     = " << specs.storage.duration.value() << " h\n";
        if (specs.storage.maximum_power_capacity.has_value())
            out << "  maximum power capacity       = " << specs.storage.maximum_power_capacity.value() << " kW\n";
        if (specs.storage.maximum_energy_capacity.has_value())
            out << "  maximum energy capacity      = " << specs.storage.maximum_energy_capacity.value() << " kWh\n";
        out << "  soc min / max / initial      = " << specs.storage.soc_min << " / " << specs.storage.soc_max << " / " << specs.storage.soc_initial << "\n";
        out << "  charge / discharge eff.      = " << specs.storage.charge_eff << " / " << specs.storage.discharge_eff << "\n";
        out << "  loss rate                    = " << specs.storage.loss_rate << "\n";
        out << "  nonexport / nonimport        = " << (specs.storage.nonexport ? "true" : "false") << " / " << (specs.storage.nonimport ? "true" : "false") << "\n";
        out << "  power capital cost           = " << specs.storage.power_capital_cost << "\n";
        out << "  fixed om cost                = " << specs.storage.fixed_om_cost << "\n";
        out << "  lifespan                     = " << specs.storage.lifespan << "\n";
        out << "  investment tax credit        = " << specs.storage.investment_tax_credit << "\n";
        out << "  linked cost scaling          = " << specs.storage.linked_cost_scaling << "\n";
    }
}

#include "components.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "errors.h"
#include "helper.h"

using namespace std;



namespace {

    string to_upper_copy(string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
        return s;
    }

    void check_fraction(double value, const string& component, const string& parameter) {
        if (value > 1.0) {
            throw ConfigurationError("The provided " + component + " parameter '" + parameter + "' is greater than 1. Please only use values between 0 and 1, inclusive.");
        } else if (value < 0.0 || std::isnan(value)) {
            throw ConfigurationError("The provided " + component + " parameter '" + parameter + "' is less than 0. Please only use values between 0 and 1, inclusive.");
        }
    }

    void check_nonnegative(const std::optional<double>& value, const string& component, const string& parameter) {
        if (value.has_value() && value.value() < 0.0) {
            throw ConfigurationError("The provided " + component + " parameter '" + parameter + "' is negative.");
        }
    }

}


size_t ScenarioSpec::n_timesteps() const {
    return timesteps_in_year(year, interval_length);
}


ScenarioSpec make_scenario_spec(const ScenarioInput& input) {
    ScenarioSpec spec;
    //
    // problem type
    if (!input.problem_type.has_value()) {
        throw ConfigurationError("The scenario parameter 'problem type' is not defined. Please specify 'PCM' or 'CEM'.");
    }
    string pt = to_upper_copy(input.problem_type.value());
    if (pt == "PCM") {
        spec.problem_type = global::ProblemType::ProductionCost;
    } else if (pt == "CEM") {
        spec.problem_type = global::ProblemType::CapacityExpansion;
    } else {
        throw ConfigurationError("The scenario parameter 'problem type' is defined as '" + input.problem_type.value() + "', but only 'PCM' and 'CEM' are known.");
    }
    //
    // year
    if (!input.year.has_value()) {
        throw ConfigurationError("The scenario parameter 'year' is not defined.");
    }
    spec.year = input.year.value();
    if (spec.year < 1900 || spec.year > 2200) {
        throw ConfigurationError("The scenario parameter 'year' is out of the supported range: " + to_string(spec.year));
    }
    //
    // interval length
    spec.interval_length = value_or_notice<unsigned int>(input.interval_length, 60, "scenario", "interval length");
    if (spec.interval_length != 15 && spec.interval_length != 30 && spec.interval_length != 60) {
        throw ConfigurationError("The scenario parameter 'interval length' must be 15, 30 or 60 minutes, but it is " + to_string(spec.interval_length) + ".");
    }
    //
    // optimization horizon
    string horizon = to_upper_copy(value_or_notice<string>(input.optimization_horizon, "MONTH", "scenario", "optimization horizon"));
    if (horizon == "DAY") {
        spec.optimization_horizon = global::OptimizationHorizon::Day;
    } else if (horizon == "MONTH") {
        spec.optimization_horizon = global::OptimizationHorizon::Month;
    } else if (horizon == "YEAR") {
        spec.optimization_horizon = global::OptimizationHorizon::Year;
    } else {
        throw ConfigurationError("The scenario parameter 'optimization horizon' is defined as '" + horizon + "', but only 'DAY', 'MONTH' and 'YEAR' are known.");
    }
    //
    // solver
    string solver = to_upper_copy(value_or_notice<string>(input.optimization_solver, "SCIP", "scenario", "optimization solver"));
    if (solver == "SCIP") {
        spec.solver = global::SolverChoice::SCIP;
    } else if (solver == "CBC") {
        spec.solver = global::SolverChoice::CBC;
    } else if (solver == "GLPK") {
        spec.solver = global::SolverChoice::GLPK;
    } else if (solver == "GUROBI") {
        spec.solver = global::SolverChoice::Gurobi;
    } else if (solver == "HIGHS") {
        spec.solver = global::SolverChoice::HiGHS;
    } else {
        throw ConfigurationError("The scenario parameter 'optimization solver' is defined as '" + solver + "', but this solver is unknown.");
    }
    if (input.solver_time_limit.has_value()) {
        if (input.solver_time_limit.value() < 0.0)
            throw ConfigurationError("The scenario parameter 'solver time limit' must not be negative.");
        spec.solver_time_limit = input.solver_time_limit.value();
    }
    if (input.solver_parameters.has_value())
        spec.solver_parameters = input.solver_parameters.value();
    //
    // discount rates
    if (input.real_discount_rate.has_value()) {
        spec.real_discount_rate = input.real_discount_rate.value();
        if (input.nominal_discount_rate.has_value() || input.inflation_rate.has_value()) {
            cerr << "Warning: A real discount rate is given. The nominal discount rate and the inflation rate are ignored." << endl;
        }
    } else if (input.nominal_discount_rate.has_value() && input.inflation_rate.has_value()) {
        const double nominal   = input.nominal_discount_rate.value();
        const double inflation = input.inflation_rate.value();
        if (inflation <= -1.0)
            throw ConfigurationError("The scenario parameter 'inflation rate' must be greater than -1.");
        spec.real_discount_rate = (nominal - inflation) / (1.0 + inflation);
    }
    if (spec.real_discount_rate.has_value() && spec.real_discount_rate.value() < 0.0) {
        throw ConfigurationError("The (derived) real discount rate must not be negative.");
    }
    if (input.amortization_period.has_value()) {
        if (input.amortization_period.value() == 0)
            throw ConfigurationError("The scenario parameter 'amortization period' must be at least one year.");
        spec.amortization_period = input.amortization_period.value();
    }
    //
    spec.binary_net_demand_and_exports_linkage  = value_or_notice<bool>(input.binary_net_demand_and_exports_linkage,  false, "scenario", "binary net demand and exports linkage");
    spec.binary_pv_capacity_and_exports_linkage = value_or_notice<bool>(input.binary_pv_capacity_and_exports_linkage, false, "scenario", "binary pv capacity and exports linkage");
    //
    return spec;
}


DemandSpec make_demand_spec(const DemandInput& input, const ScenarioSpec& scenario) {
    DemandSpec spec;
    if (!input.demand_profile.has_value()) {
        throw ConfigurationError("No demand profile is defined. A demand profile is required.");
    }
    spec.demand = resample_profile(input.demand_profile.value(), scenario.year, scenario.interval_length, "demand profile");
    //
    // simple shiftable demand
    spec.simple_shift_enabled = input.simple_shift_enabled.value_or(false);
    if (spec.simple_shift_enabled) {
        const bool profiles_given = input.shift_up_capacity_profile.has_value() && input.shift_down_capacity_profile.has_value();
        if (profiles_given) {
            if (input.shift_percent.has_value()) {
                cerr << "Warning: Both the shift capacity profiles and the shift percent have been provided. Will default to using the shift capacity profiles." << endl;
            }
            spec.shift_up_capacity   = resample_profile(input.shift_up_capacity_profile.value(),   scenario.year, scenario.interval_length, "shift up capacity profile");
            spec.shift_down_capacity = resample_profile(input.shift_down_capacity_profile.value(), scenario.year, scenario.interval_length, "shift down capacity profile");
        } else if (input.shift_percent.has_value()) {
            const double percent = input.shift_percent.value();
            check_fraction(percent, "demand", "shift percent");
            spec.shift_up_capacity.resize(spec.demand.size());
            spec.shift_down_capacity.resize(spec.demand.size());
            for (size_t t = 0; t < spec.demand.size(); t++) {
                spec.shift_up_capacity[t]   =  percent * spec.demand[t];
                spec.shift_down_capacity[t] = -percent * spec.demand[t];
            }
        } else {
            throw ConfigurationError("Simple shiftable demand is enabled, but neither both shift capacity profiles nor a shift percent are defined.");
        }
        for (size_t t = 0; t < spec.shift_up_capacity.size(); t++) {
            if (spec.shift_up_capacity[t] < 0.0)
                throw ConfigurationError("The shift up capacity must be nonnegative, but it is negative at time step " + to_string(t) + ".");
            if (spec.shift_down_capacity[t] > 0.0)
                throw ConfigurationError("The shift down capacity must be nonpositive, but it is positive at time step " + to_string(t) + ".");
        }
        if (!input.shift_duration.has_value() || input.shift_duration.value() <= 0.0) {
            throw ConfigurationError("Simple shiftable demand is enabled, but no positive 'shift duration' is defined.");
        }
        spec.shift_duration = static_cast<unsigned int>( std::lround(input.shift_duration.value() * 60.0 / scenario.interval_length) );
        if (spec.shift_duration < 1)
            spec.shift_duration = 1;
        spec.shift_up_cost   = value_or_notice<double>(input.shift_up_cost,   0.0, "demand", "shift up cost");
        spec.shift_down_cost = value_or_notice<double>(input.shift_down_cost, 0.0, "demand", "shift down cost");
    }
    //
    // sheddable demand
    spec.shed_enabled = input.shed_enabled.value_or(false);
    if (spec.shed_enabled) {
        if (!input.value_of_lost_load.has_value()) {
            throw ConfigurationError("Sheddable demand is enabled, but no 'value of lost load' is defined.");
        }
        spec.value_of_lost_load = input.value_of_lost_load.value();
        if (spec.value_of_lost_load < 0.0)
            throw ConfigurationError("The 'value of lost load' must not be negative.");
    }
    return spec;
}


SolarSpec make_solar_spec(const SolarInput& input, const ScenarioSpec& scenario) {
    SolarSpec spec;
    spec.enabled = input.enabled.value_or(false);
    if (!spec.enabled)
        return spec;
    //
    if (!input.capacity_factor_profile.has_value()) {
        throw ConfigurationError("Solar PV is enabled, but no capacity factor profile is defined.");
    }
    spec.capacity_factor = resample_profile(input.capacity_factor_profile.value(), scenario.year, scenario.interval_length, "solar capacity factor profile");
    for (size_t t = 0; t < spec.capacity_factor.size(); t++) {
        if (spec.capacity_factor[t] < 0.0 || spec.capacity_factor[t] > 1.0) {
            throw ConfigurationError("The solar capacity factor must be between 0 and 1, but it is " + to_string(spec.capacity_factor[t]) + " at time step " + to_string(t) + ".");
        }
    }
    check_nonnegative(input.power_capacity, "solar", "power capacity");
    check_nonnegative(input.maximum_power_capacity, "solar", "maximum power capacity");
    spec.power_capacity         = input.power_capacity;
    spec.maximum_power_capacity = input.maximum_power_capacity;
    spec.nonexport     = value_or_notice<bool>(input.nonexport, false, "solar", "nonexport");
    spec.inverter_eff  = value_or_notice<double>(input.inverter_eff, 1.0, "solar", "inverter efficiency");
    check_fraction(spec.inverter_eff, "solar", "inverter efficiency");
    spec.investment_tax_credit = value_or_notice<double>(input.investment_tax_credit, 0.3, "solar", "investment tax credit");
    check_fraction(spec.investment_tax_credit, "solar", "investment tax credit");
    spec.linked_cost_scaling = value_or_notice<double>(input.linked_cost_scaling, 1.0, "solar", "linked cost scaling");
    //
    if (scenario.is_capacity_expansion()) {
        if (!input.capital_cost.has_value())
            throw ConfigurationError("The problem type is CEM, but the solar parameter 'capital cost' is not defined.");
        if (!input.lifespan.has_value() || input.lifespan.value() == 0)
            throw ConfigurationError("The problem type is CEM, but the solar parameter 'lifespan' is not defined.");
        spec.capital_cost  = input.capital_cost.value();
        spec.lifespan      = input.lifespan.value();
        spec.fixed_om_cost = value_or_notice<double>(input.fixed_om_cost, 0.0, "solar", "fixed om cost");
        if (input.power_capacity.has_value()) {
            cerr << "Warning: The problem type is CEM, the given solar power capacity is ignored." << endl;
            spec.power_capacity.reset();
        }
    } else {
        if (!spec.power_capacity.has_value())
            throw ConfigurationError("Solar PV is enabled, but the solar parameter 'power capacity' is not defined.");
        spec.capital_cost  = input.capital_cost.value_or(0.0);
        spec.fixed_om_cost = input.fixed_om_cost.value_or(0.0);
        spec.lifespan      = input.lifespan.value_or(0);
    }
    return spec;
}


StorageSpec make_storage_spec(const StorageInput& input, const ScenarioSpec& scenario) {
    StorageSpec spec;
    spec.enabled = input.enabled.value_or(false);
    if (!spec.enabled)
        return spec;
    //
    check_nonnegative(input.power_capacity, "storage", "power capacity");
    check_nonnegative(input.energy_capacity, "storage", "energy capacity");
    check_nonnegative(input.duration, "storage", "duration");
    check_nonnegative(input.maximum_power_capacity, "storage", "maximum power capacity");
    check_nonnegative(input.maximum_energy_capacity, "storage", "maximum energy capacity");
    spec.power_capacity          = input.power_capacity;
    spec.energy_capacity         = input.energy_capacity;
    spec.duration                = input.duration;
    spec.maximum_power_capacity  = input.maximum_power_capacity;
    spec.maximum_energy_capacity = input.maximum_energy_capacity;
    //
    spec.soc_min       = value_or_notice<double>(input.soc_min,       0.0, "storage", "soc min");
    spec.soc_max       = value_or_notice<double>(input.soc_max,       1.0, "storage", "soc max");
    spec.soc_initial   = value_or_notice<double>(input.soc_initial,   0.5, "storage", "soc initial");
    spec.charge_eff    = value_or_notice<double>(input.charge_eff,    1.0, "storage", "charge efficiency");
    spec.discharge_eff = value_or_notice<double>(input.discharge_eff, 1.0, "storage", "discharge efficiency");
    spec.loss_rate     = value_or_notice<double>(input.loss_rate,     0.0, "storage", "loss rate");
    check_fraction(spec.soc_min,       "storage", "soc min");
    check_fraction(spec.soc_max,       "storage", "soc max");
    check_fraction(spec.soc_initial,   "storage", "soc initial");
    check_fraction(spec.charge_eff,    "storage", "charge efficiency");
    check_fraction(spec.discharge_eff, "storage", "discharge efficiency");
    check_fraction(spec.loss_rate,     "storage", "loss rate");
    if (spec.soc_min > spec.soc_max)
        throw ConfigurationError("The storage parameter 'soc min' is greater than 'soc max'.");
    if (spec.discharge_eff == 0.0)
        throw ConfigurationError("The storage parameter 'discharge efficiency' must be greater than 0.");
    spec.nonexport = value_or_notice<bool>(input.nonexport, true,  "storage", "nonexport");
    spec.nonimport = value_or_notice<bool>(input.nonimport, false, "storage", "nonimport");
    spec.investment_tax_credit = value_or_notice<double>(input.investment_tax_credit, 0.3, "storage", "investment tax credit");
    check_fraction(spec.investment_tax_credit, "storage", "investment tax credit");
    spec.linked_cost_scaling = value_or_notice<double>(input.linked_cost_scaling, 1.0, "storage", "linked cost scaling");
    //
    if (spec.duration.has_value() && spec.energy_capacity.has_value()) {
        cerr << "Warning: Both the energy capacity and duration parameters have been provided. Will default to using the energy capacity parameter." << endl;
        spec.duration.reset();
    }
    //
    if (scenario.is_capacity_expansion()) {
        if (!input.power_capital_cost.has_value())
            throw ConfigurationError("The problem type is CEM, but the storage parameter 'power capital cost' is not defined.");
        if (!input.lifespan.has_value() || input.lifespan.value() == 0)
            throw ConfigurationError("The problem type is CEM, but the storage parameter 'lifespan' is not defined.");
        spec.power_capital_cost = input.power_capital_cost.value();
        spec.lifespan           = input.lifespan.value();
        spec.fixed_om_cost      = value_or_notice<double>(input.fixed_om_cost, 0.0, "storage", "fixed om cost");
        if (spec.power_capacity.has_value() || spec.energy_capacity.has_value()) {
            cerr << "Warning: The problem type is CEM, the given storage power and energy capacities are ignored." << endl;
            spec.power_capacity.reset();
            spec.energy_capacity.reset();
        }
    } else {
        if (!spec.power_capacity.has_value())
            throw ConfigurationError("Storage is enabled, but the storage parameter 'power capacity' is not defined.");
        if (!spec.energy_capacity.has_value()) {
            if (!spec.duration.has_value())
                throw ConfigurationError("Storage is enabled, but neither the storage parameter 'energy capacity' nor 'duration' is defined.");
            spec.energy_capacity = spec.duration.value() * spec.power_capacity.value();
        }
        spec.power_capital_cost = input.power_capital_cost.value_or(0.0);
        spec.fixed_om_cost      = input.fixed_om_cost.value_or(0.0);
        spec.lifespan           = input.lifespan.value_or(0);
    }
    return spec;
}

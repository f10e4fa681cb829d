/*
 * components.h
 *
 * It contains the scenario settings and the specifications of all
 * behind-the-meter assets: demand (incl. shiftable and sheddable demand),
 * solar PV and battery storage.
 *
 * Every specification comes in two variants:
 *  - an *Input struct with optional fields as it is read from the configuration
 *  - a validated *Spec struct, that is created by the corresponding make_*_spec() function
 *
 */

#ifndef COMPONENTS_H
#define COMPONENTS_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "global.h"


/*!
 * Raw scenario settings as given in the configuration file.
 */
struct ScenarioInput {
    std::optional<std::string> problem_type;          ///< "PCM" or "CEM"
    std::optional<unsigned int> interval_length;      ///< Interval length in minutes
    std::optional<std::string> optimization_horizon;  ///< "DAY", "MONTH" or "YEAR"
    std::optional<std::string> optimization_solver;
    std::optional<int> year;
    std::optional<double> real_discount_rate;
    std::optional<double> nominal_discount_rate;
    std::optional<double> inflation_rate;
    std::optional<unsigned int> amortization_period;  ///< in years
    std::optional<bool> binary_net_demand_and_exports_linkage;
    std::optional<bool> binary_pv_capacity_and_exports_linkage;
    std::optional<double> solver_time_limit;          ///< in seconds
    std::optional<std::string> solver_parameters;
};

/*!
 * Validated scenario settings.
 */
struct ScenarioSpec {
    global::ProblemType problem_type = global::ProblemType::ProductionCost;
    unsigned int interval_length     = 60; ///< in minutes
    global::OptimizationHorizon optimization_horizon = global::OptimizationHorizon::Month;
    global::SolverChoice solver      = global::SolverChoice::SCIP;
    int year                         = 0;
    std::optional<double> real_discount_rate;        ///< Given directly or derived from the nominal discount rate and the inflation rate
    std::optional<unsigned int> amortization_period; ///< Overwrites the lifespan of the assets for the annualization if set
    bool binary_net_demand_and_exports_linkage  = false;
    bool binary_pv_capacity_and_exports_linkage = false;
    double solver_time_limit = 0.0;  ///< Time limit per window in seconds, 0.0 means no limit
    std::string solver_parameters;   ///< Passed to the solver backend as it is

    double interval_in_h() const { return static_cast<double>(interval_length) / 60.0; }
    size_t n_timesteps() const; ///< Number of time steps in the scenario year
    bool is_capacity_expansion() const { return problem_type == global::ProblemType::CapacityExpansion; }
};


/*!
 * Raw demand settings as given in the configuration file.
 * All profiles may be given in hourly, 30-minute or 15-minute resolution.
 */
struct DemandInput {
    std::optional<std::vector<double>> demand_profile;
    std::optional<bool> simple_shift_enabled;
    std::optional<std::vector<double>> shift_up_capacity_profile;
    std::optional<std::vector<double>> shift_down_capacity_profile;
    std::optional<double> shift_percent;
    std::optional<double> shift_duration;  ///< in hours
    std::optional<double> shift_up_cost;   ///< per kWh
    std::optional<double> shift_down_cost; ///< per kWh
    std::optional<bool> shed_enabled;
    std::optional<double> value_of_lost_load; ///< per kWh
};

struct DemandSpec {
    std::vector<double> demand; ///< Base demand in kW per time step of the scenario year
    bool simple_shift_enabled = false;
    std::vector<double> shift_up_capacity;   ///< Nonnegative, in kW per time step
    std::vector<double> shift_down_capacity; ///< Nonpositive, in kW per time step
    unsigned int shift_duration = 0;         ///< Length of the rolling balance window in time steps
    double shift_up_cost   = 0.0;
    double shift_down_cost = 0.0;
    bool shed_enabled = false;
    double value_of_lost_load = 0.0;
};


/*!
 * Raw solar PV settings as given in the configuration file.
 */
struct SolarInput {
    std::optional<bool> enabled;
    std::optional<std::vector<double>> capacity_factor_profile;
    std::optional<double> power_capacity;          ///< in kW
    std::optional<double> maximum_power_capacity;  ///< in kW, only used in CEM
    std::optional<bool> nonexport;
    std::optional<double> capital_cost;            ///< per kW
    std::optional<double> fixed_om_cost;           ///< per kW and year
    std::optional<double> inverter_eff;
    std::optional<unsigned int> lifespan;          ///< in years
    std::optional<double> investment_tax_credit;
    std::optional<double> linked_cost_scaling;
};

struct SolarSpec {
    bool enabled = false;
    std::vector<double> capacity_factor; ///< Values in [0,1] per time step of the scenario year
    std::optional<double> power_capacity;
    std::optional<double> maximum_power_capacity;
    bool nonexport = false;
    double capital_cost  = 0.0;
    double fixed_om_cost = 0.0;
    double inverter_eff  = 1.0;
    unsigned int lifespan = 0;
    double investment_tax_credit = 0.3;
    double linked_cost_scaling   = 1.0;
};


/*!
 * Raw battery energy storage settings as given in the configuration file.
 */
struct StorageInput {
    std::optional<bool> enabled;
    std::optional<double> power_capacity;          ///< in kW
    std::optional<double> energy_capacity;         ///< in kWh
    std::optional<double> duration;                ///< in h
    std::optional<double> maximum_power_capacity;  ///< in kW, only used in CEM
    std::optional<double> maximum_energy_capacity; ///< in kWh, only used in CEM
    std::optional<double> soc_min;
    std::optional<double> soc_max;
    std::optional<double> soc_initial;
    std::optional<double> charge_eff;
    std::optional<double> discharge_eff;
    std::optional<double> loss_rate;               ///< per time step
    std::optional<bool> nonexport;
    std::optional<bool> nonimport;
    std::optional<double> power_capital_cost;      ///< per kW
    std::optional<double> fixed_om_cost;           ///< per kW and year
    std::optional<unsigned int> lifespan;
    std::optional<double> investment_tax_credit;
    std::optional<double> linked_cost_scaling;
};

struct StorageSpec {
    bool enabled = false;
    std::optional<double> power_capacity;
    std::optional<double> energy_capacity; ///< Resolved from the duration in PCM, if only the duration is given
    std::optional<double> duration;
    std::optional<double> maximum_power_capacity;
    std::optional<double> maximum_energy_capacity;
    double soc_min       = 0.0;
    double soc_max       = 1.0;
    double soc_initial   = 0.5;
    double charge_eff    = 1.0;
    double discharge_eff = 1.0;
    double loss_rate     = 0.0;
    bool nonexport = true;
    bool nonimport = false;
    double power_capital_cost = 0.0;
    double fixed_om_cost      = 0.0;
    unsigned int lifespan     = 0;
    double investment_tax_credit = 0.3;
    double linked_cost_scaling   = 1.0;
};


/**
 * Validates the scenario settings and fills in defaults.
 * @throws ConfigurationError if a required value is missing or invalid
 */
ScenarioSpec make_scenario_spec(const ScenarioInput& input);

/**
 * Validates the demand settings, resamples all profiles to the scenario interval
 * length and derives the shift capacities from the shift percentage if required.
 * @throws ConfigurationError if a required value is missing or invalid
 */
DemandSpec make_demand_spec(const DemandInput& input, const ScenarioSpec& scenario);

/**
 * Validates the solar PV settings and resamples the capacity factor profile.
 * @throws ConfigurationError if a required value is missing or invalid
 */
SolarSpec make_solar_spec(const SolarInput& input, const ScenarioSpec& scenario);

/**
 * Validates the storage settings. In PCM, a missing energy capacity is computed from the duration.
 * @throws ConfigurationError if a required value is missing or invalid
 */
StorageSpec make_storage_spec(const StorageInput& input, const ScenarioSpec& scenario);

#endif

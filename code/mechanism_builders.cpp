#include "mechanism_builders.h"

#include <cmath>
#include <string>
#include <vector>

#include "errors.h"
#include "helper.h"

using namespace std;
using namespace model;
using operations_research::LinearExpr;


namespace {
    const double minimum_qualifying_pv_capacity = 0.001; // in kW
}


void model::build_net_demand_bound(DecisionModel& dm, const horizon::Sets& sets, const ExpressionAccumulator& acc) {
    for (size_t t = 0; t < sets.T; t++)
        dm.add_constraint(acc.net_demand[t] >= 0.0, "net_demand_nonnegative_" + to_string(t));
}


void model::build_energy_charge(DecisionModel& dm, const horizon::Sets& sets, const ExpressionAccumulator& acc) {
    LinearExpr energy_cost;
    for (size_t t = 0; t < sets.T; t++)
        energy_cost += sets.energy_prices[t] * acc.net_demand[t];
    dm.add_objective_term(sets.dt * energy_cost);
}


void model::build_demand_charge(DecisionModel& dm, const horizon::Sets& sets, const ExpressionAccumulator& acc) {
    const double infinity = dm.infinity();
    for (const horizon::WindowDemandPeriod& p : sets.demand_periods) {
        const double lb = p.previous_max.value_or(0.0);
        MPVariable* d_max = dm.make_scalar("d_max_" + p.name, lb, infinity);
        for (size_t t : p.timesteps) {
            dm.add_constraint(LinearExpr(d_max) - acc.net_demand[t] >= 0.0, "d_max_" + p.name + "_" + to_string(t));
        }
        dm.add_objective_term(p.price * LinearExpr(d_max));
    }
}


void model::build_net_energy_metering(DecisionModel& dm, const RunSpecs& specs, const horizon::Sets& sets, const ExpressionAccumulator& acc) {
    if (!acc.exports_enabled)
        return;
    const size_t T = sets.T;
    //
    // revenue
    LinearExpr revenue;
    for (size_t t = 0; t < T; t++)
        revenue += sets.nem_prices[t] * acc.exports[t];
    dm.add_objective_term(-sets.dt * revenue);

    // without any export capable asset, the exports expression is empty
    const double ub = acc.exports_upper_bound;
    if (ub <= 0.0)
        return;
    if (std::isinf(ub))
        throw ConfigurationError("The exports linkage requires finite capacity bounds of all exporting assets.");

    //
    // net demand linkage: zeta = 1 <=> net demand is 0, exports only if zeta = 1
    const vector<MPVariable*>& zeta = dm.make_indicator_series("zeta_net_demand", T, specs.scenario.binary_net_demand_and_exports_linkage);
    for (size_t t = 0; t < T; t++) {
        const string tstr = to_string(t);
        const double M = acc.net_demand_upper_bound[t];
        if (std::isinf(M))
            throw ConfigurationError("The net demand and exports linkage requires a finite upper bound of the net demand.");
        dm.add_constraint(acc.net_demand[t] + M * LinearExpr(zeta[t]) <= M, "nem_net_demand_linkage_" + tstr);
        dm.add_constraint(acc.exports[t] - ub * LinearExpr(zeta[t]) <= 0.0, "nem_exports_linkage_" + tstr);
    }

    //
    // PV capacity linkage: zeta_pv = 1 <=> no PV capacity, exports only if zeta_pv = 0
    if (specs.scenario.is_capacity_expansion() && dm.has_scalar("pv_capacity")) {
        const double M_pv = specs.solar.maximum_power_capacity.value();
        MPVariable* zeta_pv = dm.make_indicator("zeta_pv_capacity", specs.scenario.binary_pv_capacity_and_exports_linkage);
        dm.add_constraint(LinearExpr(dm.scalar("pv_capacity")) + M_pv * LinearExpr(zeta_pv) <= M_pv, "nem_pv_capacity_linkage");
        // without a qualifying PV capacity, zeta_pv is forced to 1
        const double eps = minimum_qualifying_pv_capacity;
        dm.add_constraint(LinearExpr(dm.scalar("pv_capacity")) + eps * LinearExpr(zeta_pv) >= eps, "nem_pv_capacity_qualification");
        for (size_t t = 0; t < T; t++) {
            dm.add_constraint(acc.exports[t] + ub * LinearExpr(zeta_pv) <= ub, "nem_pv_exports_linkage_" + to_string(t));
        }
    }
}


void model::build_tiered_energy_rate(DecisionModel& dm, const horizon::Sets& sets, const ExpressionAccumulator& acc) {
    const double infinity = dm.infinity();
    for (const horizon::MonthRange& mr : sets.months) {
        LinearExpr tier_sum;
        bool has_bands = false;
        for (const horizon::WindowTierBand& band : sets.tier_bands) {
            if (band.month != mr.month)
                continue;
            has_bands = true;
            const double width = band.upper_bound.has_value() ? band.upper_bound.value() - band.lower_bound : infinity;
            MPVariable* e = dm.make_scalar("e_tier_" + to_string(band.month) + "_" + to_string(band.tier), 0.0, width);
            tier_sum += LinearExpr(e);
            dm.add_objective_term(band.price * LinearExpr(e));
        }
        if (!has_bands)
            continue;
        LinearExpr month_energy;
        for (size_t t = mr.first; t < mr.first + mr.count; t++)
            month_energy += acc.net_demand[t];
        dm.add_constraint(tier_sum == sets.dt * month_energy, "tier_balance_" + to_string(mr.month));
    }
}


double model::capital_recovery_factor(const ScenarioSpec& scenario, unsigned int lifespan) {
    const unsigned int n = scenario.amortization_period.value_or(lifespan);
    if (n == 0)
        throw ConfigurationError("Neither an amortization period nor a lifespan is defined for an asset in CEM.");
    if (scenario.real_discount_rate.has_value())
        return annuity_factor(scenario.real_discount_rate.value(), n);
    return 1.0 / static_cast<double>(n);
}


void model::build_investment_costs(DecisionModel& dm, const RunSpecs& specs, const horizon::Sets& sets) {
    if (!specs.scenario.is_capacity_expansion())
        return;
    if (specs.solar.enabled) {
        const SolarSpec& pv = specs.solar;
        const double crf    = capital_recovery_factor(specs.scenario, pv.lifespan);
        const double annual = pv.capital_cost * pv.linked_cost_scaling * crf * (1.0 - pv.investment_tax_credit) + pv.fixed_om_cost;
        dm.add_objective_term( (sets.year_share * annual) * LinearExpr(dm.scalar("pv_capacity")) );
    }
    if (specs.storage.enabled) {
        const StorageSpec& bes = specs.storage;
        const double crf    = capital_recovery_factor(specs.scenario, bes.lifespan);
        const double annual = bes.power_capital_cost * bes.linked_cost_scaling * crf * (1.0 - bes.investment_tax_credit) + bes.fixed_om_cost;
        dm.add_objective_term( (sets.year_share * annual) * LinearExpr(dm.scalar("bes_power_capacity")) );
    }
}

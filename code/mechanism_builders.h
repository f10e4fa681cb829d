/*
 * mechanism_builders.h
 *
 * Builders for the tariff and incentive mechanisms. They read the shared
 * expressions and append objective terms and linkage constraints.
 *
 */

#ifndef MECHANISM_BUILDERS_H
#define MECHANISM_BUILDERS_H

#include "components.h"
#include "horizon_sets.h"
#include "optimization_model.h"
#include "run_specification.h"


namespace model {

    /**
     * Net demand must not be negative: all exports are routed through the export variables.
     */
    void build_net_demand_bound(DecisionModel& dm, const horizon::Sets& sets, const ExpressionAccumulator& acc);

    /**
     * Energy charge: dt * sum(net_demand * energy_price)
     */
    void build_energy_charge(DecisionModel& dm, const horizon::Sets& sets, const ExpressionAccumulator& acc);

    /**
     * One peak demand variable d_max_{period} per demand charge period of the window.
     * In the DAY horizon, the peak of a monthly period is bound below by the peak of the previous days.
     */
    void build_demand_charge(DecisionModel& dm, const horizon::Sets& sets, const ExpressionAccumulator& acc);

    /**
     * Net metering revenue and the export eligibility linkage:
     *  - net demand linkage: exports only if the net demand is 0
     *  - PV capacity linkage (CEM only): exports only if PV capacity is installed
     */
    void build_net_energy_metering(DecisionModel& dm, const RunSpecs& specs, const horizon::Sets& sets, const ExpressionAccumulator& acc);

    /**
     * Tiered energy rate: one energy variable per month and tier
     */
    void build_tiered_energy_rate(DecisionModel& dm, const horizon::Sets& sets, const ExpressionAccumulator& acc);

    /**
     * Annualized investment cost, fixed O&M and investment tax credit of the asset capacities in CEM,
     * prorated by the share of the window on the year.
     */
    void build_investment_costs(DecisionModel& dm, const RunSpecs& specs, const horizon::Sets& sets);

    /**
     * Returns the factor that converts a capital cost into an annual cost.
     * It is the annuity factor if a real discount rate is given, otherwise 1/n.
     * n is the amortization period if given, otherwise the lifespan.
     */
    double capital_recovery_factor(const ScenarioSpec& scenario, unsigned int lifespan);

}

#endif

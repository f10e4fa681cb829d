/*
 * asset_builders.h
 *
 * Builders for the behind-the-meter assets. Every builder adds its
 * variables and constraints to the decision model and its terms
 * to the shared net demand and exports expressions.
 *
 */

#ifndef ASSET_BUILDERS_H
#define ASSET_BUILDERS_H

#include "horizon_sets.h"
#include "optimization_model.h"
#include "run_specification.h"


namespace model {

    /**
     * Solar PV: behind-the-meter generation, export generation (if the solar exports)
     * and the installed capacity in CEM.
     * Variables: p_pv_btm, p_pv_exp, pv_capacity
     */
    void build_solar(DecisionModel& dm, const RunSpecs& specs, const horizon::Sets& sets, ExpressionAccumulator& acc);

    /**
     * Battery storage with the state of charge in energy units.
     * Must be called after build_solar(), as a non-import storage is bound to the solar generation.
     * Variables: p_bes_ch, p_bes_dis_btm, p_bes_dis_exp, e_bes_soc, bes_power_capacity, bes_energy_capacity
     */
    void build_storage(DecisionModel& dm, const RunSpecs& specs, const horizon::Sets& sets, ExpressionAccumulator& acc);

    /**
     * Energy neutral shifting of demand within a rolling window.
     * Variables: d_dev_up, d_dev_down
     */
    void build_shiftable_demand(DecisionModel& dm, const RunSpecs& specs, const horizon::Sets& sets, ExpressionAccumulator& acc);

    /**
     * Curtailment of demand at the value of lost load.
     * Variables: d_shed
     */
    void build_sheddable_demand(DecisionModel& dm, const RunSpecs& specs, const horizon::Sets& sets, ExpressionAccumulator& acc);

}

#endif

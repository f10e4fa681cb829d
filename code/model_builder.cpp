#include "model_builder.h"

#include <memory>
#include <utility>

#include "asset_builders.h"
#include "mechanism_builders.h"
#include "solver_backend.hpp"

using namespace std;
using namespace model;



BuiltModel model::build_model(const RunSpecs& specs, const horizon::Sets& sets) {
    BuiltModel built;
    built.model = make_unique<DecisionModel>( create_solver(specs.scenario) );
    built.expressions = ExpressionAccumulator(sets, specs.exports_enabled());
    DecisionModel& dm          = *built.model;
    ExpressionAccumulator& acc = built.expressions;

    //
    // assets
    if (specs.solar.enabled)
        build_solar(dm, specs, sets, acc);
    if (specs.storage.enabled)
        build_storage(dm, specs, sets, acc);
    if (specs.demand.simple_shift_enabled)
        build_shiftable_demand(dm, specs, sets, acc);
    if (specs.demand.shed_enabled)
        build_sheddable_demand(dm, specs, sets, acc);

    //
    // mechanisms
    build_net_demand_bound(dm, sets, acc);
    build_energy_charge(dm, sets, acc);
    if (!sets.demand_periods.empty())
        build_demand_charge(dm, sets, acc);
    if (acc.exports_enabled)
        build_net_energy_metering(dm, specs, sets, acc);
    if (!sets.tier_bands.empty())
        build_tiered_energy_rate(dm, sets, acc);
    build_investment_costs(dm, specs, sets);

    return built;
}

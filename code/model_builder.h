/*
 * model_builder.h
 *
 * Composes the decision model of one optimization window
 * out of the asset and mechanism builders.
 *
 */

#ifndef MODEL_BUILDER_H
#define MODEL_BUILDER_H

#include <memory>

#include "horizon_sets.h"
#include "optimization_model.h"
#include "run_specification.h"


namespace model {

    /*!
     * A decision model together with its shared expressions.
     * The expressions refer to variables owned by the model, thus both share the same lifetime.
     */
    struct BuiltModel {
        std::unique_ptr<DecisionModel> model;
        ExpressionAccumulator expressions;
    };

    /**
     * Builds the decision model for one window.
     * The builders are called in the order: solar, storage, shiftable demand, sheddable demand,
     * net demand bound, energy charge, demand charge, net metering, tiered rates, investment costs.
     *
     * @throws ConfigurationError if the selected solver backend is not available
     */
    BuiltModel build_model(const RunSpecs& specs, const horizon::Sets& sets);

}

#endif

/*
 * run_specification.h
 *
 * Bundles the inputs and the validated specifications of one run,
 * i.e. one scenario or one case of a sensitivity analysis.
 *
 */

#ifndef RUN_SPECIFICATION_H
#define RUN_SPECIFICATION_H

#include <ostream>

#include "components.h"
#include "tariff.h"


/*!
 * All raw inputs of one run as read from the configuration.
 * A sensitivity analysis copies and modifies this struct per case.
 */
struct RunInputs {
    ScenarioInput scenario;
    TariffInput   tariff;
    DemandInput   demand;
    SolarInput    solar;
    StorageInput  storage;
};

/*!
 * All validated specifications of one run. They are read-only for the lifetime of the run.
 */
struct RunSpecs {
    ScenarioSpec scenario;
    TariffSpec   tariff;
    DemandSpec   demand;
    SolarSpec    solar;
    StorageSpec  storage;

    /// True if a total exports expression exists, i.e., net metering and solar PV are enabled
    bool exports_enabled() const { return tariff.nem_enabled && solar.enabled; }
    bool solar_exports() const   { return exports_enabled() && !solar.nonexport; }
    bool storage_exports() const { return exports_enabled() && storage.enabled && !storage.nonexport; }
};

/**
 * Validates all inputs and checks the combinations of settings across the components.
 *
 * @throws ConfigurationError e.g. if non-import storage is enabled without solar PV,
 *         or if the exports linkage in CEM misses the maximum capacity of an exporting asset
 */
RunSpecs make_run_specs(const RunInputs& inputs);

/**
 * Writes the resolved settings in a human-readable form (used for parameter-settings.txt)
 */
void output_run_specs(const RunSpecs& specs, std::ostream& out);

#endif

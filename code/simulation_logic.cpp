#include "simulation_logic.h"
using namespace simulation;

#include <algorithm>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "errors.h"
#include "global.h"
#include "helper.h"
#include "horizon_sets.h"
#include "model_builder.h"
#include "output.h"
#include "sensitivity_analysis.h"
#include "solver_backend.hpp"
#include "status_output.hpp"

using namespace std;
using global::OptimizationHorizon;
using operations_research::MPSolver;



namespace {

    /*
     * Returns the energy capacity of the battery that was used in the solved window
     */
    double bes_energy_capacity(const RunSpecs& specs, const model::DecisionModel& dm) {
        if (dm.has_scalar("bes_energy_capacity"))
            return dm.scalar_value("bes_energy_capacity");
        return specs.storage.energy_capacity.value_or(0.0);
    }

    /*
     * Computes the state for the next window out of the solution of the current one
     */
    void advance_state(horizon::WindowState& state, const RunSpecs& specs,
                       const horizon::Sets& sets, const model::DecisionModel& dm)
    {
        if (specs.storage.enabled) {
            const double E = bes_energy_capacity(specs, dm);
            if (E > 0.0) {
                const vector<double> soc = dm.series_values("e_bes_soc");
                state.bes_initial_soc = std::clamp(soc.back() / E, 0.0, 1.0);
            } else {
                state.bes_initial_soc = specs.storage.soc_initial;
            }
        }
        if (sets.window.horizon == OptimizationHorizon::Day) {
            for (const horizon::WindowDemandPeriod& p : sets.demand_periods) {
                if (p.category == tariffs::DemandCategory::DailyTOU)
                    continue;
                const string name = "d_max_" + p.name;
                if (dm.has_scalar(name))
                    state.monthly_max_demand[p.name] = dm.scalar_value(name);
            }
        }
    }

}


shared_ptr<results::SimulationResults> simulation::run_windows(const RunSpecs& specs,
                                                               const tariffs::CompiledTariff& compiled,
                                                               const char* output_prefix /* = "" */)
{
    const bool verbose = (output_prefix[0] == '\0');
    auto res = make_shared<results::SimulationResults>( results::initialize_results(specs) );
    const vector<horizon::HorizonWindow> windows = horizon::make_windows(specs.scenario);

    if (verbose)
        cout << "Run optimization for " << windows.size() << " window(s) ..." << endl;

    horizon::WindowState state;
    state.bes_initial_soc = specs.storage.soc_initial;

    for (const horizon::HorizonWindow& w : windows) {
        //
        // reset of the monthly peaks at a new month
        if (w.horizon == OptimizationHorizon::Day && state.month != w.month) {
            state.monthly_max_demand.clear();
            state.month = w.month;
        }
        horizon::Sets sets = horizon::create_sets(specs, compiled, w, state);
        model::BuiltModel built = model::build_model(specs, sets);
        //
        // solve
        const MPSolver::ResultStatus status = built.model->solve();
        const string status_str = model::status_to_string(status);
        if (status != MPSolver::OPTIMAL) {
            throw SolveError("The solver returned the status " + status_str + " for the window " + w.description + ".",
                             w.description, status_str, res);
        }
        results::extract_window(*res, specs, sets, built, status_str);
        global::n_windows_solved++;
        advance_state(state, specs, sets, *built.model);

        if (verbose && (w.horizon != OptimizationHorizon::Day || w.day == days_in_month(specs.scenario.year, w.month))) {
            cout << "  Window " << w.description << " solved (" << built.model->n_variables() << " variables, "
                 << built.model->n_constraints() << " constraints)" << endl;
        }
    }

    if (verbose) {
        cout << "... optimization finished." << "\n";
        cout << global::output_section_delimiter << endl;
    }
    return res;
}


CaseResults simulation::run_case(const RunInputs& inputs, const char* output_prefix /* = "" */) {
    CaseResults cr;
    cr.specs      = make_run_specs(inputs);
    cr.compiled   = tariffs::compile(cr.specs.tariff, cr.specs.scenario);
    cr.results    = run_windows(cr.specs, cr.compiled, output_prefix);
    cr.bill       = postprocessing::compute_electricity_bill(cr.specs, cr.compiled, *cr.results);
    cr.investment = postprocessing::compute_investment_costs(cr.specs, *cr.results);
    if (cr.bill.nem_revenue_capped) {
        cout << output_prefix << "Notice: The annual net metering revenue of " << cr.bill.nem_revenue_uncapped
             << " is capped to " << cr.bill.annual.nem_revenue << "." << endl;
    }
    return cr;
}


bool simulation::runCompleteSimulation(const RunInputs& inputs, unsigned long scenario_id,
                                       const sensitivity::SensitivityDefinition* sweep /* = NULL */)
{
    const filesystem::path scenario_dir = output::scenario_output_dir(scenario_id);
    if (!output::create_dir_del_if_exists(scenario_dir))
        return false;

    //
    // Case 1: One single run
    if (sweep == NULL) {
        try {
            CaseResults cr = run_case(inputs);
            cout << "Annual electricity bill: " << cr.bill.total() << endl;
            return output::write_case_results(scenario_dir, cr);
        } catch (const SolveError& e) {
            // keep what is known up to the failing window
            if (e.get_partial_results() != NULL && Global::get_ts_output())
                output::write_time_series(scenario_dir, *e.get_partial_results());
            throw;
        }
    }

    //
    // Case 2: Sensitivity analysis
    sensitivity::SensitivityResults sr = sensitivity::run_sensitivity_analysis(inputs, *sweep);
    bool ok = sr.failed.empty();
    for (const auto& [key, cr] : sr.cases) {
        const filesystem::path case_dir = scenario_dir / key;
        if (!output::create_dir_del_if_exists(case_dir) || !output::write_case_results(case_dir, cr))
            ok = false;
    }
    if (!output::write_sensitivity_summary(scenario_dir, sr))
        ok = false;
    for (const auto& [key, msg] : sr.failed)
        cerr << "Error in sensitivity case " << key << ": " << msg << endl;
    return ok;
}


int simulation::run_with_status_output(const std::function<bool()>& run) {
    if (Global::get_status_output())
        StatusOutput::initialize_ncurses();
    StatusOutput::start_status_updater_thread();
    int return_code = 0;
    try {
        if (!run()) {
            cerr << "Error during optimization run!" << endl;
            return_code = 3;
        }
    } catch (const ConfigurationError& e) {
        cerr << "Error in the configuration: " << e.what() << endl;
        return_code = 4;
    } catch (const CompilationError& e) {
        cerr << "Error when compiling the tariff: " << e.what() << endl;
        return_code = 4;
    } catch (const SolveError& e) {
        cerr << "Error when solving the window " << e.get_window() << " (solver status " << e.get_solver_status() << "): " << e.what() << endl;
        return_code = 3;
    } catch (const std::exception& e) {
        cerr << "Error during optimization run: " << e.what() << endl;
        return_code = 3;
    }
    StatusOutput::stop_status_updater_thread();
    StatusOutput::shutdown_ncurses();
    return return_code;
}

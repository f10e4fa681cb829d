#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "errors.h"
#include "global.h"
#include "helper.h"
#include "horizon_sets.h"
#include "mechanism_builders.h"
#include "model_builder.h"
#include "rate_profiles.h"
#include "results.h"
#include "run_specification.h"
#include "simulation_logic.h"
#include "solver_backend.hpp"
#include "status_output.hpp"

#include "test_common.h"

using operations_research::MPSolver;


namespace {

    /*
     * Builds and solves the model of one window
     */
    model::BuiltModel solve_window(const RunSpecs& specs, const tariffs::CompiledTariff& ct, size_t window_index, double initial_soc) {
        const std::vector<horizon::HorizonWindow> windows = horizon::make_windows(specs.scenario);
        horizon::WindowState state;
        state.bes_initial_soc = initial_soc;
        horizon::Sets sets = horizon::create_sets(specs, ct, windows.at(window_index), state);
        model::BuiltModel built = model::build_model(specs, sets);
        EXPECT_EQ(built.model->solve(), MPSolver::OPTIMAL);
        return built;
    }

    RunInputs storage_inputs() {
        RunInputs in = testing_inputs::flat_pcm_inputs(2023);
        in.tariff = testing_inputs::tou_tariff();
        in.tariff.monthly_maximum_demand_rates = std::map<std::string, double>{ {"summer", 15.0}, {"winter", 10.0} };
        in.storage.enabled        = true;
        in.storage.power_capacity = 2.0;
        in.storage.duration       = 4.0;
        in.storage.soc_min        = 0.1;
        in.storage.soc_max        = 0.9;
        in.storage.soc_initial    = 0.5;
        in.storage.charge_eff     = 0.95;
        in.storage.discharge_eff  = 0.95;
        return in;
    }

    RunInputs exporting_inputs() {
        RunInputs in = storage_inputs();
        in.solar.enabled = true;
        in.solar.capacity_factor_profile = testing_inputs::solar_profile(2023);
        in.solar.power_capacity = 10.0;
        in.tariff.nem_enabled = true;
        in.tariff.nem_version = 2;
        in.tariff.nem_non_bypassable_charge = 0.02;
        in.storage.nonexport = false;
        return in;
    }

    /*
     * Sizing of solar PV only, with a flat price
     */
    RunInputs cem_solar_inputs() {
        RunInputs in = testing_inputs::flat_pcm_inputs(2023, 0.20);
        in.scenario.problem_type = "CEM";
        in.solar.enabled = true;
        in.solar.capacity_factor_profile = testing_inputs::solar_profile(2023);
        in.solar.maximum_power_capacity = 1.5;
        in.solar.capital_cost           = 100.0;
        in.solar.fixed_om_cost          = 0.0;
        in.solar.lifespan               = 20;
        in.solar.investment_tax_credit  = 0.0;
        return in;
    }

    /*
     * Sizing of a 4 hour battery under a TOU tariff
     */
    RunInputs cem_storage_inputs() {
        RunInputs in = storage_inputs();
        in.scenario.problem_type = "CEM";
        in.tariff.monthly_maximum_demand_rates.reset();
        in.storage.power_capacity.reset();
        in.storage.maximum_power_capacity  = 0.5;
        in.storage.maximum_energy_capacity = 10.0;
        in.storage.duration           = 4.0;
        in.storage.soc_min            = 0.0;
        in.storage.soc_max            = 1.0;
        in.storage.power_capital_cost = 0.0;
        in.storage.lifespan           = 10;
        return in;
    }

}


TEST(DecisionModel, VariableRegistry) {
    RunSpecs specs = make_run_specs(testing_inputs::flat_pcm_inputs());
    model::DecisionModel dm( model::create_solver(specs.scenario) );
    const std::vector<model::MPVariable*>& x = dm.make_series("x", 3, 0.0, 1.0);
    EXPECT_EQ(x.size(), 3u);
    EXPECT_TRUE(dm.has_series("x"));
    EXPECT_FALSE(dm.has_scalar("x"));
    dm.make_scalar("y", 0.0, 5.0);
    EXPECT_TRUE(dm.has_scalar("y"));
    EXPECT_THROW(dm.series("z"), std::out_of_range);
    EXPECT_THROW(dm.scalar("z"), std::out_of_range);
    EXPECT_EQ(dm.n_variables(), 4);
}

TEST(ModelInvariants, BatteryBoundsAndTerminalSoc) {
    RunSpecs specs = make_run_specs(storage_inputs());
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    model::BuiltModel built = solve_window(specs, ct, 6, 0.5); // July

    const double E = 8.0;
    const std::vector<double> soc  = built.model->series_values("e_bes_soc");
    const std::vector<double> ch   = built.model->series_values("p_bes_ch");
    const std::vector<double> dis  = built.model->series_values("p_bes_dis_btm");
    ASSERT_EQ(soc.size(), 31u * 24u);
    for (size_t t = 0; t < soc.size(); t++) {
        EXPECT_GE(soc[t], 0.1 * E - 1e-6);
        EXPECT_LE(soc[t], 0.9 * E + 1e-6);
        EXPECT_LE(ch[t],  2.0 + 1e-6);
        EXPECT_LE(dis[t], 2.0 + 1e-6);
        EXPECT_GE(built.expressions.net_demand[t].SolutionValue(), -1e-6);
    }
    EXPECT_GE(soc.back(), 0.5 * E - 1e-6);

    // the peak variable bounds the net demand of the month
    const double peak = built.model->scalar_value("d_max_monthly_maximum_7");
    for (size_t t = 0; t < soc.size(); t++)
        EXPECT_LE(built.expressions.net_demand[t].SolutionValue(), peak + 1e-6);
    // the battery cannot discharge below its initial level over the month, thus the base demand stays the lower bound
    EXPECT_GE(peak, 1.0 - 1e-6);
}

TEST(ModelInvariants, NetDemandNonNegativeWithExports) {
    RunInputs in = storage_inputs();
    in.solar.enabled = true;
    in.solar.capacity_factor_profile = testing_inputs::solar_profile(2023);
    in.solar.power_capacity = 10.0;
    in.tariff.nem_enabled = true;
    in.tariff.nem_version = 2;
    in.tariff.nem_non_bypassable_charge = 0.02;
    in.storage.nonexport = false;
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    model::BuiltModel built = solve_window(specs, ct, 5, 0.5); // June

    ASSERT_TRUE(built.expressions.exports_enabled);
    double exported = 0.0;
    for (size_t t = 0; t < built.expressions.net_demand.size(); t++) {
        const double nd = built.expressions.net_demand[t].SolutionValue();
        const double ex = built.expressions.exports[t].SolutionValue();
        EXPECT_GE(nd, -1e-6);
        EXPECT_GE(ex, -1e-6);
        exported += ex;
    }
    // the PV surplus (5 kW available, 1 kW demand) is exported
    EXPECT_GT(exported, 0.0);
}

TEST(ModelObjective, FlatRateSolar) {
    RunInputs in = testing_inputs::flat_pcm_inputs(2023, 0.20);
    in.solar.enabled = true;
    in.solar.capacity_factor_profile = testing_inputs::solar_profile(2023);
    in.solar.power_capacity = 10.0;
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    std::shared_ptr<results::SimulationResults> res = simulation::run_windows(specs, ct, "[test] ");

    // 0.2 * sum(max(d - min(cf * 10, d), 0)) with d = 1 and cf * 10 = 5 during 6 hours per day
    double expected = 0.0;
    for (size_t t = 0; t < specs.demand.demand.size(); t++) {
        const double d = specs.demand.demand[t];
        expected += 0.20 * std::max(d - std::min(specs.solar.capacity_factor[t] * 10.0, d), 0.0);
    }
    EXPECT_NEAR(expected, 0.20 * (8760.0 - 6.0 * 365.0), 1e-6);
    EXPECT_NEAR(res->total_objective_value(), expected, 1e-4);
    EXPECT_EQ(res->windows.size(), 12u);
    EXPECT_EQ(res->n_timesteps, 8760u);
    EXPECT_EQ(res->column("net_demand").size(), 8760u);
    EXPECT_DOUBLE_EQ(res->pv_capacity, 10.0);
}

TEST(ModelObjective, DayHorizonCarriesStorageState) {
    RunInputs in = storage_inputs();
    in.scenario.optimization_horizon = "DAY";
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    std::shared_ptr<results::SimulationResults> res = simulation::run_windows(specs, ct, "[test] ");
    ASSERT_EQ(res->windows.size(), 365u);
    const std::vector<double>& soc = res->column("bes_state_of_charge");
    ASSERT_EQ(soc.size(), 8760u);
    // the terminal guard keeps the charge level from one day to the next
    for (size_t d = 1; d < 365; d++)
        EXPECT_GE(soc[d * 24 - 1], 0.5 * 8.0 - 1e-6);
}

TEST(ModelObjective, InfeasibleWindowRaisesSolveError) {
    RunInputs in = storage_inputs();
    // the initial charge is below the minimum and the battery cannot be charged
    in.storage.charge_eff  = 0.0;
    in.storage.soc_min     = 0.9;
    in.storage.soc_max     = 1.0;
    in.storage.soc_initial = 0.5;
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    try {
        simulation::run_windows(specs, ct, "[test] ");
        FAIL() << "SolveError expected";
    } catch (const SolveError& e) {
        EXPECT_EQ(e.get_window(), "2023-01");
        EXPECT_NE(e.get_solver_status(), "OPTIMAL");
        ASSERT_NE(e.get_partial_results(), nullptr);
        EXPECT_EQ(e.get_partial_results()->n_timesteps, 0u);
    }
}


TEST(ModelLinkage, ExportsOnlyWithoutNetDemand) {
    RunInputs in = exporting_inputs();
    in.scenario.binary_net_demand_and_exports_linkage = true;
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    model::BuiltModel built = solve_window(specs, ct, 5, 0.5); // June

    const std::vector<double> zeta = built.model->series_values("zeta_net_demand");
    ASSERT_EQ(zeta.size(), built.expressions.net_demand.size());
    size_t n_exporting = 0;
    for (size_t t = 0; t < zeta.size(); t++) {
        const double nd = built.expressions.net_demand[t].SolutionValue();
        const double ex = built.expressions.exports[t].SolutionValue();
        if (ex > 1e-6) {
            EXPECT_LE(nd, 1e-6) << "time step " << t;
            EXPECT_NEAR(zeta[t], 1.0, 1e-6);
            n_exporting++;
        }
        // zeta = 1 only if the net demand is zero
        if (zeta[t] > 0.5)
            EXPECT_LE(nd, 1e-6);
    }
    EXPECT_GT(n_exporting, 0u);
}

TEST(ModelLinkage, RelaxedIndicatorStaysInUnitInterval) {
    RunInputs in = exporting_inputs();
    in.scenario.binary_net_demand_and_exports_linkage = false;
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    model::BuiltModel built = solve_window(specs, ct, 5, 0.5);

    const std::vector<double> zeta = built.model->series_values("zeta_net_demand");
    for (size_t t = 0; t < zeta.size(); t++) {
        EXPECT_GE(zeta[t], -1e-6);
        EXPECT_LE(zeta[t], 1.0 + 1e-6);
        // the exports are bounded by zeta times the export capacities (10 kW PV, 2 kW storage)
        EXPECT_LE(built.expressions.exports[t].SolutionValue(), zeta[t] * built.expressions.exports_upper_bound + 1e-6);
    }
}

TEST(CapacityExpansion, SolarCapacityAtMaximum) {
    RunSpecs specs = make_run_specs(cem_solar_inputs());
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    const horizon::HorizonWindow january = horizon::make_windows(specs.scenario).at(0);
    horizon::Sets sets = horizon::create_sets(specs, ct, january, horizon::WindowState());
    model::BuiltModel built = model::build_model(specs, sets);
    ASSERT_EQ(built.model->solve(), MPSolver::OPTIMAL);

    // the annualized capital cost (100 / 20 per kW and year) is far below the savings
    const double capacity = built.model->scalar_value("pv_capacity");
    EXPECT_NEAR(capacity, 1.5, 1e-6);

    double energy_cost = 0.0;
    for (size_t t = 0; t < sets.T; t++)
        energy_cost += 0.20 * (sets.demand[t] - sets.capacity_factor[t] * specs.solar.inverter_eff * 1.5);
    const double crf = model::capital_recovery_factor(specs.scenario, 20);
    EXPECT_DOUBLE_EQ(crf, 0.05);
    EXPECT_NEAR(sets.year_share, 31.0 / 365.0, 1e-12);
    EXPECT_NEAR(built.model->objective_value(), energy_cost + sets.year_share * 100.0 * crf * 1.5, 1e-4);
}

TEST(CapacityExpansion, ExpensiveSolarIsNotBuilt) {
    RunInputs in = cem_solar_inputs();
    in.solar.capital_cost = 1.0e5;
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    model::BuiltModel built = solve_window(specs, ct, 0, 0.5);
    EXPECT_NEAR(built.model->scalar_value("pv_capacity"), 0.0, 1e-6);
    EXPECT_NEAR(built.model->objective_value(), 0.20 * 31.0 * 24.0, 1e-4);
}

TEST(CapacityExpansion, CapitalRecoveryFactor) {
    ScenarioSpec scenario;
    EXPECT_DOUBLE_EQ(model::capital_recovery_factor(scenario, 25), 1.0 / 25.0);
    scenario.amortization_period = 10;
    EXPECT_DOUBLE_EQ(model::capital_recovery_factor(scenario, 25), 0.1);
    scenario.real_discount_rate = 0.05;
    EXPECT_DOUBLE_EQ(model::capital_recovery_factor(scenario, 25), annuity_factor(0.05, 10));
    scenario.amortization_period.reset();
    EXPECT_THROW(model::capital_recovery_factor(scenario, 0), ConfigurationError);
}

TEST(CapacityExpansion, StorageEnergyFollowsDuration) {
    RunSpecs specs = make_run_specs(cem_storage_inputs());
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    model::BuiltModel built = solve_window(specs, ct, 0, 0.5);

    const double power  = built.model->scalar_value("bes_power_capacity");
    const double energy = built.model->scalar_value("bes_energy_capacity");
    // free storage pays off by shifting energy from off-peak to peak hours
    EXPECT_NEAR(power, 0.5, 1e-6);
    EXPECT_NEAR(energy, 4.0 * power, 1e-6);

    const std::vector<double> ch  = built.model->series_values("p_bes_ch");
    const std::vector<double> soc = built.model->series_values("e_bes_soc");
    for (size_t t = 0; t < ch.size(); t++) {
        EXPECT_LE(ch[t], power + 1e-6);
        EXPECT_LE(soc[t], energy + 1e-6);
    }
}

TEST(CapacityExpansion, NoSolarCapacityNoExports) {
    RunInputs in = cem_storage_inputs();
    in.storage.maximum_power_capacity = 2.0;
    in.storage.nonexport = false;
    in.solar.enabled = true;
    in.solar.capacity_factor_profile = testing_inputs::solar_profile(2023);
    in.solar.maximum_power_capacity = 0.0;
    in.solar.capital_cost = 100.0;
    in.solar.lifespan     = 20;
    in.tariff.nem_enabled = true;
    in.tariff.nem_version = 2;
    in.tariff.nem_non_bypassable_charge = 0.02;
    in.scenario.binary_pv_capacity_and_exports_linkage = true;
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    model::BuiltModel built = solve_window(specs, ct, 5, 0.5);

    EXPECT_NEAR(built.model->scalar_value("pv_capacity"), 0.0, 1e-9);
    EXPECT_NEAR(built.model->scalar_value("zeta_pv_capacity"), 1.0, 1e-6);
    for (size_t t = 0; t < built.expressions.exports.size(); t++)
        EXPECT_LE(built.expressions.exports[t].SolutionValue(), 1e-6) << "time step " << t;

    // with a free PV system, the surplus is exported
    in.solar.maximum_power_capacity = 10.0;
    in.solar.capital_cost = 0.0;
    specs = make_run_specs(in);
    ct = tariffs::compile(specs.tariff, specs.scenario);
    built = solve_window(specs, ct, 5, 0.5);
    EXPECT_NEAR(built.model->scalar_value("zeta_pv_capacity"), 0.0, 1e-6);
    double exported = 0.0;
    for (size_t t = 0; t < built.expressions.exports.size(); t++)
        exported += built.expressions.exports[t].SolutionValue();
    EXPECT_GT(exported, 1.0);
}

TEST(DemandFlexibility, ShiftableDemandInvariants) {
    RunInputs in = testing_inputs::flat_pcm_inputs(2023);
    in.tariff = testing_inputs::tou_tariff();
    in.demand.simple_shift_enabled = true;
    in.demand.shift_percent  = 0.2;
    in.demand.shift_duration = 4.0;
    RunSpecs specs = make_run_specs(in);
    ASSERT_EQ(specs.demand.shift_duration, 4u);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    model::BuiltModel built = solve_window(specs, ct, 6, 0.5); // July, first time step 4344

    const size_t first = 181 * 24;
    const std::vector<double> up   = built.model->series_values("d_dev_up");
    const std::vector<double> down = built.model->series_values("d_dev_down");
    ASSERT_EQ(up.size(), 31u * 24u);
    double total = 0.0;
    for (size_t t = 0; t < up.size(); t++) {
        total += up[t] - down[t];
        EXPECT_GE(up[t], -1e-6);
        EXPECT_GE(down[t], -1e-6);
        EXPECT_LE(up[t],   specs.demand.shift_up_capacity[first + t] + 1e-6);
        EXPECT_LE(down[t], -specs.demand.shift_down_capacity[first + t] + 1e-6);
    }
    EXPECT_NEAR(total, 0.0, 1e-5);
    // every window of the shift duration ends without a net curtailment
    const size_t D = specs.demand.shift_duration;
    for (size_t s = 0; s + D <= up.size(); s++) {
        double window_sum = 0.0;
        for (size_t t = s; t < s + D; t++)
            window_sum += up[t] - down[t];
        EXPECT_GE(window_sum, -1e-6) << "window starting at " << s;
    }
}

TEST(DemandFlexibility, SheddingBelowEnergyPrice) {
    RunInputs in = testing_inputs::flat_pcm_inputs(2023, 0.20);
    in.demand.shed_enabled = true;
    in.demand.value_of_lost_load = 0.1;
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    model::BuiltModel built = solve_window(specs, ct, 0, 0.5);

    const std::vector<double> shed = built.model->series_values("d_shed");
    double shed_total = 0.0;
    for (size_t t = 0; t < shed.size(); t++) {
        EXPECT_GE(shed[t], -1e-6);
        EXPECT_LE(shed[t], specs.demand.demand[t] + 1e-6);
        shed_total += shed[t];
    }
    // shedding is cheaper than buying, thus all demand is shed
    EXPECT_NEAR(shed_total, 31.0 * 24.0, 1e-4);
    EXPECT_NEAR(built.model->objective_value(), 1.0 * 0.1 * shed_total, 1e-4);

    // with a high value of lost load nothing is shed
    in.demand.value_of_lost_load = 0.5;
    specs = make_run_specs(in);
    built = solve_window(specs, ct, 0, 0.5);
    const std::vector<double> no_shed = built.model->series_values("d_shed");
    for (double v : no_shed)
        EXPECT_NEAR(v, 0.0, 1e-6);
    EXPECT_NEAR(built.model->objective_value(), 0.20 * 31.0 * 24.0, 1e-4);
}

TEST(ModelInvariants, NonImportStorageChargesFromSolar) {
    RunInputs in = storage_inputs();
    in.solar.enabled = true;
    in.solar.capacity_factor_profile = testing_inputs::solar_profile(2023);
    in.solar.power_capacity = 2.0;
    in.storage.nonimport = true;
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    model::BuiltModel built = solve_window(specs, ct, 6, 0.5);

    const std::vector<double> ch = built.model->series_values("p_bes_ch");
    const std::vector<double> pv = built.model->series_values("p_pv_btm");
    for (size_t t = 0; t < ch.size(); t++)
        EXPECT_LE(ch[t], pv[t] + 1e-6) << "time step " << t;
}

TEST(ModelInvariants, TieredEnergyBalance) {
    RunInputs in = testing_inputs::flat_pcm_inputs(2023, 0.20);
    TierEntry t1; t1.lower_bound = 0.0;   t1.price = 0.0;
    TierEntry t2; t2.lower_bound = 300.0; t2.price = 0.1;
    in.tariff.energy_tiered_rates = std::vector<TierEntry>{ t1, t2 };
    in.tariff.energy_tiered_baseline_type = "monthly";
    in.scenario.optimization_horizon = "YEAR";
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    horizon::Sets sets = horizon::create_sets(specs, ct, horizon::make_windows(specs.scenario).at(0), horizon::WindowState());
    model::BuiltModel built = model::build_model(specs, sets);
    ASSERT_EQ(built.model->solve(), MPSolver::OPTIMAL);

    ASSERT_EQ(sets.months.size(), 12u);
    double expected_objective = 0.0;
    for (const horizon::MonthRange& mr : sets.months) {
        const std::string m = std::to_string(mr.month);
        const double e1 = built.model->scalar_value("e_tier_" + m + "_1");
        const double e2 = built.model->scalar_value("e_tier_" + m + "_2");
        double month_energy = 0.0;
        for (size_t t = mr.first; t < mr.first + mr.count; t++)
            month_energy += sets.dt * built.expressions.net_demand[t].SolutionValue();
        EXPECT_NEAR(e1 + e2, month_energy, 1e-5) << "month " << m;
        EXPECT_GE(e1, -1e-6);
        EXPECT_LE(e1, 300.0 + 1e-6);
        EXPECT_GE(e2, -1e-6);
        // the cheaper tier is filled first
        EXPECT_NEAR(e1, 300.0, 1e-5);
        expected_objective += 0.20 * month_energy + 0.1 * (month_energy - 300.0);
    }
    EXPECT_NEAR(built.model->objective_value(), expected_objective, 1e-3);
}

TEST(RunWithStatusOutput, ErrorsMappedToReturnCodes) {
    Global::UnlockAllVariables();
    Global::set_status_output(false);

    EXPECT_EQ(simulation::run_with_status_output([]() { return true; }), 0);
    EXPECT_EQ(simulation::run_with_status_output([]() { return false; }), 3);
    EXPECT_EQ(simulation::run_with_status_output([]() -> bool { throw ConfigurationError("bad value"); }), 4);
    EXPECT_EQ(simulation::run_with_status_output([]() -> bool { throw CompilationError("gap in the rate table"); }), 4);
    EXPECT_EQ(simulation::run_with_status_output([]() -> bool {
        throw SolveError("infeasible", "2023-01", "INFEASIBLE", nullptr);
    }), 3);
    EXPECT_FALSE(StatusOutput::is_updater_running());

    // other exceptions do not escape and the status updater is stopped
    EXPECT_EQ(simulation::run_with_status_output([]() -> bool {
        throw std::filesystem::filesystem_error("cannot create directory", std::filesystem::path("/nonexistent/out"),
                                                std::make_error_code(std::errc::permission_denied));
    }), 3);
    EXPECT_FALSE(StatusOutput::is_updater_running());
    EXPECT_FALSE(StatusOutput::is_ncurses_initialized());
    Global::UnlockAllVariables();
}

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "errors.h"
#include "helper.h"
#include "horizon_sets.h"
#include "rate_profiles.h"
#include "run_specification.h"

#include "test_common.h"

using testing_inputs::rate;


TEST(HorizonWindows, DayMonthYear) {
    RunInputs in = testing_inputs::flat_pcm_inputs(2024);

    in.scenario.optimization_horizon = "DAY";
    std::vector<horizon::HorizonWindow> days = horizon::make_windows(make_run_specs(in).scenario);
    ASSERT_EQ(days.size(), 366u);
    EXPECT_EQ(days[59].description, "2024-02-29");
    EXPECT_EQ(days[59].first_timestep, 59u * 24u);
    EXPECT_EQ(days[59].n_timesteps, 24u);

    in.scenario.optimization_horizon = "MONTH";
    std::vector<horizon::HorizonWindow> months = horizon::make_windows(make_run_specs(in).scenario);
    ASSERT_EQ(months.size(), 12u);
    EXPECT_EQ(months[1].n_timesteps, 29u * 24u);
    EXPECT_EQ(months[2].first_timestep, 60u * 24u);
    EXPECT_EQ(months[3].description, "2024-04");
    size_t covered = 0;
    for (const horizon::HorizonWindow& w : months) {
        EXPECT_EQ(w.first_timestep, covered);
        covered += w.n_timesteps;
    }
    EXPECT_EQ(covered, 8784u);

    in.scenario.optimization_horizon = "YEAR";
    std::vector<horizon::HorizonWindow> year = horizon::make_windows(make_run_specs(in).scenario);
    ASSERT_EQ(year.size(), 1u);
    EXPECT_EQ(year[0].n_timesteps, 8784u);
    EXPECT_EQ(year[0].description, "2024");
}

TEST(HorizonSets, SlicesAndScalesPrices) {
    RunInputs in = testing_inputs::flat_pcm_inputs(2023, 0.2);
    in.tariff.all_charge_scaling    = 2.0;
    in.tariff.energy_charge_scaling = 1.5;
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    std::vector<horizon::HorizonWindow> windows = horizon::make_windows(specs.scenario);

    horizon::WindowState state;
    state.bes_initial_soc = 0.7;
    horizon::Sets sets = horizon::create_sets(specs, ct, windows[1], state);
    EXPECT_EQ(sets.T, 28u * 24u);
    EXPECT_DOUBLE_EQ(sets.dt, 1.0);
    EXPECT_DOUBLE_EQ(sets.bes_initial_soc, 0.7);
    EXPECT_EQ(sets.demand.size(), sets.T);
    EXPECT_NEAR(sets.energy_prices[5], 0.6, 1e-12);
    EXPECT_NEAR(sets.year_share, 672.0 / 8760.0, 1e-12);
    EXPECT_TRUE(sets.nem_prices.empty());
    ASSERT_EQ(sets.months.size(), 1u);
    EXPECT_EQ(sets.months[0].month, 2u);
}

TEST(HorizonSets, TouScalingFactor) {
    RunInputs in = testing_inputs::flat_pcm_inputs();
    in.tariff = testing_inputs::tou_tariff();
    in.tariff.tou_energy_charge_scaling = 1.5;
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);

    EXPECT_DOUBLE_EQ(horizon::tou_scaling_factor(0, specs.tariff, ct), 1.0);
    EXPECT_DOUBLE_EQ(horizon::tou_scaling_factor(1, specs.tariff, ct), 1.5);
    // summer partial-peak: the price keeps its relative position between off-peak and the scaled peak
    const double r        = (0.30 - 0.20) / (0.50 - 0.20);
    const double expected = (r * (1.5 * 0.50 - 0.20) + 0.20) / 0.30;
    EXPECT_NEAR(horizon::tou_scaling_factor(2, specs.tariff, ct), expected, 1e-12);

    // a season without partial-peak label cannot be scaled
    in.tariff = testing_inputs::flat_tariff(0.2);
    in.tariff.energy_tou_rates = std::vector<RateEntry>{ rate("", 0, 16, 0.2, "off-peak"), rate("", 16, 24, 0.4, "partial-peak") };
    in.tariff.tou_energy_charge_scaling = 1.5;
    specs = make_run_specs(in);
    ct = tariffs::compile(specs.tariff, specs.scenario);
    EXPECT_THROW(horizon::tou_scaling_factor(2, specs.tariff, ct), CompilationError);
}

TEST(HorizonSets, DayWindowCarriesMonthlyPeak) {
    RunInputs in = testing_inputs::flat_pcm_inputs(2023);
    in.scenario.optimization_horizon = "DAY";
    in.tariff.monthly_maximum_demand_rates = std::map<std::string, double>{ {"base", 31.0} };
    in.tariff.daily_demand_tou_rates = std::vector<RateEntry>{ rate("", 16, 21, 2.0, "peak") };
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    std::vector<horizon::HorizonWindow> windows = horizon::make_windows(specs.scenario);

    horizon::WindowState state;
    state.month = 1;
    state.monthly_max_demand["monthly_maximum_1"] = 3.5;
    horizon::Sets sets = horizon::create_sets(specs, ct, windows[4], state); // 2023-01-05
    ASSERT_EQ(sets.demand_periods.size(), 2u);
    for (const horizon::WindowDemandPeriod& p : sets.demand_periods) {
        if (p.category == tariffs::DemandCategory::MonthlyMaximum) {
            // the monthly rate is spread over the days of the month
            EXPECT_NEAR(p.price, 1.0, 1e-12);
            ASSERT_TRUE(p.previous_max.has_value());
            EXPECT_DOUBLE_EQ(p.previous_max.value(), 3.5);
            EXPECT_EQ(p.timesteps.size(), 24u);
        } else {
            EXPECT_EQ(p.category, tariffs::DemandCategory::DailyTOU);
            EXPECT_DOUBLE_EQ(p.price, 2.0);
            EXPECT_FALSE(p.previous_max.has_value());
            EXPECT_EQ(p.timesteps.front(), 16u);
            EXPECT_EQ(p.timesteps.size(), 5u);
        }
    }

    // a state of another month is not carried
    state.month = 12;
    sets = horizon::create_sets(specs, ct, windows[4], state);
    for (const horizon::WindowDemandPeriod& p : sets.demand_periods)
        EXPECT_FALSE(p.previous_max.has_value());
}

TEST(HorizonSets, TierBoundsFollowBaselineType) {
    RunInputs in = testing_inputs::flat_pcm_inputs(2023);
    TierEntry t1; t1.lower_bound = 0.0;  t1.price = 0.0;
    TierEntry t2; t2.lower_bound = 10.0; t2.price = 0.1;
    in.tariff.energy_tiered_rates = std::vector<TierEntry>{ t1, t2 };

    // daily baseline in a MONTH window: bounds are multiplied by the days of the month
    in.tariff.energy_tiered_baseline_type = "daily";
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    horizon::Sets sets = horizon::create_sets(specs, ct, horizon::make_windows(specs.scenario)[3], horizon::WindowState());
    ASSERT_EQ(sets.tier_bands.size(), 2u);
    EXPECT_DOUBLE_EQ(sets.tier_bands[0].upper_bound.value(), 300.0);
    EXPECT_DOUBLE_EQ(sets.tier_bands[1].lower_bound, 300.0);

    // monthly baseline in a DAY window: bounds are divided by the days of the month
    in.tariff.energy_tiered_baseline_type = "monthly";
    in.scenario.optimization_horizon = "DAY";
    specs = make_run_specs(in);
    ct = tariffs::compile(specs.tariff, specs.scenario);
    sets = horizon::create_sets(specs, ct, horizon::make_windows(specs.scenario)[0], horizon::WindowState());
    ASSERT_EQ(sets.tier_bands.size(), 2u);
    EXPECT_NEAR(sets.tier_bands[0].upper_bound.value(), 10.0 / 31.0, 1e-12);

    // YEAR window: one range and one set of bands per month
    in.scenario.optimization_horizon = "YEAR";
    specs = make_run_specs(in);
    ct = tariffs::compile(specs.tariff, specs.scenario);
    sets = horizon::create_sets(specs, ct, horizon::make_windows(specs.scenario)[0], horizon::WindowState());
    ASSERT_EQ(sets.months.size(), 12u);
    EXPECT_EQ(sets.months[11].first + sets.months[11].count, 8760u);
    EXPECT_EQ(sets.tier_bands.size(), 24u);
}

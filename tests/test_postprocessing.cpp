#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "postprocessing.h"
#include "rate_profiles.h"
#include "results.h"
#include "run_specification.h"

#include "test_common.h"


namespace {

    /*
     * Results with a constant net demand and constant exports, without any solver call
     */
    results::SimulationResults synthetic_results(const RunSpecs& specs, const tariffs::CompiledTariff& ct,
                                                 double net_demand, double exports)
    {
        results::SimulationResults res = results::initialize_results(specs);
        const size_t n  = specs.scenario.n_timesteps();
        res.n_timesteps = n;
        for (const std::string& c : res.columns)
            res.time_series[c].assign(n, 0.0);
        res.time_series["net_demand"].assign(n, net_demand);
        res.time_series["energy_prices"] = ct.energy_prices;
        if (res.has_column("net_exports")) {
            res.time_series["net_exports"].assign(n, exports);
            res.time_series["export_prices"] = ct.nem_prices;
        }
        return res;
    }

    RunInputs nem_inputs(int nem_version) {
        RunInputs in = testing_inputs::flat_pcm_inputs(2023, 0.20);
        in.solar.enabled = true;
        in.solar.capacity_factor_profile = testing_inputs::solar_profile(2023);
        in.solar.power_capacity = 10.0;
        in.tariff.nem_enabled = true;
        in.tariff.nem_version = nem_version;
        if (nem_version != 1)
            in.tariff.nem_non_bypassable_charge = 0.02;
        in.tariff.customer_charge_daily   = 0.5;
        in.tariff.customer_charge_monthly = 10.0;
        return in;
    }

}


TEST(ElectricityBill, EnergyAndCustomerCharges) {
    RunSpecs specs = make_run_specs(nem_inputs(2));
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    postprocessing::ElectricityBill bill = postprocessing::compute_electricity_bill(specs, ct, synthetic_results(specs, ct, 1.0, 0.0));

    EXPECT_NEAR(bill.annual.energy_charge, 0.20 * 8760.0, 1e-6);
    EXPECT_NEAR(bill.monthly[1].energy_charge, 0.20 * 28.0 * 24.0, 1e-6);
    EXPECT_NEAR(bill.annual.customer_charge, 0.5 * 365.0 + 120.0, 1e-6);
    EXPECT_NEAR(bill.monthly[0].customer_charge, 0.5 * 31.0 + 10.0, 1e-9);
    EXPECT_NEAR(bill.annual.non_bypassable_charge, 0.02 * 8760.0, 1e-6);
    EXPECT_DOUBLE_EQ(bill.annual.nem_revenue, 0.0);
    EXPECT_FALSE(bill.nem_revenue_capped);
    EXPECT_NEAR(bill.total(), 0.20 * 8760.0 + 0.5 * 365.0 + 120.0, 1e-6);
}

TEST(ElectricityBill, NemRevenueIsCappedByEnergyChargeMinusNbc) {
    RunSpecs specs = make_run_specs(nem_inputs(2));
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    postprocessing::ElectricityBill bill = postprocessing::compute_electricity_bill(specs, ct, synthetic_results(specs, ct, 1.0, 10.0));

    // the revenue is valued at the export price plus the non-bypassable charge
    EXPECT_NEAR(bill.nem_revenue_uncapped, 10.0 * 0.20 * 8760.0, 1e-4);
    const double cap = 0.20 * 8760.0 - 0.02 * 8760.0;
    EXPECT_NEAR(bill.annual.nem_revenue, cap, 1e-6);
    EXPECT_TRUE(bill.nem_revenue_capped);
    EXPECT_NEAR(bill.total(), 0.20 * 8760.0 + 0.5 * 365.0 + 120.0 - cap, 1e-6);
}

TEST(ElectricityBill, NemVersionOneCapIsEnergyCharge) {
    RunSpecs specs = make_run_specs(nem_inputs(1));
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    postprocessing::ElectricityBill bill = postprocessing::compute_electricity_bill(specs, ct, synthetic_results(specs, ct, 1.0, 10.0));
    EXPECT_NEAR(bill.annual.nem_revenue, 0.20 * 8760.0, 1e-6);
    EXPECT_TRUE(bill.nem_revenue_capped);
    EXPECT_DOUBLE_EQ(bill.annual.non_bypassable_charge, 0.0);

    // small exports are not capped
    bill = postprocessing::compute_electricity_bill(specs, ct, synthetic_results(specs, ct, 1.0, 0.5));
    EXPECT_FALSE(bill.nem_revenue_capped);
    EXPECT_NEAR(bill.annual.nem_revenue, 0.5 * 0.20 * 8760.0, 1e-6);
}

TEST(ElectricityBill, DemandAndTieredCharges) {
    RunInputs in = testing_inputs::flat_pcm_inputs(2023, 0.20);
    in.tariff.monthly_maximum_demand_rates = std::map<std::string, double>{ {"base", 10.0} };
    in.tariff.demand_charge_scaling = 2.0;
    RunSpecs specs = make_run_specs(in);
    tariffs::CompiledTariff ct = tariffs::compile(specs.tariff, specs.scenario);
    results::SimulationResults res = synthetic_results(specs, ct, 1.0, 0.0);
    res.time_series["net_demand"][100] = 3.0; // January
    results::TieredResult tr;
    tr.month  = 3;
    tr.tier   = 2;
    tr.energy = 50.0;
    tr.price  = 0.1;
    res.tiered.push_back(tr);

    postprocessing::ElectricityBill bill = postprocessing::compute_electricity_bill(specs, ct, res);
    EXPECT_NEAR(bill.monthly[0].demand_charge, 2.0 * 10.0 * 3.0, 1e-9);
    EXPECT_NEAR(bill.monthly[1].demand_charge, 2.0 * 10.0 * 1.0, 1e-9);
    EXPECT_NEAR(bill.annual.demand_charge, 60.0 + 11.0 * 20.0, 1e-9);
    EXPECT_NEAR(bill.monthly[2].tiered_charge, 5.0, 1e-9);
    EXPECT_NEAR(bill.annual.tiered_charge, 5.0, 1e-9);
}

TEST(InvestmentCosts, CapacityExpansionOnly) {
    RunInputs in = testing_inputs::flat_pcm_inputs(2023);
    in.solar.enabled = true;
    in.solar.capacity_factor_profile = testing_inputs::solar_profile(2023);
    in.solar.power_capacity = 4.0;
    RunSpecs pcm = make_run_specs(in);
    EXPECT_TRUE(postprocessing::compute_investment_costs(pcm, results::initialize_results(pcm)).empty());

    in.scenario.problem_type = "CEM";
    in.solar.power_capacity.reset();
    in.solar.capital_cost          = 1000.0;
    in.solar.linked_cost_scaling   = 1.2;
    in.solar.fixed_om_cost         = 20.0;
    in.solar.lifespan              = 20;
    in.solar.investment_tax_credit = 0.3;
    RunSpecs cem = make_run_specs(in);
    results::SimulationResults res = results::initialize_results(cem);
    res.pv_capacity = 4.0;

    std::vector<postprocessing::InvestmentCost> costs = postprocessing::compute_investment_costs(cem, res);
    ASSERT_EQ(costs.size(), 1u);
    const postprocessing::InvestmentCost& ic = costs[0];
    EXPECT_EQ(ic.asset, "solar");
    EXPECT_DOUBLE_EQ(ic.capital_cost_per_kw, 1200.0);
    EXPECT_DOUBLE_EQ(ic.total_capital_cost, 4800.0);
    // without discount rate, the capital cost is spread evenly over the lifespan
    EXPECT_NEAR(ic.amortized_capital_cost, 240.0, 1e-9);
    EXPECT_DOUBLE_EQ(ic.total_om_cost, 80.0);
    EXPECT_NEAR(ic.total_itc, 1440.0, 1e-9);
    EXPECT_NEAR(ic.amortized_itc, 72.0, 1e-9);
}

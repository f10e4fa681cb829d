#include "postprocessing.h"

#include <algorithm>
#include <string>
#include <vector>

#include "helper.h"
#include "mechanism_builders.h"

using namespace std;
using namespace postprocessing;



ElectricityBill postprocessing::compute_electricity_bill(const RunSpecs& specs, const tariffs::CompiledTariff& compiled,
                                                         const results::SimulationResults& res)
{
    const TariffSpec& tariff = specs.tariff;
    const int year           = specs.scenario.year;
    const unsigned int il    = specs.scenario.interval_length;
    const double dt          = specs.scenario.interval_in_h();
    const size_t n           = res.n_timesteps;
    const double nbc         = (tariff.nem_enabled && tariff.nem_version != 1) ? tariff.nem_non_bypassable_charge : 0.0;
    const bool has_exports   = res.has_column("net_exports");

    const vector<double>& net_demand = res.column("net_demand");
    const vector<double>& prices     = res.column("energy_prices");

    ElectricityBill bill;
    //
    // energy, non-bypassable charge and net metering revenue
    for (size_t t = 0; t < n; t++) {
        BillComponents& mc = bill.monthly[timestep_to_datetime(year, il, t).month - 1];
        mc.energy_charge += net_demand[t] * prices[t] * dt;
        if (tariff.nem_enabled)
            mc.non_bypassable_charge += nbc * net_demand[t] * dt;
        if (has_exports)
            mc.nem_revenue += dt * res.column("net_exports")[t] * (res.column("export_prices")[t] + nbc);
    }

    //
    // tiered energy
    for (const results::TieredResult& tr : res.tiered)
        bill.monthly[tr.month - 1].tiered_charge += tr.price * tr.energy;

    //
    // demand charges
    const double demand_scale = tariff.all_charge_scaling * tariff.demand_charge_scaling;
    for (const tariffs::DemandPeriod& p : compiled.demand_periods) {
        double peak = 0.0;
        for (size_t t : p.timesteps) {
            if (t < n)
                peak = std::max(peak, net_demand[t]);
        }
        bill.monthly[p.month - 1].demand_charge += demand_scale * p.rate * peak;
    }

    //
    // customer charges
    for (unsigned int m = 1; m <= 12; m++) {
        bill.monthly[m - 1].customer_charge = tariff.all_charge_scaling *
            (tariff.customer_charge_daily * static_cast<double>(days_in_month(year, m)) + tariff.customer_charge_monthly);
    }

    //
    // annual sums and the cap of the revenue
    for (const BillComponents& mc : bill.monthly) {
        bill.annual.energy_charge         += mc.energy_charge;
        bill.annual.tiered_charge         += mc.tiered_charge;
        bill.annual.demand_charge         += mc.demand_charge;
        bill.annual.customer_charge       += mc.customer_charge;
        bill.annual.non_bypassable_charge += mc.non_bypassable_charge;
        bill.nem_revenue_uncapped         += mc.nem_revenue;
    }
    double cap = bill.annual.energy_charge;
    if (tariff.nem_version != 1)
        cap -= bill.annual.non_bypassable_charge;
    cap = std::max(cap, 0.0);
    bill.annual.nem_revenue = std::min(bill.nem_revenue_uncapped, cap);
    bill.nem_revenue_capped = bill.annual.nem_revenue < bill.nem_revenue_uncapped;
    return bill;
}


vector<InvestmentCost> postprocessing::compute_investment_costs(const RunSpecs& specs, const results::SimulationResults& res) {
    vector<InvestmentCost> costs;
    if (!specs.scenario.is_capacity_expansion())
        return costs;

    auto make_entry = [&](const string& asset, double capacity, double capital, double lcs, double om, double itc, unsigned int lifespan) -> InvestmentCost {
        const double crf = model::capital_recovery_factor(specs.scenario, lifespan);
        InvestmentCost ic;
        ic.asset                  = asset;
        ic.capacity               = capacity;
        ic.capital_cost_per_kw    = capital * lcs;
        ic.total_capital_cost     = ic.capital_cost_per_kw * capacity;
        ic.amortized_capital_cost = ic.total_capital_cost * crf;
        ic.om_cost_per_kw_year    = om;
        ic.total_om_cost          = om * capacity;
        ic.itc_rate               = itc;
        ic.total_itc              = ic.total_capital_cost * itc;
        ic.amortized_itc          = ic.amortized_capital_cost * itc;
        return ic;
    };

    if (specs.solar.enabled) {
        const SolarSpec& pv = specs.solar;
        costs.push_back(make_entry("solar", res.pv_capacity, pv.capital_cost, pv.linked_cost_scaling,
                                   pv.fixed_om_cost, pv.investment_tax_credit, pv.lifespan));
    }
    if (specs.storage.enabled) {
        const StorageSpec& bes = specs.storage;
        costs.push_back(make_entry("storage", res.bes_power_capacity, bes.power_capital_cost, bes.linked_cost_scaling,
                                   bes.fixed_om_cost, bes.investment_tax_credit, bes.lifespan));
    }
    return costs;
}

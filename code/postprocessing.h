/*
 * postprocessing.h
 *
 * Computation of the electricity bill and the investment costs
 * out of the results of a complete run.
 *
 */

#ifndef POSTPROCESSING_H
#define POSTPROCESSING_H

#include <array>
#include <string>
#include <vector>

#include "rate_profiles.h"
#include "results.h"
#include "run_specification.h"


namespace postprocessing {

    /*!
     * The charges of one billing period (one month or the complete year)
     */
    struct BillComponents {
        double energy_charge   = 0.0;
        double tiered_charge   = 0.0;
        double demand_charge   = 0.0;
        double customer_charge = 0.0;
        double nem_revenue     = 0.0; ///< Uncapped for a month, capped for the year
        double non_bypassable_charge = 0.0; ///< Reported only, not part of the total

        double total() const { return energy_charge + tiered_charge + demand_charge + customer_charge - nem_revenue; }
    };

    struct ElectricityBill {
        std::array<BillComponents, 12> monthly; ///< Index 0 to 11 for the months 1 to 12
        BillComponents annual;
        double nem_revenue_uncapped = 0.0;
        bool nem_revenue_capped     = false;

        double total() const { return annual.total(); }
    };

    /**
     * Computes the monthly and annual electricity bill.
     * The demand charge is evaluated over the full-year solution,
     * the annual net metering revenue is capped by the energy charge
     * (minus the non-bypassable charge for the NEM versions 2 and 3).
     */
    ElectricityBill compute_electricity_bill(const RunSpecs& specs, const tariffs::CompiledTariff& compiled,
                                             const results::SimulationResults& res);

    struct InvestmentCost {
        std::string asset;              ///< "solar" or "storage"
        double capacity = 0.0;          ///< in kW
        double capital_cost_per_kw   = 0.0;
        double total_capital_cost    = 0.0;
        double amortized_capital_cost= 0.0;
        double om_cost_per_kw_year   = 0.0;
        double total_om_cost         = 0.0;
        double itc_rate              = 0.0;
        double total_itc             = 0.0;
        double amortized_itc         = 0.0;
    };

    /**
     * Returns the investment costs of all enabled assets. Empty in PCM.
     */
    std::vector<InvestmentCost> compute_investment_costs(const RunSpecs& specs, const results::SimulationResults& res);

}

#endif

#include "tariff.h"

#include <algorithm>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "errors.h"
#include "helper.h"

using namespace std;



namespace {

    const char* const base_season_name = "base";

    /*
     * With the seasonal split switched off, all rows must belong to the base season.
     * Rows without a season name are assigned to it.
     */
    void assign_base_season(vector<RateEntry>& rows, const string& table_name) {
        for (RateEntry& row : rows) {
            if (row.season.empty()) {
                row.season = base_season_name;
            } else if (row.season != base_season_name) {
                throw ConfigurationError("The seasonal month split is disabled, but the table '" + table_name +
                                         "' contains a row for season '" + row.season + "'. Only the season 'base' is allowed.");
            }
        }
    }

}


TariffSpec make_tariff_spec(const TariffInput& input, const ScenarioSpec& scenario) {
    TariffSpec spec;
    spec.utility_name = input.utility_name.value_or("");
    spec.tariff_name  = input.tariff_name.value_or("");
    spec.weekday_weekend_split = value_or_notice<bool>(input.weekday_weekend_split, false, "tariff", "weekday weekend split");
    spec.holiday_split         = value_or_notice<bool>(input.holiday_split, false, "tariff", "holiday split");
    spec.seasonal_month_split  = value_or_notice<bool>(input.seasonal_month_split, true, "tariff", "seasonal month split");

    //
    // seasons
    if (spec.seasonal_month_split) {
        if (input.months_by_season.has_value()) {
            spec.months_by_season = input.months_by_season.value();
        } else {
            cout << "Notice: The tariff parameter 'months by season' is not defined. Will default to summer (June to September) and winter (all other months)." << endl;
            spec.months_by_season["summer"] = {6, 7, 8, 9};
            spec.months_by_season["winter"] = {1, 2, 3, 4, 5, 10, 11, 12};
        }
    } else {
        if (input.months_by_season.has_value()) {
            cerr << "Warning: The seasonal month split is disabled. The parameter 'months by season' is ignored." << endl;
        }
        spec.months_by_season[base_season_name] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
    }
    spec.season_of_month.assign(12, "");
    for (const auto& [season, months] : spec.months_by_season) {
        for (unsigned int m : months) {
            if (m < 1 || m > 12) {
                throw ConfigurationError("The season '" + season + "' contains the invalid month " + to_string(m) + ".");
            }
            if (!spec.season_of_month[m - 1].empty()) {
                throw ConfigurationError("The month " + to_string(m) + " is assigned to the seasons '" +
                                         spec.season_of_month[m - 1] + "' and '" + season + "'.");
            }
            spec.season_of_month[m - 1] = season;
        }
    }
    for (unsigned int m = 1; m <= 12; m++) {
        if (spec.season_of_month[m - 1].empty())
            throw ConfigurationError("The month " + to_string(m) + " is not assigned to any season.");
    }

    //
    // energy rates
    if (!input.energy_tou_rates.has_value() || input.energy_tou_rates.value().empty()) {
        throw ConfigurationError("The tariff does not define an energy TOU rate table ('energy tou rates'). No energy charge can be computed.");
    }
    spec.energy_tou_rates = input.energy_tou_rates.value();
    if (input.weekend_energy_tou_rates.has_value())
        spec.weekend_energy_tou_rates = input.weekend_energy_tou_rates.value();
    if (input.monthly_maximum_demand_rates.has_value())
        spec.monthly_maximum_demand_rates = input.monthly_maximum_demand_rates.value();
    if (input.monthly_demand_tou_rates.has_value())
        spec.monthly_demand_tou_rates = input.monthly_demand_tou_rates.value();
    if (input.daily_demand_tou_rates.has_value())
        spec.daily_demand_tou_rates = input.daily_demand_tou_rates.value();
    if (!spec.seasonal_month_split) {
        assign_base_season(spec.energy_tou_rates,         "energy tou rates");
        assign_base_season(spec.weekend_energy_tou_rates, "weekend energy tou rates");
        assign_base_season(spec.monthly_demand_tou_rates, "monthly demand tou rates");
        assign_base_season(spec.daily_demand_tou_rates,   "daily demand tou rates");
        map<string, double> base_rates;
        for (const auto& [season, rate] : spec.monthly_maximum_demand_rates) {
            if (season != base_season_name && !season.empty())
                throw ConfigurationError("The seasonal month split is disabled, but a monthly maximum demand rate is given for season '" + season + "'.");
            base_rates[base_season_name] = rate;
        }
        spec.monthly_maximum_demand_rates = base_rates;
    }

    //
    // tiered rates
    if (input.energy_tiered_rates.has_value() && !input.energy_tiered_rates.value().empty()) {
        spec.energy_tiered_rates = input.energy_tiered_rates.value();
        if (!spec.seasonal_month_split) {
            for (TierEntry& tier : spec.energy_tiered_rates) {
                if (tier.season.empty())
                    tier.season = base_season_name;
            }
        }
        if (input.energy_tiered_baseline_type.has_value()) {
            const string& bt = input.energy_tiered_baseline_type.value();
            if (bt == "daily") {
                spec.tiered_baseline_type = global::TieredBaselineType::Daily;
            } else if (bt == "monthly") {
                spec.tiered_baseline_type = global::TieredBaselineType::Monthly;
            } else {
                throw ConfigurationError("The tariff parameter 'energy tiered baseline type' is defined as '" + bt + "', but only 'daily' and 'monthly' are known.");
            }
        } else {
            cout << "Notice: The tariff parameter 'energy tiered baseline type' is not defined. Will default to monthly." << endl;
        }
    }

    //
    // net energy metering
    spec.nem_enabled = input.nem_enabled.value_or(false);
    if (spec.nem_enabled) {
        if (input.nem_version.has_value()) {
            spec.nem_version = input.nem_version.value();
        } else {
            cout << "Notice: The tariff parameter 'nem version' is not defined. Will default to 2." << endl;
            spec.nem_version = 2;
        }
        if (spec.nem_version < 1 || spec.nem_version > 3) {
            throw ConfigurationError("The tariff parameter 'nem version' is " + to_string(spec.nem_version) + ", but only the versions 1, 2 and 3 are known.");
        }
        if (spec.nem_version == 1) {
            if (input.nem_non_bypassable_charge.has_value())
                cerr << "Warning: NEM version 1 does not use a non-bypassable charge. The given value is ignored." << endl;
        } else if (spec.nem_version == 2) {
            if (!input.nem_non_bypassable_charge.has_value())
                throw ConfigurationError("NEM version 2 is selected, but the tariff parameter 'nem non-bypassable charge' is not defined.");
            spec.nem_non_bypassable_charge = input.nem_non_bypassable_charge.value();
        } else {
            if (input.nem_non_bypassable_charge.has_value()) {
                spec.nem_non_bypassable_charge = input.nem_non_bypassable_charge.value();
            } else {
                cout << "Notice: The tariff parameter 'nem non-bypassable charge' is not defined. Will default to 0." << endl;
            }
            spec.average_nem_avoided_cost = value_or_notice<bool>(input.average_nem_avoided_cost_profile, false, "tariff", "average nem avoided cost profile");
            if (spec.average_nem_avoided_cost) {
                if (!input.nem_avoided_cost_timestamped.has_value() || input.nem_avoided_cost_timestamped.value().empty())
                    throw ConfigurationError("NEM version 3 with averaging is selected, but no time-stamped 'nem avoided cost profile' is defined.");
                spec.nem_avoided_cost_timestamped = input.nem_avoided_cost_timestamped.value();
            } else {
                if (!input.nem_avoided_cost_profile.has_value())
                    throw ConfigurationError("NEM version 3 is selected, but the tariff parameter 'nem avoided cost profile' is not defined.");
                spec.nem_avoided_cost = resample_profile(input.nem_avoided_cost_profile.value(), scenario.year, scenario.interval_length, "nem avoided cost profile");
            }
        }
        if (spec.nem_non_bypassable_charge < 0.0)
            throw ConfigurationError("The tariff parameter 'nem non-bypassable charge' must not be negative.");
    }

    //
    // customer charges and scalings
    spec.customer_charge_daily   = value_or_notice<double>(input.customer_charge_daily, 0.0, "tariff", "customer charge daily");
    spec.customer_charge_monthly = value_or_notice<double>(input.customer_charge_monthly, 0.0, "tariff", "customer charge monthly");
    spec.all_charge_scaling        = value_or_notice<double>(input.all_charge_scaling, 1.0, "tariff", "all charge scaling");
    spec.energy_charge_scaling     = value_or_notice<double>(input.energy_charge_scaling, 1.0, "tariff", "energy charge scaling");
    spec.demand_charge_scaling     = value_or_notice<double>(input.demand_charge_scaling, 1.0, "tariff", "demand charge scaling");
    spec.tou_energy_charge_scaling = value_or_notice<double>(input.tou_energy_charge_scaling, 1.0, "tariff", "tou energy charge scaling");
    for (double s : {spec.all_charge_scaling, spec.energy_charge_scaling, spec.demand_charge_scaling, spec.tou_energy_charge_scaling}) {
        if (s < 0.0)
            throw ConfigurationError("Charge scaling factors must not be negative.");
    }

    return spec;
}

/*
 * tariff.h
 *
 * It contains the definition of an electricity tariff, i.e.,
 * seasons, time-of-use rate tables, tiered energy rates,
 * demand charges, net energy metering and customer charges.
 *
 */

#ifndef TARIFF_H
#define TARIFF_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "components.h"
#include "global.h"
#include "helper.h"


/*!
 * One row of a time-of-use rate table.
 * The hours start, ..., end-1 of every day of the season take the rate and the label.
 */
struct RateEntry {
    std::string season;
    unsigned int start = 0;
    unsigned int end   = 24;
    double rate        = 0.0;
    std::string label;
};

/*!
 * One tier of a tiered energy rate. The upper bound of a tier is
 * the lower bound of the following tier of the same season.
 */
struct TierEntry {
    std::string season;
    double lower_bound = 0.0; ///< in kWh per day or month, see TieredBaselineType
    double price       = 0.0; ///< Adder on top of the time-of-use energy price
};

/*!
 * One value of a profile that carries its own time stamp (e.g., multi-year avoided cost data).
 */
struct TimestampedValue {
    DateTime time;
    double value = 0.0;
};


/*!
 * Raw tariff settings as given in the configuration file.
 */
struct TariffInput {
    std::optional<std::string> utility_name;
    std::optional<std::string> tariff_name;
    std::optional<bool> weekday_weekend_split;
    std::optional<bool> holiday_split;
    std::optional<bool> seasonal_month_split;
    std::optional<std::map<std::string, std::vector<unsigned int>>> months_by_season;
    std::optional<std::vector<RateEntry>> energy_tou_rates;
    std::optional<std::vector<RateEntry>> weekend_energy_tou_rates;
    std::optional<std::vector<TierEntry>> energy_tiered_rates;
    std::optional<std::string> energy_tiered_baseline_type;
    std::optional<std::map<std::string, double>> monthly_maximum_demand_rates;
    std::optional<std::vector<RateEntry>> monthly_demand_tou_rates;
    std::optional<std::vector<RateEntry>> daily_demand_tou_rates;
    std::optional<bool> nem_enabled;
    std::optional<int> nem_version;
    std::optional<double> nem_non_bypassable_charge;
    std::optional<std::vector<double>> nem_avoided_cost_profile;
    std::optional<std::vector<TimestampedValue>> nem_avoided_cost_timestamped;
    std::optional<bool> average_nem_avoided_cost_profile;
    std::optional<double> customer_charge_daily;
    std::optional<double> customer_charge_monthly;
    std::optional<double> all_charge_scaling;
    std::optional<double> energy_charge_scaling;
    std::optional<double> demand_charge_scaling;
    std::optional<double> tou_energy_charge_scaling;
};

/*!
 * Validated tariff.
 */
struct TariffSpec {
    std::string utility_name;
    std::string tariff_name;
    bool weekday_weekend_split = false;
    bool holiday_split         = false;
    bool seasonal_month_split  = true;
    std::map<std::string, std::vector<unsigned int>> months_by_season;
    std::vector<std::string> season_of_month; ///< Index 0 to 11 for the months 1 to 12
    std::vector<RateEntry> energy_tou_rates;
    std::vector<RateEntry> weekend_energy_tou_rates; ///< Empty, if no override table is given
    std::vector<TierEntry> energy_tiered_rates;      ///< Empty, if no tiered rates are given
    global::TieredBaselineType tiered_baseline_type = global::TieredBaselineType::Monthly;
    std::map<std::string, double> monthly_maximum_demand_rates;
    std::vector<RateEntry> monthly_demand_tou_rates;
    std::vector<RateEntry> daily_demand_tou_rates;
    bool nem_enabled = false;
    int nem_version  = 2;
    double nem_non_bypassable_charge = 0.0;
    std::vector<double> nem_avoided_cost;                       ///< Resampled avoided cost (NEM 3, no averaging)
    std::vector<TimestampedValue> nem_avoided_cost_timestamped; ///< Multi-year avoided cost (NEM 3 with averaging)
    bool average_nem_avoided_cost = false;
    double customer_charge_daily   = 0.0;
    double customer_charge_monthly = 0.0;
    double all_charge_scaling        = 1.0;
    double energy_charge_scaling     = 1.0;
    double demand_charge_scaling     = 1.0;
    double tou_energy_charge_scaling = 1.0;

    bool has_tiered_rates() const { return !energy_tiered_rates.empty(); }
    bool has_demand_charges() const {
        return !monthly_maximum_demand_rates.empty() || !monthly_demand_tou_rates.empty() || !daily_demand_tou_rates.empty();
    }
    const std::string& season_of(unsigned int month) const { return season_of_month.at(month - 1); }
};


/**
 * Validates the tariff, resolves the season partition and fills in defaults.
 * A missing energy TOU table and missing NEM inputs are reported as ConfigurationError.
 * Hour coverage of the rate tables is checked later during the compilation.
 */
TariffSpec make_tariff_spec(const TariffInput& input, const ScenarioSpec& scenario);

#endif

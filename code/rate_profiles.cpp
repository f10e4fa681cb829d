#include "rate_profiles.h"

#include <algorithm>
#include <array>
#include <iostream>
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "errors.h"
#include "helper.h"

using namespace std;
using namespace tariffs;



string tariffs::to_string(DemandCategory c) {
    switch (c) {
        case DemandCategory::MonthlyMaximum: return "monthly maximum";
        case DemandCategory::MonthlyTOU:     return "monthly TOU";
        case DemandCategory::DailyTOU:       return "daily TOU";
    }
    return "unknown";
}

vector<double> DemandPeriod::mask(size_t n_timesteps) const {
    vector<double> m(n_timesteps, 0.0);
    for (size_t ts : timesteps) {
        if (ts < n_timesteps)
            m[ts] = 1.0;
    }
    return m;
}



namespace {

    using HourTable = array<int, 24>; ///< Index of the rate row per hour of the day, -1 if the hour is not covered

    /*
     * Returns the hour table of one season for a rate table.
     * Overlapping rows are always an error, uncovered hours only if require_full_coverage is set.
     */
    HourTable build_hour_table(const vector<RateEntry>& rows, const string& season, const string& table_name, bool require_full_coverage) {
        HourTable table;
        table.fill(-1);
        for (size_t i = 0; i < rows.size(); i++) {
            const RateEntry& row = rows[i];
            if (row.season != season)
                continue;
            if (row.start >= row.end || row.end > 24) {
                throw CompilationError("The table '" + table_name + "' contains an invalid hour range " +
                                       std::to_string(row.start) + " to " + std::to_string(row.end) + " for season '" + season + "'.");
            }
            for (unsigned int h = row.start; h < row.end; h++) {
                if (table[h] >= 0) {
                    throw CompilationError("The table '" + table_name + "' contains overlapping rows for season '" + season +
                                           "' at hour " + std::to_string(h) + ".");
                }
                table[h] = static_cast<int>(i);
            }
        }
        if (require_full_coverage) {
            for (unsigned int h = 0; h < 24; h++) {
                if (table[h] < 0) {
                    throw CompilationError("The table '" + table_name + "' does not cover the hour " + std::to_string(h) +
                                           " for season '" + season + "'. All hours from 0 to 23 must be covered.");
                }
            }
        }
        return table;
    }

    void check_seasons_known(const vector<RateEntry>& rows, const TariffSpec& tariff, const string& table_name) {
        for (const RateEntry& row : rows) {
            if (!tariff.months_by_season.contains(row.season)) {
                throw CompilationError("The table '" + table_name + "' refers to the unknown season '" + row.season + "'.");
            }
        }
    }

    /*
     * Registry for demand periods, that creates every period name only once
     */
    class DemandPeriodRegistry {
        public:
            DemandPeriod& get_or_create(const string& name, DemandCategory category, const string& label,
                                        unsigned int month, unsigned int day, double rate)
            {
                auto it = index_by_name.find(name);
                if (it != index_by_name.end()) {
                    DemandPeriod& existing = periods[it->second];
                    if (existing.rate != rate && !rate_warning_shown) {
                        cerr << "Warning: Demand charge period " << name << " is defined by rows with different rates. The first rate (" << existing.rate << ") is used." << endl;
                        rate_warning_shown = true;
                    }
                    return existing;
                }
                DemandPeriod p;
                p.name     = name;
                p.category = category;
                p.label    = label;
                p.month    = month;
                p.day      = day;
                p.rate     = rate;
                index_by_name[name] = periods.size();
                periods.push_back(std::move(p));
                return periods.back();
            }

            vector<DemandPeriod> release() { return std::move(periods); }

        private:
            vector<DemandPeriod> periods;
            map<string, size_t> index_by_name;
            bool rate_warning_shown = false;
    };

    int scaling_indicator_for(const string& label, size_t season_index) {
        if (label == "peak")
            return 1;
        if (label == "partial-peak")
            return 2 + static_cast<int>(season_index);
        return 0;
    }

    vector<double> compile_nem_prices(const TariffSpec& tariff, const ScenarioSpec& scenario, const vector<double>& energy_prices) {
        const size_t n = energy_prices.size();
        const double nbc = tariff.nem_non_bypassable_charge;
        vector<double> nem(n, 0.0);
        if (tariff.nem_version == 1) {
            nem = energy_prices;
        } else if (tariff.nem_version == 2) {
            for (size_t t = 0; t < n; t++)
                nem[t] = energy_prices[t] - nbc;
        } else if (!tariff.average_nem_avoided_cost) {
            if (tariff.nem_avoided_cost.size() != n) {
                throw CompilationError("The NEM avoided cost profile has " + std::to_string(tariff.nem_avoided_cost.size()) +
                                       " values, but " + std::to_string(n) + " are required.");
            }
            for (size_t t = 0; t < n; t++)
                nem[t] = tariff.nem_avoided_cost[t] - nbc;
        } else {
            // average by (month, hour, weekend or holiday) over all given years
            map<tuple<unsigned int, unsigned int, bool>, pair<double, size_t>> groups;
            for (const TimestampedValue& tv : tariff.nem_avoided_cost_timestamped) {
                const DateTime& d = tv.time;
                const bool non_working_day = is_weekend(d.year, d.month, d.day) || is_holiday(d.year, d.month, d.day);
                auto& g = groups[make_tuple(d.month, d.hour, non_working_day)];
                g.first  += tv.value;
                g.second += 1;
            }
            for (size_t t = 0; t < n; t++) {
                const DateTime d = timestep_to_datetime(scenario.year, scenario.interval_length, t);
                const bool non_working_day = is_weekend(d.year, d.month, d.day) || is_holiday(d.year, d.month, d.day);
                auto it = groups.find(make_tuple(d.month, d.hour, non_working_day));
                if (it == groups.end()) {
                    throw CompilationError("The averaged NEM avoided cost profile has no values for month " + std::to_string(d.month) +
                                           ", hour " + std::to_string(d.hour) + (non_working_day ? " on weekends and holidays." : " on working days."));
                }
                nem[t] = it->second.first / static_cast<double>(it->second.second) - nbc;
            }
        }
        return nem;
    }

}


CompiledTariff tariffs::compile(const TariffSpec& tariff, const ScenarioSpec& scenario) {
    CompiledTariff ct;
    const size_t n                = scenario.n_timesteps();
    const unsigned int tspd       = timesteps_per_day(scenario.interval_length);
    const unsigned int ts_per_h   = 60 / scenario.interval_length;
    const int year                = scenario.year;

    for (const auto& season_entry : tariff.months_by_season)
        ct.season_names.push_back(season_entry.first); // std::map is sorted by key

    check_seasons_known(tariff.energy_tou_rates,         tariff, "energy tou rates");
    check_seasons_known(tariff.weekend_energy_tou_rates, tariff, "weekend energy tou rates");
    check_seasons_known(tariff.monthly_demand_tou_rates, tariff, "monthly demand tou rates");
    check_seasons_known(tariff.daily_demand_tou_rates,   tariff, "daily demand tou rates");
    for (const auto& [season, rate] : tariff.monthly_maximum_demand_rates) {
        if (!tariff.months_by_season.contains(season))
            throw CompilationError("A monthly maximum demand rate refers to the unknown season '" + season + "'.");
    }

    //
    // hour tables per season
    map<string, HourTable> energy_tables;
    map<string, HourTable> weekend_tables;
    map<string, HourTable> monthly_tou_tables;
    map<string, HourTable> daily_tou_tables;
    map<string, const RateEntry*> override_entries; // fallback if no weekend table is given
    for (const string& season : ct.season_names) {
        energy_tables[season] = build_hour_table(tariff.energy_tou_rates, season, "energy tou rates", true);
        if (!tariff.weekend_energy_tou_rates.empty()) {
            weekend_tables[season] = build_hour_table(tariff.weekend_energy_tou_rates, season, "weekend energy tou rates", true);
        } else {
            // the override takes the first off-peak hour, or hour 0 if there is no off-peak label
            const HourTable& et = energy_tables[season];
            const RateEntry* entry = &tariff.energy_tou_rates[et[0]];
            for (unsigned int h = 0; h < 24; h++) {
                if (tariff.energy_tou_rates[et[h]].label == "off-peak") {
                    entry = &tariff.energy_tou_rates[et[h]];
                    break;
                }
            }
            override_entries[season] = entry;
        }
        monthly_tou_tables[season] = build_hour_table(tariff.monthly_demand_tou_rates, season, "monthly demand tou rates", false);
        daily_tou_tables[season]   = build_hour_table(tariff.daily_demand_tou_rates,   season, "daily demand tou rates",   false);
        //
        // rates per label (required for the TOU scaling)
        for (const RateEntry& row : tariff.energy_tou_rates) {
            if (row.season == season && !ct.season_label_rates[season].contains(row.label))
                ct.season_label_rates[season][row.label] = row.rate;
        }
    }

    //
    // main loop over all days of the year
    ct.energy_prices.assign(n, 0.0);
    ct.energy_labels.assign(n, "");
    ct.scaling_indicator.assign(n, 0);
    DemandPeriodRegistry registry;
    for (unsigned int month = 1; month <= 12; month++) {
        const string& season      = tariff.season_of(month);
        const size_t season_index = static_cast<size_t>(std::find(ct.season_names.begin(), ct.season_names.end(), season) - ct.season_names.begin());
        const HourTable& et  = energy_tables.at(season);
        const HourTable& mtt = monthly_tou_tables.at(season);
        const HourTable& dtt = daily_tou_tables.at(season);
        //
        DemandPeriod* monthly_max = NULL;
        auto mm_it = tariff.monthly_maximum_demand_rates.find(season);
        if (mm_it != tariff.monthly_maximum_demand_rates.end()) {
            monthly_max = &registry.get_or_create("monthly_maximum_" + std::to_string(month), DemandCategory::MonthlyMaximum, "", month, 0, mm_it->second);
        }
        //
        for (unsigned int day = 1; day <= days_in_month(year, month); day++) {
            const bool override_day = (tariff.weekday_weekend_split && is_weekend(year, month, day)) ||
                                      (tariff.holiday_split && is_holiday(year, month, day));
            const size_t first_ts = first_timestep_of_day(year, month, day, scenario.interval_length);
            //
            // energy prices
            for (unsigned int k = 0; k < tspd; k++) {
                const size_t ts     = first_ts + k;
                const unsigned int h = k / ts_per_h;
                const RateEntry* entry;
                if (override_day) {
                    if (!weekend_tables.empty())
                        entry = &tariff.weekend_energy_tou_rates[weekend_tables.at(season)[h]];
                    else
                        entry = override_entries.at(season);
                } else {
                    entry = &tariff.energy_tou_rates[et[h]];
                }
                ct.energy_prices[ts]     = entry->rate;
                ct.energy_labels[ts]     = entry->label;
                ct.scaling_indicator[ts] = override_day ? 0 : scaling_indicator_for(entry->label, season_index);
            }
            //
            // demand charge masks
            // Attention: registry.get_or_create() can invalidate the pointer monthly_max,
            // thus, all time steps of the monthly maximum are added before new periods are created
            if (monthly_max != NULL) {
                for (unsigned int k = 0; k < tspd; k++)
                    monthly_max->timesteps.push_back(first_ts + k);
            }
            if (override_day)
                continue;
            for (unsigned int h = 0; h < 24; h++) {
                if (mtt[h] >= 0) {
                    const RateEntry& row = tariff.monthly_demand_tou_rates[mtt[h]];
                    if (!row.label.empty()) {
                        DemandPeriod& p = registry.get_or_create("monthly_" + row.label + "_" + std::to_string(month),
                                                                 DemandCategory::MonthlyTOU, row.label, month, 0, row.rate);
                        for (unsigned int k = 0; k < ts_per_h; k++)
                            p.timesteps.push_back(first_ts + h * ts_per_h + k);
                    }
                }
                if (dtt[h] >= 0) {
                    const RateEntry& row = tariff.daily_demand_tou_rates[dtt[h]];
                    if (!row.label.empty()) {
                        DemandPeriod& p = registry.get_or_create("daily_" + row.label + "_" + std::to_string(month) + "-" + std::to_string(day),
                                                                 DemandCategory::DailyTOU, row.label, month, day, row.rate);
                        for (unsigned int k = 0; k < ts_per_h; k++)
                            p.timesteps.push_back(first_ts + h * ts_per_h + k);
                    }
                }
            }
            // re-resolve the pointer, as the registry might have grown
            if (monthly_max != NULL)
                monthly_max = &registry.get_or_create("monthly_maximum_" + std::to_string(month), DemandCategory::MonthlyMaximum, "", month, 0, mm_it->second);
        }
    }
    ct.demand_periods = registry.release();
    // periods with the same label but split rows are filled hour by hour, thus sort the time steps once
    for (DemandPeriod& p : ct.demand_periods)
        std::sort(p.timesteps.begin(), p.timesteps.end());

    //
    // net energy metering
    if (tariff.nem_enabled)
        ct.nem_prices = compile_nem_prices(tariff, scenario, ct.energy_prices);

    //
    // tiered energy bands
    if (tariff.has_tiered_rates()) {
        for (const TierEntry& tier : tariff.energy_tiered_rates) {
            if (!tariff.months_by_season.contains(tier.season))
                throw CompilationError("The table 'energy tiered rates' refers to the unknown season '" + tier.season + "'.");
        }
        for (unsigned int month = 1; month <= 12; month++) {
            const string& season = tariff.season_of(month);
            vector<const TierEntry*> rows;
            for (const TierEntry& tier : tariff.energy_tiered_rates) {
                if (tier.season == season)
                    rows.push_back(&tier);
            }
            vector<TierBand>& bands = ct.tiered_bands[month - 1];
            for (size_t i = 0; i < rows.size(); i++) {
                TierBand band;
                band.tier        = static_cast<unsigned int>(i + 1);
                band.lower_bound = rows[i]->lower_bound;
                band.price       = rows[i]->price;
                if (i + 1 < rows.size()) {
                    if (rows[i + 1]->lower_bound <= rows[i]->lower_bound) {
                        throw CompilationError("The lower bounds of the energy tiers of season '" + season + "' are not strictly increasing.");
                    }
                    band.upper_bound = rows[i + 1]->lower_bound;
                }
                bands.push_back(band);
            }
        }
    }

    return ct;
}

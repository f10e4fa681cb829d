#include "horizon_sets.h"

#include <iomanip>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "errors.h"
#include "helper.h"

using namespace std;
using namespace horizon;
using global::OptimizationHorizon;



namespace {

    string window_description(int year, unsigned int month, unsigned int day) {
        stringstream ss;
        ss << setfill('0') << setw(4) << year;
        if (month > 0)
            ss << "-" << setw(2) << month;
        if (day > 0)
            ss << "-" << setw(2) << day;
        return ss.str();
    }

    template <typename T>
    vector<T> slice(const vector<T>& full, size_t first, size_t count) {
        if (full.empty())
            return vector<T>();
        return vector<T>(full.begin() + static_cast<long>(first), full.begin() + static_cast<long>(first + count));
    }

}


vector<HorizonWindow> horizon::make_windows(const ScenarioSpec& scenario) {
    vector<HorizonWindow> windows;
    const int year = scenario.year;
    const unsigned int tspd = timesteps_per_day(scenario.interval_length);
    switch (scenario.optimization_horizon) {
        case OptimizationHorizon::Day:
            for (unsigned int m = 1; m <= 12; m++) {
                for (unsigned int d = 1; d <= days_in_month(year, m); d++) {
                    HorizonWindow w;
                    w.horizon        = OptimizationHorizon::Day;
                    w.month          = m;
                    w.day            = d;
                    w.first_timestep = first_timestep_of_day(year, m, d, scenario.interval_length);
                    w.n_timesteps    = tspd;
                    w.description    = window_description(year, m, d);
                    windows.push_back(w);
                }
            }
            break;
        case OptimizationHorizon::Month:
            for (unsigned int m = 1; m <= 12; m++) {
                HorizonWindow w;
                w.horizon        = OptimizationHorizon::Month;
                w.month          = m;
                w.first_timestep = first_timestep_of_day(year, m, 1, scenario.interval_length);
                w.n_timesteps    = static_cast<size_t>(days_in_month(year, m)) * tspd;
                w.description    = window_description(year, m, 0);
                windows.push_back(w);
            }
            break;
        case OptimizationHorizon::Year:
            {
                HorizonWindow w;
                w.horizon        = OptimizationHorizon::Year;
                w.first_timestep = 0;
                w.n_timesteps    = scenario.n_timesteps();
                w.description    = window_description(year, 0, 0);
                windows.push_back(w);
            }
            break;
    }
    return windows;
}


double horizon::tou_scaling_factor(int indicator, const TariffSpec& tariff, const tariffs::CompiledTariff& compiled) {
    const double s = tariff.tou_energy_charge_scaling;
    if (indicator == 1)
        return s;
    if (indicator < 2 || indicator >= 2 + static_cast<int>(compiled.season_names.size()))
        return 1.0;
    if (s == 1.0)
        return 1.0;
    //
    // partial-peak: keep the ratio of the partial-peak price in between off-peak and peak
    const string& season = compiled.season_names[static_cast<size_t>(indicator - 2)];
    const auto season_it = compiled.season_label_rates.find(season);
    if (season_it == compiled.season_label_rates.end())
        throw CompilationError("No energy rates known for season '" + season + "'.");
    const map<string, double>& rates = season_it->second;
    for (const char* label : {"peak", "partial-peak", "off-peak"}) {
        if (!rates.contains(label))
            throw CompilationError("The TOU energy charge scaling requires a rate labelled '" + string(label) + "' for season '" + season + "'.");
    }
    const double p  = rates.at("peak");
    const double pp = rates.at("partial-peak");
    const double op = rates.at("off-peak");
    if (p == op || pp == 0.0)
        throw CompilationError("The TOU energy charge scaling is undefined for season '" + season + "', as the peak rate equals the off-peak rate or the partial-peak rate is 0.");
    const double r = (pp - op) / (p - op);
    return (r * (s * p - op) + op) / pp;
}


Sets horizon::create_sets(const RunSpecs& specs, const tariffs::CompiledTariff& compiled,
                          const HorizonWindow& window, const WindowState& state)
{
    const ScenarioSpec& scenario = specs.scenario;
    const TariffSpec& tariff     = specs.tariff;
    const int year               = scenario.year;
    const size_t first           = window.first_timestep;
    const size_t T               = window.n_timesteps;
    const size_t last_excl       = first + T;

    Sets sets;
    sets.window     = window;
    sets.T          = T;
    sets.dt         = scenario.interval_in_h();
    sets.year_share = static_cast<double>(T) / static_cast<double>(scenario.n_timesteps());
    sets.bes_initial_soc = state.bes_initial_soc;

    //
    // asset series
    sets.demand = slice(specs.demand.demand, first, T);
    if (specs.solar.enabled)
        sets.capacity_factor = slice(specs.solar.capacity_factor, first, T);
    if (specs.demand.simple_shift_enabled) {
        sets.shift_up_capacity   = slice(specs.demand.shift_up_capacity,   first, T);
        sets.shift_down_capacity = slice(specs.demand.shift_down_capacity, first, T);
    }

    //
    // prices
    const double energy_scale = tariff.all_charge_scaling * tariff.energy_charge_scaling;
    const double demand_scale = tariff.all_charge_scaling * tariff.demand_charge_scaling;
    map<int, double> factor_cache;
    auto factor = [&](int indicator) -> double {
        auto it = factor_cache.find(indicator);
        if (it != factor_cache.end())
            return it->second;
        const double f = tou_scaling_factor(indicator, tariff, compiled);
        factor_cache[indicator] = f;
        return f;
    };
    sets.energy_prices.resize(T);
    for (size_t t = 0; t < T; t++) {
        sets.energy_prices[t] = energy_scale * factor(compiled.scaling_indicator[first + t]) * compiled.energy_prices[first + t];
    }
    if (specs.exports_enabled()) {
        sets.nem_prices.resize(T);
        const double nbc = (tariff.nem_version == 1) ? 0.0 : tariff.nem_non_bypassable_charge;
        for (size_t t = 0; t < T; t++) {
            if (tariff.nem_version == 3) {
                sets.nem_prices[t] = compiled.nem_prices[first + t];
            } else {
                sets.nem_prices[t] = energy_scale * factor(compiled.scaling_indicator[first + t]) * (compiled.nem_prices[first + t] + nbc) - nbc;
            }
        }
    }

    //
    // demand charge periods
    for (const tariffs::DemandPeriod& p : compiled.demand_periods) {
        bool selected = false;
        double price  = demand_scale * p.rate;
        std::optional<double> previous_max;
        switch (window.horizon) {
            case OptimizationHorizon::Day:
                if (p.category == tariffs::DemandCategory::DailyTOU) {
                    selected = (p.month == window.month && p.day == window.day);
                } else if (p.month == window.month) {
                    selected = true;
                    price   /= static_cast<double>(days_in_month(year, window.month));
                    if (state.month == window.month) {
                        auto it = state.monthly_max_demand.find(p.name);
                        if (it != state.monthly_max_demand.end())
                            previous_max = it->second;
                    }
                }
                break;
            case OptimizationHorizon::Month:
                selected = (p.month == window.month);
                break;
            case OptimizationHorizon::Year:
                selected = true;
                break;
        }
        if (!selected)
            continue;
        WindowDemandPeriod wp;
        wp.name         = p.name;
        wp.category     = p.category;
        wp.price        = price;
        wp.previous_max = previous_max;
        for (size_t ts : p.timesteps) {
            if (ts >= first && ts < last_excl)
                wp.timesteps.push_back(ts - first);
        }
        // e.g. a monthly TOU period on a weekend day
        if (wp.timesteps.empty())
            continue;
        sets.demand_periods.push_back(std::move(wp));
    }

    //
    // months and tiered energy bands
    const unsigned int tspd = timesteps_per_day(scenario.interval_length);
    if (window.horizon == OptimizationHorizon::Year) {
        size_t local = 0;
        for (unsigned int m = 1; m <= 12; m++) {
            const size_t count = static_cast<size_t>(days_in_month(year, m)) * tspd;
            sets.months.push_back(MonthRange{m, local, count});
            local += count;
        }
    } else {
        sets.months.push_back(MonthRange{window.month, 0, T});
    }
    if (tariff.has_tiered_rates()) {
        for (const MonthRange& mr : sets.months) {
            const double dim = static_cast<double>(days_in_month(year, mr.month));
            double bound_factor = 1.0;
            if (window.horizon == OptimizationHorizon::Day) {
                if (tariff.tiered_baseline_type == global::TieredBaselineType::Monthly)
                    bound_factor = 1.0 / dim;
            } else {
                if (tariff.tiered_baseline_type == global::TieredBaselineType::Daily)
                    bound_factor = dim;
            }
            for (const tariffs::TierBand& band : compiled.tiered_bands[mr.month - 1]) {
                WindowTierBand wb;
                wb.month       = mr.month;
                wb.tier        = band.tier;
                wb.lower_bound = band.lower_bound * bound_factor;
                if (band.upper_bound.has_value())
                    wb.upper_bound = band.upper_bound.value() * bound_factor;
                wb.price       = band.price;
                sets.tier_bands.push_back(wb);
            }
        }
    }

    return sets;
}

/*
 * rate_profiles.h
 *
 * This file contains the compiler that turns a tariff into
 * dense time series for the complete scenario year:
 * energy prices, demand charge periods, net metering prices,
 * tiered energy bands and the TOU scaling indicator.
 *
 */

#ifndef RATE_PROFILES_H
#define RATE_PROFILES_H

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "components.h"
#include "tariff.h"


namespace tariffs {

    /*!
     * The category of a demand charge period.
     * Periods of the same category never overlap for a given month (or day).
     */
    enum struct DemandCategory : short {
        MonthlyMaximum, ///< Maximum over all time steps of a month
        MonthlyTOU,     ///< Maximum over the time steps of one TOU label within a month
        DailyTOU        ///< Maximum over the time steps of one TOU label within a day
    };

    std::string to_string(DemandCategory c);

    /*!
     * A demand charge period together with its rate.
     * The indicator mask is stored sparse, i.e., as the sorted list
     * of time steps (of the scenario year) where the mask is 1.
     */
    struct DemandPeriod {
        std::string name;     ///< e.g. monthly_maximum_7, monthly_peak_7 or daily_peak_7-15
        DemandCategory category = DemandCategory::MonthlyMaximum;
        std::string label;
        unsigned int month = 1;
        unsigned int day   = 0; ///< Only used for DailyTOU
        double rate        = 0.0;
        std::vector<size_t> timesteps;

        std::vector<double> mask(size_t n_timesteps) const; ///< Returns the dense 0/1 indicator series
    };

    /*!
     * One tiered energy band for one month.
     */
    struct TierBand {
        unsigned int tier  = 1; ///< Starts at 1
        double lower_bound = 0.0;
        std::optional<double> upper_bound; ///< Not set for the last (unbounded) tier
        double price       = 0.0;
    };

    /*!
     * The result of the compilation. All series have one value per time step of the scenario year.
     */
    struct CompiledTariff {
        std::vector<double> energy_prices;      ///< Unscaled energy TOU price
        std::vector<std::string> energy_labels; ///< TOU label that is active in a time step
        std::vector<int> scaling_indicator;     ///< 0: no TOU scaling, 1: peak, 2+i: partial-peak of the i-th season (sorted by name)
        std::vector<DemandPeriod> demand_periods;
        std::vector<double> nem_prices;         ///< Empty, if net metering is disabled
        std::array<std::vector<TierBand>, 12> tiered_bands; ///< Index 0 to 11 for the months 1 to 12, empty if no tiered rates are given
        std::vector<std::string> season_names;  ///< Sorted by name
        std::map<std::string, std::map<std::string, double>> season_label_rates; ///< First energy rate per season and TOU label

        size_t n_timesteps() const { return energy_prices.size(); }
    };

    /**
     * Compiles a validated tariff for the scenario year.
     *
     * @throws CompilationError if a rate table does not cover all hours of a season, rows overlap,
     *         a row refers to an unknown season or the averaged avoided cost profile misses a group
     */
    CompiledTariff compile(const TariffSpec& tariff, const ScenarioSpec& scenario);

}

#endif

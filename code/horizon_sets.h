/*
 * horizon_sets.h
 *
 * This file contains the partitioning of the scenario year into
 * optimization windows and the creation of the input sets for one window.
 *
 */

#ifndef HORIZON_SETS_H
#define HORIZON_SETS_H

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "global.h"
#include "rate_profiles.h"
#include "run_specification.h"


namespace horizon {

    /*!
     * State that is carried from one window to the next one.
     */
    struct WindowState {
        double bes_initial_soc = 0.5; ///< Initial state of charge as fraction of the energy capacity
        std::map<std::string, double> monthly_max_demand; ///< Peak demand per monthly period observed so far in the current month (DAY horizon only)
        unsigned int month = 0; ///< Month the peak demand values belong to
    };

    /*!
     * One optimization window, i.e. a day, a month or the complete year.
     */
    struct HorizonWindow {
        global::OptimizationHorizon horizon = global::OptimizationHorizon::Month;
        unsigned int month = 0;   ///< 0 for the YEAR horizon
        unsigned int day   = 0;   ///< 0 for the MONTH and YEAR horizon
        size_t first_timestep = 0;
        size_t n_timesteps    = 0;
        std::string description;  ///< e.g. "2023", "2023-04" or "2023-04-17"
    };

    struct WindowDemandPeriod {
        std::string name;
        tariffs::DemandCategory category = tariffs::DemandCategory::MonthlyMaximum;
        double price = 0.0;               ///< Scaled rate, per day for monthly periods in the DAY horizon
        std::vector<size_t> timesteps;    ///< Window-local time steps where the mask is 1
        std::optional<double> previous_max; ///< Lower bound of the peak demand (DAY horizon only)
    };

    /*!
     * The time steps of one calendar month inside a window
     */
    struct MonthRange {
        unsigned int month = 1;
        size_t first = 0; ///< Window-local
        size_t count = 0;
    };

    struct WindowTierBand {
        unsigned int month = 1;
        unsigned int tier  = 1;
        double lower_bound = 0.0;
        std::optional<double> upper_bound; ///< Not set for the last tier
        double price = 0.0;
    };

    /*!
     * Immutable snapshot of all data required to build the model of one window.
     */
    struct Sets {
        HorizonWindow window;
        size_t T = 0;            ///< Number of time steps
        double dt = 1.0;         ///< Length of one time step in hours
        double year_share = 1.0; ///< Share of the window on the complete scenario year (for the investment cost proration)
        std::vector<double> demand;
        std::vector<double> energy_prices; ///< Scaled
        std::vector<double> nem_prices;    ///< Scaled, empty if no exports exist
        std::vector<double> capacity_factor;
        std::vector<double> shift_up_capacity;
        std::vector<double> shift_down_capacity;
        std::vector<WindowDemandPeriod> demand_periods;
        std::vector<MonthRange> months;
        std::vector<WindowTierBand> tier_bands;
        double bes_initial_soc = 0.5;
    };

    /**
     * Returns all windows of the scenario year in chronological order
     */
    std::vector<HorizonWindow> make_windows(const ScenarioSpec& scenario);

    /**
     * Returns the factor that is applied to the energy price of a time step with the given scaling indicator.
     * @throws CompilationError if a season misses the peak, partial-peak or off-peak label but requires the TOU scaling
     */
    double tou_scaling_factor(int indicator, const TariffSpec& tariff, const tariffs::CompiledTariff& compiled);

    /**
     * Slices all full-year series for one window and adds the carried state.
     */
    Sets create_sets(const RunSpecs& specs, const tariffs::CompiledTariff& compiled,
                     const HorizonWindow& window, const WindowState& state);

}

#endif

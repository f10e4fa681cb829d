/*
 * test_common.h
 *
 * Input builders shared by the test files.
 *
 */

#ifndef TEST_COMMON_H
#define TEST_COMMON_H

#include <string>
#include <vector>

#include "helper.h"
#include "run_specification.h"
#include "tariff.h"

namespace testing_inputs {

    inline std::vector<double> constant_profile(int year, double value) {
        return std::vector<double>(static_cast<size_t>(days_in_year(year)) * 24, value);
    }

    /*
     * Day-night solar profile: capacity factor 0.5 from 10 to 15 h, else 0
     */
    inline std::vector<double> solar_profile(int year) {
        std::vector<double> cf = constant_profile(year, 0.0);
        for (size_t h = 0; h < cf.size(); h++) {
            const size_t hod = h % 24;
            if (hod >= 10 && hod < 16)
                cf[h] = 0.5;
        }
        return cf;
    }

    inline RateEntry rate(const std::string& season, unsigned int start, unsigned int end, double r, const std::string& label) {
        RateEntry e;
        e.season = season;
        e.start  = start;
        e.end    = end;
        e.rate   = r;
        e.label  = label;
        return e;
    }

    /*
     * A tariff with a single base season and a flat energy price
     */
    inline TariffInput flat_tariff(double price) {
        TariffInput t;
        t.seasonal_month_split = false;
        t.energy_tou_rates     = std::vector<RateEntry>{ rate("", 0, 24, price, "off-peak") };
        return t;
    }

    /*
     * A summer/winter TOU tariff with peak (16-21 h), partial-peak (14-16 h) and off-peak
     */
    inline TariffInput tou_tariff() {
        TariffInput t;
        t.seasonal_month_split = true;
        t.energy_tou_rates = std::vector<RateEntry>{
            rate("summer",  0, 14, 0.20, "off-peak"),
            rate("summer", 14, 16, 0.30, "partial-peak"),
            rate("summer", 16, 21, 0.50, "peak"),
            rate("summer", 21, 24, 0.20, "off-peak"),
            rate("winter",  0, 14, 0.18, "off-peak"),
            rate("winter", 14, 16, 0.25, "partial-peak"),
            rate("winter", 16, 21, 0.35, "peak"),
            rate("winter", 21, 24, 0.18, "off-peak")
        };
        return t;
    }

    /*
     * A PCM scenario with hourly intervals, monthly windows and a constant demand of 1 kW
     */
    inline RunInputs flat_pcm_inputs(int year = 2023, double price = 0.20) {
        RunInputs in;
        in.scenario.problem_type         = "PCM";
        in.scenario.year                 = year;
        in.scenario.interval_length      = 60;
        in.scenario.optimization_horizon = "MONTH";
        in.scenario.optimization_solver  = "SCIP";
        in.tariff                        = flat_tariff(price);
        in.demand.demand_profile         = constant_profile(year, 1.0);
        return in;
    }

}

#endif

/*
 * helper.h
 *
 * This file contains functions that can be used everywhere
 * in the program: calendar computations, profile resampling
 * and the annuity factor.
 */

#ifndef __HELPER_H_
#define __HELPER_H_

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>


/**
 * A calendar point in local time (without time zone information).
 * Months and days start at 1, hours and minutes at 0.
 */
struct DateTime {
    int year           = 1970;
    unsigned int month = 1;
    unsigned int day   = 1;
    unsigned int hour  = 0;
    unsigned int minute= 0;
};

/*
 * Calendar functions
 */
bool is_leap_year(int year);
unsigned int days_in_year(int year);
unsigned int days_in_month(int year, unsigned int month);

/**
 * Returns the day of the week in ISO encoding, i.e. 1 (Monday) until 7 (Sunday)
 */
unsigned int day_of_week(int year, unsigned int month, unsigned int day);

/**
 * Returns true if the given day is a Saturday or a Sunday
 */
bool is_weekend(int year, unsigned int month, unsigned int day);

/**
 * Returns true if the given day is one of the following holidays:
 * New Year's Day, Presidents' Day (3rd Monday of February), Memorial Day (last Monday of May),
 * Independence Day, Labor Day (1st Monday of September), Veterans Day,
 * Thanksgiving (4th Thursday of November) and Christmas.
 */
bool is_holiday(int year, unsigned int month, unsigned int day);

/**
 * Returns the day of the year, starting at 0 for January 1st
 */
unsigned int day_of_year(int year, unsigned int month, unsigned int day);

/*
 * Time step functions.
 * All time step indices start at 0 (first interval of January 1st)
 * and are left-aligned, i.e. a time step denotes the start of the interval.
 */
unsigned int timesteps_per_day(unsigned int interval_length_min);
size_t timesteps_in_year(int year, unsigned int interval_length_min);
size_t first_timestep_of_day(int year, unsigned int month, unsigned int day, unsigned int interval_length_min);
DateTime timestep_to_datetime(int year, unsigned int interval_length_min, size_t ts);

/**
 * Formats a DateTime as "YYYY-MM-DD HH:MM:SS"
 */
std::string format_datetime(const DateTime& dt);

/**
 * Parses a string of the form "YYYY-MM-DD HH:MM[:SS]" into a DateTime.
 * @return false if the string could not be parsed
 */
bool parse_datetime(const std::string& str, DateTime& dt);

/**
 * Brings a profile of one year in hourly, 30-minute or 15-minute resolution
 * to the resolution given by interval_length_min.
 * A coarser profile is expanded by linear interpolation (the last value is interpolated towards the first one),
 * a finer profile is reduced by averaging.
 *
 * @param profile: The input values
 * @param year: The year the profile belongs to (required for the length check)
 * @param interval_length_min: Target interval length in minutes (15, 30 or 60)
 * @param profile_name: Name of the profile, used in error messages
 *
 * @throws ConfigurationError if the length of the profile does not fit to any supported resolution
 */
std::vector<double> resample_profile(
        const std::vector<double>& profile,
        int year,
        unsigned int interval_length_min,
        const std::string& profile_name);

/**
 * Returns the annuity factor r(1+r)^n / ((1+r)^n - 1) for a discount rate r and n periods.
 * For r == 0 it returns 1/n.
 */
double annuity_factor(double rate, unsigned int periods);

/**
 * Formats a value as it is used in names of sensitivity cases and output files
 */
std::string format_number(double value);

/**
 * Returns the value of an optional parameter or its default value.
 * If the default is taken, a notice is printed.
 */
template <typename T>
T value_or_notice(const std::optional<T>& value, T default_value, const std::string& component, const std::string& parameter) {
    if (value.has_value())
        return value.value();
    std::cout << "Notice: The " << component << " parameter '" << parameter << "' is not defined. Will default to "
              << std::boolalpha << default_value << std::noboolalpha << "." << std::endl;
    return default_value;
}

#endif

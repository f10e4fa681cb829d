#include "helper.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "errors.h"

using namespace std;



bool is_leap_year(int year) {
    return std::chrono::year{year}.is_leap();
}

unsigned int days_in_year(int year) {
    return is_leap_year(year) ? 366 : 365;
}

unsigned int days_in_month(int year, unsigned int month) {
    using namespace std::chrono;
    const year_month_day_last ymdl{ std::chrono::year{year} / std::chrono::month{month} / last };
    return static_cast<unsigned int>(ymdl.day());
}

unsigned int day_of_week(int year, unsigned int month, unsigned int day) {
    using namespace std::chrono;
    const year_month_day ymd{ std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day} };
    return weekday{ sys_days{ymd} }.iso_encoding();
}

bool is_weekend(int year, unsigned int month, unsigned int day) {
    return day_of_week(year, month, day) >= 6;
}

bool is_holiday(int year, unsigned int month, unsigned int day) {
    using namespace std::chrono;
    const std::chrono::year y{year};
    const year_month_day date{ y, std::chrono::month{month}, std::chrono::day{day} };
    const std::array<year_month_day, 8> holidays = {
        year_month_day{ y / January / 1 },
        year_month_day{ sys_days{ y / February / Monday[3] } },
        year_month_day{ sys_days{ y / May / Monday[last] } },
        year_month_day{ y / July / 4 },
        year_month_day{ sys_days{ y / September / Monday[1] } },
        year_month_day{ y / November / 11 },
        year_month_day{ sys_days{ y / November / Thursday[4] } },
        year_month_day{ y / December / 25 }
    };
    return std::find(holidays.begin(), holidays.end(), date) != holidays.end();
}

unsigned int day_of_year(int year, unsigned int month, unsigned int day) {
    unsigned int doy = 0;
    for (unsigned int m = 1; m < month; m++)
        doy += days_in_month(year, m);
    return doy + day - 1;
}

unsigned int timesteps_per_day(unsigned int interval_length_min) {
    return 24 * 60 / interval_length_min;
}

size_t timesteps_in_year(int year, unsigned int interval_length_min) {
    return static_cast<size_t>(days_in_year(year)) * timesteps_per_day(interval_length_min);
}

size_t first_timestep_of_day(int year, unsigned int month, unsigned int day, unsigned int interval_length_min) {
    return static_cast<size_t>(day_of_year(year, month, day)) * timesteps_per_day(interval_length_min);
}

DateTime timestep_to_datetime(int year, unsigned int interval_length_min, size_t ts) {
    const unsigned int tspd = timesteps_per_day(interval_length_min);
    unsigned int doy = static_cast<unsigned int>(ts / tspd);
    const unsigned int minute_of_day = static_cast<unsigned int>(ts % tspd) * interval_length_min;
    DateTime dt;
    dt.year = year;
    dt.month = 1;
    while (dt.month < 12 && doy >= days_in_month(year, dt.month)) {
        doy -= days_in_month(year, dt.month);
        dt.month++;
    }
    dt.day    = doy + 1;
    dt.hour   = minute_of_day / 60;
    dt.minute = minute_of_day % 60;
    return dt;
}

std::string format_datetime(const DateTime& dt) {
    stringstream ss;
    ss << setfill('0') << setw(4) << dt.year << "-" << setw(2) << dt.month << "-" << setw(2) << dt.day << " ";
    ss << setw(2) << dt.hour << ":" << setw(2) << dt.minute << ":00";
    return ss.str();
}

bool parse_datetime(const std::string& str, DateTime& dt) {
    struct tm tm_val = {};
    stringstream stream_val( str );
    stream_val >> get_time(&tm_val, "%Y-%m-%d %H:%M");
    if (stream_val.fail())
        return false;
    dt.year   = tm_val.tm_year + 1900;
    dt.month  = static_cast<unsigned int>(tm_val.tm_mon + 1);
    dt.day    = static_cast<unsigned int>(tm_val.tm_mday);
    dt.hour   = static_cast<unsigned int>(tm_val.tm_hour);
    dt.minute = static_cast<unsigned int>(tm_val.tm_min);
    return true;
}

std::vector<double> resample_profile(
        const std::vector<double>& profile,
        int year,
        unsigned int interval_length_min,
        const std::string& profile_name)
{
    const size_t hours = static_cast<size_t>(days_in_year(year)) * 24;
    const size_t target_steps_per_hour = 60 / interval_length_min;
    size_t input_steps_per_hour = 0;
    for (size_t k : {1, 2, 4}) {
        if (profile.size() == hours * k) {
            input_steps_per_hour = k;
            break;
        }
    }
    if (input_steps_per_hour == 0) {
        throw ConfigurationError("The " + profile_name + " has " + to_string(profile.size()) +
            " values, but a profile for the year " + to_string(year) + " requires " + to_string(hours) +
            " (hourly), " + to_string(2*hours) + " (30 minutes) or " + to_string(4*hours) + " (15 minutes) values.");
    }
    if (input_steps_per_hour == target_steps_per_hour)
        return profile;

    vector<double> resampled;
    resampled.reserve(hours * target_steps_per_hour);
    if (input_steps_per_hour < target_steps_per_hour) {
        // linear interpolation between the given values
        const size_t factor = target_steps_per_hour / input_steps_per_hour;
        for (size_t i = 0; i < profile.size(); i++) {
            const double curr = profile[i];
            const double next = profile[(i + 1) % profile.size()];
            for (size_t j = 0; j < factor; j++) {
                resampled.push_back( curr + (next - curr) * static_cast<double>(j) / static_cast<double>(factor) );
            }
        }
    } else {
        // averaging of groups
        const size_t factor = input_steps_per_hour / target_steps_per_hour;
        for (size_t i = 0; i < profile.size(); i += factor) {
            double sum = 0.0;
            for (size_t j = 0; j < factor; j++)
                sum += profile[i + j];
            resampled.push_back( sum / static_cast<double>(factor) );
        }
    }
    return resampled;
}

double annuity_factor(double rate, unsigned int periods) {
    if (periods == 0)
        throw ConfigurationError("An amortization period of 0 years is not possible.");
    if (rate == 0.0)
        return 1.0 / periods;
    const double q = std::pow(1.0 + rate, static_cast<double>(periods));
    return rate * q / (q - 1.0);
}

std::string format_number(double value) {
    stringstream ss;
    ss << value;
    return ss.str();
}

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "errors.h"
#include "helper.h"

#include "test_common.h"


TEST(Calendar, LeapYears) {
    EXPECT_TRUE(is_leap_year(2024));
    EXPECT_TRUE(is_leap_year(2000));
    EXPECT_FALSE(is_leap_year(2023));
    EXPECT_FALSE(is_leap_year(1900));
    EXPECT_EQ(days_in_month(2024, 2), 29u);
    EXPECT_EQ(days_in_month(2023, 2), 28u);
    EXPECT_EQ(days_in_year(2024), 366u);
}

TEST(Calendar, DayOfWeekAndWeekend) {
    EXPECT_EQ(day_of_week(2023, 1, 1), 7u); // Sunday
    EXPECT_EQ(day_of_week(2024, 1, 1), 1u); // Monday
    EXPECT_TRUE(is_weekend(2023, 1, 7));
    EXPECT_FALSE(is_weekend(2023, 1, 9));
}

TEST(Calendar, Holidays) {
    EXPECT_TRUE(is_holiday(2023, 1, 1));
    EXPECT_TRUE(is_holiday(2023, 2, 20));  // 3rd Monday of February
    EXPECT_TRUE(is_holiday(2023, 5, 29));  // last Monday of May
    EXPECT_TRUE(is_holiday(2023, 7, 4));
    EXPECT_TRUE(is_holiday(2023, 9, 4));   // 1st Monday of September
    EXPECT_TRUE(is_holiday(2023, 11, 11));
    EXPECT_TRUE(is_holiday(2023, 11, 23)); // 4th Thursday of November
    EXPECT_TRUE(is_holiday(2023, 12, 25));
    EXPECT_FALSE(is_holiday(2023, 7, 5));
    EXPECT_FALSE(is_holiday(2023, 11, 16));
}

TEST(Calendar, TimestepConversion) {
    EXPECT_EQ(timesteps_in_year(2023, 60), 8760u);
    EXPECT_EQ(timesteps_in_year(2024, 60), 8784u);
    EXPECT_EQ(timesteps_in_year(2023, 15), 35040u);
    EXPECT_EQ(first_timestep_of_day(2023, 2, 1, 60), 744u);
    EXPECT_EQ(day_of_year(2024, 3, 1), 60u);

    DateTime dt = timestep_to_datetime(2023, 15, 5);
    EXPECT_EQ(dt.month, 1u);
    EXPECT_EQ(dt.day, 1u);
    EXPECT_EQ(dt.hour, 1u);
    EXPECT_EQ(dt.minute, 15u);
    EXPECT_EQ(format_datetime(timestep_to_datetime(2023, 60, 8759)), "2023-12-31 23:00:00");
}

TEST(Calendar, ParseDatetime) {
    DateTime dt;
    ASSERT_TRUE(parse_datetime("2022-03-14 17:30", dt));
    EXPECT_EQ(dt.year, 2022);
    EXPECT_EQ(dt.month, 3u);
    EXPECT_EQ(dt.day, 14u);
    EXPECT_EQ(dt.hour, 17u);
    EXPECT_EQ(dt.minute, 30u);
    EXPECT_FALSE(parse_datetime("not a date", dt));
}

TEST(Resampling, HourlyToQuarterHourInterpolates) {
    std::vector<double> hourly = testing_inputs::constant_profile(2023, 2.0);
    hourly[0] = 0.0;
    hourly[1] = 4.0;
    std::vector<double> q = resample_profile(hourly, 2023, 15, "test profile");
    ASSERT_EQ(q.size(), 35040u);
    EXPECT_DOUBLE_EQ(q[0], 0.0);
    EXPECT_DOUBLE_EQ(q[1], 1.0);
    EXPECT_DOUBLE_EQ(q[2], 2.0);
    EXPECT_DOUBLE_EQ(q[3], 3.0);
    EXPECT_DOUBLE_EQ(q[4], 4.0);
    EXPECT_DOUBLE_EQ(q[100], 2.0);
}

TEST(Resampling, QuarterHourToHourlyAverages) {
    std::vector<double> q(35040, 1.0);
    q[0] = 0.0;
    q[1] = 2.0;
    q[2] = 4.0;
    q[3] = 6.0;
    std::vector<double> hourly = resample_profile(q, 2023, 60, "test profile");
    ASSERT_EQ(hourly.size(), 8760u);
    EXPECT_DOUBLE_EQ(hourly[0], 3.0);
    EXPECT_DOUBLE_EQ(hourly[1], 1.0);
}

TEST(Resampling, SameResolutionIsUnchanged) {
    std::vector<double> hourly = testing_inputs::solar_profile(2024);
    EXPECT_EQ(resample_profile(hourly, 2024, 60, "test profile"), hourly);
}

TEST(Resampling, WrongLengthThrows) {
    std::vector<double> wrong(8000, 1.0);
    EXPECT_THROW(resample_profile(wrong, 2023, 60, "test profile"), ConfigurationError);
    // a profile of a non-leap year does not fit to a leap year
    EXPECT_THROW(resample_profile(testing_inputs::constant_profile(2023, 1.0), 2024, 60, "test profile"), ConfigurationError);
}

TEST(Finance, AnnuityFactor) {
    EXPECT_DOUBLE_EQ(annuity_factor(0.0, 10), 0.1);
    EXPECT_NEAR(annuity_factor(0.05, 20), 0.0802426, 1e-6);
    EXPECT_THROW(annuity_factor(0.05, 0), ConfigurationError);
}

TEST(Formatting, FormatNumber) {
    EXPECT_EQ(format_number(5.0), "5");
    EXPECT_EQ(format_number(0.25), "0.25");
}

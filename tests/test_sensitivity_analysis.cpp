#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "errors.h"
#include "global.h"
#include "sensitivity_analysis.h"

#include "test_common.h"


namespace {

    sensitivity::SensitivityDefinition definition(const std::string& variable, const std::string& parameter, std::vector<double> values) {
        sensitivity::SensitivityDefinition def;
        def.id        = 1;
        def.variable  = variable;
        def.parameter = parameter;
        def.values    = values;
        return def;
    }

    RunInputs storage_inputs() {
        RunInputs in = testing_inputs::flat_pcm_inputs(2023);
        in.tariff                  = testing_inputs::tou_tariff();
        in.storage.enabled         = true;
        in.storage.power_capacity  = 2.0;
        in.storage.energy_capacity = 8.0;
        in.storage.soc_min         = 0.0;
        in.storage.soc_max         = 1.0;
        in.storage.soc_initial     = 0.5;
        in.storage.charge_eff      = 0.95;
        in.storage.discharge_eff   = 0.95;
        return in;
    }

}


TEST(SensitivityAnalysis, CaseKeys) {
    sensitivity::SensitivityDefinition def = definition("storage", "power_capacity", {});
    EXPECT_EQ(sensitivity::case_key(def, 5.0), "storage_power_capacity_5");
    EXPECT_EQ(sensitivity::case_key(def, 0.25), "storage_power_capacity_0.25");
}

TEST(SensitivityAnalysis, KnownParameters) {
    EXPECT_TRUE(sensitivity::is_known_parameter("storage", "power_capacity"));
    EXPECT_TRUE(sensitivity::is_known_parameter("solar", "lifespan"));
    EXPECT_TRUE(sensitivity::is_known_parameter("tariff", "nem_version"));
    EXPECT_TRUE(sensitivity::is_known_parameter("demand", "shift_percent"));
    EXPECT_FALSE(sensitivity::is_known_parameter("demand", "power_capacity"));
    EXPECT_FALSE(sensitivity::is_known_parameter("wind", "power_capacity"));
}

TEST(SensitivityAnalysis, ApplyValue) {
    RunInputs in = storage_inputs();
    sensitivity::apply_value(in, "storage", "power_capacity", 7.5);
    ASSERT_TRUE(in.storage.power_capacity.has_value());
    EXPECT_DOUBLE_EQ(in.storage.power_capacity.value(), 7.5);

    sensitivity::apply_value(in, "solar", "lifespan", 25.0);
    EXPECT_EQ(in.solar.lifespan.value(), 25u);

    EXPECT_THROW(sensitivity::apply_value(in, "wind", "power_capacity", 1.0), ConfigurationError);
    EXPECT_THROW(sensitivity::apply_value(in, "storage", "colour", 1.0), ConfigurationError);
    EXPECT_THROW(sensitivity::apply_value(in, "storage", "lifespan", 2.5), ConfigurationError);
    EXPECT_THROW(sensitivity::apply_value(in, "storage", "lifespan", -1.0), ConfigurationError);
}

TEST(SensitivityAnalysis, MakeCases) {
    const RunInputs base = storage_inputs();
    std::vector<sensitivity::SweepCase> cases = sensitivity::make_cases(base, definition("storage", "power_capacity", {0.0, 5.0, 5.0, 10.0}));
    ASSERT_EQ(cases.size(), 3u);
    EXPECT_EQ(cases[0].key, "storage_power_capacity_0");
    EXPECT_EQ(cases[2].key, "storage_power_capacity_10");
    EXPECT_DOUBLE_EQ(cases[1].inputs.storage.power_capacity.value(), 5.0);
    // the base inputs stay untouched
    EXPECT_DOUBLE_EQ(base.storage.power_capacity.value(), 2.0);

    EXPECT_THROW(sensitivity::make_cases(base, definition("storage", "power_capacity", {})), ConfigurationError);
    EXPECT_THROW(sensitivity::make_cases(base, definition("storage", "unknown", {1.0})), ConfigurationError);
}

class SensitivityRun : public ::testing::TestWithParam<unsigned int> {
    protected:
        void SetUp() override {
            Global::UnlockAllVariables();
            Global::set_n_threads(GetParam());
        }
        void TearDown() override {
            Global::UnlockAllVariables();
        }
};

TEST_P(SensitivityRun, BillDoesNotIncreaseWithStoragePower) {
    sensitivity::SensitivityResults sr = sensitivity::run_sensitivity_analysis(storage_inputs(), definition("storage", "power_capacity", {0.0, 5.0, 10.0}));
    ASSERT_TRUE(sr.failed.empty());
    ASSERT_EQ(sr.cases.size(), 3u);
    const double bill_0  = sr.cases.at("storage_power_capacity_0").bill.total();
    const double bill_5  = sr.cases.at("storage_power_capacity_5").bill.total();
    const double bill_10 = sr.cases.at("storage_power_capacity_10").bill.total();
    EXPECT_LE(bill_5,  bill_0 + 1e-4);
    EXPECT_LE(bill_10, bill_5 + 1e-4);
    // arbitrage between off-peak and peak prices pays off
    EXPECT_LT(bill_5, bill_0 - 1.0);
    EXPECT_DOUBLE_EQ(sr.values.at("storage_power_capacity_10"), 10.0);
}

TEST_P(SensitivityRun, FailedCaseDoesNotStopOthers) {
    // a negative power capacity is rejected by the validation of the case
    sensitivity::SensitivityResults sr = sensitivity::run_sensitivity_analysis(storage_inputs(), definition("storage", "power_capacity", {-1.0, 2.0}));
    ASSERT_EQ(sr.failed.size(), 1u);
    EXPECT_EQ(sr.failed[0].first, "storage_power_capacity_-1");
    EXPECT_EQ(sr.cases.size(), 1u);
    EXPECT_TRUE(sr.cases.contains("storage_power_capacity_2"));
}

INSTANTIATE_TEST_SUITE_P(SequentialAndThreaded, SensitivityRun, ::testing::Values(0u, 3u));

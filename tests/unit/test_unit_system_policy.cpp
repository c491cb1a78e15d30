/**
 * @file test_unit_system_policy.cpp
 * @brief Unit tests for UnitSystemPolicy
 */

#include <gtest/gtest.h>
#include "UnitSystemPolicy.hpp"
#include "UnitErrors.hpp"

using namespace QTRACK;

TEST(UnitSystemPolicyTest, UnknownSystemIsRejected) {
    try {
        UnitSystemPolicy policy("imperial");
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.key(), "imperial");
        EXPECT_NE(std::string(e.what()).find("metric_engineering"), std::string::npos);
    }
}

TEST(UnitSystemPolicyTest, SystemTable) {
    EXPECT_EQ(unitSystemNames(), (std::vector<std::string>{"SI", "inch", "metric_engineering"}));
    EXPECT_EQ(unitSystemDefinition("inch").at("moment"), "lbf * inch");
    EXPECT_EQ(unitSystemDefinition("metric_engineering").at("stress"), "MPa");

    UnitSystemPolicy policy("SI");
    EXPECT_EQ(policy.expectedUnit("temperature").value_or(""), "degC");
    EXPECT_FALSE(policy.expectedUnit("velocity").has_value());
}

TEST(UnitSystemPolicyTest, StrictWithoutAutoConvertRejectsInches) {
    UnitSystemPolicy policy("SI", true, false);
    TrackedQuantity length(39.37, "inch");

    try {
        policy.enforce(length, "length");
        FAIL() << "Expected PolicyViolationError";
    } catch (const PolicyViolationError& e) {
        EXPECT_EQ(e.category(), "length");
        EXPECT_EQ(e.expectedUnit(), "m");
        EXPECT_EQ(e.actualUnit(), "in");
    }
    EXPECT_FALSE(policy.validate(length, "length"));
}

TEST(UnitSystemPolicyTest, AutoConvertReturnsMetres) {
    UnitSystemPolicy policy("SI", true, true);
    TrackedQuantity length(39.37, "inch");

    TrackedQuantity metres = policy.enforce(length, "length");
    EXPECT_EQ(metres.unitString(), "m");
    EXPECT_NEAR(metres.value(), 0.999998, 1e-6);
    EXPECT_EQ(metres.provenance().back().operation, OperationKind::CONVERTED);
}

TEST(UnitSystemPolicyTest, MatchingUnitIsReturnedUnchanged) {
    UnitSystemPolicy policy("metric_engineering", true, false);
    TrackedQuantity thickness(12.0, "mm");

    TrackedQuantity enforced = policy.enforce(thickness, "length");
    EXPECT_EQ(enforced.provenance().size(), 1u);
    EXPECT_TRUE(policy.validate(thickness, "length"));

    TrackedQuantity moment(3.0, "kN*m");
    EXPECT_EQ(policy.enforce(moment, "moment").provenance().size(), 1u);
}

TEST(UnitSystemPolicyTest, UndefinedCategoryPassesInEveryMode) {
    TrackedQuantity speed(3.0, "knots");

    UnitSystemPolicy lenient("SI");
    EXPECT_EQ(lenient.enforce(speed, "velocity").unitString(), "kt");
    EXPECT_TRUE(lenient.validate(speed, "velocity"));

    UnitSystemPolicy strict("SI", true, false);
    TrackedQuantity passed = strict.enforce(speed, "velocity");
    EXPECT_EQ(passed.unitString(), "kt");
    EXPECT_EQ(passed.provenance().size(), 1u);
    EXPECT_TRUE(strict.validate(speed, "velocity"));
}

TEST(UnitSystemPolicyTest, IncompatibleDimensionThrows) {
    UnitSystemPolicy policy("inch");
    TrackedQuantity mass(5.0, "kg");

    try {
        policy.enforce(mass, "pressure");
        FAIL() << "Expected DimensionMismatchError";
    } catch (const DimensionMismatchError& e) {
        EXPECT_EQ(e.actual(), "[mass]");
        EXPECT_EQ(e.expected(), "[length]^-1[mass][time]^-2");
    }
}

TEST(UnitSystemPolicyTest, InchSystemConvertsTemperature) {
    UnitSystemPolicy policy("inch");
    TrackedQuantity temperature(100.0, "degC");

    TrackedQuantity enforced = policy.enforce(temperature, "temperature");
    EXPECT_EQ(enforced.unitString(), "degF");
    EXPECT_NEAR(enforced.value(), 212.0, 1e-9);
}

/**
 * @file test_unit_registry.cpp
 * @brief Unit tests for UnitRegistry
 */

#include <gtest/gtest.h>
#include "UnitRegistry.hpp"
#include "UnitErrors.hpp"
#include <sstream>
#include <algorithm>

using namespace QTRACK;

class UnitRegistryTest : public ::testing::Test {
protected:
    const UnitRegistry& units = UnitRegistryManager::getInstance();
};

TEST_F(UnitRegistryTest, LengthConversions) {
    EXPECT_NEAR(units.convert(1.0, "m", "ft"), 3.28084, 1e-5);
    EXPECT_NEAR(units.convert(1.0, "km", "m"), 1000.0, 1e-9);
    EXPECT_NEAR(units.convert(1.0, "in", "cm"), 2.54, 1e-12);
    EXPECT_NEAR(units.convert(1.0, "mi", "km"), 1.609344, 1e-12);
    EXPECT_NEAR(units.convert(1.0, "nautical_mile", "m"), 1852.0, 1e-9);
}

TEST_F(UnitRegistryTest, PressureConversions) {
    EXPECT_NEAR(units.convert(1.0, "psi", "Pa"), 6894.757293168, 1e-6);
    EXPECT_NEAR(units.convert(1.0, "bar", "Pa"), 100000.0, 1e-9);
    EXPECT_NEAR(units.convert(1.0, "MPa", "psi"), 145.03774, 1e-4);
    EXPECT_NEAR(units.convert(1.0, "atm", "hPa"), 1013.25, 1e-9);
    EXPECT_NEAR(units.convert(29.92, "inHg", "hPa"), 1013.2, 0.1);
}

TEST_F(UnitRegistryTest, TemperatureOffsets) {
    EXPECT_NEAR(units.convert(0.0, "degC", "K"), 273.15, 1e-9);
    EXPECT_NEAR(units.convert(100.0, "degC", "degF"), 212.0, 1e-9);
    EXPECT_NEAR(units.convert(32.0, "degF", "degC"), 0.0, 1e-9);
    EXPECT_NEAR(units.convert(-40.0, "degF", "degC"), -40.0, 1e-9);
    EXPECT_NEAR(units.convert(491.67, "degR", "K"), 273.15, 1e-9);
}

TEST_F(UnitRegistryTest, EnergyCommodityUnits) {
    EXPECT_NEAR(units.convert(1.0, "BOE", "MMBTU"), 5.8, 1e-9);
    EXPECT_NEAR(units.convert(1.0, "MCF", "MMBTU"), 1.028, 1e-9);
    EXPECT_NEAR(units.convert(1.0, "TOE", "BOE"), 3.968e7 / 5.8e6, 1e-9);
    EXPECT_NEAR(units.convert(1.0, "therm", "BTU"), 1e5, 1e-6);
    EXPECT_NEAR(units.convert(1.0, "MWh", "GJ"), 3.6, 1e-12);
}

TEST_F(UnitRegistryTest, NamesAndAliasesAreCaseInsensitive) {
    EXPECT_EQ(units.resolve("Meter").symbol, "m");
    EXPECT_EQ(units.resolve("INCHES").symbol, "in");
    EXPECT_EQ(units.resolve("knot").symbol, "kt");
    EXPECT_EQ(units.resolve("hectopascal").symbol, "hPa");
    EXPECT_EQ(units.resolve("metric_ton").symbol, "t");
}

TEST_F(UnitRegistryTest, SymbolsAreCaseSensitive) {
    EXPECT_EQ(units.resolve("MPa").to_base, 1e6);
    EXPECT_EQ(units.resolve("Pa").to_base, 1.0);
    EXPECT_THROW(units.resolve("mpa"), UnknownUnitError);
}

TEST_F(UnitRegistryTest, CompoundExpressions) {
    Unit moment = units.resolve("lbf * inch");
    EXPECT_EQ(moment.symbol, "lbf*in");
    EXPECT_EQ(moment.dimension, Dimension(2, 1, -2));
    EXPECT_NEAR(moment.to_base, 4.4482216152605 * 0.0254, 1e-12);

    Unit volume = units.resolve("m**3");
    EXPECT_EQ(volume.dimension, Dimension(3, 0, 0));
    EXPECT_NEAR(units.convert(1.0, "m**3", "L"), 1000.0, 1e-9);

    Unit stress = units.resolve("kg/(m*s^2)");
    EXPECT_EQ(stress.dimension, units.getDimension("Pa"));
    EXPECT_NEAR(units.convert(1.0, "kN*m", "N * m"), 1000.0, 1e-9);
}

TEST_F(UnitRegistryTest, SymbolsContainingSlash) {
    // Symbols built by multiply/divide around "m/s2" resolve back
    Unit force = units.resolve("kg*(m/s2)");
    EXPECT_EQ(force.symbol, "kg*(m/s2)");
    EXPECT_EQ(force.dimension, Dimension(1, 1, -2));
    EXPECT_NEAR(units.convert(1.0, "kg*(m/s2)", "N"), 1.0, 1e-12);

    Unit per_mass = units.resolve("m/s2/kg");
    EXPECT_EQ(per_mass.dimension, Dimension(1, -1, -2));
    EXPECT_EQ(units.resolve("N/(m/s2)").dimension, units.getDimension("kg"));
    EXPECT_EQ(units.resolve("(m/s2)^2").dimension, Dimension(2, 0, -4));
    EXPECT_NEAR(units.convert(1.0, "BTU/hr*h", "BTU"), 1.0, 1e-6);

    // An exponent binds to the last token, not to the whole symbol
    EXPECT_EQ(units.resolve("m/s^2").dimension, units.getDimension("m/s2"));
    EXPECT_EQ(units.resolve("m/s/s").dimension, units.getDimension("m/s2"));
}

TEST_F(UnitRegistryTest, UnknownUnitsThrow) {
    try {
        units.resolve("furlongs");
        FAIL() << "Expected UnknownUnitError";
    } catch (const UnknownUnitError& e) {
        EXPECT_EQ(e.unit(), "furlongs");
        EXPECT_NE(std::string(e.what()).find("furlongs"), std::string::npos);
    }
    EXPECT_THROW(units.resolve("m*furlong"), UnknownUnitError);
    EXPECT_THROW(units.resolve("kg/(m*s"), UnknownUnitError);
    EXPECT_THROW(units.resolve(""), UnknownUnitError);
}

TEST_F(UnitRegistryTest, IncompatibleConversionThrows) {
    try {
        units.convert(1.0, "m", "kg");
        FAIL() << "Expected DimensionMismatchError";
    } catch (const DimensionMismatchError& e) {
        EXPECT_EQ(e.actual(), "[length]");
        EXPECT_EQ(e.expected(), "[mass]");
    }
}

TEST_F(UnitRegistryTest, DimensionalityStrings) {
    EXPECT_EQ(units.getDimension("Pa").toString(), "[length]^-1[mass][time]^-2");
    EXPECT_EQ(units.getDimension("m/s").toString(), "[length][time]^-1");
    EXPECT_EQ(units.getDimension("degC").toString(), "[temperature]");
    EXPECT_EQ(units.getDimension("rad").toString(), "dimensionless");
}

TEST_F(UnitRegistryTest, CompatibilityNeverThrows) {
    EXPECT_TRUE(units.areCompatible("psi", "kPa"));
    EXPECT_TRUE(units.areCompatible("BOE", "J"));
    EXPECT_FALSE(units.areCompatible("psi", "kN"));
    EXPECT_FALSE(units.areCompatible("psi", "not_a_unit"));
    EXPECT_TRUE(units.hasUnit("N * m"));
    EXPECT_FALSE(units.hasUnit("not_a_unit"));
    EXPECT_EQ(units.getUnit("kN*m"), nullptr);
}

TEST_F(UnitRegistryTest, ParseValueWithUnit) {
    double value = 0.0;
    std::string unit;

    ASSERT_TRUE(units.parseValueWithUnit("100 psi", value, unit));
    EXPECT_DOUBLE_EQ(value, 100.0);
    EXPECT_EQ(unit, "psi");

    ASSERT_TRUE(units.parseValueWithUnit("  -2.5e3  ", value, unit));
    EXPECT_DOUBLE_EQ(value, -2500.0);
    EXPECT_TRUE(unit.empty());

    EXPECT_FALSE(units.parseValueWithUnit("psi", value, unit));
}

TEST_F(UnitRegistryTest, VectorConversionAndBaseHelpers) {
    std::vector<double> ft = units.convert(std::vector<double>{1.0, 2.0}, "m", "ft");
    ASSERT_EQ(ft.size(), 2u);
    EXPECT_NEAR(ft[1], 6.56168, 1e-5);

    EXPECT_NEAR(toSI(1.0, "ksi"), 6894757.293168, 1e-3);
    EXPECT_NEAR(fromSI(273.15, "degC"), 0.0, 1e-9);
    EXPECT_EQ(units.getBaseUnit(units.getDimension("N")), "m*kg*s^-2");
}

TEST_F(UnitRegistryTest, CategoriesAndDatabase) {
    auto pressure = units.getUnitsInCategory("pressure");
    EXPECT_GE(pressure.size(), 10u);

    auto categories = units.getCategories();
    EXPECT_NE(std::find(categories.begin(), categories.end(), "energy"), categories.end());

    std::ostringstream os;
    units.printDatabase(os);
    EXPECT_NE(os.str().find("barrel of oil equivalent"), std::string::npos);
}

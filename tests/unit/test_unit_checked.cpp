/**
 * @file test_unit_checked.cpp
 * @brief Unit tests for UnitCheckedFunction
 */

#include <gtest/gtest.h>
#include "UnitChecked.hpp"
#include "UnitErrors.hpp"

using namespace QTRACK;

namespace {

UnitCheckedFunction makeHoopStress() {
    return UnitCheckedFunction(
        {{"pressure", std::string("MPa")}, {"diameter", std::string("mm")},
         {"thickness", std::string("mm")}},
        std::string("MPa"), "hoop_stress",
        [](const UnitCheckedFunction::Values& v) {
            return v.at("pressure") * v.at("diameter") / (2.0 * v.at("thickness"));
        });
}

} // namespace

TEST(UnitCheckedFunctionTest, ConvertsArgumentsIntoExpectedUnits) {
    UnitCheckedFunction hoop = makeHoopStress();

    TrackedQuantity result = hoop({{"pressure", TrackedQuantity(2175.566, "psi", "datasheet")},
                                   {"diameter", TrackedQuantity(20.0, "in", "drawing")},
                                   {"thickness", TrackedQuantity(12.7, "mm", "drawing")}});

    EXPECT_EQ(result.unitString(), "MPa");
    // 15 MPa * 508 mm / (2 * 12.7 mm)
    EXPECT_NEAR(result.value(), 300.0, 1e-3);
}

TEST(UnitCheckedFunctionTest, ResultCarriesArgumentHistory) {
    UnitCheckedFunction hoop = makeHoopStress();

    TrackedQuantity result = hoop({{"thickness", TrackedQuantity(12.7, "mm")},
                                   {"pressure", TrackedQuantity(15.0, "MPa")},
                                   {"diameter", TrackedQuantity(20.0, "in")}});

    // pressure: created, converted; diameter: created, converted;
    // thickness: created, converted; then the result's own entry
    const auto& history = result.provenance();
    ASSERT_EQ(history.size(), 7u);
    EXPECT_EQ(history[0].to_unit.value_or(""), "MPa");
    EXPECT_EQ(history[2].to_unit.value_or(""), "in");
    EXPECT_EQ(history[3].operation, OperationKind::CONVERTED);
    EXPECT_EQ(history[3].to_unit.value_or(""), "mm");
    EXPECT_EQ(history.back().operation, OperationKind::CREATED);
    EXPECT_EQ(history.back().source, "hoop_stress");
}

TEST(UnitCheckedFunctionTest, MissingArgumentIsConfigError) {
    UnitCheckedFunction hoop = makeHoopStress();

    try {
        hoop({{"pressure", TrackedQuantity(15.0, "MPa")},
              {"diameter", TrackedQuantity(508.0, "mm")}});
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.key(), "thickness");
    }
}

TEST(UnitCheckedFunctionTest, UnexpectedArgumentIsConfigError) {
    UnitCheckedFunction hoop = makeHoopStress();
    EXPECT_THROW(hoop({{"pressure", TrackedQuantity(15.0, "MPa")},
                       {"diameter", TrackedQuantity(508.0, "mm")},
                       {"thickness", TrackedQuantity(12.7, "mm")},
                       {"corrosion", TrackedQuantity(1.0, "mm")}}),
                 ConfigError);
}

TEST(UnitCheckedFunctionTest, IncompatibleArgumentThrows) {
    UnitCheckedFunction hoop = makeHoopStress();
    EXPECT_THROW(hoop({{"pressure", TrackedQuantity(15.0, "kN")},
                       {"diameter", TrackedQuantity(508.0, "mm")},
                       {"thickness", TrackedQuantity(12.7, "mm")}}),
                 DimensionMismatchError);
}

TEST(UnitCheckedFunctionTest, RawNumbersAndUncheckedParameters) {
    UnitCheckedFunction scale({{"length", std::string("m")}, {"factor", std::nullopt}},
                              std::nullopt, "scale",
                              [](const UnitCheckedFunction::Values& v) {
                                  return v.at("length") * v.at("factor");
                              });

    TrackedQuantity result = scale({{"length", TrackedQuantity(100.0, "cm")}},
                                   {{"factor", 3.0}});
    EXPECT_EQ(result.unitString(), "dimensionless");
    EXPECT_DOUBLE_EQ(result.value(), 3.0);
    EXPECT_EQ(result.provenance().size(), 3u);
}

TEST(UnitCheckedFunctionTest, UnknownUnitsRejectedAtConstruction) {
    auto body = [](const UnitCheckedFunction::Values&) { return 0.0; };
    EXPECT_THROW(UnitCheckedFunction({{"x", std::string("furlong")}}, std::nullopt, "f", body),
                 UnknownUnitError);
    EXPECT_THROW(UnitCheckedFunction({{"x", std::nullopt}}, std::string("furlong"), "f", body),
                 UnknownUnitError);
}

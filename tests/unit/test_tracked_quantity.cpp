/**
 * @file test_tracked_quantity.cpp
 * @brief Unit tests for TrackedQuantity, Magnitude and provenance records
 */

#include <gtest/gtest.h>
#include "TrackedQuantity.hpp"
#include "UnitErrors.hpp"
#include <limits>
#include <stdexcept>

using namespace QTRACK;

// =============================================================================
// Creation and Conversion
// =============================================================================

TEST(TrackedQuantityTest, CreateRecordsSingleEntry) {
    TrackedQuantity depth(100.0, "m", "survey");

    EXPECT_DOUBLE_EQ(depth.value(), 100.0);
    EXPECT_EQ(depth.unitString(), "m");
    ASSERT_EQ(depth.provenance().size(), 1u);

    const ProvenanceEntry& created = depth.provenance().front();
    EXPECT_EQ(created.operation, OperationKind::CREATED);
    EXPECT_EQ(created.source, "survey");
    EXPECT_FALSE(created.from_unit.has_value());
    ASSERT_TRUE(created.to_unit.has_value());
    EXPECT_EQ(*created.to_unit, "m");
}

TEST(TrackedQuantityTest, UnknownUnitThrows) {
    EXPECT_THROW(TrackedQuantity(1.0, "not_a_unit"), UnknownUnitError);
}

TEST(TrackedQuantityTest, ConversionAppendsEntry) {
    TrackedQuantity length(1.0, "m");
    TrackedQuantity feet = length.to("ft");

    EXPECT_NEAR(feet.value(), 3.28084, 1e-5);
    ASSERT_EQ(feet.provenance().size(), 2u);

    const ProvenanceEntry& converted = feet.provenance().back();
    EXPECT_EQ(converted.operation, OperationKind::CONVERTED);
    EXPECT_EQ(converted.from_unit.value_or(""), "m");
    EXPECT_EQ(converted.to_unit.value_or(""), "ft");

    // Receiver untouched
    EXPECT_DOUBLE_EQ(length.value(), 1.0);
    EXPECT_EQ(length.provenance().size(), 1u);
}

TEST(TrackedQuantityTest, RoundTripConversion) {
    TrackedQuantity pressure(2500.0, "psi");
    TrackedQuantity back = pressure.to("MPa").to("psi");
    EXPECT_NEAR(back.value(), 2500.0, 1e-9);

    TrackedQuantity temperature(72.0, "degF");
    EXPECT_NEAR(temperature.to("degC").to("degF").value(), 72.0, 1e-9);
}

TEST(TrackedQuantityTest, ConversionToIncompatibleUnitThrows) {
    TrackedQuantity length(1.0, "m");
    try {
        length.to("kg");
        FAIL() << "Expected DimensionMismatchError";
    } catch (const DimensionMismatchError& e) {
        EXPECT_EQ(e.actual(), "[length]");
        EXPECT_EQ(e.expected(), "[mass]");
    }
}

TEST(TrackedQuantityTest, CompatibilityChecks) {
    TrackedQuantity pressure(100.0, "kPa");
    EXPECT_TRUE(pressure.isCompatible(TrackedQuantity(1.0, "psi")));
    EXPECT_FALSE(pressure.isCompatible(TrackedQuantity(1.0, "kN")));
    EXPECT_TRUE(pressure.isCompatible("bar"));
    EXPECT_FALSE(pressure.isCompatible("not_a_unit"));
}

TEST(TrackedQuantityTest, CheckDimensions) {
    TrackedQuantity pressure(100.0, "kPa");
    EXPECT_NO_THROW(pressure.checkDimensions("[length]^-1[mass][time]^-2"));
    EXPECT_NO_THROW(pressure.checkDimensions("psi"));

    try {
        pressure.checkDimensions("[length]");
        FAIL() << "Expected DimensionMismatchError";
    } catch (const DimensionMismatchError& e) {
        EXPECT_EQ(e.actual(), "[length]^-1[mass][time]^-2");
        EXPECT_EQ(e.expected(), "[length]");
    }

    try {
        pressure.checkDimensions("m");
        FAIL() << "Expected DimensionMismatchError";
    } catch (const DimensionMismatchError& e) {
        EXPECT_EQ(e.expected(), "[length]");
    }

    EXPECT_NO_THROW(TrackedQuantity(0.5, "dimensionless").checkDimensions("dimensionless"));
}

// =============================================================================
// Arithmetic
// =============================================================================

TEST(TrackedQuantityTest, AddConvertsIntoLeftUnit) {
    TrackedQuantity a(100.0, "kPa", "gauge");
    TrackedQuantity b(14.696, "psi", "atmosphere");
    TrackedQuantity sum = a + b;

    double expected = 100.0 + 14.696 * 6.89476;
    EXPECT_EQ(sum.unitString(), "kPa");
    EXPECT_NEAR(sum.value(), expected, expected * 1e-3);
}

TEST(TrackedQuantityTest, ProvenanceGrowth) {
    TrackedQuantity a(1.0, "m");
    TrackedQuantity b = TrackedQuantity(2.0, "ft").to("m");
    TrackedQuantity sum = a + b;

    ASSERT_EQ(sum.provenance().size(), a.provenance().size() + b.provenance().size() + 1);
    EXPECT_EQ(sum.provenance()[0].operation, OperationKind::CREATED);
    EXPECT_EQ(sum.provenance()[1].operation, OperationKind::CREATED);
    EXPECT_EQ(sum.provenance()[2].operation, OperationKind::CONVERTED);

    const ProvenanceEntry& last = sum.provenance().back();
    EXPECT_EQ(last.operation, OperationKind::ADD);
    EXPECT_FALSE(last.from_unit.has_value());
    EXPECT_FALSE(last.to_unit.has_value());
}

TEST(TrackedQuantityTest, OperandsAreNotModified) {
    TrackedQuantity a(3.0, "m");
    TrackedQuantity b(4.0, "m");
    TrackedQuantity product = a * b;

    EXPECT_DOUBLE_EQ(a.value(), 3.0);
    EXPECT_DOUBLE_EQ(b.value(), 4.0);
    EXPECT_EQ(a.provenance().size(), 1u);
    EXPECT_EQ(b.provenance().size(), 1u);
    EXPECT_DOUBLE_EQ(product.value(), 12.0);
}

TEST(TrackedQuantityTest, AddingIncompatibleUnitsThrows) {
    TrackedQuantity pressure(100.0, "kPa");
    TrackedQuantity force(50.0, "kN");

    try {
        pressure + force;
        FAIL() << "Expected UnitMismatchError";
    } catch (const UnitMismatchError& e) {
        EXPECT_EQ(e.operation(), "add");
        EXPECT_EQ(e.leftUnit(), "kPa");
        EXPECT_EQ(e.rightUnit(), "kN");
        EXPECT_NE(std::string(e.what()).find("add"), std::string::npos);
        EXPECT_EQ(e.cause().actual(), "[length]^-1[mass][time]^-2");
    }

    EXPECT_THROW(pressure - force, UnitMismatchError);
}

TEST(TrackedQuantityTest, SubtractWithTemperatureOffsets) {
    TrackedQuantity hot(30.0, "degC");
    TrackedQuantity cold(50.0, "degF");   // 10 degC
    TrackedQuantity diff = hot - cold;

    EXPECT_EQ(diff.unitString(), "degC");
    EXPECT_NEAR(diff.value(), 20.0, 1e-9);
    EXPECT_EQ(diff.provenance().back().operation, OperationKind::SUBTRACT);
}

TEST(TrackedQuantityTest, MultiplyAndDivideBuildCompoundUnits) {
    TrackedQuantity force(10.0, "kN");
    TrackedQuantity arm(2.0, "m");
    TrackedQuantity moment = force * arm;

    EXPECT_EQ(moment.unitString(), "kN*m");
    EXPECT_DOUBLE_EQ(moment.value(), 20.0);
    EXPECT_NEAR(moment.to("N * m").value(), 20000.0, 1e-9);
    EXPECT_EQ(moment.provenance().back().operation, OperationKind::MULTIPLY);

    TrackedQuantity area(0.5, "m2");
    TrackedQuantity stress = force / area;
    EXPECT_EQ(stress.unitString(), "kN/m2");
    EXPECT_NEAR(stress.to("kPa").value(), 20.0, 1e-9);
    EXPECT_EQ(stress.provenance().back().operation, OperationKind::DIVIDE);
}

TEST(TrackedQuantityTest, CompoundUnitsSurviveRecords) {
    TrackedQuantity mass(10.0, "kg", "datasheet");
    TrackedQuantity gravity(9.81, "m/s2");
    TrackedQuantity weight = mass * gravity;
    ASSERT_EQ(weight.unitString(), "kg*(m/s2)");

    TrackedQuantity restored = TrackedQuantity::fromRecord(weight.toRecord());
    EXPECT_EQ(restored.unitString(), "kg*(m/s2)");
    EXPECT_DOUBLE_EQ(restored.value(), 98.1);
    EXPECT_EQ(restored.provenance().size(), weight.provenance().size());
    EXPECT_EQ(restored.dimension(), TrackedQuantity(1.0, "N").dimension());
    EXPECT_NEAR(weight.to(weight.unitString()).value(), 98.1, 1e-12);

    TrackedQuantity back = TrackedQuantity(98.1, "N") / gravity;
    ASSERT_EQ(back.unitString(), "N/(m/s2)");
    TrackedQuantity restored_back = TrackedQuantity::fromRecord(back.toRecord());
    EXPECT_EQ(restored_back.unitString(), "N/(m/s2)");
    EXPECT_NEAR(restored_back.to("kg").value(), 10.0, 1e-12);

    TrackedQuantity specific = gravity / mass;
    EXPECT_EQ(TrackedQuantity::fromRecord(specific.toRecord()).unitString(), "m/s2/kg");
}

TEST(TrackedQuantityTest, ScalarFactorsKeepReceiverHistory) {
    TrackedQuantity length(2.0, "m");
    TrackedQuantity doubled = length * 2.0;
    TrackedQuantity halved = length / 4.0;

    EXPECT_DOUBLE_EQ(doubled.value(), 4.0);
    EXPECT_DOUBLE_EQ(halved.value(), 0.5);
    EXPECT_EQ(doubled.unitString(), "m");
    EXPECT_EQ(doubled.provenance().size(), 2u);
}

TEST(TrackedQuantityTest, ArrayMagnitudes) {
    TrackedQuantity depths(Magnitude(std::vector<double>{1.0, 2.0, 3.0}), "m");
    TrackedQuantity offset(1.0, "ft");
    TrackedQuantity shifted = depths + offset;

    ASSERT_TRUE(shifted.magnitude().isArray());
    EXPECT_NEAR(shifted.magnitude().array()[2], 3.3048, 1e-12);
    EXPECT_THROW(shifted.value(), std::logic_error);

    TrackedQuantity in_feet = depths.to("ft");
    EXPECT_NEAR(in_feet.magnitude().array()[0], 3.28084, 1e-5);

    TrackedQuantity two(Magnitude(std::vector<double>{1.0, 2.0}), "m");
    EXPECT_THROW(depths + two, std::invalid_argument);
}

// =============================================================================
// Records
// =============================================================================

TEST(TrackedQuantityTest, RecordRoundTrip) {
    TrackedQuantity original = (TrackedQuantity(10.0, "psi", "sensor") +
                                TrackedQuantity(1.0, "bar", "reference")).to("kPa");
    QuantityRecord record = original.toRecord();

    EXPECT_EQ(record.unit, "kPa");
    ASSERT_EQ(record.provenance.size(), 4u);
    EXPECT_EQ(record.provenance[0].operation, "created");
    EXPECT_EQ(record.provenance[3].operation, "converted");

    TrackedQuantity restored = TrackedQuantity::fromRecord(record);
    EXPECT_DOUBLE_EQ(restored.value(), original.value());
    EXPECT_EQ(restored.unitString(), original.unitString());
    ASSERT_EQ(restored.provenance().size(), original.provenance().size());
    for (size_t i = 0; i < original.provenance().size(); ++i) {
        const auto& a = original.provenance()[i];
        const auto& b = restored.provenance()[i];
        EXPECT_EQ(a.operation, b.operation);
        EXPECT_EQ(a.source, b.source);
        EXPECT_EQ(a.from_unit, b.from_unit);
        EXPECT_EQ(a.to_unit, b.to_unit);
        EXPECT_EQ(std::chrono::duration_cast<std::chrono::microseconds>(a.timestamp.time_since_epoch()),
                  std::chrono::duration_cast<std::chrono::microseconds>(b.timestamp.time_since_epoch()));
    }
}

TEST(TrackedQuantityTest, RecordArrayStaysSequence) {
    TrackedQuantity loads(Magnitude(std::vector<double>{1.5, 2.5}), "kN");
    QuantityRecord record = loads.toRecord();
    ASSERT_TRUE(record.magnitude.isArray());
    EXPECT_EQ(record.magnitude.values(), (std::vector<double>{1.5, 2.5}));
    EXPECT_NE(record.toJson().find("\"magnitude\": [1.5, 2.5]"), std::string::npos);
}

TEST(TrackedQuantityTest, MalformedRecordsThrow) {
    QuantityRecord record;
    record.magnitude = Magnitude(1.0);
    record.unit = "m";
    record.provenance.push_back(ProvenanceRecord{"yesterday", "created", "", std::nullopt, "m"});
    EXPECT_THROW(TrackedQuantity::fromRecord(record), std::invalid_argument);

    record.provenance[0] = ProvenanceRecord{"2024-05-01T12:00:00+00:00", "teleport", "",
                                            std::nullopt, std::nullopt};
    EXPECT_THROW(TrackedQuantity::fromRecord(record), std::invalid_argument);

    record.provenance.clear();
    record.unit = "not_a_unit";
    EXPECT_THROW(TrackedQuantity::fromRecord(record), UnknownUnitError);
}

TEST(TrackedQuantityTest, EmptyRecordProvenanceGetsCreatedEntry) {
    QuantityRecord record;
    record.magnitude = Magnitude(5.0);
    record.unit = "kg";

    TrackedQuantity restored = TrackedQuantity::fromRecord(record);
    ASSERT_EQ(restored.provenance().size(), 1u);
    EXPECT_EQ(restored.provenance()[0].operation, OperationKind::CREATED);
}

TEST(TrackedQuantityTest, JsonUsesNullForUnsetUnits) {
    TrackedQuantity q(1.0, "m", "unit \"test\"");
    std::string json = q.toJson();

    EXPECT_NE(json.find("\"unit\": \"m\""), std::string::npos);
    EXPECT_NE(json.find("\"from_unit\": null"), std::string::npos);
    EXPECT_NE(json.find("\"to_unit\": \"m\""), std::string::npos);
    EXPECT_NE(json.find("unit \\\"test\\\""), std::string::npos);
}

TEST(TrackedQuantityTest, JsonWritesNonFiniteMagnitudesAsNull) {
    TrackedQuantity undefined(std::numeric_limits<double>::quiet_NaN(), "MPa");
    EXPECT_NE(undefined.toJson().find("\"magnitude\": null,"), std::string::npos);
    EXPECT_EQ(undefined.toJson().find("nan"), std::string::npos);

    TrackedQuantity loads(Magnitude(std::vector<double>{1.0, std::numeric_limits<double>::infinity()}), "kN");
    EXPECT_NE(loads.toJson().find("\"magnitude\": [1, null]"), std::string::npos);

    // Text output keeps the readable form
    EXPECT_EQ(undefined.magnitude().toString(), "nan");
}

TEST(TrackedQuantityTest, ToStringShowsUnitAndHistoryLength) {
    TrackedQuantity q(12.5, "kPa");
    EXPECT_EQ(q.toString(), "TrackedQuantity(12.5, 'kPa', provenance=1)");
}

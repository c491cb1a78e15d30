#ifndef TRACKED_QUANTITY_HPP
#define TRACKED_QUANTITY_HPP

#include "UnitRegistry.hpp"
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <chrono>
#include <functional>

namespace QTRACK {

/**
 * @brief Numeric payload of a quantity: a scalar or an array
 *
 * Arithmetic is element-wise; a scalar broadcasts against an array.
 */
class Magnitude {
public:
    Magnitude(double value = 0.0) : data_(value) {}
    Magnitude(std::vector<double> values) : data_(std::move(values)) {}

    bool isArray() const { return std::holds_alternative<std::vector<double>>(data_); }
    size_t size() const { return isArray() ? array().size() : 1; }

    /**
     * @throws std::logic_error if this is an array
     */
    double scalar() const;

    /**
     * @throws std::logic_error if this is a scalar
     */
    const std::vector<double>& array() const;

    // Values as a plain sequence (one element for a scalar)
    std::vector<double> values() const;

    Magnitude transform(const std::function<double(double)>& fn) const;

    /**
     * @brief Element-wise combination with broadcasting
     * @throws std::invalid_argument when two arrays differ in length
     */
    static Magnitude combine(const Magnitude& a, const Magnitude& b,
                             const std::function<double(double, double)>& fn);

    // "12.5" or "[1, 2, 3]"
    std::string toString() const;

    // As toString(), with null in place of non-finite values
    std::string toJson() const;

    bool operator==(const Magnitude& other) const { return data_ == other.data_; }
    bool operator!=(const Magnitude& other) const { return !(*this == other); }

private:
    std::variant<double, std::vector<double>> data_;
};

enum class OperationKind {
    CREATED,
    CONVERTED,
    ADD,
    SUBTRACT,
    MULTIPLY,
    DIVIDE
};

std::string operationKindToString(OperationKind kind);

/**
 * @throws std::invalid_argument for an unknown operation name
 */
OperationKind operationKindFromString(const std::string& name);

/**
 * @brief Plain-record form of a provenance entry (JSON mapping)
 */
struct ProvenanceRecord {
    std::string timestamp;               // ISO-8601
    std::string operation;               // "created", "converted", "add", ...
    std::string source;
    std::optional<std::string> from_unit;
    std::optional<std::string> to_unit;

    std::string toJson() const;
};

/**
 * @brief One immutable step in the history of a tracked quantity
 */
struct ProvenanceEntry {
    std::chrono::system_clock::time_point timestamp;
    OperationKind operation;
    std::string source;
    std::optional<std::string> from_unit;
    std::optional<std::string> to_unit;

    ProvenanceRecord toRecord() const;
    static ProvenanceEntry fromRecord(const ProvenanceRecord& record);
};

/**
 * @brief Plain-record form of a tracked quantity
 */
struct QuantityRecord {
    Magnitude magnitude;
    std::string unit;
    std::vector<ProvenanceRecord> provenance;

    std::string toJson(int indent = 0) const;
};

/**
 * @brief A magnitude with a unit and the ordered history that produced it
 *
 * Instances never change after construction. to() and the arithmetic
 * operations return new quantities whose provenance is the operands'
 * histories (left first) followed by one entry for the operation.
 *
 * Units are resolved through the process-wide UnitRegistry.
 */
class TrackedQuantity {
public:
    /**
     * @brief Create a quantity with a single "created" provenance entry
     * @throws UnknownUnitError if the unit string cannot be resolved
     */
    TrackedQuantity(const Magnitude& magnitude, const std::string& unit,
                    const std::string& source = "");

    TrackedQuantity(double magnitude, const std::string& unit,
                    const std::string& source = "")
        : TrackedQuantity(Magnitude(magnitude), unit, source) {}

    /**
     * @brief Create a quantity whose history starts with existing entries
     *
     * The result's provenance is history followed by a "created" entry
     * labeled with source. Used to attach the inputs' provenance to the
     * result of a computation.
     * @throws UnknownUnitError if the unit string cannot be resolved
     */
    static TrackedQuantity createWithHistory(const Magnitude& magnitude, const std::string& unit,
                                             const std::string& source,
                                             const std::vector<ProvenanceEntry>& history);

    const Magnitude& magnitude() const { return magnitude_; }

    // Scalar magnitude; throws std::logic_error for arrays
    double value() const { return magnitude_.scalar(); }

    const Unit& unit() const { return unit_; }
    const std::string& unitString() const { return unit_.symbol; }
    const Dimension& dimension() const { return unit_.dimension; }
    std::string dimensionality() const { return unit_.dimension.toString(); }
    const std::vector<ProvenanceEntry>& provenance() const { return provenance_; }

    // =========================================================================
    // Conversion and Dimension Checks
    // =========================================================================

    /**
     * @brief Convert to another unit, appending a "converted" entry
     * @throws UnknownUnitError, DimensionMismatchError
     */
    TrackedQuantity to(const std::string& target_unit) const;

    bool isCompatible(const TrackedQuantity& other) const;

    // False (never throws) when the unit string is unknown
    bool isCompatible(const std::string& unit_string) const;

    /**
     * @brief Require a dimensionality ("[length]") or a compatible unit ("ft")
     * @throws DimensionMismatchError with actual and expected dimensionality
     */
    void checkDimensions(const std::string& expected) const;

    // =========================================================================
    // Arithmetic
    // =========================================================================

    /**
     * @brief Sum in the left operand's unit
     * @throws UnitMismatchError if dimensions differ
     */
    TrackedQuantity add(const TrackedQuantity& other) const;
    TrackedQuantity subtract(const TrackedQuantity& other) const;

    TrackedQuantity multiply(const TrackedQuantity& other) const;
    TrackedQuantity divide(const TrackedQuantity& other) const;

    // Scale by a plain number; only the receiver's history is carried
    TrackedQuantity multiply(double factor) const;
    TrackedQuantity divide(double divisor) const;

    TrackedQuantity operator+(const TrackedQuantity& other) const { return add(other); }
    TrackedQuantity operator-(const TrackedQuantity& other) const { return subtract(other); }
    TrackedQuantity operator*(const TrackedQuantity& other) const { return multiply(other); }
    TrackedQuantity operator/(const TrackedQuantity& other) const { return divide(other); }
    TrackedQuantity operator*(double factor) const { return multiply(factor); }
    TrackedQuantity operator/(double divisor) const { return divide(divisor); }

    // =========================================================================
    // Serialization
    // =========================================================================

    QuantityRecord toRecord() const;

    /**
     * @brief Rebuild a quantity from its record
     *
     * An empty provenance list yields a fresh "created" entry.
     * @throws UnknownUnitError, std::invalid_argument
     */
    static TrackedQuantity fromRecord(const QuantityRecord& record);

    std::string toJson(int indent = 0) const { return toRecord().toJson(indent); }

    // "TrackedQuantity(12.5, 'kPa', provenance=3)"
    std::string toString() const;

private:
    Magnitude magnitude_;
    Unit unit_;
    std::vector<ProvenanceEntry> provenance_;

    TrackedQuantity(Magnitude magnitude, Unit unit, std::vector<ProvenanceEntry> provenance);

    static ProvenanceEntry makeEntry(OperationKind kind, const std::string& source,
                                     std::optional<std::string> from_unit = std::nullopt,
                                     std::optional<std::string> to_unit = std::nullopt);

    TrackedQuantity combineAdditive(const TrackedQuantity& other, OperationKind kind,
                                    const std::function<double(double, double)>& fn) const;

    TrackedQuantity derive(Magnitude magnitude, Unit unit, OperationKind kind,
                           const TrackedQuantity* other) const;
};

} // namespace QTRACK

#endif // TRACKED_QUANTITY_HPP

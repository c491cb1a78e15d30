#include "TrackedQuantity.hpp"
#include "UnitErrors.hpp"
#include "ExportUtils.hpp"
#include <sstream>
#include <stdexcept>

namespace QTRACK {

using ExportUtils::jsonString;

// =============================================================================
// Magnitude Implementation
// =============================================================================

double Magnitude::scalar() const {
    if (isArray()) {
        throw std::logic_error("Magnitude is an array of " + std::to_string(array().size()) +
                               " values, not a scalar");
    }
    return std::get<double>(data_);
}

const std::vector<double>& Magnitude::array() const {
    if (!isArray()) {
        throw std::logic_error("Magnitude is a scalar, not an array");
    }
    return std::get<std::vector<double>>(data_);
}

std::vector<double> Magnitude::values() const {
    if (isArray()) return array();
    return {std::get<double>(data_)};
}

Magnitude Magnitude::transform(const std::function<double(double)>& fn) const {
    if (!isArray()) {
        return Magnitude(fn(std::get<double>(data_)));
    }
    std::vector<double> out;
    out.reserve(array().size());
    for (double v : array()) {
        out.push_back(fn(v));
    }
    return Magnitude(std::move(out));
}

Magnitude Magnitude::combine(const Magnitude& a, const Magnitude& b,
                             const std::function<double(double, double)>& fn) {
    if (!a.isArray() && !b.isArray()) {
        return Magnitude(fn(a.scalar(), b.scalar()));
    }
    if (a.isArray() && b.isArray() && a.size() != b.size()) {
        throw std::invalid_argument("Cannot combine arrays of length " +
                                    std::to_string(a.size()) + " and " +
                                    std::to_string(b.size()));
    }

    size_t n = a.isArray() ? a.size() : b.size();
    std::vector<double> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        double lhs = a.isArray() ? a.array()[i] : a.scalar();
        double rhs = b.isArray() ? b.array()[i] : b.scalar();
        out.push_back(fn(lhs, rhs));
    }
    return Magnitude(std::move(out));
}

std::string Magnitude::toString() const {
    if (isArray()) return ExportUtils::formatArray(array());
    return ExportUtils::formatNumber(scalar());
}

std::string Magnitude::toJson() const {
    if (isArray()) return ExportUtils::jsonArray(array());
    return ExportUtils::jsonNumber(scalar());
}

// =============================================================================
// Operation Kinds
// =============================================================================

std::string operationKindToString(OperationKind kind) {
    switch (kind) {
        case OperationKind::CREATED:   return "created";
        case OperationKind::CONVERTED: return "converted";
        case OperationKind::ADD:       return "add";
        case OperationKind::SUBTRACT:  return "subtract";
        case OperationKind::MULTIPLY:  return "multiply";
        case OperationKind::DIVIDE:    return "divide";
    }
    return "unknown";
}

OperationKind operationKindFromString(const std::string& name) {
    if (name == "created") return OperationKind::CREATED;
    if (name == "converted") return OperationKind::CONVERTED;
    if (name == "add") return OperationKind::ADD;
    if (name == "subtract") return OperationKind::SUBTRACT;
    if (name == "multiply") return OperationKind::MULTIPLY;
    if (name == "divide") return OperationKind::DIVIDE;
    throw std::invalid_argument("Unknown provenance operation: '" + name + "'");
}

// =============================================================================
// Provenance Records
// =============================================================================

namespace {

std::string optionalJson(const std::optional<std::string>& value) {
    return value ? jsonString(*value) : std::string("null");
}

} // namespace

std::string ProvenanceRecord::toJson() const {
    std::ostringstream ss;
    ss << "{\"timestamp\": " << jsonString(timestamp)
       << ", \"operation\": " << jsonString(operation)
       << ", \"source\": " << jsonString(source)
       << ", \"from_unit\": " << optionalJson(from_unit)
       << ", \"to_unit\": " << optionalJson(to_unit) << "}";
    return ss.str();
}

ProvenanceRecord ProvenanceEntry::toRecord() const {
    ProvenanceRecord record;
    record.timestamp = ExportUtils::formatIsoTimestamp(timestamp);
    record.operation = operationKindToString(operation);
    record.source = source;
    record.from_unit = from_unit;
    record.to_unit = to_unit;
    return record;
}

ProvenanceEntry ProvenanceEntry::fromRecord(const ProvenanceRecord& record) {
    ProvenanceEntry entry;
    entry.timestamp = ExportUtils::parseIsoTimestamp(record.timestamp);
    entry.operation = operationKindFromString(record.operation);
    entry.source = record.source;
    entry.from_unit = record.from_unit;
    entry.to_unit = record.to_unit;
    return entry;
}

std::string QuantityRecord::toJson(int indent) const {
    const std::string pad(static_cast<size_t>(indent), ' ');
    std::ostringstream ss;
    ss << "{\n";
    ss << pad << "  \"magnitude\": " << magnitude.toJson() << ",\n";
    ss << pad << "  \"unit\": " << jsonString(unit) << ",\n";
    ss << pad << "  \"provenance\": [";
    for (size_t i = 0; i < provenance.size(); ++i) {
        ss << (i == 0 ? "\n" : ",\n") << pad << "    " << provenance[i].toJson();
    }
    if (!provenance.empty()) ss << "\n" << pad << "  ";
    ss << "]\n";
    ss << pad << "}";
    return ss.str();
}

// =============================================================================
// TrackedQuantity Implementation
// =============================================================================

TrackedQuantity::TrackedQuantity(const Magnitude& magnitude, const std::string& unit,
                                 const std::string& source)
    : magnitude_(magnitude),
      unit_(UnitRegistryManager::getInstance().resolve(unit)) {
    provenance_.push_back(makeEntry(OperationKind::CREATED, source, std::nullopt, unit_.symbol));
}

TrackedQuantity::TrackedQuantity(Magnitude magnitude, Unit unit,
                                 std::vector<ProvenanceEntry> provenance)
    : magnitude_(std::move(magnitude)), unit_(std::move(unit)),
      provenance_(std::move(provenance)) {}

TrackedQuantity TrackedQuantity::createWithHistory(const Magnitude& magnitude,
                                                   const std::string& unit,
                                                   const std::string& source,
                                                   const std::vector<ProvenanceEntry>& history) {
    TrackedQuantity created(magnitude, unit, source);
    std::vector<ProvenanceEntry> combined = history;
    combined.push_back(created.provenance_.front());
    created.provenance_ = std::move(combined);
    return created;
}

ProvenanceEntry TrackedQuantity::makeEntry(OperationKind kind, const std::string& source,
                                           std::optional<std::string> from_unit,
                                           std::optional<std::string> to_unit) {
    ProvenanceEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.operation = kind;
    entry.source = source;
    entry.from_unit = std::move(from_unit);
    entry.to_unit = std::move(to_unit);
    return entry;
}

TrackedQuantity TrackedQuantity::derive(Magnitude magnitude, Unit unit, OperationKind kind,
                                        const TrackedQuantity* other) const {
    std::vector<ProvenanceEntry> history = provenance_;
    if (other) {
        history.insert(history.end(), other->provenance_.begin(), other->provenance_.end());
    }
    history.push_back(makeEntry(kind, ""));
    return TrackedQuantity(std::move(magnitude), std::move(unit), std::move(history));
}

TrackedQuantity TrackedQuantity::to(const std::string& target_unit) const {
    const UnitRegistry& registry = UnitRegistryManager::getInstance();
    Unit target = registry.resolve(target_unit);

    if (!unit_.isCompatible(target)) {
        throw DimensionMismatchError(dimensionality(), target.dimension.toString(),
                                     "Cannot convert '" + unit_.symbol + "' to '" +
                                     target.symbol + "'");
    }

    const Unit& from = unit_;
    Magnitude converted = magnitude_.transform([&](double v) {
        return registry.convert(v, from, target);
    });

    std::vector<ProvenanceEntry> history = provenance_;
    history.push_back(makeEntry(OperationKind::CONVERTED, "", unit_.symbol, target.symbol));
    return TrackedQuantity(std::move(converted), std::move(target), std::move(history));
}

bool TrackedQuantity::isCompatible(const TrackedQuantity& other) const {
    return unit_.isCompatible(other.unit_);
}

bool TrackedQuantity::isCompatible(const std::string& unit_string) const {
    try {
        return unit_.isCompatible(UnitRegistryManager::getInstance().resolve(unit_string));
    } catch (const UnknownUnitError&) {
        return false;
    }
}

void TrackedQuantity::checkDimensions(const std::string& expected) const {
    if (!expected.empty() && (expected[0] == '[' || expected == "dimensionless")) {
        if (dimensionality() != expected) {
            throw DimensionMismatchError(dimensionality(), expected,
                                         "Quantity in '" + unit_.symbol + "'");
        }
        return;
    }

    if (!isCompatible(expected)) {
        std::string expected_dim = expected;
        const UnitRegistry& registry = UnitRegistryManager::getInstance();
        if (registry.hasUnit(expected)) {
            expected_dim = registry.getDimension(expected).toString();
        }
        throw DimensionMismatchError(dimensionality(), expected_dim,
                                     "Quantity in '" + unit_.symbol +
                                     "' is not compatible with '" + expected + "'");
    }
}

TrackedQuantity TrackedQuantity::combineAdditive(const TrackedQuantity& other, OperationKind kind,
                                                 const std::function<double(double, double)>& fn) const {
    if (!isCompatible(other)) {
        DimensionMismatchError cause(dimensionality(), other.dimensionality());
        throw UnitMismatchError(operationKindToString(kind), unit_.symbol,
                                other.unit_.symbol, cause);
    }

    const UnitRegistry& registry = UnitRegistryManager::getInstance();
    const Unit& into = unit_;
    Magnitude rhs = other.magnitude_.transform([&](double v) {
        return registry.convert(v, other.unit_, into);
    });

    return derive(Magnitude::combine(magnitude_, rhs, fn), unit_, kind, &other);
}

TrackedQuantity TrackedQuantity::add(const TrackedQuantity& other) const {
    return combineAdditive(other, OperationKind::ADD,
                           [](double a, double b) { return a + b; });
}

TrackedQuantity TrackedQuantity::subtract(const TrackedQuantity& other) const {
    return combineAdditive(other, OperationKind::SUBTRACT,
                           [](double a, double b) { return a - b; });
}

TrackedQuantity TrackedQuantity::multiply(const TrackedQuantity& other) const {
    Magnitude product = Magnitude::combine(magnitude_, other.magnitude_,
                                           [](double a, double b) { return a * b; });
    return derive(std::move(product), unit_.multiply(other.unit_), OperationKind::MULTIPLY, &other);
}

TrackedQuantity TrackedQuantity::divide(const TrackedQuantity& other) const {
    Magnitude quotient = Magnitude::combine(magnitude_, other.magnitude_,
                                            [](double a, double b) { return a / b; });
    return derive(std::move(quotient), unit_.divide(other.unit_), OperationKind::DIVIDE, &other);
}

TrackedQuantity TrackedQuantity::multiply(double factor) const {
    return derive(magnitude_.transform([factor](double v) { return v * factor; }),
                  unit_, OperationKind::MULTIPLY, nullptr);
}

TrackedQuantity TrackedQuantity::divide(double divisor) const {
    return derive(magnitude_.transform([divisor](double v) { return v / divisor; }),
                  unit_, OperationKind::DIVIDE, nullptr);
}

// =============================================================================
// Serialization
// =============================================================================

QuantityRecord TrackedQuantity::toRecord() const {
    QuantityRecord record;
    record.magnitude = magnitude_;
    record.unit = unit_.symbol;
    record.provenance.reserve(provenance_.size());
    for (const auto& entry : provenance_) {
        record.provenance.push_back(entry.toRecord());
    }
    return record;
}

TrackedQuantity TrackedQuantity::fromRecord(const QuantityRecord& record) {
    Unit unit = UnitRegistryManager::getInstance().resolve(record.unit);

    std::vector<ProvenanceEntry> history;
    history.reserve(record.provenance.size());
    for (const auto& entry : record.provenance) {
        history.push_back(ProvenanceEntry::fromRecord(entry));
    }

    if (history.empty()) {
        history.push_back(makeEntry(OperationKind::CREATED, "", std::nullopt, unit.symbol));
    } else if (history.front().operation != OperationKind::CREATED) {
        throw std::invalid_argument("Provenance for '" + record.unit +
                                    "' must start with a 'created' entry, got '" +
                                    record.provenance.front().operation + "'");
    }

    return TrackedQuantity(record.magnitude, std::move(unit), std::move(history));
}

std::string TrackedQuantity::toString() const {
    std::ostringstream ss;
    ss << "TrackedQuantity(" << magnitude_.toString() << ", '" << unit_.symbol
       << "', provenance=" << provenance_.size() << ")";
    return ss.str();
}

} // namespace QTRACK

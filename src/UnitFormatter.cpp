#include "UnitFormatter.hpp"
#include "ExportUtils.hpp"
#include <sstream>
#include <stdexcept>
#include <cstdio>

namespace QTRACK {

void UnitFormatter::registerTemplate(const std::string& category, const FormatTemplate& format) {
    if (format.precision < 0) {
        throw std::invalid_argument("Template '" + category + "' has negative precision " +
                                    std::to_string(format.precision));
    }
    templates_[category] = format;
}

bool UnitFormatter::hasTemplate(const std::string& category) const {
    return templates_.find(category) != templates_.end();
}

FormatTemplate UnitFormatter::templateFor(const TrackedQuantity& q,
                                          const std::optional<std::string>& category) const {
    if (category) {
        auto it = templates_.find(*category);
        return it != templates_.end() ? it->second : FormatTemplate();
    }

    const std::string& unit_category = q.unit().category;
    if (!unit_category.empty()) {
        auto it = templates_.find(unit_category);
        if (it != templates_.end()) return it->second;
    }

    const std::string dimensionality = q.dimensionality();
    for (const auto& pair : templates_) {
        if (dimensionality.find(pair.first) != std::string::npos) {
            return pair.second;
        }
    }

    return FormatTemplate();
}

std::string UnitFormatter::formatNumber(double value, const FormatTemplate& format) {
    const char* pattern = (format.notation == Notation::SCIENTIFIC) ? "%.*e" : "%.*f";
    int length = std::snprintf(nullptr, 0, pattern, format.precision, value);
    std::string buffer(static_cast<size_t>(length) + 1, '\0');
    std::snprintf(&buffer[0], buffer.size(), pattern, format.precision, value);
    buffer.resize(static_cast<size_t>(length));
    return buffer;
}

std::string UnitFormatter::formatQuantity(const TrackedQuantity& q,
                                          const std::optional<std::string>& category) const {
    FormatTemplate format = templateFor(q, category);

    std::ostringstream ss;
    if (q.magnitude().isArray()) {
        ss << "[";
        const auto& values = q.magnitude().array();
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << formatNumber(values[i], format);
        }
        ss << "]";
    } else {
        ss << formatNumber(q.value(), format);
    }
    ss << " " << q.unitString() << format.suffix;
    return ss.str();
}

std::string UnitFormatter::formatQuantityAs(const TrackedQuantity& q, const std::string& target_unit,
                                            const std::optional<std::string>& category) const {
    return formatQuantity(q.to(target_unit), category);
}

std::string UnitFormatter::formatWithProvenance(const TrackedQuantity& q,
                                                const std::optional<std::string>& target_unit) const {
    const TrackedQuantity shown = target_unit ? q.to(*target_unit) : q;

    std::ostringstream ss;
    ss << "Value: " << shown.magnitude().toString() << " " << shown.unitString() << "\n";
    ss << "Provenance:";

    for (const auto& entry : shown.provenance()) {
        ss << "\n  [" << ExportUtils::formatIsoTimestamp(entry.timestamp) << "] "
           << operationKindToString(entry.operation);
        if (!entry.source.empty()) ss << " | source=" << entry.source;
        if (entry.from_unit && !entry.from_unit->empty()) ss << " | from=" << *entry.from_unit;
        if (entry.to_unit && !entry.to_unit->empty()) ss << " | to=" << *entry.to_unit;
    }

    return ss.str();
}

std::string UnitFormatter::exportAuditTrail(const CalculationAuditLog& log,
                                            const std::string& format) const {
    if (format == "json") {
        return log.toJson();
    }
    if (format == "text") {
        return log.summary();
    }
    throw std::invalid_argument("Unsupported format '" + format + "'. Use 'json' or 'text'.");
}

} // namespace QTRACK

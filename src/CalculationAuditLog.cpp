#include "CalculationAuditLog.hpp"
#include "ExportUtils.hpp"
#include <sstream>

namespace QTRACK {

namespace {

std::string csvMagnitude(const Magnitude& magnitude) {
    if (magnitude.isArray()) {
        return ExportUtils::formatArray(magnitude.array(), ";");
    }
    return ExportUtils::formatNumber(magnitude.scalar());
}

void writeJsonSection(std::ostringstream& ss, const QuantityMap& quantities) {
    if (quantities.empty()) {
        ss << "{}";
        return;
    }
    ss << "{";
    bool first = true;
    for (const auto& entry : quantities) {
        ss << (first ? "\n" : ",\n");
        ss << "    " << ExportUtils::jsonString(entry.first) << ": "
           << entry.second.toJson(4);
        first = false;
    }
    ss << "\n  }";
}

void writeSummarySection(std::ostringstream& ss, const std::string& title,
                         const QuantityMap& quantities) {
    ss << "  " << title << " (" << quantities.size() << "):\n";
    for (const auto& entry : quantities) {
        ss << "    " << entry.first << ": " << entry.second.magnitude().toString()
           << " " << entry.second.unitString() << "\n";
    }
}

} // namespace

void CalculationAuditLog::addInput(const std::string& name, const TrackedQuantity& quantity) {
    inputs_.set(name, quantity);
}

void CalculationAuditLog::addOutput(const std::string& name, const TrackedQuantity& quantity) {
    outputs_.set(name, quantity);
}

void CalculationAuditLog::addStep(const std::string& description) {
    steps_.push_back(AuditStep{std::chrono::system_clock::now(), description});
}

QuantityMap CalculationAuditLog::filterByUnit(const QuantityMap& quantities,
                                              const std::string& unit) {
    const std::string symbol = UnitRegistryManager::getInstance().resolve(unit).symbol;

    QuantityMap result;
    for (const auto& entry : quantities) {
        if (entry.second.unitString() == symbol) {
            result.set(entry.first, entry.second);
        }
    }
    return result;
}

QuantityMap CalculationAuditLog::filterInputs(const std::string& unit) const {
    return filterByUnit(inputs_, unit);
}

QuantityMap CalculationAuditLog::filterOutputs(const std::string& unit) const {
    return filterByUnit(outputs_, unit);
}

// =============================================================================
// Export
// =============================================================================

std::string CalculationAuditLog::toJson() const {
    std::ostringstream ss;
    ss << "{\n";
    ss << "  \"inputs\": ";
    writeJsonSection(ss, inputs_);
    ss << ",\n  \"outputs\": ";
    writeJsonSection(ss, outputs_);
    ss << ",\n  \"steps\": [";
    for (size_t i = 0; i < steps_.size(); ++i) {
        ss << (i == 0 ? "\n" : ",\n") << "    "
           << ExportUtils::jsonString(steps_[i].description);
    }
    if (!steps_.empty()) ss << "\n  ";
    ss << "]\n}";
    return ss.str();
}

std::string CalculationAuditLog::toCsv() const {
    using ExportUtils::csvField;

    std::ostringstream ss;
    ss << "role,name,magnitude,unit";
    for (const auto& entry : inputs_) {
        ss << "\ninput," << csvField(entry.first) << ","
           << csvMagnitude(entry.second.magnitude()) << ","
           << csvField(entry.second.unitString());
    }
    for (const auto& entry : outputs_) {
        ss << "\noutput," << csvField(entry.first) << ","
           << csvMagnitude(entry.second.magnitude()) << ","
           << csvField(entry.second.unitString());
    }
    return ss.str();
}

std::string CalculationAuditLog::summary() const {
    std::ostringstream ss;
    ss << "Calculation Audit Log\n";
    writeSummarySection(ss, "Inputs", inputs_);
    writeSummarySection(ss, "Outputs", outputs_);
    ss << "  Steps (" << steps_.size() << "):";
    for (const auto& step : steps_) {
        ss << "\n    - " << step.description;
    }
    return ss.str();
}

} // namespace QTRACK

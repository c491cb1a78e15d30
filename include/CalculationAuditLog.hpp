#ifndef CALCULATION_AUDIT_LOG_HPP
#define CALCULATION_AUDIT_LOG_HPP

#include "TrackedQuantity.hpp"
#include "QuantityMap.hpp"
#include <string>
#include <vector>
#include <chrono>

namespace QTRACK {

/**
 * @brief One free-text computation step
 */
struct AuditStep {
    std::chrono::system_clock::time_point timestamp;
    std::string description;
};

/**
 * @brief Named inputs, named outputs and computation steps of one calculation
 *
 * Inputs and outputs keep insertion order; recording a name again replaces
 * the quantity without moving it. Steps are appended with the time they
 * were added.
 *
 * One log belongs to one calculation and is not safe for concurrent use.
 */
class CalculationAuditLog {
public:
    CalculationAuditLog() = default;

    void addInput(const std::string& name, const TrackedQuantity& quantity);
    void addOutput(const std::string& name, const TrackedQuantity& quantity);
    void addStep(const std::string& description);

    const QuantityMap& inputs() const { return inputs_; }
    const QuantityMap& outputs() const { return outputs_; }
    const std::vector<AuditStep>& steps() const { return steps_; }

    std::vector<std::string> inputNames() const { return inputs_.names(); }
    std::vector<std::string> outputNames() const { return outputs_.names(); }

    /**
     * @brief Inputs whose unit resolves to the same symbol as unit
     * @throws UnknownUnitError if unit cannot be resolved
     */
    QuantityMap filterInputs(const std::string& unit) const;
    QuantityMap filterOutputs(const std::string& unit) const;

    // =========================================================================
    // Export
    // =========================================================================

    /**
     * @brief {"inputs": {name: record}, "outputs": {...}, "steps": [description]}
     */
    std::string toJson() const;

    /**
     * @brief Header "role,name,magnitude,unit", then inputs, then outputs
     *
     * Array magnitudes are written as "[v1;v2;...]" so every row has four
     * columns.
     */
    std::string toCsv() const;

    // Human-readable listing of inputs, outputs and steps
    std::string summary() const;

private:
    QuantityMap inputs_;
    QuantityMap outputs_;
    std::vector<AuditStep> steps_;

    static QuantityMap filterByUnit(const QuantityMap& quantities, const std::string& unit);
};

} // namespace QTRACK

#endif // CALCULATION_AUDIT_LOG_HPP

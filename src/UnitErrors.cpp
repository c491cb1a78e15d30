#include "UnitErrors.hpp"

namespace QTRACK {

UnknownUnitError::UnknownUnitError(const std::string& unit)
    : UnitError("Unknown unit: '" + unit + "'"), unit_(unit) {}

UnknownUnitError::UnknownUnitError(const std::string& unit, const std::string& domain,
                                   const std::string& msg)
    : UnitError(msg), unit_(unit), domain_(domain) {}

DimensionMismatchError::DimensionMismatchError(const std::string& actual,
                                               const std::string& expected,
                                               const std::string& context)
    : UnitError((context.empty() ? std::string() : context + ": ") +
                "incompatible dimensions " + actual + " vs expected " + expected),
      actual_(actual), expected_(expected) {}

UnitMismatchError::UnitMismatchError(const std::string& operation,
                                     const std::string& left_unit,
                                     const std::string& right_unit,
                                     const DimensionMismatchError& cause)
    : UnitError("Cannot " + operation + " '" + left_unit + "' and '" + right_unit +
                "': incompatible dimensions " + cause.actual() + " vs " + cause.expected()),
      operation_(operation), left_unit_(left_unit), right_unit_(right_unit),
      cause_(std::make_shared<DimensionMismatchError>(cause)) {}

PolicyViolationError::PolicyViolationError(const std::string& system,
                                           const std::string& category,
                                           const std::string& expected_unit,
                                           const std::string& actual_unit)
    : UnitError("Unit policy violation (" + system + "): expected '" +
                (expected_unit.empty() ? std::string("<undefined>") : expected_unit) +
                "' for '" + category + "', got '" + actual_unit + "'"),
      category_(category), expected_unit_(expected_unit), actual_unit_(actual_unit) {}

OptionalDependencyError::OptionalDependencyError(const std::string& dependency,
                                                 const std::string& feature)
    : UnitError("Optional dependency missing: " + feature + " requires '" +
                dependency + "' to be installed"),
      dependency_(dependency) {}

} // namespace QTRACK

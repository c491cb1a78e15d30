#ifndef UNIT_ERRORS_HPP
#define UNIT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <memory>

namespace QTRACK {

/**
 * @brief Base class for every failure raised by the quantity engine
 */
class UnitError : public std::runtime_error {
public:
    explicit UnitError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief A unit string (registry symbol or domain key) could not be resolved
 */
class UnknownUnitError : public UnitError {
public:
    explicit UnknownUnitError(const std::string& unit);
    UnknownUnitError(const std::string& unit, const std::string& domain,
                     const std::string& msg);

    const std::string& unit() const { return unit_; }
    const std::string& domain() const { return domain_; }

private:
    std::string unit_;
    std::string domain_;
};

/**
 * @brief Dimensional compatibility required by an operation does not hold
 *
 * Carries both dimensionality strings, e.g. "[length]" vs "[mass]".
 */
class DimensionMismatchError : public UnitError {
public:
    DimensionMismatchError(const std::string& actual, const std::string& expected,
                           const std::string& context = "");

    const std::string& actual() const { return actual_; }
    const std::string& expected() const { return expected_; }

private:
    std::string actual_;
    std::string expected_;
};

/**
 * @brief Raised by add/subtract when the operands have different dimensions
 *
 * Names the operation and both operand units, and keeps the underlying
 * dimension error reachable through cause().
 */
class UnitMismatchError : public UnitError {
public:
    UnitMismatchError(const std::string& operation,
                      const std::string& left_unit,
                      const std::string& right_unit,
                      const DimensionMismatchError& cause);

    const std::string& operation() const { return operation_; }
    const std::string& leftUnit() const { return left_unit_; }
    const std::string& rightUnit() const { return right_unit_; }
    const DimensionMismatchError& cause() const { return *cause_; }

private:
    std::string operation_;
    std::string left_unit_;
    std::string right_unit_;
    std::shared_ptr<DimensionMismatchError> cause_;
};

/**
 * @brief A unit-system policy rejected a quantity
 */
class PolicyViolationError : public UnitError {
public:
    PolicyViolationError(const std::string& system, const std::string& category,
                         const std::string& expected_unit,
                         const std::string& actual_unit);

    const std::string& category() const { return category_; }
    const std::string& expectedUnit() const { return expected_unit_; }
    const std::string& actualUnit() const { return actual_unit_; }

private:
    std::string category_;
    std::string expected_unit_;
    std::string actual_unit_;
};

/**
 * @brief An optional external tool (e.g. Graphviz) is not installed
 */
class OptionalDependencyError : public UnitError {
public:
    OptionalDependencyError(const std::string& dependency, const std::string& feature);

    const std::string& dependency() const { return dependency_; }

private:
    std::string dependency_;
};

/**
 * @brief Configuration input could not be turned into tracked quantities
 */
class ConfigError : public UnitError {
public:
    ConfigError(const std::string& key, const std::string& msg)
        : UnitError(msg), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

} // namespace QTRACK

#endif // UNIT_ERRORS_HPP

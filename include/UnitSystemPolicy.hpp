#ifndef UNIT_SYSTEM_POLICY_HPP
#define UNIT_SYSTEM_POLICY_HPP

#include "TrackedQuantity.hpp"
#include <map>
#include <string>
#include <vector>
#include <optional>

namespace QTRACK {

// Quantity category -> unit string ("length" -> "mm")
using UnitSystemDefinition = std::map<std::string, std::string>;

/**
 * @brief Named unit systems: "SI", "inch" and "metric_engineering"
 *
 * Each defines the unit expected for length, stress, pressure, force,
 * moment, temperature and mass.
 */
const std::map<std::string, UnitSystemDefinition>& unitSystemTable();

std::vector<std::string> unitSystemNames();

/**
 * @throws ConfigError naming the system if it is not in unitSystemTable()
 */
const UnitSystemDefinition& unitSystemDefinition(const std::string& system);

/**
 * @brief Enforces that quantities are expressed in a unit system's units
 *
 * A category the system does not define passes through unchanged in
 * every mode. For defined categories:
 * - auto_convert: a compatible quantity in another unit is converted
 *   (otherwise it is a violation)
 * - strict: carried for callers (isStrict()); with or without it a
 *   mismatch is a violation exactly when auto_convert is off
 */
class UnitSystemPolicy {
public:
    /**
     * @throws ConfigError if the system name is unknown
     */
    explicit UnitSystemPolicy(const std::string& system, bool strict = false,
                              bool auto_convert = true);

    const std::string& system() const { return system_; }
    bool isStrict() const { return strict_; }
    bool autoConvert() const { return auto_convert_; }

    // Unit the system expects for a category, if it defines one
    std::optional<std::string> expectedUnit(const std::string& category) const;

    /**
     * @brief True if enforce() would return the quantity unchanged
     *
     * Never throws.
     */
    bool validate(const TrackedQuantity& quantity, const std::string& category) const;

    /**
     * @brief Apply the policy to a quantity
     *
     * @return The quantity itself, or a converted copy
     * @throws PolicyViolationError, DimensionMismatchError
     */
    TrackedQuantity enforce(const TrackedQuantity& quantity, const std::string& category) const;

private:
    std::string system_;
    bool strict_;
    bool auto_convert_;
    const UnitSystemDefinition* units_;
};

} // namespace QTRACK

#endif // UNIT_SYSTEM_POLICY_HPP

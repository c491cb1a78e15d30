#ifndef INPUT_PARSER_HPP
#define INPUT_PARSER_HPP

#include "TrackedQuantity.hpp"
#include "QuantityMap.hpp"
#include <map>
#include <string>
#include <vector>
#include <utility>
#include <optional>

namespace QTRACK {

class ConfigReader;

// Field name -> quantity category ("wall_thickness" -> "length")
using FieldQuantityMap = std::map<std::string, std::string>;

// Flat configuration block: field name -> number, in input order
using ConfigValues = std::vector<std::pair<std::string, double>>;

/**
 * @brief Default field name -> quantity category map
 *
 * thickness, breadth, width, height, depth, diameter, radius, length,
 * wave_height, water_depth -> length; youngs_modulus, yield_strength,
 * ultimate_strength, stress -> stress; pressure -> pressure;
 * force, weight -> force; temperature, temp -> temperature; mass -> mass.
 */
const FieldQuantityMap& defaultFieldQuantityMap();

/**
 * @brief Field map for offshore structural inputs
 *
 * The default config field map extended with plate/wall thicknesses,
 * stresses, pressures and axial forces.
 */
const FieldQuantityMap& offshoreFieldQuantityMap();

/**
 * @brief Turn one configuration number into a tracked quantity
 *
 * The unit is the explicit unit when given, otherwise the unit that
 * unit_system defines for the field's category.
 *
 * @throws ConfigError naming the field for an unknown unit system, a field
 *         without a category, or a unit that cannot be resolved
 */
TrackedQuantity parseConfigValue(double value, const std::string& field,
                                 const std::string& unit_system,
                                 const std::string& source = "config",
                                 const std::optional<std::string>& explicit_unit = std::nullopt,
                                 const FieldQuantityMap& field_map = defaultFieldQuantityMap());

/**
 * @brief Parse a whole block; the first failure aborts the parse
 *
 * @return Quantities keyed by field name, in input order
 * @throws ConfigError
 */
QuantityMap parseConfigSection(const ConfigValues& values,
                               const std::string& unit_system,
                               const std::string& source = "config",
                               const FieldQuantityMap& field_map = defaultFieldQuantityMap());

/**
 * @brief Parse one section of an INI file
 *
 * The "unit_system" key selects the system (default "SI"). Every other
 * key holds a number, optionally followed by a unit ("12 in") which
 * overrides the system's unit for that field.
 *
 * @throws ConfigError if the section is missing or a value is malformed
 */
QuantityMap parseConfigFile(const ConfigReader& reader, const std::string& section,
                            const std::string& source = "config",
                            const FieldQuantityMap& field_map = defaultFieldQuantityMap());

} // namespace QTRACK

#endif // INPUT_PARSER_HPP

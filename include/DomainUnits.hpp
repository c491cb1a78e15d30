#ifndef DOMAIN_UNITS_HPP
#define DOMAIN_UNITS_HPP

#include <map>
#include <string>
#include <optional>

namespace QTRACK {

/**
 * @brief Short domain key -> unit string understood by the UnitRegistry
 *
 * Keys are the spellings used by upstream data feeds ("knots", "BOE",
 * "fahrenheit"); values are registry units ("kt", "BOE", "degF").
 */
using UnitMapping = std::map<std::string, std::string>;

// =============================================================================
// Domain Key Tables
// =============================================================================

const UnitMapping& speedUnitMapping();
const UnitMapping& lengthUnitMapping();
const UnitMapping& temperatureUnitMapping();
const UnitMapping& pressureUnitMapping();

/**
 * @brief Energy and commodity keys
 *
 * Thermal (BTU, MMBTU, THERM, GJ, MWH, KWH, TOE, BOE), liquid volume
 * (BBL, BBL_OIL, GAL, L, M3), gas volume (MCF, MMCF, BCF, TCF, SCF) and
 * mass (TONNE, SHORT_TON, LONG_TON, KG, LB). Only keys of the same
 * dimension convert into each other.
 */
const UnitMapping& energyUnitMapping();

const UnitMapping& massUnitMapping();
const UnitMapping& volumeUnitMapping();

// =============================================================================
// Conversion
// =============================================================================

/**
 * @brief Convert a plain number between two keys of a domain mapping
 *
 * @param value Value to convert; std::nullopt passes straight through
 * @param domain Label used in error messages ("speed", "energy", ...)
 * @throws UnknownUnitError "Unknown <domain> unit '<key>'. Known units: [...]"
 * @throws DimensionMismatchError if the two keys are not convertible
 */
std::optional<double> convertDomainValue(std::optional<double> value,
                                         const std::string& from_key,
                                         const std::string& to_key,
                                         const UnitMapping& mapping,
                                         const std::string& domain);

std::optional<double> convertSpeed(std::optional<double> value, const std::string& from_key,
                                   const std::string& to_key = "m/s");

std::optional<double> convertLength(std::optional<double> value, const std::string& from_key,
                                    const std::string& to_key = "m");

std::optional<double> convertTemperature(std::optional<double> value, const std::string& from_key,
                                         const std::string& to_key = "celsius");

std::optional<double> convertPressure(std::optional<double> value, const std::string& from_key,
                                      const std::string& to_key = "hPa");

// Energy conversions always carry a value
double convertEnergyUnits(double value, const std::string& from_key, const std::string& to_key);

std::optional<double> convertMass(std::optional<double> value, const std::string& from_key,
                                  const std::string& to_key = "KG");

std::optional<double> convertVolume(std::optional<double> value, const std::string& from_key,
                                    const std::string& to_key = "M3");

} // namespace QTRACK

#endif // DOMAIN_UNITS_HPP

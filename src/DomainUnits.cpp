#include "DomainUnits.hpp"
#include "UnitRegistry.hpp"
#include "UnitErrors.hpp"
#include <sstream>

namespace QTRACK {

namespace {

std::string knownKeys(const UnitMapping& mapping) {
    std::ostringstream ss;
    ss << "[";
    bool first = true;
    for (const auto& pair : mapping) {
        if (!first) ss << ", ";
        ss << "'" << pair.first << "'";
        first = false;
    }
    ss << "]";
    return ss.str();
}

const std::string& lookupKey(const UnitMapping& mapping, const std::string& key,
                             const std::string& domain) {
    auto it = mapping.find(key);
    if (it == mapping.end()) {
        throw UnknownUnitError(key, domain,
                               "Unknown " + domain + " unit '" + key + "'. Known units: " +
                               knownKeys(mapping));
    }
    return it->second;
}

} // namespace

// =============================================================================
// Metocean Tables
// =============================================================================

const UnitMapping& speedUnitMapping() {
    static const UnitMapping mapping = {
        {"m/s", "m/s"},
        {"knots", "knot"},
        {"km/h", "km/hr"},
        {"mph", "mph"},
        {"ft/s", "ft/s"},
    };
    return mapping;
}

const UnitMapping& lengthUnitMapping() {
    static const UnitMapping mapping = {
        {"m", "m"},
        {"feet", "ft"},
        {"cm", "cm"},
        {"inches", "inch"},
        {"nm", "nautical_mile"},  // nautical miles, not nanometres
        {"km", "km"},
        {"mm", "mm"},
    };
    return mapping;
}

const UnitMapping& temperatureUnitMapping() {
    static const UnitMapping mapping = {
        {"celsius", "degC"},
        {"fahrenheit", "degF"},
        {"kelvin", "kelvin"},
    };
    return mapping;
}

const UnitMapping& pressureUnitMapping() {
    static const UnitMapping mapping = {
        {"hPa", "hectopascal"},
        {"mbar", "millibar"},
        {"inHg", "inHg"},
        {"mmHg", "mmHg"},
        {"Pa", "Pa"},
        {"kPa", "kPa"},
        {"atm", "atm"},
        {"psi", "psi"},
    };
    return mapping;
}

// =============================================================================
// Energy and Commodity Tables
// =============================================================================

const UnitMapping& energyUnitMapping() {
    static const UnitMapping mapping = {
        // Thermal
        {"BTU", "BTU"},
        {"MMBTU", "MMBTU"},
        {"THERM", "therm"},
        {"GJ", "GJ"},
        {"MWH", "MWh"},
        {"KWH", "kWh"},
        {"TOE", "TOE"},
        {"BOE", "BOE"},
        // Liquid volume
        {"BBL", "oil_barrel"},
        {"BBL_OIL", "oil_barrel"},
        {"GAL", "gallon"},
        {"L", "liter"},
        {"M3", "m**3"},
        // Gas volume, as heating-value equivalents
        {"MCF", "MCF"},
        {"MMCF", "MMCF"},
        {"BCF", "BCF"},
        {"TCF", "TCF"},
        {"SCF", "SCF"},
        // Mass
        {"TONNE", "metric_ton"},
        {"SHORT_TON", "short_ton"},
        {"LONG_TON", "long_ton"},
        {"KG", "kg"},
        {"LB", "lb"},
    };
    return mapping;
}

const UnitMapping& massUnitMapping() {
    static const UnitMapping mapping = {
        {"TONNE", "metric_ton"},
        {"SHORT_TON", "short_ton"},
        {"LONG_TON", "long_ton"},
        {"KG", "kg"},
        {"LB", "lb"},
    };
    return mapping;
}

const UnitMapping& volumeUnitMapping() {
    static const UnitMapping mapping = {
        {"BBL", "oil_barrel"},
        {"BBL_OIL", "oil_barrel"},
        {"GAL", "gallon"},
        {"L", "liter"},
        {"M3", "m**3"},
    };
    return mapping;
}

// =============================================================================
// Conversion Functions
// =============================================================================

std::optional<double> convertDomainValue(std::optional<double> value,
                                         const std::string& from_key,
                                         const std::string& to_key,
                                         const UnitMapping& mapping,
                                         const std::string& domain) {
    if (!value) {
        return std::nullopt;
    }

    const std::string& from_unit = lookupKey(mapping, from_key, domain);
    const std::string& to_unit = lookupKey(mapping, to_key, domain);

    return UnitRegistryManager::getInstance().convert(*value, from_unit, to_unit);
}

std::optional<double> convertSpeed(std::optional<double> value, const std::string& from_key,
                                   const std::string& to_key) {
    return convertDomainValue(value, from_key, to_key, speedUnitMapping(), "speed");
}

std::optional<double> convertLength(std::optional<double> value, const std::string& from_key,
                                    const std::string& to_key) {
    return convertDomainValue(value, from_key, to_key, lengthUnitMapping(), "length");
}

std::optional<double> convertTemperature(std::optional<double> value, const std::string& from_key,
                                         const std::string& to_key) {
    return convertDomainValue(value, from_key, to_key, temperatureUnitMapping(), "temperature");
}

std::optional<double> convertPressure(std::optional<double> value, const std::string& from_key,
                                      const std::string& to_key) {
    return convertDomainValue(value, from_key, to_key, pressureUnitMapping(), "pressure");
}

double convertEnergyUnits(double value, const std::string& from_key, const std::string& to_key) {
    return *convertDomainValue(value, from_key, to_key, energyUnitMapping(), "energy");
}

std::optional<double> convertMass(std::optional<double> value, const std::string& from_key,
                                  const std::string& to_key) {
    return convertDomainValue(value, from_key, to_key, massUnitMapping(), "mass");
}

std::optional<double> convertVolume(std::optional<double> value, const std::string& from_key,
                                    const std::string& to_key) {
    return convertDomainValue(value, from_key, to_key, volumeUnitMapping(), "volume");
}

} // namespace QTRACK

#include "InputParser.hpp"
#include "UnitSystemPolicy.hpp"
#include "ConfigReader.hpp"
#include "UnitErrors.hpp"

namespace QTRACK {

const FieldQuantityMap& defaultFieldQuantityMap() {
    static const FieldQuantityMap fields = {
        {"thickness", "length"},
        {"breadth", "length"},
        {"width", "length"},
        {"height", "length"},
        {"depth", "length"},
        {"diameter", "length"},
        {"radius", "length"},
        {"length", "length"},
        {"youngs_modulus", "stress"},
        {"yield_strength", "stress"},
        {"ultimate_strength", "stress"},
        {"stress", "stress"},
        {"pressure", "pressure"},
        {"wave_height", "length"},
        {"water_depth", "length"},
        {"force", "force"},
        {"weight", "force"},
        {"temperature", "temperature"},
        {"temp", "temperature"},
        {"mass", "mass"},
    };
    return fields;
}

const FieldQuantityMap& offshoreFieldQuantityMap() {
    static const FieldQuantityMap mapping = [] {
        FieldQuantityMap fields = defaultFieldQuantityMap();
        fields["wall_thickness"] = "length";
        fields["plate_thickness"] = "length";
        fields["stiffener_height"] = "length";
        fields["buckling_stress"] = "stress";
        fields["von_mises_stress"] = "stress";
        fields["hoop_stress"] = "stress";
        fields["hydrostatic_pressure"] = "pressure";
        fields["internal_pressure"] = "pressure";
        fields["external_pressure"] = "pressure";
        fields["buoyancy_force"] = "force";
        fields["tension"] = "force";
        fields["compression"] = "force";
        return fields;
    }();
    return mapping;
}

TrackedQuantity parseConfigValue(double value, const std::string& field,
                                 const std::string& unit_system,
                                 const std::string& source,
                                 const std::optional<std::string>& explicit_unit,
                                 const FieldQuantityMap& field_map) {
    std::string unit;
    if (explicit_unit) {
        unit = *explicit_unit;
    } else {
        auto field_it = field_map.find(field);
        if (field_it == field_map.end()) {
            throw ConfigError(field, "Field '" + field +
                                     "' has no known quantity type and no explicit unit");
        }

        const UnitSystemDefinition& system = unitSystemDefinition(unit_system);
        auto unit_it = system.find(field_it->second);
        if (unit_it == system.end()) {
            throw ConfigError(field, "Unit system '" + unit_system + "' defines no unit for '" +
                                     field_it->second + "' (field '" + field + "')");
        }
        unit = unit_it->second;
    }

    try {
        return TrackedQuantity(value, unit, source);
    } catch (const UnknownUnitError& e) {
        throw ConfigError(field, "Field '" + field + "': " + e.what());
    }
}

QuantityMap parseConfigSection(const ConfigValues& values,
                               const std::string& unit_system,
                               const std::string& source,
                               const FieldQuantityMap& field_map) {
    // Unknown systems fail even for an empty block
    unitSystemDefinition(unit_system);

    QuantityMap result;
    for (const auto& entry : values) {
        result.set(entry.first, parseConfigValue(entry.second, entry.first, unit_system,
                                                 source, std::nullopt, field_map));
    }
    return result;
}

QuantityMap parseConfigFile(const ConfigReader& reader, const std::string& section,
                            const std::string& source,
                            const FieldQuantityMap& field_map) {
    if (!reader.hasSection(section)) {
        throw ConfigError(section, "Configuration has no section [" + section + "]");
    }

    const std::string unit_system = reader.getString(section, "unit_system", "SI");
    unitSystemDefinition(unit_system);

    const UnitRegistry& registry = UnitRegistryManager::getInstance();
    QuantityMap result;

    for (const auto& key : reader.getKeys(section)) {
        if (key == "unit_system") continue;

        const std::string text = reader.getString(section, key);
        double value;
        std::string unit;
        if (!registry.parseValueWithUnit(text, value, unit)) {
            throw ConfigError(key, "[" + section + "]:" + key + " = '" + text +
                                   "' is not a number");
        }

        std::optional<std::string> explicit_unit;
        if (!unit.empty()) explicit_unit = unit;

        result.set(key, parseConfigValue(value, key, unit_system, source,
                                         explicit_unit, field_map));
    }

    return result;
}

} // namespace QTRACK

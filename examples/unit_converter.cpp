/**
 * @file unit_converter.cpp
 * @brief Command-line unit converter with provenance output
 *
 * Usage:
 *   ./unit_converter <value> <from_unit> <to_unit>
 *   ./unit_converter --domain <domain> <value> <from_key> <to_key>
 *   ./unit_converter --list [category]
 *   ./unit_converter --systems
 *   ./unit_converter --all
 *   ./unit_converter --help
 *
 * Examples:
 *   ./unit_converter 5000 psi MPa
 *   ./unit_converter 9.81 "kg*m/s^2" lbf
 *   ./unit_converter --domain speed 12 knots m/s
 *   ./unit_converter --list pressure
 */

#include "QTRACK.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <cstring>

using namespace QTRACK;

namespace {

void printHelp() {
    std::cout << "\n";
    std::cout << "QTRACK Unit Converter " << VERSION << "\n";
    std::cout << "========================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  unit_converter <value> <from_unit> <to_unit>\n";
    std::cout << "  unit_converter --domain <domain> <value> <from_key> <to_key>\n";
    std::cout << "  unit_converter --list [category]\n";
    std::cout << "  unit_converter --systems\n";
    std::cout << "  unit_converter --all\n";
    std::cout << "  unit_converter --help\n\n";
    std::cout << "Unit expressions may combine units with '*', '/', '^' and parentheses,\n";
    std::cout << "e.g. \"kg*m/s^2\" or \"lbf * inch\".\n\n";
    std::cout << "Domains: speed, length, temperature, pressure, energy, mass, volume\n\n";
    std::cout << "Examples:\n";
    std::cout << "  unit_converter 5000 psi MPa\n";
    std::cout << "  unit_converter 100 degC degF\n";
    std::cout << "  unit_converter 1 MMBTU MCF\n";
    std::cout << "  unit_converter --domain speed 12 knots m/s\n";
    std::cout << "  unit_converter --list pressure\n\n";
}

void listUnits(const UnitRegistry& units, const std::string& category = "") {
    std::cout << "\n";

    if (category.empty()) {
        std::cout << "Available Unit Categories:\n";
        std::cout << "==========================\n\n";

        for (const auto& cat : units.getCategories()) {
            std::cout << std::setw(25) << std::left << cat
                      << " (" << units.getUnitsInCategory(cat).size() << " units)\n";
        }
        std::cout << "\nUse: unit_converter --list <category> to see units in a category\n\n";
        return;
    }

    auto cat_units = units.getUnitsInCategory(category);
    if (cat_units.empty()) {
        std::cout << "Category '" << category << "' not found.\n";
        std::cout << "Use: unit_converter --list to see available categories\n\n";
        return;
    }

    std::cout << "Units in category: " << category << "\n";
    std::cout << std::string(60, '=') << "\n\n";
    std::cout << std::setw(28) << std::left << "Name"
              << std::setw(12) << "Symbol"
              << "To SI Base\n";
    std::cout << std::string(60, '-') << "\n";

    for (const auto* unit : cat_units) {
        std::cout << std::setw(28) << std::left << unit->name
                  << std::setw(12) << unit->symbol
                  << ExportUtils::formatNumber(unit->to_base);
        if (unit->offset != 0.0) {
            std::cout << " (offset: " << ExportUtils::formatNumber(unit->offset) << ")";
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

void listSystems() {
    std::cout << "\nUnit Systems:\n";
    std::cout << "=============\n";
    for (const auto& name : unitSystemNames()) {
        std::cout << "\n[" << name << "]\n";
        for (const auto& pair : unitSystemDefinition(name)) {
            std::cout << "  " << std::setw(14) << std::left << pair.first << pair.second << "\n";
        }
    }
    std::cout << "\n";
}

int performConversion(double value, const std::string& from_unit, const std::string& to_unit) {
    try {
        TrackedQuantity input(value, from_unit, "command line");
        TrackedQuantity output = input.to(to_unit);

        const UnitRegistry& units = UnitRegistryManager::getInstance();
        double si_value = units.toBase(value, from_unit);
        std::string si_unit = units.getBaseUnit(input.dimension());

        UnitFormatter formatter;
        FormatTemplate full;
        full.precision = 6;
        formatter.registerTemplate("result", full);

        std::cout << "\n";
        std::cout << "Conversion Result:\n";
        std::cout << "==================\n\n";
        std::cout << "  Input:   " << formatter.formatQuantity(input, std::string("result")) << "\n";
        std::cout << "  Output:  " << formatter.formatQuantity(output, std::string("result")) << "\n";
        std::cout << "  SI Base: " << ExportUtils::formatNumber(si_value) << " " << si_unit << "\n";
        std::cout << "  Dimension: " << input.dimensionality() << "\n\n";
        std::cout << formatter.formatWithProvenance(output) << "\n\n";
        return 0;

    } catch (const DimensionMismatchError& e) {
        std::cerr << "Error: Incompatible units\n";
        std::cerr << "  " << e.what() << "\n";
    } catch (const UnknownUnitError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --list to see available units\n";
    } catch (const UnitError& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return 1;
}

int performDomainConversion(const std::string& domain, double value,
                            const std::string& from_key, const std::string& to_key) {
    try {
        double result;
        if (domain == "speed") {
            result = *convertSpeed(value, from_key, to_key);
        } else if (domain == "length") {
            result = *convertLength(value, from_key, to_key);
        } else if (domain == "temperature") {
            result = *convertTemperature(value, from_key, to_key);
        } else if (domain == "pressure") {
            result = *convertPressure(value, from_key, to_key);
        } else if (domain == "energy") {
            result = convertEnergyUnits(value, from_key, to_key);
        } else if (domain == "mass") {
            result = *convertMass(value, from_key, to_key);
        } else if (domain == "volume") {
            result = *convertVolume(value, from_key, to_key);
        } else {
            std::cerr << "Error: Unknown domain '" << domain << "'\n";
            return 1;
        }

        std::cout << ExportUtils::formatNumber(value) << " " << from_key << " = "
                  << ExportUtils::formatNumber(result) << " " << to_key << "\n";
        return 0;

    } catch (const UnitError& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return 1;
}

bool parseNumber(const char* text, double& value) {
    try {
        size_t pos = 0;
        value = std::stod(text, &pos);
        return pos == std::strlen(text);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    const UnitRegistry& units = UnitRegistryManager::getInstance();

    if (argc == 1 || (argc == 2 && strcmp(argv[1], "--help") == 0)) {
        printHelp();
        return 0;
    }

    if (strcmp(argv[1], "--list") == 0) {
        listUnits(units, argc > 2 ? argv[2] : "");
        return 0;
    }

    if (strcmp(argv[1], "--all") == 0) {
        units.printDatabase(std::cout);
        return 0;
    }

    if (strcmp(argv[1], "--systems") == 0) {
        listSystems();
        return 0;
    }

    double value = 0.0;

    if (strcmp(argv[1], "--domain") == 0) {
        if (argc != 6) {
            std::cerr << "Error: --domain takes <domain> <value> <from_key> <to_key>\n";
            return 1;
        }
        if (!parseNumber(argv[3], value)) {
            std::cerr << "Error: Invalid value '" << argv[3] << "'\n";
            return 1;
        }
        return performDomainConversion(argv[2], value, argv[4], argv[5]);
    }

    if (argc != 4) {
        std::cerr << "Error: Invalid number of arguments\n";
        printHelp();
        return 1;
    }

    if (!parseNumber(argv[1], value)) {
        std::cerr << "Error: Invalid value '" << argv[1] << "'\n";
        return 1;
    }

    return performConversion(value, argv[2], argv[3]);
}

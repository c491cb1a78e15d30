#include "UnitRegistry.hpp"
#include "UnitErrors.hpp"
#include <sstream>
#include <iomanip>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace QTRACK {

namespace {

// Render an exponent without a trailing ".0" for integral values
std::string formatExponent(double exp) {
    std::ostringstream ss;
    if (std::abs(exp - std::round(exp)) < 1e-10) {
        ss << static_cast<long>(std::round(exp));
    } else {
        ss << exp;
    }
    return ss.str();
}

// Parenthesize a symbol that already contains an operator
std::string wrapSymbol(const std::string& symbol) {
    if (symbol.find_first_of("*/") != std::string::npos) {
        return "(" + symbol + ")";
    }
    return symbol;
}

bool nearlyEqual(double a, double b) {
    return std::abs(a - b) <= 1e-12 * std::max(std::abs(a), std::abs(b));
}

} // namespace

// =============================================================================
// Dimension Implementation
// =============================================================================

std::string Dimension::toString() const {
    std::stringstream ss;
    const double exps[4] = {L, M, T, Theta};
    const char* names[4] = {"length", "mass", "time", "temperature"};

    for (int i = 0; i < 4; ++i) {
        if (std::abs(exps[i]) < 1e-10) continue;
        ss << "[" << names[i] << "]";
        if (std::abs(exps[i] - 1.0) > 1e-10) ss << "^" << formatExponent(exps[i]);
    }

    return ss.str().empty() ? "dimensionless" : ss.str();
}

// =============================================================================
// Unit Implementation
// =============================================================================

bool Unit::isSameAs(const Unit& other) const {
    return dimension == other.dimension &&
           nearlyEqual(to_base, other.to_base) &&
           std::abs(offset - other.offset) < 1e-12;
}

Unit Unit::multiply(const Unit& other) const {
    std::string s = symbol + "*" + wrapSymbol(other.symbol);
    return Unit(s, s, dimension * other.dimension, to_base * other.to_base);
}

Unit Unit::divide(const Unit& other) const {
    std::string s = symbol + "/" + wrapSymbol(other.symbol);
    return Unit(s, s, dimension / other.dimension, to_base / other.to_base);
}

Unit Unit::pow(double exponent) const {
    if (std::abs(exponent - 1.0) < 1e-10) return *this;
    std::string s = wrapSymbol(symbol) + "^" + formatExponent(exponent);
    return Unit(s, s, dimension.pow(exponent), std::pow(to_base, exponent));
}

// =============================================================================
// UnitRegistry Implementation
// =============================================================================

UnitRegistry::UnitRegistry() {
    initializeDatabase();
}

void UnitRegistry::initializeDatabase() {
    addLengthUnits();
    addMassUnits();
    addTimeUnits();
    addAreaUnits();
    addVolumeUnits();
    addDimensionlessUnits();
    addAngleUnits();
    addVelocityUnits();
    addAccelerationUnits();
    addFrequencyUnits();
    addForceUnits();
    addPressureUnits();
    addEnergyUnits();
    addEnergyCommodityUnits();
    addPowerUnits();
    addDensityUnits();
    addViscosityUnits();
    addVolumetricRateUnits();
    addMassRateUnits();
    addTemperatureUnits();
}

// =============================================================================
// Length Units
// =============================================================================

void UnitRegistry::addLengthUnits() {
    Dimension length(1, 0, 0);

    // Metric
    registerUnit(Unit("meter", "m", length, 1.0, "length", {"metre", "meters"}));
    registerUnit(Unit("centimeter", "cm", length, 0.01, "length"));
    registerUnit(Unit("millimeter", "mm", length, 0.001, "length", {"millimetre"}));
    registerUnit(Unit("kilometer", "km", length, 1000.0, "length", {"kilometre"}));
    registerUnit(Unit("micrometer", "um", length, 1e-6, "length", {"micron"}));
    registerUnit(Unit("nanometer", "nm", length, 1e-9, "length"));

    // Imperial/US
    registerUnit(Unit("foot", "ft", length, 0.3048, "length", {"feet"}));
    registerUnit(Unit("inch", "in", length, 0.0254, "length", {"inches"}));
    registerUnit(Unit("yard", "yd", length, 0.9144, "length"));
    registerUnit(Unit("mile", "mi", length, 1609.344, "length"));

    // Marine
    registerUnit(Unit("nautical mile", "nmi", length, 1852.0, "length", {"nautical_mile"}));
}

// =============================================================================
// Mass Units
// =============================================================================

void UnitRegistry::addMassUnits() {
    Dimension mass(0, 1, 0);

    // Metric
    registerUnit(Unit("kilogram", "kg", mass, 1.0, "mass"));
    registerUnit(Unit("gram", "g", mass, 0.001, "mass"));
    registerUnit(Unit("milligram", "mg", mass, 1e-6, "mass"));
    registerUnit(Unit("metric ton", "t", mass, 1000.0, "mass", {"tonne", "metric_ton"}));

    // Imperial/US
    registerUnit(Unit("pound", "lb", mass, 0.45359237, "mass", {"lbm", "pound mass"}));
    registerUnit(Unit("ounce", "oz", mass, 0.028349523125, "mass"));
    registerUnit(Unit("slug", "slug", mass, 14.5939029, "mass"));
    registerUnit(Unit("short ton", "ton", mass, 907.18474, "mass", {"short_ton"}));
    registerUnit(Unit("long ton", "LT", mass, 1016.0469088, "mass", {"long_ton"}));
}

// =============================================================================
// Time Units
// =============================================================================

void UnitRegistry::addTimeUnits() {
    Dimension time(0, 0, 1);

    registerUnit(Unit("second", "s", time, 1.0, "time", {"sec"}));
    registerUnit(Unit("millisecond", "ms", time, 0.001, "time"));
    registerUnit(Unit("microsecond", "us", time, 1e-6, "time"));
    registerUnit(Unit("minute", "min", time, 60.0, "time"));
    registerUnit(Unit("hour", "hr", time, 3600.0, "time", {"h"}));
    registerUnit(Unit("day", "day", time, 86400.0, "time"));
    registerUnit(Unit("week", "week", time, 604800.0, "time"));
    registerUnit(Unit("year", "year", time, 31536000.0, "time", {"yr"}));
}

// =============================================================================
// Area Units
// =============================================================================

void UnitRegistry::addAreaUnits() {
    Dimension area(2, 0, 0);

    // Metric
    registerUnit(Unit("square meter", "m2", area, 1.0, "area"));
    registerUnit(Unit("square centimeter", "cm2", area, 1e-4, "area"));
    registerUnit(Unit("square millimeter", "mm2", area, 1e-6, "area"));
    registerUnit(Unit("square kilometer", "km2", area, 1e6, "area"));
    registerUnit(Unit("hectare", "ha", area, 1e4, "area"));

    // Imperial/US
    registerUnit(Unit("square foot", "ft2", area, 0.09290304, "area"));
    registerUnit(Unit("square inch", "in2", area, 0.00064516, "area"));
    registerUnit(Unit("acre", "acre", area, 4046.8564224, "area"));
}

// =============================================================================
// Volume Units
// =============================================================================

void UnitRegistry::addVolumeUnits() {
    Dimension volume(3, 0, 0);

    // Metric
    registerUnit(Unit("cubic meter", "m3", volume, 1.0, "volume"));
    registerUnit(Unit("cubic centimeter", "cm3", volume, 1e-6, "volume"));
    registerUnit(Unit("liter", "L", volume, 0.001, "volume", {"litre"}));
    registerUnit(Unit("milliliter", "mL", volume, 1e-6, "volume"));

    // Imperial/US
    registerUnit(Unit("cubic foot", "ft3", volume, 0.028316846592, "volume"));
    registerUnit(Unit("cubic inch", "in3", volume, 1.6387064e-5, "volume"));
    registerUnit(Unit("gallon", "gal", volume, 0.003785411784, "volume", {"gallon US"}));

    // Oil field
    registerUnit(Unit("oil barrel", "bbl", volume, 0.158987294928, "volume", {"oil_barrel", "barrel"}));
    registerUnit(Unit("stock tank barrel", "stb", volume, 0.158987294928, "volume"));
}

// =============================================================================
// Dimensionless Units
// =============================================================================

void UnitRegistry::addDimensionlessUnits() {
    Dimension none;

    registerUnit(Unit("dimensionless", "dimensionless", none, 1.0, "dimensionless", {"unitless"}));
    registerUnit(Unit("percent", "%", none, 0.01, "dimensionless"));
}

// =============================================================================
// Angle Units
// =============================================================================

void UnitRegistry::addAngleUnits() {
    Dimension angle(0, 0, 0);  // Dimensionless

    registerUnit(Unit("radian", "rad", angle, 1.0, "angle"));
    registerUnit(Unit("degree", "deg", angle, M_PI / 180.0, "angle"));
}

// =============================================================================
// Velocity Units
// =============================================================================

void UnitRegistry::addVelocityUnits() {
    Dimension velocity(1, 0, -1);

    // Metric
    registerUnit(Unit("meter per second", "m/s", velocity, 1.0, "velocity"));
    registerUnit(Unit("centimeter per second", "cm/s", velocity, 0.01, "velocity"));
    registerUnit(Unit("kilometer per hour", "km/h", velocity, 1.0 / 3.6, "velocity", {"km/hr", "kph"}));

    // Imperial/US
    registerUnit(Unit("foot per second", "ft/s", velocity, 0.3048, "velocity"));
    registerUnit(Unit("mile per hour", "mph", velocity, 0.44704, "velocity"));

    // Marine
    registerUnit(Unit("knot", "kt", velocity, 1852.0 / 3600.0, "velocity", {"knots"}));
}

// =============================================================================
// Acceleration Units
// =============================================================================

void UnitRegistry::addAccelerationUnits() {
    Dimension acceleration(1, 0, -2);

    registerUnit(Unit("meter per second squared", "m/s2", acceleration, 1.0, "acceleration"));
    registerUnit(Unit("foot per second squared", "ft/s2", acceleration, 0.3048, "acceleration"));
    registerUnit(Unit("standard gravity", "g0", acceleration, 9.80665, "acceleration", {"g_0"}));
}

// =============================================================================
// Frequency Units
// =============================================================================

void UnitRegistry::addFrequencyUnits() {
    Dimension frequency(0, 0, -1);

    registerUnit(Unit("hertz", "Hz", frequency, 1.0, "frequency"));
    registerUnit(Unit("revolutions per minute", "rpm", frequency, 1.0 / 60.0, "frequency"));
}

// =============================================================================
// Force Units
// =============================================================================

void UnitRegistry::addForceUnits() {
    Dimension force(1, 1, -2);

    registerUnit(Unit("newton", "N", force, 1.0, "force"));
    registerUnit(Unit("kilonewton", "kN", force, 1000.0, "force"));
    registerUnit(Unit("meganewton", "MN", force, 1e6, "force"));
    registerUnit(Unit("pound force", "lbf", force, 4.4482216152605, "force", {"pound_force"}));
    registerUnit(Unit("kip", "kip", force, 4448.2216152605, "force"));
}

// =============================================================================
// Pressure Units
// =============================================================================

void UnitRegistry::addPressureUnits() {
    Dimension pressure(-1, 1, -2);

    // SI
    registerUnit(Unit("pascal", "Pa", pressure, 1.0, "pressure"));
    registerUnit(Unit("hectopascal", "hPa", pressure, 100.0, "pressure"));
    registerUnit(Unit("kilopascal", "kPa", pressure, 1000.0, "pressure"));
    registerUnit(Unit("megapascal", "MPa", pressure, 1e6, "pressure"));
    registerUnit(Unit("gigapascal", "GPa", pressure, 1e9, "pressure"));

    // Other metric
    registerUnit(Unit("bar", "bar", pressure, 1e5, "pressure"));
    registerUnit(Unit("millibar", "mbar", pressure, 100.0, "pressure"));
    registerUnit(Unit("atmosphere", "atm", pressure, 101325.0, "pressure"));

    // Imperial/US
    registerUnit(Unit("pounds per square inch", "psi", pressure, 6894.757293168, "pressure"));
    registerUnit(Unit("pounds per square foot", "psf", pressure, 47.88025898033584, "pressure"));
    registerUnit(Unit("kips per square inch", "ksi", pressure, 6894757.293168, "pressure",
                      {"kip_per_square_inch"}));

    // Manometric
    registerUnit(Unit("millimeter mercury", "mmHg", pressure, 133.322387415, "pressure", {"torr"}));
    registerUnit(Unit("inch mercury", "inHg", pressure, 3386.389, "pressure"));
}

// =============================================================================
// Energy Units
// =============================================================================

void UnitRegistry::addEnergyUnits() {
    Dimension energy(2, 1, -2);

    // SI
    registerUnit(Unit("joule", "J", energy, 1.0, "energy"));
    registerUnit(Unit("kilojoule", "kJ", energy, 1000.0, "energy"));
    registerUnit(Unit("megajoule", "MJ", energy, 1e6, "energy"));
    registerUnit(Unit("gigajoule", "GJ", energy, 1e9, "energy"));

    // Other metric
    registerUnit(Unit("calorie", "cal", energy, 4.184, "energy"));
    registerUnit(Unit("kilocalorie", "kcal", energy, 4184.0, "energy"));

    // Imperial/US
    registerUnit(Unit("foot pound force", "ft-lbf", energy, 1.3558179483314, "energy"));

    // Electrical
    registerUnit(Unit("watt hour", "Wh", energy, 3600.0, "energy"));
    registerUnit(Unit("kilowatt hour", "kWh", energy, 3.6e6, "energy"));
    registerUnit(Unit("megawatt hour", "MWh", energy, 3.6e9, "energy"));
}

// =============================================================================
// Energy Commodity Units (BTU based)
// =============================================================================

void UnitRegistry::addEnergyCommodityUnits() {
    Dimension energy(2, 1, -2);
    const double btu = 1055.05585262;

    registerUnit(Unit("british thermal unit", "BTU", energy, btu, "energy", {"Btu"}));
    registerUnit(Unit("million BTU", "MMBTU", energy, 1e6 * btu, "energy"));
    registerUnit(Unit("therm", "therm", energy, 1e5 * btu, "energy"));

    // Oil and gas equivalents; MCF/SCF are heating-value equivalents, not volumes
    registerUnit(Unit("barrel of oil equivalent", "BOE", energy, 5.8e6 * btu, "energy",
                      {"barrel_of_oil_equivalent"}));
    registerUnit(Unit("tonne of oil equivalent", "TOE", energy, 3.968e7 * btu, "energy",
                      {"tonne_of_oil_equivalent"}));
    registerUnit(Unit("standard cubic foot", "SCF", energy, 1028.0 * btu, "energy",
                      {"standard_cubic_foot"}));
    registerUnit(Unit("thousand cubic feet", "MCF", energy, 1.028e6 * btu, "energy",
                      {"thousand_cubic_feet"}));
    registerUnit(Unit("million cubic feet", "MMCF", energy, 1.028e9 * btu, "energy"));
    registerUnit(Unit("billion cubic feet", "BCF", energy, 1.028e12 * btu, "energy"));
    registerUnit(Unit("trillion cubic feet", "TCF", energy, 1.028e15 * btu, "energy"));
}

// =============================================================================
// Power Units
// =============================================================================

void UnitRegistry::addPowerUnits() {
    Dimension power(2, 1, -3);

    registerUnit(Unit("watt", "W", power, 1.0, "power"));
    registerUnit(Unit("kilowatt", "kW", power, 1000.0, "power"));
    registerUnit(Unit("megawatt", "MW", power, 1e6, "power"));
    registerUnit(Unit("horsepower", "hp", power, 745.69987158227, "power"));
    registerUnit(Unit("BTU per hour", "BTU/hr", power, 0.29307107017, "power"));
}

// =============================================================================
// Density Units
// =============================================================================

void UnitRegistry::addDensityUnits() {
    Dimension density(-3, 1, 0);

    registerUnit(Unit("kilogram per cubic meter", "kg/m3", density, 1.0, "density"));
    registerUnit(Unit("gram per cubic centimeter", "g/cm3", density, 1000.0, "density"));
    registerUnit(Unit("pound mass per cubic foot", "lbm/ft3", density, 16.018463373960142, "density"));
}

// =============================================================================
// Viscosity Units
// =============================================================================

void UnitRegistry::addViscosityUnits() {
    Dimension viscosity(-1, 1, -1);

    registerUnit(Unit("pascal second", "Pa-s", viscosity, 1.0, "viscosity"));
    registerUnit(Unit("centipoise", "cP", viscosity, 0.001, "viscosity"));
    registerUnit(Unit("poise", "P", viscosity, 0.1, "viscosity"));

    Dimension kin_viscosity(2, 0, -1);
    registerUnit(Unit("centistokes", "cSt", kin_viscosity, 1e-6, "kinematic_viscosity"));
}

// =============================================================================
// Volumetric Rate Units
// =============================================================================

void UnitRegistry::addVolumetricRateUnits() {
    Dimension rate(3, 0, -1);

    registerUnit(Unit("cubic meter per second", "m3/s", rate, 1.0, "volumetric_rate"));
    registerUnit(Unit("cubic meter per day", "m3/day", rate, 1.0 / 86400.0, "volumetric_rate"));
    registerUnit(Unit("liter per second", "L/s", rate, 0.001, "volumetric_rate"));
    registerUnit(Unit("gallon per minute", "gpm", rate, 0.003785411784 / 60.0, "volumetric_rate"));
    registerUnit(Unit("barrel per day", "bbl/day", rate, 0.158987294928 / 86400.0, "volumetric_rate",
                      {"bpd"}));
}

// =============================================================================
// Mass Rate Units
// =============================================================================

void UnitRegistry::addMassRateUnits() {
    Dimension rate(0, 1, -1);

    registerUnit(Unit("kilogram per second", "kg/s", rate, 1.0, "mass_rate"));
    registerUnit(Unit("tonne per day", "t/day", rate, 1000.0 / 86400.0, "mass_rate"));
}

// =============================================================================
// Temperature Units
// =============================================================================

void UnitRegistry::addTemperatureUnits() {
    Dimension temperature(0, 0, 0, 1);

    // Absolute temperatures
    registerUnit(Unit("kelvin", "K", temperature, 1.0, "temperature"));
    registerUnit(Unit("rankine", "degR", temperature, 5.0 / 9.0, "temperature", {"R"}));

    // Relative temperatures (with offset): base = (value + offset) * to_base
    Unit celsius("celsius", "degC", temperature, 1.0, "temperature", {"degree_Celsius"});
    celsius.offset = 273.15;  // 0 degC = 273.15 K
    registerUnit(celsius);

    Unit fahrenheit("fahrenheit", "degF", temperature, 5.0 / 9.0, "temperature",
                    {"degree_Fahrenheit"});
    fahrenheit.offset = 459.67;  // 0 degF = 459.67 degR
    registerUnit(fahrenheit);
}

// =============================================================================
// Helper Functions
// =============================================================================

void UnitRegistry::registerUnit(const Unit& unit) {
    // Symbols are case-sensitive (mm vs Mm, MPa vs mPa)
    units_[unit.symbol] = unit;
    units_[unit.name] = unit;
    folded_names_[toLowerCase(unit.name)] = unit.symbol;

    for (const auto& alias : unit.aliases) {
        units_[alias] = unit;
        folded_names_[toLowerCase(alias)] = unit.symbol;
    }

    if (!unit.category.empty()) {
        categories_[unit.category].push_back(unit.symbol);
    }
}

std::string UnitRegistry::toLowerCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string UnitRegistry::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// =============================================================================
// Compound Expression Parsing
// =============================================================================

namespace {

/**
 * Recursive descent over unit expressions:
 *   expr   := term { ('*' | '/') term }
 *   term   := factor [ ('^' | '**') number ]
 *   factor := '(' expr ')' | symbol | number
 *
 * Registered symbols may themselves contain '/' ("m/s2", "BTU/hr"). Such a
 * symbol is matched whole, longest first, at the start of an expression or
 * after '*', and only when no exponent follows it. In those positions
 * a/b/c grouped from the left equals (a/b)/c, so the match cannot change
 * the result. After '/' the plain token rules apply.
 */
class UnitExpressionParser {
public:
    UnitExpressionParser(const UnitRegistry& registry, const std::string& text,
                         const std::string& original)
        : registry_(registry), text_(text), original_(original), pos_(0) {}

    Unit parse() {
        Unit result = parseExpr();
        skipSpace();
        if (pos_ != text_.size()) {
            fail("unexpected '" + text_.substr(pos_) + "'");
        }
        return result;
    }

private:
    const UnitRegistry& registry_;
    const std::string& text_;
    const std::string& original_;
    size_t pos_;

    [[noreturn]] void fail(const std::string& detail) const {
        throw UnknownUnitError(original_, "",
                               "Unknown unit: '" + original_ + "' (" + detail + ")");
    }

    void skipSpace() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool peekPower() const {
        if (pos_ >= text_.size()) return false;
        if (text_[pos_] == '^') return true;
        return text_.compare(pos_, 2, "**") == 0;
    }

    bool peekPowerAt(size_t pos) const {
        while (pos < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos]))) {
            ++pos;
        }
        if (pos >= text_.size()) return false;
        return text_[pos] == '^' || text_.compare(pos, 2, "**") == 0;
    }

    // Longest registered symbol containing '/' that starts at pos_
    const Unit* matchSlashSymbol() {
        size_t run_end = pos_;
        while (run_end < text_.size()) {
            char c = text_[run_end];
            if (std::isspace(static_cast<unsigned char>(c)) ||
                c == '*' || c == '^' || c == '(' || c == ')') {
                break;
            }
            ++run_end;
        }

        size_t end = run_end;
        while (end > pos_) {
            std::string candidate = text_.substr(pos_, end - pos_);
            if (candidate.find('/') == std::string::npos) break;
            if (!peekPowerAt(end)) {
                const Unit* unit = registry_.getUnit(candidate);
                if (unit) {
                    pos_ = end;
                    return unit;
                }
            }
            end = text_.rfind('/', end - 1);
            if (end == std::string::npos || end <= pos_) break;
        }
        return nullptr;
    }

    Unit parseExpr() {
        Unit result = parseTerm(true);
        while (true) {
            skipSpace();
            if (pos_ >= text_.size()) break;
            char op = text_[pos_];
            if (op != '*' && op != '/') break;
            ++pos_;
            Unit rhs = parseTerm(op == '*');
            result = (op == '*') ? result.multiply(rhs) : result.divide(rhs);
        }
        return result;
    }

    Unit parseTerm(bool allow_slash_symbol) {
        Unit base = parseFactor(allow_slash_symbol);
        skipSpace();
        if (peekPower()) {
            pos_ += (text_[pos_] == '^') ? 1 : 2;
            skipSpace();
            const char* start = text_.c_str() + pos_;
            char* end = nullptr;
            double exponent = std::strtod(start, &end);
            if (end == start) fail("missing exponent");
            pos_ += static_cast<size_t>(end - start);
            return base.pow(exponent);
        }
        return base;
    }

    Unit parseFactor(bool allow_slash_symbol) {
        skipSpace();
        if (pos_ >= text_.size()) fail("unexpected end of expression");

        if (allow_slash_symbol) {
            const Unit* unit = matchSlashSymbol();
            if (unit) return *unit;
        }

        if (text_[pos_] == '(') {
            ++pos_;
            Unit inner = parseExpr();
            skipSpace();
            if (pos_ >= text_.size() || text_[pos_] != ')') fail("missing ')'");
            ++pos_;
            return inner;
        }

        size_t start = pos_;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (std::isspace(static_cast<unsigned char>(c)) ||
                c == '*' || c == '/' || c == '^' || c == '(' || c == ')') {
                break;
            }
            ++pos_;
        }
        std::string token = text_.substr(start, pos_ - start);
        if (token.empty()) fail("missing unit");

        // Pure numbers act as dimensionless scale factors ("1/s")
        char* end = nullptr;
        double number = std::strtod(token.c_str(), &end);
        if (end != token.c_str() && *end == '\0') {
            return Unit(token, token, Dimension(), number);
        }

        const Unit* unit = registry_.getUnit(token);
        if (!unit) fail("'" + token + "' is not a registered unit");
        return *unit;
    }
};

} // namespace

Unit UnitRegistry::parseExpression(const std::string& expr, const std::string& original) const {
    UnitExpressionParser parser(*this, expr, original);
    return parser.parse();
}

// =============================================================================
// Database Access
// =============================================================================

const Unit* UnitRegistry::getUnit(const std::string& name_or_symbol) const {
    // Exact symbol, name or alias
    auto it = units_.find(name_or_symbol);
    if (it != units_.end()) {
        return &(it->second);
    }

    // Case-insensitive name or alias
    auto fold_it = folded_names_.find(toLowerCase(name_or_symbol));
    if (fold_it != folded_names_.end()) {
        return &units_.at(fold_it->second);
    }

    return nullptr;
}

Unit UnitRegistry::resolve(const std::string& unit_string) const {
    std::string trimmed = trim(unit_string);
    if (trimmed.empty()) {
        throw UnknownUnitError(unit_string);
    }

    const Unit* unit = getUnit(trimmed);
    if (unit) {
        return *unit;
    }

    if (trimmed.find_first_of("*/^() ") != std::string::npos) {
        return parseExpression(trimmed, unit_string);
    }

    throw UnknownUnitError(unit_string);
}

bool UnitRegistry::hasUnit(const std::string& unit_string) const {
    try {
        resolve(unit_string);
        return true;
    } catch (const UnknownUnitError&) {
        return false;
    }
}

std::vector<const Unit*> UnitRegistry::getUnitsInCategory(const std::string& category) const {
    std::vector<const Unit*> result;
    auto it = categories_.find(category);
    if (it != categories_.end()) {
        for (const auto& symbol : it->second) {
            auto unit_it = units_.find(symbol);
            if (unit_it != units_.end()) {
                result.push_back(&(unit_it->second));
            }
        }
    }
    return result;
}

std::vector<std::string> UnitRegistry::getCategories() const {
    std::vector<std::string> result;
    for (const auto& pair : categories_) {
        result.push_back(pair.first);
    }
    return result;
}

Dimension UnitRegistry::getDimension(const std::string& unit_string) const {
    return resolve(unit_string).dimension;
}

// =============================================================================
// Conversion Functions
// =============================================================================

double UnitRegistry::convert(double value, const Unit& from, const Unit& to) const {
    if (from.dimension != to.dimension) {
        throw DimensionMismatchError(from.dimension.toString(), to.dimension.toString(),
                                     "Cannot convert '" + from.symbol + "' to '" + to.symbol + "'");
    }

    // Convert: from_unit -> base -> to_unit
    double base_value = from.convertToBase(value);
    return to.convertFromBase(base_value);
}

double UnitRegistry::convert(double value, const std::string& from_unit,
                             const std::string& to_unit) const {
    return convert(value, resolve(from_unit), resolve(to_unit));
}

std::vector<double> UnitRegistry::convert(const std::vector<double>& values,
                                          const std::string& from_unit,
                                          const std::string& to_unit) const {
    Unit from = resolve(from_unit);
    Unit to = resolve(to_unit);

    std::vector<double> result;
    result.reserve(values.size());
    for (double value : values) {
        result.push_back(convert(value, from, to));
    }
    return result;
}

double UnitRegistry::toBase(double value, const std::string& from_unit) const {
    return resolve(from_unit).convertToBase(value);
}

double UnitRegistry::fromBase(double value, const std::string& to_unit) const {
    return resolve(to_unit).convertFromBase(value);
}

// =============================================================================
// Parsing Functions
// =============================================================================

bool UnitRegistry::parseValueWithUnit(const std::string& value_with_unit,
                                      double& value, std::string& unit) const {
    std::string trimmed = trim(value_with_unit);
    if (trimmed.empty()) return false;

    const char* start = trimmed.c_str();
    char* end = nullptr;
    double parsed = std::strtod(start, &end);
    if (end == start) return false;

    value = parsed;
    unit = trim(std::string(end));
    return true;
}

// =============================================================================
// Dimensional Analysis
// =============================================================================

bool UnitRegistry::areCompatible(const std::string& unit1, const std::string& unit2) const {
    try {
        return resolve(unit1).dimension == resolve(unit2).dimension;
    } catch (const UnknownUnitError&) {
        return false;
    }
}

std::string UnitRegistry::getBaseUnit(const Dimension& dim) const {
    const double exps[4] = {dim.L, dim.M, dim.T, dim.Theta};
    const char* symbols[4] = {"m", "kg", "s", "K"};

    std::stringstream ss;
    bool first = true;
    for (int i = 0; i < 4; ++i) {
        if (std::abs(exps[i]) < 1e-10) continue;
        if (!first) ss << "*";
        ss << symbols[i];
        if (std::abs(exps[i] - 1.0) > 1e-10) ss << "^" << formatExponent(exps[i]);
        first = false;
    }

    return ss.str().empty() ? "dimensionless" : ss.str();
}

// =============================================================================
// Utility Functions
// =============================================================================

void UnitRegistry::printDatabase(std::ostream& os) const {
    os << "Unit Registry Database\n";
    os << "======================\n\n";

    for (const auto& cat_pair : categories_) {
        os << "Category: " << cat_pair.first << "\n";
        os << std::string(40, '-') << "\n";

        for (const auto& symbol : cat_pair.second) {
            auto it = units_.find(symbol);
            if (it != units_.end()) {
                const Unit& u = it->second;
                os << std::setw(28) << std::left << u.name
                   << " [" << std::setw(8) << u.symbol << "] "
                   << " = " << u.to_base << " * base SI"
                   << " (" << u.dimension.toString() << ")\n";
            }
        }
        os << "\n";
    }
}

} // namespace QTRACK

#ifndef UNIT_REGISTRY_HPP
#define UNIT_REGISTRY_HPP

#include <string>
#include <map>
#include <vector>
#include <iosfwd>
#include <cmath>

namespace QTRACK {

/**
 * @brief Unit dimension in terms of Length, Mass, Time, Temperature (L M T Θ)
 *
 * Every physical quantity handled here is a combination of the base
 * dimensions: Length^a * Mass^b * Time^c * Temperature^d
 */
struct Dimension {
    double L;      // Length exponent
    double M;      // Mass exponent
    double T;      // Time exponent
    double Theta;  // Temperature exponent

    Dimension(double length = 0, double mass = 0, double time = 0, double temperature = 0)
        : L(length), M(mass), T(time), Theta(temperature) {}

    bool operator==(const Dimension& other) const {
        return (std::abs(L - other.L) < 1e-10 &&
                std::abs(M - other.M) < 1e-10 &&
                std::abs(T - other.T) < 1e-10 &&
                std::abs(Theta - other.Theta) < 1e-10);
    }

    bool operator!=(const Dimension& other) const {
        return !(*this == other);
    }

    Dimension operator*(const Dimension& other) const {
        return Dimension(L + other.L, M + other.M, T + other.T, Theta + other.Theta);
    }

    Dimension operator/(const Dimension& other) const {
        return Dimension(L - other.L, M - other.M, T - other.T, Theta - other.Theta);
    }

    Dimension pow(double exponent) const {
        return Dimension(L * exponent, M * exponent, T * exponent, Theta * exponent);
    }

    bool isDimensionless() const { return *this == Dimension(); }

    /**
     * @brief Dimensionality string, e.g. "[length]^-1[mass][time]^-2"
     *
     * Returns "dimensionless" when every exponent is zero.
     */
    std::string toString() const;
};

/**
 * @brief Unit definition with conversion factor to base SI units
 *
 * Base SI units are:
 * - Length: meter (m)
 * - Mass: kilogram (kg)
 * - Time: second (s)
 * - Temperature: kelvin (K)
 */
struct Unit {
    std::string name;           // Full name (e.g., "meter")
    std::string symbol;         // Canonical symbol (e.g., "m")
    Dimension dimension;        // Dimensional formula
    double to_base;             // Conversion factor to base SI units
    double offset;              // Offset for affine conversions (e.g., temperature)
    std::string category;       // Category for organization
    std::vector<std::string> aliases;  // Alternative names/symbols

    Unit() : to_base(1.0), offset(0.0) {}

    Unit(const std::string& n, const std::string& s,
         const Dimension& d, double factor, const std::string& cat = "",
         const std::vector<std::string>& alias_list = {})
        : name(n), symbol(s), dimension(d), to_base(factor), offset(0.0),
          category(cat), aliases(alias_list) {}

    // Convert value from this unit to base SI
    double convertToBase(double value) const {
        return (value + offset) * to_base;
    }

    // Convert value from base SI to this unit
    double convertFromBase(double value) const {
        return value / to_base - offset;
    }

    bool isCompatible(const Unit& other) const {
        return dimension == other.dimension;
    }

    // Same dimension, scale and offset: values need no conversion
    bool isSameAs(const Unit& other) const;

    // Derived units for multiply/divide; offsets act as differences
    Unit multiply(const Unit& other) const;
    Unit divide(const Unit& other) const;
    Unit pow(double exponent) const;
};

/**
 * @brief Canonical unit registry: database of units and conversion utilities
 *
 * Provides:
 * - Database of engineering units, including energy commodity units
 *   (BOE, MMBTU, MCF, ...) and metocean units (knot, hPa, inHg, ...)
 * - Resolution of compound unit expressions ("kN*m", "m**3", "kg/(m*s^2)")
 * - Conversion between any compatible units
 * - Dimensional analysis and validation
 *
 * The registry is populated in the constructor and never modified again;
 * all query methods are const and safe to call from several threads.
 */
class UnitRegistry {
public:
    UnitRegistry();
    ~UnitRegistry() = default;

    // =========================================================================
    // Database Access
    // =========================================================================

    /**
     * @brief Resolve a unit string to a Unit
     *
     * Accepts registered symbols, names and aliases (names and aliases are
     * case-insensitive), and compound expressions of registered units.
     * @throws UnknownUnitError if the string cannot be resolved
     */
    Unit resolve(const std::string& unit_string) const;

    /**
     * @brief Get a registered unit by name, symbol or alias
     * @return Pointer to Unit, or nullptr if not registered
     *
     * Does not parse compound expressions; use resolve() for those.
     */
    const Unit* getUnit(const std::string& name_or_symbol) const;

    /**
     * @brief Check if a unit string can be resolved
     */
    bool hasUnit(const std::string& unit_string) const;

    /**
     * @brief Get all units in a category
     * @param category Category name (e.g., "length", "pressure")
     */
    std::vector<const Unit*> getUnitsInCategory(const std::string& category) const;

    /**
     * @brief Get all available categories
     */
    std::vector<std::string> getCategories() const;

    /**
     * @brief Get dimension for a unit string
     * @throws UnknownUnitError
     */
    Dimension getDimension(const std::string& unit_string) const;

    // =========================================================================
    // Conversion Functions
    // =========================================================================

    /**
     * @brief Convert value between two units
     * @throws UnknownUnitError if either unit is unknown
     * @throws DimensionMismatchError if units are incompatible
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    double convert(double value, const Unit& from, const Unit& to) const;

    /**
     * @brief Convert array of values
     */
    std::vector<double> convert(const std::vector<double>& values,
                                const std::string& from_unit,
                                const std::string& to_unit) const;

    double toBase(double value, const std::string& from_unit) const;
    double fromBase(double value, const std::string& to_unit) const;

    // =========================================================================
    // Parsing Functions
    // =========================================================================

    /**
     * @brief Split a value with unit string (e.g., "100 psi", "50.5 mm")
     * @param[out] value Parsed numeric value (not converted)
     * @param[out] unit Unit text following the number, may be empty
     * @return true if a number was found at the start of the string
     */
    bool parseValueWithUnit(const std::string& value_with_unit,
                            double& value, std::string& unit) const;

    // =========================================================================
    // Dimensional Analysis
    // =========================================================================

    /**
     * @brief Check if two unit strings have compatible dimensions
     *
     * Returns false (never throws) when either string is unknown.
     */
    bool areCompatible(const std::string& unit1, const std::string& unit2) const;

    /**
     * @brief Get base SI unit expression for a given dimension
     */
    std::string getBaseUnit(const Dimension& dim) const;

    // =========================================================================
    // Utility Functions
    // =========================================================================

    /**
     * @brief Print unit database to stream (for documentation)
     */
    void printDatabase(std::ostream& os) const;

private:
    // Unit database: exact symbol / name / alias -> Unit
    std::map<std::string, Unit> units_;

    // Lowercase names and aliases -> canonical symbol
    std::map<std::string, std::string> folded_names_;

    // Category index: category -> list of unit symbols
    std::map<std::string, std::vector<std::string>> categories_;

    // Initialize the unit database
    void initializeDatabase();

    // Add units for each category
    void addLengthUnits();
    void addMassUnits();
    void addTimeUnits();
    void addAreaUnits();
    void addVolumeUnits();
    void addDimensionlessUnits();
    void addAngleUnits();
    void addVelocityUnits();
    void addAccelerationUnits();
    void addFrequencyUnits();
    void addForceUnits();
    void addPressureUnits();
    void addEnergyUnits();
    void addEnergyCommodityUnits();
    void addPowerUnits();
    void addDensityUnits();
    void addViscosityUnits();
    void addVolumetricRateUnits();
    void addMassRateUnits();
    void addTemperatureUnits();

    // Helper to add unit with all variations
    void registerUnit(const Unit& unit);

    // Compound expression parser ("kN*m", "m**3", "kg/(m*s^2)")
    Unit parseExpression(const std::string& expr, const std::string& original) const;

    // String utilities
    static std::string toLowerCase(const std::string& str);
    static std::string trim(const std::string& str);
};

/**
 * @brief Global unit registry instance (singleton pattern)
 *
 * Built on first use; read-only afterwards.
 */
class UnitRegistryManager {
public:
    static const UnitRegistry& getInstance() {
        static const UnitRegistry instance;
        return instance;
    }

private:
    UnitRegistryManager() = default;
};

// Convenience functions for quick access
inline double convertUnits(double value, const std::string& from, const std::string& to) {
    return UnitRegistryManager::getInstance().convert(value, from, to);
}

inline double toSI(double value, const std::string& unit) {
    return UnitRegistryManager::getInstance().toBase(value, unit);
}

inline double fromSI(double value, const std::string& unit) {
    return UnitRegistryManager::getInstance().fromBase(value, unit);
}

} // namespace QTRACK

#endif // UNIT_REGISTRY_HPP

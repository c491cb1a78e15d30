#include "UnitSystemPolicy.hpp"
#include "UnitErrors.hpp"

namespace QTRACK {

// =============================================================================
// Unit System Table
// =============================================================================

const std::map<std::string, UnitSystemDefinition>& unitSystemTable() {
    static const std::map<std::string, UnitSystemDefinition> table = {
        {"inch", {
            {"length", "inch"},
            {"stress", "psi"},
            {"pressure", "psi"},
            {"force", "lbf"},
            {"moment", "lbf * inch"},
            {"temperature", "degF"},
            {"mass", "lb"},
        }},
        {"SI", {
            {"length", "m"},
            {"stress", "Pa"},
            {"pressure", "Pa"},
            {"force", "N"},
            {"moment", "N * m"},
            {"temperature", "degC"},
            {"mass", "kg"},
        }},
        {"metric_engineering", {
            {"length", "mm"},
            {"stress", "MPa"},
            {"pressure", "MPa"},
            {"force", "kN"},
            {"moment", "kN * m"},
            {"temperature", "degC"},
            {"mass", "kg"},
        }},
    };
    return table;
}

std::vector<std::string> unitSystemNames() {
    std::vector<std::string> names;
    for (const auto& pair : unitSystemTable()) {
        names.push_back(pair.first);
    }
    return names;
}

const UnitSystemDefinition& unitSystemDefinition(const std::string& system) {
    const auto& table = unitSystemTable();
    auto it = table.find(system);
    if (it == table.end()) {
        std::string available;
        for (const auto& name : unitSystemNames()) {
            if (!available.empty()) available += ", ";
            available += "'" + name + "'";
        }
        throw ConfigError(system, "Unknown unit system '" + system +
                                  "'. Available: [" + available + "]");
    }
    return it->second;
}

// =============================================================================
// UnitSystemPolicy Implementation
// =============================================================================

UnitSystemPolicy::UnitSystemPolicy(const std::string& system, bool strict, bool auto_convert)
    : system_(system), strict_(strict), auto_convert_(auto_convert),
      units_(&unitSystemDefinition(system)) {}

std::optional<std::string> UnitSystemPolicy::expectedUnit(const std::string& category) const {
    auto it = units_->find(category);
    if (it == units_->end()) {
        return std::nullopt;
    }
    return it->second;
}

bool UnitSystemPolicy::validate(const TrackedQuantity& quantity,
                                const std::string& category) const {
    auto expected = expectedUnit(category);
    if (!expected) {
        return true;
    }
    try {
        return quantity.unit().isSameAs(UnitRegistryManager::getInstance().resolve(*expected));
    } catch (const UnknownUnitError&) {
        return false;
    }
}

TrackedQuantity UnitSystemPolicy::enforce(const TrackedQuantity& quantity,
                                          const std::string& category) const {
    auto expected = expectedUnit(category);
    if (!expected) {
        return quantity;
    }

    Unit target = UnitRegistryManager::getInstance().resolve(*expected);
    if (quantity.unit().isSameAs(target)) {
        return quantity;
    }

    if (!quantity.unit().isCompatible(target)) {
        throw DimensionMismatchError(quantity.dimensionality(), target.dimension.toString(),
                                     "Policy '" + system_ + "' expects '" + target.symbol +
                                     "' for '" + category + "'");
    }

    if (!auto_convert_) {
        throw PolicyViolationError(system_, category, target.symbol, quantity.unitString());
    }

    return quantity.to(*expected);
}

} // namespace QTRACK

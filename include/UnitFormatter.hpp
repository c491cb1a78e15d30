#ifndef UNIT_FORMATTER_HPP
#define UNIT_FORMATTER_HPP

#include "TrackedQuantity.hpp"
#include "CalculationAuditLog.hpp"
#include <map>
#include <string>
#include <optional>

namespace QTRACK {

enum class Notation {
    FIXED,        // 12.35
    SCIENTIFIC    // 1.23e+01
};

/**
 * @brief Display rules for one quantity category
 */
struct FormatTemplate {
    int precision = 2;                 // Digits after the decimal point
    Notation notation = Notation::FIXED;
    std::string suffix;                // Appended after the unit, e.g. " (gauge)"
};

/**
 * @brief Renders tracked quantities and audit trails as text
 *
 * Templates are looked up by category name. Without an explicit category
 * the quantity's registry category is tried first ("pressure" for psi),
 * then any registered name appearing in its dimensionality string
 * ("length" in "[length]"). The default template is two fixed decimals.
 */
class UnitFormatter {
public:
    UnitFormatter() = default;

    /**
     * @throws std::invalid_argument if precision is negative
     */
    void registerTemplate(const std::string& category, const FormatTemplate& format);

    bool hasTemplate(const std::string& category) const;

    // Template used for q under the lookup rules above
    FormatTemplate templateFor(const TrackedQuantity& q,
                               const std::optional<std::string>& category = std::nullopt) const;

    // "101.33 kPa"; arrays render as "[1.00, 2.00] m"
    std::string formatQuantity(const TrackedQuantity& q,
                               const std::optional<std::string>& category = std::nullopt) const;

    /**
     * @brief Convert to target_unit first, then format
     * @throws UnknownUnitError, DimensionMismatchError
     */
    std::string formatQuantityAs(const TrackedQuantity& q, const std::string& target_unit,
                                 const std::optional<std::string>& category = std::nullopt) const;

    /**
     * @brief Value line followed by one line per provenance entry
     *
     * @code
     * Value: 14.7 psi
     * Provenance:
     *   [2024-05-01T12:00:00.000000+00:00] created | source=sensor | to=psi
     * @endcode
     */
    std::string formatWithProvenance(const TrackedQuantity& q,
                                     const std::optional<std::string>& target_unit = std::nullopt) const;

    /**
     * @brief Export a log as "json" (CalculationAuditLog::toJson) or "text" (summary)
     * @throws std::invalid_argument for any other format name
     */
    std::string exportAuditTrail(const CalculationAuditLog& log,
                                 const std::string& format = "json") const;

private:
    std::map<std::string, FormatTemplate> templates_;

    static std::string formatNumber(double value, const FormatTemplate& format);
};

} // namespace QTRACK

#endif // UNIT_FORMATTER_HPP

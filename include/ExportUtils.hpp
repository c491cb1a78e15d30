#ifndef EXPORT_UTILS_HPP
#define EXPORT_UTILS_HPP

#include <string>
#include <vector>
#include <chrono>

namespace QTRACK {
namespace ExportUtils {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Shortest decimal text that reads back to the same double
 *
 * Uses 15 significant digits when that round-trips, 17 otherwise.
 * Non-finite values render as "nan", "inf" or "-inf".
 */
std::string formatNumber(double value);

// "[1, 2.5, 3]"
std::string formatArray(const std::vector<double>& values,
                        const std::string& separator = ", ");

/**
 * @brief ISO-8601 UTC timestamp with microseconds
 *
 * Example: "2024-05-01T12:00:00.123456+00:00"
 */
std::string formatIsoTimestamp(const TimePoint& tp);

/**
 * @brief Parse an ISO-8601 timestamp
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS", optional fractional seconds (up to
 * microseconds are kept), and an optional "Z" or "+HH:MM"/"-HH:MM" offset.
 * @throws std::invalid_argument on malformed input
 */
TimePoint parseIsoTimestamp(const std::string& text);

// JSON string literal including the surrounding quotes
std::string jsonString(const std::string& text);

// JSON number; NaN and infinities have no JSON form and are written as null
std::string jsonNumber(double value);

// "[1, null, 3]"
std::string jsonArray(const std::vector<double>& values);

std::string htmlEscape(const std::string& text);

// CSV field, quoted when it contains a comma, quote or newline
std::string csvField(const std::string& text);

// Escape for a double-quoted Graphviz DOT string
std::string dotEscape(const std::string& text);

} // namespace ExportUtils
} // namespace QTRACK

#endif // EXPORT_UTILS_HPP

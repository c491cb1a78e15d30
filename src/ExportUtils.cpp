#include "ExportUtils.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace QTRACK {
namespace ExportUtils {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
long long daysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, long long& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += (m <= 2);
}

int readDigits(const std::string& text, size_t& pos, size_t count) {
    if (pos + count > text.size()) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: '" + text + "'");
    }
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid ISO-8601 timestamp: '" + text + "'");
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    return value;
}

void expectChar(const std::string& text, size_t& pos, char expected) {
    if (pos >= text.size() || text[pos] != expected) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: '" + text + "'");
    }
    ++pos;
}

} // namespace

std::string formatNumber(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.15g", value);
    if (std::strtod(buffer, nullptr) != value) {
        std::snprintf(buffer, sizeof(buffer), "%.17g", value);
    }
    return buffer;
}

std::string formatArray(const std::vector<double>& values, const std::string& separator) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) ss << separator;
        ss << formatNumber(values[i]);
    }
    ss << "]";
    return ss.str();
}

std::string formatIsoTimestamp(const TimePoint& tp) {
    using namespace std::chrono;

    auto us = duration_cast<microseconds>(tp.time_since_epoch()).count();
    long long secs = us / 1000000;
    long long frac = us % 1000000;
    if (frac < 0) {
        frac += 1000000;
        secs -= 1;
    }
    long long days = secs / 86400;
    long long sod = secs % 86400;
    if (sod < 0) {
        sod += 86400;
        days -= 1;
    }

    long long y;
    unsigned m, d;
    civilFromDays(days, y, m, d);

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%06lld+00:00",
                  y, m, d, sod / 3600, (sod % 3600) / 60, sod % 60, frac);
    return buffer;
}

TimePoint parseIsoTimestamp(const std::string& text) {
    size_t pos = 0;
    int year = readDigits(text, pos, 4);
    expectChar(text, pos, '-');
    int month = readDigits(text, pos, 2);
    expectChar(text, pos, '-');
    int day = readDigits(text, pos, 2);
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: '" + text + "'");
    }
    ++pos;
    int hour = readDigits(text, pos, 2);
    expectChar(text, pos, ':');
    int minute = readDigits(text, pos, 2);
    expectChar(text, pos, ':');
    int second = readDigits(text, pos, 2);

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: '" + text + "'");
    }

    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            throw std::invalid_argument("Invalid ISO-8601 timestamp: '" + text + "'");
        }
        for (int i = digits; i < 6; ++i) micros *= 10;
    }

    long long offset_seconds = 0;
    if (pos < text.size()) {
        char sign = text[pos];
        if (sign == 'Z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            ++pos;
            int oh = readDigits(text, pos, 2);
            expectChar(text, pos, ':');
            int om = readDigits(text, pos, 2);
            offset_seconds = (oh * 3600LL + om * 60LL) * (sign == '+' ? 1 : -1);
        }
    }
    if (pos != text.size()) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: '" + text + "'");
    }

    long long secs = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400LL +
                     hour * 3600LL + minute * 60LL + second - offset_seconds;

    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::microseconds(secs * 1000000LL + micros)));
}

std::string jsonNumber(double value) {
    if (!std::isfinite(value)) return "null";
    return formatNumber(value);
}

std::string jsonArray(const std::vector<double>& values) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << jsonNumber(values[i]);
    }
    ss << "]";
    return ss.str();
}

std::string jsonString(const std::string& text) {
    std::ostringstream ss;
    ss << '"';
    for (char c : text) {
        switch (c) {
            case '"':  ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
    return ss.str();
}

std::string htmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string csvField(const std::string& text) {
    if (text.find_first_of(",\"\n\r") == std::string::npos) {
        return text;
    }
    std::string out = "\"";
    for (char c : text) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    out += "\"";
    return out;
}

std::string dotEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
            out += c;
        } else if (c == '\n') {
            out += "\\n";
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace ExportUtils
} // namespace QTRACK

#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include <string>
#include <vector>
#include <map>
#include <istream>

namespace QTRACK {

/**
 * @brief INI-style configuration reader
 *
 * File format:
 * @code
 * # comment
 * [pipe_wall]
 * unit_system = inch
 * wall_thickness = 0.5        # inline comment
 * internal_pressure = 15 MPa
 * @endcode
 *
 * Sections and keys are reported in file order. Malformed lines are
 * skipped with a warning on std::cerr.
 */
class ConfigReader {
public:
    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file; false (with an error on std::cerr) if unreadable
    bool loadFile(const std::string& filename);

    // Load configuration text held in memory
    bool loadString(const std::string& content);

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    std::map<std::string, std::string> getSectionData(const std::string& section) const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    // File order of sections and of keys within each section
    std::vector<std::string> section_order_;
    std::map<std::string, std::vector<std::string>> key_order_;

    bool parse(std::istream& input, const std::string& origin);
    void setValue(const std::string& section, const std::string& key, const std::string& value);

    std::string trim(const std::string& str) const;
};

} // namespace QTRACK

#endif // CONFIG_READER_HPP

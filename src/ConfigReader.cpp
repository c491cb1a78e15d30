#include "ConfigReader.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace QTRACK {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    return parse(file, filename);
}

bool ConfigReader::loadString(const std::string& content) {
    std::istringstream input(content);
    return parse(input, "<string>");
}

bool ConfigReader::parse(std::istream& input, const std::string& origin) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(input, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            if (data.find(current_section) == data.end()) {
                data[current_section];
                section_order_.push_back(current_section);
            }
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << " in " << origin
                      << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num
                      << " in " << origin << std::endl;
            continue;
        }
        if (key.empty()) {
            std::cerr << "Warning: Empty key at line " << line_num << " in " << origin << std::endl;
            continue;
        }

        setValue(current_section, key, value);
    }

    return true;
}

void ConfigReader::setValue(const std::string& section, const std::string& key,
                            const std::string& value) {
    auto& section_data = data[section];
    if (section_data.find(key) == section_data.end()) {
        key_order_[section].push_back(key);
    }
    section_data[key] = value;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::logic_error&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

// =============================================================================
// Section/Key Query Methods
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    return section_order_;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    auto it = key_order_.find(section);
    if (it == key_order_.end()) return {};
    return it->second;
}

std::map<std::string, std::string> ConfigReader::getSectionData(const std::string& section) const {
    auto it = data.find(section);
    if (it == data.end()) return {};
    return it->second;
}

} // namespace QTRACK

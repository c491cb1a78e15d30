#ifndef QUANTITY_MAP_HPP
#define QUANTITY_MAP_HPP

#include "TrackedQuantity.hpp"
#include <map>
#include <string>
#include <vector>
#include <utility>

namespace QTRACK {

/**
 * @brief Named tracked quantities in insertion order
 *
 * Setting an existing name replaces its quantity in place; the name keeps
 * its original position.
 */
class QuantityMap {
public:
    using Entry = std::pair<std::string, TrackedQuantity>;
    using const_iterator = std::vector<Entry>::const_iterator;

    void set(const std::string& name, const TrackedQuantity& quantity);

    bool contains(const std::string& name) const { return index_.count(name) > 0; }

    // nullptr when absent
    const TrackedQuantity* find(const std::string& name) const;

    /**
     * @throws std::out_of_range naming the missing entry
     */
    const TrackedQuantity& at(const std::string& name) const;

    std::vector<std::string> names() const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
    std::map<std::string, size_t> index_;
};

} // namespace QTRACK

#endif // QUANTITY_MAP_HPP

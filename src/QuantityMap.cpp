#include "QuantityMap.hpp"
#include <stdexcept>

namespace QTRACK {

void QuantityMap::set(const std::string& name, const TrackedQuantity& quantity) {
    auto it = index_.find(name);
    if (it != index_.end()) {
        entries_[it->second].second = quantity;
        return;
    }
    index_[name] = entries_.size();
    entries_.emplace_back(name, quantity);
}

const TrackedQuantity* QuantityMap::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second].second;
}

const TrackedQuantity& QuantityMap::at(const std::string& name) const {
    const TrackedQuantity* quantity = find(name);
    if (!quantity) {
        throw std::out_of_range("No quantity named '" + name + "'");
    }
    return *quantity;
}

std::vector<std::string> QuantityMap::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace QTRACK

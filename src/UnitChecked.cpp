#include "UnitChecked.hpp"
#include "UnitErrors.hpp"

namespace QTRACK {

UnitCheckedFunction::UnitCheckedFunction(std::vector<Parameter> parameters,
                                         std::optional<std::string> return_unit,
                                         std::string source,
                                         Body body)
    : parameters_(std::move(parameters)), return_unit_(std::move(return_unit)),
      source_(std::move(source)), body_(std::move(body)) {
    const UnitRegistry& registry = UnitRegistryManager::getInstance();
    for (const auto& param : parameters_) {
        if (param.second) registry.resolve(*param.second);
    }
    if (return_unit_) registry.resolve(*return_unit_);
}

bool UnitCheckedFunction::hasParameter(const std::string& name) const {
    for (const auto& param : parameters_) {
        if (param.first == name) return true;
    }
    return false;
}

TrackedQuantity UnitCheckedFunction::operator()(const Arguments& tracked) const {
    return (*this)(tracked, Values());
}

TrackedQuantity UnitCheckedFunction::operator()(const Arguments& tracked, const Values& raw) const {
    for (const auto& arg : tracked) {
        if (!hasParameter(arg.first)) {
            throw ConfigError(arg.first, "'" + source_ + "' has no parameter '" + arg.first + "'");
        }
    }
    for (const auto& arg : raw) {
        if (!hasParameter(arg.first)) {
            throw ConfigError(arg.first, "'" + source_ + "' has no parameter '" + arg.first + "'");
        }
    }

    Values values;
    std::vector<ProvenanceEntry> history;

    for (const auto& param : parameters_) {
        const std::string& name = param.first;

        auto tracked_it = tracked.find(name);
        if (tracked_it != tracked.end()) {
            const TrackedQuantity converted =
                param.second ? tracked_it->second.to(*param.second) : tracked_it->second;
            history.insert(history.end(), converted.provenance().begin(),
                           converted.provenance().end());
            values[name] = converted.value();
            continue;
        }

        auto raw_it = raw.find(name);
        if (raw_it != raw.end()) {
            values[name] = raw_it->second;
            continue;
        }

        throw ConfigError(name, "Missing argument '" + name + "' for '" + source_ + "'");
    }

    double result = body_(values);
    return TrackedQuantity::createWithHistory(result, return_unit_.value_or("dimensionless"),
                                              source_, history);
}

} // namespace QTRACK

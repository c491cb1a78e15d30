#ifndef UNIT_CHECKED_HPP
#define UNIT_CHECKED_HPP

#include "TrackedQuantity.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace QTRACK {

/**
 * @brief A numeric function whose arguments and result carry units
 *
 * Each parameter may name the unit its value must be expressed in. On a
 * call, tracked arguments are converted into those units (the conversion
 * is recorded), the function runs on plain numbers, and the result is a
 * TrackedQuantity in the return unit. The result's provenance holds every
 * argument's history in parameter order followed by a "created" entry
 * labeled with the function's source.
 *
 * @code
 * UnitCheckedFunction hoop({{"pressure", "MPa"}, {"diameter", "mm"}, {"thickness", "mm"}},
 *                          "MPa", "hoop_stress",
 *                          [](const UnitCheckedFunction::Values& v) {
 *                              return v.at("pressure") * v.at("diameter") / (2.0 * v.at("thickness"));
 *                          });
 * TrackedQuantity sigma = hoop({{"pressure", p}, {"diameter", d}, {"thickness", t}});
 * @endcode
 */
class UnitCheckedFunction {
public:
    // Parameter name and the unit it is converted into (none: used as given)
    using Parameter = std::pair<std::string, std::optional<std::string>>;
    using Values = std::map<std::string, double>;
    using Body = std::function<double(const Values&)>;
    using Arguments = std::map<std::string, TrackedQuantity>;

    /**
     * @param return_unit Unit of the result; dimensionless when absent
     * @throws UnknownUnitError if a parameter or return unit cannot be resolved
     */
    UnitCheckedFunction(std::vector<Parameter> parameters,
                        std::optional<std::string> return_unit,
                        std::string source,
                        Body body);

    /**
     * @brief Call with tracked arguments only
     * @throws ConfigError naming a missing or unexpected parameter
     * @throws DimensionMismatchError if an argument cannot be converted
     */
    TrackedQuantity operator()(const Arguments& tracked) const;

    // Mixed call: plain numbers in raw are passed through unconverted
    TrackedQuantity operator()(const Arguments& tracked, const Values& raw) const;

    const std::vector<Parameter>& parameters() const { return parameters_; }
    const std::optional<std::string>& returnUnit() const { return return_unit_; }
    const std::string& source() const { return source_; }

private:
    std::vector<Parameter> parameters_;
    std::optional<std::string> return_unit_;
    std::string source_;
    Body body_;

    bool hasParameter(const std::string& name) const;
};

} // namespace QTRACK

#endif // UNIT_CHECKED_HPP

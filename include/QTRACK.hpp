#ifndef QTRACK_HPP
#define QTRACK_HPP

// Unit-tracked quantities, provenance and calculation audit trails

#include "UnitErrors.hpp"
#include "UnitRegistry.hpp"
#include "ExportUtils.hpp"
#include "DomainUnits.hpp"
#include "TrackedQuantity.hpp"
#include "QuantityMap.hpp"
#include "UnitSystemPolicy.hpp"
#include "ConfigReader.hpp"
#include "InputParser.hpp"
#include "CalculationAuditLog.hpp"
#include "GraphRenderer.hpp"
#include "LineageGraph.hpp"
#include "UnitFormatter.hpp"
#include "UnitChecked.hpp"

namespace QTRACK {

// Library version
constexpr const char* VERSION = "1.0.0";

} // namespace QTRACK

#endif // QTRACK_HPP

/*
 * Example: Audited Pipe Wall Calculation
 *
 * Reads design inputs from a config file, computes hoop stress and its
 * utilization against yield, and writes the audit trail next to the
 * config as JSON, CSV, HTML and (when Graphviz is installed) SVG.
 *
 * Usage:
 *   ./audit_trail_demo [config_file] [output_prefix]
 */

#include "QTRACK.hpp"
#include <fstream>
#include <iostream>
#include <string>

using namespace QTRACK;

namespace {

bool writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write " << path << "\n";
        return false;
    }
    file << content << "\n";
    std::cout << "[QTRACK] Wrote " << path << "\n";
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_file = argc > 1 ? argv[1] : "config/pipe_wall.config";
    std::string prefix = argc > 2 ? argv[2] : "pipe_wall_audit";

    std::cout << "================================================\n";
    std::cout << "  QTRACK Audited Calculation Example\n";
    std::cout << "================================================\n\n";
    std::cout << "Config file: " << config_file << "\n\n";

    ConfigReader reader;
    if (!reader.loadFile(config_file)) {
        return 1;
    }
    std::cout << "[QTRACK] Loaded " << reader.getSections().size() << " section(s)\n\n";

    try {
        QuantityMap inputs = parseConfigFile(reader, "pipe_wall", config_file);

        CalculationAuditLog log;
        for (const auto& entry : inputs) {
            log.addInput(entry.first, entry.second);
        }

        UnitSystemPolicy policy(reader.getString("pipe_wall", "unit_system", "SI"));

        // Hoop stress through the unit-checked path
        UnitCheckedFunction hoop_stress(
            {{"pressure", std::string("MPa")}, {"diameter", std::string("mm")},
             {"thickness", std::string("mm")}},
            std::string("MPa"), "hoop_stress",
            [](const UnitCheckedFunction::Values& v) {
                return v.at("pressure") * v.at("diameter") / (2.0 * v.at("thickness"));
            });

        TrackedQuantity sigma = hoop_stress({{"pressure", inputs.at("pressure")},
                                             {"diameter", inputs.at("diameter")},
                                             {"thickness", inputs.at("thickness")}});
        log.addStep("hoop stress = p * D / (2 t)");

        sigma = policy.enforce(sigma, "stress");
        log.addStep("express hoop stress in " + policy.system() + " units");
        log.addOutput("hoop_stress", sigma);

        if (inputs.contains("yield_strength")) {
            TrackedQuantity utilization = sigma / inputs.at("yield_strength");
            log.addStep("utilization = hoop stress / yield strength");
            log.addOutput("utilization", utilization.to("%"));
        }

        UnitFormatter formatter;
        FormatTemplate stress;
        stress.precision = 1;
        formatter.registerTemplate("pressure", stress);
        FormatTemplate percent;
        percent.precision = 1;
        formatter.registerTemplate("dimensionless", percent);

        std::cout << "Inputs:\n";
        for (const auto& entry : log.inputs()) {
            std::cout << "  " << entry.first << " = " << formatter.formatQuantity(entry.second) << "\n";
        }
        std::cout << "\nOutputs:\n";
        for (const auto& entry : log.outputs()) {
            std::cout << "  " << entry.first << " = " << formatter.formatQuantity(entry.second) << "\n";
        }
        std::cout << "\n" << formatter.formatWithProvenance(log.outputs().at("hoop_stress")) << "\n\n";

        LineageGraph graph = LineageGraph::fromAuditLog(log);

        bool ok = writeFile(prefix + ".json", formatter.exportAuditTrail(log, "json"));
        ok = writeFile(prefix + ".csv", log.toCsv()) && ok;
        ok = writeFile(prefix + ".html", graph.toHtml()) && ok;
        ok = writeFile(prefix + ".dot", graph.toDot()) && ok;

        try {
            ok = writeFile(prefix + ".svg", graph.toSvg()) && ok;
        } catch (const OptionalDependencyError& e) {
            std::cerr << "Warning: " << e.what() << "; skipping SVG\n";
        }

        std::cout << "\n" << log.summary() << "\n";
        return ok ? 0 : 1;

    } catch (const UnitError& e) {
        std::cerr << "Error: " << e.what() << "\n";
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return 1;
}

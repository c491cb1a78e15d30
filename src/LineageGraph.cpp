#include "LineageGraph.hpp"
#include "UnitErrors.hpp"
#include "ExportUtils.hpp"
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace QTRACK {

using ExportUtils::jsonString;

namespace {

void addNodes(std::vector<LineageNode>& nodes, const QuantityMap& quantities,
              const std::string& role) {
    for (const auto& entry : quantities) {
        nodes.push_back(LineageNode{entry.first, entry.second.magnitude(),
                                    entry.second.unitString(), role});
    }
}

} // namespace

LineageGraph LineageGraph::fromAuditLog(const CalculationAuditLog& log) {
    LineageGraph graph;
    addNodes(graph.nodes_, log.inputs(), "input");
    addNodes(graph.nodes_, log.outputs(), "output");

    for (const auto& step : log.steps()) {
        for (const auto& input : log.inputs()) {
            for (const auto& output : log.outputs()) {
                graph.edges_.push_back(LineageEdge{input.first, output.first, step.description});
            }
        }
    }

    return graph;
}

GraphDict LineageGraph::toDict() const {
    return GraphDict{nodes_, edges_};
}

std::string LineageGraph::toJson() const {
    std::ostringstream ss;
    ss << "{\n  \"nodes\": [";
    for (size_t i = 0; i < nodes_.size(); ++i) {
        const auto& node = nodes_[i];
        ss << (i == 0 ? "\n" : ",\n")
           << "    {\"name\": " << jsonString(node.name)
           << ", \"value\": " << node.value.toJson()
           << ", \"unit\": " << jsonString(node.unit)
           << ", \"role\": " << jsonString(node.role) << "}";
    }
    if (!nodes_.empty()) ss << "\n  ";
    ss << "],\n  \"edges\": [";
    for (size_t i = 0; i < edges_.size(); ++i) {
        const auto& edge = edges_[i];
        ss << (i == 0 ? "\n" : ",\n")
           << "    {\"source\": " << jsonString(edge.source)
           << ", \"target\": " << jsonString(edge.target)
           << ", \"operation\": " << jsonString(edge.operation) << "}";
    }
    if (!edges_.empty()) ss << "\n  ";
    ss << "]\n}";
    return ss.str();
}

// =============================================================================
// DOT / HTML Export
// =============================================================================

std::string LineageGraph::toDot() const {
    using ExportUtils::dotEscape;

    std::ostringstream ss;
    ss << "digraph lineage {\n";
    ss << "  rankdir=LR;\n";

    for (const auto& node : nodes_) {
        const char* shape = (node.role == "input") ? "ellipse" : "box";
        ss << "  \"" << dotEscape(node.name) << "\" [label=\"" << dotEscape(node.name)
           << "\\n" << dotEscape(node.value.toString() + " " + node.unit)
           << "\", shape=" << shape << "];\n";
    }

    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& edge : edges_) {
        if (!seen.insert({edge.source, edge.target}).second) continue;
        ss << "  \"" << dotEscape(edge.source) << "\" -> \"" << dotEscape(edge.target)
           << "\" [label=\"" << dotEscape(edge.operation) << "\"];\n";
    }

    ss << "}";
    return ss.str();
}

std::string LineageGraph::toHtml() const {
    using ExportUtils::htmlEscape;

    std::ostringstream ss;
    ss << "<!DOCTYPE html>\n"
       << "<html>\n<head>\n<meta charset=\"utf-8\">\n"
       << "<title>Calculation Lineage</title>\n"
       << "<style>\n"
       << "body { font-family: sans-serif; margin: 2em; }\n"
       << "table { border-collapse: collapse; margin-bottom: 2em; }\n"
       << "th, td { border: 1px solid #999; padding: 4px 10px; text-align: left; }\n"
       << "th { background: #eee; }\n"
       << "tr.input td:first-child { font-style: italic; }\n"
       << "</style>\n</head>\n<body>\n"
       << "<h1>Calculation Lineage</h1>\n";

    ss << "<h2>Quantities</h2>\n<table>\n"
       << "<tr><th>Name</th><th>Value</th><th>Unit</th><th>Role</th></tr>\n";
    for (const auto& node : nodes_) {
        ss << "<tr class=\"" << htmlEscape(node.role) << "\"><td>" << htmlEscape(node.name)
           << "</td><td>" << htmlEscape(node.value.toString())
           << "</td><td>" << htmlEscape(node.unit)
           << "</td><td>" << htmlEscape(node.role) << "</td></tr>\n";
    }
    ss << "</table>\n";

    ss << "<h2>Computation Steps</h2>\n<table>\n"
       << "<tr><th>Source</th><th>Target</th><th>Operation</th></tr>\n";
    for (const auto& edge : edges_) {
        ss << "<tr><td>" << htmlEscape(edge.source)
           << "</td><td>" << htmlEscape(edge.target)
           << "</td><td>" << htmlEscape(edge.operation) << "</td></tr>\n";
    }
    ss << "</table>\n</body>\n</html>\n";
    return ss.str();
}

// =============================================================================
// SVG Rendering
// =============================================================================

std::string LineageGraph::toSvg(std::chrono::seconds timeout) const {
    GraphvizRenderer renderer;
    return toSvg(renderer, timeout);
}

std::string LineageGraph::toSvg(const GraphRenderer& renderer, std::chrono::seconds timeout) const {
    if (timeout.count() <= 0) {
        throw std::invalid_argument("Rendering timeout must be positive, got " +
                                    std::to_string(timeout.count()) + " s");
    }
    if (!renderer.isAvailable()) {
        throw OptionalDependencyError(renderer.name(), "SVG lineage rendering");
    }
    return renderer.render(toDot(), timeout);
}

} // namespace QTRACK

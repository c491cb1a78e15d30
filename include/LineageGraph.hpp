#ifndef LINEAGE_GRAPH_HPP
#define LINEAGE_GRAPH_HPP

#include "CalculationAuditLog.hpp"
#include "GraphRenderer.hpp"
#include <string>
#include <vector>
#include <chrono>

namespace QTRACK {

struct LineageNode {
    std::string name;
    Magnitude value;
    std::string unit;
    std::string role;   // "input" or "output"
};

struct LineageEdge {
    std::string source;
    std::string target;
    std::string operation;
};

/**
 * @brief Plain-data form of a lineage graph
 */
struct GraphDict {
    std::vector<LineageNode> nodes;
    std::vector<LineageEdge> edges;
};

/**
 * @brief Directed graph from calculation inputs to outputs
 *
 * Built once from a completed CalculationAuditLog. The log's steps do not
 * say which inputs feed which outputs, so every step adds an edge from
 * every input to every output, labeled with the step description.
 */
class LineageGraph {
public:
    LineageGraph() = default;

    static LineageGraph fromAuditLog(const CalculationAuditLog& log);

    const std::vector<LineageNode>& nodes() const { return nodes_; }
    const std::vector<LineageEdge>& edges() const { return edges_; }

    GraphDict toDict() const;

    // {"nodes": [...], "edges": [...]}
    std::string toJson() const;

    /**
     * @brief Graphviz DOT source
     *
     * Inputs are ellipses, outputs boxes. Each (source, target) pair is
     * written once, labeled with the first step that connects it.
     */
    std::string toDot() const;

    // Standalone HTML page with a quantities table and a steps table
    std::string toHtml() const;

    /**
     * @brief Render to SVG with the Graphviz "dot" program
     * @throws std::invalid_argument if timeout is not positive
     * @throws OptionalDependencyError if Graphviz is not installed
     * @throws std::runtime_error if rendering fails or times out
     */
    std::string toSvg(std::chrono::seconds timeout = std::chrono::seconds(30)) const;

    std::string toSvg(const GraphRenderer& renderer,
                      std::chrono::seconds timeout = std::chrono::seconds(30)) const;

private:
    std::vector<LineageNode> nodes_;
    std::vector<LineageEdge> edges_;
};

} // namespace QTRACK

#endif // LINEAGE_GRAPH_HPP

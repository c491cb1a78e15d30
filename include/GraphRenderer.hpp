#ifndef GRAPH_RENDERER_HPP
#define GRAPH_RENDERER_HPP

#include <string>
#include <chrono>

namespace QTRACK {

/**
 * @brief Turns Graphviz DOT text into SVG
 *
 * Implementations wrap an external layout engine; LineageGraph only
 * depends on this interface.
 */
class GraphRenderer {
public:
    virtual ~GraphRenderer() = default;

    // Name of the backing tool, reported when it is missing
    virtual std::string name() const = 0;

    virtual bool isAvailable() const = 0;

    /**
     * @brief Render DOT source to an SVG document
     * @throws std::invalid_argument if timeout is not positive
     * @throws std::runtime_error if rendering fails or exceeds the timeout
     */
    virtual std::string render(const std::string& dot, std::chrono::seconds timeout) const = 0;
};

/**
 * @brief Renders through the Graphviz "dot" program
 *
 * The DOT text is written to a temporary file and "dot -Tsvg" runs under
 * "timeout"; the SVG is read back and the temporary files removed.
 * A missing "timeout" or "dot" program raises OptionalDependencyError.
 */
class GraphvizRenderer : public GraphRenderer {
public:
    explicit GraphvizRenderer(const std::string& executable = "dot");

    std::string name() const override { return "graphviz"; }
    bool isAvailable() const override;
    std::string render(const std::string& dot, std::chrono::seconds timeout) const override;

private:
    std::string executable_;
};

} // namespace QTRACK

#endif // GRAPH_RENDERER_HPP

#include "GraphRenderer.hpp"
#include "UnitErrors.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <atomic>
#include <cstdlib>
#include <sys/wait.h>
#include <unistd.h>

namespace QTRACK {

namespace fs = std::filesystem;

namespace {

// Exit statuses reported by timeout(1): command killed, command not found
constexpr int TIMEOUT_EXIT_CODE = 124;
constexpr int NOT_FOUND_EXIT_CODE = 127;

const char* const SVG_FEATURE = "SVG lineage rendering";

std::string shellQuote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += "'";
    return quoted;
}

int exitStatus(int raw) {
    if (raw == -1) return -1;
    if (WIFEXITED(raw)) return WEXITSTATUS(raw);
    return -1;
}

// Removes the temporary files however render() exits
struct TempFiles {
    fs::path input;
    fs::path output;

    ~TempFiles() {
        std::error_code ec;
        fs::remove(input, ec);
        fs::remove(output, ec);
    }
};

bool commandExists(const std::string& program) {
    std::string cmd = "command -v " + shellQuote(program) + " >/dev/null 2>&1";
    return exitStatus(std::system(cmd.c_str())) == 0;
}

} // namespace

GraphvizRenderer::GraphvizRenderer(const std::string& executable)
    : executable_(executable) {}

bool GraphvizRenderer::isAvailable() const {
    return commandExists(executable_);
}

std::string GraphvizRenderer::render(const std::string& dot, std::chrono::seconds timeout) const {
    if (timeout.count() <= 0) {
        throw std::invalid_argument("Rendering timeout must be positive, got " +
                                    std::to_string(timeout.count()) + " s");
    }
    if (!commandExists("timeout")) {
        throw OptionalDependencyError("timeout", SVG_FEATURE);
    }

    static std::atomic<unsigned> counter{0};

    std::ostringstream stem;
    stem << "qtrack_lineage_" << ::getpid() << "_" << counter++;

    TempFiles files;
    files.input = fs::temp_directory_path() / (stem.str() + ".dot");
    files.output = fs::temp_directory_path() / (stem.str() + ".svg");

    {
        std::ofstream script(files.input);
        if (!script) {
            throw std::runtime_error("Cannot write DOT file: " + files.input.string());
        }
        script << dot;
    }

    std::string cmd = "timeout " + std::to_string(timeout.count()) + " " +
                      shellQuote(executable_) + " -Tsvg " +
                      shellQuote(files.input.string()) + " -o " +
                      shellQuote(files.output.string()) + " 2>/dev/null";

    int status = exitStatus(std::system(cmd.c_str()));
    if (status == TIMEOUT_EXIT_CODE) {
        throw std::runtime_error("Graphviz rendering timed out after " +
                                 std::to_string(timeout.count()) + " s");
    }
    if (status == NOT_FOUND_EXIT_CODE) {
        throw OptionalDependencyError(executable_, SVG_FEATURE);
    }
    if (status != 0) {
        throw std::runtime_error("Graphviz '" + executable_ + "' failed with exit code " +
                                 std::to_string(status));
    }

    std::ifstream svg(files.output);
    if (!svg) {
        throw std::runtime_error("Graphviz produced no output: " + files.output.string());
    }
    std::ostringstream content;
    content << svg.rdbuf();
    return content.str();
}

} // namespace QTRACK

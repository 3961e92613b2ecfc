#ifndef CLOTHSIM_CLI_COMMON_HPP
#define CLOTHSIM_CLI_COMMON_HPP

#include <simulation/simulation_config.hpp>
#include <math/vec2.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace clothsim::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    bool help = false;

    // run options
    std::optional<int> frames;
    std::optional<float> dt;
    std::optional<Vec2> cut_point;
};

// Parse "X,Y" into a point
inline Vec2 parse_point(const std::string& text) {
    size_t comma = text.find(',');
    if (comma == std::string::npos) {
        throw std::runtime_error("Expected X,Y but got: " + text);
    }
    try {
        return Vec2(std::stof(text.substr(0, comma)), std::stof(text.substr(comma + 1)));
    } catch (const std::logic_error&) {
        throw std::runtime_error("Expected X,Y but got: " + text);
    }
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto require_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        return argv[++i];
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = require_value("-o/--output");
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = require_value("-c/--config");
        } else if (arg == "--frames") {
            ctx.frames = std::stoi(require_value("--frames"));
        } else if (arg == "--dt") {
            ctx.dt = std::stof(require_value("--dt"));
        } else if (arg == "--cut") {
            ctx.cut_point = parse_point(require_value("--cut"));
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
        ++i;
    }

    return {ctx, i};
}

// Load the "simulation" section of a config file, or defaults.
// Throws if the file is unreadable or the config breaks the input contract.
SimulationConfig load_simulation_config(const std::optional<std::string>& path);

// Command function declarations
int command_run(int argc, char** argv);
int command_config(int argc, char** argv);
int command_view(int argc, char** argv);

}  // namespace clothsim::cli

#endif // CLOTHSIM_CLI_COMMON_HPP

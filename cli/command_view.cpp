#include "cli_common.hpp"
#include <visualizer/visualizer.hpp>
#include <common/logging.hpp>
#include <iostream>

namespace clothsim::cli {

namespace {

void print_usage() {
    std::cerr << "Usage: clothsim view [-c <config.json>] [-v]\n";
    std::cerr << "Opens the interactive viewer.\n";
    std::cerr << "  left mouse=drag, right mouse=cut, space=pause, r=reset, q=quit\n";
}

}  // namespace

int command_view(int argc, char** argv) {
    auto log = clothsim::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        if (ctx.help) {
            print_usage();
            return 0;
        }
        if (ctx.verbose) {
            clothsim::logging::enable_verbose();
        }

        if (!visualization_available()) {
            log->error("Visualization not available - recompile with GLFW and OpenGL");
            std::cerr << "Error: Visualization not available\n";
            return 1;
        }

        SimulationConfig config = load_simulation_config(ctx.config_path);

        VisualizerResult result = run_visualizer(config);
        if (!result.completed) {
            std::cerr << "Error: viewer failed to start\n";
            return 1;
        }
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace clothsim::cli

#include "cli_common.hpp"
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <common/logging.hpp>
#include <iostream>

namespace clothsim::cli {

int command_config(int argc, char** argv) {
    auto log = clothsim::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.output_path.empty()) {
            std::cerr << "Usage: clothsim config -o <config.json>\n";
            std::cerr << "Writes the default configuration.\n";
            return ctx.help ? 0 : 1;
        }

        nlohmann::json config = {
            {"simulation", SimulationConfig{}}
        };
        json::write_json_file(ctx.output_path, config);

        log->info("Wrote default configuration to {}", ctx.output_path);
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace clothsim::cli

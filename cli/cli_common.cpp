#include "cli_common.hpp"
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <common/logging.hpp>

namespace clothsim::cli {

SimulationConfig load_simulation_config(const std::optional<std::string>& path) {
    auto log = clothsim::logging::get_logger();
    SimulationConfig config;

    if (path.has_value()) {
        nlohmann::json section = json::read_config_section(path.value(), "simulation");
        if (section.is_null()) {
            log->warn("No \"simulation\" section in {}, using defaults", path.value());
        } else {
            try {
                config = section.get<SimulationConfig>();
            } catch (const std::exception& e) {
                throw std::runtime_error("Invalid \"simulation\" section in " + path.value() +
                                         ": " + e.what());
            }
        }
        log->info("Loaded configuration from: {}", path.value());
    }

    std::vector<std::string> errors = validate_config(config);
    if (!errors.empty()) {
        for (const auto& error : errors) {
            log->error("Config error: {}", error);
        }
        throw std::runtime_error("Invalid configuration (" + std::to_string(errors.size()) +
                                 " error(s))");
    }

    return config;
}

}  // namespace clothsim::cli

#include <iostream>
#include <string>

#include "cli_common.hpp"
#include "logging.hpp"

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Interactive 2D cloth simulation (drag, tear, cut).\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  run       Simulate headless and export the final render snapshot\n";
    std::cerr << "  config    Write the default configuration file\n";
    std::cerr << "  view      Open the interactive viewer\n";
    std::cerr << "\n";
    std::cerr << "Common options:\n";
    std::cerr << "  -c, --config <file>   Configuration file (JSON)\n";
    std::cerr << "  -o, --output <file>   Output file\n";
    std::cerr << "  -v, --verbose         Debug logging\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  CLOTHSIM_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    auto log = clothsim::logging::get_logger();
    log->debug("Dispatching command: {}", command);

    if (command == "run") {
        return clothsim::cli::command_run(argc, argv);
    } else if (command == "config") {
        return clothsim::cli::command_config(argc, argv);
    } else if (command == "view") {
        return clothsim::cli::command_view(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}

#include <iostream>
#include <string>
#include <vector>
#include "fastpack/core/logger.hpp"
#include "fastpack/core/config.hpp"
#include "fastpack/core/cli.hpp"
#include "fastpack/core/utils.hpp"
#include "fastpack/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    fastpack::core::CommandLineParser parser("fastpack");
    fastpack::core::CommandRegistry command_registry;

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        command_registry.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = fastpack::core::Config::instance();
    config.set_defaults();

    auto config_file = fastpack::core::utils::FileUtils::expand_home(parser.get_option("config", "~/.fastpack.conf"));
    if (fastpack::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Error: cannot read configuration " << config_file.string() << "\n";
            return 1;
        }
    }

    auto log_level = parser.has_option("verbose")
        ? fastpack::core::LogLevel::Debug
        : fastpack::core::Logger::parse_level(config.get_string("log.level", "info"));
    fastpack::core::Logger::initialize(config.get_string("log.file", "fastpack.log"), log_level);

    LOG_INFO("fastpack starting up");

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    const std::string& command = args[0];
    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            command_registry.print_help();
        }
    }

    fastpack::core::Logger::shutdown();
    return result.exit_code;
}

#include "nearfetch/core/cli.hpp"
#include "nearfetch/core/command_registry.hpp"
#include "nearfetch/core/config.hpp"
#include "nearfetch/core/logger.hpp"
#include "nearfetch/core/utils.hpp"
#include <iostream>
#include <string>

using namespace nearfetch::core;

namespace {

void load_configuration(const CommandLineParser& parser) {
    auto& config = Config::instance();
    config.set_defaults();

    auto config_file = utils::FileUtils::expand_home(parser.get_option("config"));
    if (utils::FileUtils::exists(config_file) && !config.load_from_file(config_file.string())) {
        std::cerr << "Warning: could not read " << config_file.string() << "\n";
    }

    if (parser.has_option("share-dir")) {
        config.set("storage.base_dir", parser.get_option("share-dir"));
    }
}

}

int main(int argc, char* argv[]) {
    CommandLineParser parser("nearfetch");
    if (!parser.parse(argc, argv)) {
        std::cerr << "nearfetch: " << parser.get_error() << "\n"
                  << "Try 'nearfetch --help' for more information.\n";
        return 2;
    }

    CommandRegistry commands;

    if (parser.has_option("help")) {
        parser.print_help();
        commands.print_help();
        return 0;
    }
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    const auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        commands.print_help();
        return 1;
    }

    load_configuration(parser);

    auto& config = Config::instance();
    LogLevel level = parser.has_option("verbose") ? LogLevel::Debug
                                                  : parse_log_level(config.get_string("log.level"));
    Logger::initialize(config.get_path("log.file", "nearfetch.log").string(), level);
    LOG_INFO("nearfetch {} as {}", args[0], config.get_string("peer.name"));

    auto result = commands.execute_command(args[0], args);
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!commands.has_command(args[0])) {
            commands.print_help(std::cerr);
        }
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }

    Logger::shutdown();
    return result.exit_code;
}

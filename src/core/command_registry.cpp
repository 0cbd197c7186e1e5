#include "nearfetch/core/command_registry.hpp"
#include "nearfetch/core/logger.hpp"
#include <iomanip>

namespace nearfetch::core {

CommandRegistry::CommandRegistry() {
    register_command("demo", std::make_unique<DemoCommandHandler>());
    register_command("config", std::make_unique<ConfigCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    for (auto& [existing, current] : commands_) {
        if (existing == name) {
            current = std::move(handler);
            return;
        }
    }
    commands_.emplace_back(name, std::move(handler));
}

CommandHandler* CommandRegistry::find(const std::string& command) const {
    for (const auto& [name, handler] : commands_) {
        if (name == command) {
            return handler.get();
        }
    }
    return nullptr;
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    CommandHandler* handler = find(command);
    if (!handler) {
        return CommandResult::error("Unknown command: " + command);
    }

    LOG_DEBUG("Running command {} with {} argument(s)", command, args.size() > 0 ? args.size() - 1 : 0);
    try {
        return handler->execute(args);
    } catch (const std::exception& e) {
        LOG_ERROR("Command {} failed: {}", command, e.what());
        return CommandResult::error(command + " failed: " + e.what());
    }
}

bool CommandRegistry::has_command(const std::string& command) const {
    return find(command) != nullptr;
}

std::vector<std::string> CommandRegistry::command_names() const {
    std::vector<std::string> names;
    names.reserve(commands_.size());
    for (const auto& entry : commands_) {
        names.push_back(entry.first);
    }
    return names;
}

void CommandRegistry::print_help(std::ostream& out) const {
    out << "\nCommands:\n";
    for (const auto& [name, handler] : commands_) {
        out << "  " << std::left << std::setw(10) << name << handler->get_description() << "\n"
            << "  " << std::setw(10) << "" << handler->get_usage() << "\n";
    }
}

}

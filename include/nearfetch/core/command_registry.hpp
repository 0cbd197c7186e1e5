#pragma once

#include "command_handler.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace nearfetch::core {

class CommandRegistry {
public:
    // Registers the built-in commands.
    CommandRegistry();

    // Replaces an existing command of the same name.
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);

    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    bool has_command(const std::string& command) const;
    std::vector<std::string> command_names() const;

    void print_help(std::ostream& out = std::cout) const;

private:
    CommandHandler* find(const std::string& command) const;

    std::vector<std::pair<std::string, std::unique_ptr<CommandHandler>>> commands_;
};

}

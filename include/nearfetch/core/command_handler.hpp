#pragma once

#include <string>
#include <vector>

namespace nearfetch::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& message = "") {
        return CommandResult{true, message, 0};
    }

    static CommandResult error(const std::string& message, int exit_code = 1) {
        return CommandResult{false, message, exit_code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Shares a file from one in-process node and fetches it from another, over
// the loopback transport.
class DemoCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Exchange a file between two in-process nodes"; }
    std::string get_usage() const override { return "nearfetch demo <file>"; }
};

class ConfigCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show the effective configuration"; }
    std::string get_usage() const override { return "nearfetch config"; }
};

}

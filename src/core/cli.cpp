#include "nearfetch/core/cli.hpp"
#include <cstddef>
#include <iomanip>

#ifndef NEARFETCH_VERSION
#define NEARFETCH_VERSION "unknown"
#endif

namespace nearfetch::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option('h', "help", "Show this help message");
    add_option('v', "version", "Show version information");
    add_option('c', "config", "Configuration file", "file", "~/.nearfetch.conf");
    add_option('s', "share-dir", "Base directory for shared and received files", "dir");
    add_option('\0', "verbose", "Log at debug level");
}

void CommandLineParser::add_option(char short_name, const std::string& long_name, const std::string& description,
                                   const std::string& value_name, const std::string& default_value) {
    options_.push_back(Option{short_name, long_name, description, value_name, default_value, std::nullopt});
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

bool CommandLineParser::parse(const std::vector<std::string>& args) {
    positional_args_.clear();
    error_.clear();
    for (auto& option : options_) {
        option.value.reset();
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--") {
            positional_args_.insert(positional_args_.end(), args.begin() + static_cast<std::ptrdiff_t>(i + 1), args.end());
            break;
        }

        bool ok = true;
        if (arg.starts_with("--")) {
            ok = parse_long(args, i);
        } else if (arg.size() > 1 && arg[0] == '-') {
            ok = parse_short(args, i);
        } else {
            positional_args_.push_back(arg);
        }

        if (!ok) {
            return false;
        }
    }

    return true;
}

bool CommandLineParser::parse_long(const std::vector<std::string>& args, size_t& index) {
    const std::string& arg = args[index];
    auto equals = arg.find('=');
    std::string name = arg.substr(2, equals == std::string::npos ? std::string::npos : equals - 2);

    Option* option = find_long(name);
    if (!option) {
        return fail("Unknown option: --" + name);
    }

    if (!option->takes_value()) {
        if (equals != std::string::npos) {
            return fail("Option --" + name + " does not take a value");
        }
        option->value = "true";
        return true;
    }

    if (equals != std::string::npos) {
        option->value = arg.substr(equals + 1);
    } else if (index + 1 < args.size()) {
        option->value = args[++index];
    } else {
        return fail("Option --" + name + " requires <" + option->value_name + ">");
    }
    return true;
}

bool CommandLineParser::parse_short(const std::vector<std::string>& args, size_t& index) {
    const std::string& arg = args[index];

    for (size_t j = 1; j < arg.size(); ++j) {
        Option* option = find_short(arg[j]);
        if (!option) {
            return fail(std::string("Unknown option: -") + arg[j]);
        }

        if (!option->takes_value()) {
            option->value = "true";
            continue;
        }

        // The rest of the cluster, or the next argument, is the value.
        if (j + 1 < arg.size()) {
            option->value = arg.substr(j + 1);
        } else if (index + 1 < args.size()) {
            option->value = args[++index];
        } else {
            return fail(std::string("Option -") + arg[j] + " requires <" + option->value_name + ">");
        }
        return true;
    }
    return true;
}

bool CommandLineParser::fail(const std::string& message) {
    error_ = message;
    return false;
}

CommandLineParser::Option* CommandLineParser::find_long(const std::string& name) {
    for (auto& option : options_) {
        if (option.long_name == name) {
            return &option;
        }
    }
    return nullptr;
}

CommandLineParser::Option* CommandLineParser::find_short(char name) {
    for (auto& option : options_) {
        if (option.short_name != '\0' && option.short_name == name) {
            return &option;
        }
    }
    return nullptr;
}

const CommandLineParser::Option* CommandLineParser::lookup(const std::string& name) const {
    for (const auto& option : options_) {
        if (option.long_name == name ||
            (name.size() == 1 && option.short_name != '\0' && option.short_name == name[0])) {
            return &option;
        }
    }
    return nullptr;
}

bool CommandLineParser::has_option(const std::string& name) const {
    const Option* option = lookup(name);
    return option && option->value.has_value();
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    const Option* option = lookup(name);
    if (!option) {
        return default_value;
    }
    if (option->value) {
        return *option->value;
    }
    return option->default_value.empty() ? default_value : option->default_value;
}

void CommandLineParser::print_help(std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    out << "Options:\n";

    for (const auto& option : options_) {
        std::string flags = option.short_name != '\0' ? std::string("-") + option.short_name + ", " : "    ";
        flags += "--" + option.long_name;
        if (option.takes_value()) {
            flags += " <" + option.value_name + ">";
        }

        out << "  " << std::left << std::setw(28) << flags << option.description;
        if (!option.default_value.empty()) {
            out << " [" << option.default_value << "]";
        }
        out << "\n";
    }
}

void CommandLineParser::print_version(std::ostream& out) const {
    out << program_name_ << " " << NEARFETCH_VERSION << "\n";
}

}

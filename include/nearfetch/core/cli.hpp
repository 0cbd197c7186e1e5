#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace nearfetch::core {

// getopt-style parser: `-v`, `-c file`, `-cfile`, `--config file`,
// `--config=file`. Everything after `--` is positional.
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    // An empty value_name makes the option a flag.
    void add_option(char short_name, const std::string& long_name, const std::string& description,
                    const std::string& value_name = "", const std::string& default_value = "");

    bool parse(int argc, char* argv[]);
    bool parse(const std::vector<std::string>& args);

    // `name` may be the long name or the one-letter short name.
    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help(std::ostream& out = std::cout) const;
    void print_version(std::ostream& out = std::cout) const;

private:
    struct Option {
        char short_name;
        std::string long_name;
        std::string description;
        std::string value_name;
        std::string default_value;
        std::optional<std::string> value;

        bool takes_value() const { return !value_name.empty(); }
    };

    Option* find_long(const std::string& name);
    Option* find_short(char name);
    const Option* lookup(const std::string& name) const;

    bool parse_long(const std::vector<std::string>& args, size_t& index);
    bool parse_short(const std::vector<std::string>& args, size_t& index);
    bool fail(const std::string& message);

    std::string program_name_;
    std::vector<Option> options_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}

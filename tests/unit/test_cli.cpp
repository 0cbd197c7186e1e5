#include <gtest/gtest.h>
#include "nearfetch/core/cli.hpp"
#include "nearfetch/core/command_registry.hpp"
#include <sstream>
#include <stdexcept>

using namespace nearfetch::core;

TEST(CommandLineParserTest, LongAndShortOptions) {
    CommandLineParser parser("nearfetch");
    ASSERT_TRUE(parser.parse({"--verbose", "-c", "/etc/nf.conf", "demo", "--share-dir=/tmp/nf", "photo.jpg"}));

    EXPECT_TRUE(parser.has_option("verbose"));
    EXPECT_EQ(parser.get_option("config"), "/etc/nf.conf");
    EXPECT_EQ(parser.get_option("c"), "/etc/nf.conf");
    EXPECT_EQ(parser.get_option("share-dir"), "/tmp/nf");
    EXPECT_EQ(parser.get_positional_args(), (std::vector<std::string>{"demo", "photo.jpg"}));
}

TEST(CommandLineParserTest, DefaultsAndClusters) {
    CommandLineParser parser("nearfetch");
    ASSERT_TRUE(parser.parse({"-hs/data"}));

    EXPECT_TRUE(parser.has_option("help"));
    EXPECT_EQ(parser.get_option("share-dir"), "/data");
    EXPECT_FALSE(parser.has_option("config"));
    EXPECT_EQ(parser.get_option("config"), "~/.nearfetch.conf");
    EXPECT_EQ(parser.get_option("unknown", "x"), "x");
}

TEST(CommandLineParserTest, DoubleDashEndsOptions) {
    CommandLineParser parser("nearfetch");
    ASSERT_TRUE(parser.parse({"demo", "--", "-weird-name.txt", "--help"}));

    EXPECT_FALSE(parser.has_option("help"));
    EXPECT_EQ(parser.get_positional_args(), (std::vector<std::string>{"demo", "-weird-name.txt", "--help"}));
}

TEST(CommandLineParserTest, Errors) {
    CommandLineParser parser("nearfetch");

    EXPECT_FALSE(parser.parse({"--bogus"}));
    EXPECT_EQ(parser.get_error(), "Unknown option: --bogus");

    EXPECT_FALSE(parser.parse({"-x"}));
    EXPECT_EQ(parser.get_error(), "Unknown option: -x");

    EXPECT_FALSE(parser.parse({"--config"}));
    EXPECT_EQ(parser.get_error(), "Option --config requires <file>");

    EXPECT_FALSE(parser.parse({"--verbose=yes"}));

    // A successful parse starts from a clean slate.
    EXPECT_TRUE(parser.parse({"config"}));
    EXPECT_TRUE(parser.get_error().empty());
    EXPECT_FALSE(parser.has_option("verbose"));
}

TEST(CommandLineParserTest, HelpListsOptionsInOrder) {
    CommandLineParser parser("nearfetch");
    std::ostringstream out;
    parser.print_help(out);

    auto text = out.str();
    EXPECT_NE(text.find("Usage: nearfetch"), std::string::npos);
    EXPECT_NE(text.find("--config <file>"), std::string::npos);
    EXPECT_NE(text.find("[~/.nearfetch.conf]"), std::string::npos);
    EXPECT_LT(text.find("--help"), text.find("--verbose"));
}

namespace {

class EchoHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override {
        return CommandResult::ok(std::to_string(args.size()));
    }
    std::string get_description() const override { return "Echo"; }
    std::string get_usage() const override { return "nearfetch echo"; }
};

class ThrowingHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>&) override {
        throw std::runtime_error("disk on fire");
    }
    std::string get_description() const override { return "Throws"; }
    std::string get_usage() const override { return "nearfetch boom"; }
};

}

TEST(CommandRegistryTest, BuiltInCommands) {
    CommandRegistry registry;
    EXPECT_TRUE(registry.has_command("demo"));
    EXPECT_TRUE(registry.has_command("config"));
    EXPECT_EQ(registry.command_names(), (std::vector<std::string>{"demo", "config"}));
}

TEST(CommandRegistryTest, ExecuteAndReplace) {
    CommandRegistry registry;
    registry.register_command("echo", std::make_unique<EchoHandler>());

    auto result = registry.execute_command("echo", {"echo", "a", "b"});
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "3");

    registry.register_command("demo", std::make_unique<EchoHandler>());
    EXPECT_EQ(registry.command_names().size(), 3u);
    EXPECT_EQ(registry.execute_command("demo", {"demo"}).message, "1");
}

TEST(CommandRegistryTest, FailuresBecomeResults) {
    CommandRegistry registry;
    registry.register_command("boom", std::make_unique<ThrowingHandler>());

    auto thrown = registry.execute_command("boom", {"boom"});
    EXPECT_FALSE(thrown.success);
    EXPECT_EQ(thrown.exit_code, 1);
    EXPECT_NE(thrown.message.find("disk on fire"), std::string::npos);

    auto unknown = registry.execute_command("teleport", {"teleport"});
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ(unknown.message, "Unknown command: teleport");
}

TEST(CommandRegistryTest, DemoNeedsAnExistingFile) {
    CommandRegistry registry;
    EXPECT_FALSE(registry.execute_command("demo", {"demo"}).success);

    auto missing = registry.execute_command("demo", {"demo", "/nonexistent/nearfetch/file.bin"});
    EXPECT_FALSE(missing.success);
    EXPECT_NE(missing.message.find("does not exist"), std::string::npos);
}

TEST(CommandRegistryTest, HelpShowsUsage) {
    CommandRegistry registry;
    std::ostringstream out;
    registry.print_help(out);
    EXPECT_NE(out.str().find("nearfetch demo <file>"), std::string::npos);
}

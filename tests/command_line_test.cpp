//
// Created by garrett on 3/5/25.
//
#include <gtest/gtest.h>
#include "command_line.hpp"

#include <string>
#include <vector>

class CommandLineTest : public ::testing::Test {
protected:
    // getopt permutes argv, so every parse gets its own writable copy
    static CommandLineResult parse(std::vector<std::string> args) {
        args.insert(args.begin(), "mirrorsync");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return parseCommandLine(static_cast<int>(args.size()), argv.data());
    }
};

TEST_F(CommandLineTest, SourceAndDestination) {
    auto result = parse({"src", "dst"});

    ASSERT_EQ(result.action, CommandLineResult::Action::RUN);
    EXPECT_EQ(result.config.source, "src");
    EXPECT_EQ(result.config.destination, "dst");
    EXPECT_FALSE(result.config.simulate);
    EXPECT_FALSE(result.config.verbose);
    EXPECT_EQ(result.config.num_threads, 1);
    EXPECT_EQ(result.config.cache_file, Configuration::DEFAULT_CACHE_FILE);
    EXPECT_EQ(result.config.log_file, Configuration::DEFAULT_LOG_FILE);
}

TEST_F(CommandLineTest, ShortFlags) {
    auto result = parse({"-n", "-v", "-j", "4", "src", "dst"});

    ASSERT_EQ(result.action, CommandLineResult::Action::RUN);
    EXPECT_TRUE(result.config.simulate);
    EXPECT_TRUE(result.config.verbose);
    EXPECT_EQ(result.config.num_threads, 4);
}

TEST_F(CommandLineTest, LongFlags) {
    auto result = parse({"--dry-run", "--verbose", "--jobs=8",
                         "--cache-file", "/tmp/c.json", "--log-file=/tmp/m.log", "src", "dst"});

    ASSERT_EQ(result.action, CommandLineResult::Action::RUN);
    EXPECT_TRUE(result.config.simulate);
    EXPECT_TRUE(result.config.verbose);
    EXPECT_EQ(result.config.num_threads, 8);
    EXPECT_EQ(result.config.cache_file, "/tmp/c.json");
    EXPECT_EQ(result.config.log_file, "/tmp/m.log");
}

TEST_F(CommandLineTest, OptionsAfterPositionals) {
    auto result = parse({"src", "dst", "--dry-run"});

    ASSERT_EQ(result.action, CommandLineResult::Action::RUN);
    EXPECT_TRUE(result.config.simulate);
    EXPECT_EQ(result.config.source, "src");
    EXPECT_EQ(result.config.destination, "dst");
}

TEST_F(CommandLineTest, HelpAndVersion) {
    EXPECT_EQ(parse({"--help"}).action, CommandLineResult::Action::HELP);
    EXPECT_EQ(parse({"-h"}).action, CommandLineResult::Action::HELP);
    EXPECT_EQ(parse({"--version"}).action, CommandLineResult::Action::VERSION);
    EXPECT_EQ(parse({"-V", "src", "dst"}).action, CommandLineResult::Action::VERSION);
}

TEST_F(CommandLineTest, MissingPositionals) {
    auto none = parse({});
    EXPECT_EQ(none.action, CommandLineResult::Action::ERROR);
    EXPECT_EQ(none.message, "SOURCE and DESTINATION are required");

    auto one = parse({"src"});
    EXPECT_EQ(one.action, CommandLineResult::Action::ERROR);
}

TEST_F(CommandLineTest, TooManyPositionals) {
    auto result = parse({"src", "dst", "extra"});

    EXPECT_EQ(result.action, CommandLineResult::Action::ERROR);
    EXPECT_EQ(result.message, "unexpected argument extra");
}

TEST_F(CommandLineTest, InvalidJobs) {
    for (const char* value : {"0", "-2", "abc", "3x"}) {
        auto result = parse({"-j", value, "src", "dst"});
        EXPECT_EQ(result.action, CommandLineResult::Action::ERROR) << value;
        EXPECT_EQ(result.message, std::string("invalid value for --jobs: ") + value);
    }
}

TEST_F(CommandLineTest, MissingOptionArgument) {
    auto result = parse({"src", "dst", "-j"});

    EXPECT_EQ(result.action, CommandLineResult::Action::ERROR);
    EXPECT_EQ(result.message, "missing argument for -j");
}

TEST_F(CommandLineTest, UnknownOption) {
    auto result = parse({"--bogus", "src", "dst"});

    EXPECT_EQ(result.action, CommandLineResult::Action::ERROR);
    EXPECT_NE(result.message.find("unrecognized option"), std::string::npos);
    EXPECT_NE(result.message.find("--bogus"), std::string::npos);
}

TEST_F(CommandLineTest, RepeatedParsesStartFresh) {
    auto first = parse({"-n", "a", "b"});
    auto second = parse({"c", "d"});

    EXPECT_TRUE(first.config.simulate);
    ASSERT_EQ(second.action, CommandLineResult::Action::RUN);
    EXPECT_FALSE(second.config.simulate);
    EXPECT_EQ(second.config.source, "c");
}

TEST_F(CommandLineTest, UsageAndVersionText) {
    std::string usage = usageText("mirrorsync");

    EXPECT_NE(usage.find("Usage: mirrorsync [options] SOURCE DESTINATION"), std::string::npos);
    EXPECT_NE(usage.find("--dry-run"), std::string::npos);
    EXPECT_EQ(versionText(), std::string("mirrorsync ") + MIRRORSYNC_VERSION);
}

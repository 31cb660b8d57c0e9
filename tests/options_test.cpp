#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "ks_options.h"

namespace {

ProgramOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "keysync");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parseArguments(static_cast<int>(argv.size()), argv.data());
}

}

TEST(ProgramOptionsTest, DefaultsWithoutArguments) {
    const auto options = parse({});

    EXPECT_EQ(options.configPath, DEFAULT_CONFIG_PATH);
    EXPECT_FALSE(options.mode.has_value());
    EXPECT_FALSE(options.dryRun);
    EXPECT_EQ(executionModeOf(options, false), ExecutionMode::Normal);
}

TEST(ProgramOptionsTest, ParsesEveryFlag) {
    const auto options = parse({ "-c", "custom.json", "--MODE", "Incremental", "--auto-approve", "-s", "-v" });

    EXPECT_EQ(options.configPath, "custom.json");
    ASSERT_TRUE(options.mode.has_value());
    EXPECT_EQ(*options.mode, RunMode::Incremental);
    EXPECT_TRUE(options.autoApprove);
    EXPECT_TRUE(options.silentMode);
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(executionModeOf(options, false), ExecutionMode::AutoApprove);
}

TEST(ProgramOptionsTest, DryRunWinsOverAutoApprove) {
    const auto options = parse({ "--dry-run", "--auto-approve" });

    EXPECT_EQ(executionModeOf(options, true), ExecutionMode::DryRun);
}

TEST(ProgramOptionsTest, ConfiguredAutoApproveApplies) {
    EXPECT_EQ(executionModeOf(parse({}), true), ExecutionMode::AutoApprove);
}

TEST(ProgramOptionsTest, RejectsUnusableArguments) {
    EXPECT_THROW(parse({ "--mode", "sometimes" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--config" }), std::invalid_argument);
    EXPECT_THROW(parse({ "input.csv" }), std::invalid_argument);
}

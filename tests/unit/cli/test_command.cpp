//
// Created by gregorian-rayne on 10/19/26.
//

#include <gtest/gtest.h>
#include "dsv/cli/commands/command.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace dsv;
using namespace dsv::cli;

namespace {

    class InspectCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "inspect"; }
        [[nodiscard]] std::string_view description() const noexcept override { return "Inspect a project"; }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"ignore", 'i', "Glob to skip", false, true, "", "GLOB", true},
                {"jobs", 'j', "Worker threads", false, true, "", "N"},
                {"root", 0, "Project root", true, true, "", "DIR"},
            };
        }

        [[nodiscard]] int execute(const ParsedArgs&) override { return 0; }
    };

    class CommandTest : public ::testing::Test {
    protected:
        static void SetUpTestSuite() {
            if (!CommandRegistry::instance().find("inspect")) {
                CommandRegistry::instance().register_command(std::make_unique<InspectCommand>());
            }
        }

        InspectCommand inspect;
    };

}  // namespace

TEST_F(CommandTest, EmptyFirstArgumentFallsBack) {
    std::vector<std::string> args = {"", "inspect"};
    EXPECT_EQ(take_command_name(args, "scan"), "scan");
    EXPECT_EQ(args.size(), 2u);
}

TEST_F(CommandTest, OptionsAndPathsFallBack) {
    std::vector<std::string> option = {"--json"};
    EXPECT_EQ(take_command_name(option, "scan"), "scan");
    EXPECT_EQ(option.size(), 1u);

    std::vector<std::string> path = {"./packages/web"};
    EXPECT_EQ(take_command_name(path, "scan"), "scan");
    EXPECT_EQ(path.front(), "./packages/web");

    std::vector<std::string> none;
    EXPECT_EQ(take_command_name(none, "scan"), "scan");
}

TEST_F(CommandTest, RegisteredCommandIsRemoved) {
    std::vector<std::string> args = {"inspect", "--json"};
    EXPECT_EQ(take_command_name(args, "scan"), "inspect");
    EXPECT_EQ(args, (std::vector<std::string>{"--json"}));
}

TEST_F(CommandTest, ParsesLongShortAndBundledOptions) {
    const auto parsed = parse_arguments({"--root=.", "-vj", "4", "-i", "dist/**", "--ignore", "a,b", "src"},
                                        inspect.arguments());
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().to_string();

    const auto& args = parsed.value();
    EXPECT_EQ(args.get("root").value_or(""), ".");
    EXPECT_TRUE(args.get_flag("verbose"));
    EXPECT_EQ(args.get_all("ignore"), (std::vector<std::string>{"dist/**", "a", "b"}));
    EXPECT_EQ(args.positional(), (std::vector<std::string>{"src"}));

    const auto jobs = args.get_count("jobs");
    ASSERT_TRUE(jobs.is_ok());
    EXPECT_EQ(jobs.value().value_or(0), 4u);
}

TEST_F(CommandTest, EmptyArgumentsAreSkipped) {
    const auto parsed = parse_arguments({"", "--root", ".", ""}, inspect.arguments());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value().positional().empty());
}

TEST_F(CommandTest, RejectsUnknownAndIncompleteOptions) {
    const auto unknown = parse_arguments({"--colour"}, inspect.arguments());
    ASSERT_TRUE(unknown.is_err());
    EXPECT_EQ(unknown.error().code(), ErrorCode::InvalidArgument);

    EXPECT_TRUE(parse_arguments({"--jobs"}, inspect.arguments()).is_err());
    EXPECT_TRUE(parse_arguments({"--json=yes"}, inspect.arguments()).is_err());
}

TEST_F(CommandTest, CountMustBeWholeNumber) {
    const auto parsed = parse_arguments({"--jobs", "four"}, inspect.arguments());
    ASSERT_TRUE(parsed.is_ok());
    const auto jobs = parsed.value().get_count("jobs");
    ASSERT_TRUE(jobs.is_err());
    EXPECT_EQ(jobs.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(CommandTest, ValidateReportsMissingRequired) {
    const auto parsed = parse_arguments({}, inspect.arguments());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(inspect.validate(parsed.value()), "Missing required argument: --root");
}

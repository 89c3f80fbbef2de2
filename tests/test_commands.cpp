#include <gtest/gtest.h>
#include <termcalc/calculator.hpp>
#include <termcalc/commands.hpp>
#include <termcalc/serialization.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace {

using termcalc::Command;
using termcalc::CommandError;
using termcalc::CommandType;
using termcalc::Radix;
using termcalc::Session;

TEST(Commands, Recognized) {
    auto exit = termcalc::parse_command("exit");
    ASSERT_TRUE(exit.has_value());
    EXPECT_EQ(exit->type, CommandType::Exit);

    auto save = termcalc::parse_command("  save   my.json ");
    ASSERT_TRUE(save.has_value());
    EXPECT_EQ(save->type, CommandType::Save);
    EXPECT_EQ(save->args, (std::vector<std::string>{"my.json"}));

    auto fmt = termcalc::parse_command("format hex 4");
    ASSERT_TRUE(fmt.has_value());
    EXPECT_EQ(fmt->type, CommandType::Format);
    EXPECT_EQ(fmt->args.size(), 2u);

    EXPECT_TRUE(termcalc::parse_command("load").has_value());
    EXPECT_TRUE(termcalc::parse_command("info").has_value());
}

TEST(Commands, CalculatorInputIsNotACommand) {
    EXPECT_FALSE(termcalc::parse_command("1+2").has_value());
    EXPECT_FALSE(termcalc::parse_command("info = 5").has_value());
    EXPECT_FALSE(termcalc::parse_command("save (2)").has_value());
    EXPECT_FALSE(termcalc::parse_command("info(2)").has_value());
    EXPECT_FALSE(termcalc::parse_command("exits").has_value());
    EXPECT_FALSE(termcalc::parse_command("   ").has_value());
}

TEST(Commands, BadArguments) {
    EXPECT_THROW(termcalc::parse_command("exit now"), CommandError);
    EXPECT_THROW(termcalc::parse_command("format"), CommandError);
    EXPECT_THROW(termcalc::parse_command("format roman"), CommandError);
    EXPECT_THROW(termcalc::parse_command("format dec 0"), CommandError);
    EXPECT_THROW(termcalc::parse_command("format dec x"), CommandError);
    EXPECT_THROW(termcalc::parse_command("remove"), CommandError);
    EXPECT_THROW(termcalc::parse_command("save a b"), CommandError);
}

TEST(Commands, FormatChangesSettings) {
    Session s;
    EXPECT_EQ(termcalc::run_command(*termcalc::parse_command("format bin 6"), s), "");
    EXPECT_EQ(s.settings.format.radix, Radix::Binary);
    EXPECT_EQ(s.settings.format.precision, 6);

    termcalc::run_command(*termcalc::parse_command("format dec"), s);
    EXPECT_EQ(s.settings.format.radix, Radix::Decimal);
    EXPECT_EQ(s.settings.format.precision, 6);
}

TEST(Commands, InfoAndRemove) {
    Session s;
    EXPECT_EQ(termcalc::run_command(Command{CommandType::Info, {}}, s), "No user defined constants or functions.");

    termcalc::evaluate_input("c = 2", s.context);
    termcalc::evaluate_input("f(x) = x^2", s.context);
    EXPECT_EQ(termcalc::run_command(Command{CommandType::Info, {}}, s), "c = 2\nf(x) = x^2");

    termcalc::run_command(Command{CommandType::Remove, {"f"}}, s);
    EXPECT_FALSE(s.context.is_user_function("f"));
    termcalc::run_command(Command{CommandType::Remove, {"c"}}, s);
    EXPECT_FALSE(s.context.is_user_constant("c"));
    EXPECT_THROW(termcalc::run_command(Command{CommandType::Remove, {"c"}}, s), CommandError);
}

TEST(Commands, ExitEndsSession) {
    Session s;
    termcalc::run_command(Command{CommandType::Exit, {}}, s);
    EXPECT_TRUE(s.done);
}

TEST(Commands, SaveAndLoadUseContextPath) {
    Session s;
    s.settings.context_path = ::testing::TempDir() + "termcalc_commands_test.json";
    termcalc::evaluate_input("k = 42", s.context);
    termcalc::run_command(Command{CommandType::Save, {}}, s);

    Session t;
    t.settings.context_path = s.settings.context_path;
    termcalc::run_command(Command{CommandType::Load, {}}, t);
    EXPECT_DOUBLE_EQ(t.context.constant_value("k")->re(), 42.0);

    std::remove(s.settings.context_path.c_str());
    EXPECT_THROW(termcalc::run_command(Command{CommandType::Load, {}}, t), termcalc::SerializationError);
}

TEST(Settings, CommandLine) {
    const char* argv[] = {"termcalc", "--format", "hex", "--precision", "4", "1+1", "-2", "--context", "c.json"};
    std::vector<std::string> inputs;
    auto s = termcalc::parse_arguments(9, argv, inputs);

    EXPECT_EQ(s.format.radix, Radix::Hex);
    EXPECT_EQ(s.format.precision, 4);
    EXPECT_EQ(s.context_path, "c.json");
    EXPECT_EQ(s.log_level, spdlog::level::warn);
    EXPECT_EQ(inputs, (std::vector<std::string>{"1+1", "-2"}));
}

TEST(Settings, BadCommandLine) {
    std::vector<std::string> inputs;
    const char* unknown[] = {"termcalc", "--colour"};
    EXPECT_THROW(termcalc::parse_arguments(2, unknown, inputs), termcalc::ConfigError);
    const char* missing[] = {"termcalc", "--precision"};
    EXPECT_THROW(termcalc::parse_arguments(2, missing, inputs), termcalc::ConfigError);
    const char* bad[] = {"termcalc", "--format", "roman"};
    EXPECT_THROW(termcalc::parse_arguments(3, bad, inputs), termcalc::ConfigError);

    const char* verbose[] = {"termcalc", "--verbose"};
    EXPECT_EQ(termcalc::parse_arguments(2, verbose, inputs).log_level, spdlog::level::debug);
}

} // namespace

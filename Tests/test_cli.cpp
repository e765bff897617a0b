#include <gtest/gtest.h>

#include "app_cli.hpp"
#include "app_test_helpers.hpp"

using CLI_STATUS = Cli_Parser::CLI_STATUS;

//owns the strings so the argv pointers stay valid for the whole test
class Argv {
public:
	Argv(std::vector<std::string> _words): words(std::move(_words)) {
		words.insert(words.begin(), "pinflash");
		for(auto& word : words) pointers.push_back(word.data());
	}
	std::span<char* const> span() const { return {pointers.data(), pointers.size()}; }

private:
	std::vector<std::string> words;
	std::vector<char*> pointers;
};

static CLI_STATUS parse(std::vector<std::string> words, Cli_Args& args) {
	Argv argv(std::move(words));
	return Cli_Parser::parse(argv.span(), args);
}

TEST(CliParser, NoArgumentsIsValid) {
	Cli_Args args;
	ASSERT_EQ(parse({}, args), CLI_STATUS::CLI_OK);
	EXPECT_FALSE(args.config_path);
	EXPECT_FALSE(args.boot_pin);
	EXPECT_FALSE(args.reboot);
	EXPECT_TRUE(args.recipe_words.empty());
}

TEST(CliParser, ParsesOptionsBeforeRecipe) {
	Temp_Dir scratch;
	auto config = scratch.write_file("pinflash.json", "{}");

	Cli_Args args;
	ASSERT_EQ(parse({"-c", config.string(), "--chip", "/dev/gpiochip1", "--boot-pin", "4", "--reset-pin=17", "-q", "monitor"}, args),
				CLI_STATUS::CLI_OK);
	EXPECT_EQ(args.config_path, config.string());
	EXPECT_EQ(args.chip, "/dev/gpiochip1");
	EXPECT_EQ(args.boot_pin, 4u);
	EXPECT_EQ(args.reset_pin, 17u);
	EXPECT_TRUE(args.quiet);
	EXPECT_EQ(args.recipe_words, (std::vector<std::string>{"monitor"}));
}

TEST(CliParser, ToolOptionsPassThroughUnchanged) {
	Cli_Args args;
	ASSERT_EQ(parse({"--boot-pin", "4", "esptool.py", "--port", "/dev/ttyUSB0", "-q", "--help"}, args), CLI_STATUS::CLI_OK);
	EXPECT_FALSE(args.quiet);
	EXPECT_FALSE(args.show_help);
	EXPECT_EQ(args.recipe_words, (std::vector<std::string>{"esptool.py", "--port", "/dev/ttyUSB0", "-q", "--help"}));
}

TEST(CliParser, DoubleDashEndsOptions) {
	Cli_Args args;
	ASSERT_EQ(parse({"--boot-pin", "4", "--", "--weird-tool", "-x"}, args), CLI_STATUS::CLI_OK);
	EXPECT_EQ(args.recipe_words, (std::vector<std::string>{"--weird-tool", "-x"}));
}

TEST(CliParser, SingleDashIsARecipeWord) {
	Cli_Args args;
	ASSERT_EQ(parse({"-"}, args), CLI_STATUS::CLI_OK);
	EXPECT_EQ(args.recipe_words, (std::vector<std::string>{"-"}));
}

TEST(CliParser, RebootDelayOnlyTakenInline) {
	Cli_Args args;
	ASSERT_EQ(parse({"--reset=500", "monitor"}, args), CLI_STATUS::CLI_OK);
	EXPECT_TRUE(args.reboot);
	EXPECT_EQ(args.reboot_delay_ms, 500u);

	ASSERT_EQ(parse({"-r", "1000"}, args), CLI_STATUS::CLI_OK);
	EXPECT_TRUE(args.reboot);
	EXPECT_FALSE(args.reboot_delay_ms);
	EXPECT_EQ(args.recipe_words, (std::vector<std::string>{"1000"}));
}

TEST(CliParser, HelpAndVersionFlags) {
	Cli_Args args;
	ASSERT_EQ(parse({"-h"}, args), CLI_STATUS::CLI_OK);
	EXPECT_TRUE(args.show_help);
	ASSERT_EQ(parse({"--version"}, args), CLI_STATUS::CLI_OK);
	EXPECT_TRUE(args.show_version);
}

TEST(CliParser, UnknownOptionIsUsageError) {
	Debug_Capture capture;
	Cli_Args args;
	EXPECT_EQ(parse({"--flash"}, args), CLI_STATUS::CLI_USAGE_ERROR);
	ASSERT_EQ(capture.errors.size(), 1u);
	EXPECT_NE(capture.errors[0].find("unknown option --flash"), std::string::npos);
}

TEST(CliParser, MissingValueIsUsageError) {
	Debug_Capture capture;
	Cli_Args args;
	EXPECT_EQ(parse({"--boot-pin"}, args), CLI_STATUS::CLI_USAGE_ERROR);
	ASSERT_EQ(capture.errors.size(), 1u);
	EXPECT_NE(capture.errors[0].find("requires a value"), std::string::npos);
}

TEST(CliParser, BadNumbersAreUsageErrors) {
	Debug_Capture capture;
	Cli_Args args;
	EXPECT_EQ(parse({"--boot-pin", "four"}, args), CLI_STATUS::CLI_USAGE_ERROR);
	EXPECT_EQ(parse({"--reset-pin=-3"}, args), CLI_STATUS::CLI_USAGE_ERROR);
	EXPECT_EQ(parse({"--boot-pin", "4x"}, args), CLI_STATUS::CLI_USAGE_ERROR);
	EXPECT_EQ(parse({"--reset=soon"}, args), CLI_STATUS::CLI_USAGE_ERROR);
}

TEST(CliParser, ConfigMustBeAnExistingFile) {
	Debug_Capture capture;
	Temp_Dir scratch;
	Cli_Args args;
	EXPECT_EQ(parse({"--config", scratch.path("absent.json").string()}, args), CLI_STATUS::CLI_USAGE_ERROR);
	EXPECT_EQ(parse({"--config", scratch.path("").string()}, args), CLI_STATUS::CLI_USAGE_ERROR);
}

TEST(CliParser, FailedParseLeavesArgsUntouched) {
	Debug_Capture capture;
	Cli_Args args;
	ASSERT_EQ(parse({"--boot-pin", "4"}, args), CLI_STATUS::CLI_OK);
	EXPECT_EQ(parse({"--boot-pin", "5", "--bogus"}, args), CLI_STATUS::CLI_USAGE_ERROR);
	EXPECT_EQ(args.boot_pin, 4u);
}

TEST(CliParser, UsageNamesTheProgram) {
	std::string text = Cli_Parser::usage("pinflash");
	EXPECT_EQ(text.rfind("usage: pinflash", 0), 0u);
	EXPECT_NE(text.find("--boot-pin"), std::string::npos);
}

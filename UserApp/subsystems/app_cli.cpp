/*
 * app_cli.cpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 */

#include "app_cli.hpp"
#include "app_debug_if.hpp"

#include <charconv>
#include <filesystem>

static bool parse_uint(const std::string& text, uint32_t& dest) {
	if(text.empty()) return false;
	const char* end = text.data() + text.size();
	auto result = std::from_chars(text.data(), end, dest);
	return result.ec == std::errc() && result.ptr == end;
}

//splits `--name=value` into its two halves; `value` stays empty without an `=`
static void split_long_option(const std::string& word, std::string& name, std::optional<std::string>& value) {
	size_t equals = word.find('=');
	if(equals == std::string::npos) {
		name = word;
		value.reset();
	}
	else {
		name = word.substr(0, equals);
		value = word.substr(equals + 1);
	}
}

Cli_Parser::CLI_STATUS Cli_Parser::parse(std::span<char* const> argv, Cli_Args& args) {
	Cli_Args parsed;
	size_t index = 1;

	//grabs the value for an option that requires one, either inline (`--x=1`) or the next word
	auto take_value = [&](const std::string& name, std::optional<std::string>& inline_value, std::string& dest) -> bool {
		if(inline_value) {
			dest = *inline_value;
			return true;
		}
		if(index + 1 >= argv.size()) {
			Debug::ERROR("option " + name + " requires a value");
			return false;
		}
		dest = argv[++index];
		return true;
	};

	auto take_uint = [&](const std::string& name, std::optional<std::string>& inline_value, std::optional<uint32_t>& dest) -> bool {
		std::string text;
		if(!take_value(name, inline_value, text)) return false;
		uint32_t number;
		if(!parse_uint(text, number)) {
			Debug::ERROR("option " + name + " expects a non-negative integer, got \"" + text + "\"");
			return false;
		}
		dest = number;
		return true;
	};

	for(; index < argv.size(); index++) {
		std::string word = argv[index];

		//explicit end of options
		if(word == "--") {
			index++;
			break;
		}

		//first non-option word starts the recipe
		if(word.size() < 2 || word[0] != '-') break;

		std::string name;
		std::optional<std::string> inline_value;
		split_long_option(word, name, inline_value);

		if(name == "-h" || name == "--help") parsed.show_help = true;
		else if(name == "-V" || name == "--version") parsed.show_version = true;
		else if(name == "-q" || name == "--quiet") parsed.quiet = true;
		else if(name == "-c" || name == "--config") {
			std::string path;
			if(!take_value(name, inline_value, path)) return CLI_STATUS::CLI_USAGE_ERROR;
			std::error_code ec;
			if(!std::filesystem::is_regular_file(path, ec)) {
				Debug::ERROR("option " + name + ": not a valid file: " + path);
				return CLI_STATUS::CLI_USAGE_ERROR;
			}
			parsed.config_path = path;
		}
		else if(name == "--chip") {
			std::string path;
			if(!take_value(name, inline_value, path)) return CLI_STATUS::CLI_USAGE_ERROR;
			parsed.chip = path;
		}
		else if(name == "--boot-pin") {
			if(!take_uint(name, inline_value, parsed.boot_pin)) return CLI_STATUS::CLI_USAGE_ERROR;
		}
		else if(name == "--reset-pin") {
			if(!take_uint(name, inline_value, parsed.reset_pin)) return CLI_STATUS::CLI_USAGE_ERROR;
		}
		else if(name == "-r" || name == "--reset") {
			//delay is only taken inline so a following recipe word is never mistaken for it
			parsed.reboot = true;
			if(inline_value) {
				uint32_t delay;
				if(!parse_uint(*inline_value, delay)) {
					Debug::ERROR("option " + name + " expects a delay in milliseconds, got \"" + *inline_value + "\"");
					return CLI_STATUS::CLI_USAGE_ERROR;
				}
				parsed.reboot_delay_ms = delay;
			}
		}
		else {
			Debug::ERROR("unknown option " + name);
			return CLI_STATUS::CLI_USAGE_ERROR;
		}
	}

	//everything left is passed through verbatim
	for(; index < argv.size(); index++) parsed.recipe_words.emplace_back(argv[index]);

	args = parsed;
	return CLI_STATUS::CLI_OK;
}

std::string Cli_Parser::usage(const std::string& program_name) {
	return	"usage: " + program_name + " [OPTIONS] [--] [RECIPE | COMMAND [ARGS...]]\n"
			"\n"
			"Holds the target's boot-select line low, pulses reset, runs the flashing tool,\n"
			"then releases the line and resets the target into its application.\n"
			"\n"
			"  -c, --config FILE     JSON configuration file\n"
			"      --chip PATH       gpiochip device for both lines (default /dev/gpiochip0)\n"
			"      --boot-pin N      boot-select line offset\n"
			"      --reset-pin N     reset line offset\n"
			"  -r, --reset[=MS]      release boot and reset the target MS ms after the tool starts\n"
			"  -q, --quiet           only print warnings and errors\n"
			"  -h, --help            print this message\n"
			"  -V, --version         print the version\n"
			"\n"
			"With no RECIPE the configured default recipe runs. A single word naming a\n"
			"configured recipe runs that recipe; otherwise the words are run as a command.\n";
}

/*
 * app_cli.hpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 *
 *  Command line handling
 *  	\--> options come first; parsing stops at the first word that isn't an option (or at `--`)
 *  	\--> that word and everything after it go to the flashing tool untouched
 */

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

struct Cli_Args {
	std::optional<std::string> config_path;
	std::optional<std::string> chip;
	std::optional<uint32_t> boot_pin;
	std::optional<uint32_t> reset_pin;

	//mid-run reboot requested; the delay is optional (falls back to the configured one)
	bool reboot = false;
	std::optional<uint32_t> reboot_delay_ms;

	bool quiet = false;
	bool show_help = false;
	bool show_version = false;

	//recipe name, or command followed by its arguments
	std::vector<std::string> recipe_words;
};

class Cli_Parser {
public:
	enum class CLI_STATUS {
		CLI_OK,
		CLI_USAGE_ERROR
	};

	//`argv` includes the program name at index 0
	static CLI_STATUS parse(std::span<char* const> argv, Cli_Args& args);

	static std::string usage(const std::string& program_name);

private:
	Cli_Parser(); //don't allow instantiation
};

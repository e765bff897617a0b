/*
 * app_main.cpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 */

#include "app_main.hpp"

#include <iostream>

//=========== HAL INCLUDES ===========
#include "app_hal_gpio.hpp"
#include "app_hal_open_drain.hpp"
#include "app_hal_pin_mapping.hpp"

//========== SYSTEM/UTILITY INCLUDES =========
#include "app_debug_console.hpp"
#include "app_cli.hpp"
#include "app_config.hpp"
#include "app_reset_sequencer.hpp"

//function prototypes
static int run_sequence(const Configuration& config, const Recipe& recipe, const Cli_Args& args);
static void apply_overrides(const Cli_Args& args, Configuration& config);

int app_main(std::span<char* const> argv) {
	//route debug output to the terminal for the lifetime of the program
	Debug_Console console(std::cout, std::cerr);
	Debug::attach(&console);

	std::string program_name = argv.empty() ? "pinflash" : argv[0];

	auto finish = [](int code) {
		Debug::attach(nullptr);
		return code;
	};

	//###### COMMAND LINE ######
	Cli_Args args;
	if(Cli_Parser::parse(argv, args) != Cli_Parser::CLI_STATUS::CLI_OK) {
		std::cerr << Cli_Parser::usage(program_name);
		return finish(EXIT_USAGE_ERROR);
	}

	if(args.show_help) {
		std::cout << Cli_Parser::usage(program_name);
		return finish(0);
	}

	if(args.show_version) {
		std::cout << "pinflash " << PINFLASH_VERSION << std::endl;
		return finish(0);
	}

	console.set_quiet(args.quiet);

	//###### CONFIGURATION ######
	Configuration config;
	if(args.config_path && Config_Parser::load(*args.config_path, config) != Config_Parser::CONFIG_STATUS::CONFIG_OK)
		return finish(EXIT_CONFIG_ERROR);

	apply_overrides(args, config);

	if(!config.boot) {
		Debug::ERROR("No boot mode pin configured (use --config or --boot-pin)");
		return finish(EXIT_USAGE_ERROR);
	}

	Recipe recipe;
	if(!config.select_recipe(args.recipe_words, recipe)) {
		Debug::ERROR("No recipe given and no default recipe configured");
		return finish(EXIT_USAGE_ERROR);
	}

	return finish(run_sequence(config, recipe, args));
}

//================= HARDWARE SETUP AND SEQUENCE ===================

static int run_sequence(const Configuration& config, const Recipe& recipe, const Cli_Args& args) {
	//lines have to outlive the pins wrapping them, declare them first
	GPIO boot_line(Pin_Mapping::boot_line(config.chip_for(*config.boot), config.boot->pin));
	Open_Drain_Pin boot_pin(boot_line, config.boot->state);

	std::optional<GPIO> reset_line;
	std::optional<Open_Drain_Pin> reset_pin;
	if(config.reset) {
		reset_line.emplace(Pin_Mapping::reset_line(config.chip_for(*config.reset), config.reset->pin));
		reset_pin.emplace(*reset_line, config.reset->state);
	}

	std::optional<uint32_t> reboot_after_ms;
	if(args.reboot) reboot_after_ms = args.reboot_delay_ms.value_or(config.timing.reboot_delay_ms);

	Reset_Sequencer sequencer(boot_pin, reset_pin ? &*reset_pin : nullptr, config.timing);
	return sequencer.run(recipe, reboot_after_ms).exit_code;
}

//command line options win over the configuration file
static void apply_overrides(const Cli_Args& args, Configuration& config) {
	if(args.chip) {
		config.chip = *args.chip;
		if(config.boot) config.boot->chip.reset();
		if(config.reset) config.reset->chip.reset();
	}

	if(args.boot_pin) {
		if(config.boot) config.boot->pin = *args.boot_pin;
		else config.boot = Pin_Config{*args.boot_pin, std::nullopt, {}};
	}

	if(args.reset_pin) {
		if(config.reset) config.reset->pin = *args.reset_pin;
		else config.reset = Pin_Config{*args.reset_pin, std::nullopt, {}};
	}
}

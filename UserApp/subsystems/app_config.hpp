/*
 * app_config.hpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 *
 *  Configuration for a flashing setup, loaded from a JSON file
 *  	\--> which lines the boot-select and reset pins are wired to, and how to leave them afterwards
 *  	\--> sequence timing
 *  	\--> named recipes plus a default one
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "app_hal_open_drain.hpp"
#include "app_hal_pin_mapping.hpp"
#include "app_recipe.hpp"

//================================ CONFIGURATION STRUCTURES ================================

struct Pin_Config {
	uint32_t pin;
	std::optional<std::string> chip;	//falls back to the global chip
	Open_Drain_Pin::Drop_State state;
};

struct Sequence_Timing {
	uint32_t boot_hold_ms = 20;				//after asserting/releasing the boot line
	uint32_t reset_pulse_ms = 100;			//how long reset is held low
	uint32_t bootloader_settle_ms = 100;	//after reset is released, before the tool starts
	uint32_t reboot_delay_ms = 2000;		//default delay for a mid-run reboot
};

struct Configuration {
	std::string chip = Pin_Mapping::DEFAULT_CHIP_PATH;
	std::optional<Pin_Config> boot;
	std::optional<Pin_Config> reset;
	Sequence_Timing timing;
	std::string default_recipe;
	std::map<std::string, Recipe> recipes;

	//chip for a specific pin, with the global fallback applied
	std::string chip_for(const Pin_Config& pin_config) const { return pin_config.chip.value_or(chip); }

	/*
	 * Pick the recipe to run from the command-line words
	 * 	\--> no words: the default recipe
	 * 	\--> one word naming a recipe: that recipe
	 * 	\--> anything else: the words are the command and its arguments
	 * Returns false if no words were given and there's no default recipe
	 */
	bool select_recipe(const std::vector<std::string>& words, Recipe& selected) const;
};

//================================ PARSER ================================

class Config_Parser {
public:
	enum class CONFIG_STATUS {
		CONFIG_OK,
		CONFIG_FILE_ERROR,		//couldn't read the file
		CONFIG_PARSE_ERROR,		//not valid JSON
		CONFIG_INVALID			//valid JSON, but not a valid configuration
	};

	//read and parse a configuration file
	static CONFIG_STATUS load(const std::string& path, Configuration& config);

	//parse configuration text; `config` is only updated on success
	static CONFIG_STATUS parse(const std::string& text, Configuration& config);

private:
	Config_Parser(); //don't allow instantiation
};

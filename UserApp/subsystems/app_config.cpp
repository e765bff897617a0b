/*
 * app_config.cpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 */

#include "app_config.hpp"
#include "app_debug_if.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <ArduinoJson.h>

//========================================= RECIPE SELECTION ==========================================

bool Configuration::select_recipe(const std::vector<std::string>& words, Recipe& selected) const {
	if(words.empty()) {
		auto found = recipes.find(default_recipe);
		if(default_recipe.empty() || found == recipes.end()) return false;
		selected = found->second;
		return true;
	}

	if(words.size() == 1) {
		auto found = recipes.find(words.front());
		if(found != recipes.end()) {
			selected = found->second;
			return true;
		}
	}

	//not a recipe name--run the words directly
	selected = Recipe::from_words(words);
	return true;
}

//========================================= FIELD HELPERS ==========================================
//each helper leaves the destination alone if the key is absent
//and returns false (after logging) if the key is there but has the wrong shape

static bool read_uint(JsonVariantConst value, const std::string& key, uint32_t& dest) {
	if(value.isNull()) return true;
	if(!value.is<uint32_t>()) {
		Debug::ERROR("config: \"" + key + "\" must be a non-negative integer");
		return false;
	}
	dest = value.as<uint32_t>();
	return true;
}

static bool read_string(JsonVariantConst value, const std::string& key, std::string& dest) {
	if(value.isNull()) return true;
	if(!value.is<const char*>()) {
		Debug::ERROR("config: \"" + key + "\" must be a string");
		return false;
	}
	dest = value.as<std::string>();
	return true;
}

//levels are spelled the same for `level` and `pull`: "Low" or "High"
static bool read_level(JsonVariantConst value, const std::string& key, std::optional<GPIO_Interface::Level>& dest) {
	if(value.isNull()) return true;
	std::string text;
	if(!read_string(value, key, text)) return false;
	if(text == "Low") dest = GPIO_Interface::Level::LOW;
	else if(text == "High") dest = GPIO_Interface::Level::HIGH;
	else {
		Debug::ERROR("config: \"" + key + "\" must be \"Low\" or \"High\", got \"" + text + "\"");
		return false;
	}
	return true;
}

static bool read_mode(JsonVariantConst value, const std::string& key, std::optional<GPIO_Interface::Mode>& dest) {
	if(value.isNull()) return true;
	std::string text;
	if(!read_string(value, key, text)) return false;
	if(text == "Input") dest = GPIO_Interface::Mode::INPUT;
	else if(text == "Output") dest = GPIO_Interface::Mode::OUTPUT;
	else if(text.rfind("Alt", 0) == 0) {
		//alternate functions are SoC-specific and can't be selected through the gpiochip device
		Debug::ERROR("config: \"" + key + "\": alternate function " + text + " is not supported");
		return false;
	}
	else {
		Debug::ERROR("config: \"" + key + "\" must be \"Input\" or \"Output\", got \"" + text + "\"");
		return false;
	}
	return true;
}

static bool read_pin(JsonVariantConst value, const std::string& key, std::optional<Pin_Config>& dest) {
	if(value.isNull()) return true;
	if(!value.is<JsonObjectConst>()) {
		Debug::ERROR("config: \"" + key + "\" must be an object");
		return false;
	}

	JsonVariantConst pin_value = value["pin"];
	if(pin_value.isNull()) {
		Debug::ERROR("config: \"" + key + ".pin\" is missing");
		return false;
	}

	Pin_Config pin_config = {};
	if(!read_uint(pin_value, key + ".pin", pin_config.pin)) return false;

	std::string chip;
	if(!read_string(value["chip"], key + ".chip", chip)) return false;
	if(!chip.empty()) pin_config.chip = chip;

	JsonVariantConst state = value["state"];
	if(!state.isNull()) {
		if(!state.is<JsonObjectConst>()) {
			Debug::ERROR("config: \"" + key + ".state\" must be an object");
			return false;
		}

		std::optional<GPIO_Interface::Level> pull_level;
		if(!read_mode(state["mode"], key + ".state.mode", pin_config.state.mode)) return false;
		if(!read_level(state["level"], key + ".state.level", pin_config.state.level)) return false;
		if(!read_level(state["pull"], key + ".state.pull", pull_level)) return false;

		//pull is given as the level the resistor pulls towards
		if(pull_level) pin_config.state.pull = (*pull_level == GPIO_Interface::Level::HIGH) ?
													GPIO_Interface::Pull::PULL_UP : GPIO_Interface::Pull::PULL_DOWN;
	}

	dest = pin_config;
	return true;
}

static bool read_recipe(JsonVariantConst value, const std::string& key, Recipe& dest) {
	if(!value.is<JsonObjectConst>()) {
		Debug::ERROR("config: \"" + key + "\" must be an object");
		return false;
	}

	Recipe recipe;
	if(!read_string(value["command"], key + ".command", recipe.command)) return false;
	if(recipe.command.empty()) {
		Debug::ERROR("config: \"" + key + ".command\" is missing");
		return false;
	}

	JsonVariantConst arguments = value["arguments"];
	if(!arguments.isNull()) {
		if(!arguments.is<JsonArrayConst>()) {
			Debug::ERROR("config: \"" + key + ".arguments\" must be an array of strings");
			return false;
		}
		for(JsonVariantConst arg : arguments.as<JsonArrayConst>()) {
			if(!arg.is<const char*>()) {
				Debug::ERROR("config: \"" + key + ".arguments\" must be an array of strings");
				return false;
			}
			recipe.arguments.push_back(arg.as<std::string>());
		}
	}

	dest = recipe;
	return true;
}

//========================================= PARSER ==========================================

Config_Parser::CONFIG_STATUS Config_Parser::load(const std::string& path, Configuration& config) {
	std::ifstream file(path);
	if(!file) {
		Debug::ERROR("config: cannot read " + path);
		return CONFIG_STATUS::CONFIG_FILE_ERROR;
	}

	std::stringstream contents;
	contents << file.rdbuf();
	return parse(contents.str(), config);
}

Config_Parser::CONFIG_STATUS Config_Parser::parse(const std::string& text, Configuration& config) {
	//size the document generously relative to the input; config files are tiny
	DynamicJsonDocument doc(std::max<size_t>(16384, text.size() * 4));
	DeserializationError error = deserializeJson(doc, text);
	if(error) {
		Debug::ERROR(std::string("config: JSON parsing failed: ") + error.c_str());
		return CONFIG_STATUS::CONFIG_PARSE_ERROR;
	}

	if(!doc.is<JsonObject>()) {
		Debug::ERROR("config: top level must be an object");
		return CONFIG_STATUS::CONFIG_INVALID;
	}
	JsonObjectConst root = doc.as<JsonObjectConst>();

	//work on a copy so a half-parsed file never leaks out
	Configuration parsed;
	if(!read_string(root["chip"], "chip", parsed.chip)) return CONFIG_STATUS::CONFIG_INVALID;
	if(!read_pin(root["boot"], "boot", parsed.boot)) return CONFIG_STATUS::CONFIG_INVALID;
	if(!read_pin(root["reset"], "reset", parsed.reset)) return CONFIG_STATUS::CONFIG_INVALID;

	JsonVariantConst timing = root["timing"];
	if(!timing.isNull()) {
		if(!timing.is<JsonObjectConst>()) {
			Debug::ERROR("config: \"timing\" must be an object");
			return CONFIG_STATUS::CONFIG_INVALID;
		}
		if(	!read_uint(timing["boot_hold_ms"], "timing.boot_hold_ms", parsed.timing.boot_hold_ms) ||
			!read_uint(timing["reset_pulse_ms"], "timing.reset_pulse_ms", parsed.timing.reset_pulse_ms) ||
			!read_uint(timing["bootloader_settle_ms"], "timing.bootloader_settle_ms", parsed.timing.bootloader_settle_ms) ||
			!read_uint(timing["reboot_delay_ms"], "timing.reboot_delay_ms", parsed.timing.reboot_delay_ms))
			return CONFIG_STATUS::CONFIG_INVALID;
	}

	JsonVariantConst recipes = root["recipes"];
	if(!recipes.isNull()) {
		if(!recipes.is<JsonObjectConst>()) {
			Debug::ERROR("config: \"recipes\" must be an object");
			return CONFIG_STATUS::CONFIG_INVALID;
		}
		for(JsonPairConst entry : recipes.as<JsonObjectConst>()) {
			std::string name = entry.key().c_str();
			Recipe recipe;
			if(!read_recipe(entry.value(), "recipes." + name, recipe)) return CONFIG_STATUS::CONFIG_INVALID;
			parsed.recipes[name] = recipe;
		}
	}

	if(!read_string(root["default_recipe"], "default_recipe", parsed.default_recipe)) return CONFIG_STATUS::CONFIG_INVALID;
	if(!parsed.default_recipe.empty() && parsed.recipes.find(parsed.default_recipe) == parsed.recipes.end()) {
		Debug::ERROR("config: the default recipe \"" + parsed.default_recipe + "\" does not match any of the given recipes");
		return CONFIG_STATUS::CONFIG_INVALID;
	}

	config = parsed;
	return CONFIG_STATUS::CONFIG_OK;
}

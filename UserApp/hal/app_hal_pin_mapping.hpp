/*
 * app_hal_pin_mapping.hpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 */

#pragma once

#include "app_hal_gpio.hpp"

class Pin_Mapping {
public:
	//=============================== HOST GPIO CHIP ================================
	//the 40-pin header on a Raspberry Pi lives on the first chip, offsets match BCM numbering
	static constexpr const char* DEFAULT_CHIP_PATH = "/dev/gpiochip0";

	//=============================== CONSUMER LABELS ================================
	//what `gpioinfo` shows as the owner of our claimed lines
	static constexpr const char* BOOT_CONSUMER = "pinflash-boot";
	static constexpr const char* RESET_CONSUMER = "pinflash-reset";

	//build the hardware reference for a line
	static GPIO::GPIO_Hardware_Pin boot_line(const std::string& chip, uint32_t offset) {
		return {chip, offset, BOOT_CONSUMER};
	}
	static GPIO::GPIO_Hardware_Pin reset_line(const std::string& chip, uint32_t offset) {
		return {chip, offset, RESET_CONSUMER};
	}

private:
	Pin_Mapping(); //don't allow instantiation
};

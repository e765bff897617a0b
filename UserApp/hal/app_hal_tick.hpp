/*
 * app_hal_tick.hpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 *
 */

#pragma once

#include <cstdint>

class Tick {
public:
	static void delay_ms(uint32_t ms);
	static void delay_us(uint32_t us);

	//milliseconds on a monotonic clock, starting at the first call
	static uint32_t get_ms();

private:
	Tick(); //don't allow instantiation of a timer class
};

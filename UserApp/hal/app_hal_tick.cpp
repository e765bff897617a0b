/*
 * app_hal_tick.cpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 *
 */

#include "app_hal_tick.hpp"

#include <chrono>
#include <thread>

//utility delay functions
//sleep_for resumes after a signal handler runs, so these always wait the full time
void Tick::delay_ms(uint32_t ms) {
	if(ms == 0) return;
	std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

void Tick::delay_us(uint32_t us) {
	if(us == 0) return;
	std::this_thread::sleep_for(std::chrono::microseconds(us));
}

//system tick wrapper
uint32_t Tick::get_ms() {
	static const auto start = std::chrono::steady_clock::now();
	auto elapsed = std::chrono::steady_clock::now() - start;
	return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

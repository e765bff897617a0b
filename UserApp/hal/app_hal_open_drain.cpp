/*
 * app_hal_open_drain.cpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 */

#include "app_hal_open_drain.hpp"
#include "app_debug_if.hpp"

//========================================= SCOPED CLAIM ==========================================

Open_Drain_Pin::Claim::Claim(Open_Drain_Pin& _pin):
	pin(_pin),
	claim_status(_pin.init())
{}

Open_Drain_Pin::Claim::~Claim() {
	//only release what we actually claimed
	if(claim_status == GPIO_STATUS::GPIO_OK) pin.deinit();
}

//========================================= CONSTRUCTOR ==========================================

Open_Drain_Pin::Open_Drain_Pin(GPIO_Interface& _line, const Drop_State& _final_state):
	line(_line),
	final_state(_final_state)
{}

Open_Drain_Pin::~Open_Drain_Pin() {
	deinit();
}

//========================================= INIT FUNCTIONS ==========================================

Open_Drain_Pin::GPIO_STATUS Open_Drain_Pin::init() {
	if(claimed) return GPIO_STATUS::GPIO_OK;

	GPIO_STATUS status = line.init();
	if(status != GPIO_STATUS::GPIO_OK) return status;
	claimed = true;

	//start out released
	status = set_open();
	if(status != GPIO_STATUS::GPIO_OK) {
		//couldn't even put the line in a known state, don't hold on to it
		line.deinit();
		claimed = false;
	}
	return status;
}

void Open_Drain_Pin::deinit() {
	if(!claimed) return;

	//best effort here--if the kernel rejects the drop state we still want to release the line
	if(line.configure(drop_target()) != GPIO_STATUS::GPIO_OK)
		Debug::WARN(line.label() + ": could not apply drop state, releasing anyway");

	line.deinit();
	claimed = false;
	drive_state = Drive::OPEN;
}

//========================================= LINE CONTROL ==========================================

Open_Drain_Pin::GPIO_STATUS Open_Drain_Pin::set_low() {
	if(!claimed) return GPIO_STATUS::GPIO_ERROR;

	//level gets applied along with the direction change, no glitch high
	GPIO_STATUS status = line.configure({GPIO_Interface::Mode::OUTPUT, GPIO_Interface::Level::LOW, GPIO_Interface::Pull::NONE});
	if(status == GPIO_STATUS::GPIO_OK) drive_state = Drive::LOW;
	return status;
}

Open_Drain_Pin::GPIO_STATUS Open_Drain_Pin::set_open() {
	if(!claimed) return GPIO_STATUS::GPIO_ERROR;

	//level is a don't-care for inputs
	GPIO_STATUS status = line.configure({GPIO_Interface::Mode::INPUT, GPIO_Interface::Level::HIGH, GPIO_Interface::Pull::PULL_UP});
	if(status == GPIO_STATUS::GPIO_OK) drive_state = Drive::OPEN;
	return status;
}

Open_Drain_Pin::GPIO_STATUS Open_Drain_Pin::set(Drive drive) {
	return (drive == Drive::LOW) ? set_low() : set_open();
}

GPIO_Interface::Line_State Open_Drain_Pin::drop_target() const {
	GPIO_Interface::Line_State initial = line.initial_state();
	return {
		final_state.mode.value_or(initial.mode),
		final_state.level.value_or(initial.level),
		final_state.pull.value_or(initial.pull)
	};
}

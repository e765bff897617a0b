/*
 * app_hal_open_drain.hpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 *
 *  Open-drain emulation on top of a plain GPIO line
 *  	\--> LOW: line configured as an output, driven low
 *  	\--> OPEN: line configured as an input with the pull-up enabled
 *  The target side sees either a hard low or a weakly pulled high line, so both boot-select
 *  and reset pins (which the target usually pulls up on its own) can be shared safely
 */

#pragma once

#include <optional>

#include "app_hal_gpio.hpp"

class Open_Drain_Pin {
public:
	//================================ TYPEDEFS ================================
	using GPIO_STATUS = GPIO_Interface::GPIO_STATUS;

	enum class Drive { LOW, OPEN };

	//what the line should look like once we let go of it
	//any field left empty falls back to what the line looked like before we claimed it
	struct Drop_State {
		std::optional<GPIO_Interface::Mode> mode;
		std::optional<GPIO_Interface::Level> level;
		std::optional<GPIO_Interface::Pull> pull;
	};

	//================================ SCOPED CLAIM ================================
	/*
	 * Claims the pin on construction, releases it on destruction
	 * Guarantees the pin is released on every path out of the scope that owns the claim
	 */
	class Claim {
	public:
		Claim(Open_Drain_Pin& _pin);
		~Claim();

		GPIO_STATUS status() const { return claim_status; }
		bool ok() const { return claim_status == GPIO_STATUS::GPIO_OK; }

		Claim(const Claim& other) = delete;
		void operator=(const Claim& other) = delete;

	private:
		Open_Drain_Pin& pin;
		GPIO_STATUS claim_status;
	};

	//================================= INSTANCE METHODS ===================================
	Open_Drain_Pin(GPIO_Interface& _line, const Drop_State& _final_state = {});
	~Open_Drain_Pin();

	//delete copy constructor and assignment operator
	Open_Drain_Pin(const Open_Drain_Pin& other) = delete;
	void operator=(const Open_Drain_Pin& other) = delete;

	/*
	 * Claims the underlying line and puts it in the OPEN state
	 * 	\--> the line's initial state is captured by the line during the claim
	 */
	GPIO_STATUS init();

	/*
	 * Applies the drop state, then releases the line
	 *	\--> does nothing if the pin isn't claimed, so it's fine to call this more than once
	 */
	void deinit();

	GPIO_STATUS set_low();
	GPIO_STATUS set_open();
	GPIO_STATUS set(Drive drive);

	Drive get() const { return drive_state; }
	bool is_claimed() const { return claimed; }
	std::string label() const { return line.label(); }

	//the line state `deinit()` will apply, with the fallbacks resolved
	GPIO_Interface::Line_State drop_target() const;

private:
	GPIO_Interface& line;
	const Drop_State final_state;

	bool claimed = false;
	Drive drive_state = Drive::OPEN;
};

/*
 * app_reset_sequencer.hpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 *
 *  Puts the target into its bootloader, runs the flashing tool, and lets the target boot again
 *
 *  SEQUENCE:
 *  	\--> claim the boot line (and the reset line, if there is one)
 *  	\--> boot line LOW, wait `boot_hold_ms`
 *  	\--> reset LOW for `reset_pulse_ms`, reset OPEN, wait `bootloader_settle_ms`
 *  	\--> run the recipe until it exits
 *  		\--> optionally: `reboot_delay` into the run, boot line OPEN + reset pulse (target boots its application while the tool keeps running)
 *  	\--> boot line OPEN (if it isn't already), wait `boot_hold_ms`, reset pulse
 *  	\--> release both lines (drop states get applied)
 *
 *  NOTES:
 *  	\--> the claims are scoped, so the lines get released on every way out of `run()`
 *  	\--> if either line can't be claimed nothing else happens: no reset pulse, no tool
 *  	\--> SIGINT/SIGTERM/SIGHUP don't kill us mid-sequence; the tool gets a chance to exit and the lines are still released
 *  		\--> a second signal (or `KILL_GRACE_MS` without the tool exiting) kills the tool
 */

#pragma once

#include <optional>

#include "app_config.hpp"
#include "app_hal_open_drain.hpp"
#include "app_recipe.hpp"

class Signal_Watch;

class Reset_Sequencer {
public:
	//================================ TYPEDEFS ================================
	enum class SEQUENCE_STATUS {
		SEQ_OK,					//tool ran and exited with 0
		SEQ_PIN_UNAVAILABLE,	//couldn't claim a line; nothing was run
		SEQ_PIN_ERROR,			//claimed a line but couldn't drive it; tool not run
		SEQ_TOOL_FAILURE,		//tool exited non-zero (or died)
		SEQ_SPAWN_ERROR,		//tool couldn't be started
		SEQ_INTERRUPTED			//signal arrived before the tool was started
	};

	struct Sequence_Result {
		SEQUENCE_STATUS status;
		int exit_code;
	};

	//exit codes for the failures that don't come from the tool (sysexits.h values)
	static constexpr int EXIT_PIN_UNAVAILABLE = 69;	//EX_UNAVAILABLE
	static constexpr int EXIT_PIN_ERROR = 74;		//EX_IOERR
	static constexpr int EXIT_WAIT_ERROR = 71;		//EX_OSERR

	//how often the running tool gets checked on
	static constexpr uint32_t POLL_INTERVAL_MS = 10;

	//how long the tool gets to exit after a signal before it's killed
	static constexpr uint32_t KILL_GRACE_MS = 5000;

	//================================= INSTANCE METHODS ===================================
	//reset pin is optional; without one the target has to be power cycled some other way
	Reset_Sequencer(Open_Drain_Pin& _boot, Open_Drain_Pin* _reset, const Sequence_Timing& _timing);

	//delete copy constructor and assignment operator
	Reset_Sequencer(const Reset_Sequencer& other) = delete;
	void operator=(const Reset_Sequencer& other) = delete;

	/*
	 * Run the whole sequence around `recipe`
	 * 	\--> `reboot_after_ms` schedules a mid-run reboot into the application
	 * 	\--> returns the status plus the exit code the program should end with
	 */
	Sequence_Result run(const Recipe& recipe, std::optional<uint32_t> reboot_after_ms = std::nullopt);

private:
	//everything between claiming and releasing the lines
	Sequence_Result run_claimed(const Recipe& recipe, std::optional<uint32_t> reboot_after_ms, Signal_Watch& signals);

	//drive the tool until it exits, handling the mid-run reboot and signal forwarding
	Sequence_Result supervise(Recipe_Process& process, std::optional<uint32_t> reboot_after_ms, Signal_Watch& signals);

	GPIO_Interface::GPIO_STATUS enter_bootloader();
	void boot_application();
	void pulse_reset();

	static bool tool_in_foreground();

	Open_Drain_Pin& boot;
	Open_Drain_Pin* const reset;
	const Sequence_Timing timing;
};

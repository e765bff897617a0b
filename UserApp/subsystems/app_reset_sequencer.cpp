/*
 * app_reset_sequencer.cpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 */

#include "app_reset_sequencer.hpp"
#include "app_debug_if.hpp"
#include "app_hal_tick.hpp"
#include "app_signals.hpp"

#include <csignal>

extern "C" {
	#include <unistd.h> //tcgetpgrp, getpgrp
}

Reset_Sequencer::Reset_Sequencer(Open_Drain_Pin& _boot, Open_Drain_Pin* _reset, const Sequence_Timing& _timing):
	boot(_boot),
	reset(_reset),
	timing(_timing)
{}

//=================================== TOP LEVEL SEQUENCE ===================================

Reset_Sequencer::Sequence_Result Reset_Sequencer::run(const Recipe& recipe, std::optional<uint32_t> reboot_after_ms) {
	//start watching for signals before anything touches the hardware
	Signal_Watch signals;

	//claim the boot line first; bail right away if we can't
	Open_Drain_Pin::Claim boot_claim(boot);
	if(!boot_claim.ok()) {
		Debug::ERROR("Boot mode pin " + boot.label() + " is unavailable");
		return {SEQUENCE_STATUS::SEQ_PIN_UNAVAILABLE, EXIT_PIN_UNAVAILABLE};
	}

	//then the reset line; the boot claim gets released on the way out if this fails
	std::optional<Open_Drain_Pin::Claim> reset_claim;
	if(reset) {
		reset_claim.emplace(*reset);
		if(!reset_claim->ok()) {
			Debug::ERROR("Reset pin " + reset->label() + " is unavailable");
			return {SEQUENCE_STATUS::SEQ_PIN_UNAVAILABLE, EXIT_PIN_UNAVAILABLE};
		}
	}
	else Debug::WARN("No reset pin configured; power cycle the target to enter its bootloader");

	Sequence_Result result = run_claimed(recipe, reboot_after_ms, signals);

	//whatever happened, hand the target back to its application
	//unless the boot line never left OPEN, then the target was never reset in the first place
	if(result.status != SEQUENCE_STATUS::SEQ_PIN_ERROR) boot_application();

	//claims release the lines (reset first, then boot) as they go out of scope
	if(result.status == SEQUENCE_STATUS::SEQ_OK) Debug::PRINT("Done!");
	return result;
}

Reset_Sequencer::Sequence_Result Reset_Sequencer::run_claimed(	const Recipe& recipe,
																std::optional<uint32_t> reboot_after_ms,
																Signal_Watch& signals)
{
	if(enter_bootloader() != GPIO_Interface::GPIO_STATUS::GPIO_OK)
		return {SEQUENCE_STATUS::SEQ_PIN_ERROR, EXIT_PIN_ERROR};

	//don't start the tool if we got interrupted while the target was resetting
	if(signals.interrupted()) {
		Debug::WARN("Interrupted by signal " + std::to_string(signals.signal_number()) + " before running the recipe");
		return {SEQUENCE_STATUS::SEQ_INTERRUPTED, Recipe_Process::EXIT_SIGNAL_BASE + signals.signal_number()};
	}

	Debug::PRINT("Executing " + recipe.describe());
	Recipe_Process process(recipe);
	if(process.spawn() != Recipe_Process::PROCESS_STATUS::PROCESS_RUNNING)
		return {SEQUENCE_STATUS::SEQ_SPAWN_ERROR, process.exit_code()};

	return supervise(process, reboot_after_ms, signals);
}

Reset_Sequencer::Sequence_Result Reset_Sequencer::supervise(Recipe_Process& process,
															std::optional<uint32_t> reboot_after_ms,
															Signal_Watch& signals)
{
	uint32_t start_ms = Tick::get_ms();
	bool rebooted = false;

	int handled_signals = 0;
	uint32_t stop_requested_ms = 0;
	bool killed = false;

	while(true) {
		auto status = process.poll();

		if(status == Recipe_Process::PROCESS_STATUS::PROCESS_EXITED) {
			int code = process.exit_code();
			if(code != 0) {
				Debug::WARN("Recipe exited with code " + std::to_string(code));
				return {SEQUENCE_STATUS::SEQ_TOOL_FAILURE, code};
			}
			return {SEQUENCE_STATUS::SEQ_OK, 0};
		}

		if(status == Recipe_Process::PROCESS_STATUS::PROCESS_WAIT_ERROR)
			return {SEQUENCE_STATUS::SEQ_TOOL_FAILURE, EXIT_WAIT_ERROR};

		//first signal: ask the tool to stop, second signal: make it stop
		int count = signals.signal_count();
		if(count > handled_signals) {
			int signo = signals.signal_number();
			if(handled_signals == 0) {
				//a terminal's SIGINT already reached the tool through the foreground process group
				if(signo != SIGINT || !tool_in_foreground()) process.forward_signal(signo);
				Debug::WARN("Signal " + std::to_string(signo) + " received, waiting for the recipe to exit (signal again to kill it)");
				stop_requested_ms = Tick::get_ms();
			}
			if(count > 1 && !killed) {
				Debug::WARN("Signal " + std::to_string(signo) + " received again, killing the recipe");
				process.forward_signal(SIGKILL);
				killed = true;
			}
			handled_signals = count;
		}

		//a tool that ignores the stop request doesn't get to hold the lines forever
		if(handled_signals > 0 && !killed && (Tick::get_ms() - stop_requested_ms) >= KILL_GRACE_MS) {
			Debug::WARN("Recipe still running " + std::to_string(KILL_GRACE_MS) + " ms after the signal, killing it");
			process.forward_signal(SIGKILL);
			killed = true;
		}

		//mid-run reboot into the application
		if(reboot_after_ms && !rebooted && (Tick::get_ms() - start_ms) >= *reboot_after_ms) {
			boot_application();
			rebooted = true;
		}

		Tick::delay_ms(POLL_INTERVAL_MS);
	}
}

//whether our process group (and so the tool's) owns the controlling terminal
bool Reset_Sequencer::tool_in_foreground() {
	pid_t foreground = ::tcgetpgrp(STDIN_FILENO);
	return foreground >= 0 && foreground == ::getpgrp();
}

//=================================== PIN SEQUENCES ===================================

GPIO_Interface::GPIO_STATUS Reset_Sequencer::enter_bootloader() {
	Debug::PRINT("Triggering boot mode pin (state: Low).");
	auto status = boot.set_low();
	if(status != GPIO_Interface::GPIO_STATUS::GPIO_OK) {
		Debug::ERROR("Could not drive boot mode pin " + boot.label() + " low");
		return status;
	}
	Tick::delay_ms(timing.boot_hold_ms);

	pulse_reset();
	Tick::delay_ms(timing.bootloader_settle_ms);
	return GPIO_Interface::GPIO_STATUS::GPIO_OK;
}

void Reset_Sequencer::boot_application() {
	//after a mid-run reboot the line is already released, only the reset pulse is repeated
	if(boot.get() != Open_Drain_Pin::Drive::OPEN) {
		Debug::PRINT("Releasing boot mode pin (state: Open).");
		if(boot.set_open() != GPIO_Interface::GPIO_STATUS::GPIO_OK)
			Debug::ERROR("Could not release boot mode pin " + boot.label());
		Tick::delay_ms(timing.boot_hold_ms);
	}

	pulse_reset();
}

void Reset_Sequencer::pulse_reset() {
	if(!reset) return;

	Debug::PRINT("Triggering reset pin (state: Low).");
	if(reset->set_low() != GPIO_Interface::GPIO_STATUS::GPIO_OK) {
		Debug::ERROR("Could not drive reset pin " + reset->label() + " low");
		return;
	}
	Tick::delay_ms(timing.reset_pulse_ms);

	Debug::PRINT("Releasing reset pin (state: Open).");
	if(reset->set_open() != GPIO_Interface::GPIO_STATUS::GPIO_OK)
		Debug::ERROR("Could not release reset pin " + reset->label());
}

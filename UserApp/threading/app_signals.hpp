/*
 * app_signals.hpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 *
 *  Scoped interception of termination signals
 *  	\--> while a `Signal_Watch` is alive, SIGINT/SIGTERM/SIGHUP just get recorded instead of killing the process
 *  	\--> the owner polls `interrupted()` and winds down on its own terms (i.e. releasing pins first)
 *  	\--> previous dispositions are restored when the watch goes out of scope
 *  NOTE: only one watch should be alive at a time, the caught signal is process-wide state
 */

#pragma once

#include <array>
#include <csignal>
#include <cstddef>

class Signal_Watch {
public:
	Signal_Watch();
	~Signal_Watch();

	//delete copy constructor and assignment operator
	Signal_Watch(const Signal_Watch& other) = delete;
	void operator=(const Signal_Watch& other) = delete;

	bool interrupted() const { return caught_signal != 0; }

	//number of the most recent signal caught, 0 if none
	int signal_number() const { return caught_signal; }

	//how many signals arrived since the watch started; repeats of the same signal count too
	int signal_count() const { return caught_count; }

	static constexpr size_t NUM_WATCHED = 3;
	static constexpr std::array<int, NUM_WATCHED> WATCHED_SIGNALS = {SIGINT, SIGTERM, SIGHUP};

private:
	static void on_signal(int signo);
	static volatile std::sig_atomic_t caught_signal;
	static volatile std::sig_atomic_t caught_count;

	std::array<struct sigaction, NUM_WATCHED> previous_actions;
};

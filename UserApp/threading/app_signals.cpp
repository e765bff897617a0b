/*
 * app_signals.cpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 */

#include "app_signals.hpp"

#include <cstring>

//=============================== STATIC MEMBER INITIALIZATION ================================

volatile std::sig_atomic_t Signal_Watch::caught_signal = 0;
volatile std::sig_atomic_t Signal_Watch::caught_count = 0;

//=============================== CLASS FUNCTIONS ================================

Signal_Watch::Signal_Watch() {
	caught_signal = 0;
	caught_count = 0;

	struct sigaction action;
	std::memset(&action, 0, sizeof(action));
	action.sa_handler = on_signal;
	sigemptyset(&action.sa_mask);
	action.sa_flags = 0;

	for(size_t i = 0; i < NUM_WATCHED; i++)
		sigaction(WATCHED_SIGNALS[i], &action, &previous_actions[i]);
}

Signal_Watch::~Signal_Watch() {
	for(size_t i = 0; i < NUM_WATCHED; i++)
		sigaction(WATCHED_SIGNALS[i], &previous_actions[i], nullptr);
}

//async-signal context--just record the signal
void Signal_Watch::on_signal(int signo) {
	caught_signal = signo;
	caught_count = caught_count + 1;
}

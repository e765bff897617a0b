/*
 * app_debug_console.cpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 */

#include "app_debug_console.hpp"

//constructor - just save the streams
Debug_Console::Debug_Console(std::ostream& _out, std::ostream& _err):
	out(_out),
	err(_err)
{}

void Debug_Console::print(const Msg_t& msg) {
	if(quiet) return;
	out << msg << std::endl;
}

void Debug_Console::warn(const Msg_t& msg) {
	err << "WARNING: " << msg << std::endl;
}

void Debug_Console::error(const Msg_t& msg) {
	err << "ERROR: " << msg << std::endl;
}

void Debug_Console::set_quiet(bool _quiet) {
	quiet = _quiet;
}

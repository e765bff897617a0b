/*
 * app_debug_console.hpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 *
 *  Print debug messages to the terminal
 *  	\--> progress messages go to stdout
 *  	\--> warnings and errors go to stderr so they survive a redirected stdout
 */

#pragma once

#include <ostream>

#include "app_debug_if.hpp"

class Debug_Console : public Debug_Interface {
public:
	//====================== CONSTRUCTORS ======================
	Debug_Console(std::ostream& _out, std::ostream& _err);

	//delete copy constructor and assignment operator
	Debug_Console(const Debug_Console& other) = delete;
	void operator=(const Debug_Console& other) = delete;

	//and implement the debug interface
	void print(const Msg_t& msg) override;
	void warn(const Msg_t& msg) override;
	void error(const Msg_t& msg) override;

	//quiet mode drops `print` messages, warnings and errors still go out
	void set_quiet(bool _quiet);

private:
	std::ostream& out;
	std::ostream& err;
	bool quiet = false;
};

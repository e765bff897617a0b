/*
 * app_debug_if.hpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 *
 *  Debug front end: application code calls the static `Debug::` methods
 *  and those get forwarded to whatever debug sink is attached
 */

#pragma once

#include <string>

class Debug_Interface {
public:
	using Msg_t = std::string;

	//sinks implement these three levels
	virtual void print(const Msg_t& msg) = 0;
	virtual void warn(const Msg_t& msg) = 0;
	virtual void error(const Msg_t& msg) = 0;

	virtual ~Debug_Interface() = default;
};

class Debug {
public:
	//attach a sink to route debug messages to
	//pass `nullptr` to drop all messages
	static void attach(Debug_Interface* _sink);

	static void PRINT(const Debug_Interface::Msg_t& msg);
	static void WARN(const Debug_Interface::Msg_t& msg);
	static void ERROR(const Debug_Interface::Msg_t& msg);

private:
	Debug(); //don't allow instantiation of this class

	static Debug_Interface* sink;
};

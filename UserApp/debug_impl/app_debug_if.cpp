/*
 * app_debug_if.cpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 */

#include "app_debug_if.hpp"

//=============================== STATIC MEMBER INITIALIZATION ================================

Debug_Interface* Debug::sink = nullptr;

//=============================== CLASS FUNCTIONS ================================

void Debug::attach(Debug_Interface* _sink) {
	sink = _sink;
}

void Debug::PRINT(const Debug_Interface::Msg_t& msg) {
	if(sink) sink->print(msg);
}

void Debug::WARN(const Debug_Interface::Msg_t& msg) {
	if(sink) sink->warn(msg);
}

void Debug::ERROR(const Debug_Interface::Msg_t& msg) {
	if(sink) sink->error(msg);
}

/*
 * app_main.hpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 */

#pragma once

#include <span>

//exit codes for errors that happen before any hardware is touched (sysexits.h values)
constexpr int EXIT_USAGE_ERROR = 64;	//EX_USAGE
constexpr int EXIT_CONFIG_ERROR = 78;	//EX_CONFIG

//version string comes from the build (project version in CMakeLists.txt)
#ifndef PINFLASH_VERSION
#error "PINFLASH_VERSION must be defined by the build"
#endif

//parse the command line, load the configuration, run the sequence
//returns the process exit code
int app_main(std::span<char* const> argv);

/*
 * app_recipe.hpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 *
 *  A recipe is just the external tool we hand the target to once it's in its bootloader
 *  	\--> command is looked up on PATH
 *  	\--> arguments are passed through verbatim, no shell in between
 */

#pragma once

#include <string>
#include <vector>

extern "C" {
	#include <sys/types.h> //pid_t
}

struct Recipe {
	std::string command;
	std::vector<std::string> arguments;

	//first word is the command, the rest are its arguments
	static Recipe from_words(const std::vector<std::string>& words);

	//single line for debug messages
	std::string describe() const;
};

//================================ RUNNING A RECIPE ================================

class Recipe_Process {
public:
	//================================ TYPEDEFS ================================
	enum class PROCESS_STATUS {
		PROCESS_EXITED,			//child finished, `exit_code()` is valid
		PROCESS_RUNNING,		//child still going
		PROCESS_SPAWN_ERROR,	//couldn't start the child at all
		PROCESS_WAIT_ERROR		//lost track of the child
	};

	//exit code conventions, same as a POSIX shell
	static constexpr int EXIT_SPAWN_FAILED = 127;
	static constexpr int EXIT_SIGNAL_BASE = 128;

	//================================= INSTANCE METHODS ===================================
	Recipe_Process(const Recipe& _recipe);

	//a child that's still running when we go out of scope gets terminated and reaped
	~Recipe_Process();

	//delete copy constructor and assignment operator
	Recipe_Process(const Recipe_Process& other) = delete;
	void operator=(const Recipe_Process& other) = delete;

	//start the child; stdio and environment are inherited
	PROCESS_STATUS spawn();

	//non-blocking check on the child
	PROCESS_STATUS poll();

	//relay a signal to the child, if it's running
	void forward_signal(int signo);

	bool running() const { return child_pid > 0; }

	//valid once `poll()` reported PROCESS_EXITED (or after a spawn error)
	//normal exit -> its status, killed by signal N -> 128 + N, spawn failure -> 127
	int exit_code() const { return code; }

private:
	const Recipe recipe;

	pid_t child_pid = -1;
	int code = 0;
};

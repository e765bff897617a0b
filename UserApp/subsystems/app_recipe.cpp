/*
 * app_recipe.cpp
 *
 *  Created on: Oct 19, 2026
 *      Author: pinflash developers
 */

#include "app_recipe.hpp"
#include "app_debug_if.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

extern "C" {
	#include <spawn.h>
	#include <sys/wait.h>
	extern char** environ;
}

//========================================= RECIPE ==========================================

Recipe Recipe::from_words(const std::vector<std::string>& words) {
	if(words.empty()) return {};
	return {words.front(), std::vector<std::string>(words.begin() + 1, words.end())};
}

std::string Recipe::describe() const {
	std::string text = command;
	for(const auto& arg : arguments) text += " " + arg;
	return text;
}

//========================================= CONSTRUCTOR ==========================================

Recipe_Process::Recipe_Process(const Recipe& _recipe):
	recipe(_recipe)
{}

Recipe_Process::~Recipe_Process() {
	if(!running()) return;

	//don't leave an orphan behind holding the serial port
	Debug::WARN("Terminating " + recipe.command + " (pid " + std::to_string(child_pid) + ")");
	::kill(child_pid, SIGTERM);
	int status;
	while(::waitpid(child_pid, &status, 0) < 0 && errno == EINTR);
	child_pid = -1;
}

//========================================= PROCESS CONTROL ==========================================

Recipe_Process::PROCESS_STATUS Recipe_Process::spawn() {
	if(recipe.command.empty()) {
		Debug::ERROR("No command to execute");
		code = EXIT_SPAWN_FAILED;
		return PROCESS_STATUS::PROCESS_SPAWN_ERROR;
	}

	//build a NULL-terminated argv pointing into our own strings
	//posix_spawn wants non-const pointers, but doesn't modify them
	std::vector<char*> argv;
	argv.reserve(recipe.arguments.size() + 2);
	argv.push_back(const_cast<char*>(recipe.command.c_str()));
	for(const auto& arg : recipe.arguments) argv.push_back(const_cast<char*>(arg.c_str()));
	argv.push_back(nullptr);

	pid_t pid;
	int result = ::posix_spawnp(&pid, recipe.command.c_str(), nullptr, nullptr, argv.data(), environ);
	if(result != 0) {
		Debug::ERROR("Cannot execute " + recipe.command + " (" + std::strerror(result) + ")");
		code = EXIT_SPAWN_FAILED;
		return PROCESS_STATUS::PROCESS_SPAWN_ERROR;
	}

	child_pid = pid;
	return PROCESS_STATUS::PROCESS_RUNNING;
}

Recipe_Process::PROCESS_STATUS Recipe_Process::poll() {
	if(!running()) return PROCESS_STATUS::PROCESS_EXITED;

	int status;
	pid_t result = ::waitpid(child_pid, &status, WNOHANG);
	if(result == 0) return PROCESS_STATUS::PROCESS_RUNNING;
	if(result < 0) {
		if(errno == EINTR) return PROCESS_STATUS::PROCESS_RUNNING;
		Debug::ERROR("Lost track of " + recipe.command + " (" + std::strerror(errno) + ")");
		child_pid = -1;
		return PROCESS_STATUS::PROCESS_WAIT_ERROR;
	}

	//child is gone, translate its status the way a shell would
	child_pid = -1;
	if(WIFEXITED(status)) code = WEXITSTATUS(status);
	else if(WIFSIGNALED(status)) code = EXIT_SIGNAL_BASE + WTERMSIG(status);
	else code = EXIT_SIGNAL_BASE;
	return PROCESS_STATUS::PROCESS_EXITED;
}

void Recipe_Process::forward_signal(int signo) {
	if(!running()) return;
	::kill(child_pid, signo);
}

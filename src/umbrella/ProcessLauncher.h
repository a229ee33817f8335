#ifndef PROCESS_LAUNCHER_H
#define PROCESS_LAUNCHER_H

#include <string>


// Runs external commands
// - Calls block until the command finishes (no timeout)
class ProcessLauncher
{
 public:
	virtual ~ProcessLauncher() {};

	// Runs 'command' and returns its exit status
	// - If 'show_output' is false, the command's standard output is discarded
	// - Throws SolverError if the command can't be launched at all
	virtual int run(const std::string& command, const bool show_output) = 0;
};


// Runs commands through the shell (/bin/sh -c)
class ShellProcessLauncher : public ProcessLauncher
{
 public:
	virtual int run(const std::string& command, const bool show_output) override;
};

#endif // ifndef PROCESS_LAUNCHER_H

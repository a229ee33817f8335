#include "ProcessLauncher.h"

#include <cstdlib>
#include <iostream>

#include <sys/wait.h>

#include "Errors.h"


int ShellProcessLauncher::run(const std::string& command, const bool show_output)
{
	std::string shell_command = command;
	if ( ! show_output ) {
		shell_command += " > /dev/null";
	}

	// Anything still buffered should appear before the command's own output
	std::cout << std::flush;

	const int status = std::system( shell_command.c_str() );
	if ( status == -1 ) {
		throw SolverError(-1, "unable to launch command: " + command);
	}

	if ( WIFEXITED(status) ) {
		return WEXITSTATUS(status);
	}
	else if ( WIFSIGNALED(status) ) {
		// Same convention as the shell
		return 128 + WTERMSIG(status);
	}
	else {
		return status;
	}
}

#ifndef WHAM_SOLVER_H
#define WHAM_SOLVER_H

#include <memory>
#include <string>

#include "ProcessLauncher.h"
#include "WhamBorders.h"
#include "WhamConfig.h"


// Runs the external 2D WHAM solver
// - If the output file already exists, the solver is not run again
// - A nonzero exit status is fatal (SolverError)
class WhamSolver
{
 public:
	// If no launcher is given, commands are run through the shell
	WhamSolver(
		const WhamConfig&                wham_config,
		std::unique_ptr<ProcessLauncher> launcher   = nullptr,
		const bool                       be_verbose = false,
		const bool                       be_quiet   = false
	);

	// Command line for wham-2d:
	//   <exec> Px=<Px> <min_x> <max_x> <num_bins_x> Py=<Py> <min_y> <max_y> <num_bins_y>
	//          <tolerance> <temperature> 0 <metadata_file> <output_file> <mask>
	std::string buildCommand(
		const WhamBorders& borders,
		const std::string& metadata_file,
		const std::string& output_file
	) const;

	// Returns true if the solver ran, and false if existing output was reused
	bool run(
		const WhamBorders& borders,
		const std::string& metadata_file,
		const std::string& output_file
	) const;

 private:
	WhamConfig wham_config_;

	std::unique_ptr<ProcessLauncher> launcher_ptr_;

	bool be_verbose_ = false;  // echo the command and its output
	bool be_quiet_   = false;  // no messages
};

#endif // ifndef WHAM_SOLVER_H

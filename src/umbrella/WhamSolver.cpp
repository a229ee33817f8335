#include "WhamSolver.h"

#include <iostream>
#include <sstream>

#include "Errors.h"
#include "FileSystem.h"
#include "StringTools.h"


WhamSolver::WhamSolver(
	const WhamConfig& wham_config, std::unique_ptr<ProcessLauncher> launcher,
	const bool be_verbose, const bool be_quiet
):
	wham_config_(wham_config),
	launcher_ptr_( std::move(launcher) ),
	be_verbose_(be_verbose),
	be_quiet_(be_quiet)
{
	wham_config_.validate();

	if ( launcher_ptr_ == nullptr ) {
		launcher_ptr_.reset( new ShellProcessLauncher() );
	}
}


std::string WhamSolver::buildCommand(
	const WhamBorders& borders, const std::string& metadata_file, const std::string& output_file) const
{
	using StringTools::formatReal;
	const auto& cfg = wham_config_;

	// The '0' is 'numpad': no padding values (only meaningful for periodic PMFs)
	std::stringstream ss;
	ss << cfg.executable
	   << " Px=" << formatReal(cfg.Px) << " " << formatReal(borders.min_x) << " " << formatReal(borders.max_x)
	   << " " << cfg.num_bins_x
	   << " Py=" << formatReal(cfg.Py) << " " << formatReal(borders.min_y) << " " << formatReal(borders.max_y)
	   << " " << cfg.num_bins_y
	   << " " << formatReal(cfg.tolerance) << " " << formatReal(cfg.temperature) << " 0"
	   << " " << metadata_file << " " << output_file << " " << cfg.mask;

	return ss.str();
}


bool WhamSolver::run(
	const WhamBorders& borders, const std::string& metadata_file, const std::string& output_file) const
{
	if ( FileSystem::exists(output_file) ) {
		if ( ! be_quiet_ ) {
			std::cout << "skipping wham, " << output_file << " already exists.\n";
		}
		return false;
	}

	const std::string command = buildCommand(borders, metadata_file, output_file);
	if ( be_verbose_ ) {
		std::cout << command << "\n";
	}

	const int exit_code = launcher_ptr_->run(command, be_verbose_);
	if ( exit_code != 0 ) {
		std::stringstream err_ss;
		err_ss << "wham exited with error code " << exit_code;
		throw SolverError(exit_code, err_ss.str());
	}

	return true;
}

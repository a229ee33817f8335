#include "PmfUpdater.h"

#include <iostream>

#include "FileSystem.h"


PmfUpdater::PmfUpdater(
	const WhamConfig& wham_config, const Options& options, std::unique_ptr<ProcessLauncher> launcher
):
	options_(options),
	metadata_writer_( options_.tmp_folder,
	                  SimulationLayout(options_.simulation_folder, options_.colvar_file_name),
	                  wham_config, options_.be_verbose ),
	wham_solver_( wham_config, std::move(launcher), options_.be_verbose, options_.be_quiet )
{
	FileSystem::createDirectories(options_.tmp_folder);
}


std::string PmfUpdater::getWhamOutputFile(const UmbrellaState& state) const
{
	return FileSystem::join( options_.tmp_folder, std::to_string(state.getIteration()) + "_freeenergy.dat" );
}


const PmfUpdater::Matrix<double>& PmfUpdater::calculateNewPmf(UmbrellaState& state) const
{
	const bool be_quiet = options_.be_quiet;

	const std::string metadata_file = createMetadataFile(state);
	const std::string output_file   = getWhamOutputFile(state);
	if ( ! be_quiet ) {
		std::cout << "  Metadata: " << metadata_file << "\n" << std::flush;
	}

	const WhamBorders borders = getWhamBorders(state);
	if ( ! be_quiet ) {
		std::cout << "  Borders:  x in [" << borders.min_x << ", " << borders.max_x << "], "
		          << "y in [" << borders.min_y << ", " << borders.max_y << "]\n"
		          << "  Running WHAM ...\n" << std::flush;
	}
	wham_solver_.run(borders, metadata_file, output_file);

	WhamOutput wham_output = WhamOutput::FromFile(output_file);
	if ( ! be_quiet ) {
		std::cout << "  Read " << wham_output.size() << " points from " << output_file
		          << " (" << wham_output.getNumUnsampled() << " unsampled)\n" << std::flush;
	}

	GridProjector projector( state.getLambdaGrid() );
	projector.project( wham_output, state.accessPmf() );

	return state.getPmf();
}

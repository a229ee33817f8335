#ifndef PMF_UPDATER_H
#define PMF_UPDATER_H

#include <memory>
#include <string>

#include "GridProjector.h"
#include "MetadataWriter.h"
#include "ProcessLauncher.h"
#include "SimulationLayout.h"
#include "UmbrellaState.h"
#include "WhamBorders.h"
#include "WhamConfig.h"
#include "WhamOutput.h"
#include "WhamSolver.h"


// Recomputes the PMF of an umbrella-sampling run with wham-2d
// 1. Write the metadata file for all sampled windows
// 2. Run wham-2d over the sampled region (unless its output already exists)
// 3. Read the free energy surface
// 4. Map it onto the lambda grid
//
// Files for iteration N are "N_metadata.dat" and "N_freeenergy.dat" in the temp folder
class PmfUpdater
{
 public:
	template<typename T>
	using Matrix = numeric::Matrix<T>;

	struct Options
	{
		std::string tmp_folder        = "tmp/WHAM";
		std::string simulation_folder = "tmp/simulations";
		std::string colvar_file_name  = "COLVAR";

		bool be_verbose = false;  // echo the solver command and output
		bool be_quiet   = false;  // no progress messages
	};

	// Creates the temp folder if it doesn't exist
	PmfUpdater(
		const WhamConfig&                wham_config,
		const Options&                   options,
		std::unique_ptr<ProcessLauncher> launcher = nullptr
	);

	// Updates the state's PMF in place, and returns it
	// - On error, the PMF is left unchanged
	const Matrix<double>& calculateNewPmf(UmbrellaState& state) const;

	std::string createMetadataFile(const UmbrellaState& state) const {
		return metadata_writer_.createMetadataFile(state);
	}

	std::string getWhamOutputFile(const UmbrellaState& state) const;

	WhamBorders getWhamBorders(const UmbrellaState& state) const {
		return findWhamBorders( state.getSampleCounts(), state.getLambdaGrid() );
	}

 private:
	Options options_;

	MetadataWriter metadata_writer_;
	WhamSolver     wham_solver_;
};

#endif // ifndef PMF_UPDATER_H

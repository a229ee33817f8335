#pragma once
#ifndef UMBRELLA_PMF_DRIVER_H
#define UMBRELLA_PMF_DRIVER_H

#include <memory>
#include <string>

#include "InputParser.h"
#include "LambdaGrid.h"
#include "PmfUpdater.h"
#include "ProcessLauncher.h"
#include "UmbrellaState.h"
#include "WhamConfig.h"


// Performs one PMF update of an adaptive umbrella-sampling run
// - Reads the lambda grid, WHAM settings, and sample counts named in an input file
// - Runs wham-2d on the sampled windows, and maps its output onto the lambda grid
// - Saves the resulting PMF (rows: x, columns: y; "inf" where unknown)
//
// NOTES:
// - "x" and "y" are the first and second collective variables in the input file
// - Relative paths are with respect to the directory containing the input file
class UmbrellaPmfDriver
{
 public:
	UmbrellaPmfDriver(
		const std::string&               options_file,
		std::unique_ptr<ProcessLauncher> launcher = nullptr
	);

	// Driver: updates the PMF and prints output
	void run_driver();

	const UmbrellaState& getState() const noexcept {
		return state_;
	}

	const std::string& getOutputPmfFile() const noexcept {
		return output_pmf_file_;
	}

 private:
	// Input file
	std::string options_file_;
	ParameterPack input_parameter_pack_;

	LambdaGrid lambda_grid_;
	WhamConfig wham_config_;

	std::string sample_counts_file_;
	std::string output_pmf_file_;

	UmbrellaState state_;

	PmfUpdater::Options updater_options_;
	std::unique_ptr<PmfUpdater> updater_ptr_;


	//----- Output -----//

	bool be_verbose_ = false;  // extra feedback
	bool be_quiet_   = false;  // minimal/no feedback

	void printPmf(const std::string& file_name) const;
};

#endif // ifndef UMBRELLA_PMF_DRIVER_H

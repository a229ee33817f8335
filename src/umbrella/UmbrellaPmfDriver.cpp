#include "UmbrellaPmfDriver.h"

#include <cmath>
#include <iostream>
#include <sstream>

#include "Assert.hpp"
#include "FileSystem.h"
#include "OpenMP.h"


UmbrellaPmfDriver::UmbrellaPmfDriver(const std::string& options_file, std::unique_ptr<ProcessLauncher> launcher):
	options_file_(options_file)
{
	// Read input file into a ParameterPack
	InputParser input_parser;
	input_parser.parseFile(options_file_, input_parameter_pack_);

	using KeyType = ParameterPack::KeyType;

	input_parameter_pack_.readFlag("Verbose", KeyType::Optional, be_verbose_);
	input_parameter_pack_.readFlag("Quiet",   KeyType::Optional, be_quiet_);
	FANCY_ASSERT( ! (be_verbose_ && be_quiet_), "\"Verbose\" and \"Quiet\" are mutually exclusive" );

	if ( ! be_quiet_ ) {
		std::cout << "UMBRELLA PMF\n";
		if ( OpenMP::is_enabled() ) {
			std::cout << "  Using " << OpenMP::get_max_threads() << " threads (max.)\n";
		}
		std::cout << std::flush;
	}

	// Paths in the input file are relative to its location
	const std::string base_path = FileSystem::dirname(options_file_);
	auto resolve = [&](const std::string& path) {
		return FileSystem::resolveRelativePath(path, base_path);
	};

	int iteration = 0;
	input_parameter_pack_.readNumber("Iteration", KeyType::Required, iteration);
	FANCY_ASSERT( iteration >= 0, "invalid iteration: " << iteration );

	input_parameter_pack_.readString("TmpFolder",        KeyType::Optional, updater_options_.tmp_folder);
	input_parameter_pack_.readString("SimulationFolder", KeyType::Optional, updater_options_.simulation_folder);
	input_parameter_pack_.readString("ColvarFileName",   KeyType::Optional, updater_options_.colvar_file_name);
	updater_options_.tmp_folder        = resolve(updater_options_.tmp_folder);
	updater_options_.simulation_folder = resolve(updater_options_.simulation_folder);
	updater_options_.be_verbose = be_verbose_;
	updater_options_.be_quiet   = be_quiet_;

	input_parameter_pack_.readString("SampleCountsFile", KeyType::Required, sample_counts_file_);
	sample_counts_file_ = resolve(sample_counts_file_);

	output_pmf_file_ = "pmf_" + std::to_string(iteration) + ".out";
	input_parameter_pack_.readString("OutputPmfFile", KeyType::Optional, output_pmf_file_);
	output_pmf_file_ = resolve(output_pmf_file_);


	//----- Lambda grid and WHAM settings -----//

	lambda_grid_ = LambdaGrid(input_parameter_pack_);

	const ParameterPack* wham_pack_ptr = input_parameter_pack_.findParameterPack("Wham", KeyType::Required);
	wham_config_ = WhamConfig(*wham_pack_ptr);


	//----- Umbrella state -----//

	if ( ! be_quiet_ ) {
		std::cout << "  Loading sample counts ...\n" << std::flush;
	}
	numeric::Matrix<int> sample_counts(sample_counts_file_);
	state_ = UmbrellaState(lambda_grid_, sample_counts, iteration);

	if ( ! be_quiet_ ) {
		const auto shape = lambda_grid_.getShape();
		std::cout << "  Lambda grid: " << shape[0] << " x " << shape[1] << " windows\n"
		          << "  Sampled windows: " << state_.getSampledLambdas().size()
		          << " (" << sample_counts.sum() << " frames)\n" << std::flush;
	}

	updater_ptr_.reset( new PmfUpdater(wham_config_, updater_options_, std::move(launcher)) );
}


void UmbrellaPmfDriver::run_driver()
{
	if ( ! be_quiet_ ) {
		std::cout << "  Updating PMF (iteration " << state_.getIteration() << ") ...\n" << std::flush;
	}

	updater_ptr_->calculateNewPmf(state_);

	printPmf(output_pmf_file_);

	if ( ! be_quiet_ ) {
		const auto& pmf = state_.getPmf();
		int num_known = 0;
		for ( const double f : pmf ) {
			if ( std::isfinite(f) ) { ++num_known; }
		}
		std::cout << "  Done\n"
		          << "  PMF known for " << num_known << " of " << pmf.size() << " windows\n"
		          << "  Saved to " << output_pmf_file_ << "\n" << std::flush;
	}
}


void UmbrellaPmfDriver::printPmf(const std::string& file_name) const
{
	const auto& x = lambda_grid_.get_x();
	const auto& y = lambda_grid_.get_y();

	std::stringstream header;
	header << "PMF from WHAM (iteration " << state_.getIteration() << ", T = " << wham_config_.temperature << " K)\n"
	       << "#   rows:    " << ( x.getName().empty() ? "x" : x.getName() )
	       << " from " << x.getMin() << " to " << x.getMax() << " in steps of " << x.getStep() << "\n"
	       << "#   columns: " << ( y.getName().empty() ? "y" : y.getName() )
	       << " from " << y.getMin() << " to " << y.getMax() << " in steps of " << y.getStep();

	state_.getPmf().save(file_name, header.str());
}

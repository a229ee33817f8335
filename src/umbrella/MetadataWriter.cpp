#include "MetadataWriter.h"

#include <fstream>
#include <iostream>

#include "Assert.hpp"
#include "FileSystem.h"
#include "StringTools.h"


MetadataWriter::MetadataWriter(
	const std::string& tmp_folder, const SimulationLayout& layout,
	const WhamConfig& wham_config, const bool be_verbose
):
	tmp_folder_(tmp_folder),
	layout_(layout),
	fc_x_(wham_config.fc_x),
	fc_y_(wham_config.fc_y),
	be_verbose_(be_verbose)
{}


std::string MetadataWriter::getMetadataFile(const int iteration) const
{
	return FileSystem::join( tmp_folder_, std::to_string(iteration) + "_metadata.dat" );
}


std::string MetadataWriter::createMetadataFile(const UmbrellaState& state) const
{
	const std::string metadata_file = getMetadataFile( state.getIteration() );

	int num_windows = write( metadata_file, state.getSampledLambdas() );
	if ( num_windows == 0 ) {
		std::cerr << "  Warning: no CV files were found for any sampled window "
		          << "(simulation folder: " << layout_.getSimulationFolder() << ")\n";
	}

	return metadata_file;
}


int MetadataWriter::write(const std::string& metadata_file, const std::vector<Real2>& lambdas) const
{
	std::ofstream ofs(metadata_file);
	FANCY_ASSERT( ofs, "unable to write metadata file: " << metadata_file );

	const std::string fc_x = StringTools::formatReal(fc_x_);
	const std::string fc_y = StringTools::formatReal(fc_y_);

	int num_written = 0;
	for ( const auto& lambda : lambdas ) {
		const std::string colvar_file = layout_.getColvarFile(lambda[0], lambda[1]);
		if ( ! layout_.hasColvarFile(lambda[0], lambda[1]) ) {
			if ( be_verbose_ ) {
				std::cout << "Not found: " << colvar_file << "\n";
			}
			continue;
		}

		ofs << colvar_file << "\t"
		    << StringTools::formatReal(lambda[0]) << "\t" << StringTools::formatReal(lambda[1]) << "\t"
		    << fc_x << "\t" << fc_y << "\n";
		++num_written;
	}

	ofs.close();
	FANCY_ASSERT( ! ofs.fail(), "error writing metadata file: " << metadata_file );

	return num_written;
}

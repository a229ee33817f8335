#ifndef METADATA_WRITER_H
#define METADATA_WRITER_H

#include <array>
#include <string>
#include <vector>

#include "SimulationLayout.h"
#include "UmbrellaState.h"
#include "WhamConfig.h"


// Writes the metadata file that tells the WHAM solver which time series to use
// - One tab-separated line per window:
//     <colvar_file>  <lambda_x>  <lambda_y>  <fc_x>  <fc_y>
// - Windows without a CV file are skipped
class MetadataWriter
{
 public:
	using Real2 = UmbrellaState::Real2;

	MetadataWriter(
		const std::string&      tmp_folder,
		const SimulationLayout& layout,
		const WhamConfig&       wham_config,
		const bool              be_verbose = false
	);

	// Path of the metadata file for the given iteration
	std::string getMetadataFile(const int iteration) const;

	// Writes the metadata file for the state's current iteration and sampled windows,
	// and returns its path
	std::string createMetadataFile(const UmbrellaState& state) const;

	// Writes (or overwrites) 'metadata_file' with an entry for each window in
	// 'lambdas' whose CV file exists
	// - Returns the number of entries written
	int write(const std::string& metadata_file, const std::vector<Real2>& lambdas) const;

 private:
	std::string      tmp_folder_;
	SimulationLayout layout_;
	double           fc_x_, fc_y_;

	bool be_verbose_ = false;
};

#endif // ifndef METADATA_WRITER_H

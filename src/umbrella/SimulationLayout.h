#ifndef SIMULATION_LAYOUT_H
#define SIMULATION_LAYOUT_H

#include <string>


// Locates the data written by each umbrella window
// - Window (lambda_x, lambda_y) runs in <simulation_folder>/umb_<lambda_x>_<lambda_y>/,
//   and writes its CV time series to a file named <colvar_file_name> there
class SimulationLayout
{
 public:
	SimulationLayout(
		const std::string& simulation_folder = "tmp/simulations",
		const std::string& colvar_file_name  = "COLVAR"
	);

	const std::string& getSimulationFolder() const noexcept {
		return simulation_folder_;
	}

	std::string getWindowDirectory(const double lambda_x, const double lambda_y) const;

	std::string getColvarFile(const double lambda_x, const double lambda_y) const;

	bool hasColvarFile(const double lambda_x, const double lambda_y) const;

 private:
	std::string simulation_folder_;
	std::string colvar_file_name_;
};

#endif // ifndef SIMULATION_LAYOUT_H

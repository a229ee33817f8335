#include "SimulationLayout.h"

#include "Assert.hpp"
#include "FileSystem.h"
#include "StringTools.h"


SimulationLayout::SimulationLayout(const std::string& simulation_folder, const std::string& colvar_file_name):
	simulation_folder_(simulation_folder),
	colvar_file_name_(colvar_file_name)
{
	FANCY_ASSERT( ! simulation_folder_.empty(), "no simulation folder given" );
	FANCY_ASSERT( ! colvar_file_name_.empty(),  "no CV file name given" );
}


std::string SimulationLayout::getWindowDirectory(const double lambda_x, const double lambda_y) const
{
	const std::string window = "umb_" + StringTools::formatReal(lambda_x) + "_" + StringTools::formatReal(lambda_y);
	return FileSystem::join(simulation_folder_, window);
}


std::string SimulationLayout::getColvarFile(const double lambda_x, const double lambda_y) const
{
	return FileSystem::join( getWindowDirectory(lambda_x, lambda_y), colvar_file_name_ );
}


bool SimulationLayout::hasColvarFile(const double lambda_x, const double lambda_y) const
{
	return FileSystem::exists( getColvarFile(lambda_x, lambda_y) );
}

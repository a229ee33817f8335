#include <cmath>
#include <memory>

#include <gtest/gtest.h>

#include "Errors.h"
#include "FileSystem.h"
#include "PmfUpdater.h"
#include "TestUtils.h"

using numeric::Matrix;


// 3x3 grid with step 0.5, sampled at (0.0,0.0), (0.5,0.5), and (1.0,0.5)
// - Only the first two windows have CV files
class PmfUpdaterTest : public ::testing::Test
{
 protected:
	PmfUpdaterTest():
		grid_( LambdaAxis(0.0, 1.0, 0.5, "x"), LambdaAxis(0.0, 1.0, 0.5, "y") )
	{
		options_.tmp_folder        = tmp_.join("WHAM");
		options_.simulation_folder = tmp_.join("simulations");
		options_.be_quiet          = true;

		Matrix<int> counts(3, 3);
		counts.assign(0);
		counts(0,0) = 20;
		counts(1,1) = 15;
		counts(2,1) = 3;
		state_ = UmbrellaState(grid_, counts);

		SimulationLayout layout(options_.simulation_folder);
		writeFile( layout.getColvarFile(0.0, 0.0), "#! FIELDS time x y\n" );
		writeFile( layout.getColvarFile(0.5, 0.5), "#! FIELDS time x y\n" );
	}

	static const std::string wham_output_;

	TempDirectory       tmp_;
	LambdaGrid          grid_;
	UmbrellaState       state_;
	PmfUpdater::Options options_;
	WhamConfig          config_;
};

const std::string PmfUpdaterTest::wham_output_ =
	"#X\tY\tFree\tPro\n"
	"0.0\t0.0\t1.0\t0.1\n"
	"0.5\t0.5\t-1.0\t0.2\n"
	"\n"
	"1.0\t0.5\tinf\t0.0\n";


TEST_F(PmfUpdaterTest, CalculateNewPmf)
{
	auto* launcher = new FakeLauncher(0, wham_output_);
	PmfUpdater updater( config_, options_, std::unique_ptr<ProcessLauncher>(launcher) );
	EXPECT_TRUE( FileSystem::isDirectory(options_.tmp_folder) );

	const auto borders = updater.getWhamBorders(state_);
	EXPECT_DOUBLE_EQ( borders.min_x, -1.0 );
	EXPECT_DOUBLE_EQ( borders.max_x,  2.0 );
	EXPECT_DOUBLE_EQ( borders.min_y, -1.0 );
	EXPECT_DOUBLE_EQ( borders.max_y,  1.5 );

	const auto& pmf = updater.calculateNewPmf(state_);
	EXPECT_EQ( &pmf, &state_.getPmf() );

	const std::string metadata_file = options_.tmp_folder + "/0_metadata.dat";
	const std::string output_file   = options_.tmp_folder + "/0_freeenergy.dat";
	EXPECT_EQ( updater.getWhamOutputFile(state_), output_file );

	ASSERT_EQ( launcher->getNumCalls(), 1 );
	EXPECT_EQ( launcher->getCommands()[0],
	           "wham-2d Px=0.0 -1.0 2.0 100 Py=0.0 -1.0 1.5 100 1e-06 300.0 0 "
	           + metadata_file + " " + output_file + " 0" );

	const auto lines = readLines(metadata_file);
	ASSERT_EQ( lines.size(), 2u );
	EXPECT_EQ( lines[0], options_.simulation_folder + "/umb_0.0_0.0/COLVAR\t0.0\t0.0\t0.0\t0.0" );
	EXPECT_EQ( lines[1], options_.simulation_folder + "/umb_0.5_0.5/COLVAR\t0.5\t0.5\t0.0\t0.0" );

	ASSERT_EQ( pmf.getNumRows(), 3 );
	ASSERT_EQ( pmf.getNumCols(), 3 );
	EXPECT_EQ( pmf(0,0),  1.0 );
	EXPECT_EQ( pmf(1,1), -1.0 );
	EXPECT_TRUE( std::isinf(pmf(2,1)) );  // solver had no estimate there
	EXPECT_TRUE( std::isinf(pmf(0,2)) );
}


TEST_F(PmfUpdaterTest, ReusesCachedOutput)
{
	FileSystem::createDirectories(options_.tmp_folder);
	state_ = UmbrellaState( grid_, state_.getSampleCounts(), 3 );
	writeFile( options_.tmp_folder + "/3_freeenergy.dat", wham_output_ );

	auto* launcher = new FakeLauncher(1);
	PmfUpdater updater( config_, options_, std::unique_ptr<ProcessLauncher>(launcher) );

	testing::internal::CaptureStdout();
	const auto& pmf = updater.calculateNewPmf(state_);
	EXPECT_EQ( testing::internal::GetCapturedStdout(), "" );  // quiet
	EXPECT_EQ( launcher->getNumCalls(), 0 );
	EXPECT_TRUE( FileSystem::exists(options_.tmp_folder + "/3_metadata.dat") );
	EXPECT_EQ( pmf(1,1), -1.0 );
}


TEST_F(PmfUpdaterTest, SolverFailureLeavesPmfUnchanged)
{
	state_.accessPmf().assign(5.0);

	auto* launcher = new FakeLauncher(2);
	PmfUpdater updater( config_, options_, std::unique_ptr<ProcessLauncher>(launcher) );

	EXPECT_THROW( updater.calculateNewPmf(state_), SolverError );
	EXPECT_EQ( launcher->getNumCalls(), 1 );
	for ( const double value : state_.getPmf() ) {
		EXPECT_EQ( value, 5.0 );
	}
}


TEST_F(PmfUpdaterTest, MissingOutputLeavesPmfUnchanged)
{
	state_.accessPmf().assign(5.0);

	// Exits cleanly without writing anything
	auto* launcher = new FakeLauncher(0);
	PmfUpdater updater( config_, options_, std::unique_ptr<ProcessLauncher>(launcher) );

	EXPECT_THROW( updater.calculateNewPmf(state_), MissingFileError );
	EXPECT_EQ( state_.getPmf()(0,0), 5.0 );
}


TEST_F(PmfUpdaterTest, NoSampledWindows)
{
	Matrix<int> counts(3, 3);
	counts.assign(0);
	UmbrellaState empty_state(grid_, counts);

	// Cached output does not help: the borders are still needed
	FileSystem::createDirectories(options_.tmp_folder);
	writeFile( options_.tmp_folder + "/0_freeenergy.dat", wham_output_ );

	auto* launcher = new FakeLauncher(0, wham_output_);
	PmfUpdater updater( config_, options_, std::unique_ptr<ProcessLauncher>(launcher) );

	EXPECT_THROW( updater.calculateNewPmf(empty_state), EmptyDataError );
	EXPECT_EQ( launcher->getNumCalls(), 0 );
}

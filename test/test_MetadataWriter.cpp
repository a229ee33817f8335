#include <gtest/gtest.h>

#include "FileSystem.h"
#include "MetadataWriter.h"
#include "TestUtils.h"

using numeric::Matrix;


class MetadataWriterTest : public ::testing::Test
{
 protected:
	MetadataWriterTest():
		layout_( tmp_.join("simulations") )
	{
		config_.fc_x = 500.0;
		config_.fc_y = 250.0;
	}

	TempDirectory    tmp_;
	SimulationLayout layout_;
	WhamConfig       config_;
};


TEST_F(MetadataWriterTest, WindowPaths)
{
	EXPECT_EQ( layout_.getWindowDirectory(0.5, -1.0), tmp_.join("simulations/umb_0.5_-1.0") );
	EXPECT_EQ( layout_.getColvarFile(1.0, 2.0), tmp_.join("simulations/umb_1.0_2.0/COLVAR") );

	SimulationLayout custom("sims", "cv.dat");
	EXPECT_EQ( custom.getColvarFile(0.25, 0.0), "sims/umb_0.25_0.0/cv.dat" );
}


TEST_F(MetadataWriterTest, SkipsWindowsWithoutColvarFiles)
{
	writeFile( layout_.getColvarFile(0.0, 0.5), "# time x y\n" );
	writeFile( layout_.getColvarFile(1.5, 0.5), "# time x y\n" );

	MetadataWriter writer( tmp_.join("WHAM"), layout_, config_ );
	const std::string metadata_file = tmp_.join("metadata.dat");
	const std::vector<MetadataWriter::Real2> lambdas = { {{ 0.0, 0.5 }}, {{ 1.0, 0.5 }}, {{ 1.5, 0.5 }} };
	const int num_written = writer.write(metadata_file, lambdas);
	EXPECT_EQ( num_written, 2 );

	const auto lines = readLines(metadata_file);
	ASSERT_EQ( lines.size(), 2u );
	EXPECT_EQ( lines[0], layout_.getColvarFile(0.0, 0.5) + "\t0.0\t0.5\t500.0\t250.0" );
	EXPECT_EQ( lines[1], layout_.getColvarFile(1.5, 0.5) + "\t1.5\t0.5\t500.0\t250.0" );

	// Rewriting replaces the old contents
	const std::vector<MetadataWriter::Real2> missing = { {{ 1.0, 0.5 }} };
	EXPECT_EQ( writer.write(metadata_file, missing), 0 );
	EXPECT_EQ( readFile(metadata_file), "" );
}


TEST_F(MetadataWriterTest, CreateMetadataFileForState)
{
	LambdaGrid grid( LambdaAxis(0.0, 1.0, 0.5), LambdaAxis(0.0, 1.0, 0.5) );
	Matrix<int> counts(3, 3);
	counts.assign(0);
	counts(0,2) = 10;
	counts(2,1) = 3;
	UmbrellaState state(grid, counts, 4);

	writeFile( layout_.getColvarFile(0.0, 1.0), "" );
	writeFile( layout_.getColvarFile(1.0, 0.5), "" );
	writeFile( layout_.getColvarFile(0.5, 0.5), "" );  // not sampled

	const std::string wham_folder = tmp_.join("WHAM");
	FileSystem::createDirectories(wham_folder);
	MetadataWriter writer( wham_folder, layout_, config_ );

	EXPECT_EQ( writer.getMetadataFile(4), wham_folder + "/4_metadata.dat" );

	const std::string metadata_file = writer.createMetadataFile(state);
	EXPECT_EQ( metadata_file, writer.getMetadataFile(4) );

	const auto lines = readLines(metadata_file);
	ASSERT_EQ( lines.size(), 2u );
	EXPECT_EQ( lines[0], layout_.getColvarFile(0.0, 1.0) + "\t0.0\t1.0\t500.0\t250.0" );
	EXPECT_EQ( lines[1], layout_.getColvarFile(1.0, 0.5) + "\t1.0\t0.5\t500.0\t250.0" );
}

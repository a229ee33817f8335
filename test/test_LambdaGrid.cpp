#include <sstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include "InputParser.h"
#include "LambdaGrid.h"


TEST(LambdaAxis, IncludesTheMaximum)
{
	LambdaAxis axis(0.0, 1.0, 0.1, "x");
	EXPECT_EQ( axis.getName(), "x" );
	ASSERT_EQ( axis.getNumLambdas(), 11 );
	EXPECT_DOUBLE_EQ( axis.indexToLambda(0), 0.0 );
	EXPECT_DOUBLE_EQ( axis.indexToLambda(10), 1.0 );
	EXPECT_DOUBLE_EQ( axis.getMax(), 1.0 );
	EXPECT_DOUBLE_EQ( axis.indexToLambda(3), 0.3 );

	// A single window
	LambdaAxis point(-0.5, -0.5, 0.25);
	EXPECT_EQ( point.getNumLambdas(), 1 );
}


TEST(LambdaAxis, InvalidSettings)
{
	EXPECT_THROW( LambdaAxis(0.0, 1.0, 0.0),  std::runtime_error );
	EXPECT_THROW( LambdaAxis(0.0, 1.0, -0.1), std::runtime_error );
	EXPECT_THROW( LambdaAxis(1.0, 0.0, 0.1),  std::runtime_error );
}


TEST(LambdaGrid, FromParameterPack)
{
	std::stringstream ss(
		"CollectiveVariable = { name = x  min = 0.0  max = 1.0  step = 0.5 }\n"
		"CollectiveVariable = { name = y  min = -1.0 max = 1.0  step = 0.25 }\n"
	);
	ParameterPack pack;
	InputParser().parse(ss, pack);

	LambdaGrid grid(pack);
	EXPECT_EQ( grid.get_x().getName(), "x" );
	EXPECT_EQ( grid.get_y().getName(), "y" );

	const auto shape = grid.getShape();
	EXPECT_EQ( shape[0], 3 );
	EXPECT_EQ( shape[1], 9 );

	const auto steps = grid.getSteps();
	EXPECT_DOUBLE_EQ( steps[0], 0.5 );
	EXPECT_DOUBLE_EQ( steps[1], 0.25 );

	const auto lambdas = grid.indexToLambdas(2, 1);
	EXPECT_DOUBLE_EQ( lambdas[0], 1.0 );
	EXPECT_DOUBLE_EQ( lambdas[1], -0.75 );
}


TEST(LambdaGrid, RequiresTwoCollectiveVariables)
{
	std::stringstream ss("CollectiveVariable = { min = 0.0  max = 1.0  step = 0.5 }\n");
	ParameterPack pack;
	InputParser().parse(ss, pack);
	EXPECT_THROW( LambdaGrid grid(pack), std::runtime_error );

	ParameterPack empty_pack;
	EXPECT_THROW( LambdaGrid grid(empty_pack), std::runtime_error );
}

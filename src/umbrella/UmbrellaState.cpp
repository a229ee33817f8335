#include "UmbrellaState.h"

#include <limits>

#include "Assert.hpp"


UmbrellaState::UmbrellaState(
	const LambdaGrid& lambda_grid, const Matrix<int>& sample_counts, const int iteration
):
	lambda_grid_(lambda_grid),
	sample_counts_(sample_counts),
	iteration_(iteration)
{
	const auto shape = lambda_grid_.getShape();
	const auto counts_shape = sample_counts_.getShape();
	FANCY_ASSERT( counts_shape == shape,
		"sample counts have shape (" << counts_shape[0] << "," << counts_shape[1] << "), "
		<< "but the lambda grid has shape (" << shape[0] << "," << shape[1] << ")" );
	FANCY_ASSERT( iteration_ >= 0, "invalid iteration: " << iteration_ );

	pmf_.assign( shape, std::numeric_limits<double>::infinity() );
}


std::vector<UmbrellaState::Real2> UmbrellaState::getSampledLambdas() const
{
	std::vector<Real2> lambdas;

	const int num_x = sample_counts_.getNumRows();
	const int num_y = sample_counts_.getNumCols();
	for ( int ix=0; ix<num_x; ++ix ) {
		for ( int iy=0; iy<num_y; ++iy ) {
			if ( sample_counts_(ix,iy) != 0 ) {
				lambdas.push_back( lambda_grid_.indexToLambdas(ix, iy) );
			}
		}
	}

	return lambdas;
}

#include "WhamBorders.h"

#include <algorithm>
#include <limits>

#include "Assert.hpp"
#include "Errors.h"


WhamBorders findWhamBorders(const numeric::Matrix<int>& sample_counts, const LambdaGrid& lambda_grid)
{
	const auto shape = lambda_grid.getShape();
	FANCY_ASSERT( sample_counts.getShape() == shape, "sample counts do not match the lambda grid" );

	// Index-space bounding box of all sampled windows
	int ix_min = std::numeric_limits<int>::max(),    iy_min = std::numeric_limits<int>::max();
	int ix_max = std::numeric_limits<int>::lowest(), iy_max = std::numeric_limits<int>::lowest();
	bool found = false;
	for ( int ix=0; ix<shape[0]; ++ix ) {
		for ( int iy=0; iy<shape[1]; ++iy ) {
			if ( sample_counts(ix,iy) != 0 ) {
				ix_min = std::min(ix_min, ix);  ix_max = std::max(ix_max, ix);
				iy_min = std::min(iy_min, iy);  iy_max = std::max(iy_max, iy);
				found = true;
			}
		}
	}
	if ( ! found ) {
		throw EmptyDataError("unable to determine WHAM borders: no window has any sampled frames");
	}

	const auto lower = lambda_grid.indexToLambdas(ix_min, iy_min);
	const auto upper = lambda_grid.indexToLambdas(ix_max, iy_max);
	const auto steps = lambda_grid.getSteps();

	// Pad by 2 lambda steps
	WhamBorders borders;
	borders.min_x = lower[0] - 2.0*steps[0];
	borders.min_y = lower[1] - 2.0*steps[1];
	borders.max_x = upper[0] + 2.0*steps[0];
	borders.max_y = upper[1] + 2.0*steps[1];

	return borders;
}

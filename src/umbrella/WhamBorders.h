#ifndef WHAM_BORDERS_H
#define WHAM_BORDERS_H

#include "LambdaGrid.h"
#include "Matrix.hpp"


// Region of CV space scanned by the WHAM solver
struct WhamBorders
{
	double min_x, min_y;
	double max_x, max_y;
};


// Returns the smallest axis-aligned box containing the lambdas of all windows
// with sampled frames, widened by 2 lambda steps on every side
// - Throws EmptyDataError if no window has any samples
WhamBorders findWhamBorders(
	const numeric::Matrix<int>& sample_counts,
	const LambdaGrid&           lambda_grid
);

#endif // ifndef WHAM_BORDERS_H

#ifndef GRID_PROJECTOR_H
#define GRID_PROJECTOR_H

#include <vector>

#include "LambdaGrid.h"
#include "Matrix.hpp"
#include "WhamOutput.h"


// Maps the solver's free energy surface back onto the lambda grid
//
// For the window at (lambda_x, lambda_y), only solver points with
//   |x - lambda_x| < step_x  and  |y - lambda_y| < step_y
// are candidates. The PMF there is the free energy of the candidate closest
// to (lambda_x, lambda_y), or +inf if there are no candidates.
// - Exact ties in distance go to the point with the lowest x, then the
//   lowest y (then the first one in the solver's output)
class GridProjector
{
 public:
	template<typename T>
	using Matrix = numeric::Matrix<T>;
	using Row    = WhamOutput::Row;

	GridProjector(const LambdaGrid& lambda_grid);

	// Overwrites every cell of 'pmf', which must have the shape of the lambda grid
	// - 'pmf' is only modified once all cells have been computed
	void project(const WhamOutput& wham_output, Matrix<double>& pmf) const;

	// Returns the PMF on the lambda grid
	Matrix<double> project(const WhamOutput& wham_output) const;

	// Returns the candidate closest to the window at (lambda_x, lambda_y), or
	// nullptr if there is none
	// - 'sorted_rows' must be sorted with sortRows()
	const Row* findNearestRow(
		const std::vector<Row>& sorted_rows,
		const double            lambda_x,
		const double            lambda_y
	) const;

	// Sorts by x, then y, preserving input order among identical points
	static std::vector<Row> sortRows(const std::vector<Row>& rows);

 private:
	LambdaGrid lambda_grid_;
	double step_x_, step_y_;
};

#endif // ifndef GRID_PROJECTOR_H

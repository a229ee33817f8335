#include "GridProjector.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "Assert.hpp"


GridProjector::GridProjector(const LambdaGrid& lambda_grid):
	lambda_grid_(lambda_grid),
	step_x_( lambda_grid.get_x().getStep() ),
	step_y_( lambda_grid.get_y().getStep() )
{}


std::vector<GridProjector::Row> GridProjector::sortRows(const std::vector<Row>& rows)
{
	std::vector<Row> sorted_rows(rows);
	std::stable_sort( sorted_rows.begin(), sorted_rows.end(),
		[](const Row& a, const Row& b) {
			return ( a.x < b.x ) || ( a.x == b.x && a.y < b.y );
		}
	);
	return sorted_rows;
}


const GridProjector::Row* GridProjector::findNearestRow(
	const std::vector<Row>& sorted_rows, const double lambda_x, const double lambda_y) const
{
	// Narrow the search with a (slightly wider) range in x, then apply
	// the exact window test to each point inside it
	const double x_lo = lambda_x - 2.0*step_x_;
	const double x_hi = lambda_x + 2.0*step_x_;
	auto it = std::lower_bound( sorted_rows.begin(), sorted_rows.end(), x_lo,
		[](const Row& row, const double x) { return row.x < x; } );

	const Row* nearest_ptr = nullptr;
	double min_dist = std::numeric_limits<double>::infinity();
	for ( ; it != sorted_rows.end() && it->x <= x_hi; ++it ) {
		const double dx = it->x - lambda_x;
		const double dy = it->y - lambda_y;
		if ( std::abs(dx) < step_x_ && std::abs(dy) < step_y_ ) {
			// Strict '<': among ties, the first point in sorted order wins
			const double dist = std::sqrt(dx*dx + dy*dy);
			if ( dist < min_dist ) {
				min_dist    = dist;
				nearest_ptr = &(*it);
			}
		}
	}

	return nearest_ptr;
}


void GridProjector::project(const WhamOutput& wham_output, Matrix<double>& pmf) const
{
	const auto shape = lambda_grid_.getShape();
	const auto pmf_shape = pmf.getShape();
	FANCY_ASSERT( pmf_shape == shape,
		"PMF has shape (" << pmf_shape[0] << "," << pmf_shape[1] << "), "
		<< "but the lambda grid has shape (" << shape[0] << "," << shape[1] << ")" );

	const auto sorted_rows = sortRows( wham_output.getRows() );
	const double inf = std::numeric_limits<double>::infinity();

	// Fill a buffer, then commit
	Matrix<double> buffer(shape[0], shape[1]);
	const int num_x = shape[0];
	const int num_y = shape[1];
	#pragma omp parallel for collapse(2) schedule(static)
	for ( int ix=0; ix<num_x; ++ix ) {
		for ( int iy=0; iy<num_y; ++iy ) {
			const auto lambdas = lambda_grid_.indexToLambdas(ix, iy);
			const Row* row_ptr = findNearestRow(sorted_rows, lambdas[0], lambdas[1]);
			buffer(ix,iy) = ( row_ptr != nullptr ) ? row_ptr->e : inf;
		}
	}

	pmf.swap(buffer);
}


GridProjector::Matrix<double> GridProjector::project(const WhamOutput& wham_output) const
{
	Matrix<double> pmf( lambda_grid_.getShape() );
	project(wham_output, pmf);
	return pmf;
}

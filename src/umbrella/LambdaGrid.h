#ifndef LAMBDA_GRID_H
#define LAMBDA_GRID_H

#include <array>

#include "InputParser.h"
#include "LambdaAxis.h"


// Two-dimensional grid of bias-window centers, one axis per collective variable
// - Maps index pairs (ix, iy) to lambda pairs (lambda_x, lambda_y)
class LambdaGrid
{
 public:
	static constexpr int N_DIM = 2;
	using Int2  = std::array<int,N_DIM>;
	using Real2 = std::array<double,N_DIM>;

	LambdaGrid() = default;

	LambdaGrid(const LambdaAxis& axis_x, const LambdaAxis& axis_y);

	// Expects exactly two "CollectiveVariable" packs: x first, then y
	LambdaGrid(const ParameterPack& input_pack);

	const LambdaAxis& get_x() const noexcept { return axis_x_; }
	const LambdaAxis& get_y() const noexcept { return axis_y_; }

	// Number of windows along each axis
	Int2 getShape() const {
		return {{ axis_x_.getNumLambdas(), axis_y_.getNumLambdas() }};
	}

	// Spacing between adjacent windows along each axis
	Real2 getSteps() const {
		return {{ axis_x_.getStep(), axis_y_.getStep() }};
	}

	Real2 indexToLambdas(const int ix, const int iy) const {
		return {{ axis_x_.indexToLambda(ix), axis_y_.indexToLambda(iy) }};
	}

 private:
	LambdaAxis axis_x_, axis_y_;
};

#endif // ifndef LAMBDA_GRID_H

#ifndef UMBRELLA_STATE_H
#define UMBRELLA_STATE_H

#include <array>
#include <vector>

#include "LambdaGrid.h"
#include "Matrix.hpp"


// Data from an umbrella-sampling run that the PMF update works on
// - Sample counts and the lambda grid are read-only here
// - The PMF is updated in place, and always has the same shape as the lambda grid
class UmbrellaState
{
 public:
	template<typename T>
	using Matrix = numeric::Matrix<T>;
	using Real2  = LambdaGrid::Real2;

	UmbrellaState() = default;

	// The PMF starts out unknown (+inf) everywhere
	UmbrellaState(
		const LambdaGrid&  lambda_grid,
		const Matrix<int>& sample_counts,
		const int          iteration = 0
	);

	const LambdaGrid& getLambdaGrid() const noexcept {
		return lambda_grid_;
	}

	// Number of frames sampled by the window at each lambda pair
	const Matrix<int>& getSampleCounts() const noexcept {
		return sample_counts_;
	}

	const Matrix<double>& getPmf() const noexcept {
		return pmf_;
	}
	Matrix<double>& accessPmf() noexcept {
		return pmf_;
	}

	// Counter of PMF updates (used to name per-iteration files)
	int getIteration() const noexcept {
		return iteration_;
	}

	// Lambda pairs of all windows with sampled frames, in row-major index order
	std::vector<Real2> getSampledLambdas() const;

 private:
	LambdaGrid     lambda_grid_;
	Matrix<int>    sample_counts_;
	Matrix<double> pmf_;
	int            iteration_ = 0;
};

#endif // ifndef UMBRELLA_STATE_H

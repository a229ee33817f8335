#ifndef LAMBDA_AXIS_H
#define LAMBDA_AXIS_H

#include <string>

#include "InputParser.h"


// The bias-window centers (lambdas) along one collective variable
// - Evenly spaced: lambda(i) = min + i*step, for i = 0, ..., num_lambdas-1
// - The maximum is included, so num_lambdas = round((max - min)/step) + 1
class LambdaAxis
{
 public:
	//----- Setup -----//

	LambdaAxis();

	LambdaAxis(
		const double min,
		const double max,
		const double step,
		const std::string& name = ""
	);

	// Reads 'name' (optional), 'min', 'max', and 'step'
	LambdaAxis(const ParameterPack& input_pack);


	//----- Settings -----//

	const std::string& getName() const noexcept {
		return name_;
	}

	int getNumLambdas() const noexcept {
		return num_lambdas_;
	}

	// Spacing between adjacent windows
	double getStep() const noexcept {
		return step_;
	}

	double getMin() const noexcept {
		return min_;
	}

	double getMax() const noexcept {
		return max_;
	}


	//----- Lambda values -----//

	// Center of the window with the given index (no bounds check)
	double indexToLambda(const int i) const noexcept {
		return min_ + i*step_;
	}


	//----- Set -----//

	void setLambdas(
		const double min,
		const double max,
		const double step
	);

 private:
	std::string name_;
	double min_, max_, step_;
	int num_lambdas_;
};

#endif // ifndef LAMBDA_AXIS_H

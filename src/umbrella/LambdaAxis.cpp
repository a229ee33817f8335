#include "LambdaAxis.h"

#include <cmath>
#include <stdexcept>


LambdaAxis::LambdaAxis():
	name_(""), min_(0.0), max_(0.0), step_(1.0), num_lambdas_(0)
{}


LambdaAxis::LambdaAxis(
	const double min, const double max, const double step, const std::string& name
):
	name_(name)
{
	setLambdas(min, max, step);
}


LambdaAxis::LambdaAxis(const ParameterPack& input_pack)
{
	using KeyType = ParameterPack::KeyType;

	input_pack.readString("name", KeyType::Optional, name_);

	double min, max, step;
	input_pack.readNumber("min",  KeyType::Required, min);
	input_pack.readNumber("max",  KeyType::Required, max);
	input_pack.readNumber("step", KeyType::Required, step);

	setLambdas(min, max, step);
}


void LambdaAxis::setLambdas(const double min, const double max, const double step)
{
	// Check input
	if ( ! (step > 0.0) || ! std::isfinite(step) ) {
		throw std::runtime_error("error in LambdaAxis::setLambdas: the step must be positive");
	}
	else if ( ! std::isfinite(min) || ! std::isfinite(max) ) {
		throw std::runtime_error("error in LambdaAxis::setLambdas: min and max must be finite");
	}
	else if ( min > max ) {
		throw std::runtime_error("error in LambdaAxis::setLambdas: min must not be greater than max");
	}

	min_  = min;
	max_  = max;
	step_ = step;

	num_lambdas_ = static_cast<int>( std::lround((max_ - min_)/step_) ) + 1;
}

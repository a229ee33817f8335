#include "WhamConfig.h"

#include <cmath>

#include "Assert.hpp"
#include "StringTools.h"


WhamConfig::WhamConfig(const ParameterPack& input_pack)
{
	using KeyType = ParameterPack::KeyType;

	input_pack.readString("Executable", KeyType::Optional, executable);

	input_pack.readNumber("Px", KeyType::Optional, Px);
	input_pack.readNumber("Py", KeyType::Optional, Py);

	input_pack.readNumber("NumBinsX", KeyType::Required, num_bins_x);
	input_pack.readNumber("NumBinsY", KeyType::Required, num_bins_y);

	input_pack.readNumber("Tolerance",   KeyType::Required, tolerance);
	input_pack.readNumber("Temperature", KeyType::Required, temperature);

	input_pack.readString("Mask", KeyType::Optional, mask);

	input_pack.readNumber("ForceConstantX", KeyType::Required, fc_x);
	input_pack.readNumber("ForceConstantY", KeyType::Required, fc_y);

	validate();
}


void WhamConfig::validate() const
{
	FANCY_ASSERT( ! StringTools::isBlank(executable), "no WHAM executable was given" );

	FANCY_ASSERT( std::isfinite(Px) && std::isfinite(Py),
		"invalid periodicity: Px = " << Px << ", Py = " << Py );

	FANCY_ASSERT( num_bins_x > 0, "invalid number of bins along x: " << num_bins_x );
	FANCY_ASSERT( num_bins_y > 0, "invalid number of bins along y: " << num_bins_y );

	FANCY_ASSERT( tolerance > 0.0 && std::isfinite(tolerance), "invalid tolerance: " << tolerance );
	FANCY_ASSERT( temperature > 0.0 && std::isfinite(temperature), "invalid temperature: " << temperature );

	FANCY_ASSERT( ! mask.empty() && StringTools::split(mask).size() == 1,
		"mask must be a single token, got \"" << mask << "\"" );

	FANCY_ASSERT( fc_x >= 0.0 && std::isfinite(fc_x), "invalid force constant along x: " << fc_x );
	FANCY_ASSERT( fc_y >= 0.0 && std::isfinite(fc_y), "invalid force constant along y: " << fc_y );
}

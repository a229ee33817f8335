#include "LambdaGrid.h"

#include "Assert.hpp"


LambdaGrid::LambdaGrid(const LambdaAxis& axis_x, const LambdaAxis& axis_y):
	axis_x_(axis_x), axis_y_(axis_y)
{}


LambdaGrid::LambdaGrid(const ParameterPack& input_pack)
{
	using KeyType = ParameterPack::KeyType;

	auto cv_pack_ptrs = input_pack.findParameterPacks("CollectiveVariable", KeyType::Required);
	const int num_cvs = cv_pack_ptrs.size();
	FANCY_ASSERT( num_cvs == N_DIM, "expected " << N_DIM << " collective variables, got " << num_cvs );

	axis_x_ = LambdaAxis( *(cv_pack_ptrs[0]) );
	axis_y_ = LambdaAxis( *(cv_pack_ptrs[1]) );
}

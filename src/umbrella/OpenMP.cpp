#include "OpenMP.h"

namespace OpenMP {


int get_max_threads()
{
#ifdef _OPENMP
	return omp_get_max_threads();
#else
	return 1;
#endif
}

} // end namespace OpenMP

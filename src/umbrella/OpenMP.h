// OpenMP: thin wrappers that also behave sensibly when OpenMP is disabled

#pragma once
#ifndef OPEN_MP_H
#define OPEN_MP_H

#ifdef _OPENMP
#  include <omp.h>
#endif

namespace OpenMP {

// Whether the code was compiled with OpenMP
constexpr bool is_enabled() {
#ifdef _OPENMP
	return true;
#else
	return false;
#endif
}

// Max. number of threads available to a parallel region
int get_max_threads();

} // end namespace OpenMP

#endif // ifndef OPEN_MP_H

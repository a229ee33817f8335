// Assertions that throw instead of aborting
// - The message may be built with stream insertion:
//     FANCY_ASSERT( n > 0, "got " << n << " windows" );

#pragma once
#ifndef ASSERT_HPP
#define ASSERT_HPP

#include <sstream>
#include <stdexcept>
#include <string>

#include "utils.h"

#define FANCY_ASSERT(test,message) \
	if ( ! (test) ) { \
		std::stringstream fancy_assert_ss; \
		fancy_assert_ss << "assertion failed in " << FANCY_FUNCTION << "\n" \
		                << "  " << message << "\n" \
		                << "  test: " STRINGIFY(test) "\n"; \
		throw std::runtime_error( fancy_assert_ss.str() ); \
	}

// Only checked in debug builds
#ifndef NDEBUG
#  define FANCY_DEBUG_ASSERT(test,message) FANCY_ASSERT(test,message)
#else
#  define FANCY_DEBUG_ASSERT(test,message)
#endif

#endif // ifndef ASSERT_HPP

#include "StringTools.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace StringTools {


std::vector<std::string> split(const std::string& str)
{
	std::vector<std::string> tokens;
	std::stringstream ss(str);
	std::string token;
	while ( ss >> token ) {
		tokens.push_back(token);
	}
	return tokens;
}


bool isBlank(const std::string& str)
{
	return std::all_of( str.begin(), str.end(),
		[](const char c) { return std::isspace(static_cast<unsigned char>(c)); } );
}


std::string toLowerCase(const std::string& str)
{
	std::string lower(str);
	std::transform( lower.begin(), lower.end(), lower.begin(),
		[](const char c) { return static_cast<char>( std::tolower(static_cast<unsigned char>(c)) ); } );
	return lower;
}


bool stringToDouble(const std::string& token, double& value)
{
	if ( token.empty() ) {
		return false;
	}

	std::size_t num_parsed = 0;
	try {
		value = std::stod(token, &num_parsed);
	}
	catch ( const std::invalid_argument& ) {
		return false;
	}
	catch ( const std::out_of_range& ) {
		// Denormals and overflow: std::strtod still produces the closest value
		char* end = nullptr;
		value = std::strtod(token.c_str(), &end);
		return ( end == token.c_str() + token.size() );
	}

	return ( num_parsed == token.size() );
}


std::string formatReal(const double x)
{
	if ( ! std::isfinite(x) ) {
		if ( std::isnan(x) ) {
			return "nan";
		}
		return ( x > 0.0 ) ? "inf" : "-inf";
	}

	// Find the fewest significant digits that survive a round trip
	std::string sci;
	int num_digits = 1;
	for ( ; num_digits <= std::numeric_limits<double>::max_digits10; ++num_digits ) {
		std::ostringstream ss;
		ss << std::scientific << std::setprecision(num_digits - 1) << x;
		sci = ss.str();
		if ( std::strtod(sci.c_str(), nullptr) == x ) {
			break;
		}
	}
	num_digits = std::min(num_digits, std::numeric_limits<double>::max_digits10);

	// Very large and very small magnitudes stay in scientific notation
	const int exponent = std::stoi( sci.substr(sci.find('e') + 1) );
	if ( exponent < -4 || exponent >= 16 ) {
		return sci;
	}

	std::ostringstream ss;
	ss << std::fixed << std::setprecision( std::max(num_digits - 1 - exponent, 0) ) << x;
	std::string str = ss.str();
	if ( str.find('.') == std::string::npos ) {
		str += ".0";
	}
	return str;
}

} // end namespace StringTools

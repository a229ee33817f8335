#include "WhamOutput.h"

#include <cmath>
#include <fstream>
#include <sstream>

#include "Assert.hpp"
#include "Errors.h"
#include "StringTools.h"


WhamOutput::WhamOutput(const std::vector<Row>& rows):
	rows_(rows)
{
	for ( const auto& row : rows_ ) {
		FANCY_ASSERT( std::isfinite(row.x) && std::isfinite(row.y), "point with non-finite coordinates" );
		FANCY_ASSERT( std::isfinite(row.e), "free energy at (" << row.x << "," << row.y << ") is not finite" );
	}
}


WhamOutput WhamOutput::FromFile(const std::string& file_name)
{
	std::ifstream ifs(file_name);
	if ( not ifs.is_open() ) {
		throw MissingFileError(file_name, "Failed to open WHAM output file \'" + file_name + "\'");
	}

	const int num_cols = 4;
	WhamOutput output;

	std::string line;
	int line_number = 0;
	std::getline(ifs, line);  // header
	++line_number;

	std::vector<std::string> tokens;
	double values[num_cols];
	while ( std::getline(ifs, line) ) {
		++line_number;

		// wham-2d separates blocks of constant x with blank lines
		tokens = StringTools::split(line);
		if ( tokens.empty() || tokens.front()[0] == '#' ) {
			continue;
		}

		const int num_tokens = tokens.size();
		if ( num_tokens != num_cols ) {
			std::stringstream err_ss;
			err_ss << file_name << ":" << line_number << ": expected " << num_cols
			       << " columns (x y e pro), found " << num_tokens;
			throw ParseError( err_ss.str() );
		}
		for ( int k=0; k<num_cols; ++k ) {
			if ( ! StringTools::stringToDouble(tokens[k], values[k]) ) {
				std::stringstream err_ss;
				err_ss << file_name << ":" << line_number << ": \"" << tokens[k] << "\" is not a number";
				throw ParseError( err_ss.str() );
			}
		}

		if ( ! std::isfinite(values[0]) || ! std::isfinite(values[1]) ) {
			std::stringstream err_ss;
			err_ss << file_name << ":" << line_number << ": coordinates must be finite";
			throw ParseError( err_ss.str() );
		}

		// Unsampled region: the free energy there is unknown
		if ( ! std::isfinite(values[2]) ) {
			++output.num_unsampled_;
			continue;
		}

		output.rows_.push_back( Row{ values[0], values[1], values[2], values[3] } );
	}

	return output;
}

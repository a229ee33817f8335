/*	main.cpp
 *
 *	ABOUT: Updates the PMF of an adaptive umbrella-sampling run using wham-2d
 *	USAGE: umbrella_pmf <input_file>
 */

// Standard headers
#include <exception>
#include <iostream>
#include <string>

// Project headers
#include "../umbrella/UmbrellaPmfDriver.h"

int main(int argc, char* argv[]) 
{
	// Input checking
	if ( argc < 2 ) {
		std::cerr << "umbrella_pmf: Error - missing input file\n"
		          << "  usage: " << argv[0] << " <input_file>\n";
		return 1;
	}

	std::string options_file(argv[1]);

	//----- Update the PMF -----//

	try {
		UmbrellaPmfDriver driver(options_file);
		driver.run_driver();
	}
	catch ( const std::exception& ex ) {
		std::cerr << "umbrella_pmf: Error - " << ex.what() << "\n";
		return 1;
	}

	return 0;
}

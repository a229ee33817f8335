#pragma once
#ifndef WHAM_CONFIG_H
#define WHAM_CONFIG_H

#include <string>

#include "InputParser.h"


// Settings passed to the external 2D WHAM solver ('wham-2d')
// - See http://membrane.urmc.rochester.edu/sites/default/files/wham/doc.html
struct WhamConfig
{
	WhamConfig() = default;

	// Reads a "Wham" parameter pack and validates the result
	WhamConfig(const ParameterPack& input_pack);

	// Throws if any setting is out of range
	void validate() const;

	std::string executable = "wham-2d";

	double Px = 0.0;  // periodicity along x (0: not periodic)
	double Py = 0.0;  // periodicity along y

	int num_bins_x = 100;
	int num_bins_y = 100;

	double tolerance   = 1.0e-6;  // convergence tolerance of the solver
	double temperature = 300.0;   // [K]

	std::string mask = "0";  // 'use_mask' argument, passed through verbatim

	// Harmonic force constants of the bias, along x and y
	double fc_x = 0.0;
	double fc_y = 0.0;
};

#endif // ifndef WHAM_CONFIG_H

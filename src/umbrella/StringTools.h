// StringTools: misc. functions for working with strings

#pragma once
#ifndef STRING_TOOLS_H
#define STRING_TOOLS_H

#include <string>
#include <vector>

namespace StringTools {

// Splits a string into whitespace-delimited tokens
std::vector<std::string> split(const std::string& str);

// Returns true if the string contains only whitespace (or nothing at all)
bool isBlank(const std::string& str);

std::string toLowerCase(const std::string& str);

// Converts a token to a double
// - Accepts "inf", "-inf", and "nan" (as std::stod does)
// - Returns false if the token is not entirely a number
bool stringToDouble(const std::string& token, double& value);

// Formats a real number as the shortest decimal that reads back as the
// same double (1 -> "1.0", 0.1 -> "0.1", 1e20 -> "1e+20")
// - Fixed notation always carries at least one fractional digit
std::string formatReal(const double x);

} // end namespace StringTools

#endif // ifndef STRING_TOOLS_H

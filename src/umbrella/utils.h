// Miscellaneous macros

#ifndef UTILS_H
#define UTILS_H

#include <string>

// Convert 'x' to a string using arcane preprocessor tricks
#define STRINGIFY(x) #x
#define TO_STRING(x) STRINGIFY(x)

// Prints the file name and line number where it's expanded
#define LOCATION_IN_SOURCE __FILE__ ":" TO_STRING(__LINE__)

// Prints the "pretty" name of the function along in which the macro is expanded,
// along with the associated file name and line number
#define FANCY_FUNCTION std::string(__PRETTY_FUNCTION__) + " (" LOCATION_IN_SOURCE ")"

#endif // ifndef UTILS_H

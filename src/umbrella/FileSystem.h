#ifndef FILE_SYSTEM_H
#define FILE_SYSTEM_H

#include <string>

// Misc. functions related to manipulating files
// - POSIX only
namespace FileSystem {

// Returns the directory separator
char separator() noexcept;

// Concatenates the paths
std::string join(const std::string& left, const std::string& right);

// Get the directory which contains the given path
// - Taken from
//     C++ Cookbook by Jeff Cogswell, Jonathan Turkanis, Christopher Diggins, D. Ryan Stephens
std::string dirname(const std::string& full_path);

// Returns true if the path is with respect to the filesystem root
bool isAbsolutePath(const std::string& path);

/// Resolves a (possibly relative) path
/// @param rel_path  path to resolve (may be *relative* to base_path)
/// @param base_path used to resolve relative baths (acts like '.')
/// - Unlike 'realpath', the target does not need to exist yet
std::string resolveRelativePath(const std::string& rel_path, const std::string& base_path);

// Whether anything (file, directory, ...) exists at the path
bool exists(const std::string& path);

bool isDirectory(const std::string& path);

// Creates a directory along with any missing parents (like 'mkdir -p')
// - Throws if a directory can't be created
void createDirectories(const std::string& path);

} // end namespace FileSystem

#endif // ifndef FILE_SYSTEM_H

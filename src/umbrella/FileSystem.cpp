#include "FileSystem.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <sys/stat.h>
#include <sys/types.h>

#include "Assert.hpp"


namespace FileSystem {


char separator() noexcept
{
	return '/';
}


std::string join(const std::string& left, const std::string& right)
{
	if ( left.empty() ) {
		return right;
	}
	if ( left.back() == separator() ) {
		return left + right;
	}
	return left + separator() + right;
}


std::string dirname(const std::string& full_path)
{
	size_t i = full_path.rfind(FileSystem::separator(), full_path.length());
	if ( i == 0 ) {
		return full_path.substr(0, 1);  // file in the root directory
	}
	else if ( i != std::string::npos ) {
		return full_path.substr(0, i);
	}
	else {
		return ".";
	}
}


bool isAbsolutePath(const std::string& path)
{
	FANCY_ASSERT( ! path.empty(), "no input provided" );
	return ( path.front() == FileSystem::separator() );
}


std::string resolveRelativePath(const std::string& rel_path, const std::string& base_path)
{
	if ( isAbsolutePath(rel_path) ) {
		return rel_path;
	}
	else {
		return join(base_path, rel_path);
	}
}


bool exists(const std::string& path)
{
	struct stat info;
	return ( ::stat(path.c_str(), &info) == 0 );
}


bool isDirectory(const std::string& path)
{
	struct stat info;
	if ( ::stat(path.c_str(), &info) != 0 ) {
		return false;
	}
	return S_ISDIR(info.st_mode);
}


void createDirectories(const std::string& path)
{
	FANCY_ASSERT( ! path.empty(), "no directory provided" );
	if ( isDirectory(path) ) {
		return;
	}

	// Create each missing component in turn
	std::size_t pos = 0;
	do {
		pos = path.find(separator(), pos + 1);
		const std::string partial = path.substr(0, pos);
		if ( partial.empty() || isDirectory(partial) ) {
			continue;
		}

		if ( ::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST ) {
			throw std::runtime_error("Failed to create directory \'" + partial + "\': "
			                         + std::strerror(errno));
		}
	} while ( pos != std::string::npos );

	FANCY_ASSERT( isDirectory(path), "\'" << path << "\' exists, but is not a directory" );
}

} // end namespace FileSystem

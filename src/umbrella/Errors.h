// Exceptions for failures that callers may want to tell apart

#pragma once
#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// No data to work with (e.g. no window has sampled frames)
class EmptyDataError : public std::runtime_error
{
 public:
	explicit EmptyDataError(const std::string& what): std::runtime_error(what) {}
};

// A required input file does not exist or can't be opened
class MissingFileError : public std::runtime_error
{
 public:
	MissingFileError(const std::string& file, const std::string& what):
		std::runtime_error(what), file_(file)
	{}

	const std::string& getFile() const noexcept { return file_; }

 private:
	std::string file_;
};

// Malformed contents in an input file
class ParseError : public std::runtime_error
{
 public:
	explicit ParseError(const std::string& what): std::runtime_error(what) {}
};

// The external solver could not be run, or exited with a nonzero status
class SolverError : public std::runtime_error
{
 public:
	SolverError(const int exit_code, const std::string& what):
		std::runtime_error(what), exit_code_(exit_code)
	{}

	int getExitCode() const noexcept { return exit_code_; }

 private:
	int exit_code_;
};

#endif // ifndef ERRORS_H

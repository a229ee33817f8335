#include "TestUtils.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <ftw.h>

#include "FileSystem.h"
#include "StringTools.h"


TempDirectory::TempDirectory()
{
	char path_template[] = "/tmp/umbrella_test_XXXXXX";
	if ( ::mkdtemp(path_template) == nullptr ) {
		throw std::runtime_error("unable to create a temporary directory");
	}
	path_ = path_template;
}


TempDirectory::~TempDirectory()
{
	auto remove_entry = [](const char* path, const struct stat*, int, struct FTW*) -> int {
		return std::remove(path);
	};
	::nftw(path_.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
}


std::string TempDirectory::join(const std::string& name) const
{
	return FileSystem::join(path_, name);
}


void writeFile(const std::string& file, const std::string& contents)
{
	FileSystem::createDirectories( FileSystem::dirname(file) );
	std::ofstream ofs(file);
	if ( ! ofs ) {
		throw std::runtime_error("unable to write " + file);
	}
	ofs << contents;
}


std::string readFile(const std::string& file)
{
	std::ifstream ifs(file);
	if ( ! ifs ) {
		throw std::runtime_error("unable to read " + file);
	}
	std::stringstream ss;
	ss << ifs.rdbuf();
	return ss.str();
}


std::vector<std::string> readLines(const std::string& file)
{
	std::stringstream ss( readFile(file) );
	std::vector<std::string> lines;
	std::string line;
	while ( std::getline(ss, line) ) {
		lines.push_back(line);
	}
	return lines;
}


int FakeLauncher::run(const std::string& command, const bool show_output)
{
	commands_.push_back(command);
	last_show_output_ = show_output;

	if ( exit_code_ == 0 && ! output_contents_.empty() ) {
		const auto tokens = StringTools::split(command);
		if ( tokens.size() >= 2 ) {
			writeFile( tokens[tokens.size() - 2], output_contents_ );
		}
	}

	return exit_code_;
}

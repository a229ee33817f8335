// InputParser and ParameterPack
//
// ABOUT: Reads simple hierarchical input files into nested ParameterPacks
//
// FORMAT:
//   # Comments run to the end of the line
//   Key      = value
//   PackKey  = {                          (may be repeated; order is preserved)
//     Key = value
//   }

#pragma once
#ifndef INPUT_PARSER_H
#define INPUT_PARSER_H

#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "Assert.hpp"
#include "StringTools.h"


class ParameterPack
{
 public:
	// Whether it is an error for a key to be missing
	enum class KeyType { Required, Optional };

	using ValuePair = std::pair<std::string, std::string>;

	ParameterPack(const std::string& pack_name = ""):
		name(pack_name)
	{}

	//----- Single values -----//

	// Each returns true if the key was found
	// - Throws if a required key is missing, or if the key is defined more than once
	bool readString(const std::string& key, const KeyType key_type, std::string& value) const;

	template<typename T>
	bool readNumber(const std::string& key, const KeyType key_type, T& value) const;

	// Accepts yes/no, true/false, on/off, and 1/0 (case-insensitive)
	bool readFlag(const std::string& key, const KeyType key_type, bool& value) const;

	//----- Nested packs -----//

	// Returns nullptr if an optional pack is absent
	const ParameterPack* findParameterPack(const std::string& key, const KeyType key_type) const;

	// All packs with the given key, in input order
	std::vector<const ParameterPack*> findParameterPacks(
		const std::string& key, const KeyType key_type
	) const;

	//----- Contents -----//

	std::string name;

	std::multimap<std::string, std::string> values;
	std::vector<ParameterPack>              parameter_packs;

 private:
	// Throws a descriptive exception for a missing required key
	[[noreturn]] void throwMissingKey(const std::string& key, const std::string& kind) const;

	// Name used in error messages
	std::string getDisplayName() const {
		return ( name.empty() ? std::string("(top level)") : name );
	}
};


template<typename T>
bool ParameterPack::readNumber(const std::string& key, const KeyType key_type, T& value) const
{
	static_assert(std::is_arithmetic<T>::value, "readNumber requires an arithmetic type");

	std::string token;
	if ( ! readString(key, key_type, token) ) {
		return false;
	}

	double x;
	FANCY_ASSERT( StringTools::stringToDouble(token, x),
		"parameter pack " << getDisplayName() << ": value of " << key
		<< " (\"" << token << "\") is not a number" );

	if ( std::is_integral<T>::value ) {
		FANCY_ASSERT( std::isfinite(x) && x == std::floor(x),
			"parameter pack " << getDisplayName() << ": value of " << key
			<< " (\"" << token << "\") is not an integer" );
		FANCY_ASSERT( x >= static_cast<double>(std::numeric_limits<T>::lowest()) &&
		              x <= static_cast<double>(std::numeric_limits<T>::max()),
			"parameter pack " << getDisplayName() << ": value of " << key
			<< " (\"" << token << "\") is out of range" );
	}

	value = static_cast<T>(x);
	return true;
}



class InputParser
{
 public:
	InputParser() = default;

	// Parses the file into 'parameter_pack' (whose contents are replaced)
	void parseFile(const std::string& input_file, ParameterPack& parameter_pack) const;

	// Parses a stream
	// - 'source' names the stream in error messages
	void parse(
		std::istream&      input,
		ParameterPack&     parameter_pack,
		const std::string& source = "input"
	) const;

 private:
	struct Token {
		std::string text;
		int line;
	};

	// Splits the input into tokens, treating '=', '{', and '}' as tokens of
	// their own and dropping comments
	std::vector<Token> tokenize(std::istream& input) const;

	// Reads "key = ..." entries until the input or the enclosing pack ends
	// - Returns the index of the first unconsumed token
	std::size_t parsePack(
		const std::vector<Token>& tokens,
		std::size_t               first,
		const bool                is_nested,
		ParameterPack&            pack,
		const std::string&        source
	) const;

	static bool isDelimiter(const std::string& text) {
		return ( text == "=" || text == "{" || text == "}" );
	}
};

#endif // ifndef INPUT_PARSER_H

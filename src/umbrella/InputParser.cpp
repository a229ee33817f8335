#include "InputParser.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "Errors.h"


//----- ParameterPack -----//


void ParameterPack::throwMissingKey(const std::string& key, const std::string& kind) const
{
	throw std::runtime_error("parameter pack " + getDisplayName() + ": missing required "
	                         + kind + " \"" + key + "\"");
}


bool ParameterPack::readString(const std::string& key, const KeyType key_type, std::string& value) const
{
	const auto num_found = values.count(key);
	if ( num_found == 0 ) {
		if ( key_type == KeyType::Required ) {
			throwMissingKey(key, "value");
		}
		return false;
	}
	FANCY_ASSERT( num_found == 1,
		"parameter pack " << getDisplayName() << ": " << key << " was defined more than once" );

	value = values.find(key)->second;
	return true;
}


bool ParameterPack::readFlag(const std::string& key, const KeyType key_type, bool& value) const
{
	std::string token;
	if ( ! readString(key, key_type, token) ) {
		return false;
	}

	const std::string lower = StringTools::toLowerCase(token);
	if ( lower == "yes" || lower == "true" || lower == "on" || lower == "1" ) {
		value = true;
	}
	else if ( lower == "no" || lower == "false" || lower == "off" || lower == "0" ) {
		value = false;
	}
	else {
		throw std::runtime_error("parameter pack " + getDisplayName() + ": value of " + key
		                         + " (\"" + token + "\") is not a valid flag");
	}
	return true;
}


const ParameterPack* ParameterPack::findParameterPack(const std::string& key, const KeyType key_type) const
{
	auto pack_ptrs = findParameterPacks(key, key_type);
	if ( pack_ptrs.empty() ) {
		return nullptr;
	}
	FANCY_ASSERT( pack_ptrs.size() == 1,
		"parameter pack " << getDisplayName() << ": " << key << " was defined more than once" );
	return pack_ptrs.front();
}


std::vector<const ParameterPack*> ParameterPack::findParameterPacks(
	const std::string& key, const KeyType key_type) const
{
	std::vector<const ParameterPack*> pack_ptrs;
	for ( const auto& pack : parameter_packs ) {
		if ( pack.name == key ) {
			pack_ptrs.push_back( &pack );
		}
	}

	if ( pack_ptrs.empty() && key_type == KeyType::Required ) {
		throwMissingKey(key, "parameter pack");
	}
	return pack_ptrs;
}


//----- InputParser -----//


void InputParser::parseFile(const std::string& input_file, ParameterPack& parameter_pack) const
{
	std::ifstream ifs(input_file);
	if ( not ifs.is_open() ) {
		throw MissingFileError(input_file, "Failed to open input file \'" + input_file + "\'");
	}
	parse(ifs, parameter_pack, input_file);
}


void InputParser::parse(std::istream& input, ParameterPack& parameter_pack, const std::string& source) const
{
	const auto tokens = tokenize(input);

	ParameterPack pack(parameter_pack.name);
	std::size_t pos = parsePack(tokens, 0, false, pack, source);
	FANCY_ASSERT( pos == tokens.size(), "unexpected trailing input in " << source );

	parameter_pack = std::move(pack);
}


std::vector<InputParser::Token> InputParser::tokenize(std::istream& input) const
{
	std::vector<Token> tokens;

	const char comment_char = '#';
	std::string line;
	int line_number = 0;
	while ( std::getline(input, line) ) {
		++line_number;

		// Strip comments
		auto comment_pos = line.find(comment_char);
		if ( comment_pos != std::string::npos ) {
			line.erase(comment_pos);
		}

		// Pad delimiters with spaces so that "key=value" splits cleanly
		std::string padded;
		padded.reserve( line.size() );
		for ( const char c : line ) {
			if ( isDelimiter(std::string(1, c)) ) {
				padded += ' ';
				padded += c;
				padded += ' ';
			}
			else {
				padded += c;
			}
		}

		for ( const auto& text : StringTools::split(padded) ) {
			tokens.push_back( Token{ text, line_number } );
		}
	}

	return tokens;
}


std::size_t InputParser::parsePack(
	const std::vector<Token>& tokens, std::size_t first, const bool is_nested,
	ParameterPack& pack, const std::string& source) const
{
	const std::size_t num_tokens = tokens.size();
	auto where = [&](const std::size_t i) {
		std::stringstream ss;
		ss << source << ":" << ( i < num_tokens ? tokens[i].line : tokens.back().line );
		return ss.str();
	};

	std::size_t i = first;
	while ( i < num_tokens ) {
		const auto& key = tokens[i].text;
		if ( key == "}" ) {
			if ( is_nested ) {
				return i;  // caller consumes the brace
			}
			throw ParseError(where(i) + ": unmatched \'}\'");
		}
		if ( isDelimiter(key) ) {
			throw ParseError(where(i) + ": expected a key, got \'" + key + "\'");
		}

		++i;
		if ( i >= num_tokens || tokens[i].text != "=" ) {
			throw ParseError(where(i) + ": expected \'=\' after \'" + key + "\'");
		}

		++i;
		if ( i >= num_tokens ) {
			throw ParseError(where(i) + ": missing value for \'" + key + "\'");
		}

		const auto& value = tokens[i].text;
		if ( value == "{" ) {
			ParameterPack child(key);
			i = parsePack(tokens, i+1, true, child, source);
			if ( i >= num_tokens || tokens[i].text != "}" ) {
				throw ParseError(where(i) + ": missing \'}\' for parameter pack \'" + key + "\'");
			}
			pack.parameter_packs.push_back( std::move(child) );
			++i;
		}
		else if ( isDelimiter(value) ) {
			throw ParseError(where(i) + ": unexpected \'" + value + "\' after \'" + key + " =\'");
		}
		else {
			pack.values.insert( ParameterPack::ValuePair(key, value) );
			++i;
		}
	}

	if ( is_nested ) {
		throw ParseError(where(i) + ": missing \'}\' for parameter pack \'" + pack.name + "\'");
	}
	return i;
}

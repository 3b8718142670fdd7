#pragma once

#include <optional>
#include <ostream>
#include <string>
#include "options.hpp"

namespace CommandLine
{
	/// @brief Parses the plugin arguments with getopt_long
	/// @param ErrorMessage Receives the reason when parsing fails
	/// @return std::nullopt on an unknown option, a missing argument or a non-numeric port
	std::optional<CheckOptions> Parse(int argc, char *argv[], std::string &ErrorMessage);

	void PrintUsage(std::ostream &Output);
}

#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include "logwriter.hpp"
#include "options.hpp"

class Configuration
{
public:
	CheckOptions FileOptions{};
	long ConnectTimeoutSeconds{0};

	Configuration() = default;
	~Configuration() = default;

	/// @brief Loads the configuration file, if available. Otherwise, loads defaults. Generates a log writer based on the loaded configuration.
	/// @param ConfigFilePath File to read; a missing file is not an error
	/// @param LevelOverride Log level requested on the command line, replaces the configured level
	/// @param Console Stream console log entries go to
	/// @return std::unique_ptr<ILogWriter> The log writer to use for the duration of the program.
	std::unique_ptr<ILogWriter> Load(const std::string_view &ConfigFilePath, const std::optional<LogLevels> LevelOverride, std::ostream &Console);
};

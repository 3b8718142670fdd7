#pragma once

#include <optional>
#include <string>
#include <vector>
#include "expression.hpp"
#include "logwriter.hpp"
#include "pveclient.hpp"

/// @brief Options as given on the command line or in the configuration file, not yet validated
struct CheckOptions
{
	std::vector<std::string> Hosts{};
	std::vector<std::string> WarnStr{};
	std::vector<std::string> CritStr{};
	std::vector<std::string> Overrides{};
	std::optional<std::string> Password{};
	std::optional<std::string> UserName{};
	std::optional<std::string> Realm{};
	std::optional<std::string> Mode{};
	std::optional<std::string> Filter{};
	std::optional<std::string> ConfigFile{};
	std::optional<long> Port{};
	bool Insecure{false};
	bool Help{false};
	bool Debug{false};
	bool Verbose{false};
};

/// @brief Validated options with every expression and rule parsed
struct ProbeSettings
{
	std::vector<std::string> Hosts{};
	ClusterCredentials Credentials{};
	std::string Mode{};
	Expression Filter{};
	std::vector<RuleTriple> WarnRules{};
	std::vector<RuleTriple> CritRules{};
	std::vector<RuleTriple> Overrides{};
	bool Verbose{false};
};

/// @brief Lists are concatenated (file first), single values from CommandLine replace those from File
CheckOptions MergeOptions(const CheckOptions &File, const CheckOptions &CommandLine);

/// @return LogLevels::Debug for Debug, LogLevels::Info for Verbose, std::nullopt when neither is set
std::optional<LogLevels> GetRequestedLogLevel(const CheckOptions &Options);

/// @brief Applies defaults and parses every expression and rule
/// @param ErrorMessage Receives the reason when validation fails
/// @return std::nullopt when the options are unusable
std::optional<ProbeSettings> ValidateOptions(const CheckOptions &Options, const long ConnectTimeoutSeconds, std::string &ErrorMessage);

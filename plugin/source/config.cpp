#include <algorithm>
#include <concepts>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <vector>
#include "config_constants.hpp"
#include "config.hpp"
#include "logwriter.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

constexpr const std::string_view ConfigurationLoaded{"Configuration loaded"};

// log levels
static const std::map<const std::string_view, const LogLevels> LogLevelsMap{
	 {ConfigConstants::Values::debug, LogLevels::Debug},
	 {ConfigConstants::Values::info, LogLevels::Info},
	 {ConfigConstants::Values::warn, LogLevels::Warn},
	 {ConfigConstants::Values::error, LogLevels::Error},
	 {ConfigConstants::Values::fatal, LogLevels::Fatal}};

template <typename T>
concept has_size = requires(T t) {
	{ t.size() } -> std::convertible_to<std::size_t>;
};

template <typename T>
bool HasUsableValue(const T &Value)
{
	if constexpr (std::is_class_v<T>)
	{
		if constexpr (std::is_same_v<T, std::string>)
		{
			return !Value.empty();
		}
		else if constexpr (has_size<T>)
		{
			return Value.size() > 0;
		}
		else if constexpr (std::is_same_v<T, std::optional<typename T::value_type>>)
		{
			return Value.has_value() && HasUsableValue(Value.value());
		}
		else
		{
			static_assert(sizeof(T) == 0, "Unsupported type");
		}
	}
	else
	{
		return true; // means that T is a primitive, so about the only place this could be wrong is nullptr
	}
	return false; // unsure what the type is, so always return false
}

template <typename T>
void EmplaceIfNotExists(std::vector<std::string> &Vector, const std::optional<T> &OptVal)
{
	if (HasUsableValue(OptVal) && std::find(std::begin(Vector), std::end(Vector), OptVal.value()) == std::end(Vector))
	{
		Vector.emplace_back(OptVal.value());
	}
}

template <typename T>
void AppendIfUsable(std::vector<std::string> &Vector, const std::optional<T> &OptVal)
{
	if (HasUsableValue(OptVal))
	{
		Vector.emplace_back(OptVal.value());
	}
}

// accepts a single string or an array of strings. Unique drops repeated entries, otherwise order and repeats are kept
static std::vector<std::string> GetConfigurationList(const toml::table &TomlTable, const std::string_view &KeyName, const bool Unique)
{
	std::vector<std::string> OutVector{};
	auto Append{[&OutVector, Unique](const std::optional<std::string> &OptVal)
					{ Unique ? EmplaceIfNotExists(OutVector, OptVal) : AppendIfUsable(OutVector, OptVal); }};
	if (TomlTable.contains(KeyName))
	{
		if (TomlTable[KeyName].is_array())
		{
			for (const auto &element : *TomlTable[KeyName].as_array())
			{
				Append(element.value<std::string>());
			}
		}
		else if (TomlTable[KeyName].is_string())
		{
			Append(TomlTable[KeyName].value<std::string>());
		}
	}
	return OutVector;
}

template <typename ReturnType>
std::optional<ReturnType> GetConfigurationValue(const toml::table &TomlTable, const std::string_view &KeyName)
{
	auto OptVal{TomlTable[KeyName].value<ReturnType>()};
	return HasUsableValue(OptVal) ? OptVal : std::nullopt;
}

template <typename ReturnType, typename = std::enable_if<!std::is_class_v<ReturnType>>>
ReturnType GetConfigurationValueOrDefault(const toml::table &TomlTable, const std::string_view &KeyName, ReturnType DefaultValue)
{
	auto OptVal{TomlTable[KeyName].value<ReturnType>()};
	return HasUsableValue(OptVal) ? OptVal.value() : DefaultValue;
}

static const toml::table *GetSubTable(const toml::table &TomlConfig, const std::string_view &KeyName)
{
	return TomlConfig.contains(KeyName) ? TomlConfig[KeyName].as_table() : nullptr;
}

static std::unique_ptr<ILogWriter> GetLog(const toml::table &TomlLogConfig, const std::optional<LogLevels> LevelOverride, std::ostream &Console)
{
	bool LoggingEnabled{GetConfigurationValueOrDefault(TomlLogConfig, ConfigConstants::Fields::enabled, true)};

	if (LoggingEnabled || LevelOverride.has_value())
	{
		const std::string LogLevelString{GetConfigurationValueOrDefault(TomlLogConfig, ConfigConstants::Fields::level, ConfigConstants::DefaultValues::logLevel)};
		LogLevels LogLevel;
		if (LevelOverride.has_value())
		{
			LogLevel = LevelOverride.value();
		}
		else if (LogLevelsMap.contains(LogLevelString))
		{
			LogLevel = LogLevelsMap.at(LogLevelString);
		}
		else
		{
			LogLevel = LogLevels::Error;
		}
		const std::string LogFilePath{GetConfigurationValueOrDefault(TomlLogConfig, ConfigConstants::Fields::file, std::string_view{})};
		return LogWriterFactory::CreateLogWriter(LogLevel, Console, LogFilePath);
	}

	return LogWriterFactory::CreateEmptyLogWriter();
}

static CheckOptions GetCheckOptions(const toml::table &TomlCheckConfig)
{
	CheckOptions Options{};
	Options.Hosts = GetConfigurationList(TomlCheckConfig, ConfigConstants::Fields::host, true);
	Options.WarnStr = GetConfigurationList(TomlCheckConfig, ConfigConstants::Fields::warnstr, false);
	Options.CritStr = GetConfigurationList(TomlCheckConfig, ConfigConstants::Fields::critstr, false);
	Options.Overrides = GetConfigurationList(TomlCheckConfig, ConfigConstants::Fields::override, false);
	Options.Password = GetConfigurationValue<std::string>(TomlCheckConfig, ConfigConstants::Fields::password);
	Options.UserName = GetConfigurationValue<std::string>(TomlCheckConfig, ConfigConstants::Fields::username);
	Options.Realm = GetConfigurationValue<std::string>(TomlCheckConfig, ConfigConstants::Fields::realm);
	Options.Mode = GetConfigurationValue<std::string>(TomlCheckConfig, ConfigConstants::Fields::mode);
	Options.Filter = GetConfigurationValue<std::string>(TomlCheckConfig, ConfigConstants::Fields::filter);
	Options.Port = GetConfigurationValue<long>(TomlCheckConfig, ConfigConstants::Fields::port);
	Options.Insecure = GetConfigurationValueOrDefault(TomlCheckConfig, ConfigConstants::Fields::insecure, false);
	Options.Verbose = GetConfigurationValueOrDefault(TomlCheckConfig, ConfigConstants::Fields::verbose, false);
	Options.Debug = GetConfigurationValueOrDefault(TomlCheckConfig, ConfigConstants::Fields::debug, false);
	return Options;
}

std::unique_ptr<ILogWriter> Configuration::Load(const std::string_view &ConfigFilePath, const std::optional<LogLevels> LevelOverride, std::ostream &Console)
{
	toml::table TomlConfig;
	std::error_code FileError{};
	const bool FileExists{std::filesystem::exists(ConfigFilePath, FileError)};
	if (FileError)
	{
		Console << "Unable to access configuration file (" << ConfigFilePath << "): " << FileError.message() << std::endl;
	}
	else if (FileExists)
	{
		auto TomlParseResult{toml::parse_file(ConfigFilePath)};
		if (!TomlParseResult)
		{
			Console << "Unable to parse configuration file (" << ConfigFilePath << "): " << TomlParseResult.error() << std::endl;
		}
		else
		{
			TomlConfig = std::move(TomlParseResult.table());
		}
	}
	else
	{
		TomlConfig = toml::table{};
	}

	const toml::table EmptyTable{};
	const toml::table *TomlCheckConfig{GetSubTable(TomlConfig, ConfigConstants::Headers::check)};
	FileOptions = GetCheckOptions(TomlCheckConfig != nullptr ? *TomlCheckConfig : EmptyTable);

	// the more verbose of the command line and [check] debug/verbose wins
	std::optional<LogLevels> RequestedLevel{GetRequestedLogLevel(FileOptions)};
	if (LevelOverride.has_value() && (!RequestedLevel.has_value() || LevelOverride.value() < RequestedLevel.value()))
	{
		RequestedLevel = LevelOverride;
	}
	const toml::table *TomlLogConfig{GetSubTable(TomlConfig, ConfigConstants::Headers::logging)};
	std::unique_ptr<ILogWriter> Log{GetLog(TomlLogConfig != nullptr ? *TomlLogConfig : EmptyTable, RequestedLevel, Console)};

	const toml::table *TomlApiConfig{GetSubTable(TomlConfig, ConfigConstants::Headers::api)};
	ConnectTimeoutSeconds = GetConfigurationValueOrDefault(TomlApiConfig != nullptr ? *TomlApiConfig : EmptyTable, ConfigConstants::Fields::timeout, ConfigConstants::DefaultValues::timeoutSeconds);

	Log->WriteDebugAnnotated(ConfigurationLoaded, ConfigFilePath);
	return Log;
}

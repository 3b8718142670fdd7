#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "config_constants.hpp"
#include "expression.hpp"
#include "options.hpp"

constexpr const std::string_view NoHosts{"At least one host is required"};
constexpr const std::string_view InvalidPort{"Port must be between 1 and 65535"};
constexpr const std::string_view InvalidFilter{"Invalid filter expression: "};
constexpr const std::string_view InvalidRule{"Invalid rule, expected pattern^label^message: "};
constexpr const std::string_view InvalidOverride{"Invalid override, expected pattern^field^number: "};

template <typename T>
static std::optional<T> PreferFirst(const std::optional<T> &First, const std::optional<T> &Second)
{
	return First.has_value() ? First : Second;
}

static std::vector<std::string> Concatenate(const std::vector<std::string> &First, const std::vector<std::string> &Second)
{
	std::vector<std::string> Result{First};
	Result.insert(Result.end(), Second.begin(), Second.end());
	return Result;
}

static bool ParseRules(const std::vector<std::string> &RuleTexts, const bool AreOverrides, std::vector<RuleTriple> &Rules, std::string &ErrorMessage)
{
	for (const auto &RuleText : RuleTexts)
	{
		auto Rule{AreOverrides ? ParseOverride(RuleText) : ParseRuleTriple(RuleText)};
		if (!Rule.has_value())
		{
			ErrorMessage = std::string{AreOverrides ? InvalidOverride : InvalidRule}.append(RuleText);
			return false;
		}
		Rules.emplace_back(std::move(Rule.value()));
	}
	return true;
}

CheckOptions MergeOptions(const CheckOptions &File, const CheckOptions &CommandLine)
{
	CheckOptions Merged{};
	Merged.Hosts = Concatenate(File.Hosts, CommandLine.Hosts);
	Merged.WarnStr = Concatenate(File.WarnStr, CommandLine.WarnStr);
	Merged.CritStr = Concatenate(File.CritStr, CommandLine.CritStr);
	Merged.Overrides = Concatenate(File.Overrides, CommandLine.Overrides);
	Merged.Password = PreferFirst(CommandLine.Password, File.Password);
	Merged.UserName = PreferFirst(CommandLine.UserName, File.UserName);
	Merged.Realm = PreferFirst(CommandLine.Realm, File.Realm);
	Merged.Mode = PreferFirst(CommandLine.Mode, File.Mode);
	Merged.Filter = PreferFirst(CommandLine.Filter, File.Filter);
	Merged.ConfigFile = PreferFirst(CommandLine.ConfigFile, File.ConfigFile);
	Merged.Port = PreferFirst(CommandLine.Port, File.Port);
	Merged.Insecure = CommandLine.Insecure || File.Insecure;
	Merged.Help = CommandLine.Help || File.Help;
	Merged.Debug = CommandLine.Debug || File.Debug;
	Merged.Verbose = CommandLine.Verbose || File.Verbose;
	return Merged;
}

std::optional<LogLevels> GetRequestedLogLevel(const CheckOptions &Options)
{
	if (Options.Debug)
	{
		return LogLevels::Debug;
	}
	if (Options.Verbose)
	{
		return LogLevels::Info;
	}
	return std::nullopt;
}

std::optional<ProbeSettings> ValidateOptions(const CheckOptions &Options, const long ConnectTimeoutSeconds, std::string &ErrorMessage)
{
	if (Options.Hosts.empty())
	{
		ErrorMessage = NoHosts;
		return std::nullopt;
	}
	const long Port{Options.Port.value_or(ConfigConstants::DefaultValues::port)};
	if (Port < 1 || Port > 65535)
	{
		ErrorMessage = InvalidPort;
		return std::nullopt;
	}

	ProbeSettings Settings{};
	Settings.Hosts = Options.Hosts;
	Settings.Mode = Options.Mode.value_or(std::string{});
	Settings.Verbose = Options.Verbose || Options.Debug;
	Settings.Credentials = ClusterCredentials{
		 .UserName = Options.UserName.value_or(std::string{ConfigConstants::DefaultValues::username}),
		 .Realm = Options.Realm.value_or(std::string{ConfigConstants::DefaultValues::realm}),
		 .Password = Options.Password.value_or(std::string{}),
		 .Port = Port,
		 .Insecure = Options.Insecure,
		 .ConnectTimeoutSeconds = ConnectTimeoutSeconds};

	auto Filter{ParseExpression(Options.Filter.value_or(std::string{}))};
	if (!Filter.has_value())
	{
		ErrorMessage = std::string{InvalidFilter}.append(Options.Filter.value_or(std::string{}));
		return std::nullopt;
	}
	Settings.Filter = std::move(Filter.value());

	if (!ParseRules(Options.WarnStr, false, Settings.WarnRules, ErrorMessage) ||
		 !ParseRules(Options.CritStr, false, Settings.CritRules, ErrorMessage) ||
		 !ParseRules(Options.Overrides, true, Settings.Overrides, ErrorMessage))
	{
		return std::nullopt;
	}
	return Settings;
}

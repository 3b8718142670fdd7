#include <curl/curl.h>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include "checkresult.hpp"
#include "commandline.hpp"
#include "config.hpp"
#include "config_constants.hpp"
#include "options.hpp"
#include "probe.hpp"
#include "pveclient.hpp"

static int ExitWithUsage(const std::string &ErrorMessage)
{
	CommandLine::PrintUsage(std::cerr);
	std::cerr << '\n'
				 << ErrorMessage << std::endl;
	return ConfigConstants::ExitCodes::usage;
}

int main(int argc, char *argv[])
{
	std::string ErrorMessage{};
	auto CommandLineOptions{CommandLine::Parse(argc, argv, ErrorMessage)};
	if (!CommandLineOptions.has_value())
	{
		return ExitWithUsage(ErrorMessage);
	}

	Configuration Config{};
	auto Log{Config.Load(CommandLineOptions->ConfigFile.value_or(std::string{ConfigConstants::ConfigFilePath}), GetRequestedLogLevel(CommandLineOptions.value()), std::cerr)};
	auto Options{MergeOptions(Config.FileOptions, CommandLineOptions.value())};
	if (Options.Help)
	{
		CommandLine::PrintUsage(std::cout);
		return static_cast<int>(Severity::Unknown);
	}

	auto Settings{ValidateOptions(Options, Config.ConnectTimeoutSeconds, ErrorMessage)};
	if (!Settings.has_value())
	{
		return ExitWithUsage(ErrorMessage);
	}

	curl_global_init(CURL_GLOBAL_ALL);
	const ClusterCredentials &Credentials{Settings->Credentials};
	ProxmoxProbe Probe{*Log, [&Log, &Credentials](const std::string &HostName)
							 { return std::make_unique<ProxmoxClient>(*Log, HostName, Credentials); }};
	int ExitCode{Probe.Run(Settings.value(), std::cout)};
	curl_global_cleanup();
	return ExitCode;
}

#pragma once

#include <ostream>
#include "checkresult.hpp"
#include "hostfailover.hpp"
#include "logwriter.hpp"
#include "modes.hpp"
#include "options.hpp"

class ProxmoxProbe
{
private:
	ILogWriter &Log;
	const ClusterClientFactory CreateClient;

	int CheckResources(const IResourceMode &Mode, const ProbeSettings &Settings, IClusterApiClient &Client, CheckResult &Result, std::ostream &Output);
	int CheckClusterStatus(const ProbeSettings &Settings, IClusterApiClient &Client, CheckResult &Result, std::ostream &Output);

public:
	ProxmoxProbe(ILogWriter &Log, ClusterClientFactory CreateClient) : Log{Log}, CreateClient{std::move(CreateClient)} {}
	ProxmoxProbe(const ProxmoxProbe &) = delete;
	ProxmoxProbe &operator=(const ProxmoxProbe &) = delete;
	ProxmoxProbe(ProxmoxProbe &&) = delete;
	ProxmoxProbe &operator=(ProxmoxProbe &&) = delete;
	~ProxmoxProbe() = default;

	/// @brief Connects, fetches, evaluates and writes the plugin output. Every path ends in exactly one CheckResult::Finish.
	/// @return Plugin exit code
	int Run(const ProbeSettings &Settings, std::ostream &Output);
};

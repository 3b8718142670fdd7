#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "checkresult.hpp"
#include "logwriter.hpp"
#include "pveclient.hpp"

using ClusterClientFactory = std::function<std::unique_ptr<IClusterApiClient>(const std::string &HostName)>;

/// @brief Tries the hosts one after the other and keeps the first session that logs in with a valid ticket.
/// Every host that fails before that is reported as a WARNING "DOWN:<host>" finding.
class HostFailoverDriver
{
private:
	ILogWriter &Log;
	CheckResult &Result;
	const ClusterClientFactory CreateClient;

	void ReportDown(const std::string &HostName, const std::string_view &Reason);

public:
	HostFailoverDriver(ILogWriter &Log, CheckResult &Result, ClusterClientFactory CreateClient) : Log{Log}, Result{Result}, CreateClient{std::move(CreateClient)} {}
	HostFailoverDriver(const HostFailoverDriver &) = delete;
	HostFailoverDriver &operator=(const HostFailoverDriver &) = delete;
	~HostFailoverDriver() = default;

	/// @return The authenticated session, nullptr once every host failed
	std::unique_ptr<IClusterApiClient> Connect(const std::vector<std::string> &Hosts);
};

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "hostfailover.hpp"

constexpr const std::string_view TryingHost{"Trying host"};
constexpr const std::string_view ConnectedToHost{"Connected to host"};
constexpr const std::string_view HostDown{"Host down"};
constexpr const std::string_view LoginFailed{"login failed"};
constexpr const std::string_view TicketInvalid{"login ticket could not be verified"};
constexpr const std::string_view UnknownVersion{"unknown"};

void HostFailoverDriver::ReportDown(const std::string &HostName, const std::string_view &Reason)
{
	Log.WriteWarnAnnotated(HostDown, HostName, Reason);
	std::string Long{GetSeverityName(Severity::Warning)};
	Long.append(": ").append(HostName).append(": ").append(Reason);
	Result.Emit(Severity::Warning, std::string{"DOWN:"}.append(HostName), Long);
}

std::unique_ptr<IClusterApiClient> HostFailoverDriver::Connect(const std::vector<std::string> &Hosts)
{
	for (const auto &HostName : Hosts)
	{
		Log.WriteDebugAnnotated(TryingHost, HostName);
		auto Client{CreateClient(HostName)};
		if (Client == nullptr || !Client->Login())
		{
			ReportDown(HostName, LoginFailed);
			continue;
		}
		if (!Client->CheckLoginTicket())
		{
			ReportDown(HostName, TicketInvalid);
			continue;
		}

		auto Version{Client->GetApiVersion()};
		Log.WriteInfoAnnotated(ConnectedToHost, HostName, std::string{"API version "}.append(Version.has_value() ? Version->Version : std::string{UnknownVersion}));
		return Client;
	}
	return nullptr;
}

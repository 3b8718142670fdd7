#pragma once

#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "curlclient.hpp"
#include "logwriter.hpp"
#include "pveobject.hpp"

struct ApiVersionInfo
{
	std::string Version{};
};

struct ClusterCredentials
{
	std::string UserName{};
	std::string Realm{};
	std::string Password{};
	long Port{0};
	bool Insecure{false};
	long ConnectTimeoutSeconds{0};
};

/// @brief Session with one cluster API endpoint
class IClusterApiClient
{
public:
	IClusterApiClient() = default;
	virtual ~IClusterApiClient() = default;
	IClusterApiClient(const IClusterApiClient &) = delete;
	IClusterApiClient &operator=(const IClusterApiClient &) = delete;

	virtual const std::string &GetHostName() const = 0;
	virtual bool Login() = 0;
	virtual bool CheckLoginTicket() = 0;
	virtual std::optional<ApiVersionInfo> GetApiVersion() = 0;

	/// @return The items of the "data" array at Path, std::nullopt when the request or the response is unusable
	virtual std::optional<PveObjectList> Get(const std::string_view &Path) = 0;
};

class ProxmoxClient : public IClusterApiClient
{
private:
	ILogWriter &Log;
	const std::string HostName;
	const ClusterCredentials Credentials;
	CurlClient Curl;
	std::string Ticket{};
	std::string CsrfToken{};

public:
	ProxmoxClient(ILogWriter &Log, const std::string &HostName, const ClusterCredentials &Credentials);
	virtual ~ProxmoxClient() = default;
	ProxmoxClient(ProxmoxClient &&) = delete;
	ProxmoxClient &operator=(ProxmoxClient &&) = delete;

	virtual const std::string &GetHostName() const override { return HostName; }
	virtual bool Login() override;
	virtual bool CheckLoginTicket() override;
	virtual std::optional<ApiVersionInfo> GetApiVersion() override;
	virtual std::optional<PveObjectList> Get(const std::string_view &Path) override;
};

namespace PveTicket
{
	// tickets are valid for two hours, keep a margin for the requests still to come
	constexpr const std::time_t MaximumAgeSeconds{7200 - 10};

	/// @brief Reads the hex timestamp of a ticket of the form PVE:<user>@<realm>:<hex timestamp>::<signature>
	std::optional<std::time_t> GetTimestamp(const std::string_view &Ticket);

	bool IsValid(const std::string_view &Ticket, const std::time_t Now);
}

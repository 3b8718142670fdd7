#include <cctype>
#include <cstdlib>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include "config_constants.hpp"
#include "curlclient.hpp"
#include "pveclient.hpp"
#include "utility.hpp"

// used as paths in the URL
constexpr const std::string_view ApiRoot{"/api2/json"};
constexpr const std::string_view CommandTicket{"/access/ticket"};
constexpr const std::string_view CommandVersion{"/version"};

constexpr const std::string_view TicketCookieName{"PVEAuthCookie="};
constexpr const std::string_view CsrfHeaderName{"CSRFPreventionToken: "};

// log messages
constexpr const std::string_view LoggingIn{"Logging in"};
constexpr const std::string_view ReadingVersion{"Reading API version"};
constexpr const std::string_view Fetching{"Fetching"};
constexpr const std::string_view InvalidResponse{"Response is not a JSON object with a data member"};
constexpr const std::string_view MissingTicket{"Login response carries no ticket"};
constexpr const std::string_view ExpiredTicket{"Login ticket is missing or expired"};

static bool LogApiError(const CurlResponse &Response, ILogWriter &Log, const std::string_view &Activity, const std::string_view &Item)
{
	if (Response.CurlResult != CURLE_OK)
	{
		Log.WriteErrorAnnotated(Activity, Item, curl_easy_strerror(Response.CurlResult));
		return true;
	}
	if (Response.ResponseCode < 200 || Response.ResponseCode >= 300)
	{
		Log.WriteErrorAnnotated(Activity, Item, std::string{"HTTP "}.append(std::to_string(Response.ResponseCode)).append(1, ' ').append(Response.Body.value_or(std::string{})));
		return true;
	}
	Log.WriteDebugAnnotated(Activity, Item, "Success");
	return false;
}

/// @return The "data" member of a successful API response
static std::optional<nlohmann::json> GetResponseData(const CurlResponse &Response, ILogWriter &Log, const std::string_view &Activity, const std::string_view &Item)
{
	if (LogApiError(Response, Log, Activity, Item))
	{
		return std::nullopt;
	}
	auto Document = nlohmann::json::parse(Response.Body.value_or(std::string{}), nullptr, false); // brace initialization would wrap the document in an array
	if (Document.is_discarded() || !Document.is_object() || !Document.contains("data"))
	{
		Log.WriteErrorAnnotated(Activity, Item, InvalidResponse);
		return std::nullopt;
	}
	return Document["data"];
}

static std::string GetStringMember(const nlohmann::json &Object, const std::string_view &Name)
{
	auto Member{Object.find(std::string{Name})};
	if (Member == Object.end() || !Member->is_string())
	{
		return std::string{};
	}
	return Member->get<std::string>();
}

static CurlRequest GetApiRequest(const std::string_view &Path)
{
	return CurlRequest{Path};
}

static std::string GetBaseUrl(const std::string &HostName, const long Port)
{
	std::string BaseUrl{ConfigConstants::Values::protocol};
	BaseUrl.append("://").append(HostName).append(1, ':').append(std::to_string(Port)).append(ApiRoot);
	return BaseUrl;
}

std::optional<std::time_t> PveTicket::GetTimestamp(const std::string_view &Ticket)
{
	auto Parts{Utility::Split(Ticket, ':')};
	if (Parts.size() < 3 || Parts[2].empty())
	{
		return std::nullopt;
	}
	for (const auto Character : Parts[2])
	{
		if (!std::isxdigit(static_cast<unsigned char>(Character)))
		{
			return std::nullopt;
		}
	}
	return static_cast<std::time_t>(std::strtoll(Parts[2].c_str(), nullptr, 16));
}

bool PveTicket::IsValid(const std::string_view &Ticket, const std::time_t Now)
{
	auto Timestamp{GetTimestamp(Ticket)};
	return Timestamp.has_value() && (Now - Timestamp.value()) < MaximumAgeSeconds;
}

ProxmoxClient::ProxmoxClient(ILogWriter &Log, const std::string &HostName, const ClusterCredentials &Credentials)
	 : Log{Log}, HostName{HostName}, Credentials{Credentials},
		Curl{Log, GetBaseUrl(HostName, Credentials.Port), !Credentials.Insecure, Credentials.ConnectTimeoutSeconds} {}

bool ProxmoxClient::Login()
{
	auto LoginRequest{GetApiRequest(CommandTicket)};
	LoginRequest.AddFormField("username", std::string{Credentials.UserName}.append(1, '@').append(Credentials.Realm));
	LoginRequest.AddFormField("password", Credentials.Password);
	auto LoginData{GetResponseData(Curl.Post(LoginRequest), Log, LoggingIn, HostName)};
	if (!LoginData.has_value() || !LoginData->is_object())
	{
		return false;
	}

	Ticket = GetStringMember(LoginData.value(), "ticket");
	CsrfToken = GetStringMember(LoginData.value(), "CSRFPreventionToken");
	if (Ticket.empty())
	{
		Log.WriteErrorAnnotated(LoggingIn, HostName, MissingTicket);
		return false;
	}
	Curl.SetCookie(std::string{TicketCookieName}.append(Ticket));
	if (!CsrfToken.empty())
	{
		Curl.AddHeader(std::string{CsrfHeaderName}.append(CsrfToken));
	}
	return true;
}

bool ProxmoxClient::CheckLoginTicket()
{
	if (!PveTicket::IsValid(Ticket, std::time(nullptr)))
	{
		Log.WriteWarnAnnotated(ExpiredTicket, HostName);
		return false;
	}
	return true;
}

std::optional<ApiVersionInfo> ProxmoxClient::GetApiVersion()
{
	auto VersionData{GetResponseData(Curl.Get(GetApiRequest(CommandVersion)), Log, ReadingVersion, HostName)};
	if (!VersionData.has_value() || !VersionData->is_object())
	{
		return std::nullopt;
	}
	return ApiVersionInfo{
		 .Version = GetStringMember(VersionData.value(), "version")};
}

std::optional<PveObjectList> ProxmoxClient::Get(const std::string_view &Path)
{
	auto Data{GetResponseData(Curl.Get(GetApiRequest(Path)), Log, Fetching, Path)};
	if (!Data.has_value() || !Data->is_array())
	{
		return std::nullopt;
	}
	PveObjectList Objects{};
	Objects.reserve(Data->size());
	for (const auto &Item : Data.value())
	{
		Objects.emplace_back(PveObject::FromJson(Item));
	}
	Log.WriteDebugAnnotated(Fetching, Path, std::to_string(Objects.size()).append(" objects"));
	return Objects;
}

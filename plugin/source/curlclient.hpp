#pragma once

#include <curl/curl.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "logwriter.hpp"

/// @brief One request against a CurlClient base URL: path and optional form body
class CurlRequest
{
private:
	std::string Path;
	std::optional<std::string> FormData{};

public:
	/// @param Path Appended to the client's base URL as is
	explicit CurlRequest(const std::string_view &Path) : Path{Path} {}
	~CurlRequest() = default;

	const std::string &GetPath() const { return Path; }

	/// @brief Appends an application/x-www-form-urlencoded field to the POST body
	void AddFormField(const std::string_view &Field, const std::string_view &Value);
	const std::optional<std::string> &GetFormData() const { return FormData; }
};

/// @brief Outcome of one request: the curl result, the HTTP status code and the body received
struct CurlResponse
{
	CURLcode CurlResult{CURLE_SEND_ERROR};
	long ResponseCode{-1};
	std::optional<std::string> Body{};
};

/// @brief Keeps one easy handle, with its cookie and headers, for a series of requests to the same server
class CurlClient
{
private:
	ILogWriter &Log;
	const std::string BaseUrl;
	std::unique_ptr<CURL, void (*)(CURL *)> CurlHandle;
	std::unique_ptr<curl_slist, void (*)(curl_slist *)> RequestHeaders;

	CurlResponse Send(const CurlRequest &Request, const bool IsPost);

public:
	/// @param BaseUrl Scheme, host, port and path prefix every request path is appended to
	/// @param VerifyPeer If false, TLS certificates and host names are not verified
	/// @param ConnectTimeoutSeconds 0 keeps the libcurl default
	CurlClient(ILogWriter &LogWriter, const std::string_view &BaseUrl, const bool VerifyPeer = true, const long ConnectTimeoutSeconds = 0);
	CurlClient(const CurlClient &) = delete;
	CurlClient &operator=(const CurlClient &) = delete;
	CurlClient(CurlClient &&) = delete;
	CurlClient &operator=(CurlClient &&) = delete;
	~CurlClient() = default;

	/// @brief Adds a header sent with every following request
	void AddHeader(const std::string_view &Header);
	void SetCookie(const std::string_view &Cookie);

	CurlResponse Get(const CurlRequest &Request);
	CurlResponse Post(const CurlRequest &Request);
};

#include <curl/curl.h>
#include <memory>
#include <string>
#include <string_view>
#include "curlclient.hpp"

constexpr const std::string_view DefaultProtocol{"https"};
constexpr const std::string_view AddingHeader{"Failed to add request header"};

// helper functions
static long GetResponseCode(CURL *CurlHandle)
{
	long ResponseCode{-1};
	curl_easy_getinfo(CurlHandle, CURLINFO_RESPONSE_CODE, &ResponseCode);
	return ResponseCode;
}

static size_t CurlWriteDataCallback(char *ResponseData, size_t CharSize, size_t NumChars, void *userdata)
{
	std::optional<std::string> *OutOptString{static_cast<std::optional<std::string> *>(userdata)};
	if (!OutOptString->has_value())
	{
		OutOptString->emplace(std::string{});
	}
	OutOptString->value().append(ResponseData, CharSize * NumChars); // called once per received chunk
	return CharSize * NumChars;
}

// CurlRequest
void CurlRequest::AddFormField(const std::string_view &Field, const std::string_view &Value)
{
	if (!FormData.has_value())
	{
		FormData.emplace(std::string{});
	}
	else
	{
		FormData->push_back('&');
	}
	FormData->append(Field).push_back('=');
	if (!Value.empty())
	{
		auto EscapedValue{curl_easy_escape(nullptr, Value.data(), static_cast<int>(Value.size()))};
		if (EscapedValue != nullptr)
		{
			FormData->append(EscapedValue);
			curl_free(EscapedValue);
		}
	}
}

// CurlClient
CurlClient::CurlClient(ILogWriter &LogWriter, const std::string_view &BaseUrl, const bool VerifyPeer, const long ConnectTimeoutSeconds)
	 : Log{LogWriter},
		BaseUrl{BaseUrl},
		CurlHandle{curl_easy_init(), curl_easy_cleanup},
		RequestHeaders{nullptr, curl_slist_free_all}
{
	curl_easy_setopt(CurlHandle.get(), CURLOPT_DEFAULT_PROTOCOL, DefaultProtocol.data());
	curl_easy_setopt(CurlHandle.get(), CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(CurlHandle.get(), CURLOPT_SSL_VERIFYPEER, VerifyPeer ? 1L : 0L);
	curl_easy_setopt(CurlHandle.get(), CURLOPT_SSL_VERIFYHOST, VerifyPeer ? 2L : 0L);
	if (ConnectTimeoutSeconds > 0)
	{
		curl_easy_setopt(CurlHandle.get(), CURLOPT_CONNECTTIMEOUT, ConnectTimeoutSeconds);
	}
	curl_easy_setopt(CurlHandle.get(), CURLOPT_WRITEFUNCTION, CurlWriteDataCallback);
	if (Log.ShouldWrite(LogLevels::Debug))
	{
		curl_easy_setopt(CurlHandle.get(), CURLOPT_VERBOSE, 1L);
	}
}

CurlResponse CurlClient::Send(const CurlRequest &Request, const bool IsPost)
{
	const std::string Url{std::string{BaseUrl}.append(Request.GetPath())};
	curl_easy_setopt(CurlHandle.get(), CURLOPT_URL, Url.c_str());

	const auto &FormData{Request.GetFormData()};
	if (IsPost)
	{
		curl_easy_setopt(CurlHandle.get(), CURLOPT_POST, 1L);
		curl_easy_setopt(CurlHandle.get(), CURLOPT_POSTFIELDS, FormData.has_value() ? FormData->c_str() : "");
		curl_easy_setopt(CurlHandle.get(), CURLOPT_POSTFIELDSIZE, FormData.has_value() ? static_cast<long>(FormData->size()) : 0L);
	}
	else
	{
		curl_easy_setopt(CurlHandle.get(), CURLOPT_HTTPGET, 1L);
	}

	CurlResponse Response{};
	curl_easy_setopt(CurlHandle.get(), CURLOPT_WRITEDATA, &Response.Body);
	Response.CurlResult = curl_easy_perform(CurlHandle.get());
	curl_easy_setopt(CurlHandle.get(), CURLOPT_WRITEDATA, nullptr); // Response.Body goes out of scope with Response
	Response.ResponseCode = GetResponseCode(CurlHandle.get());
	return Response;
}

void CurlClient::AddHeader(const std::string_view &Header)
{
	std::string HeaderLine{Header}; // curl_slist_append needs NUL termination
	auto *NewHeaders{curl_slist_append(RequestHeaders.get(), HeaderLine.c_str())};
	if (NewHeaders == nullptr)
	{
		Log.WriteErrorAnnotated(AddingHeader, HeaderLine);
		return;
	}
	RequestHeaders.release(); // curl_slist_append returned the same list with the new item appended
	RequestHeaders.reset(NewHeaders);
	curl_easy_setopt(CurlHandle.get(), CURLOPT_HTTPHEADER, RequestHeaders.get());
}

void CurlClient::SetCookie(const std::string_view &Cookie)
{
	curl_easy_setopt(CurlHandle.get(), CURLOPT_COOKIE, std::string{Cookie}.c_str()); // curl copies the string
}

CurlResponse CurlClient::Get(const CurlRequest &Request)
{
	return Send(Request, false);
}

CurlResponse CurlClient::Post(const CurlRequest &Request)
{
	return Send(Request, true);
}

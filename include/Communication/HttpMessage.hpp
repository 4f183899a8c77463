#pragma once

#include <map>
#include <string>
#include <optional>

//Minimal HTTP/1.1 request parsing and response writing, enough for a read-only json API

struct HttpRequest
{
	std::string Method;
	std::string Path; //without the query string, url-decoded
	std::string Version;
	std::map<std::string, std::string> Query;
};

struct HttpResponse
{
	int Status = 200;
	std::string ContentType = "application/json";
	std::string Body;
};

//Requests with a header bigger than this are rejected
const size_t MaxHttpHeaderSize = 8192;

//True once the buffer holds the blank line ending the header
bool HasCompleteHeader(const std::string &buffer);

//Parses the request line and query string. Headers are skipped, bodies are not supported.
//Returns nullopt if the request line is malformed.
std::optional<HttpRequest> ParseHttpRequest(const std::string &buffer);

//Status line, Content-Type, Content-Length, Connection: close, then the body
std::string SerializeHttpResponse(const HttpResponse &response);

std::string GetStatusText(int Status);

//%XX escapes and '+' as space. Invalid escapes are kept as-is.
std::string UrlDecode(const std::string &encoded);

#include "Communication/HttpMessage.hpp"

#include <sstream>

using namespace std;

bool HasCompleteHeader(const string &buffer)
{
	return buffer.find("\r\n\r\n") != string::npos || buffer.find("\n\n") != string::npos;
}

static int HexValue(char c)
{
	if (c >= '0' && c <= '9')
	{
		return c - '0';
	}
	if (c >= 'a' && c <= 'f')
	{
		return c - 'a' + 10;
	}
	if (c >= 'A' && c <= 'F')
	{
		return c - 'A' + 10;
	}
	return -1;
}

string UrlDecode(const string &encoded)
{
	string decoded;
	decoded.reserve(encoded.size());
	for (size_t i = 0; i < encoded.size(); i++)
	{
		char c = encoded[i];
		if (c == '+')
		{
			decoded.push_back(' ');
		}
		else if (c == '%' && i+2 < encoded.size())
		{
			int high = HexValue(encoded[i+1]), low = HexValue(encoded[i+2]);
			if (high < 0 || low < 0)
			{
				decoded.push_back(c);
				continue;
			}
			decoded.push_back((char)(high*16+low));
			i += 2;
		}
		else
		{
			decoded.push_back(c);
		}
	}
	return decoded;
}

static map<string, string> ParseQuery(const string &query)
{
	map<string, string> values;
	size_t start = 0;
	while (start <= query.size())
	{
		size_t end = query.find('&', start);
		if (end == string::npos)
		{
			end = query.size();
		}
		string pair = query.substr(start, end-start);
		if (pair.size() > 0)
		{
			size_t equals = pair.find('=');
			if (equals == string::npos)
			{
				values[UrlDecode(pair)] = "";
			}
			else
			{
				values[UrlDecode(pair.substr(0, equals))] = UrlDecode(pair.substr(equals+1));
			}
		}
		start = end+1;
	}
	return values;
}

optional<HttpRequest> ParseHttpRequest(const string &buffer)
{
	size_t lineend = buffer.find('\n');
	if (lineend == string::npos)
	{
		return nullopt;
	}
	string requestline = buffer.substr(0, lineend);
	if (requestline.size() > 0 && requestline.back() == '\r')
	{
		requestline.pop_back();
	}

	HttpRequest request;
	string target, extra;
	istringstream stream(requestline);
	if (!(stream >> request.Method >> target >> request.Version) || (stream >> extra))
	{
		return nullopt;
	}
	if (request.Version.rfind("HTTP/", 0) != 0 || target.size() == 0 || target[0] != '/')
	{
		return nullopt;
	}

	size_t question = target.find('?');
	if (question == string::npos)
	{
		request.Path = UrlDecode(target);
	}
	else
	{
		request.Path = UrlDecode(target.substr(0, question));
		request.Query = ParseQuery(target.substr(question+1));
	}
	return request;
}

string GetStatusText(int Status)
{
	switch (Status)
	{
	case 200:
		return "OK";
	case 400:
		return "Bad Request";
	case 404:
		return "Not Found";
	case 405:
		return "Method Not Allowed";
	case 500:
		return "Internal Server Error";
	default:
		return "Unknown";
	}
}

string SerializeHttpResponse(const HttpResponse &response)
{
	ostringstream out;
	out << "HTTP/1.1 " << response.Status << " " << GetStatusText(response.Status) << "\r\n";
	out << "Content-Type: " << response.ContentType << "\r\n";
	out << "Content-Length: " << response.Body.size() << "\r\n";
	out << "Connection: close\r\n";
	out << "\r\n";
	out << response.Body;
	return out.str();
}

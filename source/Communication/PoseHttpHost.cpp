#include "Communication/PoseHttpHost.hpp"

#include <iostream>
#include <chrono>
#include <vector>
#include <cctype>

#include <nlohmann/json.hpp>

#include <Communication/Transport/TCPTransport.hpp>
#include <Communication/PoseJson.hpp>
#include <Session/MarkerSession.hpp>

using namespace std;
using namespace nlohmann;

static HttpResponse ErrorResponse(int Status, const string &message)
{
	HttpResponse response;
	response.Status = Status;
	json object;
	object["error"] = message;
	response.Body = object.dump();
	return response;
}

static bool IsTrue(string value)
{
	for (auto &c : value)
	{
		c = tolower((unsigned char)c);
	}
	return value == "true";
}

PoseHttpHost::PoseHttpHost(MarkerSession &InSession, const string &Address, int Port, chrono::milliseconds InRequestTimeout)
	:Session(InSession), RequestTimeout(InRequestTimeout), RequestsServed(0), ClientsTimedOut(0)
{
	Transport = make_unique<TCPTransport>(Address, Port);
	if (Transport->IsListening())
	{
		cout << "Pose HTTP host listening on http://" << Address << ":" << Transport->GetPort() << "/api/get_pose" << endl;
	}
	else
	{
		cerr << "ERROR: Pose HTTP host could not listen on " << Address << ":" << Port << endl;
	}
}

PoseHttpHost::~PoseHttpHost()
{
	Stop();
}

bool PoseHttpHost::IsListening() const
{
	return Transport->IsListening();
}

int PoseHttpHost::GetPort() const
{
	return Transport->GetPort();
}

HttpResponse PoseHttpHost::HandleRequest(const HttpRequest &request)
{
	if (request.Path != "/api/get_pose")
	{
		return ErrorResponse(404, "Not found");
	}
	if (request.Method != "GET")
	{
		return ErrorResponse(405, "Method not allowed");
	}
	bool rot = false;
	auto rotfound = request.Query.find("rot");
	if (rotfound != request.Query.end())
	{
		rot = IsTrue(rotfound->second);
	}

	PoseMap poses;
	{
		lock_guard lock(SessionMutex);
		if (!Session.IsInitialized())
		{
			return ErrorResponse(500, "MTC not initialized");
		}
		poses = Session.GetPoses(rot);
	}
	HttpResponse response;
	//marker names come from the device and may not be valid utf-8
	response.Body = PoseMapToJson(poses).dump(-1, ' ', false, json::error_handler_t::replace);
	RequestsServed++;
	return response;
}

void PoseHttpHost::Answer(const string &client, const HttpResponse &response)
{
	string serialized = SerializeHttpResponse(response);
	if (!Transport->Send(serialized.data(), (int)serialized.size(), client))
	{
		cerr << "WARNING: Failed to answer " << client << endl;
	}
	DropClient(client);
}

void PoseHttpHost::DropClient(const string &client)
{
	Transport->DisconnectClient(client);
	PendingRequests.erase(client);
}

bool PoseHttpHost::DropIfTimedOut(const string &client, chrono::steady_clock::time_point now)
{
	if (now - PendingRequests[client].Accepted <= RequestTimeout)
	{
		return false;
	}
	cerr << "WARNING: No complete request from " << client << " after " << RequestTimeout.count() << " ms, disconnecting" << endl;
	DropClient(client);
	ClientsTimedOut++;
	return true;
}

void PoseHttpHost::ServeClients()
{
	auto now = chrono::steady_clock::now();
	for (auto &client : Transport->AcceptNewConnections())
	{
		PendingRequests[client] = {"", now};
	}
	vector<string> clients;
	clients.reserve(PendingRequests.size());
	for (auto &pending : PendingRequests)
	{
		clients.push_back(pending.first);
	}
	char buffer[1024];
	for (auto &client : clients)
	{
		int n = Transport->Receive(buffer, sizeof(buffer), client);
		if (n < 0)
		{
			DropIfTimedOut(client, now);
			continue;
		}
		if (n == 0)
		{
			DropClient(client);
			continue;
		}
		string &received = PendingRequests[client].Received;
		received.append(buffer, n);
		if (!HasCompleteHeader(received))
		{
			if (received.size() > MaxHttpHeaderSize)
			{
				Answer(client, ErrorResponse(400, "Request too large"));
			}
			else
			{
				DropIfTimedOut(client, now);
			}
			continue;
		}
		auto request = ParseHttpRequest(received);
		if (!request.has_value())
		{
			Answer(client, ErrorResponse(400, "Malformed request"));
			continue;
		}
		Answer(client, HandleRequest(request.value()));
	}
}

void PoseHttpHost::ThreadEntryPoint()
{
	SetThreadName("Pose HTTP Host");
	while (!killed)
	{
		ServeClients();
		this_thread::sleep_for(chrono::milliseconds(5));
	}
	for (auto &pending : PendingRequests)
	{
		Transport->DisconnectClient(pending.first);
	}
	PendingRequests.clear();
}

#pragma once

#include <map>
#include <mutex>
#include <memory>
#include <string>
#include <atomic>
#include <cstdint>
#include <chrono>

#include <Misc/Task.hpp>
#include <Communication/HttpMessage.hpp>

class MarkerSession;
class TCPTransport;

//Serves marker poses over HTTP :
//GET /api/get_pose?rot=true|false -> {"<name>": {"pos": [x,y,z], "rot": [[...],[...],[...]]}}
//One request per connection. The session is only touched under SessionMutex.
class PoseHttpHost : public Task
{
private:
	MarkerSession &Session;
	std::mutex SessionMutex;
	std::unique_ptr<TCPTransport> Transport;

	struct PendingRequest
	{
		std::string Received; //bytes received so far
		std::chrono::steady_clock::time_point Accepted;
	};

	std::map<std::string, PendingRequest> PendingRequests; //by client name
	std::chrono::milliseconds RequestTimeout;
	std::atomic<uint64_t> RequestsServed;
	std::atomic<uint64_t> ClientsTimedOut;

	void DropClient(const std::string &client);

	//Disconnects a client still without a complete request once RequestTimeout has elapsed since it connected
	bool DropIfTimedOut(const std::string &client, std::chrono::steady_clock::time_point now);

	void Answer(const std::string &client, const HttpResponse &response);

	void ServeClients();

protected:
	virtual void ThreadEntryPoint() override;

public:
	//Binds Address:Port (0 picks a free port). Call Start() to begin serving.
	//Clients that have not sent a complete request within InRequestTimeout are disconnected.
	PoseHttpHost(MarkerSession &InSession, const std::string &Address, int Port,
		std::chrono::milliseconds InRequestTimeout = std::chrono::milliseconds(5000));
	~PoseHttpHost();

	bool IsListening() const;

	int GetPort() const;

	uint64_t GetRequestsServed() const
	{
		return RequestsServed;
	}

	uint64_t GetClientsTimedOut() const
	{
		return ClientsTimedOut;
	}

	//Routing and pose lookup, independent of the socket
	HttpResponse HandleRequest(const HttpRequest &request);
};

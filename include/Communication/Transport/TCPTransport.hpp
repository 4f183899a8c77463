#pragma once

#include <string>
#include <vector>
#include <shared_mutex>
#include <netinet/in.h>

//TCP server transport
//Non-blocking : accept and receive return immediately when there is nothing to do.
//Clients are named "ip:port", names are unique for the lifetime of a connection.
class TCPTransport
{
private:
	struct TCPConnection
	{
		int filedescriptor;
		sockaddr_in address;
		std::string name;
	};

	std::string IP;
	int Port;
	int sockfd;
	bool Connected;
	mutable std::shared_mutex listenmutex; //protects connections
	std::vector<TCPConnection> connections;

	void CreateSocket();
	bool Listen();
	void DeleteSocket(int fd);
	void ServerDeleteSocket(size_t clientidx);

public:
	//Port 0 picks a free port, see GetPort
	TCPTransport(std::string inIP, int inPort);

	~TCPTransport();

	TCPTransport(const TCPTransport&) = delete;
	TCPTransport& operator=(const TCPTransport&) = delete;

	bool IsListening() const
	{
		return Connected;
	}

	//Port actually bound
	int GetPort() const
	{
		return Port;
	}

	std::vector<std::string> GetClients() const;

	//Returns the number of bytes read, 0 if the client has disconnected, -1 if nothing is available
	int Receive(void *buffer, int maxlength, const std::string &client);

	bool Send(const void* buffer, int length, const std::string &client);

	std::vector<std::string> AcceptNewConnections();

	void DisconnectClient(const std::string &client);
};

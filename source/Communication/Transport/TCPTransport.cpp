#include "Communication/Transport/TCPTransport.hpp"

#include <iostream>
#include <cstring>
#include <cerrno>
#include <mutex>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <arpa/inet.h>

using namespace std;

TCPTransport::TCPTransport(string inIP, int inPort)
{
	IP = inIP;
	Port = inPort;
	sockfd = -1;
	Connected = false;
	CreateSocket();
	Listen();

	cout << "Created TCP transport " << IP << ":" << Port << endl;
}

TCPTransport::~TCPTransport()
{
	cout << "Destroying TCP transport " << IP << ":" << Port << endl;
	unique_lock lock(listenmutex);
	for (size_t i = 0; i < connections.size(); i++)
	{
		shutdown(connections[i].filedescriptor, SHUT_RDWR);
		close(connections[i].filedescriptor);
	}
	connections.clear();
	if (sockfd != -1)
	{
		shutdown(sockfd, SHUT_RDWR);
		close(sockfd);
	}
}

void TCPTransport::CreateSocket()
{
	if (sockfd != -1)
	{
		return;
	}
	sockfd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
	if (sockfd == -1)
	{
		cerr << "TCP Failed to create socket, port " << Port << " : " << strerror(errno) << endl;
		return;
	}

	const int enable = 1;
	if (setsockopt(sockfd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(int)) < 0)
	{
		cerr << "setsockopt(SO_REUSEADDR) failed" << endl;
	}
}

bool TCPTransport::Listen()
{
	if (sockfd == -1)
	{
		return false;
	}
	struct sockaddr_in serverAddress;
	memset(&serverAddress, 0, sizeof(serverAddress));
	serverAddress.sin_family = AF_INET;
	serverAddress.sin_port = htons(Port);

	if (inet_pton(AF_INET, IP.c_str(), &serverAddress.sin_addr) <= 0)
	{
		cerr << "TCP ERROR : Invalid address/ Address not supported : " << IP << endl;
		return false;
	}

	if (bind(sockfd, (struct sockaddr *)&serverAddress, sizeof(serverAddress)) == -1)
	{
		cerr << "TCP Can't bind to " << IP << ":" << Port << ", " << strerror(errno) << endl;
		return false;
	}
	if (listen(sockfd, SOMAXCONN) == -1)
	{
		cerr << "TCP Can't listen : " << strerror(errno) << endl;
		return false;
	}

	//read back the port, in case 0 was asked
	socklen_t addressSize = sizeof(serverAddress);
	if (getsockname(sockfd, (struct sockaddr *)&serverAddress, &addressSize) == 0)
	{
		Port = ntohs(serverAddress.sin_port);
	}
	Connected = true;
	return true;
}

void TCPTransport::DeleteSocket(int fd)
{
	shutdown(fd, SHUT_RDWR);
	close(fd);
}

void TCPTransport::ServerDeleteSocket(size_t clientidx)
{
	DeleteSocket(connections[clientidx].filedescriptor);
	connections.erase(next(connections.begin(), clientidx));
}

vector<string> TCPTransport::GetClients() const
{
	vector<string> clients;
	shared_lock lock(listenmutex);
	clients.reserve(connections.size());
	for (size_t i = 0; i < connections.size(); i++)
	{
		clients.push_back(connections[i].name);
	}
	return clients;
}

int TCPTransport::Receive(void *buffer, int maxlength, const string &client)
{
	shared_lock lock(listenmutex);
	for (size_t i = 0; i < connections.size(); i++)
	{
		if (client != connections[i].name)
		{
			continue;
		}
		int n = recv(connections[i].filedescriptor, buffer, maxlength, MSG_DONTWAIT);
		if (n < 0)
		{
			int errnocp = errno;
			if (errnocp != EAGAIN && errnocp != EWOULDBLOCK)
			{
				cerr << "TCP Failed to receive from " << client << " : " << strerror(errnocp) << endl;
				return 0;
			}
			return -1;
		}
		return n;
	}
	return 0;
}

bool TCPTransport::Send(const void* buffer, int length, const string &client)
{
	if (!Connected)
	{
		return false;
	}
	shared_lock lock(listenmutex);
	for (size_t i = 0; i < connections.size(); i++)
	{
		if (client != connections[i].name)
		{
			continue;
		}
		const char* cursor = static_cast<const char*>(buffer);
		int remaining = length;
		while (remaining > 0)
		{
			int sent = send(connections[i].filedescriptor, cursor, remaining, MSG_NOSIGNAL);
			if (sent == -1)
			{
				int errnocp = errno;
				if (errnocp == EAGAIN || errnocp == EWOULDBLOCK || errnocp == EINTR)
				{
					continue;
				}
				cerr << "TCP Server failed to send data to client " << client << " : " << errnocp << " (" << strerror(errnocp) << ")" << endl;
				return false;
			}
			cursor += sent;
			remaining -= sent;
		}
		return true;
	}
	return false;
}

vector<string> TCPTransport::AcceptNewConnections()
{
	vector<string> newconnections;
	if (!Connected)
	{
		return newconnections;
	}
	while (1)
	{
		TCPConnection connection;
		socklen_t clientSize = sizeof(connection.address);
		memset(&connection.address, 0, clientSize);
		connection.filedescriptor = accept4(sockfd, (struct sockaddr *)&connection.address, &clientSize, 0);
		if (connection.filedescriptor >= 0)
		{
			char buffer[INET_ADDRSTRLEN];
			inet_ntop(AF_INET, &connection.address.sin_addr, buffer, sizeof(buffer));
			buffer[sizeof(buffer)-1] = 0;
			connection.name = string(buffer) + ":" + to_string(ntohs(connection.address.sin_port));

			unique_lock lock(listenmutex);
			connections.push_back(connection);
			newconnections.push_back(connection.name);
		}
		else
		{
			switch (errno)
			{
			case EAGAIN:
			case EINTR:
				return newconnections;

			default:
				cerr << "TCP Unhandled error on accept: " << strerror(errno) << endl;
				break;
			}
			break;
		}
	}
	return newconnections;
}

void TCPTransport::DisconnectClient(const string &client)
{
	unique_lock lock(listenmutex);
	for (size_t i = 0; i < connections.size(); i++)
	{
		if (client != connections[i].name)
		{
			continue;
		}
		ServerDeleteSocket(i);
		return;
	}
}

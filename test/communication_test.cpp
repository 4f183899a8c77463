// test/communication_test.cpp
// Pose json documents, HTTP parsing and the pose host, up to a real request on the loopback interface

#include <iostream>
#include <string>
#include <memory>
#include <cstring>
#include <chrono>

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "TestSupport.hpp"

#include <Native/MTSimulation.hpp>
#include <Session/MarkerSession.hpp>
#include <Communication/PoseJson.hpp>
#include <Communication/HttpMessage.hpp>
#include <Communication/PoseHttpHost.hpp>

using namespace std;
using namespace cv;
using namespace nlohmann;

static unique_ptr<MarkerSession> MakeSimulatedSession()
{
	SessionConfig config;
	config.MTHome = "/opt/MicronTracker";
	auto sim = make_unique<MTSimulation>();
	sim->Markers = MTSimulation::DefaultMarkers();
	auto session = make_unique<MarkerSession>(config, std::move(sim));
	session->GetReporter().SetSilent(true);
	return session;
}

static HttpRequest Get(const string &path, const string &rot = "")
{
	HttpRequest request;
	request.Method = "GET";
	request.Path = path;
	request.Version = "HTTP/1.1";
	if (!rot.empty())
	{
		request.Query["rot"] = rot;
	}
	return request;
}

static int TestPoseJson()
{
	MarkerPose pose;
	pose.Position = Vec3d(1.5, -2, 3);
	json positionOnly = PoseToJson(pose);
	CHECK(positionOnly["pos"] == json::array({1.5, -2.0, 3.0}));
	CHECK(!positionOnly.contains("rot"));

	pose.Rotation = Matx33d(1, 2, 3,
							4, 5, 6,
							7, 8, 9);
	json full = PoseToJson(pose);
	CHECK(full["rot"].size() == 3);
	CHECK(full["rot"][0] == json::array({1.0, 2.0, 3.0}));
	CHECK(full["rot"][2][0] == 7.0);

	MarkerPose parsed = JsonToPose(full);
	CHECK(Near(parsed.Position, pose.Position));
	CHECK(parsed.Rotation.has_value() && Near(parsed.Rotation.value(), pose.Rotation.value()));

	bool thrown = false;
	try
	{
		JsonToPose(json::parse(R"({"pos": [1, 2]})"));
	}
	catch(const json::exception&)
	{
		thrown = true;
	}
	CHECK(thrown);

	PoseMap poses;
	poses["A"] = pose;
	poses["B"].Position = Vec3d(4, 5, 6);
	json document = PoseMapToJson(poses);
	CHECK(document.size() == 2);
	CHECK(document["B"]["pos"][2] == 6.0);
	CHECK(!document["B"].contains("rot"));
	CHECK(JsonToPoseMap(document).size() == 2);
	CHECK(PoseMapToJson(PoseMap()).dump() == "{}");
	return 0;
}

static int TestHttpParsing()
{
	CHECK(!HasCompleteHeader("GET / HTTP/1.1\r\nHost: x\r\n"));
	CHECK(HasCompleteHeader("GET / HTTP/1.1\r\nHost: x\r\n\r\n"));

	auto request = ParseHttpRequest("GET /api/get_pose?rot=True&x=a%20b+c HTTP/1.1\r\nHost: localhost\r\n\r\n");
	CHECK(request.has_value());
	CHECK(request->Method == "GET");
	CHECK(request->Path == "/api/get_pose");
	CHECK(request->Version == "HTTP/1.1");
	CHECK(request->Query["rot"] == "True");
	CHECK(request->Query["x"] == "a b c");

	auto bare = ParseHttpRequest("GET /api/get_pose HTTP/1.0\n\n");
	CHECK(bare.has_value() && bare->Query.empty());

	CHECK(!ParseHttpRequest("GARBAGE\r\n\r\n").has_value());
	CHECK(!ParseHttpRequest("GET api/get_pose HTTP/1.1\r\n\r\n").has_value());
	CHECK(!ParseHttpRequest("GET /api/get_pose FTP/1.1\r\n\r\n").has_value());
	CHECK(!ParseHttpRequest("GET /a HTTP/1.1 extra\r\n\r\n").has_value());

	CHECK(UrlDecode("%41%4a%zz") == "AJ%zz");
	CHECK(UrlDecode("100%") == "100%");

	HttpResponse response;
	response.Status = 404;
	response.Body = "{}";
	string serialized = SerializeHttpResponse(response);
	CHECK(serialized.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
	CHECK(serialized.find("Content-Length: 2\r\n") != string::npos);
	CHECK(serialized.find("Connection: close\r\n") != string::npos);
	CHECK(serialized.substr(serialized.size()-6) == "\r\n\r\n{}");
	return 0;
}

static int TestRouting()
{
	auto session = MakeSimulatedSession();
	PoseHttpHost host(*session, "127.0.0.1", 0);

	HttpResponse withRot = host.HandleRequest(Get("/api/get_pose", "TRUE"));
	CHECK(withRot.Status == 200);
	CHECK(withRot.ContentType == "application/json");
	json document = json::parse(withRot.Body);
	CHECK(document.size() == 2);
	CHECK(document["A"]["pos"] == json::array({1.0, 2.0, 3.0}));
	CHECK(document["A"]["rot"][1] == json::array({0.0, 1.0, 0.0}));

	json positionOnly = json::parse(host.HandleRequest(Get("/api/get_pose", "false")).Body);
	CHECK(!positionOnly["B"].contains("rot"));
	json defaulted = json::parse(host.HandleRequest(Get("/api/get_pose")).Body);
	CHECK(!defaulted["A"].contains("rot"));
	CHECK(host.GetRequestsServed() == 3);

	CHECK(host.HandleRequest(Get("/api/other")).Status == 404);
	HttpRequest post = Get("/api/get_pose");
	post.Method = "POST";
	CHECK(host.HandleRequest(post).Status == 405);
	CHECK(host.GetRequestsServed() == 3);

	SessionConfig config;
	auto inert = MarkerSession::Open(config);
	PoseHttpHost inerthost(*inert, "127.0.0.1", 0);
	HttpResponse failed = inerthost.HandleRequest(Get("/api/get_pose", "true"));
	CHECK(failed.Status == 500);
	CHECK(json::parse(failed.Body)["error"] == "MTC not initialized");
	return 0;
}

static string Exchange(int port, const string &request)
{
	int fd = socket(AF_INET, SOCK_STREAM, 0);
	if (fd < 0)
	{
		return "";
	}
	sockaddr_in address;
	memset(&address, 0, sizeof(address));
	address.sin_family = AF_INET;
	address.sin_port = htons(port);
	inet_pton(AF_INET, "127.0.0.1", &address.sin_addr);
	string response;
	if (connect(fd, (sockaddr*)&address, sizeof(address)) == 0
		&& send(fd, request.data(), request.size(), MSG_NOSIGNAL) == (ssize_t)request.size())
	{
		char buffer[1024];
		ssize_t n;
		while ((n = recv(fd, buffer, sizeof(buffer), 0)) > 0)
		{
			response.append(buffer, n);
		}
	}
	close(fd);
	return response;
}

static int TestServing()
{
	auto session = MakeSimulatedSession();
	PoseHttpHost host(*session, "127.0.0.1", 0);
	CHECK(host.IsListening());
	CHECK(host.GetPort() > 0);
	host.Start();
	CHECK(host.IsRunning());

	string response = Exchange(host.GetPort(), "GET /api/get_pose?rot=true HTTP/1.1\r\nHost: localhost\r\n\r\n");
	CHECK(response.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
	size_t body = response.find("\r\n\r\n");
	CHECK(body != string::npos);
	json document = json::parse(response.substr(body+4));
	CHECK(document.contains("A") && document.contains("B"));
	CHECK(document["B"]["pos"] == json::array({4.0, 5.0, 6.0}));

	string malformed = Exchange(host.GetPort(), "NONSENSE\r\n\r\n");
	CHECK(malformed.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);

	string missing = Exchange(host.GetPort(), "GET /index.html HTTP/1.1\r\n\r\n");
	CHECK(missing.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);

	host.Stop();
	CHECK(!host.IsRunning());
	CHECK(host.GetRequestsServed() == 1);
	return 0;
}

static int TestSilentClientDisconnected()
{
	auto session = MakeSimulatedSession();
	PoseHttpHost host(*session, "127.0.0.1", 0, chrono::milliseconds(200));
	CHECK(host.IsListening());
	host.Start();

	int fd = socket(AF_INET, SOCK_STREAM, 0);
	CHECK(fd >= 0);
	//bounds the wait if the host never closes the connection
	timeval guard;
	guard.tv_sec = 3;
	guard.tv_usec = 0;
	setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &guard, sizeof(guard));
	sockaddr_in address;
	memset(&address, 0, sizeof(address));
	address.sin_family = AF_INET;
	address.sin_port = htons(host.GetPort());
	inet_pton(AF_INET, "127.0.0.1", &address.sin_addr);
	CHECK(connect(fd, (sockaddr*)&address, sizeof(address)) == 0);

	auto start = chrono::steady_clock::now();
	char buffer[64];
	ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
	auto waited = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start);
	close(fd);
	//closed by the host without any response
	CHECK(n == 0);
	CHECK(waited < chrono::milliseconds(2500));
	CHECK(host.GetClientsTimedOut() == 1);

	string response = Exchange(host.GetPort(), "GET /api/get_pose HTTP/1.1\r\n\r\n");
	CHECK(response.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
	host.Stop();
	CHECK(host.GetRequestsServed() == 1);
	CHECK(host.GetClientsTimedOut() == 1);
	return 0;
}

int main()
{
	cout << "=== COMMUNICATION TEST ===" << endl;
	RUN(TestPoseJson);
	RUN(TestHttpParsing);
	RUN(TestRouting);
	RUN(TestServing);
	RUN(TestSilentClientDisconnected);
	cout << "=== ALL PASSED ===" << endl;
	return 0;
}

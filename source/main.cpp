#include <iostream> // for standard I/O
#include <string>   // for strings

#include <thread>
#include <chrono>
#include <memory>
#include <filesystem>

#include <opencv2/core.hpp>     // CommandLineParser

#include <Misc/GlobalConf.hpp>
#include <Misc/path.hpp>
#include <Native/MTSimulation.hpp>
#include <Session/MarkerSession.hpp>
#include <Communication/PoseHttpHost.hpp>

#include <signal.h>
#include <unistd.h>
#include <stdio.h>
#include <stdlib.h>

using namespace std;
using namespace cv;

volatile sig_atomic_t killrequest = false;

void signal_handler(int s)
{
	(void)s;
	killrequest = true;
}

void setup_signal_handler()
{
	struct sigaction sigIntHandler;

	sigIntHandler.sa_handler = signal_handler;
	sigemptyset(&sigIntHandler.sa_mask);
	sigIntHandler.sa_flags = 0;

	sigaction(SIGINT, &sigIntHandler, NULL);
	sigaction(SIGTERM, &sigIntHandler, NULL);
}

unique_ptr<MarkerSession> OpenSession(bool simulate)
{
	SessionConfig config = GetSessionConfig();
	if (!simulate)
	{
		return MarkerSession::Open(config);
	}
	cout << "Serving a simulated tracker" << endl;
	auto simulation = make_unique<MTSimulation>();
	simulation->Markers = MTSimulation::DefaultMarkers();
	return make_unique<MarkerSession>(config, std::move(simulation));
}

void WarmUp(MarkerSession &session, int frames)
{
	if (!session.IsInitialized() || frames <= 0)
	{
		return;
	}
	cout << "Warming up over " << frames << " frames..." << endl;
	int identified = 0;
	for (int i = 0; i < frames && !killrequest; i++)
	{
		PoseFrame frame = session.Poll(false);
		if (!frame.SessionUsable())
		{
			break;
		}
		identified = frame.IdentifiedCount;
	}
	cout << "Warmup done, " << identified << " markers identified on the last frame" << endl;
}

int main(int argc, char** argv )
{
	setup_signal_handler();

	const string keys =
		"{help h usage ? |      | print this message}"
		"{config c       |      | path to the config file, defaults to ../config.json next to the executable}"
		"{simulate s     |      | serve a simulated tracker instead of the MTC library}"
		"{port p         | -1   | port to serve on, overrides the config file}"
		;
	CommandLineParser parser(argc, argv, keys);
	parser.about("Serves MicronTracker marker poses over HTTP");

	if (parser.has("help"))
	{
		parser.printMessage();
		return EXIT_SUCCESS;
	}
	if (!parser.check())
	{
		parser.printErrors();
		return EXIT_FAILURE;
	}

	SetExecutablePath(argv[0]);
	if (parser.has("config"))
	{
		InitConfig(parser.get<string>("config"));
	}
	else
	{
		InitConfig(GetDefaultConfigPath());
	}
	cout << "Using config file " << GetConfigPath().string() << endl;

	ServerConfig server = GetServerConfig();
	int port = parser.get<int>("port");
	if (port >= 0)
	{
		server.Port = port;
	}

	unique_ptr<MarkerSession> session = OpenSession(parser.has("simulate"));
	cout << "Session state : " << SessionStateNames.at(session->GetState()) << endl;
	auto serial = session->GetSerialNumber();
	if (serial.has_value())
	{
		cout << "Camera serial number : " << serial.value() << endl;
	}
	WarmUp(*session, server.WarmupFrames);

	{
		PoseHttpHost host(*session, server.Address, server.Port, chrono::milliseconds(server.RequestTimeoutMs));
		if (!host.IsListening())
		{
			return EXIT_FAILURE;
		}
		host.Start();

		while (!killrequest)
		{
			this_thread::sleep_for(chrono::milliseconds(10));
		}
		cout << "Signal received, cleaning up..." << endl;
		cout << "Served " << host.GetRequestsServed() << " pose requests" << endl;
	}

	return EXIT_SUCCESS;
}

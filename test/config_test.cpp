// test/config_test.cpp
// config.json defaults, write-back and enum parsing

#include <iostream>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <memory>
#include <cstdlib>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "TestSupport.hpp"

#include <Misc/GlobalConf.hpp>
#include <Misc/path.hpp>
#include <Native/MTSimulation.hpp>
#include <Session/MarkerSession.hpp>

using namespace std;
using namespace nlohmann;

static filesystem::path TempConfig(const string &name)
{
	filesystem::path path = filesystem::temp_directory_path() / ("mthost_" + to_string(getpid()) + "_" + name);
	filesystem::remove(path);
	return path;
}

static json ReadBack(const filesystem::path &path)
{
	ifstream file(path);
	json object;
	file >> object;
	return object;
}

static int TestDefaultsWrittenBack()
{
	unsetenv("MTHome");
	filesystem::path path = TempConfig("defaults.json");
	InitConfig(path);
	CHECK(GetConfigPath() == path);
	CHECK(filesystem::exists(path));

	json written = ReadBack(path);
	CHECK(written["MTHome"] == "");
	CHECK(written["Library"] == "Dist64MT4/libMTC.so");
	CHECK(written["CalibrationDirectory"] == "CalibrationFiles");
	CHECK(written["MarkersDirectory"] == "Markers");
	CHECK(written["Camera"]["Index"] == 0);
	CHECK(written["Camera"]["FrameType"] == "Alternating");
	CHECK(written["Camera"]["Decimation"] == "Dec41");
	CHECK(written["Camera"]["BitDepth"] == "Bpp14");
	CHECK(written["Server"]["Address"] == "0.0.0.0");
	CHECK(written["Server"]["Port"] == 18080);
	CHECK(written["Server"]["WarmupFrames"] == 10);
	CHECK(written["Server"]["RequestTimeoutMs"] == 5000);

	SessionConfig session = GetSessionConfig();
	CHECK(session.MTHome.empty());
	CHECK(session.Mode == StreamingMode());
	filesystem::remove(path);
	return 0;
}

static int TestValuesRead()
{
	filesystem::path path = TempConfig("values.json");
	{
		ofstream file(path);
		file << R"({
			"MTHome": "/opt/MicronTracker",
			"Library": "/usr/lib/libMTC.so",
			"Camera": {"Index": 1, "FrameType": "Full", "Decimation": "Dec21", "BitDepth": "Bpp16"},
			"Server": {"Port": 9000}
		})";
	}
	InitConfig(path);
	SessionConfig session = GetSessionConfig();
	CHECK(session.MTHome == "/opt/MicronTracker");
	CHECK(session.Resolve(session.Library) == "/usr/lib/libMTC.so");
	CHECK(session.Resolve(session.MarkersDirectory) == "/opt/MicronTracker/Markers");
	CHECK(session.CameraIndex == 1);
	CHECK(session.Mode.Frame == FrameType::Full);
	CHECK(session.Mode.Decim == Decimation::Dec21);
	//unknown names keep the default
	CHECK(session.Mode.Depth == BitDepth::Bpp14);

	ServerConfig server = GetServerConfig();
	CHECK(server.Port == 9000);
	CHECK(server.Address == "0.0.0.0");

	json written = ReadBack(path);
	CHECK(written["Camera"]["BitDepth"] == "Bpp14");
	CHECK(written["Server"]["WarmupFrames"] == 10);
	CHECK(written["MTHome"] == "/opt/MicronTracker");
	filesystem::remove(path);
	return 0;
}

static int TestEnvironmentFallback()
{
	setenv("MTHome", "/usr/local/MicronTracker", 1);
	CHECK(GetMTHomeFromEnvironment().value_or("") == "/usr/local/MicronTracker");
	filesystem::path path = TempConfig("environment.json");
	InitConfig(path);
	CHECK(GetSessionConfig().MTHome == "/usr/local/MicronTracker");
	unsetenv("MTHome");
	CHECK(!GetMTHomeFromEnvironment().has_value());
	filesystem::remove(path);
	return 0;
}

static int TestUnreadableFile()
{
	filesystem::path path = TempConfig("broken.json");
	{
		ofstream file(path);
		file << "{ this is not json";
	}
	InitConfig(path);
	CHECK(GetServerConfig().Port == 18080);
	CHECK(GetSessionConfig().CameraIndex == 0);

	//a broken file is not replaced by the defaults
	ifstream file(path);
	stringstream content;
	content << file.rdbuf();
	CHECK(content.str() == "{ this is not json");
	filesystem::remove(path);
	return 0;
}

static int TestInvalidValuesCorrected()
{
	filesystem::path path = TempConfig("negative.json");
	{
		ofstream file(path);
		file << R"({"Camera": {"Index": -1}, "Server": {"RequestTimeoutMs": 0}})";
	}
	InitConfig(path);
	CHECK(GetSessionConfig().CameraIndex == 0);
	CHECK(GetServerConfig().RequestTimeoutMs == 5000);

	json written = ReadBack(path);
	CHECK(written["Camera"]["Index"] == 0);
	CHECK(written["Server"]["RequestTimeoutMs"] == 5000);

	//the corrected index opens a session instead of throwing
	auto simulation = make_unique<MTSimulation>();
	simulation->Markers = MTSimulation::DefaultMarkers();
	MarkerSession session(GetSessionConfig(), std::move(simulation));
	CHECK(session.GetState() == SessionState::Ready);
	filesystem::remove(path);
	return 0;
}

static int TestExecutablePath()
{
	SetExecutablePath("/opt/mthost/bin/mthost");
	CHECK(GetExecutablePath() == "/opt/mthost/bin/mthost");
	CHECK(GetMTHostPath() == "/opt/mthost");
	CHECK(GetDefaultConfigPath() == "/opt/mthost/config.json");
	return 0;
}

int main()
{
	cout << "=== CONFIG TEST ===" << endl;
	RUN(TestDefaultsWrittenBack);
	RUN(TestValuesRead);
	RUN(TestEnvironmentFallback);
	RUN(TestUnreadableFile);
	RUN(TestInvalidValuesCorrected);
	RUN(TestExecutablePath);
	cout << "=== ALL PASSED ===" << endl;
	return 0;
}

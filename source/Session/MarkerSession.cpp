#include "Session/MarkerSession.hpp"

#include <iostream>
#include <stdexcept>
#include <algorithm>

#include <Native/MTLibrary.hpp>
#include <Device/DeviceManager.hpp>
#include <Device/ResourceRegistry.hpp>
#include <Pipeline/FramePipeline.hpp>
#include <Pipeline/PoseExtractor.hpp>

using namespace std;

MarkerSession::MarkerSession(DiagnosticKind Kind, const string &Reason)
	:Native(nullptr), Reporter(nullptr), State(SessionState::NotInitialized), InertReason(Kind), FramesServed(0)
{
	Reporter.Fatal(Kind, "MarkerSession", Reason);
}

MarkerSession::MarkerSession(const SessionConfig &Config, unique_ptr<MTInterface> InNative)
	:Native(std::move(InNative)), Reporter(Native.get()), State(SessionState::NotInitialized),
	InertReason(DiagnosticKind::LibraryLoadFailure), FramesServed(0)
{
	if (!Native)
	{
		Reporter.Fatal(DiagnosticKind::LibraryLoadFailure, "MarkerSession", "No native interface, session is inert");
		return;
	}
	Initialise(Config);
}

MarkerSession::~MarkerSession()
{
	//camera handle is not owned, the cameras are released by the device manager
	ActiveCamera.reset();
	Resources.reset();
	Devices.reset();
}

unique_ptr<MarkerSession> MarkerSession::Open(const SessionConfig &Config)
{
	if (Config.MTHome.empty())
	{
		return unique_ptr<MarkerSession>(new MarkerSession(DiagnosticKind::ConfigurationMissing, "MTHome is not set, cannot locate the MTC library"));
	}
	filesystem::path libraryPath = Config.Resolve(Config.Library);
	unique_ptr<MTLibrary> library;
	try
	{
		library = MTLibrary::Load(libraryPath);
	}
	catch(const std::runtime_error& e)
	{
		return unique_ptr<MarkerSession>(new MarkerSession(DiagnosticKind::LibraryLoadFailure, e.what()));
	}
	return make_unique<MarkerSession>(Config, std::move(library));
}

void MarkerSession::Initialise(const SessionConfig &Config)
{
	Devices = make_unique<DeviceManager>(Native.get(), Reporter);
	Resources = make_unique<ResourceRegistry>(Native.get(), Reporter);

	Devices->AttachAvailableCameras(Config.Resolve(Config.CalibrationDirectory));
	Devices->LoadMarkerTemplates(Config.Resolve(Config.MarkersDirectory));

	int count = Devices->GetCameraCount();
	if (count <= 0)
	{
		Reporter.Warn(DiagnosticKind::NoCameraFound, "Cameras_Count", "No camera to connect");
		State = SessionState::NoCamera;
		return;
	}
	cout << count << " camera(s) attached, using camera " << Config.CameraIndex << endl;

	ActiveCamera = Devices->GetCamera(Config.CameraIndex);
	if (ActiveCamera.has_value())
	{
		SerialNumber = Devices->GetSerialNumber(ActiveCamera.value());
	}
	if (SerialNumber.has_value())
	{
		Devices->SetStreamingMode(SerialNumber.value(), Config.Mode);
	}

	Resources->CreateCollection();
	Resources->CreateTransform();

	if (!ActiveCamera.has_value())
	{
		State = SessionState::NoCamera;
	}
	else if (!Resources->IsComplete())
	{
		State = SessionState::ResourcesUnavailable;
	}
	else
	{
		State = SessionState::Ready;
		cout << "Tracker session ready";
		if (SerialNumber.has_value())
		{
			cout << " on camera " << SerialNumber.value();
		}
		cout << endl;
	}
}

PoseFrame MarkerSession::Poll(bool IncludeRotation)
{
	PoseFrame frame;
	size_t reportsBefore = Reporter.GetReportCount();

	switch (State)
	{
	case SessionState::NotInitialized:
		Reporter.Warn(InertReason, "GetPoses", "MTC not initialized");
		frame.Status = FrameStatus::NotInitialized;
		break;

	case SessionState::NoCamera:
		frame.Status = FrameStatus::NoCamera;
		break;

	case SessionState::ResourcesUnavailable:
		frame.Status = FrameStatus::ResourcesUnavailable;
		break;

	case SessionState::Ready:
	{
		FramePipeline pipeline(*Native, Reporter);
		FrameResult result = pipeline.Run(ActiveCamera.value(), Resources->GetCollection());
		FramesServed++;
		if (!result.Succeeded())
		{
			frame.Status = FrameStatus::PipelineFailed;
			break;
		}
		frame.IdentifiedCount = result.MarkerCount;
		if (result.MarkerCount == 0)
		{
			frame.Status = FrameStatus::NoMarkers;
			break;
		}
		PoseExtractor extractor(*Native, Reporter);
		frame.Poses = extractor.Extract(ActiveCamera.value(), *Resources, result.MarkerCount, IncludeRotation);
		frame.Status = FrameStatus::Ok;
		break;
	}
	}

	size_t raised = Reporter.GetReportCount() - reportsBefore;
	const auto &history = Reporter.GetDiagnostics();
	raised = min(raised, history.size());
	frame.Diagnostics.assign(history.end() - (ptrdiff_t)raised, history.end());
	return frame;
}

PoseMap MarkerSession::GetPoses(bool IncludeRotation)
{
	return Poll(IncludeRotation).Poses;
}

optional<cv::Size> MarkerSession::GetResolution()
{
	if (!Devices || !ActiveCamera.has_value())
	{
		return nullopt;
	}
	return Devices->GetResolution(ActiveCamera.value());
}

int MarkerSession::GetCameraCount()
{
	if (!Devices)
	{
		return 0;
	}
	return Devices->GetCameraCount();
}

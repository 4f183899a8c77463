#pragma once

#include <memory>
#include <vector>
#include <optional>
#include <cstdint>
#include <opencv2/core.hpp>

#include <Native/MTHandles.hpp>
#include <Native/MTInterface.hpp>
#include <Diagnostics/ErrorReporter.hpp>
#include <Pipeline/MarkerPose.hpp>
#include <Session/SessionConfig.hpp>

class DeviceManager;
class ResourceRegistry;

enum class SessionState
{
	NotInitialized, //library or configuration missing, the session does nothing
	NoCamera, //no camera attached or selected
	ResourcesUnavailable, //collection or transform could not be created
	Ready
};

const std::map<SessionState, std::string> SessionStateNames = {
	{SessionState::NotInitialized, 			"NotInitialized"},
	{SessionState::NoCamera, 				"NoCamera"},
	{SessionState::ResourcesUnavailable, 	"ResourcesUnavailable"},
	{SessionState::Ready, 					"Ready"}
};

enum class FrameStatus
{
	Ok,
	NoMarkers, //the frame went through but nothing was identified
	PipelineFailed, //grab, process or identify failed for this frame only
	NoCamera,
	ResourcesUnavailable,
	NotInitialized
};

struct PoseFrame
{
	FrameStatus Status = FrameStatus::NotInitialized;
	int IdentifiedCount = 0;
	PoseMap Poses;
	std::vector<Diagnostic> Diagnostics; //raised while serving this frame

	//False when retrying is pointless until the session is recreated
	bool SessionUsable() const
	{
		return Status == FrameStatus::Ok || Status == FrameStatus::NoMarkers || Status == FrameStatus::PipelineFailed;
	}
};

//One tracker session : library, attached camera, marker collection and scratch transform.
//Construction attaches cameras, loads templates, selects the camera, sets its streaming mode and creates the resources.
//Everything acquired is released in reverse order when the session is destroyed, including when construction throws.
//Not thread safe : callers serialize GetPoses / Poll.
class MarkerSession
{
private:
	//declaration order is the release order, reversed
	std::unique_ptr<MTInterface> Native;
	ErrorReporter Reporter;
	std::unique_ptr<DeviceManager> Devices;
	std::unique_ptr<ResourceRegistry> Resources;
	std::optional<CameraHandle> ActiveCamera;
	std::optional<int> SerialNumber;
	SessionState State;
	DiagnosticKind InertReason; //why the session is NotInitialized, repeated on every poll
	uint64_t FramesServed;

	//inert session, Reason is recorded as the fatal diagnostic
	MarkerSession(DiagnosticKind Kind, const std::string &Reason);

	void Initialise(const SessionConfig &Config);

public:
	//Runs the construction protocol on InNative. A null InNative gives an inert session.
	MarkerSession(const SessionConfig &Config, std::unique_ptr<MTInterface> InNative);

	//Loads the MTC library named by Config and starts a session on it.
	//Never fails : a missing installation or library gives an inert session.
	static std::unique_ptr<MarkerSession> Open(const SessionConfig &Config);

	~MarkerSession();

	MarkerSession(const MarkerSession&) = delete;
	MarkerSession& operator=(const MarkerSession&) = delete;

	//Grabs one frame and returns the pose of every identified marker, with the frame's status
	PoseFrame Poll(bool IncludeRotation);

	//Poll, poses only. Empty when the frame failed or the session is unusable.
	PoseMap GetPoses(bool IncludeRotation);

	SessionState GetState() const
	{
		return State;
	}

	bool IsInitialized() const
	{
		return State != SessionState::NotInitialized;
	}

	std::optional<int> GetSerialNumber() const
	{
		return SerialNumber;
	}

	//Resolution of the active camera, queried from the device
	std::optional<cv::Size> GetResolution();

	int GetCameraCount();

	uint64_t GetFramesServed() const
	{
		return FramesServed;
	}

	const ErrorReporter& GetReporter() const
	{
		return Reporter;
	}

	ErrorReporter& GetReporter()
	{
		return Reporter;
	}
};

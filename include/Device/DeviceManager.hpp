#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <opencv2/core.hpp>

#include <Native/MTHandles.hpp>

class MTInterface;
class ErrorReporter;

//Overseer of the attached tracker cameras.
//Attaches cameras and loads marker templates, then answers queries about a given camera.
//Will never throw on a device error : failures are reported and a sentinel is returned.
//Detaches the cameras when destroyed, if they were attached.
class DeviceManager
{
private:
	MTInterface* Native; //null if the library is unavailable
	ErrorReporter& Reporter;
	bool Attached;

public:
	DeviceManager(MTInterface* InNative, ErrorReporter& InReporter);

	~DeviceManager();

	DeviceManager(const DeviceManager&) = delete;
	DeviceManager& operator=(const DeviceManager&) = delete;

	//Scan for connected cameras, using the calibration files in CalibrationDirectory
	bool AttachAvailableCameras(const std::filesystem::path &CalibrationDirectory);

	bool LoadMarkerTemplates(const std::filesystem::path &MarkersDirectory);

	//0 if the native layer is unavailable
	int GetCameraCount();

	//Index is 0-based. Negative indices are a programming error and throw std::out_of_range.
	std::optional<CameraHandle> GetCamera(int Index);

	std::optional<int> GetSerialNumber(const CameraHandle &Camera);

	std::optional<cv::Size> GetResolution(const CameraHandle &Camera);

	//The camera keeps its previous mode if this fails
	bool SetStreamingMode(int SerialNumber, const StreamingMode &Mode);

	bool IsAttached() const
	{
		return Attached;
	}

	//Releases the cameras. Called by the destructor.
	void Detach();
};

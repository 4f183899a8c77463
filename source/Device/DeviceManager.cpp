#include "Device/DeviceManager.hpp"

#include <iostream>
#include <stdexcept>

#include <Native/MTInterface.hpp>
#include <Diagnostics/ErrorReporter.hpp>

using namespace std;

DeviceManager::DeviceManager(MTInterface* InNative, ErrorReporter& InReporter)
	:Native(InNative), Reporter(InReporter), Attached(false)
{
}

DeviceManager::~DeviceManager()
{
	Detach();
}

void DeviceManager::Detach()
{
	if (!Attached || Native == nullptr)
	{
		return;
	}
	Native->Cameras_Detach();
	Attached = false;
	cout << "Cameras detached." << endl;
}

bool DeviceManager::AttachAvailableCameras(const filesystem::path &CalibrationDirectory)
{
	if (Native == nullptr)
	{
		Reporter.Report("Cameras_AttachAvailableCameras");
		return false;
	}
	mtCompletionCode result = Native->Cameras_AttachAvailableCameras(CalibrationDirectory.c_str());
	if (result != mtOK)
	{
		Reporter.Report("Cameras_AttachAvailableCameras");
		return false;
	}
	Attached = true;
	cout << "Successfully attached available cameras." << endl;
	return true;
}

bool DeviceManager::LoadMarkerTemplates(const filesystem::path &MarkersDirectory)
{
	if (Native == nullptr)
	{
		Reporter.Report("Markers_LoadTemplates");
		return false;
	}
	mtCompletionCode result = Native->Markers_LoadTemplates(MarkersDirectory.c_str());
	if (result != mtOK)
	{
		Reporter.Report("Markers_LoadTemplates");
		return false;
	}
	cout << "Successfully loaded marker templates." << endl;
	return true;
}

int DeviceManager::GetCameraCount()
{
	if (Native == nullptr)
	{
		return 0;
	}
	return Native->Cameras_Count();
}

optional<CameraHandle> DeviceManager::GetCamera(int Index)
{
	if (Index < 0)
	{
		throw out_of_range("Camera index " + to_string(Index) + " is negative");
	}
	if (Native == nullptr)
	{
		Reporter.Report("Cameras_ItemGet");
		return nullopt;
	}
	int count = Native->Cameras_Count();
	if (Index >= count)
	{
		Reporter.Warn(DiagnosticKind::NativeCallFailure, "Cameras_ItemGet", "camera index " + to_string(Index) + " out of range, " + to_string(count) + " camera(s) attached");
		return nullopt;
	}
	mtHandle camera = mtHandleNull;
	mtCompletionCode result = Native->Cameras_ItemGet(Index, &camera);
	if (result != mtOK)
	{
		Reporter.Report("Cameras_ItemGet");
		return nullopt;
	}
	if (camera == mtHandleNull)
	{
		Reporter.Warn(DiagnosticKind::NativeCallFailure, "Cameras_ItemGet", "null handle for camera " + to_string(Index));
		return nullopt;
	}
	return CameraHandle(camera);
}

optional<int> DeviceManager::GetSerialNumber(const CameraHandle &Camera)
{
	if (Native == nullptr)
	{
		return nullopt;
	}
	int serial = 0;
	mtCompletionCode result = Native->Camera_SerialNumberGet(Camera.Get(), &serial);
	if (result != mtOK)
	{
		Reporter.Report("Camera_SerialNumberGet");
		return nullopt;
	}
	return serial;
}

optional<cv::Size> DeviceManager::GetResolution(const CameraHandle &Camera)
{
	if (Native == nullptr)
	{
		return nullopt;
	}
	int width = 0, height = 0;
	mtCompletionCode result = Native->Camera_ResolutionGet(Camera.Get(), &width, &height);
	if (result != mtOK)
	{
		Reporter.Report("Camera_ResolutionGet");
		return nullopt;
	}
	return cv::Size(width, height);
}

bool DeviceManager::SetStreamingMode(int SerialNumber, const StreamingMode &Mode)
{
	if (Native == nullptr)
	{
		return false;
	}
	mtStreamingModeStruct record = Mode.ToNative();
	mtCompletionCode result = Native->Cameras_StreamingModeSet(&record, SerialNumber);
	if (result != mtOK)
	{
		Reporter.Report("Cameras_StreamingModeSet");
		return false;
	}
	cout << "Camera " << SerialNumber << " streaming mode set to " << Mode << endl;
	return true;
}

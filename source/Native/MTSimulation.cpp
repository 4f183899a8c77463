#include "Native/MTSimulation.hpp"

#include <iostream>
#include <cstring>
#include <algorithm>

using namespace std;
using namespace cv;

//first camera handle, cameras are numbered contiguously from here
const mtHandle SimulatedCameraBase = 0x10;
const mtCompletionCode SimulatedFailure = 1;

MTSimulation::MTSimulation()
{
}

MTSimulation::~MTSimulation()
{
}

vector<SimulatedMarker> MTSimulation::DefaultMarkers()
{
	return {
		SimulatedMarker("A", Vec3d(1,2,3)),
		SimulatedMarker("B", Vec3d(4,5,6))
	};
}

bool MTSimulation::Enter(const string &Operation)
{
	CallCounts[Operation]++;
	if (FailingCalls.count(Operation))
	{
		LastError = string("Simulated failure in ") + Operation;
		return true;
	}
	return false;
}

mtCompletionCode MTSimulation::Fail(const string &Operation, const string &Reason)
{
	LastError = Operation + ": " + Reason;
	return SimulatedFailure;
}

bool MTSimulation::IsCamera(mtHandle Camera) const
{
	return Attached && Camera >= SimulatedCameraBase && Camera < SimulatedCameraBase + CameraCount;
}

int MTSimulation::GetCallCount(const string &Operation) const
{
	auto it = CallCounts.find(Operation);
	return it == CallCounts.end() ? 0 : it->second;
}

int MTSimulation::GetTotalCallCount() const
{
	int total = 0;
	for (auto &i : CallCounts)
	{
		total += i.second;
	}
	return total;
}

void MTSimulation::ResetCallCounts()
{
	CallCounts.clear();
}

const char* MTSimulation::MTLastErrorString()
{
	CallCounts["MTLastErrorString"]++;
	return LastError.c_str();
}

mtCompletionCode MTSimulation::Cameras_AttachAvailableCameras(const char* CalibrationDirectory)
{
	if (Enter("Cameras_AttachAvailableCameras"))
	{
		return SimulatedFailure;
	}
	if (CalibrationDirectory == nullptr)
	{
		return Fail("Cameras_AttachAvailableCameras", "null calibration directory");
	}
	Attached = true;
	return mtOK;
}

void MTSimulation::Cameras_Detach()
{
	CallCounts["Cameras_Detach"]++;
	Attached = false;
	FrameGrabbed = false;
	FrameProcessed = false;
}

mtCompletionCode MTSimulation::Markers_LoadTemplates(const char* MarkersDirectory)
{
	if (Enter("Markers_LoadTemplates"))
	{
		return SimulatedFailure;
	}
	if (MarkersDirectory == nullptr)
	{
		return Fail("Markers_LoadTemplates", "null markers directory");
	}
	TemplatesLoaded = true;
	return mtOK;
}

int MTSimulation::Cameras_Count()
{
	CallCounts["Cameras_Count"]++;
	return Attached ? CameraCount : 0;
}

mtCompletionCode MTSimulation::Cameras_ItemGet(int Index, mtHandle* Camera)
{
	if (Enter("Cameras_ItemGet"))
	{
		return SimulatedFailure;
	}
	if (!Attached || Index < 0 || Index >= CameraCount)
	{
		return Fail("Cameras_ItemGet", "camera index out of range");
	}
	*Camera = SimulatedCameraBase + Index;
	return mtOK;
}

mtCompletionCode MTSimulation::Camera_SerialNumberGet(mtHandle Camera, int* Serial)
{
	if (Enter("Camera_SerialNumberGet"))
	{
		return SimulatedFailure;
	}
	if (!IsCamera(Camera))
	{
		return Fail("Camera_SerialNumberGet", "invalid camera handle");
	}
	*Serial = SerialNumber + (int)(Camera - SimulatedCameraBase);
	return mtOK;
}

mtCompletionCode MTSimulation::Camera_ResolutionGet(mtHandle Camera, int* Width, int* Height)
{
	if (Enter("Camera_ResolutionGet"))
	{
		return SimulatedFailure;
	}
	if (!IsCamera(Camera))
	{
		return Fail("Camera_ResolutionGet", "invalid camera handle");
	}
	*Width = Resolution.width;
	*Height = Resolution.height;
	return mtOK;
}

mtCompletionCode MTSimulation::Cameras_StreamingModeSet(mtStreamingModeStruct* InMode, int Serial)
{
	if (Enter("Cameras_StreamingModeSet"))
	{
		return SimulatedFailure;
	}
	if (InMode == nullptr || !Attached || Serial < SerialNumber || Serial >= SerialNumber + CameraCount)
	{
		return Fail("Cameras_StreamingModeSet", "no camera with this serial number");
	}
	StreamingMode mode;
	mode.Frame = (FrameType)InMode->frameType;
	mode.Decim = (Decimation)InMode->decimation;
	mode.Depth = (BitDepth)InMode->bitDepth;
	Mode = mode;
	return mtOK;
}

mtHandle MTSimulation::Collection_New()
{
	if (Enter("Collection_New"))
	{
		return mtHandleNull;
	}
	mtHandle collection = NextHandle++;
	Collections[collection] = {};
	return collection;
}

void MTSimulation::Collection_Free(mtHandle Collection)
{
	CallCounts["Collection_Free"]++;
	if (Collections.erase(Collection) == 0)
	{
		InvalidFrees++;
	}
}

int MTSimulation::Collection_Count(mtHandle Collection)
{
	CallCounts["Collection_Count"]++;
	auto it = Collections.find(Collection);
	return it == Collections.end() ? 0 : (int)it->second.size();
}

mtHandle MTSimulation::Collection_Int(mtHandle Collection, int Index)
{
	CallCounts["Collection_Int"]++;
	auto it = Collections.find(Collection);
	if (it == Collections.end() || Index < 1 || Index > (int)it->second.size())
	{
		Fail("Collection_Int", "index out of range");
		return mtHandleNull;
	}
	return it->second[Index-1];
}

mtHandle MTSimulation::Xform3D_New()
{
	if (Enter("Xform3D_New"))
	{
		return mtHandleNull;
	}
	mtHandle transform = NextHandle++;
	Transforms[transform] = SimulatedTransform();
	return transform;
}

void MTSimulation::Xform3D_Free(mtHandle Transform)
{
	CallCounts["Xform3D_Free"]++;
	if (Transforms.erase(Transform) == 0)
	{
		InvalidFrees++;
	}
}

mtCompletionCode MTSimulation::Cameras_GrabFrame(mtHandle Camera)
{
	FrameGrabbed = false;
	FrameProcessed = false;
	if (Enter("Cameras_GrabFrame"))
	{
		return SimulatedFailure;
	}
	if (!IsCamera(Camera))
	{
		return Fail("Cameras_GrabFrame", "invalid camera handle");
	}
	FrameGrabbed = true;
	return mtOK;
}

mtCompletionCode MTSimulation::Markers_ProcessFrame(mtHandle Camera)
{
	if (Enter("Markers_ProcessFrame"))
	{
		return SimulatedFailure;
	}
	if (!IsCamera(Camera) || !FrameGrabbed)
	{
		return Fail("Markers_ProcessFrame", "no frame grabbed");
	}
	FrameProcessed = true;
	return mtOK;
}

mtCompletionCode MTSimulation::Markers_IdentifiedMarkersGet(mtHandle Camera, mtHandle Collection)
{
	if (Enter("Markers_IdentifiedMarkersGet"))
	{
		return SimulatedFailure;
	}
	auto it = Collections.find(Collection);
	if (it == Collections.end())
	{
		return Fail("Markers_IdentifiedMarkersGet", "invalid collection handle");
	}
	if (!IsCamera(Camera) || !FrameProcessed)
	{
		return Fail("Markers_IdentifiedMarkersGet", "no frame processed");
	}
	//marker handles only live for one frame
	FrameMarkers.clear();
	it->second.clear();
	for (auto &marker : Markers)
	{
		mtHandle handle = NextHandle++;
		FrameMarkers[handle] = marker;
		it->second.push_back(handle);
	}
	return mtOK;
}

mtCompletionCode MTSimulation::Marker_Marker2CameraXfGet(mtHandle Marker, mtHandle Camera, mtHandle Transform, mtHandle* IdentifyingCamera)
{
	if (Enter("Marker_Marker2CameraXfGet"))
	{
		return SimulatedFailure;
	}
	auto marker = FrameMarkers.find(Marker);
	auto transform = Transforms.find(Transform);
	if (marker == FrameMarkers.end() || transform == Transforms.end() || !IsCamera(Camera))
	{
		return Fail("Marker_Marker2CameraXfGet", "invalid handle");
	}
	if (marker->second.PoseFails)
	{
		return Fail("Marker_Marker2CameraXfGet", string("cannot compute pose of ") + marker->second.Name);
	}
	transform->second.Shift = marker->second.Position;
	transform->second.Rotation = marker->second.Rotation;
	*IdentifyingCamera = marker->second.Located ? Camera : mtHandleNull;
	return mtOK;
}

mtCompletionCode MTSimulation::Xform3D_ShiftGet(mtHandle Transform, double* Shift)
{
	if (Enter("Xform3D_ShiftGet"))
	{
		return SimulatedFailure;
	}
	auto transform = Transforms.find(Transform);
	if (transform == Transforms.end())
	{
		return Fail("Xform3D_ShiftGet", "invalid transform handle");
	}
	for (int i = 0; i < 3; i++)
	{
		Shift[i] = transform->second.Shift[i];
	}
	return mtOK;
}

mtCompletionCode MTSimulation::Xform3D_RotMatGet(mtHandle Transform, double* Rotation)
{
	if (Enter("Xform3D_RotMatGet"))
	{
		return SimulatedFailure;
	}
	auto transform = Transforms.find(Transform);
	if (transform == Transforms.end())
	{
		return Fail("Xform3D_RotMatGet", "invalid transform handle");
	}
	//Matx stores its values row-major
	for (int i = 0; i < 9; i++)
	{
		Rotation[i] = transform->second.Rotation.val[i];
	}
	return mtOK;
}

mtCompletionCode MTSimulation::Marker_NameGet(mtHandle Marker, char* Buffer, int BufferSize, int* ActualLength)
{
	if (Enter("Marker_NameGet"))
	{
		return SimulatedFailure;
	}
	auto marker = FrameMarkers.find(Marker);
	if (marker == FrameMarkers.end() || Buffer == nullptr || BufferSize <= 0)
	{
		return Fail("Marker_NameGet", "invalid marker handle or buffer");
	}
	if (marker->second.NameFails)
	{
		return Fail("Marker_NameGet", "name unavailable");
	}
	const string &name = marker->second.Name;
	int written = min((int)name.size(), BufferSize);
	memcpy(Buffer, name.data(), written);
	if (PadNameBuffer)
	{
		memset(Buffer + written, 'X', BufferSize - written);
	}
	if (ActualLength != nullptr)
	{
		*ActualLength = written;
	}
	return mtOK;
}

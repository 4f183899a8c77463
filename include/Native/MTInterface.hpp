#pragma once

#include <Native/MTTypes.hpp>

//One virtual per MTC entry point, with the exact argument layout of the native call.
//MTLibrary forwards to the shared library, MTSimulation emulates a tracker in-process.
class MTInterface
{
public:
	virtual ~MTInterface() {}

	//Text of the last error raised by any MTC call. Process-wide, overwritten by the next failing call.
	virtual const char* MTLastErrorString() = 0;

	virtual mtCompletionCode Cameras_AttachAvailableCameras(const char* CalibrationDirectory) = 0;
	virtual void Cameras_Detach() = 0;
	virtual mtCompletionCode Markers_LoadTemplates(const char* MarkersDirectory) = 0;
	virtual int Cameras_Count() = 0;
	virtual mtCompletionCode Cameras_ItemGet(int Index, mtHandle* Camera) = 0;
	virtual mtCompletionCode Camera_SerialNumberGet(mtHandle Camera, int* SerialNumber) = 0;
	virtual mtCompletionCode Camera_ResolutionGet(mtHandle Camera, int* Width, int* Height) = 0;
	virtual mtCompletionCode Cameras_StreamingModeSet(mtStreamingModeStruct* Mode, int SerialNumber) = 0;

	virtual mtHandle Collection_New() = 0;
	virtual void Collection_Free(mtHandle Collection) = 0;
	virtual int Collection_Count(mtHandle Collection) = 0;
	//1-based
	virtual mtHandle Collection_Int(mtHandle Collection, int Index) = 0;

	virtual mtHandle Xform3D_New() = 0;
	virtual void Xform3D_Free(mtHandle Transform) = 0;

	virtual mtCompletionCode Cameras_GrabFrame(mtHandle Camera) = 0;
	virtual mtCompletionCode Markers_ProcessFrame(mtHandle Camera) = 0;
	virtual mtCompletionCode Markers_IdentifiedMarkersGet(mtHandle Camera, mtHandle Collection) = 0;

	virtual mtCompletionCode Marker_Marker2CameraXfGet(mtHandle Marker, mtHandle Camera, mtHandle Transform, mtHandle* IdentifyingCamera) = 0;
	virtual mtCompletionCode Xform3D_ShiftGet(mtHandle Transform, double* Shift) = 0; //3 doubles
	virtual mtCompletionCode Xform3D_RotMatGet(mtHandle Transform, double* Rotation) = 0; //9 doubles, row-major
	virtual mtCompletionCode Marker_NameGet(mtHandle Marker, char* Buffer, int BufferSize, int* ActualLength) = 0;
};

#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include <optional>
#include <opencv2/core.hpp>

#include <Native/MTInterface.hpp>

//A marker the simulated tracker will identify on every processed frame
struct SimulatedMarker
{
	std::string Name;
	cv::Vec3d Position;
	cv::Matx33d Rotation = cv::Matx33d::eye();
	bool Located = true; //if false, the pose call succeeds but reports no identifying camera
	bool PoseFails = false;
	bool NameFails = false;

	SimulatedMarker()
	{}

	SimulatedMarker(std::string InName, cv::Vec3d InPosition, cv::Matx33d InRotation = cv::Matx33d::eye())
		:Name(InName), Position(InPosition), Rotation(InRotation)
	{}
};

//In-process stand-in for the MTC library.
//Behaves like an attached tracker seeing a fixed set of markers, counts every call,
//and can be told to fail any entry point by name.
class MTSimulation : public MTInterface
{
public:
	//Scenario, can be changed between frames
	int CameraCount = 1;
	int SerialNumber = 10001;
	cv::Size Resolution = cv::Size(1024, 768);
	std::vector<SimulatedMarker> Markers;
	std::set<std::string> FailingCalls; //entry points that return an error, by MTC name
	bool PadNameBuffer = true; //fill the rest of name buffers with non-zero garbage, like an uninitialised buffer

private:
	struct SimulatedTransform
	{
		cv::Vec3d Shift;
		cv::Matx33d Rotation = cv::Matx33d::eye();
	};

	std::map<std::string, int> CallCounts;
	std::string LastError;
	bool Attached = false;
	bool TemplatesLoaded = false;
	std::optional<StreamingMode> Mode;

	mtHandle NextHandle = 0x100;
	std::map<mtHandle, std::vector<mtHandle>> Collections;
	std::map<mtHandle, SimulatedTransform> Transforms;
	std::map<mtHandle, SimulatedMarker> FrameMarkers; //markers handles valid for the current frame
	int InvalidFrees = 0;
	bool FrameGrabbed = false;
	bool FrameProcessed = false;

	//counts the call, and returns true if it has been told to fail
	bool Enter(const std::string &Operation);
	mtCompletionCode Fail(const std::string &Operation, const std::string &Reason);
	bool IsCamera(mtHandle Camera) const;

public:
	MTSimulation();
	virtual ~MTSimulation();

	//Two markers "A" and "B", used by the simulate entry point
	static std::vector<SimulatedMarker> DefaultMarkers();

	int GetCallCount(const std::string &Operation) const;
	int GetTotalCallCount() const;
	void ResetCallCounts();

	bool IsAttached() const { return Attached; }
	bool AreTemplatesLoaded() const { return TemplatesLoaded; }
	std::optional<StreamingMode> GetStreamingMode() const { return Mode; }
	size_t GetLiveCollections() const { return Collections.size(); }
	size_t GetLiveTransforms() const { return Transforms.size(); }
	int GetInvalidFrees() const { return InvalidFrees; }

	virtual const char* MTLastErrorString() override;
	virtual mtCompletionCode Cameras_AttachAvailableCameras(const char* CalibrationDirectory) override;
	virtual void Cameras_Detach() override;
	virtual mtCompletionCode Markers_LoadTemplates(const char* MarkersDirectory) override;
	virtual int Cameras_Count() override;
	virtual mtCompletionCode Cameras_ItemGet(int Index, mtHandle* Camera) override;
	virtual mtCompletionCode Camera_SerialNumberGet(mtHandle Camera, int* Serial) override;
	virtual mtCompletionCode Camera_ResolutionGet(mtHandle Camera, int* Width, int* Height) override;
	virtual mtCompletionCode Cameras_StreamingModeSet(mtStreamingModeStruct* InMode, int Serial) override;
	virtual mtHandle Collection_New() override;
	virtual void Collection_Free(mtHandle Collection) override;
	virtual int Collection_Count(mtHandle Collection) override;
	virtual mtHandle Collection_Int(mtHandle Collection, int Index) override;
	virtual mtHandle Xform3D_New() override;
	virtual void Xform3D_Free(mtHandle Transform) override;
	virtual mtCompletionCode Cameras_GrabFrame(mtHandle Camera) override;
	virtual mtCompletionCode Markers_ProcessFrame(mtHandle Camera) override;
	virtual mtCompletionCode Markers_IdentifiedMarkersGet(mtHandle Camera, mtHandle Collection) override;
	virtual mtCompletionCode Marker_Marker2CameraXfGet(mtHandle Marker, mtHandle Camera, mtHandle Transform, mtHandle* IdentifyingCamera) override;
	virtual mtCompletionCode Xform3D_ShiftGet(mtHandle Transform, double* Shift) override;
	virtual mtCompletionCode Xform3D_RotMatGet(mtHandle Transform, double* Rotation) override;
	virtual mtCompletionCode Marker_NameGet(mtHandle Marker, char* Buffer, int BufferSize, int* ActualLength) override;
};

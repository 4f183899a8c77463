#include "Pipeline/FramePipeline.hpp"

#include <algorithm>

#include <Native/MTInterface.hpp>
#include <Diagnostics/ErrorReporter.hpp>

using namespace std;

FramePipeline::FramePipeline(MTInterface& InNative, ErrorReporter& InReporter)
	:Native(InNative), Reporter(InReporter), State(FrameState::Idle)
{
}

bool FramePipeline::Advance(FrameState Next, const char* Operation, int result)
{
	if (result != mtOK)
	{
		Reporter.Report(Operation);
		return false;
	}
	State = Next;
	return true;
}

FrameResult FramePipeline::Run(const CameraHandle &Camera, const CollectionHandle &Collection)
{
	State = FrameState::Idle;
	FrameResult result;

	if (!Advance(FrameState::Grabbed, "Cameras_GrabFrame", Native.Cameras_GrabFrame(Camera.Get()))
		|| !Advance(FrameState::Processed, "Markers_ProcessFrame", Native.Markers_ProcessFrame(Camera.Get()))
		|| !Advance(FrameState::Identified, "Markers_IdentifiedMarkersGet", Native.Markers_IdentifiedMarkersGet(Camera.Get(), Collection.Get())))
	{
		result.State = State;
		return result;
	}

	result.State = State;
	result.MarkerCount = max(0, Native.Collection_Count(Collection.Get()));
	return result;
}

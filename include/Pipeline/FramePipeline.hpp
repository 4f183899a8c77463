#pragma once

#include <map>
#include <string>

#include <Native/MTHandles.hpp>

class MTInterface;
class ErrorReporter;

enum class FrameState
{
	Idle,
	Grabbed,
	Processed,
	Identified
};

const std::map<FrameState, std::string> FrameStateNames = {
	{FrameState::Idle, 			"Idle"},
	{FrameState::Grabbed, 		"Grabbed"},
	{FrameState::Processed, 	"Processed"},
	{FrameState::Identified, 	"Identified"}
};

struct FrameResult
{
	FrameState State = FrameState::Idle; //last state reached
	int MarkerCount = 0; //only non-zero if State is Identified

	bool Succeeded() const
	{
		return State == FrameState::Identified;
	}
};

//Grabs one frame, processes it and fills the collection with the identified markers.
//Every run starts from Idle. A failed transition is reported and ends the run with a count of 0,
//the next run is unaffected.
class FramePipeline
{
private:
	MTInterface& Native;
	ErrorReporter& Reporter;
	FrameState State;

	bool Advance(FrameState Next, const char* Operation, int result);

public:
	FramePipeline(MTInterface& InNative, ErrorReporter& InReporter);

	FrameResult Run(const CameraHandle &Camera, const CollectionHandle &Collection);

	FrameState GetState() const
	{
		return State;
	}
};

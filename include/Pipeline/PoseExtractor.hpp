#pragma once

#include <string>
#include <optional>

#include <Native/MTHandles.hpp>
#include <Pipeline/MarkerPose.hpp>

class MTInterface;
class ErrorReporter;
class ResourceRegistry;

//Turns the markers identified in the current frame into poses keyed by marker name.
//The transform in the registry is scratch space : its values are copied out right after each marker's pose is computed.
//A marker that fails at any step is skipped, the others are still returned.
class PoseExtractor
{
private:
	MTInterface& Native;
	ErrorReporter& Reporter;

public:
	PoseExtractor(MTInterface& InNative, ErrorReporter& InReporter);

	//Index is 1-based, as in MTC collections. Throws std::out_of_range outside of [1, Count].
	MarkerHandle GetMarker(const CollectionHandle &Collection, int Index, int Count);

	//Marker pose relative to Camera, computed into Transform then copied out
	std::optional<MarkerPose> ComputePose(const MarkerHandle &Marker, const CameraHandle &Camera,
		const TransformHandle &Transform, bool IncludeRotation);

	//Name is cut to the length reported by MTC, the buffer is never read as a C string
	std::optional<std::string> GetMarkerName(const MarkerHandle &Marker);

	//Collects poses of markers 1..Count. No native call is made if Count is 0.
	PoseMap Extract(const CameraHandle &Camera, const ResourceRegistry &Resources, int Count, bool IncludeRotation);
};

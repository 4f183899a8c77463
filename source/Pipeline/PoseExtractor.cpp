#include "Pipeline/PoseExtractor.hpp"

#include <array>
#include <algorithm>
#include <stdexcept>

#include <Native/MTInterface.hpp>
#include <Diagnostics/ErrorReporter.hpp>
#include <Device/ResourceRegistry.hpp>

using namespace std;
using namespace cv;

PoseExtractor::PoseExtractor(MTInterface& InNative, ErrorReporter& InReporter)
	:Native(InNative), Reporter(InReporter)
{
}

MarkerHandle PoseExtractor::GetMarker(const CollectionHandle &Collection, int Index, int Count)
{
	if (Index < 1 || Index > Count)
	{
		throw out_of_range("Marker index " + to_string(Index) + " outside of [1, " + to_string(Count) + "]");
	}
	return MarkerHandle(Native.Collection_Int(Collection.Get(), Index));
}

optional<MarkerPose> PoseExtractor::ComputePose(const MarkerHandle &Marker, const CameraHandle &Camera,
	const TransformHandle &Transform, bool IncludeRotation)
{
	mtHandle identifyingCamera = mtHandleNull;
	if (Native.Marker_Marker2CameraXfGet(Marker.Get(), Camera.Get(), Transform.Get(), &identifyingCamera) != mtOK)
	{
		Reporter.Report("Marker_Marker2CameraXfGet");
		return nullopt;
	}
	if (identifyingCamera == mtHandleNull)
	{
		Reporter.Warn(DiagnosticKind::MarkerNotLocated, "Marker_Marker2CameraXfGet", "marker was not located by the active camera");
		return nullopt;
	}

	MarkerPose pose;
	array<double, 3> shift{};
	if (Native.Xform3D_ShiftGet(Transform.Get(), shift.data()) != mtOK)
	{
		Reporter.Report("Xform3D_ShiftGet");
		return nullopt;
	}
	pose.Position = Vec3d(shift[0], shift[1], shift[2]);

	if (IncludeRotation)
	{
		array<double, 9> rotation{};
		if (Native.Xform3D_RotMatGet(Transform.Get(), rotation.data()) != mtOK)
		{
			Reporter.Report("Xform3D_RotMatGet");
			return nullopt;
		}
		pose.Rotation = Matx33d(rotation.data());
	}
	return pose;
}

optional<string> PoseExtractor::GetMarkerName(const MarkerHandle &Marker)
{
	array<char, MT_MAX_STRING_LENGTH> buffer;
	int actualLength = 0;
	if (Native.Marker_NameGet(Marker.Get(), buffer.data(), (int)buffer.size(), &actualLength) != mtOK)
	{
		Reporter.Report("Marker_NameGet");
		return nullopt;
	}
	size_t length = (size_t)clamp(actualLength, 0, (int)buffer.size());
	return string(buffer.data(), length);
}

PoseMap PoseExtractor::Extract(const CameraHandle &Camera, const ResourceRegistry &Resources, int Count, bool IncludeRotation)
{
	PoseMap poses;
	for (int i = 1; i <= Count; i++)
	{
		MarkerHandle marker = GetMarker(Resources.GetCollection(), i, Count);
		if (marker.IsNull())
		{
			Reporter.Report("Collection_Int");
			continue;
		}
		optional<MarkerPose> pose = ComputePose(marker, Camera, Resources.GetTransform(), IncludeRotation);
		if (!pose.has_value())
		{
			continue;
		}
		optional<string> name = GetMarkerName(marker);
		if (!name.has_value())
		{
			continue;
		}
		//MTC may identify the same name twice, the last one wins
		poses[name.value()] = pose.value();
	}
	return poses;
}

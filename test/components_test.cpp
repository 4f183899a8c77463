// test/components_test.cpp
// Device manager, resource registry, frame pipeline, pose extractor and error reporter, one at a time

#include <iostream>
#include <sstream>
#include <string>
#include <stdexcept>

#include "TestSupport.hpp"

#include <Native/MTSimulation.hpp>
#include <Diagnostics/ErrorReporter.hpp>
#include <Device/DeviceManager.hpp>
#include <Device/ResourceRegistry.hpp>
#include <Pipeline/FramePipeline.hpp>
#include <Pipeline/PoseExtractor.hpp>

using namespace std;
using namespace cv;

static int TestHandles()
{
	CameraHandle empty;
	CHECK(empty.IsNull());
	CHECK(!empty);

	CameraHandle camera(0x10);
	CHECK(camera.Get() == 0x10);
	CameraHandle moved(std::move(camera));
	CHECK(moved.Get() == 0x10);
	CHECK(camera.IsNull());

	CHECK(moved.Release() == 0x10);
	CHECK(moved.IsNull());
	return 0;
}

static int TestStreamingModeRecord()
{
	StreamingMode mode;
	CHECK(mode.Frame == FrameType::Alternating);
	CHECK(mode.Decim == Decimation::Dec41);
	CHECK(mode.Depth == BitDepth::Bpp14);
	mtStreamingModeStruct record = mode.ToNative();
	CHECK(record.frameType == 3);
	CHECK(record.decimation == 3);
	CHECK(record.bitDepth == 1);

	CHECK(EnumFromName(DecimationNames, "Dec21") == Decimation::Dec21);
	CHECK(!EnumFromName(BitDepthNames, "Bpp16").has_value());

	ostringstream printed;
	printed << mode;
	CHECK(printed.str().find("Alternating") != string::npos);
	return 0;
}

static int TestErrorReporter()
{
	MTSimulation sim;
	ErrorReporter reporter(&sim, 2);
	reporter.SetSilent(true);

	sim.FailingCalls = {"Cameras_GrabFrame"};
	CHECK(sim.Cameras_GrabFrame(0x10) != mtOK);
	Diagnostic diag = reporter.Report("Cameras_GrabFrame");
	CHECK(diag.Kind == DiagnosticKind::NativeCallFailure);
	CHECK(diag.Severity == DiagnosticSeverity::Warning);
	CHECK(diag.Message == "Simulated failure in Cameras_GrabFrame");
	CHECK(sim.GetCallCount("MTLastErrorString") == 1);

	reporter.Warn(DiagnosticKind::NoCameraFound, "Cameras_Count", "No camera to connect");
	CHECK(!reporter.HasFatal());
	reporter.Fatal(DiagnosticKind::LibraryLoadFailure, "MarkerSession", "gone");
	CHECK(reporter.HasFatal());
	//history is bounded, the count is not
	CHECK(reporter.GetDiagnostics().size() == 2);
	CHECK(reporter.GetReportCount() == 3);
	CHECK(reporter.GetDiagnostics().front().Kind == DiagnosticKind::NoCameraFound);

	ostringstream printed;
	printed << reporter.GetDiagnostics().back();
	CHECK(printed.str() == "ERROR: LibraryLoadFailure in MarkerSession: gone");

	reporter.Clear();
	CHECK(reporter.GetDiagnostics().empty());
	CHECK(!reporter.HasFatal());

	ErrorReporter unbound(nullptr);
	unbound.SetSilent(true);
	CHECK(unbound.Report("Cameras_Count").Message == "MTC not initialized");
	return 0;
}

static int TestDeviceManager()
{
	MTSimulation sim;
	sim.CameraCount = 2;
	ErrorReporter reporter(&sim);
	reporter.SetSilent(true);
	{
		DeviceManager devices(&sim, reporter);
		CHECK(devices.GetCameraCount() == 0);
		CHECK(devices.AttachAvailableCameras("/opt/MicronTracker/CalibrationFiles"));
		CHECK(devices.IsAttached());
		CHECK(devices.LoadMarkerTemplates("/opt/MicronTracker/Markers"));
		CHECK(devices.GetCameraCount() == 2);

		auto camera = devices.GetCamera(1);
		CHECK(camera.has_value());
		CHECK(devices.GetSerialNumber(camera.value()).value_or(0) == 10002);
		CHECK(devices.GetResolution(camera.value()).value_or(Size()) == Size(1024, 768));

		CHECK(!devices.GetCamera(2).has_value());
		bool thrown = false;
		try
		{
			devices.GetCamera(-1);
		}
		catch(const std::out_of_range&)
		{
			thrown = true;
		}
		CHECK(thrown);

		StreamingMode mode;
		CHECK(devices.SetStreamingMode(10001, mode));
		CHECK(sim.GetStreamingMode().value() == mode);
		CHECK(!devices.SetStreamingMode(42, mode));

		sim.FailingCalls = {"Camera_SerialNumberGet", "Camera_ResolutionGet"};
		CHECK(!devices.GetSerialNumber(camera.value()).has_value());
		CHECK(!devices.GetResolution(camera.value()).has_value());
		CHECK(reporter.GetDiagnostics().back().Operation == "Camera_ResolutionGet");
	}
	CHECK(!sim.IsAttached());
	CHECK(sim.GetCallCount("Cameras_Detach") == 1);

	//attach failure : nothing to detach
	MTSimulation failing;
	failing.FailingCalls = {"Cameras_AttachAvailableCameras"};
	{
		DeviceManager devices(&failing, reporter);
		CHECK(!devices.AttachAvailableCameras("CalibrationFiles"));
		CHECK(!devices.IsAttached());
	}
	CHECK(failing.GetCallCount("Cameras_Detach") == 0);

	DeviceManager nolibrary(nullptr, reporter);
	CHECK(nolibrary.GetCameraCount() == 0);
	CHECK(!nolibrary.GetCamera(0).has_value());
	return 0;
}

static int TestResourceRegistry()
{
	MTSimulation sim;
	ErrorReporter reporter(&sim);
	reporter.SetSilent(true);
	{
		ResourceRegistry resources(&sim, reporter);
		CHECK(!resources.IsComplete());
		CHECK(resources.CreateCollection());
		CHECK(resources.CreateCollection());
		CHECK(resources.CreateTransform());
		CHECK(resources.IsComplete());
		CHECK(sim.GetCallCount("Collection_New") == 1);
		CHECK(sim.GetLiveCollections() == 1);
		CHECK(sim.GetLiveTransforms() == 1);

		resources.Release();
		CHECK(!resources.IsComplete());
		CHECK(sim.GetLiveCollections() == 0);
	}
	//the destructor does not free twice
	CHECK(sim.GetCallCount("Collection_Free") == 1);
	CHECK(sim.GetCallCount("Xform3D_Free") == 1);
	CHECK(sim.GetInvalidFrees() == 0);

	sim.FailingCalls = {"Collection_New"};
	ResourceRegistry failed(&sim, reporter);
	CHECK(!failed.CreateCollection());
	CHECK(reporter.GetDiagnostics().back().Operation == "Collection_New");
	return 0;
}

static int TestFramePipeline()
{
	MTSimulation sim;
	sim.Markers = MTSimulation::DefaultMarkers();
	ErrorReporter reporter(&sim);
	reporter.SetSilent(true);
	CHECK(sim.Cameras_AttachAvailableCameras("CalibrationFiles") == mtOK);
	CameraHandle camera(0x10);
	CollectionHandle collection(sim.Collection_New());

	FramePipeline pipeline(sim, reporter);
	CHECK(pipeline.GetState() == FrameState::Idle);
	FrameResult result = pipeline.Run(camera, collection);
	CHECK(result.Succeeded());
	CHECK(result.MarkerCount == 2);
	CHECK(pipeline.GetState() == FrameState::Identified);

	sim.FailingCalls = {"Markers_ProcessFrame"};
	result = pipeline.Run(camera, collection);
	CHECK(!result.Succeeded());
	CHECK(result.State == FrameState::Grabbed);
	CHECK(result.MarkerCount == 0);
	CHECK(sim.GetCallCount("Markers_IdentifiedMarkersGet") == 1);

	sim.FailingCalls = {"Markers_IdentifiedMarkersGet"};
	result = pipeline.Run(camera, collection);
	CHECK(result.State == FrameState::Processed);

	sim.FailingCalls = {"Cameras_GrabFrame"};
	result = pipeline.Run(camera, collection);
	CHECK(result.State == FrameState::Idle);
	CHECK(FrameStateNames.at(result.State) == "Idle");

	sim.FailingCalls.clear();
	CHECK(pipeline.Run(camera, collection).MarkerCount == 2);

	sim.Collection_Free(collection.Release());
	return 0;
}

static int TestPoseExtractor()
{
	MTSimulation sim;
	sim.Markers = MTSimulation::DefaultMarkers();
	ErrorReporter reporter(&sim);
	reporter.SetSilent(true);
	CHECK(sim.Cameras_AttachAvailableCameras("CalibrationFiles") == mtOK);
	CameraHandle camera(0x10);
	ResourceRegistry resources(&sim, reporter);
	CHECK(resources.CreateCollection() && resources.CreateTransform());
	FramePipeline pipeline(sim, reporter);
	FrameResult frame = pipeline.Run(camera, resources.GetCollection());
	CHECK(frame.MarkerCount == 2);

	PoseExtractor extractor(sim, reporter);
	bool thrown = false;
	try
	{
		extractor.GetMarker(resources.GetCollection(), 0, frame.MarkerCount);
	}
	catch(const std::out_of_range&)
	{
		thrown = true;
	}
	CHECK(thrown);
	thrown = false;
	try
	{
		extractor.GetMarker(resources.GetCollection(), 3, frame.MarkerCount);
	}
	catch(const std::out_of_range&)
	{
		thrown = true;
	}
	CHECK(thrown);

	MarkerHandle second = extractor.GetMarker(resources.GetCollection(), 2, frame.MarkerCount);
	CHECK(!second.IsNull());
	CHECK(extractor.GetMarkerName(second).value_or("") == "B");
	auto pose = extractor.ComputePose(second, camera, resources.GetTransform(), false);
	CHECK(pose.has_value());
	CHECK(Near(pose->Position, Vec3d(4,5,6)));
	CHECK(!pose->Rotation.has_value());

	sim.FailingCalls = {"Xform3D_ShiftGet"};
	CHECK(!extractor.ComputePose(second, camera, resources.GetTransform(), true).has_value());
	sim.FailingCalls = {"Xform3D_RotMatGet"};
	CHECK(!extractor.ComputePose(second, camera, resources.GetTransform(), true).has_value());
	CHECK(extractor.ComputePose(second, camera, resources.GetTransform(), false).has_value());
	sim.FailingCalls.clear();

	sim.ResetCallCounts();
	CHECK(extractor.Extract(camera, resources, 0, true).empty());
	CHECK(sim.GetTotalCallCount() == 0);

	PoseMap poses = extractor.Extract(camera, resources, frame.MarkerCount, true);
	CHECK(poses.size() == 2);
	CHECK(Near(poses["A"].Rotation.value(), Matx33d::eye()));
	return 0;
}

int main()
{
	cout << "=== COMPONENTS TEST ===" << endl;
	RUN(TestHandles);
	RUN(TestStreamingModeRecord);
	RUN(TestErrorReporter);
	RUN(TestDeviceManager);
	RUN(TestResourceRegistry);
	RUN(TestFramePipeline);
	RUN(TestPoseExtractor);
	cout << "=== ALL PASSED ===" << endl;
	return 0;
}

#include "Native/MTLibrary.hpp"

#include <iostream>
#include <stdexcept>
#include <dlfcn.h>

using namespace std;

MTLibrary::MTLibrary(void* InModuleHandle, filesystem::path InModulePath)
	:ModuleHandle(InModuleHandle), ModulePath(InModulePath), Table{}
{
}

MTLibrary::~MTLibrary()
{
	if (ModuleHandle != nullptr)
	{
		dlclose(ModuleHandle);
		ModuleHandle = nullptr;
	}
}

unique_ptr<MTLibrary> MTLibrary::Load(const filesystem::path &Path)
{
	void* module = dlopen(Path.c_str(), RTLD_NOW);
	if (module == nullptr)
	{
		const char* reason = dlerror();
		throw runtime_error(string("Failed to load library '") + Path.string() + "', error: '" + (reason ? reason : "unknown") + "'.");
	}
	//the destructor closes the module if a symbol is missing
	unique_ptr<MTLibrary> library(new MTLibrary(module, Path));
	library->BindAll();
	cout << "Loaded MTC library from " << Path.string() << endl;
	return library;
}

template<class FunctionType>
void MTLibrary::Bind(FunctionType*& Target, const char* Name)
{
	dlerror();
	void* symbol = dlsym(ModuleHandle, Name);
	if (symbol == nullptr)
	{
		const char* reason = dlerror();
		throw runtime_error(string("Failed to find symbol '") + Name + "' in library '" + ModulePath.string() + "', error: '" + (reason ? reason : "null symbol") + "'.");
	}
	Target = reinterpret_cast<FunctionType*>(symbol);
}

#define MT_BIND(name) Bind(Table.name, #name)

void MTLibrary::BindAll()
{
	MT_BIND(MTLastErrorString);
	MT_BIND(Cameras_AttachAvailableCameras);
	MT_BIND(Cameras_Detach);
	MT_BIND(Markers_LoadTemplates);
	MT_BIND(Cameras_Count);
	MT_BIND(Cameras_ItemGet);
	MT_BIND(Camera_SerialNumberGet);
	MT_BIND(Camera_ResolutionGet);
	MT_BIND(Cameras_StreamingModeSet);
	MT_BIND(Collection_New);
	MT_BIND(Collection_Free);
	MT_BIND(Collection_Count);
	MT_BIND(Collection_Int);
	MT_BIND(Xform3D_New);
	MT_BIND(Xform3D_Free);
	MT_BIND(Cameras_GrabFrame);
	MT_BIND(Markers_ProcessFrame);
	MT_BIND(Markers_IdentifiedMarkersGet);
	MT_BIND(Marker_Marker2CameraXfGet);
	MT_BIND(Xform3D_ShiftGet);
	MT_BIND(Xform3D_RotMatGet);
	MT_BIND(Marker_NameGet);
}

#undef MT_BIND

const char* MTLibrary::MTLastErrorString()
{
	return Table.MTLastErrorString();
}

mtCompletionCode MTLibrary::Cameras_AttachAvailableCameras(const char* CalibrationDirectory)
{
	return Table.Cameras_AttachAvailableCameras(CalibrationDirectory);
}

void MTLibrary::Cameras_Detach()
{
	Table.Cameras_Detach();
}

mtCompletionCode MTLibrary::Markers_LoadTemplates(const char* MarkersDirectory)
{
	return Table.Markers_LoadTemplates(MarkersDirectory);
}

int MTLibrary::Cameras_Count()
{
	return Table.Cameras_Count();
}

mtCompletionCode MTLibrary::Cameras_ItemGet(int Index, mtHandle* Camera)
{
	return Table.Cameras_ItemGet(Index, Camera);
}

mtCompletionCode MTLibrary::Camera_SerialNumberGet(mtHandle Camera, int* SerialNumber)
{
	return Table.Camera_SerialNumberGet(Camera, SerialNumber);
}

mtCompletionCode MTLibrary::Camera_ResolutionGet(mtHandle Camera, int* Width, int* Height)
{
	return Table.Camera_ResolutionGet(Camera, Width, Height);
}

mtCompletionCode MTLibrary::Cameras_StreamingModeSet(mtStreamingModeStruct* Mode, int SerialNumber)
{
	return Table.Cameras_StreamingModeSet(Mode, SerialNumber);
}

mtHandle MTLibrary::Collection_New()
{
	return Table.Collection_New();
}

void MTLibrary::Collection_Free(mtHandle Collection)
{
	Table.Collection_Free(Collection);
}

int MTLibrary::Collection_Count(mtHandle Collection)
{
	return Table.Collection_Count(Collection);
}

mtHandle MTLibrary::Collection_Int(mtHandle Collection, int Index)
{
	return Table.Collection_Int(Collection, Index);
}

mtHandle MTLibrary::Xform3D_New()
{
	return Table.Xform3D_New();
}

void MTLibrary::Xform3D_Free(mtHandle Transform)
{
	Table.Xform3D_Free(Transform);
}

mtCompletionCode MTLibrary::Cameras_GrabFrame(mtHandle Camera)
{
	return Table.Cameras_GrabFrame(Camera);
}

mtCompletionCode MTLibrary::Markers_ProcessFrame(mtHandle Camera)
{
	return Table.Markers_ProcessFrame(Camera);
}

mtCompletionCode MTLibrary::Markers_IdentifiedMarkersGet(mtHandle Camera, mtHandle Collection)
{
	return Table.Markers_IdentifiedMarkersGet(Camera, Collection);
}

mtCompletionCode MTLibrary::Marker_Marker2CameraXfGet(mtHandle Marker, mtHandle Camera, mtHandle Transform, mtHandle* IdentifyingCamera)
{
	return Table.Marker_Marker2CameraXfGet(Marker, Camera, Transform, IdentifyingCamera);
}

mtCompletionCode MTLibrary::Xform3D_ShiftGet(mtHandle Transform, double* Shift)
{
	return Table.Xform3D_ShiftGet(Transform, Shift);
}

mtCompletionCode MTLibrary::Xform3D_RotMatGet(mtHandle Transform, double* Rotation)
{
	return Table.Xform3D_RotMatGet(Transform, Rotation);
}

mtCompletionCode MTLibrary::Marker_NameGet(mtHandle Marker, char* Buffer, int BufferSize, int* ActualLength)
{
	return Table.Marker_NameGet(Marker, Buffer, BufferSize, ActualLength);
}

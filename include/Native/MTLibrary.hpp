#pragma once

#include <memory>
#include <string>
#include <filesystem>

#include <Native/MTInterface.hpp>

//MTC shared library, loaded at runtime.
//Every entry point is bound once at load time through an explicit function pointer type,
//so the argument and return layout is never guessed at call time.
//The library is unloaded when this object is destroyed.
class MTLibrary : public MTInterface
{
private:
	struct FunctionTable
	{
		const char* (*MTLastErrorString)();
		mtCompletionCode (*Cameras_AttachAvailableCameras)(const char*);
		void (*Cameras_Detach)();
		mtCompletionCode (*Markers_LoadTemplates)(const char*);
		int (*Cameras_Count)();
		mtCompletionCode (*Cameras_ItemGet)(int, mtHandle*);
		mtCompletionCode (*Camera_SerialNumberGet)(mtHandle, int*);
		mtCompletionCode (*Camera_ResolutionGet)(mtHandle, int*, int*);
		mtCompletionCode (*Cameras_StreamingModeSet)(mtStreamingModeStruct*, int);
		mtHandle (*Collection_New)();
		void (*Collection_Free)(mtHandle);
		int (*Collection_Count)(mtHandle);
		mtHandle (*Collection_Int)(mtHandle, int);
		mtHandle (*Xform3D_New)();
		void (*Xform3D_Free)(mtHandle);
		mtCompletionCode (*Cameras_GrabFrame)(mtHandle);
		mtCompletionCode (*Markers_ProcessFrame)(mtHandle);
		mtCompletionCode (*Markers_IdentifiedMarkersGet)(mtHandle, mtHandle);
		mtCompletionCode (*Marker_Marker2CameraXfGet)(mtHandle, mtHandle, mtHandle, mtHandle*);
		mtCompletionCode (*Xform3D_ShiftGet)(mtHandle, double*);
		mtCompletionCode (*Xform3D_RotMatGet)(mtHandle, double*);
		mtCompletionCode (*Marker_NameGet)(mtHandle, char*, int, int*);
	};

	void* ModuleHandle;
	std::filesystem::path ModulePath;
	FunctionTable Table;

	MTLibrary(void* InModuleHandle, std::filesystem::path InModulePath);

	template<class FunctionType>
	void Bind(FunctionType*& Target, const char* Name);

	void BindAll();

public:
	//Loads the module and binds every entry point. Throws std::runtime_error if the module or any symbol is missing.
	static std::unique_ptr<MTLibrary> Load(const std::filesystem::path &Path);

	virtual ~MTLibrary();

	MTLibrary(const MTLibrary&) = delete;
	MTLibrary& operator=(const MTLibrary&) = delete;

	const std::filesystem::path& GetModulePath() const
	{
		return ModulePath;
	}

	virtual const char* MTLastErrorString() override;
	virtual mtCompletionCode Cameras_AttachAvailableCameras(const char* CalibrationDirectory) override;
	virtual void Cameras_Detach() override;
	virtual mtCompletionCode Markers_LoadTemplates(const char* MarkersDirectory) override;
	virtual int Cameras_Count() override;
	virtual mtCompletionCode Cameras_ItemGet(int Index, mtHandle* Camera) override;
	virtual mtCompletionCode Camera_SerialNumberGet(mtHandle Camera, int* SerialNumber) override;
	virtual mtCompletionCode Camera_ResolutionGet(mtHandle Camera, int* Width, int* Height) override;
	virtual mtCompletionCode Cameras_StreamingModeSet(mtStreamingModeStruct* Mode, int SerialNumber) override;
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

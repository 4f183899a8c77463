#include "Device/ResourceRegistry.hpp"

#include <Native/MTInterface.hpp>
#include <Diagnostics/ErrorReporter.hpp>

using namespace std;

ResourceRegistry::ResourceRegistry(MTInterface* InNative, ErrorReporter& InReporter)
	:Native(InNative), Reporter(InReporter)
{
}

ResourceRegistry::~ResourceRegistry()
{
	Release();
}

bool ResourceRegistry::CreateCollection()
{
	if (!Collection.IsNull())
	{
		return true;
	}
	if (Native == nullptr)
	{
		return false;
	}
	mtHandle collection = Native->Collection_New();
	if (collection == mtHandleNull)
	{
		Reporter.Report("Collection_New");
		return false;
	}
	Collection = CollectionHandle(collection);
	return true;
}

bool ResourceRegistry::CreateTransform()
{
	if (!Transform.IsNull())
	{
		return true;
	}
	if (Native == nullptr)
	{
		return false;
	}
	mtHandle transform = Native->Xform3D_New();
	if (transform == mtHandleNull)
	{
		Reporter.Report("Xform3D_New");
		return false;
	}
	Transform = TransformHandle(transform);
	return true;
}

void ResourceRegistry::Release()
{
	if (Native == nullptr)
	{
		return;
	}
	if (!Transform.IsNull())
	{
		Native->Xform3D_Free(Transform.Release());
	}
	if (!Collection.IsNull())
	{
		Native->Collection_Free(Collection.Release());
	}
}

#pragma once

#include <Native/MTHandles.hpp>

class MTInterface;
class ErrorReporter;

//Owns the two native objects reused by every frame : the marker collection and the scratch transform.
//They are created once and freed exactly once, when the registry is destroyed.
class ResourceRegistry
{
private:
	MTInterface* Native;
	ErrorReporter& Reporter;
	CollectionHandle Collection;
	TransformHandle Transform;

public:
	ResourceRegistry(MTInterface* InNative, ErrorReporter& InReporter);

	~ResourceRegistry();

	ResourceRegistry(const ResourceRegistry&) = delete;
	ResourceRegistry& operator=(const ResourceRegistry&) = delete;

	//Does nothing and returns true if the collection already exists
	bool CreateCollection();

	bool CreateTransform();

	//Both resources exist, the pipeline can run
	bool IsComplete() const
	{
		return !Collection.IsNull() && !Transform.IsNull();
	}

	const CollectionHandle& GetCollection() const
	{
		return Collection;
	}

	const TransformHandle& GetTransform() const
	{
		return Transform;
	}

	void Release();
};

#pragma once

#include <Native/MTTypes.hpp>

//Typed wrappers around the raw MTC handles.
//Each kind gets its own type so a collection can never be passed where a camera is expected.
//Handles are move-only : ownership of a native object is never duplicated by accident.
//Releasing the native object is the job of whoever created it (DeviceManager, ResourceRegistry).

struct CameraTag {};
struct CollectionTag {};
struct TransformTag {};
struct MarkerTag {};

template<class Tag>
class TypedHandle
{
private:
	mtHandle Value;

public:
	TypedHandle()
		:Value(mtHandleNull)
	{}

	explicit TypedHandle(mtHandle InValue)
		:Value(InValue)
	{}

	TypedHandle(const TypedHandle&) = delete;
	TypedHandle& operator=(const TypedHandle&) = delete;

	TypedHandle(TypedHandle&& other) noexcept
		:Value(other.Value)
	{
		other.Value = mtHandleNull;
	}

	TypedHandle& operator=(TypedHandle&& other) noexcept
	{
		if (this != &other)
		{
			Value = other.Value;
			other.Value = mtHandleNull;
		}
		return *this;
	}

	mtHandle Get() const
	{
		return Value;
	}

	bool IsNull() const
	{
		return Value == mtHandleNull;
	}

	explicit operator bool() const
	{
		return !IsNull();
	}

	//Gives the raw value up, leaving this handle null
	mtHandle Release()
	{
		mtHandle old = Value;
		Value = mtHandleNull;
		return old;
	}
};

typedef TypedHandle<CameraTag> CameraHandle;
typedef TypedHandle<CollectionTag> CollectionHandle;
typedef TypedHandle<TransformTag> TransformHandle;
typedef TypedHandle<MarkerTag> MarkerHandle;

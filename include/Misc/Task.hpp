#pragma once

#include <atomic>
#include <memory>
#include <thread>

//Base class for objects that run their own thread.
//Derived classes implement ThreadEntryPoint, which should return once killed is set,
//and call Stop() in their destructor so the thread never outlives the derived object.
class Task
{
protected:
	std::atomic<bool> killed;
	std::unique_ptr<std::thread> ThreadHandle;

public:
	Task();
	virtual ~Task();

	Task(const Task&) = delete;
	Task& operator=(const Task&) = delete;

	void Start();

	//Sets killed and joins the thread
	void Stop();

	bool IsKilled() const
	{
		return killed;
	}

	bool IsRunning() const
	{
		return ThreadHandle != nullptr;
	}

protected:
	virtual void ThreadEntryPoint() = 0;
};

//Names the calling thread, as shown by top and gdb (truncated to 15 characters)
void SetThreadName(const char* name);

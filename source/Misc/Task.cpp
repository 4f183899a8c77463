#include "Misc/Task.hpp"

#include <string>
#include <cstring>
#include <iostream>
#include <pthread.h>

using namespace std;

Task::Task()
	:killed(false)
{
}

Task::~Task()
{
	Stop();
}

void Task::Start()
{
	if (ThreadHandle)
	{
		return;
	}
	killed = false;
	ThreadHandle = make_unique<thread>(&Task::ThreadEntryPoint, this);
}

void Task::Stop()
{
	killed = true;
	if (ThreadHandle)
	{
		if (ThreadHandle->joinable())
		{
			ThreadHandle->join();
		}
		ThreadHandle.reset();
	}
}

void SetThreadName(const char* name)
{
	string truncated(name);
	if (truncated.size() > 15)
	{
		truncated.resize(15);
	}
	int err = pthread_setname_np(pthread_self(), truncated.c_str());
	if (err != 0)
	{
		cerr << "Failed to name thread " << truncated << " : " << strerror(err) << endl;
	}
}

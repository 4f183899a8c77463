#include "Misc/path.hpp"

#include <iostream>
#include <cstdlib>

using namespace std;

filesystem::path ExecutablePath, MTHostPath;

filesystem::path GetExecutablePath()
{
    return ExecutablePath;
}
filesystem::path GetMTHostPath()
{
    return MTHostPath;
}

void SetExecutablePath(const char* path)
{
    ExecutablePath = filesystem::weakly_canonical(filesystem::path(path));
    MTHostPath = ExecutablePath.parent_path().parent_path();
}

optional<filesystem::path> GetMTHomeFromEnvironment()
{
    const char* env = getenv("MTHome");
    if (env == nullptr || env[0] == '\0')
    {
        cerr << "WARNING: MTHome not found in the environment." << endl;
        return nullopt;
    }
    return filesystem::path(env);
}

#pragma once
#include <filesystem>
#include <optional>

std::filesystem::path GetExecutablePath();
//Directory holding the bin directory, where config.json lives
std::filesystem::path GetMTHostPath();

void SetExecutablePath(const char* path);

//Installation root of the tracker SDK, from the MTHome environment variable. Warns and returns nullopt if unset.
std::optional<std::filesystem::path> GetMTHomeFromEnvironment();

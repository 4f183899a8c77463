#pragma once

#include <string>
#include <filesystem>

#include <Session/SessionConfig.hpp>

//Defines all global config parameters, and also reads the config file.
//Keys missing from the file are written back with their default value.
//A file that cannot be parsed is left untouched and the defaults are used.

struct ServerConfig
{
	std::string Address; //interface to listen on
	int Port;
	int WarmupFrames; //frames polled and thrown away before serving
	int RequestTimeoutMs; //clients silent for longer are disconnected
};

//Reads (or re-reads) the config file at filepath. Getters call it with the default path if it was never called.
void InitConfig(const std::filesystem::path &filepath);

//<install dir>/config.json
std::filesystem::path GetDefaultConfigPath();

std::filesystem::path GetConfigPath();

//Session settings. An empty MTHome in the config file is resolved from the environment.
SessionConfig GetSessionConfig();

ServerConfig GetServerConfig();

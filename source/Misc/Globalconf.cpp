#include "Misc/GlobalConf.hpp"

#include <Misc/path.hpp>

#include <map>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace std;

bool ConfigInitialised = false;
filesystem::path ConfigPath;

//Default values
string MTHomeSetting = "";
SessionConfig SessionCfg;
const ServerConfig DefaultServerCfg = {"0.0.0.0", 18080, 10, 5000};
ServerConfig ServerCfg = DefaultServerCfg;

template<class dataType, class accessorType>
void CopyOrDefaultRef(nlohmann::json &owner, accessorType accessor, dataType &value)
{
	if (owner.contains(accessor))
	{
		value = owner[accessor];
	}
	else
	{
		owner[accessor] = value;
	}
}

template<class accessorType>
nlohmann::json& CopyOrDefaultJson(nlohmann::json &owner, accessorType accessor)
{
	if (!owner.contains(accessor))
	{
		owner[accessor] = nlohmann::json();
	}
	return owner.at(accessor);
}

//Enums are stored by name. Unknown names keep the default and are overwritten.
template<class EnumType, class accessorType>
void CopyOrDefaultEnum(nlohmann::json &owner, accessorType accessor, EnumType &value, const map<EnumType, string> &names)
{
	if (owner.contains(accessor) && owner[accessor].is_string())
	{
		string name = owner[accessor];
		auto parsed = EnumFromName(names, name);
		if (parsed.has_value())
		{
			value = parsed.value();
			return;
		}
		cerr << "WARNING: Unknown value \"" << name << "\" for " << accessor << " in config, using " << names.at(value) << endl;
	}
	owner[accessor] = names.at(value);
}

//filesystem paths go through strings
template<class accessorType>
void CopyOrDefaultPath(nlohmann::json &owner, accessorType accessor, filesystem::path &value)
{
	string str = value.string();
	CopyOrDefaultRef(owner, accessor, str);
	value = str;
}

void InitConfig(const filesystem::path &filepath)
{
	ConfigPath = filepath;
	MTHomeSetting = "";
	SessionCfg = SessionConfig();
	ServerCfg = DefaultServerCfg;

	nlohmann::json configobj;
	bool writeback = true;
	try
	{
		ifstream file(filepath);
		if (file.is_open())
		{
			file >> configobj;
		}
		else
		{
			cout << "No config file at " << filepath.string() << ", creating one with default values" << endl;
		}
	}
	catch(const std::exception& e)
	{
		std::cerr << "ERROR: Cannot parse config file " << filepath.string() << ", using default values and leaving the file as is : " << e.what() << '\n';
		configobj = nlohmann::json::object();
		writeback = false;
	}
	if (!configobj.is_object())
	{
		configobj = nlohmann::json::object();
	}

	try
	{
		CopyOrDefaultRef(configobj, "MTHome", MTHomeSetting);
		CopyOrDefaultPath(configobj, "Library", SessionCfg.Library);
		CopyOrDefaultPath(configobj, "CalibrationDirectory", SessionCfg.CalibrationDirectory);
		CopyOrDefaultPath(configobj, "MarkersDirectory", SessionCfg.MarkersDirectory);

		nlohmann::json &Camera = CopyOrDefaultJson(configobj, "Camera");
		{
			CopyOrDefaultRef(Camera, 	"Index", 		SessionCfg.CameraIndex);
			if (SessionCfg.CameraIndex < 0)
			{
				cerr << "WARNING: Negative Camera.Index " << SessionCfg.CameraIndex << " in config, using 0" << endl;
				SessionCfg.CameraIndex = 0;
				Camera["Index"] = SessionCfg.CameraIndex;
			}
			CopyOrDefaultEnum(Camera, 	"FrameType", 	SessionCfg.Mode.Frame, 	FrameTypeNames);
			CopyOrDefaultEnum(Camera, 	"Decimation", 	SessionCfg.Mode.Decim, 	DecimationNames);
			CopyOrDefaultEnum(Camera, 	"BitDepth", 	SessionCfg.Mode.Depth, 	BitDepthNames);
		}

		nlohmann::json &Server = CopyOrDefaultJson(configobj, "Server");
		{
			CopyOrDefaultRef(Server, "Address", 		ServerCfg.Address);
			CopyOrDefaultRef(Server, "Port", 			ServerCfg.Port);
			CopyOrDefaultRef(Server, "WarmupFrames", 	ServerCfg.WarmupFrames);
			CopyOrDefaultRef(Server, "RequestTimeoutMs", ServerCfg.RequestTimeoutMs);
			if (ServerCfg.RequestTimeoutMs <= 0)
			{
				cerr << "WARNING: Server.RequestTimeoutMs must be positive, using " << DefaultServerCfg.RequestTimeoutMs << endl;
				ServerCfg.RequestTimeoutMs = DefaultServerCfg.RequestTimeoutMs;
				Server["RequestTimeoutMs"] = ServerCfg.RequestTimeoutMs;
			}
		}
	}
	catch(const nlohmann::json::exception& e)
	{
		std::cerr << "Error in config file, some values were not applied : " << e.what() << '\n';
	}

	if (writeback)
	{
		try
		{
			ofstream file(filepath);
			file << std::setfill('\t') << std::setw(1);
			file << configobj;
		}
		catch(const std::exception& e)
		{
			std::cerr << "Failed to serialize config: " << e.what() << '\n';
		}
	}

	ConfigInitialised = true;
}

void InitConfig()
{
	if (ConfigInitialised)
	{
		return;
	}
	InitConfig(GetDefaultConfigPath());
}

filesystem::path GetDefaultConfigPath()
{
	return GetMTHostPath() / "config.json";
}

filesystem::path GetConfigPath()
{
	InitConfig();
	return ConfigPath;
}

SessionConfig GetSessionConfig()
{
	InitConfig();
	SessionConfig config = SessionCfg;
	if (!MTHomeSetting.empty())
	{
		config.MTHome = MTHomeSetting;
	}
	else
	{
		config.MTHome = GetMTHomeFromEnvironment().value_or(filesystem::path());
	}
	return config;
}

ServerConfig GetServerConfig()
{
	InitConfig();
	return ServerCfg;
}

#pragma once

#include <filesystem>

#include <Native/MTTypes.hpp>

//Everything a MarkerSession needs to start, resolved by the caller
struct SessionConfig
{
	std::filesystem::path MTHome; //installation root, empty if it could not be resolved
	std::filesystem::path Library = "Dist64MT4/libMTC.so"; //relative paths are relative to MTHome
	std::filesystem::path CalibrationDirectory = "CalibrationFiles";
	std::filesystem::path MarkersDirectory = "Markers";
	int CameraIndex = 0;
	StreamingMode Mode; //Alternating / Dec41 / Bpp14

	std::filesystem::path Resolve(const std::filesystem::path &path) const
	{
		if (path.is_absolute())
		{
			return path;
		}
		return MTHome / path;
	}
};

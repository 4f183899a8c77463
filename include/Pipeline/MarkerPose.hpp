#pragma once

#include <map>
#include <string>
#include <optional>
#include <opencv2/core.hpp>

//Pose of a marker relative to the camera that identified it. Units are the tracker's (mm).
struct MarkerPose
{
	cv::Vec3d Position;
	std::optional<cv::Matx33d> Rotation; //row-major, only present if requested
};

//Marker display name to pose, for one frame. Order carries no meaning.
typedef std::map<std::string, MarkerPose> PoseMap;

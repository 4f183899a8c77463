#include "Communication/PoseJson.hpp"

#include <Misc/MatToJSON.hpp>

using namespace std;
using namespace nlohmann;

json PoseToJson(const MarkerPose &Pose)
{
	json objectified;
	objectified["pos"] = VecToJson(Pose.Position);
	if (Pose.Rotation.has_value())
	{
		objectified["rot"] = MatxToJson(Pose.Rotation.value());
	}
	return objectified;
}

MarkerPose JsonToPose(const json &object)
{
	MarkerPose pose;
	pose.Position = JsonToVec<double, 3>(object.at("pos"));
	if (object.contains("rot"))
	{
		pose.Rotation = JsonToMatx<double, 3, 3>(object.at("rot"));
	}
	return pose;
}

json PoseMapToJson(const PoseMap &Poses)
{
	json objectified = json::object();
	for (auto &i : Poses)
	{
		objectified[i.first] = PoseToJson(i.second);
	}
	return objectified;
}

PoseMap JsonToPoseMap(const json &object)
{
	PoseMap poses;
	for (auto &i : object.items())
	{
		poses[i.key()] = JsonToPose(i.value());
	}
	return poses;
}

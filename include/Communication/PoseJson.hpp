#pragma once

#include <nlohmann/json.hpp>
#include <Pipeline/MarkerPose.hpp>

//{"pos": [x, y, z], "rot": [[r00, r01, r02], [r10, r11, r12], [r20, r21, r22]]}, rot only if the pose has one
nlohmann::json PoseToJson(const MarkerPose &Pose);

//Throws nlohmann::json::exception on a malformed document
MarkerPose JsonToPose(const nlohmann::json &object);

//{"<marker name>": <pose>, ...}
nlohmann::json PoseMapToJson(const PoseMap &Poses);

PoseMap JsonToPoseMap(const nlohmann::json &object);

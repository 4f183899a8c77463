#pragma once

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

//Small fixed-size OpenCV types to plain JSON arrays and back.
//Vectors become [x, y, z], matrices become one array per row.

template<class T, int n>
nlohmann::json VecToJson(const cv::Vec<T, n> &vec)
{
	nlohmann::json object = nlohmann::json::array();
	for (int i = 0; i < n; i++)
	{
		object.push_back(vec[i]);
	}
	return object;
}

//Throws nlohmann::json::exception if the array is too short or holds something else than numbers
template<class T, int n>
cv::Vec<T, n> JsonToVec(const nlohmann::json &object)
{
	cv::Vec<T, n> vec;
	for (int i = 0; i < n; i++)
	{
		vec[i] = object.at(i).template get<T>();
	}
	return vec;
}

template<class T, int m, int n>
nlohmann::json MatxToJson(const cv::Matx<T, m, n> &matrix)
{
	nlohmann::json object = nlohmann::json::array();
	for (int i = 0; i < m; i++)
	{
		nlohmann::json row = nlohmann::json::array();
		for (int j = 0; j < n; j++)
		{
			row.push_back(matrix(i, j));
		}
		object.push_back(row);
	}
	return object;
}

template<class T, int m, int n>
cv::Matx<T, m, n> JsonToMatx(const nlohmann::json &object)
{
	cv::Matx<T, m, n> matrix;
	for (int i = 0; i < m; i++)
	{
		auto &row = object.at(i);
		for (int j = 0; j < n; j++)
		{
			matrix(i, j) = row.at(j).template get<T>();
		}
	}
	return matrix;
}

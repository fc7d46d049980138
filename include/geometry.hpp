#pragma once

#include <map>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "pose_types.hpp"

// Interior angle at b between rays b->a and b->c, in degrees [0, 180].
// Only x and y are used. Coincident points give a finite but meaningless value.
double calculateAngle(const Eigen::Vector2d& a, const Eigen::Vector2d& b, const Eigen::Vector2d& c);
double calculateAngle(const Eigen::Vector3d& a, const Eigen::Vector3d& b, const Eigen::Vector3d& c);

// {left,right}_{shoulder,elbow,hip,knee}; joints whose landmarks are missing are left out
std::map<std::string, double> computeJointAngles(const std::vector<Eigen::Vector3d>& landmarks,
                                                 const LandmarkMap& landmarkMap);

// Population statistics, 0 for an empty series
double seriesMean(const std::vector<double>& values);
double seriesStdDev(const std::vector<double>& values);

#pragma once

// C++ Standard Library
#include <string>
#include <vector>

// Third-party libraries
#include <Eigen/Core>
#include <opencv2/core.hpp>

#include "pose_types.hpp"

// Pose sequences on disk, in the frame layout the web backend sends:
//   pose_data:
//     - landmarks: [[x, y, z], ...]
//       landmark_map: {nose: 0, left_shoulder: 11, ...}
//       angles: {left_elbow: 172.5, ...}
// Frames without angles get them computed from their landmarks.

// JSON or YAML file with a top-level "pose_data" sequence. Throws PoseDataError.
PoseSequence readPoseFile(const std::string& path);

// Parses a "pose_data" sequence node. Throws PoseDataError.
PoseSequence readPoseSequence(const cv::FileNode& node);

// Writes the sequence under `key` in the open storage
void writePoseSequence(cv::FileStorage& fs, const std::string& key, const PoseSequence& sequence);

// MediaPipe bulk export: one row per frame of 33 x (x, y, z, visibility).
// Throws PoseDataError.
PoseSequence readMediaPipeCsv(const std::string& path);

// Header "id,f0,...,f45", one row per vector
void writeFeatureCsv(const std::string& path,
                     const std::vector<std::string>& ids,
                     const std::vector<Eigen::VectorXd>& features);

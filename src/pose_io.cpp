// pose_io.cpp
#include "pose_io.hpp"
#include "form_errors.hpp"
#include "geometry.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace {

constexpr int MEDIAPIPE_LANDMARKS = 33;
constexpr int MEDIAPIPE_VALUES_PER_LANDMARK = 4;  // x, y, z, visibility

Eigen::Vector3d readLandmark(const cv::FileNode& node, size_t frame) {
    Eigen::Vector3d point = Eigen::Vector3d::Zero();
    if (node.isSeq()) {
        if (node.size() < 2) {
            throw PoseDataError("Landmark in frame " + std::to_string(frame) +
                                " needs at least x and y");
        }
        for (int axis = 0; axis < 3 && axis < static_cast<int>(node.size()); ++axis) {
            point[axis] = static_cast<double>(node[axis]);
        }
    } else if (node.isMap()) {
        if (node["x"].empty() || node["y"].empty()) {
            throw PoseDataError("Landmark in frame " + std::to_string(frame) + " has no x/y");
        }
        point[0] = static_cast<double>(node["x"]);
        point[1] = static_cast<double>(node["y"]);
        if (!node["z"].empty()) point[2] = static_cast<double>(node["z"]);
    } else {
        throw PoseDataError("Unreadable landmark in frame " + std::to_string(frame));
    }
    return point;
}

PoseFrame readFrame(const cv::FileNode& node, size_t index) {
    if (!node.isMap()) {
        throw PoseDataError("Frame " + std::to_string(index) + " is not a mapping");
    }

    PoseFrame frame;
    cv::FileNode landmarks = node["landmarks"];
    if (!landmarks.empty()) {
        if (!landmarks.isSeq()) {
            throw PoseDataError("Frame " + std::to_string(index) + ": landmarks must be a list");
        }
        for (const auto& landmark : landmarks) {
            frame.landmarks.push_back(readLandmark(landmark, index));
        }
    }

    cv::FileNode landmark_map = node["landmark_map"];
    if (landmark_map.isMap()) {
        for (auto it = landmark_map.begin(); it != landmark_map.end(); ++it) {
            cv::FileNode entry = *it;
            frame.landmarkMap[entry.name()] = static_cast<int>(entry);
        }
    }

    cv::FileNode angles = node["angles"];
    if (angles.isMap()) {
        for (auto it = angles.begin(); it != angles.end(); ++it) {
            cv::FileNode entry = *it;
            frame.angles[entry.name()] = static_cast<double>(entry);
        }
    }

    if (frame.angles.empty() && !frame.landmarks.empty()) {
        frame.angles = computeJointAngles(frame.landmarks, frame.landmarkMap.empty()
                                                               ? defaultLandmarkMap()
                                                               : frame.landmarkMap);
    }
    return frame;
}

std::vector<double> splitCsvRow(const std::string& line) {
    std::vector<double> values;
    std::stringstream row(line);
    std::string cell;
    while (std::getline(row, cell, ',')) {
        values.push_back(std::stod(cell));
    }
    return values;
}

}  // namespace

PoseSequence readPoseSequence(const cv::FileNode& node) {
    if (node.empty()) {
        return {};
    }
    if (!node.isSeq()) {
        throw PoseDataError("pose_data must be a list of frames");
    }

    PoseSequence sequence;
    size_t index = 0;
    for (const auto& frame_node : node) {
        sequence.push_back(readFrame(frame_node, index++));
    }
    return sequence;
}

PoseSequence readPoseFile(const std::string& path) {
    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            throw PoseDataError("Could not open pose file: " + path);
        }
        cv::FileNode pose_data = fs["pose_data"];
        if (pose_data.empty()) {
            throw PoseDataError("Pose file has no pose_data: " + path);
        }
        return readPoseSequence(pose_data);
    } catch (const cv::Exception& e) {
        throw PoseDataError("Could not parse pose file " + path + ": " + e.what());
    }
}

void writePoseSequence(cv::FileStorage& fs, const std::string& key, const PoseSequence& sequence) {
    fs << key << "[";
    for (const auto& frame : sequence) {
        fs << "{";

        fs << "landmarks" << "[";
        for (const auto& point : frame.landmarks) {
            fs << "[:" << point.x() << point.y() << point.z() << "]";
        }
        fs << "]";

        fs << "landmark_map" << "{";
        for (const auto& entry : frame.landmarkMap) {
            fs << entry.first << entry.second;
        }
        fs << "}";

        fs << "angles" << "{";
        for (const auto& entry : frame.angles) {
            fs << entry.first << entry.second;
        }
        fs << "}";

        fs << "}";
    }
    fs << "]";
}

PoseSequence readMediaPipeCsv(const std::string& path) {
    std::ifstream csv(path);
    if (!csv.is_open()) {
        throw PoseDataError("Could not open landmark CSV: " + path);
    }

    const size_t expected = MEDIAPIPE_LANDMARKS * MEDIAPIPE_VALUES_PER_LANDMARK;
    PoseSequence sequence;
    std::string line;
    size_t line_number = 0;
    while (std::getline(csv, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        std::vector<double> values;
        try {
            values = splitCsvRow(line);
        } catch (const std::exception& e) {
            throw PoseDataError(path + ":" + std::to_string(line_number) + ": not a number (" +
                                e.what() + ")");
        }
        if (values.size() != expected) {
            throw PoseDataError(path + ":" + std::to_string(line_number) + ": expected " +
                                std::to_string(expected) + " values, got " +
                                std::to_string(values.size()));
        }

        PoseFrame frame;
        frame.landmarkMap = defaultLandmarkMap();
        for (int i = 0; i < MEDIAPIPE_LANDMARKS; ++i) {
            const double* lm = &values[i * MEDIAPIPE_VALUES_PER_LANDMARK];
            frame.landmarks.emplace_back(lm[0], lm[1], lm[2]);
        }
        frame.angles = computeJointAngles(frame.landmarks, frame.landmarkMap);
        sequence.push_back(std::move(frame));
    }

    std::cout << "Loaded " << sequence.size() << " frames from " << path << std::endl;
    return sequence;
}

void writeFeatureCsv(const std::string& path,
                     const std::vector<std::string>& ids,
                     const std::vector<Eigen::VectorXd>& features) {
    if (ids.size() != features.size()) {
        throw std::invalid_argument("writeFeatureCsv: one id per feature vector required");
    }

    std::ofstream csv(path);
    if (!csv.is_open()) {
        throw std::runtime_error("Could not open " + path + " for writing");
    }

    // Write header
    csv << "id";
    Eigen::Index width = features.empty() ? 0 : features.front().size();
    for (Eigen::Index i = 0; i < width; ++i) {
        csv << ",f" << i;
    }
    csv << "\n";

    csv.precision(10);
    for (size_t row = 0; row < features.size(); ++row) {
        csv << ids[row];
        for (Eigen::Index i = 0; i < features[row].size(); ++i) {
            csv << "," << features[row][i];
        }
        csv << "\n";
    }

    csv.close();
    std::cout << "Saved features to: " << path << std::endl;
}

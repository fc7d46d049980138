#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Core>

#include "pose_types.hpp"

namespace fixtures {

// Frame with angles only, no landmarks and no landmark map
inline PoseFrame angleFrame(const std::map<std::string, double>& angles) {
    PoseFrame frame;
    frame.angles = angles;
    return frame;
}

// Frame with all 8 joint angles set to the same value
inline PoseFrame uniformAngleFrame(double degrees) {
    std::map<std::string, double> angles;
    for (const char* side : {"left_", "right_"}) {
        for (const char* joint : {"shoulder", "elbow", "hip", "knee"}) {
            angles[std::string(side) + joint] = degrees;
        }
    }
    return angleFrame(angles);
}

// 33 MediaPipe landmarks at the origin with the named ones placed, default map attached
inline PoseFrame landmarkFrame(const std::map<std::string, Eigen::Vector3d>& points,
                               const std::map<std::string, double>& angles = {}) {
    PoseFrame frame;
    frame.landmarks.assign(33, Eigen::Vector3d::Zero());
    frame.landmarkMap = defaultLandmarkMap();
    for (const auto& entry : points) {
        frame.landmarks[frame.landmarkMap.at(entry.first)] = entry.second;
    }
    frame.angles = angles;
    return frame;
}

inline Eigen::Vector3d point(double x, double y) {
    return Eigen::Vector3d(x, y, 0.0);
}

// Sequence whose score is a linear function of the joint angles: a in [60, 160], score = a - 60
inline std::vector<std::pair<PoseSequence, double>> linearExamples(size_t count) {
    std::vector<std::pair<PoseSequence, double>> examples;
    for (size_t i = 0; i < count; ++i) {
        double a = 60.0 + 100.0 * static_cast<double>(i) / static_cast<double>(count - 1);
        PoseSequence sequence(3, uniformAngleFrame(a));
        examples.emplace_back(sequence, a - 60.0);
    }
    return examples;
}

// Scratch directory removed on destruction
class TempDir {
public:
    TempDir() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("form_scoring_test_" + std::to_string(stamp) + "_" + std::to_string(counter()++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    static unsigned long& counter() {
        static unsigned long value = 0;
        return value;
    }

    std::filesystem::path path_;
};

}  // namespace fixtures

// pose_types.cpp
#include "pose_types.hpp"

#include <stdexcept>

std::optional<Eigen::Vector3d> PoseFrame::landmark(const std::string& name) const {
    int index = landmarkIndex(*this, name);
    if (index < 0) {
        return std::nullopt;
    }
    return landmarks[index];
}

double PoseFrame::angle(const std::string& name, double fallback) const {
    auto it = angles.find(name);
    return it != angles.end() ? it->second : fallback;
}

std::string toString(AnalysisMethod method) {
    switch (method) {
        case AnalysisMethod::MlModel:
            return "ml_model";
        case AnalysisMethod::RuleBased:
            return "rule_based";
    }
    throw std::invalid_argument("Unknown analysis method");
}

const LandmarkMap& defaultLandmarkMap() {
    // MediaPipe Pose landmark indices
    static const LandmarkMap landmark_indices = {
        {"nose", 0},
        {"left_shoulder", 11},
        {"right_shoulder", 12},
        {"left_elbow", 13},
        {"right_elbow", 14},
        {"left_wrist", 15},
        {"right_wrist", 16},
        {"left_hip", 23},
        {"right_hip", 24},
        {"left_knee", 25},
        {"right_knee", 26},
        {"left_ankle", 27},
        {"right_ankle", 28}
    };
    return landmark_indices;
}

int landmarkIndex(const PoseFrame& frame, const std::string& name) {
    const LandmarkMap& map = frame.landmarkMap.empty() ? defaultLandmarkMap() : frame.landmarkMap;
    auto it = map.find(name);
    if (it == map.end()) return -1;

    int index = it->second;
    if (index < 0 || index >= static_cast<int>(frame.landmarks.size())) return -1;
    return index;
}

std::string validatePoseSequence(const PoseSequence& sequence) {
    if (sequence.empty()) {
        return "No pose data available";
    }

    const LandmarkMap& reference = sequence.front().landmarkMap;
    for (size_t i = 0; i < sequence.size(); ++i) {
        const auto& frame = sequence[i];
        if (frame.landmarkMap != reference) {
            return "Pose data is inconsistent: frame " + std::to_string(i) +
                   " uses a different landmark layout";
        }
        for (const auto& [name, index] : frame.landmarkMap) {
            // A map entry past the end is fine as long as there are no landmarks at all
            if (index < 0 || (!frame.landmarks.empty() &&
                              index >= static_cast<int>(frame.landmarks.size()))) {
                return "Pose data is incomplete: landmark '" + name +
                       "' is missing in frame " + std::to_string(i);
            }
        }
    }
    return "";
}

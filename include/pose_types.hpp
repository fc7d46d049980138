#pragma once

// C++ Standard Library
#include <map>
#include <optional>
#include <string>
#include <vector>

// Third-party libraries
#include <Eigen/Core>

// name -> index into PoseFrame::landmarks
using LandmarkMap = std::map<std::string, int>;

struct PoseFrame {
    std::vector<Eigen::Vector3d> landmarks;  // normalized image coordinates, z optional (0)
    LandmarkMap landmarkMap;                 // empty when the estimator sent none
    std::map<std::string, double> angles;    // joint name -> degrees

    // Resolves through landmarkMap, or the MediaPipe layout when the map is empty
    std::optional<Eigen::Vector3d> landmark(const std::string& name) const;

    // Neutral default is "fully extended"
    double angle(const std::string& name, double fallback = 180.0) const;
};

using PoseSequence = std::vector<PoseFrame>;

enum class AnalysisMethod {
    RuleBased,
    MlModel
};

std::string toString(AnalysisMethod method);

struct AnalysisResult {
    double score;
    std::vector<std::string> feedback;
    AnalysisMethod method;

    AnalysisResult() : score(0), method(AnalysisMethod::RuleBased) {}
    AnalysisResult(double s, std::vector<std::string> f, AnalysisMethod m)
        : score(s), feedback(std::move(f)), method(m) {}
};

struct TrainingExample {
    std::string id;            // "<exercise>_<YYYYmmdd_HHMMSS_ffffff>"
    std::string exerciseType;
    PoseSequence poseData;
    double score;              // 0-100
    std::optional<std::string> userFeedback;
    std::map<std::string, std::string> metadata;
    std::string timestamp;     // ISO-8601

    TrainingExample() : score(0) {}
};

// MediaPipe Pose landmark indices used when a frame carries no map
const LandmarkMap& defaultLandmarkMap();

// Index of a named landmark in the frame, or -1 if it cannot be resolved
int landmarkIndex(const PoseFrame& frame, const std::string& name);

// Empty string when the sequence is structurally sound, otherwise the reason
std::string validatePoseSequence(const PoseSequence& sequence);

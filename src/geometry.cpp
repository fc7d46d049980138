// geometry.cpp
#include "geometry.hpp"

#include <cmath>
#include <numeric>

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double RAD_TO_DEG = 180.0 / PI;

struct JointTriplet {
    const char* joint;
    const char* first;
    const char* vertex;
    const char* last;
};

const JointTriplet JOINT_TRIPLETS[] = {
    {"left_shoulder", "left_hip", "left_shoulder", "left_elbow"},
    {"right_shoulder", "right_hip", "right_shoulder", "right_elbow"},
    {"left_elbow", "left_shoulder", "left_elbow", "left_wrist"},
    {"right_elbow", "right_shoulder", "right_elbow", "right_wrist"},
    {"left_hip", "left_shoulder", "left_hip", "left_knee"},
    {"right_hip", "right_shoulder", "right_hip", "right_knee"},
    {"left_knee", "left_hip", "left_knee", "left_ankle"},
    {"right_knee", "right_hip", "right_knee", "right_ankle"}
};

}  // namespace

double calculateAngle(const Eigen::Vector2d& a, const Eigen::Vector2d& b, const Eigen::Vector2d& c) {
    double radians = std::atan2(c.y() - b.y(), c.x() - b.x()) -
                     std::atan2(a.y() - b.y(), a.x() - b.x());
    double angle = std::abs(radians * RAD_TO_DEG);

    if (angle > 180.0) {
        angle = 360.0 - angle;
    }
    return angle;
}

double calculateAngle(const Eigen::Vector3d& a, const Eigen::Vector3d& b, const Eigen::Vector3d& c) {
    return calculateAngle(Eigen::Vector2d(a.head<2>()), Eigen::Vector2d(b.head<2>()),
                          Eigen::Vector2d(c.head<2>()));
}

std::map<std::string, double> computeJointAngles(const std::vector<Eigen::Vector3d>& landmarks,
                                                 const LandmarkMap& landmarkMap) {
    PoseFrame frame;
    frame.landmarks = landmarks;
    frame.landmarkMap = landmarkMap;

    std::map<std::string, double> angles;
    for (const auto& triplet : JOINT_TRIPLETS) {
        auto first = frame.landmark(triplet.first);
        auto vertex = frame.landmark(triplet.vertex);
        auto last = frame.landmark(triplet.last);
        if (!first || !vertex || !last) continue;

        angles[triplet.joint] = calculateAngle(*first, *vertex, *last);
    }
    return angles;
}

double seriesMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double seriesStdDev(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double mean = seriesMean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / values.size());
}

// feature_extractor.cpp
#include "feature_extractor.hpp"
#include "geometry.hpp"

#include <algorithm>
#include <cmath>

namespace {

constexpr double PI = 3.14159265358979323846;

const char* const ANGLE_FAMILIES[] = {"elbow", "shoulder", "hip", "knee"};

const char* const KEY_LANDMARKS[] = {
    "left_wrist", "left_elbow", "left_shoulder",
    "left_hip", "left_knee", "left_ankle"
};

}  // namespace

Eigen::VectorXd FeatureExtractor::extract(const PoseSequence& sequence) const {
    Eigen::VectorXd features = Eigen::VectorXd::Zero(FEATURE_COUNT);
    if (sequence.empty()) {
        return features;
    }

    extractFrameFeatures(sequence, features, 0);
    extractTemporalFeatures(sequence, features, FRAME_FEATURES);
    extractStatisticalFeatures(sequence, features, FRAME_FEATURES + TEMPORAL_FEATURES);
    return features;
}

Eigen::MatrixXd FeatureExtractor::extractAll(const std::vector<PoseSequence>& sequences) const {
    Eigen::MatrixXd matrix(static_cast<Eigen::Index>(sequences.size()), FEATURE_COUNT);
    for (size_t i = 0; i < sequences.size(); ++i) {
        matrix.row(static_cast<Eigen::Index>(i)) = extract(sequences[i]).transpose();
    }
    return matrix;
}

void FeatureExtractor::extractFrameFeatures(const PoseSequence& sequence, Eigen::VectorXd& out, int offset) const {
    for (const char* family : ANGLE_FAMILIES) {
        const std::string left_key = std::string("left_") + family;
        const std::string right_key = std::string("right_") + family;

        // Average left and right per frame
        std::vector<double> series;
        series.reserve(sequence.size());
        for (const auto& frame : sequence) {
            series.push_back((frame.angle(left_key) + frame.angle(right_key)) / 2.0);
        }

        auto [min_it, max_it] = std::minmax_element(series.begin(), series.end());
        out[offset++] = *min_it;                 // deepest position
        out[offset++] = *max_it;                 // top position
        out[offset++] = seriesMean(series);
        out[offset++] = seriesStdDev(series);
        out[offset++] = *max_it - *min_it;       // range of motion
    }
}

void FeatureExtractor::extractTemporalFeatures(const PoseSequence& sequence, Eigen::VectorXd& out, int offset) const {
    // No displacement is defined for a single frame; the block stays zero
    if (sequence.size() < 2) return;

    std::vector<double> pooled;
    for (const char* name : KEY_LANDMARKS) {
        std::vector<double> displacements;
        for (size_t i = 1; i < sequence.size(); ++i) {
            auto prev = sequence[i - 1].landmark(name);
            auto curr = sequence[i].landmark(name);
            if (!prev || !curr) continue;

            displacements.push_back((curr->head<2>() - prev->head<2>()).norm());
        }

        if (!displacements.empty()) {
            out[offset] = seriesMean(displacements);
            out[offset + 1] = seriesStdDev(displacements);
            out[offset + 2] = *std::max_element(displacements.begin(), displacements.end());
            pooled.insert(pooled.end(), displacements.begin(), displacements.end());
        }
        offset += 3;
    }

    // Overall movement smoothness
    out[offset] = seriesStdDev(pooled);
}

void FeatureExtractor::extractStatisticalFeatures(const PoseSequence& sequence, Eigen::VectorXd& out, int offset) const {
    // Body line straightness (shoulder-hip-ankle)
    std::vector<double> alignment_scores;
    for (const auto& frame : sequence) {
        if (static_cast<int>(frame.landmarks.size()) < MIN_LANDMARKS_FOR_ALIGNMENT) continue;

        auto shoulder = frame.landmark("left_shoulder");
        auto hip = frame.landmark("left_hip");
        auto ankle = frame.landmark("left_ankle");
        if (!shoulder || !hip || !ankle) continue;

        Eigen::Vector2d upper = hip->head<2>() - shoulder->head<2>();
        Eigen::Vector2d lower = ankle->head<2>() - hip->head<2>();

        double cos_angle = upper.dot(lower) / (upper.norm() * lower.norm() + 1e-6);
        cos_angle = std::clamp(cos_angle, -1.0, 1.0);
        double angle = std::acos(cos_angle) * 180.0 / PI;

        alignment_scores.push_back(1.0 - std::abs(angle - 180.0) / 180.0);
    }

    if (!alignment_scores.empty()) {
        out[offset] = seriesMean(alignment_scores);
        out[offset + 1] = *std::min_element(alignment_scores.begin(), alignment_scores.end());
        out[offset + 2] = seriesStdDev(alignment_scores);
    }
    offset += 3;

    // Total range across every recorded angle, plus frame and joint counts
    std::vector<double> all_angles;
    double joint_count = 0.0;
    for (const auto& frame : sequence) {
        for (const auto& [name, value] : frame.angles) {
            all_angles.push_back(value);
        }
        joint_count += static_cast<double>(frame.angles.size());
    }

    if (!all_angles.empty()) {
        auto [min_it, max_it] = std::minmax_element(all_angles.begin(), all_angles.end());
        out[offset] = *max_it - *min_it;
        out[offset + 1] = static_cast<double>(sequence.size());
        out[offset + 2] = joint_count / sequence.size();
    }
    offset += 3;

    // Left/right symmetry
    std::vector<double> symmetry_scores;
    symmetry_scores.reserve(sequence.size());
    for (const auto& frame : sequence) {
        double elbow_symmetry = 1.0 - std::abs(frame.angle("left_elbow") - frame.angle("right_elbow")) / 180.0;
        double shoulder_symmetry = 1.0 - std::abs(frame.angle("left_shoulder") - frame.angle("right_shoulder")) / 180.0;
        symmetry_scores.push_back((elbow_symmetry + shoulder_symmetry) / 2.0);
    }
    out[offset] = seriesMean(symmetry_scores);
}

std::vector<std::string> FeatureExtractor::featureNames() {
    std::vector<std::string> names;
    names.reserve(FEATURE_COUNT);

    for (const char* family : ANGLE_FAMILIES) {
        for (const char* stat : {"min", "max", "mean", "std", "range"}) {
            names.push_back(std::string(family) + "_" + stat);
        }
    }
    for (const char* landmark : KEY_LANDMARKS) {
        for (const char* stat : {"velocity_mean", "velocity_std", "velocity_max"}) {
            names.push_back(std::string(landmark) + "_" + stat);
        }
    }
    names.push_back("movement_smoothness");

    for (const char* name : {"alignment_mean", "alignment_min", "alignment_std",
                             "angle_range", "frame_count", "joint_count", "symmetry"}) {
        names.push_back(name);
    }
    return names;
}

#pragma once

#include <string>
#include <vector>

#include <Eigen/Core>

#include "pose_types.hpp"

// Reduces a pose sequence of any length to a fixed-length vector:
//   [0, 20)  frame-level   min/max/mean/std/range of elbow, shoulder, hip, knee
//   [20, 39) temporal      mean/std/max displacement of 6 landmarks + pooled std
//   [39, 46) statistical   body-line alignment, angle range, counts, symmetry
// The layout is shared by training and inference, so it must never be reordered.
class FeatureExtractor {
public:
    static constexpr int FRAME_FEATURES = 20;
    static constexpr int TEMPORAL_FEATURES = 19;
    static constexpr int STATISTICAL_FEATURES = 7;
    static constexpr int FEATURE_COUNT = FRAME_FEATURES + TEMPORAL_FEATURES + STATISTICAL_FEATURES;

    Eigen::VectorXd extract(const PoseSequence& sequence) const;

    // One row per sequence
    Eigen::MatrixXd extractAll(const std::vector<PoseSequence>& sequences) const;

    static std::vector<std::string> featureNames();

private:
    void extractFrameFeatures(const PoseSequence& sequence, Eigen::VectorXd& out, int offset) const;
    void extractTemporalFeatures(const PoseSequence& sequence, Eigen::VectorXd& out, int offset) const;
    void extractStatisticalFeatures(const PoseSequence& sequence, Eigen::VectorXd& out, int offset) const;

    // Frames with fewer landmarks are left out of the alignment score
    static constexpr int MIN_LANDMARKS_FOR_ALIGNMENT = 28;
};

// clam_analyzer.cpp
#include "clam_analyzer.hpp"
#include "geometry.hpp"

#include <algorithm>
#include <cmath>

namespace {

const char* const TORSO_ROTATION_FEEDBACK = "Avoid rotating your torso; keep your core stable.";

struct TorsoTilt {
    double shoulders;  // left y - right y
    double hips;
};

std::optional<TorsoTilt> torsoTilt(const PoseFrame& frame) {
    auto l_shoulder = frame.landmark("left_shoulder");
    auto r_shoulder = frame.landmark("right_shoulder");
    auto l_hip = frame.landmark("left_hip");
    auto r_hip = frame.landmark("right_hip");
    if (!l_shoulder || !r_shoulder || !l_hip || !r_hip) {
        return std::nullopt;
    }
    return TorsoTilt{l_shoulder->y() - r_shoulder->y(), l_hip->y() - r_hip->y()};
}

}  // namespace

ExerciseAnalyzer::ExerciseInfo ClamAnalyzer::info() const {
    return {
        "clam",
        "Clam Shell",
        "Side-lying hip abduction exercise targeting the glute medius",
        "Beginner",
        {
            "Keep your feet together throughout the movement",
            "Focus on controlled movement, both opening and closing",
            "Keep your hips stacked and your core engaged",
            "Open the top knee as far as you can without rolling back"
        }
    };
}

std::vector<std::string> ClamAnalyzer::getVideoRequirements() const {
    return {
        "Record from a front or slightly angled view to show knee separation.",
        "Ensure your hips and knees are clearly visible."
    };
}

bool ClamAnalyzer::torsoRotated(const PoseSequence& sequence) const {
    if (sequence.empty()) {
        return false;
    }

    auto initial = torsoTilt(sequence.front());
    if (!initial) {
        return false;
    }

    for (size_t i = 1; i < sequence.size(); ++i) {
        auto current = torsoTilt(sequence[i]);
        if (!current) continue;

        double shoulder_diff = std::abs(current->shoulders - initial->shoulders);
        double hip_diff = std::abs(current->hips - initial->hips);
        if (shoulder_diff > rules_.torsoRotationTolerance &&
            shoulder_diff > hip_diff * rules_.torsoRotationRatio) {
            return true;
        }
    }
    return false;
}

AnalysisResult ClamAnalyzer::ruleBasedAnalysis(const PoseSequence& sequence) const {
    if (sequence.empty()) {
        return emptySequenceResult();
    }

    std::vector<std::string> feedback;
    double score = 100;

    // Knee opening: angle at the hip midpoint between the two knees
    std::vector<double> openings;
    std::vector<size_t> opening_frames;
    for (size_t i = 0; i < sequence.size(); ++i) {
        const PoseFrame& frame = sequence[i];
        auto l_knee = frame.landmark("left_knee");
        auto r_knee = frame.landmark("right_knee");
        auto l_hip = frame.landmark("left_hip");
        auto r_hip = frame.landmark("right_hip");
        if (!l_knee || !r_knee || !l_hip || !r_hip) continue;

        Eigen::Vector3d hip_mid = (*l_hip + *r_hip) / 2.0;
        openings.push_back(calculateAngle(*l_knee, hip_mid, *r_knee));
        opening_frames.push_back(i);
    }

    if (!openings.empty()) {
        // 1. Range of motion
        double min_opening = *std::min_element(openings.begin(), openings.end());
        double max_opening = *std::max_element(openings.begin(), openings.end());
        if (max_opening < rules_.openingAngle) {
            feedback.push_back("Knees are not opening wide enough. Lift the top knee higher.");
            score -= rules_.openingPenalty;
        }
        if (min_opening > rules_.closingAngle) {
            feedback.push_back("Knees are not closing fully between reps.");
            score -= rules_.closingPenalty;
        }

        // 2. Feet together at the widest point
        size_t widest = opening_frames[argMax(openings)];
        auto l_ankle = landmarkAt(sequence, widest, "left_ankle");
        auto r_ankle = landmarkAt(sequence, widest, "right_ankle");
        if (l_ankle && r_ankle && std::abs(l_ankle->x() - r_ankle->x()) > rules_.footAlignmentTolerance) {
            feedback.push_back("Feet are separating. Keep your feet together throughout the movement.");
            score -= rules_.footAlignmentPenalty;
        }
    }

    // 3. Torso stability
    if (torsoRotated(sequence)) {
        feedback.push_back(TORSO_ROTATION_FEEDBACK);
        score -= rules_.torsoRotationPenalty;
    }

    return finalizeRuleResult(score, std::move(feedback));
}

std::vector<std::string> ClamAnalyzer::analyzeSpecificIssues(const PoseSequence& sequence) const {
    std::vector<std::string> issues;
    if (torsoRotated(sequence)) {
        issues.push_back(TORSO_ROTATION_FEEDBACK);
    }
    return issues;
}

// bridge_analyzer.cpp
#include "bridge_analyzer.hpp"
#include "geometry.hpp"

#include <algorithm>
#include <cmath>

ExerciseAnalyzer::ExerciseInfo BridgeAnalyzer::info() const {
    return {
        "bridge",
        "Glute Bridge",
        "Hip extension exercise targeting glutes, hamstrings, and lower back",
        "Beginner",
        {
            "Ensure your hips are fully extended at the top of the movement",
            "Keep your core engaged to avoid arching your lower back",
            "Drive through your heels",
            "Lower your hips with control between reps"
        }
    };
}

std::vector<std::string> BridgeAnalyzer::getVideoRequirements() const {
    return {
        "Record from a side angle to clearly show hip movement.",
        "Ensure the mat or floor is visible to assess full range of motion."
    };
}

AnalysisResult BridgeAnalyzer::ruleBasedAnalysis(const PoseSequence& sequence) const {
    if (sequence.empty()) {
        return emptySequenceResult();
    }

    std::vector<std::string> feedback;
    double score = 100;

    std::vector<double> hip_angles = angleSeries(sequence, "left_hip");

    // 1. Range of motion
    double min_hip = *std::min_element(hip_angles.begin(), hip_angles.end());
    double max_hip = *std::max_element(hip_angles.begin(), hip_angles.end());
    if (max_hip < rules_.hipExtensionAngle) {
        feedback.push_back("Hips not reaching full extension at the top.");
        score -= rules_.hipExtensionPenalty;
    }
    if (min_hip > rules_.loweringAngle) {
        feedback.push_back("Not lowering the hips far enough between reps.");
        score -= rules_.loweringPenalty;
    }

    // 2. Shins vertical at the top
    size_t top = argMax(hip_angles);
    auto knee = landmarkAt(sequence, top, "left_knee");
    auto ankle = landmarkAt(sequence, top, "left_ankle");
    if (knee && ankle && std::abs(knee->x() - ankle->x()) > rules_.shinAlignmentTolerance) {
        feedback.push_back("Feet are not under the knees at the top. Adjust your foot position.");
        score -= rules_.shinAlignmentPenalty;
    }

    // 3. Sideways hip shift
    std::vector<double> hip_x = coordinateSeries(sequence, "left_hip", 0);
    if (!hip_x.empty()) {
        double hip_shift = seriesStdDev(hip_x) * 100.0;
        if (hip_shift > rules_.hipShiftLimit) {
            feedback.push_back("Hips are shifting during the movement (" + formatPercent(hip_shift) +
                               "% of screen width). Keep the movement controlled.");
            score -= rules_.hipShiftPenalty;
        }
    }

    return finalizeRuleResult(score, std::move(feedback));
}

std::vector<std::string> BridgeAnalyzer::analyzeSpecificIssues(const PoseSequence& sequence) const {
    std::vector<std::string> issues;
    if (sequence.empty()) {
        return issues;
    }

    // Image y grows downward, so a rising hip has a smaller y at the end
    auto start_hip = sequence.front().landmark("left_hip");
    auto end_hip = sequence.back().landmark("left_hip");
    if (start_hip && end_hip && start_hip->y() - end_hip->y() < rules_.hipRiseTolerance) {
        issues.push_back("Increase hip extension for a full range of motion.");
    }
    return issues;
}

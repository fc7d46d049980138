// push_up_analyzer.cpp
#include "push_up_analyzer.hpp"
#include "geometry.hpp"

#include <algorithm>
#include <cmath>

ExerciseAnalyzer::ExerciseInfo PushUpAnalyzer::info() const {
    return {
        "push_up",
        "Push Up",
        "Bodyweight exercise targeting chest, shoulders, and triceps",
        "Beginner",
        {
            "Maintain a straight line from head to heels",
            "Keep your core tight",
            "Lower your body as a single unit",
            "Keep your elbows close to your body"
        }
    };
}

std::vector<std::string> PushUpAnalyzer::getVideoRequirements() const {
    return {
        "Ensure your entire body is visible from the side.",
        "Place the camera at a height level with your body.",
        "Use a stable camera with good lighting."
    };
}

AnalysisResult PushUpAnalyzer::ruleBasedAnalysis(const PoseSequence& sequence) const {
    if (sequence.empty()) {
        return emptySequenceResult();
    }

    std::vector<std::string> feedback;
    double score = 100;

    std::vector<double> elbow_angles = angleSeries(sequence, "left_elbow");
    std::vector<double> hip_angles = angleSeries(sequence, "left_hip");

    // 1. Range of motion
    double min_elbow = *std::min_element(elbow_angles.begin(), elbow_angles.end());
    double max_elbow = *std::max_element(elbow_angles.begin(), elbow_angles.end());
    if (max_elbow < rules_.lockoutAngle) {
        feedback.push_back("Elbows not locking out at the top.");
        score -= rules_.lockoutPenalty;
    }
    if (min_elbow > rules_.depthAngle) {
        feedback.push_back("Not going deep enough at the bottom.");
        score -= rules_.depthPenalty;
    }

    // 2. Hip sag
    if (seriesMean(hip_angles) < rules_.hipSagAngle) {
        feedback.push_back("Hips are sagging. Maintain a straight body line.");
        score -= rules_.hipSagPenalty;
    }

    // 3. Hand placement at the bottom of the rep
    size_t bottom = argMin(elbow_angles);
    auto elbow = landmarkAt(sequence, bottom, "left_elbow");
    auto wrist = landmarkAt(sequence, bottom, "left_wrist");
    if (elbow && wrist && std::abs(elbow->x() - wrist->x()) > rules_.handAlignmentTolerance) {
        feedback.push_back("Hands may be placed too far forward or back, causing poor elbow alignment.");
        score -= rules_.handAlignmentPenalty;
    }

    return finalizeRuleResult(score, std::move(feedback));
}

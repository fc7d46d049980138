// squat_analyzer.cpp
#include "squat_analyzer.hpp"

#include <algorithm>

ExerciseAnalyzer::ExerciseInfo SquatAnalyzer::info() const {
    return {
        "squat",
        "Squat",
        "Lower body exercise targeting quadriceps, hamstrings, and glutes",
        "Beginner",
        {
            "Keep your chest up and core engaged",
            "Push your knees out in line with your toes",
            "Keep your weight in your heels",
            "Go as deep as you can while maintaining good form"
        }
    };
}

std::vector<std::string> SquatAnalyzer::getVideoRequirements() const {
    return {
        "Ensure your entire body is visible from the side.",
        "Place the camera at a height that captures your full range of motion.",
        "Use a stable camera with good lighting."
    };
}

AnalysisResult SquatAnalyzer::ruleBasedAnalysis(const PoseSequence& sequence) const {
    if (sequence.empty()) {
        return emptySequenceResult();
    }

    std::vector<std::string> feedback;
    double score = 100;

    std::vector<double> knee_angles = angleSeries(sequence, "left_knee");
    std::vector<double> hip_angles = angleSeries(sequence, "left_hip");

    // 1. Range of motion
    double min_knee = *std::min_element(knee_angles.begin(), knee_angles.end());
    double max_knee = *std::max_element(knee_angles.begin(), knee_angles.end());
    if (max_knee < rules_.extensionAngle) {
        feedback.push_back("Not fully extending knees at the top.");
        score -= rules_.extensionPenalty;
    }
    if (min_knee > rules_.depthAngle) {
        feedback.push_back("Squat depth is too shallow. Aim for at least 90 degrees.");
        score -= rules_.depthPenalty;
    }

    // 2. Knees over toes at the deepest frame
    size_t bottom = argMin(knee_angles);
    auto knee = landmarkAt(sequence, bottom, "left_knee");
    auto ankle = landmarkAt(sequence, bottom, "left_ankle");
    if (knee && ankle && knee->x() > ankle->x() + rules_.kneeTravelTolerance) {
        feedback.push_back("Knees are travelling too far forward over toes.");
        score -= rules_.kneeTravelPenalty;
    }

    // 3. Back posture
    if (*std::min_element(hip_angles.begin(), hip_angles.end()) < rules_.backRoundingAngle) {
        feedback.push_back("Lower back may be rounding. Keep your chest up.");
        score -= rules_.backRoundingPenalty;
    }

    return finalizeRuleResult(score, std::move(feedback));
}

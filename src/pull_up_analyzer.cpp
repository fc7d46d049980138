// pull_up_analyzer.cpp
#include "pull_up_analyzer.hpp"
#include "geometry.hpp"

#include <algorithm>

ExerciseAnalyzer::ExerciseInfo PullUpAnalyzer::info() const {
    return {
        "pull_up",
        "Pull Up",
        "Upper body strength exercise targeting back and biceps",
        "Intermediate",
        {
            "Keep your core engaged throughout the movement",
            "Pull your shoulder blades down and back",
            "Avoid swinging or using momentum",
            "Lower yourself with control"
        }
    };
}

std::vector<std::string> PullUpAnalyzer::getVideoRequirements() const {
    return {
        "Ensure your entire body is visible from the side.",
        "Make sure your face is in view for nose detection.",
        "Use a stable camera with good lighting."
    };
}

AnalysisResult PullUpAnalyzer::ruleBasedAnalysis(const PoseSequence& sequence) const {
    if (sequence.empty()) {
        return emptySequenceResult();
    }

    std::vector<std::string> feedback;
    double score = 100;

    std::vector<double> elbow_angles = angleSeries(sequence, "left_elbow");

    // 1. Range of motion
    double max_elbow = *std::max_element(elbow_angles.begin(), elbow_angles.end());
    if (max_elbow < rules_.fullExtensionAngle) {
        feedback.push_back("Not reaching full extension at the bottom (elbows not straight).");
        score -= rules_.fullExtensionPenalty;
    }

    // Chin over bar: nose above the wrist (smaller y) in at least one frame
    bool measured = false;
    bool chin_above_bar = false;
    for (const auto& frame : sequence) {
        auto nose = frame.landmark("nose");
        auto wrist = frame.landmark("left_wrist");
        if (!nose || !wrist) continue;
        measured = true;
        if (nose->y() < wrist->y()) {
            chin_above_bar = true;
            break;
        }
    }
    if (measured && !chin_above_bar) {
        feedback.push_back("Chin does not appear to go above the bar.");
        score -= rules_.chinOverBarPenalty;
    }

    // 2. Control (kipping)
    std::vector<double> hip_x = coordinateSeries(sequence, "left_hip", 0);
    if (!hip_x.empty()) {
        double hip_swing = seriesStdDev(hip_x) * 100.0;
        if (hip_swing > rules_.hipSwingLimit) {
            feedback.push_back("Excessive hip swing detected (" + formatPercent(hip_swing) +
                               "% of screen width). Avoid kipping.");
            score -= rules_.hipSwingPenalty;
        }
    }

    return finalizeRuleResult(score, std::move(feedback));
}

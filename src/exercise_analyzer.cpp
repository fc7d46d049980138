// exercise_analyzer.cpp
#include "exercise_analyzer.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

ExerciseAnalyzer::ExerciseAnalyzer(std::shared_ptr<const ModelTrainer> trainer, bool useModel)
    : trainer_(std::move(trainer)), useModel_(useModel) {}

AnalysisResult ExerciseAnalyzer::analyzeForm(const PoseSequence& sequence,
                                             const std::string& exerciseType) const {
    ModelAttempt attempt = tryModelAnalysis(sequence, exerciseType);
    if (attempt.isOk()) {
        return attempt.result;
    }

    if (attempt.modelPresent) {
        std::cerr << "ML prediction failed for " << exerciseType << ": " << attempt.reason
                  << ", falling back to rule-based" << std::endl;
    }
    return ruleBasedAnalysis(sequence);
}

ExerciseAnalyzer::ModelAttempt ExerciseAnalyzer::tryModelAnalysis(const PoseSequence& sequence,
                                                                  const std::string& exerciseType) const {
    if (!useModel_ || !trainer_) {
        return ModelAttempt::fallback("model analysis disabled");
    }
    if (sequence.empty()) {
        return ModelAttempt::fallback("no pose data");
    }
    if (!trainer_->modelExists(exerciseType)) {
        return ModelAttempt::fallback("no trained model for " + exerciseType);
    }

    ModelTrainer::Prediction prediction = trainer_->tryPredict(exerciseType, sequence);
    if (!prediction.ok) {
        return ModelAttempt::fallback(prediction.error, true);
    }

    return ModelAttempt::ok(AnalysisResult(prediction.score,
                                           feedbackFromScore(prediction.score, sequence),
                                           AnalysisMethod::MlModel));
}

std::vector<std::string> ExerciseAnalyzer::analyzeSpecificIssues(const PoseSequence&) const {
    return {};
}

AnalysisResult ExerciseAnalyzer::emptySequenceResult() {
    return AnalysisResult(0.0, {"No pose data available"}, AnalysisMethod::RuleBased);
}

AnalysisResult ExerciseAnalyzer::finalizeRuleResult(double score, std::vector<std::string> feedback) {
    score = std::clamp(score, 0.0, 100.0);
    if (feedback.empty()) {
        feedback.push_back("Good form detected!");
    }

    if (score >= 90) {
        feedback.push_back("Excellent overall form!");
    } else if (score >= 70) {
        feedback.push_back("Good form, but with room for minor improvements.");
    } else {
        feedback.push_back("Form needs significant work. Focus on the feedback provided.");
    }
    return AnalysisResult(score, std::move(feedback), AnalysisMethod::RuleBased);
}

std::vector<std::string> ExerciseAnalyzer::feedbackFromScore(double score,
                                                             const PoseSequence& sequence) const {
    std::vector<std::string> feedback;
    if (score >= 90) {
        feedback.push_back("Excellent form! Your technique is very good.");
    } else if (score >= 70) {
        feedback.push_back("Good form overall, with minor areas for improvement.");
    } else {
        feedback.push_back("Form needs significant improvement. Focus on the fundamentals.");
    }

    std::vector<std::string> specific = analyzeSpecificIssues(sequence);
    feedback.insert(feedback.end(), specific.begin(), specific.end());
    return feedback;
}

std::vector<double> ExerciseAnalyzer::angleSeries(const PoseSequence& sequence, const std::string& joint) {
    std::vector<double> series;
    series.reserve(sequence.size());
    for (const auto& frame : sequence) {
        series.push_back(frame.angle(joint));
    }
    return series;
}

std::vector<double> ExerciseAnalyzer::coordinateSeries(const PoseSequence& sequence,
                                                       const std::string& name, int axis) {
    std::vector<double> series;
    for (const auto& frame : sequence) {
        if (auto point = frame.landmark(name)) {
            series.push_back((*point)[axis]);
        }
    }
    return series;
}

std::optional<Eigen::Vector3d> ExerciseAnalyzer::landmarkAt(const PoseSequence& sequence, size_t frame,
                                                            const std::string& name) {
    if (frame >= sequence.size()) {
        return std::nullopt;
    }
    return sequence[frame].landmark(name);
}

size_t ExerciseAnalyzer::argMin(const std::vector<double>& values) {
    return static_cast<size_t>(std::min_element(values.begin(), values.end()) - values.begin());
}

size_t ExerciseAnalyzer::argMax(const std::vector<double>& values) {
    return static_cast<size_t>(std::max_element(values.begin(), values.end()) - values.begin());
}

std::string ExerciseAnalyzer::formatPercent(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

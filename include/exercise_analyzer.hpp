#pragma once

// C++ Standard Library
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Third-party libraries
#include <Eigen/Core>

#include "model_trainer.hpp"
#include "pose_types.hpp"

// Scores one exercise type. The learned model is tried first; the
// exercise-specific rules are the fallback.
class ExerciseAnalyzer {
public:
    struct ExerciseInfo {
        std::string id;
        std::string name;
        std::string description;
        std::string difficulty;
        std::vector<std::string> tips;
    };

    // Result of trying the learned model: Ok carries the result, Fallback the reason
    struct ModelAttempt {
        enum class Status { Ok, Fallback };

        Status status;
        AnalysisResult result;
        std::string reason;
        bool modelPresent;  // a model existed but could not be used

        static ModelAttempt ok(AnalysisResult r) {
            return {Status::Ok, std::move(r), "", true};
        }
        static ModelAttempt fallback(const std::string& why, bool present = false) {
            return {Status::Fallback, AnalysisResult(), why, present};
        }
        bool isOk() const { return status == Status::Ok; }
    };

    ExerciseAnalyzer(std::shared_ptr<const ModelTrainer> trainer, bool useModel);
    virtual ~ExerciseAnalyzer() = default;

    virtual std::string exerciseId() const = 0;
    virtual ExerciseInfo info() const = 0;
    virtual std::vector<std::string> getVideoRequirements() const = 0;

    // Never throws for missing models or data
    AnalysisResult analyzeForm(const PoseSequence& sequence, const std::string& exerciseType) const;

    ModelAttempt tryModelAnalysis(const PoseSequence& sequence, const std::string& exerciseType) const;

    virtual AnalysisResult ruleBasedAnalysis(const PoseSequence& sequence) const = 0;

    // Heuristic feedback appended to model scores
    virtual std::vector<std::string> analyzeSpecificIssues(const PoseSequence& sequence) const;

    void setUseModel(bool useModel) { useModel_ = useModel; }
    bool useModel() const { return useModel_; }

protected:
    static AnalysisResult emptySequenceResult();

    // Clamps, adds the positive message when nothing was flagged, then the tier summary
    static AnalysisResult finalizeRuleResult(double score, std::vector<std::string> feedback);

    // Tier message for a model score followed by the specific issues
    std::vector<std::string> feedbackFromScore(double score, const PoseSequence& sequence) const;

    // Per-frame joint angle, 180 where a frame has none
    static std::vector<double> angleSeries(const PoseSequence& sequence, const std::string& joint);

    // One coordinate (0 = x, 1 = y) of a landmark in frames that have it
    static std::vector<double> coordinateSeries(const PoseSequence& sequence,
                                                const std::string& name, int axis);

    static std::optional<Eigen::Vector3d> landmarkAt(const PoseSequence& sequence, size_t frame,
                                                     const std::string& name);

    // First index of the smallest / largest value
    static size_t argMin(const std::vector<double>& values);
    static size_t argMax(const std::vector<double>& values);

    // "12.3"
    static std::string formatPercent(double value);

private:
    std::shared_ptr<const ModelTrainer> trainer_;
    bool useModel_;
};

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "analyzer_config.hpp"
#include "exercise_analyzer.hpp"

class SquatAnalyzer : public ExerciseAnalyzer {
public:
    SquatAnalyzer(std::shared_ptr<const ModelTrainer> trainer, const SquatRules& rules,
                  bool useModel = true)
        : ExerciseAnalyzer(std::move(trainer), useModel), rules_(rules) {}

    std::string exerciseId() const override { return "squat"; }
    ExerciseInfo info() const override;
    std::vector<std::string> getVideoRequirements() const override;
    AnalysisResult ruleBasedAnalysis(const PoseSequence& sequence) const override;

private:
    SquatRules rules_;
};

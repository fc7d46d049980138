#pragma once

#include <stdexcept>
#include <string>

class FormScoringError : public std::runtime_error {
public:
    explicit FormScoringError(const std::string& message) : std::runtime_error(message) {}
};

class UnsupportedExerciseError : public FormScoringError {
public:
    explicit UnsupportedExerciseError(const std::string& exerciseType)
        : FormScoringError("Unsupported exercise type: " + exerciseType),
          exerciseType_(exerciseType) {}

    const std::string& exerciseType() const { return exerciseType_; }

private:
    std::string exerciseType_;
};

class InsufficientDataError : public FormScoringError {
public:
    InsufficientDataError(size_t received, size_t required)
        : FormScoringError("Need at least " + std::to_string(required) +
                           " training examples, got " + std::to_string(received)),
          received_(received) {}

    size_t received() const { return received_; }

private:
    size_t received_;
};

class InvalidExampleError : public FormScoringError {
public:
    explicit InvalidExampleError(const std::string& message) : FormScoringError(message) {}
};

class TrainingFailedError : public FormScoringError {
public:
    explicit TrainingFailedError(const std::string& cause)
        : FormScoringError("Training failed: " + cause) {}
};

class ArtifactError : public FormScoringError {
public:
    enum class Kind {
        Unavailable,  // model or scaler file missing
        Corrupt       // present but unreadable or the wrong shape
    };

    ArtifactError(Kind kind, const std::string& message)
        : FormScoringError(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class PoseDataError : public FormScoringError {
public:
    explicit PoseDataError(const std::string& message) : FormScoringError(message) {}
};

#pragma once

// C++ Standard Library
#include <memory>
#include <string>
#include <vector>

// Third-party libraries
#include <Eigen/Core>
#include <opencv2/core.hpp>
#include <opencv2/ml.hpp>

#include "analyzer_config.hpp"

enum class ModelKind {
    RandomForest,      // bagging
    GradientBoosting   // boosting
};

std::string toString(ModelKind kind);
ModelKind parseModelKind(const std::string& name);  // throws std::invalid_argument

// Maps scaled feature rows to scores
class ScoreRegressor {
public:
    virtual ~ScoreRegressor() = default;

    virtual ModelKind kind() const = 0;
    virtual void fit(const Eigen::MatrixXd& samples, const Eigen::VectorXd& targets) = 0;
    virtual Eigen::VectorXd predict(const Eigen::MatrixXd& samples) const = 0;

    virtual void write(cv::FileStorage& fs) const = 0;
    virtual void read(const cv::FileNode& node) = 0;
};

std::unique_ptr<ScoreRegressor> createRegressor(ModelKind kind, const RegressorParams& params);

class RandomForestRegressor : public ScoreRegressor {
public:
    explicit RandomForestRegressor(const RegressorParams& params) : params_(params) {}

    ModelKind kind() const override { return ModelKind::RandomForest; }
    void fit(const Eigen::MatrixXd& samples, const Eigen::VectorXd& targets) override;
    Eigen::VectorXd predict(const Eigen::MatrixXd& samples) const override;

    void write(cv::FileStorage& fs) const override;
    void read(const cv::FileNode& node) override;

private:
    RegressorParams params_;
    cv::Ptr<cv::ml::RTrees> forest_;
};

// Mean initial estimate plus shallow regression trees fitted to residuals
class GradientBoostingRegressor : public ScoreRegressor {
public:
    explicit GradientBoostingRegressor(const RegressorParams& params)
        : params_(params), initial_(0), learningRate_(params.learningRate) {}

    ModelKind kind() const override { return ModelKind::GradientBoosting; }
    void fit(const Eigen::MatrixXd& samples, const Eigen::VectorXd& targets) override;
    Eigen::VectorXd predict(const Eigen::MatrixXd& samples) const override;

    void write(cv::FileStorage& fs) const override;
    void read(const cv::FileNode& node) override;

    size_t stageCount() const { return stages_.size(); }

private:
    RegressorParams params_;
    double initial_;
    double learningRate_;
    std::vector<cv::Ptr<cv::ml::DTrees>> stages_;
};

// Eigen <-> cv::ml conversions (cv::ml trains on CV_32F)
cv::Mat toSampleMat(const Eigen::MatrixXd& samples);
cv::Mat toResponseMat(const Eigen::VectorXd& targets);

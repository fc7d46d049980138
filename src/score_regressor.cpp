// score_regressor.cpp
#include "score_regressor.hpp"
#include "form_errors.hpp"

#include <stdexcept>

#include <opencv2/core/eigen.hpp>

namespace {

Eigen::VectorXd predictWith(const cv::ml::StatModel& model, const cv::Mat& samples) {
    cv::Mat results;
    model.predict(samples, results);
    results.convertTo(results, CV_64F);

    Eigen::VectorXd out(samples.rows);
    for (int i = 0; i < samples.rows; ++i) {
        out[i] = results.at<double>(i, 0);
    }
    return out;
}

cv::Ptr<cv::ml::DTrees> createStageTree(const RegressorParams& params) {
    cv::Ptr<cv::ml::DTrees> tree = cv::ml::DTrees::create();
    tree->setMaxDepth(params.boostingMaxDepth);
    tree->setMinSampleCount(params.boostingMinSampleCount);
    tree->setCVFolds(0);  // no pruning, the learning rate regularizes
    tree->setUseSurrogates(false);
    tree->setUse1SERule(false);
    tree->setTruncatePrunedTree(false);
    return tree;
}

}  // namespace

std::string toString(ModelKind kind) {
    switch (kind) {
        case ModelKind::GradientBoosting:
            return "gradient_boosting";
        case ModelKind::RandomForest:
            return "random_forest";
    }
    throw std::invalid_argument("Unknown model kind");
}

ModelKind parseModelKind(const std::string& name) {
    if (name == "random_forest") return ModelKind::RandomForest;
    if (name == "gradient_boosting") return ModelKind::GradientBoosting;
    throw std::invalid_argument("Unknown model type: " + name);
}

std::unique_ptr<ScoreRegressor> createRegressor(ModelKind kind, const RegressorParams& params) {
    switch (kind) {
        case ModelKind::GradientBoosting:
            return std::make_unique<GradientBoostingRegressor>(params);
        case ModelKind::RandomForest:
            return std::make_unique<RandomForestRegressor>(params);
    }
    throw std::invalid_argument("Unknown model kind");
}

cv::Mat toSampleMat(const Eigen::MatrixXd& samples) {
    cv::Mat wide, narrow;
    cv::eigen2cv(samples, wide);
    wide.convertTo(narrow, CV_32F);
    return narrow;
}

cv::Mat toResponseMat(const Eigen::VectorXd& targets) {
    cv::Mat wide, narrow;
    cv::eigen2cv(targets, wide);
    wide.convertTo(narrow, CV_32F);
    return narrow;
}

// ---------------------------------------------------------------------------
// RandomForestRegressor

void RandomForestRegressor::fit(const Eigen::MatrixXd& samples, const Eigen::VectorXd& targets) {
    forest_ = cv::ml::RTrees::create();
    forest_->setMaxDepth(params_.forestMaxDepth);
    forest_->setMinSampleCount(params_.forestMinSampleCount);
    forest_->setUseSurrogates(false);
    forest_->setCalculateVarImportance(false);
    // Every feature is a split candidate, as for a bagged regression forest
    forest_->setActiveVarCount(static_cast<int>(samples.cols()));
    forest_->setTermCriteria(cv::TermCriteria(cv::TermCriteria::MAX_ITER, params_.forestTrees, 0));

    cv::Ptr<cv::ml::TrainData> data =
        cv::ml::TrainData::create(toSampleMat(samples), cv::ml::ROW_SAMPLE, toResponseMat(targets));
    if (!forest_->train(data)) {
        throw TrainingFailedError("random forest training returned no model");
    }
}

Eigen::VectorXd RandomForestRegressor::predict(const Eigen::MatrixXd& samples) const {
    if (!forest_ || !forest_->isTrained()) {
        throw std::logic_error("RandomForestRegressor::predict called before fit");
    }
    return predictWith(*forest_, toSampleMat(samples));
}

void RandomForestRegressor::write(cv::FileStorage& fs) const {
    fs << "forest" << "{";
    forest_->write(fs);
    fs << "}";
}

void RandomForestRegressor::read(const cv::FileNode& node) {
    cv::FileNode forest_node = node["forest"];
    if (forest_node.empty()) {
        throw ArtifactError(ArtifactError::Kind::Corrupt, "Model file has no forest");
    }
    forest_ = cv::ml::RTrees::create();
    forest_->read(forest_node);
    if (!forest_->isTrained()) {
        throw ArtifactError(ArtifactError::Kind::Corrupt, "Stored forest is empty");
    }
}

// ---------------------------------------------------------------------------
// GradientBoostingRegressor

void GradientBoostingRegressor::fit(const Eigen::MatrixXd& samples, const Eigen::VectorXd& targets) {
    cv::Mat sample_mat = toSampleMat(samples);

    initial_ = targets.mean();
    learningRate_ = params_.learningRate;
    stages_.clear();

    Eigen::VectorXd estimate = Eigen::VectorXd::Constant(targets.size(), initial_);
    for (int stage = 0; stage < params_.boostingStages; ++stage) {
        Eigen::VectorXd residual = targets - estimate;

        cv::Ptr<cv::ml::DTrees> tree = createStageTree(params_);
        cv::Ptr<cv::ml::TrainData> data =
            cv::ml::TrainData::create(sample_mat, cv::ml::ROW_SAMPLE, toResponseMat(residual));
        if (!tree->train(data)) {
            throw TrainingFailedError("boosting stage " + std::to_string(stage) + " returned no tree");
        }

        estimate += learningRate_ * predictWith(*tree, sample_mat);
        stages_.push_back(tree);
    }
}

Eigen::VectorXd GradientBoostingRegressor::predict(const Eigen::MatrixXd& samples) const {
    cv::Mat sample_mat = toSampleMat(samples);

    Eigen::VectorXd estimate = Eigen::VectorXd::Constant(samples.rows(), initial_);
    for (const auto& tree : stages_) {
        estimate += learningRate_ * predictWith(*tree, sample_mat);
    }
    return estimate;
}

void GradientBoostingRegressor::write(cv::FileStorage& fs) const {
    fs << "initial" << initial_;
    fs << "learning_rate" << learningRate_;
    fs << "stages" << "[";
    for (const auto& tree : stages_) {
        fs << "{";
        tree->write(fs);
        fs << "}";
    }
    fs << "]";
}

void GradientBoostingRegressor::read(const cv::FileNode& node) {
    cv::FileNode stages_node = node["stages"];
    if (node["initial"].empty() || node["learning_rate"].empty() || !stages_node.isSeq()) {
        throw ArtifactError(ArtifactError::Kind::Corrupt, "Model file has no boosting stages");
    }

    initial_ = static_cast<double>(node["initial"]);
    learningRate_ = static_cast<double>(node["learning_rate"]);
    stages_.clear();
    for (const auto& stage_node : stages_node) {
        cv::Ptr<cv::ml::DTrees> tree = cv::ml::DTrees::create();
        tree->read(stage_node);
        if (!tree->isTrained()) {
            throw ArtifactError(ArtifactError::Kind::Corrupt, "Stored boosting stage is empty");
        }
        stages_.push_back(tree);
    }
}

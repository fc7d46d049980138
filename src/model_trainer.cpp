// model_trainer.cpp
#include "model_trainer.hpp"
#include "form_errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

#include <opencv2/core.hpp>

double meanSquaredError(const Eigen::VectorXd& truth, const Eigen::VectorXd& predicted) {
    if (truth.size() == 0) return 0.0;
    return (truth - predicted).squaredNorm() / static_cast<double>(truth.size());
}

double r2Score(const Eigen::VectorXd& truth, const Eigen::VectorXd& predicted) {
    if (truth.size() == 0) return 0.0;

    double ss_res = (truth - predicted).squaredNorm();
    double ss_tot = (truth.array() - truth.mean()).matrix().squaredNorm();
    if (ss_tot <= 0.0) {
        // Constant targets: only an exact fit explains them
        return ss_res <= 1e-12 ? 1.0 : 0.0;
    }
    return 1.0 - ss_res / ss_tot;
}

ModelTrainer::ModelTrainer(std::shared_ptr<ArtifactStore> store, RegressorParams params)
    : store_(std::move(store)), params_(params) {
    if (!store_) {
        throw std::invalid_argument("ModelTrainer needs an artifact store");
    }
}

std::pair<std::vector<int>, std::vector<int>> ModelTrainer::splitIndices(size_t count) const {
    std::vector<int> order(count);
    for (size_t i = 0; i < count; ++i) {
        order[i] = static_cast<int>(i);
    }

    // Fisher-Yates with a seeded cv::RNG so the split is reproducible
    cv::RNG rng(params_.seed);
    for (size_t i = count; i > 1; --i) {
        size_t j = static_cast<size_t>(rng.uniform(0, static_cast<int>(i)));
        std::swap(order[i - 1], order[j]);
    }

    size_t test_count = static_cast<size_t>(std::ceil(params_.testFraction * count));
    test_count = std::min(std::max<size_t>(test_count, 1), count - 1);

    std::vector<int> test(order.begin(), order.begin() + test_count);
    std::vector<int> train(order.begin() + test_count, order.end());
    return {train, test};
}

ModelTrainer::TrainingReport ModelTrainer::train(
    const std::string& exerciseType,
    const std::vector<std::pair<PoseSequence, double>>& examples,
    ModelKind kind) {

    if (examples.size() < MIN_TRAINING_EXAMPLES) {
        throw InsufficientDataError(examples.size(), MIN_TRAINING_EXAMPLES);
    }
    for (size_t i = 0; i < examples.size(); ++i) {
        double score = examples[i].second;
        if (!std::isfinite(score) || score < 0.0 || score > 100.0) {
            throw InvalidExampleError("Example " + std::to_string(i) + " has score " +
                                      std::to_string(score) + " outside [0, 100]");
        }
    }

    std::cout << "Extracting features from " << examples.size() << " examples..." << std::endl;

    const Eigen::Index n = static_cast<Eigen::Index>(examples.size());
    Eigen::MatrixXd features(n, FeatureExtractor::FEATURE_COUNT);
    Eigen::VectorXd targets(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        features.row(i) = extractor_.extract(examples[i].first).transpose();
        targets[i] = examples[i].second;
    }
    if (!features.allFinite()) {
        throw TrainingFailedError("feature extraction produced non-finite values");
    }

    auto split = splitIndices(examples.size());
    const std::vector<int>& train_idx = split.first;
    const std::vector<int>& test_idx = split.second;

    Eigen::MatrixXd x_train(train_idx.size(), features.cols());
    Eigen::VectorXd y_train(train_idx.size());
    for (size_t i = 0; i < train_idx.size(); ++i) {
        x_train.row(i) = features.row(train_idx[i]);
        y_train[i] = targets[train_idx[i]];
    }
    Eigen::MatrixXd x_test(test_idx.size(), features.cols());
    Eigen::VectorXd y_test(test_idx.size());
    for (size_t i = 0; i < test_idx.size(); ++i) {
        x_test.row(i) = features.row(test_idx[i]);
        y_test[i] = targets[test_idx[i]];
    }

    auto model = std::make_shared<ScoringModel>();
    model->exerciseType = exerciseType;
    model->scaler.fit(x_train);

    Eigen::MatrixXd x_train_scaled = model->scaler.transform(x_train);
    Eigen::MatrixXd x_test_scaled = model->scaler.transform(x_test);

    std::cout << "Training " << toString(kind) << " model for " << exerciseType << "..." << std::endl;

    model->regressor = createRegressor(kind, params_);
    Eigen::VectorXd train_pred, test_pred;
    try {
        model->regressor->fit(x_train_scaled, y_train);
        train_pred = model->regressor->predict(x_train_scaled);
        test_pred = model->regressor->predict(x_test_scaled);
    } catch (const cv::Exception& e) {
        throw TrainingFailedError(e.what());
    }
    if (!train_pred.allFinite() || !test_pred.allFinite()) {
        throw TrainingFailedError("regressor produced non-finite predictions");
    }

    TrainingReport report;
    report.exerciseType = exerciseType;
    report.modelKind = kind;
    report.trainingSamples = train_idx.size();
    report.testSamples = test_idx.size();
    report.trainMse = meanSquaredError(y_train, train_pred);
    report.testMse = meanSquaredError(y_test, test_pred);
    report.trainRmse = std::sqrt(report.trainMse);
    report.testRmse = std::sqrt(report.testMse);
    report.trainR2 = r2Score(y_train, train_pred);
    report.testR2 = r2Score(y_test, test_pred);

    store_->save(exerciseType, model);

    std::cout << std::fixed << std::setprecision(4)
              << "Training complete! Test R²: " << report.testR2
              << ", Test RMSE: " << report.testRmse << std::endl;
    std::cout.unsetf(std::ios_base::floatfield);
    return report;
}

ModelTrainer::Prediction ModelTrainer::tryPredict(const std::string& exerciseType,
                                                  const PoseSequence& sequence) const {
    try {
        auto model = store_->load(exerciseType);
        if (model->scaler.dimension() != FeatureExtractor::FEATURE_COUNT) {
            throw ArtifactError(ArtifactError::Kind::Corrupt,
                                "Model for " + exerciseType + " expects " +
                                std::to_string(model->scaler.dimension()) + " features");
        }

        double raw = model->predict(extractor_.extract(sequence));
        if (!std::isfinite(raw)) {
            return Prediction::failure("Model for " + exerciseType + " produced a non-finite score");
        }
        return Prediction::success(std::clamp(raw, 0.0, 100.0));
    } catch (const ArtifactError& e) {
        return Prediction::failure(e.what());
    } catch (const cv::Exception& e) {
        return Prediction::failure(std::string("Model evaluation failed: ") + e.what());
    }
}

double ModelTrainer::predict(const std::string& exerciseType, const PoseSequence& sequence) const {
    Prediction prediction = tryPredict(exerciseType, sequence);
    if (!prediction.ok) {
        std::cerr << "ModelTrainer: " << prediction.error << ", using neutral score" << std::endl;
        return NEUTRAL_SCORE;
    }
    return prediction.score;
}

bool ModelTrainer::modelExists(const std::string& exerciseType) const {
    return store_->exists(exerciseType);
}

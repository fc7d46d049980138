// feature_scaler.cpp
#include "feature_scaler.hpp"
#include "form_errors.hpp"

#include <cmath>

#include <opencv2/core/eigen.hpp>

void FeatureScaler::fit(const Eigen::MatrixXd& samples) {
    if (samples.rows() == 0) {
        throw TrainingFailedError("cannot fit a scaler on an empty feature matrix");
    }

    mean_ = samples.colwise().mean().transpose();
    Eigen::MatrixXd centred = samples.rowwise() - mean_.transpose();
    scale_ = (centred.array().square().colwise().sum() / static_cast<double>(samples.rows()))
                 .sqrt().transpose().matrix();

    for (Eigen::Index i = 0; i < scale_.size(); ++i) {
        if (scale_[i] < 1e-12) scale_[i] = 1.0;
    }
}

Eigen::MatrixXd FeatureScaler::transform(const Eigen::MatrixXd& samples) const {
    if (samples.cols() != mean_.size()) {
        throw ArtifactError(ArtifactError::Kind::Corrupt,
                            "Scaler expects " + std::to_string(mean_.size()) +
                            " features, got " + std::to_string(samples.cols()));
    }
    Eigen::MatrixXd centred = samples.rowwise() - mean_.transpose();
    return (centred.array().rowwise() / scale_.transpose().array()).matrix();
}

Eigen::VectorXd FeatureScaler::transform(const Eigen::VectorXd& features) const {
    Eigen::MatrixXd row = features.transpose();
    return transform(row).row(0).transpose();
}

void FeatureScaler::write(cv::FileStorage& fs) const {
    cv::Mat mean, scale;
    cv::eigen2cv(mean_, mean);
    cv::eigen2cv(scale_, scale);
    fs << "mean" << mean << "scale" << scale;
}

void FeatureScaler::read(const cv::FileNode& node) {
    cv::Mat mean, scale;
    node["mean"] >> mean;
    node["scale"] >> scale;
    if (mean.empty() || scale.empty() || mean.total() != scale.total()) {
        throw ArtifactError(ArtifactError::Kind::Corrupt, "Scaler parameters are missing or mismatched");
    }

    mean.convertTo(mean, CV_64F);
    scale.convertTo(scale, CV_64F);
    cv::cv2eigen(mean.reshape(1, static_cast<int>(mean.total())), mean_);
    cv::cv2eigen(scale.reshape(1, static_cast<int>(scale.total())), scale_);

    for (Eigen::Index i = 0; i < scale_.size(); ++i) {
        if (!std::isfinite(scale_[i]) || scale_[i] <= 0.0) {
            throw ArtifactError(ArtifactError::Kind::Corrupt, "Scaler contains a non-positive scale");
        }
    }
}

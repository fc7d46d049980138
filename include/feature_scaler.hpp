#pragma once

#include <Eigen/Core>
#include <opencv2/core.hpp>

// Zero-mean, unit-variance normalization fitted per exercise type.
// Constant columns keep a scale of 1 so they pass through centred.
class FeatureScaler {
public:
    void fit(const Eigen::MatrixXd& samples);

    Eigen::MatrixXd transform(const Eigen::MatrixXd& samples) const;
    Eigen::VectorXd transform(const Eigen::VectorXd& features) const;

    bool isFitted() const { return mean_.size() > 0; }
    Eigen::Index dimension() const { return mean_.size(); }

    const Eigen::VectorXd& mean() const { return mean_; }
    const Eigen::VectorXd& scale() const { return scale_; }

    void write(cv::FileStorage& fs) const;
    void read(const cv::FileNode& node);

private:
    Eigen::VectorXd mean_;
    Eigen::VectorXd scale_;
};

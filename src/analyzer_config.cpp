// analyzer_config.cpp
#include "analyzer_config.hpp"
#include "form_errors.hpp"

#include <opencv2/core.hpp>

namespace {

void readValue(const cv::FileNode& node, double& value) {
    if (node.isReal() || node.isInt()) value = static_cast<double>(node);
}

void readValue(const cv::FileNode& node, int& value) {
    if (node.isInt() || node.isReal()) value = static_cast<int>(node);
}

void readValue(const cv::FileNode& node, uint64_t& value) {
    if (node.isInt() || node.isReal()) value = static_cast<uint64_t>(static_cast<double>(node));
}

void readValue(const cv::FileNode& node, bool& value) {
    if (node.isInt()) {
        value = static_cast<int>(node) != 0;
    } else if (node.isString()) {
        std::string text = static_cast<std::string>(node);
        if (text == "true" || text == "True") value = true;
        else if (text == "false" || text == "False") value = false;
    }
}

void readValue(const cv::FileNode& node, std::string& value) {
    if (node.isString()) value = static_cast<std::string>(node);
}

void readRules(const cv::FileNode& n, PullUpRules& r) {
    if (n.empty()) return;
    readValue(n["full_extension_angle"], r.fullExtensionAngle);
    readValue(n["full_extension_penalty"], r.fullExtensionPenalty);
    readValue(n["chin_over_bar_penalty"], r.chinOverBarPenalty);
    readValue(n["hip_swing_limit"], r.hipSwingLimit);
    readValue(n["hip_swing_penalty"], r.hipSwingPenalty);
}

void readRules(const cv::FileNode& n, PushUpRules& r) {
    if (n.empty()) return;
    readValue(n["lockout_angle"], r.lockoutAngle);
    readValue(n["lockout_penalty"], r.lockoutPenalty);
    readValue(n["depth_angle"], r.depthAngle);
    readValue(n["depth_penalty"], r.depthPenalty);
    readValue(n["hip_sag_angle"], r.hipSagAngle);
    readValue(n["hip_sag_penalty"], r.hipSagPenalty);
    readValue(n["hand_alignment_tolerance"], r.handAlignmentTolerance);
    readValue(n["hand_alignment_penalty"], r.handAlignmentPenalty);
}

void readRules(const cv::FileNode& n, SquatRules& r) {
    if (n.empty()) return;
    readValue(n["extension_angle"], r.extensionAngle);
    readValue(n["extension_penalty"], r.extensionPenalty);
    readValue(n["depth_angle"], r.depthAngle);
    readValue(n["depth_penalty"], r.depthPenalty);
    readValue(n["knee_travel_tolerance"], r.kneeTravelTolerance);
    readValue(n["knee_travel_penalty"], r.kneeTravelPenalty);
    readValue(n["back_rounding_angle"], r.backRoundingAngle);
    readValue(n["back_rounding_penalty"], r.backRoundingPenalty);
}

void readRules(const cv::FileNode& n, BridgeRules& r) {
    if (n.empty()) return;
    readValue(n["hip_extension_angle"], r.hipExtensionAngle);
    readValue(n["hip_extension_penalty"], r.hipExtensionPenalty);
    readValue(n["lowering_angle"], r.loweringAngle);
    readValue(n["lowering_penalty"], r.loweringPenalty);
    readValue(n["shin_alignment_tolerance"], r.shinAlignmentTolerance);
    readValue(n["shin_alignment_penalty"], r.shinAlignmentPenalty);
    readValue(n["hip_shift_limit"], r.hipShiftLimit);
    readValue(n["hip_shift_penalty"], r.hipShiftPenalty);
    readValue(n["hip_rise_tolerance"], r.hipRiseTolerance);
}

void readRules(const cv::FileNode& n, ClamRules& r) {
    if (n.empty()) return;
    readValue(n["opening_angle"], r.openingAngle);
    readValue(n["opening_penalty"], r.openingPenalty);
    readValue(n["closing_angle"], r.closingAngle);
    readValue(n["closing_penalty"], r.closingPenalty);
    readValue(n["foot_alignment_tolerance"], r.footAlignmentTolerance);
    readValue(n["foot_alignment_penalty"], r.footAlignmentPenalty);
    readValue(n["torso_rotation_tolerance"], r.torsoRotationTolerance);
    readValue(n["torso_rotation_ratio"], r.torsoRotationRatio);
    readValue(n["torso_rotation_penalty"], r.torsoRotationPenalty);
}

void readRegressor(const cv::FileNode& n, RegressorParams& p) {
    if (n.empty()) return;
    readValue(n["forest_trees"], p.forestTrees);
    readValue(n["forest_max_depth"], p.forestMaxDepth);
    readValue(n["forest_min_sample_count"], p.forestMinSampleCount);
    readValue(n["boosting_stages"], p.boostingStages);
    readValue(n["boosting_max_depth"], p.boostingMaxDepth);
    readValue(n["boosting_min_sample_count"], p.boostingMinSampleCount);
    readValue(n["learning_rate"], p.learningRate);
    readValue(n["test_fraction"], p.testFraction);
    readValue(n["seed"], p.seed);
}

}  // namespace

AnalyzerConfig AnalyzerConfig::load(const std::string& path) {
    AnalyzerConfig config;

    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            throw FormScoringError("Could not open config file: " + path);
        }

        readValue(fs["models_dir"], config.modelsDir);
        readValue(fs["training_data_dir"], config.trainingDataDir);
        readValue(fs["use_model"], config.useModel);

        readRules(fs["pull_up"], config.pullUp);
        readRules(fs["push_up"], config.pushUp);
        readRules(fs["squat"], config.squat);
        readRules(fs["bridge"], config.bridge);
        readRules(fs["clam"], config.clam);
        readRegressor(fs["regressor"], config.regressor);
    } catch (const cv::Exception& e) {
        throw FormScoringError("Could not parse config file " + path + ": " + e.what());
    }

    if (config.regressor.testFraction <= 0.0 || config.regressor.testFraction >= 1.0) {
        throw FormScoringError("regressor.test_fraction must be between 0 and 1");
    }
    return config;
}

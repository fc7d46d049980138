#pragma once

#include <cstdint>
#include <string>

// Thresholds are in degrees unless noted; positions are normalized image coordinates.

struct PullUpRules {
    double fullExtensionAngle = 160.0;
    double fullExtensionPenalty = 20.0;
    double chinOverBarPenalty = 20.0;
    double hipSwingLimit = 3.0;        // std dev of hip x, % of frame width
    double hipSwingPenalty = 25.0;
};

struct PushUpRules {
    double lockoutAngle = 160.0;
    double lockoutPenalty = 15.0;
    double depthAngle = 105.0;
    double depthPenalty = 15.0;
    double hipSagAngle = 150.0;        // mean hip angle
    double hipSagPenalty = 20.0;
    double handAlignmentTolerance = 0.1;
    double handAlignmentPenalty = 10.0;
};

struct SquatRules {
    double extensionAngle = 160.0;
    double extensionPenalty = 15.0;
    double depthAngle = 100.0;         // cue text says 90, threshold has always been 100
    double depthPenalty = 15.0;
    double kneeTravelTolerance = 0.05;
    double kneeTravelPenalty = 20.0;
    double backRoundingAngle = 60.0;
    double backRoundingPenalty = 10.0;
};

struct BridgeRules {
    double hipExtensionAngle = 160.0;
    double hipExtensionPenalty = 20.0;
    double loweringAngle = 130.0;
    double loweringPenalty = 15.0;
    double shinAlignmentTolerance = 0.1;
    double shinAlignmentPenalty = 10.0;
    double hipShiftLimit = 3.0;        // % of frame width
    double hipShiftPenalty = 15.0;
    double hipRiseTolerance = 0.05;    // first-to-last frame hip y change
};

struct ClamRules {
    double openingAngle = 30.0;
    double openingPenalty = 20.0;
    double closingAngle = 15.0;
    double closingPenalty = 15.0;
    double footAlignmentTolerance = 0.05;
    double footAlignmentPenalty = 15.0;
    double torsoRotationTolerance = 0.05;
    double torsoRotationRatio = 1.5;
    double torsoRotationPenalty = 20.0;
};

struct RegressorParams {
    int forestTrees = 100;
    int forestMaxDepth = 20;
    int forestMinSampleCount = 5;
    int boostingStages = 100;
    int boostingMaxDepth = 10;
    int boostingMinSampleCount = 2;
    double learningRate = 0.1;
    double testFraction = 0.2;
    uint64_t seed = 42;
};

struct AnalyzerConfig {
    std::string modelsDir = "models/ml/saved_models";
    std::string trainingDataDir = "models/ml/training_data";
    bool useModel = true;

    PullUpRules pullUp;
    PushUpRules pushUp;
    SquatRules squat;
    BridgeRules bridge;
    ClamRules clam;
    RegressorParams regressor;

    // YAML or JSON via cv::FileStorage. Missing keys keep their defaults.
    static AnalyzerConfig load(const std::string& path);
};

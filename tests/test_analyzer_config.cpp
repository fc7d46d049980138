#include <fstream>

#include <gtest/gtest.h>

#include "analyzer_config.hpp"
#include "form_errors.hpp"
#include "pose_fixtures.hpp"

using fixtures::TempDir;

namespace {

std::string writeConfig(const TempDir& dir, const std::string& name, const std::string& text) {
    auto path = dir.path() / name;
    std::ofstream out(path);
    out << text;
    return path.string();
}

}  // namespace

TEST(AnalyzerConfigTest, Defaults) {
    AnalyzerConfig config;
    EXPECT_EQ(config.modelsDir, "models/ml/saved_models");
    EXPECT_EQ(config.trainingDataDir, "models/ml/training_data");
    EXPECT_TRUE(config.useModel);
    EXPECT_DOUBLE_EQ(config.squat.depthAngle, 100.0);
    EXPECT_DOUBLE_EQ(config.pushUp.depthAngle, 105.0);
    EXPECT_DOUBLE_EQ(config.pullUp.hipSwingLimit, 3.0);
    EXPECT_EQ(config.regressor.forestTrees, 100);
    EXPECT_DOUBLE_EQ(config.regressor.testFraction, 0.2);
    EXPECT_EQ(config.regressor.seed, 42u);
}

TEST(AnalyzerConfigTest, YamlOverridesOnlyNamedKeys) {
    TempDir dir;
    std::string path = writeConfig(dir, "scoring.yml",
                                   "%YAML:1.0\n"
                                   "---\n"
                                   "models_dir: \"/var/lib/scoring/models\"\n"
                                   "use_model: 0\n"
                                   "squat:\n"
                                   "   depth_angle: 90\n"
                                   "   knee_travel_tolerance: 0.08\n"
                                   "clam:\n"
                                   "   opening_angle: 35.5\n"
                                   "regressor:\n"
                                   "   forest_trees: 25\n"
                                   "   seed: 7\n");

    AnalyzerConfig config = AnalyzerConfig::load(path);
    EXPECT_EQ(config.modelsDir, "/var/lib/scoring/models");
    EXPECT_EQ(config.trainingDataDir, "models/ml/training_data");
    EXPECT_FALSE(config.useModel);

    EXPECT_DOUBLE_EQ(config.squat.depthAngle, 90.0);
    EXPECT_DOUBLE_EQ(config.squat.kneeTravelTolerance, 0.08);
    EXPECT_DOUBLE_EQ(config.squat.extensionAngle, 160.0);
    EXPECT_DOUBLE_EQ(config.clam.openingAngle, 35.5);
    EXPECT_DOUBLE_EQ(config.bridge.hipExtensionAngle, 160.0);

    EXPECT_EQ(config.regressor.forestTrees, 25);
    EXPECT_EQ(config.regressor.boostingStages, 100);
    EXPECT_EQ(config.regressor.seed, 7u);
}

TEST(AnalyzerConfigTest, JsonIsAccepted) {
    TempDir dir;
    std::string path = writeConfig(dir, "scoring.json",
                                   R"({"use_model": "false", "bridge": {"hip_shift_limit": 4.5}})");

    AnalyzerConfig config = AnalyzerConfig::load(path);
    EXPECT_FALSE(config.useModel);
    EXPECT_DOUBLE_EQ(config.bridge.hipShiftLimit, 4.5);
}

TEST(AnalyzerConfigTest, MissingFileThrows) {
    TempDir dir;
    EXPECT_THROW(AnalyzerConfig::load((dir.path() / "absent.yml").string()), FormScoringError);
}

TEST(AnalyzerConfigTest, TestFractionMustBeAProperFraction) {
    TempDir dir;
    std::string path = writeConfig(dir, "bad.yml",
                                   "%YAML:1.0\n"
                                   "---\n"
                                   "regressor:\n"
                                   "   test_fraction: 1.0\n");
    EXPECT_THROW(AnalyzerConfig::load(path), FormScoringError);
}

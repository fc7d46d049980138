#include <cmath>

#include <gtest/gtest.h>

#include "geometry.hpp"
#include "pose_fixtures.hpp"

using fixtures::point;

TEST(CalculateAngleTest, RightAngle) {
    EXPECT_NEAR(calculateAngle(Eigen::Vector2d(1, 0), Eigen::Vector2d(0, 0), Eigen::Vector2d(0, 1)),
                90.0, 1e-9);
}

TEST(CalculateAngleTest, StraightLineIs180) {
    EXPECT_NEAR(calculateAngle(Eigen::Vector2d(-1, 0), Eigen::Vector2d(0, 0), Eigen::Vector2d(1, 0)),
                180.0, 1e-9);
}

TEST(CalculateAngleTest, IndependentOfOrientation) {
    Eigen::Vector2d a(0.2, 0.7), b(0.4, 0.4), c(0.9, 0.5);
    double forward = calculateAngle(a, b, c);
    double backward = calculateAngle(c, b, a);
    EXPECT_NEAR(forward, backward, 1e-9);
    EXPECT_GE(forward, 0.0);
    EXPECT_LE(forward, 180.0);
}

TEST(CalculateAngleTest, ReflexAngleIsReflected) {
    // Polar angles 170 and -170 degrees differ by 340; the interior angle is 20
    double rad = 170.0 * 3.14159265358979323846 / 180.0;
    Eigen::Vector2d a(std::cos(rad), std::sin(rad));
    Eigen::Vector2d c(std::cos(-rad), std::sin(-rad));
    EXPECT_NEAR(calculateAngle(a, Eigen::Vector2d::Zero(), c), 20.0, 1e-9);
}

TEST(CalculateAngleTest, IgnoresDepth) {
    Eigen::Vector3d a(1, 0, 5), b(0, 0, -3), c(0, 1, 2);
    EXPECT_NEAR(calculateAngle(a, b, c), 90.0, 1e-9);
}

TEST(CalculateAngleTest, CoincidentPointsStayFinite) {
    Eigen::Vector2d p(0.5, 0.5);
    EXPECT_TRUE(std::isfinite(calculateAngle(p, p, p)));
}

TEST(ComputeJointAnglesTest, StraightArmAndBentKnee) {
    PoseFrame frame = fixtures::landmarkFrame({
        {"left_shoulder", point(0.5, 0.2)},
        {"left_elbow", point(0.5, 0.35)},
        {"left_wrist", point(0.5, 0.5)},
        {"left_hip", point(0.5, 0.5)},
        {"left_knee", point(0.6, 0.7)},
        {"left_ankle", point(0.4, 0.7)}
    });

    auto angles = computeJointAngles(frame.landmarks, frame.landmarkMap);
    EXPECT_NEAR(angles.at("left_elbow"), 180.0, 1e-6);
    EXPECT_GT(angles.at("left_knee"), 0.0);
    EXPECT_LT(angles.at("left_knee"), 180.0);
    EXPECT_EQ(angles.size(), 8u);
}

TEST(ComputeJointAnglesTest, OmitsJointsWithUnresolvableLandmarks) {
    std::vector<Eigen::Vector3d> landmarks = {point(0.1, 0.1), point(0.2, 0.2), point(0.3, 0.1)};
    LandmarkMap map = {{"left_shoulder", 0}, {"left_elbow", 1}, {"left_wrist", 2}};

    auto angles = computeJointAngles(landmarks, map);
    ASSERT_EQ(angles.size(), 1u);
    EXPECT_NEAR(angles.at("left_elbow"), 90.0, 1e-6);
}

TEST(SeriesStatsTest, PopulationStdDev) {
    EXPECT_DOUBLE_EQ(seriesMean({2, 4, 4, 4, 5, 5, 7, 9}), 5.0);
    EXPECT_DOUBLE_EQ(seriesStdDev({2, 4, 4, 4, 5, 5, 7, 9}), 2.0);
    EXPECT_DOUBLE_EQ(seriesMean({}), 0.0);
    EXPECT_DOUBLE_EQ(seriesStdDev({}), 0.0);
}

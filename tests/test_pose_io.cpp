#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "form_errors.hpp"
#include "pose_fixtures.hpp"
#include "pose_io.hpp"

using fixtures::TempDir;

namespace {

void writeText(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

std::string readText(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// One MediaPipe row with every landmark at (x, y, 0), visibility 1
std::string mediaPipeRow(double x, double y) {
    std::stringstream row;
    for (int i = 0; i < 33; ++i) {
        if (i > 0) row << ",";
        row << x << "," << y << ",0,1";
    }
    return row.str();
}

}  // namespace

TEST(PoseIoTest, ReadsJsonFrames) {
    TempDir dir;
    auto path = dir.path() / "pose.json";
    writeText(path, R"({
        "pose_data": [
            {
                "landmarks": [[0.1, 0.2, 0.0], [0.3, 0.4], {"x": 0.5, "y": 0.6, "z": 0.1}],
                "landmark_map": {"left_shoulder": 0, "left_elbow": 1, "left_wrist": 2},
                "angles": {"left_elbow": 150.5}
            },
            {
                "landmarks": [],
                "angles": {"left_knee": 90}
            }
        ]
    })");

    PoseSequence sequence = readPoseFile(path.string());
    ASSERT_EQ(sequence.size(), 2u);

    const PoseFrame& first = sequence[0];
    ASSERT_EQ(first.landmarks.size(), 3u);
    EXPECT_DOUBLE_EQ(first.landmarks[1].y(), 0.4);
    EXPECT_DOUBLE_EQ(first.landmarks[1].z(), 0.0);
    EXPECT_DOUBLE_EQ(first.landmarks[2].z(), 0.1);
    EXPECT_EQ(first.landmarkMap.at("left_wrist"), 2);
    EXPECT_DOUBLE_EQ(first.angles.at("left_elbow"), 150.5);
    EXPECT_EQ(first.angles.size(), 1u);

    EXPECT_TRUE(sequence[1].landmarks.empty());
    EXPECT_DOUBLE_EQ(sequence[1].angle("left_knee"), 90.0);
}

TEST(PoseIoTest, ComputesMissingAngles) {
    TempDir dir;
    auto path = dir.path() / "pose.json";
    writeText(path, R"({
        "pose_data": [
            {
                "landmarks": [[0.1, 0.1], [0.2, 0.2], [0.3, 0.1]],
                "landmark_map": {"left_shoulder": 0, "left_elbow": 1, "left_wrist": 2}
            }
        ]
    })");

    PoseSequence sequence = readPoseFile(path.string());
    ASSERT_EQ(sequence.size(), 1u);
    EXPECT_NEAR(sequence[0].angles.at("left_elbow"), 90.0, 1e-6);
}

TEST(PoseIoTest, MissingPoseDataThrows) {
    TempDir dir;
    auto path = dir.path() / "pose.json";
    writeText(path, R"({"frames": []})");
    EXPECT_THROW(readPoseFile(path.string()), PoseDataError);

    EXPECT_THROW(readPoseFile((dir.path() / "absent.json").string()), PoseDataError);
}

TEST(PoseIoTest, MalformedLandmarkThrows) {
    TempDir dir;
    auto path = dir.path() / "pose.json";
    writeText(path, R"({"pose_data": [{"landmarks": [[0.1]]}]})");
    EXPECT_THROW(readPoseFile(path.string()), PoseDataError);
}

TEST(PoseIoTest, ReadsMediaPipeCsv) {
    TempDir dir;
    auto path = dir.path() / "landmarks.csv";
    writeText(path, mediaPipeRow(0.5, 0.5) + "\r\n\n" + mediaPipeRow(0.25, 0.75) + "\n");

    PoseSequence sequence = readMediaPipeCsv(path.string());
    ASSERT_EQ(sequence.size(), 2u);
    EXPECT_EQ(sequence[1].landmarks.size(), 33u);
    EXPECT_EQ(sequence[1].landmarkMap, defaultLandmarkMap());
    EXPECT_DOUBLE_EQ(sequence[1].landmarks[0].x(), 0.25);
    EXPECT_DOUBLE_EQ(sequence[1].landmarks[32].y(), 0.75);
    EXPECT_EQ(sequence[0].angles.size(), 8u);
}

TEST(PoseIoTest, ShortMediaPipeRowThrows) {
    TempDir dir;
    auto path = dir.path() / "landmarks.csv";
    writeText(path, mediaPipeRow(0.5, 0.5) + "\n0.1,0.2,0.3\n");
    EXPECT_THROW(readMediaPipeCsv(path.string()), PoseDataError);

    writeText(path, "x,y,z\n");
    EXPECT_THROW(readMediaPipeCsv(path.string()), PoseDataError);
}

TEST(PoseIoTest, WritesFeatureCsv) {
    TempDir dir;
    auto path = dir.path() / "features.csv";

    Eigen::VectorXd first(3), second(3);
    first << 1.5, 2.0, -3.25;
    second << 0.0, 0.125, 7.0;
    writeFeatureCsv(path.string(), {"squat_a", "squat_b"}, {first, second});

    std::string text = readText(path);
    EXPECT_EQ(text, "id,f0,f1,f2\nsquat_a,1.5,2,-3.25\nsquat_b,0,0.125,7\n");

    EXPECT_THROW(writeFeatureCsv(path.string(), {"only_one"}, {first, second}), std::invalid_argument);
}

TEST(PoseIoTest, WrittenSequenceReadsBack) {
    TempDir dir;
    auto path = dir.path() / "written.yml";

    PoseSequence sequence = {fixtures::landmarkFrame({{"left_knee", fixtures::point(0.4, 0.6)}},
                                                     {{"left_knee", 101.0}})};
    {
        cv::FileStorage fs(path.string(), cv::FileStorage::WRITE);
        writePoseSequence(fs, "pose_data", sequence);
    }

    PoseSequence loaded = readPoseFile(path.string());
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].landmarkMap, sequence[0].landmarkMap);
    EXPECT_NEAR(loaded[0].landmarks[25].x(), 0.4, 1e-9);
    EXPECT_DOUBLE_EQ(loaded[0].angles.at("left_knee"), 101.0);
}

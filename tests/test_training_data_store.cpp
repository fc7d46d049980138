#include <cmath>
#include <fstream>
#include <functional>
#include <set>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "form_errors.hpp"
#include "pose_fixtures.hpp"
#include "training_data_store.hpp"

using fixtures::TempDir;
using fixtures::angleFrame;
using fixtures::landmarkFrame;
using fixtures::point;

TEST(TrainingDataStoreTest, MissingExerciseHasNoExamples) {
    TempDir dir;
    TrainingDataStore store(dir.path());
    EXPECT_TRUE(store.loadExamples("squat").empty());

    TrainingDataStore::Statistics stats = store.statistics("squat");
    EXPECT_EQ(stats.count, 0u);
    EXPECT_EQ(stats.avgScore, 0.0);
}

TEST(TrainingDataStoreTest, RapidSavesGetDistinctOrderedIds) {
    TempDir dir;
    TrainingDataStore store(dir.path());
    PoseSequence sequence = {angleFrame({{"left_knee", 95.0}})};

    std::vector<std::string> ids;
    for (int i = 0; i < 25; ++i) {
        ids.push_back(store.saveExample("squat", sequence, 50.0 + i));
    }

    EXPECT_EQ(std::set<std::string>(ids.begin(), ids.end()).size(), ids.size());
    for (const auto& id : ids) {
        EXPECT_EQ(id.rfind("squat_", 0), 0u) << id;
    }

    std::vector<TrainingExample> examples = store.loadExamples("squat");
    ASSERT_EQ(examples.size(), ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(examples[i].id, ids[i]);
        EXPECT_DOUBLE_EQ(examples[i].score, 50.0 + static_cast<double>(i));
    }
}

TEST(TrainingDataStoreTest, ExampleRoundTrip) {
    TempDir dir;
    TrainingDataStore store(dir.path());

    PoseSequence sequence = {
        landmarkFrame({{"left_hip", point(0.4, 0.55)}, {"left_knee", point(0.45, 0.7)}},
                      {{"left_hip", 165.0}, {"left_knee", 92.5}}),
        landmarkFrame({{"left_hip", point(0.41, 0.5)}}, {{"left_hip", 170.0}})
    };
    std::string id = store.saveExample("bridge", sequence, 82.5, std::string("felt solid"),
                                       {{"source", "webcam"}, {"reps", "8"}});

    std::vector<TrainingExample> examples = store.loadExamples("bridge");
    ASSERT_EQ(examples.size(), 1u);
    const TrainingExample& example = examples.front();

    EXPECT_EQ(example.id, id);
    EXPECT_EQ(example.exerciseType, "bridge");
    EXPECT_DOUBLE_EQ(example.score, 82.5);
    ASSERT_TRUE(example.userFeedback.has_value());
    EXPECT_EQ(*example.userFeedback, "felt solid");
    EXPECT_EQ(example.metadata.at("source"), "webcam");
    EXPECT_EQ(example.metadata.at("reps"), "8");
    EXPECT_FALSE(example.timestamp.empty());
    EXPECT_NE(example.timestamp.find('T'), std::string::npos);

    ASSERT_EQ(example.poseData.size(), 2u);
    const PoseFrame& first = example.poseData[0];
    EXPECT_EQ(first.landmarks.size(), 33u);
    EXPECT_EQ(first.landmarkMap, defaultLandmarkMap());
    EXPECT_DOUBLE_EQ(first.angles.at("left_knee"), 92.5);
    EXPECT_NEAR(first.landmarks[23].x(), 0.4, 1e-9);
    EXPECT_NEAR(first.landmarks[23].y(), 0.55, 1e-9);
    EXPECT_DOUBLE_EQ(example.poseData[1].angles.at("left_hip"), 170.0);
}

TEST(TrainingDataStoreTest, FeedbackIsOptional) {
    TempDir dir;
    TrainingDataStore store(dir.path());
    store.saveExample("clam", {angleFrame({{"left_hip", 120.0}})}, 40.0);

    std::vector<TrainingExample> examples = store.loadExamples("clam");
    ASSERT_EQ(examples.size(), 1u);
    EXPECT_FALSE(examples.front().userFeedback.has_value());
    EXPECT_TRUE(examples.front().metadata.empty());
}

TEST(TrainingDataStoreTest, RejectsScoresOutsideRange) {
    TempDir dir;
    TrainingDataStore store(dir.path());
    PoseSequence sequence = {angleFrame({})};

    EXPECT_THROW(store.saveExample("squat", sequence, -1.0), InvalidExampleError);
    EXPECT_THROW(store.saveExample("squat", sequence, 100.5), InvalidExampleError);
    EXPECT_THROW(store.saveExample("squat", sequence, std::nan("")), InvalidExampleError);
    EXPECT_TRUE(store.loadExamples("squat").empty());

    EXPECT_NO_THROW(store.saveExample("squat", sequence, 0.0));
    EXPECT_NO_THROW(store.saveExample("squat", sequence, 100.0));
}

TEST(TrainingDataStoreTest, StatisticsUsePopulationStdDev) {
    TempDir dir;
    TrainingDataStore store(dir.path());
    PoseSequence sequence = {angleFrame({{"left_elbow", 100.0}})};

    for (double score : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) {
        store.saveExample("push_up", sequence, score);
    }

    TrainingDataStore::Statistics stats = store.statistics("push_up");
    EXPECT_EQ(stats.count, 8u);
    EXPECT_DOUBLE_EQ(stats.avgScore, 5.0);
    EXPECT_DOUBLE_EQ(stats.minScore, 2.0);
    EXPECT_DOUBLE_EQ(stats.maxScore, 9.0);
    EXPECT_DOUBLE_EQ(stats.stdScore, 2.0);
}

TEST(TrainingDataStoreTest, IgnoresStrayFiles) {
    TempDir dir;
    TrainingDataStore store(dir.path());
    store.saveExample("squat", {angleFrame({{"left_knee", 90.0}})}, 70.0);

    std::ofstream(dir.path() / "squat" / "notes.txt") << "not an example";
    std::ofstream(dir.path() / "squat" / ".squat_partial.json") << "{";

    EXPECT_EQ(store.loadExamples("squat").size(), 1u);
}

TEST(TrainingDataStoreTest, UnreadableExampleThrows) {
    TempDir dir;
    TrainingDataStore store(dir.path());
    store.saveExample("squat", {angleFrame({{"left_knee", 90.0}})}, 70.0);
    std::ofstream(dir.path() / "squat" / "squat_zzz.json") << "{\"id\": \"squat_zzz\"}";

    EXPECT_THROW(store.loadExamples("squat"), PoseDataError);
}

TEST(TrainingDataStoreTest, ConcurrentStoresStampIdsAndTimestampsConsistently) {
    TempDir dir;
    TrainingDataStore first(dir.path());
    TrainingDataStore second(dir.path());
    PoseSequence sequence = {angleFrame({{"left_hip", 150.0}})};

    auto collect = [&sequence](TrainingDataStore& store, const std::string& exerciseType) {
        for (int i = 0; i < 20; ++i) {
            store.saveExample(exerciseType, sequence, 60.0);
        }
    };
    std::thread a(collect, std::ref(first), "bridge");
    std::thread b(collect, std::ref(second), "clam");
    a.join();
    b.join();

    // "<type>_YYYYmmdd_HHMMSS_ffffff" must describe the same instant as "YYYY-mm-ddTHH:MM:SS.ffffff"
    for (const std::string type : {"bridge", "clam"}) {
        std::vector<TrainingExample> examples = first.loadExamples(type);
        ASSERT_EQ(examples.size(), 20u) << type;
        for (const auto& example : examples) {
            std::string stamp = example.id.substr(type.size() + 1);
            ASSERT_EQ(stamp.size(), 22u) << example.id;
            std::string expected = stamp.substr(0, 4) + "-" + stamp.substr(4, 2) + "-" +
                                   stamp.substr(6, 2) + "T" + stamp.substr(9, 2) + ":" +
                                   stamp.substr(11, 2) + ":" + stamp.substr(13, 2) + "." +
                                   stamp.substr(16, 6);
            EXPECT_EQ(example.timestamp, expected) << example.id;
        }
    }
}

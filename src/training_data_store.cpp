// training_data_store.cpp
#include "training_data_store.hpp"
#include "form_errors.hpp"
#include "geometry.hpp"
#include "pose_io.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <opencv2/core.hpp>

namespace fs = std::filesystem;

namespace {

constexpr const char* EXAMPLE_EXTENSION = ".json";

std::string formatTime(long long micros, const char* pattern) {
    std::time_t seconds = static_cast<std::time_t>(micros / 1000000);
    std::tm local{};
    localtime_r(&seconds, &local);
    std::stringstream ss;
    ss << std::put_time(&local, pattern);
    return ss.str();
}

std::string formatFraction(long long micros) {
    std::stringstream ss;
    ss << std::setw(6) << std::setfill('0') << (micros % 1000000);
    return ss.str();
}

}  // namespace

TrainingDataStore::TrainingDataStore(fs::path dir) : dir_(std::move(dir)), lastMicros_(0) {}

std::string TrainingDataStore::nextId(const std::string& exerciseType, std::string& timestamp) {
    long long micros = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::string id;
    for (;;) {
        if (micros <= lastMicros_) {
            micros = lastMicros_ + 1;
        }
        lastMicros_ = micros;

        id = exerciseType + "_" + formatTime(micros, "%Y%m%d_%H%M%S") + "_" + formatFraction(micros);
        // Another process may have written the same microsecond
        std::error_code ec;
        if (!fs::exists(dir_ / exerciseType / (id + EXAMPLE_EXTENSION), ec)) break;
    }

    timestamp = formatTime(micros, "%Y-%m-%dT%H:%M:%S") + "." + formatFraction(micros);
    return id;
}

std::string TrainingDataStore::saveExample(const std::string& exerciseType,
                                           const PoseSequence& poseData,
                                           double score,
                                           const std::optional<std::string>& userFeedback,
                                           const std::map<std::string, std::string>& metadata) {
    if (!std::isfinite(score) || score < 0.0 || score > 100.0) {
        throw InvalidExampleError("Score must be between 0 and 100, got " + std::to_string(score));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const fs::path exercise_dir = dir_ / exerciseType;
    fs::create_directories(exercise_dir);

    std::string timestamp;
    const std::string id = nextId(exerciseType, timestamp);
    const fs::path target = exercise_dir / (id + EXAMPLE_EXTENSION);
    const fs::path partial = exercise_dir / ("." + id + ".part");

    try {
        cv::FileStorage out(partial.string(), cv::FileStorage::WRITE | cv::FileStorage::FORMAT_JSON);
        if (!out.isOpened()) {
            throw FormScoringError("Could not write training example " + partial.string());
        }

        cv::write(out, "id", id);
        cv::write(out, "exercise_type", exerciseType);
        out << "score" << score;
        if (userFeedback) {
            cv::write(out, "user_feedback", *userFeedback);
        }
        out << "metadata" << "[";
        for (const auto& entry : metadata) {
            out << "{";
            cv::write(out, "key", entry.first);
            cv::write(out, "value", entry.second);
            out << "}";
        }
        out << "]";
        cv::write(out, "timestamp", timestamp);
        writePoseSequence(out, "pose_data", poseData);
        out.release();

        fs::rename(partial, target);
    } catch (const cv::Exception& e) {
        std::error_code ec;
        fs::remove(partial, ec);
        throw FormScoringError("Could not write training example " + id + ": " + e.what());
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(partial, ec);
        throw FormScoringError("Could not store training example " + id + ": " + e.what());
    }

    std::cout << "Saved training example " << id << " (score " << score << ")" << std::endl;
    return id;
}

TrainingExample TrainingDataStore::readExample(const fs::path& file) const {
    try {
        cv::FileStorage in(file.string(), cv::FileStorage::READ);
        if (!in.isOpened()) {
            throw PoseDataError("Could not open training example " + file.string());
        }

        TrainingExample example;
        example.id = static_cast<std::string>(in["id"]);
        if (example.id.empty()) {
            example.id = file.stem().string();
        }
        example.exerciseType = static_cast<std::string>(in["exercise_type"]);
        if (!in["score"].isReal() && !in["score"].isInt()) {
            throw PoseDataError("Training example " + file.string() + " has no score");
        }
        example.score = static_cast<double>(in["score"]);

        cv::FileNode feedback = in["user_feedback"];
        if (feedback.isString()) {
            example.userFeedback = static_cast<std::string>(feedback);
        }
        cv::FileNode metadata = in["metadata"];
        if (metadata.isSeq()) {
            for (const auto& entry : metadata) {
                example.metadata[static_cast<std::string>(entry["key"])] =
                    static_cast<std::string>(entry["value"]);
            }
        }
        example.timestamp = static_cast<std::string>(in["timestamp"]);
        example.poseData = readPoseSequence(in["pose_data"]);
        return example;
    } catch (const cv::Exception& e) {
        throw PoseDataError("Could not parse training example " + file.string() + ": " + e.what());
    }
}

std::vector<TrainingExample> TrainingDataStore::loadExamples(const std::string& exerciseType) const {
    std::vector<fs::path> files;
    const fs::path exercise_dir = dir_ / exerciseType;
    std::error_code ec;
    if (!fs::is_directory(exercise_dir, ec)) {
        return {};
    }

    for (const auto& entry : fs::directory_iterator(exercise_dir)) {
        const fs::path& path = entry.path();
        if (!entry.is_regular_file()) continue;
        if (path.extension() != EXAMPLE_EXTENSION) continue;
        if (path.filename().string().front() == '.') continue;
        files.push_back(path);
    }
    std::sort(files.begin(), files.end());

    std::vector<TrainingExample> examples;
    examples.reserve(files.size());
    for (const auto& file : files) {
        examples.push_back(readExample(file));
    }
    return examples;
}

TrainingDataStore::Statistics TrainingDataStore::statistics(const std::string& exerciseType) const {
    Statistics stats;
    std::vector<TrainingExample> examples = loadExamples(exerciseType);
    if (examples.empty()) {
        return stats;
    }

    std::vector<double> scores;
    scores.reserve(examples.size());
    for (const auto& example : examples) {
        scores.push_back(example.score);
    }

    stats.count = scores.size();
    stats.avgScore = seriesMean(scores);
    stats.minScore = *std::min_element(scores.begin(), scores.end());
    stats.maxScore = *std::max_element(scores.begin(), scores.end());
    stats.stdScore = seriesStdDev(scores);
    return stats;
}

// artifact_store.cpp
#include "artifact_store.hpp"
#include "form_errors.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <opencv2/core.hpp>

namespace fs = std::filesystem;

namespace {

// Exclusive flock on <root>/.generations/<type>.lock, held for one save.
// Serializes writers across stores and processes sharing a models directory.
class GenerationLock {
public:
    explicit GenerationLock(const fs::path& path) {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw FormScoringError("Could not open lock file " + path.string() + ": " +
                                   std::strerror(errno));
        }
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            int error = errno;
            ::close(fd_);
            throw FormScoringError("Could not lock " + path.string() + ": " + std::strerror(error));
        }
    }

    ~GenerationLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    GenerationLock(const GenerationLock&) = delete;
    GenerationLock& operator=(const GenerationLock&) = delete;

private:
    int fd_;
};

}  // namespace

double ScoringModel::predict(const Eigen::VectorXd& features) const {
    Eigen::MatrixXd row = scaler.transform(features).transpose();
    return regressor->predict(row)[0];
}

// ---------------------------------------------------------------------------
// ModelCache

std::shared_ptr<const ScoringModel> ModelCache::find(const std::string& exerciseType,
                                                     const std::string& generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(exerciseType);
    if (it == entries_.end() || it->second.generation != generation) {
        return nullptr;
    }
    return it->second.model;
}

void ModelCache::put(const std::string& exerciseType, const std::string& generation,
                     std::shared_ptr<const ScoringModel> model) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[exerciseType] = Entry{generation, std::move(model)};
}

void ModelCache::evict(const std::string& exerciseType) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(exerciseType);
}

size_t ModelCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ---------------------------------------------------------------------------
// ArtifactStore

ArtifactStore::ArtifactStore(fs::path root, std::shared_ptr<ModelCache> cache)
    : root_(std::move(root)), cache_(std::move(cache)) {
    if (!cache_) {
        cache_ = std::make_shared<ModelCache>();
    }
}

fs::path ArtifactStore::linkPath(const std::string& exerciseType) const {
    return root_ / exerciseType;
}

fs::path ArtifactStore::modelPath(const std::string& exerciseType) const {
    return linkPath(exerciseType) / MODEL_FILE;
}

fs::path ArtifactStore::scalerPath(const std::string& exerciseType) const {
    return linkPath(exerciseType) / SCALER_FILE;
}

bool ArtifactStore::exists(const std::string& exerciseType) const {
    std::error_code ec;
    return fs::exists(modelPath(exerciseType), ec) && fs::exists(scalerPath(exerciseType), ec);
}

fs::path ArtifactStore::currentGeneration(const std::string& exerciseType) const {
    std::error_code ec;
    fs::path link = linkPath(exerciseType);
    if (!fs::is_symlink(link, ec)) {
        return {};
    }

    fs::path target = fs::read_symlink(link, ec);
    if (ec) {
        return {};
    }
    if (target.is_relative()) {
        target = root_ / target;
    }
    return target.lexically_normal();
}

std::string ArtifactStore::newGenerationName(const std::string& exerciseType) const {
    static std::atomic<unsigned long> counter{0};

    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return exerciseType + "@" + std::to_string(micros) + "-" +
           std::to_string(::getpid()) + "-" + std::to_string(counter++);
}

std::mutex& ArtifactStore::writerLock(const std::string& exerciseType) {
    std::lock_guard<std::mutex> lock(writersMutex_);
    auto& writer = writers_[exerciseType];
    if (!writer) {
        writer = std::make_unique<std::mutex>();
    }
    return *writer;
}

std::shared_ptr<const ScoringModel> ArtifactStore::load(const std::string& exerciseType) const {
    fs::path generation = currentGeneration(exerciseType);
    std::error_code ec;
    if (generation.empty() || !fs::exists(generation / MODEL_FILE, ec) ||
        !fs::exists(generation / SCALER_FILE, ec)) {
        throw ArtifactError(ArtifactError::Kind::Unavailable,
                            "No trained model for " + exerciseType);
    }

    const std::string generation_name = generation.filename().string();
    if (auto cached = cache_->find(exerciseType, generation_name)) {
        return cached;
    }

    auto model = readGeneration(generation, exerciseType);
    cache_->put(exerciseType, generation_name, model);
    return model;
}

std::shared_ptr<const ScoringModel> ArtifactStore::readGeneration(const fs::path& dir,
                                                                  const std::string& exerciseType) const {
    auto model = std::make_shared<ScoringModel>();
    model->exerciseType = exerciseType;

    try {
        cv::FileStorage model_fs((dir / MODEL_FILE).string(), cv::FileStorage::READ);
        cv::FileStorage scaler_fs((dir / SCALER_FILE).string(), cv::FileStorage::READ);
        if (!model_fs.isOpened() || !scaler_fs.isOpened()) {
            throw ArtifactError(ArtifactError::Kind::Unavailable,
                                "Could not open model files in " + dir.string());
        }

        std::string stored_type = static_cast<std::string>(model_fs["exercise_type"]);
        if (stored_type != exerciseType) {
            throw ArtifactError(ArtifactError::Kind::Corrupt,
                                "Model in " + dir.string() + " belongs to '" + stored_type + "'");
        }

        ModelKind kind = parseModelKind(static_cast<std::string>(model_fs["model_kind"]));
        model->regressor = createRegressor(kind, RegressorParams());
        model->regressor->read(model_fs["regressor"]);
        model->scaler.read(scaler_fs["scaler"]);

        int feature_count = static_cast<int>(model_fs["feature_count"]);
        if (feature_count != model->scaler.dimension()) {
            throw ArtifactError(ArtifactError::Kind::Corrupt,
                                "Model expects " + std::to_string(feature_count) +
                                " features but its scaler has " +
                                std::to_string(model->scaler.dimension()));
        }
    } catch (const cv::Exception& e) {
        throw ArtifactError(ArtifactError::Kind::Corrupt,
                            "Could not parse model files in " + dir.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ArtifactError(ArtifactError::Kind::Corrupt, e.what());
    }
    return model;
}

void ArtifactStore::writeGeneration(const fs::path& dir, const ScoringModel& model) const {
    cv::FileStorage model_fs((dir / MODEL_FILE).string(), cv::FileStorage::WRITE);
    if (!model_fs.isOpened()) {
        throw std::runtime_error("cannot write " + (dir / MODEL_FILE).string());
    }
    model_fs << "exercise_type" << model.exerciseType;
    model_fs << "model_kind" << toString(model.regressor->kind());
    model_fs << "feature_count" << static_cast<int>(model.scaler.dimension());
    model_fs << "regressor" << "{";
    model.regressor->write(model_fs);
    model_fs << "}";
    model_fs.release();

    cv::FileStorage scaler_fs((dir / SCALER_FILE).string(), cv::FileStorage::WRITE);
    if (!scaler_fs.isOpened()) {
        throw std::runtime_error("cannot write " + (dir / SCALER_FILE).string());
    }
    scaler_fs << "exercise_type" << model.exerciseType;
    scaler_fs << "scaler" << "{";
    model.scaler.write(scaler_fs);
    scaler_fs << "}";
    scaler_fs.release();
}

void ArtifactStore::save(const std::string& exerciseType, std::shared_ptr<const ScoringModel> model) {
    if (!model || !model->regressor || !model->scaler.isFitted()) {
        throw std::invalid_argument("ArtifactStore::save needs a fitted model and scaler");
    }

    std::lock_guard<std::mutex> lock(writerLock(exerciseType));

    const fs::path generations_root = root_ / GENERATIONS_DIR;
    try {
        fs::create_directories(generations_root);
    } catch (const fs::filesystem_error& e) {
        throw FormScoringError("Could not save model for " + exerciseType + ": " + e.what());
    }
    GenerationLock file_lock(generations_root / (exerciseType + ".lock"));

    const fs::path previous = currentGeneration(exerciseType);
    const std::string generation_name = newGenerationName(exerciseType);
    const fs::path generation_dir = generations_root / generation_name;
    const fs::path staging_link = root_ / ("." + generation_name + ".link");

    try {
        fs::create_directories(generation_dir);
        writeGeneration(generation_dir, *model);

        // Swap the per-exercise link in one rename
        fs::create_directory_symlink(fs::path(GENERATIONS_DIR) / generation_name, staging_link);
        fs::rename(staging_link, linkPath(exerciseType));
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(staging_link, ec);
        fs::remove_all(generation_dir, ec);
        throw FormScoringError("Could not save model for " + exerciseType + ": " + e.what());
    }

    cache_->put(exerciseType, generation_name, model);
    pruneGenerations(exerciseType, generation_dir, previous);

    std::cout << "Model saved to " << modelPath(exerciseType).string() << std::endl;
}

void ArtifactStore::pruneGenerations(const std::string& exerciseType,
                                     const fs::path& keepCurrent,
                                     const fs::path& keepPrevious) const {
    // The previous generation stays one more cycle for readers that already resolved it
    const std::string prefix = exerciseType + "@";
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(root_ / GENERATIONS_DIR, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.compare(0, prefix.size(), prefix) != 0) continue;
        if (name == keepCurrent.filename().string() ||
            (!keepPrevious.empty() && name == keepPrevious.filename().string())) {
            continue;
        }

        std::error_code remove_ec;
        fs::remove_all(entry.path(), remove_ec);
        if (remove_ec) {
            std::cerr << "ArtifactStore: could not remove stale generation " << entry.path()
                      << ": " << remove_ec.message() << std::endl;
        }
    }
    if (ec) {
        std::cerr << "ArtifactStore: could not list generations: " << ec.message() << std::endl;
    }
}

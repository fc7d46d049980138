// main.cpp
// C++ Standard Library
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// built by me
#include "analyzer_config.hpp"
#include "feature_extractor.hpp"
#include "form_analysis_engine.hpp"
#include "form_errors.hpp"
#include "pose_io.hpp"
#include "training_data_store.hpp"

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--models DIR] [--data DIR] [--config FILE] [--quiet] <command>\n"
              << "\n"
              << "Commands:\n"
              << "  analyze <exercise> <pose-file>                 score a pose sequence (.json/.yml or MediaPipe .csv)\n"
              << "  train <exercise> [random_forest|gradient_boosting]\n"
              << "                                                 train from collected examples\n"
              << "  status <exercise>                              show whether a model is trained\n"
              << "  requirements <exercise>                        video capture guidance\n"
              << "  tips <exercise>                                form tips\n"
              << "  exercises                                      list supported exercises\n"
              << "  stats <exercise>                               training data statistics\n"
              << "  collect <exercise> <pose-file> <score> [feedback]\n"
              << "                                                 store a labeled example\n"
              << "  features <pose-file> <out.csv>                 write the feature vector\n";
}

// MediaPipe bulk exports are CSV, everything else goes through cv::FileStorage
PoseSequence loadPoses(const std::string& path) {
    if (std::filesystem::path(path).extension() == ".csv") {
        return readMediaPipeCsv(path);
    }
    return readPoseFile(path);
}

void requireArgs(const std::vector<std::string>& args, size_t count, const std::string& command) {
    if (args.size() < count) {
        throw std::invalid_argument("'" + command + "' needs " + std::to_string(count) + " argument(s)");
    }
}

void requireSupported(const FormAnalysisEngine& engine, const std::string& exerciseType) {
    if (!engine.isSupported(exerciseType)) {
        throw UnsupportedExerciseError(exerciseType);
    }
}

void printList(std::ostream& out, const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        out << "  - " << line << "\n";
    }
}

int runCommand(const std::string& command, const std::vector<std::string>& args,
               const AnalyzerConfig& config, std::ostream& out) {
    FormAnalysisEngine engine(config);

    if (command == "analyze") {
        requireArgs(args, 2, command);
        requireSupported(engine, args[0]);
        PoseSequence sequence = loadPoses(args[1]);
        AnalysisResult result = engine.analyze(args[0], sequence);

        out << std::fixed << std::setprecision(1)
            << "Score: " << result.score << "\n"
            << "Method: " << toString(result.method) << "\n"
            << "Feedback:\n";
        printList(out, result.feedback);
    } else if (command == "train") {
        requireArgs(args, 1, command);
        requireSupported(engine, args[0]);
        ModelKind kind = args.size() > 1 ? parseModelKind(args[1]) : ModelKind::RandomForest;

        TrainingDataStore data(config.trainingDataDir);
        std::vector<TrainingExample> examples = data.loadExamples(args[0]);
        ModelTrainer::TrainingReport report = engine.train(args[0], examples, kind);

        out << std::fixed << std::setprecision(4)
            << "Exercise: " << report.exerciseType << "\n"
            << "Model: " << toString(report.modelKind) << "\n"
            << "Training samples: " << report.trainingSamples << "\n"
            << "Test samples: " << report.testSamples << "\n"
            << "Train MSE: " << report.trainMse << "  RMSE: " << report.trainRmse
            << "  R2: " << report.trainR2 << "\n"
            << "Test MSE: " << report.testMse << "  RMSE: " << report.testRmse
            << "  R2: " << report.testR2 << "\n";
    } else if (command == "status") {
        requireArgs(args, 1, command);
        requireSupported(engine, args[0]);
        out << "Model for " << args[0] << ": "
            << (engine.modelExists(args[0]) ? "trained" : "not trained") << "\n";
    } else if (command == "requirements") {
        requireArgs(args, 1, command);
        out << "Video requirements for " << args[0] << ":\n";
        printList(out, engine.getVideoRequirements(args[0]));
    } else if (command == "tips") {
        requireArgs(args, 1, command);
        ExerciseAnalyzer::ExerciseInfo info = engine.exerciseInfo(args[0]);
        out << info.name << " (" << info.difficulty << ")\n"
            << info.description << "\n";
        printList(out, info.tips);
    } else if (command == "exercises") {
        for (const auto& id : engine.supportedExercises()) {
            ExerciseAnalyzer::ExerciseInfo info = engine.exerciseInfo(id);
            out << std::left << std::setw(10) << id << " " << info.name
                << " [" << info.difficulty << "] " << info.description << "\n";
        }
    } else if (command == "stats") {
        requireArgs(args, 1, command);
        requireSupported(engine, args[0]);
        TrainingDataStore data(config.trainingDataDir);
        TrainingDataStore::Statistics stats = data.statistics(args[0]);
        out << std::fixed << std::setprecision(2)
            << "Examples: " << stats.count << "\n"
            << "Average score: " << stats.avgScore << "\n"
            << "Min score: " << stats.minScore << "\n"
            << "Max score: " << stats.maxScore << "\n"
            << "Std dev: " << stats.stdScore << "\n";
    } else if (command == "collect") {
        requireArgs(args, 3, command);
        requireSupported(engine, args[0]);
        PoseSequence sequence = loadPoses(args[1]);
        double score = std::stod(args[2]);
        std::optional<std::string> feedback;
        if (args.size() > 3) feedback = args[3];

        TrainingDataStore data(config.trainingDataDir);
        std::string id = data.saveExample(args[0], sequence, score, feedback,
                                          {{"source", args[1]}});
        out << id << "\n";
    } else if (command == "features") {
        requireArgs(args, 2, command);
        PoseSequence sequence = loadPoses(args[0]);
        FeatureExtractor extractor;
        writeFeatureCsv(args[1], {std::filesystem::path(args[0]).stem().string()},
                        {extractor.extract(sequence)});
    } else {
        throw std::invalid_argument("Unknown command: " + command);
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string models_dir;
    std::string data_dir;
    std::string config_path;
    bool quiet = false;

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--models" || arg == "--data" || arg == "--config") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--models") models_dir = value;
            else if (arg == "--data") data_dir = value;
            else config_path = value;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        } else {
            break;
        }
    }

    if (i >= argc) {
        printUsage(argv[0]);
        return 1;
    }
    std::string command = argv[i++];
    std::vector<std::string> args(argv + i, argv + argc);

    // Results always reach stdout; --quiet only silences progress lines
    std::ostream out(std::cout.rdbuf());
    if (quiet) {
        std::cout.rdbuf(nullptr);
    }

    int status = 1;
    try {
        AnalyzerConfig config = config_path.empty() ? AnalyzerConfig() : AnalyzerConfig::load(config_path);
        if (!models_dir.empty()) config.modelsDir = models_dir;
        if (!data_dir.empty()) config.trainingDataDir = data_dir;

        status = runCommand(command, args, config, out);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }

    out.flush();
    if (quiet) {
        std::cout.rdbuf(out.rdbuf());
    }
    return status;
}

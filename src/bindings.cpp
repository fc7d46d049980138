#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "analyzer_config.hpp"
#include "form_analysis_engine.hpp"
#include "form_errors.hpp"
#include "geometry.hpp"

namespace py = pybind11;

namespace {

Eigen::Vector3d toLandmark(const py::handle& value) {
    Eigen::Vector3d point = Eigen::Vector3d::Zero();
    if (py::isinstance<py::dict>(value)) {
        py::dict coords = py::reinterpret_borrow<py::dict>(value);
        point[0] = coords["x"].cast<double>();
        point[1] = coords["y"].cast<double>();
        if (coords.contains("z")) point[2] = coords["z"].cast<double>();
        return point;
    }

    std::vector<double> values = value.cast<std::vector<double>>();
    if (values.size() < 2) {
        throw PoseDataError("Landmark needs at least x and y");
    }
    for (size_t axis = 0; axis < 3 && axis < values.size(); ++axis) {
        point[axis] = values[axis];
    }
    return point;
}

// Frame dicts as produced by the web backend's pose analyzer
PoseSequence toPoseSequence(const py::list& pose_data) {
    PoseSequence sequence;
    for (const auto& item : pose_data) {
        py::dict frame_dict = item.cast<py::dict>();
        PoseFrame frame;

        if (frame_dict.contains("landmarks")) {
            for (const auto& landmark : frame_dict["landmarks"]) {
                frame.landmarks.push_back(toLandmark(landmark));
            }
        }
        if (frame_dict.contains("landmark_map")) {
            frame.landmarkMap = frame_dict["landmark_map"].cast<LandmarkMap>();
        }
        if (frame_dict.contains("angles")) {
            frame.angles = frame_dict["angles"].cast<std::map<std::string, double>>();
        }
        if (frame.angles.empty() && !frame.landmarks.empty()) {
            frame.angles = computeJointAngles(frame.landmarks, frame.landmarkMap.empty()
                                                                   ? defaultLandmarkMap()
                                                                   : frame.landmarkMap);
        }
        sequence.push_back(std::move(frame));
    }
    return sequence;
}

py::dict toDict(const AnalysisResult& result) {
    py::dict out;
    out["score"] = result.score;
    out["feedback"] = result.feedback;
    out["method"] = toString(result.method);
    return out;
}

py::dict toDict(const ModelTrainer::TrainingReport& report) {
    py::dict out;
    out["exercise_type"] = report.exerciseType;
    out["model_type"] = toString(report.modelKind);
    out["training_samples"] = report.trainingSamples;
    out["test_samples"] = report.testSamples;
    out["train_mse"] = report.trainMse;
    out["test_mse"] = report.testMse;
    out["train_rmse"] = report.trainRmse;
    out["test_rmse"] = report.testRmse;
    out["train_r2"] = report.trainR2;
    out["test_r2"] = report.testR2;
    return out;
}

std::unique_ptr<FormAnalysisEngine> createEngine(const std::string& models_dir,
                                                 const std::string& config_path) {
    AnalyzerConfig config = config_path.empty() ? AnalyzerConfig() : AnalyzerConfig::load(config_path);
    config.modelsDir = models_dir;
    return std::make_unique<FormAnalysisEngine>(config);
}

}  // namespace

PYBIND11_MODULE(form_scoring_python, m) {
    m.doc() = "Exercise form scoring engine";

    // Translators registered later are tried first, so the base goes first
    auto& form_error = py::register_exception<FormScoringError>(m, "FormScoringError");
    py::register_exception<UnsupportedExerciseError>(m, "UnsupportedExerciseError", form_error.ptr());
    py::register_exception<InsufficientDataError>(m, "InsufficientDataError", form_error.ptr());
    py::register_exception<InvalidExampleError>(m, "InvalidExampleError", form_error.ptr());
    py::register_exception<TrainingFailedError>(m, "TrainingFailedError", form_error.ptr());
    py::register_exception<PoseDataError>(m, "PoseDataError", form_error.ptr());

    py::class_<FormAnalysisEngine>(m, "FormAnalysisEngine")
        .def(py::init(&createEngine), py::arg("models_dir"), py::arg("config_path") = "")
        .def("analyze", [](const FormAnalysisEngine& self, const std::string& exercise,
                           const py::list& pose_data) {
            PoseSequence sequence = toPoseSequence(pose_data);
            AnalysisResult result;
            {
                py::gil_scoped_release release;
                result = self.analyze(exercise, sequence);
            }
            return toDict(result);
        }, py::arg("exercise"), py::arg("pose_data"))
        .def("train", [](FormAnalysisEngine& self, const std::string& exercise,
                         const py::list& pose_sequences, const std::vector<double>& scores,
                         const std::string& model_type) {
            if (pose_sequences.size() != scores.size()) {
                throw InvalidExampleError("Got " + std::to_string(pose_sequences.size()) +
                                          " pose sequences but " + std::to_string(scores.size()) +
                                          " scores");
            }
            std::vector<std::pair<PoseSequence, double>> examples;
            for (size_t i = 0; i < scores.size(); ++i) {
                examples.emplace_back(toPoseSequence(pose_sequences[i].cast<py::list>()), scores[i]);
            }
            ModelKind kind = parseModelKind(model_type);

            ModelTrainer::TrainingReport report;
            {
                py::gil_scoped_release release;
                report = self.train(exercise, examples, kind);
            }
            return toDict(report);
        }, py::arg("exercise"), py::arg("pose_sequences"), py::arg("scores"),
           py::arg("model_type") = "random_forest")
        .def("model_exists", &FormAnalysisEngine::modelExists, py::arg("exercise"))
        .def("get_video_requirements", &FormAnalysisEngine::getVideoRequirements, py::arg("exercise"))
        .def("supported_exercises", &FormAnalysisEngine::supportedExercises)
        .def("set_use_model", &FormAnalysisEngine::setUseModel, py::arg("use_model"));
}

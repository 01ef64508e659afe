#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "engine/engine.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Scratch directory holding one model file and one model directory.
struct ModelDir {
    fs::path root;
    fs::path file;
    fs::path dir;

    ModelDir() {
        root = fs::temp_directory_path() / ("speech_test_models_" + std::to_string(::getpid()));
        fs::create_directories(root);
        file = root / "ggml-tiny.bin";
        std::ofstream(file) << "not really a model";
        dir = root / "parakeet";
        fs::create_directories(dir);
    }

    ~ModelDir() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
};

} // namespace

TEST_CASE("Engine kinds", "[engine]") {
    REQUIRE(parse_engine_kind("whisper") == EngineKind::Whisper);
    REQUIRE(parse_engine_kind("parakeet") == EngineKind::Parakeet);
    REQUIRE(parse_engine_kind("remote") == EngineKind::Remote);
    REQUIRE_FALSE(parse_engine_kind("Whisper").has_value());
    REQUIRE_FALSE(parse_engine_kind("").has_value());

    REQUIRE(to_string(EngineKind::Whisper) == "whisper");
    REQUIRE(to_string(EngineKind::Parakeet) == "parakeet");
    REQUIRE(to_string(EngineKind::Remote) == "remote");
}

TEST_CASE("check_model_path", "[engine]") {
    ModelDir models;

    SECTION("WhisperWantsFile") {
        REQUIRE(check_model_path(EngineKind::Whisper, models.file.string()).has_value());

        auto err = check_model_path(EngineKind::Whisper, models.dir.string());
        REQUIRE_FALSE(err.has_value());
        REQUIRE(err.error().reason == LoadError::Reason::WrongArtifactShape);
        REQUIRE(err.error().message == "Whisper model path must be a file");
    }

    SECTION("ParakeetWantsDirectory") {
        REQUIRE(check_model_path(EngineKind::Parakeet, models.dir.string()).has_value());

        auto err = check_model_path(EngineKind::Parakeet, models.file.string());
        REQUIRE_FALSE(err.has_value());
        REQUIRE(err.error().reason == LoadError::Reason::WrongArtifactShape);
        REQUIRE(err.error().message == "Parakeet model path must be a directory");
    }

    SECTION("MissingPath") {
        auto missing = (models.root / "nope.bin").string();
        for (auto kind : {EngineKind::Whisper, EngineKind::Parakeet}) {
            auto err = check_model_path(kind, missing);
            REQUIRE_FALSE(err.has_value());
            REQUIRE(err.error().reason == LoadError::Reason::PathNotFound);
            REQUIRE(err.error().message == "Model path not found: " + missing);
        }
    }

    SECTION("RemoteWantsUrl") {
        REQUIRE(check_model_path(EngineKind::Remote, "http://10.0.0.5:8080").has_value());
        REQUIRE(check_model_path(EngineKind::Remote, "https://asr.example.net").has_value());

        auto err = check_model_path(EngineKind::Remote, models.file.string());
        REQUIRE_FALSE(err.has_value());
        REQUIRE(err.error().reason == LoadError::Reason::WrongArtifactShape);
    }
}

TEST_CASE("load_engine rejects bad paths before loading", "[engine]") {
    Config cfg;
    cfg.engine.model_path = "/nonexistent/speech-server/model.bin";

    auto engine = load_engine(EngineKind::Whisper, cfg);
    REQUIRE_FALSE(engine.has_value());
    REQUIRE(engine.error().reason == LoadError::Reason::PathNotFound);
}

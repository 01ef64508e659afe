#include "engine/engine.hpp"

#include "config.hpp"
#include "engine/parakeet_engine.hpp"
#include "engine/remote_engine.hpp"
#include "engine/whisper_engine.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

std::optional<EngineKind> parse_engine_kind(std::string_view name) {
    if (name == "whisper") return EngineKind::Whisper;
    if (name == "parakeet") return EngineKind::Parakeet;
    if (name == "remote") return EngineKind::Remote;
    return std::nullopt;
}

std::string_view to_string(EngineKind kind) {
    switch (kind) {
        case EngineKind::Whisper: return "whisper";
        case EngineKind::Parakeet: return "parakeet";
        case EngineKind::Remote: return "remote";
    }
    return "unknown";
}

std::expected<void, LoadError> check_model_path(EngineKind kind, const std::string& model_path) {
    if (kind == EngineKind::Remote) {
        if (model_path.starts_with("http://") || model_path.starts_with("https://")) {
            return {};
        }
        return std::unexpected(LoadError{LoadError::Reason::WrongArtifactShape,
                                         "Remote engine expects an http(s) URL: " + model_path});
    }

    std::error_code ec;
    auto status = fs::status(model_path, ec);
    if (ec || !fs::exists(status)) {
        return std::unexpected(LoadError{LoadError::Reason::PathNotFound,
                                         "Model path not found: " + model_path});
    }

    if (kind == EngineKind::Whisper && !fs::is_regular_file(status)) {
        return std::unexpected(LoadError{LoadError::Reason::WrongArtifactShape,
                                         "Whisper model path must be a file"});
    }
    if (kind == EngineKind::Parakeet && !fs::is_directory(status)) {
        return std::unexpected(LoadError{LoadError::Reason::WrongArtifactShape,
                                         "Parakeet model path must be a directory"});
    }
    return {};
}

std::expected<std::unique_ptr<TranscriptionEngine>, LoadError>
load_engine(EngineKind kind, const Config& config) {
    const auto& path = config.engine.model_path;
    if (auto ok = check_model_path(kind, path); !ok) {
        return std::unexpected(ok.error());
    }

    auto engine_failure = [](std::string msg) {
        return std::unexpected(LoadError{LoadError::Reason::EngineFailure, std::move(msg)});
    };

    switch (kind) {
        case EngineKind::Whisper: {
            auto engine = WhisperEngine::load(path, config.engine);
            if (!engine) return engine_failure("Failed to load whisper model: " + engine.error());
            return std::unique_ptr<TranscriptionEngine>(std::move(*engine));
        }
        case EngineKind::Parakeet: {
            auto engine = ParakeetEngine::load(path, config.engine);
            if (!engine) return engine_failure("Failed to load parakeet model: " + engine.error());
            return std::unique_ptr<TranscriptionEngine>(std::move(*engine));
        }
        case EngineKind::Remote:
            return std::unique_ptr<TranscriptionEngine>(
                std::make_unique<RemoteEngine>(path, config.engine.api_format,
                                               config.engine.language));
    }
    return engine_failure("unsupported engine kind");
}

#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

struct Config;

enum class EngineKind { Whisper, Parakeet, Remote };

std::optional<EngineKind> parse_engine_kind(std::string_view name);
std::string_view to_string(EngineKind kind);

// A loaded speech model. Not thread-safe: exactly one thread may call
// transcribe() at a time.
class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;
    virtual EngineKind kind() const = 0;
    virtual std::expected<std::string, std::string>
        transcribe(std::span<const float> samples) = 0;
};

struct LoadError {
    enum class Reason { PathNotFound, WrongArtifactShape, EngineFailure };
    Reason reason;
    std::string message;
};

// Checks that model_path has the shape the engine expects (file for whisper,
// directory for parakeet, http(s) URL for remote) without loading anything.
std::expected<void, LoadError> check_model_path(EngineKind kind, const std::string& model_path);

std::expected<std::unique_ptr<TranscriptionEngine>, LoadError>
    load_engine(EngineKind kind, const Config& config);

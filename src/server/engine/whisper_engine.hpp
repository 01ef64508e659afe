#pragma once

#include "config.hpp"
#include "engine/engine.hpp"

#include <memory>
#include <string>

struct whisper_context;

// Routes whisper.cpp / ggml log output through logging::. Call once at startup.
void install_whisper_log_forwarding();

class WhisperEngine : public TranscriptionEngine {
public:
    static std::expected<std::unique_ptr<WhisperEngine>, std::string>
        load(const std::string& model_path, const Config::Engine& options);

    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    EngineKind kind() const override { return EngineKind::Whisper; }

    std::expected<std::string, std::string>
        transcribe(std::span<const float> samples) override;

private:
    WhisperEngine(whisper_context* ctx, const Config::Engine& options);

    whisper_context* ctx_ = nullptr;
    std::string language_;
    int threads_;
};

#pragma once

#include "engine/engine.hpp"

#include <string>

// Forwards audio to another transcription server as a WAV upload.
class RemoteEngine : public TranscriptionEngine {
public:
    // api_format: "whisper.cpp" (POST /inference) or "openai"
    // (POST /v1/audio/transcriptions)
    RemoteEngine(std::string url, std::string api_format = "whisper.cpp",
                 std::string language = "auto");
    ~RemoteEngine() override;

    RemoteEngine(const RemoteEngine&) = delete;
    RemoteEngine& operator=(const RemoteEngine&) = delete;

    EngineKind kind() const override { return EngineKind::Remote; }

    std::expected<std::string, std::string>
        transcribe(std::span<const float> samples) override;

private:
    std::string url_;
    std::string api_format_;
    std::string language_;
};

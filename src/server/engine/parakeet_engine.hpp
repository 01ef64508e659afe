#pragma once

#include "config.hpp"
#include "engine/engine.hpp"
#include "engine/parakeet_vocab.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <onnxruntime_cxx_api.h>
#include <string>
#include <vector>

// NeMo Parakeet TDT model exported to ONNX. The model directory contains:
//   nemo128.onnx                         waveform -> 128-bin log-mel features
//   encoder-model[.int8].onnx            features -> encoder frames
//   decoder_joint-model[.int8].onnx      prediction + joint network, one step
//   vocab.txt                            SentencePiece pieces
class ParakeetEngine : public TranscriptionEngine {
public:
    static std::expected<std::unique_ptr<ParakeetEngine>, std::string>
        load(const std::string& model_dir, const Config::Engine& options);

    ParakeetEngine(const ParakeetEngine&) = delete;
    ParakeetEngine& operator=(const ParakeetEngine&) = delete;

    EngineKind kind() const override { return EngineKind::Parakeet; }

    std::expected<std::string, std::string>
        transcribe(std::span<const float> samples) override;

private:
    ParakeetEngine(ParakeetVocab vocab, int threads);

    struct Features {
        std::vector<float> data;    // [1, n_mels, frames]
        std::array<int64_t, 3> shape{};
        int64_t length = 0;
    };
    struct Encoded {
        std::vector<float> data;    // [1, dim, frames]
        int64_t dim = 0;
        int64_t frames = 0;         // frames in the tensor
        int64_t length = 0;         // valid frames
    };
    struct DecoderState {
        std::vector<float> s1;
        std::vector<float> s2;
    };

    std::expected<void, std::string> open_sessions(const std::string& model_dir, bool quantized);

    Features preprocess(std::span<const float> samples);
    Encoded encode(const Features& features);
    std::vector<float> decode_step(const std::vector<float>& frame, int32_t last_token,
                                   const DecoderState& state, DecoderState& next);
    DecoderState initial_state() const;

    Ort::Env env_;
    Ort::SessionOptions session_options_;
    Ort::MemoryInfo memory_info_;
    std::unique_ptr<Ort::Session> preprocessor_;
    std::unique_ptr<Ort::Session> encoder_;
    std::unique_ptr<Ort::Session> decoder_joint_;

    ParakeetVocab vocab_;
    std::array<int64_t, 3> state1_shape_{2, 1, 640};
    std::array<int64_t, 3> state2_shape_{2, 1, 640};
};

#include "engine/parakeet_engine.hpp"

#include "engine/tdt_decoder.hpp"
#include "logging.hpp"

#include <algorithm>
#include <filesystem>
#include <functional>
#include <numeric>
#include <string_view>

namespace fs = std::filesystem;

namespace {

constexpr const char* preprocessor_file = "nemo128.onnx";
constexpr const char* vocab_file = "vocab.txt";

// Picks "<stem>.int8.onnx" when quantized weights are wanted and present,
// otherwise "<stem>.onnx".
std::expected<std::string, std::string> pick_model_file(const fs::path& dir,
                                                        const std::string& stem,
                                                        bool quantized) {
    auto int8 = dir / (stem + ".int8.onnx");
    auto fp32 = dir / (stem + ".onnx");
    if (quantized && fs::exists(int8)) return int8.string();
    if (fs::exists(fp32)) return fp32.string();
    if (fs::exists(int8)) return int8.string();
    return std::unexpected("missing " + fp32.filename().string() + " in " + dir.string());
}

int64_t read_length(const Ort::Value& value) {
    auto info = value.GetTensorTypeAndShapeInfo();
    if (info.GetElementType() == ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32) {
        return value.GetTensorData<int32_t>()[0];
    }
    return value.GetTensorData<int64_t>()[0];
}

std::array<int64_t, 3> input_shape(Ort::Session& session, const char* name,
                                   std::array<int64_t, 3> fallback) {
    Ort::AllocatorWithDefaultOptions allocator;
    for (size_t i = 0; i < session.GetInputCount(); ++i) {
        auto input_name = session.GetInputNameAllocated(i, allocator);
        if (std::string_view(input_name.get()) != name) continue;

        auto shape = session.GetInputTypeInfo(i).GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() != 3) return fallback;
        std::array<int64_t, 3> out{};
        for (size_t d = 0; d < 3; ++d) {
            out[d] = shape[d] > 0 ? shape[d] : 1; // dynamic batch
        }
        return out;
    }
    return fallback;
}

size_t element_count(const std::array<int64_t, 3>& shape) {
    return static_cast<size_t>(std::accumulate(shape.begin(), shape.end(), int64_t{1},
                                               std::multiplies<>()));
}

} // namespace

ParakeetEngine::ParakeetEngine(ParakeetVocab vocab, int threads)
    : env_(ORT_LOGGING_LEVEL_WARNING, "speech-server"),
      memory_info_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)),
      vocab_(std::move(vocab)) {
    session_options_.SetIntraOpNumThreads(threads);
    session_options_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
}

std::expected<std::unique_ptr<ParakeetEngine>, std::string>
ParakeetEngine::load(const std::string& model_dir, const Config::Engine& options) {
    auto vocab = ParakeetVocab::load((fs::path(model_dir) / vocab_file).string());
    if (!vocab) {
        return std::unexpected("vocab: " + vocab.error());
    }

    std::unique_ptr<ParakeetEngine> engine(new ParakeetEngine(std::move(*vocab), options.threads));
    if (auto opened = engine->open_sessions(model_dir, options.quantized); !opened) {
        return std::unexpected(opened.error());
    }
    return engine;
}

std::expected<void, std::string> ParakeetEngine::open_sessions(const std::string& model_dir,
                                                               bool quantized) {
    fs::path dir(model_dir);
    auto preprocessor_path = dir / preprocessor_file;
    if (!fs::exists(preprocessor_path)) {
        return std::unexpected("missing " + std::string(preprocessor_file) + " in " + model_dir);
    }
    auto encoder_path = pick_model_file(dir, "encoder-model", quantized);
    if (!encoder_path) return std::unexpected(encoder_path.error());
    auto decoder_path = pick_model_file(dir, "decoder_joint-model", quantized);
    if (!decoder_path) return std::unexpected(decoder_path.error());

    try {
        preprocessor_ = std::make_unique<Ort::Session>(env_, preprocessor_path.c_str(), session_options_);
        encoder_ = std::make_unique<Ort::Session>(env_, encoder_path->c_str(), session_options_);
        decoder_joint_ = std::make_unique<Ort::Session>(env_, decoder_path->c_str(), session_options_);
    } catch (const Ort::Exception& e) {
        return std::unexpected(std::string("onnxruntime: ") + e.what());
    }

    state1_shape_ = input_shape(*decoder_joint_, "input_states_1", state1_shape_);
    state2_shape_ = input_shape(*decoder_joint_, "input_states_2", state2_shape_);

    logging::debug("parakeet: encoder {}, decoder {}, vocab {} tokens (blank {})",
                   *encoder_path, *decoder_path, vocab_.size(), vocab_.blank_id());
    return {};
}

ParakeetEngine::Features ParakeetEngine::preprocess(std::span<const float> samples) {
    std::vector<float> waveform(samples.begin(), samples.end());
    std::array<int64_t, 2> waveform_shape{1, static_cast<int64_t>(waveform.size())};
    std::array<int64_t, 1> lens{static_cast<int64_t>(waveform.size())};
    std::array<int64_t, 1> lens_shape{1};

    std::vector<Ort::Value> inputs;
    inputs.push_back(Ort::Value::CreateTensor<float>(memory_info_, waveform.data(), waveform.size(),
                                                     waveform_shape.data(), waveform_shape.size()));
    inputs.push_back(Ort::Value::CreateTensor<int64_t>(memory_info_, lens.data(), lens.size(),
                                                       lens_shape.data(), lens_shape.size()));

    const char* input_names[] = {"waveforms", "waveforms_lens"};
    const char* output_names[] = {"features", "features_lens"};
    auto outputs = preprocessor_->Run(Ort::RunOptions{nullptr}, input_names, inputs.data(),
                                      inputs.size(), output_names, 2);

    auto info = outputs[0].GetTensorTypeAndShapeInfo();
    auto shape = info.GetShape();
    const float* data = outputs[0].GetTensorData<float>();

    Features features;
    features.data.assign(data, data + info.GetElementCount());
    for (size_t d = 0; d < 3 && d < shape.size(); ++d) features.shape[d] = shape[d];
    features.length = read_length(outputs[1]);
    return features;
}

ParakeetEngine::Encoded ParakeetEngine::encode(const Features& features) {
    std::vector<float> signal = features.data;
    std::array<int64_t, 1> length{features.length};
    std::array<int64_t, 1> length_shape{1};

    std::vector<Ort::Value> inputs;
    inputs.push_back(Ort::Value::CreateTensor<float>(memory_info_, signal.data(), signal.size(),
                                                     features.shape.data(), features.shape.size()));
    inputs.push_back(Ort::Value::CreateTensor<int64_t>(memory_info_, length.data(), length.size(),
                                                       length_shape.data(), length_shape.size()));

    const char* input_names[] = {"audio_signal", "length"};
    const char* output_names[] = {"outputs", "encoded_lengths"};
    auto outputs = encoder_->Run(Ort::RunOptions{nullptr}, input_names, inputs.data(),
                                 inputs.size(), output_names, 2);

    auto info = outputs[0].GetTensorTypeAndShapeInfo();
    auto shape = info.GetShape();
    const float* data = outputs[0].GetTensorData<float>();

    Encoded encoded;
    encoded.data.assign(data, data + info.GetElementCount());
    encoded.dim = shape.size() == 3 ? shape[1] : 0;
    encoded.frames = shape.size() == 3 ? shape[2] : 0;
    encoded.length = std::min(read_length(outputs[1]), encoded.frames);
    return encoded;
}

ParakeetEngine::DecoderState ParakeetEngine::initial_state() const {
    return DecoderState{
        .s1 = std::vector<float>(element_count(state1_shape_), 0.0f),
        .s2 = std::vector<float>(element_count(state2_shape_), 0.0f),
    };
}

std::vector<float> ParakeetEngine::decode_step(const std::vector<float>& frame, int32_t last_token,
                                               const DecoderState& state, DecoderState& next) {
    std::vector<float> enc = frame;
    std::array<int64_t, 3> enc_shape{1, static_cast<int64_t>(enc.size()), 1};
    std::array<int32_t, 1> targets{last_token};
    std::array<int64_t, 2> targets_shape{1, 1};
    std::array<int32_t, 1> target_length{1};
    std::array<int64_t, 1> target_length_shape{1};
    std::vector<float> s1 = state.s1;
    std::vector<float> s2 = state.s2;

    std::vector<Ort::Value> inputs;
    inputs.push_back(Ort::Value::CreateTensor<float>(memory_info_, enc.data(), enc.size(),
                                                     enc_shape.data(), enc_shape.size()));
    inputs.push_back(Ort::Value::CreateTensor<int32_t>(memory_info_, targets.data(), targets.size(),
                                                       targets_shape.data(), targets_shape.size()));
    inputs.push_back(Ort::Value::CreateTensor<int32_t>(memory_info_, target_length.data(),
                                                       target_length.size(),
                                                       target_length_shape.data(),
                                                       target_length_shape.size()));
    inputs.push_back(Ort::Value::CreateTensor<float>(memory_info_, s1.data(), s1.size(),
                                                     state1_shape_.data(), state1_shape_.size()));
    inputs.push_back(Ort::Value::CreateTensor<float>(memory_info_, s2.data(), s2.size(),
                                                     state2_shape_.data(), state2_shape_.size()));

    const char* input_names[] = {"encoder_outputs", "targets", "target_length",
                                 "input_states_1", "input_states_2"};
    const char* output_names[] = {"outputs", "output_states_1", "output_states_2"};
    auto outputs = decoder_joint_->Run(Ort::RunOptions{nullptr}, input_names, inputs.data(),
                                       inputs.size(), output_names, 3);

    auto copy_out = [](const Ort::Value& v) {
        const float* p = v.GetTensorData<float>();
        return std::vector<float>(p, p + v.GetTensorTypeAndShapeInfo().GetElementCount());
    };
    next.s1 = copy_out(outputs[1]);
    next.s2 = copy_out(outputs[2]);
    return copy_out(outputs[0]);
}

std::expected<std::string, std::string>
ParakeetEngine::transcribe(std::span<const float> samples) {
    if (samples.empty()) {
        return std::unexpected("empty audio");
    }

    try {
        auto features = preprocess(samples);
        auto encoded = encode(features);
        if (encoded.dim <= 0) {
            return std::unexpected("encoder produced no output");
        }

        auto state = initial_state();
        DecoderState candidate;
        std::vector<float> frame(static_cast<size_t>(encoded.dim));
        size_t cached_frame = static_cast<size_t>(-1);

        auto step = [&](size_t t, int32_t last) -> std::expected<std::vector<float>, std::string> {
            if (t != cached_frame) {
                // Encoder output is [1, dim, frames]; gather column t.
                for (int64_t d = 0; d < encoded.dim; ++d) {
                    frame[static_cast<size_t>(d)] =
                        encoded.data[static_cast<size_t>(d * encoded.frames) + t];
                }
                cached_frame = t;
            }
            return decode_step(frame, last, state, candidate);
        };
        auto commit = [&] { state = std::move(candidate); };

        auto tokens = tdt::greedy_decode(static_cast<size_t>(encoded.length), vocab_.size(),
                                         vocab_.blank_id(), step, commit);
        if (!tokens) {
            return std::unexpected("Parakeet transcription failed: " + tokens.error());
        }
        return vocab_.detokenize(*tokens);
    } catch (const Ort::Exception& e) {
        return std::unexpected(std::string("Parakeet transcription failed: ") + e.what());
    }
}

#include "engine/whisper_engine.hpp"

#include "logging.hpp"

#include <string_view>
#include <whisper.h>

namespace {

void forward_whisper_log(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text) return;
    std::string_view msg(text);
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
        msg.remove_suffix(1);
    }
    if (msg.empty()) return;

    switch (level) {
        case GGML_LOG_LEVEL_ERROR:
            logging::error("whisper: {}", msg);
            break;
        case GGML_LOG_LEVEL_WARN:
            logging::warn("whisper: {}", msg);
            break;
        default:
            logging::debug("whisper: {}", msg);
            break;
    }
}

struct StateDeleter {
    void operator()(whisper_state* state) const noexcept { whisper_free_state(state); }
};

std::string trim(std::string s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

} // namespace

void install_whisper_log_forwarding() {
    whisper_log_set(forward_whisper_log, nullptr);
}

std::expected<std::unique_ptr<WhisperEngine>, std::string>
WhisperEngine::load(const std::string& model_path, const Config::Engine& options) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = options.use_gpu;

    whisper_context* ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx) {
        return std::unexpected("whisper_init_from_file_with_params failed: " + model_path);
    }
    return std::unique_ptr<WhisperEngine>(new WhisperEngine(ctx, options));
}

WhisperEngine::WhisperEngine(whisper_context* ctx, const Config::Engine& options)
    : ctx_(ctx), language_(options.language), threads_(options.threads) {}

WhisperEngine::~WhisperEngine() {
    if (ctx_) whisper_free(ctx_);
}

std::expected<std::string, std::string>
WhisperEngine::transcribe(std::span<const float> samples) {
    // Fresh decoder state per request; the context (weights) is shared.
    std::unique_ptr<whisper_state, StateDeleter> state(whisper_init_state(ctx_));
    if (!state) {
        return std::unexpected("Failed to create state");
    }

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = threads_;
    params.language = language_.empty() ? "auto" : language_.c_str();
    params.translate = false;
    params.print_special = false;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;

    int rc = whisper_full_with_state(ctx_, state.get(), params, samples.data(),
                                     static_cast<int>(samples.size()));
    if (rc != 0) {
        return std::unexpected("Whisper transcription failed: whisper_full returned " +
                               std::to_string(rc));
    }

    std::string text;
    int n_segments = whisper_full_n_segments_from_state(state.get());
    for (int i = 0; i < n_segments; ++i) {
        const char* segment = whisper_full_get_segment_text_from_state(state.get(), i);
        if (!segment) {
            return std::unexpected("Failed to get segment " + std::to_string(i));
        }
        text += segment;
        text += ' ';
    }

    return trim(std::move(text));
}

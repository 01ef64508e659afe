#include "engine/remote_engine.hpp"

#include "audio/pcm.hpp"
#include "audio/wav_encoder.hpp"
#include "logging.hpp"

#include <chrono>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static void add_field(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

RemoteEngine::RemoteEngine(std::string url, std::string api_format, std::string language)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      language_(std::move(language)) {
    while (!url_.empty() && url_.back() == '/') url_.pop_back();
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

RemoteEngine::~RemoteEngine() {
    curl_global_cleanup();
}

std::expected<std::string, std::string>
RemoteEngine::transcribe(std::span<const float> samples) {
    if (samples.empty()) {
        return std::unexpected("empty audio");
    }

    auto wav_data = wav::encode(samples, pcm::sample_rate_hz);
    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);

    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";
        add_field(mime, "model", "whisper-1");
        add_field(mime, "response_format", "json");
        if (!language_.empty() && language_ != "auto") {
            add_field(mime, "language", language_);
        }
    } else {
        endpoint = url_ + "/inference";
        add_field(mime, "temperature", "0.0");
        add_field(mime, "response_format", "json");
        if (!language_.empty()) {
            add_field(mime, "language", language_);
        }
    }

    std::string response_body;
    long http_status = 0;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 120L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    logging::debug("remote: {} answered {} in {:.2f}s", endpoint, http_status, elapsed);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    try {
        auto j = json::parse(response_body);
        if (j.contains("error")) {
            const auto& err = j["error"];
            // OpenAI nests the message: {"error": {"message": ...}}
            if (err.is_object() && err.contains("message")) {
                return std::unexpected("server error: " + err["message"].get<std::string>());
            }
            return std::unexpected("server error: " + err.dump());
        }
        if (!j.contains("text")) {
            return std::unexpected("unexpected response: " + response_body);
        }

        auto text = j["text"].get<std::string>();
        auto start_pos = text.find_first_not_of(" \t\n\r");
        if (start_pos == std::string::npos) return std::string{};
        auto end_pos = text.find_last_not_of(" \t\n\r");
        return text.substr(start_pos, end_pos - start_pos + 1);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what() +
                               " (HTTP " + std::to_string(http_status) + ")");
    }
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

struct BindAddress {
    std::string host;
    int port = 0;
};

// Parses "host:port". The port must be in 1..65535.
std::expected<BindAddress, std::string> parse_bind_address(std::string_view bind);

struct Config {
    struct Engine {
        std::string kind = "whisper";   // "whisper", "parakeet" or "remote"
        std::string model_path;         // file, directory or URL depending on kind
        std::string language = "auto";
        int threads = 4;
        bool use_gpu = false;           // whisper only
        bool quantized = true;          // parakeet: prefer the int8 ONNX exports
        std::string api_format = "whisper.cpp"; // remote: "whisper.cpp" or "openai"
    } engine;

    struct Server {
        std::string bind = "127.0.0.1:8080";
        size_t max_bytes = 50'000'000;
        size_t queue_capacity = 8;
        int http_threads = 0;           // 0 selects queue_capacity + 4
        int keep_alive_timeout = 2;     // seconds an idle connection may hold a handler
        int keep_alive_max_count = 5;   // requests served per connection

        // Enough handlers for every admitted job to wait while new
        // submissions are still answered.
        size_t handler_threads() const {
            return http_threads > 0 ? static_cast<size_t>(http_threads) : queue_capacity + 4;
        }
    } server;

    std::expected<void, std::string> validate() const;

    static Config load(const std::string& path);
    static Config load_default();
};

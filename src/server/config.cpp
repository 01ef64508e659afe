#include "config.hpp"

#include "engine/engine.hpp"
#include "logging.hpp"
#include "platform/platform_paths.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// get<size_t>() would wrap -1 to SIZE_MAX. Negative values are stored as 0 so
// validate() rejects them.
size_t read_size(const json& value) {
    auto n = value.get<int64_t>();
    return n > 0 ? static_cast<size_t>(n) : 0;
}

} // namespace

std::expected<BindAddress, std::string> parse_bind_address(std::string_view bind) {
    auto colon = bind.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == bind.size()) {
        return std::unexpected("bind address must be HOST:PORT, got '" + std::string(bind) + "'");
    }

    auto host = bind.substr(0, colon);
    auto port_str = bind.substr(colon + 1);
    int port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port < 1 || port > 65535) {
        return std::unexpected("invalid port '" + std::string(port_str) + "'");
    }

    // [::1]:8080
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return BindAddress{.host = std::string(host), .port = port};
}

std::expected<void, std::string> Config::validate() const {
    if (!parse_engine_kind(engine.kind)) {
        return std::unexpected("unknown engine '" + engine.kind + "' (expected whisper, parakeet or remote)");
    }
    if (engine.model_path.empty()) {
        return std::unexpected("model path is required");
    }
    if (engine.threads < 1) {
        return std::unexpected("engine threads must be positive");
    }
    if (server.queue_capacity == 0) {
        return std::unexpected("queue capacity must be positive");
    }
    if (server.max_bytes == 0) {
        return std::unexpected("max bytes must be positive");
    }
    if (server.http_threads < 0) {
        return std::unexpected("http threads must not be negative");
    }
    if (server.keep_alive_timeout < 1) {
        return std::unexpected("keep-alive timeout must be positive");
    }
    if (server.keep_alive_max_count < 1) {
        return std::unexpected("keep-alive max count must be positive");
    }
    if (auto addr = parse_bind_address(server.bind); !addr) {
        return std::unexpected(addr.error());
    }
    return {};
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        logging::warn("config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("engine")) {
            auto& e = j["engine"];
            if (e.contains("kind")) cfg.engine.kind = e["kind"].get<std::string>();
            if (e.contains("model_path")) cfg.engine.model_path = e["model_path"].get<std::string>();
            if (e.contains("language")) cfg.engine.language = e["language"].get<std::string>();
            if (e.contains("threads")) cfg.engine.threads = e["threads"].get<int>();
            if (e.contains("use_gpu")) cfg.engine.use_gpu = e["use_gpu"].get<bool>();
            if (e.contains("quantized")) cfg.engine.quantized = e["quantized"].get<bool>();
            if (e.contains("api_format")) cfg.engine.api_format = e["api_format"].get<std::string>();
        }

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("bind")) cfg.server.bind = s["bind"].get<std::string>();
            if (s.contains("max_bytes")) cfg.server.max_bytes = read_size(s["max_bytes"]);
            if (s.contains("queue_capacity")) cfg.server.queue_capacity = read_size(s["queue_capacity"]);
            if (s.contains("http_threads")) cfg.server.http_threads = s["http_threads"].get<int>();
            if (s.contains("keep_alive_timeout")) cfg.server.keep_alive_timeout = s["keep_alive_timeout"].get<int>();
            if (s.contains("keep_alive_max_count")) cfg.server.keep_alive_max_count = s["keep_alive_max_count"].get<int>();
        }

    } catch (const json::exception& e) {
        logging::error("config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
